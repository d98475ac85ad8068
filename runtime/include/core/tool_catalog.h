#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/tool_call.h"
#include "core/tool_definition.h"
#include "tools/argument_validator.h"

using json = nlohmann::json;

class ToolCatalog
{
public:
	void register_tool(ToolDefinition tool);
	bool has(const std::string &name) const;
	bool empty() const { return tools_.empty(); }
	size_t size() const { return tools_.size(); }
	const ToolDefinition *find(const std::string &name) const;

	// Fills defaults and checks the arguments against the tool schema.
	std::optional<ArgumentError> validate(const std::string &name, json &arguments) const;

	// Fills defaults only; unknown tools and bad arguments are left untouched.
	void apply_defaults(ActualToolCall &call) const;

	json list() const;

private:
	std::map<std::string, ToolDefinition> tools_;
};
