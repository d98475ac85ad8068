#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/tool_call.h"

using json = nlohmann::json;

class ToolCallParser
{
public:
	// Chat completion message carrying a "tool_calls" array. Function
	// arguments may be a JSON-encoded string or an object.
	static std::vector<ActualToolCall> from_message(const json &message);

	// Free-form model output with one or more {"tool": ..., "arguments": {...}}
	// objects embedded in it. Objects that are not tool calls are skipped.
	static std::vector<ActualToolCall> from_text(const std::string &text);

private:
	static bool to_call(const json &object, ActualToolCall &call);
	static json parse_arguments(const json &arguments);
};
