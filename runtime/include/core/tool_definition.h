#pragma once

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Callable tool as advertised to the model under test.
struct ToolDefinition
{
	std::string name;
	std::string description;
	json parameters = {{"type", "object"}, {"properties", json::object()}};
};

inline void to_json(json &j, const ToolDefinition &tool)
{
	j = {
			{"name", tool.name},
			{"description", tool.description},
			{"parameters", tool.parameters}};
}

inline void from_json(const json &j, ToolDefinition &tool)
{
	tool.name = j.at("name").get<std::string>();
	tool.description = j.value("description", "");
	tool.parameters = j.value("parameters", json{{"type", "object"}, {"properties", json::object()}});
}
