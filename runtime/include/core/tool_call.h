#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Call the test author expects the model to make.
struct ExpectedToolCall
{
	std::string name;
	json args = json::object();
};

// Call the model actually made for one run.
struct ActualToolCall
{
	std::string name;
	json args = json::object();
};

inline void to_json(json &j, const ExpectedToolCall &call)
{
	j = {{"name", call.name}, {"args", call.args}};
}

inline void to_json(json &j, const ActualToolCall &call)
{
	j = {{"name", call.name}, {"args", call.args}};
}

inline void from_json(const json &j, ExpectedToolCall &call)
{
	call.name = j.at("name").get<std::string>();
	call.args = j.value("args", json::object());
}

inline void from_json(const json &j, ActualToolCall &call)
{
	call.name = j.at("name").get<std::string>();
	call.args = j.value("args", json::object());
}
