#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/tool_call.h"

using json = nlohmann::json;

// Produces the tool calls a model makes for a conversation. Implementations
// own any retry or timeout policy; failures are reported by throwing.
// EvalSuite calls predict() from several threads at once when its
// max_concurrency is above 1, so implementations must be thread-safe.
class Actor
{
public:
	virtual ~Actor() = default;

	virtual std::vector<ActualToolCall> predict(
			const std::string &model,
			const std::vector<json> &messages,
			const json &tools) = 0;
};
