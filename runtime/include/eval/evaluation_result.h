#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "eval/eval_rubric.h"

using json = nlohmann::json;

// Per-field trace entry. field is a critic field, "tool_selection",
// "missing_tool_call" or "extra_tool_call".
struct FieldResult
{
	std::string field;
	json expected;
	json actual;
	bool matched = false;
	double score = 0.0;
	double weight = 0.0;
};

struct EvaluationResult
{
	double score = 0.0;
	Classification classification = Classification::FAIL;
	std::vector<FieldResult> per_field_results;

	// Set when a rubric pre-check short-circuited the evaluation.
	std::string failure_reason;

	bool passed() const { return classification == Classification::PASS; }
	bool warned() const { return classification == Classification::WARN; }
	bool failed() const { return classification == Classification::FAIL; }
};

void to_json(json &j, const FieldResult &result);
void to_json(json &j, const EvaluationResult &result);
