#pragma once

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class Classification
{
	FAIL,
	WARN,
	PASS
};

std::string to_string(Classification classification);

struct EvalRubric
{
	double fail_threshold = 0.8;
	double warn_threshold = 0.9;
	double tool_selection_weight = 1.0;
	bool fail_on_tool_selection = true;
	bool fail_on_tool_call_quantity = true;

	// Throws ValidationError unless 0 <= fail <= warn <= 1 and the tool
	// selection weight lies in (0, 1].
	void validate() const;

	// Ascending tiers: below fail_threshold fails, below warn_threshold warns.
	Classification classify(double score) const;
};

void to_json(json &j, const EvalRubric &rubric);
void from_json(const json &j, EvalRubric &rubric);
