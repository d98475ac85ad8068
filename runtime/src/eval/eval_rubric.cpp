#include "eval/eval_rubric.h"
#include "core/error.h"

#include <cmath>

std::string to_string(Classification classification)
{
	switch (classification)
	{
	case Classification::PASS:
		return "PASS";
	case Classification::WARN:
		return "WARN";
	case Classification::FAIL:
		return "FAIL";
	}
	return "UNKNOWN";
}

static bool in_unit_interval(double value)
{
	return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

void EvalRubric::validate() const
{
	if (!in_unit_interval(fail_threshold))
	{
		throw ValidationError("fail_threshold must be in [0, 1], got " + std::to_string(fail_threshold));
	}
	if (!in_unit_interval(warn_threshold))
	{
		throw ValidationError("warn_threshold must be in [0, 1], got " + std::to_string(warn_threshold));
	}
	if (fail_threshold > warn_threshold)
	{
		throw ValidationError("fail_threshold must not exceed warn_threshold");
	}
	if (!std::isfinite(tool_selection_weight) || tool_selection_weight <= 0.0 || tool_selection_weight > 1.0)
	{
		throw ValidationError("tool_selection_weight must be in (0, 1], got " + std::to_string(tool_selection_weight));
	}
}

Classification EvalRubric::classify(double score) const
{
	if (score < fail_threshold)
		return Classification::FAIL;
	if (score < warn_threshold)
		return Classification::WARN;
	return Classification::PASS;
}

void to_json(json &j, const EvalRubric &rubric)
{
	j = {
			{"fail_threshold", rubric.fail_threshold},
			{"warn_threshold", rubric.warn_threshold},
			{"tool_selection_weight", rubric.tool_selection_weight},
			{"fail_on_tool_selection", rubric.fail_on_tool_selection},
			{"fail_on_tool_call_quantity", rubric.fail_on_tool_call_quantity}};
}

void from_json(const json &j, EvalRubric &rubric)
{
	if (j.contains("fail_threshold"))
		rubric.fail_threshold = j["fail_threshold"];
	if (j.contains("warn_threshold"))
		rubric.warn_threshold = j["warn_threshold"];
	if (j.contains("tool_selection_weight"))
		rubric.tool_selection_weight = j["tool_selection_weight"];
	if (j.contains("fail_on_tool_selection"))
		rubric.fail_on_tool_selection = j["fail_on_tool_selection"];
	if (j.contains("fail_on_tool_call_quantity"))
		rubric.fail_on_tool_call_quantity = j["fail_on_tool_call_quantity"];
}
