#include "eval/evaluation_result.h"

void to_json(json &j, const FieldResult &result)
{
	j = {
			{"field", result.field},
			{"expected", result.expected},
			{"actual", result.actual},
			{"match", result.matched},
			{"score", result.score},
			{"weight", result.weight}};
}

void to_json(json &j, const EvaluationResult &result)
{
	j = {
			{"score", result.score},
			{"classification", to_string(result.classification)},
			{"pass", result.passed()},
			{"warning", result.warned()},
			{"fail", result.failed()},
			{"critic_results", result.per_field_results}};

	if (!result.failure_reason.empty())
		j["failure_reason"] = result.failure_reason;
}
