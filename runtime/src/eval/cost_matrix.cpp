#include "eval/cost_matrix.h"

#include <algorithm>

static bool has_value(const json &args, const std::string &field)
{
	if (!args.is_object())
		return false;

	auto it = args.find(field);
	return it != args.end() && !it->is_null();
}

bool critic_applies(const Critic &critic, const json &expected_args, const json &actual_args)
{
	return has_value(expected_args, critic.field()) && has_value(actual_args, critic.field());
}

CostMatrix build_cost_matrix(
		const std::vector<ExpectedToolCall> &expected,
		const std::vector<ActualToolCall> &actual,
		const ToolSelectionCritic &tool_selection,
		const CriticList &critics)
{
	size_t k = std::max(expected.size(), actual.size());
	CostMatrix matrix(k, std::vector<double>(k, 0.0));

	for (size_t i = 0; i < expected.size(); ++i)
	{
		for (size_t j = 0; j < actual.size(); ++j)
		{
			double score = tool_selection.evaluate_names(expected[i].name, actual[j].name).score;

			for (const auto &critic : critics)
			{
				if (!critic_applies(*critic, expected[i].args, actual[j].args))
					continue;

				score += critic->evaluate(expected[i].args[critic->field()], actual[j].args[critic->field()]).score;
			}

			matrix[i][j] = score;
		}
	}

	return matrix;
}
