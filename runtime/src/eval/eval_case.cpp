#include "eval/eval_case.h"
#include "core/error.h"
#include "eval/assignment_solver.h"

#include <algorithm>
#include <set>

namespace
{
	constexpr double kWeightTolerance = 1e-9;

	template <typename Call>
	std::set<std::string> call_names(const std::vector<Call> &calls)
	{
		std::set<std::string> names;
		for (const auto &call : calls)
			names.insert(call.name);
		return names;
	}

	EvaluationResult short_circuit(const std::string &reason)
	{
		EvaluationResult result;
		result.score = 0.0;
		result.classification = Classification::FAIL;
		result.failure_reason = reason;
		return result;
	}

	// Orders calls by name, then by serialized arguments, so the outcome does
	// not depend on the order the model emitted them in.
	std::vector<ActualToolCall> canonical_order(const std::vector<ActualToolCall> &calls)
	{
		std::vector<std::pair<std::string, size_t>> keys;
		keys.reserve(calls.size());
		for (size_t i = 0; i < calls.size(); ++i)
			keys.emplace_back(calls[i].args.dump(), i);

		std::stable_sort(keys.begin(), keys.end(), [&](const auto &a, const auto &b)
										 {
			const auto &name_a = calls[a.second].name;
			const auto &name_b = calls[b.second].name;
			if (name_a != name_b)
				return name_a < name_b;
			return a.first < b.first; });

		std::vector<ActualToolCall> ordered;
		ordered.reserve(calls.size());
		for (const auto &key : keys)
			ordered.push_back(calls[key.second]);
		return ordered;
	}
}

EvalCase::EvalCase(
		std::string name,
		std::string user_message,
		std::vector<ExpectedToolCall> expected_tool_calls,
		CriticList critics,
		EvalRubric rubric,
		std::vector<json> additional_messages,
		CriticWeightPolicy policy)
		: name_(std::move(name)),
			user_message_(std::move(user_message)),
			expected_tool_calls_(std::move(expected_tool_calls)),
			critics_(std::move(critics)),
			rubric_(rubric),
			additional_messages_(std::move(additional_messages)),
			policy_(policy)
{
	validate();
}

void EvalCase::validate() const
{
	try
	{
		rubric_.validate();
	}
	catch (const ValidationError &e)
	{
		throw ValidationError("case '" + name_ + "': " + e.what());
	}

	for (const auto &call : expected_tool_calls_)
	{
		if (call.name.empty())
			throw ValidationError("case '" + name_ + "': expected tool call without a name");
		if (!call.args.is_object())
			throw ValidationError("case '" + name_ + "': arguments of '" + call.name + "' must be an object");
	}

	double total = 0.0;
	for (const auto &critic : critics_)
	{
		if (!critic)
			throw ValidationError("case '" + name_ + "': null critic");

		if (policy_.enforced && critic->weight() + kWeightTolerance < policy_.min_weight)
		{
			throw ValidationError(
					"case '" + name_ + "': critic '" + critic->field() + "' weight " +
					std::to_string(critic->weight()) + " is below the minimum of " + std::to_string(policy_.min_weight));
		}
		total += critic->weight();
	}

	if (policy_.enforced && total > policy_.max_total + kWeightTolerance)
	{
		throw ValidationError(
				"case '" + name_ + "': critic weights sum to " + std::to_string(total) +
				", more than " + std::to_string(policy_.max_total));
	}
}

std::vector<json> EvalCase::messages(const std::string &system_message) const
{
	std::vector<json> out;
	out.push_back({{"role", "system"}, {"content", system_message}});
	for (const auto &msg : additional_messages_)
		out.push_back(msg);
	out.push_back({{"role", "user"}, {"content", user_message_}});
	return out;
}

EvaluationResult EvalCase::evaluate(const std::vector<ActualToolCall> &actual_tool_calls) const
{
	if (rubric_.fail_on_tool_selection && call_names(expected_tool_calls_) != call_names(actual_tool_calls))
	{
		return short_circuit("tool_selection_mismatch");
	}

	if (rubric_.fail_on_tool_call_quantity && actual_tool_calls.size() != expected_tool_calls_.size())
	{
		return short_circuit("tool_call_quantity_mismatch");
	}

	const auto actual = canonical_order(actual_tool_calls);
	const size_t n = expected_tool_calls_.size();
	const size_t m = actual.size();

	ToolSelectionCritic tool_selection(rubric_.tool_selection_weight);
	CostMatrix matrix = build_cost_matrix(expected_tool_calls_, actual, tool_selection, critics_);
	Assignment assignment = solve_assignment(matrix);

	EvaluationResult result;
	double total_score = 0.0;
	double total_weight = 0.0;
	std::vector<bool> actual_matched(m, false);

	for (size_t i = 0; i < n; ++i)
	{
		size_t j = assignment.row_to_col[i];
		if (j >= m)
			continue;

		actual_matched[j] = true;
		const ExpectedToolCall &expected = expected_tool_calls_[i];
		const ActualToolCall &call = actual[j];

		CriticResult selection = tool_selection.evaluate_names(expected.name, call.name);
		total_score += selection.score;
		total_weight += tool_selection.weight();
		result.per_field_results.push_back({"tool_selection", expected.name, call.name,
																				selection.matched, selection.score, tool_selection.weight()});

		for (const auto &critic : critics_)
		{
			if (!critic_applies(*critic, expected.args, call.args))
				continue;

			const json &expected_value = expected.args[critic->field()];
			const json &actual_value = call.args[critic->field()];
			CriticResult outcome = critic->evaluate(expected_value, actual_value);

			total_score += outcome.score;
			total_weight += critic->weight();
			result.per_field_results.push_back({critic->field(), expected_value, actual_value,
																					outcome.matched, outcome.score, critic->weight()});
		}
	}

	// Unpaired calls cost one unit of weight each.
	for (size_t i = 0; i < n; ++i)
	{
		if (assignment.row_to_col[i] < m)
			continue;

		total_weight += 1.0;
		result.per_field_results.push_back({"missing_tool_call", expected_tool_calls_[i].name, nullptr, false, 0.0, 1.0});
	}

	for (size_t j = 0; j < m; ++j)
	{
		if (actual_matched[j])
			continue;

		total_weight += 1.0;
		result.per_field_results.push_back({"extra_tool_call", nullptr, actual[j].name, false, 0.0, 1.0});
	}

	result.score = total_weight > 0.0 ? total_score / total_weight : 0.0;
	result.classification = rubric_.classify(result.score);
	return result;
}
