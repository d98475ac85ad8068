#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/tool_call.h"
#include "eval/cost_matrix.h"
#include "eval/eval_rubric.h"
#include "eval/evaluation_result.h"

using json = nlohmann::json;

// Limits on authored critic weights, checked when a case is built.
struct CriticWeightPolicy
{
	bool enforced = true;
	double min_weight = 0.1;
	double max_total = 1.0;
};

// One scenario: the conversation sent to the model, the calls it should make
// and how to score what it actually did. Immutable once constructed.
class EvalCase
{
public:
	EvalCase(
			std::string name,
			std::string user_message,
			std::vector<ExpectedToolCall> expected_tool_calls,
			CriticList critics,
			EvalRubric rubric,
			std::vector<json> additional_messages = {},
			CriticWeightPolicy policy = {});

	const std::string &name() const { return name_; }
	const std::string &user_message() const { return user_message_; }
	const std::vector<ExpectedToolCall> &expected_tool_calls() const { return expected_tool_calls_; }
	const CriticList &critics() const { return critics_; }
	const EvalRubric &rubric() const { return rubric_; }
	const std::vector<json> &additional_messages() const { return additional_messages_; }
	const CriticWeightPolicy &policy() const { return policy_; }

	// Full conversation for this case: system, prior turns, user message.
	std::vector<json> messages(const std::string &system_message) const;

	// Scores actual_tool_calls against the expected calls. Throws
	// ConfigurationError when a critic cannot run.
	EvaluationResult evaluate(const std::vector<ActualToolCall> &actual_tool_calls) const;

private:
	std::string name_;
	std::string user_message_;
	std::vector<ExpectedToolCall> expected_tool_calls_;
	CriticList critics_;
	EvalRubric rubric_;
	std::vector<json> additional_messages_;
	CriticWeightPolicy policy_;

	void validate() const;
};

inline EvaluationResult evaluate(const EvalCase &eval_case, const std::vector<ActualToolCall> &actual_tool_calls)
{
	return eval_case.evaluate(actual_tool_calls);
}
