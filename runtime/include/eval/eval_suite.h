#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "actor/actor.h"
#include "core/tool_catalog.h"
#include "eval/eval_case.h"

using json = nlohmann::json;

struct CaseOutcome
{
	std::string name;
	std::string input;
	std::vector<ExpectedToolCall> expected_tool_calls;
	std::vector<ActualToolCall> predicted_tool_calls;
	EvaluationResult evaluation;

	// make_error() object when the actor or a critic failed; null otherwise.
	json error;
};

struct ModelReport
{
	std::string model;
	std::vector<CaseOutcome> cases;

	size_t count(Classification classification) const;
	double mean_score() const;
};

void to_json(json &j, const CaseOutcome &outcome);
void to_json(json &j, const ModelReport &report);

class EvalSuite
{
public:
	EvalSuite(std::string name, std::string system_message, ToolCatalog catalog = {}, size_t max_concurrency = 1);

	const std::string &name() const { return name_; }
	const std::string &system_message() const { return system_message_; }
	const ToolCatalog &catalog() const { return catalog_; }
	const std::vector<EvalCase> &cases() const { return cases_; }
	size_t max_concurrency() const { return max_concurrency_; }
	void set_verbose(bool verbose) { verbose_ = verbose; }
	void set_max_concurrency(size_t max_concurrency) { max_concurrency_ = max_concurrency > 0 ? max_concurrency : 1; }

	void add_case(EvalCase eval_case);

	void add_case(
			std::string name,
			std::string user_message,
			std::vector<ExpectedToolCall> expected_tool_calls,
			CriticList critics,
			EvalRubric rubric,
			std::vector<json> additional_messages = {});

	// Derives a follow-up turn from the last case: its conversation plus its
	// user message become the new case's history. Unset overrides are copied
	// from the last case.
	void extend_case(
			std::string name,
			std::string user_message,
			std::optional<std::vector<ExpectedToolCall>> expected_tool_calls = std::nullopt,
			std::optional<CriticList> critics = std::nullopt,
			std::optional<EvalRubric> rubric = std::nullopt);

	// Runs every case against every model. Actor and critic failures are
	// recorded as failed outcomes; the remaining cases still run.
	std::vector<ModelReport> run(Actor &actor, const std::vector<std::string> &models) const;

	ModelReport run_model(Actor &actor, const std::string &model) const;

private:
	std::string name_;
	std::string system_message_;
	ToolCatalog catalog_;
	std::vector<EvalCase> cases_;
	size_t max_concurrency_;
	bool verbose_ = false;

	CaseOutcome run_case(Actor &actor, const std::string &model, const EvalCase &eval_case, const json &tools) const;
};
