#include "eval/eval_suite.h"
#include "core/error.h"

#include <algorithm>
#include <future>
#include <iostream>

size_t ModelReport::count(Classification classification) const
{
	return std::count_if(cases.begin(), cases.end(), [classification](const CaseOutcome &outcome)
											 { return outcome.evaluation.classification == classification; });
}

double ModelReport::mean_score() const
{
	if (cases.empty())
		return 0.0;

	double total = 0.0;
	for (const auto &outcome : cases)
		total += outcome.evaluation.score;
	return total / static_cast<double>(cases.size());
}

void to_json(json &j, const CaseOutcome &outcome)
{
	j = {
			{"name", outcome.name},
			{"input", outcome.input},
			{"expected_tool_calls", outcome.expected_tool_calls},
			{"predicted_tool_calls", outcome.predicted_tool_calls},
			{"evaluation", outcome.evaluation}};

	if (!outcome.error.is_null())
		j["error"] = outcome.error;
}

void to_json(json &j, const ModelReport &report)
{
	j = {
			{"model", report.model},
			{"cases", report.cases},
			{"summary", {{"pass", report.count(Classification::PASS)}, {"warn", report.count(Classification::WARN)}, {"fail", report.count(Classification::FAIL)}, {"mean_score", report.mean_score()}}}};
}

EvalSuite::EvalSuite(std::string name, std::string system_message, ToolCatalog catalog, size_t max_concurrency)
		: name_(std::move(name)),
			system_message_(std::move(system_message)),
			catalog_(std::move(catalog)),
			max_concurrency_(std::max<size_t>(1, max_concurrency))
{
}

void EvalSuite::add_case(EvalCase eval_case)
{
	cases_.push_back(std::move(eval_case));
}

void EvalSuite::add_case(
		std::string name,
		std::string user_message,
		std::vector<ExpectedToolCall> expected_tool_calls,
		CriticList critics,
		EvalRubric rubric,
		std::vector<json> additional_messages)
{
	cases_.emplace_back(
			std::move(name),
			std::move(user_message),
			std::move(expected_tool_calls),
			std::move(critics),
			rubric,
			std::move(additional_messages));
}

void EvalSuite::extend_case(
		std::string name,
		std::string user_message,
		std::optional<std::vector<ExpectedToolCall>> expected_tool_calls,
		std::optional<CriticList> critics,
		std::optional<EvalRubric> rubric)
{
	if (cases_.empty())
	{
		throw ValidationError("no cases to extend, add a case first");
	}

	const EvalCase &last = cases_.back();

	std::vector<json> history = last.additional_messages();
	history.push_back({{"role", "user"}, {"content", last.user_message()}});

	EvalCase extended(
			std::move(name),
			std::move(user_message),
			expected_tool_calls ? std::move(*expected_tool_calls) : last.expected_tool_calls(),
			critics ? std::move(*critics) : last.critics(),
			rubric ? *rubric : last.rubric(),
			std::move(history),
			last.policy());

	cases_.push_back(std::move(extended));
}

CaseOutcome EvalSuite::run_case(Actor &actor, const std::string &model, const EvalCase &eval_case, const json &tools) const
{
	CaseOutcome outcome;
	outcome.name = eval_case.name();
	outcome.input = eval_case.user_message();
	outcome.expected_tool_calls = eval_case.expected_tool_calls();

	try
	{
		outcome.predicted_tool_calls = actor.predict(model, eval_case.messages(system_message_), tools);
	}
	catch (const std::exception &e)
	{
		outcome.error = make_error(ErrorCode::ACTOR_FAILED, e.what());
		outcome.evaluation.failure_reason = "actor_failed";
		return outcome;
	}

	std::vector<ActualToolCall> normalized = outcome.predicted_tool_calls;
	for (auto &call : normalized)
		catalog_.apply_defaults(call);

	try
	{
		outcome.evaluation = eval_case.evaluate(normalized);
	}
	catch (const ConfigurationError &e)
	{
		outcome.error = make_error(ErrorCode::CONFIGURATION_ERROR, e.what());
		outcome.evaluation = EvaluationResult{};
		outcome.evaluation.failure_reason = "configuration_error";
	}
	catch (const AssignmentError &)
	{
		throw;
	}
	catch (const std::exception &e)
	{
		outcome.error = make_error(ErrorCode::INTERNAL_ERROR, e.what());
		outcome.evaluation = EvaluationResult{};
		outcome.evaluation.failure_reason = "evaluation_error";
	}

	return outcome;
}

ModelReport EvalSuite::run_model(Actor &actor, const std::string &model) const
{
	ModelReport report;
	report.model = model;
	report.cases.reserve(cases_.size());

	const json tools = catalog_.list();

	for (size_t start = 0; start < cases_.size(); start += max_concurrency_)
	{
		size_t end = std::min(cases_.size(), start + max_concurrency_);
		std::vector<std::future<CaseOutcome>> batch;

		for (size_t i = start; i < end; ++i)
		{
			if (verbose_)
			{
				std::cerr << "[EvalSuite] Running case: " << cases_[i].name() << "\n";
			}

			const EvalCase &eval_case = cases_[i];
			batch.push_back(std::async(std::launch::async, [this, &actor, &model, &eval_case, &tools]()
																 { return run_case(actor, model, eval_case, tools); }));
		}

		for (auto &task : batch)
		{
			CaseOutcome outcome = task.get();

			if (!outcome.error.is_null())
			{
				std::cerr << "[EvalSuite] Case '" << outcome.name << "' failed: "
									<< outcome.error["message"].get<std::string>() << "\n";
			}
			else if (verbose_)
			{
				std::cerr << "[EvalSuite] " << outcome.name << ": "
									<< to_string(outcome.evaluation.classification)
									<< " (score " << outcome.evaluation.score << ")\n";
			}

			report.cases.push_back(std::move(outcome));
		}
	}

	return report;
}

std::vector<ModelReport> EvalSuite::run(Actor &actor, const std::vector<std::string> &models) const
{
	std::vector<ModelReport> reports;

	for (const auto &model : models)
	{
		std::cerr << "[EvalSuite] Running suite '" << name_ << "' for model: " << model << "\n";
		reports.push_back(run_model(actor, model));
	}

	return reports;
}
