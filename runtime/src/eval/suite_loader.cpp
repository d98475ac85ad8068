#include "eval/suite_loader.h"
#include "core/error.h"
#include "critics/binary_critic.h"
#include "critics/numeric_critic.h"
#include "critics/similarity_critic.h"

#include <fstream>
#include <stdexcept>

static std::string require_string(const json &object, const std::string &key, const std::string &where)
{
	if (!object.contains(key) || !object[key].is_string())
	{
		throw ValidationError(where + ": '" + key + "' must be a string");
	}
	return object[key].get<std::string>();
}

static double require_number(const json &object, const std::string &key, const std::string &where)
{
	if (!object.contains(key) || !object[key].is_number())
	{
		throw ValidationError(where + ": '" + key + "' must be a number");
	}
	return object[key].get<double>();
}

std::shared_ptr<const Critic> make_critic(
		const json &spec,
		const std::shared_ptr<const SimilarityMetricRegistry> &metrics)
{
	if (!spec.is_object())
	{
		throw ValidationError("critic must be an object");
	}

	std::string type = require_string(spec, "type", "critic");
	std::string field = require_string(spec, "field", "critic");
	double weight = require_number(spec, "weight", "critic '" + field + "'");

	if (type == "binary")
	{
		return std::make_shared<BinaryCritic>(field, weight);
	}

	if (type == "numeric")
	{
		const json &range = spec.value("value_range", json());
		if (!range.is_array() || range.size() != 2 || !range[0].is_number() || !range[1].is_number())
		{
			throw ValidationError("critic '" + field + "': value_range must be [min, max]");
		}
		return std::make_shared<NumericCritic>(
				field, weight, range[0].get<double>(), range[1].get<double>(), spec.value("match_threshold", 0.8));
	}

	if (type == "similarity")
	{
		return std::make_shared<SimilarityCritic>(
				field, weight, spec.value("metric", std::string("cosine")), spec.value("similarity_threshold", 0.8), metrics);
	}

	throw ValidationError("critic '" + field + "': unknown critic type '" + type + "'");
}

static std::vector<ExpectedToolCall> load_expected_calls(
		const json &calls,
		const ToolCatalog &catalog,
		const std::string &where)
{
	if (!calls.is_array())
	{
		throw ValidationError(where + ": expected_tool_calls must be an array");
	}

	std::vector<ExpectedToolCall> expected;
	for (const auto &entry : calls)
	{
		if (!entry.is_object())
			throw ValidationError(where + ": expected tool call must be an object");

		ExpectedToolCall call;
		call.name = require_string(entry, "name", where);
		call.args = entry.value("args", json::object());

		if (!catalog.empty())
		{
			if (auto err = catalog.validate(call.name, call.args))
			{
				throw ValidationError(where + ": expected call '" + call.name + "' field '" + err->field + "': " + err->message);
			}
		}

		expected.push_back(std::move(call));
	}

	return expected;
}

static CriticList load_critics(
		const json &critics,
		const std::shared_ptr<const SimilarityMetricRegistry> &metrics,
		const std::string &where)
{
	if (!critics.is_array())
	{
		throw ValidationError(where + ": critics must be an array");
	}

	CriticList out;
	for (const auto &spec : critics)
	{
		try
		{
			out.push_back(make_critic(spec, metrics));
		}
		catch (const ValidationError &e)
		{
			throw ValidationError(where + ": " + e.what());
		}
	}
	return out;
}

EvalSuite load_suite(const json &definition, std::shared_ptr<const SimilarityMetricRegistry> metrics)
{
	if (!definition.is_object())
	{
		throw ValidationError("suite definition must be an object");
	}

	ToolCatalog catalog;
	for (const auto &tool : definition.value("tools", json::array()))
	{
		try
		{
			catalog.register_tool(tool.get<ToolDefinition>());
		}
		catch (const json::exception &e)
		{
			throw ValidationError(std::string("invalid tool definition: ") + e.what());
		}
	}

	EvalRubric default_rubric;
	if (definition.contains("rubric"))
		default_rubric = definition["rubric"].get<EvalRubric>();

	CriticWeightPolicy policy;
	if (definition.contains("critic_weight_policy"))
	{
		const json &p = definition["critic_weight_policy"];
		policy.enforced = p.value("enforced", policy.enforced);
		policy.min_weight = p.value("min_weight", policy.min_weight);
		policy.max_total = p.value("max_total", policy.max_total);
	}

	size_t max_concurrency = 1;
	if (definition.contains("max_concurrency"))
	{
		const json &value = definition["max_concurrency"];
		if (!value.is_number_integer() || value.get<long long>() < 1)
		{
			throw ValidationError("suite: 'max_concurrency' must be an integer of at least 1");
		}
		max_concurrency = value.get<size_t>();
	}

	EvalSuite suite(
			require_string(definition, "name", "suite"),
			definition.value("system_message", ""),
			std::move(catalog),
			max_concurrency);

	for (const auto &entry : definition.value("cases", json::array()))
	{
		std::string name = require_string(entry, "name", "case");
		std::string where = "case '" + name + "'";
		std::string user_message = require_string(entry, "user_message", where);

		const bool extend = entry.value("extend", false);
		if (extend && suite.cases().empty())
		{
			throw ValidationError(where + ": no previous case to extend");
		}

		std::optional<EvalRubric> rubric;
		if (entry.contains("rubric"))
		{
			// Partial overrides merge onto the rubric the case would otherwise get
			EvalRubric case_rubric = extend ? suite.cases().back().rubric() : default_rubric;
			from_json(entry["rubric"], case_rubric);
			rubric = case_rubric;
		}

		std::optional<std::vector<ExpectedToolCall>> expected;
		if (entry.contains("expected_tool_calls"))
			expected = load_expected_calls(entry["expected_tool_calls"], suite.catalog(), where);

		std::optional<CriticList> critics;
		if (entry.contains("critics"))
			critics = load_critics(entry["critics"], metrics, where);

		if (extend)
		{
			suite.extend_case(name, user_message, expected, critics, rubric);
			continue;
		}

		suite.add_case(EvalCase(
				name,
				user_message,
				expected.value_or(std::vector<ExpectedToolCall>{}),
				critics.value_or(CriticList{}),
				rubric.value_or(default_rubric),
				entry.value("additional_messages", std::vector<json>{}),
				policy));
	}

	return suite;
}

EvalSuite load_suite_file(const std::string &path, std::shared_ptr<const SimilarityMetricRegistry> metrics)
{
	std::ifstream file(path);
	if (!file.is_open())
	{
		throw std::runtime_error("Cannot open suite file: " + path);
	}

	json definition;
	try
	{
		definition = json::parse(file);
	}
	catch (const json::parse_error &e)
	{
		throw ValidationError("suite file " + path + " is not valid JSON: " + e.what());
	}

	return load_suite(definition, std::move(metrics));
}
