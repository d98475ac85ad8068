#include "critics/tool_selection_critic.h"

ToolSelectionCritic::ToolSelectionCritic(double weight)
		: Critic("tool_selection", weight)
{
}

CriticResult ToolSelectionCritic::evaluate(const json &expected, const json &actual) const
{
	if (!expected.is_string() || !actual.is_string())
		return {false, 0.0};

	return evaluate_names(expected.get<std::string>(), actual.get<std::string>());
}

CriticResult ToolSelectionCritic::evaluate_names(const std::string &expected, const std::string &actual) const
{
	bool matched = expected == actual;
	return {matched, matched ? weight() : 0.0};
}
