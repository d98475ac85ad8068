#pragma once

#include "critics/critic.h"

// Compares call names. Built from the rubric for every case, never authored.
class ToolSelectionCritic : public Critic
{
public:
	explicit ToolSelectionCritic(double weight = 1.0);

	CriticKind kind() const override { return CriticKind::TOOL_SELECTION; }
	CriticResult evaluate(const json &expected, const json &actual) const override;
	CriticResult evaluate_names(const std::string &expected, const std::string &actual) const;
};
