#pragma once

#include "critics/critic.h"

// Exact structural equality; full weight or nothing.
class BinaryCritic : public Critic
{
public:
	BinaryCritic(std::string field, double weight);

	CriticKind kind() const override { return CriticKind::BINARY; }
	CriticResult evaluate(const json &expected, const json &actual) const override;
};
