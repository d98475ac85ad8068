#include "critics/binary_critic.h"

BinaryCritic::BinaryCritic(std::string field, double weight)
		: Critic(std::move(field), weight)
{
}

CriticResult BinaryCritic::evaluate(const json &expected, const json &actual) const
{
	bool matched = expected == actual;
	return {matched, matched ? weight() : 0.0};
}
