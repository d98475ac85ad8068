#pragma once

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct CriticResult
{
	bool matched = false;
	double score = 0.0;
};

enum class CriticKind
{
	BINARY,
	NUMERIC,
	SIMILARITY,
	TOOL_SELECTION
};

std::string to_string(CriticKind kind);

// Scores one expected argument value against the value the model produced.
// evaluate() must return a score in [0, weight()] and be deterministic.
class Critic
{
public:
	Critic(std::string field, double weight);
	virtual ~Critic() = default;

	const std::string &field() const { return field_; }
	double weight() const { return weight_; }
	double max_score() const { return weight_; }

	virtual CriticKind kind() const = 0;
	virtual CriticResult evaluate(const json &expected, const json &actual) const = 0;

	// Critic configuration as it appears in suite files.
	virtual json describe() const;

private:
	std::string field_;
	double weight_;
};
