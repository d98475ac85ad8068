#pragma once

#include <optional>
#include "critics/critic.h"

// Fuzzy numeric comparison relative to value_range. Values outside the range
// extrapolate linearly; the resulting similarity is kept within [0, 1].
class NumericCritic : public Critic
{
public:
	NumericCritic(
			std::string field,
			double weight,
			double range_min,
			double range_max,
			double match_threshold = 0.8);

	CriticKind kind() const override { return CriticKind::NUMERIC; }
	CriticResult evaluate(const json &expected, const json &actual) const override;
	json describe() const override;

	double range_min() const { return range_min_; }
	double range_max() const { return range_max_; }
	double match_threshold() const { return match_threshold_; }

	// Accepts JSON numbers and strings that parse completely as a number.
	static std::optional<double> to_number(const json &value);

private:
	double range_min_;
	double range_max_;
	double match_threshold_;
};
