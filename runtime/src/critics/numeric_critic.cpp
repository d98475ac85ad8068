#include "critics/numeric_critic.h"
#include "core/error.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

NumericCritic::NumericCritic(
		std::string field,
		double weight,
		double range_min,
		double range_max,
		double match_threshold)
		: Critic(std::move(field), weight),
			range_min_(range_min),
			range_max_(range_max),
			match_threshold_(match_threshold)
{
	if (match_threshold_ < 0.0 || match_threshold_ > 1.0)
	{
		throw ValidationError("match_threshold for '" + this->field() + "' must be in [0, 1]");
	}
}

std::optional<double> NumericCritic::to_number(const json &value)
{
	if (value.is_number())
		return value.get<double>();

	if (!value.is_string())
		return std::nullopt;

	const std::string &text = value.get_ref<const std::string &>();
	if (text.empty())
		return std::nullopt;

	const char *begin = text.c_str();
	char *end = nullptr;
	errno = 0;
	double parsed = std::strtod(begin, &end);
	if (end == begin || errno == ERANGE)
		return std::nullopt;

	// trailing whitespace is fine, anything else is not a number
	while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)))
		++end;
	if (*end != '\0' || !std::isfinite(parsed))
		return std::nullopt;

	return parsed;
}

CriticResult NumericCritic::evaluate(const json &expected, const json &actual) const
{
	if (!std::isfinite(range_min_) || !std::isfinite(range_max_) || !(range_min_ < range_max_))
	{
		throw ConfigurationError(
				"numeric critic '" + field() + "' has a degenerate value_range [" +
				std::to_string(range_min_) + ", " + std::to_string(range_max_) + "]");
	}

	auto expected_value = to_number(expected);
	auto actual_value = to_number(actual);
	if (!expected_value || !actual_value)
		return {false, 0.0};

	double span = range_max_ - range_min_;
	double normalized_expected = (*expected_value - range_min_) / span;
	double normalized_actual = (*actual_value - range_min_) / span;

	double similarity = 1.0 - std::abs(normalized_expected - normalized_actual);
	similarity = std::clamp(similarity, 0.0, 1.0);

	return {similarity >= match_threshold_, weight() * similarity};
}

json NumericCritic::describe() const
{
	json j = Critic::describe();
	j["value_range"] = {range_min_, range_max_};
	j["match_threshold"] = match_threshold_;
	return j;
}
