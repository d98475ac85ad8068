#include "critics/similarity_critic.h"
#include "core/error.h"

#include <algorithm>
#include <cmath>

SimilarityCritic::SimilarityCritic(
		std::string field,
		double weight,
		std::string metric,
		double similarity_threshold,
		std::shared_ptr<const SimilarityMetricRegistry> metrics)
		: Critic(std::move(field), weight),
			metric_(std::move(metric)),
			similarity_threshold_(similarity_threshold),
			metrics_(std::move(metrics))
{
	if (similarity_threshold_ < 0.0 || similarity_threshold_ > 1.0)
	{
		throw ValidationError("similarity_threshold for '" + this->field() + "' must be in [0, 1]");
	}
}

std::string SimilarityCritic::to_text(const json &value)
{
	if (value.is_string())
		return value.get<std::string>();
	return value.dump();
}

CriticResult SimilarityCritic::evaluate(const json &expected, const json &actual) const
{
	const SimilarityMetric *metric = metrics_ ? metrics_->find(metric_) : nullptr;
	if (!metric)
	{
		throw ConfigurationError("unsupported similarity metric: " + metric_);
	}

	double similarity = metric->similarity(to_text(expected), to_text(actual));
	if (!std::isfinite(similarity))
		similarity = 0.0;
	similarity = std::clamp(similarity, 0.0, 1.0);

	return {similarity >= similarity_threshold_, weight() * similarity};
}

json SimilarityCritic::describe() const
{
	json j = Critic::describe();
	j["metric"] = metric_;
	j["similarity_threshold"] = similarity_threshold_;
	return j;
}
