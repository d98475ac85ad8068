#pragma once

#include <memory>
#include "critics/critic.h"
#include "critics/similarity_metric.h"

// Text similarity through a metric looked up by name in a registry. An
// unknown metric surfaces as ConfigurationError when the critic runs.
class SimilarityCritic : public Critic
{
public:
	SimilarityCritic(
			std::string field,
			double weight,
			std::string metric = "cosine",
			double similarity_threshold = 0.8,
			std::shared_ptr<const SimilarityMetricRegistry> metrics = SimilarityMetricRegistry::with_defaults());

	CriticKind kind() const override { return CriticKind::SIMILARITY; }
	CriticResult evaluate(const json &expected, const json &actual) const override;
	json describe() const override;

	const std::string &metric() const { return metric_; }
	double similarity_threshold() const { return similarity_threshold_; }

	// Strings verbatim, everything else as compact JSON.
	static std::string to_text(const json &value);

private:
	std::string metric_;
	double similarity_threshold_;
	std::shared_ptr<const SimilarityMetricRegistry> metrics_;
};
