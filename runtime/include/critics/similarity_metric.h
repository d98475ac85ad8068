#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

// Text similarity strategy. similarity() returns a value in [0, 1] and must be
// deterministic for equal inputs.
class SimilarityMetric
{
public:
	virtual ~SimilarityMetric() = default;

	virtual std::string name() const = 0;
	virtual double similarity(const std::string &a, const std::string &b) const = 0;
};

// Lowercased runs of two or more word characters.
std::vector<std::string> tokenize_words(const std::string &text);

// TF-IDF cosine over the two inputs treated as a two-document corpus. The
// result is relative to that pair only.
class CosineTfidfMetric : public SimilarityMetric
{
public:
	std::string name() const override { return "cosine"; }
	double similarity(const std::string &a, const std::string &b) const override;
};

// Jaccard index of the two token sets.
class JaccardMetric : public SimilarityMetric
{
public:
	std::string name() const override { return "jaccard"; }
	double similarity(const std::string &a, const std::string &b) const override;
};

class SimilarityMetricRegistry
{
public:
	void register_metric(std::unique_ptr<SimilarityMetric> metric);
	bool has(const std::string &name) const;
	const SimilarityMetric *find(const std::string &name) const;
	std::vector<std::string> names() const;

	// Registry holding "cosine" and "jaccard".
	static std::shared_ptr<const SimilarityMetricRegistry> with_defaults();

private:
	std::map<std::string, std::unique_ptr<SimilarityMetric>> metrics_;
};
