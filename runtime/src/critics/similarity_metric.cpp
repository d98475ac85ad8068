#include "critics/similarity_metric.h"
#include "core/error.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <unordered_map>

static bool is_word_char(unsigned char c)
{
	// bytes of multi-byte UTF-8 sequences count as word characters
	return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::vector<std::string> tokenize_words(const std::string &text)
{
	std::vector<std::string> tokens;
	std::string current;

	for (char ch : text)
	{
		unsigned char c = static_cast<unsigned char>(ch);
		if (is_word_char(c))
		{
			current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
			continue;
		}

		if (current.size() >= 2)
			tokens.push_back(current);
		current.clear();
	}

	if (current.size() >= 2)
		tokens.push_back(current);

	return tokens;
}

double CosineTfidfMetric::similarity(const std::string &a, const std::string &b) const
{
	if (a == b)
		return 1.0;

	auto tokens_a = tokenize_words(a);
	auto tokens_b = tokenize_words(b);

	if (tokens_a.empty() || tokens_b.empty())
	{
		return 0.0;
	}

	std::unordered_map<std::string, double> tf_a;
	std::unordered_map<std::string, double> tf_b;
	for (const auto &tok : tokens_a)
		tf_a[tok] += 1.0;
	for (const auto &tok : tokens_b)
		tf_b[tok] += 1.0;

	// smoothed idf over a corpus of two documents
	const double n_docs = 2.0;
	auto idf = [&](const std::string &term)
	{
		double df = (tf_a.count(term) ? 1.0 : 0.0) + (tf_b.count(term) ? 1.0 : 0.0);
		return std::log((1.0 + n_docs) / (1.0 + df)) + 1.0;
	};

	double dot = 0.0;
	double norm_a = 0.0;
	double norm_b = 0.0;

	for (const auto &[term, count] : tf_a)
	{
		double w = count * idf(term);
		norm_a += w * w;

		auto it = tf_b.find(term);
		if (it != tf_b.end())
			dot += w * (it->second * idf(term));
	}

	for (const auto &[term, count] : tf_b)
	{
		double w = count * idf(term);
		norm_b += w * w;
	}

	if (norm_a <= 0.0 || norm_b <= 0.0)
		return 0.0;

	double cosine = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
	return std::clamp(cosine, 0.0, 1.0);
}

double JaccardMetric::similarity(const std::string &a, const std::string &b) const
{
	if (a == b)
		return 1.0;

	auto tokens_a = tokenize_words(a);
	auto tokens_b = tokenize_words(b);
	std::set<std::string> set_a(tokens_a.begin(), tokens_a.end());
	std::set<std::string> set_b(tokens_b.begin(), tokens_b.end());

	if (set_a.empty() && set_b.empty())
		return 0.0;

	size_t shared = 0;
	for (const auto &tok : set_a)
		shared += set_b.count(tok);

	size_t combined = set_a.size() + set_b.size() - shared;
	return static_cast<double>(shared) / static_cast<double>(combined);
}

void SimilarityMetricRegistry::register_metric(std::unique_ptr<SimilarityMetric> metric)
{
	if (!metric)
	{
		throw ValidationError("cannot register a null similarity metric");
	}
	metrics_[metric->name()] = std::move(metric);
}

bool SimilarityMetricRegistry::has(const std::string &name) const
{
	return metrics_.count(name) > 0;
}

const SimilarityMetric *SimilarityMetricRegistry::find(const std::string &name) const
{
	auto it = metrics_.find(name);
	if (it == metrics_.end())
		return nullptr;
	return it->second.get();
}

std::vector<std::string> SimilarityMetricRegistry::names() const
{
	std::vector<std::string> out;
	for (const auto &[name, _] : metrics_)
		out.push_back(name);
	return out;
}

std::shared_ptr<const SimilarityMetricRegistry> SimilarityMetricRegistry::with_defaults()
{
	auto registry = std::make_shared<SimilarityMetricRegistry>();
	registry->register_metric(std::make_unique<CosineTfidfMetric>());
	registry->register_metric(std::make_unique<JaccardMetric>());
	return registry;
}
