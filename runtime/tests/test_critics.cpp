#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include "core/error.h"
#include "critics/binary_critic.h"
#include "critics/numeric_critic.h"
#include "critics/similarity_critic.h"
#include "critics/tool_selection_critic.h"

// ─── Binary ────────────────────────────────────────────────────

TEST(CriticTest, BinaryIdenticalValuesMatch)
{
	BinaryCritic critic("to", 0.5);

	for (const json &value : {json("a@example.com"), json(42), json::array({1, 2}), json{{"k", "v"}}})
	{
		auto result = critic.evaluate(value, value);
		EXPECT_TRUE(result.matched);
		EXPECT_DOUBLE_EQ(result.score, 0.5);
	}
}

TEST(CriticTest, BinaryDifferentValuesScoreZero)
{
	BinaryCritic critic("to", 1.0);
	auto result = critic.evaluate("a@example.com", "b@example.com");
	EXPECT_FALSE(result.matched);
	EXPECT_DOUBLE_EQ(result.score, 0.0);
}

TEST(CriticTest, BinaryComparesStructurally)
{
	BinaryCritic critic("filter", 1.0);
	json a = json::parse(R"({"x": 1, "y": [true, "z"]})");
	json b = json::parse(R"({"y": [true, "z"], "x": 1})");
	EXPECT_TRUE(critic.evaluate(a, b).matched);
	EXPECT_FALSE(critic.evaluate(json(1), json("1")).matched);
}

TEST(CriticTest, WeightOutsideUnitIntervalRejected)
{
	EXPECT_THROW(BinaryCritic("to", 0.0), ValidationError);
	EXPECT_THROW(BinaryCritic("to", -0.2), ValidationError);
	EXPECT_THROW(BinaryCritic("to", 1.5), ValidationError);
	EXPECT_THROW(BinaryCritic("", 0.5), ValidationError);
}

// ─── Numeric ───────────────────────────────────────────────────

TEST(CriticTest, NumericEqualValuesFullSimilarity)
{
	NumericCritic critic("amount", 0.4, 0.0, 100.0);
	for (double v : {0.0, 12.5, 50.0, 100.0})
	{
		auto result = critic.evaluate(v, v);
		EXPECT_TRUE(result.matched);
		EXPECT_DOUBLE_EQ(result.score, 0.4);
	}
}

TEST(CriticTest, NumericScalesWithDistance)
{
	NumericCritic critic("amount", 1.0, 0.0, 100.0, 0.8);

	auto close = critic.evaluate(50, 60);
	EXPECT_NEAR(close.score, 0.9, 1e-12);
	EXPECT_TRUE(close.matched);

	auto far = critic.evaluate(10, 40);
	EXPECT_NEAR(far.score, 0.7, 1e-12);
	EXPECT_FALSE(far.matched);
}

TEST(CriticTest, NumericAcceptsNumericStrings)
{
	NumericCritic critic("amount", 1.0, 0.0, 10.0);
	auto result = critic.evaluate("5", 5.0);
	EXPECT_TRUE(result.matched);
	EXPECT_DOUBLE_EQ(result.score, 1.0);

	auto bad = critic.evaluate("five", 5.0);
	EXPECT_FALSE(bad.matched);
	EXPECT_DOUBLE_EQ(bad.score, 0.0);
}

TEST(CriticTest, NumericOutOfRangeExtrapolatesWithinBounds)
{
	NumericCritic critic("amount", 0.5, 0.0, 10.0);

	// 11 and 12 extrapolate to 1.1 and 1.2
	auto near = critic.evaluate(11, 12);
	EXPECT_NEAR(near.score, 0.45, 1e-12);

	auto far = critic.evaluate(-100, 100);
	EXPECT_DOUBLE_EQ(far.score, 0.0);
	EXPECT_FALSE(far.matched);
}

TEST(CriticTest, NumericDegenerateRangeFailsAtEvaluate)
{
	NumericCritic flat("amount", 0.5, 5.0, 5.0);
	EXPECT_THROW(flat.evaluate(5, 5), ConfigurationError);

	NumericCritic inverted("amount", 0.5, 10.0, 0.0);
	EXPECT_THROW(inverted.evaluate(1, 2), ConfigurationError);
}

TEST(CriticTest, NumericMatchAgreesWithThreshold)
{
	NumericCritic critic("n", 0.3, -5.0, 5.0, 0.75);
	for (double a = -7.0; a <= 7.0; a += 0.5)
	{
		for (double b = -7.0; b <= 7.0; b += 1.5)
		{
			auto result = critic.evaluate(a, b);
			EXPECT_GE(result.score, 0.0);
			EXPECT_LE(result.score, critic.weight());
			double similarity = result.score / critic.weight();
			if (std::abs(similarity - 0.75) > 1e-9)
				EXPECT_EQ(result.matched, similarity >= 0.75);
		}
	}
}

// ─── Similarity ────────────────────────────────────────────────

TEST(CriticTest, SimilarityIdenticalTextMatches)
{
	SimilarityCritic critic("message", 0.5);
	auto result = critic.evaluate("Hello, can we meet at 3 PM?", "Hello, can we meet at 3 PM?");
	EXPECT_TRUE(result.matched);
	EXPECT_DOUBLE_EQ(result.score, 0.5);
}

TEST(CriticTest, SimilarityUnrelatedTextDoesNotMatch)
{
	SimilarityCritic critic("message", 1.0);
	auto result = critic.evaluate("quarterly revenue report", "walk the dog tonight");
	EXPECT_FALSE(result.matched);
	EXPECT_DOUBLE_EQ(result.score, 0.0);
}

TEST(CriticTest, SimilarityPartialOverlapInBetween)
{
	SimilarityCritic critic("message", 1.0, "cosine", 0.8);
	auto result = critic.evaluate("meet at the office tomorrow", "meet at the cafe tomorrow");
	EXPECT_GT(result.score, 0.0);
	EXPECT_LT(result.score, 1.0);
	EXPECT_EQ(result.matched, result.score >= 0.8);
}

TEST(CriticTest, SimilarityRendersNonStringsAsJson)
{
	EXPECT_EQ(SimilarityCritic::to_text(json("plain")), "plain");
	EXPECT_EQ(SimilarityCritic::to_text(json(12)), "12");
	EXPECT_EQ(SimilarityCritic::to_text(json::array({"a", "b"})), R"(["a","b"])");
}

TEST(CriticTest, SimilarityUnknownMetricFailsAtEvaluate)
{
	SimilarityCritic critic("message", 0.5, "levenshtein");
	EXPECT_THROW(critic.evaluate("a", "b"), ConfigurationError);
}

TEST(CriticTest, SimilarityUsesInjectedRegistry)
{
	class ConstantMetric : public SimilarityMetric
	{
	public:
		std::string name() const override { return "constant"; }
		double similarity(const std::string &, const std::string &) const override { return 0.25; }
	};

	auto registry = std::make_shared<SimilarityMetricRegistry>();
	registry->register_metric(std::make_unique<ConstantMetric>());

	SimilarityCritic critic("message", 0.8, "constant", 0.2, registry);
	auto result = critic.evaluate("x", "y");
	EXPECT_TRUE(result.matched);
	EXPECT_DOUBLE_EQ(result.score, 0.2);

	SimilarityCritic missing("message", 0.8, "cosine", 0.8, registry);
	EXPECT_THROW(missing.evaluate("x", "y"), ConfigurationError);
}

TEST(CriticTest, ThresholdOutsideUnitIntervalRejected)
{
	EXPECT_THROW(SimilarityCritic("m", 0.5, "cosine", 1.5), ValidationError);
	EXPECT_THROW(NumericCritic("n", 0.5, 0.0, 1.0, -0.1), ValidationError);
}

// ─── Tool selection ────────────────────────────────────────────

TEST(CriticTest, ToolSelectionComparesNames)
{
	ToolSelectionCritic critic(1.0);
	EXPECT_TRUE(critic.evaluate_names("send_email", "send_email").matched);
	EXPECT_DOUBLE_EQ(critic.evaluate_names("send_email", "send_email").score, 1.0);
	EXPECT_FALSE(critic.evaluate_names("send_email", "archive_email").matched);
	EXPECT_DOUBLE_EQ(critic.evaluate(json("a"), json("b")).score, 0.0);
	EXPECT_EQ(critic.field(), "tool_selection");
}

TEST(CriticTest, DescribeCarriesConfiguration)
{
	NumericCritic critic("amount", 0.5, 0.0, 10.0, 0.9);
	json j = critic.describe();
	EXPECT_EQ(j["type"], "numeric");
	EXPECT_EQ(j["field"], "amount");
	EXPECT_EQ(j["value_range"], json::array({0.0, 10.0}));
	EXPECT_DOUBLE_EQ(j["match_threshold"].get<double>(), 0.9);
}

TEST(CriticKindTest, EveryKindHasAName)
{
	EXPECT_EQ(to_string(CriticKind::BINARY), "binary");
	EXPECT_EQ(to_string(CriticKind::NUMERIC), "numeric");
	EXPECT_EQ(to_string(CriticKind::SIMILARITY), "similarity");
	EXPECT_EQ(to_string(CriticKind::TOOL_SELECTION), "tool_selection");
}
