#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include "core/error.h"
#include "critics/binary_critic.h"
#include "critics/numeric_critic.h"
#include "critics/similarity_critic.h"
#include "eval/eval_case.h"

static EvalRubric email_rubric(bool fail_on_tool_selection = true, bool fail_on_quantity = true)
{
	EvalRubric rubric;
	rubric.fail_threshold = 0.5;
	rubric.warn_threshold = 0.8;
	rubric.tool_selection_weight = 1.0;
	rubric.fail_on_tool_selection = fail_on_tool_selection;
	rubric.fail_on_tool_call_quantity = fail_on_quantity;
	return rubric;
}

static EvalCase email_case(EvalRubric rubric)
{
	return EvalCase(
			"send email",
			"Email a@example.com",
			{{"send_email", {{"to", "a@example.com"}}}},
			{std::make_shared<BinaryCritic>("to", 1.0)},
			rubric);
}

static const FieldResult *find_field(const EvaluationResult &result, const std::string &field)
{
	for (const auto &entry : result.per_field_results)
		if (entry.field == field)
			return &entry;
	return nullptr;
}

// ─── Single call scenarios ─────────────────────────────────────

TEST(EvalCaseTest, ExactMatchPasses)
{
	EvalCase eval_case = email_case(email_rubric());
	auto result = eval_case.evaluate({{"send_email", {{"to", "a@example.com"}}}});

	EXPECT_DOUBLE_EQ(result.score, 1.0);
	EXPECT_EQ(result.classification, Classification::PASS);
	ASSERT_EQ(result.per_field_results.size(), 2u);
	EXPECT_EQ(result.per_field_results[0].field, "tool_selection");
	EXPECT_TRUE(result.per_field_results[0].matched);
	EXPECT_EQ(result.per_field_results[1].field, "to");
	EXPECT_DOUBLE_EQ(result.per_field_results[1].weight, 1.0);
}

TEST(EvalCaseTest, WrongArgumentWarnsAtFailBoundary)
{
	EvalCase eval_case = email_case(email_rubric());
	auto result = eval_case.evaluate({{"send_email", {{"to", "b@example.com"}}}});

	EXPECT_DOUBLE_EQ(result.score, 0.5);
	EXPECT_EQ(result.classification, Classification::WARN);

	const FieldResult *to = find_field(result, "to");
	ASSERT_NE(to, nullptr);
	EXPECT_FALSE(to->matched);
	EXPECT_EQ(to->expected, "a@example.com");
	EXPECT_EQ(to->actual, "b@example.com");
}

TEST(EvalCaseTest, WrongToolFailsImmediately)
{
	EvalCase eval_case = email_case(email_rubric());
	auto result = eval_case.evaluate({{"archive_email", json::object()}});

	EXPECT_DOUBLE_EQ(result.score, 0.0);
	EXPECT_EQ(result.classification, Classification::FAIL);
	EXPECT_TRUE(result.per_field_results.empty());
	EXPECT_EQ(result.failure_reason, "tool_selection_mismatch");
}

TEST(EvalCaseTest, WrongToolScoredWhenPrecheckDisabled)
{
	EvalCase eval_case = email_case(email_rubric(false));
	auto result = eval_case.evaluate({{"archive_email", json::object()}});

	// tool selection contributes weight 1 at score 0; "to" is absent and skipped
	EXPECT_DOUBLE_EQ(result.score, 0.0);
	EXPECT_EQ(result.classification, Classification::FAIL);
	ASSERT_EQ(result.per_field_results.size(), 1u);
	EXPECT_EQ(result.per_field_results[0].field, "tool_selection");
	EXPECT_TRUE(result.failure_reason.empty());
}

TEST(EvalCaseTest, QuantityPrecheckShortCircuits)
{
	EvalCase eval_case = email_case(email_rubric());
	auto result = eval_case.evaluate({
			{"send_email", {{"to", "a@example.com"}}},
			{"send_email", {{"to", "a@example.com"}}},
	});

	EXPECT_DOUBLE_EQ(result.score, 0.0);
	EXPECT_EQ(result.classification, Classification::FAIL);
	EXPECT_EQ(result.failure_reason, "tool_call_quantity_mismatch");
}

TEST(EvalCaseTest, PrechecksIgnoreCriticConfiguration)
{
	// A broken critic never runs when a pre-check fires.
	EvalCase eval_case(
			"broken",
			"msg",
			{{"transfer", {{"amount", 5}}}},
			{std::make_shared<NumericCritic>("amount", 0.5, 1.0, 1.0)},
			email_rubric());

	auto result = eval_case.evaluate({{"refund", {{"amount", 5}}}});
	EXPECT_EQ(result.classification, Classification::FAIL);
	EXPECT_EQ(result.failure_reason, "tool_selection_mismatch");
}

TEST(EvalCaseTest, NullArgumentTreatedAsAbsent)
{
	EvalCase eval_case = email_case(email_rubric());
	auto result = eval_case.evaluate({{"send_email", {{"to", nullptr}}}});

	EXPECT_DOUBLE_EQ(result.score, 1.0);
	EXPECT_EQ(find_field(result, "to"), nullptr);
}

// ─── Multiple calls ────────────────────────────────────────────

static EvalCase two_call_case(EvalRubric rubric)
{
	return EvalCase(
			"two sends",
			"Email Alice and Bob",
			{
					{"send_email", {{"to", "alice@example.com"}, {"subject", "Lunch"}}},
					{"send_email", {{"to", "bob@example.com"}, {"subject", "Dinner"}}},
			},
			{std::make_shared<BinaryCritic>("to", 0.6), std::make_shared<SimilarityCritic>("subject", 0.4)},
			rubric);
}

TEST(EvalCaseTest, OrderOfActualCallsDoesNotMatter)
{
	EvalCase eval_case = two_call_case(email_rubric());

	ActualToolCall alice{"send_email", {{"to", "alice@example.com"}, {"subject", "Lunch"}}};
	ActualToolCall bob{"send_email", {{"to", "bob@example.com"}, {"subject", "Dinner plans"}}};

	auto forward = eval_case.evaluate({alice, bob});
	auto backward = eval_case.evaluate({bob, alice});

	EXPECT_DOUBLE_EQ(forward.score, backward.score);
	EXPECT_EQ(forward.classification, backward.classification);
	ASSERT_EQ(forward.per_field_results.size(), backward.per_field_results.size());
	for (size_t i = 0; i < forward.per_field_results.size(); ++i)
	{
		EXPECT_EQ(forward.per_field_results[i].field, backward.per_field_results[i].field);
		EXPECT_EQ(forward.per_field_results[i].actual, backward.per_field_results[i].actual);
	}

	// alice pairs with alice even though bob came first
	const FieldResult *to = find_field(backward, "to");
	ASSERT_NE(to, nullptr);
	EXPECT_EQ(to->expected, to->actual);
}

TEST(EvalCaseTest, PermutationInvarianceAcrossManyOrders)
{
	EvalCase eval_case(
			"three",
			"msg",
			{
					{"a", {{"x", 1}}},
					{"b", {{"x", 2}}},
					{"a", {{"x", 3}}},
			},
			{std::make_shared<NumericCritic>("x", 0.5, 0.0, 10.0)},
			email_rubric(false, false));

	std::vector<ActualToolCall> calls = {
			{"a", {{"x", 3}}},
			{"b", {{"x", 9}}},
			{"a", {{"x", 1}}},
			{"c", {{"x", 2}}},
	};
	std::sort(calls.begin(), calls.end(), [](const ActualToolCall &l, const ActualToolCall &r)
						{ return l.args.dump() < r.args.dump(); });

	auto reference = eval_case.evaluate(calls);
	std::vector<size_t> order = {0, 1, 2, 3};
	do
	{
		std::vector<ActualToolCall> permuted;
		for (size_t idx : order)
			permuted.push_back(calls[idx]);

		auto result = eval_case.evaluate(permuted);
		EXPECT_DOUBLE_EQ(result.score, reference.score);
		EXPECT_EQ(result.classification, reference.classification);
	} while (std::next_permutation(order.begin(), order.end()));
}

TEST(EvalCaseTest, MissingCallLowersScore)
{
	EvalCase eval_case = two_call_case(email_rubric(true, false));

	ActualToolCall alice{"send_email", {{"to", "alice@example.com"}, {"subject", "Lunch"}}};
	ActualToolCall bob{"send_email", {{"to", "bob@example.com"}, {"subject", "Dinner"}}};

	auto full = eval_case.evaluate({alice, bob});
	auto partial = eval_case.evaluate({alice});

	EXPECT_DOUBLE_EQ(full.score, 1.0);
	// (1 + 0.6 + 0.4) / (2 + 1)
	EXPECT_NEAR(partial.score, 2.0 / 3.0, 1e-12);
	EXPECT_LT(partial.score, full.score);

	const FieldResult *missing = find_field(partial, "missing_tool_call");
	ASSERT_NE(missing, nullptr);
	EXPECT_DOUBLE_EQ(missing->weight, 1.0);
	EXPECT_DOUBLE_EQ(missing->score, 0.0);
	EXPECT_EQ(missing->expected, "send_email");
}

TEST(EvalCaseTest, ExtraCallAddsPenalty)
{
	EvalCase eval_case = email_case(email_rubric(false, false));
	auto result = eval_case.evaluate({
			{"send_email", {{"to", "a@example.com"}}},
			{"delete_email", {{"id", 7}}},
	});

	EXPECT_NEAR(result.score, 2.0 / 3.0, 1e-12);
	EXPECT_EQ(result.classification, Classification::WARN);

	const FieldResult *extra = find_field(result, "extra_tool_call");
	ASSERT_NE(extra, nullptr);
	EXPECT_EQ(extra->actual, "delete_email");
}

TEST(EvalCaseTest, NoCallsAtAllScoresZero)
{
	EvalCase eval_case("nothing expected", "hi", {}, {}, email_rubric());
	auto result = eval_case.evaluate({});
	EXPECT_DOUBLE_EQ(result.score, 0.0);
	EXPECT_EQ(result.classification, Classification::FAIL);
}

TEST(EvalCaseTest, ToolSelectionWeightScalesNameMatch)
{
	EvalRubric rubric = email_rubric(false);
	rubric.tool_selection_weight = 0.5;
	EvalCase eval_case = email_case(rubric);

	auto result = eval_case.evaluate({{"send_email", {{"to", "b@example.com"}}}});
	EXPECT_NEAR(result.score, 0.5 / 1.5, 1e-12);
	EXPECT_EQ(result.classification, Classification::FAIL);
}

TEST(EvalCaseTest, ConfigurationErrorPropagates)
{
	EvalCase eval_case(
			"bad metric",
			"msg",
			{{"post", {{"text", "hello"}}}},
			{std::make_shared<SimilarityCritic>("text", 0.5, "soundex")},
			email_rubric());

	EXPECT_THROW(eval_case.evaluate({{"post", {{"text", "hello"}}}}), ConfigurationError);
}

TEST(EvalCaseTest, FreeFunctionForwards)
{
	EvalCase eval_case = email_case(email_rubric());
	auto result = evaluate(eval_case, {{"send_email", {{"to", "a@example.com"}}}});
	EXPECT_EQ(result.classification, Classification::PASS);
}

// ─── Classification ────────────────────────────────────────────

TEST(EvalCaseTest, ClassificationIsMonotonic)
{
	EvalRubric rubric = email_rubric();
	Classification previous = Classification::FAIL;
	for (int step = 0; step <= 100; ++step)
	{
		Classification current = rubric.classify(step / 100.0);
		EXPECT_GE(static_cast<int>(current), static_cast<int>(previous));
		previous = current;
	}
	EXPECT_EQ(rubric.classify(0.49), Classification::FAIL);
	EXPECT_EQ(rubric.classify(0.5), Classification::WARN);
	EXPECT_EQ(rubric.classify(0.8), Classification::PASS);
}

// ─── Construction checks ───────────────────────────────────────

TEST(EvalCaseTest, RejectsBadRubric)
{
	EvalRubric inverted = email_rubric();
	inverted.fail_threshold = 0.9;
	inverted.warn_threshold = 0.5;
	EXPECT_THROW(email_case(inverted), ValidationError);

	EvalRubric out_of_range = email_rubric();
	out_of_range.warn_threshold = 1.2;
	EXPECT_THROW(email_case(out_of_range), ValidationError);

	EvalRubric zero_weight = email_rubric();
	zero_weight.tool_selection_weight = 0.0;
	EXPECT_THROW(email_case(zero_weight), ValidationError);
}

TEST(EvalCaseTest, RejectsCriticWeightsAboveOne)
{
	EXPECT_THROW(
			EvalCase("heavy", "msg", {{"a", json::object()}},
							 {std::make_shared<BinaryCritic>("x", 0.7), std::make_shared<BinaryCritic>("y", 0.7)},
							 email_rubric()),
			ValidationError);
}

TEST(EvalCaseTest, RejectsCriticBelowFloor)
{
	EXPECT_THROW(
			EvalCase("light", "msg", {{"a", json::object()}},
							 {std::make_shared<BinaryCritic>("x", 0.05)},
							 email_rubric()),
			ValidationError);
}

TEST(EvalCaseTest, WeightPolicyCanBeDisabled)
{
	CriticWeightPolicy relaxed;
	relaxed.enforced = false;

	EvalCase eval_case("relaxed", "msg", {{"a", {{"x", 1}, {"y", 2}}}},
										 {std::make_shared<BinaryCritic>("x", 0.05), std::make_shared<BinaryCritic>("y", 1.0)},
										 email_rubric(), {}, relaxed);

	auto result = eval_case.evaluate({{"a", {{"x", 1}, {"y", 2}}}});
	EXPECT_DOUBLE_EQ(result.score, 1.0);
}

TEST(EvalCaseTest, ToolSelectionOnlyCase)
{
	EvalCase eval_case("names only", "msg", {{"ping", json::object()}}, {}, email_rubric());
	auto result = eval_case.evaluate({{"ping", {{"verbose", true}}}});
	EXPECT_DOUBLE_EQ(result.score, 1.0);
	EXPECT_EQ(result.classification, Classification::PASS);
}

TEST(EvalCaseTest, MessagesIncludeHistory)
{
	EvalCase eval_case("turn two", "and now?", {}, {}, email_rubric(),
										 {{{"role", "user"}, {"content", "first"}}});
	auto messages = eval_case.messages("system prompt");
	ASSERT_EQ(messages.size(), 3u);
	EXPECT_EQ(messages[0]["role"], "system");
	EXPECT_EQ(messages[1]["content"], "first");
	EXPECT_EQ(messages[2]["content"], "and now?");
}

TEST(EvalRubricTest, EveryClassificationHasAName)
{
	EXPECT_EQ(to_string(Classification::FAIL), "FAIL");
	EXPECT_EQ(to_string(Classification::WARN), "WARN");
	EXPECT_EQ(to_string(Classification::PASS), "PASS");
}
