//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/budgets/evaluator.hpp"

#include <gtest/gtest.h>

namespace pbr::budgets
{
    using namespace std::chrono_literals;

    class EvaluatorTest : public ::testing::Test {
    protected:
        BudgetCatalog catalog{standard_budgets()};
        Evaluator evaluator{catalog};
    };

    TEST_F(EvaluatorTest, WithinBudgetPasses) {
        const auto result = evaluator.measure("context_detection", 50ms, 100, 25 * 1024);

        EXPECT_TRUE(result.budgeted);
        EXPECT_TRUE(result.passes);
        EXPECT_TRUE(result.passes_duration);
        EXPECT_TRUE(result.passes_allocations);
        EXPECT_TRUE(result.passes_bytes);
    }

    TEST_F(EvaluatorTest, DurationOverBudgetFails) {
        const auto result = evaluator.measure("context_detection", 200ms, 100, 25 * 1024);

        EXPECT_FALSE(result.passes);
        EXPECT_FALSE(result.passes_duration);
        EXPECT_TRUE(result.passes_allocations);
        EXPECT_TRUE(result.passes_bytes);
    }

    TEST_F(EvaluatorTest, AllocationsOverBudgetFail) {
        const auto result = evaluator.measure("context_detection", 50ms, 500, 25 * 1024);

        EXPECT_FALSE(result.passes);
        EXPECT_TRUE(result.passes_duration);
        EXPECT_FALSE(result.passes_allocations);
        EXPECT_TRUE(result.passes_bytes);
    }

    TEST_F(EvaluatorTest, BytesOverBudgetFail) {
        const auto result = evaluator.measure("context_detection", 50ms, 100, 100 * 1024);

        EXPECT_FALSE(result.passes);
        EXPECT_TRUE(result.passes_duration);
        EXPECT_TRUE(result.passes_allocations);
        EXPECT_FALSE(result.passes_bytes);
    }

    TEST_F(EvaluatorTest, EveryDimensionCanFailAtOnce) {
        const auto result = evaluator.measure("context_detection", 1s, 1000, 1024 * 1024);

        EXPECT_FALSE(result.passes);
        EXPECT_FALSE(result.passes_duration);
        EXPECT_FALSE(result.passes_allocations);
        EXPECT_FALSE(result.passes_bytes);
    }

    TEST_F(EvaluatorTest, UnknownOperationPasses) {
        const auto result = evaluator.measure("unknown_operation", 10s, 1000000, 1000000000);

        EXPECT_FALSE(result.budgeted);
        EXPECT_TRUE(result.passes);
        EXPECT_TRUE(result.passes_duration);
        EXPECT_TRUE(result.passes_allocations);
        EXPECT_TRUE(result.passes_bytes);
        EXPECT_EQ(result.duration, Duration(10s));
        EXPECT_EQ(result.allocations, 1000000);
    }

    TEST_F(EvaluatorTest, ZeroLimitsAreUnlimited) {
        const auto result = evaluator.measure("registry_get", 50ns, 1000000, 1000000);

        EXPECT_TRUE(result.passes);
        EXPECT_TRUE(result.passes_allocations);
        EXPECT_TRUE(result.passes_bytes);
    }

    TEST_F(EvaluatorTest, ZeroDurationLimitIsNotUnlimited) {
        BudgetCatalog strict;
        Budget budget;
        budget.name = "instant";
        budget.max_duration = Duration::zero();
        strict.register_budget(budget);

        const Evaluator strict_evaluator(strict);
        EXPECT_TRUE(strict_evaluator.measure("instant", 0ns, 0, 0).passes);
        EXPECT_FALSE(strict_evaluator.measure("instant", 1ns, 0, 0).passes);
    }

    TEST_F(EvaluatorTest, LimitsAreInclusive) {
        const auto budget = catalog.must_get_budget("context_detection");

        const auto at_limit = evaluator.measure(
            "context_detection", budget.max_duration, budget.max_allocations, budget.max_bytes);
        EXPECT_TRUE(at_limit.passes);

        EXPECT_FALSE(evaluator.measure(
            "context_detection", budget.max_duration + 1ns, budget.max_allocations, budget.max_bytes).passes);
        EXPECT_FALSE(evaluator.measure(
            "context_detection", budget.max_duration, budget.max_allocations + 1, budget.max_bytes).passes);
        EXPECT_FALSE(evaluator.measure(
            "context_detection", budget.max_duration, budget.max_allocations, budget.max_bytes + 1).passes);
    }

    TEST_F(EvaluatorTest, ObservedValuesAreEchoed) {
        const auto result = evaluator.measure("config_load", 42ms, 17, 2048);

        EXPECT_EQ(result.operation, "config_load");
        EXPECT_EQ(result.duration, Duration(42ms));
        EXPECT_EQ(result.allocations, 17);
        EXPECT_EQ(result.bytes, 2048);
    }

    TEST_F(EvaluatorTest, RepeatedEvaluationIsIdentical) {
        const auto first = evaluator.measure("plugin_load", 250ms, 800, 1024);
        const auto second = evaluator.measure("plugin_load", 250ms, 800, 1024);

        EXPECT_EQ(first, second);
        EXPECT_EQ(catalog.size(), standard_budgets().size());
    }

    TEST_F(EvaluatorTest, OverloadsAgree) {
        Measurement sample;
        sample.operation = "command_lookup";
        sample.duration = 2ms;
        sample.allocations = 3;
        sample.bytes = 512;

        EXPECT_EQ(evaluator.measure(sample), evaluator.measure("command_lookup", 2ms, 3, 512));
    }

    TEST_F(EvaluatorTest, MeasureAllPreservesOrder) {
        const std::vector<Measurement> samples{
            {"startup_total", 400ms, 10, 1024},
            {"unknown_operation", 1ms, 0, 0},
            {"config_load", 10ms, 10, 1024},
        };

        const auto results = evaluator.measure_all(samples);

        ASSERT_EQ(results.size(), 3u);
        EXPECT_EQ(results[0].operation, "startup_total");
        EXPECT_FALSE(results[0].passes);
        EXPECT_EQ(results[1].operation, "unknown_operation");
        EXPECT_FALSE(results[1].budgeted);
        EXPECT_EQ(results[2].operation, "config_load");
        EXPECT_TRUE(results[2].passes);
    }

    TEST_F(EvaluatorTest, MeasureAllEmpty) {
        EXPECT_TRUE(evaluator.measure_all({}).empty());
    }

    TEST_F(EvaluatorTest, SeesLaterRegistrations) {
        EXPECT_FALSE(evaluator.measure("late_operation", 1ms, 0, 0).budgeted);

        Budget budget;
        budget.name = "late_operation";
        budget.max_duration = 500us;
        catalog.register_budget(budget);

        const auto result = evaluator.measure("late_operation", 1ms, 0, 0);
        EXPECT_TRUE(result.budgeted);
        EXPECT_FALSE(result.passes);
    }

    TEST(EvaluateTest, IgnoresSampleOperationName) {
        Budget budget;
        budget.name = "a";
        budget.max_duration = 10ms;
        budget.max_allocations = 5;

        const Measurement sample{"b", 5ms, 6, 0};
        const auto result = evaluate(budget, sample);

        EXPECT_EQ(result.operation, "b");
        EXPECT_TRUE(result.budgeted);
        EXPECT_TRUE(result.passes_duration);
        EXPECT_FALSE(result.passes_allocations);
        EXPECT_TRUE(result.passes_bytes);
        EXPECT_FALSE(result.passes);
    }

}  // namespace pbr::budgets
