//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/types.hpp"

#include <gtest/gtest.h>

namespace pbr
{
    using namespace std::chrono_literals;

    namespace {
        Budget context_detection_budget() {
            Budget budget;
            budget.name = "context_detection";
            budget.max_duration = 100ms;
            budget.max_allocations = 200;
            budget.max_bytes = 50 * 1024;
            budget.priority = priority::P0;
            budget.description = "Time to detect project context";
            return budget;
        }
    }

    TEST(BudgetTest, DefaultIsZeroValue) {
        const Budget budget;

        EXPECT_TRUE(budget.name.empty());
        EXPECT_EQ(budget.max_duration, Duration::zero());
        EXPECT_EQ(budget.max_allocations, 0);
        EXPECT_EQ(budget.max_bytes, 0);
        EXPECT_TRUE(budget.priority.empty());
        EXPECT_TRUE(budget.description.empty());
    }

    TEST(BudgetTest, ZeroLimitsMeanNoLimit) {
        Budget budget = context_detection_budget();
        EXPECT_TRUE(budget.has_allocation_limit());
        EXPECT_TRUE(budget.has_byte_limit());

        budget.max_allocations = 0;
        budget.max_bytes = 0;
        EXPECT_FALSE(budget.has_allocation_limit());
        EXPECT_FALSE(budget.has_byte_limit());
    }

    TEST(BudgetTest, Equality) {
        const Budget a = context_detection_budget();
        Budget b = context_detection_budget();
        EXPECT_EQ(a, b);

        b.description = "changed";
        EXPECT_NE(a, b);
    }

    TEST(BudgetTest, ToString) {
        EXPECT_EQ(to_string(context_detection_budget()),
                  "context_detection [P0] max 100.00ms, 200 allocs, 50.00 KB");

        Budget unlimited;
        unlimited.name = "registry_get";
        unlimited.max_duration = 100ns;
        unlimited.priority = priority::P2;
        EXPECT_EQ(to_string(unlimited), "registry_get [P2] max 100ns, unlimited allocs, unlimited bytes");
    }

    TEST(MeasurementResultTest, ToStringPass) {
        MeasurementResult result;
        result.operation = "config_load";
        result.passes_duration = result.passes_allocations = result.passes_bytes = result.passes = true;
        result.budgeted = true;

        EXPECT_EQ(to_string(result), "config_load PASS");
    }

    TEST(MeasurementResultTest, ToStringUnbudgeted) {
        MeasurementResult result;
        result.operation = "unknown_operation";
        result.passes_duration = result.passes_allocations = result.passes_bytes = result.passes = true;

        EXPECT_EQ(to_string(result), "unknown_operation PASS (no budget)");
    }

    TEST(MeasurementResultTest, ToStringNamesEveryFailedDimension) {
        MeasurementResult result;
        result.operation = "context_detection";
        result.duration = 200ms;
        result.allocations = 500;
        result.bytes = 100 * 1024;
        result.budgeted = true;

        EXPECT_EQ(to_string(result),
                  "context_detection FAIL (duration 200.00ms, allocations 500, bytes 100.00 KB)");

        result.passes_allocations = true;
        result.passes_bytes = true;
        EXPECT_EQ(to_string(result), "context_detection FAIL (duration 200.00ms)");
    }

    TEST(MeasurementResultTest, Equality) {
        MeasurementResult a;
        a.operation = "config_load";
        a.duration = 30ms;
        MeasurementResult b = a;
        EXPECT_EQ(a, b);

        b.budgeted = true;
        EXPECT_NE(a, b);
    }

}  // namespace pbr
