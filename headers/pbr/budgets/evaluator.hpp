//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PBR_EVALUATOR_HPP
#define PBR_EVALUATOR_HPP

/**
 * @file evaluator.hpp
 * @brief Compares observed measurements against catalog budgets.
 *
 * Verdict rules for an operation with a budget:
 * - duration passes if observed <= max_duration (inclusive)
 * - allocations pass if max_allocations == 0 or observed <= max_allocations
 * - bytes pass if max_bytes == 0 or observed <= max_bytes
 * - the overall verdict is the AND of the three
 *
 * An operation with no budget passes on every dimension.
 *
 * Evaluation never mutates the catalog and performs no I/O.
 */

#include "pbr/types.hpp"
#include "pbr/budgets/catalog.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace pbr::budgets {

    /**
     * Evaluates one sample against one budget, ignoring the sample's
     * operation name.
     */
    [[nodiscard]] MeasurementResult evaluate(const Budget& budget, const Measurement& sample);

    class Evaluator {
    public:
        /**
         * @param catalog Catalog to look budgets up in. Must outlive the evaluator.
         */
        explicit Evaluator(const BudgetCatalog& catalog) : catalog_(catalog) {}

        /**
         * Evaluates an observed run of an operation.
         *
         * @param operation Operation name; need not be registered.
         * @param duration Observed wall-clock time.
         * @param allocations Observed allocation count.
         * @param bytes Observed bytes used.
         */
        [[nodiscard]] MeasurementResult measure(std::string_view operation,
                                                Duration duration,
                                                std::int64_t allocations,
                                                std::int64_t bytes) const;

        [[nodiscard]] MeasurementResult measure(const Measurement& sample) const;

        /**
         * Evaluates a batch of samples, preserving input order.
         */
        [[nodiscard]] std::vector<MeasurementResult> measure_all(const std::vector<Measurement>& samples) const;

    private:
        const BudgetCatalog& catalog_;
    };

}  // namespace pbr::budgets

#endif //PBR_EVALUATOR_HPP
