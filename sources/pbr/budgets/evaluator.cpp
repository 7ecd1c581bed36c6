//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/budgets/evaluator.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace pbr::budgets {

    MeasurementResult evaluate(const Budget& budget, const Measurement& sample) {
        MeasurementResult result;
        result.operation = sample.operation;
        result.duration = sample.duration;
        result.allocations = sample.allocations;
        result.bytes = sample.bytes;
        result.budgeted = true;

        result.passes_duration = sample.duration <= budget.max_duration;

        // Zero limits mean "no limit"
        result.passes_allocations = !budget.has_allocation_limit() ||
                                    sample.allocations <= budget.max_allocations;
        result.passes_bytes = !budget.has_byte_limit() ||
                              sample.bytes <= budget.max_bytes;

        result.passes = result.passes_duration && result.passes_allocations && result.passes_bytes;
        return result;
    }

    MeasurementResult Evaluator::measure(const std::string_view operation,
                                         const Duration duration,
                                         const std::int64_t allocations,
                                         const std::int64_t bytes) const {
        Measurement sample;
        sample.operation = std::string(operation);
        sample.duration = duration;
        sample.allocations = allocations;
        sample.bytes = bytes;
        return measure(sample);
    }

    MeasurementResult Evaluator::measure(const Measurement& sample) const {
        if (const auto budget = catalog_.get_budget(sample.operation)) {
            return evaluate(*budget, sample);
        }

        MeasurementResult result;
        result.operation = sample.operation;
        result.duration = sample.duration;
        result.allocations = sample.allocations;
        result.bytes = sample.bytes;
        result.passes_duration = true;
        result.passes_allocations = true;
        result.passes_bytes = true;
        result.passes = true;
        result.budgeted = false;
        return result;
    }

    std::vector<MeasurementResult> Evaluator::measure_all(const std::vector<Measurement>& samples) const {
        std::vector<MeasurementResult> results;
        results.reserve(samples.size());

        std::ranges::transform(samples, std::back_inserter(results),
                               [this](const Measurement& sample) { return measure(sample); });

        return results;
    }

}  // namespace pbr::budgets
