//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PERFBUDGETREGISTRY_TYPES_HPP
#define PERFBUDGETREGISTRY_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for performance budgets.
 *
 * - Duration: nanosecond-resolution time span
 * - Budget: a named performance contract (duration, allocations, bytes)
 * - Measurement: one observed sample supplied by a benchmark harness
 * - MeasurementResult: the verdict of a sample against its budget
 *
 * All types are plain values: copyable, movable and safe to hand across
 * threads once constructed.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace pbr {

    /**
     * Duration in nanoseconds.
     *
     * The standard budgets range from 100ns (registry_get) to 500ms
     * (plugin_discovery), so nanoseconds are the natural base unit.
     */
    using Duration = std::chrono::nanoseconds;

    /**
     * Priority labels observed in the standard budget set.
     *
     * Priority is an open set: any string is accepted and these constants
     * carry no enforcement meaning.
     */
    namespace priority {
        inline constexpr auto P0 = "P0";  ///< Critical
        inline constexpr auto P1 = "P1";  ///< Important
        inline constexpr auto P2 = "P2";  ///< Informational
    }

    /**
     * A named performance contract.
     *
     * max_allocations and max_bytes use zero to mean "no limit". A budget
     * that allows zero allocations cannot be expressed.
     */
    struct Budget {
        std::string name;
        Duration max_duration = Duration::zero();
        std::int64_t max_allocations = 0;
        std::int64_t max_bytes = 0;
        std::string priority;
        std::string description;

        [[nodiscard]] bool has_allocation_limit() const noexcept {
            return max_allocations != 0;
        }

        [[nodiscard]] bool has_byte_limit() const noexcept {
            return max_bytes != 0;
        }

        bool operator==(const Budget& other) const {
            return name == other.name &&
                   max_duration == other.max_duration &&
                   max_allocations == other.max_allocations &&
                   max_bytes == other.max_bytes &&
                   priority == other.priority &&
                   description == other.description;
        }

        bool operator!=(const Budget& other) const {
            return !(*this == other);
        }
    };

    /**
     * One observed run of an operation.
     */
    struct Measurement {
        std::string operation;
        Duration duration = Duration::zero();
        std::int64_t allocations = 0;
        std::int64_t bytes = 0;
    };

    /**
     * Outcome of evaluating one Measurement against the catalog.
     *
     * The observed values are echoed back unchanged. For an operation with
     * no registered budget every verdict is true and budgeted is false.
     */
    struct MeasurementResult {
        std::string operation;
        Duration duration = Duration::zero();
        std::int64_t allocations = 0;
        std::int64_t bytes = 0;

        bool passes_duration = false;
        bool passes_allocations = false;
        bool passes_bytes = false;
        bool passes = false;

        bool budgeted = false;

        bool operator==(const MeasurementResult& other) const {
            return operation == other.operation &&
                   duration == other.duration &&
                   allocations == other.allocations &&
                   bytes == other.bytes &&
                   passes_duration == other.passes_duration &&
                   passes_allocations == other.passes_allocations &&
                   passes_bytes == other.passes_bytes &&
                   passes == other.passes &&
                   budgeted == other.budgeted;
        }

        bool operator!=(const MeasurementResult& other) const {
            return !(*this == other);
        }
    };

    /**
     * Formats a budget on one line.
     *
     * Example: "context_detection [P0] max 100.00ms, 200 allocs, 50.00 KB"
     */
    [[nodiscard]] std::string to_string(const Budget& budget);

    /**
     * Formats a verdict on one line, naming each failed dimension.
     *
     * Example: "context_detection FAIL (duration 200.00ms)"
     */
    [[nodiscard]] std::string to_string(const MeasurementResult& result);

}  // namespace pbr

#endif //PERFBUDGETREGISTRY_TYPES_HPP
