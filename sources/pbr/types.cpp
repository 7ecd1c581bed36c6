//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/types.hpp"
#include "pbr/utils/string_utils.hpp"

#include <sstream>
#include <vector>

namespace pbr {

    std::string to_string(const Budget& budget) {
        std::ostringstream oss;
        oss << budget.name;
        if (!budget.priority.empty()) {
            oss << " [" << budget.priority << "]";
        }
        oss << " max " << string_utils::format_duration(budget.max_duration);
        oss << ", " << (budget.has_allocation_limit() ? std::to_string(budget.max_allocations) : "unlimited")
            << " allocs";
        oss << ", " << (budget.has_byte_limit() ? string_utils::format_bytes(budget.max_bytes) : "unlimited bytes");
        return oss.str();
    }

    std::string to_string(const MeasurementResult& result) {
        std::ostringstream oss;
        oss << result.operation;

        if (!result.budgeted) {
            oss << " PASS (no budget)";
            return oss.str();
        }

        if (result.passes) {
            oss << " PASS";
            return oss.str();
        }

        std::vector<std::string> failures;
        if (!result.passes_duration) {
            failures.push_back("duration " + string_utils::format_duration(result.duration));
        }
        if (!result.passes_allocations) {
            failures.push_back("allocations " + std::to_string(result.allocations));
        }
        if (!result.passes_bytes) {
            failures.push_back("bytes " + string_utils::format_bytes(result.bytes));
        }

        oss << " FAIL (" << string_utils::join(failures, ", ") << ")";
        return oss.str();
    }

}  // namespace pbr
