//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PBR_SERIALIZATION_HPP
#define PBR_SERIALIZATION_HPP

/**
 * @file serialization.hpp
 * @brief JSON encoding of budgets, measurement samples and verdicts.
 *
 * Durations are encoded as integer nanoseconds under keys ending in "_ns".
 *
 * A benchmark harness hands samples over as:
 * @code
 *     { "measurements": [
 *         { "operation": "context_detection", "duration_ns": 50000000,
 *           "allocations": 100, "bytes": 25600 } ] }
 * @endcode
 * A bare top-level array of sample objects is accepted too; "allocations"
 * and "bytes" default to 0.
 */

#include "pbr/result.hpp"
#include "pbr/types.hpp"
#include "pbr/budgets/catalog.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <vector>

namespace pbr::budgets {

    [[nodiscard]] nlohmann::json budget_to_json(const Budget& budget);

    /**
     * Decodes a budget object. "name" and "max_duration_ns" are required.
     */
    [[nodiscard]] Result<Budget> budget_from_json(const nlohmann::json& value);

    [[nodiscard]] nlohmann::json measurement_to_json(const Measurement& sample);

    /**
     * Decodes one sample. "operation" and "duration_ns" are required;
     * negative values are rejected.
     */
    [[nodiscard]] Result<Measurement> measurement_from_json(const nlohmann::json& value);

    [[nodiscard]] nlohmann::json result_to_json(const MeasurementResult& result);

    /**
     * Encodes a batch of verdicts together with pass/fail counts:
     * {"results": [...], "total": n, "passed": n, "failed": n}
     */
    [[nodiscard]] nlohmann::json results_to_json(const std::vector<MeasurementResult>& results);

    /**
     * Encodes every budget in the catalog as
     * {"tool_version": "x.y.z", "budgets": [...]}.
     */
    [[nodiscard]] nlohmann::json catalog_to_json(const BudgetCatalog& catalog);

    [[nodiscard]] Result<std::vector<Measurement>> measurements_from_json(const nlohmann::json& document);

    /**
     * Reads a measurement batch from a JSON file.
     */
    [[nodiscard]] Result<std::vector<Measurement>> load_measurements(const std::filesystem::path& path);

    /**
     * Writes results_to_json(results) to a file, creating parent
     * directories.
     *
     * @return Success, IoError, or InternalError if the verdicts cannot be
     *         encoded (an operation name that is not valid UTF-8).
     */
    [[nodiscard]] Result<void> save_results(const std::filesystem::path& path,
                                            const std::vector<MeasurementResult>& results);

}  // namespace pbr::budgets

#endif //PBR_SERIALIZATION_HPP
