//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/budgets/serialization.hpp"
#include "pbr/utils/json_utils.hpp"
#include "pbr/utils/logger.hpp"
#include "pbr/version.hpp"

#include <optional>
#include <string>

namespace pbr::budgets {

    using json = nlohmann::json;

    namespace {
        /**
         * Reads a non-negative integer field. A missing key yields the
         * fallback when there is one.
         */
        Result<std::int64_t> read_count(const json& obj,
                                        const std::string& key,
                                        const std::optional<std::int64_t> fallback) {
            if (!obj.contains(key)) {
                if (fallback.has_value()) {
                    return Result<std::int64_t>::success(*fallback);
                }
                return Result<std::int64_t>::failure(Error::not_found("Missing required field", key));
            }

            const auto& field = obj.at(key);
            if (!field.is_number_integer()) {
                return Result<std::int64_t>::failure(
                    Error::parse_error("Expected an integer", key + ": got " + field.type_name()));
            }

            const auto value = field.get<std::int64_t>();
            if (value < 0) {
                return Result<std::int64_t>::failure(
                    Error::invalid_argument("Value must be non-negative", key + " = " + std::to_string(value)));
            }
            return Result<std::int64_t>::success(value);
        }
    }

    json budget_to_json(const Budget& budget) {
        return {
            {"name", budget.name},
            {"max_duration_ns", budget.max_duration.count()},
            {"max_allocations", budget.max_allocations},
            {"max_bytes", budget.max_bytes},
            {"priority", budget.priority},
            {"description", budget.description}
        };
    }

    Result<Budget> budget_from_json(const json& value) {
        if (!value.is_object()) {
            return Result<Budget>::failure(Error::parse_error("Budget must be a JSON object", std::string("got ") + value.type_name()));
        }

        auto name = json_utils::get<std::string>(value, "name");
        if (name.is_err()) {
            return Result<Budget>::failure(name.error());
        }

        const auto duration = read_count(value, "max_duration_ns", std::nullopt);
        const auto allocations = read_count(value, "max_allocations", 0);
        const auto bytes = read_count(value, "max_bytes", 0);

        for (const auto* field : {&duration, &allocations, &bytes}) {
            if (field->is_err()) {
                return Result<Budget>::failure(field->error().with_context("budget " + name.value()));
            }
        }

        Budget budget;
        budget.name = std::move(name).value();
        budget.max_duration = Duration(duration.value());
        budget.max_allocations = allocations.value();
        budget.max_bytes = bytes.value();
        budget.priority = json_utils::get_or<std::string>(value, "priority", "");
        budget.description = json_utils::get_or<std::string>(value, "description", "");
        return Result<Budget>::success(std::move(budget));
    }

    json measurement_to_json(const Measurement& sample) {
        return {
            {"operation", sample.operation},
            {"duration_ns", sample.duration.count()},
            {"allocations", sample.allocations},
            {"bytes", sample.bytes}
        };
    }

    Result<Measurement> measurement_from_json(const json& value) {
        if (!value.is_object()) {
            return Result<Measurement>::failure(
                Error::parse_error("Measurement must be a JSON object", std::string("got ") + value.type_name()));
        }

        auto operation = json_utils::get<std::string>(value, "operation");
        if (operation.is_err()) {
            return Result<Measurement>::failure(operation.error());
        }

        const auto duration = read_count(value, "duration_ns", std::nullopt);
        const auto allocations = read_count(value, "allocations", 0);
        const auto bytes = read_count(value, "bytes", 0);

        for (const auto* field : {&duration, &allocations, &bytes}) {
            if (field->is_err()) {
                return Result<Measurement>::failure(
                    field->error().with_context("measurement " + operation.value()));
            }
        }

        Measurement sample;
        sample.operation = std::move(operation).value();
        sample.duration = Duration(duration.value());
        sample.allocations = allocations.value();
        sample.bytes = bytes.value();
        return Result<Measurement>::success(std::move(sample));
    }

    json result_to_json(const MeasurementResult& result) {
        return {
            {"operation", result.operation},
            {"duration_ns", result.duration.count()},
            {"allocations", result.allocations},
            {"bytes", result.bytes},
            {"passes_duration", result.passes_duration},
            {"passes_allocations", result.passes_allocations},
            {"passes_bytes", result.passes_bytes},
            {"passes", result.passes},
            {"budgeted", result.budgeted}
        };
    }

    json results_to_json(const std::vector<MeasurementResult>& results) {
        json array = json::array();
        std::size_t passed = 0;

        for (const auto& result : results) {
            array.push_back(result_to_json(result));
            if (result.passes) {
                ++passed;
            }
        }

        return {
            {"results", std::move(array)},
            {"total", results.size()},
            {"passed", passed},
            {"failed", results.size() - passed}
        };
    }

    json catalog_to_json(const BudgetCatalog& catalog) {
        json array = json::array();
        for (const auto& budget : catalog.list_budgets()) {
            array.push_back(budget_to_json(budget));
        }
        return {
            {"tool_version", VERSION_STRING},
            {"budgets", std::move(array)}
        };
    }

    Result<std::vector<Measurement>> measurements_from_json(const json& document) {
        const json* samples = &document;
        if (document.is_object()) {
            if (!document.contains("measurements")) {
                return Result<std::vector<Measurement>>::failure(
                    Error::not_found("JSON key not found", "measurements"));
            }
            samples = &document.at("measurements");
        }

        if (!samples->is_array()) {
            return Result<std::vector<Measurement>>::failure(
                Error::parse_error("Measurements must be a JSON array"));
        }

        std::vector<Measurement> result;
        result.reserve(samples->size());

        for (std::size_t i = 0; i < samples->size(); ++i) {
            auto sample = measurement_from_json((*samples)[i]);
            if (sample.is_err()) {
                return Result<std::vector<Measurement>>::failure(
                    sample.error().with_context("index " + std::to_string(i)));
            }
            result.push_back(std::move(sample).value());
        }

        return Result<std::vector<Measurement>>::success(std::move(result));
    }

    Result<std::vector<Measurement>> load_measurements(const std::filesystem::path& path) {
        return json_utils::read_file(path).and_then(
            [&path](const json& document) -> Result<std::vector<Measurement>> {
                auto samples = measurements_from_json(document);
                if (samples.is_err()) {
                    return Result<std::vector<Measurement>>::failure(samples.error().with_context(path.string()));
                }
                return samples;
            });
    }

    Result<void> save_results(const std::filesystem::path& path, const std::vector<MeasurementResult>& results) {
        auto written = json_utils::write_file(path, results_to_json(results));
        if (written.is_err()) {
            log::Logger::get().error("Failed to write verdicts: %s", written.error().to_string().c_str());
            return written;
        }

        log::Logger::get().debug("Wrote %zu verdict(s) to %s", results.size(), path.string().c_str());
        return written;
    }

}  // namespace pbr::budgets
