//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/config/config.hpp"
#include "pbr/utils/logger.hpp"
#include "pbr/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>

namespace pbr::config {

    namespace {
        constexpr std::string_view known_sections[] = {"logging", "catalog", "budget"};

        // About 285 years; the nanosecond count stays inside int64
        constexpr double max_duration_ms_magnitude = 9.0e12;

        Result<std::string> read_text(const std::string& path) {
            if (std::error_code ec; !std::filesystem::exists(path, ec)) {
                return Result<std::string>::failure(Error::not_found("Budget file not found", path));
            }

            std::ifstream file(path);
            if (!file) {
                return Result<std::string>::failure(Error::io_error("Failed to open budget file", path));
            }

            std::ostringstream content;
            content << file.rdbuf();
            return Result<std::string>::success(content.str());
        }

        /**
         * Rejects a key that is present with a non-integer value; value_or()
         * would silently fall back to the default.
         */
        std::optional<Error> check_integer(const toml::table& entry, const std::string_view key, const std::string& owner) {
            if (const auto node = entry[key]; node && !node.is_integer()) {
                return Error::config_error("Expected an integer for '" + std::string(key) + "'", owner);
            }
            return std::nullopt;
        }

        Result<Budget> parse_budget(const toml::table& entry, const std::size_t index) {
            const auto name = entry["name"].value<std::string>();
            if (!name.has_value() || name->empty()) {
                return Result<Budget>::failure(
                    Error::config_error("Budget entry is missing a name", "budget[" + std::to_string(index) + "]"));
            }

            for (const auto key : {"max_duration_ns", "max_allocations", "max_bytes"}) {
                if (auto error = check_integer(entry, key, *name)) {
                    return Result<Budget>::failure(std::move(*error));
                }
            }

            if (const auto node = entry["max_duration_ms"]; node && !node.is_number()) {
                return Result<Budget>::failure(
                    Error::config_error("Expected a number for 'max_duration_ms'", *name));
            }

            const auto ns = entry["max_duration_ns"].value<std::int64_t>();
            const auto ms = entry["max_duration_ms"].value<double>();

            if (ns.has_value() && ms.has_value()) {
                return Result<Budget>::failure(
                    Error::config_error("Budget sets both max_duration_ns and max_duration_ms", *name));
            }
            if (!ns.has_value() && !ms.has_value()) {
                return Result<Budget>::failure(
                    Error::config_error("Budget needs max_duration_ns or max_duration_ms", *name));
            }
            if (ms.has_value() && !(std::isfinite(*ms) && std::abs(*ms) <= max_duration_ms_magnitude)) {
                return Result<Budget>::failure(
                    Error::config_error("Value out of range for 'max_duration_ms'", *name));
            }

            Budget budget;
            budget.name = *name;
            budget.max_duration = ns.has_value()
                ? Duration(*ns)
                : std::chrono::round<Duration>(std::chrono::duration<double, std::milli>(*ms));
            budget.max_allocations = entry["max_allocations"].value_or(std::int64_t{0});
            budget.max_bytes = entry["max_bytes"].value_or(std::int64_t{0});
            budget.priority = entry["priority"].value_or(std::string(priority::P2));
            budget.description = entry["description"].value_or(std::string{});
            return Result<Budget>::success(std::move(budget));
        }
    }

    Result<Config> Config::load_from_file(const std::string& path) {
        const auto content = read_text(path);
        if (content.is_err()) {
            return Result<Config>::failure(content.error());
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<Config>::failure(config.error().with_context(path));
        }

        log::Logger::get().debug("Loaded %zu budget(s) from %s", config.value().budgets.size(), path.c_str());
        return config;
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            for (const auto& section : tbl) {
                const std::string_view key = section.first.str();
                if (std::ranges::find(known_sections, key) == std::ranges::end(known_sections)) {
                    log::Logger::get().warn("Ignoring unknown budget file section '%s'", std::string(key).c_str());
                }
            }

            if (const auto* logging = tbl["logging"].as_table()) {
                if ((*logging)["level"])
                    config.logging.level = (*logging)["level"].value_or("INFO");
                if ((*logging)["console"])
                    config.logging.console = (*logging)["console"].value_or(true);
                if ((*logging)["file"])
                    config.logging.file = (*logging)["file"].value_or("");
            }

            if (const auto* catalog = tbl["catalog"].as_table()) {
                if ((*catalog)["include_standard"])
                    config.catalog.include_standard = (*catalog)["include_standard"].value_or(true);
            }

            if (tbl["budget"]) {
                const auto* entries = tbl["budget"].as_array();
                if (entries == nullptr) {
                    return Result<Config>::failure(
                        Error::config_error("'budget' must be an array of tables, use [[budget]]"));
                }

                for (std::size_t i = 0; i < entries->size(); ++i) {
                    const auto* entry = entries->get(i)->as_table();
                    if (entry == nullptr) {
                        return Result<Config>::failure(
                            Error::config_error("Budget entry is not a table", "budget[" + std::to_string(i) + "]"));
                    }

                    auto budget = parse_budget(*entry, i);
                    if (budget.is_err()) {
                        return Result<Config>::failure(budget.error());
                    }
                    config.budgets.push_back(std::move(budget).value());
                }
            }

            if (auto validation_result = config.validate(); validation_result.is_err()) {
                return Result<Config>::failure(validation_result.error());
            }

            return Result<Config>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(
                Error::parse_error("Failed to parse TOML budget file", std::string(err.description())));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void> Config::save_to_file(const std::string& path) const {
        std::ofstream file(path);
        if (!file) {
            return Result<void>::failure(Error::io_error("Failed to open budget file for writing", path));
        }

        file << to_string();
        if (!file) {
            return Result<void>::failure(Error::io_error("Failed to write budget file", path));
        }

        return Result<void>::success();
    }

    std::string Config::to_string() const {
        toml::table root;

        root.insert("logging", toml::table{
            {"level", logging.level},
            {"console", logging.console},
            {"file", logging.file}
        });

        root.insert("catalog", toml::table{
            {"include_standard", catalog.include_standard}
        });

        if (!budgets.empty()) {
            toml::array entries;
            for (const auto& budget : budgets) {
                entries.push_back(toml::table{
                    {"name", budget.name},
                    {"max_duration_ns", static_cast<std::int64_t>(budget.max_duration.count())},
                    {"max_allocations", budget.max_allocations},
                    {"max_bytes", budget.max_bytes},
                    {"priority", budget.priority},
                    {"description", budget.description}
                });
            }
            root.insert("budget", std::move(entries));
        }

        std::ostringstream ss;
        ss << root << "\n";
        return ss.str();
    }

    Result<void> Config::validate() const {
        std::vector<std::string> errors;

        if (!log::level_from_string(logging.level).has_value()) {
            errors.emplace_back("unknown logging level '" + logging.level + "'");
        }

        for (const auto& budget : budgets) {
            if (budget.name.empty()) {
                errors.emplace_back("budget name must not be empty");
                continue;
            }
            if (budget.max_duration < Duration::zero()) {
                errors.emplace_back(budget.name + ": max_duration must be non-negative");
            }
            if (budget.max_allocations < 0) {
                errors.emplace_back(budget.name + ": max_allocations must be non-negative");
            }
            if (budget.max_bytes < 0) {
                errors.emplace_back(budget.name + ": max_bytes must be non-negative");
            }
        }

        if (!errors.empty()) {
            return Result<void>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  ")));
        }

        return Result<void>::success();
    }

    void Config::apply_to(budgets::BudgetCatalog& target) const {
        if (catalog.include_standard) {
            for (auto& budget : budgets::standard_budgets()) {
                target.register_budget(std::move(budget));
            }
        }

        for (const auto& budget : budgets) {
            target.register_budget(budget);
        }

        log::Logger::get().info("Budget catalog holds %zu budget(s)", target.size());
    }

    Result<void> Config::apply_logging() const {
        const auto level = log::level_from_string(logging.level);
        if (!level.has_value()) {
            return Result<void>::failure(Error::config_error("Unknown logging level", logging.level));
        }

        auto& logger = log::Logger::get();
        logger.set_level(*level);
        logger.set_console(logging.console);
        return logger.set_file(logging.file);
    }

}  // namespace pbr::config
