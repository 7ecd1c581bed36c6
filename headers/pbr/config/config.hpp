//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PBR_CONFIG_HPP
#define PBR_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Budget file loading (TOML).
 *
 * A budget file declares logging settings, whether the standard budgets are
 * seeded, and any number of project-specific budgets:
 *
 * @code
 *     [logging]
 *     level = "INFO"
 *     console = true
 *     file = ""
 *
 *     [catalog]
 *     include_standard = true
 *
 *     [[budget]]
 *     name = "my_operation"
 *     max_duration_ms = 50        # or max_duration_ns = 50000000
 *     max_allocations = 0         # 0 = no limit
 *     max_bytes = 0               # 0 = no limit
 *     priority = "P1"
 *     description = "Maximum time for my operation"
 * @endcode
 */

#include "pbr/result.hpp"
#include "pbr/types.hpp"
#include "pbr/budgets/catalog.hpp"

#include <string>
#include <vector>

namespace pbr::config {

    struct LoggingConfig {
        std::string level = "INFO";
        bool console = true;
        std::string file;
    };

    struct CatalogConfig {
        bool include_standard = true;
    };

    class Config {
    public:
        Config() = default;

        LoggingConfig logging;
        CatalogConfig catalog;

        /**
         * Budgets declared in the file, in file order.
         */
        std::vector<Budget> budgets;

        /**
         * Load configuration from a TOML file.
         *
         * @return The parsed config, or NotFound / IoError / ParseError /
         *         ConfigError.
         */
        static Result<Config> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text.
         */
        static Result<Config> load_from_string(const std::string& content);

        static Config default_config();

        [[nodiscard]] Result<void> save_to_file(const std::string& path) const;

        /**
         * Renders the configuration as TOML. Durations are written as
         * max_duration_ns so the output loads back unchanged.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Checks the logging level and every declared budget.
         *
         * @return Success, or a ConfigError listing every problem found.
         */
        [[nodiscard]] Result<void> validate() const;

        /**
         * Seeds the catalog with the standard budgets when
         * catalog.include_standard is set, then registers each declared
         * budget in order. Declared budgets replace standard entries with
         * the same name.
         */
        void apply_to(budgets::BudgetCatalog& target) const;

        /**
         * Applies the [logging] settings to the process-wide logger.
         */
        [[nodiscard]] Result<void> apply_logging() const;
    };

}  // namespace pbr::config

#endif //PBR_CONFIG_HPP
