//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/budgets/catalog.hpp"

#include <chrono>
#include <utility>

namespace pbr::budgets {

    namespace {
        using namespace std::chrono_literals;

        constexpr std::int64_t KiB = 1024;
        constexpr std::int64_t MiB = 1024 * KiB;

        Budget make_budget(std::string name,
                           const Duration max_duration,
                           const std::int64_t max_allocations,
                           const std::int64_t max_bytes,
                           std::string priority_level,
                           std::string description) {
            Budget budget;
            budget.name = std::move(name);
            budget.max_duration = max_duration;
            budget.max_allocations = max_allocations;
            budget.max_bytes = max_bytes;
            budget.priority = std::move(priority_level);
            budget.description = std::move(description);
            return budget;
        }
    }

    std::vector<Budget> standard_budgets() {
        return {
            // Startup path
            make_budget("context_detection", 100ms, 200, 50 * KiB, priority::P0,
                        "Time to detect project context (git root, frameworks, worktree mode)"),
            make_budget("startup_total", 300ms, 10000, 5 * MiB, priority::P0,
                        "Total time from start to ready state (excluding plugins)"),

            // Configuration
            make_budget("config_load", 50ms, 150, 20 * KiB, priority::P1,
                        "Time to load a single configuration file"),
            make_budget("config_merge_single", 30ms, 150, 15 * KiB, priority::P1,
                        "Time to merge a single configuration file"),
            make_budget("config_merge_multiple", 100ms, 600, 50 * KiB, priority::P1,
                        "Time to merge multiple (5+) configuration files"),

            // Plugins
            make_budget("plugin_discovery", 500ms, 10000, 2 * MiB, priority::P0,
                        "Time to discover and enumerate all available plugins"),
            make_budget("plugin_load", 200ms, 1000, 512 * KiB, priority::P1,
                        "Time to load and initialize a single plugin"),
            make_budget("plugin_cache_get", 10us, 0, 0, priority::P2,
                        "Time to retrieve a plugin from cache"),

            make_budget("command_lookup", 1ms, 10, 1 * KiB, priority::P1,
                        "Time to look up a command by name"),

            make_budget("error_creation", 1us, 5, 1 * KiB, priority::P2,
                        "Time to create a structured error"),
            make_budget("error_wrap", 500ns, 5, 512, priority::P2,
                        "Time to wrap an existing error"),

            make_budget("path_validation", 50us, 100, 10 * KiB, priority::P1,
                        "Time to validate a file path for security"),

            // Registry; registry_get is duration-only
            make_budget("registry_get", 100ns, 0, 0, priority::P2,
                        "Time to retrieve an item from registry"),
            make_budget("registry_list", 10us, 5, 4 * KiB, priority::P2,
                        "Time to list all items in registry (100 items)"),
        };
    }

}  // namespace pbr::budgets
