//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PBR_CATALOG_HPP
#define PBR_CATALOG_HPP

/**
 * @file catalog.hpp
 * @brief Named performance budgets and the catalog that holds them.
 *
 * A BudgetCatalog maps operation names to Budgets. It starts empty or from a
 * list of budgets (usually standard_budgets()) and grows through
 * register_budget(). Entries are never removed; registering a name that is
 * already present replaces the old entry.
 *
 * The catalog is safe to share between threads: lookups and listings take a
 * shared lock, registration takes an exclusive one.
 *
 * Usage:
 * @code
 *     budgets::BudgetCatalog catalog(budgets::standard_budgets());
 *     catalog.register_budget({.name = "my_operation",
 *                              .max_duration = std::chrono::milliseconds(50),
 *                              .priority = priority::P1});
 *
 *     if (auto budget = catalog.get_budget("context_detection")) {
 *         std::cout << to_string(*budget) << "\n";
 *     }
 * @endcode
 */

#include "pbr/types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace pbr::budgets {

    /**
     * Returns the standard budget set.
     *
     * Names, thresholds and priorities of these entries are relied on by
     * downstream tooling; renaming or removing one is a breaking change.
     */
    [[nodiscard]] std::vector<Budget> standard_budgets();

    class BudgetCatalog {
    public:
        BudgetCatalog() = default;

        /**
         * Creates a catalog holding the given budgets. Later entries win
         * over earlier entries with the same name.
         */
        explicit BudgetCatalog(std::vector<Budget> budgets);

        BudgetCatalog(const BudgetCatalog&) = delete;
        BudgetCatalog& operator=(const BudgetCatalog&) = delete;

        /**
         * Looks up a budget by exact name.
         *
         * @return The budget, or nullopt if no budget has that name.
         */
        [[nodiscard]] std::optional<Budget> get_budget(std::string_view name) const;

        /**
         * Looks up a budget that the caller asserts is registered.
         *
         * Intended for benchmark setup code where the name is a literal. A
         * miss is a programming error and never yields a Budget: the miss
         * is logged at ERROR and std::logic_error is thrown. Nothing in the
         * library catches it, so unless a test harness does, the process
         * terminates with the budget name in the log.
         *
         * @throws std::logic_error if no budget has that name.
         */
        [[nodiscard]] Budget must_get_budget(std::string_view name) const;

        /**
         * Inserts a budget, replacing any entry with the same name.
         * Field values are stored as given.
         */
        void register_budget(Budget budget);

        /**
         * Returns a snapshot of every budget, ordered by name.
         */
        [[nodiscard]] std::vector<Budget> list_budgets() const;

        /**
         * Returns the budgets whose priority equals the argument exactly.
         * An unused priority yields an empty vector.
         */
        [[nodiscard]] std::vector<Budget> list_by_priority(std::string_view priority) const;

        [[nodiscard]] bool contains(std::string_view name) const;
        [[nodiscard]] std::size_t size() const;
        [[nodiscard]] bool empty() const;

    private:
        mutable std::shared_mutex mutex_;
        std::map<std::string, Budget, std::less<>> budgets_;
    };

    /**
     * Process-wide catalog, seeded with standard_budgets() on first use.
     *
     * Library code never touches it implicitly; hosts that want a shared
     * catalog pass it to an Evaluator like any other.
     */
    BudgetCatalog& default_catalog();

}  // namespace pbr::budgets

#endif //PBR_CATALOG_HPP
