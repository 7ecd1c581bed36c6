//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/budgets/catalog.hpp"
#include "pbr/utils/logger.hpp"

#include <mutex>
#include <ranges>
#include <stdexcept>
#include <utility>

namespace pbr::budgets {

    BudgetCatalog::BudgetCatalog(std::vector<Budget> budgets) {
        for (auto& budget : budgets) {
            auto name = budget.name;
            budgets_.insert_or_assign(std::move(name), std::move(budget));
        }
    }

    std::optional<Budget> BudgetCatalog::get_budget(const std::string_view name) const {
        std::shared_lock lock(mutex_);

        const auto it = budgets_.find(name);
        if (it == budgets_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Budget BudgetCatalog::must_get_budget(const std::string_view name) const {
        if (auto budget = get_budget(name)) {
            return std::move(*budget);
        }

        const std::string missing(name);
        log::Logger::get().error("No performance budget registered for '%s'", missing.c_str());
        throw std::logic_error("no performance budget registered for '" + missing + "'");
    }

    void BudgetCatalog::register_budget(Budget budget) {
        std::unique_lock lock(mutex_);

        auto name = budget.name;
        if (const auto [it, inserted] = budgets_.insert_or_assign(std::move(name), std::move(budget)); !inserted) {
            log::Logger::get().debug("Replaced performance budget '%s'", it->first.c_str());
        }
    }

    std::vector<Budget> BudgetCatalog::list_budgets() const {
        std::shared_lock lock(mutex_);

        std::vector<Budget> result;
        result.reserve(budgets_.size());

        for (const auto& budget : budgets_ | std::views::values) {
            result.push_back(budget);
        }

        return result;
    }

    std::vector<Budget> BudgetCatalog::list_by_priority(const std::string_view priority) const {
        std::shared_lock lock(mutex_);

        std::vector<Budget> result;
        for (const auto& budget : budgets_ | std::views::values) {
            if (budget.priority == priority) {
                result.push_back(budget);
            }
        }

        return result;
    }

    bool BudgetCatalog::contains(const std::string_view name) const {
        std::shared_lock lock(mutex_);
        return budgets_.find(name) != budgets_.end();
    }

    std::size_t BudgetCatalog::size() const {
        std::shared_lock lock(mutex_);
        return budgets_.size();
    }

    bool BudgetCatalog::empty() const {
        std::shared_lock lock(mutex_);
        return budgets_.empty();
    }

    BudgetCatalog& default_catalog() {
        static BudgetCatalog catalog(standard_budgets());
        return catalog;
    }

}  // namespace pbr::budgets
