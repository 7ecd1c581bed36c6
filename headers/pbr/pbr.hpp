//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PERFBUDGETREGISTRY_PBR_HPP
#define PERFBUDGETREGISTRY_PBR_HPP

/**
 * @file pbr.hpp
 * @brief Main header for the Performance Budget Registry library.
 *
 * Pulls in the core types together with the budget catalog and evaluator.
 * Include specific headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "budgets/catalog.hpp"
#include "budgets/evaluator.hpp"

#endif //PERFBUDGETREGISTRY_PBR_HPP
