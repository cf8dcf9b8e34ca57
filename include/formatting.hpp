#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "schedule.hpp"
#include "solver_base.hpp"
#include "comparison.hpp"
#include "validation.hpp"
#include <iostream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief One-line totals of a schedule (assigned, cost, conflicts, efficiency).
 */
void printScheduleSummary(const Schedule& schedule, std::ostream& out = std::cout);

/**
 * @brief Per-resource day tables of a schedule, followed by the unassigned list.
 */
void printResourceSchedules(const Schedule& schedule, const std::vector<Resource>& resources,
                            std::ostream& out = std::cout);

/**
 * @brief Side-by-side table of a comparison, with the winner marked.
 */
void printComparisonTable(const ComparisonMap& results, std::ostream& out = std::cout);

/**
 * @brief Iterations, objectives and stop reason of one run.
 */
void printSearchStats(const std::string& algorithm, const SearchStats& stats, std::ostream& out = std::cout);

void printValidationReport(const ValidationReport& report, std::ostream& out = std::cout);
