#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "schedule.hpp"
#include <string>
#include <vector>


///////////////////////////
///     VALIDATION      ///
///////////////////////////
/**
 * @brief Outcome of re-checking a schedule from scratch.
 *
 * Errors are hard violations that make the schedule unusable; warnings are
 * informational (unassigned or infeasible appointments, exclusivity clashes).
 */
struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool isValid() const { return errors.empty(); }
};

/**
 * @brief Re-check every assignment against the given resources.
 *
 * Nothing the optimizer reported is trusted: eligibility, double bookings
 * and the conflict count are all recomputed.
 *
 * Errors: appointments covered zero or two times, unknown/inactive resource,
 * capability mismatch, assignment outside the availability window, two
 * overlapping appointments on one resource, reported conflict count that
 * disagrees with the recount.
 * Warnings: unassigned appointments, infeasible appointments, overlapping
 * use of mutually exclusive resources.
 */
ValidationReport validateSchedule(const Schedule& schedule, const std::vector<Resource>& resources);
