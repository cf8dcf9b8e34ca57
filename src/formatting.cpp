///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "constraints.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief "YYYY-MM-DD" part of a formatted time point.
 */
static std::string formatDay(TimePoint t) {
    return formatTimePoint(t).substr(0, 10);
}

/**
 * @brief "HH:MM" part of a formatted time point.
 */
static std::string formatClock(TimePoint t) {
    return formatTimePoint(t).substr(11, 5);
}

/**
 * @brief Print the header row for a per-day resource table.
 *
 * Uses fixed-width columns to align time, appointment, type, priority and cost.
 */
static void printDayTableHeader(std::ostream& out) {
    out << "    "
        << std::left << std::setw(11) << "Time"
        << " | " << std::left << std::setw(22) << "Appointment"
        << " | " << std::left << std::setw(12) << "Type"
        << " | " << std::left << std::setw(8)  << "Priority"
        << " | " << std::left << std::setw(8)  << "Cost"
        << "\n";

    // Underline with a matching ASCII separator line.
    out << "    "
        << std::string(11, '-')
        << "-+-" << std::string(22, '-')
        << "-+-" << std::string(12, '-')
        << "-+-" << std::string(8, '-')
        << "-+-" << std::string(8, '-')
        << "\n";
}

void printScheduleSummary(const Schedule& schedule, std::ostream& out) {
    const ScheduleMetrics& m = schedule.metrics();
    out << schedule.algorithmName() << " schedule " << schedule.id() << ": "
        << m.assignedAppointments << "/" << m.totalAppointments << " assigned"
        << ", " << m.infeasibleAppointments << " infeasible"
        << ", cost = " << std::fixed << std::setprecision(2) << schedule.totalCost()
        << ", conflicts = " << schedule.conflictCount()
        << ", utilization = " << std::setprecision(1) << m.utilizationRate * 100.0 << "%"
        << ", efficiency = " << std::setprecision(2) << schedule.efficiencyScore()
        << std::defaultfloat << "\n";
}

/**
 * @brief Print per-resource schedules grouped by day and ordered by time.
 *
 * Resources without appointments are listed with a placeholder so that idle
 * capacity is visible at a glance.
 */
void printResourceSchedules(const Schedule& schedule, const std::vector<Resource>& resources,
                            std::ostream& out) {
    for (const Resource& res : resources) {
        out << "----------------------------------------\n";
        out << "Schedule for " << res.name() << " (" << res.id() << ", "
            << resourceTypeInfo(res.type()).displayName
            << (res.isActive() ? "" : ", inactive") << "):\n";

        std::vector<const Appointment*> appts = schedule.appointmentsOn(res.id());
        if (appts.empty()) {
            out << "  (no appointments)\n";
            continue;
        }

        std::string currentDay;
        for (const Appointment* a : appts) {
            // When the day changes, print a new day header and table header.
            std::string day = formatDay(a->start());
            if (day != currentDay) {
                currentDay = day;
                out << "\n  " << day << ":\n";
                printDayTableHeader(out);
            }

            std::string timeRange = formatClock(a->start()) + "-" + formatClock(a->end());
            std::ostringstream cost;
            cost << std::fixed << std::setprecision(2) << resourceCost(res, a->duration());

            out << "    "
                << std::left << std::setw(11) << timeRange
                << " | " << std::left << std::setw(22) << (a->id() + " " + a->title()).substr(0, 22)
                << " | " << std::left << std::setw(12) << appointmentTypeInfo(a->type()).displayName
                << " | " << std::left << std::setw(8)  << priorityInfo(a->priority()).displayName
                << " | " << std::left << std::setw(8)  << cost.str()
                << "\n";
        }
        out << "\n";
    }

    if (!schedule.unassigned().empty()) {
        out << "----------------------------------------\n";
        out << "Unassigned:\n";
        for (const std::string& id : schedule.unassigned()) {
            const Appointment* a = schedule.findAppointment(id);
            out << "  " << id;
            if (a != nullptr) out << " " << a->title();
            if (schedule.infeasible().count(id) > 0) out << " (no eligible resource)";
            out << "\n";
        }
    }
}

/**
 * @brief Print one row per algorithm and mark the highest efficiency score.
 */
void printComparisonTable(const ComparisonMap& results, std::ostream& out) {
    std::optional<std::string> winner = selectWinner(results);

    out << std::left << std::setw(6) << "Algo"
        << " | " << std::right << std::setw(10) << "Time (ms)"
        << " | " << std::setw(10) << "Iterations"
        << " | " << std::setw(8)  << "Assigned"
        << " | " << std::setw(10) << "Cost"
        << " | " << std::setw(9)  << "Conflicts"
        << " | " << std::setw(10) << "Efficiency"
        << "\n";
    out << std::string(6, '-')
        << "-+-" << std::string(10, '-')
        << "-+-" << std::string(10, '-')
        << "-+-" << std::string(8, '-')
        << "-+-" << std::string(10, '-')
        << "-+-" << std::string(9, '-')
        << "-+-" << std::string(10, '-')
        << "\n";

    for (const auto& [name, r] : results) {
        const ScheduleMetrics& m = r.schedule.metrics();
        std::string assigned = std::to_string(m.assignedAppointments) + "/" + std::to_string(m.totalAppointments);
        out << std::left << std::setw(6) << name
            << " | " << std::right << std::setw(10) << std::fixed << std::setprecision(2) << r.executionTimeMs
            << " | " << std::setw(10) << r.iterations
            << " | " << std::setw(8)  << assigned
            << " | " << std::setw(10) << r.totalCost
            << " | " << std::setw(9)  << r.conflictCount
            << " | " << std::setw(10) << r.efficiencyScore
            << (winner && *winner == name ? "  <- winner" : "")
            << "\n";
    }
    out << std::defaultfloat;
}

void printSearchStats(const std::string& algorithm, const SearchStats& stats, std::ostream& out) {
    const char* stop = stats.cancelled ? "cancelled" : (stats.exhausted ? "iteration bound" : "search finished");
    out << algorithm << ": iterations = " << stats.iterations
        << ", initial objective = " << stats.initialObjective
        << ", best objective = " << stats.bestObjective
        << ", stopped by " << stop << "\n";
}

void printValidationReport(const ValidationReport& report, std::ostream& out) {
    out << "Validation: " << (report.isValid() ? "VALID" : "INVALID")
        << " (" << report.errors.size() << " errors, " << report.warnings.size() << " warnings)\n";
    for (const std::string& e : report.errors) {
        out << "  ERROR: " << e << "\n";
    }
    for (const std::string& w : report.warnings) {
        out << "  WARNING: " << w << "\n";
    }
}
