#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>


///////////////////////////
///       METRICS       ///
///////////////////////////
/**
 * @brief Derived aggregate of a finalized schedule.
 *
 * Only produced by computeScheduleMetrics(); never filled in by hand.
 */
struct ScheduleMetrics {
    int totalAppointments = 0;
    int assignedAppointments = 0;
    int unassignedAppointments = 0;
    int infeasibleAppointments = 0;
    int conflictCount = 0;

    double totalCost = 0.0;
    double totalScore = 0.0;
    double averageCostPerAppointment = 0.0; ///< Over assigned appointments.
    double averageScorePerAppointment = 0.0; ///< Over assigned appointments.

    long totalScheduledMinutes = 0; ///< Sum of assigned durations.
    long totalAvailableMinutes = 0; ///< Used resources x schedule span.
    double utilizationRate = 0.0; ///< Scheduled / available, clamped to [0, 1].
    double efficiencyScore = 0.0; ///< In [0, 100].

    /// Appointments per used resource id.
    std::map<std::string, int> resourceUtilization;
    std::map<Priority, int> priorityDistribution;
    std::map<AppointmentType, int> typeDistribution;

    /**
     * @brief Percentage of appointments with a resource (0 for empty input).
     */
    double assignmentRate() const;

    /**
     * @brief Conflicts per appointment, as a percentage.
     */
    double conflictRate() const;

    /// Resource id with the most appointments, if any.
    std::optional<std::string> mostUtilizedResource() const;

    /// Resource id with the fewest appointments among used ones, if any.
    std::optional<std::string> leastUtilizedResource() const;
};


///////////////////////////
///      SCHEDULE       ///
///////////////////////////
/**
 * @brief Output of one optimization run.
 *
 * Holds a private snapshot of the input appointments, the appointment id ->
 * resource id mapping and the complementary unassigned set. The owning
 * optimizer populates it incrementally and calls finalize() exactly once;
 * afterwards every mutator throws std::logic_error.
 */
class Schedule {
public:
    Schedule(std::string id, std::string algorithmName, std::vector<Appointment> appointments);

    const std::string& id() const { return id_; }
    const std::string& algorithmName() const { return algorithmName_; }
    const std::vector<Appointment>& appointments() const { return appointments_; }

    /**
     * @brief Record appointmentId -> resourceId (replaces an earlier decision).
     *
     * @throws std::logic_error if finalized.
     * @throws std::invalid_argument if the appointment is not part of the schedule.
     */
    void assign(const std::string& appointmentId, const std::string& resourceId);

    /**
     * @brief Record that the appointment has no resource.
     */
    void markUnassigned(const std::string& appointmentId);

    /**
     * @brief Record that no resource could ever host the appointment.
     *
     * Infeasible appointments are also unassigned.
     */
    void markInfeasible(const std::string& appointmentId);

    /**
     * @brief Compute totals and metrics from the given resources and freeze.
     *
     * @throws std::logic_error if already finalized or if some appointment is
     *         neither assigned nor unassigned.
     * @throws std::invalid_argument if an assignment names an unknown resource.
     */
    void finalize(const std::vector<Resource>& resources);

    bool isFinalized() const { return finalized_; }

    /// appointment id -> resource id, ordered by appointment id.
    const std::map<std::string, std::string>& assignments() const { return assignments_; }
    const std::set<std::string>& unassigned() const { return unassigned_; }
    const std::set<std::string>& infeasible() const { return infeasible_; }

    std::optional<std::string> resourceFor(const std::string& appointmentId) const;
    std::vector<const Appointment*> appointmentsOn(const std::string& resourceId) const;
    const Appointment* findAppointment(const std::string& appointmentId) const;

    double totalCost() const { return totalCost_; }
    double totalScore() const { return totalScore_; }
    int conflictCount() const { return conflictCount_; }
    bool hasConflicts() const { return conflictCount_ > 0; }

    /// Valid after finalize().
    const ScheduleMetrics& metrics() const { return metrics_; }
    double utilizationRate() const { return metrics_.utilizationRate; }
    double efficiencyScore() const { return metrics_.efficiencyScore; }

    /// Earliest start and latest end over assigned appointments.
    std::optional<TimePoint> startDate() const;
    std::optional<TimePoint> endDate() const;

private:
    std::string id_;
    std::string algorithmName_;
    std::vector<Appointment> appointments_;
    std::map<std::string, size_t> indexById_;

    std::map<std::string, std::string> assignments_;
    std::set<std::string> unassigned_;
    std::set<std::string> infeasible_;

    double totalCost_ = 0.0;
    double totalScore_ = 0.0;
    int conflictCount_ = 0;
    ScheduleMetrics metrics_;
    bool finalized_ = false;

    void requireMutable() const;
    void requireKnown(const std::string& appointmentId) const;
};

/**
 * @brief The single metrics-computation step for a fully populated schedule.
 *
 * Totals are recomputed from the appointment snapshot and the resources;
 * conflicts use countOverlappingPairs() on every resource.
 */
ScheduleMetrics computeScheduleMetrics(const Schedule& schedule, const std::vector<Resource>& resources);
