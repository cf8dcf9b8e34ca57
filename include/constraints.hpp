#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <vector>


///////////////////////////
///     ASSIGNMENTS     ///
///////////////////////////
/// Sentinel used to mark an appointment without a resource.
static constexpr int kUnassigned = -1;

/**
 * @brief Candidate solution shared by all optimizers.
 *
 * assignment[i] is the index into the resource list hosting appointment i,
 * or kUnassigned.
 */
using Assignment = std::vector<int>;

/**
 * @brief Eligible resource indices per appointment index, in resource order.
 */
using EligibilityTable = std::vector<std::vector<int>>;

/**
 * @brief Aggregate totals of one assignment, computed from scratch.
 */
struct AssignmentTotals {
    int assigned = 0; ///< Appointments with a resource.
    int unassigned = 0; ///< Appointments without a resource.
    int conflicts = 0; ///< Overlapping pairs on the same resource.
    double totalCost = 0.0; ///< Sum of resource costs of assigned appointments.
    double totalScore = 0.0; ///< Sum of calculateScore() of assigned appointments.
};


///////////////////////////
///     EVALUATORS      ///
///////////////////////////
/**
 * @brief Resource is active, holds every required capability, and its
 * availability window contains the appointment window.
 */
bool isEligible(const Appointment& appt, const Resource& res);

/**
 * @brief Half-open interval overlap; identical ids never conflict.
 */
bool conflictsInTime(const Appointment& a, const Appointment& b);

/**
 * @brief costPerHour * minutes / 60.
 */
double resourceCost(const Resource& res, Minutes duration);

/**
 * @brief Soft preference used to order backtracking candidates.
 *
 * 1.0 when the resource covers the required capabilities, plus 0.5 when it
 * holds at least one preferred capability.
 */
double capabilityMatchBonus(const Appointment& appt, const Resource& res);

/**
 * @brief Precompute isEligible() for every (appointment, resource) pair.
 */
EligibilityTable buildEligibility(const std::vector<Appointment>& appts,
                                  const std::vector<Resource>& resources);

/**
 * @brief Count overlapping unordered pairs among appointments sharing one resource.
 *
 * This is the single conflict-counting rule used by fitness, energy, metrics
 * and validation: each overlapping pair of distinct appointments counts once.
 */
int countOverlappingPairs(const std::vector<const Appointment*>& onResource);

/**
 * @brief Conflict count of a whole assignment (sum of countOverlappingPairs per resource).
 */
int countConflicts(const std::vector<Appointment>& appts, int numResources,
                   const Assignment& assignment);

/**
 * @brief Assigned/unassigned counts, conflicts, cost and score of an assignment.
 */
AssignmentTotals evaluateAssignment(const std::vector<Appointment>& appts,
                                    const std::vector<Resource>& resources,
                                    const Assignment& assignment);

/**
 * @brief max(0, 1 - 0.1 * conflicts).
 */
double conflictPenalty(int conflicts);

/**
 * @brief (0.4 * utilization + 0.4 * conflictPenalty + 0.2 * assignmentRate) * 100.
 *
 * Utilization is clamped to [0, 1] and assignmentRate is a fraction, so the
 * result always lies within [0, 100].
 */
double efficiencyScore(double utilization, int conflicts, double assignmentRate);


///////////////////////////
///   INCREMENTAL STATE ///
///////////////////////////
/**
 * @brief Incremental occupancy of resources during constructive search.
 *
 * Tracks which appointments are placed on which resource and enforces the
 * hard rules of a partial assignment when placing:
 *  - no two overlapping appointments on the same resource,
 *  - no overlap with appointments on a mutually exclusive resource.
 * Eligibility itself is checked by the caller through the EligibilityTable.
 */
class AssignmentState {
public:
    /**
     * @brief Construct an empty state for the given inputs.
     *
     * Both vectors must outlive the state.
     */
    AssignmentState(const std::vector<Appointment>& appts, const std::vector<Resource>& resources);

    /**
     * @brief Whether appointment apptIndex may go on resource resIndex now.
     */
    bool canPlace(int apptIndex, int resIndex) const;

    /**
     * @brief Try to place an appointment; leaves the state unchanged on failure.
     */
    bool place(int apptIndex, int resIndex);

    /**
     * @brief Undo a previously successful placement.
     */
    void undo(int apptIndex, int resIndex);

    /**
     * @brief Current resource of every appointment (kUnassigned if none).
     */
    const Assignment& assignment() const { return assignment_; }

    int placedCount() const { return placed_; }

private:
    const std::vector<Appointment>& appts_;
    const std::vector<Resource>& resources_;

    /// onResource_[r] = appointment indices currently placed on resource r.
    std::vector<std::vector<int>> onResource_;

    /// exclusive_[r] = indices of resources that may not be used concurrently with r.
    std::vector<std::vector<int>> exclusive_;

    Assignment assignment_;
    int placed_ = 0;

    /**
     * @brief Check that no appointment on resource resIndex overlaps apptIndex.
     */
    bool checkResourceFree(int apptIndex, int resIndex) const;
};
