///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>
#include <unordered_map>


///////////////////////////
///     EVALUATORS      ///
///////////////////////////
bool isEligible(const Appointment& appt, const Resource& res) {
    if (!res.isActive()) return false;
    if (!res.hasRequiredCapabilities(appt.requiredCapabilities())) return false;
    return res.isAvailableAt(appt.start(), appt.duration());
}

bool conflictsInTime(const Appointment& a, const Appointment& b) {
    return a.conflictsWith(b);
}

double resourceCost(const Resource& res, Minutes duration) {
    return res.calculateCost(duration);
}

double capabilityMatchBonus(const Appointment& appt, const Resource& res) {
    double bonus = 0.0;
    if (res.hasRequiredCapabilities(appt.requiredCapabilities())) {
        bonus += 1.0;
    }
    for (const std::string& cap : appt.preferredCapabilities()) {
        if (res.capabilities().count(cap) > 0) {
            bonus += 0.5;
            break;
        }
    }
    return bonus;
}

EligibilityTable buildEligibility(const std::vector<Appointment>& appts,
                                  const std::vector<Resource>& resources) {
    EligibilityTable table(appts.size());
    for (size_t a = 0; a < appts.size(); ++a) {
        for (size_t r = 0; r < resources.size(); ++r) {
            if (isEligible(appts[a], resources[r])) {
                table[a].push_back((int)r);
            }
        }
    }
    return table;
}

/**
 * @brief Count overlapping unordered pairs on a single resource.
 *
 * Sorting by start lets the inner scan stop at the first appointment that
 * starts after the current one ends.
 */
int countOverlappingPairs(const std::vector<const Appointment*>& onResource) {
    std::vector<const Appointment*> sorted = onResource;
    std::sort(sorted.begin(), sorted.end(), [](const Appointment* a, const Appointment* b) {
        return a->start() < b->start();
    });

    int conflicts = 0;
    for (size_t i = 0; i < sorted.size(); ++i) {
        for (size_t j = i + 1; j < sorted.size(); ++j) {
            if (sorted[j]->start() >= sorted[i]->end()) break;
            if (conflictsInTime(*sorted[i], *sorted[j])) conflicts++;
        }
    }
    return conflicts;
}

int countConflicts(const std::vector<Appointment>& appts, int numResources,
                   const Assignment& assignment) {
    std::vector<std::vector<const Appointment*>> byResource(numResources);
    for (size_t i = 0; i < assignment.size() && i < appts.size(); ++i) {
        int r = assignment[i];
        if (r >= 0 && r < numResources) {
            byResource[r].push_back(&appts[i]);
        }
    }

    int conflicts = 0;
    for (const auto& list : byResource) {
        if (list.size() > 1) conflicts += countOverlappingPairs(list);
    }
    return conflicts;
}

AssignmentTotals evaluateAssignment(const std::vector<Appointment>& appts,
                                    const std::vector<Resource>& resources,
                                    const Assignment& assignment) {
    AssignmentTotals totals;
    for (size_t i = 0; i < appts.size(); ++i) {
        int r = i < assignment.size() ? assignment[i] : kUnassigned;
        if (r < 0 || r >= (int)resources.size()) {
            totals.unassigned++;
            continue;
        }
        totals.assigned++;
        totals.totalCost += resourceCost(resources[r], appts[i].duration());
        totals.totalScore += appts[i].calculateScore();
    }
    totals.conflicts = countConflicts(appts, (int)resources.size(), assignment);
    return totals;
}

double conflictPenalty(int conflicts) {
    return std::max(0.0, 1.0 - 0.1 * conflicts);
}

double efficiencyScore(double utilization, int conflicts, double assignmentRate) {
    double u = std::min(1.0, std::max(0.0, utilization));
    double a = std::min(1.0, std::max(0.0, assignmentRate));
    return (0.4 * u + 0.4 * conflictPenalty(conflicts) + 0.2 * a) * 100.0;
}


///////////////////////////
///   INCREMENTAL STATE ///
///////////////////////////
/**
 * @brief Initialize empty occupancy and resolve exclusivity ids to indices.
 *
 * Exclusivity is symmetric: a pair is linked when either side declares it.
 * Unknown ids in a conflict set are ignored.
 */
AssignmentState::AssignmentState(const std::vector<Appointment>& appts,
                                 const std::vector<Resource>& resources)
        : appts_(appts), resources_(resources) {
    int numResources = (int)resources.size();
    onResource_.assign(numResources, {});
    exclusive_.assign(numResources, {});
    assignment_.assign(appts.size(), kUnassigned);

    std::unordered_map<std::string, int> indexById;
    for (int r = 0; r < numResources; ++r) {
        indexById[resources[r].id()] = r;
    }
    for (int r = 0; r < numResources; ++r) {
        for (const std::string& otherId : resources[r].conflicts()) {
            auto it = indexById.find(otherId);
            if (it == indexById.end() || it->second == r) continue;
            int o = it->second;
            if (std::find(exclusive_[r].begin(), exclusive_[r].end(), o) == exclusive_[r].end())
                exclusive_[r].push_back(o);
            if (std::find(exclusive_[o].begin(), exclusive_[o].end(), r) == exclusive_[o].end())
                exclusive_[o].push_back(r);
        }
    }
}

bool AssignmentState::canPlace(int apptIndex, int resIndex) const {
    if (apptIndex < 0 || apptIndex >= (int)appts_.size()) return false;
    if (resIndex < 0 || resIndex >= (int)resources_.size()) return false;
    if (assignment_[apptIndex] != kUnassigned) return false;

    // Same resource must be free for the whole window.
    if (!checkResourceFree(apptIndex, resIndex)) return false;

    // Mutually exclusive resources must not be busy at the same time.
    for (int other : exclusive_[resIndex]) {
        if (!checkResourceFree(apptIndex, other)) return false;
    }
    return true;
}

bool AssignmentState::place(int apptIndex, int resIndex) {
    if (!canPlace(apptIndex, resIndex)) return false;
    onResource_[resIndex].push_back(apptIndex);
    assignment_[apptIndex] = resIndex;
    placed_++;
    return true;
}

void AssignmentState::undo(int apptIndex, int resIndex) {
    if (resIndex < 0 || resIndex >= (int)onResource_.size()) return;
    auto& list = onResource_[resIndex];
    auto it = std::find(list.begin(), list.end(), apptIndex);
    if (it == list.end()) return;
    list.erase(it);
    assignment_[apptIndex] = kUnassigned;
    placed_--;
}

bool AssignmentState::checkResourceFree(int apptIndex, int resIndex) const {
    const Appointment& appt = appts_[apptIndex];
    for (int placedIndex : onResource_[resIndex]) {
        if (conflictsInTime(appt, appts_[placedIndex])) return false;
    }
    return true;
}
