///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string nextScheduleId(const std::string& algorithm) {
    static std::atomic<long> sequence{0};
    return algorithm + "-" + std::to_string(++sequence);
}

Assignment randomAssignment(const EligibilityTable& eligible, RandomGenerator& rng) {
    Assignment assignment(eligible.size(), kUnassigned);
    for (size_t i = 0; i < eligible.size(); ++i) {
        if (!eligible[i].empty()) {
            assignment[i] = eligible[i][rng.pickIndex((int)eligible[i].size())];
        }
    }
    return assignment;
}

Schedule buildSchedule(const std::string& algorithm,
                       const std::vector<Appointment>& appointments,
                       const std::vector<Resource>& resources,
                       const EligibilityTable& eligible,
                       const Assignment& assignment) {
    Schedule schedule(nextScheduleId(algorithm), algorithm, appointments);
    for (size_t i = 0; i < appointments.size(); ++i) {
        int r = i < assignment.size() ? assignment[i] : kUnassigned;
        if (r >= 0 && r < (int)resources.size()) {
            schedule.assign(appointments[i].id(), resources[r].id());
        } else if (i < eligible.size() && eligible[i].empty()) {
            schedule.markInfeasible(appointments[i].id());
        } else {
            schedule.markUnassigned(appointments[i].id());
        }
    }
    schedule.finalize(resources);
    return schedule;
}
