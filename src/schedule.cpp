///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule.hpp"
#include "constraints.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>


///////////////////////////
///       METRICS       ///
///////////////////////////
double ScheduleMetrics::assignmentRate() const {
    if (totalAppointments == 0) return 0.0;
    return (double)assignedAppointments / totalAppointments * 100.0;
}

double ScheduleMetrics::conflictRate() const {
    if (totalAppointments == 0) return 0.0;
    return (double)conflictCount / totalAppointments * 100.0;
}

std::optional<std::string> ScheduleMetrics::mostUtilizedResource() const {
    if (resourceUtilization.empty()) return std::nullopt;
    auto it = std::max_element(resourceUtilization.begin(), resourceUtilization.end(),
                               [](const auto& a, const auto& b) { return a.second < b.second; });
    return it->first;
}

std::optional<std::string> ScheduleMetrics::leastUtilizedResource() const {
    if (resourceUtilization.empty()) return std::nullopt;
    auto it = std::min_element(resourceUtilization.begin(), resourceUtilization.end(),
                               [](const auto& a, const auto& b) { return a.second < b.second; });
    return it->first;
}

/**
 * @brief Derive every aggregate of a schedule in one pass.
 *
 * Utilization is the scheduled time on used resources divided by
 * (number of used resources x span from earliest start to latest end).
 */
ScheduleMetrics computeScheduleMetrics(const Schedule& schedule, const std::vector<Resource>& resources) {
    std::unordered_map<std::string, const Resource*> resourceById;
    for (const Resource& r : resources) {
        resourceById[r.id()] = &r;
    }

    ScheduleMetrics m;
    m.totalAppointments = (int)schedule.appointments().size();
    m.unassignedAppointments = (int)schedule.unassigned().size();
    m.infeasibleAppointments = (int)schedule.infeasible().size();

    std::map<std::string, std::vector<const Appointment*>> byResource;
    std::optional<TimePoint> earliest, latest;

    for (const auto& [apptId, resId] : schedule.assignments()) {
        const Appointment* appt = schedule.findAppointment(apptId);
        auto it = resourceById.find(resId);
        if (it == resourceById.end()) {
            throw std::invalid_argument("appointment '" + apptId + "' assigned to unknown resource '" + resId + "'");
        }

        m.assignedAppointments++;
        m.totalCost += resourceCost(*it->second, appt->duration());
        m.totalScore += appt->calculateScore();
        m.totalScheduledMinutes += appt->durationMinutes();
        m.priorityDistribution[appt->priority()]++;
        m.typeDistribution[appt->type()]++;
        m.resourceUtilization[resId]++;
        byResource[resId].push_back(appt);

        if (!earliest || appt->start() < *earliest) earliest = appt->start();
        if (!latest || appt->end() > *latest) latest = appt->end();
    }

    for (const auto& entry : byResource) {
        m.conflictCount += countOverlappingPairs(entry.second);
    }

    if (m.assignedAppointments > 0) {
        m.averageCostPerAppointment = m.totalCost / m.assignedAppointments;
        m.averageScorePerAppointment = m.totalScore / m.assignedAppointments;
    }

    if (earliest && latest) {
        long span = (long)(*latest - *earliest).count();
        m.totalAvailableMinutes = span * (long)byResource.size();
    }
    if (m.totalAvailableMinutes > 0) {
        double raw = (double)m.totalScheduledMinutes / (double)m.totalAvailableMinutes;
        m.utilizationRate = std::min(1.0, std::max(0.0, raw));
    }

    double assignedFraction = m.totalAppointments > 0
            ? (double)m.assignedAppointments / m.totalAppointments
            : 0.0;
    m.efficiencyScore = efficiencyScore(m.utilizationRate, m.conflictCount, assignedFraction);
    return m;
}


///////////////////////////
///      SCHEDULE       ///
///////////////////////////
Schedule::Schedule(std::string id, std::string algorithmName, std::vector<Appointment> appointments)
        : id_(std::move(id)), algorithmName_(std::move(algorithmName)), appointments_(std::move(appointments)) {
    for (size_t i = 0; i < appointments_.size(); ++i) {
        indexById_[appointments_[i].id()] = i;
    }
}

void Schedule::assign(const std::string& appointmentId, const std::string& resourceId) {
    requireMutable();
    requireKnown(appointmentId);
    unassigned_.erase(appointmentId);
    infeasible_.erase(appointmentId);
    assignments_[appointmentId] = resourceId;
}

void Schedule::markUnassigned(const std::string& appointmentId) {
    requireMutable();
    requireKnown(appointmentId);
    assignments_.erase(appointmentId);
    unassigned_.insert(appointmentId);
}

void Schedule::markInfeasible(const std::string& appointmentId) {
    markUnassigned(appointmentId);
    infeasible_.insert(appointmentId);
}

/**
 * @brief Freeze the schedule after checking that every appointment is covered.
 */
void Schedule::finalize(const std::vector<Resource>& resources) {
    requireMutable();
    if (assignments_.size() + unassigned_.size() != indexById_.size()) {
        throw std::logic_error("schedule '" + id_ + "' finalized with appointments neither assigned nor unassigned");
    }

    metrics_ = computeScheduleMetrics(*this, resources);
    totalCost_ = metrics_.totalCost;
    totalScore_ = metrics_.totalScore;
    conflictCount_ = metrics_.conflictCount;

    // Reflect the outcome on the snapshot's status tags.
    for (Appointment& appt : appointments_) {
        auto it = assignments_.find(appt.id());
        if (it != assignments_.end()) {
            appt.setResourceId(it->second);
            appt.setStatus(AppointmentStatus::SCHEDULED);
        } else {
            appt.setResourceId(std::nullopt);
            appt.setStatus(AppointmentStatus::UNSCHEDULED);
        }
    }
    finalized_ = true;
}

std::optional<std::string> Schedule::resourceFor(const std::string& appointmentId) const {
    auto it = assignments_.find(appointmentId);
    if (it == assignments_.end()) return std::nullopt;
    return it->second;
}

std::vector<const Appointment*> Schedule::appointmentsOn(const std::string& resourceId) const {
    std::vector<const Appointment*> result;
    for (const Appointment& appt : appointments_) {
        auto it = assignments_.find(appt.id());
        if (it != assignments_.end() && it->second == resourceId) {
            result.push_back(&appt);
        }
    }
    std::sort(result.begin(), result.end(), [](const Appointment* a, const Appointment* b) {
        return a->start() < b->start();
    });
    return result;
}

const Appointment* Schedule::findAppointment(const std::string& appointmentId) const {
    auto it = indexById_.find(appointmentId);
    if (it == indexById_.end()) return nullptr;
    return &appointments_[it->second];
}

std::optional<TimePoint> Schedule::startDate() const {
    std::optional<TimePoint> result;
    for (const auto& entry : assignments_) {
        const Appointment* appt = findAppointment(entry.first);
        if (!result || appt->start() < *result) result = appt->start();
    }
    return result;
}

std::optional<TimePoint> Schedule::endDate() const {
    std::optional<TimePoint> result;
    for (const auto& entry : assignments_) {
        const Appointment* appt = findAppointment(entry.first);
        if (!result || appt->end() > *result) result = appt->end();
    }
    return result;
}

void Schedule::requireMutable() const {
    if (finalized_) {
        throw std::logic_error("schedule '" + id_ + "' is finalized and can no longer change");
    }
}

void Schedule::requireKnown(const std::string& appointmentId) const {
    if (indexById_.count(appointmentId) == 0) {
        throw std::invalid_argument("appointment '" + appointmentId + "' is not part of schedule '" + id_ + "'");
    }
}
