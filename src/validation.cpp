///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "validation.hpp"
#include "constraints.hpp"
#include <algorithm>
#include <iterator>
#include <map>
#include <unordered_map>


///////////////////////////
///     VALIDATION      ///
///////////////////////////
ValidationReport validateSchedule(const Schedule& schedule, const std::vector<Resource>& resources) {
    ValidationReport report;

    std::unordered_map<std::string, const Resource*> resourceById;
    for (const Resource& r : resources) {
        resourceById[r.id()] = &r;
    }

    // Coverage: each appointment is either assigned or unassigned, never both or neither.
    for (const Appointment& appt : schedule.appointments()) {
        bool assigned = schedule.assignments().count(appt.id()) > 0;
        bool unassigned = schedule.unassigned().count(appt.id()) > 0;
        if (assigned && unassigned) {
            report.errors.push_back("Appointment " + appt.id() + " is both assigned and unassigned");
        } else if (!assigned && !unassigned) {
            report.errors.push_back("Appointment " + appt.id() + " is neither assigned nor unassigned");
        }
    }

    // Per-assignment eligibility, rechecked piece by piece for precise messages.
    std::map<std::string, std::vector<const Appointment*>> byResource;
    for (const auto& [apptId, resId] : schedule.assignments()) {
        const Appointment* appt = schedule.findAppointment(apptId);
        if (appt == nullptr) {
            report.errors.push_back("Assignment for unknown appointment " + apptId);
            continue;
        }
        auto it = resourceById.find(resId);
        if (it == resourceById.end()) {
            report.errors.push_back("Appointment " + apptId + " assigned to unknown resource " + resId);
            continue;
        }
        const Resource& res = *it->second;

        if (!res.isActive()) {
            report.errors.push_back("Appointment " + apptId + " assigned to inactive resource " + resId);
        }
        if (!res.hasRequiredCapabilities(appt->requiredCapabilities())) {
            report.errors.push_back("Resource " + resId + " lacks required capabilities for appointment " + apptId);
        }
        if (res.isActive() && !res.isAvailableAt(appt->start(), appt->duration())) {
            report.errors.push_back("Appointment " + apptId + " lies outside the availability of resource " + resId);
        }
        byResource[resId].push_back(appt);
    }

    // Double bookings, one error per overlapping pair.
    int recount = 0;
    for (const auto& [resId, list] : byResource) {
        for (size_t i = 0; i < list.size(); ++i) {
            for (size_t j = i + 1; j < list.size(); ++j) {
                if (conflictsInTime(*list[i], *list[j])) {
                    report.errors.push_back("Resource " + resId + " is double booked by appointments " +
                                            list[i]->id() + " and " + list[j]->id());
                }
            }
        }
        recount += countOverlappingPairs(list);
    }

    if (schedule.isFinalized() && schedule.conflictCount() != recount) {
        report.errors.push_back("Reported conflict count " + std::to_string(schedule.conflictCount()) +
                                " differs from recount " + std::to_string(recount));
    }

    // Mutually exclusive resources in use at the same time.
    for (auto a = byResource.begin(); a != byResource.end(); ++a) {
        auto ra = resourceById.find(a->first);
        for (auto b = std::next(a); b != byResource.end(); ++b) {
            auto rb = resourceById.find(b->first);
            if (!ra->second->conflictsWith(*rb->second)) continue;
            for (const Appointment* x : a->second) {
                for (const Appointment* y : b->second) {
                    if (conflictsInTime(*x, *y)) {
                        report.warnings.push_back("Mutually exclusive resources " + a->first + " and " + b->first +
                                                  " overlap for appointments " + x->id() + " and " + y->id());
                    }
                }
            }
        }
    }

    // Eligibility is recomputed here rather than taken from the schedule's infeasible set.
    for (const std::string& id : schedule.unassigned()) {
        const Appointment* appt = schedule.findAppointment(id);
        bool hostable = appt != nullptr &&
                        std::any_of(resources.begin(), resources.end(),
                                    [&](const Resource& r) { return isEligible(*appt, r); });
        if (!hostable) {
            report.warnings.push_back("Appointment " + id + " has no eligible resource");
        } else {
            report.warnings.push_back("Appointment " + id + " is not assigned");
        }
    }

    return report;
}
