///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include "random.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/// Opening hours of the demo clinic (UTC).
constexpr int kOpenHour = 8;
constexpr int kCloseHour = 18;

Resource makeResource(const std::string& id, const std::string& name, ResourceType type,
                      CapabilitySet caps, double costPerHour) {
    Resource r(id, name, type);
    r.setCapabilities(std::move(caps));
    r.setCostPerHour(costPerHour);
    return r;
}

Appointment makeAppointment(const std::string& id, const std::string& title, TimePoint start,
                            AppointmentType type, Priority priority, CapabilitySet required) {
    Appointment a(id, title, start, Minutes(appointmentTypeInfo(type).defaultDurationMinutes));
    a.setType(type);
    a.setPriority(priority);
    a.setRequiredCapabilities(std::move(required));
    return a;
}

/**
 * @brief Open every resource from the first day's opening to the last day's closing.
 */
void setClinicHours(std::vector<Resource>& resources, TimePoint firstDay, int days) {
    TimePoint from = firstDay + std::chrono::hours(kOpenHour);
    TimePoint to = firstDay + std::chrono::hours(24 * (days - 1) + kCloseHour);
    for (Resource& r : resources) {
        r.setAvailability(from, to);
    }
}

} // namespace


///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static ProblemInstance makeDemoSmall() {
    ProblemInstance inst;
    TimePoint day = makeTimePoint(2025, 1, 6);
    auto at = [&](int hour, int minute) { return day + std::chrono::hours(hour) + Minutes(minute); };

    inst.resources.push_back(makeResource("R1", "Consultation Room 1", ResourceType::ROOM, {"general"}, 50.0));
    inst.resources.push_back(makeResource("R2", "Consultation Room 2", ResourceType::ROOM, {"general", "pediatrics"}, 60.0));
    inst.resources.push_back(makeResource("S1", "Dr. Smith", ResourceType::STAFF, {"general", "cardiology"}, 120.0));
    inst.resources.push_back(makeResource("E1", "X-Ray Unit", ResourceType::EQUIPMENT, {"xray"}, 200.0));
    inst.resources.push_back(makeResource("E2", "Ultrasound", ResourceType::EQUIPMENT, {"ultrasound"}, 150.0));
    setClinicHours(inst.resources, day, 1);

    // X-ray and ultrasound share one technician.
    inst.resources[3].setConflicts({"E2"});

    inst.appointments.push_back(makeAppointment("A01", "Checkup", at(8, 0), AppointmentType::CONSULTATION, Priority::MEDIUM, {"general"}));
    inst.appointments.push_back(makeAppointment("A02", "Child checkup", at(8, 0), AppointmentType::CONSULTATION, Priority::HIGH, {"pediatrics"}));
    inst.appointments.push_back(makeAppointment("A03", "Chest pain", at(8, 30), AppointmentType::EMERGENCY, Priority::URGENT, {"cardiology"}));
    inst.appointments.push_back(makeAppointment("A04", "Chest x-ray", at(9, 0), AppointmentType::DIAGNOSTIC, Priority::HIGH, {"xray"}));
    inst.appointments.push_back(makeAppointment("A05", "Abdominal scan", at(9, 15), AppointmentType::DIAGNOSTIC, Priority::MEDIUM, {"ultrasound"}));
    inst.appointments.push_back(makeAppointment("A06", "Follow-up", at(10, 0), AppointmentType::FOLLOW_UP, Priority::LOW, {"general"}));
    inst.appointments.push_back(makeAppointment("A07", "Flu shot", at(10, 0), AppointmentType::VACCINATION, Priority::LOW, {}));
    inst.appointments.push_back(makeAppointment("A08", "Physiotherapy", at(11, 0), AppointmentType::THERAPY, Priority::MEDIUM, {"general"}));
    inst.appointments.push_back(makeAppointment("A09", "Cardiology review", at(13, 0), AppointmentType::FOLLOW_UP, Priority::HIGH, {"cardiology"}));
    inst.appointments.push_back(makeAppointment("A10", "Wound care", at(14, 0), AppointmentType::TREATMENT, Priority::MEDIUM, {"general"}));
    inst.appointments.push_back(makeAppointment("A11", "MRI", at(15, 0), AppointmentType::DIAGNOSTIC, Priority::MEDIUM, {"mri"}));
    inst.appointments.push_back(makeAppointment("A12", "Late consult", at(17, 30), AppointmentType::CONSULTATION, Priority::LOW, {"general"}));

    inst.appointments[5].setFlexibility(true, Minutes(60));
    inst.appointments[6].setFlexibility(true, Minutes(120));
    inst.appointments[2].setImportanceScore(2.0);
    inst.appointments[1].setPreferredCapabilities({"general"});
    return inst;
}


///////////////////////////
///   DEMO: GENERATED   ///
///////////////////////////
/**
 * @brief Random clinic over several days.
 *
 * Resources are drawn from fixed templates; appointments start on the
 * quarter hour inside opening hours and require at most one capability.
 */
static ProblemInstance makeDemoGenerated(int numAppointments, int numResources, int days, unsigned int seed) {
    RandomGenerator rng(seed);
    ProblemInstance inst;
    TimePoint firstDay = makeTimePoint(2025, 1, 6);

    struct Template {
        const char* name;
        ResourceType type;
        const char* capability;
        double cost;
    };
    static const Template kTemplates[] = {
        {"Consultation Room", ResourceType::ROOM, "general", 50.0},
        {"Pediatric Room", ResourceType::ROOM, "pediatrics", 60.0},
        {"Cardiologist", ResourceType::STAFF, "cardiology", 150.0},
        {"Nurse", ResourceType::STAFF, "vaccination", 40.0},
        {"X-Ray Unit", ResourceType::EQUIPMENT, "xray", 200.0},
        {"Ultrasound", ResourceType::EQUIPMENT, "ultrasound", 150.0},
        {"Telehealth Booth", ResourceType::VIRTUAL, "general", 20.0},
    };
    const int numTemplates = (int)(sizeof(kTemplates) / sizeof(kTemplates[0]));

    for (int r = 0; r < numResources; ++r) {
        const Template& t = kTemplates[r % numTemplates];
        std::string id = "R" + std::to_string(r + 1);
        Resource res = makeResource(id, std::string(t.name) + " " + std::to_string(r / numTemplates + 1),
                                    t.type, {t.capability}, t.cost);
        if (rng.chance(0.3)) res.addCapability("general");
        inst.resources.push_back(res);
    }
    setClinicHours(inst.resources, firstDay, days);

    // Roughly one resource in ten is under maintenance.
    for (Resource& r : inst.resources) {
        if (rng.chance(0.1)) r.setActive(false);
    }

    static const Priority kPriorities[] = {Priority::LOW, Priority::MEDIUM, Priority::MEDIUM, Priority::HIGH, Priority::URGENT};
    for (int i = 0; i < numAppointments; ++i) {
        AppointmentType type = static_cast<AppointmentType>(rng.uniformInt(0, 7));
        int duration = appointmentTypeInfo(type).defaultDurationMinutes;

        int day = rng.uniformInt(0, days - 1);
        int lastQuarter = ((kCloseHour - kOpenHour) * 60 - duration) / 15;
        int startMinute = kOpenHour * 60 + 15 * rng.uniformInt(0, std::max(0, lastQuarter));
        TimePoint start = firstDay + std::chrono::hours(24 * day) + Minutes(startMinute);

        CapabilitySet required;
        if (rng.chance(0.8)) {
            required.insert(kTemplates[rng.uniformInt(0, numTemplates - 1)].capability);
        }

        char id[16];
        std::snprintf(id, sizeof(id), "A%03d", i + 1);
        Appointment appt = makeAppointment(id, std::string(appointmentTypeInfo(type).displayName) + " " + std::to_string(i + 1),
                                           start, type, kPriorities[rng.uniformInt(0, 4)], required);
        appt.setImportanceScore(1.0 + rng.uniformInt(0, 4) * 0.25);
        if (rng.chance(0.25)) appt.setFlexibility(true, Minutes(30 * rng.uniformInt(1, 4)));
        inst.appointments.push_back(appt);
    }
    return inst;
}


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
ProblemInstance makeDemoInstance(DemoSize size, unsigned int seed) {
    switch (size) {
        case DemoSize::S: return makeDemoSmall();
        case DemoSize::M: return makeDemoGenerated(40, 10, 2, seed);
        case DemoSize::L: return makeDemoGenerated(120, 20, 5, seed);
    }
    return makeDemoSmall();
}

DemoSize parseDemoSize(const std::string& name) {
    if (name == "S") return DemoSize::S;
    if (name == "M") return DemoSize::M;
    if (name == "L") return DemoSize::L;
    throw std::invalid_argument("unknown demo size '" + name + "'");
}
