///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "instance_io.hpp"
#include <fstream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

CapabilitySet readCapabilities(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    return j[key].get<CapabilitySet>();
}

std::optional<std::string> readOptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

std::optional<TimePoint> readOptionalTime(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return parseTimePoint(j[key].get<std::string>());
}

json optionalToJson(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

json optionalToJson(const std::optional<TimePoint>& v) {
    return v ? json(formatTimePoint(*v)) : json(nullptr);
}

} // namespace


///////////////////////////
///       INPUT         ///
///////////////////////////
Appointment appointmentFromJson(const json& j) {
    std::string id = j.at("id").get<std::string>();
    TimePoint start = parseTimePoint(j.at("start").get<std::string>());

    Minutes duration{0};
    if (j.contains("duration")) {
        duration = Minutes(j["duration"].get<long>());
    } else if (j.contains("end")) {
        TimePoint end = parseTimePoint(j["end"].get<std::string>());
        if (end < start) {
            throw std::invalid_argument("appointment '" + id + "' ends before it starts");
        }
        duration = end - start;
    } else {
        throw std::invalid_argument("appointment '" + id + "' needs a duration or an end time");
    }

    Appointment a(id, j.value("title", std::string()), start, duration);
    a.setDescription(j.value("description", std::string()));
    if (j.contains("type")) a.setType(parseAppointmentType(j["type"].get<std::string>()));
    if (j.contains("priority")) a.setPriority(parsePriority(j["priority"].get<std::string>()));
    if (j.contains("status")) a.setStatus(parseAppointmentStatus(j["status"].get<std::string>()));
    a.setResourceId(readOptionalString(j, "resourceId"));
    a.setClientId(readOptionalString(j, "clientId"));
    a.setRequiredCapabilities(readCapabilities(j, "requiredCapabilities"));
    a.setPreferredCapabilities(readCapabilities(j, "preferredCapabilities"));
    a.setFlexibility(j.value("isFlexible", false), Minutes(j.value("flexibilityWindow", 0L)));
    a.setImportanceScore(j.value("importanceScore", 1.0));
    return a;
}

Resource resourceFromJson(const json& j) {
    std::string id = j.at("id").get<std::string>();
    ResourceType type = j.contains("type") ? parseResourceType(j["type"].get<std::string>()) : ResourceType::ROOM;

    Resource r(id, j.value("name", id), type);
    r.setCapabilities(readCapabilities(j, "capabilities"));
    r.setCostPerHour(j.value("costPerHour", 0.0));
    r.setCapacity(j.value("capacity", 1));
    r.setActive(j.value("isActive", true));
    r.setAvailability(readOptionalTime(j, "availableFrom"), readOptionalTime(j, "availableTo"));
    if (j.contains("conflicts") && !j["conflicts"].is_null()) {
        r.setConflicts(j["conflicts"].get<std::set<std::string>>());
    }
    return r;
}

ProblemInstance parseInstanceJson(const json& j) {
    ProblemInstance inst;
    std::set<std::string> seen;

    if (j.contains("appointments")) {
        for (const json& item : j.at("appointments")) {
            Appointment a = appointmentFromJson(item);
            if (!seen.insert(a.id()).second) {
                throw std::invalid_argument("duplicate appointment id '" + a.id() + "'");
            }
            inst.appointments.push_back(std::move(a));
        }
    }

    seen.clear();
    if (j.contains("resources")) {
        for (const json& item : j.at("resources")) {
            Resource r = resourceFromJson(item);
            if (!seen.insert(r.id()).second) {
                throw std::invalid_argument("duplicate resource id '" + r.id() + "'");
            }
            inst.resources.push_back(std::move(r));
        }
    }
    return inst;
}

ProblemInstance loadInstanceJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open instance file '" + path + "'");
    }
    return parseInstanceJson(json::parse(in));
}


///////////////////////////
///       OUTPUT        ///
///////////////////////////
json appointmentToJson(const Appointment& a) {
    return json{
        {"id", a.id()},
        {"title", a.title()},
        {"description", a.description()},
        {"start", formatTimePoint(a.start())},
        {"duration", a.durationMinutes()},
        {"type", toString(a.type())},
        {"priority", toString(a.priority())},
        {"status", toString(a.status())},
        {"resourceId", optionalToJson(a.resourceId())},
        {"clientId", optionalToJson(a.clientId())},
        {"requiredCapabilities", a.requiredCapabilities()},
        {"preferredCapabilities", a.preferredCapabilities()},
        {"isFlexible", a.isFlexible()},
        {"flexibilityWindow", (long)a.flexibilityWindow().count()},
        {"importanceScore", a.importanceScore()},
    };
}

json resourceToJson(const Resource& r) {
    return json{
        {"id", r.id()},
        {"name", r.name()},
        {"type", toString(r.type())},
        {"capabilities", r.capabilities()},
        {"costPerHour", r.costPerHour()},
        {"capacity", r.capacity()},
        {"isActive", r.isActive()},
        {"availableFrom", optionalToJson(r.availableFrom())},
        {"availableTo", optionalToJson(r.availableTo())},
        {"conflicts", r.conflicts()},
    };
}

json instanceToJson(const ProblemInstance& inst) {
    json appts = json::array();
    for (const Appointment& a : inst.appointments) appts.push_back(appointmentToJson(a));
    json res = json::array();
    for (const Resource& r : inst.resources) res.push_back(resourceToJson(r));
    return json{{"appointments", appts}, {"resources", res}};
}

json scheduleToJson(const Schedule& schedule) {
    const ScheduleMetrics& m = schedule.metrics();

    json priorities = json::object();
    for (const auto& [p, count] : m.priorityDistribution) priorities[toString(p)] = count;
    json types = json::object();
    for (const auto& [t, count] : m.typeDistribution) types[toString(t)] = count;

    return json{
        {"id", schedule.id()},
        {"algorithm", schedule.algorithmName()},
        {"assignments", schedule.assignments()},
        {"unassigned", schedule.unassigned()},
        {"infeasible", schedule.infeasible()},
        {"totalCost", schedule.totalCost()},
        {"totalScore", schedule.totalScore()},
        {"conflictCount", schedule.conflictCount()},
        {"metrics", {
            {"totalAppointments", m.totalAppointments},
            {"assignedAppointments", m.assignedAppointments},
            {"unassignedAppointments", m.unassignedAppointments},
            {"utilizationRate", m.utilizationRate},
            {"efficiencyScore", m.efficiencyScore},
            {"assignmentRate", m.assignmentRate()},
            {"conflictRate", m.conflictRate()},
            {"averageCostPerAppointment", m.averageCostPerAppointment},
            {"averageScorePerAppointment", m.averageScorePerAppointment},
            {"totalScheduledMinutes", m.totalScheduledMinutes},
            {"totalAvailableMinutes", m.totalAvailableMinutes},
            {"resourceUtilization", m.resourceUtilization},
            {"priorityDistribution", priorities},
            {"typeDistribution", types},
        }},
    };
}

json comparisonToJson(const ComparisonMap& results) {
    json algorithms = json::object();
    for (const auto& [name, r] : results) {
        algorithms[name] = json{
            {"executionTimeMs", r.executionTimeMs},
            {"iterations", r.iterations},
            {"efficiencyScore", r.efficiencyScore},
            {"totalCost", r.totalCost},
            {"conflictCount", r.conflictCount},
            {"schedule", scheduleToJson(r.schedule)},
        };
    }
    std::optional<std::string> winner = selectWinner(results);
    return json{{"algorithms", algorithms}, {"winner", optionalToJson(winner)}};
}

json validationToJson(const ValidationReport& report) {
    return json{{"valid", report.isValid()}, {"errors", report.errors}, {"warnings", report.warnings}};
}

void writeJsonFile(const std::string& path, const json& j) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write file '" + path + "'");
    }
    out << j.dump(2) << "\n";
}


///////////////////////////
///    COMMAND LINE     ///
///////////////////////////
RunInputs loadRunInputs(int argc, char** argv, DemoSize fallback) {
    RunInputs inputs;

    std::string instanceArg = argc > 1 ? argv[1] : "";
    if (instanceArg.empty()) {
        inputs.instance = makeDemoInstance(fallback);
        inputs.source = "demo";
    } else if (instanceArg.rfind("demo:", 0) == 0) {
        inputs.instance = makeDemoInstance(parseDemoSize(instanceArg.substr(5)));
        inputs.source = instanceArg;
    } else {
        inputs.instance = loadInstanceJson(instanceArg);
        inputs.source = instanceArg;
    }

    if (argc > 2) {
        inputs.config = loadOptimizerConfig(argv[2]);
    }
    return inputs;
}
