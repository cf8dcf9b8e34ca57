///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "repository.hpp"
#include "instance_io.hpp"
#include <algorithm>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

template <typename T>
void upsertById(std::vector<T>& items, const T& item) {
    auto it = std::find_if(items.begin(), items.end(), [&](const T& x) { return x.id() == item.id(); });
    if (it != items.end()) {
        *it = item;
    } else {
        items.push_back(item);
    }
}

template <typename T>
bool eraseById(std::vector<T>& items, const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(), [&](const T& x) { return x.id() == id; });
    if (it == items.end()) return false;
    items.erase(it);
    return true;
}

void requireFinalized(const Schedule& schedule) {
    if (!schedule.isFinalized()) {
        throw std::logic_error("schedule '" + schedule.id() + "' must be finalized before saving");
    }
}

} // namespace


///////////////////////////
///      IN MEMORY      ///
///////////////////////////
InMemoryRepository::InMemoryRepository(ProblemInstance instance)
        : inst_(std::move(instance)) {}

void InMemoryRepository::saveAppointment(const Appointment& appointment) {
    upsertById(inst_.appointments, appointment);
}

bool InMemoryRepository::removeAppointment(const std::string& id) {
    return eraseById(inst_.appointments, id);
}

void InMemoryRepository::saveResource(const Resource& resource) {
    upsertById(inst_.resources, resource);
}

bool InMemoryRepository::removeResource(const std::string& id) {
    return eraseById(inst_.resources, id);
}

void InMemoryRepository::saveSchedule(const Schedule& schedule) {
    requireFinalized(schedule);
    schedules_.push_back(schedule);
}

std::vector<std::string> InMemoryRepository::savedScheduleIds() const {
    std::vector<std::string> ids;
    for (const Schedule& s : schedules_) ids.push_back(s.id());
    return ids;
}


///////////////////////////
///      JSON FILE      ///
///////////////////////////
JsonFileRepository::JsonFileRepository(std::string instancePath, std::string scheduleDir)
        : instancePath_(std::move(instancePath)),
          scheduleDir_(std::move(scheduleDir)),
          inst_(loadInstanceJson(instancePath_)) {}

void JsonFileRepository::saveAppointment(const Appointment& appointment) {
    upsertById(inst_.appointments, appointment);
    flush();
}

bool JsonFileRepository::removeAppointment(const std::string& id) {
    if (!eraseById(inst_.appointments, id)) return false;
    flush();
    return true;
}

void JsonFileRepository::saveResource(const Resource& resource) {
    upsertById(inst_.resources, resource);
    flush();
}

bool JsonFileRepository::removeResource(const std::string& id) {
    if (!eraseById(inst_.resources, id)) return false;
    flush();
    return true;
}

void JsonFileRepository::saveSchedule(const Schedule& schedule) {
    requireFinalized(schedule);
    writeJsonFile(scheduleDir_ + "/" + schedule.id() + ".json", scheduleToJson(schedule));
    scheduleIds_.push_back(schedule.id());
}

void JsonFileRepository::flush() const {
    writeJsonFile(instancePath_, instanceToJson(inst_));
}
