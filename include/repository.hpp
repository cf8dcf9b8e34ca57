#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "schedule.hpp"
#include <string>
#include <vector>


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Storage boundary of the service layer.
 *
 * The optimizers never see a repository; the service loads immutable
 * snapshots from it and hands finished schedules back.
 */
class ISchedulingRepository {
public:
    virtual ~ISchedulingRepository() = default;

    virtual std::vector<Appointment> loadAppointments() const = 0;
    virtual std::vector<Resource> loadResources() const = 0;

    /// Insert, or replace the appointment with the same id.
    virtual void saveAppointment(const Appointment& appointment) = 0;

    /// @return false if no appointment had this id.
    virtual bool removeAppointment(const std::string& id) = 0;

    /// Insert, or replace the resource with the same id.
    virtual void saveResource(const Resource& resource) = 0;

    /// @return false if no resource had this id.
    virtual bool removeResource(const std::string& id) = 0;

    /**
     * @brief Persist a finalized schedule.
     *
     * @throws std::logic_error if the schedule is not finalized.
     */
    virtual void saveSchedule(const Schedule& schedule) = 0;

    /// Ids of saved schedules, oldest first.
    virtual std::vector<std::string> savedScheduleIds() const = 0;
};


///////////////////////////
///   IMPLEMENTATIONS   ///
///////////////////////////
/**
 * @brief Repository kept entirely in memory.
 */
class InMemoryRepository : public ISchedulingRepository {
public:
    InMemoryRepository() = default;
    explicit InMemoryRepository(ProblemInstance instance);

    std::vector<Appointment> loadAppointments() const override { return inst_.appointments; }
    std::vector<Resource> loadResources() const override { return inst_.resources; }
    void saveAppointment(const Appointment& appointment) override;
    bool removeAppointment(const std::string& id) override;
    void saveResource(const Resource& resource) override;
    bool removeResource(const std::string& id) override;
    void saveSchedule(const Schedule& schedule) override;
    std::vector<std::string> savedScheduleIds() const override;

    /// Saved schedules, oldest first.
    const std::vector<Schedule>& schedules() const { return schedules_; }

private:
    ProblemInstance inst_;
    std::vector<Schedule> schedules_;
};

/**
 * @brief Repository backed by an instance JSON file and a schedule directory.
 *
 * Every mutation rewrites the instance file; schedules are written as
 * <scheduleDir>/<scheduleId>.json.
 */
class JsonFileRepository : public ISchedulingRepository {
public:
    /**
     * @throws std::runtime_error if the instance file cannot be read.
     */
    JsonFileRepository(std::string instancePath, std::string scheduleDir);

    std::vector<Appointment> loadAppointments() const override { return inst_.appointments; }
    std::vector<Resource> loadResources() const override { return inst_.resources; }
    void saveAppointment(const Appointment& appointment) override;
    bool removeAppointment(const std::string& id) override;
    void saveResource(const Resource& resource) override;
    bool removeResource(const std::string& id) override;
    void saveSchedule(const Schedule& schedule) override;
    std::vector<std::string> savedScheduleIds() const override { return scheduleIds_; }

private:
    std::string instancePath_;
    std::string scheduleDir_;
    ProblemInstance inst_;
    std::vector<std::string> scheduleIds_;

    void flush() const;
};
