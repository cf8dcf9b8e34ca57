#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///        TIME         ///
///////////////////////////
/// All scheduling arithmetic is done at minute resolution.
using Minutes = std::chrono::minutes;

/// Wall-clock instant (UTC) truncated to whole minutes.
using TimePoint = std::chrono::time_point<std::chrono::system_clock, Minutes>;

/**
 * @brief Build a UTC time point from calendar fields.
 */
TimePoint makeTimePoint(int year, int month, int day, int hour = 0, int minute = 0);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM" or "YYYY-MM-DDTHH:MM:SS" (UTC, seconds dropped).
 *
 * @throws std::invalid_argument if the text is not a valid timestamp.
 */
TimePoint parseTimePoint(const std::string& text);

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:00".
 */
std::string formatTimePoint(TimePoint t);


///////////////////////////
///     ENUMERATIONS    ///
///////////////////////////
/**
 * @brief Appointment priority, ordered from lowest to highest.
 */
enum class Priority { LOW, MEDIUM, HIGH, URGENT };

/**
 * @brief Kind of appointment; carries a default duration and complexity factor.
 */
enum class AppointmentType {
    CONSULTATION, FOLLOW_UP, TREATMENT, EMERGENCY,
    SURGERY, DIAGNOSTIC, THERAPY, VACCINATION
};

/**
 * @brief Lifecycle tag of an appointment. Not used by the search itself.
 */
enum class AppointmentStatus {
    PENDING, SCHEDULED, IN_PROGRESS, COMPLETED, CANCELLED, UNSCHEDULED
};

/**
 * @brief Kind of schedulable resource.
 */
enum class ResourceType { ROOM, EQUIPMENT, STAFF, VEHICLE, VIRTUAL };

/// Static row of the priority lookup table.
struct PriorityInfo {
    int level; ///< Ordinal level, 1 (low) .. 4 (urgent).
    double multiplier; ///< Score multiplier applied to the importance score.
    const char* displayName; ///< Human-readable label.
};

/// Static row of the appointment type lookup table.
struct AppointmentTypeInfo {
    const char* displayName;
    int defaultDurationMinutes;
    double complexityFactor;
};

/// Static row of the resource type lookup table.
struct ResourceTypeInfo {
    const char* displayName;
    const char* description;
};

const PriorityInfo& priorityInfo(Priority p);
const AppointmentTypeInfo& appointmentTypeInfo(AppointmentType t);
const ResourceTypeInfo& resourceTypeInfo(ResourceType t);
const char* statusDisplayName(AppointmentStatus s);

/// Enumerator identifiers ("URGENT", "FOLLOW_UP", ...) used by the file formats.
std::string toString(Priority p);
std::string toString(AppointmentType t);
std::string toString(AppointmentStatus s);
std::string toString(ResourceType t);

/// Inverse of toString(); throw std::invalid_argument on unknown names.
Priority parsePriority(const std::string& name);
AppointmentType parseAppointmentType(const std::string& name);
AppointmentStatus parseAppointmentStatus(const std::string& name);
ResourceType parseResourceType(const std::string& name);

/// Sorted capability tags ("cardiology", "xray", ...).
using CapabilitySet = std::set<std::string>;


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief A schedulable unit of work with a time window and requirements.
 *
 * The end of the window is always derived from start + duration; every
 * mutator re-validates the window so the two can never diverge.
 */
class Appointment {
public:
    /**
     * @brief Create an appointment with default type, priority and status.
     *
     * @throws std::invalid_argument if the id is empty or the duration is negative.
     */
    Appointment(std::string id, std::string title, TimePoint start, Minutes duration);

    const std::string& id() const { return id_; }
    const std::string& title() const { return title_; }
    void setTitle(std::string title) { title_ = std::move(title); }
    const std::string& description() const { return description_; }
    void setDescription(std::string description) { description_ = std::move(description); }

    TimePoint start() const { return start_; }
    TimePoint end() const { return start_ + duration_; }
    Minutes duration() const { return duration_; }
    long durationMinutes() const { return (long)duration_.count(); }

    /// Move the window; duration is kept.
    void setStart(TimePoint start) { start_ = start; }

    /// @throws std::invalid_argument if duration is negative.
    void setDuration(Minutes duration);

    AppointmentType type() const { return type_; }
    void setType(AppointmentType type) { type_ = type; }
    Priority priority() const { return priority_; }
    void setPriority(Priority priority) { priority_ = priority; }
    AppointmentStatus status() const { return status_; }
    void setStatus(AppointmentStatus status) { status_ = status; }

    const std::optional<std::string>& resourceId() const { return resourceId_; }
    void setResourceId(std::optional<std::string> resourceId) { resourceId_ = std::move(resourceId); }
    const std::optional<std::string>& clientId() const { return clientId_; }
    void setClientId(std::optional<std::string> clientId) { clientId_ = std::move(clientId); }

    const CapabilitySet& requiredCapabilities() const { return required_; }
    void setRequiredCapabilities(CapabilitySet caps) { required_ = std::move(caps); }
    const CapabilitySet& preferredCapabilities() const { return preferred_; }
    void setPreferredCapabilities(CapabilitySet caps) { preferred_ = std::move(caps); }

    bool isFlexible() const { return flexible_; }
    Minutes flexibilityWindow() const { return flexibilityWindow_; }

    /// @throws std::invalid_argument if the window is negative.
    void setFlexibility(bool flexible, Minutes window);

    double importanceScore() const { return importance_; }

    /// @throws std::invalid_argument unless score > 0.
    void setImportanceScore(double score);

    /**
     * @brief Importance weighted by the priority multiplier.
     */
    double calculateScore() const;

    /**
     * @brief Half-open overlap test; an appointment never conflicts with itself.
     */
    bool conflictsWith(const Appointment& other) const;

    /**
     * @brief Whether the appointment may legally start at the given instant.
     *
     * Fixed appointments only accept their current start; flexible ones accept
     * any start within +/- flexibilityWindow of it.
     */
    bool canBeScheduledAt(TimePoint newStart) const;

private:
    std::string id_;
    std::string title_;
    std::string description_;
    TimePoint start_;
    Minutes duration_;
    AppointmentType type_ = AppointmentType::CONSULTATION;
    Priority priority_ = Priority::MEDIUM;
    AppointmentStatus status_ = AppointmentStatus::PENDING;
    std::optional<std::string> resourceId_;
    std::optional<std::string> clientId_;
    CapabilitySet required_;
    CapabilitySet preferred_;
    bool flexible_ = false;
    Minutes flexibilityWindow_{0};
    double importance_ = 1.0;
};

/**
 * @brief A capacity provider (room, staff member, equipment, ...).
 *
 * A resource is usable for an appointment only while active and when the
 * appointment window lies inside its availability window. A missing bound
 * means the window is open on that side.
 */
class Resource {
public:
    /// @throws std::invalid_argument if the id is empty.
    Resource(std::string id, std::string name, ResourceType type);

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }
    ResourceType type() const { return type_; }
    void setType(ResourceType type) { type_ = type; }

    const CapabilitySet& capabilities() const { return capabilities_; }
    void setCapabilities(CapabilitySet caps) { capabilities_ = std::move(caps); }
    void addCapability(const std::string& cap) { capabilities_.insert(cap); }

    double costPerHour() const { return costPerHour_; }

    /// @throws std::invalid_argument if cost is negative.
    void setCostPerHour(double cost);

    int capacity() const { return capacity_; }

    /// @throws std::invalid_argument if capacity < 1.
    void setCapacity(int capacity);

    bool isActive() const { return active_; }
    void setActive(bool active) { active_ = active; }

    const std::optional<TimePoint>& availableFrom() const { return availableFrom_; }
    const std::optional<TimePoint>& availableTo() const { return availableTo_; }

    /// @throws std::invalid_argument if both bounds are set and to < from.
    void setAvailability(std::optional<TimePoint> from, std::optional<TimePoint> to);

    /// Ids of resources that cannot be in use at the same time as this one.
    const std::set<std::string>& conflicts() const { return conflicts_; }
    void setConflicts(std::set<std::string> ids) { conflicts_ = std::move(ids); }

    bool hasRequiredCapabilities(const CapabilitySet& required) const;

    /**
     * @brief Active and [start, start + duration] inside the availability window.
     */
    bool isAvailableAt(TimePoint start, Minutes duration) const;

    /**
     * @brief Cost of holding the resource for the given duration.
     */
    double calculateCost(Minutes duration) const;

    /**
     * @brief Mutual exclusion test, declared on either side.
     */
    bool conflictsWith(const Resource& other) const;

private:
    std::string id_;
    std::string name_;
    ResourceType type_;
    CapabilitySet capabilities_;
    double costPerHour_ = 0.0;
    int capacity_ = 1;
    bool active_ = true;
    std::optional<TimePoint> availableFrom_;
    std::optional<TimePoint> availableTo_;
    std::set<std::string> conflicts_;
};

/**
 * @brief Immutable input snapshot handed to every optimizer.
 */
struct ProblemInstance {
    std::vector<Appointment> appointments; ///< Appointments to place.
    std::vector<Resource> resources; ///< Resources that may host them.
};
