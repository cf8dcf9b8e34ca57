///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <array>
#include <cstdio>
#include <stdexcept>


///////////////////////////
///        TIME         ///
///////////////////////////
namespace {

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
long daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = (long)y - era * 400;
    const long doy = (153L * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

/**
 * @brief Inverse of daysFromCivil().
 */
void civilFromDays(long z, int& y, int& m, int& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    d = (int)(doy - (153 * mp + 2) / 5 + 1);
    m = (int)(mp < 10 ? mp + 3 : mp - 9);
    y = (int)(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) return 29;
    return kDays[m - 1];
}

} // namespace

TimePoint makeTimePoint(int year, int month, int day, int hour, int minute) {
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        throw std::invalid_argument("invalid calendar date/time");
    }
    long days = daysFromCivil(year, month, day);
    return TimePoint(Minutes(days * 24 * 60 + hour * 60 + minute));
}

TimePoint parseTimePoint(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    char sep = 0;
    int consumed = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d%n",
                             &y, &mo, &d, &sep, &h, &mi, &consumed);
    if (fields < 6 || (sep != 'T' && sep != ' ')) {
        throw std::invalid_argument("invalid timestamp '" + text + "'");
    }

    // Optional ":SS" and a trailing 'Z' are accepted; seconds are dropped.
    std::string rest = text.substr((size_t)consumed);
    if (!rest.empty() && rest[0] == ':') {
        int extra = 0;
        if (std::sscanf(rest.c_str(), ":%2d%n", &s, &extra) != 1 || s < 0 || s > 59) {
            throw std::invalid_argument("invalid timestamp '" + text + "'");
        }
        rest = rest.substr((size_t)extra);
    }
    if (!rest.empty() && rest != "Z") {
        throw std::invalid_argument("invalid timestamp '" + text + "'");
    }

    try {
        return makeTimePoint(y, mo, d, h, mi);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("invalid timestamp '" + text + "'");
    }
}

std::string formatTimePoint(TimePoint t) {
    long total = (long)t.time_since_epoch().count();
    long days = total >= 0 ? total / 1440 : -((-total + 1439) / 1440);
    long minuteOfDay = total - days * 1440;

    int y, m, d;
    civilFromDays(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:00",
                  y, m, d, (int)(minuteOfDay / 60), (int)(minuteOfDay % 60));
    return buf;
}


///////////////////////////
///     ENUMERATIONS    ///
///////////////////////////
namespace {

const std::array<PriorityInfo, 4> kPriorities = {{
    {1, 1.0, "Low"},
    {2, 1.5, "Medium"},
    {3, 2.0, "High"},
    {4, 3.0, "Urgent"},
}};
const std::array<const char*, 4> kPriorityNames = {{"LOW", "MEDIUM", "HIGH", "URGENT"}};

const std::array<AppointmentTypeInfo, 8> kAppointmentTypes = {{
    {"Consultation", 30, 1.0},
    {"Follow-up", 15, 0.8},
    {"Treatment", 60, 1.5},
    {"Emergency", 45, 3.0},
    {"Surgery", 120, 2.5},
    {"Diagnostic", 45, 1.2},
    {"Therapy", 50, 1.1},
    {"Vaccination", 20, 0.9},
}};
const std::array<const char*, 8> kAppointmentTypeNames = {{
    "CONSULTATION", "FOLLOW_UP", "TREATMENT", "EMERGENCY",
    "SURGERY", "DIAGNOSTIC", "THERAPY", "VACCINATION",
}};

const std::array<const char*, 6> kStatusDisplay = {{
    "Pending", "Scheduled", "In Progress", "Completed", "Cancelled", "Unscheduled",
}};
const std::array<const char*, 6> kStatusNames = {{
    "PENDING", "SCHEDULED", "IN_PROGRESS", "COMPLETED", "CANCELLED", "UNSCHEDULED",
}};

const std::array<ResourceTypeInfo, 5> kResourceTypes = {{
    {"Room", "Physical space for appointments"},
    {"Equipment", "Medical or technical equipment"},
    {"Staff", "Doctors, nurses and technicians"},
    {"Vehicle", "Transportation resources"},
    {"Virtual", "Online meeting spaces"},
}};
const std::array<const char*, 5> kResourceTypeNames = {{
    "ROOM", "EQUIPMENT", "STAFF", "VEHICLE", "VIRTUAL",
}};

/**
 * @brief Linear lookup of an enumerator identifier in a name table.
 *
 * @throws std::invalid_argument naming the enum kind if the name is unknown.
 */
template <typename Enum, size_t N>
Enum parseByName(const std::array<const char*, N>& names, const std::string& name, const char* kind) {
    for (size_t i = 0; i < N; ++i) {
        if (name == names[i]) return static_cast<Enum>(i);
    }
    throw std::invalid_argument(std::string("unknown ") + kind + " '" + name + "'");
}

} // namespace

const PriorityInfo& priorityInfo(Priority p) { return kPriorities[(size_t)p]; }
const AppointmentTypeInfo& appointmentTypeInfo(AppointmentType t) { return kAppointmentTypes[(size_t)t]; }
const ResourceTypeInfo& resourceTypeInfo(ResourceType t) { return kResourceTypes[(size_t)t]; }
const char* statusDisplayName(AppointmentStatus s) { return kStatusDisplay[(size_t)s]; }

std::string toString(Priority p) { return kPriorityNames[(size_t)p]; }
std::string toString(AppointmentType t) { return kAppointmentTypeNames[(size_t)t]; }
std::string toString(AppointmentStatus s) { return kStatusNames[(size_t)s]; }
std::string toString(ResourceType t) { return kResourceTypeNames[(size_t)t]; }

Priority parsePriority(const std::string& name) {
    return parseByName<Priority>(kPriorityNames, name, "priority");
}

AppointmentType parseAppointmentType(const std::string& name) {
    return parseByName<AppointmentType>(kAppointmentTypeNames, name, "appointment type");
}

AppointmentStatus parseAppointmentStatus(const std::string& name) {
    return parseByName<AppointmentStatus>(kStatusNames, name, "appointment status");
}

ResourceType parseResourceType(const std::string& name) {
    return parseByName<ResourceType>(kResourceTypeNames, name, "resource type");
}


///////////////////////////
///     APPOINTMENT     ///
///////////////////////////
Appointment::Appointment(std::string id, std::string title, TimePoint start, Minutes duration)
        : id_(std::move(id)), title_(std::move(title)), start_(start), duration_(duration) {
    if (id_.empty()) {
        throw std::invalid_argument("appointment id must not be empty");
    }
    if (duration_.count() < 0) {
        throw std::invalid_argument("appointment '" + id_ + "' has a negative duration");
    }
}

void Appointment::setDuration(Minutes duration) {
    if (duration.count() < 0) {
        throw std::invalid_argument("appointment '" + id_ + "' has a negative duration");
    }
    duration_ = duration;
}

void Appointment::setFlexibility(bool flexible, Minutes window) {
    if (window.count() < 0) {
        throw std::invalid_argument("appointment '" + id_ + "' has a negative flexibility window");
    }
    flexible_ = flexible;
    flexibilityWindow_ = window;
}

void Appointment::setImportanceScore(double score) {
    if (!(score > 0.0)) {
        throw std::invalid_argument("appointment '" + id_ + "' importance score must be positive");
    }
    importance_ = score;
}

double Appointment::calculateScore() const {
    return importance_ * priorityInfo(priority_).multiplier;
}

bool Appointment::conflictsWith(const Appointment& other) const {
    if (id_ == other.id_) return false;
    return start_ < other.end() && other.start_ < end();
}

/**
 * @brief Fixed appointments keep their start; flexible ones may drift by
 * at most flexibilityWindow in either direction.
 */
bool Appointment::canBeScheduledAt(TimePoint newStart) const {
    if (!flexible_) return newStart == start_;
    Minutes shift = newStart > start_ ? newStart - start_ : start_ - newStart;
    return shift <= flexibilityWindow_;
}


///////////////////////////
///      RESOURCE       ///
///////////////////////////
Resource::Resource(std::string id, std::string name, ResourceType type)
        : id_(std::move(id)), name_(std::move(name)), type_(type) {
    if (id_.empty()) {
        throw std::invalid_argument("resource id must not be empty");
    }
}

void Resource::setCostPerHour(double cost) {
    if (cost < 0.0) {
        throw std::invalid_argument("resource '" + id_ + "' has a negative hourly cost");
    }
    costPerHour_ = cost;
}

void Resource::setCapacity(int capacity) {
    if (capacity < 1) {
        throw std::invalid_argument("resource '" + id_ + "' capacity must be at least 1");
    }
    capacity_ = capacity;
}

void Resource::setAvailability(std::optional<TimePoint> from, std::optional<TimePoint> to) {
    if (from && to && *to < *from) {
        throw std::invalid_argument("resource '" + id_ + "' availability ends before it starts");
    }
    availableFrom_ = from;
    availableTo_ = to;
}

bool Resource::hasRequiredCapabilities(const CapabilitySet& required) const {
    for (const std::string& cap : required) {
        if (capabilities_.count(cap) == 0) return false;
    }
    return true;
}

bool Resource::isAvailableAt(TimePoint start, Minutes duration) const {
    if (!active_) return false;
    if (availableFrom_ && start < *availableFrom_) return false;
    if (availableTo_ && start + duration > *availableTo_) return false;
    return true;
}

double Resource::calculateCost(Minutes duration) const {
    return costPerHour_ * (double)duration.count() / 60.0;
}

bool Resource::conflictsWith(const Resource& other) const {
    return conflicts_.count(other.id_) > 0 || other.conflicts_.count(id_) > 0;
}
