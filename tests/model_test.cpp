///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <stdexcept>


///////////////////////////
///        TIME         ///
///////////////////////////
TEST(TimeTest, ParsesAndFormatsIsoTimestamps) {
    TimePoint t = parseTimePoint("2025-01-06T09:30");
    EXPECT_EQ(t, makeTimePoint(2025, 1, 6, 9, 30));
    EXPECT_EQ(formatTimePoint(t), "2025-01-06T09:30:00");

    // Seconds and a UTC designator are accepted and dropped.
    EXPECT_EQ(parseTimePoint("2025-01-06T09:30:15Z"), t);
    EXPECT_EQ(parseTimePoint("2024-02-29 23:59"), makeTimePoint(2024, 2, 29, 23, 59));
}

TEST(TimeTest, RejectsMalformedTimestamps) {
    EXPECT_THROW(parseTimePoint("not a date"), std::invalid_argument);
    EXPECT_THROW(parseTimePoint("2025-02-30T10:00"), std::invalid_argument);
    EXPECT_THROW(parseTimePoint("2025-01-06T25:00"), std::invalid_argument);
    EXPECT_THROW(parseTimePoint("2025-01-06T10:00+02"), std::invalid_argument);
    EXPECT_THROW(makeTimePoint(2025, 13, 1), std::invalid_argument);
}


///////////////////////////
///    ENUMERATIONS     ///
///////////////////////////
TEST(EnumTest, LookupTablesCarryMetadata) {
    EXPECT_EQ(priorityInfo(Priority::LOW).level, 1);
    EXPECT_EQ(priorityInfo(Priority::URGENT).level, 4);
    EXPECT_DOUBLE_EQ(priorityInfo(Priority::HIGH).multiplier, 2.0);
    EXPECT_EQ(appointmentTypeInfo(AppointmentType::SURGERY).defaultDurationMinutes, 120);
    EXPECT_DOUBLE_EQ(appointmentTypeInfo(AppointmentType::EMERGENCY).complexityFactor, 3.0);
    EXPECT_STREQ(statusDisplayName(AppointmentStatus::IN_PROGRESS), "In Progress");
}

TEST(EnumTest, NamesParseBackAndUnknownNamesThrow) {
    EXPECT_EQ(parsePriority(toString(Priority::URGENT)), Priority::URGENT);
    EXPECT_EQ(parseAppointmentType("FOLLOW_UP"), AppointmentType::FOLLOW_UP);
    EXPECT_EQ(parseAppointmentStatus("UNSCHEDULED"), AppointmentStatus::UNSCHEDULED);
    EXPECT_EQ(parseResourceType("VIRTUAL"), ResourceType::VIRTUAL);
    EXPECT_THROW(parsePriority("CRITICAL"), std::invalid_argument);
    EXPECT_THROW(parseResourceType("room"), std::invalid_argument);
}


///////////////////////////
///     APPOINTMENT     ///
///////////////////////////
TEST(AppointmentTest, ConstructorEnforcesInvariants) {
    EXPECT_THROW(Appointment("", "x", testDay(), Minutes(30)), std::invalid_argument);
    EXPECT_THROW(Appointment("A", "x", testDay(), Minutes(-1)), std::invalid_argument);

    Appointment a("A", "x", testDay(), Minutes(0));
    EXPECT_EQ(a.start(), a.end());
    EXPECT_EQ(a.status(), AppointmentStatus::PENDING);
    EXPECT_THROW(a.setImportanceScore(0.0), std::invalid_argument);
    EXPECT_THROW(a.setFlexibility(true, Minutes(-5)), std::invalid_argument);
    EXPECT_THROW(a.setDuration(Minutes(-10)), std::invalid_argument);
}

TEST(AppointmentTest, EndFollowsStartAndDuration) {
    Appointment a = makeTestAppointment("A", 9, 0, 45);
    EXPECT_EQ(a.end(), testDay() + std::chrono::hours(9) + Minutes(45));
    a.setDuration(Minutes(90));
    EXPECT_EQ(a.durationMinutes(), 90);
    EXPECT_EQ(a.end(), testDay() + std::chrono::hours(10) + Minutes(30));
}

TEST(AppointmentTest, ScoreIsImportanceTimesPriorityMultiplier) {
    Appointment a = makeTestAppointment("A", 9, 0, 30, {}, Priority::URGENT);
    a.setImportanceScore(2.0);
    EXPECT_DOUBLE_EQ(a.calculateScore(), 6.0);
}

TEST(AppointmentTest, ConflictsUseHalfOpenIntervals) {
    Appointment a = makeTestAppointment("A", 9, 0, 60);
    Appointment overlapping = makeTestAppointment("B", 9, 30, 60);
    Appointment touching = makeTestAppointment("C", 10, 0, 30);

    EXPECT_TRUE(a.conflictsWith(overlapping));
    EXPECT_TRUE(overlapping.conflictsWith(a));
    EXPECT_FALSE(a.conflictsWith(touching));
    EXPECT_FALSE(a.conflictsWith(a));
}

TEST(AppointmentTest, FlexibilityWindowBoundsRescheduling) {
    Appointment a = makeTestAppointment("A", 9, 0, 30);
    EXPECT_TRUE(a.canBeScheduledAt(a.start()));
    EXPECT_FALSE(a.canBeScheduledAt(a.start() + Minutes(15)));

    a.setFlexibility(true, Minutes(60));
    EXPECT_TRUE(a.canBeScheduledAt(a.start() - Minutes(60)));
    EXPECT_TRUE(a.canBeScheduledAt(a.start() + Minutes(45)));
    EXPECT_FALSE(a.canBeScheduledAt(a.start() + Minutes(61)));
}


///////////////////////////
///      RESOURCE       ///
///////////////////////////
TEST(ResourceTest, SettersEnforceInvariants) {
    Resource r("R", "Room", ResourceType::ROOM);
    EXPECT_THROW(Resource("", "Room", ResourceType::ROOM), std::invalid_argument);
    EXPECT_THROW(r.setCostPerHour(-1.0), std::invalid_argument);
    EXPECT_THROW(r.setCapacity(0), std::invalid_argument);
    EXPECT_THROW(r.setAvailability(testDay() + std::chrono::hours(10), testDay()), std::invalid_argument);
    EXPECT_NO_THROW(r.setAvailability(std::nullopt, testDay()));
}

TEST(ResourceTest, AvailabilityWindowMustContainAppointment) {
    Resource r = makeTestResource("R");
    EXPECT_TRUE(r.isAvailableAt(testDay() + std::chrono::hours(8), Minutes(60)));
    EXPECT_TRUE(r.isAvailableAt(testDay() + std::chrono::hours(17), Minutes(60)));
    EXPECT_FALSE(r.isAvailableAt(testDay() + std::chrono::hours(17) + Minutes(30), Minutes(60)));
    EXPECT_FALSE(r.isAvailableAt(testDay() + std::chrono::hours(7), Minutes(30)));

    r.setActive(false);
    EXPECT_FALSE(r.isAvailableAt(testDay() + std::chrono::hours(9), Minutes(30)));
}

TEST(ResourceTest, CapabilitiesCostAndExclusivity) {
    Resource r = makeTestResource("R", {"general", "xray"}, 40.0);
    EXPECT_TRUE(r.hasRequiredCapabilities({}));
    EXPECT_TRUE(r.hasRequiredCapabilities({"xray"}));
    EXPECT_FALSE(r.hasRequiredCapabilities({"xray", "mri"}));
    EXPECT_DOUBLE_EQ(r.calculateCost(Minutes(90)), 60.0);

    Resource other = makeTestResource("O");
    r.setConflicts({"O"});
    EXPECT_TRUE(r.conflictsWith(other));
    EXPECT_TRUE(other.conflictsWith(r));
}
