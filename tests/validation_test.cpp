///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "validation.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

bool mentions(const std::vector<std::string>& messages, const std::string& text) {
    return std::any_of(messages.begin(), messages.end(),
                       [&](const std::string& m) { return m.find(text) != std::string::npos; });
}

} // namespace


///////////////////////////
///     VALIDATION      ///
///////////////////////////
TEST(ValidationTest, CleanScheduleHasNoErrors) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60, {"general"}),
                                      makeTestAppointment("B", 10, 0, 60, {"general"})};
    std::vector<Resource> res = {makeTestResource("R1", {"general"})};
    Schedule s("V-1", "CSP", appts);
    s.assign("A", "R1");
    s.assign("B", "R1");
    s.finalize(res);

    ValidationReport report = validateSchedule(s, res);
    EXPECT_TRUE(report.isValid());
    EXPECT_TRUE(report.warnings.empty());
}

TEST(ValidationTest, DoubleBookingIsReportedPerPair) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60),
                                      makeTestAppointment("B", 9, 30, 60),
                                      makeTestAppointment("C", 9, 45, 15)};
    std::vector<Resource> res = {makeTestResource("R1")};
    Schedule s("V-2", "GA", appts);
    s.assign("A", "R1");
    s.assign("B", "R1");
    s.assign("C", "R1");
    s.finalize(res);

    ValidationReport report = validateSchedule(s, res);
    EXPECT_FALSE(report.isValid());
    EXPECT_EQ(report.errors.size(), 3u);
    EXPECT_TRUE(mentions(report.errors, "double booked by appointments A and B"));
    EXPECT_FALSE(mentions(report.errors, "differs from recount"));
    EXPECT_EQ(s.conflictCount(), 3);
}

TEST(ValidationTest, EligibilityViolationsAreErrors) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60, {"xray"}),
                                      makeTestAppointment("B", 17, 30, 60),
                                      makeTestAppointment("C", 12, 0, 30)};
    std::vector<Resource> res = {makeTestResource("R1"), makeTestResource("R2")};
    Schedule s("V-3", "SA", appts);
    s.assign("A", "R1");
    s.assign("B", "R1");
    s.assign("C", "R2");
    s.finalize(res);

    // Resource taken out of service after the schedule was produced.
    res[1].setActive(false);

    ValidationReport report = validateSchedule(s, res);
    EXPECT_TRUE(mentions(report.errors, "Resource R1 lacks required capabilities for appointment A"));
    EXPECT_TRUE(mentions(report.errors, "Appointment B lies outside the availability of resource R1"));
    EXPECT_TRUE(mentions(report.errors, "Appointment C assigned to inactive resource R2"));
    EXPECT_EQ(report.errors.size(), 3u);
}

TEST(ValidationTest, CoverageAndUnknownResourcesInUnfinishedSchedule) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 30), makeTestAppointment("B", 10, 0, 30)};
    std::vector<Resource> res = {makeTestResource("R1")};
    Schedule s("V-4", "CSP", appts);
    s.assign("A", "GHOST");

    ValidationReport report = validateSchedule(s, res);
    EXPECT_TRUE(mentions(report.errors, "Appointment B is neither assigned nor unassigned"));
    EXPECT_TRUE(mentions(report.errors, "assigned to unknown resource GHOST"));
}

TEST(ValidationTest, ExclusiveResourcesAndGapsAreWarnings) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60, {"xray"}),
                                      makeTestAppointment("B", 9, 30, 60, {"ultrasound"}),
                                      makeTestAppointment("C", 13, 0, 30, {"mri"}),
                                      makeTestAppointment("D", 14, 0, 30)};
    std::vector<Resource> res = {makeTestResource("E1", {"xray"}), makeTestResource("E2", {"ultrasound"})};
    res[0].setConflicts({"E2"});

    Schedule s("V-5", "GA", appts);
    s.assign("A", "E1");
    s.assign("B", "E2");
    s.markInfeasible("C");
    s.markUnassigned("D");
    s.finalize(res);

    ValidationReport report = validateSchedule(s, res);
    EXPECT_TRUE(report.isValid());
    EXPECT_TRUE(mentions(report.warnings, "Mutually exclusive resources E1 and E2 overlap"));
    EXPECT_TRUE(mentions(report.warnings, "Appointment C has no eligible resource"));
    EXPECT_TRUE(mentions(report.warnings, "Appointment D is not assigned"));
}

TEST(ValidationTest, GapWarningsFollowResourcesNotInfeasibleMarks) {
    std::vector<Appointment> appts = {makeTestAppointment("A", 9, 0, 60, {"xray"}),
                                      makeTestAppointment("B", 11, 0, 30, {"mri"})};
    std::vector<Resource> res = {makeTestResource("E1", {"xray"})};

    // A could be hosted by E1 despite the mark; B fits nowhere despite being a plain gap.
    Schedule s("V-6", "SA", appts);
    s.markInfeasible("A");
    s.markUnassigned("B");
    s.finalize(res);

    ValidationReport report = validateSchedule(s, res);
    EXPECT_TRUE(report.isValid());
    EXPECT_TRUE(mentions(report.warnings, "Appointment A is not assigned"));
    EXPECT_TRUE(mentions(report.warnings, "Appointment B has no eligible resource"));
    EXPECT_FALSE(mentions(report.warnings, "Appointment A has no eligible resource"));
}
