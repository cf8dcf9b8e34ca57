#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include <string>
#include <vector>


///////////////////////////
///      BUILDERS       ///
///////////////////////////
/// Midnight of the day every test instance lives on.
TimePoint testDay();

/// Appointment on testDay() at hour:minute lasting the given minutes.
Appointment makeTestAppointment(const std::string& id, int hour, int minute, int minutes,
                                CapabilitySet required = {}, Priority priority = Priority::MEDIUM);

/// Active resource open 08:00-18:00 on testDay().
Resource makeTestResource(const std::string& id, CapabilitySet caps = {}, double costPerHour = 60.0);

/// Two appointments with the same window and a single resource able to host either.
ProblemInstance identicalWindowsInstance();
