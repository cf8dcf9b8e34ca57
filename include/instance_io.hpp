#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "schedule.hpp"
#include "comparison.hpp"
#include "validation.hpp"
#include "demo_instances.hpp"
#include <nlohmann/json.hpp>
#include <string>


///////////////////////////
///       INPUT         ///
///////////////////////////
/**
 * @brief Build an appointment from its JSON object.
 *
 * Required keys: id, start, and either duration (minutes) or end. All other
 * fields of the appointment are optional and default like the constructor.
 *
 * @throws std::invalid_argument for invariant violations (end before start, ...).
 */
Appointment appointmentFromJson(const nlohmann::json& j);

/**
 * @brief Build a resource from its JSON object. Required key: id.
 */
Resource resourceFromJson(const nlohmann::json& j);

/**
 * @brief Parse { "appointments": [...], "resources": [...] }.
 *
 * @throws std::invalid_argument on duplicate ids.
 */
ProblemInstance parseInstanceJson(const nlohmann::json& j);

/**
 * @brief Read and parse an instance file.
 *
 * @throws std::runtime_error if the file cannot be opened.
 */
ProblemInstance loadInstanceJson(const std::string& path);


///////////////////////////
///       OUTPUT        ///
///////////////////////////
nlohmann::json appointmentToJson(const Appointment& a);
nlohmann::json resourceToJson(const Resource& r);
nlohmann::json instanceToJson(const ProblemInstance& inst);

/**
 * @brief Schedule with assignments, unassigned/infeasible ids and metrics.
 */
nlohmann::json scheduleToJson(const Schedule& schedule);

/**
 * @brief One object per algorithm plus the winner's name.
 */
nlohmann::json comparisonToJson(const ComparisonMap& results);

nlohmann::json validationToJson(const ValidationReport& report);

/**
 * @brief Pretty-print a JSON document to a file.
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void writeJsonFile(const std::string& path, const nlohmann::json& j);


///////////////////////////
///    COMMAND LINE     ///
///////////////////////////
/**
 * @brief Inputs shared by every entry point.
 */
struct RunInputs {
    ProblemInstance instance;
    OptimizerConfig config;
    std::string source; ///< Instance file name, or "demo:<size>".
};

/**
 * @brief Resolve `prog [instance.json] [config.json]`.
 *
 * Without an instance argument (or with "demo:S|M|L") a built-in demo
 * instance is used; without a config argument all defaults apply.
 */
RunInputs loadRunInputs(int argc, char** argv, DemoSize fallback);
