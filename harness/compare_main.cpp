///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "comparison.hpp"
#include "formatting.hpp"
#include "instance_io.hpp"
#include "validation.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the algorithm comparison.
 *
 * Usage: appt_compare [instance.json | demo:S|M|L] [config.json] [report.json]
 *
 * Runs CSP, GA and SA over the same snapshot (concurrently unless the config
 * disables it), prints the comparison table, validates every schedule and
 * optionally writes the full comparison as JSON.
 */
int main(int argc, char** argv) {
    try {
        RunInputs inputs = loadRunInputs(argc, argv, DemoSize::M);
        const ProblemInstance& inst = inputs.instance;
        Verbosity verbosity = inputs.config.verbosity;

        ComparisonHarness harness(inputs.config);

        auto start = std::chrono::high_resolution_clock::now();
        ComparisonMap results = harness.compareAll(inst.appointments, inst.resources);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "========================================\n";
        std::cout << "SCHEDULING ALGORITHM COMPARISON\n";
        std::cout << "Instance: " << inputs.source << "\n";
        std::cout << "Appointments: " << inst.appointments.size()
                  << ", Resources: " << inst.resources.size() << "\n";
        std::cout << "Mode: " << (inputs.config.parallelComparison ? "concurrent" : "sequential") << "\n";
        std::cout << "Total time: " << ms << " ms\n\n";

        printComparisonTable(results);

        std::optional<std::string> winner = selectWinner(results);
        if (winner) {
            std::cout << "\nWinner: " << algorithmDisplayName(*winner) << "\n";
        }

        for (const auto& [name, result] : results) {
            if (verbosity == Verbosity::Quiet) break;
            std::cout << "\n";
            printScheduleSummary(result.schedule);
            if (verbosity == Verbosity::Verbose) {
                printSearchStats(name, result.stats);
                printResourceSchedules(result.schedule, inst.resources);
            }
            printValidationReport(validateSchedule(result.schedule, inst.resources));
        }

        if (argc > 3) {
            writeJsonFile(argv[3], comparisonToJson(results));
            std::cout << "\nReport written to " << argv[3] << "\n";
        }

        std::cout << "========================================\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "appt_compare: " << e.what() << "\n";
        return 1;
    }
}
