///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "annealing_optimizer.hpp"
#include "model.hpp"
#include "formatting.hpp"
#include "instance_io.hpp"
#include "validation.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Entry point for the annealing scheduler.
 *
 * Usage: appt_annealing [instance.json | demo:S|M|L] [config.json]
 *
 * Loads the instance (or a demo), anneals a single assignment,
 * measures its runtime and prints the schedule and its validation.
 */
int main(int argc, char** argv) {
    try {
        RunInputs inputs = loadRunInputs(argc, argv, DemoSize::S);
        const ProblemInstance& inst = inputs.instance;
        Verbosity verbosity = inputs.config.verbosity;

        AnnealingOptimizer solver(inputs.config.annealing);

        // Measure wall-clock time of the annealing run.
        auto start = std::chrono::high_resolution_clock::now();
        OptimizerRun run = solver.run(inst.appointments, inst.resources);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "========================================\n";
        std::cout << "SIMULATED ANNEALING SCHEDULER\n";
        std::cout << "Instance: " << inputs.source << "\n";
        std::cout << "Appointments: " << inst.appointments.size()
                  << ", Resources: " << inst.resources.size() << "\n";
        std::cout << "Time: " << ms << " ms\n";
        printScheduleSummary(run.schedule);
        std::cout << "Iterations: " << run.stats.iterations
                  << ", best energy: " << run.stats.bestObjective
                  << " (initial " << run.stats.initialObjective << ")\n";

        if (verbosity == Verbosity::Verbose) {
            printSearchStats(solver.name(), run.stats);
        }
        if (verbosity != Verbosity::Quiet) {
            std::cout << "\n";
            printResourceSchedules(run.schedule, inst.resources);
            printValidationReport(validateSchedule(run.schedule, inst.resources));
        }

        std::cout << "========================================\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "appt_annealing: " << e.what() << "\n";
        return 1;
    }
}
