///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "mpi_comparison.hpp"
#include "formatting.hpp"
#include "instance_io.hpp"
#include "validation.hpp"
#include <mpi.h>
#include <iostream>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point for the distributed algorithm comparison.
 *
 * Usage: mpirun -n <p> appt_mpi_compare [instance.json | demo:S|M|L] [config.json]
 *
 * Every rank loads the same instance and runs its share of the algorithms;
 * rank 0 prints the comparison and the validation of every schedule.
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    try {
        RunInputs inputs = loadRunInputs(argc, argv, DemoSize::M);
        const ProblemInstance& inst = inputs.instance;

        // Only rank 0 prints a brief header about the MPI configuration.
        if (rank == 0) {
            std::cout << "========================================\n";
            std::cout << "MPI SCHEDULING ALGORITHM COMPARISON\n";
            std::cout << "Processes: " << size << "\n";
            std::cout << "Instance: " << inputs.source << "\n";
            std::cout << "Appointments: " << inst.appointments.size()
                      << ", Resources: " << inst.resources.size() << "\n";
            std::cout << "========================================\n";
        }

        MPIComparisonHarness harness(inputs.config);
        ComparisonMap results = harness.compareAll(inst);

        if (rank == 0) {
            printComparisonTable(results);
            std::optional<std::string> winner = selectWinner(results);
            if (winner) {
                std::cout << "\nWinner: " << algorithmDisplayName(*winner) << "\n";
            }
            if (inputs.config.verbosity != Verbosity::Quiet) {
                for (const auto& [name, result] : results) {
                    std::cout << "\n";
                    printScheduleSummary(result.schedule);
                    printValidationReport(validateSchedule(result.schedule, inst.resources));
                }
            }
            std::cout << "========================================\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "appt_mpi_compare (rank " << rank << "): " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 1);
        return 1;
    }

    MPI_Finalize();
    return 0;
}
