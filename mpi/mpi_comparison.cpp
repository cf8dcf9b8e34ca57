///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_comparison.hpp"
#include <mpi.h>
#include <unordered_map>


///////////////////////////
///       HARNESS       ///
///////////////////////////
namespace {

/// Fixed length of the statistics record.
constexpr int kStatsLength = 6;

/// Message tags; each algorithm index gets its own pair.
constexpr int TAG_STATS = 100;
constexpr int TAG_ASSIGNMENT = 101;

int tagFor(int base, int algorithmIndex) {
    return base + 2 * algorithmIndex;
}

} // namespace

MPIComparisonHarness::MPIComparisonHarness(OptimizerConfig config)
        : config_(std::move(config)) {
    validateConfig(config_);
    // Each rank runs its algorithms one after another.
    config_.parallelComparison = false;
}

void MPIComparisonHarness::serializeStats(const ComparisonResult& result, std::vector<double>& record) {
    record.assign(kStatsLength, 0.0);
    record[0] = result.executionTimeMs;
    record[1] = (double)result.stats.iterations;
    record[2] = result.stats.initialObjective;
    record[3] = result.stats.bestObjective;
    record[4] = result.stats.exhausted ? 1.0 : 0.0;
    record[5] = result.stats.cancelled ? 1.0 : 0.0;
}

void MPIComparisonHarness::deserializeStats(const std::vector<double>& record, double& executionTimeMs,
                                            SearchStats& stats) {
    executionTimeMs = record[0];
    stats.iterations = (long)record[1];
    stats.initialObjective = record[2];
    stats.bestObjective = record[3];
    stats.exhausted = record[4] != 0.0;
    stats.cancelled = record[5] != 0.0;
}

Assignment MPIComparisonHarness::serializeAssignment(const Schedule& schedule, const ProblemInstance& inst) {
    std::unordered_map<std::string, int> resourceIndex;
    for (int r = 0; r < (int)inst.resources.size(); ++r) {
        resourceIndex[inst.resources[r].id()] = r;
    }

    Assignment assignment(inst.appointments.size(), kUnassigned);
    for (size_t i = 0; i < inst.appointments.size(); ++i) {
        std::optional<std::string> resId = schedule.resourceFor(inst.appointments[i].id());
        if (resId) {
            assignment[i] = resourceIndex.at(*resId);
        }
    }
    return assignment;
}

/**
 * @brief Distribute, run and gather the comparison.
 *
 * Rank 0 keeps its own results directly and receives the others in
 * algorithm order with blocking receives from each owner rank.
 */
ComparisonMap MPIComparisonHarness::compareAll(const ProblemInstance& inst) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const std::vector<std::string>& names = availableAlgorithms();
    ComparisonHarness local(config_);
    EligibilityTable eligible = buildEligibility(inst.appointments, inst.resources);

    ComparisonMap results;
    for (int k = 0; k < (int)names.size(); ++k) {
        int owner = k % size;
        if (owner != rank) continue;

        ComparisonResult result = local.runOne(names[k], inst.appointments, inst.resources);
        if (rank == 0) {
            results.emplace(names[k], std::move(result));
            continue;
        }

        std::vector<double> record;
        serializeStats(result, record);
        Assignment assignment = serializeAssignment(result.schedule, inst);

        MPI_Send(record.data(), kStatsLength, MPI_DOUBLE, 0, tagFor(TAG_STATS, k), MPI_COMM_WORLD);
        int len = (int)assignment.size();
        if (len > 0) {
            MPI_Send(assignment.data(), len, MPI_INT, 0, tagFor(TAG_ASSIGNMENT, k), MPI_COMM_WORLD);
        }
    }

    if (rank != 0) {
        return results;
    }

    // Rank 0: collect the algorithms that ran elsewhere.
    for (int k = 0; k < (int)names.size(); ++k) {
        int owner = k % size;
        if (owner == 0) continue;

        std::vector<double> record(kStatsLength, 0.0);
        MPI_Recv(record.data(), kStatsLength, MPI_DOUBLE, owner, tagFor(TAG_STATS, k),
                 MPI_COMM_WORLD, MPI_STATUS_IGNORE);

        Assignment assignment(inst.appointments.size(), kUnassigned);
        int len = (int)assignment.size();
        if (len > 0) {
            MPI_Recv(assignment.data(), len, MPI_INT, owner, tagFor(TAG_ASSIGNMENT, k),
                     MPI_COMM_WORLD, MPI_STATUS_IGNORE);
        }

        double executionTimeMs = 0.0;
        SearchStats stats;
        deserializeStats(record, executionTimeMs, stats);

        Schedule schedule = buildSchedule(names[k], inst.appointments, inst.resources, eligible, assignment);
        results.emplace(names[k], makeComparisonResult(names[k], OptimizerRun{std::move(schedule), stats},
                                                       executionTimeMs));
    }
    return results;
}
