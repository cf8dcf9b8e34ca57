///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "comparison.hpp"
#include "../backtracking/csp_solver.hpp"
#include "../genetic/genetic_optimizer.hpp"
#include "../annealing/annealing_optimizer.hpp"
#include <chrono>
#include <future>
#include <stdexcept>


///////////////////////////
///       FACTORY       ///
///////////////////////////
const std::vector<std::string>& availableAlgorithms() {
    static const std::vector<std::string> kNames = {"CSP", "GA", "SA"};
    return kNames;
}

std::string algorithmDisplayName(const std::string& name) {
    if (name == "CSP") return "Constraint Satisfaction Problem (CSP)";
    if (name == "GA") return "Genetic Algorithm";
    if (name == "SA") return "Simulated Annealing";
    throw std::invalid_argument("Unknown algorithm: " + name);
}

std::unique_ptr<IScheduleOptimizer> makeOptimizer(const std::string& name, const OptimizerConfig& config) {
    if (name == "CSP") return std::make_unique<CspBacktrackingOptimizer>(config.csp);
    if (name == "GA") return std::make_unique<GeneticOptimizer>(config.genetic);
    if (name == "SA") return std::make_unique<AnnealingOptimizer>(config.annealing);
    throw std::invalid_argument("Unknown algorithm: " + name);
}

ComparisonResult makeComparisonResult(const std::string& name, OptimizerRun run, double executionTimeMs) {
    const Schedule& s = run.schedule;
    double efficiency = s.efficiencyScore();
    double cost = s.totalCost();
    int conflicts = s.conflictCount();
    return ComparisonResult{name, std::move(run.schedule), executionTimeMs, run.stats.iterations,
                            efficiency, cost, conflicts, run.stats};
}


///////////////////////////
///       HARNESS       ///
///////////////////////////
ComparisonHarness::ComparisonHarness(OptimizerConfig config)
        : config_(std::move(config)) {
    validateConfig(config_);
}

ComparisonMap ComparisonHarness::compareAll(const std::vector<Appointment>& appointments,
                                            const std::vector<Resource>& resources) const {
    return compare(availableAlgorithms(), appointments, resources);
}

ComparisonResult ComparisonHarness::runOne(const std::string& name,
                                           const std::vector<Appointment>& appointments,
                                           const std::vector<Resource>& resources) const {
    std::unique_ptr<IScheduleOptimizer> optimizer = makeOptimizer(name, config_);
    optimizer->setCancellationFlag(cancel_);

    auto start = std::chrono::high_resolution_clock::now();
    OptimizerRun run = optimizer->run(appointments, resources);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    return makeComparisonResult(name, std::move(run), ms);
}

/**
 * @brief Validate every name, then run sequentially or as one task per algorithm.
 *
 * Tasks capture their own copy of the input so that no optimizer ever reads
 * memory another one could be using. future::get() rethrows task failures.
 */
ComparisonMap ComparisonHarness::compare(const std::vector<std::string>& names,
                                         const std::vector<Appointment>& appointments,
                                         const std::vector<Resource>& resources) const {
    for (const std::string& name : names) {
        algorithmDisplayName(name);
    }

    ComparisonMap results;
    if (!config_.parallelComparison) {
        for (const std::string& name : names) {
            results.emplace(name, runOne(name, appointments, resources));
        }
        return results;
    }

    std::vector<std::future<ComparisonResult>> tasks;
    for (const std::string& name : names) {
        tasks.push_back(std::async(std::launch::async,
                                   [this, name, appointments, resources]() {
                                       return this->runOne(name, appointments, resources);
                                   }));
    }
    for (auto& t : tasks) {
        ComparisonResult r = t.get();
        std::string key = r.algorithmName;
        results.emplace(std::move(key), std::move(r));
    }
    return results;
}

std::optional<std::string> selectWinner(const ComparisonMap& results) {
    std::optional<std::string> winner;
    double bestScore = 0.0;
    for (const auto& [name, result] : results) {
        if (!winner || result.efficiencyScore > bestScore) {
            winner = name;
            bestScore = result.efficiencyScore;
        }
    }
    return winner;
}
