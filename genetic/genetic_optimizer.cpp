///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "genetic_optimizer.hpp"
#include <algorithm>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
GeneticOptimizer::GeneticOptimizer(GeneticConfig config)
        : config_(config) {
    validateGeneticConfig(config_);
}

double GeneticOptimizer::fitness(const std::vector<Appointment>& appointments,
                                 const std::vector<Resource>& resources,
                                 const Assignment& genes) {
    AssignmentTotals totals = evaluateAssignment(appointments, resources, genes);

    double assignmentRate = appointments.empty()
            ? 0.0
            : (double)totals.assigned / (double)appointments.size();
    double costEfficiency = totals.totalCost > 0.0
            ? totals.totalScore / totals.totalCost
            : totals.totalScore;
    costEfficiency = std::min(1.0, std::max(0.0, costEfficiency));

    return (0.3 * assignmentRate + 0.4 * conflictPenalty(totals.conflicts) + 0.3 * costEfficiency) * 100.0;
}

/**
 * @brief Generational loop with elitism and best-ever tracking.
 */
OptimizerRun GeneticOptimizer::run(const std::vector<Appointment>& appointments,
                                   const std::vector<Resource>& resources) {
    RandomGenerator rng(config_.seed);
    EligibilityTable eligible = buildEligibility(appointments, resources);

    int popSize = config_.populationSize;
    int eliteCount = std::min(popSize, std::max(1, (int)(popSize * config_.eliteFraction)));

    // Initial population of random valid assignments.
    std::vector<Individual> population;
    population.reserve(popSize);
    for (int i = 0; i < popSize; ++i) {
        Assignment genes = randomAssignment(eligible, rng);
        double f = fitness(appointments, resources, genes);
        population.push_back(Individual{std::move(genes), f});
    }

    auto byFitness = [](const Individual& a, const Individual& b) { return a.fitness > b.fitness; };
    std::stable_sort(population.begin(), population.end(), byFitness);

    Individual bestEver = population.front();

    SearchStats stats;
    stats.initialObjective = bestEver.fitness;

    bool converged = false;
    int generation = 0;
    for (; generation < config_.maxGenerations; ++generation) {
        if (cancelRequested()) {
            stats.cancelled = true;
            break;
        }

        // Convergence: the population has collapsed around its best member.
        double mean = 0.0;
        for (const Individual& ind : population) mean += ind.fitness;
        mean /= (double)population.size();
        if (population.front().fitness - mean < config_.convergenceEpsilon) {
            converged = true;
            break;
        }

        // Elites survive unchanged.
        std::vector<Individual> next(population.begin(), population.begin() + eliteCount);
        next.reserve(popSize);

        // Breed the rest.
        while ((int)next.size() < popSize) {
            const Individual& p1 = tournament(population, rng);
            const Individual& p2 = tournament(population, rng);

            Assignment child = rng.chance(config_.crossoverRate)
                    ? crossover(p1.genes, p2.genes, rng)
                    : p1.genes;
            mutate(child, eligible, rng);

            double f = fitness(appointments, resources, child);
            next.push_back(Individual{std::move(child), f});
        }

        population = std::move(next);
        std::stable_sort(population.begin(), population.end(), byFitness);

        if (population.front().fitness > bestEver.fitness) {
            bestEver = population.front();
        }
    }

    stats.iterations = generation;
    stats.bestObjective = bestEver.fitness;
    stats.exhausted = !converged && !stats.cancelled;

    return OptimizerRun{buildSchedule(name(), appointments, resources, eligible, bestEver.genes), stats};
}

const GeneticOptimizer::Individual& GeneticOptimizer::tournament(const std::vector<Individual>& population,
                                                                 RandomGenerator& rng) const {
    int size = (int)population.size();
    const Individual* winner = &population[rng.pickIndex(size)];
    for (int i = 1; i < config_.tournamentSize; ++i) {
        const Individual& contender = population[rng.pickIndex(size)];
        if (contender.fitness > winner->fitness) winner = &contender;
    }
    return *winner;
}

Assignment GeneticOptimizer::crossover(const Assignment& a, const Assignment& b, RandomGenerator& rng) const {
    int n = (int)a.size();
    if (n < 2) return a;

    int point = rng.uniformInt(1, n - 1);
    Assignment child(a.begin(), a.begin() + point);
    child.insert(child.end(), b.begin() + point, b.end());
    return child;
}

void GeneticOptimizer::mutate(Assignment& genes, const EligibilityTable& eligible, RandomGenerator& rng) const {
    for (size_t i = 0; i < genes.size(); ++i) {
        if (eligible[i].empty()) continue;
        if (rng.chance(config_.mutationRate)) {
            genes[i] = eligible[i][rng.pickIndex((int)eligible[i].size())];
        }
    }
}
