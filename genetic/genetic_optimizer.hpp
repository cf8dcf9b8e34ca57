#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "config.hpp"
#include "random.hpp"
#include "solver_base.hpp"
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Evolutionary search over complete assignments.
 *
 * A chromosome maps every appointment to an eligible resource or leaves it
 * unassigned. Each generation keeps the elite unchanged and breeds the rest
 * through tournament selection, single-point crossover and per-appointment
 * mutation. Conflicts are penalized in the fitness, not forbidden.
 */
class GeneticOptimizer : public IScheduleOptimizer {
public:
    /// @throws std::invalid_argument for out-of-range parameters.
    explicit GeneticOptimizer(GeneticConfig config = GeneticConfig{});

    std::string name() const override { return "GA"; }

    /**
     * @brief Evolve a population and return the fittest chromosome ever seen.
     *
     * Stops after maxGenerations or once best and mean fitness of the
     * population differ by less than convergenceEpsilon.
     */
    OptimizerRun run(const std::vector<Appointment>& appointments,
                     const std::vector<Resource>& resources) override;

    /**
     * @brief Fitness of one chromosome, in [0, 100].
     *
     * (0.3 * assignmentRate + 0.4 * conflictPenalty + 0.3 * costEfficiency) * 100,
     * where costEfficiency = score / cost (raw score when cost is zero) clamped to [0, 1].
     */
    static double fitness(const std::vector<Appointment>& appointments,
                          const std::vector<Resource>& resources,
                          const Assignment& genes);

private:
    /// Chromosome together with its cached fitness.
    struct Individual {
        Assignment genes;
        double fitness;
    };

    GeneticConfig config_;

    /**
     * @brief Sample tournamentSize individuals and return the fittest one.
     */
    const Individual& tournament(const std::vector<Individual>& population, RandomGenerator& rng) const;

    /**
     * @brief Single-point crossover over the appointment order.
     */
    Assignment crossover(const Assignment& a, const Assignment& b, RandomGenerator& rng) const;

    /**
     * @brief Reassign each appointment to a random eligible resource with probability mutationRate.
     */
    void mutate(Assignment& genes, const EligibilityTable& eligible, RandomGenerator& rng) const;
};
