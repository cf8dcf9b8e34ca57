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
 * @brief Single-solution local search with Metropolis acceptance.
 *
 * Starts from one random valid assignment and a fixed temperature. Every
 * iteration proposes a neighbor through one of four moves chosen uniformly,
 * accepts it when the energy drops or with probability exp(-dE / T)
 * otherwise, then cools geometrically. The best state ever visited is kept
 * apart from the current one.
 */
class AnnealingOptimizer : public IScheduleOptimizer {
public:
    explicit AnnealingOptimizer(AnnealingConfig config = AnnealingConfig{});

    std::string name() const override { return "SA"; }

    /**
     * @brief Anneal until the temperature floor or maxIterations and return the best state.
     */
    OptimizerRun run(const std::vector<Appointment>& appointments,
                     const std::vector<Resource>& resources) override;

    /**
     * @brief Energy of an assignment (lower is better).
     *
     * Sum of resource costs + 100 per conflict + 200 per unassigned appointment.
     */
    static double energy(const std::vector<Appointment>& appointments,
                         const std::vector<Resource>& resources,
                         const Assignment& assignment);

private:
    /// Neighborhood moves, drawn uniformly.
    enum class Move { Reassign, Swap, MultiReassign, Flexible };

    AnnealingConfig config_;

    /**
     * @brief Apply one random move to the candidate in place.
     *
     * @param movable  Appointments with at least one eligible resource.
     * @param flexible Subset of movable flagged as flexible.
     */
    void applyMove(Move move, Assignment& candidate, const std::vector<int>& movable,
                   const std::vector<int>& flexible, const EligibilityTable& eligible,
                   RandomGenerator& rng) const;

    /**
     * @brief Move one appointment to a different eligible resource, if one exists.
     */
    void reassign(int appt, Assignment& candidate, const EligibilityTable& eligible, RandomGenerator& rng) const;

    /**
     * @brief Exchange the resources of two appointments when both new pairings are eligible.
     */
    void swap(Assignment& candidate, const std::vector<int>& movable,
              const EligibilityTable& eligible, RandomGenerator& rng) const;
};
