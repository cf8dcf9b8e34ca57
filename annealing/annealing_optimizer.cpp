///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "annealing_optimizer.hpp"
#include <algorithm>
#include <cmath>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/**
 * @brief Whether resource index r is in the (sorted) eligible list of an appointment.
 */
bool eligibleFor(const EligibilityTable& eligible, int appt, int r) {
    const std::vector<int>& list = eligible[appt];
    return std::binary_search(list.begin(), list.end(), r);
}

} // namespace


///////////////////////////
///       SOLVERS       ///
///////////////////////////
AnnealingOptimizer::AnnealingOptimizer(AnnealingConfig config)
        : config_(config) {
    validateAnnealingConfig(config_);
}

double AnnealingOptimizer::energy(const std::vector<Appointment>& appointments,
                                  const std::vector<Resource>& resources,
                                  const Assignment& assignment) {
    AssignmentTotals totals = evaluateAssignment(appointments, resources, assignment);
    return totals.totalCost + 100.0 * totals.conflicts + 200.0 * totals.unassigned;
}

/**
 * @brief Main annealing loop.
 *
 * T starts at initialTemperature and is multiplied by coolingRate after each
 * iteration; the loop ends once T drops below minTemperature or after
 * maxIterations steps.
 */
OptimizerRun AnnealingOptimizer::run(const std::vector<Appointment>& appointments,
                                     const std::vector<Resource>& resources) {
    RandomGenerator rng(config_.seed);
    EligibilityTable eligible = buildEligibility(appointments, resources);

    // Only appointments with a candidate can be moved at all.
    std::vector<int> movable;
    std::vector<int> flexible;
    for (int i = 0; i < (int)appointments.size(); ++i) {
        if (eligible[i].empty()) continue;
        movable.push_back(i);
        if (appointments[i].isFlexible()) flexible.push_back(i);
    }

    Assignment current = randomAssignment(eligible, rng);
    double currentEnergy = energy(appointments, resources, current);
    Assignment best = current;
    double bestEnergy = currentEnergy;

    SearchStats stats;
    stats.initialObjective = currentEnergy;

    double temperature = config_.initialTemperature;
    int iteration = 0;
    while (iteration < config_.maxIterations && temperature >= config_.minTemperature) {
        if (cancelRequested()) {
            stats.cancelled = true;
            break;
        }

        Assignment neighbor = current;
        if (!movable.empty()) {
            Move move = static_cast<Move>(rng.uniformInt(0, 3));
            applyMove(move, neighbor, movable, flexible, eligible, rng);
        }

        double neighborEnergy = energy(appointments, resources, neighbor);
        double delta = neighborEnergy - currentEnergy;

        // Metropolis criterion.
        if (delta < 0.0 || rng.uniformReal(0.0, 1.0) < std::exp(-delta / temperature)) {
            current = std::move(neighbor);
            currentEnergy = neighborEnergy;
            if (currentEnergy < bestEnergy) {
                best = current;
                bestEnergy = currentEnergy;
            }
        }

        temperature *= config_.coolingRate;
        iteration++;
    }

    stats.iterations = iteration;
    stats.bestObjective = bestEnergy;
    stats.exhausted = !stats.cancelled && iteration >= config_.maxIterations;

    return OptimizerRun{buildSchedule(name(), appointments, resources, eligible, best), stats};
}

void AnnealingOptimizer::applyMove(Move move, Assignment& candidate, const std::vector<int>& movable,
                                   const std::vector<int>& flexible, const EligibilityTable& eligible,
                                   RandomGenerator& rng) const {
    switch (move) {
        case Move::Reassign:
            reassign(movable[rng.pickIndex((int)movable.size())], candidate, eligible, rng);
            break;
        case Move::Swap:
            swap(candidate, movable, eligible, rng);
            break;
        case Move::MultiReassign: {
            int count = std::min(config_.multiMoveCount, (int)movable.size());
            for (int k = 0; k < count; ++k) {
                reassign(movable[rng.pickIndex((int)movable.size())], candidate, eligible, rng);
            }
            break;
        }
        case Move::Flexible: {
            // Time shifting is not modeled; a flexible appointment is reassigned instead.
            const std::vector<int>& pool = flexible.empty() ? movable : flexible;
            reassign(pool[rng.pickIndex((int)pool.size())], candidate, eligible, rng);
            break;
        }
    }
}

void AnnealingOptimizer::reassign(int appt, Assignment& candidate, const EligibilityTable& eligible,
                                  RandomGenerator& rng) const {
    const std::vector<int>& options = eligible[appt];
    int currentRes = candidate[appt];

    if (currentRes == kUnassigned) {
        candidate[appt] = options[rng.pickIndex((int)options.size())];
        return;
    }
    if (options.size() < 2) return;

    // Draw among the other options only.
    int pick = rng.pickIndex((int)options.size() - 1);
    if (options[pick] == currentRes) pick = (int)options.size() - 1;
    candidate[appt] = options[pick];
}

void AnnealingOptimizer::swap(Assignment& candidate, const std::vector<int>& movable,
                              const EligibilityTable& eligible, RandomGenerator& rng) const {
    if (movable.size() < 2) return;

    int a = movable[rng.pickIndex((int)movable.size())];
    int b = movable[rng.pickIndex((int)movable.size())];
    if (a == b) return;

    int ra = candidate[a];
    int rb = candidate[b];
    if (ra == rb || ra == kUnassigned || rb == kUnassigned) return;
    if (!eligibleFor(eligible, a, rb) || !eligibleFor(eligible, b, ra)) return;

    candidate[a] = rb;
    candidate[b] = ra;
}
