#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <optional>
#include <random>


///////////////////////////
///       RANDOM        ///
///////////////////////////
/**
 * @brief Pseudo-random source owned by a single optimizer invocation.
 *
 * Wraps std::mt19937 so that concurrent runs never share generator state and
 * a run is reproducible when a seed is given.
 */
class RandomGenerator {
public:
    /**
     * @brief Seed from the given value, or from std::random_device when empty.
     */
    explicit RandomGenerator(std::optional<unsigned int> seed = std::nullopt);

    /**
     * @brief Inclusive integer range [min, max].
     */
    int uniformInt(int min, int max);

    /**
     * @brief Real range [min, max).
     */
    double uniformReal(double min, double max);

    /**
     * @brief Uniform index in [0, size); size must be positive.
     */
    int pickIndex(int size) { return uniformInt(0, size - 1); }

    /**
     * @brief True with probability p.
     */
    bool chance(double p) { return uniformReal(0.0, 1.0) < p; }

    /// Seed actually used, for reporting reproducible runs.
    unsigned int seed() const { return seed_; }

private:
    unsigned int seed_;
    std::mt19937 engine_;
};
