#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <nlohmann/json.hpp>
#include <optional>
#include <string>


///////////////////////////
///       CONFIG        ///
///////////////////////////
/**
 * @brief How much the entry points print.
 */
enum class Verbosity {
    Quiet,   ///< Summary lines only.
    Normal,  ///< Summary plus schedule and comparison tables.
    Verbose  ///< Everything, plus per-run search statistics.
};

/// Backtracking limits.
struct CspConfig {
    int maxBacktrackAttempts = 10000; ///< Cap on recursive calls per run.
};

/// Evolutionary search parameters.
struct GeneticConfig {
    int populationSize = 100;
    int maxGenerations = 1000;
    double crossoverRate = 0.8;
    double mutationRate = 0.1; ///< Independent per-appointment probability.
    double eliteFraction = 0.1;
    int tournamentSize = 5;
    double convergenceEpsilon = 0.01; ///< Stop once best - mean fitness drops below this.
    std::optional<unsigned int> seed;
};

/// Annealing schedule parameters.
struct AnnealingConfig {
    int maxIterations = 10000;
    double initialTemperature = 1000.0;
    double coolingRate = 0.95;
    double minTemperature = 0.1;
    int multiMoveCount = 3; ///< Upper bound of appointments touched by the multi-reassign move.
    std::optional<unsigned int> seed;
};

/**
 * @brief Complete run configuration shared by the entry points and the service.
 */
struct OptimizerConfig {
    CspConfig csp;
    GeneticConfig genetic;
    AnnealingConfig annealing;
    bool parallelComparison = true; ///< Run the harness algorithms as concurrent tasks.
    Verbosity verbosity = Verbosity::Normal;
};

/**
 * @brief Build a config from a JSON object; missing keys keep their defaults.
 *
 * Recognized layout:
 *   { "csp": {...}, "genetic": {...}, "annealing": {...},
 *     "parallelComparison": bool, "verbosity": "quiet" | "normal" | "verbose" }
 *
 * @throws std::invalid_argument for unknown verbosity names or out-of-range values.
 */
OptimizerConfig parseOptimizerConfig(const nlohmann::json& j);

/**
 * @brief Read and validate a JSON config file.
 *
 * @throws std::runtime_error if the file cannot be opened.
 */
OptimizerConfig loadOptimizerConfig(const std::string& path);

/**
 * @brief Reject parameters that would make a search meaningless.
 *
 * @throws std::invalid_argument naming the offending key.
 */
void validateConfig(const OptimizerConfig& cfg);

/// Per-section checks; each optimizer runs its own in its constructor.
void validateCspConfig(const CspConfig& csp);
void validateGeneticConfig(const GeneticConfig& ga);
void validateAnnealingConfig(const AnnealingConfig& sa);

Verbosity parseVerbosity(const std::string& name);
std::string toString(Verbosity v);
