///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include <fstream>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

void require(bool condition, const std::string& message) {
    if (!condition) throw std::invalid_argument("invalid config: " + message);
}

std::optional<unsigned int> readSeed(const nlohmann::json& section, const std::optional<unsigned int>& fallback) {
    if (!section.contains("seed") || section["seed"].is_null()) return fallback;
    return section["seed"].get<unsigned int>();
}

} // namespace


///////////////////////////
///       CONFIG        ///
///////////////////////////
Verbosity parseVerbosity(const std::string& name) {
    if (name == "quiet") return Verbosity::Quiet;
    if (name == "normal") return Verbosity::Normal;
    if (name == "verbose") return Verbosity::Verbose;
    throw std::invalid_argument("invalid config: unknown verbosity '" + name + "'");
}

std::string toString(Verbosity v) {
    switch (v) {
        case Verbosity::Quiet: return "quiet";
        case Verbosity::Normal: return "normal";
        case Verbosity::Verbose: return "verbose";
    }
    return "normal";
}

OptimizerConfig parseOptimizerConfig(const nlohmann::json& j) {
    OptimizerConfig cfg;
    if (!j.is_object()) {
        throw std::invalid_argument("invalid config: top level must be a JSON object");
    }

    if (j.contains("csp")) {
        const auto& c = j["csp"];
        cfg.csp.maxBacktrackAttempts = c.value("maxBacktrackAttempts", cfg.csp.maxBacktrackAttempts);
    }

    if (j.contains("genetic")) {
        const auto& g = j["genetic"];
        GeneticConfig& ga = cfg.genetic;
        ga.populationSize = g.value("populationSize", ga.populationSize);
        ga.maxGenerations = g.value("maxGenerations", ga.maxGenerations);
        ga.crossoverRate = g.value("crossoverRate", ga.crossoverRate);
        ga.mutationRate = g.value("mutationRate", ga.mutationRate);
        ga.eliteFraction = g.value("eliteFraction", ga.eliteFraction);
        ga.tournamentSize = g.value("tournamentSize", ga.tournamentSize);
        ga.convergenceEpsilon = g.value("convergenceEpsilon", ga.convergenceEpsilon);
        ga.seed = readSeed(g, ga.seed);
    }

    if (j.contains("annealing")) {
        const auto& a = j["annealing"];
        AnnealingConfig& sa = cfg.annealing;
        sa.maxIterations = a.value("maxIterations", sa.maxIterations);
        sa.initialTemperature = a.value("initialTemperature", sa.initialTemperature);
        sa.coolingRate = a.value("coolingRate", sa.coolingRate);
        sa.minTemperature = a.value("minTemperature", sa.minTemperature);
        sa.multiMoveCount = a.value("multiMoveCount", sa.multiMoveCount);
        sa.seed = readSeed(a, sa.seed);
    }

    cfg.parallelComparison = j.value("parallelComparison", cfg.parallelComparison);
    if (j.contains("verbosity")) {
        cfg.verbosity = parseVerbosity(j["verbosity"].get<std::string>());
    }

    validateConfig(cfg);
    return cfg;
}

OptimizerConfig loadOptimizerConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open config file '" + path + "'");
    }
    nlohmann::json j = nlohmann::json::parse(in);
    return parseOptimizerConfig(j);
}

void validateCspConfig(const CspConfig& csp) {
    require(csp.maxBacktrackAttempts > 0, "csp.maxBacktrackAttempts must be positive");
}

void validateGeneticConfig(const GeneticConfig& ga) {
    require(ga.populationSize >= 2, "genetic.populationSize must be at least 2");
    require(ga.maxGenerations >= 0, "genetic.maxGenerations must not be negative");
    require(ga.crossoverRate >= 0.0 && ga.crossoverRate <= 1.0, "genetic.crossoverRate must be in [0, 1]");
    require(ga.mutationRate >= 0.0 && ga.mutationRate <= 1.0, "genetic.mutationRate must be in [0, 1]");
    require(ga.eliteFraction >= 0.0 && ga.eliteFraction < 1.0, "genetic.eliteFraction must be in [0, 1)");
    require(ga.tournamentSize >= 1, "genetic.tournamentSize must be at least 1");
    require(ga.convergenceEpsilon >= 0.0, "genetic.convergenceEpsilon must not be negative");
}

void validateAnnealingConfig(const AnnealingConfig& sa) {
    require(sa.maxIterations >= 0, "annealing.maxIterations must not be negative");
    require(sa.initialTemperature > 0.0, "annealing.initialTemperature must be positive");
    require(sa.coolingRate > 0.0 && sa.coolingRate < 1.0, "annealing.coolingRate must be in (0, 1)");
    require(sa.minTemperature > 0.0, "annealing.minTemperature must be positive");
    require(sa.minTemperature < sa.initialTemperature, "annealing.minTemperature must be below initialTemperature");
    require(sa.multiMoveCount >= 1, "annealing.multiMoveCount must be at least 1");
}

void validateConfig(const OptimizerConfig& cfg) {
    validateCspConfig(cfg.csp);
    validateGeneticConfig(cfg.genetic);
    validateAnnealingConfig(cfg.annealing);
}
