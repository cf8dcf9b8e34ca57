#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///        DEMO         ///
///////////////////////////
/**
 * @brief Size presets for the built-in clinic instances.
 *
 *  - S: 12 appointments, 5 resources, hand written.
 *  - M: 40 appointments, 10 resources over two days.
 *  - L: 120 appointments, 20 resources over five days.
 */
enum class DemoSize { S, M, L };

/**
 * @brief Build a deterministic clinic-like instance.
 *
 * The same (size, seed) pair always yields the same instance; the seed only
 * affects the generated sizes M and L.
 */
ProblemInstance makeDemoInstance(DemoSize size, unsigned int seed = 42);

/**
 * @brief Parse "S", "M" or "L".
 *
 * @throws std::invalid_argument for any other name.
 */
DemoSize parseDemoSize(const std::string& name);
