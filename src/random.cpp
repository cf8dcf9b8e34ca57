///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "random.hpp"


///////////////////////////
///       RANDOM        ///
///////////////////////////
RandomGenerator::RandomGenerator(std::optional<unsigned int> seed)
        : seed_(seed ? *seed : std::random_device{}()), engine_(seed_) {}

int RandomGenerator::uniformInt(int min, int max) {
    std::uniform_int_distribution<int> dist(min, max);
    return dist(engine_);
}

double RandomGenerator::uniformReal(double min, double max) {
    std::uniform_real_distribution<double> dist(min, max);
    return dist(engine_);
}
