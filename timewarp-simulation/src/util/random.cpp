#include "util/random.hpp"

RandomGenerator::RandomGenerator() : engine(std::random_device{}()) {}

RandomGenerator::RandomGenerator(unsigned int seed) : engine(seed) {}

void RandomGenerator::reseed(unsigned int seed) {
    engine.seed(seed);
}

int RandomGenerator::uniformInt(int min, int max) {
    std::uniform_int_distribution<int> dist(min, max);
    return dist(engine);
}

double RandomGenerator::uniformReal(double min, double max) {
    std::uniform_real_distribution<double> dist(min, max);
    return dist(engine);
}

bool RandomGenerator::chance(double probability) {
    if (probability <= 0.0) return false;
    if (probability >= 1.0) return true;
    std::bernoulli_distribution dist(probability);
    return dist(engine);
}
