#include "RandomSource.hpp"
#include "MeasurementErrors.hpp"

namespace QMSIM {

RandomSource::RandomSource(std::uint64_t seed)
    : engine_(seed), seed_(seed) {}

void RandomSource::reseed(std::uint64_t seed) {
    engine_.seed(seed);
    seed_ = seed;
    draws_ = 0;
}

double RandomSource::nextDouble() {
    // 53 random mantissa bits -> [0, 1)
    ++draws_;
    return static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
}

double RandomSource::nextDoubleBetween(double low, double high) {
    if (high < low) {
        throw InvalidConfigurationError("random range upper bound below lower bound");
    }
    return low + (high - low) * nextDouble();
}

bool RandomSource::nextBoolean(double probability) {
    return nextDouble() < probability;
}

} // namespace QMSIM
