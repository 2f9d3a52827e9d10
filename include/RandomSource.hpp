/**
 * @file RandomSource.hpp
 * @brief Seedable uniform sampler shared by all probabilistic decisions
 *
 * Every sampled outcome in a controller (coin flips, spin collapse, photon
 * detection, emission offsets) draws from one RandomSource, so a fixed seed
 * reproduces a whole run. Samples are built directly from the 64-bit
 * Mersenne Twister output, which keeps sequences identical across standard
 * library implementations.
 */

#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <cstdint>
#include <random>

namespace QMSIM {

class RandomSource {
public:
    static constexpr std::uint64_t DEFAULT_SEED = 5489u;

    explicit RandomSource(std::uint64_t seed = DEFAULT_SEED);

    /// Restart the sequence from a new seed
    void reseed(std::uint64_t seed);
    std::uint64_t seed() const { return seed_; }

    /// Uniform sample in [0, 1)
    double nextDouble();

    /// Uniform sample in [low, high)
    double nextDoubleBetween(double low, double high);

    /// True with the given probability (u < probability)
    bool nextBoolean(double probability = 0.5);

    /// Number of samples drawn since the last (re)seed
    std::uint64_t drawCount() const { return draws_; }

private:
    std::mt19937_64 engine_;
    std::uint64_t seed_;
    std::uint64_t draws_ = 0;
};

} // namespace QMSIM

#endif // RANDOM_SOURCE_HPP
