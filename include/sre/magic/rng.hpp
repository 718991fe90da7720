#pragma once

/// @file rng.hpp
/// @brief Injectable sources of randomness and wall-clock time.

#include <cstdint>
#include <random>

#include "sre/magic/entities.hpp"

namespace sre::magic {

/// Uniform random draws used by dice, failure and accuracy rolls.
class IRandom {
public:
    virtual ~IRandom() = default;

    /// Uniform integer in [lo, hi] (inclusive).
    virtual int32_t UniformInt(int32_t lo, int32_t hi) = 0;

    /// Uniform real in [0, 1).
    virtual double UniformReal() = 0;
};

/// Mersenne-twister backed IRandom.
class StdRandom final : public IRandom {
public:
    StdRandom() : engine_(std::random_device{}()) {}
    explicit StdRandom(uint32_t seed) : engine_(seed) {}

    int32_t UniformInt(int32_t lo, int32_t hi) override {
        if (hi < lo) {
            return lo;
        }
        return std::uniform_int_distribution<int32_t>(lo, hi)(engine_);
    }

    double UniformReal() override {
        return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
    }

private:
    std::mt19937 engine_;
};

/// Wall clock used for fatigue and aggro timestamps.
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual TimePoint Now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] TimePoint Now() const override { return WallClock::now(); }
};

} // namespace sre::magic
