/**
 * @file scrambler.hpp
 * @brief Seeded 32-bit pseudo-random generator for table construction
 *
 * Produces a reproducible sequence of reals in [0, 1) from a 32-bit seed.
 * All arithmetic is unsigned 32-bit with wraparound, so the sequence is
 * bit-identical on every platform. Every seeded table and every Worley
 * feature point is derived from this generator.
 */

#pragma once

#include <cstdint>

namespace finenoise {

class Scrambler {
public:
    /// Additive constant applied to the state on every step (odd)
    static constexpr uint32_t kIncrement = 0x6D2B79F5u;

    explicit Scrambler(uint32_t seed) : state_(seed) {}

    /// Advance the state and return the raw 32-bit output
    [[nodiscard]] uint32_t nextU32() { return step(state_); }

    /// Advance the state and return a real in [0, 1)
    [[nodiscard]] double next() { return next(state_); }

    [[nodiscard]] uint32_t state() const { return state_; }

    /// Stateless form: advances `state` in place and returns a real in [0, 1)
    [[nodiscard]] static double next(uint32_t& state);

    /// Stateless form: advances `state` in place and returns the raw output
    [[nodiscard]] static uint32_t step(uint32_t& state);

private:
    uint32_t state_;
};

}  // namespace finenoise
