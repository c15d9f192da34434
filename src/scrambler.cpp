/**
 * @file scrambler.cpp
 * @brief Seeded 32-bit generator (add, then two xorshift-multiply rounds)
 */

#include "finenoise/scrambler.hpp"

namespace finenoise {

namespace {

// 2^32, exact in double
constexpr double kTwoPow32 = 4294967296.0;

}  // namespace

uint32_t Scrambler::step(uint32_t& state) {
    state += kIncrement;
    uint32_t t = state;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    return t ^ (t >> 14);
}

double Scrambler::next(uint32_t& state) {
    return static_cast<double>(step(state)) / kTwoPow32;
}

}  // namespace finenoise
