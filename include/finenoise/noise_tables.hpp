/**
 * @file noise_tables.hpp
 * @brief Seeded lookup tables shared by the lattice noise algorithms
 *
 * Tables are pure functions of the seed. Each noise source builds its
 * tables once, in its constructor, and never modifies them afterwards.
 */

#pragma once

#include <array>
#include <cstdint>

namespace finenoise {

/// Number of distinct lattice hashes (and entries in the value table)
inline constexpr int kTableSize = 256;

/// Shuffled 0..255 followed by a second copy, so `perm[i + j]` never wraps
using PermutationTable = std::array<uint8_t, 2 * kTableSize>;

/// Random lattice values in [0, 1) for value noise
using ValueTable = std::array<double, kTableSize>;

/// Seed offset for value tables, keeps them independent of the permutation
inline constexpr uint32_t kValueTableSeedOffset = 12345u;

/// Fisher-Yates shuffle of the identity sequence, duplicated to 512 entries
[[nodiscard]] PermutationTable buildPermutation(uint32_t seed);

/// 256 consecutive scrambler outputs
[[nodiscard]] ValueTable buildValueTable(uint32_t seed);

/**
 * @brief Table index (0..255) of a floored lattice coordinate
 *
 * Equals the low 8 bits of the coordinate's two's-complement value for any
 * finite input, so the lattice repeats every 256 units however far out the
 * coordinate is. NaN and infinities give 0.
 */
[[nodiscard]] int latticeIndex(double cell);

}  // namespace finenoise
