/**
 * @file noise_tables.cpp
 * @brief Permutation and value table construction
 */

#include "finenoise/noise_tables.hpp"
#include "finenoise/scrambler.hpp"

#include <cmath>
#include <utility>

namespace finenoise {

PermutationTable buildPermutation(uint32_t seed) {
    PermutationTable perm{};

    // Initialize first 256 entries as 0..255
    for (int i = 0; i < kTableSize; ++i) {
        perm[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
    }

    Scrambler rng(seed);
    for (int i = kTableSize - 1; i > 0; --i) {
        int j = static_cast<int>(std::floor(rng.next() * static_cast<double>(i + 1)));
        std::swap(perm[static_cast<size_t>(i)], perm[static_cast<size_t>(j)]);
    }

    // Duplicate to avoid overflow
    for (int i = 0; i < kTableSize; ++i) {
        perm[static_cast<size_t>(i + kTableSize)] = perm[static_cast<size_t>(i)];
    }

    return perm;
}

ValueTable buildValueTable(uint32_t seed) {
    ValueTable values{};
    Scrambler rng(seed);
    for (auto& v : values) {
        v = rng.next();
    }
    return values;
}

int latticeIndex(double cell) {
    if (!std::isfinite(cell)) {
        return 0;
    }
    double wrapped = std::fmod(cell, static_cast<double>(kTableSize));
    if (wrapped < 0.0) {
        wrapped += kTableSize;
    }
    return static_cast<int>(wrapped);
}

}  // namespace finenoise
