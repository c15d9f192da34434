/**
 * @file test_scrambler.cpp
 * @brief Unit tests for the seeded generator and table construction
 */

#include "finenoise/noise_tables.hpp"
#include "finenoise/scrambler.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>

using namespace finenoise;

// ============================================================================
// Scrambler tests
// ============================================================================

TEST(ScramblerTest, Seed42RawOutputs) {
    Scrambler rng(42);
    EXPECT_EQ(rng.nextU32(), 2581720956u);
    EXPECT_EQ(rng.nextU32(), 1925393290u);
    EXPECT_EQ(rng.nextU32(), 3661312704u);
}

TEST(ScramblerTest, Seed0RawOutputs) {
    Scrambler rng(0);
    EXPECT_EQ(rng.nextU32(), 1144304738u);
    EXPECT_EQ(rng.nextU32(), 1416247u);
    EXPECT_EQ(rng.nextU32(), 958946056u);
}

TEST(ScramblerTest, Seed42Reals) {
    Scrambler rng(42);
    EXPECT_DOUBLE_EQ(rng.next(), 0.6011037519201636);
    EXPECT_DOUBLE_EQ(rng.next(), 0.44829055899754167);
    EXPECT_DOUBLE_EQ(rng.next(), 0.8524657934904099);
}

TEST(ScramblerTest, RealIsRawOver2Pow32) {
    Scrambler a(1234);
    Scrambler b(1234);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.next(), static_cast<double>(b.nextU32()) / 4294967296.0);
    }
}

TEST(ScramblerTest, OutputsInUnitInterval) {
    Scrambler rng(99);
    for (int i = 0; i < 10000; ++i) {
        double v = rng.next();
        EXPECT_GE(v, 0.0);
        EXPECT_LT(v, 1.0);
    }
}

TEST(ScramblerTest, StateAdvancesByIncrement) {
    Scrambler rng(7);
    (void)rng.nextU32();
    EXPECT_EQ(rng.state(), 7u + Scrambler::kIncrement);
}

TEST(ScramblerTest, StaticFormMatchesInstance) {
    Scrambler rng(555);
    uint32_t state = 555;
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(rng.next(), Scrambler::next(state));
    }
    EXPECT_EQ(rng.state(), state);
}

TEST(ScramblerTest, StateWrapsAround) {
    // Seed near the top of the range must wrap, not saturate
    Scrambler rng(0xFFFFFFFFu);
    (void)rng.nextU32();
    EXPECT_EQ(rng.state(), Scrambler::kIncrement - 1u);
}

// ============================================================================
// Table tests
// ============================================================================

TEST(NoiseTablesTest, PermutationIsDuplicatedShuffle) {
    auto perm = buildPermutation(42);

    std::array<int, kTableSize> counts{};
    for (uint8_t v : perm) {
        ++counts[v];
    }
    for (int c : counts) {
        EXPECT_EQ(c, 2);
    }

    for (int i = 0; i < kTableSize; ++i) {
        EXPECT_EQ(perm[static_cast<size_t>(i)], perm[static_cast<size_t>(i + kTableSize)]);
    }
}

TEST(NoiseTablesTest, Seed42PermutationPrefix) {
    auto perm = buildPermutation(42);
    const std::array<uint8_t, 8> expected = {79, 208, 113, 244, 223, 165, 38, 9};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(perm[i], expected[i]) << "index " << i;
    }
}

TEST(NoiseTablesTest, Seed0PermutationPrefix) {
    auto perm = buildPermutation(0);
    const std::array<uint8_t, 8> expected = {242, 66, 69, 165, 41, 35, 67, 223};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(perm[i], expected[i]) << "index " << i;
    }
}

TEST(NoiseTablesTest, PermutationDeterministic) {
    EXPECT_EQ(buildPermutation(1000), buildPermutation(1000));
}

TEST(NoiseTablesTest, DifferentSeedsDifferentPermutation) {
    EXPECT_NE(buildPermutation(1), buildPermutation(2));
}

TEST(NoiseTablesTest, ValueTableIsScramblerSequence) {
    auto values = buildValueTable(42);
    Scrambler rng(42);
    for (double v : values) {
        EXPECT_EQ(v, rng.next());
    }
    EXPECT_DOUBLE_EQ(values[0], 0.6011037519201636);
}

TEST(NoiseTablesTest, LatticeIndexWrapsLikeTwosComplement) {
    EXPECT_EQ(latticeIndex(0.0), 0);
    EXPECT_EQ(latticeIndex(5.0), 5);
    EXPECT_EQ(latticeIndex(256.0), 0);
    EXPECT_EQ(latticeIndex(-1.0), 255);
    EXPECT_EQ(latticeIndex(-256.0), 0);
    EXPECT_EQ(latticeIndex(3000000005.0), 5);
    EXPECT_EQ(latticeIndex(-2147483649.0), 255);
    EXPECT_EQ(latticeIndex(1.0e300), 0);

    EXPECT_EQ(latticeIndex(std::numeric_limits<double>::quiet_NaN()), 0);
    EXPECT_EQ(latticeIndex(std::numeric_limits<double>::infinity()), 0);
    EXPECT_EQ(latticeIndex(-std::numeric_limits<double>::infinity()), 0);
}
