/**
 * @file test_noise_ops.cpp
 * @brief Unit tests for fractal layering, turbulence and scalar remaps
 */

#include "finenoise/noise.hpp"
#include "finenoise/noise_ops.hpp"
#include "finenoise/noise_worley.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace finenoise;

// ============================================================================
// FBM tests
// ============================================================================

TEST(FBMNoise2DTest, SingleOctaveEqualsBase) {
    auto base = std::make_shared<PerlinNoise2D>(NoiseConfig{42});
    auto fbm = base->fbm({1, 1.0, 1.0});

    for (double x = -5.0; x < 5.0; x += 0.77) {
        EXPECT_EQ(fbm->sample(x, x * 0.3), base->sample(x, x * 0.3));
    }
}

TEST(FBMNoise2DTest, TwoOctavesWeightedSum) {
    auto base = std::make_shared<SimplexNoise2D>(NoiseConfig{9});
    auto fbm = base->fbm({2, 2.0, 0.5});

    double x = 1.37;
    double y = -4.21;
    double expected = (base->sample(x, y) + 0.5 * base->sample(x * 2.0, y * 2.0)) / 1.5;
    EXPECT_DOUBLE_EQ(fbm->sample(x, y), expected);
}

TEST(FBMNoise2DTest, Deterministic) {
    auto fbm1 = std::make_shared<PerlinNoise2D>(NoiseConfig{42})->fbm({6, 2.0, 0.5});
    auto fbm2 = std::make_shared<PerlinNoise2D>(NoiseConfig{42})->fbm({6, 2.0, 0.5});
    EXPECT_EQ(fbm1->sample(12.3, 45.6), fbm2->sample(12.3, 45.6));
}

TEST(FBMNoise2DTest, NormalizedRange) {
    auto fbm = std::make_shared<PerlinNoise2D>(NoiseConfig{123})->fbm({6, 2.0, 0.5});
    for (int i = 0; i < 1000; ++i) {
        double v = fbm->sample(i * 0.37, i * 0.53);
        EXPECT_GE(v, -1.0);
        EXPECT_LE(v, 1.0);
    }
}

TEST(FBMNoise2DTest, MoreOctavesMoreDetail) {
    auto base = std::make_shared<PerlinNoise2D>(NoiseConfig{42});
    auto smooth = base->fbm({1});
    auto detailed = base->fbm({6});

    int differing = 0;
    for (int i = 0; i < 20; ++i) {
        double x = i * 0.61 + 0.13;
        if (smooth->sample(x, 1.7) != detailed->sample(x, 1.7)) ++differing;
    }
    EXPECT_GT(differing, 15);
}

TEST(FBMNoise2DTest, KeepsConfig) {
    FBMNoise2D fbm(std::make_shared<ValueNoise2D>(), FBMConfig{3, 1.5, 0.25});
    EXPECT_EQ(fbm.config().octaves, 3);
    EXPECT_EQ(fbm.config().lacunarity, 1.5);
    EXPECT_EQ(fbm.config().persistence, 0.25);
}

TEST(FBMNoise2DTest, NonPositiveOctavesThrow) {
    auto base = std::make_shared<PerlinNoise2D>();
    EXPECT_THROW(FBMNoise2D(base, FBMConfig{0}), std::invalid_argument);
    EXPECT_THROW((void)base->fbm({-2}), std::invalid_argument);
    EXPECT_THROW((void)base->turbulence({0}), std::invalid_argument);
}

TEST(FBMNoise2DTest, NullBaseThrows) {
    EXPECT_THROW(FBMNoise2D(nullptr), std::invalid_argument);
    EXPECT_THROW(TurbulenceNoise2D(nullptr), std::invalid_argument);
}

TEST(FBMNoise2DTest, UnsharedSourceCannotCompose) {
    PerlinNoise2D noise(NoiseConfig{42});
    EXPECT_THROW((void)noise.fbm(), std::bad_weak_ptr);
}

TEST(FBMNoise3DTest, SingleOctaveEqualsBase) {
    auto base = std::make_shared<SimplexNoise3D>(NoiseConfig{42});
    auto fbm = base->fbm({1, 1.0, 1.0});
    EXPECT_EQ(fbm->sample(1.1, 2.2, 3.3), base->sample(1.1, 2.2, 3.3));
}

TEST(FBMNoise3DTest, Deterministic) {
    auto fbm1 = std::make_shared<PerlinNoise3D>(NoiseConfig{42})->fbm({4});
    auto fbm2 = std::make_shared<PerlinNoise3D>(NoiseConfig{42})->fbm({4});
    EXPECT_EQ(fbm1->sample(1.5, 2.5, 3.5), fbm2->sample(1.5, 2.5, 3.5));
}

TEST(FBMNoise3DTest, NonPositiveOctavesThrow) {
    auto base = std::make_shared<PerlinNoise3D>();
    EXPECT_THROW(FBMNoise3D(base, FBMConfig{0}), std::invalid_argument);
    EXPECT_THROW(TurbulenceNoise3D(base, FBMConfig{-1}), std::invalid_argument);
}

// ============================================================================
// Turbulence tests
// ============================================================================

TEST(TurbulenceNoise2DTest, PerlinFoldsAbsolute) {
    auto base = std::make_shared<PerlinNoise2D>(NoiseConfig{42});
    auto turb = base->turbulence({1});

    for (double x = -5.0; x < 5.0; x += 0.41) {
        EXPECT_EQ(turb->sample(x, 2.3), std::abs(base->sample(x, 2.3)));
    }
}

TEST(TurbulenceNoise2DTest, PerlinRangeIsUnit) {
    auto turb = std::make_shared<PerlinNoise2D>(NoiseConfig{5})->turbulence({5});
    for (int i = 0; i < 500; ++i) {
        double v = turb->sample(i * 0.29, i * 0.71);
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 1.0);
    }
}

TEST(TurbulenceNoise2DTest, ValueFoldsAroundCenter) {
    auto base = std::make_shared<ValueNoise2D>(NoiseConfig{42});
    auto turb = base->turbulence({1});

    for (double x = -5.0; x < 5.0; x += 0.41) {
        EXPECT_EQ(turb->sample(x, 2.3), std::abs(base->sample(x, 2.3) - 0.5) * 2.0);
    }
}

TEST(TurbulenceNoise2DTest, WorleyMatchesFBM) {
    WorleyConfig config;
    config.seed = 42;
    auto base = std::make_shared<WorleyNoise2D>(config);
    auto turb = base->turbulence({4, 2.0, 0.5});
    auto fbm = base->fbm({4, 2.0, 0.5});

    for (double x = -5.0; x < 5.0; x += 0.41) {
        EXPECT_EQ(turb->sample(x, -1.9), fbm->sample(x, -1.9));
    }
}

TEST(TurbulenceNoise2DTest, WrappersInheritMode) {
    auto value = std::make_shared<ValueNoise2D>(NoiseConfig{42});
    auto layered = value->fbm({1});
    EXPECT_EQ(layered->turbulenceMode(), TurbulenceMode::Centered);

    // A single-octave FBM is the base itself, so turbulence must fold it the same way
    auto turb = layered->turbulence({1});
    EXPECT_EQ(turb->sample(0.3, 0.9), std::abs(value->sample(0.3, 0.9) - 0.5) * 2.0);

    auto worley = std::make_shared<WorleyNoise2D>();
    EXPECT_EQ(worley->fbm()->turbulenceMode(), TurbulenceMode::Direct);
    EXPECT_EQ(std::make_shared<SimplexNoise2D>()->turbulence()->turbulenceMode(),
              TurbulenceMode::Absolute);
}

TEST(TurbulenceNoise3DTest, PerlinFoldsAbsolute) {
    auto base = std::make_shared<PerlinNoise3D>(NoiseConfig{42});
    auto turb = base->turbulence({1});
    EXPECT_EQ(turb->sample(0.4, 1.6, -2.2), std::abs(base->sample(0.4, 1.6, -2.2)));
}

TEST(TurbulenceNoise3DTest, WorleyMatchesFBM) {
    auto base = std::make_shared<WorleyNoise3D>();
    EXPECT_EQ(base->turbulence({3})->sample(1.2, 3.4, 5.6),
              base->fbm({3})->sample(1.2, 3.4, 5.6));
}

// ============================================================================
// Composition tests
// ============================================================================

TEST(NoiseCompositionTest, DeepNesting) {
    auto noise = std::make_shared<SimplexNoise2D>(NoiseConfig{42})
                     ->fbm({4})
                     ->turbulence({2})
                     ->fbm({3});

    double v1 = noise->sample(10.0, 20.0);
    double v2 = noise->sample(10.0, 20.0);
    EXPECT_EQ(v1, v2);
    EXPECT_TRUE(std::isfinite(v1));
}

TEST(NoiseCompositionTest, WrapperOutlivesCallerHandle) {
    Noise2DPtr layered;
    double expected = 0.0;
    {
        auto base = std::make_shared<PerlinNoise2D>(NoiseConfig{42});
        layered = base->fbm({1});
        expected = base->sample(0.25, 0.75);
    }
    EXPECT_EQ(layered->sample(0.25, 0.75), expected);
}

TEST(NoiseCompositionTest, PolymorphicInterface) {
    std::vector<Noise2DPtr> sources = {
        std::make_shared<PerlinNoise2D>(NoiseConfig{1}),
        std::make_shared<SimplexNoise2D>(NoiseConfig{2}),
        std::make_shared<ValueNoise2D>(NoiseConfig{3}),
        std::make_shared<WorleyNoise2D>(),
    };

    for (const auto& source : sources) {
        EXPECT_TRUE(std::isfinite(source->fbm()->sample(1.5, 2.5)));
    }
}

// ============================================================================
// Remap tests
// ============================================================================

TEST(NoiseRemapTest, Normalize) {
    EXPECT_EQ(normalize(-1.0), 0.0);
    EXPECT_EQ(normalize(0.0), 0.5);
    EXPECT_EQ(normalize(1.0), 1.0);
}

TEST(NoiseRemapTest, Ridge) {
    EXPECT_EQ(ridge(0.0), 1.0);
    EXPECT_EQ(ridge(1.0), 0.0);
    EXPECT_EQ(ridge(-1.0), 0.0);
    EXPECT_EQ(ridge(-0.25), 0.75);
}

TEST(NoiseRemapTest, Billow) {
    EXPECT_EQ(billow(-0.3), 0.3);
    EXPECT_EQ(billow(0.3), 0.3);
    EXPECT_EQ(billow(0.0), 0.0);
}
