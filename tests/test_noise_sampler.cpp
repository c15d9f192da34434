/**
 * @file test_noise_sampler.cpp
 * @brief Unit tests for batch sampling into flat buffers
 */

#include "finenoise/noise.hpp"
#include "finenoise/noise_sampler.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace finenoise;

namespace {

class ConstantNoise2D : public Noise2D {
public:
    explicit ConstantNoise2D(double value) : value_(value) {}
    double sample(double, double) const override { return value_; }

private:
    double value_;
};

// Encodes its input so buffer layout can be checked
class CoordinateNoise2D : public Noise2D {
public:
    double sample(double x, double y) const override { return x * 100.0 + y; }
};

class CoordinateNoise3D : public Noise3D {
public:
    double sample(double x, double y, double z) const override { return x * 100.0 + y + z * 10000.0; }
};

}  // namespace

TEST(NoiseSamplerTest, ConstantSourceFillsGrid) {
    ConstantNoise2D noise(0.5);
    std::vector<float> buffer(16, -1.0f);

    fill2D(buffer, 4, 4, noise);

    for (float v : buffer) {
        EXPECT_EQ(v, 0.5f);
    }
}

TEST(NoiseSamplerTest, RowMajorLayout) {
    CoordinateNoise2D noise;
    const int width = 5;
    const int height = 3;
    std::vector<float> buffer(width * height);

    fill2D(buffer, width, height, noise);

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            EXPECT_EQ(buffer[static_cast<size_t>(y * width + x)], static_cast<float>(x * 100 + y));
        }
    }
}

TEST(NoiseSamplerTest, OffsetThenScale) {
    CoordinateNoise2D noise;
    SampleOptions options;
    options.scaleX = 0.5;
    options.scaleY = 2.0;
    options.offsetX = 10.0;
    options.offsetY = -1.0;

    std::vector<float> buffer(4 * 2);
    fill2D(buffer, 4, 2, noise, options);

    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 4; ++x) {
            double nx = (x + 10.0) * 0.5;
            double ny = (y - 1.0) * 2.0;
            EXPECT_EQ(buffer[static_cast<size_t>(y * 4 + x)], static_cast<float>(nx * 100.0 + ny));
        }
    }
}

TEST(NoiseSamplerTest, MatchesDirectSampling) {
    PerlinNoise2D noise(NoiseConfig{42, 0.1});
    SampleOptions options;
    options.scaleX = 0.37;
    options.scaleY = 0.37;

    std::vector<float> buffer(16 * 16);
    fill2D(buffer, 16, 16, noise, options);

    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            float expected = static_cast<float>(noise.sample(x * 0.37, y * 0.37));
            EXPECT_EQ(buffer[static_cast<size_t>(y * 16 + x)], expected);
        }
    }
}

TEST(NoiseSamplerTest, WritesOnlyRequestedCells) {
    ConstantNoise2D noise(0.25);
    std::vector<float> buffer(10, 7.0f);

    fill2D(buffer, 3, 2, noise);

    for (size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(buffer[i], 0.25f);
    }
    for (size_t i = 6; i < buffer.size(); ++i) {
        EXPECT_EQ(buffer[i], 7.0f);
    }
}

TEST(NoiseSamplerTest, EmptyGridWritesNothing) {
    ConstantNoise2D noise(0.25);
    std::vector<float> buffer(4, 7.0f);

    fill2D(buffer, 0, 4, noise);
    fill2D(buffer, 4, 0, noise);

    for (float v : buffer) {
        EXPECT_EQ(v, 7.0f);
    }
}

TEST(NoiseSamplerTest, Fill3DUsesFixedSlice) {
    CoordinateNoise3D noise;
    std::vector<float> buffer(3 * 3);

    fill3D(buffer, 3, 3, noise, 2.0);

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            EXPECT_EQ(buffer[static_cast<size_t>(y * 3 + x)],
                      static_cast<float>(x * 100.0 + y + 20000.0));
        }
    }
}

TEST(NoiseSamplerTest, Fill3DMatchesDirectSampling) {
    SimplexNoise3D noise(NoiseConfig{7});
    SampleOptions options;
    options.scaleX = 0.2;
    options.scaleY = 0.3;
    options.offsetX = 5.0;

    std::vector<float> buffer(8 * 8);
    fill3D(buffer, 8, 8, noise, 1.5, options);

    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 8; ++x) {
            float expected = static_cast<float>(noise.sample((x + 5.0) * 0.2, y * 0.3, 1.5));
            EXPECT_EQ(buffer[static_cast<size_t>(y * 8 + x)], expected);
        }
    }
}
