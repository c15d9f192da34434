/**
 * @file noise_sampler.hpp
 * @brief Batch sampling of noise sources into flat row-major buffers
 *
 * The hot path for texture and heightmap generation. The functions write
 * exactly width * height entries and allocate nothing. The caller must
 * size the buffer; its length is not checked.
 */

#pragma once

#include "finenoise/noise.hpp"

#include <span>

namespace finenoise {

/// Maps grid cell (x, y) to noise coordinates ((x + offsetX) * scaleX, ...)
struct SampleOptions {
    double scaleX = 1.0;
    double scaleY = 1.0;
    double offsetX = 0.0;
    double offsetY = 0.0;
};

/// Fill output[y * width + x] with source.sample(nx, ny)
void fill2D(std::span<float> output, int width, int height,
            const Noise2D& source, const SampleOptions& options = {});

/// Fill output[y * width + x] with source.sample(nx, ny, z), a fixed-z slice
void fill3D(std::span<float> output, int width, int height,
            const Noise3D& source, double z, const SampleOptions& options = {});

}  // namespace finenoise
