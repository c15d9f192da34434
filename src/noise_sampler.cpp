/**
 * @file noise_sampler.cpp
 * @brief Row-major batch sampling
 */

#include "finenoise/noise_sampler.hpp"

namespace finenoise {

void fill2D(std::span<float> output, int width, int height,
            const Noise2D& source, const SampleOptions& options) {
    float* out = output.data();
    for (int y = 0; y < height; ++y) {
        const double ny = (y + options.offsetY) * options.scaleY;
        for (int x = 0; x < width; ++x) {
            const double nx = (x + options.offsetX) * options.scaleX;
            *out++ = static_cast<float>(source.sample(nx, ny));
        }
    }
}

void fill3D(std::span<float> output, int width, int height,
            const Noise3D& source, double z, const SampleOptions& options) {
    float* out = output.data();
    for (int y = 0; y < height; ++y) {
        const double ny = (y + options.offsetY) * options.scaleY;
        for (int x = 0; x < width; ++x) {
            const double nx = (x + options.offsetX) * options.scaleX;
            *out++ = static_cast<float>(source.sample(nx, ny, z));
        }
    }
}

}  // namespace finenoise
