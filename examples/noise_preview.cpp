/**
 * @file noise_preview.cpp
 * @brief Render a noise descriptor to a grayscale PGM image
 *
 * Usage:
 *   finenoise_preview <descriptor.conf> <output.pgm> [size] [z]
 *
 * Samples a size x size grid (default 256) one unit per pixel, stretches
 * the result to the full 0..255 range and writes a binary (P5) PGM.
 * When z is given, a 3D slice at that depth is rendered instead.
 */

#include <finenoise/noise_descriptor.hpp>
#include <finenoise/noise_sampler.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace finenoise;

namespace {

bool writePGM(const std::string& path, const std::vector<float>& values, int size) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        return false;
    }

    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    float lo = *minIt;
    float range = *maxIt - lo;

    out << "P5\n" << size << " " << size << "\n255\n";
    for (float v : values) {
        float t = range > 0.0f ? (v - lo) / range : 0.5f;
        out.put(static_cast<char>(static_cast<uint8_t>(t * 255.0f + 0.5f)));
    }
    return out.good();
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <descriptor.conf> <output.pgm> [size] [z]\n";
        return 1;
    }

    std::string descriptorPath = argv[1];
    std::string outputPath = argv[2];
    int size = argc > 3 ? std::atoi(argv[3]) : 256;
    if (size <= 0) {
        std::cerr << "[Preview] Invalid size: " << argv[3] << "\n";
        return 1;
    }

    try {
        auto desc = loadNoiseDescriptor(descriptorPath);
        if (!desc) {
            std::cerr << "[Preview] Cannot read descriptor: " << descriptorPath << "\n";
            return 1;
        }

        std::cout << "[Preview] " << noiseTypeName(desc->type)
                  << " seed=" << desc->config.seed
                  << " frequency=" << desc->config.frequency
                  << " layers=" << desc->layers.size() << "\n";

        std::vector<float> buffer(static_cast<size_t>(size) * static_cast<size_t>(size));
        if (argc > 4) {
            double z = std::atof(argv[4]);
            fill3D(buffer, size, size, *desc->build3D(), z);
        } else {
            fill2D(buffer, size, size, *desc->build2D());
        }

        if (!writePGM(outputPath, buffer, size)) {
            std::cerr << "[Preview] Failed to write " << outputPath << "\n";
            return 1;
        }
        std::cout << "[Preview] Wrote " << size << "x" << size << " image to " << outputPath << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[Preview] ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
