/**
 * @file noise_descriptor.hpp
 * @brief Configuration-driven description of a composed noise source
 *
 * Descriptor file format (see ConfigParser for the line syntax):
 *
 *   type: simplex          # required: perlin, simplex, value, worley
 *   seed: 42
 *   frequency: 0.05
 *   distance: manhattan    # Worley only: euclidean, manhattan, chebyshev
 *   return: f2-f1          # Worley only: f1, f2, f2-f1
 *   fbm: 6 2.0 0.5         # octaves lacunarity persistence
 *   turbulence: 3
 *
 * fbm and turbulence lines may repeat and are applied in file order.
 * Omitted trailing numbers take the FBMConfig defaults.
 */

#pragma once

#include "finenoise/config_parser.hpp"
#include "finenoise/noise_factory.hpp"

#include <optional>
#include <string>
#include <vector>

namespace finenoise {

enum class LayerKind {
    Fbm,
    Turbulence,
};

/// One composition step applied on top of the base source
struct NoiseLayer {
    LayerKind kind = LayerKind::Fbm;
    FBMConfig config;
};

struct NoiseDescriptor {
    NoiseType type = NoiseType::Perlin;
    WorleyConfig config;
    std::vector<NoiseLayer> layers;

    /// @throws std::invalid_argument if `type` is missing or unknown
    [[nodiscard]] static NoiseDescriptor fromConfig(const ConfigDocument& doc);

    /// Base source with every layer applied in order
    [[nodiscard]] Noise2DPtr build2D() const;
    [[nodiscard]] Noise3DPtr build3D() const;
};

/// Parse a descriptor file; nullopt if the file cannot be read
[[nodiscard]] std::optional<NoiseDescriptor> loadNoiseDescriptor(const std::string& path);

}  // namespace finenoise
