/**
 * @file noise_factory.hpp
 * @brief Create noise sources by type tag or by name
 *
 * Prefer the NoiseType overloads in code; the string overloads are for
 * configuration-driven call sites where the type is only known at runtime.
 */

#pragma once

#include "finenoise/noise.hpp"
#include "finenoise/noise_worley.hpp"

#include <optional>
#include <string_view>

namespace finenoise {

enum class NoiseType {
    Perlin,
    Simplex,
    Value,
    Worley,
};

/// "perlin", "simplex", "value", "worley"; nullopt for anything else
[[nodiscard]] std::optional<NoiseType> parseNoiseType(std::string_view name);
[[nodiscard]] std::string_view noiseTypeName(NoiseType type);

/// "euclidean", "manhattan", "chebyshev"
[[nodiscard]] std::optional<DistanceMetric> parseDistanceMetric(std::string_view name);
[[nodiscard]] std::string_view distanceMetricName(DistanceMetric metric);

/// "f1", "f2", "f2-f1"
[[nodiscard]] std::optional<CellularReturn> parseCellularReturn(std::string_view name);
[[nodiscard]] std::string_view cellularReturnName(CellularReturn returnType);

namespace NoiseFactory {

/**
 * Seed and frequency apply to every type; distance and return type only to
 * Worley. A braced seed/frequency pair fills the NoiseConfig part:
 * `create2D(NoiseType::Perlin, {42u, 0.05})`.
 */
[[nodiscard]] Noise2DPtr create2D(NoiseType type, const WorleyConfig& config = {});
[[nodiscard]] Noise3DPtr create3D(NoiseType type, const WorleyConfig& config = {});

/// @throws std::invalid_argument for an unknown type name
[[nodiscard]] Noise2DPtr create2D(std::string_view type, const WorleyConfig& config = {});
[[nodiscard]] Noise3DPtr create3D(std::string_view type, const WorleyConfig& config = {});

}  // namespace NoiseFactory

}  // namespace finenoise
