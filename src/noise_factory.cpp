/**
 * @file noise_factory.cpp
 * @brief Dispatch-by-type creation of noise sources
 */

#include "finenoise/noise_factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace finenoise {

// ============================================================================
// Name tables
// ============================================================================

std::optional<NoiseType> parseNoiseType(std::string_view name) {
    if (name == "perlin") return NoiseType::Perlin;
    if (name == "simplex") return NoiseType::Simplex;
    if (name == "value") return NoiseType::Value;
    if (name == "worley") return NoiseType::Worley;
    return std::nullopt;
}

std::string_view noiseTypeName(NoiseType type) {
    switch (type) {
        case NoiseType::Perlin:  return "perlin";
        case NoiseType::Simplex: return "simplex";
        case NoiseType::Value:   return "value";
        case NoiseType::Worley:  return "worley";
    }
    return "unknown";
}

std::optional<DistanceMetric> parseDistanceMetric(std::string_view name) {
    if (name == "euclidean") return DistanceMetric::Euclidean;
    if (name == "manhattan") return DistanceMetric::Manhattan;
    if (name == "chebyshev") return DistanceMetric::Chebyshev;
    return std::nullopt;
}

std::string_view distanceMetricName(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::Euclidean: return "euclidean";
        case DistanceMetric::Manhattan: return "manhattan";
        case DistanceMetric::Chebyshev: return "chebyshev";
    }
    return "unknown";
}

std::optional<CellularReturn> parseCellularReturn(std::string_view name) {
    if (name == "f1") return CellularReturn::F1;
    if (name == "f2") return CellularReturn::F2;
    if (name == "f2-f1") return CellularReturn::F2MinusF1;
    return std::nullopt;
}

std::string_view cellularReturnName(CellularReturn returnType) {
    switch (returnType) {
        case CellularReturn::F1:        return "f1";
        case CellularReturn::F2:        return "f2";
        case CellularReturn::F2MinusF1: return "f2-f1";
    }
    return "unknown";
}

// ============================================================================
// NoiseFactory
// ============================================================================

namespace NoiseFactory {

namespace {

NoiseType requireType(std::string_view name) {
    auto type = parseNoiseType(name);
    if (!type) {
        throw std::invalid_argument("Unknown noise type: " + std::string(name));
    }
    return *type;
}

}  // namespace

Noise2DPtr create2D(NoiseType type, const WorleyConfig& config) {
    switch (type) {
        case NoiseType::Perlin:  return std::make_shared<PerlinNoise2D>(config);
        case NoiseType::Simplex: return std::make_shared<SimplexNoise2D>(config);
        case NoiseType::Value:   return std::make_shared<ValueNoise2D>(config);
        case NoiseType::Worley:  return std::make_shared<WorleyNoise2D>(config);
    }
    throw std::invalid_argument("Unknown noise type: " +
                                std::to_string(static_cast<int>(type)));
}

Noise3DPtr create3D(NoiseType type, const WorleyConfig& config) {
    switch (type) {
        case NoiseType::Perlin:  return std::make_shared<PerlinNoise3D>(config);
        case NoiseType::Simplex: return std::make_shared<SimplexNoise3D>(config);
        case NoiseType::Value:   return std::make_shared<ValueNoise3D>(config);
        case NoiseType::Worley:  return std::make_shared<WorleyNoise3D>(config);
    }
    throw std::invalid_argument("Unknown noise type: " +
                                std::to_string(static_cast<int>(type)));
}

Noise2DPtr create2D(std::string_view type, const WorleyConfig& config) {
    return create2D(requireType(type), config);
}

Noise3DPtr create3D(std::string_view type, const WorleyConfig& config) {
    return create3D(requireType(type), config);
}

}  // namespace NoiseFactory

}  // namespace finenoise
