/**
 * @file noise_worley.hpp
 * @brief Worley (cellular) noise: distance to scattered feature points
 *
 * Each unit cell of the (frequency-scaled) lattice holds one feature point
 * placed by a scrambler seeded from the cell hash. Sampling searches the
 * 3x3 (2D) or 3x3x3 (3D) cell neighbourhood and reports the nearest (F1)
 * and second-nearest (F2) distances.
 *
 * Output is >= 0. F1 is typically in [0, 1] but may exceed 1 near cell
 * corners.
 */

#pragma once

#include "finenoise/noise.hpp"

#include <cstdint>
#include <glm/glm.hpp>

namespace finenoise {

// ============================================================================
// Seed utilities
// ============================================================================

/// Deterministic hash of integer cell coordinates with a seed
class NoiseHash {
public:
    /// Hash a 2D integer position with a seed
    [[nodiscard]] static uint32_t hash2D(int32_t x, int32_t y, uint32_t seed);

    /// Hash a 3D integer position with a seed
    [[nodiscard]] static uint32_t hash3D(int32_t x, int32_t y, int32_t z, uint32_t seed);
};

// ============================================================================
// Configuration
// ============================================================================

/// Distance metric between the sample point and feature points
enum class DistanceMetric {
    Euclidean,  ///< sqrt(sum d^2)
    Manhattan,  ///< sum |d|
    Chebyshev,  ///< max |d|
};

/// Which distance a Worley source reports
enum class CellularReturn {
    F1,         ///< Nearest feature point
    F2,         ///< Second-nearest feature point
    F2MinusF1,  ///< Cell-edge pattern (small at borders)
};

struct WorleyConfig : NoiseConfig {
    DistanceMetric distance = DistanceMetric::Euclidean;
    CellularReturn returnType = CellularReturn::F1;
};

/// Full result of a 2D cellular evaluation
struct WorleyResult2D {
    double f1 = 0.0;               ///< Distance to nearest feature point
    double f2 = 0.0;               ///< Distance to second-nearest feature point
    glm::dvec2 featurePoint{0.0};  ///< Nearest feature point (scaled space)
    uint32_t cellId = 0;           ///< Hash of the nearest point's cell
};

/// Full result of a 3D cellular evaluation
struct WorleyResult3D {
    double f1 = 0.0;
    double f2 = 0.0;
    glm::dvec3 featurePoint{0.0};
    uint32_t cellId = 0;
};

// ============================================================================
// Worley noise
// ============================================================================

/// Worley cellular noise (2D)
class WorleyNoise2D : public Noise2D {
public:
    explicit WorleyNoise2D(const WorleyConfig& config = {});

    /// F1, F2 or F2-F1 according to the configured return type
    [[nodiscard]] double sample(double x, double y) const override;

    /// Cellular output is already non-negative; turbulence uses it as-is
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return TurbulenceMode::Direct; }

    /// Full evaluation: both distances, nearest feature point and cell ID
    [[nodiscard]] WorleyResult2D evaluateCell(double x, double y) const;

    [[nodiscard]] const WorleyConfig& config() const { return config_; }

private:
    WorleyConfig config_;

    /// Jittered feature point for the grid cell whose corner is `cell`
    [[nodiscard]] glm::dvec2 cellPoint(const glm::dvec2& cell) const;
};

/// Worley cellular noise (3D)
class WorleyNoise3D : public Noise3D {
public:
    explicit WorleyNoise3D(const WorleyConfig& config = {});

    [[nodiscard]] double sample(double x, double y, double z) const override;
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return TurbulenceMode::Direct; }

    [[nodiscard]] WorleyResult3D evaluateCell(double x, double y, double z) const;

    [[nodiscard]] const WorleyConfig& config() const { return config_; }

private:
    WorleyConfig config_;

    [[nodiscard]] glm::dvec3 cellPoint(const glm::dvec3& cell) const;
};

}  // namespace finenoise
