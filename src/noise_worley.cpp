/**
 * @file noise_worley.cpp
 * @brief Worley (cellular) noise implementation (2D and 3D)
 *
 * Each grid cell owns one feature point whose offset is drawn from a
 * Scrambler seeded with the cell hash. Euclidean distances are compared
 * squared and only the two survivors are square-rooted.
 */

#include "finenoise/noise_worley.hpp"
#include "finenoise/scrambler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace finenoise {

// ============================================================================
// NoiseHash
// ============================================================================

uint32_t NoiseHash::hash2D(int32_t x, int32_t y, uint32_t seed) {
    uint32_t n = static_cast<uint32_t>(x) * 374761393u +
                 static_cast<uint32_t>(y) * 668265263u +
                 seed * 1013904223u;
    n = (n ^ (n >> 13)) * 1274126177u;
    return n ^ (n >> 16);
}

uint32_t NoiseHash::hash3D(int32_t x, int32_t y, int32_t z, uint32_t seed) {
    uint32_t n = static_cast<uint32_t>(x) * 374761393u +
                 static_cast<uint32_t>(y) * 668265263u +
                 static_cast<uint32_t>(z) * 1013904223u +
                 seed * 1376312589u;
    n = (n ^ (n >> 13)) * 1274126177u;
    return n ^ (n >> 16);
}

// ============================================================================
// Distance helpers
// ============================================================================

namespace {

/// Metric value used for ranking; Euclidean stays squared until finish()
double rankDistance(DistanceMetric metric, const glm::dvec2& d) {
    switch (metric) {
        case DistanceMetric::Euclidean: return d.x * d.x + d.y * d.y;
        case DistanceMetric::Manhattan: return std::abs(d.x) + std::abs(d.y);
        case DistanceMetric::Chebyshev: return std::max(std::abs(d.x), std::abs(d.y));
    }
    return d.x * d.x + d.y * d.y;  // unreachable
}

double rankDistance(DistanceMetric metric, const glm::dvec3& d) {
    switch (metric) {
        case DistanceMetric::Euclidean: return d.x * d.x + d.y * d.y + d.z * d.z;
        case DistanceMetric::Manhattan: return std::abs(d.x) + std::abs(d.y) + std::abs(d.z);
        case DistanceMetric::Chebyshev:
            return std::max({std::abs(d.x), std::abs(d.y), std::abs(d.z)});
    }
    return d.x * d.x + d.y * d.y + d.z * d.z;  // unreachable
}

/// Floored cell coordinate reduced modulo 2^32 for hashing; NaN and infinities give 0
int32_t wrapCell(double cell) {
    if (!std::isfinite(cell)) {
        return 0;
    }
    constexpr double kWrap = 4294967296.0;
    double wrapped = std::fmod(cell, kWrap);
    if (wrapped < 0.0) {
        wrapped += kWrap;
    }
    return static_cast<int32_t>(static_cast<uint32_t>(wrapped));
}

double finish(DistanceMetric metric, double ranked) {
    return metric == DistanceMetric::Euclidean ? std::sqrt(ranked) : ranked;
}

double selectReturn(CellularReturn returnType, double f1, double f2) {
    switch (returnType) {
        case CellularReturn::F1:        return f1;
        case CellularReturn::F2:        return f2;
        case CellularReturn::F2MinusF1: return f2 - f1;
    }
    return f1;  // unreachable
}

}  // namespace

// ============================================================================
// WorleyNoise2D
// ============================================================================

WorleyNoise2D::WorleyNoise2D(const WorleyConfig& config)
    : config_(config) {
}

glm::dvec2 WorleyNoise2D::cellPoint(const glm::dvec2& cell) const {
    Scrambler rng(NoiseHash::hash2D(wrapCell(cell.x), wrapCell(cell.y), config_.seed));
    double jx = rng.next();
    double jy = rng.next();
    return {cell.x + jx, cell.y + jy};
}

WorleyResult2D WorleyNoise2D::evaluateCell(double x, double y) const {
    x *= config_.frequency;
    y *= config_.frequency;

    const glm::dvec2 base{std::floor(x), std::floor(y)};
    const glm::dvec2 p{x, y};

    double dist1 = std::numeric_limits<double>::infinity();
    double dist2 = std::numeric_limits<double>::infinity();
    glm::dvec2 closestPoint{0.0};
    glm::dvec2 closestCell = base;

    // Check 3x3 neighborhood of grid cells
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            glm::dvec2 cell = base + glm::dvec2(dx, dy);

            glm::dvec2 point = cellPoint(cell);
            double dist = rankDistance(config_.distance, p - point);

            if (dist < dist1) {
                dist2 = dist1;
                dist1 = dist;
                closestPoint = point;
                closestCell = cell;
            } else if (dist < dist2) {
                dist2 = dist;
            }
        }
    }

    WorleyResult2D result;
    result.f1 = finish(config_.distance, dist1);
    result.f2 = finish(config_.distance, dist2);
    result.featurePoint = closestPoint;
    result.cellId = NoiseHash::hash2D(wrapCell(closestCell.x), wrapCell(closestCell.y),
                                      config_.seed);
    return result;
}

double WorleyNoise2D::sample(double x, double y) const {
    auto r = evaluateCell(x, y);
    return selectReturn(config_.returnType, r.f1, r.f2);
}

// ============================================================================
// WorleyNoise3D
// ============================================================================

WorleyNoise3D::WorleyNoise3D(const WorleyConfig& config)
    : config_(config) {
}

glm::dvec3 WorleyNoise3D::cellPoint(const glm::dvec3& cell) const {
    Scrambler rng(NoiseHash::hash3D(wrapCell(cell.x), wrapCell(cell.y), wrapCell(cell.z),
                                    config_.seed));
    double jx = rng.next();
    double jy = rng.next();
    double jz = rng.next();
    return {cell.x + jx, cell.y + jy, cell.z + jz};
}

WorleyResult3D WorleyNoise3D::evaluateCell(double x, double y, double z) const {
    x *= config_.frequency;
    y *= config_.frequency;
    z *= config_.frequency;

    const glm::dvec3 base{std::floor(x), std::floor(y), std::floor(z)};
    const glm::dvec3 p{x, y, z};

    double dist1 = std::numeric_limits<double>::infinity();
    double dist2 = std::numeric_limits<double>::infinity();
    glm::dvec3 closestPoint{0.0};
    glm::dvec3 closestCell = base;

    // Check 3x3x3 neighborhood
    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dz = -1; dz <= 1; ++dz) {
                glm::dvec3 cell = base + glm::dvec3(dx, dy, dz);

                glm::dvec3 point = cellPoint(cell);
                double dist = rankDistance(config_.distance, p - point);

                if (dist < dist1) {
                    dist2 = dist1;
                    dist1 = dist;
                    closestPoint = point;
                    closestCell = cell;
                } else if (dist < dist2) {
                    dist2 = dist;
                }
            }
        }
    }

    WorleyResult3D result;
    result.f1 = finish(config_.distance, dist1);
    result.f2 = finish(config_.distance, dist2);
    result.featurePoint = closestPoint;
    result.cellId = NoiseHash::hash3D(wrapCell(closestCell.x), wrapCell(closestCell.y),
                                      wrapCell(closestCell.z), config_.seed);
    return result;
}

double WorleyNoise3D::sample(double x, double y, double z) const {
    auto r = evaluateCell(x, y, z);
    return selectReturn(config_.returnType, r.f1, r.f2);
}

}  // namespace finenoise
