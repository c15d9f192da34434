/**
 * @file noise_value.cpp
 * @brief Value noise implementation (2D and 3D)
 *
 * Interpolates random lattice values rather than gradients. Cheaper than
 * gradient noise but with more visible grid structure. Output is in [0, 1]
 * since it is a convex blend of table entries.
 */

#include "finenoise/noise.hpp"

#include <cmath>

namespace finenoise {

namespace {

/// Cubic smoothstep: 3t^2 - 2t^3
inline double smoothstep(double t) {
    return t * t * (3.0 - 2.0 * t);
}

inline double lerp(double a, double b, double t) {
    return a + t * (b - a);
}

}  // namespace

// ============================================================================
// ValueNoise2D
// ============================================================================

ValueNoise2D::ValueNoise2D(const NoiseConfig& config)
    : config_(config),
      perm_(buildPermutation(config.seed)),
      values_(buildValueTable(config.seed + kValueTableSeedOffset)) {
}

double ValueNoise2D::sample(double x, double y) const {
    x *= config_.frequency;
    y *= config_.frequency;

    double fx = std::floor(x);
    double fy = std::floor(y);

    int xi = latticeIndex(fx);
    int yi = latticeIndex(fy);

    double u = smoothstep(x - fx);
    double v = smoothstep(y - fy);

    auto corner = [&](int dx, int dy) {
        int h = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi + dx)] + yi + dy)];
        return values_[static_cast<size_t>(h)];
    };

    double x1 = lerp(corner(0, 0), corner(1, 0), u);
    double x2 = lerp(corner(0, 1), corner(1, 1), u);

    return lerp(x1, x2, v);
}

// ============================================================================
// ValueNoise3D
// ============================================================================

ValueNoise3D::ValueNoise3D(const NoiseConfig& config)
    : config_(config),
      perm_(buildPermutation(config.seed)),
      values_(buildValueTable(config.seed + kValueTableSeedOffset)) {
}

double ValueNoise3D::sample(double x, double y, double z) const {
    x *= config_.frequency;
    y *= config_.frequency;
    z *= config_.frequency;

    double fx = std::floor(x);
    double fy = std::floor(y);
    double fz = std::floor(z);

    int xi = latticeIndex(fx);
    int yi = latticeIndex(fy);
    int zi = latticeIndex(fz);

    double u = smoothstep(x - fx);
    double v = smoothstep(y - fy);
    double w = smoothstep(z - fz);

    auto corner = [&](int dx, int dy, int dz) {
        int a = perm_[static_cast<size_t>(xi + dx)] + yi + dy;
        int h = perm_[static_cast<size_t>(perm_[static_cast<size_t>(a)] + zi + dz)];
        return values_[static_cast<size_t>(h)];
    };

    double x00 = lerp(corner(0, 0, 0), corner(1, 0, 0), u);
    double x01 = lerp(corner(0, 0, 1), corner(1, 0, 1), u);
    double x10 = lerp(corner(0, 1, 0), corner(1, 1, 0), u);
    double x11 = lerp(corner(0, 1, 1), corner(1, 1, 1), u);

    double y0 = lerp(x00, x10, v);
    double y1 = lerp(x01, x11, v);

    return lerp(y0, y1, w);
}

}  // namespace finenoise
