/**
 * @file noise_perlin.cpp
 * @brief Perlin gradient noise implementation (2D and 3D)
 *
 * Based on Ken Perlin's improved noise (2002): quintic fade curve and
 * permutation-hashed gradients. The permutation table is shuffled from the
 * seed for determinism.
 */

#include "finenoise/noise.hpp"

#include <cmath>

namespace finenoise {

// ============================================================================
// Perlin helper functions
// ============================================================================

namespace {

/// Improved Perlin fade curve: 6t^5 - 15t^4 + 10t^3
inline double fade(double t) {
    return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
}

/// Linear interpolation
inline double lerp(double a, double b, double t) {
    return a + t * (b - a);
}

// 2D gradients: 4 diagonals + 4 axes
constexpr double GRAD2[8][2] = {
    { 1.0,  1.0}, {-1.0,  1.0}, { 1.0, -1.0}, {-1.0, -1.0},
    { 1.0,  0.0}, {-1.0,  0.0}, { 0.0,  1.0}, { 0.0, -1.0},
};

// 3D gradients: the 12 cube edge midpoints
constexpr double GRAD3[12][3] = {
    { 1.0,  1.0,  0.0}, {-1.0,  1.0,  0.0}, { 1.0, -1.0,  0.0}, {-1.0, -1.0,  0.0},
    { 1.0,  0.0,  1.0}, {-1.0,  0.0,  1.0}, { 1.0,  0.0, -1.0}, {-1.0,  0.0, -1.0},
    { 0.0,  1.0,  1.0}, { 0.0, -1.0,  1.0}, { 0.0,  1.0, -1.0}, { 0.0, -1.0, -1.0},
};

}  // namespace

// ============================================================================
// PerlinNoise2D
// ============================================================================

PerlinNoise2D::PerlinNoise2D(const NoiseConfig& config)
    : config_(config), perm_(buildPermutation(config.seed)) {
}

double PerlinNoise2D::grad(int hash, double x, double y) {
    const double* g = GRAD2[hash & 7];
    return g[0] * x + g[1] * y;
}

double PerlinNoise2D::sample(double x, double y) const {
    x *= config_.frequency;
    y *= config_.frequency;

    // Find unit grid cell
    double fx = std::floor(x);
    double fy = std::floor(y);

    // Relative position within cell
    double xf = x - fx;
    double yf = y - fy;

    // Wrap to 0..255
    int xi = latticeIndex(fx);
    int yi = latticeIndex(fy);

    double u = fade(xf);
    double v = fade(yf);

    // Hash corners
    int aa = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi)] + yi)];
    int ab = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi)] + yi + 1)];
    int ba = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi + 1)] + yi)];
    int bb = perm_[static_cast<size_t>(perm_[static_cast<size_t>(xi + 1)] + yi + 1)];

    // Gradient dot products and interpolation
    double x1 = lerp(grad(aa, xf, yf), grad(ba, xf - 1.0, yf), u);
    double x2 = lerp(grad(ab, xf, yf - 1.0), grad(bb, xf - 1.0, yf - 1.0), u);

    return lerp(x1, x2, v);
}

// ============================================================================
// PerlinNoise3D
// ============================================================================

PerlinNoise3D::PerlinNoise3D(const NoiseConfig& config)
    : config_(config), perm_(buildPermutation(config.seed)) {
}

double PerlinNoise3D::grad(int hash, double x, double y, double z) {
    const double* g = GRAD3[hash % 12];
    return g[0] * x + g[1] * y + g[2] * z;
}

double PerlinNoise3D::sample(double x, double y, double z) const {
    x *= config_.frequency;
    y *= config_.frequency;
    z *= config_.frequency;

    double fx = std::floor(x);
    double fy = std::floor(y);
    double fz = std::floor(z);

    double xf = x - fx;
    double yf = y - fy;
    double zf = z - fz;

    int xi = latticeIndex(fx);
    int yi = latticeIndex(fy);
    int zi = latticeIndex(fz);

    double u = fade(xf);
    double v = fade(yf);
    double w = fade(zf);

    // Hash corners
    int a  = perm_[static_cast<size_t>(xi)] + yi;
    int aa = perm_[static_cast<size_t>(a)] + zi;
    int ab = perm_[static_cast<size_t>(a + 1)] + zi;
    int b  = perm_[static_cast<size_t>(xi + 1)] + yi;
    int ba = perm_[static_cast<size_t>(b)] + zi;
    int bb = perm_[static_cast<size_t>(b + 1)] + zi;

    // Gradient dot products and trilinear interpolation
    double x1 = lerp(
        grad(perm_[static_cast<size_t>(aa)], xf, yf, zf),
        grad(perm_[static_cast<size_t>(ba)], xf - 1.0, yf, zf), u);
    double x2 = lerp(
        grad(perm_[static_cast<size_t>(ab)], xf, yf - 1.0, zf),
        grad(perm_[static_cast<size_t>(bb)], xf - 1.0, yf - 1.0, zf), u);
    double y1 = lerp(x1, x2, v);

    double x3 = lerp(
        grad(perm_[static_cast<size_t>(aa + 1)], xf, yf, zf - 1.0),
        grad(perm_[static_cast<size_t>(ba + 1)], xf - 1.0, yf, zf - 1.0), u);
    double x4 = lerp(
        grad(perm_[static_cast<size_t>(ab + 1)], xf, yf - 1.0, zf - 1.0),
        grad(perm_[static_cast<size_t>(bb + 1)], xf - 1.0, yf - 1.0, zf - 1.0), u);
    double y2 = lerp(x3, x4, v);

    return lerp(y1, y2, w);
}

}  // namespace finenoise
