/**
 * @file noise_simplex.cpp
 * @brief Simplex noise implementation (2D and 3D)
 *
 * Skewed-simplex gradient noise after Ken Perlin and Stefan Gustavson.
 * The input is skewed onto a triangular (2D) or tetrahedral (3D) lattice;
 * each simplex corner contributes an attenuated gradient dot product.
 */

#include "finenoise/noise.hpp"

#include <cmath>

namespace finenoise {

// ============================================================================
// Simplex constants and gradients
// ============================================================================

namespace {

// Skew constant for 2D: (sqrt(3) - 1) / 2
const double F2 = 0.5 * (std::sqrt(3.0) - 1.0);
// Unskew constant for 2D: (3 - sqrt(3)) / 6
const double G2 = (3.0 - std::sqrt(3.0)) / 6.0;

// Skew/unskew for 3D
constexpr double F3 = 1.0 / 3.0;
constexpr double G3 = 1.0 / 6.0;

// Squared contribution radius per corner
constexpr double RSQUARED_2D = 0.5;
constexpr double RSQUARED_3D = 0.6;

// Output scale to approximately [-1, 1]
constexpr double SCALE_2D = 70.0;
constexpr double SCALE_3D = 32.0;

// 2D gradients (12 entries so the same mod-12 hash serves 2D and 3D)
constexpr double GRAD2[12][2] = {
    { 1.0,  1.0}, {-1.0,  1.0}, { 1.0, -1.0}, {-1.0, -1.0},
    { 1.0,  0.0}, {-1.0,  0.0}, { 0.0,  1.0}, { 0.0, -1.0},
    { 1.0,  1.0}, {-1.0,  1.0}, { 1.0, -1.0}, {-1.0, -1.0},
};

constexpr double GRAD3[12][3] = {
    { 1.0,  1.0,  0.0}, {-1.0,  1.0,  0.0}, { 1.0, -1.0,  0.0}, {-1.0, -1.0,  0.0},
    { 1.0,  0.0,  1.0}, {-1.0,  0.0,  1.0}, { 1.0,  0.0, -1.0}, {-1.0,  0.0, -1.0},
    { 0.0,  1.0,  1.0}, { 0.0, -1.0,  1.0}, { 0.0,  1.0, -1.0}, { 0.0, -1.0, -1.0},
};

/// Attenuated corner contribution; zero outside the radius
inline double corner2D(int gi, double dx, double dy) {
    double t = RSQUARED_2D - dx * dx - dy * dy;
    if (t < 0.0) {
        return 0.0;
    }
    t *= t;
    return t * t * (GRAD2[gi][0] * dx + GRAD2[gi][1] * dy);
}

inline double corner3D(int gi, double dx, double dy, double dz) {
    double t = RSQUARED_3D - dx * dx - dy * dy - dz * dz;
    if (t < 0.0) {
        return 0.0;
    }
    t *= t;
    return t * t * (GRAD3[gi][0] * dx + GRAD3[gi][1] * dy + GRAD3[gi][2] * dz);
}

}  // namespace

// ============================================================================
// SimplexNoise2D
// ============================================================================

SimplexNoise2D::SimplexNoise2D(const NoiseConfig& config)
    : config_(config), perm_(buildPermutation(config.seed)) {
}

double SimplexNoise2D::sample(double x, double y) const {
    x *= config_.frequency;
    y *= config_.frequency;

    // Skew input to find the containing simplex cell
    double s = (x + y) * F2;
    double i = std::floor(x + s);
    double j = std::floor(y + s);

    // Unskew the cell origin back to input space
    double t = (i + j) * G2;
    double x0 = x - (i - t);
    double y0 = y - (j - t);

    // Lower or upper triangle
    int i1 = 0;
    int j1 = 1;
    if (x0 > y0) {
        i1 = 1;
        j1 = 0;
    }

    double x1 = x0 - i1 + G2;
    double y1 = y0 - j1 + G2;
    double x2 = x0 - 1.0 + 2.0 * G2;
    double y2 = y0 - 1.0 + 2.0 * G2;

    int ii = latticeIndex(i);
    int jj = latticeIndex(j);

    auto hash = [&](int di, int dj) {
        return perm_[static_cast<size_t>(
            ii + di + perm_[static_cast<size_t>(jj + dj)])] % 12;
    };

    double n0 = corner2D(hash(0, 0), x0, y0);
    double n1 = corner2D(hash(i1, j1), x1, y1);
    double n2 = corner2D(hash(1, 1), x2, y2);

    return SCALE_2D * (n0 + n1 + n2);
}

// ============================================================================
// SimplexNoise3D
// ============================================================================

SimplexNoise3D::SimplexNoise3D(const NoiseConfig& config)
    : config_(config), perm_(buildPermutation(config.seed)) {
}

double SimplexNoise3D::sample(double x, double y, double z) const {
    x *= config_.frequency;
    y *= config_.frequency;
    z *= config_.frequency;

    double s = (x + y + z) * F3;
    double i = std::floor(x + s);
    double j = std::floor(y + s);
    double k = std::floor(z + s);

    double t = (i + j + k) * G3;
    double x0 = x - (i - t);
    double y0 = y - (j - t);
    double z0 = z - (k - t);

    // Pick one of the six tetrahedra from the coordinate ordering
    int i1, j1, k1;  // second corner
    int i2, j2, k2;  // third corner
    if (x0 >= y0) {
        if (y0 >= z0) {
            i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 1; k2 = 0;
        } else if (x0 >= z0) {
            i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 0; k2 = 1;
        } else {
            i1 = 0; j1 = 0; k1 = 1; i2 = 1; j2 = 0; k2 = 1;
        }
    } else {
        if (y0 < z0) {
            i1 = 0; j1 = 0; k1 = 1; i2 = 0; j2 = 1; k2 = 1;
        } else if (x0 < z0) {
            i1 = 0; j1 = 1; k1 = 0; i2 = 0; j2 = 1; k2 = 1;
        } else {
            i1 = 0; j1 = 1; k1 = 0; i2 = 1; j2 = 1; k2 = 0;
        }
    }

    double x1 = x0 - i1 + G3;
    double y1 = y0 - j1 + G3;
    double z1 = z0 - k1 + G3;
    double x2 = x0 - i2 + 2.0 * G3;
    double y2 = y0 - j2 + 2.0 * G3;
    double z2 = z0 - k2 + 2.0 * G3;
    double x3 = x0 - 1.0 + 3.0 * G3;
    double y3 = y0 - 1.0 + 3.0 * G3;
    double z3 = z0 - 1.0 + 3.0 * G3;

    int ii = latticeIndex(i);
    int jj = latticeIndex(j);
    int kk = latticeIndex(k);

    auto hash = [&](int di, int dj, int dk) {
        int inner = perm_[static_cast<size_t>(kk + dk)];
        int middle = perm_[static_cast<size_t>(jj + dj + inner)];
        return perm_[static_cast<size_t>(ii + di + middle)] % 12;
    };

    double n0 = corner3D(hash(0, 0, 0), x0, y0, z0);
    double n1 = corner3D(hash(i1, j1, k1), x1, y1, z1);
    double n2 = corner3D(hash(i2, j2, k2), x2, y2, z2);
    double n3 = corner3D(hash(1, 1, 1), x3, y3, z3);

    return SCALE_3D * (n0 + n1 + n2 + n3);
}

}  // namespace finenoise
