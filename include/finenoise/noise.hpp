/**
 * @file noise.hpp
 * @brief Deterministic lattice noise: Perlin, simplex and value noise
 *
 * Provides the composable Noise2D/Noise3D interfaces and the three
 * table-driven base algorithms. All noise is deterministic: same seed +
 * coordinates = same output, bit for bit.
 *
 * Sources are immutable after construction and are shared through
 * std::shared_ptr<const ...>. Composition (fbm, turbulence) returns a new
 * source that shares ownership of the receiver:
 *
 *   auto terrain = std::make_shared<PerlinNoise2D>(NoiseConfig{42, 0.01})
 *                      ->fbm({6, 2.0, 0.5});
 *   double h = terrain->sample(x, y);
 */

#pragma once

#include "finenoise/noise_tables.hpp"

#include <cstdint>
#include <memory>

namespace finenoise {

// ============================================================================
// Configuration
// ============================================================================

/// Seed and input-coordinate frequency for a base noise source
struct NoiseConfig {
    uint32_t seed = 0;
    double frequency = 1.0;  ///< Multiplies coordinates before lattice lookup
};

/// Octave stacking parameters for fbm() and turbulence()
struct FBMConfig {
    int octaves = 4;
    double lacunarity = 2.0;   ///< Frequency multiplier per octave
    double persistence = 0.5;  ///< Amplitude multiplier per octave
};

/// How a turbulence octave folds a raw sample into a non-negative signal
enum class TurbulenceMode {
    Absolute,  ///< |s|, for sources centred on zero
    Centered,  ///< |s - 0.5| * 2, for sources with native range [0, 1]
    Direct,    ///< s unchanged, for sources that are already non-negative
};

// ============================================================================
// Base interfaces
// ============================================================================

class Noise2D;
class Noise3D;

using Noise2DPtr = std::shared_ptr<const Noise2D>;
using Noise3DPtr = std::shared_ptr<const Noise3D>;

/// Abstract 2D noise source
///
/// fbm() and turbulence() call shared_from_this(), so the receiver must be
/// owned by a std::shared_ptr (std::bad_weak_ptr is thrown otherwise).
class Noise2D : public std::enable_shared_from_this<Noise2D> {
public:
    virtual ~Noise2D() = default;

    /// Evaluate noise at (x, y)
    [[nodiscard]] virtual double sample(double x, double y) const = 0;

    /// Turbulence convention of this source (inherited by wrappers)
    [[nodiscard]] virtual TurbulenceMode turbulenceMode() const { return TurbulenceMode::Absolute; }

    /// Fractal layering of this source
    [[nodiscard]] Noise2DPtr fbm(const FBMConfig& config = {}) const;

    /// Absolute-valued fractal layering of this source
    [[nodiscard]] Noise2DPtr turbulence(const FBMConfig& config = {}) const;
};

/// Abstract 3D noise source
class Noise3D : public std::enable_shared_from_this<Noise3D> {
public:
    virtual ~Noise3D() = default;

    /// Evaluate noise at (x, y, z)
    [[nodiscard]] virtual double sample(double x, double y, double z) const = 0;

    [[nodiscard]] virtual TurbulenceMode turbulenceMode() const { return TurbulenceMode::Absolute; }

    [[nodiscard]] Noise3DPtr fbm(const FBMConfig& config = {}) const;
    [[nodiscard]] Noise3DPtr turbulence(const FBMConfig& config = {}) const;
};

// ============================================================================
// Perlin noise
// ============================================================================

/// Classic Perlin gradient noise (2D). Output in [-1, 1].
class PerlinNoise2D : public Noise2D {
public:
    explicit PerlinNoise2D(const NoiseConfig& config = {});

    [[nodiscard]] double sample(double x, double y) const override;

    [[nodiscard]] const NoiseConfig& config() const { return config_; }

private:
    NoiseConfig config_;
    PermutationTable perm_;

    [[nodiscard]] static double grad(int hash, double x, double y);
};

/// Classic Perlin gradient noise (3D). Output in [-1, 1].
class PerlinNoise3D : public Noise3D {
public:
    explicit PerlinNoise3D(const NoiseConfig& config = {});

    [[nodiscard]] double sample(double x, double y, double z) const override;

    [[nodiscard]] const NoiseConfig& config() const { return config_; }

private:
    NoiseConfig config_;
    PermutationTable perm_;

    [[nodiscard]] static double grad(int hash, double x, double y, double z);
};

// ============================================================================
// Simplex noise
// ============================================================================

/// Simplex gradient noise (2D, triangular cells). Output approximately [-1, 1].
class SimplexNoise2D : public Noise2D {
public:
    explicit SimplexNoise2D(const NoiseConfig& config = {});

    [[nodiscard]] double sample(double x, double y) const override;

    [[nodiscard]] const NoiseConfig& config() const { return config_; }

private:
    NoiseConfig config_;
    PermutationTable perm_;
};

/// Simplex gradient noise (3D, tetrahedral cells). Output approximately [-1, 1].
class SimplexNoise3D : public Noise3D {
public:
    explicit SimplexNoise3D(const NoiseConfig& config = {});

    [[nodiscard]] double sample(double x, double y, double z) const override;

    [[nodiscard]] const NoiseConfig& config() const { return config_; }

private:
    NoiseConfig config_;
    PermutationTable perm_;
};

// ============================================================================
// Value noise
// ============================================================================

/// Interpolated random lattice values (2D). Output in [0, 1].
class ValueNoise2D : public Noise2D {
public:
    explicit ValueNoise2D(const NoiseConfig& config = {});

    [[nodiscard]] double sample(double x, double y) const override;
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return TurbulenceMode::Centered; }

    [[nodiscard]] const NoiseConfig& config() const { return config_; }

private:
    NoiseConfig config_;
    PermutationTable perm_;
    ValueTable values_;
};

/// Interpolated random lattice values (3D). Output in [0, 1].
class ValueNoise3D : public Noise3D {
public:
    explicit ValueNoise3D(const NoiseConfig& config = {});

    [[nodiscard]] double sample(double x, double y, double z) const override;
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return TurbulenceMode::Centered; }

    [[nodiscard]] const NoiseConfig& config() const { return config_; }

private:
    NoiseConfig config_;
    PermutationTable perm_;
    ValueTable values_;
};

}  // namespace finenoise
