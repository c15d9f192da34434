/**
 * @file noise_ops.hpp
 * @brief Composable noise operations: fractal layering, turbulence, remaps
 *
 * Wrappers share ownership of the source they wrap, so any source (base or
 * already composed) can be layered again without copying. Example:
 *
 *   auto base = std::make_shared<SimplexNoise2D>(NoiseConfig{7, 0.05});
 *   auto clouds = std::make_shared<FBMNoise2D>(base, FBMConfig{5, 2.0, 0.6});
 *   auto wisps = clouds->turbulence();
 *
 * Noise2D::fbm() and Noise2D::turbulence() are shorthands for the same thing.
 */

#pragma once

#include "finenoise/noise.hpp"

#include <cmath>

namespace finenoise {

// ============================================================================
// Fractal noise (octave stacking)
// ============================================================================

/// Fractal Brownian Motion: weighted octave sum, normalized by total amplitude
class FBMNoise2D : public Noise2D {
public:
    /// @param base Noise source to layer (shared, must be non-null)
    /// @param config Octaves (> 0), lacunarity and persistence
    /// @throws std::invalid_argument on a null base or non-positive octaves
    FBMNoise2D(Noise2DPtr base, const FBMConfig& config = {});

    [[nodiscard]] double sample(double x, double y) const override;
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return base_->turbulenceMode(); }

    [[nodiscard]] const FBMConfig& config() const { return config_; }

private:
    Noise2DPtr base_;
    FBMConfig config_;
};

/// FBM for 3D noise
class FBMNoise3D : public Noise3D {
public:
    FBMNoise3D(Noise3DPtr base, const FBMConfig& config = {});

    [[nodiscard]] double sample(double x, double y, double z) const override;
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return base_->turbulenceMode(); }

    [[nodiscard]] const FBMConfig& config() const { return config_; }

private:
    Noise3DPtr base_;
    FBMConfig config_;
};

/// Turbulence: like FBM, but each octave is folded to a non-negative signal
/// according to the base's TurbulenceMode
class TurbulenceNoise2D : public Noise2D {
public:
    TurbulenceNoise2D(Noise2DPtr base, const FBMConfig& config = {});

    [[nodiscard]] double sample(double x, double y) const override;
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return base_->turbulenceMode(); }

    [[nodiscard]] const FBMConfig& config() const { return config_; }

private:
    Noise2DPtr base_;
    FBMConfig config_;
};

/// Turbulence for 3D noise
class TurbulenceNoise3D : public Noise3D {
public:
    TurbulenceNoise3D(Noise3DPtr base, const FBMConfig& config = {});

    [[nodiscard]] double sample(double x, double y, double z) const override;
    [[nodiscard]] TurbulenceMode turbulenceMode() const override { return base_->turbulenceMode(); }

    [[nodiscard]] const FBMConfig& config() const { return config_; }

private:
    Noise3DPtr base_;
    FBMConfig config_;
};

// ============================================================================
// Scalar remaps
// ============================================================================

/// [-1, 1] -> [0, 1]
[[nodiscard]] inline double normalize(double value) {
    return value * 0.5 + 0.5;
}

/// Sharp crests where the signal crosses zero
[[nodiscard]] inline double ridge(double value) {
    return 1.0 - std::abs(value);
}

/// Puffy, cloud-like folding
[[nodiscard]] inline double billow(double value) {
    return std::abs(value);
}

}  // namespace finenoise
