/**
 * @file noise_ops.cpp
 * @brief Fractal layering and turbulence wrappers
 */

#include "finenoise/noise_ops.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace finenoise {

namespace {

void validate(bool hasBase, const FBMConfig& config) {
    if (!hasBase) {
        throw std::invalid_argument("Noise composition requires a base source");
    }
    if (config.octaves <= 0) {
        throw std::invalid_argument("Noise composition octaves must be positive");
    }
}

/// One turbulence octave signal
inline double fold(TurbulenceMode mode, double s) {
    switch (mode) {
        case TurbulenceMode::Absolute: return std::abs(s);
        case TurbulenceMode::Centered: return std::abs(s - 0.5) * 2.0;
        case TurbulenceMode::Direct:   return s;
    }
    return s;  // unreachable
}

}  // namespace

// ============================================================================
// Composition shorthands
// ============================================================================

Noise2DPtr Noise2D::fbm(const FBMConfig& config) const {
    return std::make_shared<FBMNoise2D>(shared_from_this(), config);
}

Noise2DPtr Noise2D::turbulence(const FBMConfig& config) const {
    return std::make_shared<TurbulenceNoise2D>(shared_from_this(), config);
}

Noise3DPtr Noise3D::fbm(const FBMConfig& config) const {
    return std::make_shared<FBMNoise3D>(shared_from_this(), config);
}

Noise3DPtr Noise3D::turbulence(const FBMConfig& config) const {
    return std::make_shared<TurbulenceNoise3D>(shared_from_this(), config);
}

// ============================================================================
// FBM (Fractal Brownian Motion)
// ============================================================================

FBMNoise2D::FBMNoise2D(Noise2DPtr base, const FBMConfig& config)
    : base_(std::move(base)), config_(config) {
    validate(base_ != nullptr, config_);
}

double FBMNoise2D::sample(double x, double y) const {
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;
    double maxAmplitude = 0.0;

    for (int i = 0; i < config_.octaves; ++i) {
        value += base_->sample(x * frequency, y * frequency) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= config_.persistence;
        frequency *= config_.lacunarity;
    }

    return value / maxAmplitude;
}

FBMNoise3D::FBMNoise3D(Noise3DPtr base, const FBMConfig& config)
    : base_(std::move(base)), config_(config) {
    validate(base_ != nullptr, config_);
}

double FBMNoise3D::sample(double x, double y, double z) const {
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;
    double maxAmplitude = 0.0;

    for (int i = 0; i < config_.octaves; ++i) {
        value += base_->sample(x * frequency, y * frequency, z * frequency) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= config_.persistence;
        frequency *= config_.lacunarity;
    }

    return value / maxAmplitude;
}

// ============================================================================
// Turbulence
// ============================================================================

TurbulenceNoise2D::TurbulenceNoise2D(Noise2DPtr base, const FBMConfig& config)
    : base_(std::move(base)), config_(config) {
    validate(base_ != nullptr, config_);
}

double TurbulenceNoise2D::sample(double x, double y) const {
    const TurbulenceMode mode = base_->turbulenceMode();
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;
    double maxAmplitude = 0.0;

    for (int i = 0; i < config_.octaves; ++i) {
        value += fold(mode, base_->sample(x * frequency, y * frequency)) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= config_.persistence;
        frequency *= config_.lacunarity;
    }

    return value / maxAmplitude;
}

TurbulenceNoise3D::TurbulenceNoise3D(Noise3DPtr base, const FBMConfig& config)
    : base_(std::move(base)), config_(config) {
    validate(base_ != nullptr, config_);
}

double TurbulenceNoise3D::sample(double x, double y, double z) const {
    const TurbulenceMode mode = base_->turbulenceMode();
    double value = 0.0;
    double amplitude = 1.0;
    double frequency = 1.0;
    double maxAmplitude = 0.0;

    for (int i = 0; i < config_.octaves; ++i) {
        value += fold(mode, base_->sample(x * frequency, y * frequency, z * frequency)) * amplitude;
        maxAmplitude += amplitude;
        amplitude *= config_.persistence;
        frequency *= config_.lacunarity;
    }

    return value / maxAmplitude;
}

}  // namespace finenoise
