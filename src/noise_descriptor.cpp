#include "finenoise/noise_descriptor.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace finenoise {

namespace {

FBMConfig parseLayer(const ConfigValue& value) {
    FBMConfig config;
    auto numbers = value.asNumbers();
    if (numbers.size() > 0) {
        double octaves = numbers[0];
        if (octaves == std::floor(octaves) &&
            octaves >= std::numeric_limits<int>::min() &&
            octaves <= std::numeric_limits<int>::max()) {
            config.octaves = static_cast<int>(octaves);
        } else {
            std::cerr << "[NoiseDescriptor] WARNING: invalid octave count '" << value.asString()
                      << "', using " << config.octaves << "\n";
        }
    }
    if (numbers.size() > 1) config.lacunarity = numbers[1];
    if (numbers.size() > 2) config.persistence = numbers[2];
    return config;
}

}  // namespace

NoiseDescriptor NoiseDescriptor::fromConfig(const ConfigDocument& doc) {
    NoiseDescriptor desc;

    std::string_view typeName = doc.getString("type");
    if (typeName.empty()) {
        throw std::invalid_argument("Noise descriptor has no 'type' entry");
    }
    auto type = parseNoiseType(typeName);
    if (!type) {
        throw std::invalid_argument("Unknown noise type: " + std::string(typeName));
    }
    desc.type = *type;

    desc.config.seed = doc.getUInt32("seed", 0);
    desc.config.frequency = doc.getDouble("frequency", 1.0);

    if (auto* entry = doc.get("distance")) {
        auto name = entry->value.asString();
        if (auto metric = parseDistanceMetric(name)) {
            desc.config.distance = *metric;
        } else {
            std::cerr << "[NoiseDescriptor] WARNING: unknown distance '" << name
                      << "', using " << distanceMetricName(desc.config.distance) << "\n";
        }
    }

    if (auto* entry = doc.get("return")) {
        auto name = entry->value.asString();
        if (auto returnType = parseCellularReturn(name)) {
            desc.config.returnType = *returnType;
        } else {
            std::cerr << "[NoiseDescriptor] WARNING: unknown return '" << name
                      << "', using " << cellularReturnName(desc.config.returnType) << "\n";
        }
    }

    for (const auto& entry : doc) {
        if (entry.key == "fbm") {
            desc.layers.push_back({LayerKind::Fbm, parseLayer(entry.value)});
        } else if (entry.key == "turbulence") {
            desc.layers.push_back({LayerKind::Turbulence, parseLayer(entry.value)});
        }
    }

    return desc;
}

Noise2DPtr NoiseDescriptor::build2D() const {
    Noise2DPtr source = NoiseFactory::create2D(type, config);
    for (const auto& layer : layers) {
        source = layer.kind == LayerKind::Fbm ? source->fbm(layer.config)
                                              : source->turbulence(layer.config);
    }
    return source;
}

Noise3DPtr NoiseDescriptor::build3D() const {
    Noise3DPtr source = NoiseFactory::create3D(type, config);
    for (const auto& layer : layers) {
        source = layer.kind == LayerKind::Fbm ? source->fbm(layer.config)
                                              : source->turbulence(layer.config);
    }
    return source;
}

std::optional<NoiseDescriptor> loadNoiseDescriptor(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        return std::nullopt;
    }
    return NoiseDescriptor::fromConfig(*doc);
}

}  // namespace finenoise
