#include "physics/atmosphere.hpp"
#include <algorithm>
#include <cmath>

namespace srm_design {
namespace physics {

// Physical constants
static constexpr double kR = 287.05287;     // J/(kg*K)
static constexpr double kGamma = 1.4;       // specific heat ratio
static constexpr double kG0 = 9.80665;      // m/s^2

static constexpr double kSeaLevelTemperature = 288.15;  // K
static constexpr double kSeaLevelPressure = 101325.0;   // Pa

namespace {

struct LayerDefinition {
    double base_altitude;   // m
    double lapse_rate;      // K/m
};

const LayerDefinition kLayerDefinitions[] = {
    {     0.0, -0.0065},  // 0-11 km (troposphere)
    { 11000.0,  0.0   },  // 11-20 km (tropopause)
    { 20000.0,  0.001 },  // 20-32 km (stratosphere)
    { 32000.0,  0.0028},  // 32-47 km
    { 47000.0,  0.0   },  // 47-51 km
    { 51000.0, -0.0028},  // 51-71 km
    { 71000.0, -0.002 }   // 71-86 km, extrapolated above
};

// Temperature and pressure at altitude h following the law of one layer
void evaluateLayer(const ISALayer& layer, double h, double& T, double& P) {
    const double L = layer.lapse_rate;
    const double T0 = layer.base_temperature;
    const double P0 = layer.base_pressure;
    const double h0 = layer.base_altitude;

    if (std::abs(L) > 1e-12) {
        T = T0 + L * (h - h0);
        P = P0 * std::pow(T0 / T, kG0 / (kR * L));
    } else {
        T = T0;
        P = P0 * std::exp(-kG0 * (h - h0) / (kR * T0));
    }
}

AtmosphereState makeState(double T, double P) {
    AtmosphereState out{};
    out.temperature = T;
    out.pressure = P;
    out.density = P / (kR * T);
    out.speed_of_sound = std::sqrt(kGamma * kR * T);
    return out;
}

} // namespace

double Atmosphere::computeMachNumber(double velocity, double altitude) const {
    double a = computeProperties(altitude).speed_of_sound;
    return std::abs(velocity) / a;
}

ISAAtmosphere::ISAAtmosphere() {
    // Base states are chained from the layer below so that every boundary is continuous
    ISALayer first{kLayerDefinitions[0].base_altitude, kSeaLevelTemperature, kSeaLevelPressure,
                   kLayerDefinitions[0].lapse_rate};
    layers_.push_back(first);

    for (std::size_t i = 1; i < sizeof(kLayerDefinitions) / sizeof(kLayerDefinitions[0]); ++i) {
        const ISALayer& below = layers_.back();
        double T = 0.0;
        double P = 0.0;
        evaluateLayer(below, kLayerDefinitions[i].base_altitude, T, P);
        layers_.push_back({kLayerDefinitions[i].base_altitude, T, P, kLayerDefinitions[i].lapse_rate});
    }
}

std::size_t ISAAtmosphere::getLayerIndex(double altitude) const {
    // Last layer with base_altitude <= h
    std::size_t index = 0;
    for (std::size_t i = 0; i + 1 < layers_.size(); ++i) {
        if (altitude >= layers_[i + 1].base_altitude) index = i + 1; else break;
    }
    return index;
}

AtmosphereState ISAAtmosphere::computeLayerProperties(double altitude, std::size_t layer) const {
    const ISALayer& l = layers_.at(layer);
    double T = 0.0;
    double P = 0.0;
    evaluateLayer(l, altitude, T, P);
    return makeState(T, P);
}

AtmosphereState ISAAtmosphere::computeProperties(double altitude) const {
    double h = std::clamp(altitude, 0.0, kMaxAltitude);
    return computeLayerProperties(h, getLayerIndex(h));
}

std::shared_ptr<ISAAtmosphere> createISAAtmosphere() {
    return std::make_shared<ISAAtmosphere>();
}

} // namespace physics
} // namespace srm_design
