#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace srm_design {
namespace physics {

/**
 * @brief Atmospheric properties at one altitude
 */
struct AtmosphereState {
    double density;         // [kg/m³]
    double pressure;        // [Pa]
    double temperature;     // [K]
    double speed_of_sound;  // [m/s]
};

/**
 * @brief One ISA layer, valid from base_altitude up to the next layer
 */
struct ISALayer {
    double base_altitude;       // [m]
    double base_temperature;    // [K]
    double base_pressure;       // [Pa]
    double lapse_rate;          // [K/m]
};

/**
 * @brief Atmospheric model interface
 */
class Atmosphere {
public:
    virtual ~Atmosphere() = default;

    /**
     * @brief Compute atmospheric properties at given altitude
     * @param altitude Geopotential altitude above MSL [m]
     * @return Density, pressure, temperature and speed of sound
     */
    virtual AtmosphereState computeProperties(double altitude) const = 0;

    double computeDensity(double altitude) const { return computeProperties(altitude).density; }
    double computePressure(double altitude) const { return computeProperties(altitude).pressure; }

    /**
     * @brief Compute Mach number
     * @param velocity Velocity [m/s], sign ignored
     * @param altitude Altitude [m]
     * @return Mach number
     */
    double computeMachNumber(double velocity, double altitude) const;
};

/**
 * @brief International Standard Atmosphere (1976) up to 86 km
 *
 * Below sea level the sea-level state is returned. Above the last layer
 * base the last lapse law is extrapolated up to kMaxAltitude.
 */
class ISAAtmosphere : public Atmosphere {
public:
    ISAAtmosphere();

    AtmosphereState computeProperties(double altitude) const override;

    /**
     * @brief Evaluate one layer's law at an arbitrary altitude
     *
     * Used to compare both sides of a layer boundary.
     * @param altitude Altitude [m]
     * @param layer Layer index
     */
    AtmosphereState computeLayerProperties(double altitude, std::size_t layer) const;

    std::size_t getLayerIndex(double altitude) const;
    const std::vector<ISALayer>& layers() const { return layers_; }

    static constexpr double kCeiling = 86000.0;        // Top of the tabulated model [m]
    static constexpr double kMaxAltitude = 150000.0;   // Extrapolation clamp [m]

private:
    std::vector<ISALayer> layers_;
};

/**
 * @brief Create ISA atmosphere model
 * @return Shared pointer to ISA atmosphere
 */
std::shared_ptr<ISAAtmosphere> createISAAtmosphere();

} // namespace physics
} // namespace srm_design
