#pragma once

#include "physics/types.hpp"
#include "physics/atmosphere.hpp"
#include "physics/propulsion/thrust_profile.hpp"
#include <memory>

namespace srm_design {
namespace physics {

/**
 * @brief Flight phase, decided by the integrator
 */
enum class FlightPhase {
    BOOST,      // Motor burning, t < burnout
    COAST,      // After burnout, before apogee
    DESCENT     // After apogee
};

/**
 * @brief Forces acting on the vehicle at one instant
 *
 * All forces are along the vertical axis, positive up, except drag which
 * is signed positive when it opposes upward motion.
 */
struct ForceBreakdown {
    double thrust;              // [N]
    double drag;                // [N]
    double weight;              // [N]
    double net;                 // thrust - drag - weight [N]
    double acceleration;        // [m/s²], 0 while held on the pad
    double density;             // [kg/m³]
    double pressure;            // Ambient pressure [Pa]
    double mach;                // [-]
    double dynamic_pressure;    // [Pa]
    double chamber_pressure;    // [Pa]
    double mass_flow;           // [kg/s]
    bool held_on_pad;
    bool propellant_exhausted;  // Dry mass reached while the profile still burns

    ForceBreakdown() : thrust(0.0), drag(0.0), weight(0.0), net(0.0), acceleration(0.0),
                       density(0.0), pressure(0.0), mach(0.0), dynamic_pressure(0.0),
                       chamber_pressure(0.0), mass_flow(0.0), held_on_pad(false),
                       propellant_exhausted(false) {}
};

/**
 * @brief 1-DOF vertical ascent dynamics of a single-stage solid rocket
 *
 * State (h, v, m):
 * - dh/dt = v
 * - dv/dt = (T - D - m*g0) / m, with D = 0.5*rho*v|v|*Cd(M)*A
 * - dm/dt = -mdot while burning and m > dry mass
 *
 * Once the mass reaches dry mass before the profile's burnout the loaded
 * propellant is exhausted: thrust, chamber pressure and mass flow are zero.
 *
 * While the vehicle sits on the pad (h <= 0, v <= 0) before apogee and the
 * net force cannot lift it, the acceleration is held at zero.
 */
class AscentDynamics {
public:
    /**
     * @brief Constructor
     * @param rocket Airframe parameters
     * @param atmosphere Atmosphere model
     * @param thrust_profile Motor thrust curve
     */
    AscentDynamics(const RocketSpec& rocket,
                   std::shared_ptr<const Atmosphere> atmosphere,
                   std::shared_ptr<const propulsion::ThrustProfile> thrust_profile);

    /**
     * @brief Compute state derivative
     * @param t Time since ignition [s]
     * @param y State (h, v, m)
     * @param phase Current flight phase
     * @return (dh/dt, dv/dt, dm/dt)
     */
    StateVector computeDerivative(double t, const StateVector& y, FlightPhase phase) const;

    /**
     * @brief Compute forces and atmospheric quantities
     * @param t Time since ignition [s]
     * @param y State (h, v, m)
     * @param phase Current flight phase
     * @return Force breakdown
     */
    ForceBreakdown computeForces(double t, const StateVector& y, FlightPhase phase) const;

    double burnoutTime() const { return thrust_profile_->burnTime(); }

    const RocketSpec& getRocket() const { return rocket_; }
    const Atmosphere& getAtmosphere() const { return *atmosphere_; }
    const propulsion::ThrustProfile& getThrustProfile() const { return *thrust_profile_; }

private:
    RocketSpec rocket_;
    std::shared_ptr<const Atmosphere> atmosphere_;
    std::shared_ptr<const propulsion::ThrustProfile> thrust_profile_;
};

/**
 * @brief Factory function to create dynamics object
 */
std::shared_ptr<AscentDynamics> createAscentDynamics(
    const RocketSpec& rocket,
    std::shared_ptr<const Atmosphere> atmosphere,
    std::shared_ptr<const propulsion::ThrustProfile> thrust_profile);

} // namespace physics
} // namespace srm_design
