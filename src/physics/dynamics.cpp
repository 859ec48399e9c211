#include "physics/dynamics.hpp"
#include "physics/aerodynamics/aerodynamics.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cmath>

namespace srm_design {
namespace physics {

namespace {

// Stage times closer than this to burnout still belong to the burn [s]
constexpr double kBurnoutSlack = 1e-9;

} // namespace

AscentDynamics::AscentDynamics(const RocketSpec& rocket,
                               std::shared_ptr<const Atmosphere> atmosphere,
                               std::shared_ptr<const propulsion::ThrustProfile> thrust_profile)
    : rocket_(rocket), atmosphere_(std::move(atmosphere)), thrust_profile_(std::move(thrust_profile)) {
    if (!atmosphere_ || !thrust_profile_) {
        throw InvalidInput("dynamics requires an atmosphere and a thrust profile");
    }
    if (!(rocket_.dry_mass > 0.0)) {
        throw InvalidInput("dry mass must be positive");
    }
    if (!(rocket_.reference_area >= 0.0)) {
        throw InvalidInput("reference area must be non-negative");
    }
}

StateVector AscentDynamics::computeDerivative(double t, const StateVector& y, FlightPhase phase) const {
    ForceBreakdown f = computeForces(t, y, phase);

    StateVector y_dot;
    y_dot(idx(StateIndex::H)) = y(idx(StateIndex::V));
    y_dot(idx(StateIndex::V)) = f.acceleration;
    y_dot(idx(StateIndex::M)) = -f.mass_flow;
    return y_dot;
}

ForceBreakdown AscentDynamics::computeForces(double t, const StateVector& y, FlightPhase phase) const {
    const double h = y(idx(StateIndex::H));
    const double v = y(idx(StateIndex::V));
    const double m = y(idx(StateIndex::M));

    ForceBreakdown f;

    AtmosphereState atm = atmosphere_->computeProperties(rocket_.launch_altitude + h);
    f.density = atm.density;
    f.pressure = atm.pressure;
    f.mach = std::abs(v) / atm.speed_of_sound;
    f.dynamic_pressure = 0.5 * atm.density * v * v;

    if (phase == FlightPhase::BOOST) {
        // Evaluated at the burnout time at most so the final stage of a clipped step still burns
        const double tb = thrust_profile_->burnTime();
        double t_eval = std::min(t, tb);
        // Loaded propellant ran out before the profile's burnout: no thrust, no mass flow
        bool exhausted = m <= rocket_.dry_mass && tb - t_eval > kBurnoutSlack;
        if (!exhausted) {
            f.thrust = thrust_profile_->thrust(t_eval);
            f.chamber_pressure = thrust_profile_->chamberPressure(t_eval);
            if (m > rocket_.dry_mass) {
                f.mass_flow = thrust_profile_->massFlowRate(t_eval);
            }
        }
        f.propellant_exhausted = exhausted;
    }

    double Cd = aerodynamics::drag_coefficient(f.mach, rocket_.drag);
    f.drag = aerodynamics::drag_force(atm.density, v, Cd, rocket_.reference_area);
    f.weight = m * kStandardGravity;
    f.net = f.thrust - f.drag - f.weight;

    if (phase != FlightPhase::DESCENT && h <= 0.0 && v <= 0.0 && f.net <= 0.0) {
        f.held_on_pad = true;
        f.acceleration = 0.0;
    } else {
        f.acceleration = f.net / m;
    }
    return f;
}

std::shared_ptr<AscentDynamics> createAscentDynamics(
    const RocketSpec& rocket,
    std::shared_ptr<const Atmosphere> atmosphere,
    std::shared_ptr<const propulsion::ThrustProfile> thrust_profile) {
    return std::make_shared<AscentDynamics>(rocket, std::move(atmosphere), std::move(thrust_profile));
}

} // namespace physics
} // namespace srm_design
