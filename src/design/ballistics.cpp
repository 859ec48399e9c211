#include "design/ballistics.hpp"
#include "design/nozzle.hpp"
#include "physics/core/event_detection.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace srm_design {
namespace design {

namespace {

// Mass generated minus mass expelled through the throat [kg/s]
double massBalance(const MotorSpec& motor, double burn_area, double throat_area, double pc) {
    double generated = motor.propellant_density * burn_area * motor.burnRate(pc);
    double expelled = pc * motor.discharge_coefficient * throat_area / motor.characteristic_velocity;
    return generated - expelled;
}

} // namespace

BallisticsOptions makeBallisticsOptions(const DesignConfig& config, double ambient_pressure) {
    BallisticsOptions options;
    options.time_step = config.ballistics.time_step;
    options.ambient_pressure = ambient_pressure;
    options.pressure_rel_tol = config.tolerance.pressure_rel_tol;
    options.pressure_max_iter = config.limits.pressure_max_iter;
    options.max_steps = config.ballistics.max_steps;
    return options;
}

bool isChoked(const MotorSpec& motor, double burn_area, double throat_area, double ambient_pressure) {
    return burn_area > 0.0 && massBalance(motor, burn_area, throat_area, ambient_pressure) > 0.0;
}

double solveChamberPressure(const MotorSpec& motor, double burn_area, double throat_area,
                            double ambient_pressure, double rel_tol, int max_iter) {
    if (!(throat_area > 0.0) || !std::isfinite(throat_area)) {
        throw InvalidGeometry("throat area must be positive and finite");
    }
    if (!isChoked(motor, burn_area, throat_area, ambient_pressure)) {
        throw InvalidGeometry("nozzle is not choked: no chamber pressure above ambient balances the flow");
    }

    const double meop = motor.max_chamber_pressure;
    if (massBalance(motor, burn_area, throat_area, meop) > 0.0) {
        std::ostringstream msg;
        msg << "chamber pressure exceeds MEOP of " << meop << " Pa (Kn = " << burn_area / throat_area << ")";
        throw OverPressure(msg.str());
    }

    auto f = [&](double pc) { return massBalance(motor, burn_area, throat_area, pc); };
    physics::core::RootResult root =
        physics::core::find_root_bisection(f, ambient_pressure, meop, rel_tol, max_iter);
    if (!root.bracketed) {
        throw InvalidGeometry("chamber pressure root could not be bracketed");
    }
    return root.x;
}

BallisticsResult simulateBallistics(const MotorSpec& motor, const GrainGeometry& grain,
                                    const NozzleDesign& nozzle, const BallisticsOptions& options) {
    if (!grain.isValid()) {
        throw InvalidGeometry("grain requires 0 < core_diameter < outer_diameter and positive length");
    }
    if (!(nozzle.throat_area > 0.0)) {
        throw InvalidGeometry("nozzle throat area must be positive");
    }
    if (!(options.time_step > 0.0)) {
        throw InvalidInput("ballistics time step must be positive");
    }

    const double pa = options.ambient_pressure;
    const double At = nozzle.throat_area;
    const double web = grain.webThickness();

    BallisticsResult result;
    double x = 0.0;
    double t = 0.0;
    double pressure_time = 0.0;
    int steps = 0;

    while (true) {
        if (++steps > options.max_steps) {
            throw NonConvergence("ballistics step budget exhausted before burnout", t, x, steps);
        }

        BallisticsSample s;
        s.t = t;
        s.regression = x;
        s.core_diameter = grain.coreDiameterAt(x);
        s.segment_length = grain.segmentLengthAt(x);
        s.burn_area = grain.burnAreaAt(x);
        s.kn = s.burn_area / At;
        s.propellant_remaining = motor.propellant_density * grain.volumeAt(x);

        if (isChoked(motor, s.burn_area, At, pa)) {
            s.chamber_pressure = solveChamberPressure(motor, s.burn_area, At, pa,
                                                      options.pressure_rel_tol,
                                                      options.pressure_max_iter);
            s.thrust = nozzle::deliveredThrust(nozzle, motor.gamma, s.chamber_pressure, pa);
        } else {
            if (x == 0.0) {
                throw InvalidGeometry("nozzle is not choked at ignition; throat too large for the grain");
            }
            // Tail-off, the chamber has vented to ambient
            result.tail_off = true;
            s.chamber_pressure = pa;
            s.thrust = 0.0;
        }
        s.burn_rate = motor.burnRate(s.chamber_pressure);
        s.mass_flow = motor.propellant_density * s.burn_area * s.burn_rate;
        result.samples.push_back(s);

        double step = options.time_step;
        bool last = false;
        if (x + s.burn_rate * step >= web) {
            step = (web - x) / s.burn_rate;
            last = true;
        }

        result.total_impulse += s.thrust * step;
        pressure_time += s.chamber_pressure * step;
        result.peak_pressure = std::max(result.peak_pressure, s.chamber_pressure);
        result.peak_thrust = std::max(result.peak_thrust, s.thrust);
        result.peak_kn = std::max(result.peak_kn, s.kn);

        x = last ? web : x + s.burn_rate * step;
        t += step;
        if (last) {
            break;
        }
    }

    // Burnout: web consumed, chamber vented
    BallisticsSample end;
    end.t = t;
    end.regression = web;
    end.core_diameter = grain.coreDiameterAt(web);
    end.segment_length = grain.segmentLengthAt(web);
    end.chamber_pressure = pa;
    end.propellant_remaining = motor.propellant_density * grain.volumeAt(web);
    result.samples.push_back(end);

    result.burn_time = t;
    result.propellant_consumed = motor.propellant_density * (grain.volumeAt(0.0) - grain.volumeAt(web));
    result.initial_kn = result.samples.front().kn;
    result.average_pressure = pressure_time / t;
    result.average_thrust = result.total_impulse / t;
    result.specific_impulse = result.propellant_consumed > 0.0
        ? result.total_impulse / (result.propellant_consumed * kStandardGravity)
        : 0.0;
    return result;
}

std::shared_ptr<physics::propulsion::TabulatedThrustProfile> makeThrustProfile(
    const BallisticsResult& ballistics) {
    std::vector<physics::propulsion::ThrustPoint> points;
    points.reserve(ballistics.samples.size());
    for (const BallisticsSample& s : ballistics.samples) {
        if (!points.empty() && !(s.t > points.back().t)) {
            continue;
        }
        points.push_back({s.t, s.thrust, s.mass_flow, s.chamber_pressure});
    }

    // Rescale the mass flow so the interpolated curve expels exactly the consumed propellant
    double tabulated = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        tabulated += 0.5 * (points[i].t - points[i - 1].t) * (points[i].mass_flow + points[i - 1].mass_flow);
    }
    if (tabulated > 0.0) {
        const double scale = ballistics.propellant_consumed / tabulated;
        for (physics::propulsion::ThrustPoint& p : points) {
            p.mass_flow *= scale;
        }
    }
    return std::make_shared<physics::propulsion::TabulatedThrustProfile>(std::move(points));
}

} // namespace design
} // namespace srm_design
