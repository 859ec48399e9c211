#include "design/motor_designer.hpp"
#include "design/nozzle.hpp"
#include "utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <sstream>

namespace srm_design {
namespace design {

MotorDesigner::MotorDesigner(const DesignConfig& config)
    : config_(config), atmosphere_(physics::createISAAtmosphere()) {
    validate(config_);
}

DesignResult MotorDesigner::run() const {
    DesignResult result;
    result.target_altitude = config_.target_altitude;
    result.rocket = config_.rocket;
    result.motor = config_.motor;

    auto warn = [&result](const std::string& message) {
        spdlog::warn("{}", message);
        result.warnings.push_back(message);
    };

    // 1. Thrust search
    spdlog::info("searching constant thrust for a {:.1f} m apogee (burn time {:.3f} s)",
                 config_.target_altitude, config_.motor.burn_time);
    ThrustOptimizer optimizer(config_);
    result.optimization = optimizer.optimize();
    result.trajectory = result.optimization.trajectory;
    result.average_thrust = result.optimization.thrust;
    result.total_impulse = result.average_thrust * config_.motor.burn_time;
    result.mass_flow = config_.rocket.propellant_mass / config_.motor.burn_time;
    result.required_isp = result.average_thrust / (result.mass_flow * kStandardGravity);
    spdlog::info("thrust {:.3f} N -> apogee {:.2f} m after {} iterations ({} evaluations)",
                 result.average_thrust, result.optimization.apogee, result.optimization.iterations,
                 result.optimization.evaluations);

    // 2. Nozzle
    result.ambient_pressure = atmosphere_->computePressure(config_.rocket.launch_altitude);
    result.nozzle = nozzle::solveNozzle(
        nozzle::makeNozzleRequest(config_.motor, result.average_thrust, result.ambient_pressure));
    spdlog::info("nozzle: throat {:.2f} mm, exit {:.2f} mm, Me={:.3f}, CF={:.4f}, Isp={:.1f} s",
                 result.nozzle.throat_diameter * 1e3, result.nozzle.exit_diameter * 1e3,
                 result.nozzle.exit_mach, result.nozzle.thrust_coefficient,
                 result.nozzle.specific_impulse);

    double mismatch = std::abs(result.required_isp - result.nozzle.specific_impulse) /
                      result.nozzle.specific_impulse;
    if (mismatch > kIspMismatchWarning) {
        std::ostringstream msg;
        msg.precision(1);
        msg << std::fixed << "required Isp " << result.required_isp << " s differs from the delivered "
            << result.nozzle.specific_impulse << " s by " << mismatch * 100.0
            << " %; propellant mass and thrust are not consistent";
        warn(msg.str());
    }

    // 3. Grain and ballistics
    BallisticsOptions ballistics_options = makeBallisticsOptions(config_, result.ambient_pressure);
    GrainSizingRequest request = makeGrainSizingRequest(config_, result.nozzle, ballistics_options);
    if (config_.grain_mode == GrainMode::SIZED) {
        result.grain_sizing = sizeGrain(request);
    } else {
        result.grain_sizing = analyseGrain(config_.grain, request);
    }
    result.grain = result.grain_sizing.grain;
    result.ballistics = result.grain_sizing.ballistics;
    spdlog::info("grain ({}): {} x BATES D={:.2f} mm d={:.2f} mm L={:.2f} mm, burn {:.3f} s, "
                 "peak Pc {:.3f} MPa, impulse {:.1f} Ns",
                 toString(config_.grain_mode), result.grain.segments,
                 result.grain.outer_diameter * 1e3, result.grain.core_diameter * 1e3,
                 result.grain.segment_length * 1e3, result.ballistics.burn_time,
                 result.ballistics.peak_pressure * 1e-6, result.ballistics.total_impulse);

    if (result.grain_sizing.erosive_risk) {
        std::ostringstream msg;
        msg.precision(2);
        msg << std::fixed << "erosive burning risk: grain L/D " << result.grain_sizing.length_to_diameter
            << " with port-to-throat ratio " << result.grain_sizing.port_to_throat_ratio;
        warn(msg.str());
    }

    // The thrust curve expels the grain's mass, the airframe must carry the same load
    DesignConfig flight_config = config_;
    const double grain_mass = result.ballistics.propellant_consumed;
    const double loaded_mass = config_.rocket.propellant_mass;
    if (std::abs(grain_mass - loaded_mass) > kPropellantMassTolerance * loaded_mass) {
        std::ostringstream msg;
        msg.precision(4);
        msg << std::fixed << "grain holds " << grain_mass << " kg of propellant but the rocket is loaded with "
            << loaded_mass << " kg; verification flies the grain mass";
        warn(msg.str());
        flight_config.rocket.propellant_mass = grain_mass;
    }

    // 4. Verification flight with the ballistics thrust curve
    if (config_.verify_with_ballistics) {
        auto profile = makeThrustProfile(result.ballistics);
        result.verification = flyThrustProfile(flight_config, atmosphere_, profile, true);
        result.has_verification = true;
        spdlog::info("verification flight: apogee {:.2f} m at {:.2f} s",
                     result.verification.apogee_altitude, result.verification.apogee_time);

        double error = std::abs(result.verification.apogee_altitude - config_.target_altitude) /
                       config_.target_altitude;
        if (error > kVerificationWarning) {
            std::ostringstream msg;
            msg.precision(1);
            msg << std::fixed << "verification apogee " << result.verification.apogee_altitude
                << " m misses the target by " << error * 100.0 << " %";
            warn(msg.str());
        }
    }

    return result;
}

DesignResult designMotor(const DesignConfig& config) {
    return MotorDesigner(config).run();
}

} // namespace design
} // namespace srm_design
