#include "design/design_config.hpp"
#include "utils/errors.hpp"
#include <cmath>
#include <string>

namespace srm_design {
namespace design {

namespace {

void requirePositive(double value, const char* name) {
    if (!std::isfinite(value) || !(value > 0.0)) {
        throw InvalidInput(std::string(name) + " must be positive and finite (got " +
                           std::to_string(value) + ")");
    }
}

void requireNonNegative(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidInput(std::string(name) + " must be non-negative and finite (got " +
                           std::to_string(value) + ")");
    }
}

void requireAtLeastOne(int value, const char* name) {
    if (value < 1) {
        throw InvalidInput(std::string(name) + " must be at least 1");
    }
}

} // namespace

void validate(const DesignConfig& config) {
    requirePositive(config.target_altitude, "target_altitude");

    const RocketSpec& rocket = config.rocket;
    requirePositive(rocket.dry_mass, "rocket.dry_mass");
    requirePositive(rocket.propellant_mass, "rocket.propellant_mass");
    requireNonNegative(rocket.reference_area, "rocket.reference_area");
    requireNonNegative(rocket.launch_altitude, "rocket.launch_altitude");
    if (!aerodynamics::is_valid(rocket.drag)) {
        throw InvalidInput("rocket.drag is not a valid drag model");
    }

    const MotorSpec& motor = config.motor;
    requirePositive(motor.propellant_density, "motor.propellant_density");
    requirePositive(motor.burn_rate_coefficient, "motor.burn_rate_coefficient");
    if (!(motor.burn_rate_exponent > 0.0 && motor.burn_rate_exponent < 1.0)) {
        throw InvalidInput("motor.burn_rate_exponent must lie in (0, 1)");
    }
    requirePositive(motor.characteristic_velocity, "motor.characteristic_velocity");
    if (!(motor.gamma > 1.0) || !std::isfinite(motor.gamma)) {
        throw InvalidInput("motor.gamma must be greater than 1");
    }
    requirePositive(motor.chamber_volume, "motor.chamber_volume");
    requirePositive(motor.chamber_diameter, "motor.chamber_diameter");
    requireNonNegative(motor.liner_thickness, "motor.liner_thickness");
    if (!(motor.grainOuterDiameter() > 0.0)) {
        throw InvalidInput("motor.liner_thickness leaves no room for the grain");
    }
    requirePositive(motor.max_chamber_pressure, "motor.max_chamber_pressure");
    if (!(motor.average_pressure_ratio > 0.0 && motor.average_pressure_ratio <= 1.0)) {
        throw InvalidInput("motor.average_pressure_ratio must lie in (0, 1]");
    }
    if (!(motor.discharge_coefficient > 0.0 && motor.discharge_coefficient <= 1.0)) {
        throw InvalidInput("motor.discharge_coefficient must lie in (0, 1]");
    }
    if (!(motor.nozzle_efficiency > 0.0 && motor.nozzle_efficiency <= 1.0)) {
        throw InvalidInput("motor.nozzle_efficiency must lie in (0, 1]");
    }
    if (!std::isfinite(motor.expansion_ratio) ||
        (motor.expansion_ratio > 0.0 && motor.expansion_ratio < 1.0)) {
        throw InvalidInput("motor.expansion_ratio must be >= 1 (or <= 0 for optimum expansion)");
    }
    requirePositive(motor.burn_time, "motor.burn_time");

    if (config.grain_mode == GrainMode::FIXED) {
        if (!config.grain.isValid()) {
            throw InvalidInput("grain geometry requires 0 < core_diameter < outer_diameter, "
                               "positive segment_length and segments");
        }
        if (config.grain.outer_diameter > motor.grainOuterDiameter() * (1.0 + 1e-9)) {
            throw InvalidInput("grain.outer_diameter does not fit inside the liner");
        }
    } else {
        requireAtLeastOne(config.grain.segments, "grain.segments");
    }

    const Tolerances& tol = config.tolerance;
    requirePositive(tol.altitude_eps, "tolerance.altitude_eps");
    requireNonNegative(tol.altitude_rel_eps, "tolerance.altitude_rel_eps");
    requirePositive(tol.integrator_abs_tol, "tolerance.integrator_abs_tol");
    requireNonNegative(tol.integrator_rel_tol, "tolerance.integrator_rel_tol");
    requirePositive(tol.pressure_rel_tol, "tolerance.pressure_rel_tol");
    requirePositive(tol.burn_time_rel_tol, "tolerance.burn_time_rel_tol");

    const IterationLimits& limits = config.limits;
    requireAtLeastOne(limits.optimizer_max_iter, "iteration_limits.optimizer_max_iter");
    requireAtLeastOne(limits.grain_solver_max_iter, "iteration_limits.grain_solver_max_iter");
    if (limits.bracket_expansions < 0) {
        throw InvalidInput("iteration_limits.bracket_expansions must be non-negative");
    }
    requireAtLeastOne(limits.pressure_max_iter, "iteration_limits.pressure_max_iter");
    requireAtLeastOne(limits.max_step_rejections, "iteration_limits.max_step_rejections");

    const IntegratorSettings& integ = config.integrator;
    requirePositive(integ.initial_step, "integrator.initial_step");
    requirePositive(integ.min_step, "integrator.min_step");
    requirePositive(integ.max_step, "integrator.max_step");
    requirePositive(integ.fixed_step, "integrator.fixed_step");
    requirePositive(integ.t_max, "integrator.t_max");
    if (integ.max_step < integ.min_step) {
        throw InvalidInput("integrator.max_step must not be smaller than integrator.min_step");
    }

    const SearchSettings& search = config.search;
    requirePositive(search.thrust_min_limit, "search.thrust_min_limit");
    requirePositive(search.thrust_max_limit, "search.thrust_max_limit");
    if (!(search.thrust_min_limit <= search.thrust_min && search.thrust_min < search.thrust_max &&
          search.thrust_max <= search.thrust_max_limit)) {
        throw InvalidInput("search requires thrust_min_limit <= thrust_min < thrust_max <= thrust_max_limit");
    }

    const BallisticsSettings& ball = config.ballistics;
    requirePositive(ball.time_step, "ballistics.time_step");
    requirePositive(ball.min_port_ratio, "ballistics.min_port_ratio");
    requirePositive(ball.erosive_port_ratio, "ballistics.erosive_port_ratio");
    requirePositive(ball.erosive_ld_limit, "ballistics.erosive_ld_limit");
    requireAtLeastOne(ball.max_steps, "ballistics.max_steps");
}

physics::IntegratorOptions makeIntegratorOptions(const DesignConfig& config) {
    physics::IntegratorOptions options;
    options.abs_tol = config.tolerance.integrator_abs_tol;
    options.rel_tol = config.tolerance.integrator_rel_tol;
    options.initial_step = config.integrator.initial_step;
    options.min_step = config.integrator.min_step;
    options.max_step = config.integrator.max_step;
    options.fixed_step = config.integrator.fixed_step;
    options.t_max = config.integrator.t_max;
    options.simulate_descent = config.integrator.simulate_descent;
    options.max_step_rejections = config.limits.max_step_rejections;
    return options;
}

const char* toString(GrainMode mode) {
    return mode == GrainMode::FIXED ? "fixed" : "sized";
}

GrainMode grainModeFromString(const std::string& name) {
    if (name == "fixed") return GrainMode::FIXED;
    if (name == "sized") return GrainMode::SIZED;
    throw InvalidInput("unknown grain mode '" + name + "' (expected fixed or sized)");
}

} // namespace design
} // namespace srm_design
