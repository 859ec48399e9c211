#include "utils/config_loader.hpp"
#include "utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <initializer_list>
#include <set>

namespace srm_design {
namespace config {

namespace {

template <typename T>
void read(const YAML::Node& node, const std::string& section, const char* key, T& value) {
    const YAML::Node child = node[key];
    if (!child) {
        return;
    }
    try {
        value = child.as<T>();
    } catch (const YAML::Exception& e) {
        std::string path = section.empty() ? key : section + "." + key;
        throw InvalidInput("invalid value for '" + path + "': " + e.what());
    }
}

YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw InvalidInput(std::string("section '") + name + "' must be a map");
    }
    return node;
}

void warnUnknownKeys(const YAML::Node& node, const std::string& where,
                     std::initializer_list<const char*> known) {
    if (!node || !node.IsMap()) {
        return;
    }
    std::set<std::string> names(known.begin(), known.end());
    for (const auto& entry : node) {
        std::string key = entry.first.as<std::string>();
        if (names.count(key) == 0) {
            spdlog::warn("ignoring unknown configuration key '{}{}'", where.empty() ? "" : where + ".", key);
        }
    }
}

void parseDrag(const YAML::Node& node, aerodynamics::DragModel& drag) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "rocket.drag", {"model", "cd", "cd_transonic_peak", "cd_supersonic",
                                         "mach_transonic_start", "mach_transonic_end"});
    std::string model = "constant";
    read(node, "rocket.drag", "model", model);
    if (model == "constant") {
        drag.type = aerodynamics::DragModelType::CONSTANT;
    } else if (model == "mach") {
        drag.type = aerodynamics::DragModelType::MACH_DEPENDENT;
    } else {
        throw InvalidInput("rocket.drag.model must be 'constant' or 'mach' (got '" + model + "')");
    }
    read(node, "rocket.drag", "cd", drag.Cd_subsonic);
    read(node, "rocket.drag", "cd_transonic_peak", drag.Cd_transonic_peak);
    read(node, "rocket.drag", "cd_supersonic", drag.Cd_supersonic);
    read(node, "rocket.drag", "mach_transonic_start", drag.mach_transonic_start);
    read(node, "rocket.drag", "mach_transonic_end", drag.mach_transonic_end);
}

void parseRocket(const YAML::Node& node, RocketSpec& rocket) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "rocket", {"dry_mass", "propellant_mass", "reference_area",
                                     "reference_diameter", "launch_altitude", "drag"});
    read(node, "rocket", "dry_mass", rocket.dry_mass);
    read(node, "rocket", "propellant_mass", rocket.propellant_mass);
    read(node, "rocket", "reference_area", rocket.reference_area);
    if (node["reference_diameter"]) {
        if (node["reference_area"]) {
            throw InvalidInput("rocket: give either reference_area or reference_diameter, not both");
        }
        double diameter = 0.0;
        read(node, "rocket", "reference_diameter", diameter);
        rocket.reference_area = utils::circleArea(diameter);
    }
    read(node, "rocket", "launch_altitude", rocket.launch_altitude);
    parseDrag(section(node, "drag"), rocket.drag);
}

void parseMotor(const YAML::Node& node, MotorSpec& motor) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "motor", {"propellant_density", "burn_rate_coefficient", "burn_rate_exponent",
                                    "characteristic_velocity", "gamma", "chamber_volume",
                                    "chamber_diameter", "liner_thickness", "max_chamber_pressure",
                                    "average_pressure_ratio", "discharge_coefficient",
                                    "nozzle_efficiency", "expansion_ratio", "burn_time"});
    read(node, "motor", "propellant_density", motor.propellant_density);
    read(node, "motor", "burn_rate_coefficient", motor.burn_rate_coefficient);
    read(node, "motor", "burn_rate_exponent", motor.burn_rate_exponent);
    read(node, "motor", "characteristic_velocity", motor.characteristic_velocity);
    read(node, "motor", "gamma", motor.gamma);
    read(node, "motor", "chamber_volume", motor.chamber_volume);
    read(node, "motor", "chamber_diameter", motor.chamber_diameter);
    read(node, "motor", "liner_thickness", motor.liner_thickness);
    read(node, "motor", "max_chamber_pressure", motor.max_chamber_pressure);
    read(node, "motor", "average_pressure_ratio", motor.average_pressure_ratio);
    read(node, "motor", "discharge_coefficient", motor.discharge_coefficient);
    read(node, "motor", "nozzle_efficiency", motor.nozzle_efficiency);
    read(node, "motor", "expansion_ratio", motor.expansion_ratio);
    read(node, "motor", "burn_time", motor.burn_time);
}

void parseGrain(const YAML::Node& node, design::DesignConfig& config) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "grain", {"mode", "segments", "inhibit_ends", "core_diameter",
                                    "outer_diameter", "segment_length"});
    std::string mode = design::toString(config.grain_mode);
    read(node, "grain", "mode", mode);
    config.grain_mode = design::grainModeFromString(mode);

    GrainGeometry& grain = config.grain;
    read(node, "grain", "segments", grain.segments);
    read(node, "grain", "inhibit_ends", grain.inhibit_ends);
    read(node, "grain", "core_diameter", grain.core_diameter);
    read(node, "grain", "segment_length", grain.segment_length);
    if (node["outer_diameter"]) {
        read(node, "grain", "outer_diameter", grain.outer_diameter);
    } else {
        grain.outer_diameter = config.motor.grainOuterDiameter();
    }
}

void parseTolerances(const YAML::Node& node, design::Tolerances& tol) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "tolerance", {"altitude_eps", "altitude_rel_eps", "integrator_abs_tol",
                                        "integrator_rel_tol", "pressure_rel_tol", "burn_time_rel_tol"});
    read(node, "tolerance", "altitude_eps", tol.altitude_eps);
    read(node, "tolerance", "altitude_rel_eps", tol.altitude_rel_eps);
    read(node, "tolerance", "integrator_abs_tol", tol.integrator_abs_tol);
    read(node, "tolerance", "integrator_rel_tol", tol.integrator_rel_tol);
    read(node, "tolerance", "pressure_rel_tol", tol.pressure_rel_tol);
    read(node, "tolerance", "burn_time_rel_tol", tol.burn_time_rel_tol);
}

void parseLimits(const YAML::Node& node, design::IterationLimits& limits) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "iteration_limits", {"optimizer_max_iter", "grain_solver_max_iter",
                                               "bracket_expansions", "pressure_max_iter",
                                               "max_step_rejections"});
    read(node, "iteration_limits", "optimizer_max_iter", limits.optimizer_max_iter);
    read(node, "iteration_limits", "grain_solver_max_iter", limits.grain_solver_max_iter);
    read(node, "iteration_limits", "bracket_expansions", limits.bracket_expansions);
    read(node, "iteration_limits", "pressure_max_iter", limits.pressure_max_iter);
    read(node, "iteration_limits", "max_step_rejections", limits.max_step_rejections);
}

void parseIntegrator(const YAML::Node& node, design::IntegratorSettings& integ) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "integrator", {"method", "initial_step", "min_step", "max_step",
                                         "fixed_step", "t_max", "simulate_descent"});
    if (node["method"]) {
        std::string method;
        read(node, "integrator", "method", method);
        integ.method = physics::integratorMethodFromString(method);
    }
    read(node, "integrator", "initial_step", integ.initial_step);
    read(node, "integrator", "min_step", integ.min_step);
    read(node, "integrator", "max_step", integ.max_step);
    read(node, "integrator", "fixed_step", integ.fixed_step);
    read(node, "integrator", "t_max", integ.t_max);
    read(node, "integrator", "simulate_descent", integ.simulate_descent);
}

void parseSearch(const YAML::Node& node, design::SearchSettings& search) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "search", {"thrust_min", "thrust_max", "thrust_min_limit", "thrust_max_limit"});
    read(node, "search", "thrust_min", search.thrust_min);
    read(node, "search", "thrust_max", search.thrust_max);
    read(node, "search", "thrust_min_limit", search.thrust_min_limit);
    read(node, "search", "thrust_max_limit", search.thrust_max_limit);
}

void parseBallistics(const YAML::Node& node, design::BallisticsSettings& ball) {
    if (!node) {
        return;
    }
    warnUnknownKeys(node, "ballistics", {"time_step", "min_port_ratio", "erosive_port_ratio",
                                         "erosive_ld_limit", "max_steps"});
    read(node, "ballistics", "time_step", ball.time_step);
    read(node, "ballistics", "min_port_ratio", ball.min_port_ratio);
    read(node, "ballistics", "erosive_port_ratio", ball.erosive_port_ratio);
    read(node, "ballistics", "erosive_ld_limit", ball.erosive_ld_limit);
    read(node, "ballistics", "max_steps", ball.max_steps);
}

} // namespace

design::DesignConfig parseDesignConfig(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw InvalidInput("design configuration must be a YAML map");
    }
    warnUnknownKeys(root, "", {"target_altitude", "rocket", "motor", "grain", "tolerance",
                               "iteration_limits", "integrator", "search", "ballistics",
                               "verify_with_ballistics"});

    design::DesignConfig config;
    read(root, "", "target_altitude", config.target_altitude);
    read(root, "", "verify_with_ballistics", config.verify_with_ballistics);
    parseRocket(section(root, "rocket"), config.rocket);
    // Motor before grain: the grain defaults to the liner's inner diameter
    parseMotor(section(root, "motor"), config.motor);
    config.grain.outer_diameter = config.motor.grainOuterDiameter();
    parseGrain(section(root, "grain"), config);
    parseTolerances(section(root, "tolerance"), config.tolerance);
    parseLimits(section(root, "iteration_limits"), config.limits);
    parseIntegrator(section(root, "integrator"), config.integrator);
    parseSearch(section(root, "search"), config.search);
    parseBallistics(section(root, "ballistics"), config.ballistics);

    design::validate(config);
    return config;
}

design::DesignConfig loadDesignConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw InvalidInput("cannot open configuration file '" + path + "'");
    } catch (const YAML::Exception& e) {
        throw InvalidInput("cannot parse configuration file '" + path + "': " + e.what());
    }
    spdlog::debug("loaded configuration {}", path);
    return parseDesignConfig(root);
}

} // namespace config
} // namespace srm_design
