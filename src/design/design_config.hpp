#pragma once

#include "physics/types.hpp"
#include "physics/integrator.hpp"
#include <string>

namespace srm_design {
namespace design {

/**
 * @brief Convergence tolerances of every solver in the pipeline
 */
struct Tolerances {
    double altitude_eps;            // Absolute apogee tolerance [m]
    double altitude_rel_eps;        // Relative apogee tolerance [-]
    double integrator_abs_tol;
    double integrator_rel_tol;
    double pressure_rel_tol;        // Chamber pressure bisection [-]
    double burn_time_rel_tol;       // Grain sizing target [-]

    Tolerances() : altitude_eps(1.0), altitude_rel_eps(1e-3), integrator_abs_tol(1e-6),
                   integrator_rel_tol(1e-6), pressure_rel_tol(1e-9), burn_time_rel_tol(1e-3) {}
};

/**
 * @brief Iteration budgets
 */
struct IterationLimits {
    int optimizer_max_iter;
    int grain_solver_max_iter;
    int bracket_expansions;
    int pressure_max_iter;
    int max_step_rejections;

    IterationLimits() : optimizer_max_iter(100), grain_solver_max_iter(60), bracket_expansions(20),
                        pressure_max_iter(200), max_step_rejections(50) {}
};

struct IntegratorSettings {
    physics::IntegratorMethod method;
    double initial_step;    // [s]
    double min_step;        // [s]
    double max_step;        // [s]
    double fixed_step;      // RK4 step [s]
    double t_max;           // [s]
    bool simulate_descent;

    IntegratorSettings() : method(physics::IntegratorMethod::RK45), initial_step(1e-3),
                           min_step(1e-9), max_step(0.05), fixed_step(0.01), t_max(300.0),
                           simulate_descent(false) {}
};

/**
 * @brief Initial thrust bracket and hard limits of its re-expansion [N]
 */
struct SearchSettings {
    double thrust_min;
    double thrust_max;
    double thrust_min_limit;
    double thrust_max_limit;

    SearchSettings() : thrust_min(1.0), thrust_max(1000.0), thrust_min_limit(1e-3),
                       thrust_max_limit(1e6) {}
};

struct BallisticsSettings {
    double time_step;           // Regression time step [s]
    double min_port_ratio;      // Port area / throat area lower bound
    double erosive_port_ratio;  // Port ratio used when L/D exceeds erosive_ld_limit
    double erosive_ld_limit;    // Grain L/D above which erosive burning is a risk
    int max_steps;

    BallisticsSettings() : time_step(1e-3), min_port_ratio(2.0), erosive_port_ratio(3.0),
                           erosive_ld_limit(6.0), max_steps(1000000) {}
};

enum class GrainMode {
    FIXED,      // Use the configured grain as is
    SIZED       // Solve core diameter and segment length for the target burn time
};

/**
 * @brief Complete input of one design run
 */
struct DesignConfig {
    double target_altitude;         // Apogee above the launch site [m]
    RocketSpec rocket;
    MotorSpec motor;
    GrainGeometry grain;            // Used as is in FIXED mode, segment count in SIZED mode
    GrainMode grain_mode;
    Tolerances tolerance;
    IterationLimits limits;
    IntegratorSettings integrator;
    SearchSettings search;
    BallisticsSettings ballistics;
    bool verify_with_ballistics;    // Fly the ballistics thrust curve after sizing

    DesignConfig() : target_altitude(500.0), grain_mode(GrainMode::SIZED),
                     verify_with_ballistics(true) {}
};

/**
 * @brief Check every field for physical validity
 * @throws InvalidInput naming the first offending field
 */
void validate(const DesignConfig& config);

/**
 * @brief Integrator options derived from the configuration
 */
physics::IntegratorOptions makeIntegratorOptions(const DesignConfig& config);

const char* toString(GrainMode mode);
GrainMode grainModeFromString(const std::string& name);

} // namespace design
} // namespace srm_design
