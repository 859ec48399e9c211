#pragma once

#include "physics/types.hpp"
#include "physics/propulsion/thrust_profile.hpp"
#include "design/design_config.hpp"
#include <memory>
#include <vector>

namespace srm_design {
namespace design {

/**
 * @brief Motor state at one regression step
 */
struct BallisticsSample {
    double t;                       // [s]
    double regression;              // Distance burned [m]
    double core_diameter;           // [m]
    double segment_length;          // [m]
    double burn_area;               // [m²]
    double kn;                      // Burn area / throat area [-]
    double chamber_pressure;        // [Pa]
    double burn_rate;               // [m/s]
    double mass_flow;               // [kg/s]
    double thrust;                  // [N]
    double propellant_remaining;    // [kg]

    BallisticsSample() : t(0.0), regression(0.0), core_diameter(0.0), segment_length(0.0),
                         burn_area(0.0), kn(0.0), chamber_pressure(0.0), burn_rate(0.0),
                         mass_flow(0.0), thrust(0.0), propellant_remaining(0.0) {}
};

/**
 * @brief Time series and summary of one internal-ballistics run
 */
struct BallisticsResult {
    std::vector<BallisticsSample> samples;
    double burn_time;               // [s]
    double average_pressure;        // Time averaged over the burn [Pa]
    double peak_pressure;           // [Pa]
    double average_thrust;          // [N]
    double peak_thrust;             // [N]
    double total_impulse;           // [N*s]
    double propellant_consumed;     // Grain mass burned between ignition and web burnout [kg]
    double initial_kn;              // [-]
    double peak_kn;                 // [-]
    double specific_impulse;        // Delivered total_impulse / (consumed * g0) [s]
    bool tail_off;                  // Nozzle unchoked before the web was consumed

    BallisticsResult() : burn_time(0.0), average_pressure(0.0), peak_pressure(0.0),
                         average_thrust(0.0), peak_thrust(0.0), total_impulse(0.0),
                         propellant_consumed(0.0), initial_kn(0.0), peak_kn(0.0),
                         specific_impulse(0.0), tail_off(false) {}
};

struct BallisticsOptions {
    double time_step;           // [s]
    double ambient_pressure;    // [Pa]
    double pressure_rel_tol;
    int pressure_max_iter;
    int max_steps;

    BallisticsOptions() : time_step(1e-3), ambient_pressure(101325.0), pressure_rel_tol(1e-9),
                          pressure_max_iter(200), max_steps(1000000) {}
};

BallisticsOptions makeBallisticsOptions(const DesignConfig& config, double ambient_pressure);

/**
 * @brief True when the grain generates enough gas to choke the throat at ambient pressure
 */
bool isChoked(const MotorSpec& motor, double burn_area, double throat_area, double ambient_pressure);

/**
 * @brief Quasi-steady chamber pressure
 *
 * Solves rho_p * Ab * a * (Pc/1e6)^n = Pc * Cd * At / c* by bisection on
 * [ambient, MEOP].
 * @throws OverPressure if the root lies above MEOP
 * @throws InvalidGeometry if the nozzle is not choked (no root above ambient)
 */
double solveChamberPressure(const MotorSpec& motor, double burn_area, double throat_area,
                            double ambient_pressure, double rel_tol = 1e-9, int max_iter = 200);

/**
 * @brief March a BATES grain from ignition to web burnout
 *
 * The final step is shortened so the web is consumed exactly at the
 * reported burn time. If the nozzle unchokes after ignition the motor
 * tails off at ambient pressure with zero thrust.
 * @throws InvalidGeometry for an invalid grain or a nozzle unchoked at ignition
 * @throws OverPressure if Pc rises above MEOP at any step
 */
BallisticsResult simulateBallistics(const MotorSpec& motor, const GrainGeometry& grain,
                                    const NozzleDesign& nozzle, const BallisticsOptions& options);

/**
 * @brief Tabulated thrust curve of a ballistics run
 *
 * Mass flow is rescaled so that the linearly interpolated curve carries
 * exactly propellant_consumed.
 */
std::shared_ptr<physics::propulsion::TabulatedThrustProfile> makeThrustProfile(
    const BallisticsResult& ballistics);

} // namespace design
} // namespace srm_design
