#pragma once

#include "physics/types.hpp"
#include "design/ballistics.hpp"
#include "design/design_config.hpp"

namespace srm_design {
namespace design {

/**
 * @brief Inputs of the BATES grain sizing loop
 */
struct GrainSizingRequest {
    MotorSpec motor;
    NozzleDesign nozzle;
    double propellant_mass;         // [kg]
    int segments;
    bool inhibit_ends;
    BallisticsSettings settings;
    BallisticsOptions ballistics;
    double burn_time_rel_tol;
    int max_iter;

    GrainSizingRequest() : propellant_mass(0.0), segments(1), inhibit_ends(false),
                           burn_time_rel_tol(1e-3), max_iter(60) {}
};

/**
 * @brief Sized grain with its ballistics and design checks
 */
struct GrainSizingResult {
    GrainGeometry grain;
    BallisticsResult ballistics;
    int iterations;
    double min_core_diameter;       // Lower bound from the port-to-throat ratio [m]
    double port_to_throat_ratio;    // Initial port area / throat area [-]
    double length_to_diameter;      // Total grain length / outer diameter [-]
    bool erosive_risk;
    double burn_time;               // Achieved burn time [s]

    GrainSizingResult() : iterations(0), min_core_diameter(0.0), port_to_throat_ratio(0.0),
                          length_to_diameter(0.0), erosive_risk(false), burn_time(0.0) {}
};

GrainSizingRequest makeGrainSizingRequest(const DesignConfig& config, const NozzleDesign& nozzle,
                                          const BallisticsOptions& ballistics);

/**
 * @brief Grain of a given core diameter holding the requested propellant mass
 *
 * Segment length follows from mass conservation:
 * L = m / (rho * pi/4 * (D² - d²)) / N.
 */
GrainGeometry grainForCoreDiameter(double core_diameter, double outer_diameter,
                                   double propellant_mass, double density, int segments,
                                   bool inhibit_ends);

/**
 * @brief Smallest core diameter giving port area = port_ratio * throat area
 */
double minimumCoreDiameter(double throat_area, double port_ratio);

/**
 * @brief Initial guess: the core at the minimum port-to-throat ratio
 *
 * The ratio is raised to the erosive limit when the grain at the minimum
 * ratio is longer than erosive_ld_limit diameters. No ballistics are run.
 */
GrainSizingResult initialGrainGuess(const GrainSizingRequest& request);

/**
 * @brief Port ratio, L/D and erosive risk of a given grain, with its ballistics
 * @throws InvalidGeometry if the grain does not fit the chamber
 */
GrainSizingResult analyseGrain(const GrainGeometry& grain, const GrainSizingRequest& request);

/**
 * @brief Solve the core diameter so the simulated burn time matches the target
 *
 * Bisection between the minimum core diameter and 95 % of the grain
 * diameter. A larger core gives a thinner web and a shorter burn.
 * @throws InfeasibleDesign if the target burn time is not bracketed
 * @throws NonConvergence if the iteration budget is exhausted
 * @throws InvalidGeometry if the grain does not fit the chamber
 */
GrainSizingResult sizeGrain(const GrainSizingRequest& request);

} // namespace design
} // namespace srm_design
