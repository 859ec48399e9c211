#pragma once

#include "physics/types.hpp"
#include "design/design_config.hpp"

namespace srm_design {
namespace design {
namespace nozzle {

/**
 * @brief Isentropic area ratio A/A* at Mach number M
 */
double areaRatioFromMach(double mach, double gamma);

/**
 * @brief Supersonic Mach number with A/A* = area_ratio
 *
 * Bisection on [1, hi], hi doubled until it brackets the root.
 * @throws InvalidGeometry if area_ratio < 1 or the root cannot be bracketed
 */
double exitMachFromAreaRatio(double area_ratio, double gamma, double rel_tol = 1e-12,
                             int max_iter = 200);

/**
 * @brief Static over stagnation pressure p/pc at Mach number M
 */
double pressureRatioFromMach(double mach, double gamma);

/**
 * @brief Mach number reached when expanding to p/pc = pressure_ratio
 */
double machFromPressureRatio(double pressure_ratio, double gamma);

/**
 * @brief Ideal thrust coefficient
 *
 * C_F = sqrt(2k²/(k-1) (2/(k+1))^((k+1)/(k-1)) (1 - (pe/pc)^((k-1)/k))) + (pe/pc - pa/pc) ε
 */
double thrustCoefficient(double gamma, double area_ratio, double exit_pressure_ratio,
                         double ambient_pressure_ratio);

/**
 * @brief Inputs of the nozzle sizing problem
 */
struct NozzleRequest {
    double thrust;                  // Required delivered thrust [N]
    double chamber_pressure;        // Design chamber pressure [Pa]
    double ambient_pressure;        // [Pa]
    double gamma;                   // [-]
    double efficiency;              // η [-]
    double expansion_ratio;         // ε; <= 0 selects optimum expansion (pe = pa)
    double characteristic_velocity; // c* [m/s]
    double max_chamber_pressure;    // MEOP [Pa]

    NozzleRequest() : thrust(0.0), chamber_pressure(0.0), ambient_pressure(101325.0), gamma(1.2),
                      efficiency(1.0), expansion_ratio(0.0), characteristic_velocity(0.0),
                      max_chamber_pressure(0.0) {}
};

/**
 * @brief Size throat and exit for the requested thrust
 *
 * At = F / (Pc C_F η), Ae = ε At.
 * @throws InvalidInput for non-physical inputs
 * @throws OverPressure if Pc exceeds MEOP
 * @throws InvalidGeometry if Pc <= pa, C_F <= 0 or an area is not positive and finite
 */
NozzleDesign solveNozzle(const NozzleRequest& request);

/**
 * @brief Request for a thrust level using the motor's design point
 */
NozzleRequest makeNozzleRequest(const MotorSpec& motor, double thrust, double ambient_pressure);

/**
 * @brief Thrust of a sized nozzle at an off-design chamber pressure
 *
 * Expansion ratio stays fixed so pe/pc is unchanged; zero when Pc <= pa.
 */
double deliveredThrust(const NozzleDesign& nozzle, double gamma, double chamber_pressure,
                       double ambient_pressure);

} // namespace nozzle
} // namespace design
} // namespace srm_design
