#include "design/nozzle.hpp"
#include "physics/core/event_detection.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace srm_design {
namespace design {
namespace nozzle {

double areaRatioFromMach(double mach, double gamma) {
    double term = (2.0 / (gamma + 1.0)) * (1.0 + 0.5 * (gamma - 1.0) * mach * mach);
    return std::pow(term, (gamma + 1.0) / (2.0 * (gamma - 1.0))) / mach;
}

double exitMachFromAreaRatio(double area_ratio, double gamma, double rel_tol, int max_iter) {
    if (!std::isfinite(area_ratio) || area_ratio < 1.0) {
        throw InvalidGeometry("expansion ratio must be finite and >= 1");
    }
    if (area_ratio == 1.0) {
        return 1.0;
    }

    double hi = 2.0;
    int doublings = 0;
    while (areaRatioFromMach(hi, gamma) < area_ratio) {
        hi *= 2.0;
        if (++doublings > 60) {
            throw InvalidGeometry("no supersonic Mach number matches the expansion ratio");
        }
    }

    auto f = [&](double mach) { return areaRatioFromMach(mach, gamma) - area_ratio; };
    physics::core::RootResult root = physics::core::find_root_bisection(f, 1.0, hi, rel_tol, max_iter);
    if (!root.bracketed || !std::isfinite(root.x)) {
        throw InvalidGeometry("exit Mach number could not be bracketed");
    }
    return root.x;
}

double pressureRatioFromMach(double mach, double gamma) {
    return std::pow(1.0 + 0.5 * (gamma - 1.0) * mach * mach, -gamma / (gamma - 1.0));
}

double machFromPressureRatio(double pressure_ratio, double gamma) {
    if (!(pressure_ratio > 0.0 && pressure_ratio <= 1.0)) {
        throw InvalidGeometry("pressure ratio must lie in (0, 1]");
    }
    double term = std::pow(1.0 / pressure_ratio, (gamma - 1.0) / gamma) - 1.0;
    return std::sqrt(2.0 / (gamma - 1.0) * term);
}

double thrustCoefficient(double gamma, double area_ratio, double exit_pressure_ratio,
                         double ambient_pressure_ratio) {
    const double k = gamma;
    double term1 = 2.0 * k * k / (k - 1.0);
    double term2 = std::pow(2.0 / (k + 1.0), (k + 1.0) / (k - 1.0));
    double term3 = 1.0 - std::pow(exit_pressure_ratio, (k - 1.0) / k);
    return std::sqrt(term1 * term2 * term3) + (exit_pressure_ratio - ambient_pressure_ratio) * area_ratio;
}

NozzleDesign solveNozzle(const NozzleRequest& request) {
    if (!std::isfinite(request.thrust) || !(request.thrust > 0.0)) {
        throw InvalidInput("nozzle thrust must be positive and finite");
    }
    if (!(request.gamma > 1.0)) {
        throw InvalidInput("gamma must be greater than 1");
    }
    if (!(request.efficiency > 0.0 && request.efficiency <= 1.0)) {
        throw InvalidInput("nozzle efficiency must lie in (0, 1]");
    }
    if (!std::isfinite(request.chamber_pressure) || !std::isfinite(request.ambient_pressure) ||
        !(request.ambient_pressure >= 0.0)) {
        throw InvalidInput("chamber and ambient pressure must be finite");
    }
    if (request.max_chamber_pressure > 0.0 && request.chamber_pressure > request.max_chamber_pressure) {
        std::ostringstream msg;
        msg << "design chamber pressure " << request.chamber_pressure << " Pa exceeds MEOP "
            << request.max_chamber_pressure << " Pa";
        throw OverPressure(msg.str());
    }
    if (!(request.chamber_pressure > request.ambient_pressure)) {
        throw InvalidGeometry("chamber pressure must exceed ambient pressure for a choked nozzle");
    }

    NozzleDesign design;
    design.chamber_pressure = request.chamber_pressure;
    design.ambient_pressure = request.ambient_pressure;
    design.efficiency = request.efficiency;

    const double pa_over_pc = request.ambient_pressure / request.chamber_pressure;
    if (request.expansion_ratio > 0.0) {
        design.expansion_ratio = request.expansion_ratio;
        design.exit_mach = exitMachFromAreaRatio(request.expansion_ratio, request.gamma);
        design.exit_pressure_ratio = pressureRatioFromMach(design.exit_mach, request.gamma);
    } else {
        // Optimum expansion, pe = pa
        design.exit_pressure_ratio = pa_over_pc;
        design.exit_mach = machFromPressureRatio(pa_over_pc, request.gamma);
        design.expansion_ratio = std::max(areaRatioFromMach(design.exit_mach, request.gamma), 1.0);
    }
    design.design_pressure_ratio = request.ambient_pressure > 0.0
        ? design.exit_pressure_ratio / pa_over_pc
        : std::numeric_limits<double>::infinity();

    design.thrust_coefficient = thrustCoefficient(request.gamma, design.expansion_ratio,
                                                  design.exit_pressure_ratio, pa_over_pc);
    if (!std::isfinite(design.thrust_coefficient) || !(design.thrust_coefficient > 0.0)) {
        throw InvalidGeometry("thrust coefficient is not positive; nozzle is grossly over-expanded");
    }

    design.throat_area = request.thrust /
                         (request.chamber_pressure * design.thrust_coefficient * request.efficiency);
    design.exit_area = design.expansion_ratio * design.throat_area;
    if (!std::isfinite(design.throat_area) || !(design.throat_area > 0.0) ||
        !std::isfinite(design.exit_area) || !(design.exit_area > 0.0)) {
        throw InvalidGeometry("nozzle areas must be positive and finite");
    }
    design.throat_diameter = utils::circleDiameter(design.throat_area);
    design.exit_diameter = utils::circleDiameter(design.exit_area);
    design.specific_impulse = request.characteristic_velocity * design.thrust_coefficient *
                              request.efficiency / kStandardGravity;
    return design;
}

NozzleRequest makeNozzleRequest(const MotorSpec& motor, double thrust, double ambient_pressure) {
    NozzleRequest request;
    request.thrust = thrust;
    request.chamber_pressure = motor.designChamberPressure();
    request.ambient_pressure = ambient_pressure;
    request.gamma = motor.gamma;
    request.efficiency = motor.nozzle_efficiency;
    request.expansion_ratio = motor.expansion_ratio;
    request.characteristic_velocity = motor.characteristic_velocity;
    request.max_chamber_pressure = motor.max_chamber_pressure;
    return request;
}

double deliveredThrust(const NozzleDesign& nozzle, double gamma, double chamber_pressure,
                       double ambient_pressure) {
    if (!(chamber_pressure > ambient_pressure)) {
        return 0.0;
    }
    double cf = thrustCoefficient(gamma, nozzle.expansion_ratio, nozzle.exit_pressure_ratio,
                                  ambient_pressure / chamber_pressure);
    return std::max(chamber_pressure * nozzle.throat_area * cf * nozzle.efficiency, 0.0);
}

} // namespace nozzle
} // namespace design
} // namespace srm_design
