#include "design/grain_sizing.hpp"
#include "utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <sstream>

namespace srm_design {
namespace design {

namespace {

// Outcome of one trial core diameter
struct Trial {
    bool over_pressure;
    BallisticsResult ballistics;
};

Trial runTrial(const GrainSizingRequest& request, const GrainGeometry& grain) {
    Trial trial{false, BallisticsResult()};
    try {
        trial.ballistics = simulateBallistics(request.motor, grain, request.nozzle, request.ballistics);
    } catch (const OverPressure& e) {
        spdlog::debug("grain d={:.3f} mm: {}", grain.core_diameter * 1e3, e.what());
        trial.over_pressure = true;
    }
    return trial;
}

void checkFitsChamber(const GrainGeometry& grain, const MotorSpec& motor) {
    double envelope = utils::circleArea(grain.outer_diameter) * grain.totalLength();
    if (envelope > motor.chamber_volume) {
        std::ostringstream msg;
        msg << "grain envelope of " << envelope * 1e6 << " cm³ exceeds the chamber volume of "
            << motor.chamber_volume * 1e6 << " cm³";
        throw InvalidGeometry(msg.str());
    }
}

} // namespace

GrainSizingRequest makeGrainSizingRequest(const DesignConfig& config, const NozzleDesign& nozzle,
                                          const BallisticsOptions& ballistics) {
    GrainSizingRequest request;
    request.motor = config.motor;
    request.nozzle = nozzle;
    request.propellant_mass = config.rocket.propellant_mass;
    request.segments = config.grain.segments;
    request.inhibit_ends = config.grain.inhibit_ends;
    request.settings = config.ballistics;
    request.ballistics = ballistics;
    request.burn_time_rel_tol = config.tolerance.burn_time_rel_tol;
    request.max_iter = config.limits.grain_solver_max_iter;
    return request;
}

GrainGeometry grainForCoreDiameter(double core_diameter, double outer_diameter,
                                   double propellant_mass, double density, int segments,
                                   bool inhibit_ends) {
    double cross_section = 0.25 * kPi * (outer_diameter * outer_diameter - core_diameter * core_diameter);
    if (!(cross_section > 0.0) || segments < 1) {
        throw InvalidGeometry("core diameter must be smaller than the grain diameter");
    }
    double length = propellant_mass / (density * cross_section) / segments;
    return GrainGeometry(core_diameter, outer_diameter, length, segments, inhibit_ends);
}

double minimumCoreDiameter(double throat_area, double port_ratio) {
    return std::sqrt(4.0 * port_ratio * throat_area / kPi);
}

GrainSizingResult initialGrainGuess(const GrainSizingRequest& request) {
    const MotorSpec& motor = request.motor;
    const double D = motor.grainOuterDiameter();
    const double At = request.nozzle.throat_area;

    GrainSizingResult guess;
    double d_min = minimumCoreDiameter(At, request.settings.min_port_ratio);
    if (d_min >= D) {
        throw InfeasibleDesign("throat too large: the minimum core diameter exceeds the grain diameter");
    }
    GrainGeometry grain = grainForCoreDiameter(d_min, D, request.propellant_mass,
                                               motor.propellant_density, request.segments,
                                               request.inhibit_ends);

    if (grain.totalLength() / D > request.settings.erosive_ld_limit) {
        guess.erosive_risk = true;
        d_min = minimumCoreDiameter(At, request.settings.erosive_port_ratio);
        if (d_min >= D) {
            throw InfeasibleDesign("throat too large for the erosive-burning port ratio");
        }
        grain = grainForCoreDiameter(d_min, D, request.propellant_mass, motor.propellant_density,
                                     request.segments, request.inhibit_ends);
    }

    guess.grain = grain;
    guess.min_core_diameter = d_min;
    guess.port_to_throat_ratio = utils::circleArea(d_min) / At;
    guess.length_to_diameter = grain.totalLength() / D;
    return guess;
}

GrainSizingResult analyseGrain(const GrainGeometry& grain, const GrainSizingRequest& request) {
    checkFitsChamber(grain, request.motor);

    GrainSizingResult result;
    result.grain = grain;
    result.min_core_diameter = minimumCoreDiameter(request.nozzle.throat_area,
                                                   request.settings.min_port_ratio);
    result.port_to_throat_ratio = utils::circleArea(grain.core_diameter) / request.nozzle.throat_area;
    result.length_to_diameter = grain.totalLength() / grain.outer_diameter;
    result.erosive_risk = result.length_to_diameter > request.settings.erosive_ld_limit &&
                          result.port_to_throat_ratio < request.settings.erosive_port_ratio;
    result.ballistics = simulateBallistics(request.motor, grain, request.nozzle, request.ballistics);
    result.burn_time = result.ballistics.burn_time;
    return result;
}

GrainSizingResult sizeGrain(const GrainSizingRequest& request) {
    if (!(request.propellant_mass > 0.0)) {
        throw InvalidInput("propellant mass must be positive");
    }
    const MotorSpec& motor = request.motor;
    const double D = motor.grainOuterDiameter();
    const double target = motor.burn_time;
    const double tol = request.burn_time_rel_tol * target;

    GrainSizingResult guess = initialGrainGuess(request);
    checkFitsChamber(guess.grain, motor);

    auto make = [&](double d) {
        return grainForCoreDiameter(d, D, request.propellant_mass, motor.propellant_density,
                                    request.segments, request.inhibit_ends);
    };
    auto finish = [&](const GrainGeometry& grain, const BallisticsResult& ballistics, int iterations) {
        checkFitsChamber(grain, motor);
        GrainSizingResult result;
        result.grain = grain;
        result.ballistics = ballistics;
        result.iterations = iterations;
        result.min_core_diameter = guess.min_core_diameter;
        result.port_to_throat_ratio = utils::circleArea(grain.core_diameter) / request.nozzle.throat_area;
        result.length_to_diameter = grain.totalLength() / D;
        result.erosive_risk = guess.erosive_risk ||
                              result.length_to_diameter > request.settings.erosive_ld_limit;
        result.burn_time = ballistics.burn_time;
        return result;
    };

    double lo = guess.min_core_diameter;
    double hi = 0.95 * D;
    if (!(lo < hi)) {
        throw InfeasibleDesign("no room between the minimum core diameter and the grain diameter");
    }

    // Thickest web: must burn at least as long as the target
    GrainGeometry grain_lo = make(lo);
    BallisticsResult ball_lo = simulateBallistics(motor, grain_lo, request.nozzle, request.ballistics);
    spdlog::debug("grain sizing lo d={:.3f} mm tb={:.4f} s", lo * 1e3, ball_lo.burn_time);
    if (std::abs(ball_lo.burn_time - target) <= tol) {
        return finish(grain_lo, ball_lo, 0);
    }
    if (ball_lo.burn_time < target) {
        std::ostringstream msg;
        msg << "target burn time " << target << " s not reachable: the thickest admissible web burns out in "
            << ball_lo.burn_time << " s";
        throw InfeasibleDesign(msg.str());
    }

    // Thinnest web: must burn out sooner than the target (over-pressure counts as too fast)
    GrainGeometry grain_hi = make(hi);
    Trial trial_hi = runTrial(request, grain_hi);
    if (!trial_hi.over_pressure) {
        spdlog::debug("grain sizing hi d={:.3f} mm tb={:.4f} s", hi * 1e3, trial_hi.ballistics.burn_time);
        if (std::abs(trial_hi.ballistics.burn_time - target) <= tol) {
            return finish(grain_hi, trial_hi.ballistics, 0);
        }
        if (trial_hi.ballistics.burn_time > target) {
            std::ostringstream msg;
            msg << "target burn time " << target << " s not reachable: the thinnest web still burns for "
                << trial_hi.ballistics.burn_time << " s";
            throw InfeasibleDesign(msg.str());
        }
    }

    double best_d = lo;
    double best_tb = ball_lo.burn_time;
    for (int iter = 1; iter <= request.max_iter; ++iter) {
        double mid = 0.5 * (lo + hi);
        GrainGeometry grain = make(mid);
        Trial trial = runTrial(request, grain);

        if (trial.over_pressure) {
            hi = mid;
            continue;
        }
        double tb = trial.ballistics.burn_time;
        spdlog::debug("grain sizing iter {} d={:.4f} mm L={:.4f} mm tb={:.5f} s",
                      iter, mid * 1e3, grain.segment_length * 1e3, tb);

        if (std::abs(tb - target) < std::abs(best_tb - target)) {
            best_d = mid;
            best_tb = tb;
        }
        if (std::abs(tb - target) <= tol) {
            return finish(grain, trial.ballistics, iter);
        }
        if (tb < target) {
            hi = mid;
        } else {
            lo = mid;
        }
    }

    std::ostringstream msg;
    msg << "grain sizing did not reach burn time " << target << " s within " << request.max_iter
        << " iterations";
    throw NonConvergence(msg.str(), best_d, best_tb, request.max_iter);
}

} // namespace design
} // namespace srm_design
