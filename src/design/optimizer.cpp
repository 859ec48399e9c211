#include "design/optimizer.hpp"
#include "physics/dynamics.hpp"
#include "physics/integrator.hpp"
#include "utils/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace srm_design {
namespace design {

TrajectoryResult flyThrustProfile(const DesignConfig& config,
                                  std::shared_ptr<const physics::Atmosphere> atmosphere,
                                  std::shared_ptr<const physics::propulsion::ThrustProfile> profile,
                                  bool record_samples) {
    auto dynamics = physics::createAscentDynamics(config.rocket, std::move(atmosphere), std::move(profile));
    physics::IntegratorOptions options = makeIntegratorOptions(config);
    options.record_samples = record_samples;
    auto integrator = physics::createIntegrator(config.integrator.method, dynamics, options);
    return integrator->integrate();
}

TrajectoryResult flyConstantThrust(const DesignConfig& config,
                                   std::shared_ptr<const physics::Atmosphere> atmosphere,
                                   double thrust, bool record_samples) {
    auto profile = physics::propulsion::createConstantThrustProfile(
        thrust, config.motor.burn_time, config.rocket.propellant_mass,
        config.motor.designChamberPressure());
    return flyThrustProfile(config, std::move(atmosphere), profile, record_samples);
}

ThrustOptimizer::ThrustOptimizer(const DesignConfig& config, ApogeeFunc apogee_func)
    : config_(config), atmosphere_(physics::createISAAtmosphere()),
      apogee_func_(std::move(apogee_func)), uses_model_(false) {
    validate(config_);
    if (!apogee_func_) {
        uses_model_ = true;
        DesignConfig model_config = config_;
        auto atmosphere = atmosphere_;
        apogee_func_ = [model_config, atmosphere](double thrust) {
            return flyConstantThrust(model_config, atmosphere, thrust, false).apogee_altitude;
        };
    }
}

double ThrustOptimizer::apogeeTolerance() const {
    return std::max(config_.tolerance.altitude_eps,
                    config_.tolerance.altitude_rel_eps * config_.target_altitude);
}

OptimizationResult ThrustOptimizer::optimize() const {
    const double target = config_.target_altitude;
    const double tol = apogeeTolerance();
    const SearchSettings& search = config_.search;

    OptimizationResult result;

    auto evaluate = [&](double thrust) {
        double apogee = apogee_func_(thrust);
        if (!std::isfinite(apogee)) {
            std::ostringstream msg;
            msg << "apogee model returned a non-finite value at thrust " << thrust << " N";
            throw InfeasibleDesign(msg.str());
        }
        result.history.push_back({thrust, apogee});
        result.evaluations++;
        return apogee;
    };

    double lo = search.thrust_min;
    double hi = search.thrust_max;
    double ap_lo = evaluate(lo);
    double ap_hi = evaluate(hi);

    while (!(ap_lo < target && target < ap_hi)) {
        bool expanded = false;
        if (result.bracket_expansions < config_.limits.bracket_expansions) {
            if (ap_hi <= target && hi < search.thrust_max_limit) {
                hi = std::min(2.0 * hi, search.thrust_max_limit);
                ap_hi = evaluate(hi);
                expanded = true;
            }
            if (ap_lo >= target && lo > search.thrust_min_limit) {
                lo = std::max(0.5 * lo, search.thrust_min_limit);
                ap_lo = evaluate(lo);
                expanded = true;
            }
        }
        if (!expanded) {
            std::ostringstream msg;
            msg << "no thrust bracket reaches the target apogee of " << target << " m: apogee("
                << lo << " N) = " << ap_lo << " m, apogee(" << hi << " N) = " << ap_hi << " m";
            throw InfeasibleDesign(msg.str());
        }
        result.bracket_expansions++;
        spdlog::debug("bracket expanded to [{:.4g}, {:.4g}] N -> [{:.3f}, {:.3f}] m", lo, hi, ap_lo, ap_hi);
    }

    ThrustEvaluation best = (std::abs(ap_lo - target) < std::abs(ap_hi - target))
        ? ThrustEvaluation{lo, ap_lo} : ThrustEvaluation{hi, ap_hi};

    for (int iter = 1; iter <= config_.limits.optimizer_max_iter; ++iter) {
        double mid = 0.5 * (lo + hi);
        double ap = evaluate(mid);
        result.iterations = iter;
        spdlog::debug("optimizer iter {}: thrust={:.6f} N apogee={:.4f} m (target {:.4f} m)",
                      iter, mid, ap, target);

        // Allow the flat region of no lift-off and integration noise below tol
        if (ap < ap_lo - tol || ap > ap_hi + tol) {
            std::ostringstream msg;
            msg << "apogee is not monotonic in thrust: apogee(" << mid << " N) = " << ap
                << " m outside [" << ap_lo << ", " << ap_hi << "] m";
            throw InfeasibleDesign(msg.str());
        }

        if (std::abs(ap - target) < std::abs(best.apogee - target)) {
            best = {mid, ap};
        }
        if (std::abs(ap - target) < tol) {
            result.thrust = mid;
            result.apogee = ap;
            result.bracket_low = lo;
            result.bracket_high = hi;
            if (uses_model_) {
                result.trajectory = flyConstantThrust(config_, atmosphere_, mid, true);
                result.has_trajectory = true;
            }
            return result;
        }

        if (ap < target) {
            lo = mid;
            ap_lo = ap;
        } else {
            hi = mid;
            ap_hi = ap;
        }
    }

    std::ostringstream msg;
    msg << "thrust search did not converge within " << config_.limits.optimizer_max_iter
        << " iterations (best " << best.thrust << " N -> " << best.apogee << " m)";
    throw NonConvergence(msg.str(), best.thrust, best.apogee, config_.limits.optimizer_max_iter);
}

} // namespace design
} // namespace srm_design
