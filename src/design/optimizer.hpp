#pragma once

#include "physics/types.hpp"
#include "physics/atmosphere.hpp"
#include "physics/propulsion/thrust_profile.hpp"
#include "design/design_config.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace srm_design {
namespace design {

/**
 * @brief Apogee above the launch site [m] reached with a constant thrust [N]
 */
using ApogeeFunc = std::function<double(double)>;

struct ThrustEvaluation {
    double thrust;      // [N]
    double apogee;      // [m]
};

/**
 * @brief Converged thrust level and search statistics
 */
struct OptimizationResult {
    double thrust;                          // [N]
    double apogee;                          // [m]
    int iterations;                         // Bisection iterations
    int evaluations;                        // Apogee evaluations including bracketing
    int bracket_expansions;
    double bracket_low;                     // Final bracket [N]
    double bracket_high;
    std::vector<ThrustEvaluation> history;  // Every evaluation in order
    TrajectoryResult trajectory;            // Full run at the converged thrust
    bool has_trajectory;                    // False when an external apogee function was used

    OptimizationResult() : thrust(0.0), apogee(0.0), iterations(0), evaluations(0),
                           bracket_expansions(0), bracket_low(0.0), bracket_high(0.0),
                           has_trajectory(false) {}
};

/**
 * @brief Fly the configured rocket with a given thrust curve
 */
TrajectoryResult flyThrustProfile(const DesignConfig& config,
                                  std::shared_ptr<const physics::Atmosphere> atmosphere,
                                  std::shared_ptr<const physics::propulsion::ThrustProfile> profile,
                                  bool record_samples = true);

/**
 * @brief Fly the configured rocket with constant thrust over the configured burn time
 */
TrajectoryResult flyConstantThrust(const DesignConfig& config,
                                   std::shared_ptr<const physics::Atmosphere> atmosphere,
                                   double thrust, bool record_samples = true);

/**
 * @brief Bracketed bisection on constant thrust to reach the target apogee
 *
 * The bracket is valid only if apogee(lo) < target < apogee(hi); it is
 * re-expanded (hi doubled, lo halved) within the configured limits. Each
 * midpoint apogee must lie between the bracket apogees, otherwise the
 * apogee is not monotonic in thrust and the design is reported infeasible.
 */
class ThrustOptimizer {
public:
    /**
     * @brief Constructor
     * @param config Design configuration, validated here
     * @param apogee_func Apogee model; defaults to integrating the configured rocket
     * @throws InvalidInput if the configuration is not physical
     */
    explicit ThrustOptimizer(const DesignConfig& config, ApogeeFunc apogee_func = nullptr);

    /**
     * @brief Run the search
     * @throws InfeasibleDesign if no valid bracket exists or monotonicity is violated
     * @throws NonConvergence if the iteration budget is exhausted
     * @throws IntegrationFailure from the apogee model
     */
    OptimizationResult optimize() const;

    // max(altitude_eps, altitude_rel_eps * target)
    double apogeeTolerance() const;

    const DesignConfig& getConfig() const { return config_; }

private:
    DesignConfig config_;
    std::shared_ptr<const physics::Atmosphere> atmosphere_;
    ApogeeFunc apogee_func_;
    bool uses_model_;
};

} // namespace design
} // namespace srm_design
