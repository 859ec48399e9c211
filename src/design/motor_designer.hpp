#pragma once

#include "physics/types.hpp"
#include "physics/atmosphere.hpp"
#include "design/design_config.hpp"
#include "design/ballistics.hpp"
#include "design/grain_sizing.hpp"
#include "design/optimizer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace srm_design {
namespace design {

/**
 * @brief Complete outcome of one design run, read-only once created
 */
struct DesignResult {
    double target_altitude;         // [m]
    RocketSpec rocket;
    MotorSpec motor;
    GrainGeometry grain;
    NozzleDesign nozzle;
    TrajectoryResult trajectory;    // Accepted constant-thrust run

    double average_thrust;          // [N]
    double total_impulse;           // Average thrust * burn time [N*s]
    double mass_flow;               // Propellant mass / burn time [kg/s]
    double required_isp;            // F / (mdot * g0) [s]
    double ambient_pressure;        // At the launch site [Pa]

    OptimizationResult optimization;
    GrainSizingResult grain_sizing;
    BallisticsResult ballistics;

    TrajectoryResult verification;  // Flown with the ballistics thrust curve
    bool has_verification;

    std::vector<std::string> warnings;

    DesignResult() : target_altitude(0.0), average_thrust(0.0), total_impulse(0.0), mass_flow(0.0),
                     required_isp(0.0), ambient_pressure(0.0), has_verification(false) {}
};

/**
 * @brief Inverse design pipeline
 *
 * validate -> thrust search -> nozzle -> grain (sized or fixed) ->
 * ballistics -> verification flight.
 */
class MotorDesigner {
public:
    /**
     * @brief Constructor
     * @param config Design configuration
     * @throws InvalidInput before any integration if the configuration is not physical
     */
    explicit MotorDesigner(const DesignConfig& config);

    /**
     * @brief Run every stage
     * @return Design result
     * @throws DesignError subclasses from the failing stage
     */
    DesignResult run() const;

    const DesignConfig& getConfig() const { return config_; }

    // Relative required/delivered Isp difference above which a warning is raised
    static constexpr double kIspMismatchWarning = 0.10;
    // Relative verification apogee error above which a warning is raised
    static constexpr double kVerificationWarning = 0.10;
    // Relative grain / loaded propellant mass difference tolerated before the grain mass is flown
    static constexpr double kPropellantMassTolerance = 1e-3;

private:
    DesignConfig config_;
    std::shared_ptr<const physics::Atmosphere> atmosphere_;
};

/**
 * @brief Convenience wrapper: MotorDesigner(config).run()
 */
DesignResult designMotor(const DesignConfig& config);

} // namespace design
} // namespace srm_design
