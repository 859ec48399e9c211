#pragma once

#include "physics/aerodynamics/aerodynamics.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace srm_design {

// Standard gravity [m/s²]
constexpr double kStandardGravity = 9.80665;
constexpr double kPi = 3.14159265358979323846;

// Integrated state (altitude, vertical velocity, mass)
using StateVector = Eigen::Vector3d;

/**
 * @brief State vector indices for standardization
 */
enum class StateIndex {
    H = 0,      // Altitude above the launch site (0)
    V,          // Vertical velocity (1)
    M           // Mass (2)
};

inline constexpr int idx(StateIndex i) { return static_cast<int>(i); }

/**
 * @brief Airframe description
 *
 * Invariants: dry_mass > 0, propellant_mass >= 0.
 */
struct RocketSpec {
    double dry_mass;                    // Mass without propellant [kg]
    double propellant_mass;             // Loaded propellant [kg]
    double reference_area;              // Reference cross-section [m²]
    aerodynamics::DragModel drag;       // Drag coefficient model
    double launch_altitude;             // Launch site altitude above MSL [m]

    RocketSpec() : dry_mass(1.0), propellant_mass(0.3), reference_area(0.005), drag(),
                   launch_altitude(0.0) {}

    double liftoffMass() const { return dry_mass + propellant_mass; }
};

/**
 * @brief Propellant, chamber and nozzle parameters of the motor
 *
 * Burn rate follows r = a * Pc^n with Pc expressed in MPa and r in m/s.
 * Defaults describe KNSB (potassium nitrate / sorbitol).
 */
struct MotorSpec {
    // Propellant
    double propellant_density;          // [kg/m³]
    double burn_rate_coefficient;       // a [m/s per MPa^n]
    double burn_rate_exponent;          // n [-]
    double characteristic_velocity;     // c* [m/s]
    double gamma;                       // Ratio of specific heats of the combustion gas

    // Chamber
    double chamber_volume;              // Free volume available for the grain [m³]
    double chamber_diameter;            // Inner diameter of the motor case [m]
    double liner_thickness;             // Liner / casting tube wall [m]
    double max_chamber_pressure;        // Maximum expected operating pressure [Pa]
    double average_pressure_ratio;      // Design (average) Pc over max Pc [-]

    // Nozzle
    double discharge_coefficient;       // Effective / geometric throat area [-]
    double nozzle_efficiency;           // Thrust correction η [-]
    double expansion_ratio;             // Ae/At; <= 0 selects optimum expansion

    // Mission
    double burn_time;                   // Target burn duration [s]

    MotorSpec() : propellant_density(1641.0), burn_rate_coefficient(8.26e-3),
                  burn_rate_exponent(0.319), characteristic_velocity(895.0), gamma(1.226),
                  chamber_volume(4.0e-4), chamber_diameter(0.054), liner_thickness(0.002),
                  max_chamber_pressure(3.0e6), average_pressure_ratio(0.615),
                  discharge_coefficient(1.0), nozzle_efficiency(0.92), expansion_ratio(7.414),
                  burn_time(1.5) {}

    double designChamberPressure() const { return average_pressure_ratio * max_chamber_pressure; }

    // Steady burn rate [m/s] at chamber pressure Pc [Pa]
    double burnRate(double chamber_pressure) const {
        return burn_rate_coefficient * std::pow(chamber_pressure / 1.0e6, burn_rate_exponent);
    }

    // Largest grain diameter that fits inside the liner [m]
    double grainOuterDiameter() const { return chamber_diameter - 2.0 * liner_thickness; }
};

/**
 * @brief BATES grain: cylindrical segments burning on the bore and end faces
 *
 * Regression x [m] is the distance burned normal to every exposed surface.
 */
struct GrainGeometry {
    double core_diameter;       // Initial bore diameter [m]
    double outer_diameter;      // Grain outer diameter [m]
    double segment_length;      // Initial length of one segment [m]
    int segments;               // Number of segments
    bool inhibit_ends;          // End faces inhibited (core burning only)

    GrainGeometry() : core_diameter(0.02), outer_diameter(0.05), segment_length(0.05),
                      segments(3), inhibit_ends(false) {}

    GrainGeometry(double core, double outer, double length, int count, bool inhibited = false)
        : core_diameter(core), outer_diameter(outer), segment_length(length), segments(count),
          inhibit_ends(inhibited) {}

    // Thickness that burns before the grain is exhausted
    double webThickness() const {
        double radial = 0.5 * (outer_diameter - core_diameter);
        if (inhibit_ends) {
            return radial;
        }
        return std::min(radial, 0.5 * segment_length);
    }

    double coreDiameterAt(double regression) const {
        return std::min(core_diameter + 2.0 * regression, outer_diameter);
    }

    double segmentLengthAt(double regression) const {
        if (inhibit_ends) {
            return segment_length;
        }
        return std::max(segment_length - 2.0 * regression, 0.0);
    }

    // Total burning surface of all segments [m²]
    double burnAreaAt(double regression) const {
        double d = coreDiameterAt(regression);
        double L = segmentLengthAt(regression);
        double core_area = kPi * d * L;
        double end_area = inhibit_ends ? 0.0
                                       : 2.0 * 0.25 * kPi * (outer_diameter * outer_diameter - d * d);
        return segments * (core_area + end_area);
    }

    // Remaining propellant volume [m³]
    double volumeAt(double regression) const {
        double d = coreDiameterAt(regression);
        double L = segmentLengthAt(regression);
        return segments * 0.25 * kPi * (outer_diameter * outer_diameter - d * d) * L;
    }

    double totalLength() const { return segments * segment_length; }

    bool isValid() const {
        return core_diameter > 0.0 && outer_diameter > core_diameter && segment_length > 0.0 &&
               segments > 0 && std::isfinite(outer_diameter) && std::isfinite(segment_length);
    }
};

/**
 * @brief Vertical flight state owned by one integration run
 */
struct FlightState {
    double t;       // Time since ignition [s]
    double h;       // Altitude above launch site [m]
    double v;       // Vertical velocity [m/s]
    double m;       // Mass [kg]

    FlightState() : t(0.0), h(0.0), v(0.0), m(0.0) {}
    FlightState(double time, double altitude, double velocity, double mass)
        : t(time), h(altitude), v(velocity), m(mass) {}

    StateVector toVector() const { return StateVector(h, v, m); }

    void fromVector(double time, const StateVector& y) {
        t = time;
        h = y(idx(StateIndex::H));
        v = y(idx(StateIndex::V));
        m = y(idx(StateIndex::M));
    }
};

/**
 * @brief One recorded point of a trajectory
 */
struct TrajectorySample {
    double t;                   // [s]
    double altitude;            // Above launch site [m]
    double velocity;            // [m/s]
    double acceleration;        // [m/s²]
    double mass;                // [kg]
    double thrust;              // [N]
    double drag;                // Signed, positive opposes upward motion [N]
    double mach;                // [-]
    double dynamic_pressure;    // [Pa]
    double chamber_pressure;    // [Pa], 0 after burnout

    TrajectorySample() : t(0.0), altitude(0.0), velocity(0.0), acceleration(0.0), mass(0.0),
                         thrust(0.0), drag(0.0), mach(0.0), dynamic_pressure(0.0),
                         chamber_pressure(0.0) {}
};

/**
 * @brief Immutable outcome of one integrator run
 */
struct TrajectoryResult {
    std::vector<TrajectorySample> samples;
    double apogee_altitude;         // [m]
    double apogee_time;             // [s]
    double burnout_time;            // [s]
    double max_velocity;            // [m/s]
    double max_acceleration;        // [m/s²]
    double max_dynamic_pressure;    // [Pa]
    double ground_impact_time;      // [s], NaN unless descent was simulated
    bool lifted_off;                // False if thrust never exceeded weight
    int accepted_steps;
    int rejected_steps;
    int function_evaluations;

    TrajectoryResult() : apogee_altitude(0.0), apogee_time(0.0), burnout_time(0.0),
                         max_velocity(0.0), max_acceleration(0.0), max_dynamic_pressure(0.0),
                         ground_impact_time(std::numeric_limits<double>::quiet_NaN()),
                         lifted_off(false), accepted_steps(0), rejected_steps(0),
                         function_evaluations(0) {}
};

/**
 * @brief Converged nozzle geometry
 */
struct NozzleDesign {
    double throat_area;             // [m²]
    double throat_diameter;         // [m]
    double exit_area;               // [m²]
    double exit_diameter;           // [m]
    double expansion_ratio;         // Ae/At [-]
    double exit_mach;               // [-]
    double exit_pressure_ratio;     // pe/pc [-]
    double design_pressure_ratio;   // pe/pa [-]
    double thrust_coefficient;      // C_F at the design point [-]
    double efficiency;              // η [-]
    double chamber_pressure;        // Design chamber pressure [Pa]
    double ambient_pressure;        // [Pa]
    double specific_impulse;        // Delivered c*·C_F·η/g0 [s]

    NozzleDesign() : throat_area(0.0), throat_diameter(0.0), exit_area(0.0), exit_diameter(0.0),
                     expansion_ratio(0.0), exit_mach(0.0), exit_pressure_ratio(0.0),
                     design_pressure_ratio(0.0), thrust_coefficient(0.0), efficiency(0.0),
                     chamber_pressure(0.0), ambient_pressure(0.0), specific_impulse(0.0) {}
};

namespace utils {

    inline bool isFinite(const StateVector& y) {
        return y.allFinite();
    }

    inline double circleArea(double diameter) {
        return 0.25 * kPi * diameter * diameter;
    }

    inline double circleDiameter(double area) {
        return std::sqrt(4.0 * area / kPi);
    }
}

} // namespace srm_design
