#pragma once

#include <memory>
#include <vector>

namespace srm_design {
namespace physics {
namespace propulsion {

/**
 * @brief Motor output as a function of time since ignition
 *
 * Implementations return zero thrust and zero mass flow outside [0, burnTime()].
 */
class ThrustProfile {
public:
    virtual ~ThrustProfile() = default;

    virtual double thrust(double t) const = 0;          // [N]
    virtual double massFlowRate(double t) const = 0;    // [kg/s], positive while burning
    virtual double chamberPressure(double t) const = 0; // [Pa], 0 when unknown
    virtual double burnTime() const = 0;                // [s]
    virtual double propellantMass() const = 0;          // [kg]
};

/**
 * @brief Constant (average) thrust with constant mass flow
 *
 * The search variable of the thrust optimizer.
 */
class ConstantThrustProfile : public ThrustProfile {
public:
    ConstantThrustProfile(double thrust, double burn_time, double propellant_mass,
                          double chamber_pressure = 0.0);

    double thrust(double t) const override;
    double massFlowRate(double t) const override;
    double chamberPressure(double t) const override;
    double burnTime() const override { return burn_time_; }
    double propellantMass() const override { return propellant_mass_; }

    double totalImpulse() const { return thrust_ * burn_time_; }

private:
    double thrust_;
    double burn_time_;
    double propellant_mass_;
    double chamber_pressure_;
};

/**
 * @brief One row of a tabulated thrust curve
 */
struct ThrustPoint {
    double t;                   // [s]
    double thrust;              // [N]
    double mass_flow;           // [kg/s]
    double chamber_pressure;    // [Pa]
};

/**
 * @brief Piecewise-linear thrust curve, typically from the ballistics solver
 *
 * Points must be strictly increasing in time, start at t = 0 and have
 * non-negative thrust and mass flow. Burn time is the last point's time.
 */
class TabulatedThrustProfile : public ThrustProfile {
public:
    explicit TabulatedThrustProfile(std::vector<ThrustPoint> points);

    double thrust(double t) const override;
    double massFlowRate(double t) const override;
    double chamberPressure(double t) const override;
    double burnTime() const override;
    double propellantMass() const override { return propellant_mass_; }

    // Trapezoidal integral of thrust over the curve [N*s]
    double totalImpulse() const;
    const std::vector<ThrustPoint>& points() const { return points_; }

private:
    std::vector<ThrustPoint> points_;
    double propellant_mass_;

    // Linear interpolation of one column
    template <typename Getter>
    double interpolate(double t, Getter get) const;
};

std::shared_ptr<ConstantThrustProfile> createConstantThrustProfile(double thrust, double burn_time,
                                                                   double propellant_mass,
                                                                   double chamber_pressure = 0.0);

} // namespace propulsion
} // namespace physics
} // namespace srm_design
