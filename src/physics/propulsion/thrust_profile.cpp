#include "physics/propulsion/thrust_profile.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace srm_design {
namespace physics {
namespace propulsion {

ConstantThrustProfile::ConstantThrustProfile(double thrust, double burn_time,
                                             double propellant_mass, double chamber_pressure)
    : thrust_(thrust), burn_time_(burn_time), propellant_mass_(propellant_mass),
      chamber_pressure_(chamber_pressure) {
    if (!(thrust >= 0.0) || !std::isfinite(thrust)) {
        throw InvalidInput("thrust must be finite and non-negative");
    }
    if (!(burn_time > 0.0) || !std::isfinite(burn_time)) {
        throw InvalidInput("burn time must be positive");
    }
    if (!(propellant_mass >= 0.0)) {
        throw InvalidInput("propellant mass must be non-negative");
    }
}

double ConstantThrustProfile::thrust(double t) const {
    return (t >= 0.0 && t <= burn_time_) ? thrust_ : 0.0;
}

double ConstantThrustProfile::massFlowRate(double t) const {
    return (t >= 0.0 && t <= burn_time_) ? propellant_mass_ / burn_time_ : 0.0;
}

double ConstantThrustProfile::chamberPressure(double t) const {
    return (t >= 0.0 && t <= burn_time_) ? chamber_pressure_ : 0.0;
}

TabulatedThrustProfile::TabulatedThrustProfile(std::vector<ThrustPoint> points)
    : points_(std::move(points)), propellant_mass_(0.0) {
    if (points_.size() < 2) {
        throw InvalidInput("tabulated thrust curve needs at least two points");
    }
    if (std::abs(points_.front().t) > 1e-12) {
        throw InvalidInput("tabulated thrust curve must start at t = 0");
    }
    for (std::size_t i = 0; i < points_.size(); ++i) {
        const ThrustPoint& p = points_[i];
        if (!std::isfinite(p.thrust) || p.thrust < 0.0 || !std::isfinite(p.mass_flow) ||
            p.mass_flow < 0.0) {
            throw InvalidInput("tabulated thrust curve has a negative or non-finite entry");
        }
        if (i > 0) {
            double dt = p.t - points_[i - 1].t;
            if (!(dt > 0.0)) {
                throw InvalidInput("tabulated thrust curve times must be strictly increasing");
            }
            propellant_mass_ += 0.5 * dt * (p.mass_flow + points_[i - 1].mass_flow);
        }
    }
}

template <typename Getter>
double TabulatedThrustProfile::interpolate(double t, Getter get) const {
    if (t < 0.0 || t > points_.back().t) {
        return 0.0;
    }
    auto upper = std::upper_bound(points_.begin(), points_.end(), t,
                                  [](double value, const ThrustPoint& p) { return value < p.t; });
    if (upper == points_.end()) {
        return get(points_.back());
    }
    auto lower = std::prev(upper);
    double w = (t - lower->t) / (upper->t - lower->t);
    return (1.0 - w) * get(*lower) + w * get(*upper);
}

double TabulatedThrustProfile::thrust(double t) const {
    return interpolate(t, [](const ThrustPoint& p) { return p.thrust; });
}

double TabulatedThrustProfile::massFlowRate(double t) const {
    return interpolate(t, [](const ThrustPoint& p) { return p.mass_flow; });
}

double TabulatedThrustProfile::chamberPressure(double t) const {
    return interpolate(t, [](const ThrustPoint& p) { return p.chamber_pressure; });
}

double TabulatedThrustProfile::burnTime() const {
    return points_.back().t;
}

double TabulatedThrustProfile::totalImpulse() const {
    double impulse = 0.0;
    for (std::size_t i = 1; i < points_.size(); ++i) {
        impulse += 0.5 * (points_[i].t - points_[i - 1].t) * (points_[i].thrust + points_[i - 1].thrust);
    }
    return impulse;
}

std::shared_ptr<ConstantThrustProfile> createConstantThrustProfile(double thrust, double burn_time,
                                                                   double propellant_mass,
                                                                   double chamber_pressure) {
    return std::make_shared<ConstantThrustProfile>(thrust, burn_time, propellant_mass,
                                                   chamber_pressure);
}

} // namespace propulsion
} // namespace physics
} // namespace srm_design
