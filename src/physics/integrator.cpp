#include "physics/integrator.hpp"
#include "physics/core/event_detection.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace srm_design {
namespace physics {

const char* toString(IntegratorMethod method) {
    switch (method) {
        case IntegratorMethod::RK45: return "rk45";
        case IntegratorMethod::RK4:  return "rk4";
    }
    return "unknown";
}

IntegratorMethod integratorMethodFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "rk45" || lower == "rkf45") return IntegratorMethod::RK45;
    if (lower == "rk4") return IntegratorMethod::RK4;
    throw InvalidInput("unknown integrator method '" + name + "'");
}

// Base Integrator class
Integrator::Integrator(std::shared_ptr<const AscentDynamics> dynamics, const IntegratorOptions& options)
    : dynamics_(std::move(dynamics)), options_(options) {
    if (!dynamics_) {
        throw InvalidInput("integrator requires a dynamics object");
    }
    if (!(options_.abs_tol > 0.0) || !(options_.rel_tol >= 0.0)) {
        throw InvalidInput("integrator tolerances must be positive");
    }
    if (!(options_.min_step > 0.0) || !(options_.max_step >= options_.min_step) ||
        !(options_.initial_step > 0.0) || !(options_.fixed_step > 0.0)) {
        throw InvalidInput("integrator step sizes must be positive and ordered");
    }
    if (options_.max_step_rejections < 1 || options_.max_steps < 1 || !(options_.t_max > 0.0)) {
        throw InvalidInput("integrator limits must be positive");
    }
}

TrajectoryResult Integrator::integrate() const {
    const RocketSpec& rocket = dynamics_->getRocket();
    return integrate(FlightState(0.0, 0.0, 0.0, rocket.liftoffMass()));
}

TrajectorySample Integrator::makeSample(double t, const StateVector& y, FlightPhase phase) const {
    ForceBreakdown f = dynamics_->computeForces(t, y, phase);
    TrajectorySample s;
    s.t = t;
    s.altitude = y(idx(StateIndex::H));
    s.velocity = y(idx(StateIndex::V));
    s.mass = y(idx(StateIndex::M));
    s.acceleration = f.acceleration;
    s.thrust = f.thrust;
    s.drag = f.drag;
    s.mach = f.mach;
    s.dynamic_pressure = f.dynamic_pressure;
    s.chamber_pressure = f.chamber_pressure;
    return s;
}

void Integrator::recordSample(TrajectoryResult& result, const TrajectorySample& sample) const {
    result.max_velocity = std::max(result.max_velocity, sample.velocity);
    result.max_acceleration = std::max(result.max_acceleration, sample.acceleration);
    result.max_dynamic_pressure = std::max(result.max_dynamic_pressure, sample.dynamic_pressure);
    if (options_.record_samples) {
        result.samples.push_back(sample);
    }
}

TrajectoryResult Integrator::integrate(const FlightState& initial) const {
    const double dry_mass = dynamics_->getRocket().dry_mass;
    const double tb = dynamics_->burnoutTime();
    const double landing_tol = 1e-12 * std::max(1.0, tb);
    const bool adaptive = isAdaptive();

    TrajectoryResult result;
    result.burnout_time = tb;

    double t = initial.t;
    StateVector y = initial.toVector();
    if (!utils::isFinite(y) || !std::isfinite(t)) {
        throw IntegrationFailure("non-finite initial state");
    }
    if (!(y(idx(StateIndex::M)) > 0.0)) {
        throw IntegrationFailure("initial mass must be positive");
    }

    bool apogee_reached = false;
    bool lifted_off = y(idx(StateIndex::H)) > 0.0 || y(idx(StateIndex::V)) > 0.0;
    double dt = adaptive ? options_.initial_step : options_.fixed_step;
    int consecutive_rejections = 0;

    auto phaseAt = [&](double time) {
        if (apogee_reached) return FlightPhase::DESCENT;
        return time < tb ? FlightPhase::BOOST : FlightPhase::COAST;
    };

    recordSample(result, makeSample(t, y, phaseAt(t)));

    if (!lifted_off && t >= tb) {
        result.lifted_off = false;
        return result;
    }

    while (true) {
        if (result.accepted_steps >= options_.max_steps) {
            throw IntegrationFailure("step budget exhausted before apogee");
        }
        if (t >= options_.t_max) {
            std::ostringstream msg;
            msg << "simulated time limit of " << options_.t_max << " s exceeded without "
                << (apogee_reached ? "ground impact" : "apogee");
            throw IntegrationFailure(msg.str());
        }

        const FlightPhase phase = phaseAt(t);

        double h_step = adaptive ? std::min(dt, options_.max_step) : dt;
        bool lands_on_burnout = false;
        if (phase == FlightPhase::BOOST && h_step >= (tb - t) - landing_tol) {
            h_step = tb - t;
            lands_on_burnout = true;
        }

        StepAttempt attempt = attemptStep(t, y, h_step, phase);
        result.function_evaluations += attempt.evaluations;

        const bool finite = utils::isFinite(attempt.y) && std::isfinite(attempt.error);
        if (adaptive) {
            if (!finite || attempt.error > 1.0) {
                result.rejected_steps++;
                if (++consecutive_rejections > options_.max_step_rejections) {
                    throw IntegrationFailure("too many consecutive rejected steps");
                }
                dt = h_step * (finite ? RK45Integrator::stepFactor(attempt.error, false) : 0.1);
                if (dt < options_.min_step) {
                    std::ostringstream msg;
                    msg << "step size " << dt << " s below minimum at t = " << t;
                    throw IntegrationFailure(msg.str());
                }
                continue;
            }
            dt = h_step * RK45Integrator::stepFactor(attempt.error, true);
            dt = std::max(dt, options_.min_step);
        } else if (!finite) {
            throw IntegrationFailure("non-finite state in fixed-step integration");
        }
        consecutive_rejections = 0;
        result.accepted_steps++;

        StateVector y_new = attempt.y;
        double t_new = lands_on_burnout ? tb : t + h_step;

        if (!(y_new(idx(StateIndex::M)) > 0.0)) {
            throw IntegrationFailure("mass became non-positive");
        }
        y_new(idx(StateIndex::M)) = std::max(y_new(idx(StateIndex::M)), dry_mass);

        if (y_new(idx(StateIndex::H)) > 0.0) {
            lifted_off = true;
        }

        int event_evaluations = 0;
        auto locate = [&](StateIndex component) {
            auto g = [&](double tau) {
                StepAttempt partial = attemptStep(t, y, tau, phase);
                event_evaluations += partial.evaluations;
                return partial.y(idx(component));
            };
            core::StepEvent event = core::locate_step_event(g, y(idx(component)), y_new(idx(component)),
                                                            h_step, options_.event_tol,
                                                            options_.event_max_iter);
            return event.tau;
        };

        const double v_old = y(idx(StateIndex::V));
        const double v_new = y_new(idx(StateIndex::V));
        if (!apogee_reached && lifted_off && v_old > 0.0 && v_new <= 0.0) {
            double tau = locate(StateIndex::V);
            StateVector y_apogee = attemptStep(t, y, tau, phase).y;
            result.function_evaluations += event_evaluations;

            result.apogee_time = t + tau;
            result.apogee_altitude = y_apogee(idx(StateIndex::H));
            recordSample(result, makeSample(result.apogee_time, y_apogee, phase));
            apogee_reached = true;

            if (!options_.simulate_descent) {
                break;
            }
            // Continue the descent from the located apogee
            t = result.apogee_time;
            y = y_apogee;
            continue;
        }

        if (apogee_reached && y(idx(StateIndex::H)) > 0.0 && y_new(idx(StateIndex::H)) <= 0.0) {
            double tau = locate(StateIndex::H);
            StateVector y_impact = attemptStep(t, y, tau, phase).y;
            result.function_evaluations += event_evaluations;

            result.ground_impact_time = t + tau;
            recordSample(result, makeSample(result.ground_impact_time, y_impact, phase));
            break;
        }

        recordSample(result, makeSample(t_new, y_new, phase));
        t = t_new;
        y = y_new;

        if (!lifted_off && t >= tb) {
            // Thrust never overcame weight
            result.apogee_altitude = 0.0;
            result.apogee_time = 0.0;
            break;
        }
    }

    result.lifted_off = lifted_off;
    return result;
}

// RK4Integrator implementation
RK4Integrator::RK4Integrator(std::shared_ptr<const AscentDynamics> dynamics, const IntegratorOptions& options)
    : Integrator(std::move(dynamics), options) {
}

StepAttempt RK4Integrator::attemptStep(double t, const StateVector& y, double dt,
                                       FlightPhase phase) const {
    StateVector k1 = dynamics_->computeDerivative(t, y, phase);
    StateVector k2 = dynamics_->computeDerivative(t + 0.5*dt, y + 0.5*dt*k1, phase);
    StateVector k3 = dynamics_->computeDerivative(t + 0.5*dt, y + 0.5*dt*k2, phase);
    StateVector k4 = dynamics_->computeDerivative(t + dt, y + dt*k3, phase);

    StepAttempt attempt;
    attempt.y = y + dt * (k1_coeff*k1 + k2_coeff*k2 + k3_coeff*k3 + k4_coeff*k4);
    attempt.error = 0.0;
    attempt.evaluations = 4;
    return attempt;
}

// RK45Integrator implementation
RK45Integrator::RK45Integrator(std::shared_ptr<const AscentDynamics> dynamics, const IntegratorOptions& options)
    : Integrator(std::move(dynamics), options) {
}

StepAttempt RK45Integrator::attemptStep(double t, const StateVector& y, double dt,
                                        FlightPhase phase) const {
    StateVector k1 = dynamics_->computeDerivative(t, y, phase);
    StateVector k2 = dynamics_->computeDerivative(t + c_2*dt, y + dt*a21*k1, phase);
    StateVector k3 = dynamics_->computeDerivative(t + c_3*dt, y + dt*(a31*k1 + a32*k2), phase);
    StateVector k4 = dynamics_->computeDerivative(t + c_4*dt, y + dt*(a41*k1 + a42*k2 + a43*k3), phase);
    StateVector k5 = dynamics_->computeDerivative(t + c_5*dt,
                                                  y + dt*(a51*k1 + a52*k2 + a53*k3 + a54*k4), phase);
    StateVector k6 = dynamics_->computeDerivative(t + c_6*dt,
                                                  y + dt*(a61*k1 + a62*k2 + a63*k3 + a64*k4 + a65*k5), phase);

    // 4th and 5th order solutions
    StateVector y4 = y + dt * (c1*k1 + c3*k3 + c4*k4 + c5*k5);
    StateVector y5 = y + dt * (b1*k1 + b3*k3 + b4*k4 + b5*k5 + b6*k6);

    StepAttempt attempt;
    attempt.y = y5; // Use 5th order solution
    attempt.error = computeError(y, y4, y5);
    attempt.evaluations = 6;
    return attempt;
}

double RK45Integrator::computeError(const StateVector& y, const StateVector& y4,
                                    const StateVector& y5) const {
    double sum = 0.0;
    for (Eigen::Index i = 0; i < y.size(); ++i) {
        double scale = options_.abs_tol + options_.rel_tol * std::max(std::abs(y(i)), std::abs(y5(i)));
        double e = (y5(i) - y4(i)) / scale;
        sum += e * e;
    }
    return std::sqrt(sum / static_cast<double>(y.size()));
}

double RK45Integrator::stepFactor(double error, bool accepted) {
    const double safety_factor = 0.9;
    if (accepted) {
        if (error < 1e-10) {
            return 5.0;
        }
        return std::clamp(safety_factor * std::pow(error, -0.2), 0.1, 5.0);
    }
    return std::clamp(safety_factor * std::pow(error, -0.25), 0.1, 1.0);
}

// Factory functions
std::shared_ptr<RK4Integrator> createRK4Integrator(std::shared_ptr<const AscentDynamics> dynamics,
                                                  const IntegratorOptions& options) {
    return std::make_shared<RK4Integrator>(std::move(dynamics), options);
}

std::shared_ptr<RK45Integrator> createRK45Integrator(std::shared_ptr<const AscentDynamics> dynamics,
                                                    const IntegratorOptions& options) {
    return std::make_shared<RK45Integrator>(std::move(dynamics), options);
}

std::shared_ptr<Integrator> createIntegrator(IntegratorMethod method,
                                             std::shared_ptr<const AscentDynamics> dynamics,
                                             const IntegratorOptions& options) {
    switch (method) {
        case IntegratorMethod::RK4:
            return createRK4Integrator(std::move(dynamics), options);
        case IntegratorMethod::RK45:
        default:
            return createRK45Integrator(std::move(dynamics), options);
    }
}

} // namespace physics
} // namespace srm_design
