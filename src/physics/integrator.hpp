#pragma once

#include "physics/types.hpp"
#include "physics/dynamics.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace srm_design {
namespace physics {

/**
 * @brief Available integration schemes
 */
enum class IntegratorMethod {
    RK45,   // Adaptive Runge-Kutta-Fehlberg 4(5)
    RK4     // Fixed-step classical Runge-Kutta
};

const char* toString(IntegratorMethod method);
IntegratorMethod integratorMethodFromString(const std::string& name);

/**
 * @brief Step control and termination settings
 */
struct IntegratorOptions {
    double abs_tol;             // Absolute error tolerance (RK45)
    double rel_tol;             // Relative error tolerance (RK45)
    double initial_step;        // First trial step (RK45) [s]
    double min_step;            // Smallest admissible step (RK45) [s]
    double max_step;            // Largest step (RK45) [s]
    double fixed_step;          // Step of the fixed-step scheme [s]
    int max_step_rejections;    // Consecutive rejected steps before failure
    int max_steps;              // Accepted step budget
    double t_max;               // Simulated time limit [s]
    bool simulate_descent;      // Continue past apogee until ground impact
    bool record_samples;        // Store one sample per accepted step
    int event_max_iter;         // Bisection iterations for event location
    double event_tol;           // Event time tolerance [s]

    IntegratorOptions() : abs_tol(1e-6), rel_tol(1e-6), initial_step(1e-3), min_step(1e-9),
                          max_step(0.05), fixed_step(0.01), max_step_rejections(50),
                          max_steps(2000000), t_max(300.0), simulate_descent(false),
                          record_samples(true), event_max_iter(60), event_tol(1e-9) {}
};

/**
 * @brief Result of one trial step
 */
struct StepAttempt {
    StateVector y;      // Proposed state (highest order solution)
    double error;       // Scaled error norm, <= 1 means acceptable; 0 for fixed-step schemes
    int evaluations;    // Derivative evaluations spent
};

/**
 * @brief Base class for numerical integrators
 *
 * Owns the propagation loop: flight phases, burnout landing, apogee and
 * ground-impact events, sampling and failure detection. Subclasses only
 * provide the single-step scheme. Instances are immutable; every call to
 * integrate() owns its own state.
 */
class Integrator {
public:
    /**
     * @brief Constructor
     * @param dynamics Dynamics object
     * @param options Step control settings
     */
    Integrator(std::shared_ptr<const AscentDynamics> dynamics, const IntegratorOptions& options);

    virtual ~Integrator() = default;

    /**
     * @brief Integrate from ignition on the pad with the lift-off mass
     * @return Trajectory up to apogee (or ground impact)
     * @throws IntegrationFailure
     */
    TrajectoryResult integrate() const;

    /**
     * @brief Integrate from an arbitrary initial state
     * @param initial Initial state
     * @return Trajectory up to apogee (or ground impact)
     * @throws IntegrationFailure
     */
    TrajectoryResult integrate(const FlightState& initial) const;

    /**
     * @brief Take one trial step
     * @param t Current time
     * @param y Current state
     * @param dt Step size
     * @param phase Flight phase held for the whole step
     */
    virtual StepAttempt attemptStep(double t, const StateVector& y, double dt,
                                    FlightPhase phase) const = 0;

    virtual bool isAdaptive() const = 0;

    const AscentDynamics& getDynamics() const { return *dynamics_; }
    const IntegratorOptions& getOptions() const { return options_; }

protected:
    std::shared_ptr<const AscentDynamics> dynamics_;
    IntegratorOptions options_;

private:
    TrajectorySample makeSample(double t, const StateVector& y, FlightPhase phase) const;
    void recordSample(TrajectoryResult& result, const TrajectorySample& sample) const;
};

/**
 * @brief Runge-Kutta 4th order integrator (fixed step)
 */
class RK4Integrator : public Integrator {
public:
    RK4Integrator(std::shared_ptr<const AscentDynamics> dynamics, const IntegratorOptions& options);

    StepAttempt attemptStep(double t, const StateVector& y, double dt,
                            FlightPhase phase) const override;
    bool isAdaptive() const override { return false; }

private:
    // RK4 coefficients
    static constexpr double k1_coeff = 1.0/6.0;
    static constexpr double k2_coeff = 1.0/3.0;
    static constexpr double k3_coeff = 1.0/3.0;
    static constexpr double k4_coeff = 1.0/6.0;
};

/**
 * @brief Runge-Kutta-Fehlberg 4(5) adaptive integrator
 *
 * Error norm is the RMS over components of (y5 - y4) / (atol + rtol*max|y|).
 */
class RK45Integrator : public Integrator {
public:
    RK45Integrator(std::shared_ptr<const AscentDynamics> dynamics, const IntegratorOptions& options);

    StepAttempt attemptStep(double t, const StateVector& y, double dt,
                            FlightPhase phase) const override;
    bool isAdaptive() const override { return true; }

    /**
     * @brief Step size factor after an accepted (error <= 1) or rejected step
     *
     * Growth is capped at 5x and shrinking at 0.1x.
     */
    static double stepFactor(double error, bool accepted);

private:
    // RK45 coefficients
    static constexpr double a21 = 1.0/4.0;
    static constexpr double a31 = 3.0/32.0, a32 = 9.0/32.0;
    static constexpr double a41 = 1932.0/2197.0, a42 = -7200.0/2197.0, a43 = 7296.0/2197.0;
    static constexpr double a51 = 439.0/216.0, a52 = -8.0, a53 = 3680.0/513.0, a54 = -845.0/4104.0;
    static constexpr double a61 = -8.0/27.0, a62 = 2.0, a63 = -3544.0/2565.0, a64 = 1859.0/4104.0, a65 = -11.0/40.0;

    static constexpr double b1 = 16.0/135.0, b3 = 6656.0/12825.0, b4 = 28561.0/56430.0, b5 = -9.0/50.0, b6 = 2.0/55.0;
    static constexpr double c1 = 25.0/216.0, c3 = 1408.0/2565.0, c4 = 2197.0/4104.0, c5 = -1.0/5.0;

    static constexpr double c_2 = 1.0/4.0, c_3 = 3.0/8.0, c_4 = 12.0/13.0, c_5 = 1.0, c_6 = 1.0/2.0;

    double computeError(const StateVector& y, const StateVector& y4, const StateVector& y5) const;
};

std::shared_ptr<RK4Integrator> createRK4Integrator(std::shared_ptr<const AscentDynamics> dynamics,
                                                  const IntegratorOptions& options = IntegratorOptions());

std::shared_ptr<RK45Integrator> createRK45Integrator(std::shared_ptr<const AscentDynamics> dynamics,
                                                    const IntegratorOptions& options = IntegratorOptions());

/**
 * @brief Create integrator by method
 */
std::shared_ptr<Integrator> createIntegrator(IntegratorMethod method,
                                             std::shared_ptr<const AscentDynamics> dynamics,
                                             const IntegratorOptions& options = IntegratorOptions());

} // namespace physics
} // namespace srm_design
