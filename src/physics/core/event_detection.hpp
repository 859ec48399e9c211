#pragma once

#include <functional>

namespace srm_design {
namespace physics {
namespace core {

/**
 * @brief Location of a sign change inside one integration step
 */
struct StepEvent {
    bool found;         // The monitored value changed sign (or reached zero) over the step
    double tau;         // Offset from the step start at which it happens [s]
    int iterations;

    StepEvent() : found(false), tau(0.0), iterations(0) {}
};

/**
 * @brief Bisect the step [0, step] for the zero crossing of a state component
 *
 * g(tau) returns the component after a partial step of length tau. The end
 * values are already known from the accepted step and are not re-evaluated.
 * The returned tau is the right end of the final bracket, so the event has
 * occurred at tau.
 * @param g Component value after a partial step
 * @param g_start Value at the step start
 * @param g_end Value at the step end
 * @param step Step length [s]
 * @param time_tol Bracket width at which the search stops [s]
 * @param max_iter Maximum number of halvings
 */
StepEvent locate_step_event(
    const std::function<double(double)> &g,
    double g_start,
    double g_end,
    double step,
    double time_tol,
    int max_iter
);

/**
 * @brief Outcome of a bracketed scalar root search
 */
struct RootResult {
    bool bracketed;     // f(lo) and f(hi) have opposite signs (or one is zero)
    bool converged;     // Interval shrank below the tolerance within max_iter
    double x;           // Best root estimate
    double fx;          // f(x)
    int iterations;

    RootResult() : bracketed(false), converged(false), x(0.0), fx(0.0), iterations(0) {}
};

/**
 * @brief Bisection on [lo, hi]
 *
 * Stops when |f(x)| <= f_tol or when the half interval is below
 * x_rel_tol * max(|x|, 1e-12). Never evaluates f outside [lo, hi].
 * @param f Continuous function
 * @param lo Lower end of the bracket
 * @param hi Upper end of the bracket
 * @param x_rel_tol Relative tolerance on x
 * @param max_iter Maximum number of halvings
 * @param f_tol Absolute tolerance on f (0 disables)
 */
RootResult find_root_bisection(
    const std::function<double(double)> &f,
    double lo,
    double hi,
    double x_rel_tol,
    int max_iter,
    double f_tol = 0.0
);

} // namespace core
} // namespace physics
} // namespace srm_design
