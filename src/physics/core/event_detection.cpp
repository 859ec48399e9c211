#include "physics/core/event_detection.hpp"
#include <algorithm>
#include <cmath>

namespace srm_design {
namespace physics {
namespace core {

StepEvent locate_step_event(
    const std::function<double(double)> &g,
    double g_start,
    double g_end,
    double step,
    double time_tol,
    int max_iter
) {
    StepEvent event;
    event.tau = step;
    if (g_end == 0.0) {
        event.found = true;
        return event;
    }
    if (g_start == 0.0) {
        event.found = true;
        event.tau = 0.0;
        return event;
    }
    if (std::signbit(g_start) == std::signbit(g_end)) {
        return event;
    }
    event.found = true;

    double a = 0.0;
    double b = step;
    const bool start_negative = std::signbit(g_start);
    while (b - a > time_tol && event.iterations < max_iter) {
        double mid = 0.5 * (a + b);
        double g_mid = g(mid);
        event.iterations++;
        if (g_mid == 0.0) {
            b = mid;
            break;
        }
        if (std::signbit(g_mid) == start_negative) {
            a = mid;
        } else {
            b = mid;
        }
    }
    event.tau = b;
    return event;
}

RootResult find_root_bisection(
    const std::function<double(double)> &f,
    double lo,
    double hi,
    double x_rel_tol,
    int max_iter,
    double f_tol
) {
    RootResult result;
    double f_lo = f(lo);
    double f_hi = f(hi);

    if (f_lo == 0.0 || f_hi == 0.0) {
        result.bracketed = true;
        result.converged = true;
        result.x = (f_lo == 0.0) ? lo : hi;
        result.fx = 0.0;
        return result;
    }
    if (f_lo * f_hi > 0.0) {
        // Report the end closest to zero
        result.x = (std::abs(f_lo) < std::abs(f_hi)) ? lo : hi;
        result.fx = (std::abs(f_lo) < std::abs(f_hi)) ? f_lo : f_hi;
        return result;
    }
    result.bracketed = true;

    double a = lo;
    double b = hi;
    for (int i = 0; i < max_iter; ++i) {
        double m = 0.5 * (a + b);
        double fm = f(m);
        result.iterations = i + 1;
        result.x = m;
        result.fx = fm;

        double half_width = 0.5 * (b - a);
        if (fm == 0.0 || std::abs(fm) <= f_tol ||
            half_width <= x_rel_tol * std::max(std::abs(m), 1e-12)) {
            result.converged = true;
            return result;
        }
        if (f_lo * fm < 0.0) {
            b = m;
        } else {
            a = m;
            f_lo = fm;
        }
    }
    return result;
}

} // namespace core
} // namespace physics
} // namespace srm_design
