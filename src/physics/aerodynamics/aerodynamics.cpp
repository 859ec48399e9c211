#include "physics/aerodynamics/aerodynamics.hpp"
#include <cmath>

namespace srm_design {
namespace aerodynamics {

double drag_coefficient(double mach, const DragModel &p) {
    if (p.type == DragModelType::CONSTANT) {
        return p.Cd_subsonic;
    }

    mach = std::abs(mach);
    if (mach <= p.mach_transonic_start) {
        return p.Cd_subsonic;
    }
    if (mach >= p.mach_transonic_end) {
        // Supersonic, exponential decay from the peak, Cd_supersonic is the asymptote
        double t = mach - p.mach_transonic_end;
        return p.Cd_supersonic + (p.Cd_transonic_peak - p.Cd_supersonic) * std::exp(-2.0 * t);
    }
    // Transonic ramp up to peak
    double t = (mach - p.mach_transonic_start) / (p.mach_transonic_end - p.mach_transonic_start);
    return p.Cd_subsonic + t * (p.Cd_transonic_peak - p.Cd_subsonic);
}

double drag_force(double density, double velocity, double Cd, double reference_area) {
    return 0.5 * density * velocity * std::abs(velocity) * Cd * reference_area;
}

bool is_valid(const DragModel &p) {
    if (!(p.Cd_subsonic >= 0.0) || !std::isfinite(p.Cd_subsonic)) return false;
    if (p.type == DragModelType::CONSTANT) return true;
    return p.Cd_transonic_peak >= 0.0 && p.Cd_supersonic >= 0.0 &&
           p.mach_transonic_start > 0.0 && p.mach_transonic_end > p.mach_transonic_start;
}

} // namespace aerodynamics
} // namespace srm_design
