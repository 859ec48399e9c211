#pragma once

namespace srm_design {
namespace aerodynamics {

enum class DragModelType {
    CONSTANT,         // Cd independent of Mach
    MACH_DEPENDENT    // Subsonic plateau, transonic ramp, supersonic decay
};

struct DragModel {
    DragModelType type = DragModelType::CONSTANT;
    double Cd_subsonic = 0.5;        // Also the value used by the constant model
    double Cd_transonic_peak = 1.2;
    double Cd_supersonic = 0.8;
    double mach_transonic_start = 0.8;
    double mach_transonic_end = 1.2;
};

// Cd vs Mach: constant below the transonic start, linear ramp to the peak,
// then peak - (peak - supersonic) * (1 - exp(-2 * (M - M_end))) above it
double drag_coefficient(double mach, const DragModel &model);

// Signed drag force opposing the velocity: 0.5 * rho * v|v| * Cd * A
double drag_force(double density, double velocity, double Cd, double reference_area);

bool is_valid(const DragModel &model);

} // namespace aerodynamics
} // namespace srm_design
