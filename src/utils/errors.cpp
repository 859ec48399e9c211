#include "utils/errors.hpp"

namespace srm_design {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT:       return "InvalidInput";
        case ErrorKind::INFEASIBLE_DESIGN:   return "InfeasibleDesign";
        case ErrorKind::NON_CONVERGENCE:     return "NonConvergence";
        case ErrorKind::OVER_PRESSURE:       return "OverPressure";
        case ErrorKind::INVALID_GEOMETRY:    return "InvalidGeometry";
        case ErrorKind::INTEGRATION_FAILURE: return "IntegrationFailure";
    }
    return "Unknown";
}

DesignError::DesignError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {
}

NonConvergence::NonConvergence(const std::string& message, double best_candidate,
                               double best_value, int iterations)
    : DesignError(ErrorKind::NON_CONVERGENCE, message),
      best_candidate_(best_candidate), best_value_(best_value), iterations_(iterations) {
}

} // namespace srm_design
