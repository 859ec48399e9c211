#pragma once

#include <stdexcept>
#include <string>

namespace srm_design {

/**
 * @brief Failure categories reported by the design solvers
 */
enum class ErrorKind {
    INVALID_INPUT,          // Non-physical configuration supplied by the caller
    INFEASIBLE_DESIGN,      // No bracket / thrust level reaches the target
    NON_CONVERGENCE,        // Iteration budget exhausted
    OVER_PRESSURE,          // Chamber pressure above the operating ceiling
    INVALID_GEOMETRY,       // Negative area, complex Mach, unchoked nozzle...
    INTEGRATION_FAILURE     // Adaptive stepper gave up or mass went non-positive
};

/**
 * @brief Human readable name of an error kind
 */
const char* toString(ErrorKind kind);

/**
 * @brief Base class of every error raised by the design core
 *
 * Callers can either catch the concrete subclasses or inspect kind().
 */
class DesignError : public std::runtime_error {
public:
    DesignError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidInput : public DesignError {
public:
    explicit InvalidInput(const std::string& message)
        : DesignError(ErrorKind::INVALID_INPUT, message) {}
};

class InfeasibleDesign : public DesignError {
public:
    explicit InfeasibleDesign(const std::string& message)
        : DesignError(ErrorKind::INFEASIBLE_DESIGN, message) {}
};

/**
 * @brief Iteration budget exhausted before the tolerance was met
 *
 * Carries the best candidate seen so the caller can still inspect it.
 */
class NonConvergence : public DesignError {
public:
    /**
     * @param message Description of the failed search
     * @param best_candidate Best value of the search variable
     * @param best_value Objective value obtained at best_candidate
     * @param iterations Number of iterations performed
     */
    NonConvergence(const std::string& message, double best_candidate, double best_value,
                   int iterations);

    double bestCandidate() const { return best_candidate_; }
    double bestValue() const { return best_value_; }
    int iterations() const { return iterations_; }

private:
    double best_candidate_;
    double best_value_;
    int iterations_;
};

class OverPressure : public DesignError {
public:
    explicit OverPressure(const std::string& message)
        : DesignError(ErrorKind::OVER_PRESSURE, message) {}
};

class InvalidGeometry : public DesignError {
public:
    explicit InvalidGeometry(const std::string& message)
        : DesignError(ErrorKind::INVALID_GEOMETRY, message) {}
};

class IntegrationFailure : public DesignError {
public:
    explicit IntegrationFailure(const std::string& message)
        : DesignError(ErrorKind::INTEGRATION_FAILURE, message) {}
};

} // namespace srm_design
