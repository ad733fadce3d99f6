#pragma once

// =============================================================================
// Kutta v1 - Error Taxonomy and Status Codes
// =============================================================================
// - ConfigurationError: malformed tableau or options, thrown at construction
// - FieldEvaluationError: raised by user vector fields, never retried
// - ImplicitSolveStatus: recoverable outcome of an implicit stage solve
// - IntegrationStatus: final outcome of a trajectory
// - IntegrationError: fatal IntegrationStatus surfaced as an exception
// =============================================================================

#include <stdexcept>
#include <string>

namespace kutta::v1 {

// =============================================================================
// Configuration Errors
// =============================================================================

enum class ConfigurationErrorCode {
    EmptyTableau,
    NodesDimension,
    MatrixDimension,
    WeightsDimension,
    EmbeddedWeightsDimension,
    NonFiniteCoefficient,
    NotStrictlyLowerTriangular,
    InvalidOrder,
    MissingEmbeddedMethod,
    UnknownTableau,
    UnknownProblem,
    InvalidTolerance,
    InvalidStepSize,
    InvalidGrowthFactor,
    InvalidIterationLimit,
    InvalidInitialState,
    InvalidTimeSpan
};

/// Convert configuration error code to string
[[nodiscard]] constexpr const char* to_string(ConfigurationErrorCode code) noexcept {
    switch (code) {
        case ConfigurationErrorCode::EmptyTableau: return "EmptyTableau";
        case ConfigurationErrorCode::NodesDimension: return "NodesDimension";
        case ConfigurationErrorCode::MatrixDimension: return "MatrixDimension";
        case ConfigurationErrorCode::WeightsDimension: return "WeightsDimension";
        case ConfigurationErrorCode::EmbeddedWeightsDimension: return "EmbeddedWeightsDimension";
        case ConfigurationErrorCode::NonFiniteCoefficient: return "NonFiniteCoefficient";
        case ConfigurationErrorCode::NotStrictlyLowerTriangular: return "NotStrictlyLowerTriangular";
        case ConfigurationErrorCode::InvalidOrder: return "InvalidOrder";
        case ConfigurationErrorCode::MissingEmbeddedMethod: return "MissingEmbeddedMethod";
        case ConfigurationErrorCode::UnknownTableau: return "UnknownTableau";
        case ConfigurationErrorCode::UnknownProblem: return "UnknownProblem";
        case ConfigurationErrorCode::InvalidTolerance: return "InvalidTolerance";
        case ConfigurationErrorCode::InvalidStepSize: return "InvalidStepSize";
        case ConfigurationErrorCode::InvalidGrowthFactor: return "InvalidGrowthFactor";
        case ConfigurationErrorCode::InvalidIterationLimit: return "InvalidIterationLimit";
        case ConfigurationErrorCode::InvalidInitialState: return "InvalidInitialState";
        case ConfigurationErrorCode::InvalidTimeSpan: return "InvalidTimeSpan";
        default: return "Unknown";
    }
}

/// Thrown when a tableau, option set or solve request is malformed.
/// Always raised before any trajectory sample is produced.
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(ConfigurationErrorCode code, const std::string& message)
        : std::invalid_argument(std::string("[") + to_string(code) + "] " + message)
        , code_(code) {}

    [[nodiscard]] ConfigurationErrorCode code() const noexcept { return code_; }

private:
    ConfigurationErrorCode code_;
};

/// Raised by a vector field for input outside its domain.
/// The stepping engine lets it propagate unchanged.
class FieldEvaluationError : public std::runtime_error {
public:
    explicit FieldEvaluationError(const std::string& message)
        : std::runtime_error(message) {}
};

// =============================================================================
// Implicit Stage Solve Status
// =============================================================================

enum class ImplicitSolveStatus {
    Success,
    MaxIterationsReached,
    SingularMatrix,
    NumericalError,
    Diverging
};

[[nodiscard]] constexpr const char* to_string(ImplicitSolveStatus status) noexcept {
    switch (status) {
        case ImplicitSolveStatus::Success: return "Success";
        case ImplicitSolveStatus::MaxIterationsReached: return "MaxIterationsReached";
        case ImplicitSolveStatus::SingularMatrix: return "SingularMatrix";
        case ImplicitSolveStatus::NumericalError: return "NumericalError";
        case ImplicitSolveStatus::Diverging: return "Diverging";
        default: return "Unknown";
    }
}

// =============================================================================
// Integration Status
// =============================================================================

enum class IntegrationStatus {
    Running,
    Completed,
    StepSizeUnderflow,
    SolverStalled,
    NonFiniteState,
    FieldEvaluationFailure
};

[[nodiscard]] constexpr const char* to_string(IntegrationStatus status) noexcept {
    switch (status) {
        case IntegrationStatus::Running: return "Running";
        case IntegrationStatus::Completed: return "Completed";
        case IntegrationStatus::StepSizeUnderflow: return "StepSizeUnderflow";
        case IntegrationStatus::SolverStalled: return "SolverStalled";
        case IntegrationStatus::NonFiniteState: return "NonFiniteState";
        case IntegrationStatus::FieldEvaluationFailure: return "FieldEvaluationFailure";
        default: return "Unknown";
    }
}

/// True for outcomes that ended the trajectory before the target time
[[nodiscard]] constexpr bool is_fatal(IntegrationStatus status) noexcept {
    return status != IntegrationStatus::Running && status != IntegrationStatus::Completed;
}

/// Thrown by solve_to() when integration ends before the target time
class IntegrationError : public std::runtime_error {
public:
    IntegrationError(IntegrationStatus status, const std::string& message)
        : std::runtime_error(std::string("[") + to_string(status) + "] " + message)
        , status_(status) {}

    [[nodiscard]] IntegrationStatus status() const noexcept { return status_; }

private:
    IntegrationStatus status_;
};

}  // namespace kutta::v1
