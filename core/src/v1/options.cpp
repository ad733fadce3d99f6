#include "kutta/v1/options.hpp"

#include <string>

namespace kutta::v1 {

namespace {

[[nodiscard]] bool positive_finite(Real value) {
    return std::isfinite(value) && value > 0.0;
}

}  // namespace

void IntegratorOptions::validate() const {
    if (!std::isfinite(absolute_tolerance) || absolute_tolerance < 0.0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidTolerance,
                                 "absolute_tolerance must be finite and >= 0");
    }
    if (!std::isfinite(relative_tolerance) || relative_tolerance < 0.0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidTolerance,
                                 "relative_tolerance must be finite and >= 0");
    }
    if (absolute_tolerance == 0.0 && relative_tolerance == 0.0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidTolerance,
                                 "absolute_tolerance and relative_tolerance cannot both be zero");
    }
    if (!std::isfinite(implicit_convergence_tolerance) || implicit_convergence_tolerance < 0.0 ||
        !std::isfinite(implicit_relative_tolerance) || implicit_relative_tolerance < 0.0 ||
        (implicit_convergence_tolerance == 0.0 && implicit_relative_tolerance == 0.0)) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidTolerance,
                                 "implicit tolerances must be finite, >= 0 and not both zero");
    }

    if (!std::isfinite(initial_step_size)) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidStepSize,
                                 "initial_step_size must be finite");
    }
    if (!positive_finite(min_step_size)) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidStepSize,
                                 "min_step_size must be finite and > 0");
    }
    if (initial_step_size > 0.0 && initial_step_size < min_step_size) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidStepSize,
                                 "initial_step_size must be 0 (automatic) or >= min_step_size");
    }
    if (std::isnan(max_step_size) || max_step_size < min_step_size) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidStepSize,
                                 "max_step_size must be >= min_step_size");
    }
    if (!positive_finite(jacobian_perturbation)) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidStepSize,
                                 "jacobian_perturbation must be finite and > 0");
    }

    if (!positive_finite(safety_factor) || safety_factor > 1.0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidGrowthFactor,
                                 "safety_factor must be in (0, 1]");
    }
    if (!positive_finite(min_growth_factor) || !positive_finite(max_growth_factor) ||
        min_growth_factor > max_growth_factor) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidGrowthFactor,
                                 "growth factors must satisfy 0 < min_growth_factor <= max_growth_factor");
    }
    if (max_growth_factor < 1.0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidGrowthFactor,
                                 "max_growth_factor must be >= 1");
    }
    if (!positive_finite(max_shrink_factor) || max_shrink_factor >= 1.0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidGrowthFactor,
                                 "max_shrink_factor must be in (0, 1)");
    }
    if (!positive_finite(nonconvergence_shrink_factor) || nonconvergence_shrink_factor >= 1.0) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidGrowthFactor,
                                 "nonconvergence_shrink_factor must be in (0, 1)");
    }

    if (implicit_iteration_cap < 1) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidIterationLimit,
                                 "implicit_iteration_cap must be >= 1, got " +
                                     std::to_string(implicit_iteration_cap));
    }
    if (max_consecutive_nonconvergence < 1) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidIterationLimit,
                                 "max_consecutive_nonconvergence must be >= 1, got " +
                                     std::to_string(max_consecutive_nonconvergence));
    }
}

}  // namespace kutta::v1
