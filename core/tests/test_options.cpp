#include <catch2/catch_test_macros.hpp>
#include "kutta/v1/options.hpp"
#include <limits>

using namespace kutta::v1;

namespace {

ConfigurationErrorCode validation_error(const IntegratorOptions& opts) {
    try {
        opts.validate();
    } catch (const ConfigurationError& e) {
        return e.code();
    }
    FAIL("Expected ConfigurationError");
    return ConfigurationErrorCode::InvalidTolerance;
}

}  // namespace

TEST_CASE("IntegratorOptions - Presets are valid", "[options][presets]") {
    REQUIRE_NOTHROW(IntegratorOptions::defaults().validate());
    REQUIRE_NOTHROW(IntegratorOptions::conservative().validate());
    REQUIRE_NOTHROW(IntegratorOptions::aggressive().validate());
    REQUIRE_NOTHROW(IntegratorOptions::stiff().validate());

    const auto defaults = IntegratorOptions::defaults();
    REQUIRE(defaults.absolute_tolerance == 1e-6);
    REQUIRE(defaults.relative_tolerance == 1e-3);
    REQUIRE(defaults.initial_step_size == 0.0);
    REQUIRE(defaults.implicit_mode == ImplicitMode::FixedPoint);

    const auto conservative = IntegratorOptions::conservative();
    REQUIRE(conservative.absolute_tolerance < defaults.absolute_tolerance);
    REQUIRE(conservative.max_growth_factor < defaults.max_growth_factor);

    const auto aggressive = IntegratorOptions::aggressive();
    REQUIRE(aggressive.max_growth_factor > defaults.max_growth_factor);

    REQUIRE(IntegratorOptions::stiff().implicit_mode == ImplicitMode::Newton);
}

TEST_CASE("IntegratorOptions - Tolerance validation", "[options][validation]") {
    IntegratorOptions opts;

    SECTION("Negative absolute tolerance") {
        opts.absolute_tolerance = -1e-6;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidTolerance);
    }
    SECTION("Non-finite relative tolerance") {
        opts.relative_tolerance = std::numeric_limits<Real>::quiet_NaN();
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidTolerance);
    }
    SECTION("Both tolerances zero") {
        opts.absolute_tolerance = 0.0;
        opts.relative_tolerance = 0.0;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidTolerance);
    }
    SECTION("Pure relative control is allowed") {
        opts.absolute_tolerance = 0.0;
        REQUIRE_NOTHROW(opts.validate());
    }
    SECTION("Implicit tolerances") {
        opts.implicit_convergence_tolerance = 0.0;
        opts.implicit_relative_tolerance = 0.0;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidTolerance);
    }
}

TEST_CASE("IntegratorOptions - Step size validation", "[options][validation]") {
    IntegratorOptions opts;

    SECTION("Non-positive minimum") {
        opts.min_step_size = 0.0;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidStepSize);
    }
    SECTION("Maximum below minimum") {
        opts.min_step_size = 1e-3;
        opts.max_step_size = 1e-4;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidStepSize);
    }
    SECTION("Initial step below minimum") {
        opts.min_step_size = 1e-3;
        opts.initial_step_size = 1e-4;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidStepSize);
    }
    SECTION("Infinite initial step") {
        opts.initial_step_size = std::numeric_limits<Real>::infinity();
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidStepSize);
    }
    SECTION("Unbounded maximum is the default") {
        REQUIRE(opts.max_step_size == std::numeric_limits<Real>::infinity());
        REQUIRE_NOTHROW(opts.validate());
    }
}

TEST_CASE("IntegratorOptions - Growth factor validation", "[options][validation]") {
    IntegratorOptions opts;

    SECTION("Safety factor above one") {
        opts.safety_factor = 1.5;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidGrowthFactor);
    }
    SECTION("Min growth above max growth") {
        opts.min_growth_factor = 6.0;
        opts.max_growth_factor = 5.0;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidGrowthFactor);
    }
    SECTION("Max growth below one") {
        opts.min_growth_factor = 0.1;
        opts.max_growth_factor = 0.5;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidGrowthFactor);
    }
    SECTION("Shrink factor of one") {
        opts.max_shrink_factor = 1.0;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidGrowthFactor);
    }
    SECTION("Non-convergence shrink of zero") {
        opts.nonconvergence_shrink_factor = 0.0;
        CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidGrowthFactor);
    }
}

TEST_CASE("IntegratorOptions - Iteration limit validation", "[options][validation]") {
    IntegratorOptions opts;

    opts.implicit_iteration_cap = 0;
    CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidIterationLimit);

    opts.implicit_iteration_cap = 1;
    REQUIRE_NOTHROW(opts.validate());

    opts.max_consecutive_nonconvergence = 0;
    CHECK(validation_error(opts) == ConfigurationErrorCode::InvalidIterationLimit);
}

TEST_CASE("ImplicitMode - Names", "[options]") {
    CHECK(std::string(to_string(ImplicitMode::FixedPoint)) == "FixedPoint");
    CHECK(std::string(to_string(ImplicitMode::Newton)) == "Newton");
}
