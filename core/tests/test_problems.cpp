#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "kutta/v1/problems.hpp"
#include "kutta/v1/run_config.hpp"
#include <cmath>

using namespace kutta::v1;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Problem Catalog
// =============================================================================

TEST_CASE("Problems - Exponential", "[problems]") {
    const Problem p = problems::exponential(-2.0, 3.0);
    REQUIRE(p.has_exact_solution());
    REQUIRE(p.initial_state.size() == 1);
    REQUIRE(p.initial_state[0] == 3.0);
    REQUIRE(p.field(0.0, p.initial_state)[0] == Approx(-6.0));
    REQUIRE(p.jacobian(0.0, p.initial_state)(0, 0) == Approx(-2.0));
    REQUIRE(p.exact(1.0)[0] == Approx(3.0 * std::exp(-2.0)));
}

TEST_CASE("Problems - Analytical Jacobians match finite differences", "[problems][jacobian]") {
    for (const auto& name : problems::names()) {
        INFO("problem " << name);
        const Problem p = problems::make(name);
        Vector y = p.initial_state;
        for (Index i = 0; i < y.size(); ++i) {
            y[i] += 0.1 * static_cast<Real>(i + 1);
        }

        const Matrix analytic = p.jacobian(p.t0, y);
        const Vector f0 = p.field(p.t0, y);
        const Real eps = 1e-6;
        for (Index j = 0; j < y.size(); ++j) {
            Vector yp = y;
            yp[j] += eps;
            const Vector column = (p.field(p.t0, yp) - f0) / eps;
            for (Index i = 0; i < y.size(); ++i) {
                CHECK(analytic(i, j) ==
                      Approx(column[i]).epsilon(1e-4).margin(1e-4 * (1.0 + std::abs(analytic(i, j)))));
            }
        }
    }
}

TEST_CASE("Problems - Lookup by name", "[problems]") {
    SECTION("Parameters override defaults") {
        const Problem p = problems::make("harmonic", {{"omega", 2.0}});
        REQUIRE(p.name == "harmonic");
        REQUIRE(p.t_end == Approx(std::acos(-1.0)));
        REQUIRE(p.component_names.size() == 2);
    }

    SECTION("Unknown name") {
        try {
            (void)problems::make("pendulum");
            FAIL("Expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.code() == ConfigurationErrorCode::UnknownProblem);
        }
    }

    SECTION("Every listed name resolves") {
        for (const auto& name : problems::names()) {
            const Problem p = problems::make(name);
            REQUIRE(p.name == name);
            REQUIRE(static_cast<std::size_t>(p.initial_state.size()) == p.component_names.size());
            REQUIRE(p.t_end > p.t0);
        }
    }
}

// =============================================================================
// Run Configuration
// =============================================================================

TEST_CASE("RunConfig - Problem overrides", "[run][config]") {
    RunConfig config;
    config.problem_name = "exponential";

    SECTION("Time window") {
        config.t_end = 2.0;
        const Problem p = config.resolve_problem();
        REQUIRE(p.t_end == 2.0);
        REQUIRE(p.has_exact_solution());
    }

    SECTION("Initial state drops the closed form") {
        config.initial_state = Vector::Constant(1, 5.0);
        const Problem p = config.resolve_problem();
        REQUIRE(p.initial_state[0] == 5.0);
        REQUIRE_FALSE(p.has_exact_solution());
    }

    SECTION("Initial state of the wrong size") {
        config.initial_state = Vector::Constant(2, 1.0);
        try {
            (void)config.resolve_problem();
            FAIL("Expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.code() == ConfigurationErrorCode::InvalidInitialState);
        }
    }

    SECTION("Custom tableau takes precedence") {
        config.custom_tableau = Tableau({0.0}, {{0.0}}, {1.0}, 1, std::nullopt, 0, "mine");
        REQUIRE(config.resolve_tableau().name() == "mine");
    }
}

TEST_CASE("run - Adaptive and fixed integration", "[run]") {
    RunConfig config;
    config.problem_name = "exponential";
    config.problem_parameters = {{"lambda", -1.0}};
    config.options.absolute_tolerance = 1e-9;
    config.options.relative_tolerance = 1e-9;

    SECTION("Adaptive default method") {
        const RunOutput output = run(config);
        REQUIRE(output.tableau_name == "dormand-prince");
        REQUIRE(output.result.success);
        REQUIRE_THAT(output.result.final_state()[0],
                     WithinAbs(output.problem.exact(1.0)[0], 1e-7));
    }

    SECTION("Fixed step with the default step size") {
        config.adaptive = false;
        config.tableau_name = "rk4";
        const RunOutput output = run(config);
        REQUIRE(output.result.success);
        REQUIRE(output.result.size() == 101);
        REQUIRE_THAT(output.result.final_state()[0], WithinAbs(std::exp(-1.0), 1e-9));
    }

    SECTION("Step callback sees every attempt") {
        std::size_t accepted = 0;
        const RunOutput output = run(config, [&accepted](const StepLogEntry& entry) {
            if (entry.event == StepEvent::Accepted) ++accepted;
        });
        REQUIRE(accepted == output.result.statistics.accepted_steps);
    }

    SECTION("Stiff problem with Newton stages") {
        RunConfig stiff;
        stiff.problem_name = "robertson";
        stiff.t_end = 1.0;
        stiff.tableau_name = "sdirk2";
        stiff.options = IntegratorOptions::stiff();
        stiff.options.absolute_tolerance = 1e-8;
        stiff.options.relative_tolerance = 1e-4;

        const RunOutput output = run(stiff);
        REQUIRE(output.result.success);
        const Vector& y = output.result.final_state();
        // Mass is conserved
        REQUIRE_THAT(y.sum(), WithinAbs(1.0, 1e-6));
        REQUIRE(y[0] < 1.0);
        REQUIRE(y[2] > 0.0);
    }
}
