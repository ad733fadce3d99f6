#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "kutta/v1/stage_evaluator.hpp"
#include "kutta/v1/tableau_catalog.hpp"
#include <cmath>
#include <vector>

using namespace kutta::v1;
using Catch::Approx;

namespace {

Vector scalar_vector(Real value) {
    Vector v(1);
    v << value;
    return v;
}

}  // namespace

// =============================================================================
// Explicit Stages
// =============================================================================

TEST_CASE("Explicit stages - First stage sees (t, y) only", "[stage][explicit]") {
    struct Call {
        Real t;
        Real y;
    };
    std::vector<Call> calls;
    VectorField<Vector> field = [&calls](Real t, const Vector& y) {
        calls.push_back({t, y[0]});
        return Vector(y * 2.0);
    };

    const auto evaluation = evaluate_explicit_stages<Vector>(field, 0.5, scalar_vector(3.0), 0.1,
                                                             TableauCatalog::get("rk4"));

    REQUIRE(calls.size() == 4);
    REQUIRE(evaluation.field_evaluations == 4);
    REQUIRE(evaluation.implicit_iterations == 0);
    REQUIRE(evaluation.converged());

    // Stages are evaluated in ascending order at t + c_i h
    REQUIRE(calls[0].t == 0.5);
    REQUIRE(calls[0].y == 3.0);
    REQUIRE(calls[1].t == Approx(0.55));
    REQUIRE(calls[3].t == Approx(0.6));
    REQUIRE(evaluation.stages[0][0] == Approx(6.0));
    // y + h/2 * k1 = 3.3
    REQUIRE(calls[1].y == Approx(3.3));
}

TEST_CASE("Explicit stages - Classical RK4 step of y' = y", "[stage][explicit]") {
    VectorField<Vector> field = [](Real, const Vector& y) { return Vector(y); };
    const Tableau& rk4 = TableauCatalog::get("rk4");

    const auto evaluation = evaluate_explicit_stages<Vector>(field, 0.0, scalar_vector(1.0), 0.1, rk4);
    const Vector y1 = combine_stages(scalar_vector(1.0), 0.1, evaluation.stages, rk4.weights());

    REQUIRE(y1[0] == Approx(1.1051708333333333).epsilon(1e-12));
}

TEST_CASE("Explicit stages - Scalar state", "[stage][explicit]") {
    VectorField<Real> field = [](Real t, const Real& y) { return t - y; };
    const Tableau& heun = TableauCatalog::get("heun");

    const auto evaluation = evaluate_explicit_stages<Real>(field, 0.0, 1.0, 0.5, heun);
    REQUIRE(evaluation.stages.size() == 2);
    REQUIRE(evaluation.stages[0] == Approx(-1.0));
    // f(0.5, 1 - 0.5) = 0
    REQUIRE(evaluation.stages[1] == Approx(0.0));

    const Real y1 = combine_stages<Real>(1.0, 0.5, evaluation.stages, heun.weights());
    REQUIRE(y1 == Approx(0.75));
}

// =============================================================================
// Dispatch
// =============================================================================

TEST_CASE("StageEvaluator - Dispatches on tableau structure", "[stage][dispatch]") {
    VectorField<Vector> field = [](Real, const Vector& y) { return Vector(-2.0 * y); };
    StageEvaluator<Vector> evaluator;

    SECTION("Explicit tableau evaluates each stage once") {
        const auto evaluation = evaluator.evaluate(field, 0.0, scalar_vector(1.0), 0.1,
                                                   TableauCatalog::get("rk4"));
        REQUIRE(evaluation.converged());
        REQUIRE(evaluation.implicit_iterations == 0);
        REQUIRE(evaluation.field_evaluations == 4);
    }

    SECTION("Implicit tableau iterates") {
        const auto evaluation = evaluator.evaluate(field, 0.0, scalar_vector(1.0), 0.1,
                                                   TableauCatalog::get("backward-euler"));
        REQUIRE(evaluation.converged());
        REQUIRE(evaluation.implicit_iterations > 1);
        // k = lambda y / (1 - h lambda)
        REQUIRE(evaluation.stages[0][0] == Approx(-2.0 / 1.2).epsilon(1e-8));
    }
}

TEST_CASE("StageEvaluator - Warm start from converged stages", "[stage][implicit]") {
    VectorField<Vector> field = [](Real, const Vector& y) { return Vector(-2.0 * y); };
    const Tableau& tableau = TableauCatalog::get("gauss-legendre4");
    StageEvaluator<Vector> evaluator;

    const auto cold = evaluator.evaluate(field, 0.0, scalar_vector(1.0), 0.1, tableau);
    REQUIRE(cold.converged());

    const auto warm = evaluator.evaluate(field, 0.0, scalar_vector(1.0), 0.1, tableau, &cold.stages);
    REQUIRE(warm.converged());
    REQUIRE(warm.implicit_iterations == 1);
    REQUIRE(warm.implicit_iterations < cold.implicit_iterations);
    // No extra evaluation for the initial guess
    REQUIRE(warm.field_evaluations == static_cast<int>(tableau.stages()));

    SECTION("Warm start of the wrong size is ignored") {
        StageSet<Vector> wrong{scalar_vector(0.0)};
        const auto result = evaluator.evaluate(field, 0.0, scalar_vector(1.0), 0.1, tableau, &wrong);
        REQUIRE(result.converged());
        REQUIRE(result.implicit_iterations == cold.implicit_iterations);
    }
}

TEST_CASE("combine_stages - Skips zero weights", "[stage]") {
    StageSet<Vector> stages{scalar_vector(1.0), scalar_vector(std::nan(""))};
    const std::vector<Real> weights{1.0, 0.0};
    const Vector y1 = combine_stages(scalar_vector(2.0), 0.5, stages, weights);
    REQUIRE(y1[0] == Approx(2.5));
}
