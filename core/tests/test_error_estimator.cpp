#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "kutta/v1/error_estimator.hpp"
#include "kutta/v1/stage_evaluator.hpp"
#include "kutta/v1/tableau_catalog.hpp"
#include <cmath>
#include <limits>

using namespace kutta::v1;
using Catch::Approx;

namespace {

Vector scalar_vector(Real value) {
    Vector v(1);
    v << value;
    return v;
}

/// Embedded error of one step of y' = y from y = 1
Real error_of_step(const Tableau& tableau, Real h) {
    VectorField<Vector> field = [](Real, const Vector& y) { return Vector(y); };
    const Vector y = scalar_vector(1.0);
    const auto evaluation = evaluate_explicit_stages<Vector>(field, 0.0, y, h, tableau);
    const Vector candidate = combine_stages(y, h, evaluation.stages, tableau.weights());
    ErrorEstimator estimator(1e-6, 1e-6);
    return estimator.estimate(evaluation.stages, h, tableau, y, candidate).error[0];
}

}  // namespace

TEST_CASE("scaled_error_norm - Weighted maximum norm", "[error][norm]") {
    Vector error(2);
    error << 1e-3, 0.0;
    Vector y(2);
    y << 1.0, 0.0;
    Vector candidate(2);
    candidate << 2.0, 0.0;

    SECTION("Scale uses the larger endpoint") {
        // 1e-3 / (1e-3 + 1e-3 * 2)
        REQUIRE(scaled_error_norm(error, y, candidate, 1e-3, 1e-3) == Approx(1.0 / 3.0));
    }

    SECTION("Zero error component with zero tolerance scale is skipped") {
        REQUIRE(scaled_error_norm(error, y, candidate, 0.0, 1e-3) == Approx(0.5));
    }

    SECTION("Non-finite component propagates") {
        error[1] = std::numeric_limits<Real>::quiet_NaN();
        REQUIRE(std::isnan(scaled_error_norm(error, y, candidate, 1e-3, 1e-3)));
    }

    SECTION("Scalar state") {
        REQUIRE(scaled_error_norm<Real>(-2e-6, 1.0, 1.0, 1e-6, 1e-6) == Approx(1.0));
    }
}

TEST_CASE("ErrorEstimator - Embedded difference", "[error][estimate]") {
    SECTION("Heun-Euler on y' = y") {
        // e = h (0.5 k1 - 0.5 k2) = -0.5 h^2 exactly
        const Tableau& tableau = TableauCatalog::get("heun-euler");
        REQUIRE(error_of_step(tableau, 0.1) == Approx(-0.005));

        VectorField<Vector> field = [](Real, const Vector& y) { return Vector(y); };
        const Vector y = scalar_vector(1.0);
        const auto evaluation = evaluate_explicit_stages<Vector>(field, 0.0, y, 0.1, tableau);
        const Vector candidate = combine_stages(y, 0.1, evaluation.stages, tableau.weights());
        REQUIRE(candidate[0] == Approx(1.105));

        ErrorEstimator estimator(1e-3, 0.0);
        const auto estimate = estimator.estimate(evaluation.stages, 0.1, tableau, y, candidate);
        REQUIRE(estimate.norm == Approx(5.0));
        REQUIRE(estimator.absolute_tolerance() == 1e-3);
        REQUIRE(estimator.relative_tolerance() == 0.0);
    }

    SECTION("Identical weights give zero error") {
        Tableau same({0.0, 1.0}, {{0.0, 0.0}, {1.0, 0.0}}, {0.5, 0.5}, 2,
                     std::vector<Real>{0.5, 0.5}, 2, "same");
        REQUIRE(error_of_step(same, 0.1) == 0.0);
    }

    SECTION("Error scales with the embedded order") {
        const Tableau& heun_euler = TableauCatalog::get("heun-euler");
        REQUIRE(error_of_step(heun_euler, 0.1) / error_of_step(heun_euler, 0.05) ==
                Approx(4.0));

        // Local error of the fourth-order embedded solution: O(h^5)
        const Tableau& dp = TableauCatalog::get("dormand-prince");
        REQUIRE(error_of_step(dp, 0.1) / error_of_step(dp, 0.05) == Approx(32.0).epsilon(0.05));
    }

    SECTION("Missing embedded weights") {
        const Tableau& rk4 = TableauCatalog::get("rk4");
        ErrorEstimator estimator(1e-6, 1e-6);
        StageSet<Vector> stages(4, scalar_vector(1.0));
        try {
            (void)estimator.estimate(stages, 0.1, rk4, scalar_vector(1.0), scalar_vector(1.1));
            FAIL("Expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.code() == ConfigurationErrorCode::MissingEmbeddedMethod);
        }
    }
}
