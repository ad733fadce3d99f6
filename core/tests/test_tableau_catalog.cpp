#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "kutta/v1/tableau_catalog.hpp"
#include <algorithm>
#include <cmath>

using namespace kutta::v1;
using Catch::Approx;

TEST_CASE("TableauCatalog - Lookup by name", "[catalog]") {
    SECTION("Known names") {
        REQUIRE(TableauCatalog::contains("rk4"));
        REQUIRE(TableauCatalog::contains("dormand-prince"));
        REQUIRE(TableauCatalog::get("rk4").stages() == 4);
        REQUIRE(TableauCatalog::get("dormand-prince").stages() == 7);
    }

    SECTION("Repeated lookups share one instance") {
        const Tableau& a = TableauCatalog::get("heun");
        const Tableau& b = TableauCatalog::get("heun");
        REQUIRE(&a == &b);
    }

    SECTION("Unknown name") {
        REQUIRE_FALSE(TableauCatalog::contains("rk99"));
        try {
            (void)TableauCatalog::get("rk99");
            FAIL("Expected ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(e.code() == ConfigurationErrorCode::UnknownTableau);
        }
    }

    SECTION("Names are sorted and complete") {
        const auto names = TableauCatalog::names();
        REQUIRE(names.size() == 19);
        REQUIRE(std::is_sorted(names.begin(), names.end()));
        for (const auto& name : names) {
            REQUIRE(TableauCatalog::get(name).name() == name);
        }
    }
}

TEST_CASE("TableauCatalog - Consistency conditions", "[catalog][coefficients]") {
    for (const auto& name : TableauCatalog::names()) {
        const Tableau& t = TableauCatalog::get(name);
        INFO("tableau " << name);

        Real weight_sum = 0.0;
        for (Real b : t.weights()) weight_sum += b;
        CHECK(weight_sum == Approx(1.0).margin(1e-12));

        if (t.has_embedded_method()) {
            Real embedded_sum = 0.0;
            for (Real b : t.embedded_weights()) embedded_sum += b;
            CHECK(embedded_sum == Approx(1.0).margin(1e-12));
            CHECK(t.embedded_order() >= 1);
        }

        // c_i = sum_j a_ij
        for (std::size_t i = 0; i < t.stages(); ++i) {
            Real row_sum = 0.0;
            for (Real a : t.row(i)) row_sum += a;
            CHECK(row_sum == Approx(t.node(i)).margin(1e-12));
        }
    }
}

TEST_CASE("TableauCatalog - Structure of catalog methods", "[catalog][structure]") {
    CHECK(TableauCatalog::get("euler").is_explicit());
    CHECK(TableauCatalog::get("rk38").is_explicit());
    CHECK(TableauCatalog::get("cash-karp").is_explicit());
    CHECK(TableauCatalog::get("backward-euler").is_implicit());
    CHECK(TableauCatalog::get("gauss-legendre4").is_implicit());
    CHECK(std::string(structure_label(TableauCatalog::get("sdirk2"))) == "diagonally implicit");
    CHECK(std::string(structure_label(TableauCatalog::get("radau-iia3"))) == "implicit");

    CHECK(TableauCatalog::get("fehlberg45").order() == 4);
    CHECK(TableauCatalog::get("fehlberg45").embedded_order() == 5);
    CHECK(TableauCatalog::get("dormand-prince").order() == 5);
    CHECK(TableauCatalog::get("dormand-prince").embedded_order() == 4);
    CHECK(TableauCatalog::get("trapezoidal").has_embedded_method());
    CHECK_FALSE(TableauCatalog::get("rk4").has_embedded_method());
}

TEST_CASE("TableauCatalog - Gauss-Legendre nodes", "[catalog][coefficients]") {
    const Tableau t = tableaus::gauss_legendre4();
    const Real r = std::sqrt(3.0) / 6.0;
    REQUIRE(t.node(0) == Approx(0.5 - r));
    REQUIRE(t.node(1) == Approx(0.5 + r));
    REQUIRE(t.order() == 4);
}
