#include "kutta/v1/tableau_catalog.hpp"

#include <cmath>
#include <functional>
#include <map>

namespace kutta::v1 {

namespace tableaus {

// =============================================================================
// Explicit, fixed order
// =============================================================================

Tableau euler() {
    return Tableau::make_explicit({0.0}, {{0.0}}, {1.0}, 1, std::nullopt, 0, "euler");
}

Tableau midpoint() {
    return Tableau::make_explicit(
        {0.0, 0.5},
        {{0.0, 0.0},
         {0.5, 0.0}},
        {0.0, 1.0}, 2, std::nullopt, 0, "midpoint");
}

Tableau heun() {
    return Tableau::make_explicit(
        {0.0, 1.0},
        {{0.0, 0.0},
         {1.0, 0.0}},
        {0.5, 0.5}, 2, std::nullopt, 0, "heun");
}

Tableau ralston() {
    return Tableau::make_explicit(
        {0.0, 2.0 / 3.0},
        {{0.0, 0.0},
         {2.0 / 3.0, 0.0}},
        {0.25, 0.75}, 2, std::nullopt, 0, "ralston");
}

Tableau kutta3() {
    return Tableau::make_explicit(
        {0.0, 0.5, 1.0},
        {{0.0, 0.0, 0.0},
         {0.5, 0.0, 0.0},
         {-1.0, 2.0, 0.0}},
        {1.0 / 6.0, 2.0 / 3.0, 1.0 / 6.0}, 3, std::nullopt, 0, "kutta3");
}

Tableau rk4() {
    return Tableau::make_explicit(
        {0.0, 0.5, 0.5, 1.0},
        {{0.0, 0.0, 0.0, 0.0},
         {0.5, 0.0, 0.0, 0.0},
         {0.0, 0.5, 0.0, 0.0},
         {0.0, 0.0, 1.0, 0.0}},
        {1.0 / 6.0, 1.0 / 3.0, 1.0 / 3.0, 1.0 / 6.0}, 4, std::nullopt, 0, "rk4");
}

Tableau rk38() {
    return Tableau::make_explicit(
        {0.0, 1.0 / 3.0, 2.0 / 3.0, 1.0},
        {{0.0, 0.0, 0.0, 0.0},
         {1.0 / 3.0, 0.0, 0.0, 0.0},
         {-1.0 / 3.0, 1.0, 0.0, 0.0},
         {1.0, -1.0, 1.0, 0.0}},
        {0.125, 0.375, 0.375, 0.125}, 4, std::nullopt, 0, "rk38");
}

// =============================================================================
// Explicit, embedded
// =============================================================================

Tableau heun_euler() {
    return Tableau::make_explicit(
        {0.0, 1.0},
        {{0.0, 0.0},
         {1.0, 0.0}},
        {0.5, 0.5}, 2,
        std::vector<Real>{1.0, 0.0}, 1, "heun-euler");
}

Tableau bogacki_shampine() {
    return Tableau::make_explicit(
        {0.0, 0.5, 0.75, 1.0},
        {{0.0, 0.0, 0.0, 0.0},
         {0.5, 0.0, 0.0, 0.0},
         {0.0, 0.75, 0.0, 0.0},
         {2.0 / 9.0, 1.0 / 3.0, 4.0 / 9.0, 0.0}},
        {2.0 / 9.0, 1.0 / 3.0, 4.0 / 9.0, 0.0}, 3,
        std::vector<Real>{7.0 / 24.0, 0.25, 1.0 / 3.0, 0.125}, 2, "bogacki-shampine");
}

// Propagates the fourth-order solution, estimates with the fifth-order one
Tableau fehlberg45() {
    return Tableau::make_explicit(
        {0.0, 0.25, 0.375, 12.0 / 13.0, 1.0, 0.5},
        {{0.0, 0.0, 0.0, 0.0, 0.0, 0.0},
         {0.25, 0.0, 0.0, 0.0, 0.0, 0.0},
         {3.0 / 32.0, 9.0 / 32.0, 0.0, 0.0, 0.0, 0.0},
         {1932.0 / 2197.0, -7200.0 / 2197.0, 7296.0 / 2197.0, 0.0, 0.0, 0.0},
         {439.0 / 216.0, -8.0, 3680.0 / 513.0, -845.0 / 4104.0, 0.0, 0.0},
         {-8.0 / 27.0, 2.0, -3544.0 / 2565.0, 1859.0 / 4104.0, -11.0 / 40.0, 0.0}},
        {25.0 / 216.0, 0.0, 1408.0 / 2565.0, 2197.0 / 4104.0, -0.2, 0.0}, 4,
        std::vector<Real>{16.0 / 135.0, 0.0, 6656.0 / 12825.0, 28561.0 / 56430.0, -9.0 / 50.0,
                          2.0 / 55.0},
        5, "fehlberg45");
}

Tableau cash_karp() {
    return Tableau::make_explicit(
        {0.0, 0.2, 0.3, 0.6, 1.0, 0.875},
        {{0.0, 0.0, 0.0, 0.0, 0.0, 0.0},
         {0.2, 0.0, 0.0, 0.0, 0.0, 0.0},
         {3.0 / 40.0, 9.0 / 40.0, 0.0, 0.0, 0.0, 0.0},
         {0.3, -0.9, 1.2, 0.0, 0.0, 0.0},
         {-11.0 / 54.0, 2.5, -70.0 / 27.0, 35.0 / 27.0, 0.0, 0.0},
         {1631.0 / 55296.0, 175.0 / 512.0, 575.0 / 13824.0, 44275.0 / 110592.0, 253.0 / 4096.0,
          0.0}},
        {37.0 / 378.0, 0.0, 250.0 / 621.0, 125.0 / 594.0, 0.0, 512.0 / 1771.0}, 5,
        std::vector<Real>{2825.0 / 27648.0, 0.0, 18575.0 / 48384.0, 13525.0 / 55296.0,
                          277.0 / 14336.0, 0.25},
        4, "cash-karp");
}

Tableau dormand_prince() {
    return Tableau::make_explicit(
        {0.0, 0.2, 0.3, 0.8, 8.0 / 9.0, 1.0, 1.0},
        {{0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0},
         {0.2, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0},
         {3.0 / 40.0, 9.0 / 40.0, 0.0, 0.0, 0.0, 0.0, 0.0},
         {44.0 / 45.0, -56.0 / 15.0, 32.0 / 9.0, 0.0, 0.0, 0.0, 0.0},
         {19372.0 / 6561.0, -25360.0 / 2187.0, 64448.0 / 6561.0, -212.0 / 729.0, 0.0, 0.0, 0.0},
         {9017.0 / 3168.0, -355.0 / 33.0, 46732.0 / 5247.0, 49.0 / 176.0, -5103.0 / 18656.0, 0.0,
          0.0},
         {35.0 / 384.0, 0.0, 500.0 / 1113.0, 125.0 / 192.0, -2187.0 / 6784.0, 11.0 / 84.0, 0.0}},
        {35.0 / 384.0, 0.0, 500.0 / 1113.0, 125.0 / 192.0, -2187.0 / 6784.0, 11.0 / 84.0, 0.0}, 5,
        std::vector<Real>{5179.0 / 57600.0, 0.0, 7571.0 / 16695.0, 393.0 / 640.0,
                          -92097.0 / 339200.0, 187.0 / 2100.0, 1.0 / 40.0},
        4, "dormand-prince");
}

// =============================================================================
// Implicit
// =============================================================================

Tableau backward_euler() {
    return Tableau({1.0}, {{1.0}}, {1.0}, 1, std::nullopt, 0, "backward-euler");
}

Tableau implicit_midpoint() {
    return Tableau({0.5}, {{0.5}}, {1.0}, 2, std::nullopt, 0, "implicit-midpoint");
}

// Trapezoidal rule (Lobatto IIIA, two stages) with the explicit Euler weights
Tableau trapezoidal() {
    return Tableau(
        {0.0, 1.0},
        {{0.0, 0.0},
         {0.5, 0.5}},
        {0.5, 0.5}, 2,
        std::vector<Real>{1.0, 0.0}, 1, "trapezoidal");
}

Tableau gauss_legendre4() {
    const Real r = std::sqrt(3.0) / 6.0;
    return Tableau(
        {0.5 - r, 0.5 + r},
        {{0.25, 0.25 - r},
         {0.25 + r, 0.25}},
        {0.5, 0.5}, 4, std::nullopt, 0, "gauss-legendre4");
}

Tableau radau_iia3() {
    return Tableau(
        {1.0 / 3.0, 1.0},
        {{5.0 / 12.0, -1.0 / 12.0},
         {0.75, 0.25}},
        {0.75, 0.25}, 3, std::nullopt, 0, "radau-iia3");
}

Tableau lobatto_iiic2() {
    return Tableau(
        {0.0, 1.0},
        {{0.5, -0.5},
         {0.5, 0.5}},
        {0.5, 0.5}, 2,
        std::vector<Real>{1.0, 0.0}, 1, "lobatto-iiic2");
}

// Alexander's L-stable two-stage SDIRK, gamma = 1 - 1/sqrt(2)
Tableau sdirk2() {
    const Real gamma = 1.0 - std::sqrt(2.0) / 2.0;
    return Tableau(
        {gamma, 1.0},
        {{gamma, 0.0},
         {1.0 - gamma, gamma}},
        {1.0 - gamma, gamma}, 2,
        std::vector<Real>{1.0, 0.0}, 1, "sdirk2");
}

}  // namespace tableaus

// =============================================================================
// Catalog
// =============================================================================

namespace {

using Registry = std::map<std::string, Tableau, std::less<>>;

const Registry& registry() {
    static const Registry instance = [] {
        Registry r;
        for (auto factory : {tableaus::euler, tableaus::midpoint, tableaus::heun,
                             tableaus::ralston, tableaus::kutta3, tableaus::rk4,
                             tableaus::rk38, tableaus::heun_euler,
                             tableaus::bogacki_shampine, tableaus::fehlberg45,
                             tableaus::cash_karp, tableaus::dormand_prince,
                             tableaus::backward_euler, tableaus::implicit_midpoint,
                             tableaus::trapezoidal, tableaus::gauss_legendre4,
                             tableaus::radau_iia3, tableaus::lobatto_iiic2,
                             tableaus::sdirk2}) {
            Tableau t = factory();
            std::string key = t.name();
            r.emplace(std::move(key), std::move(t));
        }
        return r;
    }();
    return instance;
}

}  // namespace

const Tableau& TableauCatalog::get(std::string_view name) {
    const auto& r = registry();
    auto it = r.find(name);
    if (it == r.end()) {
        throw ConfigurationError(ConfigurationErrorCode::UnknownTableau,
                                 "No tableau named '" + std::string(name) + "'");
    }
    return it->second;
}

bool TableauCatalog::contains(std::string_view name) {
    const auto& r = registry();
    return r.find(name) != r.end();
}

std::vector<std::string> TableauCatalog::names() {
    std::vector<std::string> result;
    for (const auto& [name, tableau] : registry()) {
        result.push_back(name);
    }
    return result;
}

}  // namespace kutta::v1
