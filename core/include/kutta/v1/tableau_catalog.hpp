#pragma once

// =============================================================================
// Kutta v1 - Tableau Catalog
// =============================================================================
// Named, ready-made Butcher tableaus:
// - Explicit fixed-order methods (Euler through the 3/8 rule)
// - Explicit embedded pairs for adaptive stepping
// - Implicit methods (collocation, DIRK), some with embedded weights
//
// Every factory returns a freshly validated Tableau. The catalog keeps one
// instance per name for the lifetime of the program, so references returned
// by TableauCatalog::get() may be shared across solves.
// =============================================================================

#include "kutta/v1/tableau.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace kutta::v1 {

namespace tableaus {

// Explicit, fixed order
[[nodiscard]] Tableau euler();
[[nodiscard]] Tableau midpoint();
[[nodiscard]] Tableau heun();
[[nodiscard]] Tableau ralston();
[[nodiscard]] Tableau kutta3();
[[nodiscard]] Tableau rk4();
[[nodiscard]] Tableau rk38();

// Explicit, embedded
[[nodiscard]] Tableau heun_euler();
[[nodiscard]] Tableau bogacki_shampine();
[[nodiscard]] Tableau fehlberg45();
[[nodiscard]] Tableau cash_karp();
[[nodiscard]] Tableau dormand_prince();

// Implicit
[[nodiscard]] Tableau backward_euler();
[[nodiscard]] Tableau implicit_midpoint();
[[nodiscard]] Tableau trapezoidal();
[[nodiscard]] Tableau gauss_legendre4();
[[nodiscard]] Tableau radau_iia3();
[[nodiscard]] Tableau lobatto_iiic2();
[[nodiscard]] Tableau sdirk2();

}  // namespace tableaus

class TableauCatalog {
public:
    /// Look up a tableau by name (e.g. "rk4", "dormand-prince").
    /// @throws ConfigurationError (UnknownTableau) for names not in the catalog
    [[nodiscard]] static const Tableau& get(std::string_view name);

    [[nodiscard]] static bool contains(std::string_view name);

    /// All registered names, sorted
    [[nodiscard]] static std::vector<std::string> names();
};

}  // namespace kutta::v1
