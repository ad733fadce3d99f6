#include "kutta/v1/tableau.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace kutta::v1 {

namespace {

[[nodiscard]] std::string dimension_message(const std::string& what,
                                            std::size_t expected,
                                            std::size_t got) {
    std::ostringstream message;
    message << what << " has the wrong dimension: expected " << expected << ", got " << got;
    return message.str();
}

void require_finite(std::span<const Real> values, const std::string& what) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw ConfigurationError(ConfigurationErrorCode::NonFiniteCoefficient,
                                     what + "[" + std::to_string(i) + "] is not finite");
        }
    }
}

[[nodiscard]] StageStructure classify(const std::vector<Real>& matrix, std::size_t s) {
    bool upper_nonzero = false;
    bool diagonal_nonzero = false;
    for (std::size_t i = 0; i < s; ++i) {
        for (std::size_t j = i; j < s; ++j) {
            if (matrix[i * s + j] == 0.0) continue;
            if (j == i) {
                diagonal_nonzero = true;
            } else {
                upper_nonzero = true;
            }
        }
    }

    if (!upper_nonzero && !diagonal_nonzero) {
        return ExplicitStructure{};
    }
    return ImplicitStructure{!upper_nonzero};
}

}  // namespace

Tableau::Tableau(std::vector<Real> nodes,
                 std::vector<Row> matrix,
                 std::vector<Real> weights,
                 int order,
                 std::optional<std::vector<Real>> embedded_weights,
                 int embedded_order,
                 std::string name)
    : nodes_(std::move(nodes))
    , weights_(std::move(weights))
    , order_(order)
    , embedded_order_(embedded_order)
    , name_(std::move(name)) {

    // The row count of A fixes the stage count; everything else must agree.
    const std::size_t s = matrix.size();
    if (s == 0) {
        throw ConfigurationError(ConfigurationErrorCode::EmptyTableau,
                                 "Tableau must have at least one stage");
    }

    if (nodes_.size() != s) {
        throw ConfigurationError(ConfigurationErrorCode::NodesDimension,
                                 dimension_message("Nodes vector", s, nodes_.size()));
    }
    matrix_.reserve(s * s);
    for (std::size_t i = 0; i < s; ++i) {
        if (matrix[i].size() != s) {
            throw ConfigurationError(
                ConfigurationErrorCode::MatrixDimension,
                dimension_message("Matrix row " + std::to_string(i), s, matrix[i].size()));
        }
        matrix_.insert(matrix_.end(), matrix[i].begin(), matrix[i].end());
    }

    if (weights_.size() != s) {
        throw ConfigurationError(ConfigurationErrorCode::WeightsDimension,
                                 dimension_message("Weights vector", s, weights_.size()));
    }

    if (embedded_weights) {
        if (embedded_weights->size() != s) {
            throw ConfigurationError(
                ConfigurationErrorCode::EmbeddedWeightsDimension,
                dimension_message("Embedded weights vector", s, embedded_weights->size()));
        }
        embedded_weights_ = std::move(*embedded_weights);
    }

    require_finite(nodes_, "nodes");
    require_finite(matrix_, "matrix");
    require_finite(weights_, "weights");
    require_finite(embedded_weights_, "embedded_weights");

    if (order_ < 1) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidOrder,
                                 "Method order must be at least 1, got " + std::to_string(order_));
    }
    if (has_embedded_method() && embedded_order_ < 1) {
        throw ConfigurationError(ConfigurationErrorCode::InvalidOrder,
                                 "Embedded method order must be at least 1, got " +
                                     std::to_string(embedded_order_));
    }
    if (!has_embedded_method()) {
        embedded_order_ = 0;
    }

    error_weights_.resize(embedded_weights_.size());
    for (std::size_t i = 0; i < embedded_weights_.size(); ++i) {
        error_weights_[i] = embedded_weights_[i] - weights_[i];
    }

    structure_ = classify(matrix_, s);
}

Tableau Tableau::make_explicit(std::vector<Real> nodes,
                               std::vector<Row> matrix,
                               std::vector<Real> weights,
                               int order,
                               std::optional<std::vector<Real>> embedded_weights,
                               int embedded_order,
                               std::string name) {
    Tableau tableau(std::move(nodes), std::move(matrix), std::move(weights), order,
                    std::move(embedded_weights), embedded_order, std::move(name));
    if (!tableau.is_explicit()) {
        throw ConfigurationError(ConfigurationErrorCode::NotStrictlyLowerTriangular,
                                 "The matrix is not strictly lower triangular");
    }
    return tableau;
}

std::span<const Real> Tableau::row(std::size_t i) const {
    if (i >= stages()) {
        throw std::out_of_range("Tableau row index " + std::to_string(i) + " out of range");
    }
    return std::span<const Real>(matrix_.data() + i * stages(), stages());
}

Matrix Tableau::coefficient_matrix() const {
    const auto s = static_cast<Index>(stages());
    Matrix a(s, s);
    for (Index i = 0; i < s; ++i) {
        for (Index j = 0; j < s; ++j) {
            a(i, j) = matrix_[static_cast<std::size_t>(i * s + j)];
        }
    }
    return a;
}

bool Tableau::is_uncoupled() const noexcept {
    return std::all_of(matrix_.begin(), matrix_.end(), [](Real a) { return a == 0.0; });
}

const char* structure_label(const Tableau& tableau) noexcept {
    if (const auto* implicit = std::get_if<ImplicitStructure>(&tableau.structure())) {
        return implicit->diagonally_implicit ? "diagonally implicit" : "implicit";
    }
    return "explicit";
}

}  // namespace kutta::v1
