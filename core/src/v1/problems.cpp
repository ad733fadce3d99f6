#include "kutta/v1/problems.hpp"

#include "kutta/v1/errors.hpp"

#include <cmath>
#include <numbers>

namespace kutta::v1::problems {

namespace {

[[nodiscard]] Real parameter(const ProblemParameters& parameters, std::string_view key,
                             Real fallback) {
    auto it = parameters.find(key);
    return it == parameters.end() ? fallback : it->second;
}

}  // namespace

Problem exponential(Real lambda, Real y0) {
    Problem p;
    p.name = "exponential";
    p.description = "y' = lambda * y";
    p.field = [lambda](Real, const Vector& y) -> Vector { return lambda * y; };
    p.jacobian = [lambda](Real, const Vector&) -> Matrix {
        return Matrix::Constant(1, 1, lambda);
    };
    p.initial_state = Vector::Constant(1, y0);
    p.t0 = 0.0;
    p.t_end = 1.0;
    p.exact = [lambda, y0](Real t) -> Vector {
        return Vector::Constant(1, y0 * std::exp(lambda * t));
    };
    p.component_names = {"y"};
    return p;
}

Problem harmonic_oscillator(Real omega) {
    Problem p;
    p.name = "harmonic";
    p.description = "x'' = -omega^2 x";
    p.field = [omega](Real, const Vector& y) -> Vector {
        Vector dy(2);
        dy << y[1], -omega * omega * y[0];
        return dy;
    };
    p.jacobian = [omega](Real, const Vector&) -> Matrix {
        Matrix j(2, 2);
        j << 0.0, 1.0,
             -omega * omega, 0.0;
        return j;
    };
    p.initial_state = Vector(2);
    p.initial_state << 1.0, 0.0;
    p.t0 = 0.0;
    p.t_end = 2.0 * std::numbers::pi / omega;
    p.exact = [omega](Real t) -> Vector {
        Vector y(2);
        y << std::cos(omega * t), -omega * std::sin(omega * t);
        return y;
    };
    p.component_names = {"x", "v"};
    return p;
}

Problem van_der_pol(Real mu) {
    Problem p;
    p.name = "van_der_pol";
    p.description = "x'' = mu (1 - x^2) x' - x";
    p.field = [mu](Real, const Vector& y) -> Vector {
        Vector dy(2);
        dy << y[1], mu * (1.0 - y[0] * y[0]) * y[1] - y[0];
        return dy;
    };
    p.jacobian = [mu](Real, const Vector& y) -> Matrix {
        Matrix j(2, 2);
        j << 0.0, 1.0,
             -2.0 * mu * y[0] * y[1] - 1.0, mu * (1.0 - y[0] * y[0]);
        return j;
    };
    p.initial_state = Vector(2);
    p.initial_state << 2.0, 0.0;
    p.t0 = 0.0;
    p.t_end = 20.0;
    p.component_names = {"x", "v"};
    return p;
}

Problem lorenz(Real sigma, Real rho, Real beta) {
    Problem p;
    p.name = "lorenz";
    p.description = "Lorenz attractor";
    p.field = [sigma, rho, beta](Real, const Vector& y) -> Vector {
        Vector dy(3);
        dy << sigma * (y[1] - y[0]),
              y[0] * (rho - y[2]) - y[1],
              y[0] * y[1] - beta * y[2];
        return dy;
    };
    p.jacobian = [sigma, rho, beta](Real, const Vector& y) -> Matrix {
        Matrix j(3, 3);
        j << -sigma, sigma, 0.0,
             rho - y[2], -1.0, -y[0],
             y[1], y[0], -beta;
        return j;
    };
    p.initial_state = Vector::Ones(3);
    p.t0 = 0.0;
    p.t_end = 10.0;
    p.component_names = {"x", "y", "z"};
    return p;
}

Problem robertson() {
    static constexpr Real k1 = 0.04;
    static constexpr Real k2 = 3.0e7;
    static constexpr Real k3 = 1.0e4;

    Problem p;
    p.name = "robertson";
    p.description = "Robertson chemical kinetics";
    p.field = [](Real, const Vector& y) -> Vector {
        Vector dy(3);
        dy << -k1 * y[0] + k3 * y[1] * y[2],
              k1 * y[0] - k3 * y[1] * y[2] - k2 * y[1] * y[1],
              k2 * y[1] * y[1];
        return dy;
    };
    p.jacobian = [](Real, const Vector& y) -> Matrix {
        Matrix j(3, 3);
        j << -k1, k3 * y[2], k3 * y[1],
             k1, -k3 * y[2] - 2.0 * k2 * y[1], -k3 * y[1],
             0.0, 2.0 * k2 * y[1], 0.0;
        return j;
    };
    p.initial_state = Vector(3);
    p.initial_state << 1.0, 0.0, 0.0;
    p.t0 = 0.0;
    p.t_end = 40.0;
    p.component_names = {"y1", "y2", "y3"};
    return p;
}

Problem make(std::string_view name, const ProblemParameters& parameters) {
    if (name == "exponential") {
        return exponential(parameter(parameters, "lambda", 1.0), parameter(parameters, "y0", 1.0));
    }
    if (name == "harmonic") {
        return harmonic_oscillator(parameter(parameters, "omega", 1.0));
    }
    if (name == "van_der_pol") {
        return van_der_pol(parameter(parameters, "mu", 1.0));
    }
    if (name == "lorenz") {
        return lorenz(parameter(parameters, "sigma", 10.0), parameter(parameters, "rho", 28.0),
                      parameter(parameters, "beta", 8.0 / 3.0));
    }
    if (name == "robertson") {
        return robertson();
    }
    throw ConfigurationError(ConfigurationErrorCode::UnknownProblem,
                             "No problem named '" + std::string(name) + "'");
}

std::vector<std::string> names() {
    return {"exponential", "harmonic", "lorenz", "robertson", "van_der_pol"};
}

}  // namespace kutta::v1::problems
