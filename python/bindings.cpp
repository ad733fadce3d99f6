// =============================================================================
// Kutta v1 - Python Bindings
// =============================================================================
// pybind11 module `_kutta`: tableaus and the catalog, integrator options and
// a one-call integrate() over NumPy state vectors.
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>

#include "kutta/v1/core.hpp"

namespace py = pybind11;
using namespace kutta::v1;

// =============================================================================
// Helper: Python callables as vector fields
// =============================================================================

// A Python exception raised by f becomes a FieldEvaluationError so the
// integrator keeps the partial trajectory.
VectorField<Vector> wrap_field(py::function f) {
    return [f = std::move(f)](Real t, const Vector& y) -> Vector {
        py::gil_scoped_acquire gil;
        try {
            return f(t, y).cast<Vector>();
        } catch (const py::error_already_set& e) {
            throw FieldEvaluationError(e.what());
        } catch (const py::cast_error& e) {
            throw FieldEvaluationError(std::string("Field must return a 1-D float array: ") +
                                       e.what());
        }
    };
}

SolveResult<Vector> integrate(py::function f, Real t0, const Vector& y0, Real t_end,
                              const Tableau& tableau, const IntegratorOptions& options,
                              bool adaptive, Real step_size,
                              std::optional<py::function> jacobian) {
    auto field = wrap_field(std::move(f));
    auto shared_tableau = std::make_shared<const Tableau>(tableau);

    JacobianFunction<Vector> jac;
    if (jacobian) {
        jac = [j = std::move(*jacobian)](Real t, const Vector& y) -> Matrix {
            py::gil_scoped_acquire gil;
            return j(t, y).cast<Matrix>();
        };
    }

    if (adaptive) {
        IVPEmbeddedSolver<Vector> solver(shared_tableau, options);
        if (jac) solver.set_jacobian(jac);
        return solver.solve(std::move(field), t0, y0, t_end);
    }

    if (step_size <= 0.0) {
        step_size = std::abs(t_end - t0) / 100.0;
    }
    IVPSolver<Vector> solver(shared_tableau, step_size, options);
    if (jac) solver.set_jacobian(jac);
    return solver.solve(std::move(field), t0, y0, t_end);
}

// =============================================================================
// Module Definition
// =============================================================================

PYBIND11_MODULE(_kutta, m) {
    m.doc() = R"pbdoc(
        Kutta - Runge-Kutta initial value problem integrator (C++ extension)

        Example:
            import numpy as np
            import kutta

            tab = kutta.tableau("dormand-prince")
            opts = kutta.IntegratorOptions.conservative()
            res = kutta.integrate(lambda t, y: -y, 0.0, np.array([1.0]), 1.0,
                                  tab, opts)
            print(res.status, res.states[-1])
    )pbdoc";

    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<IntegrationError>(m, "IntegrationError", PyExc_RuntimeError);

    // =========================================================================
    // Enums
    // =========================================================================

    py::enum_<ImplicitMode>(m, "ImplicitMode", "Implicit stage iteration")
        .value("FixedPoint", ImplicitMode::FixedPoint)
        .value("Newton", ImplicitMode::Newton);

    py::enum_<IntegrationStatus>(m, "IntegrationStatus", "Trajectory end status")
        .value("Running", IntegrationStatus::Running)
        .value("Completed", IntegrationStatus::Completed)
        .value("StepSizeUnderflow", IntegrationStatus::StepSizeUnderflow)
        .value("SolverStalled", IntegrationStatus::SolverStalled)
        .value("NonFiniteState", IntegrationStatus::NonFiniteState)
        .value("FieldEvaluationFailure", IntegrationStatus::FieldEvaluationFailure);

    // =========================================================================
    // Tableau
    // =========================================================================

    py::class_<Tableau>(m, "Tableau", "Butcher tableau")
        .def(py::init<std::vector<Real>, std::vector<Tableau::Row>, std::vector<Real>, int,
                      std::optional<std::vector<Real>>, int, std::string>(),
             py::arg("nodes"), py::arg("matrix"), py::arg("weights"), py::arg("order"),
             py::arg("embedded_weights") = py::none(), py::arg("embedded_order") = 0,
             py::arg("name") = "")
        .def_property_readonly("stages", &Tableau::stages)
        .def_property_readonly("order", &Tableau::order)
        .def_property_readonly("embedded_order", &Tableau::embedded_order)
        .def_property_readonly("name", &Tableau::name)
        .def_property_readonly("nodes", [](const Tableau& t) {
            return std::vector<Real>(t.nodes().begin(), t.nodes().end());
        })
        .def_property_readonly("weights", [](const Tableau& t) {
            return std::vector<Real>(t.weights().begin(), t.weights().end());
        })
        .def_property_readonly("embedded_weights", [](const Tableau& t) {
            return std::vector<Real>(t.embedded_weights().begin(), t.embedded_weights().end());
        })
        .def_property_readonly("matrix", &Tableau::coefficient_matrix)
        .def("has_embedded_method", &Tableau::has_embedded_method)
        .def("is_explicit", &Tableau::is_explicit)
        .def("is_implicit", &Tableau::is_implicit)
        .def("structure", [](const Tableau& t) { return std::string(structure_label(t)); })
        .def("__repr__", [](const Tableau& t) {
            return "<Tableau '" + t.name() + "' " + structure_label(t) + ", " +
                   std::to_string(t.stages()) + " stages, order " + std::to_string(t.order()) +
                   ">";
        });

    m.def("tableau", [](const std::string& name) { return TableauCatalog::get(name); },
          py::arg("name"), "Copy of a catalog tableau");
    m.def("tableau_names", &TableauCatalog::names, "Names of the catalog tableaus");

    // =========================================================================
    // Options
    // =========================================================================

    py::class_<IntegratorOptions>(m, "IntegratorOptions", "Step control and implicit solver options")
        .def(py::init<>())
        .def_readwrite("absolute_tolerance", &IntegratorOptions::absolute_tolerance)
        .def_readwrite("relative_tolerance", &IntegratorOptions::relative_tolerance)
        .def_readwrite("initial_step_size", &IntegratorOptions::initial_step_size,
                       "0 selects the starting step automatically")
        .def_readwrite("min_step_size", &IntegratorOptions::min_step_size)
        .def_readwrite("max_step_size", &IntegratorOptions::max_step_size)
        .def_readwrite("safety_factor", &IntegratorOptions::safety_factor)
        .def_readwrite("min_growth_factor", &IntegratorOptions::min_growth_factor)
        .def_readwrite("max_growth_factor", &IntegratorOptions::max_growth_factor)
        .def_readwrite("max_shrink_factor", &IntegratorOptions::max_shrink_factor)
        .def_readwrite("nonconvergence_shrink_factor",
                       &IntegratorOptions::nonconvergence_shrink_factor)
        .def_readwrite("max_consecutive_nonconvergence",
                       &IntegratorOptions::max_consecutive_nonconvergence)
        .def_readwrite("implicit_mode", &IntegratorOptions::implicit_mode)
        .def_readwrite("implicit_iteration_cap", &IntegratorOptions::implicit_iteration_cap)
        .def_readwrite("implicit_convergence_tolerance",
                       &IntegratorOptions::implicit_convergence_tolerance)
        .def_readwrite("implicit_relative_tolerance",
                       &IntegratorOptions::implicit_relative_tolerance)
        .def_readwrite("jacobian_perturbation", &IntegratorOptions::jacobian_perturbation)
        .def_readwrite("warm_start_implicit", &IntegratorOptions::warm_start_implicit)
        .def_static("defaults", &IntegratorOptions::defaults)
        .def_static("conservative", &IntegratorOptions::conservative)
        .def_static("aggressive", &IntegratorOptions::aggressive)
        .def_static("stiff", &IntegratorOptions::stiff)
        .def("validate", &IntegratorOptions::validate);

    // =========================================================================
    // Results
    // =========================================================================

    py::class_<SolveStatistics>(m, "SolveStatistics", "Work counters of one solve")
        .def_readonly("accepted_steps", &SolveStatistics::accepted_steps)
        .def_readonly("rejected_steps", &SolveStatistics::rejected_steps)
        .def_readonly("nonconvergent_attempts", &SolveStatistics::nonconvergent_attempts)
        .def_readonly("field_evaluations", &SolveStatistics::field_evaluations)
        .def_readonly("implicit_iterations", &SolveStatistics::implicit_iterations)
        .def("total_attempts", &SolveStatistics::total_attempts);

    py::class_<SolveResult<Vector>>(m, "SolveResult", "Sampled trajectory")
        .def_readonly("time", &SolveResult<Vector>::time)
        .def_readonly("states", &SolveResult<Vector>::states)
        .def_readonly("success", &SolveResult<Vector>::success)
        .def_readonly("status", &SolveResult<Vector>::status)
        .def_readonly("message", &SolveResult<Vector>::message)
        .def_readonly("statistics", &SolveResult<Vector>::statistics)
        .def("__len__", &SolveResult<Vector>::size);

    m.def("integrate", &integrate,
          py::arg("f"), py::arg("t0"), py::arg("y0"), py::arg("t_end"),
          py::arg("tableau"), py::arg("options") = IntegratorOptions::defaults(),
          py::arg("adaptive") = true, py::arg("step_size") = 0.0,
          py::arg("jacobian") = py::none(),
          R"pbdoc(
              Integrate dy/dt = f(t, y) from t0 to t_end.

              Adaptive mode needs a tableau with embedded weights. In fixed
              mode step_size <= 0 selects (t_end - t0) / 100.
          )pbdoc");

    m.attr("__version__") = "0.1.0";
}
