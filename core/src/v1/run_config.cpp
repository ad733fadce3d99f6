#include "kutta/v1/run_config.hpp"

#include "kutta/v1/tableau_catalog.hpp"

#include <cmath>
#include <utility>

namespace kutta::v1 {

Problem RunConfig::resolve_problem() const {
    Problem problem = problems::make(problem_name, problem_parameters);

    if (initial_state) {
        if (initial_state->size() != problem.initial_state.size()) {
            throw ConfigurationError(
                ConfigurationErrorCode::InvalidInitialState,
                "Problem '" + problem.name + "' has " +
                    std::to_string(problem.initial_state.size()) + " components, initial_state has " +
                    std::to_string(initial_state->size()));
        }
        problem.initial_state = *initial_state;
        // The closed form assumes the default initial condition
        problem.exact = nullptr;
    }
    if (t_start) {
        if (*t_start != problem.t0) problem.exact = nullptr;
        problem.t0 = *t_start;
    }
    if (t_end) {
        problem.t_end = *t_end;
    }
    return problem;
}

Tableau RunConfig::resolve_tableau() const {
    if (custom_tableau) {
        return *custom_tableau;
    }
    return TableauCatalog::get(tableau_name);
}

RunOutput run(const RunConfig& config, const StepLogCallback& on_step) {
    RunOutput output{config.resolve_problem(), {}, {}};
    auto tableau = std::make_shared<const Tableau>(config.resolve_tableau());
    output.tableau_name = tableau->name();

    const Problem& problem = output.problem;
    const bool use_jacobian = config.analytic_jacobian && static_cast<bool>(problem.jacobian);

    if (config.adaptive) {
        IVPEmbeddedSolver<Vector> solver(tableau, config.options);
        if (use_jacobian) solver.set_jacobian(problem.jacobian);
        if (on_step) {
            solver.logger().set_enabled(true);
            solver.logger().set_callback(on_step);
        }
        output.result = solver.solve(problem.field, problem.t0, problem.initial_state,
                                     problem.t_end);
    } else {
        Real h = config.step_size;
        if (h <= 0.0) {
            h = std::abs(problem.t_end - problem.t0) / 100.0;
        }
        IVPSolver<Vector> solver(tableau, h, config.options);
        if (use_jacobian) solver.set_jacobian(problem.jacobian);
        if (on_step) {
            solver.logger().set_enabled(true);
            solver.logger().set_callback(on_step);
        }
        output.result = solver.solve(problem.field, problem.t0, problem.initial_state,
                                     problem.t_end);
    }
    return output;
}

}  // namespace kutta::v1
