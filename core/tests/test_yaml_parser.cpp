#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "kutta/v1/parser/yaml_parser.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace kutta::v1;
using namespace kutta::v1::parser;
using Catch::Approx;

namespace {

bool has_diagnostic(const std::vector<std::string>& messages, const std::string& code) {
    return std::any_of(messages.begin(), messages.end(), [&code](const std::string& m) {
        return m.find("[" + code + "]") != std::string::npos;
    });
}

bool has_message(const std::vector<std::string>& messages, const std::string& text) {
    return std::any_of(messages.begin(), messages.end(), [&text](const std::string& m) {
        return m.find(text) != std::string::npos;
    });
}

}  // namespace

TEST_CASE("YAML parser - Complete configuration", "[parser][yaml]") {
    const std::string yaml = R"(
schema: kutta-v1
version: 1
problem:
  name: harmonic
  parameters:
    omega: 2.0
  initial_state: [0.5, 0.0]
time:
  start: 0.0
  end: 3.0
method:
  tableau: Cash-Karp
  jacobian: finite_difference
tolerances:
  absolute: 1e-8
  relative: 1e-7
step_control:
  min_step: 1e-9
  max_step: 0.25
  safety_factor: 0.85
  max_consecutive_nonconvergence: 5
implicit:
  max_iterations: 30
  warm_start: true
output:
  path: harmonic.csv
  every: 4
)";

    YamlParser parser;
    const RunConfig config = parser.load_string(yaml);

    INFO((parser.errors().empty() ? std::string() : parser.errors().front()));
    REQUIRE(parser.errors().empty());
    REQUIRE(parser.warnings().empty());

    REQUIRE(config.problem_name == "harmonic");
    REQUIRE(config.problem_parameters.at("omega") == 2.0);
    REQUIRE(config.initial_state.has_value());
    REQUIRE(config.initial_state->size() == 2);
    REQUIRE((*config.initial_state)[0] == 0.5);
    REQUIRE(config.t_start.value() == 0.0);
    REQUIRE(config.t_end.value() == 3.0);

    REQUIRE(config.tableau_name == "cash-karp");
    REQUIRE(config.adaptive);
    REQUIRE_FALSE(config.analytic_jacobian);

    REQUIRE(config.options.absolute_tolerance == Approx(1e-8));
    REQUIRE(config.options.relative_tolerance == Approx(1e-7));
    REQUIRE(config.options.min_step_size == Approx(1e-9));
    REQUIRE(config.options.max_step_size == Approx(0.25));
    REQUIRE(config.options.safety_factor == Approx(0.85));
    REQUIRE(config.options.max_consecutive_nonconvergence == 5);
    REQUIRE(config.options.implicit_iteration_cap == 30);
    REQUIRE(config.options.warm_start_implicit);

    REQUIRE(config.output_path == "harmonic.csv");
    REQUIRE(config.output_every == 4);

    const Problem problem = config.resolve_problem();
    REQUIRE(problem.t_end == 3.0);
    REQUIRE_FALSE(problem.has_exact_solution());
}

TEST_CASE("YAML parser - Problem given as a name", "[parser][yaml]") {
    YamlParser parser;
    const RunConfig config = parser.load_string(
        "schema: kutta-v1\nversion: 1\nproblem: lorenz\n");
    REQUIRE(parser.errors().empty());
    REQUIRE(config.problem_name == "lorenz");
    REQUIRE(config.tableau_name == "dormand-prince");
    REQUIRE_FALSE(config.initial_state.has_value());
}

TEST_CASE("YAML parser - Schema and version", "[parser][yaml]") {
    YamlParser parser;

    SECTION("Missing schema") {
        (void)parser.load_string("version: 1\nproblem: exponential\n");
        REQUIRE(has_message(parser.errors(), "Missing required field 'schema'"));
    }

    SECTION("Wrong schema") {
        (void)parser.load_string("schema: other-v2\nversion: 1\nproblem: exponential\n");
        REQUIRE(has_message(parser.errors(), "Unsupported schema: other-v2"));
    }

    SECTION("Wrong version") {
        (void)parser.load_string("schema: kutta-v1\nversion: 3\nproblem: exponential\n");
        REQUIRE(has_message(parser.errors(), "Unsupported schema version: 3"));
    }

    SECTION("Missing problem") {
        (void)parser.load_string("schema: kutta-v1\nversion: 1\n");
        REQUIRE(has_message(parser.errors(), "Missing required field 'problem'"));
    }

    SECTION("Root is not a map") {
        (void)parser.load_string("- 1\n- 2\n");
        REQUIRE(has_message(parser.errors(), "Configuration root must be a map"));
    }

    SECTION("Malformed document") {
        (void)parser.load_string("schema: [kutta-v1\n");
        REQUIRE(has_message(parser.errors(), "YAML parse error"));
    }
}

TEST_CASE("YAML parser - Unknown fields", "[parser][yaml]") {
    const std::string yaml =
        "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
        "tolerances:\n  absolute: 1e-6\n  absolut: 1e-7\n";

    SECTION("Strict mode reports them") {
        YamlParser parser;
        (void)parser.load_string(yaml);
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_UNKNOWN_FIELD"));
        REQUIRE(has_message(parser.errors(), "tolerances.absolut"));
    }

    SECTION("Lenient mode ignores them") {
        YamlParser parser(YamlParserOptions{false});
        const RunConfig config = parser.load_string(yaml);
        REQUIRE(parser.errors().empty());
        REQUIRE(config.options.absolute_tolerance == Approx(1e-6));
    }
}

TEST_CASE("YAML parser - Type mismatches", "[parser][yaml]") {
    YamlParser parser;

    SECTION("Sequence where a number is expected") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "tolerances:\n  absolute: [1, 2]\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_TYPE_MISMATCH"));
        REQUIRE(has_message(parser.errors(), "tolerances.absolute"));
    }

    SECTION("Text where a boolean is expected") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "method:\n  adaptive: sometimes\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_TYPE_MISMATCH"));
    }
}

TEST_CASE("YAML parser - Problem and tableau names", "[parser][yaml]") {
    YamlParser parser;

    SECTION("Unknown problem") {
        (void)parser.load_string("schema: kutta-v1\nversion: 1\nproblem: pendulum\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_PROBLEM_UNKNOWN"));
    }

    SECTION("Unknown tableau") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "method:\n  tableau: rk17\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_TABLEAU_UNKNOWN"));
    }

    SECTION("Tableau without embedded weights falls back to fixed steps") {
        const RunConfig config = parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "method:\n  tableau: rk4\n");
        REQUIRE(parser.errors().empty());
        REQUIRE(has_diagnostic(parser.warnings(), "KUTTA_YAML_W_EMBEDDED_MISSING"));
        REQUIRE_FALSE(config.adaptive);
    }

    SECTION("Step size seeds an adaptive run") {
        const RunConfig config = parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "method:\n  tableau: bogacki-shampine\n  step_size: 0.01\n");
        REQUIRE(parser.errors().empty());
        REQUIRE(has_diagnostic(parser.warnings(), "KUTTA_YAML_W_STEP_SIZE_IGNORED"));
        REQUIRE(config.adaptive);
        REQUIRE(config.options.initial_step_size == Approx(0.01));
    }

    SECTION("Fixed steps keep the step size") {
        const RunConfig config = parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "method:\n  tableau: rk4\n  adaptive: false\n  step_size: 0.05\n");
        REQUIRE(parser.errors().empty());
        REQUIRE(parser.warnings().empty());
        REQUIRE(config.step_size == Approx(0.05));
    }

    SECTION("Non-positive step size") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "method:\n  tableau: rk4\n  adaptive: false\n  step_size: -0.1\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_PARAM_INVALID"));
    }

    SECTION("Unknown Jacobian source") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "method:\n  jacobian: symbolic\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_PARAM_INVALID"));
    }
}

TEST_CASE("YAML parser - Custom tableau", "[parser][yaml][tableau]") {
    YamlParser parser;

    SECTION("Heun-Euler pair") {
        const RunConfig config = parser.load_string(R"(
schema: kutta-v1
version: 1
problem: exponential
method:
  custom:
    name: my-heun
    nodes: [0.0, 1.0]
    matrix:
      - [0.0, 0.0]
      - [1.0, 0.0]
    weights: [0.5, 0.5]
    embedded_weights: [1.0, 0.0]
    order: 2
)");
        REQUIRE(parser.errors().empty());
        REQUIRE(config.custom_tableau.has_value());
        REQUIRE(config.custom_tableau->name() == "my-heun");
        REQUIRE(config.custom_tableau->embedded_order() == 1);
        REQUIRE(config.custom_tableau->is_explicit());
        REQUIRE(config.adaptive);
        REQUIRE(config.resolve_tableau().name() == "my-heun");
    }

    SECTION("Weights of the wrong length") {
        (void)parser.load_string(R"(
schema: kutta-v1
version: 1
problem: exponential
method:
  custom:
    nodes: [0.0, 1.0]
    matrix: [[0.0, 0.0], [1.0, 0.0]]
    weights: [1.0]
    order: 1
)");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_TABLEAU_INVALID"));
        REQUIRE(has_message(parser.errors(), "WeightsDimension"));
    }

    SECTION("Missing order") {
        (void)parser.load_string(R"(
schema: kutta-v1
version: 1
problem: exponential
method:
  custom:
    nodes: [0.0]
    matrix: [[0.0]]
    weights: [1.0]
)");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_TABLEAU_INVALID"));
        REQUIRE(has_message(parser.errors(), "method.custom.order"));
    }
}

TEST_CASE("YAML parser - Step control and implicit options", "[parser][yaml][options]") {
    YamlParser parser;

    SECTION("Stiff preset keeps explicit tolerances") {
        const RunConfig config = parser.load_string(R"(
schema: kutta-v1
version: 1
problem: robertson
method:
  tableau: sdirk2
tolerances:
  absolute: 1e-10
  relative: 1e-5
step_control:
  preset: stiff
)");
        REQUIRE(parser.errors().empty());
        REQUIRE(config.options.implicit_mode == ImplicitMode::Newton);
        REQUIRE(config.options.implicit_iteration_cap == 20);
        REQUIRE(config.options.absolute_tolerance == Approx(1e-10));
        REQUIRE(config.options.relative_tolerance == Approx(1e-5));
    }

    SECTION("Preset without explicit tolerances") {
        const RunConfig config = parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "step_control:\n  preset: conservative\n");
        REQUIRE(parser.errors().empty());
        REQUIRE(config.options.absolute_tolerance == Approx(1e-9));
        REQUIRE(config.options.max_growth_factor == Approx(2.0));
    }

    SECTION("Unknown preset") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "step_control:\n  preset: reckless\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_PARAM_INVALID"));
    }

    SECTION("Implicit mode spellings") {
        RunConfig config = parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "implicit:\n  mode: Newton\n  tolerance: 1e-12\n  jacobian_perturbation: 1e-7\n");
        REQUIRE(parser.errors().empty());
        REQUIRE(config.options.implicit_mode == ImplicitMode::Newton);
        REQUIRE(config.options.implicit_convergence_tolerance == Approx(1e-12));
        REQUIRE(config.options.jacobian_perturbation == Approx(1e-7));

        config = parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "implicit:\n  mode: functional\n");
        REQUIRE(parser.errors().empty());
        REQUIRE(config.options.implicit_mode == ImplicitMode::FixedPoint);
    }

    SECTION("Invalid implicit mode") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "implicit:\n  mode: broyden\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_IMPLICIT_MODE_INVALID"));
    }

    SECTION("Inconsistent options") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "step_control:\n  safety_factor: 2.0\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_OPTIONS_INVALID"));
    }

    SECTION("Output decimation below one") {
        (void)parser.load_string(
            "schema: kutta-v1\nversion: 1\nproblem: exponential\n"
            "output:\n  every: 0\n");
        REQUIRE(has_diagnostic(parser.errors(), "KUTTA_YAML_E_PARAM_INVALID"));
    }
}

TEST_CASE("YAML parser - Missing file", "[parser][yaml]") {
    YamlParser parser;
    (void)parser.load("/nonexistent/kutta/config.yaml");
    REQUIRE(parser.errors().size() == 1);
    REQUIRE(has_message(parser.errors(), "Cannot open file"));
}
