#include "kutta/v1/parser/yaml_parser.hpp"

#include "kutta/v1/tableau_catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace kutta::v1::parser {

namespace {

constexpr const char* kSchemaId = "kutta-v1";
constexpr const char* kDiagUnknownField = "KUTTA_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "KUTTA_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagUnknownProblem = "KUTTA_YAML_E_PROBLEM_UNKNOWN";
constexpr const char* kDiagUnknownTableau = "KUTTA_YAML_E_TABLEAU_UNKNOWN";
constexpr const char* kDiagInvalidTableau = "KUTTA_YAML_E_TABLEAU_INVALID";
constexpr const char* kDiagInvalidParameter = "KUTTA_YAML_E_PARAM_INVALID";
constexpr const char* kDiagInvalidOptions = "KUTTA_YAML_E_OPTIONS_INVALID";
constexpr const char* kDiagInvalidImplicitMode = "KUTTA_YAML_E_IMPLICIT_MODE_INVALID";
constexpr const char* kDiagMissingEmbedded = "KUTTA_YAML_W_EMBEDDED_MISSING";
constexpr const char* kDiagStepSizeIgnored = "KUTTA_YAML_W_STEP_SIZE_IGNORED";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalize_key(std::string s) {
    s = to_lower(s);
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(
        errors,
        kDiagTypeMismatch,
        "Type mismatch at '" + path + "' (expected " + expected +
            ", got " + yaml_node_class(received) + ")");
}

template<typename T>
std::optional<T> parse_scalar(const YAML::Node& node,
                              const std::string& path,
                              const std::string& expected,
                              std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
}

std::optional<bool> parse_bool_scalar(const YAML::Node& node,
                                      const std::string& path,
                                      std::vector<std::string>& errors) {
    return parse_scalar<bool>(node, path, "boolean", errors);
}

std::optional<int> parse_int_scalar(const YAML::Node& node,
                                    const std::string& path,
                                    std::vector<std::string>& errors) {
    return parse_scalar<int>(node, path, "integer", errors);
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               std::vector<std::string>& errors) {
    return parse_scalar<std::string>(node, path, "string", errors);
}

std::optional<Real> parse_real_scalar(const YAML::Node& node,
                                      const std::string& path,
                                      std::vector<std::string>& errors) {
    return parse_scalar<Real>(node, path, "number", errors);
}

std::optional<std::vector<Real>> parse_real_sequence(const YAML::Node& node,
                                                     const std::string& path,
                                                     std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsSequence()) {
        push_type_mismatch_error(errors, path, "sequence of numbers", node);
        return std::nullopt;
    }
    std::vector<Real> values;
    values.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        auto value = parse_real_scalar(node[i], path + "[" + std::to_string(i) + "]", errors);
        if (!value) {
            return std::nullopt;
        }
        values.push_back(*value);
    }
    return values;
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   bool strict) {
    if (!strict || !node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) == allowed.end()) {
            push_error(errors,
                       kDiagUnknownField,
                       "Unknown field at '" + context + "." + key + "'");
        }
    }
}

bool require_map(const YAML::Node& node, const std::string& path, std::vector<std::string>& errors) {
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, path, "map", node);
        return false;
    }
    return true;
}

/// Assign a parsed real to `target` when present
void assign_real(const YAML::Node& parent, const char* key, const std::string& context,
                 Real& target, std::vector<std::string>& errors) {
    if (auto value = parse_real_scalar(parent[key], context + "." + key, errors)) {
        target = *value;
    }
}

void assign_int(const YAML::Node& parent, const char* key, const std::string& context,
                int& target, std::vector<std::string>& errors) {
    if (auto value = parse_int_scalar(parent[key], context + "." + key, errors)) {
        target = *value;
    }
}

std::optional<Tableau> parse_custom_tableau(const YAML::Node& node,
                                            std::vector<std::string>& errors,
                                            bool strict) {
    const std::string context = "method.custom";
    if (!require_map(node, context, errors)) {
        return std::nullopt;
    }
    validate_keys(node, {"name", "nodes", "matrix", "weights", "embedded_weights", "order",
                         "embedded_order"},
                  context, errors, strict);

    for (const char* required : {"nodes", "matrix", "weights", "order"}) {
        if (!node[required]) {
            push_error(errors, kDiagInvalidTableau,
                       "Missing required field '" + context + "." + required + "'");
            return std::nullopt;
        }
    }

    const auto nodes = parse_real_sequence(node["nodes"], context + ".nodes", errors);
    const auto weights = parse_real_sequence(node["weights"], context + ".weights", errors);
    const auto order = parse_int_scalar(node["order"], context + ".order", errors);

    std::vector<Tableau::Row> matrix;
    const YAML::Node rows = node["matrix"];
    if (!rows.IsSequence()) {
        push_type_mismatch_error(errors, context + ".matrix", "sequence of rows", rows);
        return std::nullopt;
    }
    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto row = parse_real_sequence(rows[i], context + ".matrix[" + std::to_string(i) + "]",
                                       errors);
        if (!row) {
            return std::nullopt;
        }
        matrix.push_back(std::move(*row));
    }

    std::optional<std::vector<Real>> embedded;
    int embedded_order = 0;
    if (node["embedded_weights"]) {
        embedded = parse_real_sequence(node["embedded_weights"], context + ".embedded_weights",
                                       errors);
        if (!embedded) {
            return std::nullopt;
        }
        if (auto eo = parse_int_scalar(node["embedded_order"], context + ".embedded_order",
                                       errors)) {
            embedded_order = *eo;
        } else if (!node["embedded_order"] && order) {
            embedded_order = std::max(1, *order - 1);
        }
    }

    if (!nodes || !weights || !order) {
        return std::nullopt;
    }

    std::string name = "custom";
    if (auto raw = parse_string_scalar(node["name"], context + ".name", errors)) {
        name = *raw;
    }

    try {
        return Tableau(*nodes, std::move(matrix), *weights, *order, std::move(embedded),
                       embedded_order, name);
    } catch (const ConfigurationError& e) {
        push_error(errors, kDiagInvalidTableau, std::string("Invalid custom tableau: ") + e.what());
        return std::nullopt;
    }
}

}  // namespace

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

RunConfig YamlParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        errors_.push_back("Cannot open file: " + path.string());
        return RunConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

RunConfig YamlParser::load_string(const std::string& content) {
    RunConfig config;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, config);
    return config;
}

void YamlParser::parse_yaml(const std::string& content, RunConfig& config) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root || !root.IsMap()) {
        errors_.push_back("Configuration root must be a map");
        return;
    }

    validate_keys(root, {"schema", "version", "problem", "time", "method", "tolerances",
                         "step_control", "implicit", "output"},
                  "root", errors_, options_.strict);

    if (!root["schema"]) {
        errors_.push_back("Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        errors_.push_back("Missing required field 'version'");
        return;
    }

    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        errors_.push_back("Unsupported schema: " + *schema);
        return;
    }

    const std::optional<int> version = parse_int_scalar(root["version"], "root.version", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        errors_.push_back("Unsupported schema version: " + std::to_string(*version));
        return;
    }

    // Problem
    if (!root["problem"]) {
        errors_.push_back("Missing required field 'problem'");
        return;
    }
    YAML::Node problem = root["problem"];
    if (problem.IsScalar()) {
        config.problem_name = problem.as<std::string>();
    } else if (require_map(problem, "problem", errors_)) {
        validate_keys(problem, {"name", "parameters", "initial_state"}, "problem", errors_,
                      options_.strict);
        if (auto name = parse_string_scalar(problem["name"], "problem.name", errors_)) {
            config.problem_name = *name;
        } else if (!problem["name"]) {
            errors_.push_back("Missing required field 'problem.name'");
        }

        YAML::Node params = problem["parameters"];
        if (params && require_map(params, "problem.parameters", errors_)) {
            for (const auto& it : params) {
                const std::string key = it.first.as<std::string>();
                if (auto value = parse_real_scalar(it.second, "problem.parameters." + key, errors_)) {
                    config.problem_parameters[key] = *value;
                }
            }
        }

        if (auto state = parse_real_sequence(problem["initial_state"], "problem.initial_state",
                                             errors_)) {
            config.initial_state = Eigen::Map<const Vector>(state->data(),
                                                            static_cast<Index>(state->size()));
        }
    }

    const auto known_problems = problems::names();
    if (std::find(known_problems.begin(), known_problems.end(), config.problem_name) ==
        known_problems.end()) {
        push_error(errors_, kDiagUnknownProblem, "Unknown problem: " + config.problem_name);
    }

    // Time window
    if (YAML::Node time = root["time"]) {
        if (require_map(time, "time", errors_)) {
            validate_keys(time, {"start", "end"}, "time", errors_, options_.strict);
            config.t_start = parse_real_scalar(time["start"], "time.start", errors_);
            config.t_end = parse_real_scalar(time["end"], "time.end", errors_);
        }
    }

    // Method
    bool step_size_explicit = false;
    if (YAML::Node method = root["method"]) {
        if (require_map(method, "method", errors_)) {
            validate_keys(method, {"tableau", "custom", "adaptive", "step_size", "jacobian"},
                          "method", errors_, options_.strict);

            if (auto name = parse_string_scalar(method["tableau"], "method.tableau", errors_)) {
                config.tableau_name = to_lower(*name);
                if (!method["custom"] && !TableauCatalog::contains(config.tableau_name)) {
                    push_error(errors_, kDiagUnknownTableau, "Unknown tableau: " + *name);
                }
            }
            if (method["custom"]) {
                config.custom_tableau = parse_custom_tableau(method["custom"], errors_,
                                                             options_.strict);
            }
            if (auto adaptive = parse_bool_scalar(method["adaptive"], "method.adaptive", errors_)) {
                config.adaptive = *adaptive;
            }
            if (auto h = parse_real_scalar(method["step_size"], "method.step_size", errors_)) {
                config.step_size = *h;
                step_size_explicit = true;
                if (!std::isfinite(*h) || *h <= 0.0) {
                    push_error(errors_, kDiagInvalidParameter,
                               "method.step_size must be finite and > 0");
                }
            }
            if (auto jac = parse_string_scalar(method["jacobian"], "method.jacobian", errors_)) {
                const std::string mode = normalize_key(*jac);
                if (mode == "analytic") {
                    config.analytic_jacobian = true;
                } else if (mode == "finitedifference" || mode == "fd") {
                    config.analytic_jacobian = false;
                } else {
                    push_error(errors_, kDiagInvalidParameter,
                               "Invalid method.jacobian: " + *jac +
                                   " (expected 'analytic' or 'finite_difference')");
                }
            }
        }
    }

    if (config.adaptive) {
        const Tableau* tableau = config.custom_tableau ? &*config.custom_tableau : nullptr;
        if (!tableau && TableauCatalog::contains(config.tableau_name)) {
            tableau = &TableauCatalog::get(config.tableau_name);
        }
        if (tableau && !tableau->has_embedded_method()) {
            push_warning(warnings_, kDiagMissingEmbedded,
                         "Tableau '" + tableau->name() +
                             "' has no embedded weights; falling back to fixed steps");
            config.adaptive = false;
        }
        if (config.adaptive && step_size_explicit) {
            // Adaptive runs start from the given step
            config.options.initial_step_size = config.step_size;
            push_warning(warnings_, kDiagStepSizeIgnored,
                         "method.step_size is used as the initial step of an adaptive run");
        }
    }

    // Tolerances
    if (YAML::Node tol = root["tolerances"]) {
        if (require_map(tol, "tolerances", errors_)) {
            validate_keys(tol, {"absolute", "relative"}, "tolerances", errors_, options_.strict);
            assign_real(tol, "absolute", "tolerances", config.options.absolute_tolerance, errors_);
            assign_real(tol, "relative", "tolerances", config.options.relative_tolerance, errors_);
        }
    }

    // Step control
    if (YAML::Node sc = root["step_control"]) {
        if (require_map(sc, "step_control", errors_)) {
            validate_keys(sc, {"preset", "initial_step", "min_step", "max_step", "safety_factor",
                               "min_growth", "max_growth", "max_shrink", "nonconvergence_shrink",
                               "max_consecutive_nonconvergence"},
                          "step_control", errors_, options_.strict);

            if (auto preset = parse_string_scalar(sc["preset"], "step_control.preset", errors_)) {
                const Real atol = config.options.absolute_tolerance;
                const Real rtol = config.options.relative_tolerance;
                const Real h0 = config.options.initial_step_size;
                const std::string p = normalize_key(*preset);
                if (p == "default" || p == "defaults") {
                    config.options = IntegratorOptions::defaults();
                } else if (p == "conservative") {
                    config.options = IntegratorOptions::conservative();
                } else if (p == "aggressive") {
                    config.options = IntegratorOptions::aggressive();
                } else if (p == "stiff") {
                    config.options = IntegratorOptions::stiff();
                } else {
                    push_error(errors_, kDiagInvalidParameter,
                               "Invalid step_control.preset: " + *preset);
                }
                // Explicit tolerances win over the preset
                if (root["tolerances"]) {
                    config.options.absolute_tolerance = atol;
                    config.options.relative_tolerance = rtol;
                }
                config.options.initial_step_size = h0;
            }

            assign_real(sc, "initial_step", "step_control", config.options.initial_step_size, errors_);
            assign_real(sc, "min_step", "step_control", config.options.min_step_size, errors_);
            assign_real(sc, "max_step", "step_control", config.options.max_step_size, errors_);
            assign_real(sc, "safety_factor", "step_control", config.options.safety_factor, errors_);
            assign_real(sc, "min_growth", "step_control", config.options.min_growth_factor, errors_);
            assign_real(sc, "max_growth", "step_control", config.options.max_growth_factor, errors_);
            assign_real(sc, "max_shrink", "step_control", config.options.max_shrink_factor, errors_);
            assign_real(sc, "nonconvergence_shrink", "step_control",
                        config.options.nonconvergence_shrink_factor, errors_);
            assign_int(sc, "max_consecutive_nonconvergence", "step_control",
                       config.options.max_consecutive_nonconvergence, errors_);
        }
    }

    // Implicit stage solver
    if (YAML::Node imp = root["implicit"]) {
        if (require_map(imp, "implicit", errors_)) {
            validate_keys(imp, {"mode", "max_iterations", "tolerance", "relative_tolerance",
                                "warm_start", "jacobian_perturbation"},
                          "implicit", errors_, options_.strict);

            if (auto mode = parse_string_scalar(imp["mode"], "implicit.mode", errors_)) {
                const std::string m = normalize_key(*mode);
                if (m == "fixedpoint" || m == "functional") {
                    config.options.implicit_mode = ImplicitMode::FixedPoint;
                } else if (m == "newton") {
                    config.options.implicit_mode = ImplicitMode::Newton;
                } else {
                    push_error(errors_, kDiagInvalidImplicitMode,
                               "Invalid implicit.mode: " + *mode +
                                   " (expected 'fixed_point' or 'newton')");
                }
            }
            assign_int(imp, "max_iterations", "implicit", config.options.implicit_iteration_cap, errors_);
            assign_real(imp, "tolerance", "implicit", config.options.implicit_convergence_tolerance, errors_);
            assign_real(imp, "relative_tolerance", "implicit",
                        config.options.implicit_relative_tolerance, errors_);
            assign_real(imp, "jacobian_perturbation", "implicit",
                        config.options.jacobian_perturbation, errors_);
            if (auto warm = parse_bool_scalar(imp["warm_start"], "implicit.warm_start", errors_)) {
                config.options.warm_start_implicit = *warm;
            }
        }
    }

    // Output
    if (YAML::Node out = root["output"]) {
        if (require_map(out, "output", errors_)) {
            validate_keys(out, {"path", "every"}, "output", errors_, options_.strict);
            if (auto path = parse_string_scalar(out["path"], "output.path", errors_)) {
                config.output_path = *path;
            }
            assign_int(out, "every", "output", config.output_every, errors_);
            if (config.output_every < 1) {
                push_error(errors_, kDiagInvalidParameter, "output.every must be >= 1");
            }
        }
    }

    try {
        config.options.validate();
    } catch (const ConfigurationError& e) {
        push_error(errors_, kDiagInvalidOptions, e.what());
    }
}

}  // namespace kutta::v1::parser
