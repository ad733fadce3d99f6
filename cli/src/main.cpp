#include <CLI/CLI.hpp>
#include <kutta/v1/core.hpp>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace kutta::v1;

void write_csv(const RunOutput& output, int every, std::ostream& out) {
    const auto& result = output.result;

    // Header
    out << "t";
    for (const auto& name : output.problem.component_names) {
        out << "," << name;
    }
    out << "\n";

    // Data
    out << std::scientific << std::setprecision(12);
    const std::size_t n = result.time.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (i % static_cast<std::size_t>(every) != 0 && i + 1 != n) continue;
        out << result.time[i];
        for (Index j = 0; j < result.states[i].size(); ++j) {
            out << "," << result.states[i](j);
        }
        out << "\n";
    }
}

void print_progress(Real time, Real t0, Real t_end) {
    int percent = static_cast<int>(100.0 * (time - t0) / (t_end - t0));
    std::cerr << "\rProgress: " << percent << "% (t=" << std::scientific
              << std::setprecision(3) << time << ")" << std::flush;
}

void print_diagnostics(const parser::YamlParser& parser) {
    for (const auto& warning : parser.warnings()) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    for (const auto& error : parser.errors()) {
        std::cerr << "Error: " << error << std::endl;
    }
}

// Sentinel value to detect if a CLI option was explicitly provided
constexpr double CLI_SENTINEL = -1e99;

struct RunOverrides {
    double t_end = CLI_SENTINEL;
    double atol = CLI_SENTINEL;
    double rtol = CLI_SENTINEL;
    double h0 = CLI_SENTINEL;
    std::string tableau;
};

int cmd_run(const std::string& config_file, const std::string& output_file,
            const RunOverrides& overrides, bool verbose, bool quiet) {
    try {
        if (!quiet) {
            std::cerr << "Reading configuration: " << config_file << std::endl;
        }

        parser::YamlParser yaml;
        RunConfig config = yaml.load(config_file);
        if (!quiet || !yaml.errors().empty()) {
            print_diagnostics(yaml);
        }
        if (!yaml.errors().empty()) {
            return 1;
        }

        // Apply CLI overrides only if explicitly provided (not sentinel values)
        if (overrides.t_end != CLI_SENTINEL) config.t_end = overrides.t_end;
        if (overrides.atol != CLI_SENTINEL) config.options.absolute_tolerance = overrides.atol;
        if (overrides.rtol != CLI_SENTINEL) config.options.relative_tolerance = overrides.rtol;
        if (overrides.h0 != CLI_SENTINEL) {
            config.step_size = overrides.h0;
            config.options.initial_step_size = overrides.h0;
        }
        if (!overrides.tableau.empty()) {
            config.tableau_name = overrides.tableau;
            config.custom_tableau.reset();
        }

        const Problem problem = config.resolve_problem();
        const Tableau tableau = config.resolve_tableau();
        if (config.adaptive && !tableau.has_embedded_method()) {
            if (!quiet) {
                std::cerr << "Tableau '" << tableau.name()
                          << "' has no embedded weights; using fixed steps" << std::endl;
            }
            config.adaptive = false;
        }

        if (verbose) {
            std::cerr << "Problem: " << problem.name << " (" << problem.description << ")" << std::endl;
            std::cerr << "  Dimension: " << problem.initial_state.size() << std::endl;
            std::cerr << "Method: " << tableau.name() << " (" << structure_label(tableau)
                      << ", " << tableau.stages() << " stages, order " << tableau.order() << ")"
                      << std::endl;
        }

        if (!quiet) {
            std::cerr << "Integrating..." << std::endl;
            std::cerr << "  t0: " << problem.t0 << std::endl;
            std::cerr << "  t_end: " << problem.t_end << std::endl;
            std::cerr << "  mode: " << (config.adaptive ? "adaptive" : "fixed") << std::endl;
            std::cerr << "  atol: " << config.options.absolute_tolerance << std::endl;
            std::cerr << "  rtol: " << config.options.relative_tolerance << std::endl;
        }

        StepLogCallback on_step;
        if (!quiet) {
            on_step = [&problem](const StepLogEntry& entry) {
                if (entry.event == StepEvent::Accepted) {
                    print_progress(entry.time + entry.h, problem.t0, problem.t_end);
                }
            };
        }

        RunOutput output = run(config, on_step);
        if (!quiet) {
            std::cerr << std::endl;  // Newline after progress
        }

        const auto& result = output.result;
        if (!quiet || !result.success) {
            std::cerr << "Integration " << (result.success ? "completed" : "failed") << ": "
                      << to_string(result.status) << std::endl;
            if (!result.message.empty()) {
                std::cerr << "  " << result.message << std::endl;
            }
            std::cerr << "  Accepted steps: " << result.statistics.accepted_steps << std::endl;
            std::cerr << "  Rejected steps: " << result.statistics.rejected_steps << std::endl;
            std::cerr << "  Non-convergent attempts: " << result.statistics.nonconvergent_attempts
                      << std::endl;
            std::cerr << "  Field evaluations: " << result.statistics.field_evaluations << std::endl;
        }

        // Partial trajectories are still written
        const int every = std::max(1, config.output_every);
        const std::string path = output_file.empty() ? config.output_path : output_file;
        if (!path.empty()) {
            if (!quiet) {
                std::cerr << "Writing results to: " << path << std::endl;
            }
            std::ofstream file(path);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot open output file: " + path);
            }
            write_csv(output, every, file);
        } else {
            write_csv(output, every, std::cout);
        }

        return result.success ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& config_file, bool verbose) {
    try {
        parser::YamlParser yaml;
        RunConfig config = yaml.load(config_file);
        print_diagnostics(yaml);
        if (!yaml.errors().empty()) {
            return 1;
        }

        const Problem problem = config.resolve_problem();
        const Tableau tableau = config.resolve_tableau();

        if (verbose) {
            std::cout << "Configuration is valid." << std::endl;
            std::cout << "  Problem: " << problem.name << std::endl;
            std::cout << "  Time: [" << problem.t0 << ", " << problem.t_end << "]" << std::endl;
            std::cout << "  Tableau: " << tableau.name() << " (" << structure_label(tableau) << ")"
                      << std::endl;
            std::cout << "  Mode: " << (config.adaptive ? "adaptive" : "fixed") << std::endl;
            std::cout << "  Implicit mode: " << to_string(config.options.implicit_mode) << std::endl;
        } else {
            std::cout << "OK" << std::endl;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_tableaus() {
    std::cout << std::left << std::setw(20) << "name" << std::setw(8) << "stages"
              << std::setw(8) << "order" << std::setw(10) << "embedded"
              << "structure" << std::endl;
    for (const auto& name : TableauCatalog::names()) {
        const Tableau& t = TableauCatalog::get(name);
        std::cout << std::left << std::setw(20) << name << std::setw(8) << t.stages()
                  << std::setw(8) << t.order() << std::setw(10)
                  << (t.has_embedded_method() ? std::to_string(t.embedded_order()) : "-")
                  << structure_label(t) << std::endl;
    }
    return 0;
}

int main(int argc, char** argv) {
    CLI::App app{"Kutta - Runge-Kutta initial value problem integrator"};
    app.set_version_flag("-V,--version", "Kutta 0.1.0");

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Integrate a problem");
    std::string run_file;
    std::string output_file;
    RunOverrides overrides;

    run_cmd->add_option("config", run_file, "Run configuration (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-o,--output", output_file, "Output file (CSV)");
    run_cmd->add_option("--t-end", overrides.t_end, "End time (overrides YAML)");
    run_cmd->add_option("--atol", overrides.atol, "Absolute tolerance (overrides YAML)");
    run_cmd->add_option("--rtol", overrides.rtol, "Relative tolerance (overrides YAML)");
    run_cmd->add_option("--h0", overrides.h0, "Fixed or initial step size (overrides YAML)");
    run_cmd->add_option("--tableau", overrides.tableau, "Catalog tableau (overrides YAML)");

    run_cmd->callback([&]() {
        std::exit(cmd_run(run_file, output_file, overrides, verbose, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate a run configuration");
    std::string validate_file;
    validate_cmd->add_option("config", validate_file, "Run configuration (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, verbose));
    });

    // Tableau listing
    auto* tableaus_cmd = app.add_subcommand("tableaus", "List the built-in tableaus");
    tableaus_cmd->callback([&]() {
        std::exit(cmd_tableaus());
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
