#include <simdjson.h>

#include <CLI/CLI.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "config_parser.hpp"
#include "db.hpp"
#include "json_string_builders.hpp"
#include "run_model.hpp"
#include "spectrum_plot.hpp"

using namespace exospec;

enum class CommandType { Run, Runs, Show };

struct ListOptions {
    std::optional<std::string> config_path;
};

struct Parsed {
    CommandType command_type;
    std::variant<RunOptions, ListOptions, ShowOptions> opts;
};

static void add_run_options(CLI::App* sub, RunOptions& opts) {
    sub->add_option("-m,--model", opts.model_path, "Model file (JSON)")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("-c,--config", opts.config_path, "Configuration file");
    sub->add_option("-o,--output", opts.output_path,
                    "Write the result JSON here instead of stdout");
    sub->add_option("--svg", opts.svg_path, "Plot the spectrum to this file");
    sub->add_flag("-f,--full", opts.full,
                  "Include the full diagnostic output");
    sub->add_flag("--no-cache", opts.no_cache,
                  "Recompute even if the run is stored");
}

Parsed parse_cli(CLI::App& app, int argc, char** argv) {
    RunOptions eclipse_opts;
    eclipse_opts.kind = RunKind::Eclipse;
    RunOptions transit_opts;
    transit_opts.kind = RunKind::Transit;
    ListOptions list_opts;
    ShowOptions show_opts;

    auto eclipse
        = app.add_subcommand("eclipse", "Compute a secondary-eclipse spectrum");
    add_run_options(eclipse, eclipse_opts);
    auto transit
        = app.add_subcommand("transit", "Compute a transmission spectrum");
    add_run_options(transit, transit_opts);
    auto runs = app.add_subcommand("runs", "List stored runs");
    runs->add_option("-c,--config", list_opts.config_path,
                     "Configuration file");
    auto show = app.add_subcommand("show", "Print a stored run");
    show->add_option("run_id", show_opts.run_id, "Run ID")->required();
    show->add_option("-c,--config", show_opts.config_path,
                     "Configuration file");
    show->add_option("--svg", show_opts.svg_path,
                     "Plot the spectrum to this file");
    app.require_subcommand(1);
    app.parse(argc, argv);

    Parsed parsed{};
    if (*eclipse) {
        parsed.command_type = CommandType::Run;
        parsed.opts = std::move(eclipse_opts);
        return parsed;
    }
    if (*transit) {
        parsed.command_type = CommandType::Run;
        parsed.opts = std::move(transit_opts);
        return parsed;
    }
    if (*runs) {
        parsed.command_type = CommandType::Runs;
        parsed.opts = std::move(list_opts);
        return parsed;
    }
    if (*show) {
        parsed.command_type = CommandType::Show;
        parsed.opts = std::move(show_opts);
        return parsed;
    }
    throw CLI::CallForHelp();
}

static void show_run(const ShowOptions& opts) {
    ConfigUtil::Config config
        = ConfigUtil::ConfigParser::parse_config_file(opts.config_path);
    DB db(config.db_path);
    db.build_tables();
    std::optional<StoredRun> run = db.load_run(opts.run_id);
    if (!run) {
        throw std::runtime_error("No stored run " + opts.run_id);
    }
    std::cout << build_stored_run_json(*run) << "\n";
    if (opts.svg_path) {
        SpectrumPlot plot;
        plot.title = run_kind_name(run->summary.kind) + " spectrum "
                     + run->summary.run_id;
        plot.y_label = spectrum_y_label(run->summary.kind, false);
        plot.unbinned = run->unbinned;
        plot.binned = run->binned;
        save_graph_to_file(build_spectrum_svg(plot), *opts.svg_path);
    }
}

int main(int argc, char** argv) {
    CLI::App app{"Exoplanet transit and eclipse spectra"};
    try {
        Parsed parsed = parse_cli(app, argc, argv);
        switch (parsed.command_type) {
            case CommandType::Run: {
                const RunOptions& opts = std::get<RunOptions>(parsed.opts);
                ConfigUtil::Config config
                    = ConfigUtil::ConfigParser::parse_config_file(
                        opts.config_path);
                ModelRun run = run_model(opts, config);
                write_output(run.json, opts.output_path);
                break;
            }
            case CommandType::Runs: {
                const ListOptions& opts = std::get<ListOptions>(parsed.opts);
                ConfigUtil::Config config
                    = ConfigUtil::ConfigParser::parse_config_file(
                        opts.config_path);
                DB db(config.db_path);
                db.build_tables();
                std::cout << build_runs_json(db.list_runs()) << "\n";
                break;
            }
            case CommandType::Show: {
                show_run(std::get<ShowOptions>(parsed.opts));
                break;
            }
        }
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const simdjson::simdjson_error& e) {
        std::cerr << "[exospec] error: malformed JSON: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[exospec] error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
