#include "run_model.hpp"

#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "abundances.hpp"
#include "db.hpp"
#include "eclipse_depth_calculator.hpp"
#include "json_string_builders.hpp"
#include "opacity_data.hpp"
#include "parser.hpp"
#include "spectrum_plot.hpp"
#include "transit_depth_calculator.hpp"

namespace exospec {

AtmosphereSolver build_atmosphere_solver(const ConfigUtil::Config& config) {
    OpacityDatabase opacity
        = load_opacity_database(config.opacity_files, config.collision_files,
                                config.method, config.n_gauss);
    AbundanceGrid condensation_grid;
    AbundanceGrid no_condensation_grid;
    if (!config.abundance_file.empty()) {
        condensation_grid = load_abundance_grid(config.abundance_file);
    }
    if (!config.abundance_file_no_condensation.empty()) {
        no_condensation_grid
            = load_abundance_grid(config.abundance_file_no_condensation);
    }
    return AtmosphereSolver(std::move(opacity), std::move(condensation_grid),
                            std::move(no_condensation_grid),
                            config.include_condensation);
}

std::string spectrum_y_label(RunKind kind, bool is_brown_dwarf) {
    if (kind == RunKind::Transit) return "Transit depth";
    return is_brown_dwarf ? "Flux (W m^-3)" : "Eclipse depth";
}

void write_output(const std::string& text,
                  const std::optional<std::string>& output_path) {
    if (!output_path) {
        std::cout << text << "\n";
        return;
    }
    std::ofstream out(*output_path);
    if (!out) {
        throw std::runtime_error("Cannot write " + *output_path);
    }
    out << text << "\n";
}

namespace {

void compute_spectrum(const RunOptions& options, const ModelSpec& model,
                      const ConfigUtil::Config& config, ModelRun& run) {
    Profile profile = build_profile(model);
    std::cerr << "[exospec] computing " << run_kind_name(model.kind)
              << " spectrum for " << options.model_path << "\n";
    if (model.kind == RunKind::Eclipse) {
        EclipseDepthCalculator calculator(build_atmosphere_solver(config));
        calculator.change_wavelength_bins(model.bins);
        EclipseResult result = calculator.compute_depths(
            profile, model.params, model.is_brown_dwarf, true);
        const EclipseFullOutput& output = *result.full_output;
        run.stored.binned = {result.wavelengths, result.values};
        run.stored.unbinned
            = {output.unbinned_wavelengths,
               model.is_brown_dwarf ? output.unbinned_fluxes
                                    : output.unbinned_eclipse_depths};
        if (options.full) run.json = build_eclipse_json(result);
    } else {
        TransitDepthCalculator calculator(build_atmosphere_solver(config));
        calculator.change_wavelength_bins(model.bins);
        TransitResult result
            = calculator.compute_depths(profile, model.params, true);
        const TransitFullOutput& output = *result.full_output;
        run.stored.binned = {result.wavelengths, result.values};
        run.stored.unbinned
            = {output.unbinned_wavelengths, output.unbinned_depths};
        if (options.full) run.json = build_transit_json(result);
    }
}

}  // namespace

ModelRun run_model(const RunOptions& options,
                   const ConfigUtil::Config& config) {
    const std::string model_json = read_text_file(options.model_path);
    ModelSpec model = parse_model(model_json);
    if (model.kind != options.kind) {
        std::cerr << "[exospec] model type '" << run_kind_name(model.kind)
                  << "' overridden by '" << run_kind_name(options.kind)
                  << "'\n";
        model.kind = options.kind;
    }

    ModelRun run;
    run.stored.summary.run_id
        = compute_run_id(model.kind, model_json,
                         ConfigUtil::ConfigParser::data_fingerprint(config));
    run.stored.summary.kind = model.kind;
    run.stored.summary.model_path = options.model_path;

    DB db(config.db_path);
    db.build_tables();
    std::optional<StoredRun> cached;
    if (!options.no_cache && !options.full) {
        cached = db.load_run(run.stored.summary.run_id);
    }
    if (cached) {
        std::cerr << "[exospec] using cached run " << run.stored.summary.run_id
                  << "\n";
        run.stored = std::move(*cached);
        run.from_cache = true;
    } else {
        compute_spectrum(options, model, config, run);
        run.stored.summary.created_at
            = static_cast<int64_t>(std::time(nullptr));
        run.stored.summary.num_points = run.stored.binned.values.size();
        db.save_run(run.stored.summary, model_json, run.stored.binned,
                    run.stored.unbinned);
    }
    if (!options.full) run.json = build_stored_run_json(run.stored);

    if (options.svg_path) {
        SpectrumPlot plot;
        plot.title = run_kind_name(model.kind) + " spectrum "
                     + run.stored.summary.run_id;
        plot.y_label = spectrum_y_label(model.kind, model.is_brown_dwarf);
        plot.unbinned = run.stored.unbinned;
        plot.binned = run.stored.binned;
        save_graph_to_file(build_spectrum_svg(plot), *options.svg_path);
        std::cerr << "[exospec] wrote " << *options.svg_path << "\n";
    }
    return run;
}

}  // namespace exospec
