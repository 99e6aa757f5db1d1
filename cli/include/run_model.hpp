#pragma once

#include <optional>
#include <string>

#include "atmosphere_solver.hpp"
#include "config_parser.hpp"
#include "model.hpp"

namespace exospec {

struct RunOptions {
    RunKind kind = RunKind::Eclipse;
    std::string model_path;
    std::optional<std::string> config_path;
    std::optional<std::string> output_path;
    std::optional<std::string> svg_path;
    bool full = false;
    bool no_cache = false;
};

struct ShowOptions {
    std::string run_id;
    std::optional<std::string> config_path;
    std::optional<std::string> svg_path;
};

struct ModelRun {
    StoredRun stored;
    // stored-run JSON, or the full result JSON when full output was asked for
    std::string json;
    bool from_cache = false;
};

AtmosphereSolver build_atmosphere_solver(const ConfigUtil::Config& config);

// Computes one model file, or loads it from the store when an identical
// run was saved before.
ModelRun run_model(const RunOptions& options,
                   const ConfigUtil::Config& config);

std::string spectrum_y_label(RunKind kind, bool is_brown_dwarf);

void write_output(const std::string& text,
                  const std::optional<std::string>& output_path);

}  // namespace exospec
