#pragma once

#include <string>
#include <utility>
#include <vector>

#include "model.hpp"

namespace exospec {

std::string json_number(double value);
std::string json_string(const std::string& value);

std::string build_json_array(const std::vector<std::string>& json_values);
std::string build_json_object(
    const std::vector<std::pair<std::string, std::string>>& json_object_pairs);

std::string build_number_array_json(const std::vector<double>& values);
std::string build_matrix_json(const LayerMatrix& matrix);

std::string build_eclipse_json(const EclipseResult& result);
std::string build_transit_json(const TransitResult& result);
std::string build_stored_run_json(const StoredRun& run);
std::string build_runs_json(const std::vector<RunSummary>& runs);

}  // namespace exospec
