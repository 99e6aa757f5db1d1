#include "json_string_builders.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>

#include "parser.hpp"

namespace exospec {

std::string json_number(double value) {
    if (!std::isfinite(value)) return "null";
    std::ostringstream number;
    number << std::setprecision(12) << value;
    return number.str();
}

std::string json_string(const std::string& value) {
    std::string escaped = R"(")";
    escaped.reserve(value.size() + 2);
    for (char c : value) {
        switch (c) {
            case '"':
                escaped += R"(\")";
                break;
            case '\\':
                escaped += R"(\\)";
                break;
            case '\n':
                escaped += R"(\n)";
                break;
            case '\t':
                escaped += R"(\t)";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    escaped += buffer;
                } else {
                    escaped += c;
                }
        }
    }
    escaped += R"(")";
    return escaped;
}

std::string build_json_array(const std::vector<std::string>& json_values) {
    std::ostringstream json_array;
    json_array << "[";
    bool first = true;
    for (const std::string& json_value : json_values) {
        if (!first) json_array << ",";
        first = false;
        json_array << json_value;
    }
    json_array << "]";
    return json_array.str();
}

std::string build_json_object(
    const std::vector<std::pair<std::string, std::string>>& json_object_pairs) {
    std::ostringstream json_object_string;
    json_object_string << "{";
    bool first = true;
    for (const auto& [key, value] : json_object_pairs) {
        if (!first) json_object_string << ",";
        first = false;
        json_object_string << json_string(key) << ":" << value;
    }
    json_object_string << "}";
    return json_object_string.str();
}

std::string build_number_array_json(const std::vector<double>& values) {
    std::vector<std::string> numbers;
    numbers.reserve(values.size());
    for (double value : values) numbers.push_back(json_number(value));
    return build_json_array(numbers);
}

std::string build_matrix_json(const LayerMatrix& matrix) {
    std::vector<std::string> rows;
    rows.reserve(matrix.size());
    for (const std::vector<double>& row : matrix) {
        rows.push_back(build_number_array_json(row));
    }
    return build_json_array(rows);
}

namespace {

std::string build_atm_info_json(const AtmosphereInfo& atm_info) {
    std::vector<std::pair<std::string, std::string>> abundances;
    for (const auto& [species, values] : atm_info.abundances) {
        abundances.emplace_back(species, build_number_array_json(values));
    }
    return build_json_object(
        {{"P_profile", build_number_array_json(atm_info.P_profile)},
         {"T_profile", build_number_array_json(atm_info.T_profile)},
         {"mu_profile", build_number_array_json(atm_info.mu_profile)},
         {"radii", build_number_array_json(atm_info.radii)},
         {"dr", build_number_array_json(atm_info.dr)},
         {"abundances", build_json_object(abundances)},
         {"absorption_coeff_atm",
          build_matrix_json(atm_info.absorption_coeff_atm)}});
}

std::vector<std::pair<std::string, std::string>> depth_pairs(
    RunKind kind, const DepthResult& result) {
    return {{"type", json_string(run_kind_name(kind))},
            {"wavelengths", build_number_array_json(result.wavelengths)},
            {"values", build_number_array_json(result.values)}};
}

}  // namespace

std::string build_eclipse_json(const EclipseResult& result) {
    std::vector<std::pair<std::string, std::string>> pairs
        = depth_pairs(RunKind::Eclipse, result);
    if (result.full_output) {
        const EclipseFullOutput& output = *result.full_output;
        pairs.emplace_back(
            "full_output",
            build_json_object(
                {{"atm_info", build_atm_info_json(output.atm_info)},
                 {"stellar_spectrum",
                  build_number_array_json(output.stellar_spectrum)},
                 {"planet_spectrum",
                  build_number_array_json(output.planet_spectrum)},
                 {"unbinned_wavelengths",
                  build_number_array_json(output.unbinned_wavelengths)},
                 {"unbinned_eclipse_depths",
                  build_number_array_json(output.unbinned_eclipse_depths)},
                 {"unbinned_fluxes",
                  build_number_array_json(output.unbinned_fluxes)},
                 {"binned_fluxes",
                  build_number_array_json(output.binned_fluxes)},
                 {"taus", build_matrix_json(output.taus)},
                 {"contrib", build_matrix_json(output.contrib)}}));
    }
    return build_json_object(pairs);
}

std::string build_transit_json(const TransitResult& result) {
    std::vector<std::pair<std::string, std::string>> pairs
        = depth_pairs(RunKind::Transit, result);
    if (result.full_output) {
        const TransitFullOutput& output = *result.full_output;
        pairs.emplace_back(
            "full_output",
            build_json_object(
                {{"atm_info", build_atm_info_json(output.atm_info)},
                 {"stellar_spectrum",
                  build_number_array_json(output.stellar_spectrum)},
                 {"unbinned_wavelengths",
                  build_number_array_json(output.unbinned_wavelengths)},
                 {"unbinned_depths",
                  build_number_array_json(output.unbinned_depths)},
                 {"tau_los", build_matrix_json(output.tau_los)}}));
    }
    return build_json_object(pairs);
}

std::string build_stored_run_json(const StoredRun& run) {
    std::vector<std::pair<std::string, std::string>> pairs
        = depth_pairs(run.summary.kind, run.binned);
    pairs.insert(pairs.begin(), std::make_pair(std::string("run_id"),
                                               json_string(run.summary.run_id)));
    pairs.emplace_back("unbinned_wavelengths",
                       build_number_array_json(run.unbinned.wavelengths));
    pairs.emplace_back("unbinned_values",
                       build_number_array_json(run.unbinned.values));
    return build_json_object(pairs);
}

std::string build_runs_json(const std::vector<RunSummary>& runs) {
    std::vector<std::string> run_json_strings;
    run_json_strings.reserve(runs.size());
    for (const RunSummary& run : runs) {
        run_json_strings.push_back(build_json_object(
            {{"run_id", json_string(run.run_id)},
             {"type", json_string(run_kind_name(run.kind))},
             {"model_path", json_string(run.model_path)},
             {"created_at", std::to_string(run.created_at)},
             {"num_points", std::to_string(run.num_points)}}));
    }
    return build_json_array(run_json_strings);
}

}  // namespace exospec
