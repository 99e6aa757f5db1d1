#pragma once

#include <simdjson.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "model.hpp"
#include "tp_profile.hpp"

namespace exospec {

struct IsothermalProfileSpec {
    double temperature;
};
struct ArrayProfileSpec {
    std::vector<double> pressures;
    std::vector<double> temperatures;
};
struct ParametricProfileSpec {
    double T0;
    double P1;
    double alpha1;
    double alpha2;
    double P3;
    double T3;
};
struct RadiativeProfileSpec {
    double a;
    double beta;
    double log_k_th;
    double log_gamma;
    std::optional<double> log_gamma2;
    double alpha = 0.0;
    double T_int = 100.0;
};

using ProfileSpec = std::variant<IsothermalProfileSpec, ArrayProfileSpec,
                                 ParametricProfileSpec, RadiativeProfileSpec>;

struct ModelSpec {
    RunKind kind = RunKind::Eclipse;
    AtmosphereParams params;
    ProfileSpec profile;
    int num_profile_heights = 500;
    std::optional<std::vector<WavelengthBin>> bins;
    bool is_brown_dwarf = false;
};

std::string get_string(simdjson::ondemand::object& obj, const char* name);
double get_double(simdjson::ondemand::object& obj, const char* name);
std::optional<double> get_optional_double(simdjson::ondemand::object& obj,
                                          const char* name);
bool get_bool_or(simdjson::ondemand::object& obj, const char* name,
                 bool fallback);
std::vector<double> get_double_array(simdjson::ondemand::object& obj,
                                     const char* name);
std::vector<std::string> get_string_array(simdjson::ondemand::object& obj,
                                          const char* name);

std::string read_text_file(const std::string& path);
ModelSpec parse_model(const std::string& model_json);
ModelSpec parse_model_file(const std::string& path);

Profile build_profile(const ModelSpec& model);

std::string run_kind_name(RunKind kind);
RunKind parse_run_kind(const std::string& name);

}  // namespace exospec
