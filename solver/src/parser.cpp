#include "parser.hpp"

#include <simdjson.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "model.hpp"
#include "tp_profile.hpp"

namespace exospec {

using namespace simdjson;

namespace {

std::string key_error(const char* name, error_code error) {
    return std::string("key '") + name + "': " + error_message(error);
}

ondemand::object get_object(ondemand::object& obj, const char* name) {
    simdjson_result<ondemand::object> result
        = obj.find_field_unordered(name).get_object();
    if (result.error()) {
        throw std::invalid_argument(key_error(name, result.error()));
    }
    return result.value();
}

std::optional<std::vector<WavelengthBin>> parse_bins(ondemand::object& root) {
    auto field = root.find_field_unordered("bins");
    if (field.error() == NO_SUCH_FIELD) return std::nullopt;
    simdjson_result<ondemand::array> bins_result = field.get_array();
    if (bins_result.error()) {
        throw std::invalid_argument(key_error("bins", bins_result.error()));
    }
    std::vector<WavelengthBin> bins;
    for (ondemand::value bin_value : bins_result.value()) {
        std::vector<double> edges;
        for (ondemand::value edge : bin_value.get_array().value()) {
            edges.push_back(edge.get_double().value());
        }
        if (edges.size() != 2) {
            throw std::invalid_argument(
                "key 'bins': each bin must be [start, end]");
        }
        bins.emplace_back(edges[0], edges[1]);
    }
    return bins;
}

std::map<std::string, CustomAbundance> parse_custom_abundances(
    ondemand::object& abundances_object) {
    std::map<std::string, CustomAbundance> abundances;
    for (auto field_result : abundances_object) {
        ondemand::field field = std::move(field_result).take_value();
        std::string species(field.unescaped_key().value());
        ondemand::value value = field.value();
        if (value.type().value() == ondemand::json_type::array) {
            std::vector<double> layer_values;
            for (ondemand::value layer_value : value.get_array().value()) {
                layer_values.push_back(layer_value.get_double().value());
            }
            abundances[species] = layer_values;
        } else {
            abundances[species] = value.get_double().value();
        }
    }
    return abundances;
}

void parse_atmosphere(ondemand::object& atmosphere, AtmosphereParams& params) {
    if (auto v = get_optional_double(atmosphere, "logZ")) params.logZ = *v;
    if (auto v = get_optional_double(atmosphere, "CO_ratio")) {
        params.CO_ratio = *v;
    }
    params.add_gas_absorption = get_bool_or(atmosphere, "add_gas_absorption",
                                            params.add_gas_absorption);
    params.add_scattering
        = get_bool_or(atmosphere, "add_scattering", params.add_scattering);
    if (auto v = get_optional_double(atmosphere, "scattering_factor")) {
        params.scattering_factor = *v;
    }
    if (auto v = get_optional_double(atmosphere, "scattering_slope")) {
        params.scattering_slope = *v;
    }
    if (auto v = get_optional_double(atmosphere, "scattering_ref_wavelength")) {
        params.scattering_ref_wavelength = *v;
    }
    params.add_collisional_absorption
        = get_bool_or(atmosphere, "add_collisional_absorption",
                      params.add_collisional_absorption);
    params.add_H_minus_absorption
        = get_bool_or(atmosphere, "add_H_minus_absorption",
                      params.add_H_minus_absorption);
    if (auto v = get_optional_double(atmosphere, "cloudtop_pressure")) {
        params.cloudtop_pressure = *v;
    }
    if (auto v = get_optional_double(atmosphere, "P_quench")) {
        params.P_quench = *v;
    }
    auto custom = atmosphere.find_field_unordered("custom_abundances");
    if (custom.error() != NO_SUCH_FIELD) {
        ondemand::object abundances_object = custom.get_object().value();
        params.custom_abundances = parse_custom_abundances(abundances_object);
    }
}

MieParams parse_mie(ondemand::object& mie) {
    MieParams mie_params;
    double ri_real = get_double(mie, "ri_real");
    double ri_imag = get_optional_double(mie, "ri_imag").value_or(0.0);
    mie_params.ri = {ri_real, ri_imag};
    if (auto v = get_optional_double(mie, "frac_scale_height")) {
        mie_params.frac_scale_height = *v;
    }
    if (auto v = get_optional_double(mie, "number_density")) {
        mie_params.number_density = *v;
    }
    if (auto v = get_optional_double(mie, "part_size")) {
        mie_params.part_size = *v;
    }
    if (auto v = get_optional_double(mie, "part_size_std")) {
        mie_params.part_size_std = *v;
    }
    return mie_params;
}

ProfileSpec parse_profile(ondemand::object& profile, int& num_heights) {
    std::string type = get_string(profile, "type");
    auto heights = profile.find_field_unordered("num_heights");
    if (heights.error() != NO_SUCH_FIELD) {
        simdjson_result<int64_t> value = heights.get_int64();
        if (value.error()) {
            throw std::invalid_argument(key_error("num_heights", value.error()));
        }
        if (value.value() < 2
            || value.value() > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("key 'num_heights': "
                                        + std::to_string(value.value())
                                        + " is out of range");
        }
        num_heights = static_cast<int>(value.value());
    }
    if (type == "isothermal") {
        return IsothermalProfileSpec{get_double(profile, "temperature")};
    }
    if (type == "arrays") {
        return ArrayProfileSpec{get_double_array(profile, "pressures"),
                                get_double_array(profile, "temperatures")};
    }
    if (type == "parametric") {
        return ParametricProfileSpec{
            get_double(profile, "T0"),     get_double(profile, "P1"),
            get_double(profile, "alpha1"), get_double(profile, "alpha2"),
            get_double(profile, "P3"),     get_double(profile, "T3")};
    }
    if (type == "radiative_solution") {
        RadiativeProfileSpec spec{get_double(profile, "a"),
                                  get_double(profile, "beta"),
                                  get_double(profile, "log_k_th"),
                                  get_double(profile, "log_gamma"),
                                  get_optional_double(profile, "log_gamma2")};
        if (auto v = get_optional_double(profile, "alpha")) spec.alpha = *v;
        if (auto v = get_optional_double(profile, "T_int")) spec.T_int = *v;
        return spec;
    }
    throw std::invalid_argument("key 'profile.type': unknown profile type '"
                                + type + "'");
}

}  // namespace

std::string get_string(ondemand::object& obj, const char* name) {
    simdjson_result<std::string_view> result
        = obj.find_field_unordered(name).get_string();
    if (result.error()) {
        throw std::invalid_argument(key_error(name, result.error()));
    }
    return std::string(result.value());
}

double get_double(ondemand::object& obj, const char* name) {
    simdjson_result<double> result
        = obj.find_field_unordered(name).get_double();
    if (result.error()) {
        throw std::invalid_argument(key_error(name, result.error()));
    }
    return result.value();
}

std::optional<double> get_optional_double(ondemand::object& obj,
                                          const char* name) {
    auto field = obj.find_field_unordered(name);
    if (field.error() == NO_SUCH_FIELD) return std::nullopt;
    simdjson_result<double> result = field.get_double();
    if (result.error()) {
        throw std::invalid_argument(key_error(name, result.error()));
    }
    return result.value();
}

bool get_bool_or(ondemand::object& obj, const char* name, bool fallback) {
    auto field = obj.find_field_unordered(name);
    if (field.error() == NO_SUCH_FIELD) return fallback;
    simdjson_result<bool> result = field.get_bool();
    if (result.error()) {
        throw std::invalid_argument(key_error(name, result.error()));
    }
    return result.value();
}

std::vector<double> get_double_array(ondemand::object& obj, const char* name) {
    simdjson_result<ondemand::array> result
        = obj.find_field_unordered(name).get_array();
    if (result.error()) {
        throw std::invalid_argument(key_error(name, result.error()));
    }
    std::vector<double> values;
    for (ondemand::value value : result.value()) {
        values.push_back(value.get_double().value());
    }
    return values;
}

std::vector<std::string> get_string_array(ondemand::object& obj,
                                          const char* name) {
    simdjson_result<ondemand::array> result
        = obj.find_field_unordered(name).get_array();
    if (result.error()) {
        throw std::invalid_argument(key_error(name, result.error()));
    }
    std::vector<std::string> values;
    for (ondemand::value value : result.value()) {
        values.emplace_back(value.get_string().value());
    }
    return values;
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

ModelSpec parse_model(const std::string& model_json) {
    ondemand::parser parser;
    padded_string padded_model(model_json);
    ondemand::document document = parser.iterate(padded_model).value();
    ondemand::object root = document.get_object().value();
    ModelSpec model;
    model.kind = parse_run_kind(get_string(root, "type"));
    {
        ondemand::object star = get_object(root, "star");
        model.params.star_radius = get_double(star, "radius");
        model.params.T_star = get_double(star, "temperature");
        model.params.T_spot = get_optional_double(star, "spot_temperature");
        model.params.spot_cov_frac = get_optional_double(star, "spot_cov_frac");
    }
    {
        ondemand::object planet = get_object(root, "planet");
        model.params.planet_mass = get_double(planet, "mass");
        model.params.planet_radius = get_double(planet, "radius");
    }
    {
        ondemand::object profile = get_object(root, "profile");
        model.profile = parse_profile(profile, model.num_profile_heights);
    }
    auto atmosphere = root.find_field_unordered("atmosphere");
    if (atmosphere.error() != NO_SUCH_FIELD) {
        ondemand::object atmosphere_object = atmosphere.get_object().value();
        parse_atmosphere(atmosphere_object, model.params);
    }
    auto mie = root.find_field_unordered("mie");
    if (mie.error() != NO_SUCH_FIELD) {
        ondemand::object mie_object = mie.get_object().value();
        model.params.mie = parse_mie(mie_object);
    }
    model.bins = parse_bins(root);
    model.is_brown_dwarf = get_bool_or(root, "is_brown_dwarf", false);
    return model;
}

ModelSpec parse_model_file(const std::string& path) {
    return parse_model(read_text_file(path));
}

Profile build_profile(const ModelSpec& model) {
    Profile profile(model.num_profile_heights);
    const AtmosphereParams& params = model.params;
    if (auto spec = std::get_if<IsothermalProfileSpec>(&model.profile)) {
        profile.set_isothermal(spec->temperature);
    } else if (auto spec = std::get_if<ArrayProfileSpec>(&model.profile)) {
        profile.set_from_arrays(spec->pressures, spec->temperatures);
    } else if (auto spec = std::get_if<ParametricProfileSpec>(&model.profile)) {
        profile.set_parametric(spec->T0, spec->P1, spec->alpha1, spec->alpha2,
                               spec->P3, spec->T3);
    } else if (auto spec = std::get_if<RadiativeProfileSpec>(&model.profile)) {
        profile.set_from_radiative_solution(
            params.T_star, params.star_radius, spec->a, params.planet_mass,
            params.planet_radius, spec->beta, spec->log_k_th, spec->log_gamma,
            spec->log_gamma2, spec->alpha, spec->T_int);
    }
    return profile;
}

std::string run_kind_name(RunKind kind) {
    switch (kind) {
        case RunKind::Eclipse:
            return "eclipse";
        case RunKind::Transit:
            return "transit";
    }
    return "unknown";
}

RunKind parse_run_kind(const std::string& name) {
    if (name == "eclipse") return RunKind::Eclipse;
    if (name == "transit") return RunKind::Transit;
    throw std::invalid_argument("key 'type': unknown run type '" + name + "'");
}

}  // namespace exospec
