#include "opacity_data.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "parser.hpp"

namespace exospec {

namespace {

struct AxisWeight {
    size_t lo;
    size_t hi;
    double weight;
};

AxisWeight axis_weight(const std::vector<double>& axis, double value) {
    if (axis.size() == 1 || value <= axis.front()) return {0, 0, 0.0};
    if (value >= axis.back()) {
        return {axis.size() - 1, axis.size() - 1, 0.0};
    }
    auto upper = std::upper_bound(axis.begin(), axis.end(), value);
    size_t hi = static_cast<size_t>(upper - axis.begin());
    size_t lo = hi - 1;
    return {lo, hi, (value - axis[lo]) / (axis[hi] - axis[lo])};
}

AxisWeight log_axis_weight(const std::vector<double>& axis, double value) {
    if (axis.size() == 1 || value <= axis.front()) return {0, 0, 0.0};
    if (value >= axis.back()) {
        return {axis.size() - 1, axis.size() - 1, 0.0};
    }
    auto upper = std::upper_bound(axis.begin(), axis.end(), value);
    size_t hi = static_cast<size_t>(upper - axis.begin());
    size_t lo = hi - 1;
    return {lo, hi,
            std::log(value / axis[lo]) / std::log(axis[hi] / axis[lo])};
}

void check_ascending(const std::vector<double>& axis, const std::string& name,
                     const std::string& source) {
    if (axis.empty()) {
        throw std::invalid_argument(source + ": empty " + name + " axis");
    }
    for (size_t i = 1; i < axis.size(); ++i) {
        if (!(axis[i] > axis[i - 1])) {
            throw std::invalid_argument(source + ": " + name
                                        + " axis must be strictly ascending");
        }
    }
}

bool same_axis(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::fabs(a[i] - b[i]) > 1e-9 * std::fabs(a[i])) return false;
    }
    return true;
}

}  // namespace

OpacityDatabase::OpacityDatabase(Method method, int n_gauss)
    : method_(method), n_gauss_(n_gauss) {
    if (n_gauss_ < 1) {
        throw std::invalid_argument("n_gauss must be positive");
    }
}

void OpacityDatabase::check_wavelengths(const std::vector<double>& wavelengths,
                                        const std::string& source) {
    if (wavelengths.empty()) {
        throw std::invalid_argument(source + ": empty wavelength grid");
    }
    if (method_ == Method::KTables
        && wavelengths.size() % static_cast<size_t>(n_gauss_) != 0) {
        throw std::invalid_argument(
            source + ": ktables grid length is not a multiple of n_gauss");
    }
    if (lambda_grid_.empty()) {
        for (size_t i = 1; i < wavelengths.size(); ++i) {
            if (wavelengths[i] < wavelengths[i - 1]) {
                throw std::invalid_argument(
                    source + ": wavelengths must be non-decreasing");
            }
        }
        lambda_grid_ = wavelengths;
        return;
    }
    if (!same_axis(lambda_grid_, wavelengths)) {
        throw std::invalid_argument(source
                                    + ": wavelength grid does not match");
    }
}

void OpacityDatabase::add_absorption_table(AbsorptionTable table) {
    const std::string source = "absorption table " + table.species;
    check_ascending(table.temperatures, "temperature", source);
    check_ascending(table.pressures, "pressure", source);
    check_wavelengths(table.wavelengths, source);
    if (temperatures_.empty()) {
        temperatures_ = table.temperatures;
        pressures_ = table.pressures;
    } else if (!same_axis(temperatures_, table.temperatures)
               || !same_axis(pressures_, table.pressures)) {
        throw std::invalid_argument(source + ": T/P grid does not match");
    }
    size_t expected = table.temperatures.size() * table.pressures.size()
                      * table.wavelengths.size();
    if (table.cross_sections.size() != expected) {
        throw std::invalid_argument(source + ": expected "
                                    + std::to_string(expected)
                                    + " cross sections, got "
                                    + std::to_string(
                                        table.cross_sections.size()));
    }
    cross_sections_[table.species] = std::move(table.cross_sections);
}

void OpacityDatabase::add_collision_table(CollisionTable table) {
    const std::string source = "collision table " + table.species_a + "-"
                               + table.species_b;
    check_ascending(table.temperatures, "temperature", source);
    check_wavelengths(table.wavelengths, source);
    if (table.coefficients.size()
        != table.temperatures.size() * table.wavelengths.size()) {
        throw std::invalid_argument(source + ": wrong coefficient count");
    }
    collision_tables_.push_back(std::move(table));
}

std::vector<std::string> OpacityDatabase::species() const {
    std::vector<std::string> names;
    for (const auto& [name, values] : cross_sections_) {
        (void)values;
        names.push_back(name);
    }
    return names;
}

bool OpacityDatabase::has_species(const std::string& species) const {
    return cross_sections_.count(species) > 0;
}

double OpacityDatabase::d_ln_lambda() const {
    std::vector<double> distinct;
    for (double wavelength : lambda_grid_) {
        if (distinct.empty() || wavelength != distinct.back()) {
            distinct.push_back(wavelength);
        }
    }
    if (distinct.size() < 2) {
        throw std::invalid_argument(
            "Wavelength grid needs at least 2 distinct wavelengths");
    }
    return std::log(distinct.back() / distinct.front())
           / static_cast<double>(distinct.size() - 1);
}

double OpacityDatabase::cross_section(const std::string& species, double T,
                                      double P, size_t lambda_index) const {
    return cross_sections(species, T, P, {lambda_index}).front();
}

std::vector<double> OpacityDatabase::cross_sections(
    const std::string& species, double T, double P,
    const std::vector<size_t>& lambda_indices) const {
    auto it = cross_sections_.find(species);
    if (it == cross_sections_.end()) {
        throw std::invalid_argument("No absorption table for " + species);
    }
    const std::vector<double>& table = it->second;
    const size_t n_lambda = lambda_grid_.size();
    const size_t n_P = pressures_.size();
    AxisWeight t_weight = axis_weight(temperatures_, T);
    AxisWeight p_weight = log_axis_weight(pressures_, P);
    auto offset = [&](size_t t, size_t p) {
        return (t * n_P + p) * n_lambda;
    };
    const size_t ll = offset(t_weight.lo, p_weight.lo);
    const size_t lh = offset(t_weight.lo, p_weight.hi);
    const size_t hl = offset(t_weight.hi, p_weight.lo);
    const size_t hh = offset(t_weight.hi, p_weight.hi);
    const double wt = t_weight.weight;
    const double wp = p_weight.weight;
    std::vector<double> result;
    result.reserve(lambda_indices.size());
    for (size_t index : lambda_indices) {
        double low_T = (1 - wp) * table[ll + index] + wp * table[lh + index];
        double high_T = (1 - wp) * table[hl + index] + wp * table[hh + index];
        result.push_back((1 - wt) * low_T + wt * high_T);
    }
    return result;
}

std::vector<double> OpacityDatabase::collision_coefficients(
    const CollisionTable& table, double T,
    const std::vector<size_t>& lambda_indices) const {
    AxisWeight t_weight = axis_weight(table.temperatures, T);
    const size_t n_lambda = table.wavelengths.size();
    const size_t lo = t_weight.lo * n_lambda;
    const size_t hi = t_weight.hi * n_lambda;
    std::vector<double> result;
    result.reserve(lambda_indices.size());
    for (size_t index : lambda_indices) {
        result.push_back((1 - t_weight.weight) * table.coefficients[lo + index]
                         + t_weight.weight * table.coefficients[hi + index]);
    }
    return result;
}

AbsorptionTable load_absorption_table(const std::string& path) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded_json
        = simdjson::padded_string::load(path).value();
    simdjson::ondemand::document document = parser.iterate(padded_json).value();
    simdjson::ondemand::object root = document.get_object().value();
    std::string kind = get_string(root, "kind");
    if (kind != "absorption") {
        throw std::invalid_argument(path + ": expected kind 'absorption', got '"
                                    + kind + "'");
    }
    AbsorptionTable table;
    table.species = get_string(root, "species");
    table.wavelengths = get_double_array(root, "wavelengths");
    table.temperatures = get_double_array(root, "temperatures");
    table.pressures = get_double_array(root, "pressures");
    table.cross_sections = get_double_array(root, "cross_sections");
    return table;
}

CollisionTable load_collision_table(const std::string& path) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded_json
        = simdjson::padded_string::load(path).value();
    simdjson::ondemand::document document = parser.iterate(padded_json).value();
    simdjson::ondemand::object root = document.get_object().value();
    std::string kind = get_string(root, "kind");
    if (kind != "collision") {
        throw std::invalid_argument(path + ": expected kind 'collision', got '"
                                    + kind + "'");
    }
    CollisionTable table;
    std::vector<std::string> pair = get_string_array(root, "species");
    if (pair.size() != 2) {
        throw std::invalid_argument(path + ": 'species' must name a pair");
    }
    table.species_a = pair[0];
    table.species_b = pair[1];
    table.wavelengths = get_double_array(root, "wavelengths");
    table.temperatures = get_double_array(root, "temperatures");
    table.coefficients = get_double_array(root, "coefficients");
    return table;
}

OpacityDatabase load_opacity_database(
    const std::vector<std::string>& absorption_files,
    const std::vector<std::string>& collision_files, Method method,
    int n_gauss) {
    OpacityDatabase database(method, n_gauss);
    for (const std::string& path : absorption_files) {
        database.add_absorption_table(load_absorption_table(path));
    }
    for (const std::string& path : collision_files) {
        database.add_collision_table(load_collision_table(path));
    }
    std::cerr << "[solver] loaded " << absorption_files.size()
              << " absorption and " << collision_files.size()
              << " collision tables, " << database.lambda_grid().size()
              << " wavelengths\n";
    return database;
}

}  // namespace exospec
