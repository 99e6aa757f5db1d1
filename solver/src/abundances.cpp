#include "abundances.hpp"

#include <simdjson.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "constants.hpp"
#include "parser.hpp"
#include "special_functions.hpp"

namespace exospec {

namespace {

struct Bracket {
    size_t lo;
    size_t hi;
    double weight;
};

Bracket clamped_bracket(const std::vector<double>& axis, double value) {
    if (axis.size() == 1 || value <= axis.front()) return {0, 0, 0.0};
    if (value >= axis.back()) return {axis.size() - 1, axis.size() - 1, 0.0};
    size_t hi = static_cast<size_t>(
        std::upper_bound(axis.begin(), axis.end(), value) - axis.begin());
    size_t lo = hi - 1;
    return {lo, hi, (value - axis[lo]) / (axis[hi] - axis[lo])};
}

Bracket bounded_bracket(const std::vector<double>& axis, double value,
                        const std::string& name) {
    if (value < axis.front() || value > axis.back()) {
        throw AtmosphereError(name + "=" + std::to_string(value)
                              + " outside abundance grid ["
                              + std::to_string(axis.front()) + ", "
                              + std::to_string(axis.back()) + "]");
    }
    return clamped_bracket(axis, value);
}

}  // namespace

AbundanceGrid::AbundanceGrid(std::vector<double> logZs,
                             std::vector<double> CO_ratios,
                             std::vector<double> temperatures,
                             std::vector<double> pressures,
                             std::map<std::string, std::vector<double>> species)
    : logZs_(std::move(logZs)),
      CO_ratios_(std::move(CO_ratios)),
      temperatures_(std::move(temperatures)),
      pressures_(std::move(pressures)),
      species_(std::move(species)) {
    if (logZs_.empty() || CO_ratios_.empty() || temperatures_.empty()
        || pressures_.empty()) {
        throw std::invalid_argument("Abundance grid has an empty axis");
    }
    const size_t expected = logZs_.size() * CO_ratios_.size()
                            * temperatures_.size() * pressures_.size();
    for (const auto& [name, values] : species_) {
        if (values.size() != expected) {
            throw std::invalid_argument("Abundance grid for " + name
                                        + " has wrong size");
        }
    }
}

std::map<std::string, double> AbundanceGrid::abundances_at(double logZ,
                                                           double CO_ratio,
                                                           double T,
                                                           double P) const {
    std::vector<double> ln_pressures(pressures_.size());
    std::transform(pressures_.begin(), pressures_.end(), ln_pressures.begin(),
                   [](double p) { return std::log(p); });
    const std::array<Bracket, 4> brackets
        = {bounded_bracket(logZs_, logZ, "logZ"),
           bounded_bracket(CO_ratios_, CO_ratio, "CO_ratio"),
           clamped_bracket(temperatures_, T),
           clamped_bracket(ln_pressures, std::log(P))};
    const std::array<size_t, 4> sizes
        = {logZs_.size(), CO_ratios_.size(), temperatures_.size(),
           pressures_.size()};

    std::map<std::string, double> result;
    for (const auto& [name, values] : species_) {
        double total = 0.0;
        // sum over the 16 corners of the enclosing hypercube
        for (int corner = 0; corner < 16; ++corner) {
            double weight = 1.0;
            size_t flat_index = 0;
            for (int axis = 0; axis < 4; ++axis) {
                const Bracket& bracket = brackets[axis];
                bool upper = (corner >> axis) & 1;
                weight *= upper ? bracket.weight : 1.0 - bracket.weight;
                flat_index = flat_index * sizes[axis]
                             + (upper ? bracket.hi : bracket.lo);
            }
            if (weight == 0.0) continue;
            total += weight * values[flat_index];
        }
        result[name] = total;
    }
    return result;
}

AbundanceGrid load_abundance_grid(const std::string& path) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded_json
        = simdjson::padded_string::load(path).value();
    simdjson::ondemand::document document = parser.iterate(padded_json).value();
    simdjson::ondemand::object root = document.get_object().value();
    std::string kind = get_string(root, "kind");
    if (kind != "abundances") {
        throw std::invalid_argument(path + ": expected kind 'abundances', got '"
                                    + kind + "'");
    }
    std::vector<double> logZs = get_double_array(root, "logZ");
    std::vector<double> CO_ratios = get_double_array(root, "CO_ratios");
    std::vector<double> temperatures = get_double_array(root, "temperatures");
    std::vector<double> pressures = get_double_array(root, "pressures");
    std::map<std::string, std::vector<double>> species;
    simdjson::ondemand::object species_object
        = root.find_field_unordered("species").get_object().value();
    for (auto field_result : species_object) {
        simdjson::ondemand::field field = std::move(field_result).take_value();
        std::string name(field.unescaped_key().value());
        std::vector<double> values;
        for (simdjson::ondemand::value value :
             field.value().get_array().value()) {
            values.push_back(value.get_double().value());
        }
        species[name] = std::move(values);
    }
    return AbundanceGrid(std::move(logZs), std::move(CO_ratios),
                         std::move(temperatures), std::move(pressures),
                         std::move(species));
}

std::map<std::string, std::vector<double>> compute_abundances(
    const AbundanceGrid& grid, const AtmosphereParams& params,
    const std::vector<double>& P, const std::vector<double>& T) {
    const size_t n_layers = P.size();
    std::map<std::string, std::vector<double>> abundances;

    if (params.custom_abundances) {
        for (const auto& [name, value] : *params.custom_abundances) {
            if (const double* constant = std::get_if<double>(&value)) {
                abundances[name].assign(n_layers, *constant);
                continue;
            }
            const auto& layer_values = std::get<std::vector<double>>(value);
            if (layer_values.size() != n_layers) {
                throw AtmosphereError("Custom abundance for " + name + " has "
                                      + std::to_string(layer_values.size())
                                      + " values, profile has "
                                      + std::to_string(n_layers));
            }
            abundances[name] = layer_values;
        }
        return abundances;
    }

    if (grid.empty()) {
        throw AtmosphereError(
            "No equilibrium abundance grid loaded and no custom abundances");
    }
    for (size_t i = 0; i < n_layers; ++i) {
        for (const auto& [name, value] :
             grid.abundances_at(params.logZ, params.CO_ratio, T[i], P[i])) {
            auto& column = abundances[name];
            if (column.empty()) column.assign(n_layers, 0.0);
            column[i] = value;
        }
    }

    if (params.P_quench > P.front()) {
        std::vector<double> ln_P(n_layers);
        std::transform(P.begin(), P.end(), ln_P.begin(),
                       [](double p) { return std::log(p); });
        const double T_quench = interp(std::log(params.P_quench), ln_P, T);
        auto quenched = grid.abundances_at(params.logZ, params.CO_ratio,
                                           T_quench, params.P_quench);
        for (size_t i = 0; i < n_layers && P[i] < params.P_quench; ++i) {
            for (const auto& [name, value] : quenched) {
                abundances[name][i] = value;
            }
        }
    }
    return abundances;
}

std::vector<double> mean_molecular_weight(
    const std::map<std::string, std::vector<double>>& abundances,
    size_t n_layers) {
    const auto& masses = molecular_masses();
    std::vector<double> mu(n_layers, 0.0);
    std::vector<double> total(n_layers, 0.0);
    for (const auto& [name, values] : abundances) {
        auto mass = masses.find(name);
        if (mass == masses.end()) {
            throw AtmosphereError("Unknown molecular mass for species " + name);
        }
        for (size_t i = 0; i < n_layers; ++i) {
            mu[i] += values[i] * mass->second;
            total[i] += values[i];
        }
    }
    for (size_t i = 0; i < n_layers; ++i) {
        if (!(total[i] > 0.0)) {
            throw AtmosphereError("Layer " + std::to_string(i)
                                  + " has zero total abundance");
        }
    }
    return mu;
}

}  // namespace exospec
