#include "atmosphere_solver.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "constants.hpp"
#include "h_minus.hpp"
#include "special_functions.hpp"
#include "stellar_spectrum.hpp"

namespace exospec {

AtmosphereSolver::AtmosphereSolver(OpacityDatabase opacity,
                                   AbundanceGrid condensation_grid,
                                   AbundanceGrid no_condensation_grid,
                                   bool include_condensation)
    : opacity_(std::move(opacity)),
      condensation_grid_(std::move(condensation_grid)),
      no_condensation_grid_(std::move(no_condensation_grid)),
      include_condensation_(include_condensation),
      d_ln_lambda_(opacity_.d_ln_lambda()) {
    change_wavelength_bins(std::nullopt);
}

std::vector<double> AtmosphereSolver::group_wavelengths() const {
    const std::vector<double>& full_grid = opacity_.lambda_grid();
    const size_t group_size
        = method() == Method::KTables ? static_cast<size_t>(n_gauss()) : 1;
    std::vector<double> wavelengths;
    for (size_t start = 0; start < full_grid.size(); start += group_size) {
        wavelengths.push_back(
            median(std::vector<double>(full_grid.begin() + start,
                                       full_grid.begin() + start + group_size)));
    }
    return wavelengths;
}

void AtmosphereSolver::change_wavelength_bins(
    const std::optional<std::vector<WavelengthBin>>& bins) {
    const std::vector<double>& full_grid = opacity_.lambda_grid();
    active_indices_.clear();
    lambda_grid_.clear();
    if (!bins) {
        for (size_t i = 0; i < full_grid.size(); ++i) {
            active_indices_.push_back(i);
        }
        lambda_grid_ = full_grid;
        wavelength_bins_.reset();
        return;
    }

    const std::vector<double> groups = group_wavelengths();
    const size_t group_size = full_grid.size() / groups.size();
    std::vector<bool> keep(groups.size(), false);
    for (const auto& [start, end] : *bins) {
        if (!(start < end)) {
            throw std::invalid_argument("Wavelength bin ["
                                        + std::to_string(start) + ", "
                                        + std::to_string(end)
                                        + ") ends before it starts");
        }
        if (start < groups.front() || end > groups.back()) {
            throw std::invalid_argument(
                "Wavelength bin [" + std::to_string(start) + ", "
                + std::to_string(end) + ") is outside the wavelength grid");
        }
        bool populated = false;
        for (size_t g = 0; g < groups.size(); ++g) {
            if (groups[g] >= start && groups[g] < end) {
                keep[g] = true;
                populated = true;
            }
        }
        if (!populated) {
            throw std::invalid_argument(
                "Wavelength bin [" + std::to_string(start) + ", "
                + std::to_string(end) + ") contains no grid wavelength");
        }
    }
    for (size_t g = 0; g < groups.size(); ++g) {
        if (!keep[g]) continue;
        for (size_t i = g * group_size; i < (g + 1) * group_size; ++i) {
            active_indices_.push_back(i);
            lambda_grid_.push_back(full_grid[i]);
        }
    }
    wavelength_bins_ = bins;
}

void AtmosphereSolver::validate_params(
    const AtmosphereParams& params, const std::vector<double>& P_profile,
    const std::vector<double>& T_profile) const {
    if (!(params.star_radius > 0.0)) {
        throw AtmosphereError("Star radius must be positive");
    }
    if (!(params.planet_mass > 0.0)) {
        throw AtmosphereError("Planet mass must be positive");
    }
    if (!(params.planet_radius > 0.0)) {
        throw AtmosphereError("Planet radius must be positive");
    }
    if (!(params.cloudtop_pressure > 0.0)) {
        throw AtmosphereError("Cloud-top pressure must be positive");
    }
    if (P_profile.size() != T_profile.size() || P_profile.size() < 2) {
        throw AtmosphereError(
            "Pressure and temperature profiles must have equal length >= 2");
    }
    for (size_t i = 0; i < T_profile.size(); ++i) {
        if (!(T_profile[i] > 0.0) || !(P_profile[i] > 0.0)) {
            throw AtmosphereError("Non-positive pressure or temperature at layer "
                                  + std::to_string(i));
        }
    }
    if (params.mie) {
        if (!(params.mie->frac_scale_height > 0.0)) {
            throw AtmosphereError("frac_scale_height must be positive");
        }
        if (params.mie->number_density < 0.0) {
            throw AtmosphereError("Particle number density must be >= 0");
        }
    }
}

std::vector<double> AtmosphereSolver::compute_radii(
    const AtmosphereParams& params, const std::vector<double>& P,
    const std::vector<double>& T, const std::vector<double>& mu) const {
    const size_t n = P.size();
    std::vector<double> ln_P(n);
    std::vector<double> integrand(n);
    for (size_t i = 0; i < n; ++i) {
        ln_P[i] = std::log(P[i]);
        integrand[i] = T[i] / mu[i];
    }
    // cumulative integral of T/mu d ln P from the top of the atmosphere
    std::vector<double> cumulative(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        cumulative[i] = cumulative[i - 1]
                        + 0.5 * (integrand[i] + integrand[i - 1])
                              * (ln_P[i] - ln_P[i - 1]);
    }
    const double ln_P_ref = std::log(REF_PRESSURE);
    double ref_value;
    if (ln_P_ref < ln_P.front()) {
        ref_value = integrand.front() * (ln_P_ref - ln_P.front());
    } else if (ln_P_ref > ln_P.back()) {
        ref_value = cumulative.back()
                    + integrand.back() * (ln_P_ref - ln_P.back());
    } else {
        ref_value = interp(ln_P_ref, ln_P, cumulative);
    }

    const double scale = k_B / (G * params.planet_mass * AMU);
    std::vector<double> radii(n);
    for (size_t i = 0; i < n; ++i) {
        double inverse_radius = 1.0 / params.planet_radius
                                + scale * (cumulative[i] - ref_value);
        if (!(inverse_radius > 0.0)) {
            throw AtmosphereError(
                "Atmosphere is unbound: hydrostatic radius diverges at P="
                + std::to_string(P[i]) + " Pa");
        }
        radii[i] = 1.0 / inverse_radius;
    }
    return radii;
}

std::vector<double> AtmosphereSolver::mie_cross_sections(const MieParams& mie) {
    auto key = std::make_pair(mie.ri.real(), mie.ri.imag());
    auto cache = mie_caches_.find(key);
    if (cache == mie_caches_.end()) {
        cache = mie_caches_.try_emplace(key, mie.ri).first;
    }
    std::vector<double> cross_sections;
    cross_sections.reserve(lambda_grid_.size());
    for (double wavelength : lambda_grid_) {
        cross_sections.push_back(cache->second.lognormal_cross_section(
            wavelength, mie.part_size, mie.part_size_std));
    }
    return cross_sections;
}

LayerMatrix AtmosphereSolver::compute_absorption(
    const AtmosphereParams& params, const std::vector<double>& P,
    const std::vector<double>& T,
    const std::map<std::string, std::vector<double>>& abundances) {
    const size_t n_layers = P.size();
    const size_t n_lambda = lambda_grid_.size();
    LayerMatrix absorption(n_layers, std::vector<double>(n_lambda, 0.0));

    std::vector<double> mie_sigma;
    const bool add_mie = params.mie && params.mie->number_density > 0.0;
    if (add_mie) mie_sigma = mie_cross_sections(*params.mie);

    const auto electrons = abundances.find("e-");
    const auto hydrogen = abundances.find("H");
    const auto& polarizability_table = polarizabilities();
    for (size_t layer = 0; layer < n_layers; ++layer) {
        std::vector<double>& coeff = absorption[layer];
        const double number_density = P[layer] / (k_B * T[layer]);

        if (params.add_gas_absorption) {
            for (const auto& [species, fractions] : abundances) {
                if (!opacity_.has_species(species)) continue;
                const double species_density = fractions[layer] * number_density;
                if (species_density == 0.0) continue;
                std::vector<double> sigma = opacity_.cross_sections(
                    species, T[layer], P[layer], active_indices_);
                for (size_t j = 0; j < n_lambda; ++j) {
                    coeff[j] += species_density * sigma[j];
                }
            }
        }

        if (params.add_collisional_absorption) {
            for (const CollisionTable& table : opacity_.collision_tables()) {
                auto a = abundances.find(table.species_a);
                auto b = abundances.find(table.species_b);
                if (a == abundances.end() || b == abundances.end()) continue;
                const double pair_density = number_density * number_density
                                            * a->second[layer]
                                            * b->second[layer];
                if (pair_density == 0.0) continue;
                std::vector<double> k = opacity_.collision_coefficients(
                    table, T[layer], active_indices_);
                for (size_t j = 0; j < n_lambda; ++j) {
                    coeff[j] += pair_density * k[j];
                }
            }
        }

        if (params.add_H_minus_absorption && electrons != abundances.end()
            && hydrogen != abundances.end()) {
            const double electron_pressure
                = electrons->second[layer] * number_density * k_B * T[layer];
            const double H_density = hydrogen->second[layer] * number_density;
            for (size_t j = 0; j < n_lambda; ++j) {
                coeff[j] += (h_minus_bound_free(lambda_grid_[j], T[layer])
                             + h_minus_free_free(lambda_grid_[j], T[layer]))
                            * electron_pressure * H_density;
            }
        }

        if (params.add_scattering) {
            double sum_polarizability_sqr = 0.0;
            for (const auto& [species, fractions] : abundances) {
                auto alpha = polarizability_table.find(species);
                if (alpha == polarizability_table.end()) continue;
                sum_polarizability_sqr
                    += fractions[layer] * alpha->second * alpha->second;
            }
            const double prefactor
                = params.scattering_factor * 128.0 / 3 * std::pow(PI, 5)
                  * std::pow(params.scattering_ref_wavelength,
                             params.scattering_slope - 4)
                  * number_density * sum_polarizability_sqr;
            for (size_t j = 0; j < n_lambda; ++j) {
                coeff[j] += prefactor
                            / std::pow(lambda_grid_[j], params.scattering_slope);
            }
        }

        if (add_mie) {
            const double particle_density
                = params.mie->number_density
                  * std::pow(P[layer] / REF_PRESSURE,
                             1.0 / params.mie->frac_scale_height);
            for (size_t j = 0; j < n_lambda; ++j) {
                coeff[j] += particle_density * mie_sigma[j];
            }
        }
    }
    return absorption;
}

AtmosphereInfo AtmosphereSolver::compute_params(
    const AtmosphereParams& params, const std::vector<double>& P_profile,
    const std::vector<double>& T_profile) {
    validate_params(params, P_profile, T_profile);

    const AbundanceGrid& grid
        = include_condensation_ ? condensation_grid_ : no_condensation_grid_;
    std::map<std::string, std::vector<double>> full_abundances
        = compute_abundances(grid, params, P_profile, T_profile);

    AtmosphereInfo info;
    std::vector<size_t> above_cloud;
    for (size_t i = 0; i < P_profile.size(); ++i) {
        if (P_profile[i] <= params.cloudtop_pressure) above_cloud.push_back(i);
    }
    if (above_cloud.size() < 2) {
        throw AtmosphereError("Fewer than 2 layers above the cloud top at "
                              + std::to_string(params.cloudtop_pressure)
                              + " Pa");
    }
    const std::vector<double>& table_T = opacity_.temperatures();
    for (size_t i : above_cloud) {
        if (!table_T.empty()
            && (T_profile[i] < table_T.front() || T_profile[i] > table_T.back())) {
            throw AtmosphereError(
                "Temperature " + std::to_string(T_profile[i])
                + " K outside opacity table range ["
                + std::to_string(table_T.front()) + ", "
                + std::to_string(table_T.back()) + "]");
        }
        info.P_profile.push_back(P_profile[i]);
        info.T_profile.push_back(T_profile[i]);
    }
    for (const auto& [species, fractions] : full_abundances) {
        std::vector<double>& truncated = info.abundances[species];
        for (size_t i : above_cloud) truncated.push_back(fractions[i]);
    }

    const size_t n_layers = info.P_profile.size();
    info.mu_profile = mean_molecular_weight(info.abundances, n_layers);
    info.radii
        = compute_radii(params, info.P_profile, info.T_profile, info.mu_profile);
    info.dr.resize(n_layers - 1);
    for (size_t i = 0; i + 1 < n_layers; ++i) {
        info.dr[i] = info.radii[i] - info.radii[i + 1];
    }
    info.absorption_coeff_atm = compute_absorption(
        params, info.P_profile, info.T_profile, info.abundances);
    return info;
}

std::vector<double> AtmosphereSolver::get_stellar_spectrum(
    const AtmosphereParams& params) const {
    return stellar_photon_spectrum(lambda_grid_, d_ln_lambda_, params.T_star,
                                   params.T_spot, params.spot_cov_frac);
}

}  // namespace exospec
