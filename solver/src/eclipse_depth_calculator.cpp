#include "eclipse_depth_calculator.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "binning.hpp"
#include "constants.hpp"
#include "stellar_spectrum.hpp"

namespace exospec {

EclipseDepthCalculator::EclipseDepthCalculator(AtmosphereSolver atm)
    : atm_(std::move(atm)) {
}

void EclipseDepthCalculator::change_wavelength_bins(
    const std::optional<std::vector<WavelengthBin>>& bins) {
    atm_.change_wavelength_bins(bins);
}

std::vector<double> EclipseDepthCalculator::get_photosphere_radii(
    const LayerMatrix& taus, const std::vector<double>& radii) const {
    std::vector<double> intermediate_radii(radii.size() - 1);
    for (size_t i = 0; i + 1 < radii.size(); ++i) {
        intermediate_radii[i] = 0.5 * (radii[i] + radii[i + 1]);
    }
    std::vector<double> photosphere_radii;
    photosphere_radii.reserve(taus.size());
    for (const std::vector<double>& tau_row : taus) {
        photosphere_radii.push_back(interp(1.0, tau_row, intermediate_radii));
    }
    return photosphere_radii;
}

EclipseResult EclipseDepthCalculator::compute_depths(
    const Profile& t_p_profile, const AtmosphereParams& params,
    bool is_brown_dwarf, bool full_output) {
    AtmosphereInfo atm_info = atm_.compute_params(
        params, t_p_profile.pressures(), t_p_profile.temperatures());
    if (atm_info.P_profile.back() > params.cloudtop_pressure) {
        throw std::logic_error("Atmosphere extends below the cloud top");
    }

    const std::vector<double>& lambda_grid = atm_.lambda_grid();
    const size_t n_lambda = lambda_grid.size();
    const size_t n_mid = atm_info.P_profile.size() - 1;
    const LayerMatrix& absorption_coeff = atm_info.absorption_coeff_atm;

    std::vector<double> intermediate_T(n_mid);
    for (size_t j = 0; j < n_mid; ++j) {
        intermediate_T[j]
            = 0.5 * (atm_info.T_profile[j] + atm_info.T_profile[j + 1]);
    }

    LayerMatrix taus(n_lambda, std::vector<double>(n_mid, 0.0));
    LayerMatrix integrand(n_lambda, std::vector<double>(n_mid, 0.0));
    std::vector<double> fluxes(n_lambda, 0.0);
    std::vector<double> bottom_planck(n_lambda, 0.0);
    for (size_t k = 0; k < n_lambda; ++k) {
        double tau = 0.0;
        double previous_exp3 = exp3_interpolator_(0.0);
        double flux_sum = 0.0;
        for (size_t j = 0; j < n_mid; ++j) {
            const double intermediate_coeff
                = 0.5 * (absorption_coeff[j][k] + absorption_coeff[j + 1][k]);
            tau += intermediate_coeff * atm_info.dr[j];
            taus[k][j] = tau;
            const double planck_value = planck(intermediate_T[j], lambda_grid[k]);
            const double exp3 = exp3_interpolator_(tau);
            integrand[k][j] = planck_value * (exp3 - previous_exp3);
            flux_sum += integrand[k][j];
            previous_exp3 = exp3;
            bottom_planck[k] = planck_value;
        }
        fluxes[k] = -2 * PI * flux_sum;
    }

    if (!std::isinf(params.cloudtop_pressure)) {
        // opaque deck under the whole column
        for (size_t k = 0; k < n_lambda; ++k) {
            fluxes[k] += 2 * PI * bottom_planck[k] * expn(3, taus[k].back());
        }
    }

    std::vector<double> stellar_photon_fluxes
        = atm_.get_stellar_spectrum(params);
    std::vector<double> photosphere_radii
        = get_photosphere_radii(taus, atm_info.radii);
    std::vector<double> eclipse_depths(n_lambda);
    for (size_t k = 0; k < n_lambda; ++k) {
        const double d_lambda = atm_.d_ln_lambda() * lambda_grid[k];
        const double photon_flux
            = fluxes[k] * d_lambda / (h * c / lambda_grid[k]);
        const double radius_ratio = photosphere_radii[k] / params.star_radius;
        eclipse_depths[k] = photon_flux / stellar_photon_fluxes[k]
                            * radius_ratio * radius_ratio;
    }

    // For ktables, eclipse_depths has n_gauss points per wavelength while
    // the unbinned arrays have one.
    BinnedSpectrum depths = bin_spectrum(
        lambda_grid, eclipse_depths, stellar_photon_fluxes, atm_.method(),
        atm_.n_gauss(), atm_.wavelength_bins(), is_brown_dwarf);
    BinnedSpectrum binned_fluxes
        = bin_spectrum(lambda_grid, fluxes, stellar_photon_fluxes,
                       atm_.method(), atm_.n_gauss(), atm_.wavelength_bins());

    EclipseResult result;
    result.wavelengths = depths.binned_wavelengths;
    result.values
        = is_brown_dwarf ? binned_fluxes.binned_values : depths.binned_values;

    if (full_output) {
        EclipseFullOutput output;
        output.stellar_spectrum = stellar_photon_fluxes;
        output.planet_spectrum = fluxes;
        output.unbinned_wavelengths = depths.unbinned_wavelengths;
        output.unbinned_eclipse_depths = depths.unbinned_values;
        output.unbinned_fluxes = binned_fluxes.unbinned_values;
        output.binned_fluxes = binned_fluxes.binned_values;
        output.contrib = LayerMatrix(n_lambda, std::vector<double>(n_mid, 0.0));
        for (size_t k = 0; k < n_lambda; ++k) {
            if (fluxes[k] == 0.0) continue;
            for (size_t j = 0; j < n_mid; ++j) {
                output.contrib[k][j] = -integrand[k][j] / fluxes[k];
            }
        }
        output.taus = std::move(taus);
        output.atm_info = std::move(atm_info);
        result.full_output = std::move(output);
    }
    return result;
}

}  // namespace exospec
