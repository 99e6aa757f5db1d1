#include "transit_depth_calculator.hpp"

#include <cmath>
#include <utility>

#include "binning.hpp"
#include "stellar_spectrum.hpp"

namespace exospec {

TransitDepthCalculator::TransitDepthCalculator(AtmosphereSolver atm)
    : atm_(std::move(atm)) {
}

void TransitDepthCalculator::change_wavelength_bins(
    const std::optional<std::vector<WavelengthBin>>& bins) {
    atm_.change_wavelength_bins(bins);
}

LayerMatrix line_of_sight_lengths(const std::vector<double>& radii) {
    const size_t n_shells = radii.size() - 1;
    LayerMatrix dl(n_shells, std::vector<double>(n_shells, 0.0));
    for (size_t i = 0; i < n_shells; ++i) {
        const double b = 0.5 * (radii[i] + radii[i + 1]);
        const double b2 = b * b;
        for (size_t j = 0; j < i; ++j) {
            dl[i][j] = 2 * (std::sqrt(radii[j] * radii[j] - b2)
                            - std::sqrt(radii[j + 1] * radii[j + 1] - b2));
        }
        dl[i][i] = 2 * std::sqrt(radii[i] * radii[i] - b2);
    }
    return dl;
}

TransitResult TransitDepthCalculator::compute_depths(
    const Profile& t_p_profile, const AtmosphereParams& params,
    bool full_output) {
    AtmosphereInfo atm_info = atm_.compute_params(
        params, t_p_profile.pressures(), t_p_profile.temperatures());

    const std::vector<double>& lambda_grid = atm_.lambda_grid();
    const size_t n_lambda = lambda_grid.size();
    const std::vector<double>& radii = atm_info.radii;
    const size_t n_shells = radii.size() - 1;
    const LayerMatrix& absorption_coeff = atm_info.absorption_coeff_atm;

    LayerMatrix intermediate_coeff(n_shells, std::vector<double>(n_lambda));
    for (size_t j = 0; j < n_shells; ++j) {
        for (size_t k = 0; k < n_lambda; ++k) {
            intermediate_coeff[j][k]
                = 0.5 * (absorption_coeff[j][k] + absorption_coeff[j + 1][k]);
        }
    }

    const LayerMatrix dl = line_of_sight_lengths(radii);
    // [impact parameter][wavelength]
    LayerMatrix tau_by_impact(n_shells, std::vector<double>(n_lambda, 0.0));
    for (size_t i = 0; i < n_shells; ++i) {
        std::vector<double>& tau_row = tau_by_impact[i];
        for (size_t j = 0; j <= i; ++j) {
            const double length = dl[i][j];
            const std::vector<double>& coeff = intermediate_coeff[j];
            for (size_t k = 0; k < n_lambda; ++k) {
                tau_row[k] += length * coeff[k];
            }
        }
    }

    const double bottom_radius = radii.back();
    const double star_area = params.star_radius * params.star_radius;
    std::vector<double> transit_depths(n_lambda,
                                       bottom_radius * bottom_radius);
    for (size_t i = 0; i < n_shells; ++i) {
        const double b = 0.5 * (radii[i] + radii[i + 1]);
        const double annulus = 2 * b * atm_info.dr[i];
        for (size_t k = 0; k < n_lambda; ++k) {
            transit_depths[k]
                += annulus * (1 - std::exp(-tau_by_impact[i][k]));
        }
    }
    for (double& depth : transit_depths) depth /= star_area;

    std::vector<double> stellar_spectrum = atm_.get_stellar_spectrum(params);
    if (params.T_spot && params.spot_cov_frac) {
        // unocculted spots brighten the transit chord relative to the disk
        std::vector<double> photosphere = stellar_photon_spectrum(
            lambda_grid, atm_.d_ln_lambda(), params.T_star);
        for (size_t k = 0; k < n_lambda; ++k) {
            transit_depths[k] *= photosphere[k] / stellar_spectrum[k];
        }
    }

    BinnedSpectrum depths
        = bin_spectrum(lambda_grid, transit_depths, stellar_spectrum,
                       atm_.method(), atm_.n_gauss(), atm_.wavelength_bins());

    TransitResult result;
    result.wavelengths = depths.binned_wavelengths;
    result.values = depths.binned_values;
    if (full_output) {
        TransitFullOutput output;
        output.stellar_spectrum = stellar_spectrum;
        output.unbinned_wavelengths = depths.unbinned_wavelengths;
        output.unbinned_depths = depths.unbinned_values;
        output.tau_los = LayerMatrix(n_lambda, std::vector<double>(n_shells));
        for (size_t i = 0; i < n_shells; ++i) {
            for (size_t k = 0; k < n_lambda; ++k) {
                output.tau_los[k][i] = tau_by_impact[i][k];
            }
        }
        output.atm_info = std::move(atm_info);
        result.full_output = std::move(output);
    }
    return result;
}

}  // namespace exospec
