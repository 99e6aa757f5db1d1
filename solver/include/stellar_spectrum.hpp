#pragma once

#include <optional>
#include <vector>

namespace exospec {

// Spectral radiance B_lambda, W m^-3 sr^-1.
double planck(double T, double wavelength);

// Photons s^-1 m^-2 emitted into each grid cell of width
// d_ln_lambda * lambda, optionally mixed with a spot blackbody.
std::vector<double> stellar_photon_spectrum(
    const std::vector<double>& lambda_grid, double d_ln_lambda, double T_star,
    std::optional<double> T_spot = std::nullopt,
    std::optional<double> spot_cov_frac = std::nullopt);

}  // namespace exospec
