#include "stellar_spectrum.hpp"

#include <cmath>
#include <stdexcept>

#include "constants.hpp"

namespace exospec {

double planck(double T, double wavelength) {
    if (!(T > 0.0)) return 0.0;
    return 2 * h * c * c / std::pow(wavelength, 5)
           / std::expm1(h * c / (wavelength * k_B * T));
}

std::vector<double> stellar_photon_spectrum(
    const std::vector<double>& lambda_grid, double d_ln_lambda, double T_star,
    std::optional<double> T_spot, std::optional<double> spot_cov_frac) {
    if (!(T_star > 0.0)) {
        throw std::invalid_argument("Stellar temperature must be positive");
    }
    if (T_spot.has_value() != spot_cov_frac.has_value()) {
        throw std::invalid_argument(
            "T_spot and spot_cov_frac must be given together");
    }
    double frac = 0.0;
    if (spot_cov_frac) {
        frac = *spot_cov_frac;
        if (frac < 0.0 || frac > 1.0) {
            throw std::invalid_argument("spot_cov_frac must be in [0, 1]");
        }
    }
    std::vector<double> spectrum;
    spectrum.reserve(lambda_grid.size());
    for (double wavelength : lambda_grid) {
        double radiance = (1 - frac) * planck(T_star, wavelength);
        if (T_spot) radiance += frac * planck(*T_spot, wavelength);
        const double d_lambda = d_ln_lambda * wavelength;
        spectrum.push_back(PI * radiance * d_lambda
                           / (h * c / wavelength));
    }
    return spectrum;
}

}  // namespace exospec
