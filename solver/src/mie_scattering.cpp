#include "mie_scattering.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "constants.hpp"
#include "special_functions.hpp"

namespace exospec {

namespace {
constexpr double MIN_LOG10_X = -3.0;
constexpr double MAX_LOG10_X = 4.0;
constexpr int POINTS_PER_DECADE = 100;
constexpr int LOGNORMAL_SAMPLES = 101;
constexpr double LOGNORMAL_WIDTH = 5.0;
}  // namespace

MieEfficiencies mie_efficiencies(std::complex<double> m, double x) {
    if (!(x > 0.0)) {
        throw std::invalid_argument("Mie size parameter must be positive, got "
                                    + std::to_string(x));
    }
    const std::complex<double> y = m * x;
    const int nstop = static_cast<int>(x + 4.0 * std::cbrt(x) + 2.0);
    const int nmx = std::max(nstop, static_cast<int>(std::abs(y))) + 15;

    // logarithmic derivative by downward recurrence
    std::vector<std::complex<double>> d(nmx + 1, {0.0, 0.0});
    for (int n = nmx; n >= 1; --n) {
        std::complex<double> en = static_cast<double>(n) / y;
        d[n - 1] = en - 1.0 / (d[n] + en);
    }

    double psi0 = std::cos(x);
    double psi1 = std::sin(x);
    double chi0 = -std::sin(x);
    double chi1 = std::cos(x);
    std::complex<double> xi1(psi1, -chi1);

    double q_sca = 0.0;
    double q_ext = 0.0;
    std::complex<double> back(0.0, 0.0);
    double sign = -1.0;
    for (int n = 1; n <= nstop; ++n) {
        const double fn = static_cast<double>(n);
        const double psi = (2.0 * fn - 1.0) * psi1 / x - psi0;
        const double chi = (2.0 * fn - 1.0) * chi1 / x - chi0;
        const std::complex<double> xi(psi, -chi);
        const std::complex<double> da = d[n] / m + fn / x;
        const std::complex<double> db = m * d[n] + fn / x;
        const std::complex<double> an = (da * psi - psi1) / (da * xi - xi1);
        const std::complex<double> bn = (db * psi - psi1) / (db * xi - xi1);
        q_sca += (2.0 * fn + 1.0) * (std::norm(an) + std::norm(bn));
        q_ext += (2.0 * fn + 1.0) * (an.real() + bn.real());
        back += (2.0 * fn + 1.0) * sign * (an - bn);
        sign = -sign;
        psi0 = psi1;
        psi1 = psi;
        chi0 = chi1;
        chi1 = chi;
        xi1 = std::complex<double>(psi1, -chi1);
    }
    const double x2 = x * x;
    return {2.0 * q_ext / x2, 2.0 * q_sca / x2, std::norm(back) / x2};
}

MieCache::MieCache(std::complex<double> m) : m_(m) {
    if (!(m.real() > 0.0) || m.imag() < 0.0) {
        throw std::invalid_argument(
            "Refractive index needs positive real part and non-negative "
            "imaginary part");
    }
    const int n_points = static_cast<int>((MAX_LOG10_X - MIN_LOG10_X)
                                          * POINTS_PER_DECADE)
                         + 1;
    for (double x : logspace(MIN_LOG10_X, MAX_LOG10_X, n_points)) {
        ln_x_grid_.push_back(std::log(x));
        q_ext_grid_.push_back(mie_efficiencies(m_, x).q_ext);
    }
}

double MieCache::q_ext(double x) const {
    if (!(x > 0.0)) return 0.0;
    const double ln_x = std::log(x);
    if (ln_x < ln_x_grid_.front()) return mie_efficiencies(m_, x).q_ext;
    if (ln_x > ln_x_grid_.back()) return 2.0;
    return interp(ln_x, ln_x_grid_, q_ext_grid_);
}

double MieCache::lognormal_cross_section(double wavelength, double r_mean,
                                         double sigma_ln) const {
    if (!(wavelength > 0.0) || !(r_mean > 0.0) || sigma_ln < 0.0) {
        throw std::invalid_argument("Bad Mie particle or wavelength parameters");
    }
    if (sigma_ln == 0.0) {
        return PI * r_mean * r_mean * q_ext(2 * PI * r_mean / wavelength);
    }
    const double ln_r_mean = std::log(r_mean);
    const double z_min = ln_r_mean - LOGNORMAL_WIDTH * sigma_ln;
    const double dz = 2 * LOGNORMAL_WIDTH * sigma_ln / (LOGNORMAL_SAMPLES - 1);
    double integral = 0.0;
    double norm = 0.0;
    for (int i = 0; i < LOGNORMAL_SAMPLES; ++i) {
        const double z = z_min + i * dz;
        const double trapezoid_weight
            = (i == 0 || i == LOGNORMAL_SAMPLES - 1) ? 0.5 : 1.0;
        const double pdf
            = std::exp(-std::pow(z - ln_r_mean, 2) / (2 * sigma_ln * sigma_ln));
        const double r = std::exp(z);
        integral += trapezoid_weight * pdf * PI * r * r
                    * q_ext(2 * PI * r / wavelength);
        norm += trapezoid_weight * pdf;
    }
    return integral / norm;
}

}  // namespace exospec
