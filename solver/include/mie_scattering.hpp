#pragma once

#include <complex>
#include <vector>

namespace exospec {

struct MieEfficiencies {
    double q_ext;
    double q_sca;
    double q_back;
};

// Bohren & Huffman series for a homogeneous sphere.
// m: complex refractive index (n + ik), x: size parameter 2 pi r / lambda.
MieEfficiencies mie_efficiencies(std::complex<double> m, double x);

// Q_ext tabulated against ln x for one refractive index.
class MieCache {
   public:
    explicit MieCache(std::complex<double> m);

    double q_ext(double x) const;

    // Extinction cross section (m^2) averaged over a log-normal size
    // distribution with geometric mean r_mean and log-width sigma_ln.
    double lognormal_cross_section(double wavelength, double r_mean,
                                   double sigma_ln) const;

   private:
    std::complex<double> m_;
    std::vector<double> ln_x_grid_;
    std::vector<double> q_ext_grid_;
};

}  // namespace exospec
