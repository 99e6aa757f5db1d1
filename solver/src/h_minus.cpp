#include "h_minus.hpp"

#include <cmath>

namespace exospec {

namespace {

// cm^4 dyn^-1 -> m^4 N^-1
constexpr double CGS_TO_SI = 1e-3;

// photodetachment threshold, um
constexpr double LAMBDA_0 = 1.6419;
// h c / k_B, um K
constexpr double ALPHA = 1.439e4;

constexpr double BF_COEFFS[6]
    = {152.519, 49.534, -118.858, 92.536, -34.194, 4.982};

// Rows are A..F, columns n = 1..6.
constexpr double FF_LONG[6][6] = {
    {0, 2483.346, -3449.889, 2200.040, -696.271, 88.283},
    {0, 285.827, -1158.382, 2427.719, -1841.400, 444.517},
    {0, -2054.291, 8746.523, -13651.105, 8624.970, -1863.864},
    {0, 2827.776, -11485.632, 16755.524, -10051.530, 2095.288},
    {0, -1341.537, 5303.609, -7510.494, 4400.067, -901.788},
    {0, 208.952, -812.939, 1132.738, -655.020, 132.985}};

constexpr double FF_SHORT[6][6] = {
    {518.1021, 473.2636, -482.2089, 115.5291, 0, 0},
    {-734.8666, 1443.4137, -737.1616, 169.6374, 0, 0},
    {1021.1775, -1977.3395, 1096.8827, -245.6490, 0, 0},
    {-479.0721, 922.3575, -521.1341, 114.2430, 0, 0},
    {93.1373, -178.9275, 101.7963, -21.9972, 0, 0},
    {-6.4285, 12.3600, -7.0571, 1.5097, 0, 0}};

}  // namespace

double h_minus_bound_free(double wavelength, double T) {
    const double lambda_um = wavelength * 1e6;
    if (!(T > 0.0) || !(lambda_um > 0.0) || lambda_um >= LAMBDA_0) return 0.0;
    const double x = 1.0 / lambda_um - 1.0 / LAMBDA_0;
    double f = 0.0;
    for (int n = 0; n < 6; ++n) {
        f += BF_COEFFS[n] * std::pow(x, n / 2.0);
    }
    // photodetachment cross section, cm^2
    const double sigma
        = 1e-18 * lambda_um * lambda_um * lambda_um * std::pow(x, 1.5) * f;
    const double k_bf = 0.750 * std::pow(T, -2.5)
                        * std::exp(ALPHA / (LAMBDA_0 * T))
                        * (1.0 - std::exp(-ALPHA / (lambda_um * T))) * sigma;
    return k_bf * CGS_TO_SI;
}

double h_minus_free_free(double wavelength, double T) {
    const double lambda_um = wavelength * 1e6;
    if (!(T > 0.0) || lambda_um < 0.1823) return 0.0;
    const auto& table = lambda_um > 0.3645 ? FF_LONG : FF_SHORT;
    const double theta = 5040.0 / T;
    double total = 0.0;
    for (int n = 0; n < 6; ++n) {
        const double polynomial
            = lambda_um * lambda_um * table[0][n] + table[1][n]
              + table[2][n] / lambda_um
              + table[3][n] / (lambda_um * lambda_um)
              + table[4][n] / std::pow(lambda_um, 3)
              + table[5][n] / std::pow(lambda_um, 4);
        total += std::pow(theta, (n + 2) / 2.0) * polynomial;
    }
    return 1e-29 * total * CGS_TO_SI;
}

}  // namespace exospec
