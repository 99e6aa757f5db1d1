#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <stdexcept>

#include "constants.hpp"
#include "mie_scattering.hpp"

using namespace exospec;

TEST(MieEfficiencies, BohrenHuffmanReferenceSphere) {
    MieEfficiencies q = mie_efficiencies({1.55, 0.0}, 5.213);
    EXPECT_NEAR(q.q_ext, 3.1050, 2e-3);
    // no absorption: everything extinguished is scattered
    EXPECT_NEAR(q.q_sca, q.q_ext, 1e-10);
    EXPECT_NEAR(q.q_back, 2.925, 2e-3);
}

TEST(MieEfficiencies, RayleighLimit) {
    const std::complex<double> m(1.5, 0.01);
    const double x = 0.01;
    MieEfficiencies q = mie_efficiencies(m, x);
    const std::complex<double> K = (m * m - 1.0) / (m * m + 2.0);
    EXPECT_NEAR(q.q_ext / (4 * x * K.imag()), 1.0, 1e-2);
    EXPECT_NEAR(q.q_sca / (8.0 / 3 * std::pow(x, 4) * std::norm(K)), 1.0,
                1e-2);
    EXPECT_LT(q.q_sca, q.q_ext);
}

TEST(MieEfficiencies, LargeSphereApproachesExtinctionParadox) {
    MieEfficiencies q = mie_efficiencies({1.33, 0.0}, 2000.0);
    EXPECT_NEAR(q.q_ext, 2.0, 2e-2);
}

TEST(MieCache, MatchesDirectEvaluationInsideTable) {
    MieCache cache({1.55, 0.001});
    for (double x : {0.05, 0.8, 2.0, 5.0}) {
        EXPECT_NEAR(cache.q_ext(x), mie_efficiencies({1.55, 0.001}, x).q_ext,
                    2e-2)
            << "x=" << x;
    }
}

TEST(MieCache, OutsideTable) {
    MieCache cache({1.55, 0.001});
    EXPECT_DOUBLE_EQ(cache.q_ext(1e5), 2.0);
    EXPECT_DOUBLE_EQ(cache.q_ext(1e-4),
                     mie_efficiencies({1.55, 0.001}, 1e-4).q_ext);
    EXPECT_DOUBLE_EQ(cache.q_ext(0.0), 0.0);
}

TEST(MieCache, RejectsUnphysicalIndex) {
    EXPECT_THROW(MieCache({-1.0, 0.0}), std::invalid_argument);
    EXPECT_THROW(MieCache({1.5, -0.1}), std::invalid_argument);
}

TEST(MieCache, MonodisperseCrossSection) {
    MieCache cache({1.7, 0.01});
    const double r = 5e-7;
    const double wavelength = 2e-6;
    EXPECT_DOUBLE_EQ(cache.lognormal_cross_section(wavelength, r, 0.0),
                     PI * r * r * cache.q_ext(2 * PI * r / wavelength));
}

TEST(MieCache, LognormalAverageOfLargeGrains) {
    // Q_ext ~ 2 for every grain, so the average is 2 pi <r^2>.
    MieCache cache({1.33, 0.0});
    const double r_mean = 1e-3;
    const double sigma = 0.5;
    const double expected = 2 * PI * r_mean * r_mean * std::exp(2 * sigma * sigma);
    EXPECT_NEAR(cache.lognormal_cross_section(1e-6, r_mean, sigma) / expected,
                1.0, 3e-2);
    EXPECT_THROW(cache.lognormal_cross_section(1e-6, -1.0, sigma),
                 std::invalid_argument);
}
