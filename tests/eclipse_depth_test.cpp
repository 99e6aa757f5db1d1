#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "constants.hpp"
#include "eclipse_depth_calculator.hpp"
#include "special_functions.hpp"
#include "stellar_spectrum.hpp"
#include "test_fixtures.hpp"
#include "tp_profile.hpp"

using namespace exospec;
using namespace exospec::test_support;

namespace {

constexpr double PLANET_T = 1000.0;

Profile isothermal_profile(int n_heights = 200) {
    Profile profile(n_heights);
    profile.set_isothermal(PLANET_T);
    return profile;
}

std::vector<double> mid_radii(const std::vector<double>& radii) {
    std::vector<double> mids;
    for (size_t i = 0; i + 1 < radii.size(); ++i) {
        mids.push_back(0.5 * (radii[i] + radii[i + 1]));
    }
    return mids;
}

}  // namespace

TEST(EclipseDepthCalculator, OpticallyThickColumnEmitsBlackbody) {
    EclipseDepthCalculator calculator(make_solver(1e-22));
    EclipseResult result = calculator.compute_depths(
        isothermal_profile(), hot_jupiter_params(), false, true);
    ASSERT_TRUE(result.full_output.has_value());
    const EclipseFullOutput& output = *result.full_output;
    ASSERT_EQ(result.wavelengths.size(), 12u);
    ASSERT_EQ(output.planet_spectrum.size(), 12u);
    for (size_t k = 0; k < result.wavelengths.size(); ++k) {
        EXPECT_NEAR(output.planet_spectrum[k]
                        / (PI * planck(PLANET_T, result.wavelengths[k])),
                    1.0, 1e-9);
    }
}

TEST(EclipseDepthCalculator, DepthIsFluxRatioTimesPhotosphereArea) {
    EclipseDepthCalculator calculator(make_solver(1e-22));
    const AtmosphereParams params = hot_jupiter_params();
    EclipseResult result
        = calculator.compute_depths(isothermal_profile(), params, false, true);
    const EclipseFullOutput& output = *result.full_output;
    std::vector<double> mids = mid_radii(output.atm_info.radii);
    for (size_t k = 0; k < result.wavelengths.size(); ++k) {
        const double r_photosphere = interp(1.0, output.taus[k], mids);
        EXPECT_LT(r_photosphere, output.atm_info.radii.front());
        EXPECT_GT(r_photosphere, output.atm_info.radii.back());
        const double ratio = r_photosphere / params.star_radius;
        const double expected = planck(PLANET_T, result.wavelengths[k])
                                / planck(params.T_star, result.wavelengths[k])
                                * ratio * ratio;
        EXPECT_NEAR(result.values[k] / expected, 1.0, 1e-9);
    }
}

TEST(EclipseDepthCalculator, ContributionRowsSumToInverseTwoPiWithoutCloud) {
    EclipseDepthCalculator calculator(make_solver(1e-22));
    EclipseResult result = calculator.compute_depths(
        isothermal_profile(), hot_jupiter_params(), false, true);
    const EclipseFullOutput& output = *result.full_output;
    ASSERT_EQ(output.contrib.size(), 12u);
    for (const std::vector<double>& row : output.contrib) {
        ASSERT_EQ(row.size(), output.atm_info.P_profile.size() - 1);
        double total = 0.0;
        for (double value : row) {
            EXPECT_GE(value, 0.0);
            total += value;
        }
        EXPECT_NEAR(total, 1.0 / (2 * PI), 1e-9);
    }
    for (const std::vector<double>& row : output.taus) {
        for (size_t j = 1; j < row.size(); ++j) EXPECT_GE(row[j], row[j - 1]);
    }
}

TEST(EclipseDepthCalculator, TransparentAtmosphereShowsTheCloudDeck) {
    EclipseDepthCalculator calculator(make_solver(0.0));
    AtmosphereParams params = hot_jupiter_params();
    params.cloudtop_pressure = 1e4;
    EclipseResult result
        = calculator.compute_depths(isothermal_profile(), params, false, true);
    const EclipseFullOutput& output = *result.full_output;
    const double r_deck = mid_radii(output.atm_info.radii).back();
    for (size_t k = 0; k < result.wavelengths.size(); ++k) {
        const double wavelength = result.wavelengths[k];
        EXPECT_NEAR(output.planet_spectrum[k] / (PI * planck(PLANET_T, wavelength)),
                    1.0, 1e-12);
        const double ratio = r_deck / params.star_radius;
        EXPECT_NEAR(result.values[k]
                        / (planck(PLANET_T, wavelength)
                           / planck(params.T_star, wavelength) * ratio * ratio),
                    1.0, 1e-9);
        for (double value : output.contrib[k]) EXPECT_EQ(value, 0.0);
    }
}

TEST(EclipseDepthCalculator, BinsAverageWithStellarWeights) {
    EclipseDepthCalculator calculator(make_solver(1e-22));
    calculator.change_wavelength_bins(
        std::vector<WavelengthBin>{{1e-6, 3e-6}, {3e-6, 9e-6}});
    EclipseResult result = calculator.compute_depths(
        isothermal_profile(), hot_jupiter_params(), false, true);
    const EclipseFullOutput& output = *result.full_output;
    ASSERT_EQ(result.values.size(), 2u);
    ASSERT_EQ(result.wavelengths.size(), 2u);
    ASSERT_EQ(output.unbinned_wavelengths.size(), 11u);

    double weighted = 0.0;
    double weights = 0.0;
    std::vector<double> in_bin;
    for (size_t k = 0; k < output.unbinned_wavelengths.size(); ++k) {
        if (output.unbinned_wavelengths[k] >= 3e-6) continue;
        weighted += output.unbinned_eclipse_depths[k] * output.stellar_spectrum[k];
        weights += output.stellar_spectrum[k];
        in_bin.push_back(output.unbinned_wavelengths[k]);
    }
    EXPECT_NEAR(result.values[0] / (weighted / weights), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(result.wavelengths[0], mean(in_bin));
    EXPECT_EQ(output.binned_fluxes.size(), 2u);
}

TEST(EclipseDepthCalculator, IdenticalGaussPointsReproduceCrossSections) {
    EclipseDepthCalculator xsec(make_solver(1e-22));
    EclipseDepthCalculator ktables(make_solver(1e-22, Method::KTables, 4));
    EclipseResult a = xsec.compute_depths(isothermal_profile(),
                                          hot_jupiter_params());
    EclipseResult b = ktables.compute_depths(isothermal_profile(),
                                             hot_jupiter_params());
    ASSERT_EQ(a.values.size(), b.values.size());
    for (size_t k = 0; k < a.values.size(); ++k) {
        EXPECT_NEAR(b.wavelengths[k] / a.wavelengths[k], 1.0, 1e-12);
        EXPECT_NEAR(b.values[k] / a.values[k], 1.0, 1e-9);
    }
    EXPECT_FALSE(a.full_output.has_value());
}

TEST(EclipseDepthCalculator, BrownDwarfModeReturnsFluxes) {
    EclipseDepthCalculator calculator(make_solver(1e-22));
    EclipseResult result = calculator.compute_depths(
        isothermal_profile(), hot_jupiter_params(), true, true);
    const EclipseFullOutput& output = *result.full_output;
    ASSERT_EQ(result.values.size(), output.planet_spectrum.size());
    for (size_t k = 0; k < result.values.size(); ++k) {
        EXPECT_DOUBLE_EQ(result.values[k], output.planet_spectrum[k]);
    }
}

TEST(EclipseDepthCalculator, CloudDeckShinesThroughAFiniteColumn) {
    EclipseDepthCalculator calculator(make_solver(1e-27));
    AtmosphereParams params = hot_jupiter_params();
    params.cloudtop_pressure = 1e4;
    std::vector<double> P = log_grid(1e-4, 1e8, 200);
    std::vector<double> T;
    for (double pressure : P) {
        T.push_back(800.0 + 50.0 * (std::log10(pressure) + 4));
    }
    Profile profile(200);
    profile.set_from_arrays(P, T);
    EclipseResult result = calculator.compute_depths(profile, params, false, true);
    const EclipseFullOutput& output = *result.full_output;

    const std::vector<double>& layer_T = output.atm_info.T_profile;
    const size_t n_mid = layer_T.size() - 1;
    Exp3Interpolator exp3;
    for (size_t k = 0; k < result.wavelengths.size(); ++k) {
        const double wavelength = result.wavelengths[k];
        const std::vector<double>& taus = output.taus[k];
        const double tau_max = taus.back();
        ASSERT_GT(tau_max, 0.05);
        ASSERT_LT(tau_max, 20.0);

        double column = 0.0;
        double previous = exp3(0.0);
        double B_bottom = 0.0;
        for (size_t j = 0; j < n_mid; ++j) {
            B_bottom = planck(0.5 * (layer_T[j] + layer_T[j + 1]), wavelength);
            const double current = exp3(taus[j]);
            column += B_bottom * (current - previous);
            previous = current;
        }
        column *= -2 * PI;
        // 2 E3(t) = (1 - t) e^-t + t^2 E1(t)
        const double deck
            = PI * B_bottom
              * ((1 - tau_max) * std::exp(-tau_max)
                 + tau_max * tau_max * expn(1, tau_max));
        EXPECT_GT(deck, 1e-3 * column);
        EXPECT_NEAR(output.planet_spectrum[k] / (column + deck), 1.0, 1e-8);
    }
}

TEST(EclipseDepthCalculator, BrownDwarfBinsAreStellarWeightedFluxes) {
    EclipseDepthCalculator calculator(make_solver(1e-22));
    calculator.change_wavelength_bins(
        std::vector<WavelengthBin>{{1e-6, 3e-6}, {3e-6, 9e-6}});
    EclipseResult result = calculator.compute_depths(
        isothermal_profile(), hot_jupiter_params(), true, true);
    const EclipseFullOutput& output = *result.full_output;
    ASSERT_EQ(result.values.size(), 2u);
    EXPECT_EQ(result.values, output.binned_fluxes);

    double weighted = 0.0;
    double weights = 0.0;
    for (size_t k = 0; k < output.unbinned_wavelengths.size(); ++k) {
        if (output.unbinned_wavelengths[k] < 3e-6) continue;
        weighted += output.unbinned_fluxes[k] * output.stellar_spectrum[k];
        weights += output.stellar_spectrum[k];
    }
    EXPECT_NEAR(result.values[1] / (weighted / weights), 1.0, 1e-12);
    // planetary flux, not a depth
    EXPECT_GT(result.values[1], 1.0);
}
