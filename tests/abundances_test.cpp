#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "abundances.hpp"
#include "test_fixtures.hpp"

using namespace exospec;
using namespace exospec::test_support;

namespace {

// CH4 falls linearly from 0.01 at 500 K to 0 at 1500 K; H2 fills the rest.
AbundanceGrid make_methane_grid() {
    std::map<std::string, std::vector<double>> species;
    for (double T : {500.0, 1500.0}) {
        for (int p = 0; p < 2; ++p) {
            (void)p;
            double ch4 = 0.01 * (1500.0 - T) / 1000.0;
            species["CH4"].push_back(ch4);
            species["H2"].push_back(1.0 - ch4);
        }
    }
    return AbundanceGrid({0.0}, {0.5}, {500.0, 1500.0}, {1.0, 1e4},
                         std::move(species));
}

}  // namespace

TEST(AbundanceGrid, LoadsAndInterpolatesInMetallicity) {
    AbundanceGrid grid = load_abundance_grid(data_path("abundances.json"));
    ASSERT_FALSE(grid.empty());
    std::map<std::string, double> at = grid.abundances_at(0.0, 0.5, 1000, 1e3);
    EXPECT_NEAR(at["H2O"], 0.004, 1e-12);
    EXPECT_NEAR(at["He"], 0.145, 1e-12);
    EXPECT_NEAR(at["H2"] + at["He"] + at["H2O"] + at["CO"], 1.0, 1e-9);
}

TEST(AbundanceGrid, MetallicityOutsideGridIsAnError) {
    AbundanceGrid grid = load_abundance_grid(data_path("abundances.json"));
    EXPECT_THROW(grid.abundances_at(2.0, 0.5, 1000, 1e3), AtmosphereError);
    EXPECT_THROW(grid.abundances_at(0.0, 1.5, 1000, 1e3), AtmosphereError);
    // temperature and pressure clamp instead
    EXPECT_NO_THROW(grid.abundances_at(0.0, 0.5, 5000, 1e12));
}

TEST(AbundanceGrid, RejectsWrongSizes) {
    EXPECT_THROW(AbundanceGrid({0.0}, {0.5}, {500.0}, {1.0, 10.0},
                               {{"H2", {1.0}}}),
                 std::invalid_argument);
    EXPECT_THROW(AbundanceGrid({}, {0.5}, {500.0}, {1.0}, {{"H2", {1.0}}}),
                 std::invalid_argument);
}

TEST(ComputeAbundances, CustomAbundancesReplaceTheGrid) {
    AtmosphereParams params;
    params.custom_abundances = std::map<std::string, CustomAbundance>{
        {"H2", 0.9}, {"He", std::vector<double>{0.1, 0.05, 0.02}}};
    std::vector<double> P = {1.0, 10.0, 100.0};
    std::vector<double> T = {1000.0, 1000.0, 1000.0};
    auto abundances = compute_abundances(make_methane_grid(), params, P, T);
    EXPECT_EQ(abundances.size(), 2u);
    EXPECT_EQ(abundances["H2"], (std::vector<double>{0.9, 0.9, 0.9}));
    EXPECT_DOUBLE_EQ(abundances["He"][2], 0.02);
}

TEST(ComputeAbundances, CustomLayerCountMustMatch) {
    AtmosphereParams params;
    params.custom_abundances = std::map<std::string, CustomAbundance>{
        {"He", std::vector<double>{0.1, 0.05}}};
    EXPECT_THROW(compute_abundances(AbundanceGrid(), params, {1.0, 10.0, 100.0},
                                    {900.0, 900.0, 900.0}),
                 AtmosphereError);
}

TEST(ComputeAbundances, NeedsAGridWithoutCustomAbundances) {
    AtmosphereParams params;
    EXPECT_THROW(compute_abundances(AbundanceGrid(), params, {1.0, 10.0},
                                    {900.0, 900.0}),
                 AtmosphereError);
}

TEST(ComputeAbundances, QuenchFreezesUpperLayers) {
    AtmosphereParams params;
    params.logZ = 0.0;
    params.CO_ratio = 0.5;
    std::vector<double> P = {1.0, 10.0, 100.0, 1000.0};
    std::vector<double> T = {500.0, 800.0, 1100.0, 1400.0};

    auto equilibrium = compute_abundances(make_methane_grid(), params, P, T);
    EXPECT_NEAR(equilibrium["CH4"][0], 0.01, 1e-12);
    EXPECT_NEAR(equilibrium["CH4"][3], 0.001, 1e-12);

    params.P_quench = 100.0;
    auto quenched = compute_abundances(make_methane_grid(), params, P, T);
    EXPECT_NEAR(quenched["CH4"][0], 0.004, 1e-12);
    EXPECT_NEAR(quenched["CH4"][1], 0.004, 1e-12);
    EXPECT_NEAR(quenched["CH4"][2], 0.004, 1e-12);
    EXPECT_NEAR(quenched["CH4"][3], 0.001, 1e-12);
}

TEST(MeanMolecularWeight, WeightsMassesByMixingRatio) {
    std::map<std::string, std::vector<double>> abundances = {
        {"H2", {0.5, 1.0}}, {"He", {0.5, 0.0}}};
    std::vector<double> mu = mean_molecular_weight(abundances, 2);
    EXPECT_NEAR(mu[0], 0.5 * 2.016 + 0.5 * 4.0026, 1e-12);
    EXPECT_NEAR(mu[1], 2.016, 1e-12);
}

TEST(MeanMolecularWeight, RejectsUnknownSpeciesAndEmptyLayers) {
    EXPECT_THROW(mean_molecular_weight({{"Unobtainium", {1.0}}}, 1),
                 AtmosphereError);
    EXPECT_THROW(mean_molecular_weight({{"H2", {1.0, 0.0}}}, 2),
                 AtmosphereError);
}
