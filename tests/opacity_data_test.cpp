#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "opacity_data.hpp"
#include "test_fixtures.hpp"

using namespace exospec;
using namespace exospec::test_support;

namespace {

// sigma = T * 1e-30 * (1 + index) * (P == 1 ? 1 : 100)
AbsorptionTable make_graded_table() {
    AbsorptionTable table;
    table.species = "CH4";
    table.wavelengths = {1e-6, 2e-6, 4e-6};
    table.temperatures = {500.0, 1500.0};
    table.pressures = {1.0, 1e4};
    for (double T : table.temperatures) {
        for (double P : table.pressures) {
            for (size_t i = 0; i < table.wavelengths.size(); ++i) {
                table.cross_sections.push_back(T * 1e-30 * (1.0 + i)
                                               * (P == 1.0 ? 1.0 : 100.0));
            }
        }
    }
    return table;
}

}  // namespace

TEST(OpacityDatabase, InterpolatesLinearInTemperatureAndLogPressure) {
    OpacityDatabase database(Method::Xsec);
    database.add_absorption_table(make_graded_table());
    EXPECT_NEAR(database.cross_section("CH4", 1000.0, 1.0, 0), 1e-27, 1e-40);
    // halfway in ln P between 1 and 1e4
    EXPECT_NEAR(database.cross_section("CH4", 500.0, 100.0, 1),
                500e-30 * 2 * 50.5, 1e-38);
    std::vector<double> row
        = database.cross_sections("CH4", 1500.0, 1e4, {0, 1, 2});
    ASSERT_EQ(row.size(), 3u);
    EXPECT_NEAR(row[2], 1500e-30 * 3 * 100, 1e-35);
}

TEST(OpacityDatabase, ClampsOutsideTheGrid) {
    OpacityDatabase database(Method::Xsec);
    database.add_absorption_table(make_graded_table());
    EXPECT_DOUBLE_EQ(database.cross_section("CH4", 100.0, 1e-3, 0),
                     database.cross_section("CH4", 500.0, 1.0, 0));
    EXPECT_DOUBLE_EQ(database.cross_section("CH4", 9000.0, 1e9, 2),
                     database.cross_section("CH4", 1500.0, 1e4, 2));
}

TEST(OpacityDatabase, UnknownSpecies) {
    OpacityDatabase database(Method::Xsec);
    database.add_absorption_table(make_graded_table());
    EXPECT_TRUE(database.has_species("CH4"));
    EXPECT_FALSE(database.has_species("NH3"));
    EXPECT_THROW(database.cross_section("NH3", 1000.0, 1.0, 0),
                 std::invalid_argument);
}

TEST(OpacityDatabase, RejectsMismatchedGrids) {
    OpacityDatabase database(Method::Xsec);
    database.add_absorption_table(make_graded_table());

    AbsorptionTable other_wavelengths = make_graded_table();
    other_wavelengths.species = "NH3";
    other_wavelengths.wavelengths = {1e-6, 2e-6, 5e-6};
    EXPECT_THROW(database.add_absorption_table(other_wavelengths),
                 std::invalid_argument);

    AbsorptionTable wrong_size = make_graded_table();
    wrong_size.species = "NH3";
    wrong_size.cross_sections.pop_back();
    EXPECT_THROW(database.add_absorption_table(wrong_size),
                 std::invalid_argument);

    AbsorptionTable unsorted = make_graded_table();
    unsorted.species = "NH3";
    unsorted.temperatures = {1500.0, 500.0};
    EXPECT_THROW(database.add_absorption_table(unsorted),
                 std::invalid_argument);
}

TEST(OpacityDatabase, KTablesGridMustBeMultipleOfNGauss) {
    OpacityDatabase database(Method::KTables, 2);
    EXPECT_THROW(database.add_absorption_table(make_graded_table()),
                 std::invalid_argument);
    EXPECT_THROW(OpacityDatabase(Method::KTables, 0), std::invalid_argument);
}

TEST(OpacityDatabase, LogWavelengthSpacing) {
    OpacityDatabase database(Method::Xsec);
    database.add_absorption_table(make_graded_table());
    EXPECT_NEAR(database.d_ln_lambda(), std::log(2.0), 1e-12);

    OpacityDatabase ktables = make_constant_opacity(1e-26, Method::KTables, 4);
    EXPECT_NEAR(ktables.d_ln_lambda(), std::log(10.0) / 11, 1e-12);
}

TEST(OpacityDatabase, CollisionCoefficientsInterpolateInTemperature) {
    OpacityDatabase database(Method::Xsec);
    database.add_absorption_table(make_graded_table());
    CollisionTable table;
    table.species_a = "H2";
    table.species_b = "He";
    table.wavelengths = {1e-6, 2e-6, 4e-6};
    table.temperatures = {1000.0, 2000.0};
    table.coefficients = {1.0, 2.0, 3.0, 3.0, 4.0, 5.0};
    database.add_collision_table(table);
    ASSERT_EQ(database.collision_tables().size(), 1u);
    std::vector<double> k = database.collision_coefficients(
        database.collision_tables()[0], 1250.0, {0, 2});
    EXPECT_DOUBLE_EQ(k[0], 1.5);
    EXPECT_DOUBLE_EQ(k[1], 3.5);
}

TEST(OpacityLoading, ReadsJsonTables) {
    OpacityDatabase database = load_opacity_database(
        {data_path("H2O_xsec.json"), data_path("CO_xsec.json")},
        {data_path("H2-H2_cia.json")}, Method::Xsec, 10);
    EXPECT_EQ(database.lambda_grid().size(), 8u);
    EXPECT_EQ(database.species(), (std::vector<std::string>{"CO", "H2O"}));
    EXPECT_NEAR(database.cross_section("H2O", 300.0, 1e-4, 0), 1e-26, 1e-36);
    EXPECT_NEAR(database.cross_section("H2O", 3000.0, 1e-4, 2), 2.4e-26,
                1e-36);
    ASSERT_EQ(database.collision_tables().size(), 1u);
    EXPECT_EQ(database.collision_tables()[0].species_a, "H2");
    EXPECT_NEAR(database.d_ln_lambda(), std::log(10.0) / 7, 1e-6);
}

TEST(OpacityLoading, RejectsWrongKind) {
    EXPECT_THROW(load_collision_table(data_path("H2O_xsec.json")),
                 std::invalid_argument);
    EXPECT_THROW(load_absorption_table(data_path("abundances.json")),
                 std::invalid_argument);
}
