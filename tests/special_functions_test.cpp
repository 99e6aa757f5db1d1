#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "special_functions.hpp"

using namespace exospec;

TEST(ExponentialIntegral, MatchesTabulatedValues) {
    EXPECT_NEAR(expn(1, 1.0), 0.219383934395520, 1e-12);
    EXPECT_NEAR(expn(2, 1.0), 0.148495506775922, 1e-12);
    EXPECT_NEAR(expn(3, 1.0), 0.109691966197760, 1e-12);
    EXPECT_NEAR(expn(1, 5.0), 0.001148295591275, 1e-12);
    EXPECT_NEAR(expn(2, 0.5), 0.326643862324516, 1e-10);
    EXPECT_NEAR(expn(4, 2.0), 0.025022841213658, 1e-10);
    EXPECT_NEAR(expn(2, 0.01), 0.949670537983787, 1e-10);
    EXPECT_NEAR(expn(3, 10.0) / 3.548762553083865e-06, 1.0, 1e-7);
}

TEST(ExponentialIntegral, ValueAtZero) {
    EXPECT_DOUBLE_EQ(expn(2, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(expn(3, 0.0), 0.5);
    EXPECT_DOUBLE_EQ(expn(0, 2.0), std::exp(-2.0) / 2.0);
}

TEST(ExponentialIntegral, RejectsBadArguments) {
    EXPECT_THROW(expn(1, 0.0), std::domain_error);
    EXPECT_THROW(expn(-1, 1.0), std::domain_error);
    EXPECT_THROW(expn(2, -0.5), std::domain_error);
}

TEST(GaussLegendre, TwoPointRule) {
    auto [points, weights] = roots_legendre(2);
    ASSERT_EQ(points.size(), 2u);
    EXPECT_NEAR(points[0], -1.0 / std::sqrt(3.0), 1e-14);
    EXPECT_NEAR(points[1], 1.0 / std::sqrt(3.0), 1e-14);
    EXPECT_NEAR(weights[0], 1.0, 1e-14);
    EXPECT_NEAR(weights[1], 1.0, 1e-14);
}

TEST(GaussLegendre, IntegratesPolynomialsExactly) {
    auto [points, weights] = roots_legendre(10);
    double weight_sum = 0.0;
    double x8 = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        weight_sum += weights[i];
        x8 += weights[i] * std::pow(points[i], 8);
        if (i > 0) EXPECT_LT(points[i - 1], points[i]);
    }
    EXPECT_NEAR(weight_sum, 2.0, 1e-13);
    EXPECT_NEAR(x8, 2.0 / 9.0, 1e-13);
}

TEST(Interp, LinearAndClamped) {
    std::vector<double> xp = {0.0, 1.0, 3.0};
    std::vector<double> fp = {10.0, 20.0, 40.0};
    EXPECT_DOUBLE_EQ(interp(0.5, xp, fp), 15.0);
    EXPECT_DOUBLE_EQ(interp(2.0, xp, fp), 30.0);
    EXPECT_DOUBLE_EQ(interp(-1.0, xp, fp), 10.0);
    EXPECT_DOUBLE_EQ(interp(7.0, xp, fp), 40.0);
    EXPECT_THROW(interp(1.0, xp, {1.0}), std::invalid_argument);
}

TEST(Statistics, MeanAndMedian) {
    EXPECT_DOUBLE_EQ(mean({1.0, 2.0, 6.0}), 3.0);
    EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
    EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
    EXPECT_TRUE(std::isnan(mean({})));
}

TEST(Logspace, EndpointsAndCount) {
    std::vector<double> grid = logspace(-6, 3, 1000);
    ASSERT_EQ(grid.size(), 1000u);
    EXPECT_NEAR(grid.front(), 1e-6, 1e-20);
    EXPECT_NEAR(grid.back() / 1e3, 1.0, 1e-12);
}

TEST(Exp3Interpolator, TracksExpnInsideTable) {
    Exp3Interpolator exp3;
    for (double tau : {1e-4, 0.01, 0.3, 1.0}) {
        EXPECT_NEAR(exp3(tau), expn(3, tau), 5e-4 * expn(3, tau))
            << "tau=" << tau;
    }
    EXPECT_NEAR(exp3(4.0), expn(3, 4.0), 3e-3 * expn(3, 4.0));
}

TEST(Exp3Interpolator, OutsideTable) {
    Exp3Interpolator exp3;
    EXPECT_DOUBLE_EQ(exp3(0.0), 0.5);
    EXPECT_DOUBLE_EQ(exp3(1e-9), 0.5);
    EXPECT_DOUBLE_EQ(exp3(5000.0), 0.0);
}
