#pragma once

#include <utility>
#include <vector>

namespace exospec {

// Generalized exponential integral E_n(x), n >= 0, x >= 0.
double expn(int n, double x);

// Gauss-Legendre nodes and weights on [-1, 1].
std::pair<std::vector<double>, std::vector<double>> roots_legendre(int n);

// Piecewise-linear interpolation; clamps to the end values outside xp.
double interp(double x, const std::vector<double>& xp,
              const std::vector<double>& fp);

double mean(const std::vector<double>& values);
double median(std::vector<double> values);

std::vector<double> logspace(double start_exp, double stop_exp, int num);

class Exp3Interpolator {
   public:
    Exp3Interpolator();
    double operator()(double tau) const;

   private:
    std::vector<double> tau_cache_;
    std::vector<double> exp3_cache_;
};

}  // namespace exospec
