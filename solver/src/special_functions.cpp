#include "special_functions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

#include "constants.hpp"

namespace exospec {

namespace {
constexpr double EULER = 0.5772156649015329;
constexpr int MAX_ITERATIONS = 200;
constexpr double EPSILON = std::numeric_limits<double>::epsilon();
constexpr double FPMIN = std::numeric_limits<double>::min() / EPSILON;
}  // namespace

double expn(int n, double x) {
    if (n < 0 || x < 0.0 || (x == 0.0 && (n == 0 || n == 1))) {
        throw std::domain_error("expn: bad arguments n=" + std::to_string(n)
                                + " x=" + std::to_string(x));
    }
    if (n == 0) return std::exp(-x) / x;
    if (x == 0.0) return 1.0 / (n - 1);
    const int nm1 = n - 1;
    if (x > 1.0) {
        // modified Lentz continued fraction
        double b = x + n;
        double c = 1.0 / FPMIN;
        double d = 1.0 / b;
        double h = d;
        for (int i = 1; i <= MAX_ITERATIONS; ++i) {
            double a = -static_cast<double>(i) * (nm1 + i);
            b += 2.0;
            d = 1.0 / (a * d + b);
            c = b + a / c;
            double del = c * d;
            h *= del;
            if (std::fabs(del - 1.0) <= EPSILON) return h * std::exp(-x);
        }
        return h * std::exp(-x);
    }
    double ans = nm1 != 0 ? 1.0 / nm1 : -std::log(x) - EULER;
    double fact = 1.0;
    for (int i = 1; i <= MAX_ITERATIONS; ++i) {
        fact *= -x / i;
        double del;
        if (i != nm1) {
            del = -fact / (i - nm1);
        } else {
            double psi = -EULER;
            for (int ii = 1; ii <= nm1; ++ii) psi += 1.0 / ii;
            del = fact * (-std::log(x) + psi);
        }
        ans += del;
        if (std::fabs(del) < std::fabs(ans) * EPSILON) return ans;
    }
    return ans;
}

std::pair<std::vector<double>, std::vector<double>> roots_legendre(int n) {
    if (n < 1) {
        throw std::invalid_argument("roots_legendre: n must be positive");
    }
    std::vector<double> points(n);
    std::vector<double> weights(n);
    const int m = (n + 1) / 2;
    for (int i = 0; i < m; ++i) {
        double z = std::cos(PI * (i + 0.75) / (n + 0.5));
        double pp = 0.0;
        for (int iteration = 0; iteration < 100; ++iteration) {
            double p1 = 1.0;
            double p2 = 0.0;
            for (int j = 1; j <= n; ++j) {
                double p3 = p2;
                p2 = p1;
                p1 = ((2.0 * j - 1.0) * z * p2 - (j - 1.0) * p3) / j;
            }
            pp = n * (z * p1 - p2) / (z * z - 1.0);
            double z1 = z;
            z = z1 - p1 / pp;
            if (std::fabs(z - z1) < 1e-15) break;
        }
        points[i] = -z;
        points[n - 1 - i] = z;
        weights[i] = 2.0 / ((1.0 - z * z) * pp * pp);
        weights[n - 1 - i] = weights[i];
    }
    return {points, weights};
}

double interp(double x, const std::vector<double>& xp,
              const std::vector<double>& fp) {
    if (xp.empty() || xp.size() != fp.size()) {
        throw std::invalid_argument("interp: xp and fp must be same size");
    }
    if (x <= xp.front()) return fp.front();
    if (x >= xp.back()) return fp.back();
    auto upper = std::upper_bound(xp.begin(), xp.end(), x);
    size_t hi = static_cast<size_t>(upper - xp.begin());
    size_t lo = hi - 1;
    double span = xp[hi] - xp[lo];
    if (span <= 0.0) return fp[hi];
    double weight = (x - xp[lo]) / span;
    return fp[lo] + weight * (fp[hi] - fp[lo]);
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double median(std::vector<double> values) {
    if (values.empty()) return std::numeric_limits<double>::quiet_NaN();
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) return values[mid];
    return 0.5 * (values[mid - 1] + values[mid]);
}

std::vector<double> logspace(double start_exp, double stop_exp, int num) {
    std::vector<double> result(num);
    if (num == 1) {
        result[0] = std::pow(10.0, start_exp);
        return result;
    }
    double step = (stop_exp - start_exp) / (num - 1);
    for (int i = 0; i < num; ++i) {
        result[i] = std::pow(10.0, start_exp + i * step);
    }
    return result;
}

Exp3Interpolator::Exp3Interpolator() : tau_cache_(logspace(-6, 3, 1000)) {
    exp3_cache_.reserve(tau_cache_.size());
    for (double tau : tau_cache_) exp3_cache_.push_back(expn(3, tau));
}

double Exp3Interpolator::operator()(double tau) const {
    if (tau < tau_cache_.front()) return 0.5;
    if (tau > tau_cache_.back()) return 0.0;
    return interp(tau, tau_cache_, exp3_cache_);
}

}  // namespace exospec
