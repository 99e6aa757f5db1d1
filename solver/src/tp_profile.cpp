#include "tp_profile.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "constants.hpp"
#include "special_functions.hpp"

namespace exospec {

Profile::Profile(int num_profile_heights) {
    if (num_profile_heights < 2) {
        throw std::invalid_argument(
            "Profile needs at least 2 heights, got "
            + std::to_string(num_profile_heights));
    }
    pressures_ = logspace(-4, 8, num_profile_heights);
    temperatures_.assign(pressures_.size(), 0.0);
}

void Profile::set_isothermal(double T) {
    if (!(T > 0.0)) {
        throw std::invalid_argument("Isothermal temperature must be positive");
    }
    temperatures_.assign(pressures_.size(), T);
}

void Profile::set_from_arrays(const std::vector<double>& P,
                              const std::vector<double>& T) {
    if (P.size() != T.size()) {
        throw std::invalid_argument(
            "Pressure and temperature arrays differ in length");
    }
    if (P.size() < 2) {
        throw std::invalid_argument("Profile needs at least 2 points");
    }
    for (size_t i = 0; i < P.size(); ++i) {
        if (!(P[i] > 0.0) || !(T[i] > 0.0)) {
            throw std::invalid_argument(
                "Pressures and temperatures must be positive");
        }
        if (i > 0 && !(P[i] > P[i - 1])) {
            throw std::invalid_argument("Pressures must be strictly increasing");
        }
    }
    pressures_ = P;
    temperatures_ = T;
}

void Profile::set_parametric(double T0, double P1, double alpha1,
                             double alpha2, double P3, double T3) {
    if (!(alpha1 > 0.0) || !(alpha2 > 0.0)) {
        throw std::invalid_argument("alpha1 and alpha2 must be positive");
    }
    if (!(P1 > 0.0) || !(P3 > P1)) {
        throw std::invalid_argument("Parametric profile needs 0 < P1 < P3");
    }
    const double ln_P0 = std::log(pressures_.front());
    const double ln_P1 = std::log(P1);
    const double ln_P3 = std::log(P3);
    const double T1 = T0 + std::pow((ln_P1 - ln_P0) / alpha1, 2);
    const double ln_P2 = 0.5 * (ln_P3 + ln_P1)
                         - alpha2 * alpha2 * (T3 - T1) / (2 * (ln_P3 - ln_P1));
    const double T2 = T3 - std::pow((ln_P3 - ln_P2) / alpha2, 2);
    for (size_t i = 0; i < pressures_.size(); ++i) {
        const double ln_P = std::log(pressures_[i]);
        double T;
        if (pressures_[i] < P1) {
            T = T0 + std::pow((ln_P - ln_P0) / alpha1, 2);
        } else if (pressures_[i] < P3) {
            T = T2 + std::pow((ln_P - ln_P2) / alpha2, 2);
        } else {
            T = T3;
        }
        if (!(T > 0.0)) {
            throw std::invalid_argument(
                "Parametric profile has non-positive temperature at P="
                + std::to_string(pressures_[i]));
        }
        temperatures_[i] = T;
    }
}

void Profile::set_from_radiative_solution(double T_star, double R_star,
                                          double a, double M_p, double R_p,
                                          double beta, double log_k_th,
                                          double log_gamma,
                                          std::optional<double> log_gamma2,
                                          double alpha, double T_int) {
    if (!(R_p > 0.0) || !(M_p > 0.0) || !(a > 0.0)) {
        throw std::invalid_argument("Planet radius, mass and a must be positive");
    }
    const double k_th = std::pow(10.0, log_k_th);
    const double gamma = std::pow(10.0, log_gamma);
    const double g = G * M_p / (R_p * R_p);
    const double T_eq = beta * std::sqrt(R_star / (2 * a)) * T_star;
    const double T_eq4 = std::pow(T_eq, 4);

    auto incoming_stream_contribution = [&](double gamma_value, double tau) {
        return 3.0 / 4 * T_eq4
               * (2.0 / 3
                  + 2.0 / 3 / gamma_value
                        * (1 + (gamma_value * tau / 2 - 1)
                                   * std::exp(-gamma_value * tau))
                  + 2.0 * gamma_value / 3 * (1 - tau * tau / 2)
                        * expn(2, gamma_value * tau));
    };

    for (size_t i = 0; i < pressures_.size(); ++i) {
        const double tau = k_th * pressures_[i] / g;
        double T4 = 3.0 / 4 * std::pow(T_int, 4) * (2.0 / 3 + tau)
                    + (1 - alpha) * incoming_stream_contribution(gamma, tau);
        if (log_gamma2) {
            T4 += alpha * incoming_stream_contribution(
                              std::pow(10.0, *log_gamma2), tau);
        }
        if (!(T4 > 0.0)) {
            throw std::invalid_argument(
                "Radiative solution gives non-positive temperature");
        }
        temperatures_[i] = std::pow(T4, 0.25);
    }
}

}  // namespace exospec
