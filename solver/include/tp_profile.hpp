#pragma once

#include <optional>
#include <vector>

namespace exospec {

// Temperature-pressure profile. Pressures are ascending, in Pa.
class Profile {
   public:
    explicit Profile(int num_profile_heights = 500);

    void set_isothermal(double T);
    void set_from_arrays(const std::vector<double>& P,
                         const std::vector<double>& T);
    // Madhusudhan & Seager (2009) three-layer profile.
    void set_parametric(double T0, double P1, double alpha1, double alpha2,
                        double P3, double T3);
    // Guillot (2010) two-stream solution with the Line et al. (2013)
    // second visible channel.
    void set_from_radiative_solution(double T_star, double R_star, double a,
                                     double M_p, double R_p, double beta,
                                     double log_k_th, double log_gamma,
                                     std::optional<double> log_gamma2
                                     = std::nullopt,
                                     double alpha = 0.0, double T_int = 100.0);

    const std::vector<double>& pressures() const {
        return pressures_;
    }
    const std::vector<double>& temperatures() const {
        return temperatures_;
    }

   private:
    std::vector<double> pressures_;
    std::vector<double> temperatures_;
};

}  // namespace exospec
