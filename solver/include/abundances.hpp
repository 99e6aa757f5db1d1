#pragma once

#include <map>
#include <string>
#include <vector>

#include "model.hpp"

namespace exospec {

// Equilibrium volume mixing ratios on (logZ, C/O, T, P).
class AbundanceGrid {
   public:
    AbundanceGrid() = default;
    // species values are flattened [logZ][CO][T][P]
    AbundanceGrid(std::vector<double> logZs, std::vector<double> CO_ratios,
                  std::vector<double> temperatures,
                  std::vector<double> pressures,
                  std::map<std::string, std::vector<double>> species);

    bool empty() const {
        return species_.empty();
    }
    std::map<std::string, double> abundances_at(double logZ, double CO_ratio,
                                                double T, double P) const;

   private:
    std::vector<double> logZs_;
    std::vector<double> CO_ratios_;
    std::vector<double> temperatures_;
    std::vector<double> pressures_;
    std::map<std::string, std::vector<double>> species_;
};

AbundanceGrid load_abundance_grid(const std::string& path);

// Per-species mixing ratio in every layer of (P, T).
std::map<std::string, std::vector<double>> compute_abundances(
    const AbundanceGrid& grid, const AtmosphereParams& params,
    const std::vector<double>& P, const std::vector<double>& T);

std::vector<double> mean_molecular_weight(
    const std::map<std::string, std::vector<double>>& abundances,
    size_t n_layers);

}  // namespace exospec
