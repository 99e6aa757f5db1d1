#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "abundances.hpp"
#include "mie_scattering.hpp"
#include "model.hpp"
#include "opacity_data.hpp"

namespace exospec {

class AtmosphereSolver {
   public:
    AtmosphereSolver(OpacityDatabase opacity, AbundanceGrid condensation_grid,
                     AbundanceGrid no_condensation_grid,
                     bool include_condensation = true);

    // Restricts the active wavelength grid to the union of [start, end)
    // bins; std::nullopt restores the full grid.
    void change_wavelength_bins(
        const std::optional<std::vector<WavelengthBin>>& bins);

    AtmosphereInfo compute_params(const AtmosphereParams& params,
                                  const std::vector<double>& P_profile,
                                  const std::vector<double>& T_profile);

    std::vector<double> get_stellar_spectrum(
        const AtmosphereParams& params) const;

    const std::vector<double>& lambda_grid() const {
        return lambda_grid_;
    }
    const std::optional<std::vector<WavelengthBin>>& wavelength_bins() const {
        return wavelength_bins_;
    }
    Method method() const {
        return opacity_.method();
    }
    int n_gauss() const {
        return opacity_.n_gauss();
    }
    double d_ln_lambda() const {
        return d_ln_lambda_;
    }

   private:
    void validate_params(const AtmosphereParams& params,
                         const std::vector<double>& P_profile,
                         const std::vector<double>& T_profile) const;
    std::vector<double> compute_radii(const AtmosphereParams& params,
                                      const std::vector<double>& P,
                                      const std::vector<double>& T,
                                      const std::vector<double>& mu) const;
    LayerMatrix compute_absorption(
        const AtmosphereParams& params, const std::vector<double>& P,
        const std::vector<double>& T,
        const std::map<std::string, std::vector<double>>& abundances);
    std::vector<double> mie_cross_sections(const MieParams& mie);
    std::vector<double> group_wavelengths() const;

    OpacityDatabase opacity_;
    AbundanceGrid condensation_grid_;
    AbundanceGrid no_condensation_grid_;
    bool include_condensation_;
    double d_ln_lambda_;
    std::vector<size_t> active_indices_;
    std::vector<double> lambda_grid_;
    std::optional<std::vector<WavelengthBin>> wavelength_bins_;
    std::map<std::pair<double, double>, MieCache> mie_caches_;
};

}  // namespace exospec
