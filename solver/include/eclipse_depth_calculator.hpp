#pragma once

#include <optional>
#include <vector>

#include "atmosphere_solver.hpp"
#include "model.hpp"
#include "special_functions.hpp"
#include "tp_profile.hpp"

namespace exospec {

/**
 * Secondary-eclipse depths from the planet's thermal emission.
 *
 * The emergent flux of each wavelength is integrated through the layers
 * of the atmosphere with the E3 exponential integral, divided by the
 * stellar photon flux and scaled by the area of the tau = 1 photosphere.
 * In brown-dwarf mode the planetary fluxes are returned instead of depths.
 */
class EclipseDepthCalculator {
   public:
    explicit EclipseDepthCalculator(AtmosphereSolver atm);

    void change_wavelength_bins(
        const std::optional<std::vector<WavelengthBin>>& bins);

    EclipseResult compute_depths(const Profile& t_p_profile,
                                 const AtmosphereParams& params,
                                 bool is_brown_dwarf = false,
                                 bool full_output = false);

   private:
    std::vector<double> get_photosphere_radii(
        const LayerMatrix& taus, const std::vector<double>& radii) const;

    AtmosphereSolver atm_;
    Exp3Interpolator exp3_interpolator_;
};

}  // namespace exospec
