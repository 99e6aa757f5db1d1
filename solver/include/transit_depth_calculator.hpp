#pragma once

#include <optional>
#include <vector>

#include "atmosphere_solver.hpp"
#include "model.hpp"
#include "tp_profile.hpp"

namespace exospec {

// Transmission spectrum: fraction of starlight blocked by the planet disk
// and by its atmosphere along each line of sight.
class TransitDepthCalculator {
   public:
    explicit TransitDepthCalculator(AtmosphereSolver atm);

    void change_wavelength_bins(
        const std::optional<std::vector<WavelengthBin>>& bins);

    TransitResult compute_depths(const Profile& t_p_profile,
                                 const AtmosphereParams& params,
                                 bool full_output = false);

   private:
    AtmosphereSolver atm_;
};

// Chord length through each shell for impact parameters at the shell
// midpoints; radii descend. Result is [impact parameter][shell].
LayerMatrix line_of_sight_lengths(const std::vector<double>& radii);

}  // namespace exospec
