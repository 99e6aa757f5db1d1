#pragma once

#include <optional>
#include <vector>

#include "model.hpp"

namespace exospec {

struct BinnedSpectrum {
    std::vector<double> unbinned_wavelengths;
    std::vector<double> unbinned_values;
    std::vector<double> binned_wavelengths;
    std::vector<double> binned_values;
};

// For ktables, first collapses each group of n_gauss g-points with
// Gauss-Legendre weights. Without bins the binned arrays equal the
// unbinned ones. Within a bin values are averaged with stellar_spectrum
// as weights, or summed when sum_in_bins is set.
BinnedSpectrum bin_spectrum(const std::vector<double>& lambda_grid,
                            const std::vector<double>& values,
                            const std::vector<double>& stellar_spectrum,
                            Method method, int n_gauss,
                            const std::optional<std::vector<WavelengthBin>>& bins,
                            bool sum_in_bins = false);

}  // namespace exospec
