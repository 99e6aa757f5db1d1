#include "binning.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include "special_functions.hpp"

namespace exospec {

BinnedSpectrum bin_spectrum(const std::vector<double>& lambda_grid,
                            const std::vector<double>& values,
                            const std::vector<double>& stellar_spectrum,
                            Method method, int n_gauss,
                            const std::optional<std::vector<WavelengthBin>>& bins,
                            bool sum_in_bins) {
    if (values.size() != lambda_grid.size()
        || stellar_spectrum.size() != lambda_grid.size()) {
        throw std::invalid_argument(
            "bin_spectrum: wavelength, value and stellar arrays differ in size");
    }
    BinnedSpectrum result;
    std::vector<double> intermediate_stellar;
    if (method == Method::KTables) {
        if (values.size() % static_cast<size_t>(n_gauss) != 0) {
            throw std::invalid_argument("bin_spectrum: "
                                        + std::to_string(values.size())
                                        + " points is not a multiple of n_gauss");
        }
        auto [points, weights] = roots_legendre(n_gauss);
        (void)points;
        for (double& weight : weights) weight /= 2;
        const size_t num_binned = values.size() / n_gauss;
        for (size_t chunk = 0; chunk < num_binned; ++chunk) {
            const size_t start = chunk * n_gauss;
            const size_t end = start + n_gauss;
            double weighted_sum = 0.0;
            for (size_t i = start; i < end; ++i) {
                weighted_sum += values[i] * weights[i - start];
            }
            result.unbinned_wavelengths.push_back(
                median(std::vector<double>(lambda_grid.begin() + start,
                                           lambda_grid.begin() + end)));
            result.unbinned_values.push_back(weighted_sum);
            intermediate_stellar.push_back(
                median(std::vector<double>(stellar_spectrum.begin() + start,
                                           stellar_spectrum.begin() + end)));
        }
    } else {
        result.unbinned_wavelengths = lambda_grid;
        result.unbinned_values = values;
        intermediate_stellar = stellar_spectrum;
    }

    if (!bins) {
        result.binned_wavelengths = result.unbinned_wavelengths;
        result.binned_values = result.unbinned_values;
        return result;
    }

    for (const auto& [start, end] : *bins) {
        std::vector<double> in_bin;
        double weighted_sum = 0.0;
        double weight_total = 0.0;
        double plain_sum = 0.0;
        for (size_t i = 0; i < result.unbinned_wavelengths.size(); ++i) {
            const double wavelength = result.unbinned_wavelengths[i];
            if (wavelength < start || wavelength >= end) continue;
            in_bin.push_back(wavelength);
            weighted_sum += result.unbinned_values[i] * intermediate_stellar[i];
            weight_total += intermediate_stellar[i];
            plain_sum += result.unbinned_values[i];
        }
        result.binned_wavelengths.push_back(mean(in_bin));
        if (sum_in_bins) {
            result.binned_values.push_back(plain_sum);
        } else if (weight_total > 0.0) {
            result.binned_values.push_back(weighted_sum / weight_total);
        } else {
            result.binned_values.push_back(
                std::numeric_limits<double>::quiet_NaN());
        }
    }
    return result;
}

}  // namespace exospec
