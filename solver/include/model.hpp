#pragma once

#include <complex>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace exospec {

class AtmosphereError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

enum class Method { Xsec, KTables };

enum class RunKind { Eclipse, Transit };

using WavelengthBin = std::pair<double, double>;

using LayerMatrix = std::vector<std::vector<double>>;

// Constant mixing ratio, or one value per profile layer.
using CustomAbundance = std::variant<double, std::vector<double>>;

struct MieParams {
    std::complex<double> ri;
    double frac_scale_height = 1.0;
    double number_density = 0.0;
    double part_size = 1e-6;
    double part_size_std = 0.5;
};

struct AtmosphereParams {
    double star_radius = 0.0;
    double planet_mass = 0.0;
    double planet_radius = 0.0;
    double T_star = 0.0;
    double logZ = 0.0;
    double CO_ratio = 0.53;
    bool add_gas_absorption = true;
    bool add_H_minus_absorption = false;
    bool add_scattering = true;
    double scattering_factor = 1.0;
    double scattering_slope = 4.0;
    double scattering_ref_wavelength = 1e-6;
    bool add_collisional_absorption = true;
    double cloudtop_pressure = std::numeric_limits<double>::infinity();
    std::optional<std::map<std::string, CustomAbundance>> custom_abundances;
    std::optional<double> T_spot;
    std::optional<double> spot_cov_frac;
    std::optional<MieParams> mie;
    double P_quench = 1e-99;
};

struct AtmosphereInfo {
    std::vector<double> P_profile;
    std::vector<double> T_profile;
    std::vector<double> mu_profile;
    std::vector<double> radii;
    std::vector<double> dr;
    std::map<std::string, std::vector<double>> abundances;
    // [layer][wavelength], m^-1
    LayerMatrix absorption_coeff_atm;
};

struct EclipseFullOutput {
    AtmosphereInfo atm_info;
    std::vector<double> stellar_spectrum;
    std::vector<double> planet_spectrum;
    std::vector<double> unbinned_wavelengths;
    std::vector<double> unbinned_eclipse_depths;
    std::vector<double> unbinned_fluxes;
    std::vector<double> binned_fluxes;
    // [wavelength][layer]
    LayerMatrix taus;
    LayerMatrix contrib;
};

struct TransitFullOutput {
    AtmosphereInfo atm_info;
    std::vector<double> stellar_spectrum;
    std::vector<double> unbinned_wavelengths;
    std::vector<double> unbinned_depths;
    // [wavelength][impact parameter]
    LayerMatrix tau_los;
};

struct DepthResult {
    std::vector<double> wavelengths;
    std::vector<double> values;
};

struct EclipseResult : DepthResult {
    std::optional<EclipseFullOutput> full_output;
};

struct TransitResult : DepthResult {
    std::optional<TransitFullOutput> full_output;
};

struct RunSummary {
    std::string run_id;
    RunKind kind = RunKind::Eclipse;
    std::string model_path;
    int64_t created_at = 0;
    size_t num_points = 0;
};

struct StoredRun {
    RunSummary summary;
    DepthResult binned;
    DepthResult unbinned;
};

}  // namespace exospec
