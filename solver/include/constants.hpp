#pragma once

#include <string>
#include <unordered_map>

namespace exospec {

constexpr double h = 6.62607015e-34;
constexpr double c = 2.99792458e8;
constexpr double k_B = 1.380649e-23;
constexpr double G = 6.67430e-11;
constexpr double AMU = 1.66053906660e-27;
constexpr double PI = 3.14159265358979323846;

constexpr double R_jup = 7.1492e7;
constexpr double M_jup = 1.8982e27;
constexpr double R_sun = 6.957e8;
constexpr double M_earth = 5.9722e24;
constexpr double R_earth = 6.371e6;
constexpr double AU = 1.495978707e11;
constexpr double BAR = 1e5;

// Pressure at which the planet radius is defined.
constexpr double REF_PRESSURE = 1e5;

// Molecular masses in AMU.
inline const std::unordered_map<std::string, double>& molecular_masses() {
    static const std::unordered_map<std::string, double> masses = {
        {"e-", 5.4858e-4}, {"H", 1.008},     {"H2", 2.016},    {"He", 4.0026},
        {"H2O", 18.015},  {"CO", 28.010},   {"CO2", 44.009},
        {"CH4", 16.043},  {"NH3", 17.031},  {"N2", 28.014},
        {"O2", 31.998},   {"O3", 47.997},   {"NO", 30.006},
        {"OH", 17.007},   {"HCN", 27.025},  {"C2H2", 26.038},
        {"H2S", 34.081},  {"Na", 22.990},   {"K", 39.098},
        {"TiO", 63.866},  {"VO", 66.940},   {"FeH", 56.853},
        {"SO2", 64.066},  {"SiO", 44.085},  {"PH3", 33.998},
        {"C2H4", 28.054}, {"C2H6", 30.070}, {"H2CO", 30.026},
        {"HCl", 36.461},  {"HF", 20.006},   {"NO2", 46.006},
        {"OCS", 60.075}};
    return masses;
}

// Static polarizabilities in m^3.
inline const std::unordered_map<std::string, double>& polarizabilities() {
    static const std::unordered_map<std::string, double> values = {
        {"H", 0.667e-30},   {"H2", 0.8059e-30}, {"He", 0.2080e-30},
        {"H2O", 1.45e-30},  {"CO", 1.95e-30},   {"CO2", 2.911e-30},
        {"CH4", 2.593e-30}, {"NH3", 2.26e-30},  {"N2", 1.74e-30},
        {"O2", 1.58e-30},   {"O3", 3.21e-30},   {"NO", 1.70e-30},
        {"HCN", 2.59e-30},  {"C2H2", 3.33e-30}, {"H2S", 3.78e-30},
        {"Na", 24.11e-30},  {"K", 43.4e-30},    {"SO2", 3.72e-30},
        {"PH3", 4.84e-30},  {"C2H4", 4.25e-30}, {"C2H6", 4.47e-30},
        {"H2CO", 2.77e-30}, {"HCl", 2.63e-30},  {"HF", 0.80e-30},
        {"NO2", 3.02e-30},  {"OCS", 5.09e-30}};
    return values;
}

}  // namespace exospec
