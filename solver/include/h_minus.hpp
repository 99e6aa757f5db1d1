#pragma once

namespace exospec {

// H- opacity from the John (1988) fits. Both return m^4 N^-1 per H atom per
// unit electron pressure; multiply by P_e * n_H for an absorption
// coefficient in m^-1. wavelength in m, T in K.
double h_minus_bound_free(double wavelength, double T);
double h_minus_free_free(double wavelength, double T);

}  // namespace exospec
