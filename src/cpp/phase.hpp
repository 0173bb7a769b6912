#ifndef __PHASE_HPP__
#define __PHASE_HPP__

#include "common.hpp"

enum class ice_phase {
  water,
  ice_I,
  ice_II,
  ice_III,
  ice_V,
  ice_VI,
  clathrate
};

std::string to_string(ice_phase phase);

ice_phase phase_from_string(std::string const & name);

/**
 * Rheology and conduction constants of the ordinary (pure water) ice
 * polymorphs. Activation energies follow Deschamps and Sotin (2001)
 * for ice I and Durham et al. (1997) for the high pressure phases;
 * cond_coef is D in k = D/T (Andersson and Inaba, 2005).
 */
struct ordinary_ice_params {
  ice_phase phase;
  double activation_energy;   // [J mol^-1]
  double reference_viscosity; // viscosity at the melting point [Pa s]
  double cond_coef;           // [W m^-1]
  double critical_rayleigh {1e5};
};

/**
 * Methane clathrate (Durham et al., 2003; Kalousova and Sotin, 2020).
 */
struct clathrate_params {
  double activation_energy {90e3};
  double reference_viscosity {20*1e14}; // ~20 times that of ice I
  double activation_volume {19e-6};     // [m^3 mol^-1], unused by the model
  double thermal_conductivity {0.5};    // [W m^-1 K^-1], no T dependence
  double critical_rayleigh {2e7};
};

using phase_params = var_t<ordinary_ice_params, clathrate_params>;

/**
 * Look up the constants for a solid phase. Throws
 * unsupported_phase_error for liquid water.
 */
phase_params const & get_phase_params(ice_phase phase);

double get_activation_energy(phase_params const & params);

double get_reference_viscosity(phase_params const & params);

double get_critical_rayleigh(phase_params const & params);

#endif // __PHASE_HPP__
