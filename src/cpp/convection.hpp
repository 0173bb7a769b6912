#ifndef __CONVECTION_HPP__
#define __CONVECTION_HPP__

#include "common.hpp"
#include "material.hpp"
#include "phase.hpp"

struct layer_thermal_state {
  double top_temperature;    // Ttop [K]
  double bottom_temperature; // Tm [K]
  double midpoint_pressure;  // [MPa]
  double thickness;          // h [m]
  double gravity;            // g [m s^-2]
};

enum class convection_regime {
  convecting,
  conducting, // Ra <= Ra_crit
  downgraded  // Ra > Ra_crit, but the conductive lid was thicker than h
};

std::string to_string(convection_regime regime);

enum class convection_mode {
  check,   // decide from the Rayleigh number
  force,   // skip the Rayleigh criterion and assume convection
  suppress // always conduct
};

convection_mode convection_mode_from_string(std::string const & name);

struct regime_result {
  double heat_flux;        // Q [W m^-2]
  double upper_tbl;        // conductive lid thickness eTBL [m]
  double lower_tbl;        // bottom boundary layer thickness deltaTBL [m]
  double core_temperature; // Tc [K]
  material_properties props;
  double viscosity;        // [Pa s]
  bool convecting;
  convection_regime regime;
  double rayleigh;
  double critical_rayleigh;
};

/**
 * Closed on the conducting side: Ra == Ra_crit doesn't convect.
 */
inline bool exceeds_critical_rayleigh(double Ra, double Ra_crit) {
  return Ra > Ra_crit;
}

/**
 * Conductive heat flux through the layer. For ordinary ices
 * k = D/T, which integrates to Q = D*log(Tm/Ttop)/h (Ojakangas and
 * Stevenson, 1989). Clathrate conductivity doesn't depend on T, so
 * Fourier's law Q = k*dT/h is used with the supplied k.
 */
double conduction_heat_flux(phase_params const & params,
                            layer_thermal_state const & state,
                            material_properties const & props);

/**
 * Decide whether a single ice or clathrate layer convects, following
 * Deschamps and Sotin (2001), and compute its heat flux and boundary
 * layer thicknesses.
 *
 * Throws unsupported_phase_error for water before touching the
 * provider, physical_domain_error for nonphysical input or
 * intermediates, and lets property_range_error from the provider
 * through unchanged.
 */
regime_result evaluate_convection(
  layer_thermal_state const & state,
  ice_phase phase,
  material_provider const & provider,
  convection_mode mode = convection_mode::check);

#endif // __CONVECTION_HPP__
