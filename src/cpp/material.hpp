#ifndef __MATERIAL_HPP__
#define __MATERIAL_HPP__

#include "common.hpp"
#include "phase.hpp"

struct material_properties {
  double density;              // [kg m^-3]
  double thermal_expansion;    // [K^-1]
  double specific_heat;        // [J kg^-1 K^-1]
  double thermal_conductivity; // [W m^-1 K^-1]

  double thermal_diffusivity() const {
    return thermal_conductivity/(density*specific_heat);
  }
};

/**
 * Source of density, expansivity, heat capacity and conductivity for
 * a solid phase at a given pressure and temperature. Implementations
 * must be safe to call concurrently and throw property_range_error
 * outside of their range of validity.
 */
struct material_provider {
  virtual ~material_provider() = default;

  virtual material_properties evaluate(
    double pressure_MPa,
    double temperature_K,
    ice_phase phase) const = 0;
};

/**
 * Closed form correlations:
 *
 * - ordinary ices: specific volume of Choukroun and Grasset (2010),
 *   linear heat capacity, k = D/T (Andersson and Inaba, 2005)
 * - clathrate: Helgerud et al. (2009) density, Ning et al. (2015)
 *   expansivity and heat capacity, constant conductivity (Waite et
 *   al., 2005)
 */
struct ice_eos_provider: public material_provider {
  material_properties evaluate(
    double pressure_MPa,
    double temperature_K,
    ice_phase phase) const override;

private:
  material_properties evaluate_ordinary(
    double P, double T, ordinary_ice_params const & params) const;

  material_properties evaluate_clathrate(
    double P, double T, clathrate_params const & params) const;
};

/**
 * Whether fully occupied methane clathrate is stable at (P, T), using
 * the dissociation curves of Sloan (1998).
 */
bool clathrate_stable(double pressure_MPa, double temperature_K);

#endif // __MATERIAL_HPP__
