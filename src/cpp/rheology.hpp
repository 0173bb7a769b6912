#ifndef __RHEOLOGY_HPP__
#define __RHEOLOGY_HPP__

/**
 * Temperature at the top of the convecting core (the rheological
 * sublayer), Deschamps and Sotin (2001) eq. 18:
 *
 *   Tc = B*(sqrt(1 + 2/B*(Tm - C)) - 1),  B = E/(2*R*c1),  C = c2*dT
 *
 * Throws physical_domain_error if the radicand is negative or Tc
 * isn't finite.
 */
double critical_temperature(
  double bottom_temperature,  // Tm [K]
  double delta_T,             // Tm - Ttop [K]
  double activation_energy);  // E [J mol^-1]

/**
 * Arrhenius viscosity at the core temperature (DS2001 eq. 11):
 *
 *   nu = nu0*exp(E/(R*Tm)*(Tm/Tc - 1))
 *
 * Throws physical_domain_error if Tc <= 0 or the result isn't finite.
 */
double viscosity(
  double reference_viscosity, // nu0 [Pa s]
  double activation_energy,   // E [J mol^-1]
  double bottom_temperature,  // Tm [K]
  double core_temperature);   // Tc [K]

#endif // __RHEOLOGY_HPP__
