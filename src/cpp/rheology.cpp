#include "rheology.hpp"

#include "constants.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

double
critical_temperature(double bottom_temperature, double delta_T,
                     double activation_energy)
{
  using namespace constants;

  double B = activation_energy/(2*GAS_CONSTANT*TC_FIT_C1);
  double C = TC_FIT_C2*delta_T;

  double radicand = 1 + 2/B*(bottom_temperature - C);
  if (radicand < 0) {
    throw physical_domain_error {
      "negative radicand (" + std::to_string(radicand) +
      ") when solving for the core temperature"};
  }

  double Tc = B*(std::sqrt(radicand) - 1);
  if (!std::isfinite(Tc)) {
    throw physical_domain_error {"core temperature isn't finite"};
  }
  return Tc;
}

double
viscosity(double reference_viscosity, double activation_energy,
          double bottom_temperature, double core_temperature)
{
  if (core_temperature <= 0) {
    throw physical_domain_error {
      "core temperature must be positive (got " +
      std::to_string(core_temperature) + " K)"};
  }

  double A = activation_energy/(constants::GAS_CONSTANT*bottom_temperature);
  double nu = reference_viscosity*
    std::exp(A*(bottom_temperature/core_temperature - 1));

  if (!std::isfinite(nu)) {
    throw physical_domain_error {"viscosity isn't finite"};
  }
  return nu;
}
