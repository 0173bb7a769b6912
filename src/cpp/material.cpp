#include "material.hpp"

#include "constants.hpp"
#include "errors.hpp"

#include <map>
#include <sstream>

namespace {

/**
 * Coefficients of the Choukroun and Grasset (2010) specific volume
 * model and of the linear heat capacity fit, Cp = c0 + c1*T.
 */
struct volume_coefs {
  double T_ref;  // [K]
  double V0;     // [dm^3 kg^-1]
  double a0, a1;
  double b0, b1, b2;
  double c0, c1;
};

volume_coefs const & get_volume_coefs(ice_phase phase) {
  static std::map<ice_phase, volume_coefs> const coefs = {
    {ice_phase::ice_I,
     {273.16, 1.086, 0.019, 0.0075, 0.974, 0.0302, 0.00395, 74.11, 7.56}},
    {ice_phase::ice_II,
     {238.45, 0.8425, 0.060, 0.0070, 0.976, 0.0425, 0.0022, 2200, 0}},
    {ice_phase::ice_III,
     {256.43, 0.855, 0.0375, 0.0203, 0.951, 0.097, 0.00200, 820, 7}},
    {ice_phase::ice_V,
     {273.31, 0.783, 0.005, 0.0100, 0.977, 0.1200, 0.0016, 700, 7.56}},
    {ice_phase::ice_VI,
     {356.15, 0.743, 0.024, 0.002, 0.969, 0.05, 0.00102, 940, 5.5}}
  };
  return coefs.at(phase);
}

void check_range(double P, double T, double P_min, double P_max,
                 double T_min, double T_max, ice_phase phase) {
  if (P < P_min || P > P_max || T < T_min || T > T_max) {
    std::ostringstream ss;
    ss << "(P, T) = (" << P << " MPa, " << T << " K) is outside of the "
       << "valid range for phase " << to_string(phase) << " ("
       << P_min << " to " << P_max << " MPa, "
       << T_min << " to " << T_max << " K)";
    throw property_range_error {ss.str()};
  }
}

}

material_properties
ice_eos_provider::evaluate(double pressure_MPa, double temperature_K,
                           ice_phase phase) const
{
  auto const & params = get_phase_params(phase);
  if (auto p = boost::get<ordinary_ice_params>(&params)) {
    return evaluate_ordinary(pressure_MPa, temperature_K, *p);
  } else {
    return evaluate_clathrate(
      pressure_MPa, temperature_K, *boost::get<clathrate_params>(&params));
  }
}

material_properties
ice_eos_provider::evaluate_ordinary(double P, double T,
                                    ordinary_ice_params const & params) const
{
  check_range(P, T, 0, 2500, 50, 400, params.phase);

  auto const & c = get_volume_coefs(params.phase);

  double th = std::tanh(c.a1*(T - c.T_ref));
  double eps_T = 1 + c.a0*th;
  double eps_P = c.b0 + c.b1*(1 - std::tanh(c.b2*P));
  double V = c.V0*eps_T*eps_P;

  material_properties props;
  props.density = 1e3/V;
  // (1/V)*dV/dT, with sech^2 = 1 - tanh^2
  props.thermal_expansion = c.a0*c.a1*(1 - th*th)/eps_T;
  props.specific_heat = c.c0 + c.c1*T;
  props.thermal_conductivity = params.cond_coef/T;
  return props;
}

material_properties
ice_eos_provider::evaluate_clathrate(double P, double T,
                                     clathrate_params const & params) const
{
  check_range(P, T, 0, 200, 5, 292, ice_phase::clathrate);

  double T_C = T - constants::ZERO_CELSIUS_K;

  material_properties props;
  props.density = (-2.3815e-4*T_C + 1.1843e-4*P + 0.92435)*1e3;
  props.thermal_expansion = (3.5697e-4*T + 0.2558)/
    (3.5697e-4*T*T + 0.2558*T + 1612.8597);
  props.specific_heat = arma::as_scalar(
    arma::polyval(arma::vec {3.19, 2150.}, arma::vec {T}));
  props.thermal_conductivity = params.thermal_conductivity;
  return props;
}

bool
clathrate_stable(double pressure_MPa, double temperature_K)
{
  double P = pressure_MPa, T_dissoc;
  if (P < 2.567) {
    T_dissoc = 212.33820985 + 43.37319252*P - 7.83348412*P*P;
  } else {
    T_dissoc = -20.3058036 + 8.09637199*std::log(P/4.56717945e-16);
  }
  return temperature_K < T_dissoc;
}
