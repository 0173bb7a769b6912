#include "convection.hpp"

#include "constants.hpp"
#include "errors.hpp"
#include "rheology.hpp"

#include <sstream>

namespace {

void check_finite(double value, char const * name) {
  if (!std::isfinite(value)) {
    throw physical_domain_error {std::string(name) + " isn't finite"};
  }
}

void validate(layer_thermal_state const & state) {
  std::ostringstream ss;
  if (!(state.top_temperature > 0)) {
    ss << "top temperature must be positive (got "
       << state.top_temperature << " K)";
  } else if (!(state.bottom_temperature > state.top_temperature)) {
    ss << "bottom temperature (" << state.bottom_temperature
       << " K) must exceed top temperature (" << state.top_temperature
       << " K)";
  } else if (!(state.thickness > 0)) {
    ss << "layer thickness must be positive (got "
       << state.thickness << " m)";
  } else if (!(state.gravity > 0)) {
    ss << "gravity must be positive (got " << state.gravity << " m/s^2)";
  } else {
    return;
  }
  throw physical_domain_error {ss.str()};
}

// Resets a result to the conductive solution. Tc takes the value dT,
// as in the conductive lid models this is fed to.
void make_conductive(regime_result & result, convection_regime regime,
                     phase_params const & params,
                     layer_thermal_state const & state) {
  result.convecting = false;
  result.regime = regime;
  result.core_temperature = state.bottom_temperature - state.top_temperature;
  result.lower_tbl = 0;
  result.upper_tbl = 0;
  result.heat_flux = conduction_heat_flux(params, state, result.props);
}

}

std::string
to_string(convection_regime regime)
{
  switch (regime) {
  case convection_regime::convecting: return "convecting";
  case convection_regime::conducting: return "conducting";
  case convection_regime::downgraded: return "downgraded";
  }
  throw std::invalid_argument {"unknown convection regime"};
}

convection_mode
convection_mode_from_string(std::string const & name)
{
  if (name == "check") {
    return convection_mode::check;
  } else if (name == "force") {
    return convection_mode::force;
  } else if (name == "suppress") {
    return convection_mode::suppress;
  }
  throw std::invalid_argument {
    "convection mode must be one of check, force or suppress (got \"" +
    name + "\")"};
}

double
conduction_heat_flux(phase_params const & params,
                     layer_thermal_state const & state,
                     material_properties const & props)
{
  double Tm = state.bottom_temperature, Ttop = state.top_temperature;
  double h = state.thickness;
  if (auto p = boost::get<ordinary_ice_params>(&params)) {
    return p->cond_coef*std::log(Tm/Ttop)/h;
  } else {
    return props.thermal_conductivity*(Tm - Ttop)/h;
  }
}

regime_result
evaluate_convection(layer_thermal_state const & state, ice_phase phase,
                    material_provider const & provider, convection_mode mode)
{
  // Rejects water before anything is evaluated
  auto const & params = get_phase_params(phase);

  validate(state);

  double Ttop = state.top_temperature, Tm = state.bottom_temperature;
  double dT = Tm - Ttop, h = state.thickness, g = state.gravity;

  double E = get_activation_energy(params);

  double Tc = critical_temperature(Tm, dT, E);
  double nu = viscosity(get_reference_viscosity(params), E, Tm, Tc);

  regime_result result;
  result.props = provider.evaluate(state.midpoint_pressure, Tc, phase);
  result.viscosity = nu;
  result.core_temperature = Tc;

  double rho = result.props.density;
  double alpha = result.props.thermal_expansion;
  double k = result.props.thermal_conductivity;
  double kappa = result.props.thermal_diffusivity();
  check_finite(kappa, "thermal diffusivity");

  // DS2001 eq. 4
  double Ra = alpha*rho*g*dT*h*h*h/(kappa*nu);
  check_finite(Ra, "Rayleigh number");

  result.rayleigh = Ra;
  result.critical_rayleigh = get_critical_rayleigh(params);

  bool convect = mode == convection_mode::force ||
    (mode == convection_mode::check &&
     exceeds_critical_rayleigh(Ra, result.critical_rayleigh));
  if (!convect) {
    make_conductive(result, convection_regime::conducting, params, state);
    return result;
  }

  if (!(Tm > Tc)) {
    std::ostringstream ss;
    ss << "core temperature (" << Tc << " K) isn't below the bottom "
       << "temperature (" << Tm << " K)";
    throw physical_domain_error {ss.str()};
  }

  // A small dT puts Tc below Ttop, which would give a negative lid
  if (!(Tc > Ttop)) {
    std::ostringstream ss;
    ss << "core temperature (" << Tc << " K) isn't above the top "
       << "temperature (" << Ttop << " K)";
    throw physical_domain_error {ss.str()};
  }

  // DS2001 eqs. 8, 19, 20 and 21
  double Ra_del = constants::RA_DEL_PREFACTOR*
    std::pow(Ra, constants::RA_DEL_EXPONENT);
  double delta_tbl = std::cbrt(nu*kappa/(alpha*rho*g*(Tm - Tc))*Ra_del);
  check_finite(delta_tbl, "bottom boundary layer thickness");

  double Q = k*(Tm - Tc)/delta_tbl;
  double e_tbl = k*(Tc - Ttop)/Q;

  result.convecting = true;
  result.regime = convection_regime::convecting;
  result.lower_tbl = delta_tbl;
  result.upper_tbl = e_tbl;
  result.heat_flux = Q;

  // The conductive lid can't be thicker than the whole layer
  if (e_tbl > h) {
    make_conductive(result, convection_regime::downgraded, params, state);
  }

  return result;
}
