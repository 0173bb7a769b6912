#include "phase.hpp"

#include "errors.hpp"

#include <cctype>
#include <map>

std::string
to_string(ice_phase phase)
{
  switch (phase) {
  case ice_phase::water: return "water";
  case ice_phase::ice_I: return "Ih";
  case ice_phase::ice_II: return "II";
  case ice_phase::ice_III: return "III";
  case ice_phase::ice_V: return "V";
  case ice_phase::ice_VI: return "VI";
  case ice_phase::clathrate: return "clathrate";
  }
  throw unsupported_phase_error {"unknown phase tag"};
}

ice_phase
phase_from_string(std::string const & name)
{
  std::string s {name};
  std::transform(s.begin(), s.end(), s.begin(), [] (unsigned char c) {
    return std::tolower(c);
  });

  static std::map<std::string, ice_phase> const names = {
    {"water", ice_phase::water},
    {"i", ice_phase::ice_I},
    {"ih", ice_phase::ice_I},
    {"ii", ice_phase::ice_II},
    {"iii", ice_phase::ice_III},
    {"v", ice_phase::ice_V},
    {"vi", ice_phase::ice_VI},
    {"clath", ice_phase::clathrate},
    {"clathrate", ice_phase::clathrate}
  };

  auto it = names.find(s);
  if (it == names.end()) {
    throw unsupported_phase_error {"unknown phase \"" + name + "\""};
  }
  return it->second;
}

phase_params const &
get_phase_params(ice_phase phase)
{
  // Ice II and III use the mean of the low and high T activation
  // energies; ice VI uses the high T value
  static std::map<ice_phase, phase_params> const table = {
    {ice_phase::ice_I,
     ordinary_ice_params {ice_phase::ice_I, 60e3, 1e14, 632}},
    {ice_phase::ice_II,
     ordinary_ice_params {ice_phase::ice_II, 76.5e3, 1e18, 418}},
    {ice_phase::ice_III,
     ordinary_ice_params {ice_phase::ice_III, 127e3, 5e12, 242}},
    {ice_phase::ice_V,
     ordinary_ice_params {ice_phase::ice_V, 136e3, 5e14, 328}},
    {ice_phase::ice_VI,
     ordinary_ice_params {ice_phase::ice_VI, 110e3, 5e14, 183}},
    {ice_phase::clathrate, clathrate_params {}}
  };

  auto it = table.find(phase);
  if (it == table.end()) {
    throw unsupported_phase_error {
      "solid state convection isn't computed for phase " + to_string(phase)};
  }
  return it->second;
}

double
get_activation_energy(phase_params const & params)
{
  return boost::apply_visitor([] (auto const & p) {
    return p.activation_energy;
  }, params);
}

double
get_reference_viscosity(phase_params const & params)
{
  return boost::apply_visitor([] (auto const & p) {
    return p.reference_viscosity;
  }, params);
}

double
get_critical_rayleigh(phase_params const & params)
{
  return boost::apply_visitor([] (auto const & p) {
    return p.critical_rayleigh;
  }, params);
}
