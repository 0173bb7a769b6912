#include <gtest/gtest.h>

#include "errors.hpp"
#include "phase.hpp"

TEST(PhaseTest, NamesRoundTrip) {
  for (auto phase: {ice_phase::water, ice_phase::ice_I, ice_phase::ice_II,
                    ice_phase::ice_III, ice_phase::ice_V, ice_phase::ice_VI,
                    ice_phase::clathrate}) {
    EXPECT_EQ(phase_from_string(to_string(phase)), phase);
  }
}

TEST(PhaseTest, NamesAreCaseInsensitive) {
  EXPECT_EQ(phase_from_string("ih"), ice_phase::ice_I);
  EXPECT_EQ(phase_from_string("I"), ice_phase::ice_I);
  EXPECT_EQ(phase_from_string("Clath"), ice_phase::clathrate);
  EXPECT_EQ(phase_from_string("vi"), ice_phase::ice_VI);
}

TEST(PhaseTest, UnknownNameThrows) {
  EXPECT_THROW(phase_from_string("IV"), unsupported_phase_error);
  EXPECT_THROW(phase_from_string(""), unsupported_phase_error);
}

TEST(PhaseTest, WaterHasNoParameters) {
  EXPECT_THROW(get_phase_params(ice_phase::water), unsupported_phase_error);
}

TEST(PhaseTest, OrdinaryIceTable) {
  auto const & params = get_phase_params(ice_phase::ice_I);
  auto p = boost::get<ordinary_ice_params>(&params);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->phase, ice_phase::ice_I);
  EXPECT_DOUBLE_EQ(p->activation_energy, 60e3);
  EXPECT_DOUBLE_EQ(p->reference_viscosity, 1e14);
  EXPECT_DOUBLE_EQ(p->cond_coef, 632);
  EXPECT_DOUBLE_EQ(get_critical_rayleigh(params), 1e5);

  for (auto phase: {ice_phase::ice_II, ice_phase::ice_III,
                    ice_phase::ice_V, ice_phase::ice_VI}) {
    auto const & other = get_phase_params(phase);
    auto q = boost::get<ordinary_ice_params>(&other);
    ASSERT_NE(q, nullptr);
    EXPECT_EQ(q->phase, phase);
    EXPECT_DOUBLE_EQ(get_critical_rayleigh(other), 1e5);
  }

  EXPECT_DOUBLE_EQ(
    get_activation_energy(get_phase_params(ice_phase::ice_V)), 136e3);
  EXPECT_DOUBLE_EQ(
    get_reference_viscosity(get_phase_params(ice_phase::ice_II)), 1e18);
}

TEST(PhaseTest, ClathrateTable) {
  auto const & params = get_phase_params(ice_phase::clathrate);
  auto p = boost::get<clathrate_params>(&params);
  ASSERT_NE(p, nullptr);
  EXPECT_DOUBLE_EQ(get_activation_energy(params), 90e3);
  EXPECT_DOUBLE_EQ(get_reference_viscosity(params), 2e15);
  EXPECT_DOUBLE_EQ(get_critical_rayleigh(params), 2e7);
  EXPECT_DOUBLE_EQ(p->thermal_conductivity, 0.5);
}
