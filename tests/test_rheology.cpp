#include <gtest/gtest.h>

#include <cmath>

#include "errors.hpp"
#include "phase.hpp"
#include "rheology.hpp"

TEST(RheologyTest, CoreTemperatureForIceI) {
  double Tc = critical_temperature(260, 160, 60e3);
  EXPECT_NEAR(Tc, 252.1969814460752, 1e-9);
  EXPECT_GT(Tc, 100);
  EXPECT_LT(Tc, 260);
}

TEST(RheologyTest, CoreTemperatureNegativeRadicandThrows) {
  EXPECT_THROW(critical_temperature(-3000, 10, 60e3), physical_domain_error);
}

TEST(RheologyTest, ViscosityAtBottomIsReference) {
  EXPECT_DOUBLE_EQ(viscosity(1e14, 60e3, 260, 260), 1e14);
}

TEST(RheologyTest, ViscosityGrowsAsCoreCools) {
  double warm = viscosity(1e14, 60e3, 260, 250);
  double cold = viscosity(1e14, 60e3, 260, 200);
  EXPECT_GT(warm, 1e14);
  EXPECT_GT(cold, warm);
}

TEST(RheologyTest, ViscosityRejectsNonpositiveCoreTemperature) {
  EXPECT_THROW(viscosity(1e14, 60e3, 260, 0), physical_domain_error);
  EXPECT_THROW(viscosity(1e14, 60e3, 260, -10), physical_domain_error);
}

TEST(RheologyTest, ViscosityPositiveAndFinite) {
  for (auto phase: {ice_phase::ice_I, ice_phase::ice_II, ice_phase::ice_III,
                    ice_phase::ice_V, ice_phase::ice_VI,
                    ice_phase::clathrate}) {
    auto const & params = get_phase_params(phase);
    double E = get_activation_energy(params);
    double nu0 = get_reference_viscosity(params);
    for (double Tm = 150; Tm <= 350; Tm += 25) {
      for (double Ttop = 40; Ttop < Tm; Ttop += 20) {
        double Tc = critical_temperature(Tm, Tm - Ttop, E);
        double nu = viscosity(nu0, E, Tm, Tc);
        EXPECT_GT(nu, 0) << to_string(phase) << ", Tm = " << Tm;
        EXPECT_TRUE(std::isfinite(nu)) << to_string(phase) << ", Tm = " << Tm;
      }
    }
  }
}
