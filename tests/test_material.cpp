#include <gtest/gtest.h>

#include "errors.hpp"
#include "material.hpp"

class MaterialTest: public ::testing::Test {
protected:
  ice_eos_provider provider;
};

TEST_F(MaterialTest, IceIhNearMelting) {
  auto props = provider.evaluate(5, 252.1969814460752, ice_phase::ice_I);
  EXPECT_NEAR(props.density, 920.230482161448, 1e-9);
  EXPECT_NEAR(props.thermal_expansion, 1.3944795766022478e-4, 1e-15);
  EXPECT_NEAR(props.specific_heat, 1980.7191797323283, 1e-9);
  EXPECT_NEAR(props.thermal_conductivity, 2.5059776543564, 1e-12);
  EXPECT_DOUBLE_EQ(
    props.thermal_diffusivity(),
    props.thermal_conductivity/(props.density*props.specific_heat));
}

TEST_F(MaterialTest, OrdinaryIceConductivityIsInverseInT) {
  auto cold = provider.evaluate(300, 150, ice_phase::ice_III);
  auto warm = provider.evaluate(300, 250, ice_phase::ice_III);
  EXPECT_DOUBLE_EQ(cold.thermal_conductivity, 242./150);
  EXPECT_DOUBLE_EQ(warm.thermal_conductivity, 242./250);
}

TEST_F(MaterialTest, HighPressureIcesAreDenser) {
  double rho_I = provider.evaluate(200, 250, ice_phase::ice_I).density;
  double rho_V = provider.evaluate(500, 250, ice_phase::ice_V).density;
  double rho_VI = provider.evaluate(1000, 250, ice_phase::ice_VI).density;
  EXPECT_LT(rho_I, rho_V);
  EXPECT_LT(rho_V, rho_VI);
}

TEST_F(MaterialTest, ClathrateConductivityIsConstant) {
  auto cold = provider.evaluate(5, 150, ice_phase::clathrate);
  auto warm = provider.evaluate(5, 250, ice_phase::clathrate);
  EXPECT_DOUBLE_EQ(cold.thermal_conductivity, 0.5);
  EXPECT_DOUBLE_EQ(warm.thermal_conductivity, 0.5);
}

TEST_F(MaterialTest, ClathrateCorrelations) {
  auto props = provider.evaluate(5, 150, ice_phase::clathrate);
  EXPECT_NEAR(props.density, 954.2703225, 1e-7);
  EXPECT_NEAR(props.specific_heat, 2628.5, 1e-9);
  EXPECT_NEAR(props.thermal_expansion, 1.8643564943748097e-4, 1e-15);
}

TEST_F(MaterialTest, OutOfRangeThrows) {
  EXPECT_THROW(provider.evaluate(5, 450, ice_phase::ice_I),
               property_range_error);
  EXPECT_THROW(provider.evaluate(-1, 250, ice_phase::ice_I),
               property_range_error);
  EXPECT_THROW(provider.evaluate(5, 300, ice_phase::clathrate),
               property_range_error);
  EXPECT_THROW(provider.evaluate(300, 250, ice_phase::clathrate),
               property_range_error);
}

TEST_F(MaterialTest, WaterIsRejected) {
  EXPECT_THROW(provider.evaluate(5, 270, ice_phase::water),
               unsupported_phase_error);
}

TEST(ClathrateStabilityTest, LowPressureBranch) {
  // T_dissoc(1 MPa) = 247.878 K
  EXPECT_TRUE(clathrate_stable(1, 200));
  EXPECT_TRUE(clathrate_stable(1, 247.8));
  EXPECT_FALSE(clathrate_stable(1, 248));
}

TEST(ClathrateStabilityTest, HighPressureBranch) {
  // T_dissoc(10 MPa) = 284.321 K
  EXPECT_TRUE(clathrate_stable(10, 280));
  EXPECT_FALSE(clathrate_stable(10, 290));
}
