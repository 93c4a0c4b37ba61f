#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "StakingYieldModel.h"
#include "RebalanceConfiguration.h"

using namespace tao_index;

TEST_CASE("hourlyRateFromApy compounds back to the annual yield", "[StakingYieldModel]")
{
  REQUIRE(hourlyRateFromApy(0.0) == 0.0);

  const double hourly = hourlyRateFromApy(12.0);
  REQUIRE(hourly > 0.0);
  REQUIRE(std::pow(1.0 + hourly, 8760.0) == Catch::Approx(1.12));
}

TEST_CASE("Emission proportional yield model", "[StakingYieldModel]")
{
  EmissionProportionalYieldModel model;

  REQUIRE(model.getName() == "emission");
  REQUIRE(model.estimateApy(0.05, boost::none) == Catch::Approx(0.05 * 0.0001 * 365.0 * 100.0));
  REQUIRE(model.estimateApy(0.0, boost::none) == 0.0);
  REQUIRE(model.estimateApy(-0.1, boost::none) == 0.0);

  EmissionProportionalYieldModel scaled(0.001);
  REQUIRE(scaled.estimateApy(0.05, 1000000.0) == Catch::Approx(1.825));
}

TEST_CASE("Alpha staking yield model", "[StakingYieldModel]")
{
  AlphaStakingYieldModel model;

  SECTION("Staking ratio passes through the calibration points")
    {
      REQUIRE(model.estimateStakingRatio(1129000.0) == Catch::Approx(0.2066).epsilon(1e-6));
      REQUIRE(model.estimateStakingRatio(3166000.0) == Catch::Approx(0.1838).epsilon(1e-6));
    }

  SECTION("Staking ratio bounds")
    {
      REQUIRE(model.estimateStakingRatio(0.0) == Catch::Approx(0.15));
      REQUIRE(model.estimateStakingRatio(1.0e12) == Catch::Approx(0.05));
      REQUIRE(model.estimateStakingRatio(1.0) == Catch::Approx(0.30).epsilon(1e-3));

      for (double supply : {50000.0, 100000.0, 500000.0, 2000000.0, 10000000.0})
	{
	  const double ratio = model.estimateStakingRatio(supply);
	  REQUIRE(ratio >= 0.05);
	  REQUIRE(ratio <= 0.40);
	}
    }

  SECTION("Daily issuance")
    {
      REQUIRE(model.getDailyIssuance(0.01) == Catch::Approx(144.0));
    }

  SECTION("APY from issuance over staked supply")
    {
      const double supply = 1129000.0;
      const double expected = 144.0 / (supply * model.estimateStakingRatio(supply)) * 365.0 * 100.0;

      REQUIRE(model.estimateApy(0.01, supply) == Catch::Approx(expected));
    }

  SECTION("No supply means no yield")
    {
      REQUIRE(model.estimateApy(0.01, boost::none) == 0.0);
    }
}

TEST_CASE("createStakingYieldModel selects by name", "[StakingYieldModel]")
{
  RebalanceConfiguration configuration;

  configuration.setYieldModelName("none");
  REQUIRE(createStakingYieldModel(configuration)->getName() == "none");
  REQUIRE(createStakingYieldModel(configuration)->estimateApy(0.5, 100.0) == 0.0);

  configuration.setYieldModelName("emission");
  REQUIRE(createStakingYieldModel(configuration)->getName() == "emission");

  configuration.setYieldModelName("alpha");
  REQUIRE(createStakingYieldModel(configuration)->getName() == "alpha");
}
