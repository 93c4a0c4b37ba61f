#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <cmath>
#include <sstream>
#include "CadenceSimulator.h"
#include "IndexSimException.h"
#include "StakingYieldModel.h"
#include "TargetWeightPolicy.h"
#include "TestUtils.h"

using namespace tao_index;

namespace
{
  std::shared_ptr<const StakingYieldModel> noYield()
  {
    return std::make_shared<ZeroYieldModel>();
  }

  std::shared_ptr<const TargetWeightPolicy> emissionPolicy(unsigned int topN)
  {
    return std::make_shared<EmissionWeightPolicy>(topN);
  }

  // Hourly table with fixed emissions and a gently moving price path
  std::shared_ptr<const SnapshotTable> makeTrendingTable(size_t numTicks)
  {
    std::vector<EmissionMap> emissions(numTicks, EmissionMap({ {1, 0.5}, {2, 0.3}, {3, 0.2} }));
    std::vector<double> p1, p2, p3;

    for (size_t i = 0; i < numTicks; ++i)
      {
	const double t = static_cast<double>(i);
	p1.push_back(10.0 + 0.5 * std::sin(t / 3.0) + 0.05 * t);
	p2.push_back(20.0 + std::cos(t / 5.0));
	p3.push_back(5.0 + 0.02 * t);
      }

    return makeTableWithPrices(emissions, { {1, p1}, {2, p2}, {3, p3} });
  }
}

TEST_CASE("Continuous cadence on a two tick market", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  configuration.setTopN(2);

  std::shared_ptr<const SnapshotTable> table =
    makeTableWithPrices({ { {1, 0.6}, {2, 0.4} }, { {1, 0.6}, {2, 0.4} } },
			{ {1, {1.0, 1.1}}, {2, {1.0, 0.9}} });

  CadenceSimulator simulator(table, configuration, noYield(), emissionPolicy(2));
  SimulationResult result = simulator.simulate(CadenceSpec::continuous(), false);

  REQUIRE(result.getNavHistory().size() == 2);
  REQUIRE(result.getNavHistory()[0].nav == Catch::Approx(1000000.0));
  REQUIRE(result.getSummary().finalNav == Catch::Approx(1020000.0));
  REQUIRE(result.getSummary().totalReturn == Catch::Approx(0.02));
  REQUIRE(result.getSummary().rebalanceCount == 2);
  REQUIRE(result.getSummary().totalTransactionCost == 0.0);
  REQUIRE(result.getSummary().transactionCostPct == 0.0);
  REQUIRE(result.getSummary().elapsedDays == 0);
  REQUIRE(result.getSummary().annualizedReturn == 0.0);
}

TEST_CASE("Cadence longer than the data is buy and hold", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  configuration.setTopN(2);

  std::vector<EmissionMap> emissions = { { {1, 0.6}, {2, 0.4} }, { {1, 0.1}, {2, 0.9} }, { {1, 0.9}, {2, 0.1} } };
  std::shared_ptr<const SnapshotTable> table =
    makeTableWithPrices(emissions, { {1, {1.0, 1.1, 1.2}}, {2, {1.0, 0.9, 0.95}} });

  CadenceSimulation simulation(table, CadenceSpec::fromString("1w"), configuration,
			       noYield(), emissionPolicy(2), true);

  simulation.processNextTick();
  const double quantity1 = simulation.getPortfolio().getQuantity(1);
  const double quantity2 = simulation.getPortfolio().getQuantity(2);

  REQUIRE(quantity1 == Catch::Approx(600000.0));
  REQUIRE(quantity2 == Catch::Approx(400000.0));

  while (simulation.hasMoreTicks())
    REQUIRE_FALSE(simulation.processNextTick().rebalanceTriggered);

  REQUIRE(simulation.getPortfolio().getQuantity(1) == quantity1);
  REQUIRE(simulation.getPortfolio().getQuantity(2) == quantity2);

  SimulationResult result = simulation.finalize();
  REQUIRE(result.getSummary().rebalanceCount == 1);
  REQUIRE(result.getNavHistory()[1].nav == Catch::Approx(600000.0 * 1.1 + 400000.0 * 0.9));
  REQUIRE(result.getSummary().finalNav == Catch::Approx(600000.0 * 1.2 + 400000.0 * 0.95));
}

TEST_CASE("Zero emission at a rebalance boundary", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  configuration.setTransactionCostBps(10.0);
  configuration.setTopN(2);

  std::vector<EmissionMap> emissions = { { {1, 0.6}, {2, 0.4} }, { {1, 0.0}, {2, 0.0} }, { {1, 0.5}, {2, 0.5} } };
  std::shared_ptr<const SnapshotTable> table =
    makeTableWithPrices(emissions, { {1, {1.0, 1.2, 1.2}}, {2, {1.0, 0.8, 0.8}} });

  std::ostringstream log;
  CadenceSimulation simulation(table, CadenceSpec::fromString("1h"), configuration,
			       noYield(), emissionPolicy(2), true, &log);

  simulation.processNextTick();
  const double quantity1 = simulation.getPortfolio().getQuantity(1);
  const double costBefore = simulation.getPortfolio().getCumulativeTransactionCost();

  const TickOutcome& outcome = simulation.processNextTick();

  REQUIRE(outcome.rebalanceTriggered);
  REQUIRE_FALSE(outcome.rebalanced);
  REQUIRE(outcome.skippedForZeroWeights);
  REQUIRE(outcome.costCharged == 0.0);
  REQUIRE(simulation.getRebalanceCount() == 1);
  REQUIRE(simulation.getPortfolio().getQuantity(1) == quantity1);
  REQUIRE(simulation.getPortfolio().getCumulativeTransactionCost() == costBefore);
  REQUIRE(log.str().find("[1h]") != std::string::npos);
  REQUIRE(log.str().find("rebalance skipped") != std::string::npos);

  REQUIRE(simulation.processNextTick().rebalanced);

  SimulationResult result = simulation.finalize();
  REQUIRE(result.getSummary().rebalanceCount == 2);
  REQUIRE(result.getSummary().numSkippedRebalances == 1);
}

TEST_CASE("Rebalance schedule follows the cadence", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  std::shared_ptr<const SnapshotTable> table = makeTrendingTable(10);

  SECTION("Every h ticks")
    {
      CadenceSimulation simulation(table, CadenceSpec::fromString("4h"), configuration,
				   noYield(), emissionPolicy(3), true);

      std::vector<size_t> rebalanceTicks;
      while (simulation.hasMoreTicks())
	{
	  const TickOutcome& outcome = simulation.processNextTick();
	  if (outcome.rebalanceTriggered)
	    rebalanceTicks.push_back(outcome.tick);
	}

      REQUIRE(rebalanceTicks == std::vector<size_t>({0, 4, 8}));
      REQUIRE(simulation.getRebalanceCount() == 3);
    }

  SECTION("Continuous rebalances every tick")
    {
      CadenceSimulator simulator(table, configuration, noYield(), emissionPolicy(3));
      SimulationResult result = simulator.simulate(CadenceSpec::continuous(), false);

      REQUIRE(result.getSummary().rebalanceCount == 10);
    }

  SECTION("Hourly matches continuous when costs are zero")
    {
      CadenceSimulator simulator(table, configuration, noYield(), emissionPolicy(3));
      SimulationResult hourly = simulator.simulate(CadenceSpec::fromString("1h"), true);
      SimulationResult continuous = simulator.simulate(CadenceSpec::continuous(), false);

      REQUIRE(hourly.getSummary().finalNav == Catch::Approx(continuous.getSummary().finalNav));
      REQUIRE(hourly.getSummary().rebalanceCount == continuous.getSummary().rebalanceCount);
    }
}

TEST_CASE("Simulation invariants with costs", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  configuration.setTransactionCostBps(10.0);
  configuration.setSlippageBps(5.0);

  std::shared_ptr<const SnapshotTable> table = makeTrendingTable(48);

  for (const char* name : {"1h", "2h", "8h", "1d"})
    {
      CadenceSimulation simulation(table, CadenceSpec::fromString(name), configuration,
				   noYield(), emissionPolicy(2), true);

      double previousCost = 0.0;
      while (simulation.hasMoreTicks())
	{
	  const TickOutcome& outcome = simulation.processNextTick();
	  const double cumulativeCost = simulation.getPortfolio().getCumulativeTransactionCost();

	  REQUIRE(outcome.nav > 0.0);
	  REQUIRE(cumulativeCost >= previousCost);
	  if (outcome.rebalanced)
	    REQUIRE(outcome.nav == Catch::Approx(outcome.navBeforeRebalance - outcome.costCharged));

	  previousCost = cumulativeCost;
	}

      SimulationResult result = simulation.finalize();
      const PerformanceSummary& summary = result.getSummary();

      REQUIRE(summary.totalTransactionCost > 0.0);
      REQUIRE(summary.transactionCostPct ==
	      Catch::Approx(summary.totalTransactionCost / configuration.getInitialCapital()));
      REQUIRE(summary.maxDrawdown <= 0.0);
      REQUIRE(summary.elapsedDays == 1);
      REQUIRE(summary.annualizedVolatility > 0.0);
      REQUIRE(summary.numTradesExecuted > 0);
    }
}

TEST_CASE("Simulation statistics", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  configuration.setRiskFreeRate(0.05);

  std::shared_ptr<const SnapshotTable> table = makeTrendingTable(73);
  CadenceSimulator simulator(table, configuration, noYield(), emissionPolicy(3));
  SimulationResult result = simulator.simulate(CadenceSpec::fromString("1d"), true);
  const PerformanceSummary& summary = result.getSummary();

  std::vector<double> nav = result.getNavValues();
  const double totalReturn = nav.back() / nav.front() - 1.0;
  const double annualized = std::pow(1.0 + totalReturn, 365.0 / 3.0) - 1.0;

  REQUIRE(summary.elapsedDays == 3);
  REQUIRE(summary.totalReturn == Catch::Approx(totalReturn));
  REQUIRE(summary.annualizedReturn == Catch::Approx(annualized));
  REQUIRE(summary.sharpeRatio ==
	  Catch::Approx((summary.annualizedReturn - 0.05) / summary.annualizedVolatility));
  REQUIRE(summary.trackingError == 0.0);
  REQUIRE(summary.rebalanceCount == 4);
}

TEST_CASE("Staking yield grows holdings between rebalances", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  configuration.setTopN(1);

  std::shared_ptr<const SnapshotTable> table =
    makeTableWithPrices({ { {1, 1.0} }, { {1, 1.0} } }, { {1, {1.0, 1.0}} });

  std::shared_ptr<const StakingYieldModel> model = std::make_shared<EmissionProportionalYieldModel>();
  CadenceSimulator simulator(table, configuration, model, emissionPolicy(1));
  SimulationResult result = simulator.simulate(CadenceSpec::fromString("1w"), true);

  const double hourly = hourlyRateFromApy(model->estimateApy(1.0, boost::none));
  REQUIRE(hourly > 0.0);
  REQUIRE(result.getSummary().finalNav == Catch::Approx(1000000.0 * (1.0 + hourly)));
}

TEST_CASE("Missing prices are logged and skipped", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  configuration.setTopN(2);

  std::shared_ptr<const SnapshotTable> table =
    makeTableWithPrices({ { {1, 0.6}, {2, 0.4} }, { {1, 0.6}, {2, 0.4} } }, { {1, {1.0, 1.0}} });

  std::ostringstream log;
  CadenceSimulator simulator(table, configuration, noYield(), emissionPolicy(2));
  SimulationResult result = simulator.simulate(CadenceSpec::continuous(), false, &log);

  REQUIRE(result.getSummary().numStaleTradesSkipped == 2);
  REQUIRE(result.getSummary().finalNav == Catch::Approx(1000000.0));
  REQUIRE(log.str().find("[continuous] 2024-01-01T00:00:00: no price for subnet 2") != std::string::npos);
}

TEST_CASE("CadenceSimulation state machine", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();
  std::shared_ptr<const SnapshotTable> table = makeTrendingTable(3);

  CadenceSimulation simulation(table, CadenceSpec::fromString("2h"), configuration,
			       noYield(), emissionPolicy(3), true);

  REQUIRE(simulation.getState() == SimulationState::INITIALIZING);
  REQUIRE_THROWS_AS(simulation.finalize(), IndexSimException);

  simulation.processNextTick();
  REQUIRE(simulation.getState() == SimulationState::ACTIVE);
  REQUIRE_THROWS_AS(simulation.finalize(), IndexSimException);

  simulation.processNextTick();
  simulation.processNextTick();
  REQUIRE_FALSE(simulation.hasMoreTicks());
  REQUIRE_THROWS_AS(simulation.processNextTick(), IndexSimException);

  SimulationResult result = simulation.finalize();
  REQUIRE(simulation.getState() == SimulationState::FINALIZED);
  REQUIRE(getSimulationStateString(simulation.getState()) == "FINALIZED");
  REQUIRE(result.getNavHistory().size() == 3);
  REQUIRE_THROWS_AS(simulation.finalize(), IndexSimException);
}

TEST_CASE("Simulation failures", "[CadenceSimulator]")
{
  RebalanceConfiguration configuration = makeFrictionlessConfiguration();

  SECTION("One snapshot is insufficient")
    {
      std::shared_ptr<const SnapshotTable> table = makeTableWithPrices({ { {1, 1.0} } }, { {1, {1.0}} });

      REQUIRE_THROWS_AS(CadenceSimulation(table, CadenceSpec::continuous(), configuration,
					  noYield(), emissionPolicy(1), false),
			InsufficientDataException);
    }

  SECTION("Cancellation stops the run")
    {
      std::atomic<bool> cancel(true);
      CadenceSimulator simulator(makeTrendingTable(5), configuration, noYield(), emissionPolicy(3));

      REQUIRE_THROWS_AS(simulator.simulate(CadenceSpec::fromString("1h"), true, nullptr, &cancel),
			SimulationCancelledException);

      cancel.store(false);
      REQUIRE_NOTHROW(simulator.simulate(CadenceSpec::fromString("1h"), true, nullptr, &cancel));
    }
}
