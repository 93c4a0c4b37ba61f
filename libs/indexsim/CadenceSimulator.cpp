// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <sstream>
#include "CadenceSimulator.h"
#include "IndexSimException.h"
#include "PerformanceMetrics.h"

namespace tao_index
{
  std::string getSimulationStateString(SimulationState state)
  {
    switch (state)
      {
      case SimulationState::INITIALIZING:
	return "INITIALIZING";
      case SimulationState::ACTIVE:
	return "ACTIVE";
      case SimulationState::FINALIZED:
	return "FINALIZED";
      default:
	return "UNKNOWN";
      }
  }

  CadenceSimulation::CadenceSimulation(std::shared_ptr<const SnapshotTable> table,
				       const CadenceSpec& cadence,
				       const RebalanceConfiguration& configuration,
				       std::shared_ptr<const StakingYieldModel> yieldModel,
				       std::shared_ptr<const TargetWeightPolicy> weightPolicy,
				       bool applyCosts,
				       std::ostream* log)
    : mTable(table),
      mCadence(cadence),
      mYieldModel(yieldModel),
      mWeightPolicy(weightPolicy),
      mTransactionCostBps(applyCosts ? configuration.getTransactionCostBps() : 0.0),
      mSlippageBps(applyCosts ? configuration.getSlippageBps() : 0.0),
      mRiskFreeRate(configuration.getRiskFreeRate()),
      mTicksPerYear(configuration.getTicksPerYear()),
      mLog(log),
      mPortfolio(configuration.getInitialCapital(),
		 configuration.getMinTradeValue(),
		 configuration.getDustThreshold()),
      mState(SimulationState::INITIALIZING),
      mNextTick(0),
      mHoursSinceRebalance(0),
      mRebalanceCount(0),
      mSkippedRebalances(0),
      mNavHistory(),
      mLastOutcome()
  {
    if (!mTable || !mYieldModel || !mWeightPolicy)
      throw IndexSimException("CadenceSimulation - table, yield model and weight policy are required");

    if (mTable->getNumTicks() < 2)
      throw InsufficientDataException("CadenceSimulation - cadence " + cadence.getName() +
				      " needs at least two snapshots, found " +
				      std::to_string(mTable->getNumTicks()));

    mNavHistory.reserve(mTable->getNumTicks());
  }

  void CadenceSimulation::logEvent(const EmissionSnapshot& snapshot, const std::string& message) const
  {
    if (mLog)
      (*mLog) << "[" << mCadence.getName() << "] "
	      << boost::posix_time::to_iso_extended_string(snapshot.getTimestamp())
	      << ": " << message << std::endl;
  }

  bool CadenceSimulation::isRebalanceDue()
  {
    if (mCadence.isContinuous())
      return true;

    if (mHoursSinceRebalance >= mCadence.getHours())
      {
	mHoursSinceRebalance = 0;
	return true;
      }

    return false;
  }

  void CadenceSimulation::performRebalance(const EmissionSnapshot& snapshot, const PriceMap& prices)
  {
    mLastOutcome.rebalanceTriggered = true;
    mLastOutcome.navBeforeRebalance = mPortfolio.getPortfolioValue(prices);

    TargetWeights weights = mWeightPolicy->getTargetWeights(snapshot);
    if (weights.empty())
      {
	mLastOutcome.skippedForZeroWeights = true;
	++mSkippedRebalances;
	logEvent(snapshot, "no target weights available (zero top-N emission), rebalance skipped");
	return;
      }

    mLastOutcome.costCharged = mPortfolio.rebalance(weights, prices, mTransactionCostBps, mSlippageBps);
    mLastOutcome.rebalanced = true;
    ++mRebalanceCount;

    for (SubnetId subnet : mPortfolio.getLastStaleSubnets())
      logEvent(snapshot, "no price for subnet " + std::to_string(subnet) + ", trade skipped");
  }

  const TickOutcome& CadenceSimulation::processNextTick()
  {
    if (mState == SimulationState::FINALIZED)
      throw IndexSimException("CadenceSimulation::processNextTick - simulation already finalized");

    if (!hasMoreTicks())
      throw IndexSimException("CadenceSimulation::processNextTick - snapshot table exhausted");

    const size_t tick = mNextTick;
    const EmissionSnapshot& snapshot = mTable->getSnapshot(tick);
    const PriceMap& prices = mTable->getPricesAt(tick);

    mLastOutcome = TickOutcome();
    mLastOutcome.tick = tick;

    if (mState == SimulationState::INITIALIZING)
      {
	performRebalance(snapshot, prices);
	mState = SimulationState::ACTIVE;
      }
    else
      {
	mPortfolio.applyStakingYield(*mYieldModel, snapshot, 1.0);

	if (isRebalanceDue())
	  performRebalance(snapshot, prices);
      }

    const double nav = mPortfolio.getPortfolioValue(prices);
    mNavHistory.emplace_back(snapshot.getTimestamp(), nav, mPortfolio.getCash());
    mLastOutcome.nav = nav;

    ++mHoursSinceRebalance;
    ++mNextTick;

    return mLastOutcome;
  }

  SimulationResult CadenceSimulation::finalize()
  {
    if (mState == SimulationState::FINALIZED)
      throw IndexSimException("CadenceSimulation::finalize - simulation already finalized");

    if (hasMoreTicks())
      throw IndexSimException("CadenceSimulation::finalize - " +
			      std::to_string(mTable->getNumTicks() - mNextTick) +
			      " ticks not yet processed");

    std::vector<double> navValues;
    navValues.reserve(mNavHistory.size());
    for (const auto& record : mNavHistory)
      navValues.push_back(record.nav);

    PerformanceSummary summary;

    summary.finalNav = navValues.back();
    summary.totalReturn = metrics::totalReturn(navValues.front(), navValues.back());

    const boost::posix_time::time_duration elapsed =
      mNavHistory.back().timestamp - mNavHistory.front().timestamp;
    summary.elapsedDays = static_cast<long>(elapsed.hours() / 24);
    summary.annualizedReturn = metrics::annualizedReturn(summary.totalReturn, summary.elapsedDays);

    summary.annualizedVolatility = metrics::annualizedVolatility(metrics::percentChange(navValues),
								 mTicksPerYear);
    summary.sharpeRatio = metrics::sharpeRatio(summary.annualizedReturn, mRiskFreeRate,
					       summary.annualizedVolatility);
    summary.maxDrawdown = metrics::maxDrawdown(navValues);

    summary.rebalanceCount = mRebalanceCount;
    summary.totalTransactionCost = mPortfolio.getCumulativeTransactionCost();
    summary.transactionCostPct = summary.totalTransactionCost / mPortfolio.getInitialCapital();
    summary.trackingError = 0.0;
    summary.numTradesExecuted = mPortfolio.getNumTradesExecuted();
    summary.tradedNotional = mPortfolio.getTradedNotional();
    summary.numStaleTradesSkipped = mPortfolio.getNumStaleTradesSkipped();
    summary.numSkippedRebalances = mSkippedRebalances;

    mState = SimulationState::FINALIZED;

    return SimulationResult(mCadence, mNavHistory, summary);
  }

  CadenceSimulator::CadenceSimulator(std::shared_ptr<const SnapshotTable> table,
				     const RebalanceConfiguration& configuration,
				     std::shared_ptr<const StakingYieldModel> yieldModel,
				     std::shared_ptr<const TargetWeightPolicy> weightPolicy)
    : mTable(table),
      mConfiguration(configuration),
      mYieldModel(yieldModel),
      mWeightPolicy(weightPolicy)
  {}

  SimulationResult CadenceSimulator::simulate(const CadenceSpec& cadence,
					      bool applyCosts,
					      std::ostream* log,
					      const std::atomic<bool>* cancelFlag) const
  {
    CadenceSimulation simulation(mTable, cadence, mConfiguration, mYieldModel,
				 mWeightPolicy, applyCosts, log);

    while (simulation.hasMoreTicks())
      {
	if (cancelFlag && cancelFlag->load(std::memory_order_relaxed))
	  throw SimulationCancelledException("CadenceSimulator::simulate - cadence " +
					     cadence.getName() + " cancelled at tick " +
					     std::to_string(simulation.getNextTick()));

	simulation.processNextTick();
      }

    return simulation.finalize();
  }
} // namespace tao_index
