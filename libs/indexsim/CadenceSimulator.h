// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_CADENCE_SIMULATOR_H
#define __TAO_INDEX_CADENCE_SIMULATOR_H 1

#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "CadenceSpec.h"
#include "IndexPortfolio.h"
#include "RebalanceConfiguration.h"
#include "SimulationResult.h"
#include "SnapshotLoader.h"
#include "StakingYieldModel.h"
#include "TargetWeightPolicy.h"

namespace tao_index
{
  enum class SimulationState
  {
    INITIALIZING,
    ACTIVE,
    FINALIZED
  };

  std::string getSimulationStateString(SimulationState state);

  /**
   * @brief What happened during the most recently processed tick.
   */
  struct TickOutcome
  {
    size_t tick = 0;
    bool rebalanceTriggered = false;
    bool rebalanced = false;
    bool skippedForZeroWeights = false;
    double navBeforeRebalance = 0.0;
    double costCharged = 0.0;
    double nav = 0.0;
  };

  /**
   * @class CadenceSimulation
   * @brief One tick-by-tick replay of a snapshot table under one cadence.
   *
   * The first tick always performs the initial allocation. On every later
   * tick the holdings first earn one hour of staking yield, then a
   * rebalance is performed when the cadence is due, and finally NAV is
   * recorded at that tick's prices. A cadence of h hours rebalances every
   * h ticks; a cadence of zero rebalances on every tick.
   *
   * Each simulation owns its own portfolio. Ticks are strictly sequential.
   */
  class CadenceSimulation
  {
  public:
    /**
     * @param applyCosts When false, trades are charged zero cost and
     *        slippage (the continuous benchmark).
     * @param log Optional stream for data quality events.
     * @throws InsufficientDataException when the table has fewer than two ticks.
     */
    CadenceSimulation(std::shared_ptr<const SnapshotTable> table,
		      const CadenceSpec& cadence,
		      const RebalanceConfiguration& configuration,
		      std::shared_ptr<const StakingYieldModel> yieldModel,
		      std::shared_ptr<const TargetWeightPolicy> weightPolicy,
		      bool applyCosts,
		      std::ostream* log = nullptr);

    CadenceSimulation(const CadenceSimulation&) = delete;
    CadenceSimulation& operator=(const CadenceSimulation&) = delete;

    SimulationState getState() const
    {
      return mState;
    }

    bool hasMoreTicks() const
    {
      return mNextTick < mTable->getNumTicks();
    }

    size_t getNextTick() const
    {
      return mNextTick;
    }

    /**
     * @throws IndexSimException when finalized or when no tick remains.
     */
    const TickOutcome& processNextTick();

    /**
     * @brief Compute summary statistics and move to FINALIZED.
     * @throws IndexSimException unless every tick has been processed.
     */
    SimulationResult finalize();

    const IndexPortfolio& getPortfolio() const
    {
      return mPortfolio;
    }

    const std::vector<NavRecord>& getNavHistory() const
    {
      return mNavHistory;
    }

    unsigned long getRebalanceCount() const
    {
      return mRebalanceCount;
    }

    const TickOutcome& getLastTickOutcome() const
    {
      return mLastOutcome;
    }

    const CadenceSpec& getCadence() const
    {
      return mCadence;
    }

  private:
    bool isRebalanceDue();
    void performRebalance(const EmissionSnapshot& snapshot, const PriceMap& prices);
    void logEvent(const EmissionSnapshot& snapshot, const std::string& message) const;

  private:
    std::shared_ptr<const SnapshotTable> mTable;
    CadenceSpec mCadence;
    std::shared_ptr<const StakingYieldModel> mYieldModel;
    std::shared_ptr<const TargetWeightPolicy> mWeightPolicy;
    double mTransactionCostBps;
    double mSlippageBps;
    double mRiskFreeRate;
    double mTicksPerYear;
    std::ostream* mLog;
    IndexPortfolio mPortfolio;
    SimulationState mState;
    size_t mNextTick;
    unsigned long mHoursSinceRebalance;
    unsigned long mRebalanceCount;
    unsigned long mSkippedRebalances;
    std::vector<NavRecord> mNavHistory;
    TickOutcome mLastOutcome;
  };

  /**
   * @class CadenceSimulator
   * @brief Runs complete simulations of one snapshot table, one cadence at
   * a time.
   *
   * The simulator holds only shared read-only state, so simulate() may be
   * called concurrently for different cadences.
   */
  class CadenceSimulator
  {
  public:
    CadenceSimulator(std::shared_ptr<const SnapshotTable> table,
		     const RebalanceConfiguration& configuration,
		     std::shared_ptr<const StakingYieldModel> yieldModel,
		     std::shared_ptr<const TargetWeightPolicy> weightPolicy);

    /**
     * @param cancelFlag Polled before every tick; when set the run stops
     *        and SimulationCancelledException is thrown.
     */
    SimulationResult simulate(const CadenceSpec& cadence,
			      bool applyCosts,
			      std::ostream* log = nullptr,
			      const std::atomic<bool>* cancelFlag = nullptr) const;

    const RebalanceConfiguration& getConfiguration() const
    {
      return mConfiguration;
    }

  private:
    std::shared_ptr<const SnapshotTable> mTable;
    RebalanceConfiguration mConfiguration;
    std::shared_ptr<const StakingYieldModel> mYieldModel;
    std::shared_ptr<const TargetWeightPolicy> mWeightPolicy;
  };
} // namespace tao_index

#endif
