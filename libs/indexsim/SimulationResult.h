// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_SIMULATION_RESULT_H
#define __TAO_INDEX_SIMULATION_RESULT_H 1

#include <utility>
#include <vector>
#include "CadenceSpec.h"
#include "EmissionSnapshot.h"

namespace tao_index
{
  struct NavRecord
  {
    NavRecord(const ptime& aTimestamp, double aNav, double aCash)
      : timestamp(aTimestamp),
	nav(aNav),
	cash(aCash)
    {}

    ptime timestamp;
    double nav;
    double cash;
  };

  /**
   * @brief Scalar statistics of one finished cadence run.
   *
   * Returns, volatility, drawdown and costs are fractions (0.02 = 2%).
   */
  struct PerformanceSummary
  {
    double totalReturn = 0.0;
    double annualizedReturn = 0.0;
    double annualizedVolatility = 0.0;
    double sharpeRatio = 0.0;
    double maxDrawdown = 0.0;
    unsigned long rebalanceCount = 0;
    double totalTransactionCost = 0.0;
    double transactionCostPct = 0.0;
    double trackingError = 0.0;
    double finalNav = 0.0;
    long elapsedDays = 0;
    unsigned long numTradesExecuted = 0;
    double tradedNotional = 0.0;
    unsigned long numStaleTradesSkipped = 0;
    unsigned long numSkippedRebalances = 0;
  };

  /**
   * @class SimulationResult
   * @brief NAV history and summary statistics of one cadence.
   *
   * Produced once by CadenceSimulation::finalize(). Only the tracking
   * error may be filled in afterwards, by the comparative analyzer on its
   * own copy.
   */
  class SimulationResult
  {
  public:
    SimulationResult(const CadenceSpec& cadence,
		     std::vector<NavRecord> navHistory,
		     const PerformanceSummary& summary)
      : mCadence(cadence),
	mNavHistory(std::move(navHistory)),
	mSummary(summary)
    {}

    const CadenceSpec& getCadence() const
    {
      return mCadence;
    }

    const std::vector<NavRecord>& getNavHistory() const
    {
      return mNavHistory;
    }

    std::vector<double> getNavValues() const
    {
      std::vector<double> values;
      values.reserve(mNavHistory.size());
      for (const auto& record : mNavHistory)
	values.push_back(record.nav);
      return values;
    }

    const PerformanceSummary& getSummary() const
    {
      return mSummary;
    }

    void setTrackingError(double trackingError)
    {
      mSummary.trackingError = trackingError;
    }

  private:
    CadenceSpec mCadence;
    std::vector<NavRecord> mNavHistory;
    PerformanceSummary mSummary;
  };
} // namespace tao_index

#endif
