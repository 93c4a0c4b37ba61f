// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_INDEX_PORTFOLIO_H
#define __TAO_INDEX_INDEX_PORTFOLIO_H 1

#include <map>
#include <vector>
#include "EmissionSnapshot.h"
#include "StakingYieldModel.h"

namespace tao_index
{
  /**
   * @class IndexPortfolio
   * @brief Cash plus per-subnet token holdings of an emission-weighted
   * index basket.
   *
   * The portfolio trades toward target weights against whatever price
   * vector it is given. A subnet without a price is valued at zero and
   * is never traded. Holdings never go negative: positions at or below
   * the dust threshold are closed.
   */
  class IndexPortfolio
  {
  public:
    typedef std::map<SubnetId, double> HoldingsMap;

    /**
     * @param initialCapital Starting cash.
     * @param minTradeValue Trades whose absolute notional does not exceed
     *        this are skipped.
     * @param dustThreshold Quantity at or below which a position is removed.
     * @throws IndexPortfolioException for non-positive capital or negative
     *         thresholds.
     */
    explicit IndexPortfolio(double initialCapital,
			    double minTradeValue = 0.01,
			    double dustThreshold = 0.001);

    /**
     * @brief Emission-proportional weights over the top N subnets.
     *
     * Subnets are ranked by emission descending, ties broken by subnet id.
     * Non-positive or non-finite emissions never receive weight.
     * @return Weights summing to one, or an empty map when the top N carry
     * no emission.
     */
    static TargetWeights calculateTargetWeights(const EmissionMap& emissions,
						unsigned int topN);

    /**
     * @brief Cash plus market value of holdings. Missing prices count as zero.
     */
    double getPortfolioValue(const PriceMap& prices) const;

    /**
     * @brief Trade toward target weights.
     *
     * Every subnet in the target or currently held gets a trade of
     * (value * weight - quantity * price). Trades at or below the minimum
     * trade value are dropped. A trade against a missing or zero price is
     * skipped as stale. Each executed trade costs
     * |notional| * (costBps + slippageBps) / 10000, and cash is debited by
     * the notional plus cost.
     *
     * @return Cost charged by this call.
     */
    double rebalance(const TargetWeights& targetWeights,
		     const PriceMap& prices,
		     double transactionCostBps,
		     double slippageBps);

    /**
     * @brief Compound every holding by its staking yield over a number of
     * hours. Prices are not needed, so yield accrues even for stale subnets.
     */
    void applyStakingYield(const StakingYieldModel& yieldModel,
			   const EmissionSnapshot& snapshot,
			   double hours);

    /**
     * @brief Current weight of each holding; empty when the value is not positive.
     */
    TargetWeights getCurrentWeights(const PriceMap& prices) const;

    double getCash() const
    {
      return mCash;
    }

    double getInitialCapital() const
    {
      return mInitialCapital;
    }

    const HoldingsMap& getHoldings() const
    {
      return mHoldings;
    }

    double getQuantity(SubnetId subnet) const;

    double getCumulativeTransactionCost() const
    {
      return mCumulativeTransactionCost;
    }

    unsigned long getNumTradesExecuted() const
    {
      return mNumTradesExecuted;
    }

    double getTradedNotional() const
    {
      return mTradedNotional;
    }

    unsigned long getNumStaleTradesSkipped() const
    {
      return mNumStaleTradesSkipped;
    }

    /**
     * @brief Subnets whose trades were skipped for lack of a price during
     * the most recent rebalance.
     */
    const std::vector<SubnetId>& getLastStaleSubnets() const
    {
      return mLastStaleSubnets;
    }

  private:
    static double lookupPrice(const PriceMap& prices, SubnetId subnet);

  private:
    double mInitialCapital;
    double mMinTradeValue;
    double mDustThreshold;
    double mCash;
    HoldingsMap mHoldings;
    double mCumulativeTransactionCost;
    unsigned long mNumTradesExecuted;
    double mTradedNotional;
    unsigned long mNumStaleTradesSkipped;
    std::vector<SubnetId> mLastStaleSubnets;
  };
} // namespace tao_index

#endif
