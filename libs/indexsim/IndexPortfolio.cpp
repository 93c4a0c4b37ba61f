// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>
#include "IndexPortfolio.h"
#include "IndexSimException.h"

namespace tao_index
{
  IndexPortfolio::IndexPortfolio(double initialCapital,
				 double minTradeValue,
				 double dustThreshold)
    : mInitialCapital(initialCapital),
      mMinTradeValue(minTradeValue),
      mDustThreshold(dustThreshold),
      mCash(initialCapital),
      mHoldings(),
      mCumulativeTransactionCost(0.0),
      mNumTradesExecuted(0),
      mTradedNotional(0.0),
      mNumStaleTradesSkipped(0),
      mLastStaleSubnets()
  {
    if (!std::isfinite(initialCapital) || initialCapital <= 0.0)
      throw IndexPortfolioException("IndexPortfolio - initial capital must be positive");

    if (!(minTradeValue >= 0.0) || !(dustThreshold >= 0.0))
      throw IndexPortfolioException("IndexPortfolio - trade and dust thresholds must be non-negative");
  }

  TargetWeights IndexPortfolio::calculateTargetWeights(const EmissionMap& emissions,
						       unsigned int topN)
  {
    std::vector<std::pair<SubnetId, double>> ranked;
    ranked.reserve(emissions.size());

    for (const auto& entry : emissions)
      {
	double emission = std::isfinite(entry.second) ? std::max(entry.second, 0.0) : 0.0;
	ranked.emplace_back(entry.first, emission);
      }

    std::stable_sort(ranked.begin(), ranked.end(),
		     [](const std::pair<SubnetId, double>& lhs,
			const std::pair<SubnetId, double>& rhs)
		     {
		       return lhs.second > rhs.second;
		     });

    if (ranked.size() > topN)
      ranked.resize(topN);

    double totalEmission = 0.0;
    for (const auto& entry : ranked)
      totalEmission += entry.second;

    TargetWeights weights;
    if (!(totalEmission > 0.0))
      return weights;

    for (const auto& entry : ranked)
      weights.emplace(entry.first, entry.second / totalEmission);

    return weights;
  }

  double IndexPortfolio::lookupPrice(const PriceMap& prices, SubnetId subnet)
  {
    PriceMap::const_iterator it = prices.find(subnet);
    if (it == prices.end() || !std::isfinite(it->second))
      return 0.0;

    return it->second;
  }

  double IndexPortfolio::getPortfolioValue(const PriceMap& prices) const
  {
    double holdingsValue = 0.0;

    for (const auto& holding : mHoldings)
      holdingsValue += holding.second * lookupPrice(prices, holding.first);

    return mCash + holdingsValue;
  }

  double IndexPortfolio::getQuantity(SubnetId subnet) const
  {
    HoldingsMap::const_iterator it = mHoldings.find(subnet);
    return (it == mHoldings.end()) ? 0.0 : it->second;
  }

  double IndexPortfolio::rebalance(const TargetWeights& targetWeights,
				   const PriceMap& prices,
				   double transactionCostBps,
				   double slippageBps)
  {
    mLastStaleSubnets.clear();

    const double portfolioValue = getPortfolioValue(prices);
    const double costRate = (transactionCostBps + slippageBps) / 10000.0;

    std::set<SubnetId> universe;
    for (const auto& w : targetWeights)
      universe.insert(w.first);
    for (const auto& h : mHoldings)
      universe.insert(h.first);

    // Trades are sized against the pre-trade value, then executed
    std::vector<std::pair<SubnetId, double>> trades;
    for (SubnetId subnet : universe)
      {
	TargetWeights::const_iterator w = targetWeights.find(subnet);
	const double targetValue = (w == targetWeights.end()) ? 0.0 : portfolioValue * w->second;
	const double currentValue = getQuantity(subnet) * lookupPrice(prices, subnet);
	const double tradeValue = targetValue - currentValue;

	if (std::fabs(tradeValue) > mMinTradeValue)
	  trades.emplace_back(subnet, tradeValue);
      }

    double totalCost = 0.0;

    for (const auto& trade : trades)
      {
	const SubnetId subnet = trade.first;
	const double tradeValue = trade.second;
	const double price = lookupPrice(prices, subnet);

	if (!(price > 0.0))
	  {
	    mLastStaleSubnets.push_back(subnet);
	    ++mNumStaleTradesSkipped;
	    continue;
	  }

	const double cost = std::fabs(tradeValue) * costRate;
	const double newQuantity = getQuantity(subnet) + tradeValue / price;

	if (newQuantity > mDustThreshold)
	  mHoldings[subnet] = newQuantity;
	else
	  mHoldings.erase(subnet);

	mCash -= (tradeValue + cost);
	totalCost += cost;
	mTradedNotional += std::fabs(tradeValue);
	++mNumTradesExecuted;
      }

    mCumulativeTransactionCost += totalCost;
    return totalCost;
  }

  void IndexPortfolio::applyStakingYield(const StakingYieldModel& yieldModel,
					 const EmissionSnapshot& snapshot,
					 double hours)
  {
    for (auto& holding : mHoldings)
      {
	if (holding.second <= 0.0)
	  continue;

	boost::optional<double> supply;
	if (snapshot.hasSupply(holding.first))
	  supply = snapshot.getSupply(holding.first);

	const double apy = yieldModel.estimateApy(snapshot.getEmission(holding.first), supply);
	const double hourlyRate = hourlyRateFromApy(apy);

	holding.second *= std::pow(1.0 + hourlyRate, hours);
      }
  }

  TargetWeights IndexPortfolio::getCurrentWeights(const PriceMap& prices) const
  {
    TargetWeights weights;
    const double value = getPortfolioValue(prices);

    if (!(value > 0.0))
      return weights;

    for (const auto& holding : mHoldings)
      weights.emplace(holding.first, holding.second * lookupPrice(prices, holding.first) / value);

    return weights;
  }
} // namespace tao_index
