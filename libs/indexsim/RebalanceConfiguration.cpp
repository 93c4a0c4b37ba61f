// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cmath>
#include <set>
#include <boost/algorithm/string.hpp>
#include "RebalanceConfiguration.h"
#include "IndexSimException.h"

namespace tao_index
{
  static void requireFiniteNonNegative(double value, const std::string& what)
  {
    if (!std::isfinite(value) || value < 0.0)
      throw RebalanceConfigurationException("RebalanceConfiguration - " + what + " must be a finite non-negative number");
  }

  static void requireFinitePositive(double value, const std::string& what)
  {
    if (!std::isfinite(value) || value <= 0.0)
      throw RebalanceConfigurationException("RebalanceConfiguration - " + what + " must be a finite positive number");
  }

  RebalanceConfiguration::RebalanceConfiguration()
    : mInitialCapital(1000000.0),
      mTransactionCostBps(10.0),
      mSlippageBps(5.0),
      mTopN(20),
      mRiskFreeRate(0.05),
      mCadences(getDefaultCadences()),
      mYieldModelName("emission"),
      mEmissionYieldScale(0.0001),
      mPriceDampingFactor(0.1),
      mPriceClipBound(0.5),
      mBasePrice(100.0),
      mMinTradeValue(0.01),
      mDustThreshold(0.001),
      mTicksPerYear(24.0 * 365.0),
      mWeightScheduleFile()
  {}

  void RebalanceConfiguration::setInitialCapital(double capital)
  {
    requireFinitePositive(capital, "initial capital");
    mInitialCapital = capital;
  }

  void RebalanceConfiguration::setTransactionCostBps(double bps)
  {
    requireFiniteNonNegative(bps, "transaction cost bps");
    mTransactionCostBps = bps;
  }

  void RebalanceConfiguration::setSlippageBps(double bps)
  {
    requireFiniteNonNegative(bps, "slippage bps");
    mSlippageBps = bps;
  }

  void RebalanceConfiguration::setTopN(unsigned int topN)
  {
    if (topN == 0)
      throw RebalanceConfigurationException("RebalanceConfiguration - top N must be at least 1");

    mTopN = topN;
  }

  void RebalanceConfiguration::setRiskFreeRate(double rate)
  {
    if (!std::isfinite(rate))
      throw RebalanceConfigurationException("RebalanceConfiguration - risk free rate must be finite");

    mRiskFreeRate = rate;
  }

  void RebalanceConfiguration::setCadences(const std::vector<CadenceSpec>& cadences)
  {
    if (cadences.empty())
      throw RebalanceConfigurationException("RebalanceConfiguration - at least one cadence is required");

    std::set<std::string> names;
    for (const auto& cadence : cadences)
      {
	if (!names.insert(cadence.getName()).second)
	  throw RebalanceConfigurationException("RebalanceConfiguration - duplicate cadence " + cadence.getName());
      }

    mCadences = cadences;
  }

  void RebalanceConfiguration::setYieldModelName(const std::string& name)
  {
    std::string lowered = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    if (lowered != "none" && lowered != "emission" && lowered != "alpha")
      throw RebalanceConfigurationException("RebalanceConfiguration - unknown yield model '" + name + "'");

    mYieldModelName = lowered;
  }

  void RebalanceConfiguration::setEmissionYieldScale(double scale)
  {
    requireFiniteNonNegative(scale, "emission yield scale");
    mEmissionYieldScale = scale;
  }

  void RebalanceConfiguration::setPriceDampingFactor(double factor)
  {
    requireFiniteNonNegative(factor, "price damping factor");
    mPriceDampingFactor = factor;
  }

  void RebalanceConfiguration::setPriceClipBound(double bound)
  {
    requireFinitePositive(bound, "price clip bound");

    // A bound of one or more would allow a -100% step and a zero price
    if (bound >= 1.0)
      throw RebalanceConfigurationException("RebalanceConfiguration - price clip bound must be below 1.0");

    mPriceClipBound = bound;
  }

  void RebalanceConfiguration::setBasePrice(double price)
  {
    requireFinitePositive(price, "base price");
    mBasePrice = price;
  }

  void RebalanceConfiguration::setMinTradeValue(double value)
  {
    requireFiniteNonNegative(value, "minimum trade value");
    mMinTradeValue = value;
  }

  void RebalanceConfiguration::setDustThreshold(double threshold)
  {
    requireFiniteNonNegative(threshold, "dust threshold");
    mDustThreshold = threshold;
  }

  void RebalanceConfiguration::setTicksPerYear(double ticks)
  {
    requireFinitePositive(ticks, "ticks per year");
    mTicksPerYear = ticks;
  }

  void RebalanceConfiguration::setWeightScheduleFile(const std::string& path)
  {
    mWeightScheduleFile = boost::algorithm::trim_copy(path);
  }

  std::vector<CadenceSpec> RebalanceConfiguration::getCadencesWithBenchmark() const
  {
    std::vector<CadenceSpec> cadences(mCadences);

    for (const auto& cadence : cadences)
      if (cadence.isContinuous())
	return cadences;

    cadences.push_back(CadenceSpec::continuous());
    return cadences;
  }

  void RebalanceConfiguration::print(std::ostream& os) const
  {
    os << "Configuration:" << std::endl;
    os << "  Initial Capital: " << mInitialCapital << std::endl;
    os << "  Transaction Cost: " << mTransactionCostBps << " bps" << std::endl;
    os << "  Slippage: " << mSlippageBps << " bps" << std::endl;
    os << "  Top N Subnets: " << mTopN << std::endl;
    os << "  Risk Free Rate: " << mRiskFreeRate << std::endl;
    os << "  Yield Model: " << mYieldModelName << std::endl;

    os << "  Frequencies:";
    for (const auto& cadence : mCadences)
      os << " " << cadence.getName();
    os << std::endl;

    if (!mWeightScheduleFile.empty())
      os << "  Weight Schedule: " << mWeightScheduleFile << std::endl;
  }
} // namespace tao_index
