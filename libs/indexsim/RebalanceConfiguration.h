// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_REBALANCE_CONFIGURATION_H
#define __TAO_INDEX_REBALANCE_CONFIGURATION_H 1

#include <ostream>
#include <string>
#include <vector>
#include "CadenceSpec.h"

namespace tao_index
{
  /**
   * @class RebalanceConfiguration
   * @brief All tunable inputs of a cadence sweep.
   *
   * Built once by the caller (defaults, then an optional configuration
   * file, then command line overrides) and handed by const reference to
   * the loader, the simulator and the analyzer. Every setter validates
   * its argument and throws RebalanceConfigurationException on a bad
   * value, so a constructed object is always usable.
   */
  class RebalanceConfiguration
  {
  public:
    RebalanceConfiguration();

    double getInitialCapital() const { return mInitialCapital; }
    double getTransactionCostBps() const { return mTransactionCostBps; }
    double getSlippageBps() const { return mSlippageBps; }
    unsigned int getTopN() const { return mTopN; }
    double getRiskFreeRate() const { return mRiskFreeRate; }
    const std::vector<CadenceSpec>& getCadences() const { return mCadences; }
    const std::string& getYieldModelName() const { return mYieldModelName; }
    double getEmissionYieldScale() const { return mEmissionYieldScale; }
    double getPriceDampingFactor() const { return mPriceDampingFactor; }
    double getPriceClipBound() const { return mPriceClipBound; }
    double getBasePrice() const { return mBasePrice; }
    double getMinTradeValue() const { return mMinTradeValue; }
    double getDustThreshold() const { return mDustThreshold; }
    double getTicksPerYear() const { return mTicksPerYear; }
    const std::string& getWeightScheduleFile() const { return mWeightScheduleFile; }

    void setInitialCapital(double capital);
    void setTransactionCostBps(double bps);
    void setSlippageBps(double bps);
    void setTopN(unsigned int topN);
    void setRiskFreeRate(double rate);
    void setCadences(const std::vector<CadenceSpec>& cadences);
    void setYieldModelName(const std::string& name);
    void setEmissionYieldScale(double scale);
    void setPriceDampingFactor(double factor);
    void setPriceClipBound(double bound);
    void setBasePrice(double price);
    void setMinTradeValue(double value);
    void setDustThreshold(double threshold);
    void setTicksPerYear(double ticks);
    void setWeightScheduleFile(const std::string& path);

    /**
     * @brief Configured cadences with the continuous benchmark appended
     * when the list does not already contain it.
     */
    std::vector<CadenceSpec> getCadencesWithBenchmark() const;

    void print(std::ostream& os) const;

  private:
    double mInitialCapital;
    double mTransactionCostBps;
    double mSlippageBps;
    unsigned int mTopN;
    double mRiskFreeRate;
    std::vector<CadenceSpec> mCadences;
    std::string mYieldModelName;
    double mEmissionYieldScale;
    double mPriceDampingFactor;
    double mPriceClipBound;
    double mBasePrice;
    double mMinTradeValue;
    double mDustThreshold;
    double mTicksPerYear;
    std::string mWeightScheduleFile;
  };
} // namespace tao_index

#endif
