// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_TARGET_WEIGHT_POLICY_H
#define __TAO_INDEX_TARGET_WEIGHT_POLICY_H 1

#include <memory>
#include <string>
#include "EmissionSnapshot.h"
#include "IndexPortfolio.h"
#include "WeightSchedule.h"
#include "IndexSimException.h"

namespace tao_index
{
  /**
   * @class TargetWeightPolicy
   * @brief Source of the weights a rebalance trades toward.
   *
   * An empty result means no rebalance is possible at that tick.
   */
  class TargetWeightPolicy
  {
  public:
    virtual ~TargetWeightPolicy() = default;

    virtual TargetWeights getTargetWeights(const EmissionSnapshot& snapshot) const = 0;

    virtual std::string getName() const = 0;
  };

  // Top N subnets by current emission, weighted by emission share
  class EmissionWeightPolicy : public TargetWeightPolicy
  {
  public:
    explicit EmissionWeightPolicy(unsigned int topN)
      : mTopN(topN)
    {
      if (topN == 0)
	throw IndexSimException("EmissionWeightPolicy - top N must be at least 1");
    }

    TargetWeights getTargetWeights(const EmissionSnapshot& snapshot) const override
    {
      return IndexPortfolio::calculateTargetWeights(snapshot.getEmissions(), mTopN);
    }

    std::string getName() const override
    {
      return "Emission top " + std::to_string(mTopN);
    }

    unsigned int getTopN() const
    {
      return mTopN;
    }

  private:
    unsigned int mTopN;
  };

  // Published weights looked up by snapshot time
  class ScheduledWeightPolicy : public TargetWeightPolicy
  {
  public:
    explicit ScheduledWeightPolicy(std::shared_ptr<const WeightSchedule> schedule)
      : mSchedule(schedule)
    {
      if (!mSchedule || mSchedule->empty())
	throw WeightScheduleException("ScheduledWeightPolicy - weight schedule is empty");
    }

    TargetWeights getTargetWeights(const EmissionSnapshot& snapshot) const override
    {
      const TargetWeights* weights = mSchedule->findWeightsInEffect(snapshot.getTimestamp());
      return weights ? *weights : TargetWeights();
    }

    std::string getName() const override
    {
      return "Weight schedule (" + std::to_string(mSchedule->getNumEntries()) + " periods)";
    }

  private:
    std::shared_ptr<const WeightSchedule> mSchedule;
  };
} // namespace tao_index

#endif
