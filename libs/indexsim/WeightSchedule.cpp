// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>
#include "WeightSchedule.h"
#include "IndexSimException.h"

namespace tao_index
{
  namespace
  {
    bool entryBefore(const WeightSchedule::Entry& entry, const ptime& when)
    {
      return entry.first < when;
    }

    bool timeBefore(const ptime& when, const WeightSchedule::Entry& entry)
    {
      return when < entry.first;
    }
  }

  void WeightSchedule::addEntry(const ptime& effectiveTime, const TargetWeights& weights)
  {
    if (effectiveTime.is_special())
      throw WeightScheduleException("WeightSchedule::addEntry - invalid effective time");

    double total = 0.0;
    for (const auto& w : weights)
      {
	if (!std::isfinite(w.second) || w.second < 0.0)
	  throw WeightScheduleException("WeightSchedule::addEntry - invalid weight for subnet " +
					std::to_string(w.first));
	total += w.second;
      }

    if (!(total > 0.0))
      throw WeightScheduleException("WeightSchedule::addEntry - weights effective " +
				    boost::posix_time::to_simple_string(effectiveTime) +
				    " sum to zero");

    TargetWeights normalized;
    for (const auto& w : weights)
      if (w.second > 0.0)
	normalized.emplace(w.first, w.second / total);

    auto pos = std::lower_bound(mEntries.begin(), mEntries.end(), effectiveTime, entryBefore);
    if (pos != mEntries.end() && pos->first == effectiveTime)
      throw WeightScheduleException("WeightSchedule::addEntry - duplicate effective time " +
				    boost::posix_time::to_simple_string(effectiveTime));

    mEntries.insert(pos, Entry(effectiveTime, normalized));
  }

  const TargetWeights* WeightSchedule::findWeightsInEffect(const ptime& when) const
  {
    auto pos = std::upper_bound(mEntries.begin(), mEntries.end(), when, timeBefore);
    if (pos == mEntries.begin())
      return nullptr;

    return &(std::prev(pos)->second);
  }
} // namespace tao_index
