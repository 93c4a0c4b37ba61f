// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_WEIGHT_SCHEDULE_H
#define __TAO_INDEX_WEIGHT_SCHEDULE_H 1

#include <utility>
#include <vector>
#include "EmissionSnapshot.h"

namespace tao_index
{
  /**
   * @class WeightSchedule
   * @brief Published index weights keyed by the instant they take effect.
   *
   * Lookup returns the entry with the latest effective time that is not
   * after the query time.
   */
  class WeightSchedule
  {
  public:
    typedef std::pair<ptime, TargetWeights> Entry;
    typedef std::vector<Entry>::const_iterator ConstIterator;

    WeightSchedule()
      : mEntries()
    {}

    /**
     * @brief Add weights effective from a given instant.
     *
     * Weights are normalized to sum to one. Entries may be added in any
     * order.
     * @throws WeightScheduleException for a duplicate instant, an invalid
     * time, a negative weight or weights that sum to zero.
     */
    void addEntry(const ptime& effectiveTime, const TargetWeights& weights);

    /**
     * @return Pointer to the weights in effect at the given time, or
     * nullptr when the time precedes the first entry.
     */
    const TargetWeights* findWeightsInEffect(const ptime& when) const;

    size_t getNumEntries() const
    {
      return mEntries.size();
    }

    bool empty() const
    {
      return mEntries.empty();
    }

    ConstIterator beginEntries() const
    {
      return mEntries.begin();
    }

    ConstIterator endEntries() const
    {
      return mEntries.end();
    }

  private:
    std::vector<Entry> mEntries;
  };
} // namespace tao_index

#endif
