// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_SNAPSHOT_LOADER_H
#define __TAO_INDEX_SNAPSHOT_LOADER_H 1

#include <map>
#include <memory>
#include <vector>
#include "EmissionSnapshot.h"
#include "RebalanceConfiguration.h"

namespace tao_index
{
  /**
   * @class SnapshotTable
   * @brief Time-ordered emission snapshots together with the proxy price
   * series of every subnet observed in any snapshot.
   *
   * Row i of every price series belongs to snapshot i. Prices are always
   * strictly positive. A table is immutable once built by SnapshotLoader
   * and is shared read-only by all cadence runs.
   */
  class SnapshotTable
  {
  public:
    typedef std::vector<double> PriceSeries;

    SnapshotTable(std::vector<EmissionSnapshot> snapshots,
		  std::map<SubnetId, PriceSeries> priceSeries);

    SnapshotTable(const SnapshotTable&) = delete;
    SnapshotTable& operator=(const SnapshotTable&) = delete;

    size_t getNumTicks() const
    {
      return mSnapshots.size();
    }

    const EmissionSnapshot& getSnapshot(size_t tick) const;

    const std::vector<EmissionSnapshot>& getSnapshots() const
    {
      return mSnapshots;
    }

    const ptime& getFirstTimestamp() const
    {
      return mSnapshots.front().getTimestamp();
    }

    const ptime& getLastTimestamp() const
    {
      return mSnapshots.back().getTimestamp();
    }

    /**
     * @brief Every subnet observed across all snapshots, ascending.
     */
    const std::vector<SubnetId>& getSubnets() const
    {
      return mSubnets;
    }

    bool hasPriceSeries(SubnetId subnet) const
    {
      return mPriceSeries.find(subnet) != mPriceSeries.end();
    }

    /**
     * @throws SnapshotLoaderException for an unknown subnet.
     */
    const PriceSeries& getPriceSeries(SubnetId subnet) const;

    /**
     * @brief Price of a subnet at a tick, 0.0 when the subnet was never
     * observed.
     */
    double getPrice(SubnetId subnet, size_t tick) const;

    /**
     * @brief All prices at a tick keyed by subnet.
     */
    const PriceMap& getPricesAt(size_t tick) const;

  private:
    std::vector<EmissionSnapshot> mSnapshots;
    std::map<SubnetId, PriceSeries> mPriceSeries;
    std::vector<SubnetId> mSubnets;
    std::vector<PriceMap> mPricesByTick;
  };

  /**
   * @class SnapshotLoader
   * @brief Validates a snapshot sequence and derives synthetic prices.
   *
   * The proxy price of a subnet moves with the percentage change of its
   * emission fraction. Each step is damped by the configured factor and
   * clipped to +/- the configured bound before compounding from the base
   * price, so emission volatility does not translate one to one into
   * price volatility. A step into or out of a zero emission is treated as
   * no change.
   */
  class SnapshotLoader
  {
  public:
    explicit SnapshotLoader(const RebalanceConfiguration& configuration);

    /**
     * @brief Build the table from parsed snapshots.
     *
     * @throws SnapshotLoaderException if the sequence is empty, carries no
     * emission at all, holds an invalid timestamp, or is not strictly
     * increasing in time.
     * @throws InsufficientDataException if fewer than two snapshots remain.
     */
    std::shared_ptr<const SnapshotTable> load(const std::vector<EmissionSnapshot>& snapshots) const;

    /**
     * @brief Price series derived from one raw emission-rate series.
     */
    SnapshotTable::PriceSeries createPriceSeries(const std::vector<double>& emissionRates) const;

  private:
    double mDampingFactor;
    double mClipBound;
    double mBasePrice;
  };
} // namespace tao_index

#endif
