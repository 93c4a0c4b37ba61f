// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include "SnapshotLoader.h"
#include "IndexSimException.h"

namespace tao_index
{
  SnapshotTable::SnapshotTable(std::vector<EmissionSnapshot> snapshots,
			       std::map<SubnetId, PriceSeries> priceSeries)
    : mSnapshots(std::move(snapshots)),
      mPriceSeries(std::move(priceSeries)),
      mSubnets(),
      mPricesByTick(mSnapshots.size())
  {
    for (const auto& entry : mPriceSeries)
      {
	if (entry.second.size() != mSnapshots.size())
	  throw SnapshotLoaderException("SnapshotTable - price series for subnet " +
					std::to_string(entry.first) +
					" is not aligned with the snapshots");

	mSubnets.push_back(entry.first);

	for (size_t tick = 0; tick < entry.second.size(); ++tick)
	  mPricesByTick[tick].emplace(entry.first, entry.second[tick]);
      }
  }

  const EmissionSnapshot& SnapshotTable::getSnapshot(size_t tick) const
  {
    if (tick >= mSnapshots.size())
      throw SnapshotLoaderException("SnapshotTable::getSnapshot - tick " + std::to_string(tick) + " out of range");

    return mSnapshots[tick];
  }

  const SnapshotTable::PriceSeries& SnapshotTable::getPriceSeries(SubnetId subnet) const
  {
    auto it = mPriceSeries.find(subnet);
    if (it == mPriceSeries.end())
      throw SnapshotLoaderException("SnapshotTable::getPriceSeries - no prices for subnet " + std::to_string(subnet));

    return it->second;
  }

  double SnapshotTable::getPrice(SubnetId subnet, size_t tick) const
  {
    auto it = mPriceSeries.find(subnet);
    if (it == mPriceSeries.end() || tick >= it->second.size())
      return 0.0;

    return it->second[tick];
  }

  const PriceMap& SnapshotTable::getPricesAt(size_t tick) const
  {
    if (tick >= mPricesByTick.size())
      throw SnapshotLoaderException("SnapshotTable::getPricesAt - tick " + std::to_string(tick) + " out of range");

    return mPricesByTick[tick];
  }

  SnapshotLoader::SnapshotLoader(const RebalanceConfiguration& configuration)
    : mDampingFactor(configuration.getPriceDampingFactor()),
      mClipBound(configuration.getPriceClipBound()),
      mBasePrice(configuration.getBasePrice())
  {}

  static bool isUsableRate(double rate)
  {
    return std::isfinite(rate) && rate > 0.0;
  }

  SnapshotTable::PriceSeries SnapshotLoader::createPriceSeries(const std::vector<double>& emissionRates) const
  {
    SnapshotTable::PriceSeries prices;
    prices.reserve(emissionRates.size());

    double lastPrice = mBasePrice;

    for (size_t i = 0; i < emissionRates.size(); ++i)
      {
	double change = 0.0;

	if (i > 0 && isUsableRate(emissionRates[i - 1]) && isUsableRate(emissionRates[i]))
	  change = emissionRates[i] / emissionRates[i - 1] - 1.0;

	change = std::max(-mClipBound, std::min(mClipBound, change * mDampingFactor));

	double price = lastPrice * (1.0 + change);

	// forward fill
	if (!std::isfinite(price) || price <= 0.0)
	  price = lastPrice;

	prices.push_back(price);
	lastPrice = price;
      }

    return prices;
  }

  std::shared_ptr<const SnapshotTable>
  SnapshotLoader::load(const std::vector<EmissionSnapshot>& snapshots) const
  {
    if (snapshots.empty())
      throw SnapshotLoaderException("SnapshotLoader::load - snapshot sequence is empty");

    bool anyEmission = false;
    std::set<SubnetId> subnets;

    for (size_t i = 0; i < snapshots.size(); ++i)
      {
	const ptime& timestamp = snapshots[i].getTimestamp();

	if (timestamp.is_special())
	  throw SnapshotLoaderException("SnapshotLoader::load - snapshot " + std::to_string(i) +
					" has an invalid timestamp");

	if (i > 0 && !(snapshots[i - 1].getTimestamp() < timestamp))
	  throw SnapshotLoaderException("SnapshotLoader::load - snapshots are not strictly increasing at " +
					boost::posix_time::to_simple_string(timestamp));

	for (const auto& entry : snapshots[i].getEmissions())
	  {
	    subnets.insert(entry.first);
	    if (isUsableRate(entry.second))
	      anyEmission = true;
	  }
      }

    if (!anyEmission)
      throw SnapshotLoaderException("SnapshotLoader::load - no snapshot carries any emission");

    if (snapshots.size() < 2)
      throw InsufficientDataException("SnapshotLoader::load - at least two snapshots are required, found " +
				      std::to_string(snapshots.size()));

    std::map<SubnetId, SnapshotTable::PriceSeries> priceSeries;

    for (SubnetId subnet : subnets)
      {
	std::vector<double> rates;
	rates.reserve(snapshots.size());

	for (const auto& snapshot : snapshots)
	  rates.push_back(snapshot.getEmission(subnet));

	priceSeries.emplace(subnet, createPriceSeries(rates));
      }

    return std::make_shared<const SnapshotTable>(snapshots, std::move(priceSeries));
  }
} // namespace tao_index
