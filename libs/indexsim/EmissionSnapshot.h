// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_EMISSION_SNAPSHOT_H
#define __TAO_INDEX_EMISSION_SNAPSHOT_H 1

#include <cstdint>
#include <map>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace tao_index
{
  using boost::posix_time::ptime;

  typedef unsigned int SubnetId;

  // Subnet -> share of network emission for one period
  typedef std::map<SubnetId, double> EmissionMap;

  // Subnet -> total token supply
  typedef std::map<SubnetId, double> SupplyMap;

  // Subnet -> price at one tick
  typedef std::map<SubnetId, double> PriceMap;

  // Subnet -> portfolio weight
  typedef std::map<SubnetId, double> TargetWeights;

  /**
   * @class EmissionSnapshot
   * @brief Emission fractions observed at one (timestamp, block) sample.
   *
   * Fractions are not required to sum to one. Subnets with no emission
   * are simply absent. The supply map is optional and is empty when the
   * data source carries no supply information.
   */
  class EmissionSnapshot
  {
  public:
    EmissionSnapshot(const ptime& timestamp,
		     int64_t block,
		     const EmissionMap& emissions,
		     const SupplyMap& supplies = SupplyMap())
      : mTimestamp(timestamp),
	mBlock(block),
	mEmissions(emissions),
	mSupplies(supplies)
    {}

    EmissionSnapshot(const EmissionSnapshot& rhs) = default;
    EmissionSnapshot& operator=(const EmissionSnapshot& rhs) = default;

    const ptime& getTimestamp() const
    {
      return mTimestamp;
    }

    int64_t getBlock() const
    {
      return mBlock;
    }

    const EmissionMap& getEmissions() const
    {
      return mEmissions;
    }

    const SupplyMap& getSupplies() const
    {
      return mSupplies;
    }

    /**
     * @brief Emission fraction of a subnet, 0.0 when absent.
     */
    double getEmission(SubnetId subnet) const
    {
      EmissionMap::const_iterator it = mEmissions.find(subnet);
      return (it == mEmissions.end()) ? 0.0 : it->second;
    }

    bool hasSupply(SubnetId subnet) const
    {
      return mSupplies.find(subnet) != mSupplies.end();
    }

    double getSupply(SubnetId subnet) const
    {
      SupplyMap::const_iterator it = mSupplies.find(subnet);
      return (it == mSupplies.end()) ? 0.0 : it->second;
    }

  private:
    ptime mTimestamp;
    int64_t mBlock;
    EmissionMap mEmissions;
    SupplyMap mSupplies;
  };

  inline bool operator<(const EmissionSnapshot& lhs, const EmissionSnapshot& rhs)
  {
    return lhs.getTimestamp() < rhs.getTimestamp();
  }
} // namespace tao_index

#endif
