#ifndef __TAO_INDEX_TEST_UTILS_H
#define __TAO_INDEX_TEST_UTILS_H 1

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "EmissionSnapshot.h"
#include "RebalanceConfiguration.h"
#include "SnapshotLoader.h"

using namespace tao_index;

// 2024-01-01 00:00 plus the given number of hours
ptime makeHourlyTimestamp(long hour);

EmissionSnapshot makeSnapshot(long hour,
			      const EmissionMap& emissions,
			      const SupplyMap& supplies = SupplyMap());

// One snapshot per hour starting at hour 0
std::vector<EmissionSnapshot> makeHourlySnapshots(const std::vector<EmissionMap>& emissions);

///
/// Snapshot table with caller supplied prices instead of emission derived
/// ones. Every price series must have one entry per emission map.
///
std::shared_ptr<const SnapshotTable>
makeTableWithPrices(const std::vector<EmissionMap>& emissions,
		    const std::map<SubnetId, std::vector<double>>& prices);

// Configuration with no costs, no yield and a zero risk-free rate
RebalanceConfiguration makeFrictionlessConfiguration(double initialCapital = 1000000.0);

///
/// Directory under the system temp path, removed with its contents on
/// destruction.
///
class TemporaryDirectory
{
public:
  TemporaryDirectory();
  ~TemporaryDirectory();

  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

  const boost::filesystem::path& getPath() const
  {
    return mPath;
  }

  // Write a file inside the directory and return its full path
  std::string writeFile(const std::string& fileName, const std::string& contents) const;

  std::string filePath(const std::string& fileName) const;

private:
  boost::filesystem::path mPath;
};

std::string readWholeFile(const std::string& fileName);

#endif
