#include <fstream>
#include <sstream>
#include <stdexcept>
#include "TestUtils.h"

using namespace boost::gregorian;
using namespace boost::posix_time;

ptime makeHourlyTimestamp(long hour)
{
  return ptime(date(2024, Jan, 1), hours(hour));
}

EmissionSnapshot makeSnapshot(long hour,
			      const EmissionMap& emissions,
			      const SupplyMap& supplies)
{
  return EmissionSnapshot(makeHourlyTimestamp(hour), 4000000 + hour * 300, emissions, supplies);
}

std::vector<EmissionSnapshot> makeHourlySnapshots(const std::vector<EmissionMap>& emissions)
{
  std::vector<EmissionSnapshot> snapshots;
  for (size_t i = 0; i < emissions.size(); ++i)
    snapshots.push_back(makeSnapshot(static_cast<long>(i), emissions[i]));

  return snapshots;
}

std::shared_ptr<const SnapshotTable>
makeTableWithPrices(const std::vector<EmissionMap>& emissions,
		    const std::map<SubnetId, std::vector<double>>& prices)
{
  return std::make_shared<const SnapshotTable>(makeHourlySnapshots(emissions), prices);
}

RebalanceConfiguration makeFrictionlessConfiguration(double initialCapital)
{
  RebalanceConfiguration configuration;
  configuration.setInitialCapital(initialCapital);
  configuration.setTransactionCostBps(0.0);
  configuration.setSlippageBps(0.0);
  configuration.setRiskFreeRate(0.0);
  configuration.setYieldModelName("none");
  return configuration;
}

TemporaryDirectory::TemporaryDirectory()
  : mPath(boost::filesystem::temp_directory_path() /
	  boost::filesystem::unique_path("taoindex-test-%%%%-%%%%-%%%%"))
{
  boost::filesystem::create_directories(mPath);
}

TemporaryDirectory::~TemporaryDirectory()
{
  boost::system::error_code ec;
  boost::filesystem::remove_all(mPath, ec);
}

std::string TemporaryDirectory::filePath(const std::string& fileName) const
{
  return (mPath / fileName).string();
}

std::string TemporaryDirectory::writeFile(const std::string& fileName, const std::string& contents) const
{
  const std::string fullPath = filePath(fileName);
  std::ofstream out(fullPath.c_str());
  if (!out)
    throw std::runtime_error("TemporaryDirectory::writeFile - cannot create " + fullPath);

  out << contents;
  return fullPath;
}

std::string readWholeFile(const std::string& fileName)
{
  std::ifstream in(fileName.c_str());
  if (!in)
    throw std::runtime_error("readWholeFile - cannot open " + fileName);

  std::stringstream contents;
  contents << in.rdbuf();
  return contents.str();
}
