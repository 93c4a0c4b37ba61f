#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include "ReportCsvWriters.h"
#include "IndexIOException.h"
#include "TestUtils.h"

using namespace tao_index;

namespace
{
  SimulationResult makeResult(const std::string& cadence, double totalReturn, double sharpe)
  {
    std::vector<NavRecord> history;
    history.emplace_back(makeHourlyTimestamp(0), 1000000.0, 0.0);
    history.emplace_back(makeHourlyTimestamp(1), 1000000.0 * (1.0 + totalReturn), -12.5);

    PerformanceSummary summary;
    summary.totalReturn = totalReturn;
    summary.sharpeRatio = sharpe;
    summary.rebalanceCount = 2;
    summary.totalTransactionCost = 12.5;
    summary.transactionCostPct = 0.0000125;
    summary.finalNav = history.back().nav;

    return SimulationResult(CadenceSpec::fromString(cadence), history, summary);
  }

  std::vector<std::string> splitLines(const std::string& text)
  {
    std::vector<std::string> lines;
    boost::split(lines, boost::trim_copy(text), boost::is_any_of("\n"));
    return lines;
  }
}

TEST_CASE("ComparisonReportCsvWriter", "[ReportCsvWriters]")
{
  TemporaryDirectory dir;
  ComparisonReport report =
    ComparativeAnalyzer::compare({ makeResult("1d", 0.01, 1.0), makeResult("continuous", 0.02, 2.0) },
				 CadenceSpec::continuous(), 8760.0);

  const std::string path = dir.filePath("comparison_report.csv");
  {
    ComparisonReportCsvWriter writer(path);
    writer.writeReport(report);
  }

  std::vector<std::string> lines = splitLines(readWholeFile(path));

  REQUIRE(lines.size() == 3);
  REQUIRE(lines[0] == ComparisonReportCsvWriter::getHeader());
  REQUIRE(boost::starts_with(lines[1], "continuous,2,"));
  REQUIRE(boost::starts_with(lines[2], "1d,1,"));

  std::vector<std::string> fields;
  boost::split(fields, lines[2], boost::is_any_of(","));
  REQUIRE(fields.size() == 12);
  REQUIRE(fields[6] == "2");
  REQUIRE(fields[7] == "12.5");
  REQUIRE(fields[8] == "0.00125");

  REQUIRE_THROWS_AS(ComparisonReportCsvWriter(dir.filePath("no/such/dir/report.csv")), ReportWriterException);
}

TEST_CASE("NavHistoryCsvWriter", "[ReportCsvWriters]")
{
  TemporaryDirectory dir;
  std::vector<SimulationResult> results = { makeResult("4h", 0.01, 1.0), makeResult("continuous", 0.02, 2.0) };

  const std::string path = dir.filePath("detailed_nav_history.csv");
  {
    NavHistoryCsvWriter writer(path);
    writer.writeResults(results);
  }

  std::vector<std::string> lines = splitLines(readWholeFile(path));

  REQUIRE(lines.size() == 5);
  REQUIRE(lines[0] == "timestamp,nav,cash,frequency");
  REQUIRE(lines[1] == "2024-01-01 00:00:00,1000000,0,4h");
  REQUIRE(lines[2] == "2024-01-01 01:00:00,1010000,-12.5,4h");
  REQUIRE(lines[4] == "2024-01-01 01:00:00,1020000,-12.5,continuous");
}
