#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include "EmissionSnapshotReader.h"
#include "IndexIOException.h"
#include "TestUtils.h"

using namespace tao_index;
using namespace boost::gregorian;
using namespace boost::posix_time;

namespace
{
  const char* const FirstDayJson = R"({
  "samples": [
    { "block_timestamp_utc": "2025-02-01T01:00:00Z", "closest_block": 5000300,
      "emissions": { "1": 0.12, "4": "0.30", "19": 0.05 } },
    { "block_timestamp_utc": "2025-02-01T00:00:00Z", "closest_block": 5000000,
      "emissions": { "1": 0.10, "4": 0.31 },
      "supplies": { "1": 2500000, "4": "1200000.5" } }
  ]
})";

  const char* const SecondDayJson = R"({
  "samples": [
    { "block_timestamp_utc": "2025-02-01 01:00:00", "closest_block": 5000301,
      "emissions": { "1": 0.99 } },
    { "block_timestamp_utc": "2025-02-01T02:00:00.000000+00:00", "closest_block": 5000600,
      "emissions": { "1": 0.11, "4": 0.29 } },
    { "closest_block": 5000900, "emissions": { "1": 0.2 } },
    { "block_timestamp_utc": "2025-02-01T04:00:00Z", "emissions": { "one": 0.2 } },
    { "block_timestamp_utc": "2025-02-01T05:00:00Z", "emissions": { "1": "lots" } }
  ]
})";
}

TEST_CASE("EmissionSnapshotReader parses documents", "[EmissionSnapshotReader]")
{
  std::ostringstream log;
  EmissionSnapshotReader reader(&log);

  SECTION("Samples, emissions and supplies")
    {
      std::vector<EmissionSnapshot> snapshots = reader.parseDocument(FirstDayJson, "first");

      REQUIRE(snapshots.size() == 2);

      const EmissionSnapshot& first = snapshots[0];
      REQUIRE(first.getTimestamp() == ptime(date(2025, Feb, 1), hours(1)));
      REQUIRE(first.getBlock() == 5000300);
      REQUIRE(first.getEmissions().size() == 3);
      REQUIRE(first.getEmission(4) == Catch::Approx(0.30));
      REQUIRE(first.getSupplies().empty());

      const EmissionSnapshot& second = snapshots[1];
      REQUIRE(second.hasSupply(1));
      REQUIRE(second.getSupply(4) == Catch::Approx(1200000.5));
    }

  SECTION("Malformed samples are skipped and logged")
    {
      std::vector<EmissionSnapshot> snapshots = reader.parseDocument(SecondDayJson, "second");

      REQUIRE(snapshots.size() == 2);
      REQUIRE(reader.getNumSamplesSkipped() == 3);
      REQUIRE(log.str().find("second: skipping sample 2") != std::string::npos);
    }

  SECTION("Negative subnet ids are malformed")
    {
      const char* const json = R"({
  "samples": [
    { "block_timestamp_utc": "2025-02-01T00:00:00Z", "emissions": { "1": 0.5, "-3": 0.5 } },
    { "block_timestamp_utc": "2025-02-01T01:00:00Z", "emissions": { "1": 0.5 },
      "supplies": { " -7": 1000 } },
    { "block_timestamp_utc": "2025-02-01T02:00:00Z", "emissions": { "1": 0.5, "2": 0.5 } }
  ]
})";

      std::vector<EmissionSnapshot> snapshots = reader.parseDocument(json, "negative");

      REQUIRE(snapshots.size() == 1);
      REQUIRE(snapshots[0].getEmissions().size() == 2);
      REQUIRE(snapshots[0].getEmissions().count(2) == 1);
      REQUIRE(reader.getNumSamplesSkipped() == 2);
      REQUIRE(log.str().find("invalid subnet id: -3") != std::string::npos);
    }

  SECTION("Documents that are not snapshot files")
    {
      REQUIRE_THROWS_AS(reader.parseDocument("{ not json", "broken"), EmissionSnapshotReaderException);
      REQUIRE_THROWS_AS(reader.parseDocument("{\"rows\": []}", "other"), EmissionSnapshotReaderException);
      REQUIRE_THROWS_AS(reader.parseDocument("[1, 2, 3]", "array"), EmissionSnapshotReaderException);
    }
}

TEST_CASE("EmissionSnapshotReader reads directories", "[EmissionSnapshotReader]")
{
  TemporaryDirectory dir;
  std::ostringstream log;
  EmissionSnapshotReader reader(&log);

  SECTION("Files are merged, sorted and de-duplicated")
    {
      dir.writeFile("emissions_v2_20250201.json", FirstDayJson);
      dir.writeFile("emissions_v2_20250202.json", SecondDayJson);
      dir.writeFile("emissions_v2_20250203.json", "{ truncated");
      dir.writeFile("notes.json", "{\"samples\": []}");
      dir.writeFile("emissions_v2_readme.txt", "ignored");

      std::vector<EmissionSnapshot> snapshots = reader.readPath(dir.getPath().string());

      REQUIRE(snapshots.size() == 3);
      REQUIRE(snapshots[0].getTimestamp() == ptime(date(2025, Feb, 1), hours(0)));
      REQUIRE(snapshots[1].getTimestamp() == ptime(date(2025, Feb, 1), hours(1)));
      REQUIRE(snapshots[2].getTimestamp() == ptime(date(2025, Feb, 1), hours(2)));

      // The earlier file wins the duplicate hour
      REQUIRE(snapshots[1].getBlock() == 5000300);
      REQUIRE(reader.getNumDuplicatesDropped() == 1);
      REQUIRE(reader.getNumFilesSkipped() == 1);
      REQUIRE(log.str().find("emissions_v2_20250203.json") != std::string::npos);
    }

  SECTION("Snapshot files are listed in name order")
    {
      dir.writeFile("emissions_v2_b.json", FirstDayJson);
      dir.writeFile("emissions_v2_a.json", FirstDayJson);

      std::vector<std::string> files = EmissionSnapshotReader::findSnapshotFiles(dir.getPath().string());
      REQUIRE(files.size() == 2);
      REQUIRE(files[0] == dir.filePath("emissions_v2_a.json"));
    }

  SECTION("A single file")
    {
      const std::string path = dir.writeFile("sample.json", FirstDayJson);
      REQUIRE(reader.readPath(path).size() == 2);
    }

  SECTION("Missing inputs")
    {
      REQUIRE_THROWS_AS(reader.readPath(dir.filePath("absent")), EmissionSnapshotReaderException);
      REQUIRE_THROWS_AS(reader.readPath(dir.getPath().string()), EmissionSnapshotReaderException);
    }
}
