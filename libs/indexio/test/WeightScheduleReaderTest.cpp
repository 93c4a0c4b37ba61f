#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "WeightScheduleReader.h"
#include "IndexIOException.h"
#include "TestUtils.h"

using namespace tao_index;
using namespace boost::gregorian;

TEST_CASE("WeightScheduleReader groups rows by date", "[WeightScheduleReader]")
{
  TemporaryDirectory dir;

  SECTION("Valid schedule")
    {
      const std::string path = dir.writeFile("weights.csv",
					     "EffectiveDate,Subnet,Weight\n"
					     "20250108,3,0.25\n"
					     "20250101,1,3\n"
					     "20250101,2,1\n"
					     "2025-01-08,4,0.75\n");

      std::shared_ptr<WeightSchedule> schedule = WeightScheduleReader(path).readFile();

      REQUIRE(schedule->getNumEntries() == 2);

      const TargetWeights* early = schedule->findWeightsInEffect(ptime(date(2025, Jan, 5)));
      REQUIRE(early != nullptr);
      REQUIRE(early->at(1) == Catch::Approx(0.75));
      REQUIRE(early->at(2) == Catch::Approx(0.25));

      const TargetWeights* late = schedule->findWeightsInEffect(ptime(date(2025, Jan, 8)));
      REQUIRE(late->size() == 2);
      REQUIRE(late->at(4) == Catch::Approx(0.75));

      REQUIRE(schedule->findWeightsInEffect(ptime(date(2024, Dec, 31))) == nullptr);
    }

  SECTION("Rejected files")
    {
      REQUIRE_THROWS_AS(WeightScheduleReader(dir.filePath("missing.csv")).readFile(),
			WeightScheduleReaderException);

      const std::string empty = dir.writeFile("empty.csv", "EffectiveDate,Subnet,Weight\n");
      REQUIRE_THROWS_AS(WeightScheduleReader(empty).readFile(), WeightScheduleReaderException);

      const std::string repeated = dir.writeFile("repeated.csv",
						 "EffectiveDate,Subnet,Weight\n20250101,1,0.5\n20250101,1,0.5\n");
      REQUIRE_THROWS_AS(WeightScheduleReader(repeated).readFile(), WeightScheduleReaderException);

      const std::string badDate = dir.writeFile("date.csv", "EffectiveDate,Subnet,Weight\nsoon,1,0.5\n");
      REQUIRE_THROWS_AS(WeightScheduleReader(badDate).readFile(), WeightScheduleReaderException);

      const std::string badWeight = dir.writeFile("weight.csv", "EffectiveDate,Subnet,Weight\n20250101,1,heavy\n");
      REQUIRE_THROWS_AS(WeightScheduleReader(badWeight).readFile(), WeightScheduleReaderException);

      const std::string negative = dir.writeFile("negative.csv", "EffectiveDate,Subnet,Weight\n20250101,1,-0.5\n");
      REQUIRE_THROWS_AS(WeightScheduleReader(negative).readFile(), WeightScheduleReaderException);

      const std::string negativeSubnet = dir.writeFile("subnet.csv",
						       "EffectiveDate,Subnet,Weight\n20250101,1,0.5\n20250101,-1,0.5\n");
      REQUIRE_THROWS_AS(WeightScheduleReader(negativeSubnet).readFile(), WeightScheduleReaderException);
    }
}
