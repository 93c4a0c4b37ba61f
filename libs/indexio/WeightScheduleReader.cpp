// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <map>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "WeightScheduleReader.h"
#include "IndexIOException.h"
#include "IndexSimException.h"
#include "TimestampParser.h"

namespace tao_index
{
  WeightScheduleReader::WeightScheduleReader(const std::string& fileName)
    : mFileName(fileName)
  {}

  std::shared_ptr<WeightSchedule> WeightScheduleReader::readFile() const
  {
    if (!boost::filesystem::exists(mFileName))
      throw WeightScheduleReaderException("WeightScheduleReader - file does not exist: " + mFileName);

    std::map<ptime, TargetWeights> weightsByDate;
    int lineNo = 1;

    try
      {
	io::CSVReader<3, io::trim_chars<' ', '\t'>> csvScheduleFile(mFileName.c_str());
	csvScheduleFile.read_header(io::ignore_extra_column, "EffectiveDate", "Subnet", "Weight");

	std::string dateString, subnetString, weightString;
	while (csvScheduleFile.read_row(dateString, subnetString, weightString))
	  {
	    ++lineNo;

	    const ptime effectiveDate = parseEffectiveDate(dateString);
	    if (boost::starts_with(subnetString, "-"))
	      throw WeightScheduleReaderException("WeightScheduleReader - invalid subnet " + subnetString +
						  " at line " + std::to_string(lineNo));

	    const SubnetId subnet = boost::lexical_cast<SubnetId>(subnetString);
	    const double weight = boost::lexical_cast<double>(weightString);

	    TargetWeights& weights = weightsByDate[effectiveDate];
	    if (!weights.insert(std::make_pair(subnet, weight)).second)
	      throw WeightScheduleReaderException("WeightScheduleReader - subnet " + subnetString +
						  " repeated for " + dateString + " at line " +
						  std::to_string(lineNo));
	  }
      }
    catch (const io::error::base& e)
      {
	throw WeightScheduleReaderException("WeightScheduleReader - " + mFileName + ": " + e.what());
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw WeightScheduleReaderException("WeightScheduleReader - bad number at line " +
					    std::to_string(lineNo) + " of " + mFileName);
      }
    catch (const WeightScheduleReaderException&)
      {
	throw;
      }
    catch (const IndexIOException& e)
      {
	throw WeightScheduleReaderException("WeightScheduleReader - line " + std::to_string(lineNo) +
					    ": " + e.what());
      }

    if (weightsByDate.empty())
      throw WeightScheduleReaderException("WeightScheduleReader - no rows in " + mFileName);

    std::shared_ptr<WeightSchedule> schedule = std::make_shared<WeightSchedule>();
    for (const auto& entry : weightsByDate)
      {
	try
	  {
	    schedule->addEntry(entry.first, entry.second);
	  }
	catch (const WeightScheduleException& e)
	  {
	    throw WeightScheduleReaderException("WeightScheduleReader - " + mFileName + ": " + e.what());
	  }
      }

    return schedule;
  }
} // namespace tao_index
