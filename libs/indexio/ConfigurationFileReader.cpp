// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <set>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "ConfigurationFileReader.h"
#include "CadenceSpec.h"
#include "IndexIOException.h"
#include "IndexSimException.h"

namespace tao_index
{
  static double parseDouble(const std::string& key, const std::string& value)
  {
    try
      {
	return boost::lexical_cast<double>(value);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ConfigurationFileReaderException("ConfigurationFileReader - value for " + key +
					       " is not a number: " + value);
      }
  }

  static unsigned int parseUnsigned(const std::string& key, const std::string& value)
  {
    if (boost::starts_with(value, "-"))
      throw ConfigurationFileReaderException("ConfigurationFileReader - value for " + key +
					     " is not a non-negative integer: " + value);

    try
      {
	return boost::lexical_cast<unsigned int>(value);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ConfigurationFileReaderException("ConfigurationFileReader - value for " + key +
					       " is not a non-negative integer: " + value);
      }
  }

  ConfigurationFileReader::ConfigurationFileReader(const std::string& fileName)
    : mFileName(fileName)
  {}

  std::vector<std::string> ConfigurationFileReader::getRecognizedKeys()
  {
    return { "InitialCapital", "TransactionCostBps", "SlippageBps", "TopN", "RiskFreeRate",
	"Cadences", "YieldModel", "EmissionYieldScale", "PriceDampingFactor", "PriceClipBound",
	"BasePrice", "MinTradeValue", "DustThreshold", "TicksPerYear", "WeightScheduleFile" };
  }

  RebalanceConfiguration
  ConfigurationFileReader::readConfigurationFile(const RebalanceConfiguration& base) const
  {
    if (!boost::filesystem::exists(mFileName))
      throw ConfigurationFileReaderException("ConfigurationFileReader - file does not exist: " + mFileName);

    RebalanceConfiguration configuration(base);
    std::set<std::string> seenKeys;

    try
      {
	io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> csvConfigFile(mFileName.c_str());
	csvConfigFile.read_header(io::ignore_extra_column, "Key", "Value");

	std::string key, value;
	while (csvConfigFile.read_row(key, value))
	  {
	    if (key.empty())
	      continue;

	    const std::string normalizedKey = boost::to_lower_copy(key);
	    if (!seenKeys.insert(normalizedKey).second)
	      throw ConfigurationFileReaderException("ConfigurationFileReader - key repeated: " + key);

	    applySetting(configuration, key, value);
	  }
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationFileReaderException("ConfigurationFileReader - " + mFileName + ": " + e.what());
      }

    return configuration;
  }

  void ConfigurationFileReader::applySetting(RebalanceConfiguration& configuration,
					     const std::string& key,
					     const std::string& value) const
  {
    try
      {
	if (boost::iequals(key, "InitialCapital"))
	  configuration.setInitialCapital(parseDouble(key, value));
	else if (boost::iequals(key, "TransactionCostBps"))
	  configuration.setTransactionCostBps(parseDouble(key, value));
	else if (boost::iequals(key, "SlippageBps"))
	  configuration.setSlippageBps(parseDouble(key, value));
	else if (boost::iequals(key, "TopN"))
	  configuration.setTopN(parseUnsigned(key, value));
	else if (boost::iequals(key, "RiskFreeRate"))
	  configuration.setRiskFreeRate(parseDouble(key, value));
	else if (boost::iequals(key, "Cadences"))
	  configuration.setCadences(CadenceSpec::listFromString(value));
	else if (boost::iequals(key, "YieldModel"))
	  configuration.setYieldModelName(value);
	else if (boost::iequals(key, "EmissionYieldScale"))
	  configuration.setEmissionYieldScale(parseDouble(key, value));
	else if (boost::iequals(key, "PriceDampingFactor"))
	  configuration.setPriceDampingFactor(parseDouble(key, value));
	else if (boost::iequals(key, "PriceClipBound"))
	  configuration.setPriceClipBound(parseDouble(key, value));
	else if (boost::iequals(key, "BasePrice"))
	  configuration.setBasePrice(parseDouble(key, value));
	else if (boost::iequals(key, "MinTradeValue"))
	  configuration.setMinTradeValue(parseDouble(key, value));
	else if (boost::iequals(key, "DustThreshold"))
	  configuration.setDustThreshold(parseDouble(key, value));
	else if (boost::iequals(key, "TicksPerYear"))
	  configuration.setTicksPerYear(parseDouble(key, value));
	else if (boost::iequals(key, "WeightScheduleFile"))
	  configuration.setWeightScheduleFile(value);
	else
	  throw ConfigurationFileReaderException("ConfigurationFileReader - unknown key: " + key);
      }
    catch (const RebalanceConfigurationException& e)
      {
	throw ConfigurationFileReaderException("ConfigurationFileReader - invalid " + key + ": " + e.what());
      }
  }
} // namespace tao_index
