// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <fstream>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <rapidjson/error/en.h>
#include "EmissionSnapshotReader.h"
#include "IndexIOException.h"
#include "TimestampParser.h"

using namespace boost::filesystem;

namespace tao_index
{
  static const char* const kSnapshotFilePrefix = "emissions_v2_";
  static const char* const kSnapshotFileExtension = ".json";

  static double getNumericValue(const rapidjson::Value& value, const std::string& what)
  {
    if (value.IsNumber())
      return value.GetDouble();

    if (value.IsString())
      {
	try
	  {
	    return boost::lexical_cast<double>(boost::trim_copy(std::string(value.GetString())));
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw EmissionSnapshotReaderException(what + " is not numeric: " + value.GetString());
	  }
      }

    throw EmissionSnapshotReaderException(what + " must be a number or numeric string");
  }

  static SubnetId getSubnetId(const std::string& key)
  {
    // lexical_cast wraps a negative value into the unsigned range
    const std::string trimmed = boost::trim_copy(key);
    if (trimmed.empty() || trimmed[0] == '-')
      throw EmissionSnapshotReaderException("invalid subnet id: " + key);

    try
      {
	return boost::lexical_cast<SubnetId>(trimmed);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw EmissionSnapshotReaderException("invalid subnet id: " + key);
      }
  }

  static std::map<SubnetId, double> getSubnetValues(const rapidjson::Value& object, const std::string& what)
  {
    if (!object.IsObject())
      throw EmissionSnapshotReaderException(what + " must be an object");

    std::map<SubnetId, double> values;
    for (rapidjson::Value::ConstMemberIterator it = object.MemberBegin(); it != object.MemberEnd(); ++it)
      {
	const std::string key(it->name.GetString());
	values[getSubnetId(key)] = getNumericValue(it->value, what + " for subnet " + key);
      }

    return values;
  }

  EmissionSnapshotReader::EmissionSnapshotReader(std::ostream* log)
    : mLog(log),
      mNumFilesSkipped(0),
      mNumSamplesSkipped(0),
      mNumDuplicatesDropped(0)
  {}

  void EmissionSnapshotReader::logMessage(const std::string& message) const
  {
    if (mLog)
      (*mLog) << "EmissionSnapshotReader: " << message << std::endl;
  }

  std::vector<std::string> EmissionSnapshotReader::findSnapshotFiles(const std::string& directory)
  {
    std::vector<std::string> files;

    for (directory_iterator it(directory); it != directory_iterator(); ++it)
      {
	if (!is_regular_file(it->status()))
	  continue;

	const std::string name = it->path().filename().string();
	if (boost::starts_with(name, kSnapshotFilePrefix) &&
	    boost::ends_with(name, kSnapshotFileExtension))
	  files.push_back(it->path().string());
      }

    std::sort(files.begin(), files.end());
    return files;
  }

  std::vector<EmissionSnapshot> EmissionSnapshotReader::readPath(const std::string& pathName)
  {
    path dataPath(pathName);

    if (!exists(dataPath))
      throw EmissionSnapshotReaderException("EmissionSnapshotReader::readPath - path does not exist: " + pathName);

    std::vector<std::string> files;
    if (is_directory(dataPath))
      {
	files = findSnapshotFiles(pathName);
	if (files.empty())
	  throw EmissionSnapshotReaderException("EmissionSnapshotReader::readPath - no " +
						std::string(kSnapshotFilePrefix) + "*" +
						kSnapshotFileExtension + " files in " + pathName);
      }
    else
      files.push_back(pathName);

    std::vector<EmissionSnapshot> merged;
    size_t filesRead = 0;
    for (const auto& fileName : files)
      {
	try
	  {
	    std::vector<EmissionSnapshot> fileSnapshots = readFile(fileName);
	    merged.insert(merged.end(), fileSnapshots.begin(), fileSnapshots.end());
	    ++filesRead;
	  }
	catch (const EmissionSnapshotReaderException& e)
	  {
	    ++mNumFilesSkipped;
	    logMessage("skipping " + fileName + ": " + e.what());
	  }
      }

    logMessage("read " + std::to_string(merged.size()) + " samples from " +
	       std::to_string(filesRead) + " of " +
	       std::to_string(files.size()) + " files");

    return sortAndRemoveDuplicates(std::move(merged));
  }

  std::vector<EmissionSnapshot> EmissionSnapshotReader::readFile(const std::string& fileName)
  {
    std::ifstream jsonFile(fileName.c_str());
    if (!jsonFile)
      throw EmissionSnapshotReaderException("cannot open " + fileName);

    std::stringstream contents;
    contents << jsonFile.rdbuf();

    return parseDocument(contents.str(), fileName);
  }

  std::vector<EmissionSnapshot> EmissionSnapshotReader::parseDocument(const std::string& jsonText,
								      const std::string& sourceName)
  {
    rapidjson::Document document;
    document.Parse(jsonText.c_str());

    if (document.HasParseError())
      throw EmissionSnapshotReaderException(sourceName + ": JSON parse error at offset " +
					    std::to_string(document.GetErrorOffset()) + ": " +
					    rapidjson::GetParseError_En(document.GetParseError()));

    if (!document.IsObject() || !document.HasMember("samples") || !document["samples"].IsArray())
      throw EmissionSnapshotReaderException(sourceName + ": no samples array");

    const rapidjson::Value& samples = document["samples"];
    std::vector<EmissionSnapshot> snapshots;
    snapshots.reserve(samples.Size());

    for (rapidjson::SizeType idx = 0; idx != samples.Size(); idx++)
      {
	try
	  {
	    snapshots.push_back(parseSample(samples[idx]));
	  }
	catch (const IndexIOException& e)
	  {
	    ++mNumSamplesSkipped;
	    logMessage(sourceName + ": skipping sample " + std::to_string(idx) + ": " + e.what());
	  }
      }

    return snapshots;
  }

  EmissionSnapshot EmissionSnapshotReader::parseSample(const rapidjson::Value& sample) const
  {
    if (!sample.IsObject())
      throw EmissionSnapshotReaderException("sample is not an object");

    if (!sample.HasMember("block_timestamp_utc") || !sample["block_timestamp_utc"].IsString())
      throw EmissionSnapshotReaderException("missing block_timestamp_utc");

    if (!sample.HasMember("emissions"))
      throw EmissionSnapshotReaderException("missing emissions");

    const ptime timestamp = parseIsoTimestamp(sample["block_timestamp_utc"].GetString());

    int64_t block = 0;
    if (sample.HasMember("closest_block"))
      {
	const rapidjson::Value& blockValue = sample["closest_block"];
	if (blockValue.IsInt64())
	  block = blockValue.GetInt64();
	else
	  block = static_cast<int64_t>(getNumericValue(blockValue, "closest_block"));
      }

    EmissionMap emissions = getSubnetValues(sample["emissions"], "emission");

    SupplyMap supplies;
    if (sample.HasMember("supplies") && !sample["supplies"].IsNull())
      supplies = getSubnetValues(sample["supplies"], "supply");

    return EmissionSnapshot(timestamp, block, emissions, supplies);
  }

  std::vector<EmissionSnapshot>
  EmissionSnapshotReader::sortAndRemoveDuplicates(std::vector<EmissionSnapshot> snapshots)
  {
    std::stable_sort(snapshots.begin(), snapshots.end());

    std::vector<EmissionSnapshot> unique;
    unique.reserve(snapshots.size());

    for (const auto& snapshot : snapshots)
      {
	if (!unique.empty() && unique.back().getTimestamp() == snapshot.getTimestamp())
	  {
	    ++mNumDuplicatesDropped;
	    logMessage("dropping duplicate sample at " + formatTimestamp(snapshot.getTimestamp()) +
		       " (block " + std::to_string(snapshot.getBlock()) + ")");
	    continue;
	  }

	unique.push_back(snapshot);
      }

    return unique;
  }
} // namespace tao_index
