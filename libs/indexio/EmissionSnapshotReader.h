// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_EMISSION_SNAPSHOT_READER_H
#define __TAO_INDEX_EMISSION_SNAPSHOT_READER_H 1

#include <ostream>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "EmissionSnapshot.h"

namespace tao_index
{
  /**
   * @class EmissionSnapshotReader
   * @brief Reads emission samples from the JSON files produced by the
   * network data collector.
   *
   * Each file holds an object with a "samples" array. A sample carries
   * "block_timestamp_utc", "closest_block", an "emissions" object keyed by
   * subnet id and, optionally, a "supplies" object of the same shape.
   * Values may be JSON numbers or numeric strings.
   *
   * Files and samples that cannot be parsed are reported on the log
   * stream and skipped. The merged result is sorted by timestamp; when two
   * samples share a timestamp the first one read is kept.
   */
  class EmissionSnapshotReader
  {
  public:
    explicit EmissionSnapshotReader(std::ostream* log = nullptr);

    /**
     * @brief Read a single file, or every emissions_v2_*.json file of a
     * directory in file name order.
     * @throws EmissionSnapshotReaderException when the path does not exist
     * or a directory holds no snapshot files.
     */
    std::vector<EmissionSnapshot> readPath(const std::string& path);

    /**
     * @throws EmissionSnapshotReaderException when the file cannot be
     * opened or is not a snapshot document.
     */
    std::vector<EmissionSnapshot> readFile(const std::string& fileName);

    /**
     * @brief Parse the text of one snapshot document.
     * @param sourceName Used only in log and error messages.
     */
    std::vector<EmissionSnapshot> parseDocument(const std::string& jsonText,
						const std::string& sourceName);

    static std::vector<std::string> findSnapshotFiles(const std::string& directory);

    unsigned long getNumFilesSkipped() const
    {
      return mNumFilesSkipped;
    }

    unsigned long getNumSamplesSkipped() const
    {
      return mNumSamplesSkipped;
    }

    unsigned long getNumDuplicatesDropped() const
    {
      return mNumDuplicatesDropped;
    }

  private:
    EmissionSnapshot parseSample(const rapidjson::Value& sample) const;
    std::vector<EmissionSnapshot> sortAndRemoveDuplicates(std::vector<EmissionSnapshot> snapshots);
    void logMessage(const std::string& message) const;

  private:
    std::ostream* mLog;
    unsigned long mNumFilesSkipped;
    unsigned long mNumSamplesSkipped;
    unsigned long mNumDuplicatesDropped;
  };
} // namespace tao_index

#endif
