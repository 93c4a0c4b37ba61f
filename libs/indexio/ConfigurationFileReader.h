// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_CONFIGURATION_FILE_READER_H
#define __TAO_INDEX_CONFIGURATION_FILE_READER_H 1

#include <string>
#include <vector>
#include "RebalanceConfiguration.h"

namespace tao_index
{
  /**
   * @class ConfigurationFileReader
   * @brief Reads simulation settings from a two column Key,Value CSV file.
   *
   * Keys that are absent keep the value of the base configuration. Keys are
   * matched case-insensitively.
   */
  class ConfigurationFileReader
  {
  public:
    explicit ConfigurationFileReader(const std::string& fileName);

    /**
     * @throws ConfigurationFileReaderException for a missing file, an
     * unknown key, a repeated key or a value the setting rejects.
     */
    RebalanceConfiguration readConfigurationFile(const RebalanceConfiguration& base) const;

    const std::string& getFileName() const
    {
      return mFileName;
    }

    static std::vector<std::string> getRecognizedKeys();

  private:
    void applySetting(RebalanceConfiguration& configuration,
		      const std::string& key,
		      const std::string& value) const;

  private:
    std::string mFileName;
  };
} // namespace tao_index

#endif
