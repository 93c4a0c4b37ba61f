// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_CADENCE_SPEC_H
#define __TAO_INDEX_CADENCE_SPEC_H 1

#include <string>
#include <vector>

namespace tao_index
{
  /**
   * @class CadenceSpec
   * @brief A named rebalancing interval measured in hours.
   *
   * An interval of zero hours denotes the continuous benchmark, which
   * rebalances on every tick and bears no trading costs.
   */
  class CadenceSpec
  {
  public:
    CadenceSpec(const std::string& name, unsigned int hours)
      : mName(name),
	mHours(hours)
    {}

    const std::string& getName() const
    {
      return mName;
    }

    unsigned int getHours() const
    {
      return mHours;
    }

    bool isContinuous() const
    {
      return mHours == 0;
    }

    /**
     * @brief Parse "continuous", "<n>h", "<n>d" or "<n>w".
     * @throws RebalanceConfigurationException on malformed input.
     */
    static CadenceSpec fromString(const std::string& text);

    /**
     * @brief Parse a ';' or ',' separated list of cadence names.
     */
    static std::vector<CadenceSpec> listFromString(const std::string& text);

    static CadenceSpec continuous()
    {
      return CadenceSpec("continuous", 0);
    }

  private:
    std::string mName;
    unsigned int mHours;
  };

  inline bool operator==(const CadenceSpec& lhs, const CadenceSpec& rhs)
  {
    return lhs.getName() == rhs.getName() && lhs.getHours() == rhs.getHours();
  }

  /**
   * @brief The sweep used by the original index study: 1h through 1w plus
   * the continuous benchmark.
   */
  std::vector<CadenceSpec> getDefaultCadences();
} // namespace tao_index

#endif
