// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <cctype>
#include <limits>
#include <boost/algorithm/string.hpp>
#include "CadenceSpec.h"
#include "IndexSimException.h"

namespace tao_index
{
  CadenceSpec CadenceSpec::fromString(const std::string& text)
  {
    std::string name = boost::algorithm::trim_copy(text);
    boost::algorithm::to_lower(name);

    if (name.empty())
      throw RebalanceConfigurationException("CadenceSpec::fromString - empty cadence name");

    if (name == "continuous")
      return continuous();

    const char unit = name.back();
    std::string digits = name.substr(0, name.size() - 1);

    unsigned int multiplier = 0;
    if (unit == 'h')
      multiplier = 1;
    else if (unit == 'd')
      multiplier = 24;
    else if (unit == 'w')
      multiplier = 168;
    else
      throw RebalanceConfigurationException("CadenceSpec::fromString - unknown unit in cadence '" + text + "'");

    if (digits.empty())
      throw RebalanceConfigurationException("CadenceSpec::fromString - missing count in cadence '" + text + "'");

    // Accumulate the count so that any value whose hours overflow is rejected
    const unsigned int maxCount = std::numeric_limits<unsigned int>::max() / multiplier;
    unsigned int count = 0;
    for (char c : digits)
      {
	if (!std::isdigit(static_cast<unsigned char>(c)))
	  throw RebalanceConfigurationException("CadenceSpec::fromString - invalid count in cadence '" + text + "'");

	const unsigned int digit = static_cast<unsigned int>(c - '0');
	if (count > (maxCount - digit) / 10)
	  throw RebalanceConfigurationException("CadenceSpec::fromString - cadence '" + text + "' is too long");

	count = count * 10 + digit;
      }

    if (count == 0)
      throw RebalanceConfigurationException("CadenceSpec::fromString - cadence '" + text + "' must be positive, use 'continuous' for every tick");

    return CadenceSpec(name, count * multiplier);
  }

  std::vector<CadenceSpec> CadenceSpec::listFromString(const std::string& text)
  {
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, text, boost::algorithm::is_any_of(";,"));

    std::vector<CadenceSpec> cadences;
    for (const auto& token : tokens)
      {
	if (boost::algorithm::trim_copy(token).empty())
	  continue;

	cadences.push_back(fromString(token));
      }

    return cadences;
  }

  std::vector<CadenceSpec> getDefaultCadences()
  {
    return {
      CadenceSpec("1h", 1),
      CadenceSpec("2h", 2),
      CadenceSpec("4h", 4),
      CadenceSpec("8h", 8),
      CadenceSpec("12h", 12),
      CadenceSpec("1d", 24),
      CadenceSpec("2d", 48),
      CadenceSpec("3d", 72),
      CadenceSpec("1w", 168),
      CadenceSpec::continuous()
    };
  }
} // namespace tao_index
