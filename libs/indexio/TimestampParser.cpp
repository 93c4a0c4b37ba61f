// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cctype>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TimestampParser.h"
#include "IndexIOException.h"

namespace tao_index
{
  using boost::posix_time::time_duration;

  static bool isAsciiDigit(char c)
  {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  }

  static bool splitUtcOffset(std::string& text, time_duration& offset)
  {
    offset = time_duration(0, 0, 0);

    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
      {
	text.pop_back();
	return true;
      }

    // An offset needs a time part, so look only after the date separator
    const std::string::size_type timeStart = text.find_first_of("T ");
    if (timeStart == std::string::npos)
      return false;

    const std::string::size_type signPos = text.find_first_of("+-", timeStart);
    if (signPos == std::string::npos)
      return false;

    std::string offsetText = text.substr(signPos + 1);
    boost::erase_all(offsetText, ":");
    if (offsetText.size() != 4 ||
	!std::all_of(offsetText.begin(), offsetText.end(), isAsciiDigit))
      throw IndexIOException("parseIsoTimestamp - invalid UTC offset in " + text);

    const int hours = std::stoi(offsetText.substr(0, 2));
    const int minutes = std::stoi(offsetText.substr(2, 2));
    offset = time_duration(hours, minutes, 0);
    if (text[signPos] == '-')
      offset = offset.invert_sign();

    text.erase(signPos);
    return true;
  }

  ptime parseIsoTimestamp(const std::string& text)
  {
    std::string working = boost::trim_copy(text);
    if (working.empty())
      throw IndexIOException("parseIsoTimestamp - empty timestamp");

    time_duration offset;
    splitUtcOffset(working, offset);

    std::replace(working.begin(), working.end(), ' ', 'T');
    if (working.find('T') == std::string::npos)
      throw IndexIOException("parseIsoTimestamp - missing time of day in " + text);

    ptime parsed;
    try
      {
	parsed = boost::date_time::parse_delimited_time<ptime>(working, 'T');
      }
    catch (const std::exception& e)
      {
	throw IndexIOException("parseIsoTimestamp - cannot parse " + text + ": " + e.what());
      }

    if (parsed.is_special())
      throw IndexIOException("parseIsoTimestamp - not a valid instant: " + text);

    return parsed - offset;
  }

  ptime parseEffectiveDate(const std::string& text)
  {
    const std::string working = boost::trim_copy(text);

    try
      {
	if (working.size() == 8 && std::all_of(working.begin(), working.end(), isAsciiDigit))
	  return ptime(boost::gregorian::from_undelimited_string(working));

	if (working.size() == 10)
	  return ptime(boost::gregorian::from_simple_string(working));
      }
    catch (const std::exception& e)
      {
	throw IndexIOException("parseEffectiveDate - cannot parse " + text + ": " + e.what());
      }

    return parseIsoTimestamp(working);
  }

  std::string formatTimestamp(const ptime& timestamp)
  {
    std::string text = boost::posix_time::to_iso_extended_string(timestamp);
    std::replace(text.begin(), text.end(), 'T', ' ');
    return text;
  }
} // namespace tao_index
