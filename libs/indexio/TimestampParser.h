// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_TIMESTAMP_PARSER_H
#define __TAO_INDEX_TIMESTAMP_PARSER_H 1

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace tao_index
{
  using boost::posix_time::ptime;

  /**
   * @brief Parse an ISO-8601 instant into UTC.
   *
   * Accepts a 'T' or space between date and time, optional fractional
   * seconds, and an optional "Z" or "+HH:MM"/"-HH:MM" offset which is
   * folded into the result.
   * @throws IndexIOException when the text is not a valid instant.
   */
  ptime parseIsoTimestamp(const std::string& text);

  /**
   * @brief Parse a schedule date: "YYYYMMDD", "YYYY-MM-DD" (both midnight
   * UTC) or a full ISO-8601 instant.
   */
  ptime parseEffectiveDate(const std::string& text);

  // "YYYY-MM-DD HH:MM:SS"
  std::string formatTimestamp(const ptime& timestamp);
} // namespace tao_index

#endif
