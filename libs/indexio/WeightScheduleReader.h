// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_WEIGHT_SCHEDULE_READER_H
#define __TAO_INDEX_WEIGHT_SCHEDULE_READER_H 1

#include <memory>
#include <string>
#include "WeightSchedule.h"

namespace tao_index
{
  /**
   * @class WeightScheduleReader
   * @brief Loads published index weights from an
   * EffectiveDate,Subnet,Weight CSV file.
   *
   * Rows sharing an effective date form one schedule entry.
   */
  class WeightScheduleReader
  {
  public:
    explicit WeightScheduleReader(const std::string& fileName);

    /**
     * @throws WeightScheduleReaderException when the file is missing,
     * empty, malformed or repeats a subnet within one date.
     */
    std::shared_ptr<WeightSchedule> readFile() const;

  private:
    std::string mFileName;
  };
} // namespace tao_index

#endif
