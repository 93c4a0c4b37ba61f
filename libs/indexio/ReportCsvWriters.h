// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_REPORT_CSV_WRITERS_H
#define __TAO_INDEX_REPORT_CSV_WRITERS_H 1

#include <fstream>
#include <string>
#include <vector>
#include "ComparativeAnalyzer.h"
#include "SimulationResult.h"

namespace tao_index
{
  /**
   * @class ComparisonReportCsvWriter
   * @brief Writes one row per cadence in report order.
   *
   * Returns, volatility, drawdown, cost share and tracking error are
   * written as percentages.
   */
  class ComparisonReportCsvWriter
  {
  public:
    /**
     * @throws ReportWriterException when the file cannot be created.
     */
    explicit ComparisonReportCsvWriter(const std::string& fileName);

    ComparisonReportCsvWriter(const ComparisonReportCsvWriter&) = delete;
    ComparisonReportCsvWriter& operator=(const ComparisonReportCsvWriter&) = delete;

    void writeReport(const ComparisonReport& report);

    static std::string getHeader();

  private:
    std::string mFileName;
    std::ofstream mCsvFile;
  };

  /**
   * @class NavHistoryCsvWriter
   * @brief Writes the NAV path of every cadence to a single long-format
   * file with columns timestamp,nav,cash,frequency.
   */
  class NavHistoryCsvWriter
  {
  public:
    explicit NavHistoryCsvWriter(const std::string& fileName);

    NavHistoryCsvWriter(const NavHistoryCsvWriter&) = delete;
    NavHistoryCsvWriter& operator=(const NavHistoryCsvWriter&) = delete;

    void writeResults(const std::vector<SimulationResult>& results);

  private:
    std::string mFileName;
    std::ofstream mCsvFile;
  };
} // namespace tao_index

#endif
