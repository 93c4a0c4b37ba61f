// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <iomanip>
#include "ReportCsvWriters.h"
#include "IndexIOException.h"
#include "TimestampParser.h"

namespace tao_index
{
  ComparisonReportCsvWriter::ComparisonReportCsvWriter(const std::string& fileName)
    : mFileName(fileName),
      mCsvFile(fileName)
  {
    if (!mCsvFile)
      throw ReportWriterException("ComparisonReportCsvWriter - cannot create " + fileName);
  }

  std::string ComparisonReportCsvWriter::getHeader()
  {
    return "Frequency,Total Return (%),Annualized Return (%),Volatility (%),Sharpe Ratio,"
      "Max Drawdown (%),Rebalances,Transaction Costs ($),Transaction Costs (%),"
      "Tracking Error (%),Final NAV,Days";
  }

  void ComparisonReportCsvWriter::writeReport(const ComparisonReport& report)
  {
    mCsvFile << getHeader() << std::endl;
    mCsvFile << std::setprecision(10);

    for (const auto& result : report.getRankedResults())
      {
	const PerformanceSummary& summary = result.getSummary();

	mCsvFile << result.getCadence().getName() << ","
		 << summary.totalReturn * 100.0 << ","
		 << summary.annualizedReturn * 100.0 << ","
		 << summary.annualizedVolatility * 100.0 << ","
		 << summary.sharpeRatio << ","
		 << summary.maxDrawdown * 100.0 << ","
		 << summary.rebalanceCount << ","
		 << summary.totalTransactionCost << ","
		 << summary.transactionCostPct * 100.0 << ","
		 << summary.trackingError * 100.0 << ","
		 << summary.finalNav << ","
		 << summary.elapsedDays << std::endl;
      }

    if (!mCsvFile)
      throw ReportWriterException("ComparisonReportCsvWriter - write failed for " + mFileName);
  }

  NavHistoryCsvWriter::NavHistoryCsvWriter(const std::string& fileName)
    : mFileName(fileName),
      mCsvFile(fileName)
  {
    if (!mCsvFile)
      throw ReportWriterException("NavHistoryCsvWriter - cannot create " + fileName);
  }

  void NavHistoryCsvWriter::writeResults(const std::vector<SimulationResult>& results)
  {
    mCsvFile << "timestamp,nav,cash,frequency" << std::endl;
    mCsvFile << std::setprecision(12);

    for (const auto& result : results)
      {
	const std::string& frequency = result.getCadence().getName();

	for (const auto& record : result.getNavHistory())
	  mCsvFile << formatTimestamp(record.timestamp) << ","
		   << record.nav << ","
		   << record.cash << ","
		   << frequency << "\n";
      }

    mCsvFile.flush();
    if (!mCsvFile)
      throw ReportWriterException("NavHistoryCsvWriter - write failed for " + mFileName);
  }
} // namespace tao_index
