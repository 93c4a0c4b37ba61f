#include "SummaryReporter.h"
#include <iomanip>
#include <sstream>

namespace cadenceopt
{
namespace reporting
{

void SummaryReporter::writeConfiguration(std::ostream& os,
                                         const RebalanceConfiguration& configuration,
                                         const SnapshotTable& table,
                                         const std::string& weightPolicyName)
{
    writeSectionHeader(os, "Rebalancing Cadence Optimization");

    configuration.print(os);
    os << "Target Weights: " << weightPolicyName << std::endl;
    os << "Snapshots: " << table.getNumTicks()
       << " from " << boost::posix_time::to_simple_string(table.getFirstTimestamp())
       << " to " << boost::posix_time::to_simple_string(table.getLastTimestamp()) << std::endl;
    os << "Subnets Observed: " << table.getSubnets().size() << std::endl;

    writeSectionFooter(os);
    os << std::endl;
}

void SummaryReporter::writeReportTable(std::ostream& os, const ComparisonReport& report)
{
    writeSectionHeader(os, "Rebalancing Optimization Summary");

    std::ios::fmtflags savedFlags(os.flags());
    const std::streamsize savedPrecision = os.precision();

    os << std::left << std::setw(12) << "Frequency"
       << std::right
       << std::setw(11) << "Return%"
       << std::setw(11) << "Annual%"
       << std::setw(9) << "Vol%"
       << std::setw(9) << "Sharpe"
       << std::setw(10) << "MaxDD%"
       << std::setw(11) << "Rebalances"
       << std::setw(14) << "Costs($)"
       << std::setw(9) << "Costs%"
       << std::setw(9) << "TE%"
       << std::setw(16) << "Final NAV"
       << std::setw(6) << "Days" << std::endl;

    os << std::fixed;
    for (const auto& result : report.getRankedResults())
    {
        const PerformanceSummary& summary = result.getSummary();

        os << std::left << std::setw(12) << result.getCadence().getName()
           << std::right << std::setprecision(2)
           << std::setw(11) << summary.totalReturn * 100.0
           << std::setw(11) << summary.annualizedReturn * 100.0
           << std::setw(9) << summary.annualizedVolatility * 100.0
           << std::setw(9) << summary.sharpeRatio
           << std::setw(10) << summary.maxDrawdown * 100.0
           << std::setw(11) << summary.rebalanceCount
           << std::setw(14) << summary.totalTransactionCost
           << std::setprecision(3)
           << std::setw(9) << summary.transactionCostPct * 100.0
           << std::setprecision(2)
           << std::setw(9) << summary.trackingError * 100.0
           << std::setw(16) << summary.finalNav
           << std::setw(6) << summary.elapsedDays << std::endl;
    }

    os.flags(savedFlags);
    os.precision(savedPrecision);

    for (const auto& skipped : report.getSkippedCadences())
        os << "Skipped " << skipped.cadence.getName() << ": " << skipped.reason << std::endl;

    writeSectionFooter(os);
    os << std::endl;
}

void SummaryReporter::writeRecommendation(std::ostream& os, const ComparisonReport& report)
{
    writeSectionHeader(os, "Recommended Cadence");

    if (!report.hasRecommendation())
    {
        os << "No cadence other than the continuous benchmark could be simulated" << std::endl;
        writeSectionFooter(os);
        return;
    }

    const SimulationResult& best = report.getRecommendedResult();
    const SimulationResult& benchmark = report.getBenchmarkResult();
    const PerformanceSummary& summary = best.getSummary();

    std::ios::fmtflags savedFlags(os.flags());
    const std::streamsize savedPrecision = os.precision();
    os << std::fixed << std::setprecision(2);

    os << "Cadence: " << best.getCadence().getName() << std::endl;
    os << "Sharpe Ratio: " << summary.sharpeRatio << std::endl;
    os << "Total Return: " << summary.totalReturn * 100.0 << "%" << std::endl;
    os << "Transaction Costs: $" << summary.totalTransactionCost
       << " (" << std::setprecision(3) << summary.transactionCostPct * 100.0 << "%)" << std::endl;
    os << std::setprecision(2);
    os << "Tracking Error: " << summary.trackingError * 100.0 << "%" << std::endl;
    os << "Rebalances: " << summary.rebalanceCount << std::endl;
    os << "Return Gap vs Continuous: "
       << (summary.totalReturn - benchmark.getSummary().totalReturn) * 100.0 << "%" << std::endl;

    os.flags(savedFlags);
    os.precision(savedPrecision);
    writeSectionFooter(os);
}

void SummaryReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void SummaryReporter::writeSectionFooter(std::ostream& os)
{
    os << "===================================" << std::endl;
}

} // namespace reporting
} // namespace cadenceopt
