#pragma once

#include <ostream>
#include <string>
#include "ComparativeAnalyzer.h"
#include "RebalanceConfiguration.h"
#include "SnapshotLoader.h"

namespace cadenceopt
{
namespace reporting
{

using namespace tao_index;

/**
 * @brief Human readable summary of a cadence sweep
 *
 * Writes the configuration banner before the sweep and the ranked table
 * and recommendation after it.
 */
class SummaryReporter
{
public:
    /**
     * @brief Write the settings in effect and the span of the loaded data
     * @param os Output stream
     * @param configuration Settings used for every cadence
     * @param table Loaded snapshot table
     * @param weightPolicyName Description of the target weight source
     */
    static void writeConfiguration(std::ostream& os,
                                   const RebalanceConfiguration& configuration,
                                   const SnapshotTable& table,
                                   const std::string& weightPolicyName);

    /**
     * @brief Write one row per cadence in report order
     */
    static void writeReportTable(std::ostream& os, const ComparisonReport& report);

    /**
     * @brief Write the recommended cadence and how it compares with the benchmark
     */
    static void writeRecommendation(std::ostream& os, const ComparisonReport& report);

private:
    static void writeSectionHeader(std::ostream& os, const std::string& title);

    static void writeSectionFooter(std::ostream& os);
};

} // namespace reporting
} // namespace cadenceopt
