// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_COMPARATIVE_ANALYZER_H
#define __TAO_INDEX_COMPARATIVE_ANALYZER_H 1

#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "IParallelExecutor.h"
#include "CadenceSimulator.h"
#include "CadenceSpec.h"
#include "SimulationResult.h"

namespace tao_index
{
  // A cadence left out of the report and the reason it was dropped
  struct SkippedCadence
  {
    SkippedCadence(const CadenceSpec& aCadence, const std::string& aReason)
      : cadence(aCadence),
	reason(aReason)
    {}

    CadenceSpec cadence;
    std::string reason;
  };

  /**
   * @class ComparisonReport
   * @brief Ranked results of one cadence sweep.
   *
   * Results are ordered by total return, highest first. The benchmark row
   * is included with a tracking error of zero.
   */
  class ComparisonReport
  {
  public:
    ComparisonReport(std::vector<SimulationResult> rankedResults,
		     const CadenceSpec& benchmarkCadence,
		     const boost::optional<CadenceSpec>& recommendedCadence,
		     std::vector<SkippedCadence> skippedCadences);

    const std::vector<SimulationResult>& getRankedResults() const
    {
      return mRankedResults;
    }

    size_t getNumRows() const
    {
      return mRankedResults.size();
    }

    const CadenceSpec& getBenchmarkCadence() const
    {
      return mBenchmarkCadence;
    }

    bool hasRecommendation() const
    {
      return mRecommendedCadence.is_initialized();
    }

    /**
     * @throws ComparativeAnalyzerException when no non-benchmark cadence
     * produced a result.
     */
    const CadenceSpec& getRecommendedCadence() const;

    const SimulationResult& getRecommendedResult() const;

    const SimulationResult& getBenchmarkResult() const;

    /**
     * @throws ComparativeAnalyzerException when the cadence is not in the report.
     */
    const SimulationResult& findResult(const CadenceSpec& cadence) const;

    const std::vector<SkippedCadence>& getSkippedCadences() const
    {
      return mSkippedCadences;
    }

  private:
    std::vector<SimulationResult> mRankedResults;
    CadenceSpec mBenchmarkCadence;
    boost::optional<CadenceSpec> mRecommendedCadence;
    std::vector<SkippedCadence> mSkippedCadences;
  };

  /**
   * @class ComparativeAnalyzer
   * @brief Runs every candidate cadence and ranks the results against the
   * zero-cost continuous benchmark.
   */
  class ComparativeAnalyzer
  {
  public:
    ComparativeAnalyzer(std::shared_ptr<const CadenceSimulator> simulator,
			concurrency::IParallelExecutor& executor);

    /**
     * @brief Simulate the benchmark and then every other cadence.
     *
     * The continuous cadence is the benchmark and runs without costs; it is
     * added when the list does not name it. A cadence that fails with
     * InsufficientDataException is skipped; any other failure propagates.
     * Log text of each run is written to log in the order the cadences are
     * listed, after all runs finish.
     *
     * @throws ComparativeAnalyzerException when the list is empty or the
     * benchmark cannot be simulated.
     */
    ComparisonReport runSweep(const std::vector<CadenceSpec>& cadences,
			      std::ostream* log = nullptr,
			      const std::atomic<bool>* cancelFlag = nullptr) const;

    /**
     * @brief Rank already computed results.
     *
     * @param results One result per cadence in configured order, exactly
     *        one of which is for the benchmark cadence.
     */
    static ComparisonReport compare(const std::vector<SimulationResult>& results,
				    const CadenceSpec& benchmarkCadence,
				    double ticksPerYear,
				    std::vector<SkippedCadence> skippedCadences = std::vector<SkippedCadence>());

  private:
    std::shared_ptr<const CadenceSimulator> mSimulator;
    concurrency::IParallelExecutor& mExecutor;
  };
} // namespace tao_index

#endif
