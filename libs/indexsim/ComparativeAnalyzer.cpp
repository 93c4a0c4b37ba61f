// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <future>
#include <sstream>
#include "ComparativeAnalyzer.h"
#include "IndexSimException.h"
#include "PerformanceMetrics.h"

namespace tao_index
{
  ComparisonReport::ComparisonReport(std::vector<SimulationResult> rankedResults,
				     const CadenceSpec& benchmarkCadence,
				     const boost::optional<CadenceSpec>& recommendedCadence,
				     std::vector<SkippedCadence> skippedCadences)
    : mRankedResults(std::move(rankedResults)),
      mBenchmarkCadence(benchmarkCadence),
      mRecommendedCadence(recommendedCadence),
      mSkippedCadences(std::move(skippedCadences))
  {}

  const CadenceSpec& ComparisonReport::getRecommendedCadence() const
  {
    if (!mRecommendedCadence)
      throw ComparativeAnalyzerException("ComparisonReport::getRecommendedCadence - no candidate cadence besides the benchmark");

    return *mRecommendedCadence;
  }

  const SimulationResult& ComparisonReport::getRecommendedResult() const
  {
    return findResult(getRecommendedCadence());
  }

  const SimulationResult& ComparisonReport::getBenchmarkResult() const
  {
    return findResult(mBenchmarkCadence);
  }

  const SimulationResult& ComparisonReport::findResult(const CadenceSpec& cadence) const
  {
    for (const auto& result : mRankedResults)
      if (result.getCadence() == cadence)
	return result;

    throw ComparativeAnalyzerException("ComparisonReport::findResult - cadence " +
				       cadence.getName() + " not in report");
  }

  ComparativeAnalyzer::ComparativeAnalyzer(std::shared_ptr<const CadenceSimulator> simulator,
					   concurrency::IParallelExecutor& executor)
    : mSimulator(simulator),
      mExecutor(executor)
  {
    if (!mSimulator)
      throw ComparativeAnalyzerException("ComparativeAnalyzer - simulator is required");
  }

  ComparisonReport ComparativeAnalyzer::runSweep(const std::vector<CadenceSpec>& cadences,
						 std::ostream* log,
						 const std::atomic<bool>* cancelFlag) const
  {
    if (cadences.empty())
      throw ComparativeAnalyzerException("ComparativeAnalyzer::runSweep - no cadences configured");

    const CadenceSpec benchmark = CadenceSpec::continuous();

    std::vector<CadenceSpec> runOrder(cadences);
    if (std::find(runOrder.begin(), runOrder.end(), benchmark) == runOrder.end())
      runOrder.push_back(benchmark);

    const size_t numRuns = runOrder.size();
    std::vector<std::shared_ptr<SimulationResult>> results(numRuns);
    std::vector<std::string> skipReasons(numRuns);
    std::vector<std::ostringstream> runLogs(numRuns);

    const size_t benchmarkIndex =
      std::find(runOrder.begin(), runOrder.end(), benchmark) - runOrder.begin();

    auto runOne = [&, this](size_t i, bool applyCosts) {
      std::ostream* runLog = log ? &runLogs[i] : nullptr;
      try
	{
	  results[i] = std::make_shared<SimulationResult>(mSimulator->simulate(runOrder[i],
									       applyCosts,
									       runLog,
									       cancelFlag));
	}
      catch (const InsufficientDataException& e)
	{
	  skipReasons[i] = e.what();
	  if (runLog)
	    (*runLog) << "[" << runOrder[i].getName() << "] skipped: " << e.what() << std::endl;
	}
    };

    // Benchmark first; every tracking error is measured against it
    {
      std::vector<std::future<void>> futures;
      futures.push_back(mExecutor.submit([&runOne, benchmarkIndex]() { runOne(benchmarkIndex, false); }));
      mExecutor.waitAll(futures);
    }

    if (!results[benchmarkIndex])
      throw ComparativeAnalyzerException("ComparativeAnalyzer::runSweep - benchmark could not be simulated: " +
					 skipReasons[benchmarkIndex]);

    std::vector<std::future<void>> futures;
    for (size_t i = 0; i < numRuns; ++i)
      {
	if (i == benchmarkIndex)
	  continue;

	futures.push_back(mExecutor.submit([&runOne, i]() { runOne(i, true); }));
      }

    mExecutor.waitAll(futures);

    if (log)
      {
	(*log) << runLogs[benchmarkIndex].str();
	for (size_t i = 0; i < numRuns; ++i)
	  if (i != benchmarkIndex)
	    (*log) << runLogs[i].str();
      }

    std::vector<SimulationResult> completed;
    std::vector<SkippedCadence> skipped;
    for (size_t i = 0; i < numRuns; ++i)
      {
	if (results[i])
	  completed.push_back(*results[i]);
	else
	  skipped.emplace_back(runOrder[i], skipReasons[i]);
      }

    return compare(completed, benchmark,
		   mSimulator->getConfiguration().getTicksPerYear(),
		   std::move(skipped));
  }

  ComparisonReport ComparativeAnalyzer::compare(const std::vector<SimulationResult>& results,
						const CadenceSpec& benchmarkCadence,
						double ticksPerYear,
						std::vector<SkippedCadence> skippedCadences)
  {
    std::vector<SimulationResult>::const_iterator benchmarkIt =
      std::find_if(results.begin(), results.end(),
		   [&benchmarkCadence](const SimulationResult& r) { return r.getCadence() == benchmarkCadence; });

    if (benchmarkIt == results.end())
      throw ComparativeAnalyzerException("ComparativeAnalyzer::compare - no result for benchmark cadence " +
					 benchmarkCadence.getName());

    const std::vector<double> benchmarkNav = benchmarkIt->getNavValues();

    std::vector<SimulationResult> ranked;
    ranked.reserve(results.size());

    boost::optional<CadenceSpec> recommended;
    double bestSharpe = 0.0;

    for (const auto& result : results)
      {
	ranked.push_back(result);

	if (result.getCadence() == benchmarkCadence)
	  {
	    ranked.back().setTrackingError(0.0);
	    continue;
	  }

	ranked.back().setTrackingError(metrics::trackingError(result.getNavValues(),
							      benchmarkNav,
							      ticksPerYear));

	const double sharpe = result.getSummary().sharpeRatio;
	if (!recommended || sharpe > bestSharpe)
	  {
	    recommended = result.getCadence();
	    bestSharpe = sharpe;
	  }
      }

    std::stable_sort(ranked.begin(), ranked.end(),
		     [](const SimulationResult& lhs, const SimulationResult& rhs) {
		       return lhs.getSummary().totalReturn > rhs.getSummary().totalReturn;
		     });

    return ComparisonReport(std::move(ranked), benchmarkCadence, recommended, std::move(skippedCadences));
  }
} // namespace tao_index
