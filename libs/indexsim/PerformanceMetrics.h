// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_PERFORMANCE_METRICS_H
#define __TAO_INDEX_PERFORMANCE_METRICS_H 1

#include <algorithm>
#include <cmath>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace tao_index
{
  namespace metrics
  {
    using boost::accumulators::accumulator_set;
    using boost::accumulators::features;
    namespace tag = boost::accumulators::tag;

    /**
     * @brief Period-over-period simple returns.
     *
     * The result has one element fewer than the input. A period whose
     * previous value is zero yields a zero return.
     */
    inline std::vector<double> percentChange(const std::vector<double>& values)
    {
      std::vector<double> returns;
      if (values.size() < 2)
	return returns;

      returns.reserve(values.size() - 1);
      for (size_t i = 1; i < values.size(); ++i)
	{
	  if (values[i - 1] != 0.0)
	    returns.push_back(values[i] / values[i - 1] - 1.0);
	  else
	    returns.push_back(0.0);
	}

      return returns;
    }

    /**
     * @brief Sample standard deviation (n - 1 denominator).
     *
     * boost::accumulators::variance is the population variance, so it is
     * rescaled by n / (n - 1). Returns 0 for fewer than two values.
     */
    inline double sampleStandardDeviation(const std::vector<double>& values)
    {
      const size_t n = values.size();
      if (n < 2)
	return 0.0;

      accumulator_set<double, features<tag::variance>> acc;
      for (double v : values)
	acc(v);

      const double populationVariance = boost::accumulators::variance(acc);
      const double sampleVariance = populationVariance * static_cast<double>(n) / static_cast<double>(n - 1);

      return (sampleVariance > 0.0) ? std::sqrt(sampleVariance) : 0.0;
    }

    inline double totalReturn(double firstValue, double lastValue)
    {
      if (firstValue == 0.0)
	return 0.0;

      return lastValue / firstValue - 1.0;
    }

    /**
     * @brief (1 + total)^(365 / days) - 1, zero when no whole day elapsed.
     */
    inline double annualizedReturn(double totalReturn, long elapsedDays)
    {
      if (elapsedDays <= 0)
	return 0.0;

      return std::pow(1.0 + totalReturn, 365.0 / static_cast<double>(elapsedDays)) - 1.0;
    }

    inline double annualizedVolatility(const std::vector<double>& returns, double periodsPerYear)
    {
      return sampleStandardDeviation(returns) * std::sqrt(periodsPerYear);
    }

    inline double sharpeRatio(double annualizedReturn, double riskFreeRate, double annualizedVolatility)
    {
      if (!(annualizedVolatility > 0.0))
	return 0.0;

      return (annualizedReturn - riskFreeRate) / annualizedVolatility;
    }

    /**
     * @brief Most negative (value - running peak) / running peak; zero for
     * a series that never falls below its peak.
     */
    inline double maxDrawdown(const std::vector<double>& values)
    {
      double peak = 0.0;
      double worst = 0.0;
      bool first = true;

      for (double v : values)
	{
	  if (first || v > peak)
	    {
	      peak = v;
	      first = false;
	    }

	  if (peak > 0.0)
	    worst = std::min(worst, (v - peak) / peak);
	}

      return worst;
    }

    /**
     * @brief Annualized standard deviation of the return difference between
     * two value series, over their common prefix.
     */
    inline double trackingError(const std::vector<double>& values,
				const std::vector<double>& benchmarkValues,
				double periodsPerYear)
    {
      const size_t n = std::min(values.size(), benchmarkValues.size());
      if (n < 3)
	return 0.0;

      std::vector<double> a(values.begin(), values.begin() + n);
      std::vector<double> b(benchmarkValues.begin(), benchmarkValues.begin() + n);

      std::vector<double> ra = percentChange(a);
      std::vector<double> rb = percentChange(b);

      std::vector<double> diff;
      diff.reserve(ra.size());
      for (size_t i = 0; i < ra.size(); ++i)
	diff.push_back(ra[i] - rb[i]);

      return sampleStandardDeviation(diff) * std::sqrt(periodsPerYear);
    }
  } // namespace metrics
} // namespace tao_index

#endif
