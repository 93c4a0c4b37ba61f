#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "PerformanceMetrics.h"

using namespace tao_index;

TEST_CASE("Return series", "[PerformanceMetrics]")
{
  SECTION("Percent change")
    {
      std::vector<double> returns = metrics::percentChange({100.0, 110.0, 99.0});

      REQUIRE(returns.size() == 2);
      REQUIRE(returns[0] == Catch::Approx(0.1));
      REQUIRE(returns[1] == Catch::Approx(-0.1));
    }

  SECTION("Zero previous value gives a zero return")
    {
      std::vector<double> returns = metrics::percentChange({0.0, 5.0});
      REQUIRE(returns.size() == 1);
      REQUIRE(returns[0] == 0.0);
    }

  SECTION("Short series")
    {
      REQUIRE(metrics::percentChange({}).empty());
      REQUIRE(metrics::percentChange({1.0}).empty());
    }

  SECTION("Total return")
    {
      REQUIRE(metrics::totalReturn(1000000.0, 1020000.0) == Catch::Approx(0.02));
      REQUIRE(metrics::totalReturn(0.0, 5.0) == 0.0);
    }
}

TEST_CASE("Dispersion statistics", "[PerformanceMetrics]")
{
  SECTION("Sample standard deviation")
    {
      REQUIRE(metrics::sampleStandardDeviation({1.0, 2.0, 3.0, 4.0}) == Catch::Approx(std::sqrt(5.0 / 3.0)));
      REQUIRE(metrics::sampleStandardDeviation({2.0, 2.0, 2.0}) == Catch::Approx(0.0).margin(1e-12));
      REQUIRE(metrics::sampleStandardDeviation({3.0}) == 0.0);
    }

  SECTION("Annualized volatility")
    {
      std::vector<double> returns = {0.01, -0.01, 0.01, -0.01};
      const double expected = metrics::sampleStandardDeviation(returns) * std::sqrt(8760.0);

      REQUIRE(metrics::annualizedVolatility(returns, 8760.0) == Catch::Approx(expected));
      REQUIRE(metrics::annualizedVolatility({0.01}, 8760.0) == 0.0);
    }
}

TEST_CASE("Risk adjusted statistics", "[PerformanceMetrics]")
{
  SECTION("Annualized return")
    {
      REQUIRE(metrics::annualizedReturn(0.1, 365) == Catch::Approx(0.1));
      REQUIRE(metrics::annualizedReturn(0.21, 730) == Catch::Approx(0.1));
      REQUIRE(metrics::annualizedReturn(0.05, 0) == 0.0);
    }

  SECTION("Sharpe ratio")
    {
      REQUIRE(metrics::sharpeRatio(0.15, 0.05, 0.2) == Catch::Approx(0.5));
      REQUIRE(metrics::sharpeRatio(0.15, 0.05, 0.0) == 0.0);
    }

  SECTION("Maximum drawdown")
    {
      REQUIRE(metrics::maxDrawdown({100.0, 120.0, 90.0, 130.0, 65.0}) == Catch::Approx(-0.5));
      REQUIRE(metrics::maxDrawdown({100.0, 101.0, 102.0}) == 0.0);
    }
}

TEST_CASE("Tracking error", "[PerformanceMetrics]")
{
  std::vector<double> nav = {100.0, 102.0, 101.0, 104.0, 103.5};

  SECTION("A series tracks itself exactly")
    {
      REQUIRE(metrics::trackingError(nav, nav, 8760.0) == 0.0);
    }

  SECTION("Series are truncated to the common range")
    {
      std::vector<double> longer(nav);
      longer.push_back(500.0);

      REQUIRE(metrics::trackingError(longer, nav, 8760.0) == 0.0);
    }

  SECTION("Different paths")
    {
      std::vector<double> other = {100.0, 101.0, 101.0, 103.0, 104.0};
      std::vector<double> a = metrics::percentChange(nav);
      std::vector<double> b = metrics::percentChange(other);
      std::vector<double> diff;
      for (size_t i = 0; i < a.size(); ++i)
	diff.push_back(a[i] - b[i]);

      const double expected = metrics::sampleStandardDeviation(diff) * std::sqrt(8760.0);
      REQUIRE(metrics::trackingError(nav, other, 8760.0) == Catch::Approx(expected));
      REQUIRE(expected > 0.0);
    }

  SECTION("Too short to measure")
    {
      REQUIRE(metrics::trackingError({1.0, 2.0}, {1.0, 3.0}, 8760.0) == 0.0);
    }
}
