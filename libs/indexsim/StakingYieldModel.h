// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TAO_INDEX_STAKING_YIELD_MODEL_H
#define __TAO_INDEX_STAKING_YIELD_MODEL_H 1

#include <memory>
#include <string>
#include <boost/optional.hpp>
#include "RebalanceConfiguration.h"

namespace tao_index
{
  /**
   * @class StakingYieldModel
   * @brief Estimates the annual staking yield of a subnet.
   *
   * Implementations are pure functions of their inputs and hold no
   * mutable state, so one instance can be shared by concurrent runs.
   */
  class StakingYieldModel
  {
  public:
    virtual ~StakingYieldModel() = default;

    /**
     * @param emissionFraction Subnet share of network emission.
     * @param supply Token supply of the subnet, if known.
     * @return Annualized yield in percent (12.5 means 12.5%).
     */
    virtual double estimateApy(double emissionFraction,
			       const boost::optional<double>& supply) const = 0;

    virtual std::string getName() const = 0;
  };

  /**
   * @brief Per-hour compounding rate equivalent to an annual percentage.
   *
   * hourly = (1 + apy/100)^(1/(365*24)) - 1
   */
  double hourlyRateFromApy(double apyPercent);

  class ZeroYieldModel : public StakingYieldModel
  {
  public:
    double estimateApy(double, const boost::optional<double>&) const override
    {
      return 0.0;
    }

    std::string getName() const override
    {
      return "none";
    }
  };

  /**
   * @class EmissionProportionalYieldModel
   * @brief Yield proportional to emission share.
   *
   * daily yield = emission * scale, apy% = daily * 365 * 100. Supply is
   * ignored.
   */
  class EmissionProportionalYieldModel : public StakingYieldModel
  {
  public:
    explicit EmissionProportionalYieldModel(double dailyScale = 0.0001)
      : mDailyScale(dailyScale)
    {}

    double estimateApy(double emissionFraction,
		       const boost::optional<double>& supply) const override;

    std::string getName() const override
    {
      return "emission";
    }

    double getDailyScale() const
    {
      return mDailyScale;
    }

  private:
    double mDailyScale;
  };

  /**
   * @class AlphaStakingYieldModel
   * @brief Supply-aware yield from the subnet's daily token issuance and
   * an estimated staked share of its supply.
   *
   * Daily issuance is emission * 7200 * 2 tokens. The staked share
   * follows a power law in supply through two calibration points
   * (1.129M supply, 20.66% staked) and (3.166M, 18.38%), clamped to
   * [5%, 40%]. Below 100k supply the share is blended linearly toward
   * 30%. The calibration is a replaceable heuristic.
   */
  class AlphaStakingYieldModel : public StakingYieldModel
  {
  public:
    AlphaStakingYieldModel();

    double estimateApy(double emissionFraction,
		       const boost::optional<double>& supply) const override;

    std::string getName() const override
    {
      return "alpha";
    }

    /**
     * @return Fraction of supply assumed staked, 0.15 for non-positive supply.
     */
    double estimateStakingRatio(double supply) const;

    double getDailyIssuance(double emissionFraction) const;

  private:
    double mExponent;
    double mCoefficient;
  };

  /**
   * @brief Build the yield model named in the configuration.
   * @throws RebalanceConfigurationException for an unknown name.
   */
  std::shared_ptr<const StakingYieldModel>
  createStakingYieldModel(const RebalanceConfiguration& configuration);
} // namespace tao_index

#endif
