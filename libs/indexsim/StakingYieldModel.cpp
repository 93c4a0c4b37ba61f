// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <algorithm>
#include <cmath>
#include "StakingYieldModel.h"
#include "IndexSimException.h"

namespace tao_index
{
  namespace
  {
    const double HoursPerYear = 365.0 * 24.0;
    const double NetworkTokensPerDay = 7200.0;
    const double AlphaIssuanceMultiplier = 2.0;

    // (supply in millions, staked fraction)
    const double CalibrationSupply1 = 1.129;
    const double CalibrationRatio1 = 0.2066;
    const double CalibrationSupply2 = 3.166;
    const double CalibrationRatio2 = 0.1838;

    const double MinStakingRatio = 0.05;
    const double MaxStakingRatio = 0.40;
    const double NewSubnetSupplyMillions = 0.1;
    const double NewSubnetStakingRatio = 0.30;
    const double UnknownSupplyStakingRatio = 0.15;
  }

  double hourlyRateFromApy(double apyPercent)
  {
    return std::pow(1.0 + apyPercent / 100.0, 1.0 / HoursPerYear) - 1.0;
  }

  double EmissionProportionalYieldModel::estimateApy(double emissionFraction,
						     const boost::optional<double>&) const
  {
    if (!std::isfinite(emissionFraction) || emissionFraction <= 0.0)
      return 0.0;

    const double dailyReturn = emissionFraction * mDailyScale;
    return dailyReturn * 365.0 * 100.0;
  }

  AlphaStakingYieldModel::AlphaStakingYieldModel()
    : mExponent(std::log(CalibrationRatio2 / CalibrationRatio1) /
		std::log(CalibrationSupply2 / CalibrationSupply1)),
      mCoefficient(0.0)
  {
    mCoefficient = CalibrationRatio1 / std::pow(CalibrationSupply1, mExponent);
  }

  double AlphaStakingYieldModel::estimateStakingRatio(double supply) const
  {
    if (!(supply > 0.0))
      return UnknownSupplyStakingRatio;

    const double supplyMillions = supply / 1000000.0;

    if (supplyMillions < NewSubnetSupplyMillions)
      {
	const double ratioAtThreshold = mCoefficient * std::pow(NewSubnetSupplyMillions, mExponent);
	const double blend = supplyMillions / NewSubnetSupplyMillions;
	return blend * ratioAtThreshold + (1.0 - blend) * NewSubnetStakingRatio;
      }

    const double ratio = mCoefficient * std::pow(supplyMillions, mExponent);
    return std::max(MinStakingRatio, std::min(MaxStakingRatio, ratio));
  }

  double AlphaStakingYieldModel::getDailyIssuance(double emissionFraction) const
  {
    return emissionFraction * NetworkTokensPerDay * AlphaIssuanceMultiplier;
  }

  double AlphaStakingYieldModel::estimateApy(double emissionFraction,
					     const boost::optional<double>& supply) const
  {
    if (!supply || !std::isfinite(emissionFraction) || emissionFraction <= 0.0)
      return 0.0;

    const double staked = *supply * estimateStakingRatio(*supply);
    if (!(staked > 0.0))
      return 0.0;

    const double dailyYield = getDailyIssuance(emissionFraction) / staked;
    return dailyYield * 365.0 * 100.0;
  }

  std::shared_ptr<const StakingYieldModel>
  createStakingYieldModel(const RebalanceConfiguration& configuration)
  {
    const std::string& name = configuration.getYieldModelName();

    if (name == "none")
      return std::make_shared<ZeroYieldModel>();
    else if (name == "emission")
      return std::make_shared<EmissionProportionalYieldModel>(configuration.getEmissionYieldScale());
    else if (name == "alpha")
      return std::make_shared<AlphaStakingYieldModel>();
    else
      throw RebalanceConfigurationException("createStakingYieldModel - unknown yield model " + name);
  }
} // namespace tao_index
