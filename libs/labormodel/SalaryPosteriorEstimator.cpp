#include "SalaryPosteriorEstimator.h"
#include <algorithm>
#include <cmath>
#include "LognormalDistribution.h"
#include "WeightedMoments.h"

namespace labormodel
{
  namespace
  {
    constexpr double OBSERVATION_VARIANCE_GUARD = 1e-6;
  }

  std::optional<double> SalaryPosteriorEstimator::representativeSalary(const SalaryObservation& observation)
  {
    if (observation.getSalaryPoint())
      return *observation.getSalaryPoint();

    const auto& lo = observation.getSalaryMin();
    const auto& hi = observation.getSalaryMax();

    if (lo && hi)
      return 0.5 * (*lo + *hi);
    if (lo)
      return *lo * RANGE_MIN_MULTIPLIER;
    if (hi)
      return *hi * RANGE_MAX_MULTIPLIER;

    return std::nullopt;
  }

  SalaryEstimate SalaryPosteriorEstimator::estimate(const OEWSPrior& prior,
						    const std::string& companyId,
						    const std::vector<SalaryObservation>& observations,
						    std::ostream& os) const
  {
    const MetroRoleKey& key = prior.getKey();
    const SalaryModelParameters& params = mConfig.getSalaryParameters();

    const double muPrior = prior.getWageP50();
    if (!(muPrior > 0.0))
      throw MissingPriorException("SalaryPosteriorEstimator: no usable median wage for cell " + key.toString());

    const double sigmaPrior = muPrior * params.priorCoefficientOfVariation;
    const double nPrior = params.priorEffectiveN;

    stats::WeightedMoments moments;
    std::size_t numOutliers = 0;

    for (const auto& observation : observations)
      {
	if (observation.getCompanyId() != companyId)
	  continue;

	const std::optional<double> value = representativeSalary(observation);
	if (!value)
	  continue;

	if (*value < params.minPlausibleSalary || *value > params.maxPlausibleSalary)
	  {
	    numOutliers++;
	    continue;
	  }

	moments.add(*value, mConfig.getSalarySourceWeight(observation.getSourceType()));
      }

    if (moments.empty())
      {
	const double mean = prior.getWageMean() > 0.0 ? prior.getWageMean() : muPrior;
	const WagePercentiles priorPercentiles{prior.getWageP10(), prior.getWageP25(), prior.getWageP50(),
					       prior.getWageP75(), prior.getWageP90()};

	os << "   [Salary] " << key << " " << companyId << ": no usable observations";
	if (numOutliers > 0)
	  os << " (" << numOutliers << " outliers discarded)";
	os << ", prior returned" << std::endl;

	return SalaryEstimate(companyId, key, priorPercentiles, mean, sigmaPrior, 0, 0.0, 0.0, muPrior);
      }

    const double muObs = moments.weightedMean();
    const double nObs = moments.totalWeight();
    const double sigmaObs = moments.count() > 1 ? moments.populationStdDev() : sigmaPrior;

    const double precisionPrior = nPrior / (sigmaPrior * sigmaPrior);
    const double precisionObs = nObs / (sigmaObs * sigmaObs + OBSERVATION_VARIANCE_GUARD);
    const double precisionPost = precisionPrior + precisionObs;

    const double muPost = (precisionPrior * muPrior + precisionObs * muObs) / precisionPost;
    const double sigmaPost = std::sqrt(1.0 / precisionPost);
    const double shrinkage = std::clamp(precisionObs / precisionPost, 0.0, 1.0);

    const auto posterior = stats::LognormalDistribution::fromMeanAndStdDev(muPost, sigmaPost);
    const WagePercentiles percentiles{posterior.quantile(0.10), posterior.quantile(0.25),
				      posterior.quantile(0.50), posterior.quantile(0.75),
				      posterior.quantile(0.90)};

    os << "   [Salary] " << key << " " << companyId << ": " << moments.count()
       << " observations (weight " << nObs << "), mu_post " << muPost
       << ", shrinkage " << shrinkage;
    if (numOutliers > 0)
      os << ", " << numOutliers << " outliers discarded";
    os << std::endl;

    return SalaryEstimate(companyId, key, percentiles, muPost, sigmaPost,
			  moments.count(), nObs, shrinkage, muPrior);
  }
}
