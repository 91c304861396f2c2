#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "DomainTypes.h"
#include "EngineConfiguration.h"
#include "LaborModelException.h"

namespace labormodel
{
  /**
   * @class SalaryPosteriorEstimator
   * @brief Conjugate normal/normal update of the OEWS wage prior with a
   *        company's salary observations.
   *
   * Prior: Normal(wage_p50, sigma_prior^2 / n_prior) with
   * sigma_prior = cv * wage_p50 and n_prior the configured effective sample
   * size. Observations are reduced to one value each, outliers removed, and
   * combined by precision weighting:
   *
   *   precision_prior = n_prior / sigma_prior^2
   *   precision_obs   = n_obs / (sigma_obs^2 + 1e-6)
   *   mu_post         = (precision_prior * mu_prior + precision_obs * mu_obs) / precision_post
   *   sigma_post      = sqrt(1 / precision_post)
   *
   * n_obs is the sum of the source weights. Percentiles come from a
   * lognormal moment-matched to (mu_post, sigma_post).
   */
  class SalaryPosteriorEstimator
  {
  public:
    static constexpr double RANGE_MIN_MULTIPLIER = 1.1;
    static constexpr double RANGE_MAX_MULTIPLIER = 0.9;

    explicit SalaryPosteriorEstimator(const EngineConfiguration& config)
      : mConfig(config)
    {}

    /**
     * @brief Posterior for one company.
     *
     * Observations for other companies are ignored. With no usable
     * observation the prior percentiles are returned unchanged with a
     * shrinkage factor of 0.
     *
     * @throws MissingPriorException if the prior median wage is not positive.
     */
    SalaryEstimate estimate(const OEWSPrior& prior,
			    const std::string& companyId,
			    const std::vector<SalaryObservation>& observations,
			    std::ostream& os) const;

    /**
     * @brief Reduce an observation to a single salary.
     *
     * The point value when present; else the midpoint of min and max; else
     * min * 1.1 or max * 0.9 as a one-sided estimate.
     */
    static std::optional<double> representativeSalary(const SalaryObservation& observation);

  private:
    const EngineConfiguration& mConfig;
  };
}
