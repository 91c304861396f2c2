#pragma once

#include <cmath>
#include <stdexcept>
#include "NormalQuantile.h"

namespace labormodel
{
  namespace stats
  {
    /**
     * @brief Lognormal distribution parameterised on the log scale.
     *
     * X = exp(Y) with Y ~ Normal(mLogMu, mLogSigma^2). Wage posteriors are
     * reported through this type so that no percentile can go negative.
     */
    class LognormalDistribution
    {
    public:
      LognormalDistribution(double logMu, double logSigma)
	: mLogMu(logMu),
	  mLogSigma(logSigma)
      {
	if (!(logSigma >= 0.0) || !std::isfinite(logMu))
	  throw std::domain_error("LognormalDistribution: logSigma must be >= 0 and logMu finite");
      }

      /**
       * @brief Moment-match a lognormal to a (mean, stddev) pair on the
       *        natural scale.
       *
       * sigma_log^2 = ln(1 + (sd/mean)^2),  mu_log = ln(mean) - sigma_log^2 / 2,
       * so that E[X] = mean and SD[X] = sd exactly.
       */
      static LognormalDistribution fromMeanAndStdDev(double mean, double stdDev)
      {
	if (!(mean > 0.0))
	  throw std::domain_error("LognormalDistribution::fromMeanAndStdDev: mean must be positive");
	if (stdDev < 0.0)
	  throw std::domain_error("LognormalDistribution::fromMeanAndStdDev: stddev must be non-negative");

	const double cv = stdDev / mean;
	const double logVariance = std::log1p(cv * cv);
	return LognormalDistribution(std::log(mean) - 0.5 * logVariance,
				     std::sqrt(logVariance));
      }

      double quantile(double p) const
      {
	if (mLogSigma == 0.0)
	  {
	    if (p <= 0.0 || p >= 1.0)
	      throw std::domain_error("LognormalDistribution::quantile: p must be in (0, 1)");
	    return std::exp(mLogMu);
	  }
	return std::exp(mLogMu + mLogSigma * compute_normal_quantile(p));
      }

      double median() const
      {
	return std::exp(mLogMu);
      }

      double mean() const
      {
	return std::exp(mLogMu + 0.5 * mLogSigma * mLogSigma);
      }

      double getLogMu() const
      {
	return mLogMu;
      }

      double getLogSigma() const
      {
	return mLogSigma;
      }

    private:
      double mLogMu;
      double mLogSigma;
    };
  }
}
