#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/sum.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/weighted_mean.hpp>

namespace labormodel
{
  namespace stats
  {
    /**
     * @class WeightedMoments
     * @brief Reliability-weighted mean plus unweighted dispersion of a sample.
     *
     * Salary observations are averaged with per-source weights, while their
     * spread is measured as the plain population standard deviation of the
     * values (divisor n). Both come from Boost.Accumulators so the values are
     * never stored.
     */
    class WeightedMoments
    {
    private:
      using WeightedAccumulator = boost::accumulators::accumulator_set<
	double,
	boost::accumulators::stats<
	  boost::accumulators::tag::weighted_mean,
	  boost::accumulators::tag::sum_of_weights
	  >,
	double
	>;

      using PlainAccumulator = boost::accumulators::accumulator_set<
	double,
	boost::accumulators::stats<
	  boost::accumulators::tag::mean,
	  boost::accumulators::tag::variance,
	  boost::accumulators::tag::count
	  >
	>;

    public:
      /**
       * @brief Add one observation.
       * @throws std::invalid_argument if weight is not positive or value is not finite.
       */
      void add(double value, double weight)
      {
	if (!(weight > 0.0) || !std::isfinite(weight))
	  throw std::invalid_argument("WeightedMoments::add: weight must be positive and finite");
	if (!std::isfinite(value))
	  throw std::invalid_argument("WeightedMoments::add: value must be finite");

	mWeighted(value, boost::accumulators::weight = weight);
	mPlain(value);
      }

      std::size_t count() const
      {
	return boost::accumulators::count(mPlain);
      }

      bool empty() const
      {
	return count() == 0;
      }

      double totalWeight() const
      {
	return empty() ? 0.0 : boost::accumulators::sum_of_weights(mWeighted);
      }

      double weightedMean() const
      {
	requireNonEmpty("weightedMean");
	return boost::accumulators::weighted_mean(mWeighted);
      }

      double mean() const
      {
	requireNonEmpty("mean");
	return boost::accumulators::mean(mPlain);
      }

      // Population standard deviation; zero for a single observation.
      double populationStdDev() const
      {
	requireNonEmpty("populationStdDev");
	const double var = boost::accumulators::variance(mPlain);
	return var > 0.0 ? std::sqrt(var) : 0.0;
      }

    private:
      void requireNonEmpty(const char* what) const
      {
	if (empty())
	  throw std::logic_error(std::string("WeightedMoments::") + what + ": no observations");
      }

      WeightedAccumulator mWeighted;
      PlainAccumulator mPlain;
    };
  }
}
