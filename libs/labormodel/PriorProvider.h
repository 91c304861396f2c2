#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>
#include "DomainTypes.h"

namespace labormodel
{
  /**
   * @class IPriorProvider
   * @brief Source of OEWS macro priors, one per cell and reference year.
   */
  class IPriorProvider
  {
  public:
    virtual ~IPriorProvider() = default;

    virtual std::optional<OEWSPrior> getPrior(const MetroRoleKey& key, int referenceYear) const = 0;

    // All cells with a prior for the year, in key order.
    virtual std::vector<MetroRoleKey> listKeys(int referenceYear) const = 0;
  };

  // One row of the OEWS table. Suppressed wages are absent.
  struct OEWSPriorRow
  {
    MetroRoleKey key;
    int referenceYear;
    long employment;
    std::optional<double> wageP10;
    std::optional<double> wageP25;
    std::optional<double> wageP50;
    std::optional<double> wageP75;
    std::optional<double> wageP90;
    std::optional<double> wageMean;
  };

  /**
   * @class InMemoryPriorProvider
   * @brief Prior table held in memory.
   *
   * Several occupation codes can map to the same canonical role. Rows added
   * for the same (year, metro, role) are combined: employment is summed and
   * each wage statistic is the average over the rows that reported it.
   * A cell where no row reported a median gets a median of 0, which the
   * salary estimator treats as a missing wage prior. Other statistics that
   * no row reported take the median.
   */
  class InMemoryPriorProvider : public IPriorProvider
  {
  public:
    InMemoryPriorProvider() = default;

    void addPrior(const OEWSPriorRow& row);

    // Non-positive wages are taken as not reported.
    void addPrior(const OEWSPrior& prior);

    // Counts a table row that could not be read.
    void discardRow()
    {
      mNumDiscarded++;
    }

    std::optional<OEWSPrior> getPrior(const MetroRoleKey& key, int referenceYear) const override;
    std::vector<MetroRoleKey> listKeys(int referenceYear) const override;

    std::size_t getNumPriors() const
    {
      return mPriors.size();
    }

    std::size_t getNumDiscarded() const
    {
      return mNumDiscarded;
    }

  private:
    class WageAverage
    {
    public:
      void add(const std::optional<double>& wage)
      {
	if (!wage)
	  return;

	mSum += *wage;
	mCount++;
      }

      std::optional<double> getAverage() const
      {
	if (mCount == 0)
	  return std::nullopt;

	return mSum / static_cast<double>(mCount);
      }

    private:
      double mSum = 0.0;
      unsigned int mCount = 0;
    };

    struct PriorAccumulation
    {
      long employment = 0;
      WageAverage wageP10;
      WageAverage wageP25;
      WageAverage wageP50;
      WageAverage wageP75;
      WageAverage wageP90;
      WageAverage wageMean;
    };

    std::map<std::pair<int, MetroRoleKey>, PriorAccumulation> mPriors;
    std::size_t mNumDiscarded = 0;
  };
}
