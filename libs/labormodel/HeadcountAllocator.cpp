#include "HeadcountAllocator.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include "DirichletSampler.h"
#include "EmpiricalQuantile.h"

namespace labormodel
{
  namespace
  {
    // Indices ordered by descending weight; ties keep input order.
    std::vector<std::size_t> descendingOrder(const std::vector<double>& weights)
    {
      std::vector<std::size_t> order(weights.size());
      std::iota(order.begin(), order.end(), 0);
      std::stable_sort(order.begin(), order.end(),
		       [&weights](std::size_t a, std::size_t b) { return weights[a] > weights[b]; });
      return order;
    }

    // Rounding a sample's scaled shares can miss the total by a few heads.
    // The difference goes to the largest share. When that company cannot
    // absorb a deficit (tiny totals) it spills to the next largest.
    void absorbRoundingDrift(std::vector<long>& counts, const std::vector<double>& shares, long drift)
    {
      if (drift == 0)
	return;

      const std::size_t largest = static_cast<std::size_t>(
	std::distance(shares.begin(), std::max_element(shares.begin(), shares.end())));

      if (drift > 0 || counts[largest] + drift >= 0)
	{
	  counts[largest] += drift;
	  return;
	}

      for (std::size_t idx : descendingOrder(shares))
	{
	  const long take = std::min(counts[idx], -drift);
	  counts[idx] -= take;
	  drift += take;
	  if (drift == 0)
	    return;
	}
    }

    // Move the p50 sum onto the total, largest expected share first,
    // never pushing a company under its minimum.
    void correctToTotal(std::vector<long>& p50,
			const std::vector<long>& minimums,
			const std::vector<std::size_t>& order,
			long total)
    {
      long residual = total - std::accumulate(p50.begin(), p50.end(), 0L);
      const long n = static_cast<long>(p50.size());

      if (residual > 0)
	{
	  const long perCompany = residual / n;
	  long remainder = residual % n;
	  for (std::size_t idx : order)
	    {
	      p50[idx] += perCompany;
	      if (remainder > 0)
		{
		  p50[idx]++;
		  remainder--;
		}
	    }
	  return;
	}

      while (residual < 0)
	{
	  long reducible = 0;
	  for (std::size_t idx : order)
	    if (p50[idx] > minimums[idx])
	      reducible++;

	  if (reducible == 0)
	    throw std::logic_error("HeadcountAllocator: minimum headcounts exceed employment total");

	  const long step = std::max(1L, -residual / reducible);
	  for (std::size_t idx : order)
	    {
	      if (residual == 0)
		break;

	      const long take = std::min({step, p50[idx] - minimums[idx], -residual});
	      if (take > 0)
		{
		  p50[idx] -= take;
		  residual += take;
		}
	    }
	}
    }
  }

  std::vector<HeadcountEstimate> HeadcountAllocator::allocate(const OEWSPrior& prior,
							      const std::vector<CompanyEvidence>& companies,
							      stats::RandomPcg& rng,
							      std::ostream& os) const
  {
    const MetroRoleKey& key = prior.getKey();
    const long total = prior.getEmploymentTotal();

    if (total <= 0)
      throw MissingPriorException("HeadcountAllocator: employment total for cell " + key.toString() +
				  " is " + std::to_string(total));

    std::vector<HeadcountEstimate> estimates;
    const std::size_t n = companies.size();

    if (n == 0)
      {
	os << "   [Headcount] " << key << ": no eligible companies" << std::endl;
	return estimates;
      }

    if (n == 1)
      {
	const CompanyEvidence& only = companies.front();
	estimates.emplace_back(only.getCompanyId(), key, total, total, total,
			       only.getTotalWeightedEvidence(), 1.0, total, 1);
	os << "   [Headcount] " << key << ": single company " << only.getCompanyId()
	   << " receives all " << total << std::endl;
	return estimates;
      }

    const HeadcountModelParameters& params = mConfig.getHeadcountParameters();
    const double dn = static_cast<double>(n);

    std::vector<double> alpha(n);
    for (std::size_t i = 0; i < n; ++i)
      alpha[i] = params.priorWeight / dn +
	companies[i].getTotalWeightedEvidence() * params.concentrationScale;

    stats::DirichletSampler sampler(alpha);
    const unsigned int numSamples = params.monteCarloSamples;
    const double dTotal = static_cast<double>(total);

    std::vector<std::vector<long>> draws(n, std::vector<long>(numSamples));
    std::vector<long> counts(n);

    for (unsigned int s = 0; s < numSamples; ++s)
      {
	const std::vector<double> shares = sampler.sample(rng);

	long assigned = 0;
	for (std::size_t i = 0; i < n; ++i)
	  {
	    counts[i] = std::lround(shares[i] * dTotal);
	    assigned += counts[i];
	  }

	absorbRoundingDrift(counts, shares, total - assigned);

	for (std::size_t i = 0; i < n; ++i)
	  draws[i][s] = counts[i];
      }

    std::vector<long> p10(n), p50(n), p90(n), minimums(n, 0);
    const long floorHeadcount = (total >= static_cast<long>(n)) ? 1 : 0;

    for (std::size_t i = 0; i < n; ++i)
      {
	std::sort(draws[i].begin(), draws[i].end());
	p10[i] = static_cast<long>(stats::quantileOnSorted(draws[i], 0.10));
	p50[i] = static_cast<long>(stats::quantileOnSorted(draws[i], 0.50));
	p90[i] = static_cast<long>(stats::quantileOnSorted(draws[i], 0.90));

	if (companies[i].getTotalWeightedEvidence() > 0.0)
	  {
	    minimums[i] = floorHeadcount;
	    p10[i] = std::max(p10[i], floorHeadcount);
	    p50[i] = std::max(p50[i], floorHeadcount);
	  }
      }

    const long sampledSum = std::accumulate(p50.begin(), p50.end(), 0L);
    correctToTotal(p50, minimums, descendingOrder(sampler.expectedShares()), total);

    for (std::size_t i = 0; i < n; ++i)
      {
	p10[i] = std::min(p10[i], p50[i]);
	p90[i] = std::max(p90[i], p50[i]);

	estimates.emplace_back(companies[i].getCompanyId(), key, p10[i], p50[i], p90[i],
			       companies[i].getTotalWeightedEvidence(),
			       static_cast<double>(p50[i]) / dTotal,
			       total, n);
      }

    os << "   [Headcount] " << key << ": allocated " << total << " across " << n
       << " companies (" << numSamples << " draws, p50 residual corrected "
       << (total - sampledSum) << ")" << std::endl;

    return estimates;
  }
}
