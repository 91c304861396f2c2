#pragma once

#include <ostream>
#include <vector>
#include "DomainTypes.h"
#include "EngineConfiguration.h"
#include "LaborModelException.h"
#include "RandomPcg.h"

namespace labormodel
{
  /**
   * @class HeadcountAllocator
   * @brief Splits a cell's macro employment total across companies by
   *        Dirichlet shrinkage allocation.
   *
   * Each company gets concentration
   *
   *   alpha_i = prior_weight / n + evidence_i * concentration_scale
   *
   * so companies with little evidence are pulled toward an equal split while
   * heavily evidenced companies dominate. Monte Carlo draws from
   * Dirichlet(alpha) are scaled to the employment total, rounded and
   * drift-corrected onto the draw's largest share, then summarised as
   * P10/P50/P90 per company (type-7 quantile, truncated).
   *
   * The reported p50 values are finally corrected so that they sum to the
   * employment total exactly. Every company with nonzero evidence keeps at
   * least one head, unless the total is smaller than the number of companies.
   */
  class HeadcountAllocator
  {
  public:
    explicit HeadcountAllocator(const EngineConfiguration& config)
      : mConfig(config)
    {}

    /**
     * @param prior     Macro prior for the cell.
     * @param companies Eligible companies (see EvidenceAggregator).
     * @param rng       Seeded generator owned by the calling cell.
     * @param os        Diagnostic output.
     * @return One estimate per company, in input order. Empty when there are
     *         no companies.
     * @throws MissingPriorException if the employment total is not positive.
     */
    std::vector<HeadcountEstimate> allocate(const OEWSPrior& prior,
					    const std::vector<CompanyEvidence>& companies,
					    stats::RandomPcg& rng,
					    std::ostream& os) const;

  private:
    const EngineConfiguration& mConfig;
  };
}
