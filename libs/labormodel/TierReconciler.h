#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include "DomainTypes.h"
#include "EngineConfiguration.h"

namespace labormodel
{
  // What the reconciler did to one industry.
  struct IndustryReconciliation
  {
    std::string industry;
    long knownHeadcount;
    long syntheticHeadcountBefore;
    long syntheticHeadcountAfter;
    double remainingFraction;
    std::size_t droppedRows;
  };

  struct ReconciliationResult
  {
    std::vector<Archetype> archetypes;
    std::vector<IndustryReconciliation> industries;
  };

  /**
   * @class TierReconciler
   * @brief Removes double counting between the synthetic tier and the
   *        employers known individually.
   *
   * Per industry, known = sum of headcount_p50 over Observed and
   * KnownEmployerInferred rows and synthetic = the same sum over CbpSynthetic
   * rows. Every synthetic row is scaled by
   *
   *   remaining_fraction = max(0, 1 - known / synthetic)
   *
   * and its confidence multiplied by the overlap discount. Rows whose scaled
   * p50 rounds to zero are removed. Industries with no known employment are
   * left untouched, and Observed / KnownEmployerInferred rows are never
   * modified. Must run once over the complete dataset.
   */
  class TierReconciler
  {
  public:
    explicit TierReconciler(const EngineConfiguration& config)
      : mConfig(config)
    {}

    ReconciliationResult reconcile(const std::vector<Archetype>& archetypes,
				   std::ostream& os) const;

  private:
    const EngineConfiguration& mConfig;
  };
}
