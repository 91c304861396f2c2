#pragma once

#include <cstddef>
#include <vector>
#include "DomainTypes.h"
#include "EngineConfiguration.h"
#include "EvidenceRepository.h"

namespace labormodel
{
  // Everything the estimators need to know about one cell's evidence.
  struct CellEvidence
  {
    explicit CellEvidence(const MetroRoleKey& cellKey)
      : key(cellKey),
	companies(),
	salaryObservations(),
	numExcludedCompanies(0),
	numDiscardedRecords(0)
    {}

    MetroRoleKey key;

    // Companies eligible for allocation, ordered by company id.
    // evidenceShare sums to 1 over this list (or the list is empty).
    std::vector<CompanyEvidence> companies;

    std::vector<SalaryObservation> salaryObservations;

    // Companies whose weighted evidence fell below the threshold.
    std::size_t numExcludedCompanies;

    // Negative counts and observations without any salary value.
    std::size_t numDiscardedRecords;
  };

  /**
   * @class EvidenceAggregator
   * @brief Collapses raw evidence rows for a cell into per-company evidence.
   *
   * Headcount rows are summed per company and source type and weighted
   * (posting 0.5, visa 2.0, payroll 3.0). Companies below the configured
   * minimum weighted evidence are excluded from allocation. Salary
   * observations are passed through, minus degenerate ones.
   * Pure read; safe to call concurrently.
   */
  class EvidenceAggregator
  {
  public:
    EvidenceAggregator(const EngineConfiguration& config,
		       const IEvidenceRepository& repository)
      : mConfig(config),
	mRepository(repository)
    {}

    CellEvidence aggregate(const MetroRoleKey& key) const;

  private:
    const EngineConfiguration& mConfig;
    const IEvidenceRepository& mRepository;
  };
}
