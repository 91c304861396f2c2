#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "ArchetypeAssembler.h"
#include "ArchetypeStore.h"
#include "BatchSummary.h"
#include "CompanyDirectory.h"
#include "DomainTypes.h"
#include "EngineConfiguration.h"
#include "EvidenceAggregator.h"
#include "EvidenceRepository.h"
#include "HeadcountAllocator.h"
#include "PriorProvider.h"
#include "SalaryPosteriorEstimator.h"
#include "SyntheticTierGenerator.h"
#include "TierReconciler.h"

namespace labormodel
{
  struct BatchParameters
  {
    int referenceYear = 2024;

    // Zero means no limit. Limits keep the first metro areas / roles in key order.
    std::size_t limitMetroAreas = 0;
    std::size_t limitRoles = 0;

    bool persist = false;
    uint64_t randomSeed = 42;

    // Zero sizes the pool to the hardware; one runs cells on the caller's thread.
    unsigned int numThreads = 0;

    // Echo every cell's log. Otherwise only skipped and failed cells are shown.
    bool verbose = false;
  };

  enum class CellStatus
    {
      Processed,
      Skipped,
      Failed,
      Insufficient,
      Cancelled
    };

  std::string toString(CellStatus status);

  // Everything one cell produced. Only Processed cells carry estimates.
  struct CellResult
  {
    explicit CellResult(const MetroRoleKey& cellKey)
      : key(cellKey),
	status(CellStatus::Processed),
	headcounts(),
	salaries(),
	archetypes(),
	excludedCompanies(0),
	discardedRecords(0),
	message(),
	log()
    {}

    MetroRoleKey key;
    CellStatus status;
    std::vector<HeadcountEstimate> headcounts;
    std::vector<SalaryEstimate> salaries;
    std::vector<Archetype> archetypes;
    std::size_t excludedCompanies;
    std::size_t discardedRecords;
    std::string message;
    std::string log;
  };

  // Archetypes that do not come out of the per-cell estimators.
  struct TierInputs
  {
    std::vector<Archetype> observed;
    std::vector<EstablishmentRecord> establishments;
  };

  struct BatchResult
  {
    BatchSummary summary;
    std::vector<HeadcountEstimate> headcounts;
    std::vector<SalaryEstimate> salaries;

    // All tiers after reconciliation.
    std::vector<Archetype> archetypes;
  };

  /**
   * @class BatchRunner
   * @brief Runs inference over every selected (metro, role) cell, then
   *        reconciles the tiers and persists the result.
   *
   * Cells are independent and run on a worker pool. Each cell writes only its
   * own result slot and its own log buffer; logs are copied to the output
   * stream in cell order once all cells have finished, so output does not
   * depend on scheduling. Monte Carlo draws are seeded per cell from the
   * master seed and the cell identity.
   *
   * A cell whose prior is missing, or has no employment total, is skipped.
   * A prior without a median wage still yields headcount estimates and
   * archetypes, with no salary estimates. A cell that throws anything else
   * is marked failed. Neither stops the batch, and neither contributes
   * partial output. Reconciliation runs once, after every cell.
   */
  class BatchRunner
  {
  public:
    BatchRunner(const EngineConfiguration& config,
		const IPriorProvider& priors,
		const IEvidenceRepository& evidence,
		const CompanyDirectory& directory);

    std::vector<MetroRoleKey> selectCells(const BatchParameters& params) const;

    CellResult processCell(const MetroRoleKey& key, const BatchParameters& params) const;

    /**
     * @param params  Batch control.
     * @param tiers   Observed rows and establishment data for the other tiers.
     * @param store   Receives reconciled archetypes when params.persist is set.
     * @param os      Progress and diagnostic output.
     */
    BatchResult run(const BatchParameters& params,
		    const TierInputs& tiers,
		    IArchetypeStore& store,
		    std::ostream& os);

    // Cells not yet started when this is called are reported as cancelled.
    void cancel()
    {
      mCancelled.store(true);
    }

    bool isCancelled() const
    {
      return mCancelled.load();
    }

  private:
    void persistArchetypes(const std::vector<Archetype>& archetypes,
			   IArchetypeStore& store,
			   BatchSummary& summary,
			   std::ostream& os) const;

    const EngineConfiguration& mConfig;
    const IPriorProvider& mPriors;
    const CompanyDirectory& mDirectory;
    EvidenceAggregator mAggregator;
    HeadcountAllocator mAllocator;
    SalaryPosteriorEstimator mSalaryEstimator;
    ArchetypeAssembler mAssembler;
    TierReconciler mReconciler;
    std::atomic<bool> mCancelled;
  };
}
