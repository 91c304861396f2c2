#include "BatchRunner.h"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "RandomPcg.h"
#include "RngUtils.h"

namespace labormodel
{
  namespace
  {
    constexpr std::size_t PROGRESS_INTERVAL = 100;
  }

  std::string toString(CellStatus status)
  {
    switch (status)
      {
      case CellStatus::Processed:
	return "processed";
      case CellStatus::Skipped:
	return "skipped";
      case CellStatus::Failed:
	return "failed";
      case CellStatus::Insufficient:
	return "insufficient";
      case CellStatus::Cancelled:
	return "cancelled";
      }
    throw std::logic_error("toString: unhandled cell status");
  }

  BatchRunner::BatchRunner(const EngineConfiguration& config,
			   const IPriorProvider& priors,
			   const IEvidenceRepository& evidence,
			   const CompanyDirectory& directory)
    : mConfig(config),
      mPriors(priors),
      mDirectory(directory),
      mAggregator(config, evidence),
      mAllocator(config),
      mSalaryEstimator(config),
      mAssembler(config),
      mReconciler(config),
      mCancelled(false)
  {}

  std::vector<MetroRoleKey> BatchRunner::selectCells(const BatchParameters& params) const
  {
    const std::vector<MetroRoleKey> keys = mPriors.listKeys(params.referenceYear);

    std::set<std::string> metros;
    std::set<int> roles;
    for (const auto& key : keys)
      {
	metros.insert(key.getMetroAreaId());
	roles.insert(key.getCanonicalRoleId());
      }

    if (params.limitMetroAreas > 0 && metros.size() > params.limitMetroAreas)
      metros.erase(std::next(metros.begin(), static_cast<long>(params.limitMetroAreas)), metros.end());

    if (params.limitRoles > 0 && roles.size() > params.limitRoles)
      roles.erase(std::next(roles.begin(), static_cast<long>(params.limitRoles)), roles.end());

    std::vector<MetroRoleKey> selected;
    for (const auto& key : keys)
      if (metros.count(key.getMetroAreaId()) && roles.count(key.getCanonicalRoleId()))
	selected.push_back(key);

    return selected;
  }

  CellResult BatchRunner::processCell(const MetroRoleKey& key, const BatchParameters& params) const
  {
    CellResult result(key);

    if (isCancelled())
      {
	result.status = CellStatus::Cancelled;
	return result;
      }

    std::ostringstream log;

    try
      {
	const auto prior = mPriors.getPrior(key, params.referenceYear);
	if (!prior)
	  throw MissingPriorException("no prior for cell " + key.toString() + " in reference year " +
				      std::to_string(params.referenceYear));

	const CellEvidence evidence = mAggregator.aggregate(key);
	result.excludedCompanies = evidence.numExcludedCompanies;
	result.discardedRecords = evidence.numDiscardedRecords;

	stats::RandomPcg rng(rng_utils::make_cell_seed(params.randomSeed,
						       key.getMetroAreaId(),
						       key.getCanonicalRoleId()));

	std::vector<HeadcountEstimate> headcounts =
	  mAllocator.allocate(*prior, evidence.companies, rng, log);

	// Without a median wage the salary side has nothing to shrink toward;
	// the headcount side still stands on its own.
	const bool hasWagePrior = prior->getWageP50() > 0.0;

	if (headcounts.empty() && (evidence.salaryObservations.empty() || !hasWagePrior))
	  {
	    log << "   [Cell] " << key << ": insufficient evidence, no rows produced" << std::endl;
	    result.status = CellStatus::Insufficient;
	    result.log = log.str();
	    return result;
	  }

	std::vector<SalaryEstimate> salaries;
	if (hasWagePrior)
	  {
	    std::set<std::string> salaryCompanies;
	    for (const auto& h : headcounts)
	      salaryCompanies.insert(h.getCompanyId());
	    for (const auto& observation : evidence.salaryObservations)
	      salaryCompanies.insert(observation.getCompanyId());

	    salaries.reserve(salaryCompanies.size());
	    for (const auto& companyId : salaryCompanies)
	      salaries.push_back(mSalaryEstimator.estimate(*prior, companyId, evidence.salaryObservations, log));
	  }
	else
	  log << "   [Salary] " << key << ": prior has no median wage, salary estimates skipped" << std::endl;

	result.archetypes = mAssembler.assemble(headcounts, salaries, mDirectory);
	result.headcounts = std::move(headcounts);
	result.salaries = std::move(salaries);
	result.status = CellStatus::Processed;

	log << "   [Cell] " << key << ": " << result.headcounts.size() << " headcount, "
	    << result.salaries.size() << " salary estimates" << std::endl;
      }
    catch (const MissingPriorException& e)
      {
	result.status = CellStatus::Skipped;
	result.message = e.what();
	result.headcounts.clear();
	result.salaries.clear();
	result.archetypes.clear();
	log << "   [Cell] " << key << " skipped: " << e.what() << std::endl;
      }
    catch (const std::exception& e)
      {
	result.status = CellStatus::Failed;
	result.message = e.what();
	result.headcounts.clear();
	result.salaries.clear();
	result.archetypes.clear();
	log << "   [Cell] " << key << " FAILED: " << e.what() << std::endl;
      }

    result.log = log.str();
    return result;
  }

  BatchResult BatchRunner::run(const BatchParameters& params,
			       const TierInputs& tiers,
			       IArchetypeStore& store,
			       std::ostream& os)
  {
    BatchResult result;
    BatchSummary& summary = result.summary;
    summary.referenceYear = params.referenceYear;

    const std::vector<MetroRoleKey> cells = selectCells(params);
    os << "[Batch] " << cells.size() << " cells selected for reference year " << params.referenceYear
       << " (seed " << params.randomSeed << ", "
       << mConfig.getHeadcountParameters().monteCarloSamples << " Monte Carlo draws)" << std::endl;

    std::vector<CellResult> cellResults;
    cellResults.reserve(cells.size());
    for (const auto& key : cells)
      cellResults.emplace_back(key);

    auto body = [this, &cells, &cellResults, &params](std::size_t i) {
      cellResults[i] = processCell(cells[i], params);
    };

    if (params.numThreads == 1)
      {
	concurrency::SingleThreadExecutor executor;
	concurrency::parallel_for(cells.size(), executor, body);
      }
    else
      {
	concurrency::ThreadPoolExecutor executor(params.numThreads);
	concurrency::parallel_for(cells.size(), executor, body);
      }

    for (std::size_t i = 0; i < cellResults.size(); ++i)
      {
	CellResult& cell = cellResults[i];
	if (params.verbose || cell.status == CellStatus::Skipped || cell.status == CellStatus::Failed)
	  os << cell.log;

	summary.excludedCompanies += cell.excludedCompanies;
	summary.discardedRecords += cell.discardedRecords;

	switch (cell.status)
	  {
	  case CellStatus::Processed:
	    summary.cellsProcessed++;
	    result.headcounts.insert(result.headcounts.end(), cell.headcounts.begin(), cell.headcounts.end());
	    result.salaries.insert(result.salaries.end(), cell.salaries.begin(), cell.salaries.end());
	    break;
	  case CellStatus::Skipped:
	    summary.cellsSkipped++;
	    break;
	  case CellStatus::Failed:
	    summary.cellsFailed++;
	    summary.failures.push_back(CellFailure{cell.key.toString(), cell.message});
	    break;
	  case CellStatus::Insufficient:
	    summary.cellsInsufficient++;
	    break;
	  case CellStatus::Cancelled:
	    summary.cellsCancelled++;
	    break;
	  }

	if ((i + 1) % PROGRESS_INTERVAL == 0)
	  os << "[Batch] progress: " << (i + 1) << "/" << cellResults.size() << " cells" << std::endl;
      }

    summary.headcountEstimates = result.headcounts.size();
    summary.salaryEstimates = result.salaries.size();

    std::vector<Archetype> allTiers(tiers.observed);
    summary.observedArchetypes = tiers.observed.size();

    for (const auto& cell : cellResults)
      if (cell.status == CellStatus::Processed)
	{
	  summary.inferredArchetypes += cell.archetypes.size();
	  allTiers.insert(allTiers.end(), cell.archetypes.begin(), cell.archetypes.end());
	}

    if (!tiers.establishments.empty())
      {
	SyntheticTierGenerator generator(mConfig, mPriors, params.referenceYear);
	std::vector<Archetype> synthetic = generator.generate(tiers.establishments, os);
	summary.syntheticArchetypes = synthetic.size();
	allTiers.insert(allTiers.end(), synthetic.begin(), synthetic.end());
      }

    ReconciliationResult reconciled = mReconciler.reconcile(allTiers, os);
    result.archetypes = std::move(reconciled.archetypes);
    summary.reconciliation = std::move(reconciled.industries);
    summary.reconciledArchetypes = result.archetypes.size();

    if (params.persist)
      persistArchetypes(result.archetypes, store, summary, os);
    else
      os << "[Batch] dry run: " << result.archetypes.size() << " archetypes not persisted" << std::endl;

    os << "[Batch] cells processed " << summary.cellsProcessed
       << ", skipped " << summary.cellsSkipped
       << ", failed " << summary.cellsFailed
       << ", insufficient " << summary.cellsInsufficient;
    if (summary.cellsCancelled > 0)
      os << ", cancelled " << summary.cellsCancelled;
    os << std::endl;

    return result;
  }

  void BatchRunner::persistArchetypes(const std::vector<Archetype>& archetypes,
				      IArchetypeStore& store,
				      BatchSummary& summary,
				      std::ostream& os) const
  {
    for (const auto& archetype : archetypes)
      {
	try
	  {
	    store.upsert(archetype);
	    summary.archetypesPersisted++;
	  }
	catch (const PersistenceException& e)
	  {
	    summary.persistenceFailures++;
	    os << "   [Persist] upsert failed: " << e.what() << std::endl;
	  }
      }

    try
      {
	store.flush();
      }
    catch (const PersistenceException& e)
      {
	summary.persistenceFailures += summary.archetypesPersisted;
	summary.archetypesPersisted = 0;
	os << "   [Persist] flush failed: " << e.what() << std::endl;
      }

    os << "[Batch] persisted " << summary.archetypesPersisted << " archetypes";
    if (summary.persistenceFailures > 0)
      os << " (" << summary.persistenceFailures << " failures)";
    os << std::endl;
  }
}
