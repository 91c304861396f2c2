#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "TierReconciler.h"

namespace labormodel
{
  struct CellFailure
  {
    std::string cell;
    std::string message;
  };

  // Counters reported at the end of a batch run.
  struct BatchSummary
  {
    int referenceYear = 0;

    std::size_t cellsProcessed = 0;
    std::size_t cellsSkipped = 0;
    std::size_t cellsFailed = 0;
    std::size_t cellsInsufficient = 0;
    std::size_t cellsCancelled = 0;

    std::size_t headcountEstimates = 0;
    std::size_t salaryEstimates = 0;
    std::size_t excludedCompanies = 0;
    std::size_t discardedRecords = 0;

    std::size_t observedArchetypes = 0;
    std::size_t inferredArchetypes = 0;
    std::size_t syntheticArchetypes = 0;
    std::size_t reconciledArchetypes = 0;

    std::size_t archetypesPersisted = 0;
    std::size_t persistenceFailures = 0;

    std::vector<IndustryReconciliation> reconciliation;
    std::vector<CellFailure> failures;

    std::size_t totalCells() const
    {
      return cellsProcessed + cellsSkipped + cellsFailed + cellsInsufficient + cellsCancelled;
    }
  };
}
