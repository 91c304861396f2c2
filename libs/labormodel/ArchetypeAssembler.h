#pragma once

#include <vector>
#include "CompanyDirectory.h"
#include "DomainTypes.h"
#include "EngineConfiguration.h"

namespace labormodel
{
  /**
   * @class ArchetypeAssembler
   * @brief Joins a cell's headcount and salary estimates into
   *        KnownEmployerInferred archetypes and scores their confidence.
   *
   * Composite confidence sits inside the record type's band and rises with
   * the volume of evidence behind the row:
   *
   *   confidence = floor + (ceiling - floor) * v / (v + evidence_scale)
   *
   * where v is the headcount evidence score plus the salary effective
   * sample size.
   */
  class ArchetypeAssembler
  {
  public:
    explicit ArchetypeAssembler(const EngineConfiguration& config)
      : mConfig(config)
    {}

    double computeCompositeConfidence(RecordType type, double evidenceVolume) const;

    // One archetype per headcount estimate; salary fields are empty for
    // companies with no salary estimate.
    std::vector<Archetype> assemble(const std::vector<HeadcountEstimate>& headcounts,
				    const std::vector<SalaryEstimate>& salaries,
				    const CompanyDirectory& directory) const;

  private:
    const EngineConfiguration& mConfig;
  };
}
