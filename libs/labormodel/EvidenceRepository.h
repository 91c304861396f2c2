#pragma once

#include <cstddef>
#include <map>
#include <vector>
#include "DomainTypes.h"

namespace labormodel
{
  /**
   * @class IEvidenceRepository
   * @brief Read access to the company evidence collected for each cell.
   *
   * Implementations must be safe for concurrent reads; the batch runner
   * queries the repository from several worker threads at once.
   */
  class IEvidenceRepository
  {
  public:
    virtual ~IEvidenceRepository() = default;

    virtual std::vector<HeadcountEvidenceRecord> getHeadcountEvidence(const MetroRoleKey& key) const = 0;
    virtual std::vector<SalaryObservation> getSalaryObservations(const MetroRoleKey& key) const = 0;
  };

  // Evidence indexed by cell. Populated once, then only read.
  class InMemoryEvidenceRepository : public IEvidenceRepository
  {
  public:
    InMemoryEvidenceRepository()
      : mHeadcountEvidence(),
	mSalaryObservations(),
	mNumDiscarded(0)
    {}

    // Negative counts are discarded and counted.
    void addHeadcountEvidence(const MetroRoleKey& key, const HeadcountEvidenceRecord& record);

    // Observations with neither min, max nor point are discarded and counted.
    void addSalaryObservation(const MetroRoleKey& key, const SalaryObservation& observation);

    // Counts an input row that could not be turned into evidence.
    void discardRecord()
    {
      mNumDiscarded++;
    }

    std::vector<HeadcountEvidenceRecord> getHeadcountEvidence(const MetroRoleKey& key) const override;
    std::vector<SalaryObservation> getSalaryObservations(const MetroRoleKey& key) const override;

    std::size_t getNumDiscarded() const
    {
      return mNumDiscarded;
    }

  private:
    std::map<MetroRoleKey, std::vector<HeadcountEvidenceRecord>> mHeadcountEvidence;
    std::map<MetroRoleKey, std::vector<SalaryObservation>> mSalaryObservations;
    std::size_t mNumDiscarded;
  };
}
