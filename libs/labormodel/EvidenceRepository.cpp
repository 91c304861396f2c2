#include "EvidenceRepository.h"

namespace labormodel
{
  void InMemoryEvidenceRepository::addHeadcountEvidence(const MetroRoleKey& key,
							const HeadcountEvidenceRecord& record)
  {
    if (record.count < 0)
      {
	mNumDiscarded++;
	return;
      }

    mHeadcountEvidence[key].push_back(record);
  }

  void InMemoryEvidenceRepository::addSalaryObservation(const MetroRoleKey& key,
							const SalaryObservation& observation)
  {
    if (observation.isDegenerate())
      {
	mNumDiscarded++;
	return;
      }

    mSalaryObservations[key].push_back(observation);
  }

  std::vector<HeadcountEvidenceRecord>
  InMemoryEvidenceRepository::getHeadcountEvidence(const MetroRoleKey& key) const
  {
    auto it = mHeadcountEvidence.find(key);
    if (it == mHeadcountEvidence.end())
      return {};

    return it->second;
  }

  std::vector<SalaryObservation>
  InMemoryEvidenceRepository::getSalaryObservations(const MetroRoleKey& key) const
  {
    auto it = mSalaryObservations.find(key);
    if (it == mSalaryObservations.end())
      return {};

    return it->second;
  }
}
