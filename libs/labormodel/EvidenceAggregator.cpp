#include "EvidenceAggregator.h"
#include <map>
#include <string>

namespace labormodel
{
  namespace
  {
    struct CompanyCounts
    {
      long postings = 0;
      long visas = 0;
      long payroll = 0;
    };
  }

  CellEvidence EvidenceAggregator::aggregate(const MetroRoleKey& key) const
  {
    CellEvidence cell(key);

    std::map<std::string, CompanyCounts> countsByCompany;
    for (const auto& record : mRepository.getHeadcountEvidence(key))
      {
	if (record.count < 0)
	  {
	    cell.numDiscardedRecords++;
	    continue;
	  }

	CompanyCounts& counts = countsByCompany[record.companyId];
	switch (record.sourceType)
	  {
	  case HeadcountSourceType::Posting:
	    counts.postings += record.count;
	    break;
	  case HeadcountSourceType::Visa:
	    counts.visas += record.count;
	    break;
	  case HeadcountSourceType::Payroll:
	    counts.payroll += record.count;
	    break;
	  }
      }

    const double threshold = mConfig.getHeadcountParameters().minEvidenceThreshold;

    struct Eligible
    {
      std::string companyId;
      CompanyCounts counts;
      double weighted;
    };

    std::vector<Eligible> eligible;
    double totalWeighted = 0.0;

    for (const auto& entry : countsByCompany)
      {
	const CompanyCounts& c = entry.second;
	const double weighted =
	  mConfig.getHeadcountSourceWeight(HeadcountSourceType::Posting) * static_cast<double>(c.postings) +
	  mConfig.getHeadcountSourceWeight(HeadcountSourceType::Visa) * static_cast<double>(c.visas) +
	  mConfig.getHeadcountSourceWeight(HeadcountSourceType::Payroll) * static_cast<double>(c.payroll);

	if (weighted < threshold)
	  {
	    cell.numExcludedCompanies++;
	    continue;
	  }

	eligible.push_back(Eligible{entry.first, c, weighted});
	totalWeighted += weighted;
      }

    cell.companies.reserve(eligible.size());
    for (const auto& e : eligible)
      {
	// A zero threshold admits companies with no weighted evidence at all
	const double share = totalWeighted > 0.0
	  ? e.weighted / totalWeighted
	  : 1.0 / static_cast<double>(eligible.size());

	cell.companies.emplace_back(e.companyId, e.counts.postings, e.counts.visas, e.counts.payroll,
				    e.weighted, share);
      }

    for (const auto& observation : mRepository.getSalaryObservations(key))
      {
	if (observation.isDegenerate())
	  {
	    cell.numDiscardedRecords++;
	    continue;
	  }
	cell.salaryObservations.push_back(observation);
      }

    return cell;
  }
}
