#include "ArchetypeAssembler.h"
#include <algorithm>
#include <map>
#include <optional>
#include <string>

namespace labormodel
{
  double ArchetypeAssembler::computeCompositeConfidence(RecordType type, double evidenceVolume) const
  {
    const ConfidenceBand& band = mConfig.getConfidenceBand(type);
    const double v = std::max(0.0, evidenceVolume);
    const double scale = mConfig.getConfidenceParameters().evidenceScale;

    return band.floor + (band.ceiling - band.floor) * v / (v + scale);
  }

  std::vector<Archetype> ArchetypeAssembler::assemble(const std::vector<HeadcountEstimate>& headcounts,
						      const std::vector<SalaryEstimate>& salaries,
						      const CompanyDirectory& directory) const
  {
    std::map<std::string, const SalaryEstimate*> salaryByCompany;
    for (const auto& salary : salaries)
      salaryByCompany[salary.getCompanyId()] = &salary;

    std::vector<Archetype> archetypes;
    archetypes.reserve(headcounts.size());

    for (const auto& headcount : headcounts)
      {
	std::optional<double> p25, p50, p75;
	double volume = headcount.getEvidenceScore();

	auto it = salaryByCompany.find(headcount.getCompanyId());
	if (it != salaryByCompany.end())
	  {
	    const SalaryEstimate& salary = *it->second;
	    p25 = salary.getP25();
	    p50 = salary.getP50();
	    p75 = salary.getP75();
	    volume += salary.getEffectiveSampleSize();
	  }

	archetypes.emplace_back(headcount.getCompanyId(),
				headcount.getKey(),
				Seniority::Mid,
				RecordType::KnownEmployerInferred,
				directory.getIndustry(headcount.getCompanyId()),
				headcount.getP10(),
				headcount.getP50(),
				headcount.getP90(),
				p25, p50, p75,
				computeCompositeConfidence(RecordType::KnownEmployerInferred, volume));
      }

    return archetypes;
  }
}
