#include "SyntheticTierGenerator.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <map>

namespace labormodel
{
  namespace
  {
    const std::array<SizeClass, 9> SIZE_CLASSES = {{
	{210, 1, 4, 2.5},
	{220, 5, 9, 7.0},
	{230, 10, 19, 15.0},
	{241, 20, 49, 35.0},
	{242, 50, 99, 75.0},
	{251, 100, 249, 175.0},
	{252, 250, 499, 375.0},
	{254, 500, 999, 750.0},
	{260, 1000, 5000, 2000.0}
      }};

    constexpr double SIZE_CONFIDENCE_BASE = 0.30;
    constexpr double SIZE_CONFIDENCE_SLOPE = 0.3;
    constexpr double SIZE_CONFIDENCE_CAP = 0.60;
    constexpr double SALARY_CONFIDENCE = 0.85;
    constexpr double LOCATION_CONFIDENCE = 0.50;
    constexpr double OCCUPATION_MIX_CONFIDENCE = 0.8;
  }

  std::optional<SizeClass> SyntheticTierGenerator::lookupSizeClass(int code)
  {
    for (const auto& sizeClass : SIZE_CLASSES)
      if (sizeClass.code == code)
	return sizeClass;

    return std::nullopt;
  }

  double SyntheticTierGenerator::syntheticConfidence(const SizeClass& sizeClass)
  {
    const double sizeConfidence =
      std::min(SIZE_CONFIDENCE_CAP,
	       SIZE_CONFIDENCE_BASE + (static_cast<double>(sizeClass.minEmployees) / 1000.0) * SIZE_CONFIDENCE_SLOPE);

    return sizeConfidence * SALARY_CONFIDENCE * LOCATION_CONFIDENCE * OCCUPATION_MIX_CONFIDENCE;
  }

  std::string SyntheticTierGenerator::syntheticCompanyId(const EstablishmentRecord& record)
  {
    return "cbp:" + record.naicsCode + ":" + std::to_string(record.sizeClass);
  }

  std::vector<Archetype> SyntheticTierGenerator::generate(const std::vector<EstablishmentRecord>& establishments,
							  std::ostream& os) const
  {
    const OccupationMix& mix = mConfig.getOccupationMix();
    const ConfidenceBand& band = mConfig.getConfidenceBand(RecordType::CbpSynthetic);

    std::vector<Archetype> archetypes;
    std::map<ArchetypeKey, std::size_t> indexByKey;
    std::size_t numSkipped = 0;
    long totalHeadcount = 0;

    for (const auto& record : establishments)
      {
	const std::optional<SizeClass> sizeClass = lookupSizeClass(record.sizeClass);
	if (!sizeClass)
	  {
	    os << "   [Synthetic] unknown size class " << record.sizeClass << " for NAICS "
	       << record.naicsCode << " in " << record.metroAreaId << ", row skipped" << std::endl;
	    numSkipped++;
	    continue;
	  }

	if (record.establishments <= 0)
	  continue;

	const bool estimated = record.employment <= 0;
	const double employment = estimated
	  ? static_cast<double>(record.establishments) * sizeClass->midpoint
	  : static_cast<double>(record.employment);

	const std::vector<RoleFraction>& roles = mix.getMix(record.industry);
	if (roles.empty())
	  {
	    numSkipped++;
	    continue;
	  }

	const double confidence = std::clamp(syntheticConfidence(*sizeClass), band.floor, band.ceiling);
	const std::string companyId = syntheticCompanyId(record);

	for (const auto& role : roles)
	  {
	    const long p50 = static_cast<long>(employment * role.fraction);
	    if (p50 < 1)
	      continue;

	    long p10 = p50;
	    long p90 = p50;
	    if (estimated)
	      {
		const double perEstablishment = static_cast<double>(record.establishments) * role.fraction;
		p10 = std::min(p50, static_cast<long>(perEstablishment * static_cast<double>(sizeClass->minEmployees)));
		p90 = std::max(p50, static_cast<long>(perEstablishment * static_cast<double>(sizeClass->maxEmployees)));
	      }

	    const MetroRoleKey key(record.metroAreaId, role.canonicalRoleId);
	    std::optional<double> salaryP25, salaryP50, salaryP75;
	    if (const auto prior = mPriors.getPrior(key, mReferenceYear))
	      {
		salaryP25 = prior->getWageP25();
		salaryP50 = prior->getWageP50();
		salaryP75 = prior->getWageP75();
	      }

	    Archetype archetype(companyId, key, Seniority::Mid, RecordType::CbpSynthetic,
				record.industry, p10, p50, p90,
				salaryP25, salaryP50, salaryP75, confidence);

	    totalHeadcount += p50;
	    auto found = indexByKey.find(archetype.getNaturalKey());
	    if (found == indexByKey.end())
	      {
		indexByKey.emplace(archetype.getNaturalKey(), archetypes.size());
		archetypes.push_back(archetype);
	      }
	    else
	      {
		const Archetype& existing = archetypes[found->second];
		archetypes[found->second] =
		  existing.withAdjustedHeadcount(existing.getHeadcountP10() + p10,
						 existing.getHeadcountP50() + p50,
						 existing.getHeadcountP90() + p90,
						 existing.getCompositeConfidence());
	      }
	  }
      }

    os << "   [Synthetic] " << archetypes.size() << " synthetic archetypes from "
       << establishments.size() << " establishment rows, " << totalHeadcount << " positions";
    if (numSkipped > 0)
      os << ", " << numSkipped << " rows skipped";
    os << std::endl;

    return archetypes;
  }
}
