#include "TierReconciler.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace labormodel
{
  namespace
  {
    struct IndustryTotals
    {
      long known = 0;
      long synthetic = 0;
      bool hasSyntheticRows = false;
    };

    long scaleHeadcount(long value, double fraction)
    {
      return std::max(0L, std::lround(static_cast<double>(value) * fraction));
    }
  }

  ReconciliationResult TierReconciler::reconcile(const std::vector<Archetype>& archetypes,
						 std::ostream& os) const
  {
    std::map<std::string, IndustryTotals> totals;
    for (const auto& archetype : archetypes)
      {
	IndustryTotals& t = totals[archetype.getIndustry()];
	if (archetype.getRecordType() == RecordType::CbpSynthetic)
	  {
	    t.synthetic += archetype.getHeadcountP50();
	    t.hasSyntheticRows = true;
	  }
	else
	  t.known += archetype.getHeadcountP50();
      }

    std::map<std::string, IndustryReconciliation> reports;
    for (const auto& entry : totals)
      {
	if (!entry.second.hasSyntheticRows)
	  continue;

	double fraction = 1.0;
	if (entry.second.known > 0)
	  fraction = entry.second.synthetic > 0
	    ? std::max(0.0, 1.0 - static_cast<double>(entry.second.known) /
		       static_cast<double>(entry.second.synthetic))
	    : 0.0;

	reports.emplace(entry.first,
			IndustryReconciliation{entry.first, entry.second.known, entry.second.synthetic,
			    0, fraction, 0});
      }

    const double discount = mConfig.getConfidenceParameters().syntheticOverlapDiscount;

    ReconciliationResult result;
    result.archetypes.reserve(archetypes.size());

    for (const auto& archetype : archetypes)
      {
	if (archetype.getRecordType() != RecordType::CbpSynthetic)
	  {
	    result.archetypes.push_back(archetype);
	    continue;
	  }

	IndustryReconciliation& report = reports.at(archetype.getIndustry());
	if (report.knownHeadcount <= 0)
	  {
	    report.syntheticHeadcountAfter += archetype.getHeadcountP50();
	    result.archetypes.push_back(archetype);
	    continue;
	  }

	const double fraction = report.remainingFraction;
	const long p50 = scaleHeadcount(archetype.getHeadcountP50(), fraction);
	if (p50 == 0)
	  {
	    report.droppedRows++;
	    continue;
	  }

	const long p10 = std::min(p50, scaleHeadcount(archetype.getHeadcountP10(), fraction));
	const long p90 = std::max(p50, scaleHeadcount(archetype.getHeadcountP90(), fraction));

	report.syntheticHeadcountAfter += p50;
	result.archetypes.push_back(archetype.withAdjustedHeadcount(p10, p50, p90,
								    archetype.getCompositeConfidence() * discount));
      }

    for (const auto& entry : reports)
      {
	const IndustryReconciliation& r = entry.second;
	result.industries.push_back(r);

	os << "   [Reconcile] " << r.industry << ": known " << r.knownHeadcount
	   << ", synthetic " << r.syntheticHeadcountBefore << " -> " << r.syntheticHeadcountAfter;
	if (r.knownHeadcount > 0)
	  os << " (remaining " << r.remainingFraction << ", " << r.droppedRows << " rows dropped)";
	else
	  os << " (no known employers, unchanged)";
	os << std::endl;
      }

    return result;
  }
}
