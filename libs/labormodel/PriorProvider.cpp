#include "PriorProvider.h"

namespace labormodel
{
  namespace
  {
    std::optional<double> reported(double wage)
    {
      if (wage > 0.0)
	return wage;

      return std::nullopt;
    }
  }

  void InMemoryPriorProvider::addPrior(const OEWSPriorRow& row)
  {
    PriorAccumulation& acc = mPriors[std::make_pair(row.referenceYear, row.key)];

    acc.employment += row.employment;
    acc.wageP10.add(row.wageP10);
    acc.wageP25.add(row.wageP25);
    acc.wageP50.add(row.wageP50);
    acc.wageP75.add(row.wageP75);
    acc.wageP90.add(row.wageP90);
    acc.wageMean.add(row.wageMean);
  }

  void InMemoryPriorProvider::addPrior(const OEWSPrior& prior)
  {
    addPrior(OEWSPriorRow{prior.getKey(), prior.getReferenceYear(), prior.getEmploymentTotal(),
			  reported(prior.getWageP10()), reported(prior.getWageP25()),
			  reported(prior.getWageP50()), reported(prior.getWageP75()),
			  reported(prior.getWageP90()), reported(prior.getWageMean())});
  }

  std::optional<OEWSPrior> InMemoryPriorProvider::getPrior(const MetroRoleKey& key, int referenceYear) const
  {
    auto it = mPriors.find(std::make_pair(referenceYear, key));
    if (it == mPriors.end())
      return std::nullopt;

    const PriorAccumulation& acc = it->second;
    const double median = acc.wageP50.getAverage().value_or(0.0);

    return OEWSPrior(key, referenceYear, acc.employment,
		     acc.wageP10.getAverage().value_or(median),
		     acc.wageP25.getAverage().value_or(median),
		     median,
		     acc.wageP75.getAverage().value_or(median),
		     acc.wageP90.getAverage().value_or(median),
		     acc.wageMean.getAverage().value_or(median));
  }

  std::vector<MetroRoleKey> InMemoryPriorProvider::listKeys(int referenceYear) const
  {
    std::vector<MetroRoleKey> keys;

    for (const auto& entry : mPriors)
      if (entry.first.first == referenceYear)
	keys.push_back(entry.first.second);

    return keys;
  }
}
