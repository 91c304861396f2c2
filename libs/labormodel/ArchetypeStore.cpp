#include "ArchetypeStore.h"
#include <cmath>
#include "EstimateSerializer.h"

namespace labormodel
{
  namespace
  {
    // Row-level constraints a relational archetype table would enforce.
    void checkPersistable(const Archetype& archetype)
    {
      const std::string where = " for " + archetype.getCompanyId() + " in " + archetype.getKey().toString();

      if (archetype.getCompanyId().empty())
	throw PersistenceException("ArchetypeStore: empty company id in " + archetype.getKey().toString());

      if (archetype.getKey().getMetroAreaId().empty())
	throw PersistenceException("ArchetypeStore: empty metro area id" + where);

      if (archetype.getHeadcountP10() < 0 ||
	  archetype.getHeadcountP10() > archetype.getHeadcountP50() ||
	  archetype.getHeadcountP50() > archetype.getHeadcountP90())
	throw PersistenceException("ArchetypeStore: headcount percentiles out of order" + where);

      const double confidence = archetype.getCompositeConfidence();
      if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0)
	throw PersistenceException("ArchetypeStore: composite confidence outside [0, 1]" + where);
    }
  }

  void InMemoryArchetypeStore::upsert(const Archetype& archetype)
  {
    checkPersistable(archetype);

    const ArchetypeKey key = archetype.getNaturalKey();
    auto it = mRows.find(key);
    if (it == mRows.end())
      mRows.emplace(key, archetype);
    else
      it->second = archetype;
  }

  void InMemoryArchetypeStore::flush()
  {}

  std::size_t InMemoryArchetypeStore::size() const
  {
    return mRows.size();
  }

  std::optional<Archetype> InMemoryArchetypeStore::find(const ArchetypeKey& key) const
  {
    auto it = mRows.find(key);
    if (it == mRows.end())
      return std::nullopt;

    return it->second;
  }

  std::vector<Archetype> InMemoryArchetypeStore::getAll() const
  {
    std::vector<Archetype> rows;
    rows.reserve(mRows.size());
    for (const auto& entry : mRows)
      rows.push_back(entry.second);

    return rows;
  }

  void JsonArchetypeStore::upsert(const Archetype& archetype)
  {
    mRows.upsert(archetype);
  }

  void JsonArchetypeStore::flush()
  {
    EstimateSerializer::writeFile(mFilePath, EstimateSerializer::toJson(mRows.getAll()));
  }

  std::size_t JsonArchetypeStore::size() const
  {
    return mRows.size();
  }
}
