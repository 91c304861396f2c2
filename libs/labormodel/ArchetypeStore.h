#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "DomainTypes.h"
#include "LaborModelException.h"

namespace labormodel
{
  /**
   * @class IArchetypeStore
   * @brief Destination for reconciled archetypes.
   *
   * upsert() is keyed by the archetype's natural key (company, metro, role,
   * seniority, record type) and fully replaces an existing row, so running
   * the same batch twice leaves the store unchanged.
   *
   * @throws PersistenceException from upsert() or flush() on failure.
   */
  class IArchetypeStore
  {
  public:
    virtual ~IArchetypeStore() = default;

    virtual void upsert(const Archetype& archetype) = 0;

    // Make upserted rows durable. No-op for stores without a backing file.
    virtual void flush() = 0;

    virtual std::size_t size() const = 0;
  };

  class InMemoryArchetypeStore : public IArchetypeStore
  {
  public:
    InMemoryArchetypeStore() = default;

    void upsert(const Archetype& archetype) override;
    void flush() override;
    std::size_t size() const override;

    std::optional<Archetype> find(const ArchetypeKey& key) const;

    // All rows in natural key order.
    std::vector<Archetype> getAll() const;

  private:
    std::map<ArchetypeKey, Archetype> mRows;
  };

  /**
   * @class JsonArchetypeStore
   * @brief Keeps rows in memory and writes them as a JSON array on flush().
   */
  class JsonArchetypeStore : public IArchetypeStore
  {
  public:
    explicit JsonArchetypeStore(const std::string& filePath)
      : mFilePath(filePath),
	mRows()
    {}

    void upsert(const Archetype& archetype) override;
    void flush() override;
    std::size_t size() const override;

    const std::string& getFilePath() const
    {
      return mFilePath;
    }

  private:
    std::string mFilePath;
    InMemoryArchetypeStore mRows;
  };
}
