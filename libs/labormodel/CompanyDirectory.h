#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace labormodel
{
  // Company id -> display name and industry.
  class CompanyDirectory
  {
  public:
    static constexpr const char* UNKNOWN_INDUSTRY = "other";

    struct Entry
    {
      std::string companyName;
      std::string industry;
    };

    CompanyDirectory() = default;

    void addCompany(const std::string& companyId, const std::string& companyName, const std::string& industry)
    {
      mEntries[companyId] = Entry{companyName, industry.empty() ? std::string(UNKNOWN_INDUSTRY) : industry};
    }

    // "other" for companies not in the directory.
    std::string getIndustry(const std::string& companyId) const
    {
      auto it = mEntries.find(companyId);
      return it == mEntries.end() ? std::string(UNKNOWN_INDUSTRY) : it->second.industry;
    }

    std::string getCompanyName(const std::string& companyId) const
    {
      auto it = mEntries.find(companyId);
      return it == mEntries.end() ? companyId : it->second.companyName;
    }

    std::size_t size() const
    {
      return mEntries.size();
    }

  private:
    std::map<std::string, Entry> mEntries;
  };
}
