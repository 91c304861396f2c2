#pragma once

#include <string>
#include <vector>
#include "BatchSummary.h"
#include "DomainTypes.h"
#include "LaborModelException.h"

namespace labormodel
{
  /**
   * @class EstimateSerializer
   * @brief JSON rendering of estimates, archetypes and batch summaries.
   *
   * Output is pretty-printed. Absent optional values are written as null.
   */
  class EstimateSerializer
  {
  public:
    static std::string toJson(const std::vector<HeadcountEstimate>& estimates);
    static std::string toJson(const std::vector<SalaryEstimate>& estimates);
    static std::string toJson(const std::vector<Archetype>& archetypes);
    static std::string toJson(const BatchSummary& summary);

    /**
     * @brief Write a JSON string to a file, replacing it.
     * @throws PersistenceException if the file cannot be written.
     */
    static void writeFile(const std::string& filePath, const std::string& json);
  };
}
