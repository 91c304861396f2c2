#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "CompanyDirectory.h"
#include "DomainTypes.h"
#include "EngineConfiguration.h"
#include "EvidenceRepository.h"
#include "LaborModelException.h"
#include "PriorProvider.h"
#include "SyntheticTierGenerator.h"

namespace labormodel
{
  /*
   * Readers for the comma separated input files. Each file starts with a
   * header row naming its columns; extra columns are ignored and fields may
   * be double quoted. A missing file or header raises EvidenceFileException.
   * Malformed prior and evidence rows are counted and skipped; a malformed
   * row in the other files raises EvidenceFileException naming the line.
   */

  // year,area_code,occ_code,canonical_role_id,employment,wage_p10,wage_p25,
  // wage_median,wage_p75,wage_p90,wage_mean
  // Empty or non-numeric wages are not reported; empty employment counts as 0.
  // Returns the number of rows read, discarded rows included.
  std::size_t readPriorTable(const std::string& filePath, InMemoryPriorProvider& priors);

  // company_id,area_code,canonical_role_id,source_type,count
  std::size_t readHeadcountEvidence(const std::string& filePath, InMemoryEvidenceRepository& repository);

  // company_id,area_code,canonical_role_id,source_type,salary_min,salary_max,salary_point
  // Empty salary fields are absent values.
  std::size_t readSalaryEvidence(const std::string& filePath, InMemoryEvidenceRepository& repository);

  // company_id,company_name,industry
  CompanyDirectory readCompanyDirectory(const std::string& filePath);

  // company_id,area_code,canonical_role_id,seniority,industry,headcount,salary_p50,confidence
  // An empty confidence takes the floor of the Observed band.
  std::vector<Archetype> readObservedArchetypes(const std::string& filePath,
						const EngineConfiguration& config);

  // area_code,naics_code,industry,size_class,establishments,employment
  std::vector<EstablishmentRecord> readEstablishments(const std::string& filePath);
}
