#include "CsvInputReaders.h"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include "csv.h"

namespace labormodel
{
  namespace
  {
    template <unsigned int N>
    using CsvFile = io::CSVReader<N, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>>;

    template <unsigned int N>
    std::string location(const std::string& filePath, const CsvFile<N>& reader)
    {
      return filePath + " line " + std::to_string(reader.get_file_line());
    }

    // Empty, non-numeric and non-finite fields give no value.
    std::optional<double> tryParseDouble(const std::string& field)
    {
      if (field.empty())
	return std::nullopt;

      char* end = nullptr;
      errno = 0;
      const double value = std::strtod(field.c_str(), &end);
      if (end == field.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(value))
	return std::nullopt;

      return value;
    }

    std::optional<double> parseOptionalDouble(const std::string& field, const std::string& where)
    {
      if (field.empty())
	return std::nullopt;

      const std::optional<double> value = tryParseDouble(field);
      if (!value)
	throw EvidenceFileException(where + ": not a number '" + field + "'");

      return value;
    }

    template <typename T>
    std::optional<T> tryParseInteger(const std::string& field)
    {
      if (field.empty())
	return std::nullopt;

      char* end = nullptr;
      errno = 0;
      const long long value = std::strtoll(field.c_str(), &end, 10);
      if (*end != '\0' || errno == ERANGE ||
	  value < static_cast<long long>(std::numeric_limits<T>::min()) ||
	  value > static_cast<long long>(std::numeric_limits<T>::max()))
	return std::nullopt;

      return static_cast<T>(value);
    }

    template <typename T>
    T parseInteger(const std::string& field, const std::string& where, const char* column)
    {
      const std::optional<T> value = tryParseInteger<T>(field);
      if (!value)
	throw EvidenceFileException(where + ": " + column + " is not an integer '" + field + "'");

      return *value;
    }

    // OEWS marks suppressed wages with '*' or '#'; those and non-positive
    // values are not reported.
    std::optional<double> reportedWage(const std::string& field)
    {
      const std::optional<double> value = tryParseDouble(field);
      if (value && *value > 0.0)
	return value;

      return std::nullopt;
    }

    template <typename Parser>
    auto parseName(Parser parse, const std::string& name, const std::string& where) -> decltype(parse(name))
    {
      try
	{
	  return parse(name);
	}
      catch (const std::invalid_argument& e)
	{
	  throw EvidenceFileException(where + ": " + e.what());
	}
    }

    void requireCompanyId(const std::string& companyId, const std::string& where)
    {
      if (companyId.empty())
	throw EvidenceFileException(where + ": empty company_id");
    }

    // Wraps a csv.h failure so callers only see EvidenceFileException.
    template <typename Fn>
    auto withFileErrors(const std::string& filePath, Fn readRows) -> decltype(readRows())
    {
      try
	{
	  return readRows();
	}
      catch (const io::error::base& e)
	{
	  throw EvidenceFileException(filePath + ": " + e.what());
	}
    }
  }

  std::size_t readPriorTable(const std::string& filePath, InMemoryPriorProvider& priors)
  {
    return withFileErrors(filePath, [&]() {
	CsvFile<11> csv(filePath);
	csv.read_header(io::ignore_extra_column, "year", "area_code", "occ_code", "canonical_role_id",
			"employment", "wage_p10", "wage_p25", "wage_median", "wage_p75", "wage_p90",
			"wage_mean");

	std::string year, areaCode, occCode, roleId, employment;
	std::string p10, p25, p50, p75, p90, mean;
	std::size_t rows = 0;

	while (csv.read_row(year, areaCode, occCode, roleId, employment, p10, p25, p50, p75, p90, mean))
	  {
	    rows++;

	    const std::optional<int> referenceYear = tryParseInteger<int>(year);
	    const std::optional<int> canonicalRoleId = tryParseInteger<int>(roleId);
	    if (!referenceYear || !canonicalRoleId || areaCode.empty())
	      {
		priors.discardRow();
		continue;
	      }

	    // Suppressed employment contributes nothing to the cell total.
	    const long reportedEmployment = std::max(0L, tryParseInteger<long>(employment).value_or(0L));

	    priors.addPrior(OEWSPriorRow{MetroRoleKey(areaCode, *canonicalRoleId), *referenceYear,
					 reportedEmployment,
					 reportedWage(p10), reportedWage(p25), reportedWage(p50),
					 reportedWage(p75), reportedWage(p90), reportedWage(mean)});
	  }
	return rows;
      });
  }

  std::size_t readHeadcountEvidence(const std::string& filePath, InMemoryEvidenceRepository& repository)
  {
    return withFileErrors(filePath, [&]() {
	CsvFile<5> csv(filePath);
	csv.read_header(io::ignore_extra_column, "company_id", "area_code", "canonical_role_id",
			"source_type", "count");

	std::string companyId, areaCode, roleId, sourceType, count;
	std::size_t rows = 0;

	while (csv.read_row(companyId, areaCode, roleId, sourceType, count))
	  {
	    rows++;
	    const std::string where = location(filePath, csv);

	    try
	      {
		requireCompanyId(companyId, where);
		const MetroRoleKey key(areaCode, parseInteger<int>(roleId, where, "canonical_role_id"));
		const HeadcountSourceType type = parseName(parseHeadcountSourceType, sourceType, where);

		repository.addHeadcountEvidence(key, HeadcountEvidenceRecord{companyId, type,
		      parseInteger<long>(count, where, "count")});
	      }
	    catch (const EvidenceFileException&)
	      {
		repository.discardRecord();
	      }
	  }
	return rows;
      });
  }

  std::size_t readSalaryEvidence(const std::string& filePath, InMemoryEvidenceRepository& repository)
  {
    return withFileErrors(filePath, [&]() {
	CsvFile<7> csv(filePath);
	csv.read_header(io::ignore_extra_column, "company_id", "area_code", "canonical_role_id",
			"source_type", "salary_min", "salary_max", "salary_point");

	std::string companyId, areaCode, roleId, sourceType, salaryMin, salaryMax, salaryPoint;
	std::size_t rows = 0;

	while (csv.read_row(companyId, areaCode, roleId, sourceType, salaryMin, salaryMax, salaryPoint))
	  {
	    rows++;
	    const std::string where = location(filePath, csv);

	    try
	      {
		requireCompanyId(companyId, where);
		const MetroRoleKey key(areaCode, parseInteger<int>(roleId, where, "canonical_role_id"));
		const SalarySourceType type = parseName(parseSalarySourceType, sourceType, where);

		repository.addSalaryObservation(key,
						SalaryObservation(companyId, type,
								  parseOptionalDouble(salaryMin, where),
								  parseOptionalDouble(salaryMax, where),
								  parseOptionalDouble(salaryPoint, where)));
	      }
	    catch (const EvidenceFileException&)
	      {
		repository.discardRecord();
	      }
	  }
	return rows;
      });
  }

  CompanyDirectory readCompanyDirectory(const std::string& filePath)
  {
    return withFileErrors(filePath, [&]() {
	CsvFile<3> csv(filePath);
	csv.read_header(io::ignore_extra_column, "company_id", "company_name", "industry");

	CompanyDirectory directory;
	std::string companyId, companyName, industry;

	while (csv.read_row(companyId, companyName, industry))
	  directory.addCompany(companyId, companyName, industry);

	return directory;
      });
  }

  std::vector<Archetype> readObservedArchetypes(const std::string& filePath,
						const EngineConfiguration& config)
  {
    return withFileErrors(filePath, [&]() {
	CsvFile<8> csv(filePath);
	csv.read_header(io::ignore_extra_column, "company_id", "area_code", "canonical_role_id",
			"seniority", "industry", "headcount", "salary_p50", "confidence");

	const ConfidenceBand& band = config.getConfidenceBand(RecordType::Observed);

	std::vector<Archetype> archetypes;
	std::string companyId, areaCode, seniority, industry, salaryP50, confidence;
	int roleId;
	long headcount;

	while (csv.read_row(companyId, areaCode, roleId, seniority, industry, headcount, salaryP50, confidence))
	  {
	    const std::string where = location(filePath, csv);

	    const Seniority level = parseName(parseSeniority, seniority, where);

	    if (headcount < 0)
	      throw EvidenceFileException(where + ": negative headcount");

	    archetypes.emplace_back(companyId, MetroRoleKey(areaCode, roleId), level, RecordType::Observed,
				    industry.empty() ? std::string(CompanyDirectory::UNKNOWN_INDUSTRY) : industry,
				    headcount, headcount, headcount,
				    std::nullopt, parseOptionalDouble(salaryP50, where), std::nullopt,
				    parseOptionalDouble(confidence, where).value_or(band.floor));
	  }
	return archetypes;
      });
  }

  std::vector<EstablishmentRecord> readEstablishments(const std::string& filePath)
  {
    return withFileErrors(filePath, [&]() {
	CsvFile<6> csv(filePath);
	csv.read_header(io::ignore_extra_column, "area_code", "naics_code", "industry", "size_class",
			"establishments", "employment");

	std::vector<EstablishmentRecord> records;
	std::string areaCode, naicsCode, industry, employment;
	int sizeClass;
	long establishments;

	while (csv.read_row(areaCode, naicsCode, industry, sizeClass, establishments, employment))
	  {
	    // Census suppresses employment for small cells; empty means unknown.
	    const double reported = parseOptionalDouble(employment, location(filePath, csv)).value_or(0.0);

	    records.push_back(EstablishmentRecord{areaCode, naicsCode,
		  industry.empty() ? std::string(CompanyDirectory::UNKNOWN_INDUSTRY) : industry,
		  sizeClass, establishments, static_cast<long>(reported)});
	  }
	return records;
      });
  }
}
