#include "EstimateSerializer.h"
#include <fstream>
#include <optional>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace labormodel
{
  namespace
  {
    std::string render(const Document& doc)
    {
      StringBuffer buffer;
      PrettyWriter<StringBuffer> writer(buffer);
      doc.Accept(writer);
      return std::string(buffer.GetString(), buffer.GetSize());
    }

    Value stringValue(const std::string& s, Document::AllocatorType& allocator)
    {
      return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }

    Value optionalValue(const std::optional<double>& v)
    {
      Value out;
      if (v)
	out.SetDouble(*v);
      return out;
    }

    void addKey(Value& obj, const MetroRoleKey& key, Document::AllocatorType& allocator)
    {
      obj.AddMember("metro_area_id", stringValue(key.getMetroAreaId(), allocator), allocator);
      obj.AddMember("canonical_role_id", key.getCanonicalRoleId(), allocator);
    }

    Value serializeHeadcount(const HeadcountEstimate& e, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      obj.AddMember("company_id", stringValue(e.getCompanyId(), allocator), allocator);
      addKey(obj, e.getKey(), allocator);
      obj.AddMember("headcount_p10", static_cast<int64_t>(e.getP10()), allocator);
      obj.AddMember("headcount_p50", static_cast<int64_t>(e.getP50()), allocator);
      obj.AddMember("headcount_p90", static_cast<int64_t>(e.getP90()), allocator);
      obj.AddMember("evidence_score", e.getEvidenceScore(), allocator);
      obj.AddMember("share_of_metro", e.getShareOfMetro(), allocator);
      obj.AddMember("employment_total", static_cast<int64_t>(e.getEmploymentTotal()), allocator);
      obj.AddMember("companies_in_cell", static_cast<uint64_t>(e.getCompaniesInCell()), allocator);
      obj.AddMember("method", stringValue(toString(e.getMethod()), allocator), allocator);
      return obj;
    }

    Value serializeSalary(const SalaryEstimate& e, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      obj.AddMember("company_id", stringValue(e.getCompanyId(), allocator), allocator);
      addKey(obj, e.getKey(), allocator);
      obj.AddMember("salary_p10", e.getP10(), allocator);
      obj.AddMember("salary_p25", e.getP25(), allocator);
      obj.AddMember("salary_p50", e.getP50(), allocator);
      obj.AddMember("salary_p75", e.getP75(), allocator);
      obj.AddMember("salary_p90", e.getP90(), allocator);
      obj.AddMember("salary_mean", e.getMean(), allocator);
      obj.AddMember("salary_stddev", e.getStdDev(), allocator);
      obj.AddMember("observation_count", static_cast<uint64_t>(e.getObservationCount()), allocator);
      obj.AddMember("effective_sample_size", e.getEffectiveSampleSize(), allocator);
      obj.AddMember("shrinkage_factor", e.getShrinkageFactor(), allocator);
      obj.AddMember("oews_median", e.getOewsMedian(), allocator);
      obj.AddMember("method", stringValue(toString(e.getMethod()), allocator), allocator);
      return obj;
    }

    Value serializeArchetype(const Archetype& a, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      obj.AddMember("company_id", stringValue(a.getCompanyId(), allocator), allocator);
      addKey(obj, a.getKey(), allocator);
      obj.AddMember("seniority", stringValue(toString(a.getSeniority()), allocator), allocator);
      obj.AddMember("record_type", stringValue(toString(a.getRecordType()), allocator), allocator);
      obj.AddMember("industry", stringValue(a.getIndustry(), allocator), allocator);
      obj.AddMember("headcount_p10", static_cast<int64_t>(a.getHeadcountP10()), allocator);
      obj.AddMember("headcount_p50", static_cast<int64_t>(a.getHeadcountP50()), allocator);
      obj.AddMember("headcount_p90", static_cast<int64_t>(a.getHeadcountP90()), allocator);
      obj.AddMember("salary_p25", optionalValue(a.getSalaryP25()), allocator);
      obj.AddMember("salary_p50", optionalValue(a.getSalaryP50()), allocator);
      obj.AddMember("salary_p75", optionalValue(a.getSalaryP75()), allocator);
      obj.AddMember("composite_confidence", a.getCompositeConfidence(), allocator);
      return obj;
    }

    template <typename T, typename Fn>
    std::string serializeArray(const std::vector<T>& items, Fn serializeItem)
    {
      Document doc;
      doc.SetArray();
      Document::AllocatorType& allocator = doc.GetAllocator();

      for (const auto& item : items)
	doc.PushBack(serializeItem(item, allocator), allocator);

      return render(doc);
    }
  }

  std::string EstimateSerializer::toJson(const std::vector<HeadcountEstimate>& estimates)
  {
    return serializeArray(estimates, serializeHeadcount);
  }

  std::string EstimateSerializer::toJson(const std::vector<SalaryEstimate>& estimates)
  {
    return serializeArray(estimates, serializeSalary);
  }

  std::string EstimateSerializer::toJson(const std::vector<Archetype>& archetypes)
  {
    return serializeArray(archetypes, serializeArchetype);
  }

  std::string EstimateSerializer::toJson(const BatchSummary& summary)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("reference_year", summary.referenceYear, allocator);

    Value cells(kObjectType);
    cells.AddMember("processed", static_cast<uint64_t>(summary.cellsProcessed), allocator);
    cells.AddMember("skipped", static_cast<uint64_t>(summary.cellsSkipped), allocator);
    cells.AddMember("failed", static_cast<uint64_t>(summary.cellsFailed), allocator);
    cells.AddMember("insufficient", static_cast<uint64_t>(summary.cellsInsufficient), allocator);
    cells.AddMember("cancelled", static_cast<uint64_t>(summary.cellsCancelled), allocator);
    doc.AddMember("cells", cells, allocator);

    Value estimates(kObjectType);
    estimates.AddMember("headcount", static_cast<uint64_t>(summary.headcountEstimates), allocator);
    estimates.AddMember("salary", static_cast<uint64_t>(summary.salaryEstimates), allocator);
    estimates.AddMember("excluded_companies", static_cast<uint64_t>(summary.excludedCompanies), allocator);
    estimates.AddMember("discarded_records", static_cast<uint64_t>(summary.discardedRecords), allocator);
    doc.AddMember("estimates", estimates, allocator);

    Value archetypes(kObjectType);
    archetypes.AddMember("observed", static_cast<uint64_t>(summary.observedArchetypes), allocator);
    archetypes.AddMember("inferred", static_cast<uint64_t>(summary.inferredArchetypes), allocator);
    archetypes.AddMember("synthetic", static_cast<uint64_t>(summary.syntheticArchetypes), allocator);
    archetypes.AddMember("after_reconciliation", static_cast<uint64_t>(summary.reconciledArchetypes), allocator);
    archetypes.AddMember("persisted", static_cast<uint64_t>(summary.archetypesPersisted), allocator);
    archetypes.AddMember("persistence_failures", static_cast<uint64_t>(summary.persistenceFailures), allocator);
    doc.AddMember("archetypes", archetypes, allocator);

    Value reconciliation(kArrayType);
    for (const auto& r : summary.reconciliation)
      {
	Value obj(kObjectType);
	obj.AddMember("industry", stringValue(r.industry, allocator), allocator);
	obj.AddMember("known_headcount", static_cast<int64_t>(r.knownHeadcount), allocator);
	obj.AddMember("synthetic_before", static_cast<int64_t>(r.syntheticHeadcountBefore), allocator);
	obj.AddMember("synthetic_after", static_cast<int64_t>(r.syntheticHeadcountAfter), allocator);
	obj.AddMember("remaining_fraction", r.remainingFraction, allocator);
	obj.AddMember("dropped_rows", static_cast<uint64_t>(r.droppedRows), allocator);
	reconciliation.PushBack(obj, allocator);
      }
    doc.AddMember("reconciliation", reconciliation, allocator);

    Value failures(kArrayType);
    for (const auto& f : summary.failures)
      {
	Value obj(kObjectType);
	obj.AddMember("cell", stringValue(f.cell, allocator), allocator);
	obj.AddMember("message", stringValue(f.message, allocator), allocator);
	failures.PushBack(obj, allocator);
      }
    doc.AddMember("failures", failures, allocator);

    return render(doc);
  }

  void EstimateSerializer::writeFile(const std::string& filePath, const std::string& json)
  {
    std::ofstream file(filePath, std::ios::out | std::ios::trunc);
    if (!file.is_open())
      throw PersistenceException("EstimateSerializer: cannot open file for writing: " + filePath);

    file << json << '\n';
    file.close();

    if (!file)
      throw PersistenceException("EstimateSerializer: write failed for " + filePath);
  }
}
