#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "EstimateSerializer.h"

using Catch::Approx;
using namespace labormodel;

namespace
{
    rapidjson::Document parse(const std::string& json)
    {
        rapidjson::Document doc;
        doc.Parse(json.c_str());
        REQUIRE_FALSE(doc.HasParseError());
        return doc;
    }

    const MetroRoleKey CELL("42660", 2);
}

TEST_CASE("Headcount estimates serialize every field", "[EstimateSerializer]")
{
    const std::vector<HeadcountEstimate> estimates{
        HeadcountEstimate("harbor", CELL, 3900, 4100, 4300, 10400.0, 0.788, 5200, 2)};

    const auto doc = parse(EstimateSerializer::toJson(estimates));
    REQUIRE(doc.IsArray());
    REQUIRE(doc.Size() == 1);

    const auto& e = doc[0];
    REQUIRE(std::string(e["company_id"].GetString()) == "harbor");
    REQUIRE(std::string(e["metro_area_id"].GetString()) == "42660");
    REQUIRE(e["canonical_role_id"].GetInt() == 2);
    REQUIRE(e["headcount_p10"].GetInt64() == 3900);
    REQUIRE(e["headcount_p50"].GetInt64() == 4100);
    REQUIRE(e["headcount_p90"].GetInt64() == 4300);
    REQUIRE(e["evidence_score"].GetDouble() == Approx(10400.0));
    REQUIRE(e["employment_total"].GetInt64() == 5200);
    REQUIRE(e["companies_in_cell"].GetUint64() == 2);
    REQUIRE(std::string(e["method"].GetString()) == "dirichlet_shrinkage");
}

TEST_CASE("Salary estimates serialize percentiles and shrinkage", "[EstimateSerializer]")
{
    const std::vector<SalaryEstimate> estimates{
        SalaryEstimate("harbor", CELL, WagePercentiles{120000.0, 135000.0, 150000.0, 166000.0, 181000.0},
                       151000.0, 9000.0, 4, 17.5, 0.64, 152000.0)};

    const auto doc = parse(EstimateSerializer::toJson(estimates));
    const auto& e = doc[0];
    REQUIRE(e["salary_p10"].GetDouble() == Approx(120000.0));
    REQUIRE(e["salary_p90"].GetDouble() == Approx(181000.0));
    REQUIRE(e["salary_mean"].GetDouble() == Approx(151000.0));
    REQUIRE(e["salary_stddev"].GetDouble() == Approx(9000.0));
    REQUIRE(e["observation_count"].GetUint64() == 4);
    REQUIRE(e["effective_sample_size"].GetDouble() == Approx(17.5));
    REQUIRE(e["shrinkage_factor"].GetDouble() == Approx(0.64));
    REQUIRE(e["oews_median"].GetDouble() == Approx(152000.0));
    REQUIRE(std::string(e["method"].GetString()) == "bayesian_shrinkage");
}

TEST_CASE("Absent archetype salaries serialize as null", "[EstimateSerializer]")
{
    const std::vector<Archetype> archetypes{
        Archetype("cbp:5182:252", CELL, Seniority::Mid, RecordType::CbpSynthetic, "technology",
                  1200, 1400, 1700, std::nullopt, std::nullopt, std::nullopt, 0.12),
        Archetype("harbor", CELL, Seniority::Senior, RecordType::Observed, "technology",
                  2100, 2100, 2100, std::nullopt, 201000.0, std::nullopt, 0.9)};

    const auto doc = parse(EstimateSerializer::toJson(archetypes));
    REQUIRE(doc.Size() == 2);

    REQUIRE(std::string(doc[0]["record_type"].GetString()) == "synthetic");
    REQUIRE(doc[0]["salary_p50"].IsNull());
    REQUIRE(doc[0]["composite_confidence"].GetDouble() == Approx(0.12));

    REQUIRE(std::string(doc[1]["seniority"].GetString()) == "senior");
    REQUIRE(doc[1]["salary_p25"].IsNull());
    REQUIRE(doc[1]["salary_p50"].GetDouble() == Approx(201000.0));
}

TEST_CASE("Batch summary serialization", "[EstimateSerializer]")
{
    BatchSummary summary;
    summary.referenceYear = 2024;
    summary.cellsProcessed = 7;
    summary.cellsSkipped = 1;
    summary.cellsFailed = 1;
    summary.reconciliation.push_back(IndustryReconciliation{"technology", 3000, 10000, 7000, 0.7, 0});
    summary.failures.push_back(CellFailure{"41860/3", "evidence store unavailable"});

    const auto doc = parse(EstimateSerializer::toJson(summary));
    REQUIRE(doc["reference_year"].GetInt() == 2024);
    REQUIRE(doc["cells"]["processed"].GetUint64() == 7);
    REQUIRE(doc["cells"]["failed"].GetUint64() == 1);
    REQUIRE(doc["reconciliation"].Size() == 1);
    REQUIRE(doc["reconciliation"][0]["synthetic_after"].GetInt64() == 7000);
    REQUIRE(doc["reconciliation"][0]["remaining_fraction"].GetDouble() == Approx(0.7));
    REQUIRE(std::string(doc["failures"][0]["cell"].GetString()) == "41860/3");
}

TEST_CASE("Writing to an unwritable path fails", "[EstimateSerializer]")
{
    REQUIRE_THROWS_AS(EstimateSerializer::writeFile("/nonexistent-directory/out.json", "[]"),
                      PersistenceException);
}
