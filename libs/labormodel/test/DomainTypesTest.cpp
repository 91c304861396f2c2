#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include "DomainTypes.h"

using Catch::Approx;
using namespace labormodel;

TEST_CASE("Enum names parse back to the same value", "[DomainTypes]")
{
    for (auto type : {HeadcountSourceType::Posting, HeadcountSourceType::Visa, HeadcountSourceType::Payroll})
        REQUIRE(parseHeadcountSourceType(toString(type)) == type);

    for (auto type : {SalarySourceType::Payroll, SalarySourceType::VisaFiling,
                      SalarySourceType::NegotiatedWageTable, SalarySourceType::AtsPosting,
                      SalarySourceType::Posting})
        REQUIRE(parseSalarySourceType(toString(type)) == type);

    for (auto type : {RecordType::Observed, RecordType::KnownEmployerInferred, RecordType::CbpSynthetic})
        REQUIRE(parseRecordType(toString(type)) == type);

    for (auto level : {Seniority::Intern, Seniority::Entry, Seniority::Mid, Seniority::Senior,
                       Seniority::Lead, Seniority::Manager, Seniority::Director, Seniority::Executive})
        REQUIRE(parseSeniority(toString(level)) == level);

    REQUIRE(parseSeniority("executive") == Seniority::Executive);
    REQUIRE(toString(EstimationMethod::DirichletShrinkage) == "dirichlet_shrinkage");
    REQUIRE(toString(EstimationMethod::BayesianShrinkage) == "bayesian_shrinkage");
}

TEST_CASE("Unknown enum names are rejected", "[DomainTypes]")
{
    REQUIRE_THROWS_AS(parseHeadcountSourceType("linkedin"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSalarySourceType("glassdoor"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseRecordType(""), std::invalid_argument);
    REQUIRE_THROWS_AS(parseSeniority("Senior"), std::invalid_argument);
}

TEST_CASE("MetroRoleKey identity", "[DomainTypes]")
{
    const MetroRoleKey a("41860", 1);
    const MetroRoleKey b("41860", 2);
    const MetroRoleKey c("12060", 9);

    REQUIRE(a == MetroRoleKey("41860", 1));
    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE(c < a);
    REQUIRE(a.toString() == "41860/1");

    std::ostringstream os;
    os << b;
    REQUIRE(os.str() == "41860/2");

    std::unordered_set<MetroRoleKey> keys{a, b, c, MetroRoleKey("41860", 1)};
    REQUIRE(keys.size() == 3);
}

TEST_CASE("SalaryObservation", "[DomainTypes]")
{
    const SalaryObservation point("acme", SalarySourceType::AtsPosting, std::nullopt, std::nullopt, 120000.0);
    REQUIRE_FALSE(point.isDegenerate());

    const SalaryObservation empty("acme", SalarySourceType::Payroll, std::nullopt, std::nullopt, std::nullopt);
    REQUIRE(empty.isDegenerate());
}

TEST_CASE("Archetype natural key and adjusted copies", "[DomainTypes]")
{
    const Archetype original("acme", MetroRoleKey("41860", 1), Seniority::Senior, RecordType::Observed,
                             "technology", 90, 100, 110, 150000.0, 170000.0, 190000.0, 0.9);

    const ArchetypeKey key = original.getNaturalKey();
    REQUIRE(key.companyId == "acme");
    REQUIRE(key.metroAreaId == "41860");
    REQUIRE(key.canonicalRoleId == 1);
    REQUIRE(key.seniority == Seniority::Senior);
    REQUIRE(key.recordType == RecordType::Observed);

    const Archetype adjusted = original.withAdjustedHeadcount(45, 50, 55, 0.81);
    REQUIRE(adjusted.getNaturalKey() == key);
    REQUIRE(adjusted.getHeadcountP10() == 45);
    REQUIRE(adjusted.getHeadcountP50() == 50);
    REQUIRE(adjusted.getHeadcountP90() == 55);
    REQUIRE(adjusted.getCompositeConfidence() == Approx(0.81));
    REQUIRE(adjusted.getSalaryP50().value() == Approx(170000.0));
    REQUIRE(adjusted.getIndustry() == "technology");

    // Same cell, different tier: distinct rows.
    const Archetype inferred("acme", MetroRoleKey("41860", 1), Seniority::Senior,
                             RecordType::KnownEmployerInferred, "technology", 1, 1, 1,
                             std::nullopt, std::nullopt, std::nullopt, 0.3);
    std::set<ArchetypeKey> keys{key, inferred.getNaturalKey()};
    REQUIRE(keys.size() == 2);
}
