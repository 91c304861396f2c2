#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "ArchetypeAssembler.h"

using Catch::Approx;
using namespace labormodel;

namespace
{
    const MetroRoleKey CELL("41860", 1);

    SalaryEstimate salaryFor(const std::string& company, double median, double ess)
    {
        return SalaryEstimate(company, CELL, WagePercentiles{median * 0.7, median * 0.85, median,
                                                             median * 1.15, median * 1.3},
                              median, median * 0.1, 3, ess, 0.5, 150000.0);
    }
}

TEST_CASE("Composite confidence stays inside the record type's band", "[ArchetypeAssembler]")
{
    const EngineConfiguration config;
    ArchetypeAssembler assembler(config);

    REQUIRE(assembler.computeCompositeConfidence(RecordType::KnownEmployerInferred, 0.0) == Approx(0.20));
    REQUIRE(assembler.computeCompositeConfidence(RecordType::KnownEmployerInferred, 10.0) == Approx(0.325));
    REQUIRE(assembler.computeCompositeConfidence(RecordType::KnownEmployerInferred, 1e9) <= 0.45);
    REQUIRE(assembler.computeCompositeConfidence(RecordType::KnownEmployerInferred, 1e9) == Approx(0.45).margin(1e-6));

    REQUIRE(assembler.computeCompositeConfidence(RecordType::Observed, 0.0) == Approx(0.85));
    REQUIRE(assembler.computeCompositeConfidence(RecordType::CbpSynthetic, 30.0) == Approx(0.175));

    // Negative volume is treated as no evidence.
    REQUIRE(assembler.computeCompositeConfidence(RecordType::KnownEmployerInferred, -4.0) == Approx(0.20));

    double previous = 0.0;
    for (double v : {0.0, 1.0, 5.0, 20.0, 100.0, 1000.0})
    {
        const double c = assembler.computeCompositeConfidence(RecordType::KnownEmployerInferred, v);
        REQUIRE(c >= previous);
        previous = c;
    }
}

TEST_CASE("Headcount and salary estimates are joined by company", "[ArchetypeAssembler]")
{
    const EngineConfiguration config;
    ArchetypeAssembler assembler(config);

    CompanyDirectory directory;
    directory.addCompany("acme", "Acme Software", "technology");

    const std::vector<HeadcountEstimate> headcounts{
        HeadcountEstimate("acme", CELL, 700, 800, 900, 6.0, 0.8, 1000, 2),
        HeadcountEstimate("unlisted", CELL, 150, 200, 260, 0.0, 0.2, 1000, 2)};
    const std::vector<SalaryEstimate> salaries{salaryFor("acme", 170000.0, 4.0),
                                               salaryFor("no-headcount", 90000.0, 2.0)};

    const auto archetypes = assembler.assemble(headcounts, salaries, directory);
    REQUIRE(archetypes.size() == 2);

    const Archetype& acme = archetypes[0];
    REQUIRE(acme.getCompanyId() == "acme");
    REQUIRE(acme.getKey() == CELL);
    REQUIRE(acme.getRecordType() == RecordType::KnownEmployerInferred);
    REQUIRE(acme.getSeniority() == Seniority::Mid);
    REQUIRE(acme.getIndustry() == "technology");
    REQUIRE(acme.getHeadcountP10() == 700);
    REQUIRE(acme.getHeadcountP50() == 800);
    REQUIRE(acme.getHeadcountP90() == 900);
    REQUIRE(acme.getSalaryP50().value() == Approx(170000.0));
    REQUIRE(acme.getSalaryP25().value() == Approx(170000.0 * 0.85));
    REQUIRE(acme.getSalaryP75().value() == Approx(170000.0 * 1.15));
    // v = 6 + 4
    REQUIRE(acme.getCompositeConfidence() == Approx(0.325));

    const Archetype& unlisted = archetypes[1];
    REQUIRE(unlisted.getIndustry() == CompanyDirectory::UNKNOWN_INDUSTRY);
    REQUIRE_FALSE(unlisted.getSalaryP50().has_value());
    REQUIRE(unlisted.getCompositeConfidence() == Approx(0.20));
}
