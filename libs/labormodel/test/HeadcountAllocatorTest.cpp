#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>
#include "HeadcountAllocator.h"

using Catch::Approx;
using namespace labormodel;
using labormodel::stats::RandomPcg;

namespace
{
    const MetroRoleKey CELL("41860", 1);

    OEWSPrior priorWithTotal(long total)
    {
        return OEWSPrior(CELL, 2024, total, 90000.0, 110000.0, 130000.0, 150000.0, 170000.0, 132000.0);
    }

    CompanyEvidence company(const std::string& id, double weightedEvidence)
    {
        return CompanyEvidence(id, 0, 0, 0, weightedEvidence, 0.0);
    }

    long sumP50(const std::vector<HeadcountEstimate>& estimates)
    {
        return std::accumulate(estimates.begin(), estimates.end(), 0L,
                               [](long acc, const HeadcountEstimate& e) { return acc + e.getP50(); });
    }
}

TEST_CASE("Allocation follows evidence and sums to the cell total", "[HeadcountAllocator]")
{
    const EngineConfiguration config;
    HeadcountAllocator allocator(config);
    RandomPcg rng(42);
    std::ostringstream log;

    const std::vector<CompanyEvidence> companies{company("a", 90.0), company("b", 10.0)};
    const auto estimates = allocator.allocate(priorWithTotal(1000), companies, rng, log);

    REQUIRE(estimates.size() == 2);
    REQUIRE(sumP50(estimates) == 1000);

    // alpha = (92.5, 12.5): expected shares 0.881 and 0.119
    REQUIRE(estimates[0].getCompanyId() == "a");
    REQUIRE(estimates[0].getP50() == Approx(881).margin(15));
    REQUIRE(estimates[1].getP50() == Approx(119).margin(15));

    for (const auto& e : estimates)
    {
        REQUIRE(e.getP10() <= e.getP50());
        REQUIRE(e.getP50() <= e.getP90());
        REQUIRE(e.getP10() < e.getP90());
        REQUIRE(e.getEmploymentTotal() == 1000);
        REQUIRE(e.getCompaniesInCell() == 2);
        REQUIRE(e.getMethod() == EstimationMethod::DirichletShrinkage);
        REQUIRE(e.getKey() == CELL);
    }

    REQUIRE(estimates[0].getEvidenceScore() == Approx(90.0));
    REQUIRE(estimates[0].getShareOfMetro() == Approx(estimates[0].getP50() / 1000.0));
    REQUIRE(log.str().find("[Headcount]") != std::string::npos);
}

TEST_CASE("Equal evidence gives roughly equal allocations", "[HeadcountAllocator]")
{
    const EngineConfiguration config;
    HeadcountAllocator allocator(config);
    RandomPcg rng(7);
    std::ostringstream log;

    std::vector<CompanyEvidence> companies;
    for (int i = 0; i < 4; ++i)
        companies.push_back(company("c" + std::to_string(i), 50.0));

    const auto estimates = allocator.allocate(priorWithTotal(4000), companies, rng, log);

    REQUIRE(sumP50(estimates) == 4000);
    for (const auto& e : estimates)
        REQUIRE(e.getP50() == Approx(1000).margin(60));
}

TEST_CASE("A single company receives the whole total", "[HeadcountAllocator]")
{
    const EngineConfiguration config;
    HeadcountAllocator allocator(config);
    RandomPcg rng(1);
    std::ostringstream log;

    const auto estimates = allocator.allocate(priorWithTotal(725), {company("only", 3.0)}, rng, log);

    REQUIRE(estimates.size() == 1);
    REQUIRE(estimates[0].getP10() == 725);
    REQUIRE(estimates[0].getP50() == 725);
    REQUIRE(estimates[0].getP90() == 725);
    REQUIRE(estimates[0].getShareOfMetro() == Approx(1.0));
}

TEST_CASE("No companies gives no estimates", "[HeadcountAllocator]")
{
    const EngineConfiguration config;
    HeadcountAllocator allocator(config);
    RandomPcg rng(1);
    std::ostringstream log;

    REQUIRE(allocator.allocate(priorWithTotal(500), {}, rng, log).empty());
}

TEST_CASE("A non-positive employment total is a missing prior", "[HeadcountAllocator]")
{
    const EngineConfiguration config;
    HeadcountAllocator allocator(config);
    RandomPcg rng(1);
    std::ostringstream log;

    const std::vector<CompanyEvidence> companies{company("a", 5.0), company("b", 5.0)};
    REQUIRE_THROWS_AS(allocator.allocate(priorWithTotal(0), companies, rng, log), MissingPriorException);
    REQUIRE_THROWS_AS(allocator.allocate(priorWithTotal(-20), companies, rng, log), MissingPriorException);
}

TEST_CASE("Companies with evidence keep at least one head", "[HeadcountAllocator]")
{
    const EngineConfiguration config = EngineConfiguration().withMonteCarloSamples(400);
    HeadcountAllocator allocator(config);
    RandomPcg rng(99);
    std::ostringstream log;

    std::vector<CompanyEvidence> companies{company("giant", 10000.0)};
    for (int i = 0; i < 4; ++i)
        companies.push_back(company("small" + std::to_string(i), 0.5));

    const auto estimates = allocator.allocate(priorWithTotal(10), companies, rng, log);

    REQUIRE(sumP50(estimates) == 10);
    for (const auto& e : estimates)
    {
        REQUIRE(e.getP50() >= 1);
        REQUIRE(e.getP10() <= e.getP50());
        REQUIRE(e.getP50() <= e.getP90());
    }
    REQUIRE(estimates[0].getP50() == 6);
}

TEST_CASE("A total smaller than the number of companies", "[HeadcountAllocator]")
{
    const EngineConfiguration config = EngineConfiguration().withMonteCarloSamples(300);
    HeadcountAllocator allocator(config);
    RandomPcg rng(5);
    std::ostringstream log;

    std::vector<CompanyEvidence> companies;
    for (int i = 0; i < 5; ++i)
        companies.push_back(company("c" + std::to_string(i), 10.0));

    const auto estimates = allocator.allocate(priorWithTotal(3), companies, rng, log);

    REQUIRE(estimates.size() == 5);
    REQUIRE(sumP50(estimates) == 3);
    for (const auto& e : estimates)
    {
        REQUIRE(e.getP50() >= 0);
        REQUIRE(e.getP10() <= e.getP50());
        REQUIRE(e.getP50() <= e.getP90());
    }
}

TEST_CASE("Allocation is reproducible for a given seed", "[HeadcountAllocator]")
{
    const EngineConfiguration config = EngineConfiguration().withMonteCarloSamples(500);
    HeadcountAllocator allocator(config);
    std::ostringstream log;

    const std::vector<CompanyEvidence> companies{company("a", 12.0), company("b", 30.0), company("c", 3.5)};

    RandomPcg rng1(2024);
    RandomPcg rng2(2024);
    const auto first = allocator.allocate(priorWithTotal(2500), companies, rng1, log);
    const auto second = allocator.allocate(priorWithTotal(2500), companies, rng2, log);

    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        REQUIRE(first[i].getP10() == second[i].getP10());
        REQUIRE(first[i].getP50() == second[i].getP50());
        REQUIRE(first[i].getP90() == second[i].getP90());
    }
}
