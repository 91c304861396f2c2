#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <vector>
#include "TierReconciler.h"

using Catch::Approx;
using namespace labormodel;

namespace
{
    Archetype archetype(const std::string& company, RecordType type, const std::string& industry,
                        long p10, long p50, long p90, double confidence = 0.15)
    {
        return Archetype(company, MetroRoleKey("41860", 1), Seniority::Mid, type, industry,
                         p10, p50, p90, std::nullopt, 150000.0, std::nullopt, confidence);
    }

    long syntheticTotal(const std::vector<Archetype>& rows, const std::string& industry)
    {
        long total = 0;
        for (const auto& a : rows)
            if (a.getRecordType() == RecordType::CbpSynthetic && a.getIndustry() == industry)
                total += a.getHeadcountP50();
        return total;
    }
}

TEST_CASE("Synthetic headcount is reduced by the known headcount", "[TierReconciler]")
{
    const EngineConfiguration config;
    TierReconciler reconciler(config);
    std::ostringstream log;

    const std::vector<Archetype> input{
        archetype("acme", RecordType::KnownEmployerInferred, "technology", 1800, 2000, 2200, 0.3),
        archetype("harbor", RecordType::Observed, "technology", 1000, 1000, 1000, 0.9),
        archetype("cbp:5112:251", RecordType::CbpSynthetic, "technology", 5000, 6000, 7000, 0.15),
        archetype("cbp:5112:260", RecordType::CbpSynthetic, "technology", 3000, 4000, 5000, 0.20)};

    const ReconciliationResult result = reconciler.reconcile(input, log);

    REQUIRE(result.archetypes.size() == 4);
    REQUIRE(syntheticTotal(result.archetypes, "technology") == 7000);

    // Known rows pass through untouched and keep their order.
    REQUIRE(result.archetypes[0].getCompanyId() == "acme");
    REQUIRE(result.archetypes[0].getHeadcountP50() == 2000);
    REQUIRE(result.archetypes[0].getCompositeConfidence() == Approx(0.3));
    REQUIRE(result.archetypes[1].getHeadcountP50() == 1000);

    const Archetype& first = result.archetypes[2];
    REQUIRE(first.getHeadcountP10() == 3500);
    REQUIRE(first.getHeadcountP50() == 4200);
    REQUIRE(first.getHeadcountP90() == 4900);
    REQUIRE(first.getCompositeConfidence() == Approx(0.15 * 0.9));
    REQUIRE(result.archetypes[3].getHeadcountP50() == 2800);
    REQUIRE(result.archetypes[3].getCompositeConfidence() == Approx(0.20 * 0.9));

    REQUIRE(result.industries.size() == 1);
    const IndustryReconciliation& report = result.industries[0];
    REQUIRE(report.industry == "technology");
    REQUIRE(report.knownHeadcount == 3000);
    REQUIRE(report.syntheticHeadcountBefore == 10000);
    REQUIRE(report.syntheticHeadcountAfter == 7000);
    REQUIRE(report.remainingFraction == Approx(0.7));
    REQUIRE(report.droppedRows == 0);
}

TEST_CASE("Industries are reconciled independently", "[TierReconciler]")
{
    const EngineConfiguration config;
    TierReconciler reconciler(config);
    std::ostringstream log;

    const std::vector<Archetype> input{
        archetype("acme", RecordType::KnownEmployerInferred, "technology", 500, 500, 500),
        archetype("cbp:5112:251", RecordType::CbpSynthetic, "technology", 1000, 1000, 1000),
        archetype("cbp:6221:254", RecordType::CbpSynthetic, "healthcare", 900, 1000, 1100, 0.18)};

    const ReconciliationResult result = reconciler.reconcile(input, log);

    REQUIRE(syntheticTotal(result.archetypes, "technology") == 500);

    // No known employer in healthcare: unchanged, confidence included.
    REQUIRE(syntheticTotal(result.archetypes, "healthcare") == 1000);
    const Archetype& healthcare = result.archetypes[2];
    REQUIRE(healthcare.getHeadcountP10() == 900);
    REQUIRE(healthcare.getHeadcountP90() == 1100);
    REQUIRE(healthcare.getCompositeConfidence() == Approx(0.18));

    REQUIRE(result.industries.size() == 2);
    REQUIRE(result.industries[0].industry == "healthcare");
    REQUIRE(result.industries[0].remainingFraction == Approx(1.0));
}

TEST_CASE("Known headcount covering the synthetic total removes synthetic rows", "[TierReconciler]")
{
    const EngineConfiguration config;
    TierReconciler reconciler(config);
    std::ostringstream log;

    const std::vector<Archetype> input{
        archetype("acme", RecordType::KnownEmployerInferred, "finance", 5000, 5000, 5000),
        archetype("cbp:5221:242", RecordType::CbpSynthetic, "finance", 2000, 3000, 4000),
        archetype("cbp:5221:251", RecordType::CbpSynthetic, "finance", 500, 600, 700)};

    const ReconciliationResult result = reconciler.reconcile(input, log);

    REQUIRE(result.archetypes.size() == 1);
    REQUIRE(result.archetypes[0].getCompanyId() == "acme");
    REQUIRE(result.industries[0].remainingFraction == Approx(0.0));
    REQUIRE(result.industries[0].droppedRows == 2);
    REQUIRE(result.industries[0].syntheticHeadcountAfter == 0);
}

TEST_CASE("Rows that round to nothing are dropped", "[TierReconciler]")
{
    const EngineConfiguration config;
    TierReconciler reconciler(config);
    std::ostringstream log;

    // fraction = 1 - 95/100 = 0.05
    const std::vector<Archetype> input{
        archetype("acme", RecordType::KnownEmployerInferred, "technology", 95, 95, 95),
        archetype("cbp:5112:230", RecordType::CbpSynthetic, "technology", 80, 90, 100),
        archetype("cbp:5112:210", RecordType::CbpSynthetic, "technology", 5, 8, 12),
        archetype("cbp:5112:220", RecordType::CbpSynthetic, "technology", 1, 2, 3)};

    const ReconciliationResult result = reconciler.reconcile(input, log);

    REQUIRE(result.archetypes.size() == 2);
    REQUIRE(result.archetypes[1].getHeadcountP50() == 5);
    REQUIRE(result.industries[0].droppedRows == 2);
}

TEST_CASE("Reconciliation never increases synthetic headcount", "[TierReconciler]")
{
    const EngineConfiguration config;
    TierReconciler reconciler(config);
    std::ostringstream log;

    for (long known : {0L, 1L, 250L, 999L, 1000L, 5000L})
    {
        std::vector<Archetype> input{
            archetype("cbp:a", RecordType::CbpSynthetic, "technology", 300, 400, 500),
            archetype("cbp:b", RecordType::CbpSynthetic, "technology", 500, 600, 700)};
        if (known > 0)
            input.push_back(archetype("acme", RecordType::KnownEmployerInferred, "technology",
                                      known, known, known));

        const ReconciliationResult result = reconciler.reconcile(input, log);
        const long after = syntheticTotal(result.archetypes, "technology");

        REQUIRE(after <= 1000);
        for (const auto& a : result.archetypes)
        {
            REQUIRE(a.getHeadcountP10() <= a.getHeadcountP50());
            REQUIRE(a.getHeadcountP50() <= a.getHeadcountP90());
        }
    }
}

TEST_CASE("Nothing to reconcile without synthetic rows", "[TierReconciler]")
{
    const EngineConfiguration config;
    TierReconciler reconciler(config);
    std::ostringstream log;

    const std::vector<Archetype> input{archetype("acme", RecordType::Observed, "technology", 10, 10, 10, 0.9)};
    const ReconciliationResult result = reconciler.reconcile(input, log);

    REQUIRE(result.archetypes.size() == 1);
    REQUIRE(result.industries.empty());
}
