#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>
#include "DirichletSampler.h"
#include "RandomPcg.h"

using Catch::Approx;
using labormodel::stats::DirichletSampler;
using labormodel::stats::RandomPcg;

TEST_CASE("DirichletSampler: draws lie on the simplex", "[Dirichlet]")
{
    DirichletSampler sampler({0.5, 2.0, 7.5, 0.01});
    RandomPcg rng(42);

    for (int i = 0; i < 500; ++i)
    {
        const auto draw = sampler.sample(rng);
        REQUIRE(draw.size() == 4);
        for (double p : draw)
            REQUIRE(p >= 0.0);
        REQUIRE(std::accumulate(draw.begin(), draw.end(), 0.0) == Approx(1.0).margin(1e-12));
    }
}

TEST_CASE("DirichletSampler: sample mean approaches alpha / sum(alpha)", "[Dirichlet]")
{
    DirichletSampler sampler({60.0, 20.0, 20.0});
    RandomPcg rng(7);

    const auto expected = sampler.expectedShares();
    REQUIRE(expected[0] == Approx(0.6));
    REQUIRE(expected[1] == Approx(0.2));

    std::vector<double> sums(3, 0.0);
    const int draws = 4000;
    for (int i = 0; i < draws; ++i)
    {
        const auto draw = sampler.sample(rng);
        for (std::size_t k = 0; k < draw.size(); ++k)
            sums[k] += draw[k];
    }

    for (std::size_t k = 0; k < sums.size(); ++k)
        REQUIRE(sums[k] / draws == Approx(expected[k]).margin(0.01));
}

TEST_CASE("DirichletSampler: identical seeds give identical draws", "[Dirichlet]")
{
    DirichletSampler a({1.0, 3.0, 5.0});
    DirichletSampler b({1.0, 3.0, 5.0});
    RandomPcg rngA(12345);
    RandomPcg rngB(12345);
    RandomPcg rngC(54321);

    const auto first = a.sample(rngA);
    REQUIRE(first == b.sample(rngB));
    REQUIRE(first != a.sample(rngC));
}

TEST_CASE("DirichletSampler: works on a bare standard engine", "[Dirichlet]")
{
    DirichletSampler sampler({2.0, 2.0});
    std::mt19937_64 eng(99);

    const auto draw = sampler.sample(eng);
    REQUIRE(draw[0] + draw[1] == Approx(1.0));
}

TEST_CASE("DirichletSampler: rejects invalid concentrations", "[Dirichlet]")
{
    REQUIRE_THROWS_AS(DirichletSampler(std::vector<double>{}), std::invalid_argument);
    REQUIRE_THROWS_AS(DirichletSampler({1.0, 0.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(DirichletSampler({1.0, -2.0}), std::invalid_argument);
}
