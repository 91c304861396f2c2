// NormalQuantileTest.cpp
//
// Acklam inverse normal CDF and the erf-based forward CDF.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>
#include "NormalQuantile.h"

using Catch::Approx;
using labormodel::stats::compute_normal_quantile;
using labormodel::stats::compute_normal_cdf;

TEST_CASE("compute_normal_quantile: reference values", "[NormalQuantile]")
{
    SECTION("Wage percentile z-scores")
    {
        REQUIRE(compute_normal_quantile(0.10) == Approx(-1.2815515655446004).margin(1e-8));
        REQUIRE(compute_normal_quantile(0.25) == Approx(-0.6744897501960817).margin(1e-8));
        REQUIRE(compute_normal_quantile(0.75) == Approx( 0.6744897501960817).margin(1e-8));
        REQUIRE(compute_normal_quantile(0.90) == Approx( 1.2815515655446004).margin(1e-8));
    }

    SECTION("Median is exactly zero")
    {
        REQUIRE(compute_normal_quantile(0.5) == 0.0);
    }

    SECTION("Tail regions")
    {
        REQUIRE(compute_normal_quantile(0.001) == Approx(-3.090232306167813).margin(1e-7));
        REQUIRE(compute_normal_quantile(0.999) == Approx( 3.090232306167813).margin(1e-7));
    }
}

TEST_CASE("compute_normal_quantile: symmetry and monotonicity", "[NormalQuantile]")
{
    double previous = compute_normal_quantile(0.001);
    for (int i = 2; i < 1000; ++i)
    {
        const double p = static_cast<double>(i) / 1000.0;
        const double z = compute_normal_quantile(p);
        REQUIRE(z > previous);
        REQUIRE(z == Approx(-compute_normal_quantile(1.0 - p)).margin(1e-9));
        previous = z;
    }
}

TEST_CASE("compute_normal_quantile: rejects probabilities outside (0, 1)", "[NormalQuantile]")
{
    REQUIRE_THROWS_AS(compute_normal_quantile(0.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(1.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(-0.2), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(1.5), std::domain_error);
}

TEST_CASE("compute_normal_cdf inverts compute_normal_quantile", "[NormalQuantile]")
{
    REQUIRE(compute_normal_cdf(0.0) == Approx(0.5));

    for (double p : {0.01, 0.1, 0.25, 0.5, 0.75, 0.9, 0.99})
        REQUIRE(compute_normal_cdf(compute_normal_quantile(p)) == Approx(p).margin(1e-8));
}
