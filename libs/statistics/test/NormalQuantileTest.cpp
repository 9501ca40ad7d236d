#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include "NormalQuantile.h"

using namespace mkc_measurement::detail;
using Catch::Approx;

TEST_CASE("compute_normal_quantile", "[NormalQuantile]")
{
  SECTION("Known values")
  {
    REQUIRE(compute_normal_quantile(0.5) == 0.0);
    REQUIRE(compute_normal_quantile(0.975) == Approx(1.959963985).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.025) == Approx(-1.959963985).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.001) == Approx(-3.090232306).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.999) == Approx(3.090232306).margin(1e-8));
  }

  SECTION("Inverse of the CDF across all regions")
  {
    const double probabilities[] = { 1e-6, 0.01, 0.02425, 0.1, 0.3, 0.7, 0.9, 0.97575, 0.99, 1.0 - 1e-6 };

    for (double p : probabilities)
      REQUIRE(compute_normal_cdf(compute_normal_quantile(p)) == Approx(p).epsilon(1e-6));
  }

  SECTION("Domain")
  {
    REQUIRE_THROWS_AS(compute_normal_quantile(0.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(1.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(-0.2), std::domain_error);
  }
}

TEST_CASE("compute_normal_cdf", "[NormalQuantile]")
{
  REQUIRE(compute_normal_cdf(0.0) == Approx(0.5));
  REQUIRE(compute_normal_cdf(1.959963985) == Approx(0.975).margin(1e-9));
  REQUIRE(compute_normal_cdf(-40.0) == Approx(0.0).margin(1e-15));
  REQUIRE(compute_normal_cdf(40.0) == Approx(1.0));
}

TEST_CASE("compute_normal_critical_value", "[NormalQuantile]")
{
  REQUIRE(compute_normal_critical_value(0.80) == Approx(1.281551566).margin(1e-8));
  REQUIRE(compute_normal_critical_value(0.90) == Approx(1.644853627).margin(1e-8));
  REQUIRE(compute_normal_critical_value(0.95) == Approx(1.959963985).margin(1e-8));
  REQUIRE(compute_normal_critical_value(0.9973) == Approx(2.999976993).margin(1e-7));

  REQUIRE_THROWS_AS(compute_normal_critical_value(0.0), std::domain_error);
  REQUIRE_THROWS_AS(compute_normal_critical_value(1.0), std::domain_error);
}
