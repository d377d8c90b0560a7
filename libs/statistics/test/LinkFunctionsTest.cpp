#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include "LinkFunctions.h"
#include "PsePowerException.h"

using Catch::Approx;
using psepower::NumericDomainException;
using psepower::statistics::logistic;
using psepower::statistics::logit;

TEST_CASE("logistic: known values and bounds", "[LinkFunctions][logistic]")
{
  REQUIRE(logistic(0.0) == 0.5);
  REQUIRE(logistic(std::log(3.0)) == Approx(0.75).margin(1e-15));
  REQUIRE(logistic(-std::log(3.0)) == Approx(0.25).margin(1e-15));

  SECTION("Symmetry: logistic(-x) == 1 - logistic(x)")
  {
    for (double x : {0.1, 1.0, 2.5, 7.0, 15.0})
      REQUIRE(logistic(-x) == Approx(1.0 - logistic(x)).margin(1e-15));
  }

  SECTION("Large arguments stay finite and inside [0, 1]")
  {
    REQUIRE(logistic(800.0) == 1.0);
    REQUIRE(logistic(-800.0) >= 0.0);
    REQUIRE(logistic(-800.0) < 1e-300);
    REQUIRE(std::isfinite(logistic(-800.0)));
  }
}

TEST_CASE("logit inverts logistic on (0, 1)", "[LinkFunctions][logit]")
{
  SECTION("Round trip through logit then logistic")
  {
    for (double p : {1e-9, 1e-4, 0.01, 0.2, 0.5, 0.73, 0.99, 1.0 - 1e-9})
      REQUIRE(logistic(logit(p)) == Approx(p).epsilon(1e-12));
  }

  SECTION("Round trip through logistic then logit")
  {
    for (double eta : {-12.0, -3.0, -0.5, 0.0, 0.25, 4.0, 12.0})
      REQUIRE(logit(logistic(eta)) == Approx(eta).margin(1e-9));
  }

  SECTION("logit(0.5) is exactly zero")
  {
    REQUIRE(logit(0.5) == 0.0);
  }
}

TEST_CASE("logit rejects probabilities outside the open interval", "[LinkFunctions][logit][errors]")
{
  REQUIRE_THROWS_AS(logit(0.0), NumericDomainException);
  REQUIRE_THROWS_AS(logit(1.0), NumericDomainException);
  REQUIRE_THROWS_AS(logit(-0.1), NumericDomainException);
  REQUIRE_THROWS_AS(logit(1.5), NumericDomainException);
  REQUIRE_THROWS_AS(logit(std::numeric_limits<double>::quiet_NaN()), NumericDomainException);
}
