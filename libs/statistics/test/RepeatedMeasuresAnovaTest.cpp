#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>
#include "RepeatedMeasuresAnova.h"
#include "PsePowerException.h"

using Catch::Approx;
using namespace psepower;
using namespace psepower::statistics;

TEST_CASE("withinSubjectsAnova matches a hand-computed table", "[RepeatedMeasuresAnova][within]")
{
  // cells: {a0b0, a0b1, a1b0, a1b1}
  const std::vector<std::array<double, 4>> cells{
    {1.0, 2.0, 3.0, 4.0},
    {2.0, 2.0, 4.0, 5.0},
    {3.0, 4.0, 4.0, 6.0}};

  const TwoByTwoAnovaResult r = withinSubjectsAnova(cells);

  REQUIRE(r.subjects == 3);

  SECTION("Factor A")
  {
    REQUIRE(r.factorA.ssEffect == Approx(12.0));
    REQUIRE(r.factorA.ssError == Approx(0.5));
    REQUIRE(r.factorA.dfEffect == 1.0);
    REQUIRE(r.factorA.dfError == 2.0);
    REQUIRE(r.factorA.fStatistic == Approx(48.0));
    REQUIRE(r.factorA.partialEtaSquared == Approx(0.96));
    // F(1, 2): p = 1 - sqrt(F / (F + 2))
    REQUIRE(r.factorA.pValue == Approx(1.0 - std::sqrt(0.96)).margin(1e-9));
  }

  SECTION("Factor B")
  {
    REQUIRE(r.factorB.ssEffect == Approx(3.0));
    REQUIRE(r.factorB.fStatistic == Approx(12.0));
    REQUIRE(r.factorB.partialEtaSquared == Approx(3.0 / 3.5));
  }

  SECTION("Interaction")
  {
    REQUIRE(r.interaction.ssEffect == Approx(1.0 / 3.0));
    REQUIRE(r.interaction.ssError == Approx(1.0 / 6.0));
    REQUIRE(r.interaction.fStatistic == Approx(4.0));
    REQUIRE(r.interaction.partialEtaSquared == Approx(2.0 / 3.0));
  }

  SECTION("Intercept (subject stratum)")
  {
    REQUIRE(r.intercept.ssEffect == Approx(400.0 / 3.0));
    REQUIRE(r.intercept.ssError == Approx(74.0 / 12.0));
    REQUIRE(r.intercept.dfError == 2.0);
  }
}

TEST_CASE("mixedAnova matches a hand-computed balanced table", "[RepeatedMeasuresAnova][mixed]")
{
  const std::vector<std::array<double, 2>> cells{
    {1.0, 3.0}, {2.0, 5.0}, {4.0, 5.0}, {6.0, 8.0}};
  const std::vector<int> groups{0, 0, 1, 1};

  const TwoByTwoAnovaResult r = mixedAnova(cells, groups);

  REQUIRE(r.subjects == 4);

  REQUIRE(r.factorB.ssEffect == Approx(18.0));
  REQUIRE(r.factorB.ssError == Approx(8.5));
  REQUIRE(r.factorB.dfError == 2.0);
  REQUIRE(r.factorB.fStatistic == Approx(18.0 / 4.25));
  REQUIRE(r.factorB.partialEtaSquared == Approx(18.0 / 26.5));

  REQUIRE(r.factorA.ssEffect == Approx(8.0));
  REQUIRE(r.factorA.ssError == Approx(0.5));
  REQUIRE(r.factorA.fStatistic == Approx(32.0));

  REQUIRE(r.interaction.ssEffect == Approx(0.5));
  REQUIRE(r.interaction.fStatistic == Approx(2.0));
  REQUIRE(r.interaction.partialEtaSquared == Approx(0.5));

  REQUIRE(r.intercept.ssEffect == Approx(144.5));
  REQUIRE(r.intercept.fStatistic == Approx(34.0));
}

TEST_CASE("mixedAnova handles unequal group sizes", "[RepeatedMeasuresAnova][mixed]")
{
  const std::vector<std::array<double, 2>> cells{
    {1.0, 3.0}, {2.0, 5.0}, {1.5, 2.0}, {4.0, 5.0}, {6.0, 8.0}};
  const std::vector<int> groups{0, 0, 0, 1, 1};

  const TwoByTwoAnovaResult r = mixedAnova(cells, groups);

  REQUIRE(r.factorA.dfError == 3.0);
  REQUIRE(std::isfinite(r.factorA.fStatistic));
  REQUIRE(r.factorB.pValue > 0.0);
  REQUIRE(r.factorB.pValue < 1.0);
}

TEST_CASE("ANOVA rejects designs it cannot estimate", "[RepeatedMeasuresAnova][errors]")
{
  SECTION("Single subject")
  {
    REQUIRE_THROWS_AS(withinSubjectsAnova({{1.0, 2.0, 3.0, 4.0}}), InsufficientDesignException);
  }

  SECTION("Zero residual variance")
  {
    const std::vector<std::array<double, 4>> identical{
      {1.0, 2.0, 3.0, 4.0}, {1.0, 2.0, 3.0, 4.0}, {1.0, 2.0, 3.0, 4.0}};
    REQUIRE_THROWS_AS(withinSubjectsAnova(identical), InsufficientDesignException);
  }

  SECTION("Empty between-subject group")
  {
    REQUIRE_THROWS_AS(mixedAnova({{1.0, 2.0}, {2.0, 4.0}, {3.0, 3.0}}, {0, 0, 0}),
		      InsufficientDesignException);
  }

  SECTION("Too few subjects for the mixed error term")
  {
    REQUIRE_THROWS_AS(mixedAnova({{1.0, 2.0}, {2.0, 4.0}}, {0, 1}), InsufficientDesignException);
  }

  SECTION("Malformed grouping")
  {
    REQUIRE_THROWS_AS(mixedAnova({{1.0, 2.0}, {2.0, 4.0}, {3.0, 3.0}}, {0, 1}), std::invalid_argument);
    REQUIRE_THROWS_AS(mixedAnova({{1.0, 2.0}, {2.0, 4.0}, {3.0, 3.0}}, {0, 1, 2}), std::invalid_argument);
  }
}

TEST_CASE("Effect-size conversions", "[RepeatedMeasuresAnova][effectsize]")
{
  REQUIRE(partialEtaSquared(1.0, 3.0) == Approx(0.25));
  REQUIRE(partialEtaSquared(0.0, 0.0) == 0.0);

  REQUIRE(cohensFFromPartialEtaSquared(0.0) == 0.0);
  REQUIRE(cohensFFromPartialEtaSquared(0.2) == Approx(0.5));
  REQUIRE(cohensFFromPartialEtaSquared(0.5) == Approx(1.0));
  REQUIRE(std::isinf(cohensFFromPartialEtaSquared(1.0)));

  REQUIRE(fDistributionUpperTail(0.0, 1.0, 10.0) == 1.0);
  REQUIRE(fDistributionUpperTail(std::numeric_limits<double>::infinity(), 1.0, 10.0) == 0.0);
  // F(1, 2) tail equals the two-sided t(2) tail at sqrt(F)
  REQUIRE(fDistributionUpperTail(12.0, 1.0, 2.0) == Approx(1.0 - std::sqrt(12.0 / 14.0)).margin(1e-9));
}
