#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "PowerRunTypes.h"
#include "PsePowerException.h"

using Catch::Approx;
using namespace psepower;
using namespace psepower::power;

namespace
{
  EffectSizeAnalysis analysisWith(double colorF, double colorP, std::size_t excluded)
  {
    EffectSizeAnalysis a;
    a.completeSubjects = 8;
    a.excludedSubjects = excluded;
    a.effects = {
      EffectSizeRecord{"(Intercept)", 1.0, 1.0, 7.0, 0.35, 0.1, 0.33},
      EffectSizeRecord{"color", 9.0, 1.0, 7.0, colorP, 0.5, colorF},
      EffectSizeRecord{"contrast", 0.5, 1.0, 7.0, 0.5, 0.05, 0.23},
      EffectSizeRecord{"color:contrast", 0.2, 1.0, 7.0, 0.67, 0.02, 0.14}
    };
    return a;
  }
}

TEST_CASE("PowerRunResult accumulates effect sizes and diagnostics", "[PowerRunResult]")
{
  PowerRunResult result(0.05);

  ReplicationResult first;
  first.replication = 0;
  first.estimates = {
    PseEstimate{1, true, ContrastLevel::Positive, 1.0, FitFailure::None, 10},
    PseEstimate{1, false, ContrastLevel::Positive, std::nullopt, FitFailure::NonConvergence, 10}
  };
  first.analysis = analysisWith(1.2, 0.01, 1);

  ReplicationResult second;
  second.replication = 1;
  second.analysis = analysisWith(0.8, 0.20, 0);

  ReplicationResult third;
  third.replication = 2;
  third.estimates = {
    PseEstimate{1, true, ContrastLevel::Positive, std::nullopt, FitFailure::InsufficientResponseVariation, 0},
    PseEstimate{2, true, ContrastLevel::Positive, std::nullopt, FitFailure::InsufficientResponseVariation, 0}
  };
  third.failureMessage = "too few subjects";

  result.addReplication(first);
  result.addReplication(second);
  result.addReplication(third);

  REQUIRE(result.getReplicationCount() == 3u);
  REQUIRE(result.getAnalysedReplications() == 2u);
  REQUIRE(result.getUnanalysableReplications() == 1u);
  REQUIRE(result.getReplicationsWithInvalidPse() == 2u);
  REQUIRE(result.getInvalidPseCount() == 3u);
  REQUIRE(result.getExcludedSubjectCount() == 1u);
  REQUIRE(result.getFailureCounts().at(FitFailure::NonConvergence) == 1u);
  REQUIRE(result.getFailureCounts().at(FitFailure::InsufficientResponseVariation) == 2u);

  REQUIRE(result.getCohensF("color") == std::vector<double>{1.2, 0.8});
  REQUIRE(result.getCohensF("size").empty());

  auto color = result.getSummary("color");
  REQUIRE(color != nullptr);
  REQUIRE(*color->getMean() == Approx(1.0));
  REQUIRE(color->getSignificantCount() == 1u);
  REQUIRE(*color->getEmpiricalPower() == Approx(0.5));
  REQUIRE(result.getSummary("size") == nullptr);
}

TEST_CASE("PowerRunResult starts with every effect empty", "[PowerRunResult]")
{
  PowerRunResult result;
  REQUIRE(result.getCohensF().size() == effectNames().size());
  for (const auto& name : effectNames())
    {
      REQUIRE(result.getCohensF(name).empty());
      REQUIRE(result.getSummary(name)->getCount() == 0u);
      REQUIRE_FALSE(result.getSummary(name)->getMean().has_value());
    }
}

TEST_CASE("PowerRunSettings validation", "[PowerRunSettings]")
{
  PowerRunSettings s;
  s.subjectCount = 10;
  s.trialCount = 24;
  s.replications = 5;
  s.excludedProportion = 0.2;

  REQUIRE_NOTHROW(s.validate());

  SECTION("Proportion bounds are inclusive")
  {
    s.excludedProportion = 0.0;
    REQUIRE_NOTHROW(s.validate());
    s.excludedProportion = 1.0;
    REQUIRE_NOTHROW(s.validate());
    s.excludedProportion = 1.01;
    REQUIRE_THROWS_AS(s.validate(), ConfigurationException);
  }

  SECTION("Too few subjects for the analysis")
  {
    s.subjectCount = 1;
    REQUIRE_THROWS_AS(s.validate(), ConfigurationException);
    s.subjectCount = 2;
    REQUIRE_NOTHROW(s.validate());
    s.contrastAssignment = ContrastAssignment::BetweenSubject;
    REQUIRE_THROWS_AS(s.validate(), ConfigurationException);
  }
}
