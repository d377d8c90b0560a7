#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <vector>
#include "DesignGenerator.h"
#include "EffectSizeAnalyzer.h"
#include "FixedEffectSet.h"
#include "IPowerRunObserver.h"
#include "NullPowerRunObserver.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "PowerRunTypes.h"
#include "PseEstimator.h"
#include "PsePowerException.h"
#include "QualityDegrader.h"
#include "ResponseSimulator.h"
#include "RngUtils.h"

namespace psepower
{
  namespace power
  {
    /**
     * @brief Intermediate products of one replication, kept for inspection.
     *
     * `records` holds the trials after degradation.
     */
    struct ReplicationTrace
    {
      std::vector<simulation::TrialRecord> records;
      std::vector<simulation::RandomEffectDraw> subjectIntercepts;
      std::vector<PseEstimate> estimates;
    };

    /**
     * @class PowerEngine
     * @brief Runs the replications of a PSE power analysis.
     *
     * Each replication r draws from its own stream seeded by
     * ReplicationSeeder(seed).make_seed_for(r) and runs
     * generate -> simulate -> degrade -> estimate PSEs -> ANOVA. Replications
     * are independent and are distributed over the Executor; their results
     * are combined in replication order, so the outcome of a run does not
     * depend on the executor.
     *
     * @tparam Executor Policy exposing submit() / waitAll().
     */
    template <class Executor = concurrency::SingleThreadExecutor>
    class PowerEngine
    {
    public:
      /**
       * @throws ConfigurationException if the settings are invalid.
       */
      PowerEngine(simulation::FixedEffectSet fixedEffects,
		  const PowerRunSettings& settings,
		  std::shared_ptr<Executor> executor = nullptr)
	: mFixedEffects(fixedEffects),
	  mSettings(validated(settings)),
	  mExecutor(executor ? std::move(executor) : std::make_shared<Executor>()),
	  mObserver(std::make_shared<diagnostics::NullPowerRunObserver>()),
	  mSeeder(settings.seed),
	  mDesign(settings.subjectCount,
		  settings.trialCount,
		  settings.contrastAssignment),
	  mSimulator(fixedEffects),
	  mDegrader(settings.excludedProportion),
	  mEstimator(),
	  mAnalyzer(settings.contrastAssignment)
      {}

      void setObserver(std::shared_ptr<diagnostics::IPowerRunObserver> observer)
      {
	mObserver = observer ? std::move(observer)
	                     : std::make_shared<diagnostics::NullPowerRunObserver>();
      }

      /**
       * @brief Generates, simulates, degrades and estimates replication
       * `index` without analysing it.
       */
      ReplicationTrace simulateReplication(std::size_t index) const
      {
	auto rng = rng_utils::make_replication_rng(mSeeder, index);

	ReplicationTrace trace;
	std::vector<simulation::TrialRecord> records = mDesign.generate();
	trace.subjectIntercepts = mSimulator.simulate(records, rng);
	trace.records = mDegrader.degrade(std::move(records), rng);
	trace.estimates = mEstimator.estimate(trace.records);
	return trace;
      }

      /**
       * @brief Runs replication `index` end to end. A design left too small
       * for the ANOVA yields a result without analysis; every other error
       * propagates.
       */
      ReplicationResult runReplication(std::size_t index) const
      {
	ReplicationResult result;
	result.replication = index;
	result.estimates = simulateReplication(index).estimates;

	try
	  {
	    result.analysis = mAnalyzer.analyze(result.estimates);
	  }
	catch (const InsufficientDesignException& e)
	  {
	    result.failureMessage = e.what();
	  }

	return result;
      }

      /**
       * @brief Runs every replication and accumulates the Cohen's f
       * distribution of each effect. Per-replication warnings are written to
       * `os` in replication order once all replications have finished.
       */
      PowerRunResult run(std::ostream& os)
      {
	os << "PSE power run: " << mSettings.subjectCount << " subjects, "
	   << mSettings.trialCount << " trials per cell, excluded proportion "
	   << mSettings.excludedProportion << ", "
	   << simulation::contrastAssignmentName(mSettings.contrastAssignment)
	   << "-subject contrast, " << mSettings.replications << " replications, seed "
	   << mSeeder.runSeed() << std::endl;

	std::vector<ReplicationResult> replications(mSettings.replications);
	concurrency::parallel_for(mSettings.replications, *mExecutor,
				  [this, &replications](uint32_t r) {
				    replications[r] = runReplication(r);
				  });

	PowerRunResult result(mSettings.alpha);
	for (const auto& replication : replications)
	  {
	    logReplication(os, replication);
	    mObserver->onReplicationResult(replication);
	    result.addReplication(replication);
	  }

	return result;
      }

      const PowerRunSettings& getSettings() const
      {
	return mSettings;
      }

      const simulation::FixedEffectSet& getFixedEffects() const
      {
	return mFixedEffects;
      }

    private:
      static const PowerRunSettings& validated(const PowerRunSettings& settings)
      {
	settings.validate();
	return settings;
      }

      static void logReplication(std::ostream& os, const ReplicationResult& replication)
      {
	const std::size_t invalid = replication.invalidEstimates();
	if (invalid > 0)
	  {
	    os << "Replication " << (replication.replication + 1) << ": " << invalid
	       << " invalid PSE group(s) [";
	    bool first = true;
	    for (const auto& count : PseEstimator::countFailures(replication.estimates))
	      {
		os << (first ? "" : ", ") << fitFailureName(count.first) << ": " << count.second;
		first = false;
	      }
	    os << "]" << std::endl;
	  }

	if (!replication.analysis)
	  {
	    os << "Replication " << (replication.replication + 1) << " not analysed: "
	       << replication.failureMessage << std::endl;
	    return;
	  }

	if (replication.analysis->excludedSubjects > 0)
	  os << "Replication " << (replication.replication + 1) << ": "
	     << replication.analysis->excludedSubjects
	     << " subject(s) excluded listwise for incomplete cells" << std::endl;
      }

      simulation::FixedEffectSet mFixedEffects;
      PowerRunSettings mSettings;
      std::shared_ptr<Executor> mExecutor;
      std::shared_ptr<diagnostics::IPowerRunObserver> mObserver;
      rng_utils::ReplicationSeeder mSeeder;
      simulation::DesignGenerator mDesign;
      simulation::ResponseSimulator mSimulator;
      simulation::QualityDegrader mDegrader;
      PseEstimator mEstimator;
      EffectSizeAnalyzer mAnalyzer;
    };
  } // namespace power
} // namespace psepower
