#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <boost/program_options.hpp>

#include "CsvEffectSizeCollector.h"
#include "ParallelExecutors.h"
#include "PowerConfiguration.h"
#include "PowerEngine.h"
#include "PsePowerException.h"
#include "RngUtils.h"
#include "reporting/PowerReporter.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;

using namespace psepower;

namespace
{
  void printUsage(const po::options_description& desc)
  {
    std::cout << "PSE power simulation - parametric-bootstrap power analysis of a\n"
	      << "psychometric color x contrast experiment\n\n";
    std::cout << "Usage: psepower --coefficients <file.csv> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  psepower --coefficients pilot_fixef.csv --subjects 10 --trials 24 --replications 500\n";
    std::cout << "  psepower -c pilot_fixef.csv --retained-trials 6120 --total-trials 6912 --seed 42 --threads 0\n";
  }

  simulation::ContrastAssignment parseContrastAssignment(const std::string& value)
  {
    if (value == "within")
      return simulation::ContrastAssignment::WithinSubject;
    if (value == "between")
      return simulation::ContrastAssignment::BetweenSubject;
    throw ConfigurationException("--contrast-assignment must be 'within' or 'between', got '" + value + "'");
  }

  template <class Executor>
  power::PowerRunResult runPowerAnalysis(const simulation::FixedEffectSet& fixedEffects,
					 const power::PowerRunSettings& settings,
					 std::shared_ptr<Executor> executor,
					 std::shared_ptr<diagnostics::IPowerRunObserver> observer,
					 std::ostream& os)
  {
    power::PowerEngine<Executor> engine(fixedEffects, settings, executor);
    engine.setObserver(observer);
    return engine.run(os);
  }
}

int main(int argc, char** argv)
{
  try
    {
      po::options_description desc("Options");
      desc.add_options()
	("help,h", "Show this help message")
	("coefficients,c", po::value<std::string>(), "Pilot model coefficient table (CSV: term,estimate)")
	("subjects,s", po::value<int64_t>()->default_value(10), "Number of simulated subjects")
	("trials,t", po::value<int64_t>()->default_value(24), "Replicate trials per stimulus level and condition")
	("excluded-proportion,p", po::value<double>(), "Proportion of responses marked missing, in [0, 1]")
	("retained-trials", po::value<int64_t>(), "Real-data trials kept after exclusion (with --total-trials)")
	("total-trials", po::value<int64_t>(), "Real-data trials before exclusion (with --retained-trials)")
	("replications,r", po::value<int64_t>()->default_value(100), "Number of simulated replications")
	("seed", po::value<uint64_t>(), "Run seed (drawn from system entropy when omitted)")
	("contrast-assignment", po::value<std::string>()->default_value("within"), "Contrast factor: within or between subjects")
	("alpha", po::value<double>()->default_value(0.05), "Significance level for empirical power")
	("threads", po::value<int64_t>()->default_value(0), "Worker threads (0 runs replications on the calling thread)")
	("output,o", po::value<std::string>(), "Effect-size table CSV (default: timestamped file in the working directory)")
	("log-file", po::value<std::string>(), "Also write the run log to this file");

      po::variables_map vm;
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);

      if (vm.count("help"))
	{
	  printUsage(desc);
	  return 0;
	}

      if (!vm.count("coefficients"))
	{
	  std::cerr << "Error: --coefficients is required\n\n";
	  printUsage(desc);
	  return 1;
	}

      power::PowerRunSettings settings;
      settings.subjectCount = countFromOption("subjects", vm["subjects"].as<int64_t>());
      settings.trialCount = countFromOption("trials", vm["trials"].as<int64_t>());
      settings.replications = countFromOption("replications", vm["replications"].as<int64_t>());
      settings.contrastAssignment = parseContrastAssignment(vm["contrast-assignment"].as<std::string>());
      settings.alpha = vm["alpha"].as<double>();

      const bool haveCounts = vm.count("retained-trials") || vm.count("total-trials");
      if (haveCounts && vm.count("excluded-proportion"))
	throw ConfigurationException("give either --excluded-proportion or --retained-trials/--total-trials, not both");
      if (haveCounts)
	{
	  if (!(vm.count("retained-trials") && vm.count("total-trials")))
	    throw ConfigurationException("--retained-trials and --total-trials must be given together");
	  const uint32_t retained = countFromOption("retained-trials", vm["retained-trials"].as<int64_t>(), true);
	  const uint32_t total = countFromOption("total-trials", vm["total-trials"].as<int64_t>(), true);
	  settings.excludedProportion = excludedProportionFromCounts(retained, total);
	}
      else if (vm.count("excluded-proportion"))
	settings.excludedProportion = vm["excluded-proportion"].as<double>();

      settings.seed = vm.count("seed") ? vm["seed"].as<uint64_t>() : rng_utils::make_entropy_seed();
      settings.validate();
      const unsigned int threads = countFromOption("threads", vm["threads"].as<int64_t>(), true);

      CoefficientFileReader reader(vm["coefficients"].as<std::string>());
      const simulation::FixedEffectSet fixedEffects = reader.readFixedEffectSet();

      const std::string outputFile = vm.count("output")
	? vm["output"].as<std::string>()
	: utils::createEffectSizeFileName(settings.subjectCount, settings.trialCount);
      utils::RunOutputs outputs(outputFile, vm.count("log-file") ? vm["log-file"].as<std::string>() : std::string());
      std::ostream& os = outputs.log();
      auto collector = outputs.getCollector();

      os << "Coefficients: " << reader.getFileName() << std::endl;
      for (const auto& term : fixedEffects.toTermMap())
	os << "  " << term.first << " = " << term.second << std::endl;
      if (!vm.count("seed"))
	os << "No --seed given; using entropy seed " << settings.seed << std::endl;

      power::PowerRunResult result = threads == 0
	? runPowerAnalysis(fixedEffects, settings,
			   std::make_shared<concurrency::SingleThreadExecutor>(), collector, os)
	: runPowerAnalysis(fixedEffects, settings,
			   std::make_shared<concurrency::ThreadPoolExecutor<>>(threads), collector, os);

      os << std::endl;
      reporting::PowerReporter::writeRunReport(os, settings, result);
      os << "Effect-size table written to " << outputFile << std::endl;
      os.flush();
    }
  catch (const po::error& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
  catch (const ConfigurationException& e)
    {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Power analysis failed: " << e.what() << std::endl;
      return 1;
    }

  return 0;
}
