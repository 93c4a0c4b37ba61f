#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include "CadenceSimulator.h"
#include "CadenceSpec.h"
#include "ComparativeAnalyzer.h"
#include "ConfigurationFileReader.h"
#include "EmissionSnapshotReader.h"
#include "IndexSimException.h"
#include "ParallelExecutors.h"
#include "RebalanceConfiguration.h"
#include "ReportCsvWriters.h"
#include "SnapshotLoader.h"
#include "StakingYieldModel.h"
#include "TargetWeightPolicy.h"
#include "WeightScheduleReader.h"
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"
#include "reporting/SummaryReporter.h"

namespace po = boost::program_options;

using namespace tao_index;
using cadenceopt::utils::TeeStream;
using cadenceopt::reporting::SummaryReporter;

namespace
{
    std::atomic<bool> gCancelRequested(false);

    void handleInterrupt(int)
    {
        gCancelRequested.store(true);
    }

    void printUsage(const po::options_description& desc)
    {
        std::cout << "cadenceopt - compare rebalancing cadences of an emission-weighted subnet index\n\n";
        std::cout << "Usage: cadenceopt --data <dir|file> [options]\n\n";
        std::cout << desc << std::endl;

        std::cout << "\nExamples:\n";
        std::cout << "  # Default cadences over every emissions_v2_*.json in a directory\n";
        std::cout << "  cadenceopt --data emissions_v2\n\n";
        std::cout << "  # Settings file plus overrides, four worker threads\n";
        std::cout << "  cadenceopt --data emissions_v2 --config cadence.csv --cost-bps 15 --threads 4\n\n";
        std::cout << "  # Only daily and weekly against the continuous benchmark\n";
        std::cout << "  cadenceopt --data emissions_v2 --cadences \"1d;1w\" --log run.log\n";
    }

    RebalanceConfiguration buildConfiguration(const po::variables_map& vm)
    {
        RebalanceConfiguration configuration;

        if (vm.count("config"))
        {
            ConfigurationFileReader reader(vm["config"].as<std::string>());
            configuration = reader.readConfigurationFile(configuration);
        }

        if (vm.count("capital"))
            configuration.setInitialCapital(vm["capital"].as<double>());
        if (vm.count("cost-bps"))
            configuration.setTransactionCostBps(vm["cost-bps"].as<double>());
        if (vm.count("slippage-bps"))
            configuration.setSlippageBps(vm["slippage-bps"].as<double>());
        if (vm.count("top-n"))
        {
            const int topN = vm["top-n"].as<int>();
            if (topN < 1)
                throw RebalanceConfigurationException("--top-n must be at least 1");
            configuration.setTopN(static_cast<unsigned int>(topN));
        }
        if (vm.count("risk-free"))
            configuration.setRiskFreeRate(vm["risk-free"].as<double>());
        if (vm.count("cadences"))
            configuration.setCadences(CadenceSpec::listFromString(vm["cadences"].as<std::string>()));
        if (vm.count("yield-model"))
            configuration.setYieldModelName(vm["yield-model"].as<std::string>());
        if (vm.count("weight-schedule"))
            configuration.setWeightScheduleFile(vm["weight-schedule"].as<std::string>());

        return configuration;
    }

    std::shared_ptr<const TargetWeightPolicy>
    createWeightPolicy(const RebalanceConfiguration& configuration)
    {
        if (configuration.getWeightScheduleFile().empty())
            return std::make_shared<EmissionWeightPolicy>(configuration.getTopN());

        WeightScheduleReader reader(configuration.getWeightScheduleFile());
        std::shared_ptr<const WeightSchedule> schedule = reader.readFile();
        return std::make_shared<ScheduledWeightPolicy>(schedule);
    }

    int runOptimization(const po::variables_map& vm, std::ostream& log)
    {
        const auto startTime = std::chrono::steady_clock::now();

        RebalanceConfiguration configuration = buildConfiguration(vm);
        const std::string dataPath = vm["data"].as<std::string>();
        const std::string outputDir = vm["output"].as<std::string>();
        const int numThreads = vm["threads"].as<int>();
        if (numThreads < 0)
            throw RebalanceConfigurationException("--threads must not be negative");

        log << "Run started " << cadenceopt::utils::getCurrentTimestamp() << std::endl;

        // Step 1: snapshots
        EmissionSnapshotReader snapshotReader(&log);
        std::vector<EmissionSnapshot> snapshots = snapshotReader.readPath(dataPath);

        SnapshotLoader loader(configuration);
        std::shared_ptr<const SnapshotTable> table = loader.load(snapshots);

        std::shared_ptr<const StakingYieldModel> yieldModel = createStakingYieldModel(configuration);
        std::shared_ptr<const TargetWeightPolicy> weightPolicy = createWeightPolicy(configuration);

        SummaryReporter::writeConfiguration(log, configuration, *table, weightPolicy->getName());

        // Step 2: simulations
        std::unique_ptr<concurrency::IParallelExecutor> executor =
            concurrency::createExecutor(static_cast<std::size_t>(numThreads));
        log << "Simulating " << configuration.getCadencesWithBenchmark().size()
            << " cadences on " << executor->getName()
            << " executor (" << executor->getConcurrency() << " threads)" << std::endl;

        std::shared_ptr<const CadenceSimulator> simulator =
            std::make_shared<CadenceSimulator>(table, configuration, yieldModel, weightPolicy);

        ComparativeAnalyzer analyzer(simulator, *executor);
        ComparisonReport report = analyzer.runSweep(configuration.getCadences(), &log, &gCancelRequested);

        // Step 3: reports
        SummaryReporter::writeReportTable(log, report);
        SummaryReporter::writeRecommendation(log, report);

        cadenceopt::utils::ensureOutputDirectory(outputDir);

        const std::string reportPath = cadenceopt::utils::makeOutputPath(outputDir, "comparison_report.csv");
        ComparisonReportCsvWriter reportWriter(reportPath);
        reportWriter.writeReport(report);
        log << "Saved report to " << reportPath << std::endl;

        const std::string navPath = cadenceopt::utils::makeOutputPath(outputDir, "detailed_nav_history.csv");
        NavHistoryCsvWriter navWriter(navPath);
        navWriter.writeResults(report.getRankedResults());
        log << "Saved detailed NAV history to " << navPath << std::endl;

        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;
        log << "Completed in " << cadenceopt::utils::formatElapsed(elapsed.count()) << std::endl;

        return 0;
    }
}

int main(int argc, char* argv[])
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("data,d", po::value<std::string>(), "Snapshot file or directory of emissions_v2_*.json files (required)")
        ("config,c", po::value<std::string>(), "Key,Value CSV settings file")
        ("output,o", po::value<std::string>()->default_value("rebalance_optimization_results"), "Output directory for reports")
        ("threads,t", po::value<int>()->default_value(1), "Worker threads (1 = run cadences sequentially, 0 = one per core)")
        ("log,l", po::value<std::string>(), "Also write the run log to this file")
        ("capital", po::value<double>(), "Initial capital")
        ("cost-bps", po::value<double>(), "Transaction cost in basis points")
        ("slippage-bps", po::value<double>(), "Slippage in basis points")
        ("top-n", po::value<int>(), "Number of subnets in the index")
        ("risk-free", po::value<double>(), "Annual risk-free rate used in the Sharpe ratio")
        ("cadences", po::value<std::string>(), "Cadences to compare, e.g. \"1h;4h;1d;1w\"")
        ("yield-model", po::value<std::string>(), "Staking yield model: none, emission or alpha")
        ("weight-schedule", po::value<std::string>(), "EffectiveDate,Subnet,Weight CSV replacing emission weights");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(desc);
        return 1;
    }

    if (vm.count("help"))
    {
        printUsage(desc);
        return 0;
    }

    if (!vm.count("data"))
    {
        std::cerr << "Error: --data is required" << std::endl;
        printUsage(desc);
        return 1;
    }

    std::signal(SIGINT, handleInterrupt);

    try
    {
        if (vm.count("log"))
        {
            const std::string logPath = vm["log"].as<std::string>();
            std::ofstream logFile(logPath);
            if (!logFile)
            {
                std::cerr << "Error: cannot open log file " << logPath << std::endl;
                return 1;
            }

            TeeStream log(std::cout, logFile);
            const int status = runOptimization(vm, log);
            log.flush();
            return status;
        }

        return runOptimization(vm, std::cout);
    }
    catch (const SimulationCancelledException& e)
    {
        std::cerr << "Cancelled: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
