#include <atomic>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include "ArchetypeStore.h"
#include "BatchRunner.h"
#include "CompanyDirectory.h"
#include "CsvInputReaders.h"
#include "EngineConfiguration.h"
#include "EstimateSerializer.h"
#include "EvidenceRepository.h"
#include "LaborModelException.h"
#include "PriorProvider.h"
#include "utils/OutputUtils.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace labormodel;
using archetypeinfer::utils::TeeStream;
using archetypeinfer::utils::createOutputFilePath;

namespace
{
    std::atomic<BatchRunner*> gActiveRunner(nullptr);

    extern "C" void handleInterrupt(int)
    {
        BatchRunner* runner = gActiveRunner.load();
        if (runner != nullptr)
        {
            runner->cancel();
        }
    }
}

void printUsage(const po::options_description& desc)
{
    std::cout << "Archetype Inference - company level headcount and salary estimates\n\n";
    std::cout << "Usage: archetypeinfer --priors <file> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Dry run over the first two metro areas\n";
    std::cout << "  archetypeinfer --priors data/oews_priors.csv --headcount-evidence data/headcount_evidence.csv \\\n";
    std::cout << "                 --salary-evidence data/salary_evidence.csv --limit-areas 2\n\n";
    std::cout << "  # Full run, all tiers, results written to out/\n";
    std::cout << "  archetypeinfer --config config/engine_config.json --priors data/oews_priors.csv \\\n";
    std::cout << "                 --headcount-evidence data/headcount_evidence.csv \\\n";
    std::cout << "                 --salary-evidence data/salary_evidence.csv --companies data/companies.csv \\\n";
    std::cout << "                 --observed data/observed_archetypes.csv --establishments data/cbp_establishments.csv \\\n";
    std::cout << "                 --save --output-dir out\n";
}

void requireFile(const std::string& option, const std::string& path)
{
    if (!fs::exists(path))
    {
        throw EvidenceFileException("--" + option + ": file not found: " + path);
    }
}

int runInference(const po::variables_map& vm, std::ostream& out)
{
    EngineConfiguration config;
    if (vm.count("config"))
    {
        const std::string configPath = vm["config"].as<std::string>();
        requireFile("config", configPath);
        out << "Reading engine configuration " << configPath << std::endl;
        config = EngineConfigurationFileReader(configPath).readConfigurationFile();
    }

    if (vm.count("samples"))
    {
        config = config.withMonteCarloSamples(vm["samples"].as<unsigned int>());
    }

    InMemoryPriorProvider priors;
    const std::string priorPath = vm["priors"].as<std::string>();
    requireFile("priors", priorPath);
    out << "Read " << readPriorTable(priorPath, priors) << " prior rows (" << priors.getNumPriors()
        << " cells) from " << priorPath << std::endl;
    if (priors.getNumDiscarded() > 0)
    {
        out << "Discarded " << priors.getNumDiscarded() << " unreadable prior rows" << std::endl;
    }

    InMemoryEvidenceRepository evidence;
    if (vm.count("headcount-evidence"))
    {
        const std::string path = vm["headcount-evidence"].as<std::string>();
        requireFile("headcount-evidence", path);
        out << "Read " << readHeadcountEvidence(path, evidence) << " headcount evidence rows from " << path << std::endl;
    }

    if (vm.count("salary-evidence"))
    {
        const std::string path = vm["salary-evidence"].as<std::string>();
        requireFile("salary-evidence", path);
        out << "Read " << readSalaryEvidence(path, evidence) << " salary evidence rows from " << path << std::endl;
    }

    if (evidence.getNumDiscarded() > 0)
    {
        out << "Discarded " << evidence.getNumDiscarded() << " malformed evidence rows" << std::endl;
    }

    CompanyDirectory directory;
    if (vm.count("companies"))
    {
        const std::string path = vm["companies"].as<std::string>();
        requireFile("companies", path);
        directory = readCompanyDirectory(path);
        out << "Read " << directory.size() << " companies from " << path << std::endl;
    }

    TierInputs tiers;
    if (vm.count("observed"))
    {
        const std::string path = vm["observed"].as<std::string>();
        requireFile("observed", path);
        tiers.observed = readObservedArchetypes(path, config);
        out << "Read " << tiers.observed.size() << " observed archetypes from " << path << std::endl;
    }

    if (vm.count("establishments"))
    {
        const std::string path = vm["establishments"].as<std::string>();
        requireFile("establishments", path);
        tiers.establishments = readEstablishments(path);
        out << "Read " << tiers.establishments.size() << " establishment rows from " << path << std::endl;
    }

    BatchParameters params;
    params.referenceYear = vm["year"].as<int>();
    params.limitMetroAreas = vm["limit-areas"].as<std::size_t>();
    params.limitRoles = vm["limit-roles"].as<std::size_t>();
    params.persist = vm.count("save") > 0;
    params.randomSeed = vm["random-seed"].as<uint64_t>();
    params.numThreads = vm["threads"].as<unsigned int>();
    params.verbose = vm.count("verbose") > 0;

    const std::string outputDir = vm["output-dir"].as<std::string>();

    BatchRunner runner(config, priors, evidence, directory);
    gActiveRunner.store(&runner);
    std::signal(SIGINT, handleInterrupt);

    BatchResult result;
    if (params.persist)
    {
        JsonArchetypeStore store(createOutputFilePath(outputDir, "archetypes.json"));
        result = runner.run(params, tiers, store, out);
    }
    else
    {
        InMemoryArchetypeStore store;
        result = runner.run(params, tiers, store, out);
    }

    std::signal(SIGINT, SIG_DFL);
    gActiveRunner.store(nullptr);

    if (params.persist)
    {
        EstimateSerializer::writeFile(createOutputFilePath(outputDir, "headcount_estimates.json"),
                                      EstimateSerializer::toJson(result.headcounts));
        EstimateSerializer::writeFile(createOutputFilePath(outputDir, "salary_estimates.json"),
                                      EstimateSerializer::toJson(result.salaries));
        EstimateSerializer::writeFile(createOutputFilePath(outputDir, "summary.json"),
                                      EstimateSerializer::toJson(result.summary));
        out << "Results written to " << outputDir << std::endl;
    }

    const BatchSummary& summary = result.summary;
    out << "\nBatch Summary (" << summary.referenceYear << ")\n";
    out << "=====================\n";
    out << "Cells:                " << summary.totalCells() << std::endl;
    out << "  processed           " << summary.cellsProcessed << std::endl;
    out << "  skipped             " << summary.cellsSkipped << std::endl;
    out << "  insufficient        " << summary.cellsInsufficient << std::endl;
    out << "  failed              " << summary.cellsFailed << std::endl;
    if (summary.cellsCancelled > 0)
    {
        out << "  cancelled           " << summary.cellsCancelled << std::endl;
    }
    out << "Headcount estimates:  " << summary.headcountEstimates << std::endl;
    out << "Salary estimates:     " << summary.salaryEstimates << std::endl;
    out << "Archetypes:           " << summary.reconciledArchetypes
        << " (observed " << summary.observedArchetypes
        << ", inferred " << summary.inferredArchetypes
        << ", synthetic " << summary.syntheticArchetypes << ")" << std::endl;
    if (params.persist)
    {
        out << "Persisted:            " << summary.archetypesPersisted << std::endl;
        if (summary.persistenceFailures > 0)
        {
            out << "Persistence failures: " << summary.persistenceFailures << std::endl;
        }
    }

    for (const auto& failure : summary.failures)
    {
        out << "FAILED " << failure.cell << ": " << failure.message << std::endl;
    }

    if (summary.cellsCancelled > 0 || summary.persistenceFailures > 0)
    {
        return 2;
    }

    return 0;
}

int main(int argc, char* argv[])
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "Engine configuration JSON file (defaults are used when omitted)")
        ("priors,p", po::value<std::string>(), "OEWS prior table (CSV)")
        ("headcount-evidence", po::value<std::string>(), "Headcount evidence (CSV)")
        ("salary-evidence", po::value<std::string>(), "Salary observations (CSV)")
        ("companies", po::value<std::string>(), "Company directory with industries (CSV)")
        ("observed", po::value<std::string>(), "Observed archetypes (CSV)")
        ("establishments", po::value<std::string>(), "County Business Patterns establishment counts (CSV)")
        ("output-dir,o", po::value<std::string>()->default_value("output"), "Directory for result files")
        ("year,y", po::value<int>()->default_value(2024), "Reference year of the prior table")
        ("limit-areas", po::value<std::size_t>()->default_value(0), "Process only the first N metro areas (0 = all)")
        ("limit-roles", po::value<std::size_t>()->default_value(0), "Process only the first N roles (0 = all)")
        ("save,s", "Persist archetypes and write result files (default is a dry run)")
        ("samples", po::value<unsigned int>(), "Monte Carlo draws per cell (overrides the configuration)")
        ("random-seed", po::value<uint64_t>()->default_value(42), "Master random seed")
        ("threads,t", po::value<unsigned int>()->default_value(0), "Worker threads (0 = hardware concurrency)")
        ("log-file", po::value<std::string>(), "Also write the run log to this file")
        ("verbose,v", "Log every cell");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(desc);
        return 1;
    }

    if (vm.count("help"))
    {
        printUsage(desc);
        return 0;
    }

    if (!vm.count("priors"))
    {
        std::cerr << "Error: --priors is required\n\n";
        printUsage(desc);
        return 1;
    }

    std::ofstream logFile;
    if (vm.count("log-file"))
    {
        const std::string logPath = vm["log-file"].as<std::string>();
        logFile.open(logPath);
        if (!logFile)
        {
            std::cerr << "Error: cannot open log file " << logPath << std::endl;
            return 1;
        }
    }

    TeeStream tee(std::cout, logFile);
    std::ostream& out = logFile.is_open() ? static_cast<std::ostream&>(tee) : std::cout;

    try
    {
        return runInference(vm, out);
    }
    catch (const EngineConfigurationException& e)
    {
        out << "Configuration error: " << e.what() << std::endl;
    }
    catch (const EvidenceFileException& e)
    {
        out << "Input error: " << e.what() << std::endl;
    }
    catch (const PersistenceException& e)
    {
        out << "Output error: " << e.what() << std::endl;
    }
    catch (const fs::filesystem_error& e)
    {
        out << "Filesystem error: " << e.what() << std::endl;
    }

    return 1;
}
