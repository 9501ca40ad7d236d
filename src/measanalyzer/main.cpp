#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "AnalyzerConfiguration.h"
#include "ConsoleProgressObserver.h"
#include "MeasurementException.h"
#include "MeasurementSession.h"
#include "OutputUtils.h"

namespace po = boost::program_options;

using namespace mkc_measurement;
using measanalyzer::ConsoleProgressObserver;
using measanalyzer::utils::TeeStream;

void printUsage(const po::options_description& desc) {
    std::cout << "Measurement Analyzer - process capability and tolerance suggestions from inspection reports\n\n";
    std::cout << "Usage: measanalyzer --folder DIR [--folder DIR ...] [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Statistics of one lot\n";
    std::cout << "  measanalyzer --folder reports/lot1\n\n";
    std::cout << "  # Accumulate two lots and export the statistics table\n";
    std::cout << "  measanalyzer --folder reports/lot1 --folder reports/lot2 --export stats.csv\n\n";
    std::cout << "  # Tolerance needed for 99.73% yield on one item\n";
    std::cout << "  measanalyzer --folder reports/lot1 --item Gap-A --yield 0.9973\n\n";
    std::cout << "  # Failing records only\n";
    std::cout << "  measanalyzer --folder reports/lot1 --export-records fails.csv --only-fail\n";
}

AnalyzerConfiguration createConfiguration(const po::variables_map& vm) {
    AnalyzerConfiguration configuration;

    if (vm.count("config")) {
        AnalyzerConfigurationFileReader reader(vm["config"].as<std::string>());
        configuration = reader.readConfigurationFile();
    }

    // Command line settings override the configuration file
    if (vm.count("yield"))
        configuration.setTargetYield(vm["yield"].as<double>());

    if (vm.count("threads")) {
        const int threads = vm["threads"].as<int>();
        if (threads < 0 || static_cast<std::size_t>(threads) > AnalyzerConfiguration::kMaxWorkerThreads)
            throw po::validation_error(po::validation_error::invalid_option_value, "threads",
                                       std::to_string(threads));
        configuration.setWorkerThreads(static_cast<std::size_t>(threads));
    }

    return configuration;
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("folder,f", po::value<std::vector<std::string>>(), "Folder of measurement reports (repeatable, data accumulates)")
            ("yield,y", po::value<double>(), "Target yield for tolerance suggestions (0.80 - 0.9973)")
            ("config,c", po::value<std::string>(), "Analyzer configuration file (Key,Value CSV)")
            ("export,e", po::value<std::string>(), "Write the statistics table to a CSV file")
            ("export-records", po::value<std::string>(), "Write the record table to a CSV file")
            ("only-fail", "Export only failing records")
            ("threads,t", po::value<int>(), "Number of parse worker threads (0 = hardware threads, at most 256)")
            ("log,l", po::value<std::string>(), "Also append the output to this log file")
            ("item,i", po::value<std::string>(), "Print the tolerance suggestion for one item")
            ("verbose,v", "Report every imported file");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("folder")) {
            printUsage(desc);
            return 0;
        }

        std::ofstream logFile;
        std::unique_ptr<TeeStream> tee;
        if (vm.count("log")) {
            const std::string logPath = vm["log"].as<std::string>();
            logFile.open(logPath, std::ios::app);
            if (!logFile) {
                std::cerr << "Error: cannot open log file " << logPath << std::endl;
                return 1;
            }
            tee = std::make_unique<TeeStream>(std::cout, logFile);
        }
        std::ostream& log = tee ? static_cast<std::ostream&>(*tee) : std::cout;

        AnalyzerConfiguration configuration = createConfiguration(vm);
        MeasurementSession session(configuration);
        ConsoleProgressObserver observer(log, vm.count("verbose") > 0);

        for (const auto& folder : vm["folder"].as<std::vector<std::string>>()) {
            ImportResult result = session.importFolder(folder, nullptr, &observer);
            measanalyzer::utils::printImportSummary(log, result);
        }

        const double targetYield = configuration.getTargetYield();

        log << std::endl << "Statistics (" << session.getStore().getTotalRecordCount() << " records, "
            << session.getStore().getNumItems() << " items)" << std::endl;
        for (const auto& series : session.getStore().getSnapshot())
            measanalyzer::utils::printItemStatistics(log, series->getItemName(), series->getStatistics());

        if (vm.count("item")) {
            const std::string itemName = vm["item"].as<std::string>();
            try {
                ToleranceSuggestion suggestion = session.suggestTolerance(itemName, targetYield);
                log << std::endl;
                measanalyzer::utils::printToleranceSuggestion(log, itemName, suggestion);
            } catch (const std::out_of_range&) {
                std::cerr << "Error: no measurements for item '" << itemName << "'" << std::endl;
                return 1;
            } catch (const InsufficientDataError& e) {
                std::cerr << "Error: " << itemName << ": " << e.what() << std::endl;
                return 1;
            }
        }

        if (vm.count("export")) {
            const std::string exportPath = vm["export"].as<std::string>();
            session.exportStatistics(exportPath, targetYield);
            log << "Statistics written to " << exportPath << std::endl;
        }

        if (vm.count("export-records")) {
            const std::string exportPath = vm["export-records"].as<std::string>();
            std::size_t numWritten = session.exportRecords(exportPath, vm.count("only-fail") > 0);
            log << numWritten << " records written to " << exportPath << std::endl;
        }

        log.flush();

    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const AnalyzerConfigurationException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
