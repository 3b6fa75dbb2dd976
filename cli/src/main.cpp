// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <memory>      // For std::shared_ptr

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "config_loader.hpp"
#include "sizing_study.hpp"
#include "report_logger.hpp"
#include "result_exporter.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    void printUsage(const char* program) {
        std::cout << "Usage: " << program << " [config.json] [--output result.json] [--final-capitals]\n"
                  << "  Without a config file the default 1%..40% scan at a 57% win rate runs.\n"
                  << "  --final-capitals adds every trial's final capital per size to the export.\n";
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Argument Parsing ---
        std::string config_path;
        std::string output_path;
        bool export_final_capitals = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "-o" || arg == "--output") {
                if (i + 1 >= argc) {
                    std::cerr << "Missing value for " << arg << std::endl;
                    printUsage(argv[0]);
                    return 2;
                }
                output_path = argv[++i];
            } else if (arg == "--final-capitals") {
                export_final_capitals = true;
            } else if (config_path.empty()) {
                config_path = arg;
            } else {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                printUsage(argv[0]);
                return 2;
            }
        }

        // --- Initialize Logging ---
        core::logging::initialize("position_sizing_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Position Sizing CLI starting...");

        // --- Load Configuration ---
        config::SimulationConfig sim_config;
        if (!config_path.empty()) {
            sim_config = config::ConfigLoader::fromFile(config_path);
        } else {
            logger->info("No config file given; using the default position size scan.");
        }

        // --- Run Study ---
        engine::SizingStudy study(sim_config);
        engine::StudyResult result = study.run();

        reporting::ReportLogger::logStudy(result);

        if (export_final_capitals && output_path.empty()) {
            logger->warn("--final-capitals has no effect without --output.");
        }
        if (!output_path.empty()) {
            reporting::ResultExporter::writeToFile(result, output_path, true, export_final_capitals);
        }

        logger->info("Position Sizing CLI finished.");

    // --- Exception Handling ---
    } catch (const core::ConfigException& ex) {
        std::cerr << "Configuration Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Configuration Error ({}): {}", ex.parameter(), ex.what());
        return 1;
    } catch (const core::PositionSizingException& ex) {
        std::cerr << "Platform Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Platform Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
