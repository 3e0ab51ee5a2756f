/**
 * @file main.cpp
 * @brief Main entry point for the population accessibility analyzer
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "popaccess.hpp"
#include "AccessErrors.hpp"
#include "core/AccessPipeline.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include <iostream>
#include <iomanip>

using namespace popaccess;

namespace {

/**
 * @brief Apply level, facility overrides and log file before anything logs
 */
bool configure_logging(const AnalysisConfig& config) {
    Logger::setDefaultLevel(static_cast<LogLevel>(std::clamp(config.log_level, 1, 6)));

    if (!config.log_config.empty() && !Logger::parseLogConfig(config.log_config)) {
        std::cerr << "Invalid --log-config: " << config.log_config << "\n";
        return false;
    }
    if (!config.log_file.empty() && !Logger::setLogFile(config.log_file)) {
        std::cerr << "Cannot open log file: " << config.log_file << "\n";
        return false;
    }
    return true;
}

/**
 * @brief Print a one-line-per-rollup summary
 */
void print_summary(const PipelineSummary& summary, const AnalysisConfig& config) {
    const double threshold = config.gap_thresholds_km.empty() ? 5.0 : config.gap_thresholds_km.back();

    std::cout << "\n=== Accessibility Summary ===\n";
    std::cout << "Countries analyzed: " << summary.scopes.size() << "\n";
    std::cout << "Countries excluded: " << summary.excluded.size() << "\n";

    auto print_row = [threshold](const std::string& name, const AccessTable& table) {
        std::cout << "  " << std::left << std::setw(24) << name << std::right
                  << std::setw(16) << std::fixed << std::setprecision(0) << table.total.value();
        if (const ThresholdRow* row = table.find_threshold(threshold)) {
            std::cout << "  within " << threshold << "km: " << std::setprecision(1)
                      << 100.0 * PopulationCount::share(row->reachable, table.total) << "%";
        }
        std::cout << "\n";
    };

    for (const auto& region : summary.report.regions) {
        print_row(region.name, region.table);
    }
    if (summary.report.continent) {
        print_row(summary.report.continent->name, summary.report.continent->table);
    }

    const auto& audit = summary.report.audit;
    if (!audit.unmapped_countries.empty() || !audit.missing_members.empty()) {
        std::cout << "Unmapped countries: " << audit.unmapped_countries.size()
                  << ", missing members: " << audit.missing_members.size() << "\n";
    }
    std::cout << "Files written: " << summary.output_files.size() << "\n";
    std::cout << "Elapsed: " << summary.elapsed.count() << "ms\n";
    std::cout << "=============================\n";
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.exit_code();  // Help, version, created config, or parse error
    }

    const AnalysisConfig& config = cli.get_config();
    if (!configure_logging(config)) {
        return 1;
    }
    Logger logger("main");

    InputValidator validator;
    ValidationResult validation = validator.validate(config);
    if (validation.has_errors()) {
        std::cerr << validation.format_error_message() << "\n";
        std::cerr << "Program terminated due to invalid inputs.\n";
        return 1;
    }

    cli.print_config();

    if (cli.is_dry_run()) {
        logger.info("Dry run mode - configuration validated successfully");
        return 0;
    }

    try {
        AccessPipeline pipeline(config);
        PipelineSummary summary = config.rollup_only_dir.empty()
            ? pipeline.run()
            : pipeline.run_rollup_only(config.rollup_only_dir);

        if (config.log_level >= 3) {
            print_summary(summary, config);
        }

        if (!summary.outputs_complete) {
            logger.error("One or more output files could not be written");
            return 1;
        }
        if (summary.scopes.empty()) {
            logger.error("No country produced a result");
            return 1;
        }
        return 0;

    } catch (const AccessError& e) {
        logger.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
