/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the accessibility analyzer
 */

#pragma once

#include "popaccess.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>
#include <vector>

namespace popaccess {

/**
 * @brief Command line interface for parsing arguments and configuring a run
 *
 * Precedence: built-in defaults, then the --config file, then options given
 * on the command line.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if a run should follow; false after help, version,
     *         --create-config or an error (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Get the parsed configuration
     * @return AnalysisConfig object
     */
    const AnalysisConfig& get_config() const { return config_; }

    /**
     * @brief Check if this is a dry run
     * @return true if dry run mode is enabled
     */
    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit code when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

private:
    AnalysisConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    // Main parsing method
    void parse_all_options(const SimpleCommandLineParser& parser);

    // Configuration file methods
    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);
};

} // namespace popaccess
