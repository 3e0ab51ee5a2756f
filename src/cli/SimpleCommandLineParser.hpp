/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser to avoid CLI11 dependency issues
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>
#include <cctype>

namespace popaccess {

/**
 * @brief Simple command-line argument parser
 *
 * A lightweight alternative to CLI11 that avoids CMake compatibility issues
 * while providing the essential functionality needed for our application.
 * Options carry no built-in defaults: an option that was not given stays
 * unset so that values loaded from a configuration file are not overwritten.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true)
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false) {
        options_[long_name] = Option(long_name, short_name, description, required, true);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    // Parse command line arguments
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        // Store all arguments
        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        // Parse arguments
        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!inline_value) {
                        if (!has_value_at(i + 1)) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !looks_numeric(arg)) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (!has_value_at(i + 1)) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }

        // Check required options
        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        return true;
    }

    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << "POPACCESS - Population accessibility by distance to facilities and roads\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n\n";

        std::cout << description_ << "\n\n";

        std::cout << "QUICK START:\n";
        std::cout << "    # One continental raster split by country boundaries\n";
        std::cout << "    " << program_name_ << " --population pop.tif --features health_sites.gpkg \\\n";
        std::cout << "        --boundaries countries.gpkg --boundary-name-field NAME\n";
        std::cout << "    \n";
        std::cout << "    # Create a configuration file, edit it, then run from it\n";
        std::cout << "    " << program_name_ << " --create-config run.json\n";
        std::cout << "    " << program_name_ << " --config run.json\n\n";

        std::cout << "INPUT OPTIONS:\n";
        print_help_section("config", "Load configuration from JSON file (command-line options override it)");
        print_help_section("population", "Population raster (any GDAL format)");
        print_help_section("band", "Raster band: 1-based index or band description (default: 1)");
        print_help_section("nodata", "No-data value when the raster does not declare one (e.g. -9999)");
        print_help_section("features", "Reference features: facilities or roads (any OGR format)");
        print_help_section("feature-layer", "Layer name inside the feature source (default: first layer)");
        print_help_section("filter-field", "Attribute used to select feature classes (e.g. GP_RTP)");
        print_help_section("filter-values", "Accepted values of the filter attribute (e.g. 1,2)");
        std::cout << "\n";

        std::cout << "SCOPE OPTIONS:\n";
        print_help_section("boundaries", "Boundary file (one feature per country) or directory of boundary files");
        print_help_section("boundary-name-field", "Attribute holding the country name (default: name)");
        print_help_section("country-rasters", "Directory of per-country population rasters");
        print_help_section("regions", "Region definition JSON (default: built-in African regions)");
        print_help_section("rollup-only", "Rebuild regional rollups from stored per-country results");
        std::cout << "\n";

        std::cout << "CLASSIFICATION OPTIONS:\n";
        print_help_section("policy", "Urban/rural policy: threshold (density grid) or sign (pre-classified)");
        print_help_section("threshold", "Urban density threshold, threshold policy only (default: 300)");
        print_help_section("bands", "Distance band breakpoints in km (default: 1,2,5,10,20,50,100)");
        print_help_section("thresholds", "Cumulative thresholds in km, list or start:stop:step (default: 1:100:1)");
        print_help_section("gap-thresholds", "Thresholds for urban/rural coverage gaps (default: 1,5)");
        std::cout << "\n";

        std::cout << "OUTPUT OPTIONS:\n";
        print_help_section("output-dir", "Output directory (default: output)");
        print_help_section("base-name", "Output filename prefix (default: accessibility)");
        print_help_section("output-formats", "Result formats: json,csv (default: json,csv)");
        print_help_section("cell-detail", "Write grid-level CSV detail per country");
        print_help_section("distance-raster", "Write the distance field of each country as GeoTIFF");
        print_help_section("block-factor", "Aggregate population into N x N cell blocks (default: 0, off)");
        std::cout << "\n";

        std::cout << "PROCESSING & LOGGING OPTIONS:\n";
        print_help_section("threads", "Worker thread limit (default: 0, all cores)");
        print_help_section("log-level", "Verbosity: 1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE");
        print_help_section("log-config", "Per-facility levels, e.g. \"4,DistanceField=6\"");
        print_help_section("log-file", "Log to specified file (append if exists)");
        print_help_section("create-config", "Create a default configuration file at the specified path");
        print_help_section("dry-run", "Parse arguments and validate without processing");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "HELP:\n";
        std::cout << "    -h, --help               Show this help\n";
        std::cout << "\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    <base>_countries.json, <base>_regions.json  per-country and regional results\n";
        std::cout << "    <base>_summary.csv, <base>_bands.csv        flat tables\n";
        std::cout << "    scopes/<country>.json                       stored results for --rollup-only\n";
    }

private:
    bool has_value_at(size_t index) const {
        if (index >= args_.size()) return false;
        const std::string& next = args_[index];
        return !next.starts_with("-") || looks_numeric(next);
    }

    // "-9999", "-0.5" and "-1,2" are values, not options
    static bool looks_numeric(const std::string& arg) {
        return arg.size() > 1 && arg[0] == '-' &&
               (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it != options_.end()) {
            const auto& option = it->second;
            std::string flag = "--" + option.long_name;
            if (option.has_value) {
                flag += " VALUE";
            }
            std::cout << "    " << flag;
            if (flag.size() < 28) {
                std::cout << std::string(28 - flag.size(), ' ');
            } else {
                std::cout << "  ";
            }
            std::cout << description << "\n";
        }
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace popaccess
