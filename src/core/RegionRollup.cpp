/**
 * @file RegionRollup.cpp
 * @brief Implementation of region definitions and rollups
 */

#include "RegionRollup.hpp"
#include "Logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace popaccess {

void RegionDefinitions::add_region(const std::string& name, const std::vector<std::string>& members) {
    for (const auto& region : regions_) {
        if (region.first == name) {
            throw ConfigurationError("Region '" + name + "' is defined twice");
        }
    }
    for (const auto& member : members) {
        auto existing = country_to_region_.find(member);
        if (existing != country_to_region_.end()) {
            throw ConfigurationError("Country '" + member + "' is assigned to both '" +
                                     existing->second + "' and '" + name + "'");
        }
        country_to_region_[member] = name;
    }
    regions_.emplace_back(name, members);
}

RegionDefinitions RegionDefinitions::african_defaults() {
    RegionDefinitions defs;
    defs.add_region("North Africa",
        {"Morocco", "Algeria", "Tunisia", "Libya", "Egypt", "Mauritius"});
    defs.add_region("West Africa",
        {"Senegal", "Gambia", "Guinea-Bissau", "Guinea", "Sierra Leone", "Liberia",
         "Côte d'Ivoire", "Ghana", "Togo", "Benin", "Nigeria", "Niger",
         "Burkina Faso", "Mali", "Mauritania", "Cabo Verde"});
    defs.add_region("Central Africa",
        {"Chad", "Central African Republic", "Cameroon", "Gabon", "Congo",
         "Democratic Republic of the Congo", "Equatorial Guinea",
         "Sao Tome and Principe", "Burundi"});
    defs.add_region("East Africa",
        {"Ethiopia", "Eritrea", "Djibouti", "Somalia", "Kenya", "Uganda",
         "Tanzania", "Rwanda", "South Sudan", "Sudan"});
    defs.add_region("Southern Africa",
        {"South Africa", "Namibia", "Botswana", "Zimbabwe", "Zambia", "Malawi",
         "Mozambique", "Angola", "Lesotho", "Madagascar", "Comoros", "Swaziland",
         "Seychelles"});
    return defs;
}

RegionDefinitions RegionDefinitions::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open region definition file: " + path);
    }

    RegionDefinitions defs;
    try {
        nlohmann::ordered_json document = nlohmann::ordered_json::parse(file);
        if (!document.is_object()) {
            throw ConfigurationError("Region file " + path + " must contain a JSON object");
        }
        for (const auto& [region, members] : document.items()) {
            if (!members.is_array()) {
                throw ConfigurationError("Region '" + region + "' in " + path +
                                         " must list its countries as an array");
            }
            defs.add_region(region, members.get<std::vector<std::string>>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed region file " + path + ": " + e.what());
    }
    return defs;
}

std::optional<std::string> RegionDefinitions::region_of(const std::string& country) const {
    auto it = country_to_region_.find(country);
    if (it == country_to_region_.end()) {
        return std::nullopt;
    }
    return it->second;
}

RollupReport rollup_regions(const std::vector<ScopeResult>& scopes,
                            const RegionDefinitions& definitions,
                            const std::vector<ExcludedScope>& excluded) {
    Logger logger("RegionRollup");

    RollupReport report;
    report.audit.excluded_scopes = excluded;

    std::unordered_map<std::string, const ScopeResult*> by_name;
    for (const auto& scope : scopes) {
        by_name[scope.name] = &scope;
        if (!definitions.region_of(scope.name)) {
            report.audit.unmapped_countries.push_back(scope.name);
        }
    }
    std::set<std::string> failed;
    for (const auto& scope : excluded) {
        failed.insert(scope.name);
    }

    if (scopes.empty()) {
        logger.warning("No successful scopes to roll up");
    }

    for (const auto& [region_name, members] : definitions.regions()) {
        RegionResult region;
        region.name = region_name;
        if (!scopes.empty()) {
            region.table = scopes.front().table.empty_like();
        }

        PopulationCount member_sum;
        for (const auto& member : members) {
            auto it = by_name.find(member);
            if (it == by_name.end()) {
                if (!failed.count(member)) {
                    report.audit.missing_members.push_back(member);
                }
                continue;
            }
            region.members.push_back(member);
            region.table.merge(it->second->table, region_name + "/" + member);
            member_sum += it->second->table.total;
        }

        if (region.members.empty()) {
            report.audit.empty_regions.push_back(region_name);
            logger.warning("Region " + region_name + " has no member with results");
        }
        if (member_sum != region.table.total) {
            throw ReconciliationError(region_name + ": region total differs from sum of members");
        }
        if (!scopes.empty()) {
            region.table.validate(region_name);
        }

        std::ostringstream msg;
        msg << region_name << ": " << region.members.size() << "/" << members.size()
            << " members, population " << static_cast<long long>(std::llround(region.table.total.value()));
        logger.info(msg.str());

        report.regions.push_back(std::move(region));
    }

    if (!scopes.empty()) {
        RegionResult continent;
        continent.name = kContinentRollupName;
        continent.table = scopes.front().table.empty_like();
        for (const auto& scope : scopes) {
            continent.members.push_back(scope.name);
            continent.table.merge(scope.table, std::string(kContinentRollupName) + "/" + scope.name);
        }
        continent.table.validate(kContinentRollupName);
        report.continent = std::move(continent);
    }

    if (!report.audit.unmapped_countries.empty()) {
        logger.warning(std::to_string(report.audit.unmapped_countries.size()) +
                       " countries are not assigned to any region");
    }
    if (!report.audit.missing_members.empty()) {
        logger.warning(std::to_string(report.audit.missing_members.size()) +
                       " region members have no data");
    }
    return report;
}

} // namespace popaccess
