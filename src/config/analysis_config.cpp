#include "config/analysis_config.hpp"
#include "core/errors.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace amod {

using json = nlohmann::json;

// ============================================================================
// AnalysisConfig
// ============================================================================

json AnalysisConfig::to_json() const {
    json j;
    j["scoring"] = scoring.to_json();
    j["search"] = search.to_json();
    j["selection"] = selection.to_json();
    return j;
}

AnalysisConfig AnalysisConfig::from_json(const json& j) {
    AnalysisConfig config;

    try {
        if (j.contains("scoring")) config.scoring = ScorerConfig::from_json(j["scoring"]);
        if (j.contains("search")) config.search = SearchConfig::from_json(j["search"]);
        if (j.contains("selection")) config.selection = SelectionConfig::from_json(j["selection"]);
    } catch (const json::type_error& e) {
        throw ConfigurationError("config", std::string("wrong value type: ") + e.what());
    }

    return config;
}

AnalysisConfig AnalysisConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("config", "cannot parse " + path + ": " + e.what());
    }

    return from_json(j);
}

void AnalysisConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

AnalysisConfig AnalysisConfig::from_environment() {
    AnalysisConfig config;
    config.apply_environment();
    return config;
}

void AnalysisConfig::apply_environment() {
    const char* threads = std::getenv("AMOD_THREADS");
    if (threads) {
        try {
            search.num_threads = std::stoi(threads);
        } catch (const std::exception&) {
            throw ConfigurationError("AMOD_THREADS", std::string("not an integer: ") + threads);
        }
    }

    const char* seed = std::getenv("AMOD_RANDOM_SEED");
    if (seed) {
        try {
            search.random_seed = std::stoull(seed);
        } catch (const std::exception&) {
            throw ConfigurationError("AMOD_RANDOM_SEED", std::string("not an integer: ") + seed);
        }
    }
}

bool AnalysisConfig::validate(std::string& error_message) const {
    std::string section_error;

    if (!scoring.validate(section_error)) {
        error_message = "scoring." + section_error;
        return false;
    }

    if (!search.validate(section_error)) {
        error_message = "search." + section_error;
        return false;
    }

    if (!selection.validate(section_error)) {
        error_message = "selection." + section_error;
        return false;
    }

    return true;
}

void AnalysisConfig::require_valid() const {
    std::string error;
    if (!validate(error)) {
        throw configuration_error(error);
    }
}

} // namespace amod
