#pragma once

#include "scoring/significance_scorer.hpp"
#include "search/module_search_engine.hpp"
#include "selection/cluster_selector.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace amod {

// ============================================================================
// Analysis Configuration
// ============================================================================

/**
 * @brief All parameters of a scoring, search and selection pass
 *
 * JSON layout:
 * @code
 * {
 *   "scoring":   {"study_weights": {...}, "p_value_floor": 1e-300},
 *   "search":    {"target_module_count": 10, "overlap_thresholds": [0.25, 0.5, 0.75], ...},
 *   "selection": {"min_reactions": 1, "max_reactions": 3, ...}
 * }
 * @endcode
 */
struct AnalysisConfig {
    ScorerConfig scoring;
    SearchConfig search;
    SelectionConfig selection;

    nlohmann::json to_json() const;
    static AnalysisConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration from JSON file
     */
    static AnalysisConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overlaid with AMOD_THREADS and AMOD_RANDOM_SEED
     */
    static AnalysisConfig from_environment();

    /**
     * @brief Overlay environment variables onto this configuration
     * @throws ConfigurationError if a variable does not parse
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /**
     * @throws ConfigurationError naming the first invalid parameter
     */
    void require_valid() const;
};

} // namespace amod
