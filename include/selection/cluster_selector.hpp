#pragma once

#include "search/module.hpp"
#include "search/module_evaluator.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace amod {

/**
 * @brief Rules applied to pooled candidate modules
 */
struct SelectionConfig {
    int min_reactions = 1;               // Inclusive bounds on reaction nodes
    int max_reactions = 3;
    double min_coverage = 0.5;           // Measured metabolites / metabolites
    double significance_cutoff = 0.05;   // Module combined p and per-node significance
    double context_cutoff = 0.25;        // Per-node p that keeps a non-significant metabolite

    nlohmann::json to_json() const;
    static SelectionConfig from_json(const nlohmann::json& j);

    bool validate(std::string& error_message) const;
};

// Required rules, in the order they are checked
enum class SelectionRule {
    SIZE,
    COVERAGE,
    DIRECTIONALITY,
    SIGNIFICANCE
};

std::string selection_rule_to_string(SelectionRule rule);

/**
 * @brief Why a candidate did not make it into the selection
 */
struct Rejection {
    std::string module_id;
    SelectionRule rule = SelectionRule::SIZE;
    bool after_pruning = false;          // Failed on the pruned module
    std::string detail;

    nlohmann::json to_json() const;
};

struct SelectionResult {
    std::vector<Module> selected;        // Ranked: score desc, p asc, node ids
    std::vector<Rejection> rejected;
    size_t num_candidates = 0;
    size_t num_merged = 0;               // Candidates that pruned down to an already selected node set

    std::map<std::string, size_t> rejection_counts() const;

    nlohmann::json summary_json() const;
};

/**
 * @brief Filters and ranks candidate modules
 *
 * A candidate must pass the size, coverage, directionality and significance
 * rules. Survivors are context-pruned: a metabolite that is unmeasured or not
 * significant stays only if it holds the module together or its own p-value
 * is below the context cutoff. The pruned module is a new value and must pass
 * the required rules again.
 */
class ClusterSelector {
public:
    ClusterSelector(const ModuleEvaluator& evaluator, const SelectionConfig& config = {});

    const SelectionConfig& config() const { return config_; }

    // ==========================================
    // Required rules
    // ==========================================

    bool passes_size(const Module& module) const;
    bool passes_coverage(const Module& module) const;
    bool passes_directionality(const Module& module) const;
    bool passes_significance(const Module& module) const;

    /**
     * @brief Check all required rules in order
     * @param failed Set to the first failing rule
     * @return true when every rule passes
     */
    bool check_rules(const Module& module, SelectionRule& failed) const;

    // ==========================================
    // Context inclusion
    // ==========================================

    /**
     * @brief Metabolites eligible for pruning, in pruning order
     *
     * Missing nodes first, then by descending p-value, then by id.
     */
    std::vector<std::string> context_candidates(const Module& module) const;

    /**
     * @brief Module with every prunable, structurally unnecessary context node removed
     */
    Module prune_context(const Module& module) const;

    SelectionResult select(const std::vector<Module>& candidates) const;

private:
    const ModuleEvaluator& evaluator_;
    SelectionConfig config_;

    std::string describe_failure(const Module& module, SelectionRule rule) const;
};

} // namespace amod
