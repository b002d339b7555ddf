#include "selection/cluster_selector.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace amod {

// ==========================================
// SelectionConfig
// ==========================================

nlohmann::json SelectionConfig::to_json() const {
    nlohmann::json j;
    j["min_reactions"] = min_reactions;
    j["max_reactions"] = max_reactions;
    j["min_coverage"] = min_coverage;
    j["significance_cutoff"] = significance_cutoff;
    j["context_cutoff"] = context_cutoff;
    return j;
}

SelectionConfig SelectionConfig::from_json(const nlohmann::json& j) {
    SelectionConfig config;
    config.min_reactions = j.value("min_reactions", config.min_reactions);
    config.max_reactions = j.value("max_reactions", config.max_reactions);
    config.min_coverage = j.value("min_coverage", config.min_coverage);
    config.significance_cutoff = j.value("significance_cutoff", config.significance_cutoff);
    config.context_cutoff = j.value("context_cutoff", config.context_cutoff);
    return config;
}

bool SelectionConfig::validate(std::string& error_message) const {
    if (min_reactions < 0) {
        error_message = "min_reactions: must not be negative";
        return false;
    }

    if (max_reactions < min_reactions) {
        error_message = "max_reactions: must not be below min_reactions";
        return false;
    }

    if (!(min_coverage >= 0.0 && min_coverage <= 1.0)) {
        error_message = "min_coverage: must be between 0 and 1";
        return false;
    }

    if (!(significance_cutoff > 0.0 && significance_cutoff <= 1.0)) {
        error_message = "significance_cutoff: must be in (0, 1]";
        return false;
    }

    if (!(context_cutoff > 0.0 && context_cutoff <= 1.0)) {
        error_message = "context_cutoff: must be in (0, 1]";
        return false;
    }

    return true;
}

std::string selection_rule_to_string(SelectionRule rule) {
    switch (rule) {
        case SelectionRule::SIZE: return "size";
        case SelectionRule::COVERAGE: return "coverage";
        case SelectionRule::DIRECTIONALITY: return "directionality";
        case SelectionRule::SIGNIFICANCE: return "significance";
        default: return "unknown";
    }
}

nlohmann::json Rejection::to_json() const {
    return {
        {"module_id", module_id},
        {"rule", selection_rule_to_string(rule)},
        {"after_pruning", after_pruning},
        {"detail", detail}
    };
}

std::map<std::string, size_t> SelectionResult::rejection_counts() const {
    std::map<std::string, size_t> counts;
    for (const auto& r : rejected) {
        counts[selection_rule_to_string(r.rule)]++;
    }
    return counts;
}

nlohmann::json SelectionResult::summary_json() const {
    nlohmann::json rejected_json = nlohmann::json::array();
    for (const auto& r : rejected) {
        rejected_json.push_back(r.to_json());
    }
    return {
        {"num_candidates", num_candidates},
        {"num_selected", selected.size()},
        {"num_merged", num_merged},
        {"rejection_counts", rejection_counts()},
        {"rejected", rejected_json}
    };
}

// ==========================================
// ClusterSelector Implementation
// ==========================================

ClusterSelector::ClusterSelector(const ModuleEvaluator& evaluator, const SelectionConfig& config)
    : evaluator_(evaluator), config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw configuration_error(error);
    }
}

bool ClusterSelector::passes_size(const Module& module) const {
    auto reactions = static_cast<int>(module.num_reactions);
    return reactions >= config_.min_reactions && reactions <= config_.max_reactions;
}

bool ClusterSelector::passes_coverage(const Module& module) const {
    if (module.num_metabolites == 0) return false;
    return module.coverage >= config_.min_coverage;
}

bool ClusterSelector::passes_directionality(const Module& module) const {
    const auto& network = evaluator_.network();
    const auto& scorer = evaluator_.scorer();

    bool accumulation = false;
    bool depletion = false;
    for (const auto& id : module.node_ids) {
        if (!network.get_node(id).is_metabolite()) continue;

        const auto& s = scorer.score(id);
        if (s.missing) continue;
        if (s.fold_change > 0.0) accumulation = true;
        if (s.fold_change < 0.0) depletion = true;
    }
    return accumulation && depletion;
}

bool ClusterSelector::passes_significance(const Module& module) const {
    return module.combined_p_value < config_.significance_cutoff;
}

bool ClusterSelector::check_rules(const Module& module, SelectionRule& failed) const {
    if (!passes_size(module)) {
        failed = SelectionRule::SIZE;
        return false;
    }
    if (!passes_coverage(module)) {
        failed = SelectionRule::COVERAGE;
        return false;
    }
    if (!passes_directionality(module)) {
        failed = SelectionRule::DIRECTIONALITY;
        return false;
    }
    if (!passes_significance(module)) {
        failed = SelectionRule::SIGNIFICANCE;
        return false;
    }
    return true;
}

std::string ClusterSelector::describe_failure(const Module& module, SelectionRule rule) const {
    std::ostringstream ss;
    switch (rule) {
        case SelectionRule::SIZE:
            ss << module.num_reactions << " reactions, allowed "
               << config_.min_reactions << "-" << config_.max_reactions;
            break;
        case SelectionRule::COVERAGE:
            ss << "coverage " << module.coverage << " < " << config_.min_coverage;
            break;
        case SelectionRule::DIRECTIONALITY:
            ss << "needs both accumulated and depleted metabolites";
            break;
        case SelectionRule::SIGNIFICANCE:
            ss << "combined p " << module.combined_p_value
               << " >= " << config_.significance_cutoff;
            break;
    }
    return ss.str();
}

std::vector<std::string> ClusterSelector::context_candidates(const Module& module) const {
    const auto& network = evaluator_.network();
    const auto& scorer = evaluator_.scorer();

    struct Entry {
        std::string id;
        bool missing;
        double p_value;
    };
    std::vector<Entry> entries;

    for (const auto& id : module.node_ids) {
        if (!network.get_node(id).is_metabolite()) continue;

        const auto& s = scorer.score(id);
        if (!s.missing && s.p_value < config_.significance_cutoff) continue;  // Significant
        if (!s.missing && s.p_value < config_.context_cutoff) continue;       // Marginal, kept
        entries.push_back({id, s.missing, s.p_value});
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.missing != b.missing) return a.missing;
        if (!a.missing && a.p_value != b.p_value) return a.p_value > b.p_value;
        return a.id < b.id;
    });

    std::vector<std::string> ids;
    for (const auto& e : entries) {
        ids.push_back(e.id);
    }
    return ids;
}

Module ClusterSelector::prune_context(const Module& module) const {
    const auto& network = evaluator_.network();
    auto members = module.node_set();
    auto candidates = context_candidates(module);
    size_t pruned = 0;

    // A removal can turn a later candidate into a leaf, so repeat until stable
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& id : candidates) {
            if (!members.count(id) || members.size() <= 1) continue;

            auto cut_nodes = network.articulation_points(members);
            if (cut_nodes.count(id)) continue;

            members.erase(id);
            pruned++;
            changed = true;
        }
    }

    if (pruned == 0) {
        return module;
    }
    return evaluator_.rebuild(module, members, module.context_pruned + pruned);
}

SelectionResult ClusterSelector::select(const std::vector<Module>& candidates) const {
    SelectionResult result;
    result.num_candidates = candidates.size();

    std::map<std::vector<std::string>, size_t> selected_index;

    for (const auto& candidate : candidates) {
        SelectionRule failed = SelectionRule::SIZE;
        if (!check_rules(candidate, failed)) {
            result.rejected.push_back({candidate.module_id, failed, false,
                                       describe_failure(candidate, failed)});
            continue;
        }

        Module pruned = prune_context(candidate);
        if (!check_rules(pruned, failed)) {
            result.rejected.push_back({candidate.module_id, failed, true,
                                       describe_failure(pruned, failed)});
            continue;
        }

        auto it = selected_index.find(pruned.node_ids);
        if (it != selected_index.end()) {
            auto& kept = result.selected[it->second];
            if (Module::rank_before(pruned, kept)) {
                std::swap(kept, pruned);
            }
            for (double theta : pruned.overlap_thresholds) {
                if (std::find(kept.overlap_thresholds.begin(), kept.overlap_thresholds.end(),
                              theta) == kept.overlap_thresholds.end()) {
                    kept.overlap_thresholds.push_back(theta);
                }
            }
            std::sort(kept.overlap_thresholds.begin(), kept.overlap_thresholds.end());
            result.num_merged++;
            continue;
        }

        selected_index[pruned.node_ids] = result.selected.size();
        result.selected.push_back(std::move(pruned));
    }

    std::stable_sort(result.selected.begin(), result.selected.end(), Module::rank_before);
    return result;
}

} // namespace amod
