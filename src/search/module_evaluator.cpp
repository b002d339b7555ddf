#include "search/module_evaluator.hpp"
#include "core/errors.hpp"
#include <cmath>

namespace amod {

ModuleEvaluator::ModuleEvaluator(const SignificanceScorer& scorer, const ScoringOptions& options)
    : scorer_(scorer), options_(options) {}

std::set<std::string> ModuleEvaluator::region(const std::string& seed) const {
    std::set<std::string> result;
    for (const auto& [id, distance] : network().hop_distances({seed}, options_.max_depth)) {
        result.insert(id);
    }
    return result;
}

double ModuleEvaluator::contribution(const std::string& node_id,
                                     const std::set<std::string>* region) const {
    if (options_.regional_scoring && region && !region->count(node_id)) {
        return 0.0;
    }
    const auto& s = scorer_.score(node_id);
    return s.missing ? 0.0 : s.activity;
}

double ModuleEvaluator::combine(double activity_sum, size_t member_count) const {
    if (member_count == 0) return 0.0;
    if (options_.adjust_for_size) {
        return activity_sum / std::sqrt(static_cast<double>(member_count));
    }
    return activity_sum;
}

double ModuleEvaluator::aggregate_score(const std::set<std::string>& members,
                                        const std::set<std::string>* region) const {
    double sum = 0.0;
    for (const auto& id : members) {
        sum += contribution(id, region);
    }
    return combine(sum, members.size());
}

Module ModuleEvaluator::build(const std::set<std::string>& members,
                              const std::string& seed,
                              int restart) const {
    if (members.empty()) {
        throw StructuralError(seed, "Module has no members");
    }
    if (!network().is_connected(members)) {
        throw StructuralError(seed, "Module is not connected");
    }

    Module m;
    m.seed = seed;
    m.restart = restart;
    m.node_ids.assign(members.begin(), members.end());
    m.links = network().induced_links(members);

    std::set<std::string> seed_region;
    const std::set<std::string>* region_ptr = nullptr;
    if (options_.regional_scoring && network().has_node(seed)) {
        seed_region = region(seed);
        region_ptr = &seed_region;
    }
    m.score = aggregate_score(members, region_ptr);

    double activity_sum = 0.0;
    size_t measured = 0;
    for (const auto& id : members) {
        const auto& node = network().get_node(id);
        const auto& s = scorer_.score(id);

        if (node.is_reaction()) {
            m.num_reactions++;
        } else {
            m.num_metabolites++;
            if (!s.missing) m.num_measured_metabolites++;
        }

        if (!s.missing) {
            activity_sum += s.activity;
            measured++;
        }
    }

    if (measured > 0) {
        m.combined_z = activity_sum / std::sqrt(static_cast<double>(measured));
        m.combined_p_value = 1.0 - SignificanceScorer::normal_cdf(m.combined_z);
    } else {
        m.combined_z = 0.0;
        m.combined_p_value = 1.0;
    }

    if (m.num_metabolites > 0) {
        m.coverage = static_cast<double>(m.num_measured_metabolites) /
                     static_cast<double>(m.num_metabolites);
    }

    return m;
}

Module ModuleEvaluator::rebuild(const Module& base,
                                const std::set<std::string>& members,
                                size_t context_pruned) const {
    Module m = build(members, base.seed, base.restart);
    m.module_id = base.module_id;
    m.overlap_thresholds = base.overlap_thresholds;
    m.context_pruned = context_pruned;
    return m;
}

} // namespace amod
