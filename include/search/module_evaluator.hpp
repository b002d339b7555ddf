#pragma once

#include "scoring/significance_scorer.hpp"
#include "search/module.hpp"
#include <set>
#include <string>

namespace amod {

/**
 * @brief Options that shape the aggregate module score
 */
struct ScoringOptions {
    bool adjust_for_size = true;     // Divide the activity sum by sqrt(member count)
    bool regional_scoring = true;    // Only nodes within max_depth of the seed contribute
    int max_depth = 2;
};

/**
 * @brief Scores node sets and turns them into Module values
 *
 * Shared by the search engine (incremental scoring of moves) and the cluster
 * selector (rebuilding pruned modules), so both apply the same formula.
 */
class ModuleEvaluator {
public:
    ModuleEvaluator(const SignificanceScorer& scorer, const ScoringOptions& options);

    /**
     * @brief Seed plus every node within max_depth hops of it
     */
    std::set<std::string> region(const std::string& seed) const;

    /**
     * @brief Activity a node adds to a module sum
     *
     * Missing nodes contribute 0, as do nodes outside `region` when regional
     * scoring is enabled and a region is given.
     */
    double contribution(const std::string& node_id, const std::set<std::string>* region) const;

    /**
     * @brief Aggregate score from an activity sum and a member count
     */
    double combine(double activity_sum, size_t member_count) const;

    double aggregate_score(const std::set<std::string>& members,
                           const std::set<std::string>* region) const;

    /**
     * @brief Build a fully scored module
     * @throws StructuralError if the members are empty or not connected
     */
    Module build(const std::set<std::string>& members,
                 const std::string& seed,
                 int restart = 0) const;

    /**
     * @brief New module over `members` keeping the provenance of `base`
     */
    Module rebuild(const Module& base,
                   const std::set<std::string>& members,
                   size_t context_pruned) const;

    const SignificanceScorer& scorer() const { return scorer_; }
    const MetabolicNetwork& network() const { return scorer_.network(); }
    const ScoringOptions& options() const { return options_; }

private:
    const SignificanceScorer& scorer_;
    ScoringOptions options_;
};

} // namespace amod
