#pragma once

#include "search/module.hpp"
#include "search/module_evaluator.hpp"
#include "search/search_budget.hpp"
#include "scoring/significance_scorer.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace amod {

// Search configuration
struct SearchConfig {
    // Acceptance
    size_t target_module_count = 10;     // K: modules accepted per threshold run (5-25)
    std::vector<double> overlap_thresholds = {0.25, 0.5, 0.75};

    // Scoring
    int max_depth = 2;                   // D: hop bound for moves and regional scoring
    bool adjust_for_size = true;
    bool regional_scoring = true;

    // Restarts
    int restarts_per_seed = 0;           // Random restarts after the deterministic one
    uint64_t random_seed = 42;

    // Budget
    int max_iterations = 1000;           // Accepted moves per local search
    double budget_seconds = 60.0;        // Wall clock for the whole exploration
    int num_threads = 0;                 // 0 = OpenMP default

    ScoringOptions scoring_options() const {
        return ScoringOptions{adjust_for_size, regional_scoring, max_depth};
    }

    nlohmann::json to_json() const;
    static SearchConfig from_json(const nlohmann::json& j);

    bool validate(std::string& error_message) const;
};

// Which nodes start a local search
using SeedPredicate = std::function<bool(const NetworkNode&)>;

// Progress callback
using SearchProgressCallback = std::function<void(const std::string& stage, int current, int total)>;

/**
 * @brief A seed search that raised instead of returning a module
 */
struct SeedFailure {
    std::string seed;
    int restart = 0;
    std::string message;

    nlohmann::json to_json() const {
        return {{"seed", seed}, {"restart", restart}, {"message", message}};
    }
};

/**
 * @brief Locally optimal modules found from all seeds and restarts
 */
struct ExplorationResult {
    std::vector<Module> candidates;      // Deduplicated by node set, in rank order
    std::vector<SeedFailure> failures;
    size_t total_iterations = 0;
    bool iteration_cap_hit = false;      // Some local search stopped at max_iterations
    bool timed_out = false;
    bool cancelled = false;
    double elapsed_seconds = 0.0;

    bool cut_short() const { return iteration_cap_hit || timed_out || cancelled; }
};

/**
 * @brief Accepted modules of one overlap threshold
 */
struct ThresholdRun {
    double overlap_threshold = 0.0;
    std::vector<Module> modules;
    bool budget_exhausted = false;       // Fewer than K accepted, or exploration cut short

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of a threshold sweep
 */
struct SearchResult {
    std::vector<ThresholdRun> runs;
    std::vector<Module> pooled;          // Union over runs, deduplicated, in rank order
    std::vector<Module> candidates;      // Every locally optimal module explored
    std::vector<SeedFailure> failures;
    bool budget_exhausted = false;
    size_t num_seeds = 0;
    size_t total_iterations = 0;
    double elapsed_seconds = 0.0;

    nlohmann::json summary_json() const;
};

/**
 * @brief Depth-bounded, overlap-controlled search for high-scoring connected modules
 *
 * Exploration runs every (seed, restart) pair as an independent task over an
 * OpenMP worker pool. The scorer and network are only read. Candidates are
 * merged once, after all tasks finish. Greedy acceptance is sequential within
 * a threshold; the thresholds of a sweep are accepted in parallel.
 *
 * The progress callback is called from worker threads, one call at a time.
 * An exception it throws stops reporting and is rethrown by explore().
 */
class ModuleSearchEngine {
public:
    ModuleSearchEngine(const SignificanceScorer& scorer, const SearchConfig& config = {});
    virtual ~ModuleSearchEngine() = default;

    void set_progress_callback(SearchProgressCallback cb) { progress_cb_ = std::move(cb); }
    void set_seed_predicate(SeedPredicate predicate) { seed_predicate_ = std::move(predicate); }

    /**
     * @brief Use exactly these seeds instead of the predicate
     * @throws NotFoundError for an id that is not in the network
     */
    void set_seeds(const std::vector<std::string>& seeds);

    // Checked between iterations; set from another thread to stop early
    void set_cancel_flag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

    const SearchConfig& config() const { return config_; }

    /**
     * @brief Seeds in id order
     */
    std::vector<std::string> select_seeds() const;

    /**
     * @brief Run every seed and restart to a local optimum
     */
    ExplorationResult explore() const;

    /**
     * @brief Greedy acceptance in rank order under an overlap cap
     * @param candidates Modules in rank order
     */
    std::vector<Module> accept(const std::vector<Module>& candidates,
                               double overlap_threshold) const;

    /**
     * @brief Explore and accept under a single threshold
     */
    ThresholdRun run(double overlap_threshold) const;

    /**
     * @brief Explore once, accept under every configured threshold, pool the results
     */
    SearchResult run_sweep() const;

    /**
     * @brief Hill-climb from one seed
     * @param restart 0 for the deterministic climb, > 0 for a random restart
     */
    virtual Module search_from(const std::string& seed, size_t seed_index, int restart,
                               SearchBudget& budget) const;

    /**
     * @brief Generator seed of a restart, derived from (random_seed, seed index, restart)
     */
    static uint64_t restart_seed(uint64_t random_seed, size_t seed_index, int restart);

    static std::string format_module_id(double overlap_threshold, size_t rank);

private:
    const SignificanceScorer& scorer_;
    SearchConfig config_;
    ModuleEvaluator evaluator_;
    SeedPredicate seed_predicate_;
    std::vector<std::string> explicit_seeds_;
    SearchProgressCallback progress_cb_;
    const std::atomic<bool>* cancel_ = nullptr;

    struct Move {
        bool add = true;
        std::vector<std::string> nodes;  // Nodes added (target plus path) or the one removed
        double score = 0.0;
    };

    // Add and remove moves of a module, in id order
    std::vector<Move> enumerate_moves(const std::set<std::string>& members,
                                      const std::set<std::string>& region,
                                      double activity_sum) const;

    // Shortest paths from the module to every node within max_depth
    std::map<std::string, std::string> connecting_parents(
        const std::set<std::string>& members,
        const std::set<std::string>& region) const;

    // num_threads, or the OpenMP default when 0
    int worker_count() const;

    void report(const std::string& stage, int current, int total) const;
};

} // namespace amod
