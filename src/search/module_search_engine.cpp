#include "search/module_search_engine.hpp"
#include "core/errors.hpp"
#include <omp.h>
#include <algorithm>
#include <cmath>
#include <deque>
#include <exception>
#include <iomanip>
#include <sstream>

namespace amod {

namespace {

// Smallest score gain that counts as an improvement
constexpr double kMinGain = 1e-12;

} // namespace

// ==========================================
// SearchConfig
// ==========================================

nlohmann::json SearchConfig::to_json() const {
    nlohmann::json j;
    j["target_module_count"] = target_module_count;
    j["overlap_thresholds"] = overlap_thresholds;
    j["max_depth"] = max_depth;
    j["adjust_for_size"] = adjust_for_size;
    j["regional_scoring"] = regional_scoring;
    j["restarts_per_seed"] = restarts_per_seed;
    j["random_seed"] = random_seed;
    j["max_iterations"] = max_iterations;
    j["budget_seconds"] = budget_seconds;
    j["num_threads"] = num_threads;
    return j;
}

SearchConfig SearchConfig::from_json(const nlohmann::json& j) {
    SearchConfig config;
    config.target_module_count = j.value("target_module_count", config.target_module_count);
    config.overlap_thresholds = j.value("overlap_thresholds", config.overlap_thresholds);
    config.max_depth = j.value("max_depth", config.max_depth);
    config.adjust_for_size = j.value("adjust_for_size", config.adjust_for_size);
    config.regional_scoring = j.value("regional_scoring", config.regional_scoring);
    config.restarts_per_seed = j.value("restarts_per_seed", config.restarts_per_seed);
    config.random_seed = j.value("random_seed", config.random_seed);
    config.max_iterations = j.value("max_iterations", config.max_iterations);
    config.budget_seconds = j.value("budget_seconds", config.budget_seconds);
    config.num_threads = j.value("num_threads", config.num_threads);
    return config;
}

bool SearchConfig::validate(std::string& error_message) const {
    if (target_module_count < 5 || target_module_count > 25) {
        error_message = "target_module_count: must be between 5 and 25";
        return false;
    }

    if (overlap_thresholds.empty()) {
        error_message = "overlap_thresholds: at least one threshold is required";
        return false;
    }

    for (double theta : overlap_thresholds) {
        if (!(theta >= 0.0 && theta <= 1.0)) {
            error_message = "overlap_thresholds: every threshold must be between 0 and 1";
            return false;
        }
    }

    if (max_depth < 1 || max_depth > 6) {
        error_message = "max_depth: must be between 1 and 6";
        return false;
    }

    if (restarts_per_seed < 0) {
        error_message = "restarts_per_seed: must not be negative";
        return false;
    }

    if (max_iterations < 1) {
        error_message = "max_iterations: must be at least 1";
        return false;
    }

    if (!(budget_seconds > 0.0)) {
        error_message = "budget_seconds: must be positive";
        return false;
    }

    if (num_threads < 0) {
        error_message = "num_threads: must not be negative";
        return false;
    }

    return true;
}

// ==========================================
// Results
// ==========================================

nlohmann::json ThresholdRun::to_json() const {
    nlohmann::json ids = nlohmann::json::array();
    for (const auto& m : modules) {
        ids.push_back(m.module_id);
    }
    return {
        {"overlap_threshold", overlap_threshold},
        {"num_modules", modules.size()},
        {"budget_exhausted", budget_exhausted},
        {"module_ids", ids}
    };
}

nlohmann::json SearchResult::summary_json() const {
    nlohmann::json j;
    nlohmann::json runs_json = nlohmann::json::array();
    for (const auto& run : runs) {
        runs_json.push_back(run.to_json());
    }
    j["runs"] = runs_json;

    nlohmann::json failures_json = nlohmann::json::array();
    for (const auto& f : failures) {
        failures_json.push_back(f.to_json());
    }
    j["failures"] = failures_json;

    j["num_seeds"] = num_seeds;
    j["num_candidates"] = candidates.size();
    j["num_pooled"] = pooled.size();
    j["total_iterations"] = total_iterations;
    j["budget_exhausted"] = budget_exhausted;
    return j;
}

// ==========================================
// ModuleSearchEngine Implementation
// ==========================================

ModuleSearchEngine::ModuleSearchEngine(const SignificanceScorer& scorer, const SearchConfig& config)
    : scorer_(scorer),
      config_(config),
      evaluator_(scorer, config.scoring_options()),
      seed_predicate_([](const NetworkNode& node) { return node.is_metabolite(); }) {
    std::string error;
    if (!config_.validate(error)) {
        throw configuration_error(error);
    }
}

void ModuleSearchEngine::set_seeds(const std::vector<std::string>& seeds) {
    std::set<std::string> unique;
    for (const auto& id : seeds) {
        if (!scorer_.network().has_node(id)) {
            throw NotFoundError(id);
        }
        unique.insert(id);
    }
    explicit_seeds_.assign(unique.begin(), unique.end());
}

std::vector<std::string> ModuleSearchEngine::select_seeds() const {
    if (!explicit_seeds_.empty()) {
        return explicit_seeds_;
    }

    std::vector<std::string> seeds;
    const auto& network = scorer_.network();
    for (const auto& id : network.node_ids()) {
        if (seed_predicate_(network.get_node(id))) {
            seeds.push_back(id);
        }
    }
    return seeds;
}

int ModuleSearchEngine::worker_count() const {
    return config_.num_threads > 0 ? config_.num_threads : omp_get_max_threads();
}

void ModuleSearchEngine::report(const std::string& stage, int current, int total) const {
    if (progress_cb_) {
        progress_cb_(stage, current, total);
    }
}

uint64_t ModuleSearchEngine::restart_seed(uint64_t random_seed, size_t seed_index, int restart) {
    // splitmix64 over the three inputs
    auto mix = [](uint64_t x) {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    };
    uint64_t h = mix(random_seed);
    h = mix(h ^ static_cast<uint64_t>(seed_index));
    h = mix(h ^ static_cast<uint64_t>(restart));
    return h;
}

std::string ModuleSearchEngine::format_module_id(double overlap_threshold, size_t rank) {
    std::ostringstream ss;
    ss << "t" << std::fixed << std::setprecision(2) << overlap_threshold
       << ":" << std::setw(4) << std::setfill('0') << rank;
    return ss.str();
}

std::map<std::string, std::string> ModuleSearchEngine::connecting_parents(
    const std::set<std::string>& members,
    const std::set<std::string>& region) const {

    const auto& network = scorer_.network();
    std::map<std::string, std::string> parent;
    std::map<std::string, int> depth;
    std::deque<std::string> queue;

    for (const auto& id : members) {
        depth[id] = 0;
        queue.push_back(id);
    }

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();

        int d = depth[current];
        if (d >= config_.max_depth) continue;

        for (const auto& next : network.neighbors(current)) {
            if (depth.count(next)) continue;
            if (config_.regional_scoring && !region.count(next)) continue;

            depth[next] = d + 1;
            parent[next] = current;
            queue.push_back(next);
        }
    }

    return parent;
}

std::vector<ModuleSearchEngine::Move> ModuleSearchEngine::enumerate_moves(
    const std::set<std::string>& members,
    const std::set<std::string>& region,
    double activity_sum) const {

    const std::set<std::string>* region_ptr = config_.regional_scoring ? &region : nullptr;
    std::vector<Move> moves;

    // Add a target together with its path back to the module
    auto parents = connecting_parents(members, region);
    for (const auto& [target, first_parent] : parents) {
        Move move;
        move.add = true;

        double sum = activity_sum;
        std::string node = target;
        while (!members.count(node)) {
            move.nodes.push_back(node);
            sum += evaluator_.contribution(node, region_ptr);
            node = parents.at(node);
        }

        move.score = evaluator_.combine(sum, members.size() + move.nodes.size());
        moves.push_back(std::move(move));
    }

    // Remove a member that does not disconnect the rest
    if (members.size() > 1) {
        auto cut_nodes = scorer_.network().articulation_points(members);
        for (const auto& id : members) {
            if (cut_nodes.count(id)) continue;

            Move move;
            move.add = false;
            move.nodes.push_back(id);
            double sum = activity_sum - evaluator_.contribution(id, region_ptr);
            move.score = evaluator_.combine(sum, members.size() - 1);
            moves.push_back(std::move(move));
        }
    }

    return moves;
}

Module ModuleSearchEngine::search_from(const std::string& seed, size_t seed_index, int restart,
                                       SearchBudget& budget) const {
    std::set<std::string> region = evaluator_.region(seed);
    const std::set<std::string>* region_ptr = config_.regional_scoring ? &region : nullptr;

    std::mt19937_64 rng(restart_seed(config_.random_seed, seed_index, restart));

    std::string start = seed;
    if (restart > 0) {
        std::vector<std::string> region_nodes(region.begin(), region.end());
        std::uniform_int_distribution<size_t> pick(0, region_nodes.size() - 1);
        start = region_nodes[pick(rng)];
    }

    std::set<std::string> members = {start};
    double activity_sum = evaluator_.contribution(start, region_ptr);

    while (budget.check()) {
        double current = evaluator_.combine(activity_sum, members.size());
        auto moves = enumerate_moves(members, region, activity_sum);

        const Move* chosen = nullptr;
        if (restart == 0) {
            // Best improvement, first in id order on ties
            for (const auto& move : moves) {
                if (move.score > current + kMinGain &&
                    (!chosen || move.score > chosen->score)) {
                    chosen = &move;
                }
            }
        } else {
            // First improvement over a shuffled order
            std::shuffle(moves.begin(), moves.end(), rng);
            for (const auto& move : moves) {
                if (move.score > current + kMinGain) {
                    chosen = &move;
                    break;
                }
            }
        }

        if (!chosen) break;

        for (const auto& id : chosen->nodes) {
            if (chosen->add) {
                members.insert(id);
                activity_sum += evaluator_.contribution(id, region_ptr);
            } else {
                members.erase(id);
                activity_sum -= evaluator_.contribution(id, region_ptr);
            }
        }
        budget.record_iteration();
    }

    return evaluator_.build(members, seed, restart);
}

ExplorationResult ModuleSearchEngine::explore() const {
    ExplorationResult result;

    auto seeds = select_seeds();
    const size_t runs_per_seed = static_cast<size_t>(config_.restarts_per_seed) + 1;
    const size_t num_tasks = seeds.size() * runs_per_seed;

    SearchBudget master(config_.budget_seconds, config_.max_iterations);
    master.set_cancel_flag(cancel_);
    master.start();

    // Per-task slots keep the merge independent of scheduling
    std::vector<Module> modules(num_tasks);
    std::vector<char> produced(num_tasks, 0);
    std::vector<char> failed(num_tasks, 0);
    std::vector<std::string> messages(num_tasks);
    std::vector<int> iterations(num_tasks, 0);
    std::vector<char> stopped(num_tasks, 0);
    std::vector<char> capped(num_tasks, 0);

    int completed = 0;
    std::exception_ptr progress_error;
    report("explore", 0, static_cast<int>(num_tasks));

    #pragma omp parallel for schedule(dynamic) num_threads(worker_count())
    for (long long t = 0; t < static_cast<long long>(num_tasks); ++t) {
        size_t task = static_cast<size_t>(t);
        size_t seed_index = task / runs_per_seed;
        int restart = static_cast<int>(task % runs_per_seed);

        SearchBudget budget = master.fork();
        if (!budget.check()) {
            stopped[task] = 1;
        } else {
            try {
                modules[task] = search_from(seeds[seed_index], seed_index, restart, budget);
                produced[task] = 1;
            } catch (const std::exception& e) {
                failed[task] = 1;
                messages[task] = e.what();
            }
            iterations[task] = budget.iterations();
            stopped[task] = budget.exhausted() ? 1 : 0;
            capped[task] = budget.exhausted() && budget.is_iteration_exhausted() ? 1 : 0;
        }

        #pragma omp critical
        {
            completed++;
            // An exception may not leave the parallel region; rethrown below
            if (!progress_error) {
                try {
                    report("explore", completed, static_cast<int>(num_tasks));
                } catch (...) {
                    progress_error = std::current_exception();
                }
            }
        }
    }

    if (progress_error) {
        std::rethrow_exception(progress_error);
    }

    std::vector<Module> found;
    for (size_t task = 0; task < num_tasks; ++task) {
        result.total_iterations += static_cast<size_t>(iterations[task]);
        if (capped[task]) {
            result.iteration_cap_hit = true;
        } else if (stopped[task]) {
            if (master.is_cancelled()) {
                result.cancelled = true;
            } else {
                result.timed_out = true;
            }
        }

        if (failed[task]) {
            result.failures.push_back(SeedFailure{seeds[task / runs_per_seed],
                                                  static_cast<int>(task % runs_per_seed),
                                                  messages[task]});
        }
        if (produced[task]) {
            found.push_back(std::move(modules[task]));
        }
    }

    std::stable_sort(found.begin(), found.end(), Module::rank_before);

    std::set<std::vector<std::string>> seen;
    for (auto& m : found) {
        if (!seen.insert(m.node_ids).second) continue;
        result.candidates.push_back(std::move(m));
    }

    for (size_t i = 0; i < result.candidates.size(); ++i) {
        std::ostringstream id;
        id << "c" << std::setw(4) << std::setfill('0') << (i + 1);
        result.candidates[i].module_id = id.str();
    }

    result.elapsed_seconds = master.elapsed_seconds();
    return result;
}

std::vector<Module> ModuleSearchEngine::accept(const std::vector<Module>& candidates,
                                               double overlap_threshold) const {
    std::vector<Module> accepted;

    for (const auto& candidate : candidates) {
        if (accepted.size() >= config_.target_module_count) break;

        bool overlaps = false;
        for (const auto& other : accepted) {
            if (Module::overlap_ratio(candidate, other) > overlap_threshold) {
                overlaps = true;
                break;
            }
        }
        if (overlaps) continue;

        Module m = candidate;
        m.module_id = format_module_id(overlap_threshold, accepted.size() + 1);
        m.overlap_thresholds = {overlap_threshold};
        accepted.push_back(std::move(m));
    }

    return accepted;
}

ThresholdRun ModuleSearchEngine::run(double overlap_threshold) const {
    if (!(overlap_threshold >= 0.0 && overlap_threshold <= 1.0)) {
        throw ConfigurationError("overlap_threshold", "must be between 0 and 1");
    }

    auto exploration = explore();

    ThresholdRun run;
    run.overlap_threshold = overlap_threshold;
    run.modules = accept(exploration.candidates, overlap_threshold);
    run.budget_exhausted = run.modules.size() < config_.target_module_count ||
                           exploration.cut_short();
    return run;
}

SearchResult ModuleSearchEngine::run_sweep() const {
    SearchResult result;
    result.num_seeds = select_seeds().size();

    auto exploration = explore();
    result.total_iterations = exploration.total_iterations;
    result.elapsed_seconds = exploration.elapsed_seconds;
    result.failures = exploration.failures;
    result.budget_exhausted = exploration.cut_short();

    // Acceptance runs are independent given the shared candidate list
    const auto& thresholds = config_.overlap_thresholds;
    const int total = static_cast<int>(thresholds.size());
    std::vector<ThresholdRun> runs(thresholds.size());

    #pragma omp parallel for schedule(dynamic) num_threads(worker_count())
    for (int i = 0; i < total; ++i) {
        ThresholdRun& run = runs[static_cast<size_t>(i)];
        run.overlap_threshold = thresholds[static_cast<size_t>(i)];
        run.modules = accept(exploration.candidates, run.overlap_threshold);
        run.budget_exhausted = run.modules.size() < config_.target_module_count ||
                               exploration.cut_short();
    }

    // Pool in configuration order
    std::map<std::vector<std::string>, size_t> pooled_index;
    int step = 0;

    for (auto& run : runs) {
        if (run.budget_exhausted) {
            result.budget_exhausted = true;
        }

        for (const auto& m : run.modules) {
            auto it = pooled_index.find(m.node_ids);
            if (it == pooled_index.end()) {
                pooled_index[m.node_ids] = result.pooled.size();
                result.pooled.push_back(m);
            } else {
                auto& accepted_at = result.pooled[it->second].overlap_thresholds;
                if (std::find(accepted_at.begin(), accepted_at.end(), run.overlap_threshold) ==
                    accepted_at.end()) {
                    accepted_at.push_back(run.overlap_threshold);
                }
            }
        }

        result.runs.push_back(std::move(run));
        report("accept", ++step, total);
    }

    std::stable_sort(result.pooled.begin(), result.pooled.end(), Module::rank_before);
    result.candidates = std::move(exploration.candidates);
    return result;
}

} // namespace amod
