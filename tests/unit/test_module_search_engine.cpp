#include <gtest/gtest.h>
#include "search/module_search_engine.hpp"
#include "core/errors.hpp"
#include <omp.h>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <iomanip>
#include <sstream>

using namespace amod;

namespace {

NetworkNode make_node(const std::string& id, NodeType type) {
    NetworkNode n;
    n.id = id;
    n.type = type;
    return n;
}

std::string padded(const std::string& prefix, int i) {
    std::ostringstream ss;
    ss << prefix << std::setw(2) << std::setfill('0') << i;
    return ss.str();
}

Module module_of(const std::vector<std::string>& ids, double score) {
    Module m;
    m.node_ids = ids;
    std::sort(m.node_ids.begin(), m.node_ids.end());
    m.score = score;
    return m;
}

// Engine whose local search fails for one seed
class FailingSeedEngine : public ModuleSearchEngine {
public:
    FailingSeedEngine(const SignificanceScorer& scorer, const SearchConfig& config,
                      const std::string& failing_seed)
        : ModuleSearchEngine(scorer, config), failing_seed_(failing_seed) {}

    Module search_from(const std::string& seed, size_t seed_index, int restart,
                       SearchBudget& budget) const override {
        if (seed == failing_seed_) {
            throw std::runtime_error("scoring table unavailable for " + seed);
        }
        return ModuleSearchEngine::search_from(seed, seed_index, restart, budget);
    }

private:
    std::string failing_seed_;
};

} // namespace

// Five metabolites around two reactions:
//   M1, M2, M3 -- R1 ;  M3, M4, M5 -- R2
class ToyNetworkSearchTest : public ::testing::Test {
protected:
    MetabolicNetwork network;
    MeasurementTable measurements;

    void SetUp() override {
        network = MetabolicNetwork(
            {make_node("M1", NodeType::METABOLITE), make_node("M2", NodeType::METABOLITE),
             make_node("M3", NodeType::METABOLITE), make_node("M4", NodeType::METABOLITE),
             make_node("M5", NodeType::METABOLITE), make_node("R1", NodeType::REACTION),
             make_node("R2", NodeType::REACTION)},
            {{"M1", "R1"}, {"M2", "R1"}, {"M3", "R1"},
             {"M3", "R2"}, {"M4", "R2"}, {"M5", "R2"}});

        measurements.add("M1", "s1", 1.5, 0.01);
        measurements.add("M2", "s1", -1.2, 0.02);
        measurements.add("M3", "s1", 0.1, 0.5);
        measurements.add("M4", "s1", -0.05, 0.9);
        measurements.add("M5", "s1", 2.0, 0.03);
    }

    SearchConfig config_with_depth(int depth) {
        SearchConfig config;
        config.target_module_count = 5;
        config.max_depth = depth;
        return config;
    }
};

// Chain M00 - R00 - M01 - R01 - ... - M19 with mixed significance
class ChainNetworkSearchTest : public ::testing::Test {
protected:
    MetabolicNetwork network;
    MeasurementTable measurements;

    void SetUp() override {
        std::vector<NetworkNode> nodes;
        std::vector<NetworkLink> links;
        for (int i = 0; i < 20; ++i) {
            nodes.push_back(make_node(padded("M", i), NodeType::METABOLITE));
        }
        for (int i = 0; i < 19; ++i) {
            nodes.push_back(make_node(padded("R", i), NodeType::REACTION));
            links.emplace_back(padded("M", i), padded("R", i));
            links.emplace_back(padded("R", i), padded("M", i + 1));
        }
        network = MetabolicNetwork(nodes, links);

        const double p_values[] = {0.001, 0.03, 0.4, 0.8};
        for (int i = 0; i < 20; ++i) {
            double sign = (i % 2 == 0) ? 1.0 : -1.0;
            measurements.add(padded("M", i), "s1", sign * (1.0 + 0.1 * i), p_values[i % 4]);
            if (i % 3 == 0) {
                measurements.add(padded("M", i), "s2", sign * 0.5, 0.2);
            }
        }
    }

    SearchConfig sweep_config() {
        SearchConfig config;
        config.target_module_count = 5;
        config.overlap_thresholds = {0.25, 0.5, 0.75};
        config.max_depth = 2;
        config.restarts_per_seed = 2;
        config.random_seed = 7;
        return config;
    }
};

// ==========================================
// Local Search Tests
// ==========================================

TEST_F(ToyNetworkSearchTest, ClimbsToSignificantNeighbor) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(2));

    SearchBudget budget(60.0, 1000);
    budget.start();
    Module m = engine.search_from("M1", 0, 0, budget);

    EXPECT_EQ(m.node_ids, (std::vector<std::string>{"M1", "M2", "R1"}));
    EXPECT_EQ(m.seed, "M1");
    EXPECT_EQ(m.num_reactions, 1);
    EXPECT_EQ(m.num_metabolites, 2);
    EXPECT_EQ(budget.iterations(), 1);
}

TEST_F(ToyNetworkSearchTest, DeeperSearchReachesDistantMetabolite) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(4));

    SearchBudget budget(60.0, 1000);
    budget.start();
    Module m = engine.search_from("M1", 0, 0, budget);

    // M3 is kept as the connecting path to M5
    EXPECT_EQ(m.node_ids, (std::vector<std::string>{"M1", "M2", "M3", "M5", "R1", "R2"}));
    EXPECT_EQ(m.links.size(), 5);
    EXPECT_DOUBLE_EQ(m.coverage, 1.0);
    EXPECT_LT(m.combined_p_value, 0.05);
}

TEST_F(ToyNetworkSearchTest, RegionalScoringIgnoresFarNodes) {
    SignificanceScorer scorer(network, measurements);
    ModuleEvaluator regional(scorer, ScoringOptions{true, true, 2});
    ModuleEvaluator global(scorer, ScoringOptions{true, false, 2});

    std::set<std::string> members = {"M1", "R1", "M3", "R2", "M5"};
    Module a = regional.build(members, "M1");
    Module b = global.build(members, "M1");

    // M5 is three hops from M1 and only counts without regional scoring
    EXPECT_LT(a.score, b.score);
    EXPECT_DOUBLE_EQ(a.combined_p_value, b.combined_p_value);
}

TEST_F(ToyNetworkSearchTest, EvaluatorRejectsDisconnectedSet) {
    SignificanceScorer scorer(network, measurements);
    ModuleEvaluator evaluator(scorer, ScoringOptions{});
    EXPECT_THROW(evaluator.build({"M1", "M2"}, "M1"), StructuralError);
    EXPECT_THROW(evaluator.build({}, "M1"), StructuralError);
}

TEST_F(ToyNetworkSearchTest, IterationCapStopsSearch) {
    SignificanceScorer scorer(network, measurements);
    auto config = config_with_depth(4);
    config.max_iterations = 1;
    ModuleSearchEngine engine(scorer, config);
    engine.set_seeds({"M1"});

    auto exploration = engine.explore();
    EXPECT_TRUE(exploration.iteration_cap_hit);
    EXPECT_TRUE(exploration.cut_short());
    ASSERT_EQ(exploration.candidates.size(), 1);
    EXPECT_EQ(exploration.candidates[0].size(), 3);
}

// ==========================================
// Seed Selection Tests
// ==========================================

TEST_F(ToyNetworkSearchTest, DefaultSeedsAreMetabolites) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(2));
    EXPECT_EQ(engine.select_seeds(),
              (std::vector<std::string>{"M1", "M2", "M3", "M4", "M5"}));
}

TEST_F(ToyNetworkSearchTest, SeedPredicate) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(2));
    engine.set_seed_predicate([&scorer](const NetworkNode& node) {
        const auto& s = scorer.score(node.id);
        return !s.missing && s.p_value < 0.05;
    });
    EXPECT_EQ(engine.select_seeds(), (std::vector<std::string>{"M1", "M2", "M5"}));
}

TEST_F(ToyNetworkSearchTest, ExplicitSeedsMustExist) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(2));
    EXPECT_THROW(engine.set_seeds({"M1", "NOPE"}), NotFoundError);

    engine.set_seeds({"M5", "M1", "M5"});
    EXPECT_EQ(engine.select_seeds(), (std::vector<std::string>{"M1", "M5"}));
}

// ==========================================
// Budget Tests
// ==========================================

TEST_F(ToyNetworkSearchTest, FewerThanTargetIsFlagged) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(2));
    engine.set_seeds({"M1"});

    auto run = engine.run(0.5);
    EXPECT_EQ(run.modules.size(), 1);
    EXPECT_TRUE(run.budget_exhausted);
}

TEST_F(ToyNetworkSearchTest, CancellationReturnsPartialResult) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(2));
    std::atomic<bool> cancel(true);
    engine.set_cancel_flag(&cancel);

    auto result = engine.run_sweep();
    EXPECT_TRUE(result.candidates.empty());
    EXPECT_TRUE(result.budget_exhausted);
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(ToyNetworkSearchTest, FailingSeedIsRecordedAndOthersContinue) {
    SignificanceScorer scorer(network, measurements);
    auto config = config_with_depth(2);
    config.restarts_per_seed = 1;
    config.num_threads = 2;
    FailingSeedEngine engine(scorer, config, "M3");

    auto result = engine.explore();
    ASSERT_EQ(result.failures.size(), 2);
    EXPECT_EQ(result.failures[0].seed, "M3");
    EXPECT_EQ(result.failures[0].restart, 0);
    EXPECT_EQ(result.failures[1].restart, 1);
    EXPECT_NE(result.failures[0].message.find("M3"), std::string::npos);

    // Every other seed still produced its module
    EXPECT_FALSE(result.candidates.empty());
    auto sweep = engine.run_sweep();
    EXPECT_EQ(sweep.failures.size(), 2);
    EXPECT_FALSE(sweep.pooled.empty());
    EXPECT_EQ(sweep.summary_json()["failures"].size(), 2);
}

TEST_F(ToyNetworkSearchTest, ThrowingProgressCallbackPropagates) {
    SignificanceScorer scorer(network, measurements);
    auto config = config_with_depth(2);
    config.num_threads = 2;
    ModuleSearchEngine engine(scorer, config);

    int calls = 0;
    engine.set_progress_callback([&calls](const std::string& stage, int current, int) {
        if (stage == "explore" && current > 0) {
            calls++;
            throw std::runtime_error("display closed");
        }
    });

    EXPECT_THROW(engine.explore(), std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST_F(ToyNetworkSearchTest, ThreadCountDoesNotLeakIntoOpenMP) {
    SignificanceScorer scorer(network, measurements);
    auto config = config_with_depth(2);
    config.num_threads = 1;
    ModuleSearchEngine engine(scorer, config);

    int before = omp_get_max_threads();
    engine.run_sweep();
    EXPECT_EQ(omp_get_max_threads(), before);
}

// ==========================================
// Acceptance Tests
// ==========================================

TEST_F(ToyNetworkSearchTest, GreedyAcceptanceHonorsOverlap) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, config_with_depth(2));

    std::vector<Module> candidates = {
        module_of({"a", "b", "c", "d"}, 3.0),
        module_of({"c", "d", "e", "f"}, 2.0),  // Overlap 0.5 with the first
        module_of({"x"}, 1.0)
    };

    auto loose = engine.accept(candidates, 0.5);
    ASSERT_EQ(loose.size(), 3);
    EXPECT_EQ(loose[0].module_id, "t0.50:0001");
    EXPECT_EQ(loose[1].overlap_thresholds, (std::vector<double>{0.5}));

    auto strict = engine.accept(candidates, 0.25);
    ASSERT_EQ(strict.size(), 2);
    EXPECT_EQ(strict[1].node_ids, (std::vector<std::string>{"x"}));
}

TEST(ModuleSearchEngineStatic, ModuleIdFormat) {
    EXPECT_EQ(ModuleSearchEngine::format_module_id(0.5, 3), "t0.50:0003");
    EXPECT_EQ(ModuleSearchEngine::format_module_id(0.25, 12), "t0.25:0012");
}

TEST(ModuleSearchEngineStatic, RestartSeedsDiffer) {
    auto a = ModuleSearchEngine::restart_seed(42, 0, 1);
    EXPECT_EQ(a, ModuleSearchEngine::restart_seed(42, 0, 1));
    EXPECT_NE(a, ModuleSearchEngine::restart_seed(42, 0, 2));
    EXPECT_NE(a, ModuleSearchEngine::restart_seed(42, 1, 1));
    EXPECT_NE(a, ModuleSearchEngine::restart_seed(43, 0, 1));
}

// ==========================================
// Sweep Tests
// ==========================================

TEST_F(ChainNetworkSearchTest, TwentySeedsYieldAtMostKNonOverlapping) {
    SignificanceScorer scorer(network, measurements);
    auto config = sweep_config();
    config.overlap_thresholds = {0.5};
    ModuleSearchEngine engine(scorer, config);

    EXPECT_EQ(engine.select_seeds().size(), 20);

    auto result = engine.run_sweep();
    ASSERT_EQ(result.runs.size(), 1);
    const auto& modules = result.runs[0].modules;
    EXPECT_LE(modules.size(), 5);
    EXPECT_FALSE(modules.empty());

    for (size_t i = 0; i < modules.size(); ++i) {
        for (size_t j = i + 1; j < modules.size(); ++j) {
            EXPECT_LE(Module::overlap_ratio(modules[i], modules[j]), 0.5)
                << modules[i].module_id << " vs " << modules[j].module_id;
        }
    }
}

TEST_F(ChainNetworkSearchTest, EveryModuleIsConnected) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, sweep_config());

    auto result = engine.run_sweep();
    ASSERT_FALSE(result.candidates.empty());
    for (const auto& m : result.candidates) {
        EXPECT_TRUE(network.is_connected(m.node_set())) << m.module_id;
        EXPECT_TRUE(std::is_sorted(m.node_ids.begin(), m.node_ids.end()));
    }
}

TEST_F(ChainNetworkSearchTest, SweepPoolsAcrossThresholds) {
    SignificanceScorer scorer(network, measurements);
    ModuleSearchEngine engine(scorer, sweep_config());

    auto result = engine.run_sweep();
    ASSERT_EQ(result.runs.size(), 3);

    std::set<std::vector<std::string>> seen;
    for (const auto& m : result.pooled) {
        EXPECT_TRUE(seen.insert(m.node_ids).second);
        EXPECT_FALSE(m.overlap_thresholds.empty());
    }
    for (size_t i = 1; i < result.pooled.size(); ++i) {
        EXPECT_FALSE(Module::rank_before(result.pooled[i], result.pooled[i - 1]));
    }

    for (const auto& run : result.runs) {
        EXPECT_LE(run.modules.size(), 5);
        for (const auto& m : run.modules) {
            auto it = std::find_if(result.pooled.begin(), result.pooled.end(),
                                   [&m](const Module& p) { return p.node_ids == m.node_ids; });
            ASSERT_NE(it, result.pooled.end());
            EXPECT_NE(std::find(it->overlap_thresholds.begin(), it->overlap_thresholds.end(),
                                run.overlap_threshold),
                      it->overlap_thresholds.end());
        }
    }
}

TEST_F(ChainNetworkSearchTest, ParallelSweepMatchesSingleThresholdRuns) {
    SignificanceScorer scorer(network, measurements);
    auto config = sweep_config();
    config.num_threads = 4;
    ModuleSearchEngine engine(scorer, config);

    auto sweep = engine.run_sweep();
    ASSERT_EQ(sweep.runs.size(), config.overlap_thresholds.size());

    for (size_t i = 0; i < sweep.runs.size(); ++i) {
        const auto& run = sweep.runs[i];
        EXPECT_DOUBLE_EQ(run.overlap_threshold, config.overlap_thresholds[i]);

        auto single = engine.run(run.overlap_threshold);
        ASSERT_EQ(single.modules.size(), run.modules.size());
        EXPECT_EQ(single.budget_exhausted, run.budget_exhausted);
        for (size_t k = 0; k < run.modules.size(); ++k) {
            EXPECT_EQ(single.modules[k].module_id, run.modules[k].module_id);
            EXPECT_EQ(single.modules[k].node_ids, run.modules[k].node_ids);
        }
    }
}

TEST_F(ChainNetworkSearchTest, DeterministicAcrossRunsAndThreads) {
    SignificanceScorer scorer(network, measurements);

    auto single = sweep_config();
    single.num_threads = 1;
    auto multi = sweep_config();
    multi.num_threads = 4;

    ModuleSearchEngine a(scorer, single);
    ModuleSearchEngine b(scorer, multi);
    ModuleSearchEngine c(scorer, multi);

    auto dump = [](const SearchResult& r) {
        nlohmann::json j = r.summary_json();
        for (const auto& m : r.pooled) j["pooled"].push_back(m.to_json());
        return j.dump();
    };

    std::string first = dump(a.run_sweep());
    EXPECT_EQ(first, dump(b.run_sweep()));
    EXPECT_EQ(first, dump(c.run_sweep()));
}

// ==========================================
// Configuration Tests
// ==========================================

TEST_F(ToyNetworkSearchTest, InvalidConfigurationIsRejected) {
    SignificanceScorer scorer(network, measurements);

    SearchConfig config;
    config.target_module_count = 4;
    try {
        ModuleSearchEngine engine(scorer, config);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.parameter(), "target_module_count");
    }

    config = SearchConfig{};
    config.overlap_thresholds = {0.5, 1.5};
    EXPECT_THROW({ ModuleSearchEngine engine(scorer, config); }, ConfigurationError);

    config = SearchConfig{};
    config.max_depth = 0;
    EXPECT_THROW({ ModuleSearchEngine engine(scorer, config); }, ConfigurationError);

    config = SearchConfig{};
    config.budget_seconds = 0.0;
    EXPECT_THROW({ ModuleSearchEngine engine(scorer, config); }, ConfigurationError);
}

TEST(SearchConfigTest, JsonRoundTrip) {
    SearchConfig config;
    config.target_module_count = 7;
    config.overlap_thresholds = {0.3};
    config.regional_scoring = false;
    config.random_seed = 99;

    auto restored = SearchConfig::from_json(config.to_json());
    EXPECT_EQ(restored.target_module_count, 7);
    EXPECT_EQ(restored.overlap_thresholds, (std::vector<double>{0.3}));
    EXPECT_FALSE(restored.regional_scoring);
    EXPECT_EQ(restored.random_seed, 99u);
}
