#include "cli/cli.hpp"
#include "config/analysis_config.hpp"
#include "core/errors.hpp"
#include "export/result_exporter.hpp"
#include "network/metabolic_network.hpp"
#include "scoring/measurement_table.hpp"
#include "scoring/significance_scorer.hpp"
#include "search/module_search_engine.hpp"
#include "selection/cluster_selector.hpp"
#include <algorithm>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

using namespace amod;

// ============== Helper Functions ==============

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

std::string join_path(const std::string& dir, const std::string& file) {
    return (fs::path(dir) / file).string();
}

void ensure_parent_directory(const std::string& path) {
    fs::path out_path(path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
}

// One id per line; blank lines and '#' comments skipped
std::vector<std::string> read_seed_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open seed file: " + path);
    }

    std::vector<std::string> seeds;
    std::string line;
    while (std::getline(file, line)) {
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') continue;
        auto end = line.find_last_not_of(" \t\r");
        seeds.push_back(line.substr(start, end - start + 1));
    }
    return seeds;
}

MetabolicNetwork load_network(const std::string& path) {
    std::cout << "Loading network from: " << path << "\n";
    MetabolicNetwork network = MetabolicNetwork::load_from_json(path);
    std::cout << "Loaded " << network.metabolite_ids().size() << " metabolites, "
              << network.reaction_ids().size() << " reactions and "
              << network.num_links() << " links\n";
    return network;
}

MeasurementTable load_measurements(const std::string& path, const MetabolicNetwork& network) {
    std::cout << "Loading measurements from: " << path << "\n";
    MeasurementTable measurements = MeasurementTable::load(path);
    std::cout << "Loaded " << measurements.size() << " measurements for "
              << measurements.num_nodes() << " nodes in "
              << measurements.studies().size() << " studies\n";

    auto unmatched = measurements.unmatched_nodes(network);
    if (!unmatched.empty()) {
        std::cerr << "Warning: " << unmatched.size()
                  << " measured ids are not in the network (first: " << unmatched.front() << ")\n";
    }
    return measurements;
}

// Config file, then environment, then command-line overrides
AnalysisConfig load_config(const Args& args) {
    if (!args.has("config")) {
        return AnalysisConfig::from_environment();
    }

    std::cout << "Loading config from: " << args.get("config").value << "\n";
    AnalysisConfig config = AnalysisConfig::from_json_file(args.get("config").value);
    config.apply_environment();
    return config;
}

void apply_selection_overrides(const Args& args, SelectionConfig& selection) {
    if (args.has("min-reactions")) selection.min_reactions = args.get("min-reactions").as_int();
    if (args.has("max-reactions")) selection.max_reactions = args.get("max-reactions").as_int();
    if (args.has("min-coverage")) selection.min_coverage = args.get("min-coverage").as_double();
    if (args.has("significance")) selection.significance_cutoff = args.get("significance").as_double();
    if (args.has("context-cutoff")) selection.context_cutoff = args.get("context-cutoff").as_double();
}

void print_modules(const std::vector<Module>& modules, size_t limit) {
    for (size_t i = 0; i < modules.size() && i < limit; ++i) {
        const auto& m = modules[i];
        std::cout << "  " << std::setw(3) << (i + 1) << ". " << m.module_id
                  << "  score " << std::fixed << std::setprecision(3) << m.score
                  << "  p " << std::scientific << std::setprecision(2) << m.combined_p_value
                  << std::defaultfloat
                  << "  " << m.num_metabolites << "M/" << m.num_reactions << "R"
                  << "  seed " << m.seed << "\n";
    }
    if (modules.size() > limit) {
        std::cout << "  ... " << (modules.size() - limit) << " more\n";
    }
}

void print_selection(const SelectionResult& selection) {
    std::cout << "\nSelection Summary:\n";
    std::cout << "  Candidates: " << selection.num_candidates << "\n";
    std::cout << "  Selected: " << selection.selected.size() << "\n";
    if (selection.num_merged > 0) {
        std::cout << "  Merged after pruning: " << selection.num_merged << "\n";
    }
    for (const auto& [rule, count] : selection.rejection_counts()) {
        std::cout << "  Rejected by " << rule << ": " << count << "\n";
    }
}

// ============== amod stats ==============
int cmd_stats(const Args& args) {
    MetabolicNetwork network = load_network(args.require("network"));
    auto stats = network.compute_statistics();

    std::cout << "\nNetwork Statistics:\n";
    std::cout << "  Nodes: " << stats.num_nodes << "\n";
    std::cout << "  Metabolites: " << stats.num_metabolites << "\n";
    std::cout << "  Reactions: " << stats.num_reactions << "\n";
    std::cout << "  Links: " << stats.num_links << "\n";
    std::cout << "  Avg node degree: " << stats.avg_degree << "\n";
    std::cout << "  Max node degree: " << stats.max_degree << "\n";
    std::cout << "  Isolated nodes: " << stats.num_isolated << "\n";
    std::cout << "  Connected components: " << stats.num_components << "\n";
    std::cout << "  Largest component: " << stats.largest_component << "\n";

    size_t top = args.get("top", "10").as_count(10);
    auto hubs = network.get_top_hubs(top);
    std::cout << "\nTop " << top << " Hubs:\n";
    for (const auto& [node_id, degree] : hubs) {
        const auto& node = network.get_node(node_id);
        std::cout << "  " << node.label << " [" << node_type_to_string(node.type)
                  << "] (degree " << degree << ")\n";
    }

    return 0;
}

// ============== amod score ==============
int cmd_score(const Args& args) {
    std::string output_path = args.require("output");
    NetworkFormat format = string_to_network_format(args.get("format", "cytoscape").value);

    AnalysisConfig config = load_config(args);
    config.require_valid();

    MetabolicNetwork network = load_network(args.require("network"));
    MeasurementTable measurements = load_measurements(args.require("measurements"), network);

    SignificanceScorer scorer(network, measurements, config.scoring);
    std::cout << "Scored " << scorer.measured_count() << " of " << network.num_nodes()
              << " nodes (" << (network.num_nodes() - scorer.measured_count()) << " missing)\n";

    ensure_parent_directory(output_path);
    ResultExporter exporter(scorer, config.selection.significance_cutoff);
    exporter.write_enriched_network(output_path, format);
    std::cout << "Enriched network (" << network_format_to_string(format)
              << ") saved to: " << output_path << "\n";
    return 0;
}

// ============== amod search ==============
int cmd_search(const Args& args) {
    std::string output_dir = args.get("output-dir", "amod_output").value;
    bool quiet = args.has("quiet");

    // Configuration is checked before any input is read
    AnalysisConfig config = load_config(args);
    auto& search = config.search;
    if (args.has("targets")) search.target_module_count = args.get("targets").as_count();
    if (args.has("thresholds")) search.overlap_thresholds = args.get("thresholds").as_double_list();
    if (args.has("depth")) search.max_depth = args.get("depth").as_int();
    if (args.has("no-size-adjustment")) search.adjust_for_size = false;
    if (args.has("no-regional-scoring")) search.regional_scoring = false;
    if (args.has("restarts")) search.restarts_per_seed = args.get("restarts").as_int();
    if (args.has("random-seed")) search.random_seed = args.get("random-seed").as_uint64();
    if (args.has("threads")) search.num_threads = args.get("threads").as_int();
    if (args.has("iterations")) search.max_iterations = args.get("iterations").as_int();
    if (args.has("budget")) search.budget_seconds = args.get("budget").as_double();
    apply_selection_overrides(args, config.selection);
    config.require_valid();

    MetabolicNetwork network = load_network(args.require("network"));
    MeasurementTable measurements = load_measurements(args.require("measurements"), network);

    auto start = std::chrono::steady_clock::now();

    SignificanceScorer scorer(network, measurements, config.scoring);
    std::cout << "Scored " << scorer.measured_count() << " of " << network.num_nodes() << " nodes\n";

    ModuleSearchEngine engine(scorer, search);
    if (args.has("seeds") || args.has("seed-file")) {
        std::vector<std::string> seeds = args.get("seeds").as_list();
        if (args.has("seed-file")) {
            auto from_file = read_seed_file(args.get("seed-file").value);
            seeds.insert(seeds.end(), from_file.begin(), from_file.end());
        }
        engine.set_seeds(seeds);
    }

    if (!quiet) {
        engine.set_progress_callback([](const std::string& stage, int current, int total) {
            std::cout << "  [" << stage << "] " << current << "/" << total << "\r" << std::flush;
        });
    }

    std::cout << "Searching from " << engine.select_seeds().size() << " seeds (K="
              << search.target_module_count << ", D=" << search.max_depth
              << ", restarts=" << search.restarts_per_seed << ")\n";

    SearchResult result = engine.run_sweep();
    if (!quiet) std::cout << "\n";

    for (const auto& failure : result.failures) {
        std::cerr << "Warning: search from seed " << failure.seed << " (restart "
                  << failure.restart << ") failed: " << failure.message << "\n";
    }

    std::cout << "\nSearch Summary:\n";
    std::cout << "  Locally optimal modules: " << result.candidates.size() << "\n";
    std::cout << "  Iterations: " << result.total_iterations << "\n";
    for (const auto& run : result.runs) {
        std::cout << "  theta " << std::fixed << std::setprecision(2) << run.overlap_threshold
                  << std::defaultfloat << ": " << run.modules.size() << " modules"
                  << (run.budget_exhausted ? " (budget exhausted)" : "") << "\n";
    }
    std::cout << "  Pooled: " << result.pooled.size() << "\n";

    ModuleEvaluator evaluator(scorer, search.scoring_options());
    ClusterSelector selector(evaluator, config.selection);
    SelectionResult selection = selector.select(result.pooled);
    print_selection(selection);

    std::cout << "\nTop modules:\n";
    print_modules(selection.selected, 10);

    fs::create_directories(output_dir);
    ResultExporter exporter(scorer, config.selection.significance_cutoff);

    ModuleCollection candidates;
    candidates.stage = "candidates";
    candidates.parameters = config.to_json();
    candidates.budget_exhausted = result.budget_exhausted;
    candidates.modules = result.pooled;
    std::string candidates_path = join_path(output_dir, "candidates.json");
    exporter.write_modules(candidates, candidates_path);

    ModuleCollection selected;
    selected.stage = "selected";
    selected.parameters = config.to_json();
    selected.budget_exhausted = result.budget_exhausted;
    selected.modules = selection.selected;
    std::string modules_path = join_path(output_dir, "modules.json");
    exporter.write_modules(selected, modules_path);

    std::string network_path = join_path(output_dir, "network_enriched.json");
    exporter.write_enriched_network(network_path, NetworkFormat::CYTOSCAPE, &selection.selected);

    std::cout << "\nSaved:\n";
    std::cout << "  " << modules_path << "\n";
    std::cout << "  " << candidates_path << "\n";
    std::cout << "  " << network_path << "\n";
    std::cout << "\nSearch complete in " << format_duration(std::chrono::steady_clock::now() - start) << "\n";
    return 0;
}

// ============== amod select ==============
int cmd_select(const Args& args) {
    std::string output_path = args.require("output");

    AnalysisConfig config = load_config(args);
    apply_selection_overrides(args, config.selection);
    config.require_valid();

    std::string candidates_path = args.require("candidates");
    std::cout << "Loading candidates from: " << candidates_path << "\n";
    ModuleCollection candidates = ModuleCollection::load_from_json(candidates_path);
    std::cout << "Loaded " << candidates.modules.size() << " candidate modules\n";

    // Score candidates the way the search that produced them did
    SearchConfig search = config.search;
    if (candidates.parameters.contains("search")) {
        search = SearchConfig::from_json(candidates.parameters["search"]);
    }

    MetabolicNetwork network = load_network(args.require("network"));
    MeasurementTable measurements = load_measurements(args.require("measurements"), network);
    SignificanceScorer scorer(network, measurements, config.scoring);

    // Rebuild every candidate against the current inputs
    ModuleEvaluator evaluator(scorer, search.scoring_options());
    std::vector<Module> rebuilt;
    for (const auto& m : candidates.modules) {
        rebuilt.push_back(evaluator.rebuild(m, m.node_set(), m.context_pruned));
    }
    std::stable_sort(rebuilt.begin(), rebuilt.end(), Module::rank_before);

    ClusterSelector selector(evaluator, config.selection);
    SelectionResult selection = selector.select(rebuilt);
    print_selection(selection);

    std::cout << "\nTop modules:\n";
    print_modules(selection.selected, 10);

    ModuleCollection selected;
    selected.stage = "selected";
    selected.parameters = config.to_json();
    selected.parameters["search"] = search.to_json();
    selected.budget_exhausted = candidates.budget_exhausted;
    selected.modules = selection.selected;

    ensure_parent_directory(output_path);
    ResultExporter exporter(scorer, config.selection.significance_cutoff);
    exporter.write_modules(selected, output_path);
    std::cout << "\nSaved " << selected.modules.size() << " modules to: " << output_path << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("amod", "1.0.0");

    // amod stats
    cli.register_command({
        "stats",
        "Print statistics about a metabolic network",
        {
            {"network", "n", "Network JSON file", "", true, false},
            {"top", "t", "Number of hubs to list", "10", false, false}
        },
        cmd_stats
    });

    // amod score
    cli.register_command({
        "score",
        "Score every node and export the enriched network",
        {
            {"network", "n", "Network JSON file", "", true, false},
            {"measurements", "m", "Measurements (.json, .tsv)", "", true, false},
            {"output", "o", "Output path for the enriched network", "", true, false},
            {"format", "f", "Network layout: cytoscape or node-link", "cytoscape", false, false},
            {"config", "c", "Analysis config JSON file", "", false, false}
        },
        cmd_score
    });

    // amod search
    cli.register_command({
        "search",
        "Search, select and export active modules",
        {
            {"network", "n", "Network JSON file", "", true, false},
            {"measurements", "m", "Measurements (.json, .tsv)", "", true, false},
            {"output-dir", "o", "Output directory", "amod_output", false, false},
            {"config", "c", "Analysis config JSON file", "", false, false},
            {"targets", "k", "Modules accepted per threshold (5-25)", "", false, false},
            {"thresholds", "t", "Comma-separated overlap thresholds", "", false, false},
            {"depth", "d", "Maximum hop depth", "", false, false},
            {"no-size-adjustment", "", "Do not divide scores by sqrt(module size)", "", false, true},
            {"no-regional-scoring", "", "Let nodes far from the seed contribute", "", false, true},
            {"restarts", "r", "Random restarts per seed", "", false, false},
            {"random-seed", "s", "Seed of the restart generator", "", false, false},
            {"threads", "j", "Worker threads (0 = OpenMP default)", "", false, false},
            {"iterations", "", "Maximum accepted moves per local search", "", false, false},
            {"budget", "", "Wall-clock budget in seconds", "", false, false},
            {"seeds", "", "Comma-separated seed ids (default: all metabolites)", "", false, false},
            {"seed-file", "", "File with one seed id per line", "", false, false},
            {"min-reactions", "", "Minimum reactions per module", "", false, false},
            {"max-reactions", "", "Maximum reactions per module", "", false, false},
            {"min-coverage", "", "Minimum measured fraction of metabolites", "", false, false},
            {"significance", "", "Combined p-value cutoff", "", false, false},
            {"context-cutoff", "", "p-value that keeps a non-significant metabolite", "", false, false},
            {"quiet", "q", "Suppress progress output", "", false, true}
        },
        cmd_search
    });

    // amod select
    cli.register_command({
        "select",
        "Re-select a saved candidate pool with new rules",
        {
            {"network", "n", "Network JSON file", "", true, false},
            {"measurements", "m", "Measurements (.json, .tsv)", "", true, false},
            {"candidates", "i", "candidates.json from a search", "", true, false},
            {"output", "o", "Output path for the selected modules", "", true, false},
            {"config", "c", "Analysis config JSON file", "", false, false},
            {"min-reactions", "", "Minimum reactions per module", "", false, false},
            {"max-reactions", "", "Maximum reactions per module", "", false, false},
            {"min-coverage", "", "Minimum measured fraction of metabolites", "", false, false},
            {"significance", "", "Combined p-value cutoff", "", false, false},
            {"context-cutoff", "", "p-value that keeps a non-significant metabolite", "", false, false}
        },
        cmd_select
    });

    return cli.run(argc, argv);
}
