#pragma once

#include "network/metabolic_network.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <set>
#include <fstream>
#include <stdexcept>

namespace amod {

/**
 * @brief A connected, scored subset of the network
 *
 * Modules are values: the search and the selector build new instances
 * instead of editing existing ones.
 */
struct Module {
    std::string module_id;              // "t0.50:0003"
    std::string seed;                   // Seed node the search started from
    int restart = 0;                    // Restart index that produced it
    std::vector<std::string> node_ids;  // Sorted
    std::vector<NetworkLink> links;     // Induced links, sorted
    double score = 0.0;                 // Aggregate score (size-adjusted when enabled)
    double combined_z = 0.0;            // Stouffer z over measured members
    double combined_p_value = 1.0;
    size_t num_reactions = 0;
    size_t num_metabolites = 0;
    size_t num_measured_metabolites = 0;
    double coverage = 0.0;              // Measured metabolites / metabolites
    size_t context_pruned = 0;          // Metabolites removed by context pruning
    std::vector<double> overlap_thresholds; // Threshold runs that accepted this module

    size_t size() const { return node_ids.size(); }

    std::set<std::string> node_set() const {
        return std::set<std::string>(node_ids.begin(), node_ids.end());
    }

    bool contains(const std::string& node_id) const;

    /**
     * @brief Shared nodes over the size of the smaller module
     */
    static double overlap_ratio(const Module& a, const Module& b);

    /**
     * @brief Ranking order: score desc, combined p asc, node ids asc
     */
    static bool rank_before(const Module& a, const Module& b);

    nlohmann::json to_json() const;
    static Module from_json(const nlohmann::json& j);
};

/**
 * @brief Modules with the parameters that produced them
 */
struct ModuleCollection {
    std::string stage;                  // "candidates" or "selected"
    nlohmann::json parameters = nlohmann::json::object();
    bool budget_exhausted = false;
    std::vector<Module> modules;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["meta"] = {
            {"stage", stage},
            {"parameters", parameters},
            {"budget_exhausted", budget_exhausted},
            {"total_modules", modules.size()}
        };

        nlohmann::json modules_arr = nlohmann::json::array();
        for (size_t i = 0; i < modules.size(); ++i) {
            auto m = modules[i].to_json();
            m["rank"] = i + 1;
            modules_arr.push_back(m);
        }
        j["modules"] = modules_arr;
        return j;
    }

    static ModuleCollection from_json(const nlohmann::json& j) {
        ModuleCollection col;

        if (j.contains("meta")) {
            col.stage = j["meta"].value("stage", "");
            col.parameters = j["meta"].value("parameters", nlohmann::json::object());
            col.budget_exhausted = j["meta"].value("budget_exhausted", false);
        }

        if (j.contains("modules")) {
            for (const auto& m : j["modules"]) {
                col.modules.push_back(Module::from_json(m));
            }
        }

        return col;
    }

    static ModuleCollection load_from_json(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open modules file: " + path);
        }
        nlohmann::json j;
        file >> j;
        return from_json(j);
    }
};

} // namespace amod
