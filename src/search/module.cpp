#include "search/module.hpp"
#include <algorithm>

namespace amod {

bool Module::contains(const std::string& node_id) const {
    return std::binary_search(node_ids.begin(), node_ids.end(), node_id);
}

double Module::overlap_ratio(const Module& a, const Module& b) {
    size_t smaller = std::min(a.node_ids.size(), b.node_ids.size());
    if (smaller == 0) return 0.0;

    std::vector<std::string> shared;
    std::set_intersection(a.node_ids.begin(), a.node_ids.end(),
                          b.node_ids.begin(), b.node_ids.end(),
                          std::back_inserter(shared));

    return static_cast<double>(shared.size()) / static_cast<double>(smaller);
}

bool Module::rank_before(const Module& a, const Module& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.combined_p_value != b.combined_p_value) return a.combined_p_value < b.combined_p_value;
    return a.node_ids < b.node_ids;
}

nlohmann::json Module::to_json() const {
    nlohmann::json j;
    j["module_id"] = module_id;
    j["seed"] = seed;
    j["restart"] = restart;
    j["node_ids"] = node_ids;

    nlohmann::json links_json = nlohmann::json::array();
    for (const auto& link : links) {
        links_json.push_back(link.to_json());
    }
    j["links"] = links_json;

    j["score"] = score;
    j["combined_z"] = combined_z;
    j["combined_p_value"] = combined_p_value;
    j["num_reactions"] = num_reactions;
    j["num_metabolites"] = num_metabolites;
    j["num_measured_metabolites"] = num_measured_metabolites;
    j["coverage"] = coverage;
    j["context_pruned"] = context_pruned;
    j["overlap_thresholds"] = overlap_thresholds;
    return j;
}

Module Module::from_json(const nlohmann::json& j) {
    Module m;
    m.module_id = j.value("module_id", "");
    m.seed = j.value("seed", "");
    m.restart = j.value("restart", 0);
    m.node_ids = j.at("node_ids").get<std::vector<std::string>>();
    std::sort(m.node_ids.begin(), m.node_ids.end());

    if (j.contains("links")) {
        for (const auto& link_json : j["links"]) {
            m.links.push_back(NetworkLink::from_json(link_json));
        }
    }

    m.score = j.value("score", 0.0);
    m.combined_z = j.value("combined_z", 0.0);
    m.combined_p_value = j.value("combined_p_value", 1.0);
    m.num_reactions = j.value("num_reactions", static_cast<size_t>(0));
    m.num_metabolites = j.value("num_metabolites", static_cast<size_t>(0));
    m.num_measured_metabolites = j.value("num_measured_metabolites", static_cast<size_t>(0));
    m.coverage = j.value("coverage", 0.0);
    m.context_pruned = j.value("context_pruned", static_cast<size_t>(0));
    m.overlap_thresholds = j.value("overlap_thresholds", std::vector<double>{});
    return m;
}

} // namespace amod
