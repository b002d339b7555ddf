#include "network/metabolic_network.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <algorithm>
#include <queue>

namespace amod {

// ==========================================
// Neighborhood Queries
// ==========================================

std::set<std::string> MetabolicNetwork::get_neighborhood(const std::string& node_id, int hops) const {
    if (!has_node(node_id)) {
        throw NotFoundError(node_id);
    }
    if (hops <= 0) {
        return {};
    }

    std::set<std::string> neighborhood;
    for (const auto& [id, distance] : hop_distances({node_id}, hops)) {
        if (distance > 0) neighborhood.insert(id);
    }
    return neighborhood;
}

std::map<std::string, int> MetabolicNetwork::hop_distances(const std::set<std::string>& sources,
                                                           int max_hops) const {
    std::map<std::string, int> distance;
    std::queue<std::string> queue;

    for (const auto& s : sources) {
        if (!has_node(s)) {
            throw NotFoundError(s);
        }
        distance[s] = 0;
        queue.push(s);
    }

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop();

        int d = distance[current];
        if (d >= max_hops) continue;

        for (const auto& n : adjacency_.at(current)) {
            if (distance.find(n) == distance.end()) {
                distance[n] = d + 1;
                queue.push(n);
            }
        }
    }

    return distance;
}

// ==========================================
// Analysis Methods
// ==========================================

std::vector<std::set<std::string>> MetabolicNetwork::connected_components() const {
    std::vector<std::set<std::string>> components;
    std::set<std::string> visited;

    for (const auto& [id, _] : nodes_) {
        if (visited.count(id)) continue;

        std::set<std::string> component;
        std::queue<std::string> queue;
        queue.push(id);
        visited.insert(id);

        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop();
            component.insert(current);

            for (const auto& n : adjacency_.at(current)) {
                if (visited.insert(n).second) {
                    queue.push(n);
                }
            }
        }

        components.push_back(std::move(component));
    }

    // Sort by size (largest first)
    std::stable_sort(components.begin(), components.end(),
                     [](const auto& a, const auto& b) { return a.size() > b.size(); });

    return components;
}

std::vector<std::pair<std::string, size_t>> MetabolicNetwork::get_top_hubs(size_t k) const {
    std::vector<std::pair<std::string, size_t>> hubs;
    hubs.reserve(adjacency_.size());
    for (const auto& [id, adj] : adjacency_) {
        hubs.emplace_back(id, adj.size());
    }

    std::sort(hubs.begin(), hubs.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    if (hubs.size() > k) hubs.resize(k);
    return hubs;
}

NetworkStatistics MetabolicNetwork::compute_statistics() const {
    NetworkStatistics stats;
    stats.num_nodes = nodes_.size();
    stats.num_links = links_.size();

    size_t total_degree = 0;
    for (const auto& [id, node] : nodes_) {
        if (node.is_metabolite()) {
            stats.num_metabolites++;
        } else {
            stats.num_reactions++;
        }

        size_t d = adjacency_.at(id).size();
        total_degree += d;
        stats.max_degree = std::max(stats.max_degree, d);
        if (d == 0) stats.num_isolated++;
    }

    if (stats.num_nodes > 0) {
        stats.avg_degree = static_cast<double>(total_degree) / stats.num_nodes;
    }

    auto components = connected_components();
    stats.num_components = components.size();
    if (!components.empty()) {
        stats.largest_component = components.front().size();
    }

    return stats;
}

nlohmann::json NetworkStatistics::to_json() const {
    return {
        {"num_nodes", num_nodes},
        {"num_metabolites", num_metabolites},
        {"num_reactions", num_reactions},
        {"num_links", num_links},
        {"avg_degree", avg_degree},
        {"max_degree", max_degree},
        {"num_isolated", num_isolated},
        {"num_components", num_components},
        {"largest_component", largest_component}
    };
}

// ==========================================
// Export/Import Methods
// ==========================================

nlohmann::json MetabolicNetwork::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& [id, node] : nodes_) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json links_json = nlohmann::json::array();
    for (const auto& link : links_) {
        links_json.push_back(link.to_json());
    }
    j["links"] = links_json;

    j["metadata"] = {
        {"num_nodes", nodes_.size()},
        {"num_links", links_.size()}
    };

    return j;
}

MetabolicNetwork MetabolicNetwork::from_json(const nlohmann::json& j) {
    std::vector<NetworkNode> nodes;
    std::vector<NetworkLink> links;

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            nodes.push_back(NetworkNode::from_json(node_json));
        }
    }

    const char* link_key = j.contains("links") ? "links" : "edges";
    if (j.contains(link_key)) {
        for (const auto& link_json : j[link_key]) {
            links.push_back(NetworkLink::from_json(link_json));
        }
    }

    return MetabolicNetwork(nodes, links);
}

MetabolicNetwork MetabolicNetwork::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    file >> j;
    file.close();

    return from_json(j);
}

} // namespace amod
