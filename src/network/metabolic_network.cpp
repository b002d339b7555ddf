#include "network/metabolic_network.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <queue>

namespace amod {

// ==========================================
// NodeType
// ==========================================

std::string node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::METABOLITE: return "metabolite";
        case NodeType::REACTION: return "reaction";
        default: return "unknown";
    }
}

NodeType string_to_node_type(const std::string& s, const std::string& node_id) {
    if (s == "metabolite") return NodeType::METABOLITE;
    if (s == "reaction") return NodeType::REACTION;
    throw StructuralError(node_id, "Unknown node type '" + s + "'");
}

// ==========================================
// NetworkNode Implementation
// ==========================================

nlohmann::json NetworkNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["type"] = node_type_to_string(type);
    j["label"] = label;
    if (!properties.empty()) {
        j["properties"] = properties;
    }
    return j;
}

NetworkNode NetworkNode::from_json(const nlohmann::json& j) {
    NetworkNode node;
    node.id = j.at("id").get<std::string>();
    node.type = string_to_node_type(j.at("type").get<std::string>(), node.id);
    node.label = j.value("label", node.id);

    if (j.contains("properties")) {
        node.properties = j["properties"].get<std::map<std::string, std::string>>();
    }

    return node;
}

// ==========================================
// NetworkLink Implementation
// ==========================================

std::pair<std::string, std::string> NetworkLink::key() const {
    if (source < target) return {source, target};
    return {target, source};
}

nlohmann::json NetworkLink::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["target"] = target;
    return j;
}

NetworkLink NetworkLink::from_json(const nlohmann::json& j) {
    return NetworkLink(j.at("source").get<std::string>(), j.at("target").get<std::string>());
}

// ==========================================
// MetabolicNetwork Implementation
// ==========================================

MetabolicNetwork::MetabolicNetwork(const std::vector<NetworkNode>& nodes,
                                   const std::vector<NetworkLink>& links) {
    for (const auto& node : nodes) {
        if (node.id.empty()) {
            throw StructuralError("", "Node with empty identifier");
        }
        if (nodes_.count(node.id)) {
            throw StructuralError(node.id, "Duplicate node identifier");
        }
        NetworkNode stored = node;
        if (stored.label.empty()) stored.label = stored.id;
        nodes_.emplace(stored.id, std::move(stored));
        adjacency_[node.id];  // ensure entry exists
    }

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& link : links) {
        auto src = nodes_.find(link.source);
        if (src == nodes_.end()) {
            throw StructuralError(link.source, "Link references unknown node");
        }
        auto tgt = nodes_.find(link.target);
        if (tgt == nodes_.end()) {
            throw StructuralError(link.target, "Link references unknown node");
        }
        if (src->second.type == tgt->second.type) {
            throw StructuralError(link.source + "--" + link.target,
                                  "Link joins two " + node_type_to_string(src->second.type) +
                                  " nodes");
        }

        if (!seen.insert(link.key()).second) continue;

        links_.push_back(link);
        adjacency_[link.source].push_back(link.target);
        adjacency_[link.target].push_back(link.source);
    }

    std::sort(links_.begin(), links_.end());
    for (auto& [id, adj] : adjacency_) {
        std::sort(adj.begin(), adj.end());
    }
}

const NetworkNode& MetabolicNetwork::get_node(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        throw NotFoundError(node_id);
    }
    return it->second;
}

const NetworkNode* MetabolicNetwork::find_node(const std::string& node_id) const {
    auto it = nodes_.find(node_id);
    return it != nodes_.end() ? &it->second : nullptr;
}

bool MetabolicNetwork::has_node(const std::string& node_id) const {
    return nodes_.find(node_id) != nodes_.end();
}

std::vector<std::string> MetabolicNetwork::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> MetabolicNetwork::metabolite_ids() const {
    std::vector<std::string> ids;
    for (const auto& [id, node] : nodes_) {
        if (node.is_metabolite()) ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> MetabolicNetwork::reaction_ids() const {
    std::vector<std::string> ids;
    for (const auto& [id, node] : nodes_) {
        if (node.is_reaction()) ids.push_back(id);
    }
    return ids;
}

const std::vector<std::string>& MetabolicNetwork::neighbors(const std::string& node_id) const {
    auto it = adjacency_.find(node_id);
    if (it == adjacency_.end()) {
        throw NotFoundError(node_id);
    }
    return it->second;
}

size_t MetabolicNetwork::degree(const std::string& node_id) const {
    return neighbors(node_id).size();
}

std::vector<NetworkLink> MetabolicNetwork::induced_links(const std::set<std::string>& node_ids) const {
    std::vector<NetworkLink> result;
    for (const auto& id : node_ids) {
        auto it = adjacency_.find(id);
        if (it == adjacency_.end()) continue;
        for (const auto& other : it->second) {
            // Each undirected link once, from its smaller endpoint
            if (id < other && node_ids.count(other)) {
                result.emplace_back(id, other);
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t MetabolicNetwork::count_reachable(const std::set<std::string>& members,
                                         const std::string& start,
                                         const std::string& excluded) const {
    std::set<std::string> visited = {start};
    std::queue<std::string> queue;
    queue.push(start);

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop();

        auto it = adjacency_.find(current);
        if (it == adjacency_.end()) continue;
        for (const auto& n : it->second) {
            if (n == excluded || !members.count(n)) continue;
            if (visited.insert(n).second) {
                queue.push(n);
            }
        }
    }

    return visited.size();
}

bool MetabolicNetwork::is_connected(const std::set<std::string>& node_ids) const {
    if (node_ids.empty()) return false;
    for (const auto& id : node_ids) {
        if (!has_node(id)) return false;
    }
    return count_reachable(node_ids, *node_ids.begin(), "") == node_ids.size();
}

std::set<std::string> MetabolicNetwork::articulation_points(const std::set<std::string>& node_ids) const {
    std::set<std::string> result;
    if (node_ids.size() < 3) return result;

    for (const auto& candidate : node_ids) {
        // Start from any other member
        const std::string& start = (*node_ids.begin() == candidate)
            ? *std::next(node_ids.begin())
            : *node_ids.begin();
        if (count_reachable(node_ids, start, candidate) < node_ids.size() - 1) {
            result.insert(candidate);
        }
    }

    return result;
}

} // namespace amod
