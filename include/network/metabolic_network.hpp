#ifndef AMOD_METABOLIC_NETWORK_HPP
#define AMOD_METABOLIC_NETWORK_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <nlohmann/json.hpp>

namespace amod {

/**
 * @brief Partition of the bipartite network a node belongs to
 */
enum class NodeType {
    METABOLITE,
    REACTION
};

std::string node_type_to_string(NodeType type);

/**
 * @brief Parse "metabolite" / "reaction"
 * @throws StructuralError for any other string
 */
NodeType string_to_node_type(const std::string& s, const std::string& node_id = "");

/**
 * @brief A metabolite or reaction node
 *
 * Nodes are identified by their string id. Labels and properties are carried
 * through to exports untouched.
 */
struct NetworkNode {
    std::string id;                                    // Unique identifier
    NodeType type = NodeType::METABOLITE;
    std::string label;                                 // Human-readable name (defaults to id)
    std::map<std::string, std::string> properties;     // Additional metadata

    bool is_metabolite() const { return type == NodeType::METABOLITE; }
    bool is_reaction() const { return type == NodeType::REACTION; }

    nlohmann::json to_json() const;
    static NetworkNode from_json(const nlohmann::json& j);
};

/**
 * @brief Undirected link between a metabolite and a reaction
 *
 * Endpoints are stored as given; equality and ordering ignore direction.
 */
struct NetworkLink {
    std::string source;
    std::string target;

    NetworkLink() = default;
    NetworkLink(std::string s, std::string t) : source(std::move(s)), target(std::move(t)) {}

    // (min, max) of the two endpoints
    std::pair<std::string, std::string> key() const;

    bool operator==(const NetworkLink& other) const { return key() == other.key(); }
    bool operator<(const NetworkLink& other) const { return key() < other.key(); }

    nlohmann::json to_json() const;
    static NetworkLink from_json(const nlohmann::json& j);
};

/**
 * @brief Summary of the network structure
 */
struct NetworkStatistics {
    size_t num_nodes = 0;
    size_t num_metabolites = 0;
    size_t num_reactions = 0;
    size_t num_links = 0;

    double avg_degree = 0.0;
    size_t max_degree = 0;
    size_t num_isolated = 0;
    size_t num_components = 0;
    size_t largest_component = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Immutable bipartite graph of metabolites and reactions
 *
 * Construction validates the whole definition: duplicate node ids, links to
 * unknown ids and links joining two nodes of the same type are rejected with
 * StructuralError. Duplicate links collapse to one. After construction the
 * network is read-only, so a single instance can be shared by every search
 * task without locking.
 */
class MetabolicNetwork {
public:
    MetabolicNetwork() = default;

    /**
     * @brief Build and validate the network
     * @throws StructuralError on duplicate ids, dangling or same-type links
     */
    MetabolicNetwork(const std::vector<NetworkNode>& nodes,
                     const std::vector<NetworkLink>& links);

    // ==========================================
    // Lookup
    // ==========================================

    /**
     * @brief Get a node by ID
     * @throws NotFoundError if the id is absent
     */
    const NetworkNode& get_node(const std::string& node_id) const;

    /**
     * @brief Get a node by ID, or nullptr
     */
    const NetworkNode* find_node(const std::string& node_id) const;

    bool has_node(const std::string& node_id) const;

    /**
     * @brief All node ids, sorted
     */
    std::vector<std::string> node_ids() const;
    std::vector<std::string> metabolite_ids() const;
    std::vector<std::string> reaction_ids() const;

    const std::vector<NetworkLink>& links() const { return links_; }

    // ==========================================
    // Adjacency
    // ==========================================

    /**
     * @brief Direct neighbors of a node, sorted by id
     * @throws NotFoundError if the id is absent
     */
    const std::vector<std::string>& neighbors(const std::string& node_id) const;

    /**
     * @brief Number of incident links
     * @throws NotFoundError if the id is absent
     */
    size_t degree(const std::string& node_id) const;

    /**
     * @brief Get the h-hop neighborhood of a node
     * @param node_id Starting node
     * @param hops Number of hops
     * @return Set of node IDs reachable within h hops, excluding the start node
     * @throws NotFoundError if the id is absent
     */
    std::set<std::string> get_neighborhood(const std::string& node_id, int hops) const;

    /**
     * @brief Multi-source BFS distances
     * @param sources Start nodes (distance 0)
     * @param max_hops Nodes farther than this are not reported
     * @return node id -> hop distance from the nearest source
     */
    std::map<std::string, int> hop_distances(const std::set<std::string>& sources,
                                             int max_hops) const;

    /**
     * @brief Links with both endpoints inside the node set, sorted
     */
    std::vector<NetworkLink> induced_links(const std::set<std::string>& node_ids) const;

    /**
     * @brief Whether the node set induces a connected subgraph
     *
     * The empty set is not connected; a single node is.
     */
    bool is_connected(const std::set<std::string>& node_ids) const;

    /**
     * @brief Members whose removal disconnects the induced subgraph
     */
    std::set<std::string> articulation_points(const std::set<std::string>& node_ids) const;

    // ==========================================
    // Analysis
    // ==========================================

    std::vector<std::set<std::string>> connected_components() const;

    /**
     * @brief Get the k highest-degree nodes (hubs), ties broken by id
     */
    std::vector<std::pair<std::string, size_t>> get_top_hubs(size_t k = 10) const;

    NetworkStatistics compute_statistics() const;

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_links() const { return links_.size(); }
    bool empty() const { return nodes_.empty(); }

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @brief Load from {"nodes": [...], "links": [...]} ("edges" accepted too)
     * @throws StructuralError if the definition is not bipartite-consistent
     */
    static MetabolicNetwork from_json(const nlohmann::json& j);

    static MetabolicNetwork load_from_json(const std::string& filename);

private:
    std::map<std::string, NetworkNode> nodes_;                  // node_id -> node
    std::vector<NetworkLink> links_;                            // sorted, unique
    std::map<std::string, std::vector<std::string>> adjacency_; // node_id -> sorted neighbors

    /**
     * @brief BFS restricted to members, starting from `start`, skipping `excluded`
     */
    size_t count_reachable(const std::set<std::string>& members,
                           const std::string& start,
                           const std::string& excluded) const;
};

} // namespace amod

#endif // AMOD_METABOLIC_NETWORK_HPP
