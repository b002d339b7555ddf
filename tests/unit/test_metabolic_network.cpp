#include <gtest/gtest.h>
#include "network/metabolic_network.hpp"
#include "core/errors.hpp"

using namespace amod;

namespace {

NetworkNode metabolite(const std::string& id) {
    NetworkNode n;
    n.id = id;
    n.type = NodeType::METABOLITE;
    return n;
}

NetworkNode reaction(const std::string& id) {
    NetworkNode n;
    n.id = id;
    n.type = NodeType::REACTION;
    return n;
}

} // namespace

class MetabolicNetworkTest : public ::testing::Test {
protected:
    MetabolicNetwork network;

    void SetUp() override {
        // M1, M2, M3 -- R1 -- ... ; M3, M4, M5 -- R2 ; M6 isolated
        network = MetabolicNetwork(
            {metabolite("M1"), metabolite("M2"), metabolite("M3"), metabolite("M4"),
             metabolite("M5"), metabolite("M6"), reaction("R1"), reaction("R2")},
            {{"M1", "R1"}, {"M2", "R1"}, {"R1", "M3"}, {"M3", "R2"},
             {"M4", "R2"}, {"M5", "R2"}});
    }
};

// ==========================================
// Construction Tests
// ==========================================

TEST_F(MetabolicNetworkTest, CountsNodesAndLinks) {
    EXPECT_EQ(network.num_nodes(), 8);
    EXPECT_EQ(network.num_links(), 6);
    EXPECT_EQ(network.metabolite_ids().size(), 6);
    EXPECT_EQ(network.reaction_ids().size(), 2);
}

TEST_F(MetabolicNetworkTest, LabelDefaultsToId) {
    EXPECT_EQ(network.get_node("M1").label, "M1");
}

TEST(MetabolicNetworkConstruction, DuplicateLinksCollapse) {
    MetabolicNetwork net({metabolite("A"), reaction("R")},
                         {{"A", "R"}, {"R", "A"}, {"A", "R"}});
    EXPECT_EQ(net.num_links(), 1);
    EXPECT_EQ(net.degree("A"), 1);
}

TEST(MetabolicNetworkConstruction, RejectsDanglingLink) {
    try {
        MetabolicNetwork net({metabolite("A"), reaction("R")}, {{"A", "R9"}});
        FAIL() << "Expected StructuralError";
    } catch (const StructuralError& e) {
        EXPECT_EQ(e.offending_id(), "R9");
    }
}

TEST(MetabolicNetworkConstruction, RejectsSameTypeLink) {
    EXPECT_THROW(MetabolicNetwork({metabolite("A"), metabolite("B")}, {{"A", "B"}}),
                 StructuralError);
    EXPECT_THROW(MetabolicNetwork({reaction("R1"), reaction("R2")}, {{"R1", "R2"}}),
                 StructuralError);
}

TEST(MetabolicNetworkConstruction, RejectsDuplicateNode) {
    EXPECT_THROW(MetabolicNetwork({metabolite("A"), reaction("A")}, {}), StructuralError);
}

TEST(MetabolicNetworkConstruction, RejectsUnknownNodeType) {
    nlohmann::json j = {
        {"nodes", {{{"id", "A"}, {"type", "enzyme"}}}},
        {"links", nlohmann::json::array()}
    };
    EXPECT_THROW(MetabolicNetwork::from_json(j), StructuralError);
}

// ==========================================
// Lookup Tests
// ==========================================

TEST_F(MetabolicNetworkTest, UnknownNodeThrows) {
    EXPECT_THROW(network.get_node("X"), NotFoundError);
    EXPECT_THROW(network.neighbors("X"), NotFoundError);
    EXPECT_EQ(network.find_node("X"), nullptr);
    EXPECT_FALSE(network.has_node("X"));
}

TEST_F(MetabolicNetworkTest, NeighborsAreSorted) {
    auto n = network.neighbors("R1");
    ASSERT_EQ(n.size(), 3);
    EXPECT_EQ(n[0], "M1");
    EXPECT_EQ(n[1], "M2");
    EXPECT_EQ(n[2], "M3");
}

TEST_F(MetabolicNetworkTest, Neighborhood) {
    auto one = network.get_neighborhood("M1", 1);
    EXPECT_EQ(one, (std::set<std::string>{"R1"}));

    auto two = network.get_neighborhood("M1", 2);
    EXPECT_EQ(two, (std::set<std::string>{"R1", "M2", "M3"}));

    auto four = network.get_neighborhood("M1", 4);
    EXPECT_TRUE(four.count("M5"));
    EXPECT_FALSE(four.count("M1"));
}

TEST_F(MetabolicNetworkTest, HopDistancesFromSeveralSources) {
    auto d = network.hop_distances({"M1", "M5"}, 2);
    EXPECT_EQ(d.at("M1"), 0);
    EXPECT_EQ(d.at("M5"), 0);
    EXPECT_EQ(d.at("R1"), 1);
    EXPECT_EQ(d.at("R2"), 1);
    EXPECT_EQ(d.at("M3"), 2);
    EXPECT_FALSE(d.count("M6"));
}

// ==========================================
// Structure Tests
// ==========================================

TEST_F(MetabolicNetworkTest, InducedLinks) {
    auto links = network.induced_links({"M1", "R1", "M3", "M5"});
    ASSERT_EQ(links.size(), 2);
    EXPECT_EQ(links[0], NetworkLink("M1", "R1"));
    EXPECT_EQ(links[1], NetworkLink("M3", "R1"));
}

TEST_F(MetabolicNetworkTest, Connectivity) {
    EXPECT_TRUE(network.is_connected({"M1", "R1", "M2"}));
    EXPECT_TRUE(network.is_connected({"M4"}));
    EXPECT_FALSE(network.is_connected({"M1", "M2"}));
    EXPECT_FALSE(network.is_connected({}));
}

TEST_F(MetabolicNetworkTest, ArticulationPoints) {
    auto cut = network.articulation_points({"M1", "R1", "M3", "R2", "M5"});
    EXPECT_EQ(cut, (std::set<std::string>{"R1", "M3", "R2"}));

    EXPECT_TRUE(network.articulation_points({"M1", "R1"}).empty());
}

TEST_F(MetabolicNetworkTest, ComponentsAndStatistics) {
    auto components = network.connected_components();
    ASSERT_EQ(components.size(), 2);
    EXPECT_EQ(components[0].size(), 7);
    EXPECT_EQ(components[1], (std::set<std::string>{"M6"}));

    auto stats = network.compute_statistics();
    EXPECT_EQ(stats.num_metabolites, 6);
    EXPECT_EQ(stats.num_reactions, 2);
    EXPECT_EQ(stats.max_degree, 3);
    EXPECT_EQ(stats.num_isolated, 1);
    EXPECT_EQ(stats.num_components, 2);
    EXPECT_EQ(stats.largest_component, 7);
    EXPECT_DOUBLE_EQ(stats.avg_degree, 12.0 / 8.0);
}

TEST_F(MetabolicNetworkTest, TopHubs) {
    auto hubs = network.get_top_hubs(2);
    ASSERT_EQ(hubs.size(), 2);
    EXPECT_EQ(hubs[0].first, "R1");
    EXPECT_EQ(hubs[1].first, "R2");
}

// ==========================================
// Serialization Tests
// ==========================================

TEST_F(MetabolicNetworkTest, JsonRoundTrip) {
    auto restored = MetabolicNetwork::from_json(network.to_json());
    EXPECT_EQ(restored.node_ids(), network.node_ids());
    EXPECT_EQ(restored.links(), network.links());
    EXPECT_EQ(restored.get_node("R2").type, NodeType::REACTION);
}

TEST(MetabolicNetworkSerialization, AcceptsEdgesAlias) {
    nlohmann::json j = {
        {"nodes", {{{"id", "A"}, {"type", "metabolite"}, {"label", "Alanine"}},
                   {{"id", "R"}, {"type", "reaction"}}}},
        {"edges", {{{"source", "R"}, {"target", "A"}}}}
    };
    auto net = MetabolicNetwork::from_json(j);
    EXPECT_EQ(net.num_links(), 1);
    EXPECT_EQ(net.get_node("A").label, "Alanine");
}
