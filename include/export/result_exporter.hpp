#pragma once

#include "network/metabolic_network.hpp"
#include "scoring/measurement_table.hpp"
#include "scoring/significance_scorer.hpp"
#include "search/module.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace amod {

// Whole-network export layout
enum class NetworkFormat {
    CYTOSCAPE,   // {"elements": {"nodes": [{"data": ...}], "edges": [{"data": ...}]}}
    NODE_LINK    // {"nodes": [...], "links": [...]} as read by NetworkX
};

std::string network_format_to_string(NetworkFormat format);
NetworkFormat string_to_network_format(const std::string& s);

/**
 * @brief Enriched network read back from an export
 */
struct EnrichedNetwork {
    MetabolicNetwork network;
    std::map<std::string, CompositeScore> scores;
    MeasurementTable measurements;
    std::map<std::string, std::vector<std::string>> memberships;  // node id -> module ids
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Serializes modules and the score-enriched network
 *
 * Every export is a pure transform of its inputs: nothing is filtered and
 * nothing depends on the clock, so identical inputs give identical bytes.
 */
class ResultExporter {
public:
    /**
     * @param significance_cutoff Threshold of the per-study "significant" flag
     */
    explicit ResultExporter(const SignificanceScorer& scorer, double significance_cutoff = 0.05);

    /**
     * @brief Ranked module list
     */
    nlohmann::json modules_json(const ModuleCollection& collection) const;

    /**
     * @brief Attribute record of one node: type, label, composite score, per-study values
     *
     * Each study entry carries fold_change (log2), p_value, p_value_log10 and
     * significant.
     */
    nlohmann::json node_record(const std::string& node_id) const;

    /**
     * @brief Fold-change range, minimum p-value (and its log10) and studies, for colour scales
     */
    nlohmann::json network_metadata() const;

    /**
     * @brief Whole network with merged node attributes
     * @param modules When given, each node lists the module ids it belongs to
     */
    nlohmann::json enriched_network(NetworkFormat format,
                                    const std::vector<Module>* modules = nullptr) const;

    // File output
    void write_modules(const ModuleCollection& collection, const std::string& path) const;
    void write_enriched_network(const std::string& path,
                                NetworkFormat format = NetworkFormat::CYTOSCAPE,
                                const std::vector<Module>* modules = nullptr) const;

    static void write_json(const nlohmann::json& j, const std::string& path);

    /**
     * @brief Read an enriched network in either layout
     * @throws StructuralError if the embedded network is not valid
     */
    static EnrichedNetwork parse_enriched_network(const nlohmann::json& j);
    static EnrichedNetwork load_enriched_network(const std::string& path);

private:
    const SignificanceScorer& scorer_;
    double significance_cutoff_;

    std::map<std::string, std::vector<std::string>> memberships(
        const std::vector<Module>& modules) const;
};

} // namespace amod
