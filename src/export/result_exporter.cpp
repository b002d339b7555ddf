#include "export/result_exporter.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace amod {

std::string network_format_to_string(NetworkFormat format) {
    switch (format) {
        case NetworkFormat::CYTOSCAPE: return "cytoscape";
        case NetworkFormat::NODE_LINK: return "node-link";
        default: return "unknown";
    }
}

NetworkFormat string_to_network_format(const std::string& s) {
    if (s == "cytoscape") return NetworkFormat::CYTOSCAPE;
    if (s == "node-link" || s == "networkx") return NetworkFormat::NODE_LINK;
    throw ConfigurationError("format", "unknown network format '" + s + "'");
}

// ==========================================
// ResultExporter Implementation
// ==========================================

ResultExporter::ResultExporter(const SignificanceScorer& scorer, double significance_cutoff)
    : scorer_(scorer), significance_cutoff_(significance_cutoff) {}

nlohmann::json ResultExporter::modules_json(const ModuleCollection& collection) const {
    return collection.to_json();
}

nlohmann::json ResultExporter::node_record(const std::string& node_id) const {
    const auto& node = scorer_.network().get_node(node_id);
    const auto& s = scorer_.score(node_id);

    nlohmann::json j = node.to_json();
    j["missing"] = s.missing;
    j["num_studies"] = s.num_studies;
    if (s.missing) {
        j["composite_z"] = nullptr;
        j["composite_p_value"] = nullptr;
        j["composite_fold_change"] = nullptr;
        j["activity"] = nullptr;
    } else {
        j["composite_z"] = s.z;
        j["composite_p_value"] = s.p_value;
        j["composite_fold_change"] = s.fold_change;
        j["activity"] = s.activity;
    }

    nlohmann::json studies = nlohmann::json::object();
    if (const auto* values = scorer_.measurements().find(node_id)) {
        for (const auto& [study, v] : *values) {
            studies[study] = {
                {"fold_change", v.fold_change},
                {"p_value", v.p_value},
                {"p_value_log10", v.p_value_log10()},
                {"significant", v.is_significant(significance_cutoff_)}
            };
        }
    }
    j["studies"] = studies;
    return j;
}

nlohmann::json ResultExporter::network_metadata() const {
    const auto& network = scorer_.network();
    const auto& measurements = scorer_.measurements();
    auto range = measurements.fold_change_range();

    nlohmann::json j;
    j["num_nodes"] = network.num_nodes();
    j["num_links"] = network.num_links();
    j["num_measured_nodes"] = scorer_.measured_count();
    j["studies"] = measurements.studies();
    j["fold_change_range"] = {range.first, range.second};
    j["min_p_value"] = measurements.min_p_value();
    j["min_p_value_log10"] = std::log10(measurements.min_p_value());
    j["significance_cutoff"] = significance_cutoff_;
    return j;
}

std::map<std::string, std::vector<std::string>> ResultExporter::memberships(
    const std::vector<Module>& modules) const {
    std::map<std::string, std::vector<std::string>> result;
    for (const auto& m : modules) {
        for (const auto& id : m.node_ids) {
            result[id].push_back(m.module_id);
        }
    }
    return result;
}

nlohmann::json ResultExporter::enriched_network(NetworkFormat format,
                                                const std::vector<Module>* modules) const {
    const auto& network = scorer_.network();

    std::map<std::string, std::vector<std::string>> member_of;
    if (modules) {
        member_of = memberships(*modules);
    }

    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& id : network.node_ids()) {
        auto record = node_record(id);
        if (modules) {
            auto it = member_of.find(id);
            record["modules"] = it != member_of.end() ? it->second : std::vector<std::string>{};
        }
        nodes.push_back(format == NetworkFormat::CYTOSCAPE
                            ? nlohmann::json{{"data", record}}
                            : record);
    }

    nlohmann::json links = nlohmann::json::array();
    for (const auto& link : network.links()) {
        auto record = link.to_json();
        if (format == NetworkFormat::CYTOSCAPE) {
            record["id"] = link.source + "--" + link.target;
            links.push_back({{"data", record}});
        } else {
            links.push_back(record);
        }
    }

    nlohmann::json j;
    if (format == NetworkFormat::CYTOSCAPE) {
        j["data"] = network_metadata();
        j["elements"] = {{"nodes", nodes}, {"edges", links}};
    } else {
        j["directed"] = false;
        j["multigraph"] = false;
        j["graph"] = network_metadata();
        j["nodes"] = nodes;
        j["links"] = links;
    }
    return j;
}

// ==========================================
// File output
// ==========================================

void ResultExporter::write_json(const nlohmann::json& j, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

void ResultExporter::write_modules(const ModuleCollection& collection,
                                   const std::string& path) const {
    write_json(modules_json(collection), path);
}

void ResultExporter::write_enriched_network(const std::string& path,
                                            NetworkFormat format,
                                            const std::vector<Module>* modules) const {
    write_json(enriched_network(format, modules), path);
}

// ==========================================
// Reading back
// ==========================================

EnrichedNetwork ResultExporter::parse_enriched_network(const nlohmann::json& j) {
    nlohmann::json node_records = nlohmann::json::array();
    nlohmann::json link_records = nlohmann::json::array();

    EnrichedNetwork result;

    if (j.contains("elements")) {
        for (const auto& n : j["elements"].value("nodes", nlohmann::json::array())) {
            node_records.push_back(n.at("data"));
        }
        for (const auto& e : j["elements"].value("edges", nlohmann::json::array())) {
            link_records.push_back(e.at("data"));
        }
        result.metadata = j.value("data", nlohmann::json::object());
    } else if (j.contains("nodes")) {
        node_records = j["nodes"];
        link_records = j.value("links", nlohmann::json::array());
        result.metadata = j.value("graph", nlohmann::json::object());
    } else {
        throw std::runtime_error("Enriched network has neither 'elements' nor 'nodes'");
    }

    std::vector<NetworkNode> nodes;
    for (const auto& record : node_records) {
        NetworkNode node = NetworkNode::from_json(record);

        CompositeScore s;
        s.missing = record.value("missing", true);
        s.num_studies = record.value("num_studies", 0);
        if (!s.missing) {
            s.z = record.at("composite_z").get<double>();
            s.p_value = record.at("composite_p_value").get<double>();
            s.fold_change = record.at("composite_fold_change").get<double>();
            s.activity = record.at("activity").get<double>();
        }
        result.scores[node.id] = s;

        if (record.contains("studies")) {
            for (const auto& [study, value] : record["studies"].items()) {
                result.measurements.add(node.id, study,
                                        value.at("fold_change").get<double>(),
                                        value.at("p_value").get<double>());
            }
        }

        if (record.contains("modules")) {
            result.memberships[node.id] = record["modules"].get<std::vector<std::string>>();
        }

        nodes.push_back(std::move(node));
    }

    std::vector<NetworkLink> links;
    for (const auto& record : link_records) {
        links.push_back(NetworkLink::from_json(record));
    }

    result.network = MetabolicNetwork(nodes, links);
    return result;
}

EnrichedNetwork ResultExporter::load_enriched_network(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open enriched network file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return parse_enriched_network(j);
}

} // namespace amod
