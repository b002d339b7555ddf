#include "scoring/measurement_table.hpp"
#include "network/metabolic_network.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <limits>

namespace amod {

namespace {

void check_value(const std::string& node_id, const std::string& study_id, const StudyValue& v) {
    if (node_id.empty()) {
        throw MeasurementError(node_id, study_id, "empty node identifier");
    }
    if (study_id.empty()) {
        throw MeasurementError(node_id, study_id, "empty study identifier");
    }
    if (!std::isfinite(v.fold_change)) {
        throw MeasurementError(node_id, study_id, "fold change is not finite");
    }
    if (!(v.p_value > 0.0 && v.p_value <= 1.0)) {
        throw MeasurementError(node_id, study_id,
                               "p-value " + std::to_string(v.p_value) + " outside (0, 1]");
    }
}

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, '\t')) {
        // Strip trailing carriage return from files written on Windows
        if (!item.empty() && item.back() == '\r') item.pop_back();
        fields.push_back(item);
    }
    return fields;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ==========================================
// StudyValue / Measurement
// ==========================================

double StudyValue::p_value_log10() const {
    return std::log10(p_value);
}

nlohmann::json Measurement::to_json() const {
    nlohmann::json j;
    j["node"] = node_id;
    j["study"] = study_id;
    j["fold_change"] = value.fold_change;
    j["p_value"] = value.p_value;
    return j;
}

Measurement Measurement::from_json(const nlohmann::json& j) {
    Measurement m;
    m.node_id = j.at("node").get<std::string>();
    m.study_id = j.at("study").get<std::string>();
    m.value.p_value = j.at("p_value").get<double>();

    if (j.contains("fold_change")) {
        m.value.fold_change = j["fold_change"].get<double>();
    } else if (j.contains("fold")) {
        double fold = j["fold"].get<double>();
        if (!(fold > 0.0)) {
            throw MeasurementError(m.node_id, m.study_id, "raw fold ratio must be positive");
        }
        m.value.fold_change = std::log2(fold);
    } else {
        throw MeasurementError(m.node_id, m.study_id, "missing fold_change");
    }

    return m;
}

// ==========================================
// MeasurementTable Implementation
// ==========================================

void MeasurementTable::add(const Measurement& m) {
    check_value(m.node_id, m.study_id, m.value);

    auto& studies = rows_[m.node_id];
    if (!studies.emplace(m.study_id, m.value).second) {
        throw MeasurementError(m.node_id, m.study_id, "duplicate measurement");
    }
    studies_.insert(m.study_id);
    num_rows_++;
}

void MeasurementTable::add(const std::string& node_id, const std::string& study_id,
                           double fold_change, double p_value) {
    Measurement m;
    m.node_id = node_id;
    m.study_id = study_id;
    m.value.fold_change = fold_change;
    m.value.p_value = p_value;
    add(m);
}

const MeasurementTable::StudyMap* MeasurementTable::find(const std::string& node_id) const {
    auto it = rows_.find(node_id);
    return it != rows_.end() ? &it->second : nullptr;
}

std::vector<std::string> MeasurementTable::studies() const {
    return std::vector<std::string>(studies_.begin(), studies_.end());
}

std::vector<std::string> MeasurementTable::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(rows_.size());
    for (const auto& [id, _] : rows_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> MeasurementTable::unmatched_nodes(const MetabolicNetwork& network) const {
    std::vector<std::string> unmatched;
    for (const auto& [id, _] : rows_) {
        if (!network.has_node(id)) unmatched.push_back(id);
    }
    return unmatched;
}

std::pair<double, double> MeasurementTable::fold_change_range() const {
    if (rows_.empty()) return {0.0, 0.0};

    double minimum = std::numeric_limits<double>::max();
    double maximum = std::numeric_limits<double>::lowest();
    for (const auto& [id, studies] : rows_) {
        for (const auto& [study, v] : studies) {
            minimum = std::min(minimum, v.fold_change);
            maximum = std::max(maximum, v.fold_change);
        }
    }
    return {minimum, maximum};
}

double MeasurementTable::min_p_value() const {
    double minimum = 1.0;
    for (const auto& [id, studies] : rows_) {
        for (const auto& [study, v] : studies) {
            minimum = std::min(minimum, v.p_value);
        }
    }
    return minimum;
}

nlohmann::json MeasurementTable::to_json() const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& [id, studies] : rows_) {
        for (const auto& [study, v] : studies) {
            rows.push_back(Measurement{id, study, v}.to_json());
        }
    }

    nlohmann::json j;
    j["measurements"] = rows;
    j["studies"] = studies();
    return j;
}

MeasurementTable MeasurementTable::from_json(const nlohmann::json& j) {
    MeasurementTable table;
    if (j.contains("measurements")) {
        for (const auto& row : j["measurements"]) {
            table.add(Measurement::from_json(row));
        }
    }
    return table;
}

MeasurementTable MeasurementTable::load(const std::string& filename) {
    if (ends_with(filename, ".tsv") || ends_with(filename, ".txt")) {
        return load_from_tsv(filename);
    }
    return load_from_json(filename);
}

MeasurementTable MeasurementTable::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open measurements file: " + filename);
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

MeasurementTable MeasurementTable::load_from_tsv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open measurements file: " + filename);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Empty measurements file: " + filename);
    }

    auto header = split_tabs(line);
    auto column = [&header](const std::string& name) -> int {
        auto it = std::find(header.begin(), header.end(), name);
        return it == header.end() ? -1 : static_cast<int>(it - header.begin());
    };

    int col_node = column("node");
    int col_study = column("study");
    int col_fold_change = column("fold_change");
    int col_fold = column("fold");
    int col_p = column("p_value");
    if (col_node < 0 || col_study < 0 || col_p < 0 || (col_fold_change < 0 && col_fold < 0)) {
        throw std::runtime_error("Measurements header must name node, study, fold_change (or fold), p_value: " +
                                 filename);
    }

    MeasurementTable table;
    size_t line_number = 1;
    while (std::getline(file, line)) {
        line_number++;
        if (line.empty() || line[0] == '#') continue;

        auto fields = split_tabs(line);
        if (fields.size() < header.size()) {
            throw std::runtime_error("Line " + std::to_string(line_number) + " of " + filename +
                                     " has " + std::to_string(fields.size()) + " fields, expected " +
                                     std::to_string(header.size()));
        }

        Measurement m;
        m.node_id = fields[col_node];
        m.study_id = fields[col_study];
        try {
            m.value.p_value = std::stod(fields[col_p]);
            if (col_fold_change >= 0) {
                m.value.fold_change = std::stod(fields[col_fold_change]);
            } else {
                double fold = std::stod(fields[col_fold]);
                if (!(fold > 0.0)) {
                    throw MeasurementError(m.node_id, m.study_id, "raw fold ratio must be positive");
                }
                m.value.fold_change = std::log2(fold);
            }
        } catch (const std::invalid_argument& e) {
            if (dynamic_cast<const MeasurementError*>(&e)) throw;
            throw MeasurementError(m.node_id, m.study_id,
                                   "non-numeric value on line " + std::to_string(line_number));
        } catch (const std::out_of_range&) {
            throw MeasurementError(m.node_id, m.study_id,
                                   "value out of range on line " + std::to_string(line_number));
        }

        table.add(m);
    }

    return table;
}

} // namespace amod
