#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <set>

namespace amod {

class MetabolicNetwork;

/**
 * @brief One study's measurement of one node
 *
 * fold_change is signed and log-scale (positive = accumulation,
 * negative = depletion). p_value is the two-sided test p-value in (0, 1].
 */
struct StudyValue {
    double fold_change = 0.0;
    double p_value = 1.0;

    double p_value_log10() const;
    bool is_significant(double threshold) const { return p_value < threshold; }

    bool operator==(const StudyValue& other) const {
        return fold_change == other.fold_change && p_value == other.p_value;
    }
};

/**
 * @brief Row of a measurement table
 */
struct Measurement {
    std::string node_id;
    std::string study_id;
    StudyValue value;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a row; accepts "fold_change" (log2) or "fold" (raw ratio)
     * @throws MeasurementError for out-of-range values
     */
    static Measurement from_json(const nlohmann::json& j);
};

/**
 * @brief Sparse node x study table of (fold change, p-value) pairs
 *
 * Not every node/study pair is present. A node without any row is
 * unmeasured; the scorer turns that into an explicit missing marker.
 */
class MeasurementTable {
public:
    using StudyMap = std::map<std::string, StudyValue>;

    MeasurementTable() = default;

    /**
     * @brief Add a row
     * @throws MeasurementError on invalid values or a duplicate node/study pair
     */
    void add(const Measurement& m);
    void add(const std::string& node_id, const std::string& study_id,
             double fold_change, double p_value);

    /**
     * @brief Per-study values of a node, or nullptr when unmeasured
     */
    const StudyMap* find(const std::string& node_id) const;

    bool has_measurement(const std::string& node_id) const { return find(node_id) != nullptr; }

    /**
     * @brief All study ids, sorted
     */
    std::vector<std::string> studies() const;

    /**
     * @brief All measured node ids, sorted
     */
    std::vector<std::string> node_ids() const;

    /**
     * @brief Measured ids that the network does not contain, sorted
     */
    std::vector<std::string> unmatched_nodes(const MetabolicNetwork& network) const;

    /**
     * @brief Minimal and maximal fold change across all rows
     */
    std::pair<double, double> fold_change_range() const;

    /**
     * @brief Minimal p-value across all rows (1.0 for an empty table)
     */
    double min_p_value() const;

    size_t size() const { return num_rows_; }
    size_t num_nodes() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;
    static MeasurementTable from_json(const nlohmann::json& j);

    /**
     * @brief Load a table, JSON or TSV chosen by file extension
     */
    static MeasurementTable load(const std::string& filename);
    static MeasurementTable load_from_json(const std::string& filename);

    /**
     * @brief Load tab-separated rows with header node, study, fold_change|fold, p_value
     */
    static MeasurementTable load_from_tsv(const std::string& filename);

private:
    std::map<std::string, StudyMap> rows_;   // node_id -> study_id -> value
    std::set<std::string> studies_;
    size_t num_rows_ = 0;
};

} // namespace amod
