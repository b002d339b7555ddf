#pragma once

#include "network/metabolic_network.hpp"
#include "scoring/measurement_table.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <functional>

namespace amod {

/**
 * @brief Scoring configuration
 */
struct ScorerConfig {
    std::map<std::string, double> study_weights;  ///< study id -> weight (absent = 1.0)
    double p_value_floor = 1e-300;                ///< Smallest p-value used in z conversion

    double weight_for(const std::string& study_id) const;

    nlohmann::json to_json() const;
    static ScorerConfig from_json(const nlohmann::json& j);

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Composite significance of one node across all studies
 *
 * A node measured in no study is missing: its z, p and activity carry no
 * meaning and every consumer must test `missing` first. A measured node with
 * z == 0 is a legitimate, non-significant score.
 */
struct CompositeScore {
    bool missing = true;
    double z = 0.0;               ///< Signed Stouffer z (accumulation > 0, depletion < 0)
    double p_value = 1.0;         ///< Two-sided p-value of z
    double fold_change = 0.0;     ///< Weight-averaged signed fold change
    double activity = 0.0;        ///< Phi^-1(1 - p): contribution to module scores
    int num_studies = 0;

    bool is_missing() const { return missing; }

    nlohmann::json to_json() const;
    static CompositeScore from_json(const nlohmann::json& j);
};

/**
 * @brief Converts per-study (fold change, p-value) pairs into composite scores
 *
 * Scores are computed once for every network node at construction and are
 * read-only afterwards.
 */
class SignificanceScorer {
public:
    /**
     * @throws ConfigurationError if the config does not validate
     */
    SignificanceScorer(const MetabolicNetwork& network,
                       const MeasurementTable& measurements,
                       const ScorerConfig& config = {});

    /**
     * @brief Composite score of a node
     * @throws NotFoundError if the node is not in the network
     */
    const CompositeScore& score(const std::string& node_id) const;

    const std::map<std::string, CompositeScore>& scores() const { return scores_; }

    const MetabolicNetwork& network() const { return network_; }
    const MeasurementTable& measurements() const { return measurements_; }
    const ScorerConfig& config() const { return config_; }

    size_t measured_count() const { return measured_count_; }

    /**
     * @brief Combine one node's study values; returns a missing score for an empty map
     */
    static CompositeScore combine(const MeasurementTable::StudyMap& studies,
                                  const ScorerConfig& config = {});

    // ==========================================
    // Normal distribution helpers
    // ==========================================

    /**
     * @brief Signed z-score of one study: sign(fold) * Phi^-1(1 - p/2)
     */
    static double study_z(double fold_change, double p_value, double p_floor = 1e-300);

    /**
     * @brief Two-sided p-value of a z-score: erfc(|z| / sqrt 2)
     */
    static double z_to_p(double z);

    static double normal_cdf(double x);

    /**
     * @brief Inverse of the standard normal CDF for p in (0, 1)
     */
    static double normal_quantile(double p);

private:
    const MetabolicNetwork& network_;
    const MeasurementTable& measurements_;
    ScorerConfig config_;
    std::map<std::string, CompositeScore> scores_;
    size_t measured_count_ = 0;
};

} // namespace amod
