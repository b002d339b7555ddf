#include "scoring/significance_scorer.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace amod {

namespace {

// Largest p-value fed to the activity transform; keeps Phi^-1 finite at p = 1
constexpr double kMaxActivityP = 1.0 - 1e-12;

const double kSqrt2 = std::sqrt(2.0);
const double kSqrt2Pi = std::sqrt(2.0 * 3.14159265358979323846);

} // namespace

// ==========================================
// ScorerConfig
// ==========================================

double ScorerConfig::weight_for(const std::string& study_id) const {
    auto it = study_weights.find(study_id);
    return it != study_weights.end() ? it->second : 1.0;
}

nlohmann::json ScorerConfig::to_json() const {
    nlohmann::json j;
    j["study_weights"] = study_weights;
    j["p_value_floor"] = p_value_floor;
    return j;
}

ScorerConfig ScorerConfig::from_json(const nlohmann::json& j) {
    ScorerConfig config;
    if (j.contains("study_weights")) {
        config.study_weights = j["study_weights"].get<std::map<std::string, double>>();
    }
    config.p_value_floor = j.value("p_value_floor", config.p_value_floor);
    return config;
}

bool ScorerConfig::validate(std::string& error_message) const {
    for (const auto& [study, weight] : study_weights) {
        if (!std::isfinite(weight) || weight <= 0.0) {
            error_message = "study_weights." + study + ": weight must be finite and positive";
            return false;
        }
    }

    if (!(p_value_floor >= 1e-300 && p_value_floor <= 1e-3)) {
        error_message = "p_value_floor: must be between 1e-300 and 1e-3";
        return false;
    }

    return true;
}

// ==========================================
// CompositeScore
// ==========================================

nlohmann::json CompositeScore::to_json() const {
    nlohmann::json j;
    j["missing"] = missing;
    j["num_studies"] = num_studies;
    if (missing) {
        j["z"] = nullptr;
        j["p_value"] = nullptr;
        j["fold_change"] = nullptr;
        j["activity"] = nullptr;
    } else {
        j["z"] = z;
        j["p_value"] = p_value;
        j["fold_change"] = fold_change;
        j["activity"] = activity;
    }
    return j;
}

CompositeScore CompositeScore::from_json(const nlohmann::json& j) {
    CompositeScore s;
    s.missing = j.value("missing", true);
    s.num_studies = j.value("num_studies", 0);
    if (!s.missing) {
        s.z = j.at("z").get<double>();
        s.p_value = j.at("p_value").get<double>();
        s.fold_change = j.at("fold_change").get<double>();
        s.activity = j.at("activity").get<double>();
    }
    return s;
}

// ==========================================
// SignificanceScorer Implementation
// ==========================================

SignificanceScorer::SignificanceScorer(const MetabolicNetwork& network,
                                       const MeasurementTable& measurements,
                                       const ScorerConfig& config)
    : network_(network), measurements_(measurements), config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw configuration_error(error);
    }

    for (const auto& id : network_.node_ids()) {
        const auto* studies = measurements_.find(id);
        CompositeScore s = studies ? combine(*studies, config_) : CompositeScore{};
        if (!s.missing) measured_count_++;
        scores_.emplace(id, s);
    }
}

const CompositeScore& SignificanceScorer::score(const std::string& node_id) const {
    auto it = scores_.find(node_id);
    if (it == scores_.end()) {
        throw NotFoundError(node_id);
    }
    return it->second;
}

CompositeScore SignificanceScorer::combine(const MeasurementTable::StudyMap& studies,
                                           const ScorerConfig& config) {
    CompositeScore s;
    if (studies.empty()) return s;

    double weighted_z = 0.0;
    double weight_sq = 0.0;
    double weighted_fold = 0.0;
    double weight_sum = 0.0;

    for (const auto& [study, value] : studies) {
        double w = config.weight_for(study);
        weighted_z += w * study_z(value.fold_change, value.p_value, config.p_value_floor);
        weight_sq += w * w;
        weighted_fold += w * value.fold_change;
        weight_sum += w;
    }

    s.missing = false;
    s.num_studies = static_cast<int>(studies.size());
    s.z = weighted_z / std::sqrt(weight_sq);
    s.fold_change = weighted_fold / weight_sum;
    s.p_value = std::max(z_to_p(s.z), config.p_value_floor);
    s.activity = -normal_quantile(std::min(s.p_value, kMaxActivityP));
    return s;
}

double SignificanceScorer::study_z(double fold_change, double p_value, double p_floor) {
    if (fold_change == 0.0) return 0.0;

    // One-sided p in the observed direction
    double one_sided = std::max(p_value, p_floor) / 2.0;
    double magnitude = -normal_quantile(one_sided);
    return fold_change > 0.0 ? magnitude : -magnitude;
}

double SignificanceScorer::z_to_p(double z) {
    return std::erfc(std::fabs(z) / kSqrt2);
}

double SignificanceScorer::normal_cdf(double x) {
    return 0.5 * std::erfc(-x / kSqrt2);
}

double SignificanceScorer::normal_quantile(double p) {
    if (p <= 0.0) return -std::numeric_limits<double>::infinity();
    if (p >= 1.0) return std::numeric_limits<double>::infinity();

    // Acklam's rational approximation
    static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                               -2.759285104469687e+02, 1.383577518672690e+02,
                               -3.066479806614716e+01, 2.506628277459239e+00};
    static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                               -1.556989798598866e+02, 6.680131188771972e+01,
                               -1.328068155288572e+01};
    static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                               -2.400758277161838e+00, -2.549732539343734e+00,
                               4.374664141464968e+00, 2.938163982698783e+00};
    static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                               2.445134137142996e+00, 3.754408661907416e+00};
    const double p_low = 0.02425;

    double x;
    if (p < p_low) {
        double q = std::sqrt(-2.0 * std::log(p));
        x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    } else if (p <= 1.0 - p_low) {
        double q = p - 0.5;
        double r = q * q;
        x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
            (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    } else {
        double q = std::sqrt(-2.0 * std::log1p(-p));
        x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }

    // One Halley step against erfc brings the error to machine precision
    double e = normal_cdf(x) - p;
    double u = e * kSqrt2Pi * std::exp(x * x / 2.0);
    x = x - u / (1.0 + x * u / 2.0);

    return x;
}

} // namespace amod
