#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ml_model/model_interface.hpp"
#include "risk_scorer/risk_scorer.hpp"

namespace review_scoring {

using Seconds = std::chrono::duration<double>;

inline constexpr std::string_view kTooShortReason = "TOO_SHORT";

enum class PredictionErrorKind {
    kModelNotLoaded,
    kClassifierFailure,
};

std::string_view ToString(PredictionErrorKind kind);

struct PredictionError {
    PredictionErrorKind kind = PredictionErrorKind::kClassifierFailure;
    std::string message;
};

struct AnalysisDetails {
    int word_count = 0;
    double sentiment_score = 0.0;
    int malaysian_terms = 0;
    bool has_mixed_language = false;
    bool has_specific_details = false;
};

struct PredictionMetadata {
    std::size_t text_length = 0;
    std::size_t processed_length = 0;
    std::string model_version;
    std::string timestamp;
};

struct PredictionResult {
    ReviewLabel label = ReviewLabel::kUnknown;
    double confidence = 0.0;
    double fake_probability = 0.0;
    double real_probability = 0.0;
    RiskLevel risk_level = RiskLevel::kMinimal;
    int quality_score = 0;
    std::vector<std::string> suspicious_patterns;
    Seconds elapsed{0.0};

    std::optional<std::string> reason;
    std::optional<PredictionError> error;

    AnalysisDetails analysis;
    PredictionMetadata metadata;

    // UNKNOWN и ERROR в батче считаются ошибками
    bool IsError() const { return label == ReviewLabel::kUnknown || label == ReviewLabel::kError; }
};

struct BatchEntry {
    std::size_t index = 0;
    std::string preview;  // первые 100 символов, "..." если текст обрезан
    PredictionResult result;
};

struct BatchStatistics {
    std::size_t total = 0;
    std::size_t fake_count = 0;
    std::size_t real_count = 0;
    std::size_t error_count = 0;
    double average_confidence = 0.0;  // только по успешным
    double fake_percentage = 0.0;     // fake / (total - error) * 100
    Seconds processing_time{0.0};
};

struct BatchResult {
    std::vector<BatchEntry> entries;
    BatchStatistics statistics;
};

struct PerformanceSnapshot {
    std::uint64_t total_predictions = 0;
    double average_prediction_time = 0.0;
    double total_prediction_time = 0.0;
    bool model_loaded = false;
    std::string model_path;
};

struct ComponentPresence {
    bool model = false;
    bool vectorizer = false;
    bool scaler = false;
    bool nlp = false;
    bool feature_extractor = false;
};

struct HealthStatus {
    std::string status;  // healthy / unhealthy
    bool model_loaded = false;
    ComponentPresence components;
    PerformanceSnapshot performance;
    std::string version;
    std::string timestamp;
};

struct FeatureExplanation {
    std::string original_text;
    std::string cleaned_text;
    std::string profile;
    std::vector<std::pair<std::string, double>> features;
    int quality_score = 0;
    std::vector<std::string> suspicious_patterns;
};

class BatchTooLargeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace review_scoring
