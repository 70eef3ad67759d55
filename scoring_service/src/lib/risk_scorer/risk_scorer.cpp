#include "risk_scorer.hpp"

#include <algorithm>

namespace review_scoring {

std::string_view ToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::kHigh:
            return "HIGH";
        case RiskLevel::kMedium:
            return "MEDIUM";
        case RiskLevel::kLow:
            return "LOW";
        case RiskLevel::kMinimal:
            return "MINIMAL";
    }
    return "MINIMAL";
}

RiskLevel RiskScorer::RiskLevelFor(double fake_probability) {
    if (fake_probability >= kHighThreshold) return RiskLevel::kHigh;
    if (fake_probability >= kMediumThreshold) return RiskLevel::kMedium;
    if (fake_probability >= kLowThreshold) return RiskLevel::kLow;
    return RiskLevel::kMinimal;
}

int RiskScorer::QualityScore(const FeatureRecord& features, const QualityPolicy& policy) {
    int score = 50;

    if (features.word_count >= 15) score += 10;
    if (features.malaysian_terms_count > 0) score += 15;
    if (features.has_mixed_language) score += 10;
    if (features.has_specific_details) score += 10;
    if (policy.sentiment_window_bonus &&
        features.sentiment_compound >= 0.2 && features.sentiment_compound <= 0.8) {
        score += 5;
    }

    if (features.exclamation_count > kExcessiveExclamations) score -= 15;
    if (features.has_generic_phrases) score -= 10;
    if (features.has_promotional_language) score -= 15;
    if (policy.caps_penalty && features.caps_ratio > kExcessiveCapsRatio) score -= 10;

    return std::max(0, std::min(100, score));
}

std::vector<std::string> RiskScorer::SuspiciousPatterns(const FeatureRecord& features) {
    std::vector<std::string> patterns;

    if (features.has_generic_phrases) {
        patterns.emplace_back("generic_phrases");
    }
    if (features.has_promotional_language) {
        patterns.emplace_back("promotional_language");
    }
    if (features.exclamation_count > kExcessiveExclamations) {
        patterns.emplace_back("excessive_punctuation");
    }
    if (features.caps_ratio > kExcessiveCapsRatio) {
        patterns.emplace_back("excessive_caps");
    }
    if (features.repeated_words > kRepetitionFactor * features.word_count) {
        patterns.emplace_back("repetitive_language");
    }

    return patterns;
}

} // namespace review_scoring
