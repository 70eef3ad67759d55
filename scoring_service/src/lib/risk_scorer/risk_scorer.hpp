#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "feature_extractor/feature_record.hpp"

namespace review_scoring {

enum class RiskLevel {
    kMinimal,
    kLow,
    kMedium,
    kHigh,
};

std::string_view ToString(RiskLevel level);

// Расхождения двух исторических реализаций оценки качества
struct QualityPolicy {
    bool sentiment_window_bonus = true;  // +5 при sentiment_compound в [0.2, 0.8]
    bool caps_penalty = true;            // -10 при caps_ratio > 0.2
};

class RiskScorer {
public:
    static constexpr double kHighThreshold = 0.8;
    static constexpr double kMediumThreshold = 0.6;
    static constexpr double kLowThreshold = 0.4;

    static constexpr double kExcessiveCapsRatio = 0.2;
    static constexpr int kExcessiveExclamations = 5;
    static constexpr double kRepetitionFactor = 0.3;

    // Нижние границы включены: 0.8 -> HIGH, 0.79999 -> MEDIUM
    static RiskLevel RiskLevelFor(double fake_probability);

    // Эвристическая оценка качества текста, всегда в [0, 100]
    static int QualityScore(const FeatureRecord& features, const QualityPolicy& policy);

    // Теги в фиксированном порядке
    static std::vector<std::string> SuspiciousPatterns(const FeatureRecord& features);
};

} // namespace review_scoring
