#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "lexicon/lexicon.hpp"
#include "risk_scorer/risk_scorer.hpp"

namespace review_scoring {

enum class CapsRatioSource {
    kOriginalText,    // исходный регистр текста до нормализации
    kNormalizedText,  // уже нормализованный текст (всегда 0)
};

// Именованный набор политик конвейера.
// "realtime" - веб-движок, "batch-inference" - автономный сервис классификации.
struct ScoringProfile {
    std::string name;
    const LexiconSet* lexicon = nullptr;
    MixedLanguageMatch mixed_language_match = MixedLanguageMatch::kTokenSet;
    CapsRatioSource caps_ratio_source = CapsRatioSource::kOriginalText;
    std::size_t spelling_window = 20;  // 0 - все токены
    QualityPolicy quality;
};

inline constexpr std::string_view kRealtimeProfileName = "realtime";
inline constexpr std::string_view kBatchInferenceProfileName = "batch-inference";

const ScoringProfile& RealtimeProfile();
const ScoringProfile& BatchInferenceProfile();

// Бросает std::invalid_argument для неизвестного имени
const ScoringProfile& ProfileByName(std::string_view name);

} // namespace review_scoring
