#include "scoring_profile.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace review_scoring {

const ScoringProfile& RealtimeProfile() {
    static const ScoringProfile profile{
        std::string(kRealtimeProfileName),
        &RealtimeLexicon(),
        MixedLanguageMatch::kTokenSet,
        CapsRatioSource::kOriginalText,
        20,
        QualityPolicy{true, true},
    };
    return profile;
}

const ScoringProfile& BatchInferenceProfile() {
    static const ScoringProfile profile{
        std::string(kBatchInferenceProfileName),
        &BatchInferenceLexicon(),
        MixedLanguageMatch::kSubstring,
        CapsRatioSource::kNormalizedText,
        0,
        QualityPolicy{false, false},
    };
    return profile;
}

const ScoringProfile& ProfileByName(std::string_view name) {
    if (name == kRealtimeProfileName) return RealtimeProfile();
    if (name == kBatchInferenceProfileName) return BatchInferenceProfile();
    throw std::invalid_argument(fmt::format("Unknown scoring profile: '{}'", name));
}

} // namespace review_scoring
