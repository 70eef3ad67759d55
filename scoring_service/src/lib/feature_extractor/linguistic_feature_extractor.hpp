#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "feature_extractor/feature_record.hpp"
#include "lexicon/lexicon.hpp"
#include "scoring_profile/scoring_profile.hpp"
#include "text_analyzers/text_analyzers.hpp"
#include "text_normalizer/text_normalizer.hpp"

namespace review_scoring {

class LinguisticFeatureExtractor {
public:
    LinguisticFeatureExtractor(TextAnalyzers analyzers, const ScoringProfile& profile);

    // Никогда не бросает: сбои анализаторов заменяются значениями по умолчанию
    FeatureRecord Extract(const NormalizedText& text) const;

    const ScoringProfile& Profile() const { return profile_; }
    bool HasSentimentAnalyzer() const { return analyzers_.sentiment != nullptr; }

private:
    std::vector<std::string> Tokenize(const std::string& text) const;
    SentimentScores ScoreSentiment(const std::string& text) const;
    PolaritySubjectivity ScorePolarity(const std::string& text) const;
    double CapsRatio(const NormalizedText& text) const;
    int CountSpellingErrors(const std::vector<std::string>& tokens) const;

    static int CountSentences(std::string_view text);

    TextAnalyzers analyzers_;
    const ScoringProfile& profile_;
    LexiconMatcher matcher_;
};

} // namespace review_scoring
