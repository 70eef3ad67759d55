#include "linguistic_feature_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include <userver/logging/log.hpp>

#include "text_analyzers/tokenizers.hpp"

namespace review_scoring {

namespace {

bool IsSentenceTerminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool IsRatioPunctuation(char c) {
    switch (c) {
        case '.': case ',': case '!': case '?': case ';': case ':':
            return true;
        default:
            return false;
    }
}

bool IsAlphabetic(const std::string& word) {
    if (word.empty()) return false;
    return std::all_of(word.begin(), word.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    });
}

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

} // anonymous namespace

LinguisticFeatureExtractor::LinguisticFeatureExtractor(TextAnalyzers analyzers, const ScoringProfile& profile)
    : analyzers_(std::move(analyzers))
    , profile_(profile)
    , matcher_(*profile.lexicon, profile.mixed_language_match) {}

std::vector<std::string> LinguisticFeatureExtractor::Tokenize(const std::string& text) const {
    if (analyzers_.tokenizer) {
        try {
            return analyzers_.tokenizer->Tokenize(text);
        } catch (const std::exception& e) {
            LOG_WARNING() << "Tokenizer failed, falling back to whitespace split: " << e.what();
        }
    }
    return WhitespaceTokenizer{}.Tokenize(text);
}

SentimentScores LinguisticFeatureExtractor::ScoreSentiment(const std::string& text) const {
    if (!analyzers_.sentiment) return SentimentScores{};
    try {
        return analyzers_.sentiment->PolarityScores(text);
    } catch (const std::exception& e) {
        LOG_WARNING() << "Sentiment analyzer failed, using neutral defaults: " << e.what();
        return SentimentScores{};
    }
}

PolaritySubjectivity LinguisticFeatureExtractor::ScorePolarity(const std::string& text) const {
    if (!analyzers_.polarity) return PolaritySubjectivity{};
    try {
        return analyzers_.polarity->Analyze(text);
    } catch (const std::exception& e) {
        LOG_WARNING() << "Polarity analyzer failed, using neutral defaults: " << e.what();
        return PolaritySubjectivity{};
    }
}

double LinguisticFeatureExtractor::CapsRatio(const NormalizedText& text) const {
    const std::string& source =
        profile_.caps_ratio_source == CapsRatioSource::kOriginalText ? text.source : text.text;
    if (source.empty()) return 0.0;

    const auto upper = std::count_if(source.begin(), source.end(), [](char c) {
        return std::isupper(static_cast<unsigned char>(c)) != 0;
    });
    return SafeRatio(static_cast<std::size_t>(upper), source.size());
}

int LinguisticFeatureExtractor::CountSpellingErrors(const std::vector<std::string>& tokens) const {
    const auto& stop_words = EnglishStopWords();
    const std::size_t limit = profile_.spelling_window == 0
        ? tokens.size()
        : std::min(profile_.spelling_window, tokens.size());

    int errors = 0;
    for (std::size_t i = 0; i < limit; ++i) {
        const auto& word = tokens[i];
        if (word.size() > 3 && !IsAlphabetic(word) && !stop_words.count(word)) {
            ++errors;
        }
    }
    return errors;
}

// Число сегментов после разбиения по [.!?]+, пустые сегменты по краям тоже считаются
int LinguisticFeatureExtractor::CountSentences(std::string_view text) {
    int separators = 0;
    bool in_run = false;
    for (char c : text) {
        if (IsSentenceTerminator(c)) {
            if (!in_run) ++separators;
            in_run = true;
        } else {
            in_run = false;
        }
    }
    return separators + 1;
}

FeatureRecord LinguisticFeatureExtractor::Extract(const NormalizedText& normalized) const {
    if (normalized.text.empty() || IsBlank(normalized.text)) {
        return FeatureRecord::Empty();
    }

    const std::string& text = normalized.text;
    const auto tokens = Tokenize(text);

    FeatureRecord features;
    features.length = static_cast<int>(text.size());
    features.word_count = static_cast<int>(tokens.size());

    if (!tokens.empty()) {
        std::size_t total_length = 0;
        for (const auto& token : tokens) total_length += token.size();
        features.avg_word_length = static_cast<double>(total_length) / static_cast<double>(tokens.size());
    }

    features.sentence_count = CountSentences(text);
    features.exclamation_count = static_cast<int>(std::count(text.begin(), text.end(), '!'));
    features.question_count = static_cast<int>(std::count(text.begin(), text.end(), '?'));
    features.caps_ratio = CapsRatio(normalized);
    features.punctuation_ratio = SafeRatio(
        static_cast<std::size_t>(std::count_if(text.begin(), text.end(), IsRatioPunctuation)),
        text.size());

    const auto sentiment = ScoreSentiment(text);
    features.sentiment_compound = sentiment.compound;
    features.sentiment_positive = sentiment.positive;
    features.sentiment_negative = sentiment.negative;
    features.sentiment_neutral = sentiment.neutral;

    const auto lexicon = matcher_.Match(tokens, text);
    features.malaysian_terms_count = lexicon.malaysian_terms_count;
    features.malaysian_terms_ratio = lexicon.malaysian_terms_ratio;
    features.product_terms_count = lexicon.product_terms_count;
    features.product_terms_ratio = lexicon.product_terms_ratio;
    features.has_mixed_language = lexicon.has_mixed_language;
    features.has_specific_details = lexicon.has_specific_details;
    features.has_generic_phrases = lexicon.has_generic_phrases;
    features.has_promotional_language = lexicon.has_promotional_language;

    const std::unordered_set<std::string> distinct(tokens.begin(), tokens.end());
    features.repeated_words = static_cast<int>(tokens.size() - distinct.size());
    features.spelling_errors = CountSpellingErrors(tokens);

    const auto polarity = ScorePolarity(text);
    features.textblob_polarity = polarity.polarity;
    features.textblob_subjectivity = polarity.subjectivity;

    LOG_DEBUG() << "Extracted features: words=" << features.word_count
                << " malaysian=" << features.malaysian_terms_count
                << " product=" << features.product_terms_count;

    return features;
}

} // namespace review_scoring
