#include "feature_record.hpp"

namespace review_scoring {

namespace {

double AsDouble(bool value) {
    return value ? 1.0 : 0.0;
}

} // anonymous namespace

const std::array<FeatureColumn, kModelFeatureCount>& ModelFeatureColumns() {
    static const std::array<FeatureColumn, kModelFeatureCount> columns{{
        {"length", [](const FeatureRecord& r) { return static_cast<double>(r.length); }},
        {"word_count", [](const FeatureRecord& r) { return static_cast<double>(r.word_count); }},
        {"avg_word_length", [](const FeatureRecord& r) { return r.avg_word_length; }},
        {"sentence_count", [](const FeatureRecord& r) { return static_cast<double>(r.sentence_count); }},
        {"exclamation_count", [](const FeatureRecord& r) { return static_cast<double>(r.exclamation_count); }},
        {"question_count", [](const FeatureRecord& r) { return static_cast<double>(r.question_count); }},
        {"caps_ratio", [](const FeatureRecord& r) { return r.caps_ratio; }},
        {"punctuation_ratio", [](const FeatureRecord& r) { return r.punctuation_ratio; }},
        {"sentiment_compound", [](const FeatureRecord& r) { return r.sentiment_compound; }},
        {"sentiment_positive", [](const FeatureRecord& r) { return r.sentiment_positive; }},
        {"sentiment_negative", [](const FeatureRecord& r) { return r.sentiment_negative; }},
        {"malaysian_terms_count", [](const FeatureRecord& r) { return static_cast<double>(r.malaysian_terms_count); }},
        {"malaysian_terms_ratio", [](const FeatureRecord& r) { return r.malaysian_terms_ratio; }},
        {"product_terms_count", [](const FeatureRecord& r) { return static_cast<double>(r.product_terms_count); }},
        {"product_terms_ratio", [](const FeatureRecord& r) { return r.product_terms_ratio; }},
        {"repeated_words", [](const FeatureRecord& r) { return static_cast<double>(r.repeated_words); }},
        {"spelling_errors", [](const FeatureRecord& r) { return static_cast<double>(r.spelling_errors); }},
        {"textblob_polarity", [](const FeatureRecord& r) { return r.textblob_polarity; }},
        {"textblob_subjectivity", [](const FeatureRecord& r) { return r.textblob_subjectivity; }},
        {"has_mixed_language", [](const FeatureRecord& r) { return AsDouble(r.has_mixed_language); }},
        {"has_specific_details", [](const FeatureRecord& r) { return AsDouble(r.has_specific_details); }},
        {"has_generic_phrases", [](const FeatureRecord& r) { return AsDouble(r.has_generic_phrases); }},
        {"has_promotional_language", [](const FeatureRecord& r) { return AsDouble(r.has_promotional_language); }},
    }};
    return columns;
}

const std::vector<FeatureColumn>& AllFeatureColumns() {
    static const std::vector<FeatureColumn> columns = [] {
        const auto& model = ModelFeatureColumns();
        std::vector<FeatureColumn> all(model.begin(), model.end());
        all.insert(all.begin() + 11,
                   FeatureColumn{"sentiment_neutral", [](const FeatureRecord& r) { return r.sentiment_neutral; }});
        return all;
    }();
    return columns;
}

bool operator==(const FeatureRecord& lhs, const FeatureRecord& rhs) {
    for (const auto& column : AllFeatureColumns()) {
        if (column.value(lhs) != column.value(rhs)) return false;
    }
    return true;
}

bool operator!=(const FeatureRecord& lhs, const FeatureRecord& rhs) {
    return !(lhs == rhs);
}

} // namespace review_scoring
