#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace review_scoring {

// Закрытая схема признаков. Все поля присутствуют всегда;
// отсутствующий сигнал - значение по умолчанию, а не пропуск.
struct FeatureRecord {
    int length = 0;
    int word_count = 0;
    double avg_word_length = 0.0;
    int sentence_count = 0;
    int exclamation_count = 0;
    int question_count = 0;
    double caps_ratio = 0.0;
    double punctuation_ratio = 0.0;

    double sentiment_compound = 0.0;
    double sentiment_positive = 0.0;
    double sentiment_negative = 0.0;
    double sentiment_neutral = 0.5;

    int malaysian_terms_count = 0;
    double malaysian_terms_ratio = 0.0;
    int product_terms_count = 0;
    double product_terms_ratio = 0.0;
    bool has_mixed_language = false;
    bool has_specific_details = false;

    bool has_generic_phrases = false;
    bool has_promotional_language = false;
    int repeated_words = 0;
    int spelling_errors = 0;

    double textblob_polarity = 0.0;
    double textblob_subjectivity = 0.5;

    // Каноническая запись для пустого текста
    static FeatureRecord Empty() { return FeatureRecord{}; }
};

bool operator==(const FeatureRecord& lhs, const FeatureRecord& rhs);
bool operator!=(const FeatureRecord& lhs, const FeatureRecord& rhs);

struct FeatureColumn {
    std::string_view name;
    double (*value)(const FeatureRecord&);
};

// Версия порядка признаков, общего с обученной моделью.
// Любое изменение порядка ломает совместимость с уже обученными моделями.
inline constexpr int kFeatureSchemaVersion = 1;
inline constexpr std::size_t kNumericFeatureCount = 19;
inline constexpr std::size_t kBinaryFeatureCount = 4;
inline constexpr std::size_t kModelFeatureCount = kNumericFeatureCount + kBinaryFeatureCount;

// 19 числовых признаков, затем 4 булевых (0/1) - порядок входа модели
const std::array<FeatureColumn, kModelFeatureCount>& ModelFeatureColumns();

// Все поля записи, включая не входящие в модель (sentiment_neutral)
const std::vector<FeatureColumn>& AllFeatureColumns();

} // namespace review_scoring
