#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace review_scoring {

// Первые kGenericPhraseCount фраз списка - шаблонная похвала,
// остальные - рекламный язык. Индекс разделения фиксирован.
inline constexpr std::size_t kGenericPhraseCount = 8;

enum class MixedLanguageMatch {
    kTokenSet,   // пересечение множества токенов со словарями
    kSubstring,  // вхождение подстроки в текст
};

struct LexiconSet {
    std::unordered_set<std::string> malaysian_terms;
    std::unordered_set<std::string> product_terms;
    std::vector<std::string> suspicious_phrases;
    std::unordered_set<std::string> malay_function_words;
    std::unordered_set<std::string> english_function_words;
};

// Словари веб-движка
const LexiconSet& RealtimeLexicon();

// Словари автономного сервиса классификации
const LexiconSet& BatchInferenceLexicon();

// Английские стоп-слова (список NLTK)
const std::unordered_set<std::string>& EnglishStopWords();

struct LexiconMatch {
    int malaysian_terms_count = 0;
    double malaysian_terms_ratio = 0.0;
    int product_terms_count = 0;
    double product_terms_ratio = 0.0;
    bool has_mixed_language = false;
    bool has_specific_details = false;
    bool has_generic_phrases = false;
    bool has_promotional_language = false;
};

class LexiconMatcher {
public:
    LexiconMatcher(const LexiconSet& lexicon, MixedLanguageMatch mixed_match);

    // tokens - токены в нижнем регистре, text - нормализованный текст
    LexiconMatch Match(const std::vector<std::string>& tokens, std::string_view text) const;

    bool DetectMixedLanguage(const std::vector<std::string>& tokens, std::string_view text) const;

private:
    static bool ContainsAny(std::string_view text,
                            std::vector<std::string>::const_iterator begin,
                            std::vector<std::string>::const_iterator end);

    const LexiconSet& lexicon_;
    MixedLanguageMatch mixed_match_;
};

// count / word_count, 0 при пустом списке токенов
double SafeRatio(std::size_t count, std::size_t word_count);

} // namespace review_scoring
