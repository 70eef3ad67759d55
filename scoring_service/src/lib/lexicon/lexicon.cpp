#include "lexicon.hpp"

#include <algorithm>

namespace review_scoring {

const LexiconSet& RealtimeLexicon() {
    static const LexiconSet lexicon{
        {
            "shiok", "confirm", "steady", "power", "cantik", "lawa", "terror",
            "bagus", "teruk", "rosak", "murah", "baik", "elok", "mantap",
            "tiptop", "padu", "mmg", "sgt", "dia", "kt", "kat", "dah", "tak",
            "beli", "dapat", "sampai", "cepat", "lambat", "ok", "okay",
            "best", "nice", "cheap", "mahal", "syok", "gempak", "memang",
        },
        {
            "delivery", "packaging", "quality", "size", "color", "material",
            "fitting", "comfort", "battery", "charge", "sound", "screen",
            "camera", "performance", "seller", "service", "price", "value",
            "texture", "durability", "functionality", "design", "weight",
        },
        {
            "highly recommend", "best product ever", "amazing quality",
            "exceeded expectations", "perfect product", "love it so much",
            "exactly what i needed", "great value for money",
            "buy now", "great deal", "discount", "sale", "limited time", "special offer",
        },
        {"yang", "dan", "ini", "itu", "dengan", "untuk", "dari", "ke", "pada"},
        {"the", "and", "this", "that", "with", "for", "from", "to", "on"},
    };
    return lexicon;
}

const LexiconSet& BatchInferenceLexicon() {
    static const LexiconSet lexicon{
        {
            "shiok", "confirm", "steady", "power", "cantik", "lawa", "terror",
            "bagus", "teruk", "rosak", "murah", "baik", "elok", "mantap",
            "tiptop", "padu", "mmg", "sgt", "dia", "kt", "kat", "dah", "tak",
            "beli", "dapat", "sampai", "cepat", "lambat", "ok", "okay",
            "best", "nice", "cheap", "mahal",
        },
        {
            "delivery", "packaging", "quality", "size", "color", "material",
            "fitting", "comfort", "battery", "charge", "sound", "screen",
            "camera", "performance", "seller", "service", "price", "value",
        },
        {
            "highly recommend", "best product ever", "amazing quality",
            "exceeded expectations", "perfect product", "love it so much",
            "exactly what i needed", "great value for money",
            "buy now", "great deal", "discount", "sale", "limited time", "special offer",
            "best price",
        },
        {"yang", "dan", "ini", "itu", "dengan", "untuk", "dari"},
        {"the", "and", "this", "that", "with", "for", "from"},
    };
    return lexicon;
}

const std::unordered_set<std::string>& EnglishStopWords() {
    static const std::unordered_set<std::string> words{
        "i", "me", "my", "myself", "we", "our", "ours", "ourselves", "you", "you're",
        "you've", "you'll", "you'd", "your", "yours", "yourself", "yourselves", "he",
        "him", "his", "himself", "she", "she's", "her", "hers", "herself", "it", "it's",
        "its", "itself", "they", "them", "their", "theirs", "themselves", "what", "which",
        "who", "whom", "this", "that", "that'll", "these", "those", "am", "is", "are",
        "was", "were", "be", "been", "being", "have", "has", "had", "having", "do",
        "does", "did", "doing", "a", "an", "the", "and", "but", "if", "or", "because",
        "as", "until", "while", "of", "at", "by", "for", "with", "about", "against",
        "between", "into", "through", "during", "before", "after", "above", "below",
        "to", "from", "up", "down", "in", "out", "on", "off", "over", "under", "again",
        "further", "then", "once", "here", "there", "when", "where", "why", "how", "all",
        "any", "both", "each", "few", "more", "most", "other", "some", "such", "no",
        "nor", "not", "only", "own", "same", "so", "than", "too", "very", "s", "t",
        "can", "will", "just", "don", "don't", "should", "should've", "now", "d", "ll",
        "m", "o", "re", "ve", "y", "ain", "aren", "aren't", "couldn", "couldn't",
        "didn", "didn't", "doesn", "doesn't", "hadn", "hadn't", "hasn", "hasn't",
        "haven", "haven't", "isn", "isn't", "ma", "mightn", "mightn't", "mustn",
        "mustn't", "needn", "needn't", "shan", "shan't", "shouldn", "shouldn't",
        "wasn", "wasn't", "weren", "weren't", "won", "won't", "wouldn", "wouldn't",
    };
    return words;
}

double SafeRatio(std::size_t count, std::size_t word_count) {
    if (word_count == 0) return 0.0;
    return static_cast<double>(count) / static_cast<double>(word_count);
}

LexiconMatcher::LexiconMatcher(const LexiconSet& lexicon, MixedLanguageMatch mixed_match)
    : lexicon_(lexicon)
    , mixed_match_(mixed_match) {}

bool LexiconMatcher::ContainsAny(
    std::string_view text,
    std::vector<std::string>::const_iterator begin,
    std::vector<std::string>::const_iterator end) {
    return std::any_of(begin, end, [text](const std::string& phrase) {
        return text.find(phrase) != std::string_view::npos;
    });
}

bool LexiconMatcher::DetectMixedLanguage(
    const std::vector<std::string>& tokens,
    std::string_view text) const {
    bool has_malay = false;
    bool has_english = false;

    if (mixed_match_ == MixedLanguageMatch::kSubstring) {
        for (const auto& word : lexicon_.malay_function_words) {
            if (text.find(word) != std::string_view::npos) {
                has_malay = true;
                break;
            }
        }
        for (const auto& word : lexicon_.english_function_words) {
            if (text.find(word) != std::string_view::npos) {
                has_english = true;
                break;
            }
        }
        return has_malay && has_english;
    }

    for (const auto& token : tokens) {
        if (!has_malay && lexicon_.malay_function_words.count(token)) has_malay = true;
        if (!has_english && lexicon_.english_function_words.count(token)) has_english = true;
        if (has_malay && has_english) return true;
    }
    return false;
}

LexiconMatch LexiconMatcher::Match(
    const std::vector<std::string>& tokens,
    std::string_view text) const {
    LexiconMatch out;

    std::size_t malaysian = 0;
    std::size_t product = 0;
    for (const auto& token : tokens) {
        if (lexicon_.malaysian_terms.count(token)) ++malaysian;
        if (lexicon_.product_terms.count(token)) ++product;
    }

    out.malaysian_terms_count = static_cast<int>(malaysian);
    out.malaysian_terms_ratio = SafeRatio(malaysian, tokens.size());
    out.product_terms_count = static_cast<int>(product);
    out.product_terms_ratio = SafeRatio(product, tokens.size());
    out.has_mixed_language = DetectMixedLanguage(tokens, text);
    out.has_specific_details = product >= 2;

    const auto& phrases = lexicon_.suspicious_phrases;
    const auto split = phrases.begin() +
        static_cast<std::ptrdiff_t>(std::min(kGenericPhraseCount, phrases.size()));
    out.has_generic_phrases = ContainsAny(text, phrases.begin(), split);
    out.has_promotional_language = ContainsAny(text, split, phrases.end());

    return out;
}

} // namespace review_scoring
