#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "text_analyzers.hpp"

namespace review_scoring {

// Анализатор тональности по правилам VADER.
// Словарь загружается из файла формата vader_lexicon.txt:
// word <TAB> mean <TAB> std <TAB> raw
class VaderSentimentAnalyzer final : public SentimentAnalyzer {
public:
    VaderSentimentAnalyzer() = default;
    explicit VaderSentimentAnalyzer(std::unordered_map<std::string, double> lexicon);

    bool LoadLexicon(const std::string& path);

    bool IsLoaded() const { return !lexicon_.empty(); }

    SentimentScores PolarityScores(std::string_view text) const override;

private:
    double SentimentValence(const std::vector<std::string>& words,
                            const std::vector<std::string>& lowered,
                            std::size_t i,
                            bool is_cap_diff) const;

    double LeastCheck(double valence,
                      const std::vector<std::string>& lowered,
                      std::size_t i) const;

    bool InLexicon(const std::string& word) const { return lexicon_.count(word) != 0; }

    static std::vector<std::string> SplitWords(std::string_view text);
    static bool IsUpper(const std::string& word);
    static bool AllCapDifferential(const std::vector<std::string>& words);
    static bool IsNegated(const std::string& lowered_word);
    static double ScalarIncDec(const std::string& word,
                               const std::string& lowered,
                               double valence,
                               bool is_cap_diff);
    static double NegationCheck(double valence,
                                const std::vector<std::string>& lowered,
                                std::size_t start_i,
                                std::size_t i);
    static void ButCheck(const std::vector<std::string>& lowered,
                         std::vector<double>& sentiments);
    static double PunctuationEmphasis(std::string_view text);
    static double Normalize(double score, double alpha = 15.0);

    std::unordered_map<std::string, double> lexicon_;
};

} // namespace review_scoring
