#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "text_analyzers.hpp"

namespace review_scoring {

struct PolarityEntry {
    double polarity = 0.0;
    double subjectivity = 0.0;
    double intensity = 1.0;
};

// Полярность/субъективность как среднее по словам из словаря.
// Файл словаря: word <TAB> polarity <TAB> subjectivity [<TAB> intensity]
class LexiconPolarityAnalyzer final : public PolarityAnalyzer {
public:
    LexiconPolarityAnalyzer() = default;
    explicit LexiconPolarityAnalyzer(std::unordered_map<std::string, PolarityEntry> lexicon);

    bool LoadLexicon(const std::string& path);

    bool IsLoaded() const { return !lexicon_.empty(); }

    PolaritySubjectivity Analyze(std::string_view text) const override;

private:
    std::unordered_map<std::string, PolarityEntry> lexicon_;
};

} // namespace review_scoring
