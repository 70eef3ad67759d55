#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace review_scoring {

struct SentimentScores {
    double compound = 0.0;
    double positive = 0.0;
    double negative = 0.0;
    double neutral = 0.5;
};

struct PolaritySubjectivity {
    double polarity = 0.0;
    double subjectivity = 0.5;
};

// Интерфейс анализатора тональности (VADER-совместимый)
class SentimentAnalyzer {
public:
    virtual ~SentimentAnalyzer() = default;

    virtual SentimentScores PolarityScores(std::string_view text) const = 0;
};

// Интерфейс анализатора полярности/субъективности
class PolarityAnalyzer {
public:
    virtual ~PolarityAnalyzer() = default;

    virtual PolaritySubjectivity Analyze(std::string_view text) const = 0;
};

class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual std::vector<std::string> Tokenize(std::string_view text) const = 0;
};

// Набор анализаторов; любой указатель может быть пустым,
// тогда экстрактор подставляет значения по умолчанию
struct TextAnalyzers {
    std::shared_ptr<const SentimentAnalyzer> sentiment;
    std::shared_ptr<const PolarityAnalyzer> polarity;
    std::shared_ptr<const Tokenizer> tokenizer;
};

} // namespace review_scoring
