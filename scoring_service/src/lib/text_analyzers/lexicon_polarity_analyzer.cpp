#include "lexicon_polarity_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <vector>

#include <userver/logging/log.hpp>

namespace review_scoring {

namespace {

constexpr double kNegationFactor = -0.5;

bool IsNegation(const std::string& word) {
    static const std::unordered_set<std::string> words{"not", "never", "no", "n't"};
    return words.count(word) != 0 || (word.size() > 3 && word.compare(word.size() - 3, 3, "n't") == 0);
}

std::vector<std::string> Words(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '\'' || c == '-') {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

double Clamp(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

} // anonymous namespace

LexiconPolarityAnalyzer::LexiconPolarityAnalyzer(std::unordered_map<std::string, PolarityEntry> lexicon)
    : lexicon_(std::move(lexicon)) {}

bool LexiconPolarityAnalyzer::LoadLexicon(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARNING() << "Cannot open polarity lexicon: " << path;
        return false;
    }

    std::unordered_map<std::string, PolarityEntry> lexicon;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        std::istringstream fields(line);
        std::string word, polarity, subjectivity, intensity;
        if (!std::getline(fields, word, '\t') ||
            !std::getline(fields, polarity, '\t') ||
            !std::getline(fields, subjectivity, '\t')) {
            continue;
        }
        try {
            PolarityEntry entry;
            entry.polarity = std::stod(polarity);
            entry.subjectivity = std::stod(subjectivity);
            if (std::getline(fields, intensity, '\t') && !intensity.empty()) {
                entry.intensity = std::stod(intensity);
            }
            lexicon[word] = entry;
        } catch (const std::exception& e) {
            LOG_DEBUG() << "Skipping malformed polarity line '" << line << "': " << e.what();
        }
    }

    if (lexicon.empty()) {
        LOG_WARNING() << "Polarity lexicon is empty: " << path;
        return false;
    }

    lexicon_ = std::move(lexicon);
    LOG_INFO() << "Loaded " << lexicon_.size() << " polarity lexicon entries from " << path;
    return true;
}

PolaritySubjectivity LexiconPolarityAnalyzer::Analyze(std::string_view text) const {
    PolaritySubjectivity out{0.0, 0.0};
    const auto words = Words(text);

    double polarity_sum = 0.0;
    double subjectivity_sum = 0.0;
    int assessed = 0;
    double pending_intensity = 1.0;
    bool pending_negation = false;

    for (const auto& word : words) {
        if (IsNegation(word)) {
            pending_negation = true;
            continue;
        }
        auto it = lexicon_.find(word);
        if (it == lexicon_.end()) continue;

        const auto& entry = it->second;
        // Слово-усилитель без собственной оценки действует на следующее слово
        if (entry.polarity == 0.0 && entry.intensity != 1.0) {
            pending_intensity *= entry.intensity;
            continue;
        }

        double polarity = Clamp(entry.polarity * pending_intensity, -1.0, 1.0);
        const double subjectivity = Clamp(entry.subjectivity * pending_intensity, 0.0, 1.0);
        if (pending_negation) polarity *= kNegationFactor;

        polarity_sum += polarity;
        subjectivity_sum += subjectivity;
        ++assessed;
        pending_intensity = 1.0;
        pending_negation = false;
    }

    if (assessed > 0) {
        out.polarity = Clamp(polarity_sum / assessed, -1.0, 1.0);
        out.subjectivity = Clamp(subjectivity_sum / assessed, 0.0, 1.0);
    }
    return out;
}

} // namespace review_scoring
