#include "vader_sentiment_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include <userver/logging/log.hpp>

#include "text_utils/text_utils.hpp"

namespace review_scoring {

namespace {

constexpr double kBoosterIncrement = 0.293;
constexpr double kBoosterDecrement = -0.293;
constexpr double kCapsIncrement = 0.733;
constexpr double kNegationScalar = -0.74;

const std::unordered_map<std::string, double>& BoosterWords() {
    static const std::unordered_map<std::string, double> words{
        {"absolutely", kBoosterIncrement}, {"amazingly", kBoosterIncrement},
        {"awfully", kBoosterIncrement}, {"completely", kBoosterIncrement},
        {"considerably", kBoosterIncrement}, {"decidedly", kBoosterIncrement},
        {"deeply", kBoosterIncrement}, {"enormously", kBoosterIncrement},
        {"entirely", kBoosterIncrement}, {"especially", kBoosterIncrement},
        {"exceptionally", kBoosterIncrement}, {"extremely", kBoosterIncrement},
        {"fabulously", kBoosterIncrement}, {"fully", kBoosterIncrement},
        {"greatly", kBoosterIncrement}, {"highly", kBoosterIncrement},
        {"hugely", kBoosterIncrement}, {"incredibly", kBoosterIncrement},
        {"intensely", kBoosterIncrement}, {"majorly", kBoosterIncrement},
        {"more", kBoosterIncrement}, {"most", kBoosterIncrement},
        {"particularly", kBoosterIncrement}, {"purely", kBoosterIncrement},
        {"quite", kBoosterIncrement}, {"really", kBoosterIncrement},
        {"remarkably", kBoosterIncrement}, {"so", kBoosterIncrement},
        {"substantially", kBoosterIncrement}, {"thoroughly", kBoosterIncrement},
        {"totally", kBoosterIncrement}, {"tremendously", kBoosterIncrement},
        {"uber", kBoosterIncrement}, {"unbelievably", kBoosterIncrement},
        {"unusually", kBoosterIncrement}, {"utterly", kBoosterIncrement},
        {"very", kBoosterIncrement},
        {"almost", kBoosterDecrement}, {"barely", kBoosterDecrement},
        {"hardly", kBoosterDecrement}, {"kinda", kBoosterDecrement},
        {"less", kBoosterDecrement}, {"little", kBoosterDecrement},
        {"marginally", kBoosterDecrement}, {"occasionally", kBoosterDecrement},
        {"partly", kBoosterDecrement}, {"scarcely", kBoosterDecrement},
        {"slightly", kBoosterDecrement}, {"somewhat", kBoosterDecrement},
        {"sorta", kBoosterDecrement},
    };
    return words;
}

const std::unordered_set<std::string>& NegationWords() {
    static const std::unordered_set<std::string> words{
        "aint", "arent", "cannot", "cant", "couldnt", "darent", "didnt", "doesnt",
        "ain't", "aren't", "can't", "couldn't", "daren't", "didn't", "doesn't",
        "dont", "hadnt", "hasnt", "havent", "isnt", "mightnt", "mustnt", "neither",
        "don't", "hadn't", "hasn't", "haven't", "isn't", "mightn't", "mustn't",
        "neednt", "needn't", "never", "none", "nope", "nor", "not", "nothing",
        "nowhere", "oughtnt", "shant", "shouldnt", "uhuh", "wasnt", "werent",
        "oughtn't", "shan't", "shouldn't", "uh-uh", "wasn't", "weren't", "without",
        "wont", "wouldnt", "won't", "wouldn't", "rarely", "seldom", "despite",
    };
    return words;
}

bool IsPunctuation(char c) {
    return std::ispunct(static_cast<unsigned char>(c)) != 0;
}

// Снимает пунктуацию по краям, если остаётся больше двух символов (смайлики сохраняются)
std::string StripPunctuationIfWord(const std::string& token) {
    std::size_t a = 0;
    std::size_t b = token.size();
    while (a < b && IsPunctuation(token[a])) ++a;
    while (b > a && IsPunctuation(token[b - 1])) --b;
    if (b - a <= 2) return token;
    return token.substr(a, b - a);
}

} // anonymous namespace

VaderSentimentAnalyzer::VaderSentimentAnalyzer(std::unordered_map<std::string, double> lexicon)
    : lexicon_(std::move(lexicon)) {}

bool VaderSentimentAnalyzer::LoadLexicon(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARNING() << "Cannot open sentiment lexicon: " << path;
        return false;
    }

    std::unordered_map<std::string, double> lexicon;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        std::istringstream fields(line);
        std::string word;
        std::string measure;
        if (!std::getline(fields, word, '\t') || !std::getline(fields, measure, '\t')) {
            continue;
        }
        try {
            lexicon[text_utils::ToLowerAscii(word)] = std::stod(measure);
        } catch (const std::exception& e) {
            LOG_DEBUG() << "Skipping malformed lexicon line '" << line << "': " << e.what();
        }
    }

    if (lexicon.empty()) {
        LOG_WARNING() << "Sentiment lexicon is empty: " << path;
        return false;
    }

    lexicon_ = std::move(lexicon);
    LOG_INFO() << "Loaded " << lexicon_.size() << " sentiment lexicon entries from " << path;
    return true;
}

std::vector<std::string> VaderSentimentAnalyzer::SplitWords(std::string_view text) {
    std::vector<std::string> words;
    std::istringstream stream{std::string(text)};
    std::string token;
    while (stream >> token) {
        words.push_back(StripPunctuationIfWord(token));
    }
    return words;
}

bool VaderSentimentAnalyzer::IsUpper(const std::string& word) {
    bool has_cased = false;
    for (char c : word) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::islower(uc)) return false;
        if (std::isupper(uc)) has_cased = true;
    }
    return has_cased;
}

bool VaderSentimentAnalyzer::AllCapDifferential(const std::vector<std::string>& words) {
    const auto caps = std::count_if(words.begin(), words.end(), IsUpper);
    return caps > 0 && static_cast<std::size_t>(caps) < words.size();
}

bool VaderSentimentAnalyzer::IsNegated(const std::string& lowered_word) {
    if (NegationWords().count(lowered_word)) return true;
    return lowered_word.find("n't") != std::string::npos;
}

double VaderSentimentAnalyzer::ScalarIncDec(
    const std::string& word,
    const std::string& lowered,
    double valence,
    bool is_cap_diff) {
    double scalar = 0.0;
    const auto& boosters = BoosterWords();
    auto it = boosters.find(lowered);
    if (it == boosters.end()) return scalar;

    scalar = it->second;
    if (valence < 0) scalar *= -1;
    if (IsUpper(word) && is_cap_diff) {
        scalar += (valence > 0) ? kCapsIncrement : -kCapsIncrement;
    }
    return scalar;
}

double VaderSentimentAnalyzer::NegationCheck(
    double valence,
    const std::vector<std::string>& lowered,
    std::size_t start_i,
    std::size_t i) {
    auto is_so_or_this = [](const std::string& w) { return w == "so" || w == "this"; };

    if (start_i == 0) {
        if (IsNegated(lowered[i - 1])) valence *= kNegationScalar;
    } else if (start_i == 1) {
        if (lowered[i - 2] == "never" && is_so_or_this(lowered[i - 1])) {
            valence *= 1.25;
        } else if (lowered[i - 2] == "without" && lowered[i - 1] == "doubt") {
            // "without doubt" усиливает, а не отрицает
        } else if (IsNegated(lowered[i - 2])) {
            valence *= kNegationScalar;
        }
    } else if (start_i == 2) {
        if (lowered[i - 3] == "never" &&
            (is_so_or_this(lowered[i - 2]) || is_so_or_this(lowered[i - 1]))) {
            valence *= 1.25;
        } else if (lowered[i - 3] == "without" &&
                   (lowered[i - 2] == "doubt" || lowered[i - 1] == "doubt")) {
        } else if (IsNegated(lowered[i - 3])) {
            valence *= kNegationScalar;
        }
    }
    return valence;
}

double VaderSentimentAnalyzer::LeastCheck(
    double valence,
    const std::vector<std::string>& lowered,
    std::size_t i) const {
    if (i > 1 && !InLexicon(lowered[i - 1]) && lowered[i - 1] == "least") {
        if (lowered[i - 2] != "at" && lowered[i - 2] != "very") {
            valence *= kNegationScalar;
        }
    } else if (i > 0 && !InLexicon(lowered[i - 1]) && lowered[i - 1] == "least") {
        valence *= kNegationScalar;
    }
    return valence;
}

double VaderSentimentAnalyzer::SentimentValence(
    const std::vector<std::string>& words,
    const std::vector<std::string>& lowered,
    std::size_t i,
    bool is_cap_diff) const {
    auto it = lexicon_.find(lowered[i]);
    if (it == lexicon_.end()) return 0.0;

    double valence = it->second;

    if (lowered[i] == "no" && i + 1 < lowered.size() && InLexicon(lowered[i + 1])) {
        valence = 0.0;
    }
    if ((i > 0 && lowered[i - 1] == "no") ||
        (i > 1 && lowered[i - 2] == "no") ||
        (i > 2 && lowered[i - 3] == "no" &&
         (lowered[i - 1] == "or" || lowered[i - 1] == "nor"))) {
        valence = it->second * kNegationScalar;
    }

    if (IsUpper(words[i]) && is_cap_diff) {
        valence += (valence > 0) ? kCapsIncrement : -kCapsIncrement;
    }

    for (std::size_t start_i = 0; start_i < 3; ++start_i) {
        if (i <= start_i) break;
        const std::size_t prev = i - (start_i + 1);
        if (InLexicon(lowered[prev])) continue;

        double scalar = ScalarIncDec(words[prev], lowered[prev], valence, is_cap_diff);
        if (start_i == 1 && scalar != 0) scalar *= 0.95;
        if (start_i == 2 && scalar != 0) scalar *= 0.9;
        valence += scalar;
        valence = NegationCheck(valence, lowered, start_i, i);
    }

    return LeastCheck(valence, lowered, i);
}

void VaderSentimentAnalyzer::ButCheck(
    const std::vector<std::string>& lowered,
    std::vector<double>& sentiments) {
    auto it = std::find(lowered.begin(), lowered.end(), "but");
    if (it == lowered.end()) return;

    const auto but_index = static_cast<std::size_t>(it - lowered.begin());
    for (std::size_t i = 0; i < sentiments.size(); ++i) {
        if (i < but_index) {
            sentiments[i] *= 0.5;
        } else if (i > but_index) {
            sentiments[i] *= 1.5;
        }
    }
}

double VaderSentimentAnalyzer::PunctuationEmphasis(std::string_view text) {
    const auto exclamations = std::min<std::ptrdiff_t>(
        std::count(text.begin(), text.end(), '!'), 4);
    const double ep_amplifier = static_cast<double>(exclamations) * 0.292;

    const auto questions = std::count(text.begin(), text.end(), '?');
    double qm_amplifier = 0.0;
    if (questions > 1) {
        qm_amplifier = (questions <= 3) ? static_cast<double>(questions) * 0.18 : 0.96;
    }
    return ep_amplifier + qm_amplifier;
}

double VaderSentimentAnalyzer::Normalize(double score, double alpha) {
    const double norm = score / std::sqrt(score * score + alpha);
    return std::max(-1.0, std::min(1.0, norm));
}

SentimentScores VaderSentimentAnalyzer::PolarityScores(std::string_view text) const {
    const auto words = SplitWords(text);

    SentimentScores out;
    out.neutral = 0.0;
    if (words.empty()) return out;

    std::vector<std::string> lowered;
    lowered.reserve(words.size());
    for (const auto& w : words) lowered.push_back(text_utils::ToLowerAscii(w));

    const bool is_cap_diff = AllCapDifferential(words);
    const auto& boosters = BoosterWords();

    std::vector<double> sentiments;
    sentiments.reserve(words.size());
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (boosters.count(lowered[i]) ||
            (lowered[i] == "kind" && i + 1 < words.size() && lowered[i + 1] == "of")) {
            sentiments.push_back(0.0);
            continue;
        }
        sentiments.push_back(SentimentValence(words, lowered, i, is_cap_diff));
    }
    ButCheck(lowered, sentiments);

    double sum = 0.0;
    for (double s : sentiments) sum += s;

    const double emphasis = PunctuationEmphasis(text);
    if (sum > 0) {
        sum += emphasis;
    } else if (sum < 0) {
        sum -= emphasis;
    }

    double pos_sum = 0.0;
    double neg_sum = 0.0;
    double neu_count = 0.0;
    for (double s : sentiments) {
        if (s > 0) pos_sum += s + 1;
        if (s < 0) neg_sum += s - 1;
        if (s == 0) neu_count += 1;
    }
    if (pos_sum > std::fabs(neg_sum)) {
        pos_sum += emphasis;
    } else if (pos_sum < std::fabs(neg_sum)) {
        neg_sum -= emphasis;
    }

    const double total = pos_sum + std::fabs(neg_sum) + neu_count;
    out.compound = Normalize(sum);
    if (total > 0) {
        out.positive = std::fabs(pos_sum / total);
        out.negative = std::fabs(neg_sum / total);
        out.neutral = std::fabs(neu_count / total);
    }
    return out;
}

} // namespace review_scoring
