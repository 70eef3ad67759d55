#include "text_normalizer.hpp"

#include <cctype>

#include <userver/utils/regex.hpp>

#include "text_utils/text_utils.hpp"

namespace review_scoring {

namespace {

const userver::utils::regex& ContactPattern() {
    static const userver::utils::regex pattern(
        R"(http\S+|www\S+|https\S+|\S+@\S+|\+?6\d{1,3}-?\d{3,4}-?\d{3,4})");
    return pattern;
}

const userver::utils::regex& ExclamationRun() {
    static const userver::utils::regex pattern(R"(!{2,})");
    return pattern;
}

const userver::utils::regex& QuestionRun() {
    static const userver::utils::regex pattern(R"(\?{2,})");
    return pattern;
}

const userver::utils::regex& EllipsisRun() {
    static const userver::utils::regex pattern(R"(\.{3,})");
    return pattern;
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "sooooo" -> "soo"
std::string CollapseRepeatedLetters(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    std::size_t run = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        run = (i > 0 && s[i - 1] == c) ? run + 1 : 1;
        if (std::isalpha(static_cast<unsigned char>(c)) && run > 2) {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

bool IsAllowed(char c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= '0' && c <= '9') return true;
    switch (c) {
        case '.': case ',': case '!': case '?': case '-':
            return true;
        default:
            return IsSpace(c);
    }
}

std::string CollapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (IsSpace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) {
            out.push_back(' ');
        }
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

} // anonymous namespace

std::string TextNormalizer::Trim(std::string_view s) {
    std::size_t a = 0;
    while (a < s.size() && IsSpace(s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && IsSpace(s[b - 1])) --b;
    return std::string(s.substr(a, b - a));
}

std::string TextNormalizer::NormalizeOnce(std::string_view text) {
    std::string s = Trim(text_utils::ToLowerAscii(text));

    s = userver::utils::regex_replace(s, ContactPattern(), "");

    s = userver::utils::regex_replace(s, ExclamationRun(), "!");
    s = userver::utils::regex_replace(s, QuestionRun(), "?");
    s = userver::utils::regex_replace(s, EllipsisRun(), "...");

    s = CollapseRepeatedLetters(s);

    std::string filtered;
    filtered.reserve(s.size());
    for (char c : s) {
        if (IsAllowed(c)) filtered.push_back(c);
    }

    return CollapseWhitespace(filtered);
}

NormalizedText TextNormalizer::Normalize(std::string_view raw) {
    NormalizedText out;
    out.source = std::string(raw);

    // Каждый шаг не удлиняет строку, цикл конечен
    std::string current = NormalizeOnce(raw);
    while (true) {
        std::string next = NormalizeOnce(current);
        if (next == current) break;
        current = std::move(next);
    }
    out.text = std::move(current);
    return out;
}

} // namespace review_scoring
