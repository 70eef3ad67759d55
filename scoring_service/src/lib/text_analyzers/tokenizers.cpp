#include "tokenizers.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace review_scoring {

namespace {

bool IsEdgePunctuation(char c) {
    switch (c) {
        case '.': case ',': case '!': case '?': case ';': case ':':
        case '"': case '\'': case '(': case ')': case '[': case ']':
        case '{': case '}': case '<': case '>':
            return true;
        default:
            return false;
    }
}

bool StartsWithEllipsis(std::string_view s, std::size_t pos) {
    return s.compare(pos, 3, "...") == 0;
}

void SplitChunk(std::string_view chunk, std::vector<std::string>& out) {
    std::size_t begin = 0;
    std::size_t end = chunk.size();

    while (begin < end && IsEdgePunctuation(chunk[begin])) {
        if (end - begin >= 3 && StartsWithEllipsis(chunk, begin)) {
            out.emplace_back("...");
            begin += 3;
        } else {
            out.emplace_back(1, chunk[begin]);
            ++begin;
        }
    }

    std::vector<std::string> trailing;
    while (end > begin && IsEdgePunctuation(chunk[end - 1])) {
        if (end - begin >= 3 && StartsWithEllipsis(chunk, end - 3)) {
            trailing.emplace_back("...");
            end -= 3;
        } else {
            trailing.emplace_back(1, chunk[end - 1]);
            --end;
        }
    }

    if (end > begin) {
        out.emplace_back(chunk.substr(begin, end - begin));
    }
    std::reverse(trailing.begin(), trailing.end());
    for (auto& token : trailing) out.push_back(std::move(token));
}

} // anonymous namespace

std::vector<std::string> WhitespaceTokenizer::Tokenize(std::string_view text) const {
    std::vector<std::string> tokens;
    std::istringstream stream{std::string(text)};
    std::string token;
    while (stream >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

std::vector<std::string> TreebankTokenizer::Tokenize(std::string_view text) const {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        std::size_t j = i;
        while (j < text.size() && !std::isspace(static_cast<unsigned char>(text[j]))) ++j;
        if (j > i) SplitChunk(text.substr(i, j - i), tokens);
        i = j;
    }
    return tokens;
}

} // namespace review_scoring
