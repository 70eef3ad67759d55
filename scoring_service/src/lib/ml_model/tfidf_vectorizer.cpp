#include "tfidf_vectorizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <stdexcept>

#include <fmt/format.h>

#include "text_utils/text_utils.hpp"

namespace review_scoring {

namespace {

bool IsWordChar(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || uc >= 0x80;
}

TfidfVectorizer::Norm NormFromProto(review_model::TfidfVectorizer::Norm norm) {
    switch (norm) {
        case review_model::TfidfVectorizer::L1:
            return TfidfVectorizer::Norm::kL1;
        case review_model::TfidfVectorizer::NONE:
            return TfidfVectorizer::Norm::kNone;
        default:
            return TfidfVectorizer::Norm::kL2;
    }
}

} // anonymous namespace

TfidfVectorizer::TfidfVectorizer(
    std::unordered_map<std::string, std::uint32_t> vocabulary,
    std::vector<double> idf,
    Options options)
    : vocabulary_(std::move(vocabulary))
    , idf_(std::move(idf))
    , options_(options) {
    if (options_.ngram_min == 0) options_.ngram_min = 1;
    if (options_.ngram_max < options_.ngram_min) options_.ngram_max = options_.ngram_min;

    std::size_t max_index = 0;
    for (const auto& [term, index] : vocabulary_) {
        max_index = std::max<std::size_t>(max_index, index + 1);
    }
    if (!idf_.empty() && idf_.size() < max_index) {
        throw std::invalid_argument(fmt::format(
            "TF-IDF idf has {} weights but vocabulary needs {}", idf_.size(), max_index));
    }
    dimension_ = idf_.empty() ? max_index : idf_.size();
}

std::unique_ptr<TfidfVectorizer> TfidfVectorizer::FromProto(const review_model::TfidfVectorizer& proto) {
    if (proto.analyzer() != review_model::TfidfVectorizer::WORD) {
        throw std::invalid_argument("Only word analyzer is supported for TF-IDF");
    }
    if (proto.vocabulary().empty()) {
        throw std::invalid_argument("TF-IDF vocabulary is empty");
    }

    std::unordered_map<std::string, std::uint32_t> vocabulary(
        proto.vocabulary().begin(), proto.vocabulary().end());
    std::vector<double> idf(proto.idf().begin(), proto.idf().end());

    Options options;
    options.ngram_min = proto.ngram_min();
    options.ngram_max = proto.ngram_max();
    options.sublinear_tf = proto.sublinear_tf();
    options.norm = NormFromProto(proto.norm());

    return std::make_unique<TfidfVectorizer>(std::move(vocabulary), std::move(idf), options);
}

std::vector<std::string> TfidfVectorizer::WordTokens(std::string_view text) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !IsWordChar(text[i])) ++i;
        std::size_t j = i;
        while (j < text.size() && IsWordChar(text[j])) ++j;
        if (j - i >= 2) tokens.push_back(text_utils::ToLowerAscii(text.substr(i, j - i)));
        i = j;
    }
    return tokens;
}

SparseVector TfidfVectorizer::Transform(std::string_view text) const {
    const auto tokens = WordTokens(text);

    std::map<std::uint32_t, double> counts;
    for (std::size_t n = options_.ngram_min; n <= options_.ngram_max; ++n) {
        if (tokens.size() < n) break;
        for (std::size_t start = 0; start + n <= tokens.size(); ++start) {
            std::string gram = tokens[start];
            for (std::size_t k = 1; k < n; ++k) {
                gram += ' ';
                gram += tokens[start + k];
            }
            auto it = vocabulary_.find(gram);
            if (it != vocabulary_.end()) counts[it->second] += 1.0;
        }
    }

    SparseVector out;
    out.dimension = dimension_;
    if (counts.empty()) return out;

    std::vector<double> weights;
    weights.reserve(counts.size());
    for (const auto& [index, tf] : counts) {
        double weight = options_.sublinear_tf ? 1.0 + std::log(tf) : tf;
        if (!idf_.empty()) weight *= idf_[index];
        out.indices.push_back(index);
        weights.push_back(weight);
    }

    double norm = 0.0;
    if (options_.norm == Norm::kL2) {
        for (double w : weights) norm += w * w;
        norm = std::sqrt(norm);
    } else if (options_.norm == Norm::kL1) {
        for (double w : weights) norm += std::fabs(w);
    }

    out.values.reserve(weights.size());
    for (double w : weights) {
        out.values.push_back(static_cast<float>(norm > 0.0 ? w / norm : w));
    }
    return out;
}

} // namespace review_scoring
