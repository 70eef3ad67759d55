#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <review/model_bundle.pb.h>

#include "model_interface.hpp"

namespace review_scoring {

// TF-IDF в семантике scikit-learn TfidfVectorizer (analyzer='word')
class TfidfVectorizer final : public TextVectorizer {
public:
    enum class Norm { kL2, kL1, kNone };

    struct Options {
        std::size_t ngram_min = 1;
        std::size_t ngram_max = 1;
        bool sublinear_tf = false;
        Norm norm = Norm::kL2;
    };

    TfidfVectorizer(std::unordered_map<std::string, std::uint32_t> vocabulary,
                    std::vector<double> idf,
                    Options options);

    // Бросает std::invalid_argument для неподдерживаемой или несогласованной конфигурации
    static std::unique_ptr<TfidfVectorizer> FromProto(const review_model::TfidfVectorizer& proto);

    SparseVector Transform(std::string_view text) const override;
    std::size_t Dimension() const override { return dimension_; }

    // Токены по шаблону \b\w\w+\b
    static std::vector<std::string> WordTokens(std::string_view text);

private:
    std::unordered_map<std::string, std::uint32_t> vocabulary_;
    std::vector<double> idf_;
    Options options_;
    std::size_t dimension_ = 0;
};

} // namespace review_scoring
