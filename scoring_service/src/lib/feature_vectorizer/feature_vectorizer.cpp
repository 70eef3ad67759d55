#include "feature_vectorizer.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

#include <fmt/format.h>

namespace review_scoring {

std::vector<double> FeatureVectorizer::DenseFeatures(const FeatureRecord& record) {
    std::vector<double> dense;
    dense.reserve(kModelFeatureCount);
    for (const auto& column : ModelFeatureColumns()) {
        dense.push_back(column.value(record));
    }
    return dense;
}

ModelInput FeatureVectorizer::ToModelInput(const NormalizedText& text,
                                           const FeatureRecord& record,
                                           const TextVectorizer& vectorizer,
                                           const FeatureScaler& scaler) {
    ModelInput input = vectorizer.Transform(text.text);
    const std::size_t offset = vectorizer.Dimension();
    if (input.dimension != offset) {
        throw std::invalid_argument(fmt::format(
            "Vectorizer produced dimension {}, declared {}", input.dimension, offset));
    }

    const auto scaled = scaler.Transform(DenseFeatures(record));
    if (scaled.size() != kModelFeatureCount) {
        throw std::invalid_argument(fmt::format(
            "Scaler returned {} features, expected {}", scaled.size(), kModelFeatureCount));
    }

    for (std::size_t i = 0; i < scaled.size(); ++i) {
        if (!std::isfinite(scaled[i])) {
            throw std::invalid_argument(fmt::format(
                "Non-finite value for feature {}", ModelFeatureColumns()[i].name));
        }
        // как в строке CSR: нулевые значения неявные
        if (scaled[i] == 0.0) continue;
        input.indices.push_back(static_cast<std::uint32_t>(offset + i));
        input.values.push_back(static_cast<float>(scaled[i]));
    }
    input.dimension = offset + kModelFeatureCount;
    return input;
}

} // namespace review_scoring
