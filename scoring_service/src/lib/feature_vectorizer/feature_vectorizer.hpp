#pragma once

#include <vector>

#include "feature_extractor/feature_record.hpp"
#include "ml_model/model_interface.hpp"
#include "text_normalizer/text_normalizer.hpp"

namespace review_scoring {

class FeatureVectorizer {
public:
    // 19 числовых + 4 булевых признака в порядке ModelFeatureColumns()
    static std::vector<double> DenseFeatures(const FeatureRecord& record);

    // [TF-IDF нормализованного текста | масштабированные плотные признаки].
    // Плотный блок начинается со смещения vectorizer.Dimension(), нули не хранятся.
    static ModelInput ToModelInput(const NormalizedText& text,
                                   const FeatureRecord& record,
                                   const TextVectorizer& vectorizer,
                                   const FeatureScaler& scaler);
};

} // namespace review_scoring
