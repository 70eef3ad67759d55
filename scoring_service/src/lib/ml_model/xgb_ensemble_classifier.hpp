#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "model_interface.hpp"

// Forward declarations для XGBoost
typedef void* BoosterHandle;

namespace review_scoring {

// Ансамблевый классификатор на XGBoost.
// Поддерживает binary:logistic (один выход = p_fake) и multi:softprob с двумя классами.
class XgbEnsembleClassifier final : public Classifier {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Создаётся только через FromBuffer
    XgbEnsembleClassifier(PrivateTag, BoosterHandle booster, std::size_t num_features);
    ~XgbEnsembleClassifier() override;

    XgbEnsembleClassifier(const XgbEnsembleClassifier&) = delete;
    XgbEnsembleClassifier& operator=(const XgbEnsembleClassifier&) = delete;

    // Загрузить модель из буфера (JSON или UBJSON); бросает ClassifierError
    static std::unique_ptr<XgbEnsembleClassifier> FromBuffer(const std::string& payload,
                                                             std::size_t num_features);

    ReviewLabel Predict(const ModelInput& input) const override;
    ProbabilityPair PredictProba(const ModelInput& input) const override;

    std::size_t NumFeatures() const { return num_features_; }

private:
    BoosterHandle booster_ = nullptr;
    std::size_t num_features_ = 0;  // 0 - берётся из размерности входа
};

} // namespace review_scoring
