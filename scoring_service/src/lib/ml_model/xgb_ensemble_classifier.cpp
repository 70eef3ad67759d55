#include "xgb_ensemble_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <xgboost/c_api.h>

#include <userver/logging/log.hpp>

namespace review_scoring {

namespace {

std::string LastError(std::string_view what) {
    return fmt::format("{}: {}", what, XGBGetLastError());
}

// Освобождает DMatrix на всех путях выхода
struct DMatrixGuard {
    DMatrixHandle handle = nullptr;

    ~DMatrixGuard() {
        if (handle) XGDMatrixFree(handle);
    }
};

double SafeProbability(float value) {
    if (!std::isfinite(value)) {
        throw ClassifierError("XGBoost returned non-finite probability");
    }
    return std::max(0.0, std::min(1.0, static_cast<double>(value)));
}

} // anonymous namespace

XgbEnsembleClassifier::XgbEnsembleClassifier(PrivateTag, BoosterHandle booster, std::size_t num_features)
    : booster_(booster)
    , num_features_(num_features) {}

XgbEnsembleClassifier::~XgbEnsembleClassifier() {
    if (booster_) {
        XGBoosterFree(booster_);
    }
}

std::unique_ptr<XgbEnsembleClassifier> XgbEnsembleClassifier::FromBuffer(
    const std::string& payload,
    std::size_t num_features) {
    if (payload.empty()) {
        throw ClassifierError("Ensemble model payload is empty");
    }

    BoosterHandle booster = nullptr;
    if (XGBoosterCreate(nullptr, 0, &booster) != 0) {
        throw ClassifierError(LastError("XGBoosterCreate failed"));
    }
    if (XGBoosterLoadModelFromBuffer(booster, payload.data(),
                                     static_cast<bst_ulong>(payload.size())) != 0) {
        const auto message = LastError("XGBoosterLoadModelFromBuffer failed");
        XGBoosterFree(booster);
        throw ClassifierError(message);
    }

    LOG_INFO() << "Loaded XGBoost ensemble (" << payload.size() << " bytes, "
               << num_features << " features)";
    return std::make_unique<XgbEnsembleClassifier>(PrivateTag{}, booster, num_features);
}

ProbabilityPair XgbEnsembleClassifier::PredictProba(const ModelInput& input) const {
    if (input.indices.size() != input.values.size()) {
        throw ClassifierError("Malformed model input: indices and values differ in size");
    }
    const std::size_t num_col = num_features_ > 0 ? num_features_ : input.dimension;
    if (input.dimension > num_col) {
        throw ClassifierError(fmt::format(
            "Model input has {} columns, ensemble expects {}", input.dimension, num_col));
    }

    const std::vector<std::size_t> indptr{0, input.indices.size()};
    const std::vector<unsigned> indices(input.indices.begin(), input.indices.end());

    DMatrixGuard dmat;
    if (XGDMatrixCreateFromCSREx(indptr.data(), indices.data(), input.values.data(),
                                 indptr.size(), input.values.size(), num_col,
                                 &dmat.handle) != 0) {
        throw ClassifierError(LastError("XGDMatrixCreateFromCSREx failed"));
    }

    bst_ulong out_len = 0;
    const float* out_result = nullptr;
    if (XGBoosterPredict(booster_, dmat.handle, 0, 0, 0, &out_len, &out_result) != 0) {
        throw ClassifierError(LastError("XGBoosterPredict failed"));
    }

    ProbabilityPair out;
    if (out_len == 1) {
        out.fake_probability = SafeProbability(out_result[0]);
        out.real_probability = 1.0 - out.fake_probability;
    } else if (out_len == 2) {
        out.real_probability = SafeProbability(out_result[0]);
        out.fake_probability = SafeProbability(out_result[1]);
    } else {
        throw ClassifierError(fmt::format("Unexpected XGBoost output length: {}", out_len));
    }

    LOG_DEBUG() << "XGBoost fake probability: " << out.fake_probability;
    return out;
}

ReviewLabel XgbEnsembleClassifier::Predict(const ModelInput& input) const {
    return LabelFor(PredictProba(input));
}

} // namespace review_scoring
