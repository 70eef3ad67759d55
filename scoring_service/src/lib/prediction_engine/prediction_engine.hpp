#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <userver/engine/mutex.hpp>
#include <userver/rcu/rcu.hpp>

#include "feature_extractor/linguistic_feature_extractor.hpp"
#include "ml_model/model_bundle_loader.hpp"
#include "ml_model/model_interface.hpp"
#include "prediction_engine/prediction_result.hpp"
#include "scoring_profile/scoring_profile.hpp"
#include "text_analyzers/text_analyzers.hpp"

namespace review_scoring {

// Движок предсказаний: владеет снимком модели и счётчиками производительности.
// Predict можно вызывать параллельно из любого числа корутин.
class PredictionEngine {
public:
    static constexpr std::size_t kMaxBatchSize = 50;
    static constexpr std::size_t kMinTextLength = 3;
    static constexpr std::size_t kPreviewLength = 100;

    PredictionEngine(TextAnalyzers analyzers, const ScoringProfile& default_profile);

    PredictionEngine(const PredictionEngine&) = delete;
    PredictionEngine& operator=(const PredictionEngine&) = delete;

    // При ошибке предыдущая модель остаётся на месте
    LoadStatus LoadModel(const std::string& path);

    // Атомарная замена снимка модели.
    // Бросает std::invalid_argument при неизвестном detector_profile.
    void Install(ModelComponents components);

    // Никогда не бросает
    PredictionResult Predict(std::string_view text);

    // Бросает BatchTooLargeError, если texts.size() > limit или limit > kMaxBatchSize
    BatchResult PredictBatch(const std::vector<std::string>& texts, std::size_t limit = kMaxBatchSize);

    HealthStatus Health() const;
    PerformanceSnapshot Stats() const;

    // Отладочный разбор признаков, работает и без загруженной модели
    FeatureExplanation Explain(std::string_view text) const;

    bool IsLoaded() const;
    std::string ActiveProfileName() const;

private:
    struct ModelSnapshot {
        std::shared_ptr<const ModelComponents> components;  // nullptr - модель не загружена
        std::shared_ptr<const LinguisticFeatureExtractor> extractor;
    };

    struct PerformanceCounters {
        std::uint64_t count = 0;
        double cumulative_seconds = 0.0;
    };

    PredictionResult NotLoadedResult(std::string_view text) const;
    PredictionResult TooShortResult(std::string_view text, const ModelComponents& model,
                                    Seconds elapsed) const;
    void RecordPrediction(Seconds elapsed);

    static std::string Preview(std::string_view text);
    static std::string NowTimestamp();

    TextAnalyzers analyzers_;
    const ScoringProfile& default_profile_;

    userver::rcu::Variable<ModelSnapshot> snapshot_;

    mutable userver::engine::Mutex counters_mutex_;
    PerformanceCounters counters_;
};

} // namespace review_scoring
