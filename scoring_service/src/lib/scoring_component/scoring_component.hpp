#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/components/loggable_component_base.hpp>
#include <userver/yaml_config/schema.hpp>

#include "prediction_engine/prediction_engine.hpp"
#include "text_analyzers/text_analyzers.hpp"

namespace review_scoring {

// Собирает анализаторы и движок предсказаний при старте сервиса.
// Отсутствие модели не фатально: движок остаётся незагруженным.
class ReviewScoringEngineComponent final : public userver::components::LoggableComponentBase {
public:
    static constexpr std::string_view kName = "review-scoring-engine";

    ReviewScoringEngineComponent(const userver::components::ComponentConfig& config,
                                 const userver::components::ComponentContext& context);

    ~ReviewScoringEngineComponent() override;

    ReviewScoringEngineComponent(const ReviewScoringEngineComponent&) = delete;
    ReviewScoringEngineComponent& operator=(const ReviewScoringEngineComponent&) = delete;

    static userver::yaml_config::Schema GetStaticConfigSchema();

    PredictionEngine& GetEngine() { return *engine_; }
    std::size_t GetBatchLimit() const { return batch_limit_; }

private:
    static TextAnalyzers BuildAnalyzers(const userver::components::ComponentConfig& config);

    std::size_t batch_limit_;
    std::unique_ptr<PredictionEngine> engine_;
};

} // namespace review_scoring
