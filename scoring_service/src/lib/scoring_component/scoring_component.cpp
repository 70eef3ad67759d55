#include "scoring_component.hpp"

#include <optional>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include "ml_model/model_bundle_loader.hpp"
#include "scoring_profile/scoring_profile.hpp"
#include "text_analyzers/lexicon_polarity_analyzer.hpp"
#include "text_analyzers/tokenizers.hpp"
#include "text_analyzers/vader_sentiment_analyzer.hpp"

namespace review_scoring {

ReviewScoringEngineComponent::ReviewScoringEngineComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : LoggableComponentBase(config, context),
      batch_limit_(config["batch-limit"].As<std::size_t>(PredictionEngine::kMaxBatchSize)) {
    if (batch_limit_ == 0 || batch_limit_ > PredictionEngine::kMaxBatchSize) {
        throw std::invalid_argument(fmt::format(
            "batch-limit must be in [1, {}], got {}", PredictionEngine::kMaxBatchSize, batch_limit_));
    }

    const auto profile_name = config["profile"].As<std::string>(std::string(kRealtimeProfileName));
    const auto& profile = ProfileByName(profile_name);

    engine_ = std::make_unique<PredictionEngine>(BuildAnalyzers(config), profile);

    auto model_path = config["model-path"].As<std::optional<std::string>>();
    if (!model_path) {
        model_path = ModelBundleLoader::FindBundle(
            config["model-search-paths"].As<std::vector<std::string>>(std::vector<std::string>{}));
    }

    if (!model_path) {
        LOG_WARNING() << "No model bundle found, engine stays unloaded";
    } else {
        const auto status = engine_->LoadModel(*model_path);
        if (status == LoadStatus::kOk) {
            LOG_INFO() << "Model loaded from " << *model_path;
        } else {
            LOG_ERROR() << fmt::format("Failed to load model from {}: {}", *model_path, ToString(status));
        }
    }

    LOG_INFO() << fmt::format("ReviewScoringEngine initialized (profile {}, batch limit {})",
                              engine_->ActiveProfileName(), batch_limit_);
}

ReviewScoringEngineComponent::~ReviewScoringEngineComponent() {
    LOG_INFO() << "ReviewScoringEngine shutting down";
}

TextAnalyzers ReviewScoringEngineComponent::BuildAnalyzers(const userver::components::ComponentConfig& config) {
    TextAnalyzers analyzers;
    analyzers.tokenizer = std::make_shared<TreebankTokenizer>();

    const auto sentiment_path = config["sentiment-lexicon"].As<std::optional<std::string>>();
    if (sentiment_path) {
        auto sentiment = std::make_shared<VaderSentimentAnalyzer>();
        if (sentiment->LoadLexicon(*sentiment_path)) {
            analyzers.sentiment = std::move(sentiment);
        } else {
            LOG_WARNING() << "Sentiment lexicon unavailable, sentiment defaults apply: " << *sentiment_path;
        }
    } else {
        LOG_WARNING() << "sentiment-lexicon is not configured, sentiment defaults apply";
    }

    const auto polarity_path = config["polarity-lexicon"].As<std::optional<std::string>>();
    if (polarity_path) {
        auto polarity = std::make_shared<LexiconPolarityAnalyzer>();
        if (polarity->LoadLexicon(*polarity_path)) {
            analyzers.polarity = std::move(polarity);
        } else {
            LOG_WARNING() << "Polarity lexicon unavailable, polarity defaults apply: " << *polarity_path;
        }
    } else {
        LOG_WARNING() << "polarity-lexicon is not configured, polarity defaults apply";
    }

    return analyzers;
}

userver::yaml_config::Schema ReviewScoringEngineComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::LoggableComponentBase>(R"(
type: object
description: Review authenticity scoring engine
additionalProperties: false
properties:
    model-path:
        type: string
        description: explicit path to the model bundle (.pb or .json)
    model-search-paths:
        type: array
        description: candidate bundle paths, the first existing one is used
        items:
            type: string
            description: bundle path
    profile:
        type: string
        description: default scoring profile (realtime or batch-inference)
        defaultDescription: realtime
    sentiment-lexicon:
        type: string
        description: VADER lexicon file (word<TAB>mean...)
    polarity-lexicon:
        type: string
        description: polarity lexicon TSV (word polarity subjectivity [intensity])
    batch-limit:
        type: integer
        description: maximum reviews per batch request
        defaultDescription: 50
        minimum: 1
        maximum: 50
)");
}

} // namespace review_scoring
