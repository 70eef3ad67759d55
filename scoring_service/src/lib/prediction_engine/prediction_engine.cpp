#include "prediction_engine.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/utils/datetime.hpp>

#include "feature_vectorizer/feature_vectorizer.hpp"
#include "risk_scorer/risk_scorer.hpp"
#include "text_normalizer/text_normalizer.hpp"
#include "text_utils/text_utils.hpp"

namespace review_scoring {

namespace {

constexpr std::string_view kDefaultModelVersion = "1.0";

AnalysisDetails ToAnalysis(const FeatureRecord& features) {
    AnalysisDetails analysis;
    analysis.word_count = features.word_count;
    analysis.sentiment_score = features.sentiment_compound;
    analysis.malaysian_terms = features.malaysian_terms_count;
    analysis.has_mixed_language = features.has_mixed_language;
    analysis.has_specific_details = features.has_specific_details;
    return analysis;
}

} // anonymous namespace

std::string_view ToString(PredictionErrorKind kind) {
    switch (kind) {
        case PredictionErrorKind::kModelNotLoaded:
            return "model_not_loaded";
        case PredictionErrorKind::kClassifierFailure:
            return "classifier_failure";
    }
    return "unknown";
}

PredictionEngine::PredictionEngine(TextAnalyzers analyzers, const ScoringProfile& default_profile)
    : analyzers_(std::move(analyzers))
    , default_profile_(default_profile)
    , snapshot_(ModelSnapshot{
          nullptr, std::make_shared<const LinguisticFeatureExtractor>(analyzers_, default_profile_)}) {
    LOG_INFO() << "PredictionEngine created with profile " << default_profile_.name;
}

LoadStatus PredictionEngine::LoadModel(const std::string& path) {
    auto result = ModelBundleLoader::Load(path);
    if (!result.Ok()) {
        LOG_WARNING() << fmt::format("Model not installed from {}: {} ({})", path,
                                     ToString(result.status), result.message);
        return result.status;
    }
    Install(std::move(*result.components));
    return LoadStatus::kOk;
}

void PredictionEngine::Install(ModelComponents components) {
    if (!components.classifier || !components.vectorizer || !components.scaler) {
        throw std::invalid_argument("Model components are incomplete");
    }

    const ScoringProfile& profile = components.detector_profile
        ? ProfileByName(*components.detector_profile)
        : default_profile_;

    ModelSnapshot snapshot;
    snapshot.extractor = std::make_shared<const LinguisticFeatureExtractor>(analyzers_, profile);
    snapshot.components = std::make_shared<const ModelComponents>(std::move(components));

    const auto version = snapshot.components->version;
    snapshot_.Assign(std::move(snapshot));
    LOG_INFO() << fmt::format("Installed model version {} with profile {}", version, profile.name);
}

bool PredictionEngine::IsLoaded() const {
    return snapshot_.Read()->components != nullptr;
}

std::string PredictionEngine::ActiveProfileName() const {
    return snapshot_.Read()->extractor->Profile().name;
}

PredictionResult PredictionEngine::Predict(std::string_view text) {
    const auto start = std::chrono::steady_clock::now();
    const auto snapshot = snapshot_.Read();

    if (!snapshot->components) {
        return NotLoadedResult(text);
    }
    const auto& model = *snapshot->components;

    if (TextNormalizer::Trim(text).size() < kMinTextLength) {
        return TooShortResult(text, model, std::chrono::steady_clock::now() - start);
    }

    // "!!!" после очистки превращается в "!", классифицировать нечего
    const auto normalized = TextNormalizer::Normalize(text);
    if (normalized.text.size() < kMinTextLength) {
        auto result = TooShortResult(text, model, std::chrono::steady_clock::now() - start);
        result.metadata.processed_length = normalized.text.size();
        return result;
    }

    const auto& extractor = *snapshot->extractor;
    const auto features = extractor.Extract(normalized);

    PredictionResult result;
    result.analysis = ToAnalysis(features);
    result.metadata.text_length = text_utils::CodePointCount(text);
    result.metadata.processed_length = normalized.text.size();
    result.metadata.model_version = model.version;
    result.metadata.timestamp = NowTimestamp();

    try {
        const auto input = FeatureVectorizer::ToModelInput(
            normalized, features, *model.vectorizer, *model.scaler);
        const auto proba = model.classifier->PredictProba(input);
        result.label = LabelFor(proba);
        result.fake_probability = proba.fake_probability;
        result.real_probability = proba.real_probability;
        result.confidence = std::max(proba.fake_probability, proba.real_probability);
    } catch (const std::exception& e) {
        LOG_ERROR() << "Prediction error: " << e.what();
        result.label = ReviewLabel::kError;
        result.confidence = 0.0;
        result.error = PredictionError{PredictionErrorKind::kClassifierFailure, e.what()};
        result.elapsed = std::chrono::steady_clock::now() - start;
        return result;
    }

    result.risk_level = RiskScorer::RiskLevelFor(result.fake_probability);
    result.quality_score = RiskScorer::QualityScore(features, extractor.Profile().quality);
    result.suspicious_patterns = RiskScorer::SuspiciousPatterns(features);
    result.elapsed = std::chrono::steady_clock::now() - start;

    RecordPrediction(result.elapsed);

    LOG_DEBUG() << fmt::format("Analysis completed: {} ({:.3f}) in {:.3f}s",
                               ToString(result.label), result.confidence, result.elapsed.count());
    return result;
}

PredictionResult PredictionEngine::NotLoadedResult(std::string_view text) const {
    PredictionResult result;
    result.label = ReviewLabel::kUnknown;
    result.confidence = 0.0;
    result.error = PredictionError{PredictionErrorKind::kModelNotLoaded, "Model not loaded"};
    result.metadata.text_length = text_utils::CodePointCount(text);
    result.metadata.timestamp = NowTimestamp();
    return result;
}

PredictionResult PredictionEngine::TooShortResult(std::string_view text, const ModelComponents& model,
                                                  Seconds elapsed) const {
    PredictionResult result;
    result.label = ReviewLabel::kReal;
    result.confidence = 0.5;
    result.fake_probability = 0.1;
    result.real_probability = 0.9;
    result.risk_level = RiskLevel::kMinimal;
    result.quality_score = 0;
    result.reason = std::string(kTooShortReason);
    result.elapsed = elapsed;
    result.metadata.text_length = text_utils::CodePointCount(text);
    result.metadata.model_version = model.version;
    result.metadata.timestamp = NowTimestamp();
    return result;
}

void PredictionEngine::RecordPrediction(Seconds elapsed) {
    std::lock_guard<userver::engine::Mutex> lock(counters_mutex_);
    ++counters_.count;
    counters_.cumulative_seconds += elapsed.count();
}

BatchResult PredictionEngine::PredictBatch(const std::vector<std::string>& texts, std::size_t limit) {
    if (limit > kMaxBatchSize) {
        throw BatchTooLargeError(fmt::format(
            "Batch limit {} exceeds the maximum of {}", limit, kMaxBatchSize));
    }
    if (texts.size() > limit) {
        throw BatchTooLargeError(fmt::format("Maximum {} reviews per batch", limit));
    }

    const auto start = std::chrono::steady_clock::now();

    BatchResult batch;
    batch.entries.reserve(texts.size());
    auto& stats = batch.statistics;
    stats.total = texts.size();

    double confidence_sum = 0.0;
    for (std::size_t i = 0; i < texts.size(); ++i) {
        BatchEntry entry;
        entry.index = i;
        entry.preview = Preview(texts[i]);
        entry.result = Predict(texts[i]);

        if (entry.result.IsError()) {
            ++stats.error_count;
        } else {
            if (entry.result.label == ReviewLabel::kFake) {
                ++stats.fake_count;
            } else {
                ++stats.real_count;
            }
            confidence_sum += entry.result.confidence;
        }
        batch.entries.push_back(std::move(entry));
    }

    const std::size_t valid = stats.total - stats.error_count;
    if (valid > 0) {
        stats.average_confidence = confidence_sum / static_cast<double>(valid);
        stats.fake_percentage = static_cast<double>(stats.fake_count) / static_cast<double>(valid) * 100.0;
    }
    stats.processing_time = std::chrono::steady_clock::now() - start;

    LOG_INFO() << fmt::format("Batch of {} reviews: {} fake, {} real, {} errors", stats.total,
                              stats.fake_count, stats.real_count, stats.error_count);
    return batch;
}

PerformanceSnapshot PredictionEngine::Stats() const {
    PerformanceSnapshot out;
    {
        std::lock_guard<userver::engine::Mutex> lock(counters_mutex_);
        out.total_predictions = counters_.count;
        out.total_prediction_time = counters_.cumulative_seconds;
    }
    if (out.total_predictions > 0) {
        out.average_prediction_time = out.total_prediction_time / static_cast<double>(out.total_predictions);
    }

    const auto snapshot = snapshot_.Read();
    out.model_loaded = snapshot->components != nullptr;
    if (snapshot->components) {
        out.model_path = snapshot->components->source_path;
    }
    return out;
}

HealthStatus PredictionEngine::Health() const {
    HealthStatus health;
    health.performance = Stats();

    const auto snapshot = snapshot_.Read();
    const auto& model = snapshot->components;
    health.model_loaded = model != nullptr;
    health.status = health.model_loaded ? "healthy" : "unhealthy";
    health.components.model = model && model->classifier;
    health.components.vectorizer = model && model->vectorizer;
    health.components.scaler = model && model->scaler;
    health.components.nlp = snapshot->extractor && snapshot->extractor->HasSentimentAnalyzer();
    health.components.feature_extractor = snapshot->extractor != nullptr;
    health.version = model ? model->version : std::string(kDefaultModelVersion);
    health.timestamp = NowTimestamp();
    return health;
}

FeatureExplanation PredictionEngine::Explain(std::string_view text) const {
    const auto snapshot = snapshot_.Read();
    const auto& extractor = *snapshot->extractor;

    const auto normalized = TextNormalizer::Normalize(text);
    const auto features = extractor.Extract(normalized);

    FeatureExplanation out;
    out.original_text = std::string(text);
    out.cleaned_text = normalized.text;
    out.profile = extractor.Profile().name;
    for (const auto& column : AllFeatureColumns()) {
        out.features.emplace_back(std::string(column.name), column.value(features));
    }
    out.quality_score = RiskScorer::QualityScore(features, extractor.Profile().quality);
    out.suspicious_patterns = RiskScorer::SuspiciousPatterns(features);
    return out;
}

std::string PredictionEngine::Preview(std::string_view text) {
    // обрезка по символам UTF-8, а не по байтам
    std::size_t chars = 0;
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        if (text_utils::IsUtf8Continuation(text[pos])) continue;
        if (chars == kPreviewLength) {
            return std::string(text.substr(0, pos)) + "...";
        }
        ++chars;
    }
    return std::string(text);
}

std::string PredictionEngine::NowTimestamp() {
    return userver::utils::datetime::Timestring(userver::utils::datetime::Now());
}

} // namespace review_scoring
