#include "response_mapping.hpp"

#include <cmath>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/utils/datetime.hpp>

#include "text_normalizer/text_normalizer.hpp"
#include "text_utils/text_utils.hpp"

namespace review_scoring {

namespace {

double Round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

review::Prediction ToProto(ReviewLabel label) {
    switch (label) {
        case ReviewLabel::kReal:
            return review::REAL;
        case ReviewLabel::kFake:
            return review::FAKE;
        case ReviewLabel::kUnknown:
            return review::UNKNOWN;
        case ReviewLabel::kError:
            return review::ERROR;
    }
    return review::PREDICTION_UNSPECIFIED;
}

review::RiskLevel ToProto(RiskLevel level) {
    switch (level) {
        case RiskLevel::kMinimal:
            return review::MINIMAL;
        case RiskLevel::kLow:
            return review::LOW;
        case RiskLevel::kMedium:
            return review::MEDIUM;
        case RiskLevel::kHigh:
            return review::HIGH;
    }
    return review::RISK_LEVEL_UNSPECIFIED;
}

void FillPerformance(const PerformanceSnapshot& stats, review::PerformanceStats& out) {
    out.set_total_predictions(stats.total_predictions);
    out.set_average_prediction_time(stats.average_prediction_time);
    out.set_total_prediction_time(stats.total_prediction_time);
    out.set_is_model_loaded(stats.model_loaded);
    out.set_model_path(stats.model_path);
}

} // anonymous namespace

std::optional<grpc::Status> ValidateReviewText(std::string_view text) {
    if (text.empty()) {
        return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, "Review text must not be empty"};
    }
    if (text_utils::CodePointCount(text) > kMaxReviewTextLength) {
        return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                            fmt::format("Review text exceeds {} characters", kMaxReviewTextLength)};
    }
    return std::nullopt;
}

review::AnalyzeReviewResponse MakeAnalyzeResponse(const PredictionResult& result) {
    review::AnalyzeReviewResponse response;
    response.set_success(!result.IsError());
    response.set_prediction(ToProto(result.label));
    response.set_confidence(result.confidence);
    response.set_fake_probability(result.fake_probability);
    response.set_real_probability(result.real_probability);
    response.set_risk_level(ToProto(result.risk_level));
    response.set_prediction_time(result.elapsed.count());
    if (result.reason) {
        response.set_reason(*result.reason);
    }
    if (result.error) {
        auto& error = *response.mutable_error();
        error.set_kind(std::string(ToString(result.error->kind)));
        error.set_message(result.error->message);
    }

    auto& analysis = *response.mutable_analysis();
    analysis.set_word_count(result.analysis.word_count);
    analysis.set_sentiment_score(result.analysis.sentiment_score);
    analysis.set_malaysian_terms(result.analysis.malaysian_terms);
    analysis.set_has_mixed_language(result.analysis.has_mixed_language);
    analysis.set_has_specific_details(result.analysis.has_specific_details);
    analysis.set_quality_score(result.quality_score);
    for (const auto& pattern : result.suspicious_patterns) {
        analysis.add_suspicious_patterns(pattern);
    }

    auto& metadata = *response.mutable_metadata();
    metadata.set_text_length(result.metadata.text_length);
    metadata.set_processed_length(result.metadata.processed_length);
    metadata.set_model_version(result.metadata.model_version);
    metadata.set_timestamp(result.metadata.timestamp);
    metadata.set_api_version(std::string(kApiVersion));
    return response;
}

review::AnalyzeForExtensionResponse MakeExtensionResponse(PredictionEngine& engine, std::string_view text) {
    review::AnalyzeForExtensionResponse response;
    const auto trimmed = TextNormalizer::Trim(text);
    if (trimmed.size() < PredictionEngine::kMinTextLength) {
        response.set_status("invalid");
        response.set_message("Text too short");
        response.set_risk("unknown");
        return response;
    }

    const auto result = engine.Predict(trimmed);
    if (result.IsError()) {
        response.set_status("error");
        response.set_message("Analysis failed");
        response.set_risk("unknown");
        return response;
    }

    response.set_status("success");
    response.set_prediction(text_utils::ToLowerAscii(ToString(result.label)));
    response.set_confidence(Round3(result.confidence));
    response.set_risk(text_utils::ToLowerAscii(ToString(result.risk_level)));
    response.set_fake_prob(Round3(result.fake_probability));
    auto& details = *response.mutable_details();
    details.set_malaysian(result.analysis.malaysian_terms > 0);
    details.set_quality(result.quality_score);
    details.set_time(Round3(result.elapsed.count()));
    return response;
}

grpc::Status AnalyzeBatchInto(PredictionEngine& engine,
                              const std::vector<std::string>& texts,
                              std::size_t limit,
                              review::AnalyzeBatchResponse& response) {
    BatchResult batch;
    try {
        batch = engine.PredictBatch(texts, limit);
    } catch (const BatchTooLargeError& e) {
        LOG_WARNING() << "Rejected batch of " << texts.size() << " reviews: " << e.what();
        return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, e.what()};
    }

    response.set_success(true);
    for (const auto& entry : batch.entries) {
        auto& item = *response.add_results();
        item.set_index(entry.index);
        item.set_text(entry.preview);
        if (entry.result.IsError()) {
            item.set_error(entry.result.error ? entry.result.error->message : "Prediction failed");
            continue;
        }
        item.set_prediction(ToProto(entry.result.label));
        item.set_confidence(entry.result.confidence);
        item.set_fake_probability(entry.result.fake_probability);
        item.set_risk_level(ToProto(entry.result.risk_level));
    }

    const auto& stats = batch.statistics;
    auto& out = *response.mutable_statistics();
    out.set_total(stats.total);
    out.set_fake_count(stats.fake_count);
    out.set_real_count(stats.real_count);
    out.set_error_count(stats.error_count);
    out.set_avg_confidence(stats.average_confidence);
    out.set_fake_percentage(stats.fake_percentage);
    out.set_processing_time(stats.processing_time.count());

    response.set_api_version(std::string(kApiVersion));
    response.set_timestamp(userver::utils::datetime::Timestring(userver::utils::datetime::Now()));
    return grpc::Status::OK;
}

review::ExplainReviewResponse MakeExplainResponse(const FeatureExplanation& explanation) {
    review::ExplainReviewResponse response;
    response.set_original_text(explanation.original_text);
    response.set_cleaned_text(explanation.cleaned_text);
    response.set_profile(explanation.profile);
    auto& features = *response.mutable_features();
    for (const auto& [name, value] : explanation.features) {
        features[name] = value;
        response.add_feature_order(name);
    }
    response.set_quality_score(explanation.quality_score);
    for (const auto& pattern : explanation.suspicious_patterns) {
        response.add_suspicious_patterns(pattern);
    }
    return response;
}

review::HealthResponse MakeHealthResponse(const HealthStatus& health) {
    review::HealthResponse response;
    response.set_status(health.status);
    response.set_model_loaded(health.model_loaded);
    auto& components = *response.mutable_components();
    components.set_model(health.components.model);
    components.set_vectorizer(health.components.vectorizer);
    components.set_scaler(health.components.scaler);
    components.set_nlp(health.components.nlp);
    components.set_feature_extractor(health.components.feature_extractor);
    FillPerformance(health.performance, *response.mutable_performance());
    response.set_version(health.version);
    response.set_timestamp(health.timestamp);
    return response;
}

review::StatsResponse MakeStatsResponse(const PerformanceSnapshot& stats) {
    review::StatsResponse response;
    response.set_success(stats.model_loaded);
    FillPerformance(stats, *response.mutable_statistics());
    response.set_api_version(std::string(kApiVersion));
    return response;
}

} // namespace review_scoring
