#include "review_service.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <google/protobuf/empty.pb.h>

#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include "review_service/response_mapping.hpp"
#include "scoring_component/scoring_component.hpp"

namespace review_scoring {

ReviewScoringService::ReviewScoringService(PredictionEngine& engine, std::size_t batch_limit)
    : engine_(engine)
    , batch_limit_(batch_limit) {}

ReviewScoringService::AnalyzeReviewResult ReviewScoringService::AnalyzeReview(
    CallContext&,
    review::AnalyzeReviewRequest&& request) {
    const auto start = std::chrono::steady_clock::now();

    if (auto invalid = ValidateReviewText(request.text())) {
        return std::move(*invalid);
    }

    const auto result = engine_.Predict(request.text());
    if (result.error) {
        LOG_ERROR() << "ML prediction error: " << result.error->message;
    }

    auto response = MakeAnalyzeResponse(result);
    auto& metadata = *response.mutable_metadata();
    if (request.has_context()) {
        *metadata.mutable_context() = std::move(*request.mutable_context());
    }
    const std::chrono::duration<double> request_time = std::chrono::steady_clock::now() - start;
    metadata.set_request_time(request_time.count());

    LOG_INFO() << fmt::format("Analysis completed: {} ({:.3f}) in {:.3f}s", ToString(result.label),
                              result.confidence, result.elapsed.count());
    return response;
}

ReviewScoringService::AnalyzeBatchResult ReviewScoringService::AnalyzeBatch(
    CallContext&,
    review::AnalyzeBatchRequest&& request) {
    const std::vector<std::string> texts(request.reviews().begin(), request.reviews().end());

    review::AnalyzeBatchResponse response;
    auto status = AnalyzeBatchInto(engine_, texts, batch_limit_, response);
    if (!status.ok()) {
        return status;
    }
    return response;
}

ReviewScoringService::AnalyzeForExtensionResult ReviewScoringService::AnalyzeForExtension(
    CallContext&,
    review::AnalyzeReviewRequest&& request) {
    if (auto invalid = ValidateReviewText(request.text())) {
        return std::move(*invalid);
    }
    return MakeExtensionResponse(engine_, request.text());
}

ReviewScoringService::ExplainReviewResult ReviewScoringService::ExplainReview(
    CallContext&,
    review::AnalyzeReviewRequest&& request) {
    if (auto invalid = ValidateReviewText(request.text())) {
        return std::move(*invalid);
    }
    return MakeExplainResponse(engine_.Explain(request.text()));
}

ReviewScoringService::GetHealthResult ReviewScoringService::GetHealth(
    CallContext&,
    google::protobuf::Empty&&) {
    return MakeHealthResponse(engine_.Health());
}

ReviewScoringService::GetStatsResult ReviewScoringService::GetStats(
    CallContext&,
    google::protobuf::Empty&&) {
    return MakeStatsResponse(engine_.Stats());
}

ReviewScoringServiceComponent::ReviewScoringServiceComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : userver::ugrpc::server::ServiceComponentBase(config, context),
      service_(
          context.FindComponent<ReviewScoringEngineComponent>().GetEngine(),
          context.FindComponent<ReviewScoringEngineComponent>().GetBatchLimit()) {
    RegisterService(service_);
}

userver::yaml_config::Schema ReviewScoringServiceComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::ugrpc::server::ServiceComponentBase>(R"(
type: object
description: gRPC review scoring service component
additionalProperties: false
properties: {}
)");
}

} // namespace review_scoring
