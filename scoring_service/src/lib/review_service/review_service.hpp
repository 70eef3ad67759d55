#pragma once

#include <cstddef>
#include <string_view>

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/ugrpc/server/service_component_base.hpp>
#include <userver/yaml_config/schema.hpp>

#include <review/review_scoring.pb.h>
#include <review/review_scoring_service.usrv.pb.hpp>

#include "prediction_engine/prediction_engine.hpp"

namespace review_scoring {

class ReviewScoringService final : public review::ReviewScoringServiceBase {
public:
    ReviewScoringService(PredictionEngine& engine, std::size_t batch_limit);

    AnalyzeReviewResult AnalyzeReview(CallContext& context,
                                      review::AnalyzeReviewRequest&& request) override;

    AnalyzeBatchResult AnalyzeBatch(CallContext& context,
                                    review::AnalyzeBatchRequest&& request) override;

    AnalyzeForExtensionResult AnalyzeForExtension(CallContext& context,
                                                  review::AnalyzeReviewRequest&& request) override;

    ExplainReviewResult ExplainReview(CallContext& context,
                                      review::AnalyzeReviewRequest&& request) override;

    GetHealthResult GetHealth(CallContext& context, google::protobuf::Empty&& request) override;

    GetStatsResult GetStats(CallContext& context, google::protobuf::Empty&& request) override;

private:
    PredictionEngine& engine_;
    std::size_t batch_limit_;
};

class ReviewScoringServiceComponent final : public userver::ugrpc::server::ServiceComponentBase {
public:
    static constexpr std::string_view kName = "review-scoring-service";

    ReviewScoringServiceComponent(const userver::components::ComponentConfig& config,
                                  const userver::components::ComponentContext& context);

    ~ReviewScoringServiceComponent() override = default;

    static userver::yaml_config::Schema GetStaticConfigSchema();

private:
    ReviewScoringService service_;
};

} // namespace review_scoring
