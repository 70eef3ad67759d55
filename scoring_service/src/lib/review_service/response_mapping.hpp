#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <grpcpp/support/status.h>

#include <review/review_scoring.pb.h>

#include "prediction_engine/prediction_engine.hpp"

namespace review_scoring {

inline constexpr std::size_t kMaxReviewTextLength = 5000;
inline constexpr std::string_view kApiVersion = "1.0";

// INVALID_ARGUMENT для пустого текста и текста длиннее kMaxReviewTextLength символов.
// Длина считается в символах UTF-8, а не в байтах.
std::optional<grpc::Status> ValidateReviewText(std::string_view text);

// Полный ответ без метаданных запроса (context, request_time)
review::AnalyzeReviewResponse MakeAnalyzeResponse(const PredictionResult& result);

// Компактный вердикт для браузерного расширения: статус invalid/error/success,
// метки в нижнем регистре, значения округлены до 3 знаков
review::AnalyzeForExtensionResponse MakeExtensionResponse(PredictionEngine& engine, std::string_view text);

// OK, либо INVALID_ARGUMENT, если батч превышает лимит
grpc::Status AnalyzeBatchInto(PredictionEngine& engine,
                              const std::vector<std::string>& texts,
                              std::size_t limit,
                              review::AnalyzeBatchResponse& response);

review::ExplainReviewResponse MakeExplainResponse(const FeatureExplanation& explanation);
review::HealthResponse MakeHealthResponse(const HealthStatus& health);
review::StatsResponse MakeStatsResponse(const PerformanceSnapshot& stats);

} // namespace review_scoring
