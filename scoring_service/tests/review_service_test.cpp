#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <userver/utest/utest.hpp>

#include "review_service/response_mapping.hpp"
#include "test_fakes.hpp"
#include "text_utils/text_utils.hpp"

namespace review_scoring {

namespace {

constexpr std::string_view kReview = "Barang sampai cepat, kualiti bagus lah";

std::string Repeat(std::string_view piece, std::size_t times) {
    std::string out;
    for (std::size_t i = 0; i < times; ++i) out += piece;
    return out;
}

std::unique_ptr<PredictionEngine> LoadedEngine(double fake_probability, bool fail = false) {
    auto engine = std::make_unique<PredictionEngine>(TextAnalyzers{}, RealtimeProfile());
    engine->Install(test::MakeComponents(fake_probability, fail));
    return engine;
}

} // namespace

TEST(TextUtils, ToLowerAsciiKeepsUtf8Bytes) {
    EXPECT_EQ(text_utils::ToLowerAscii("BARANG Bagus LAH"), "barang bagus lah");
    EXPECT_EQ(text_utils::ToLowerAscii("CAF\xC3\x89 \xC3\xA9"), "caf\xC3\x89 \xC3\xA9");
    EXPECT_EQ(text_utils::ToLowerAscii(""), "");
}

TEST(TextUtils, CodePointCount) {
    EXPECT_EQ(text_utils::CodePointCount(""), 0u);
    EXPECT_EQ(text_utils::CodePointCount("barang"), 6u);
    EXPECT_EQ(text_utils::CodePointCount("caf\xC3\xA9"), 4u);
    EXPECT_EQ(text_utils::CodePointCount("\xE5\xA5\xBD\xF0\x9F\x91\x8D"), 2u);  // 好👍
    EXPECT_TRUE(text_utils::IsUtf8Continuation('\xA9'));
    EXPECT_FALSE(text_utils::IsUtf8Continuation('\xC3'));
    EXPECT_FALSE(text_utils::IsUtf8Continuation('a'));
}

TEST(ValidateReviewText, EmptyIsInvalid) {
    const auto status = ValidateReviewText("");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(ValidateReviewText, LimitCountsCharacters) {
    const auto accented = Repeat("\xC3\xA9", kMaxReviewTextLength);
    ASSERT_EQ(accented.size(), 2 * kMaxReviewTextLength);
    EXPECT_FALSE(ValidateReviewText(accented).has_value());
    EXPECT_FALSE(ValidateReviewText(std::string(kMaxReviewTextLength, 'a')).has_value());

    const auto too_long = ValidateReviewText(std::string(kMaxReviewTextLength + 1, 'a'));
    ASSERT_TRUE(too_long.has_value());
    EXPECT_EQ(too_long->error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(too_long->error_message(), "Review text exceeds 5000 characters");

    const auto accented_too_long = ValidateReviewText(accented + "\xC3\xA9");
    ASSERT_TRUE(accented_too_long.has_value());
    EXPECT_EQ(accented_too_long->error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

UTEST(ExtensionResponse, ShortTextIsInvalid) {
    auto engine = LoadedEngine(0.9);
    for (const auto* text : {"ok", "   a  "}) {
        const auto response = MakeExtensionResponse(*engine, text);
        EXPECT_EQ(response.status(), "invalid") << text;
        EXPECT_EQ(response.message(), "Text too short");
        EXPECT_EQ(response.risk(), "unknown");
        EXPECT_TRUE(response.prediction().empty());
    }
    EXPECT_EQ(engine->Stats().total_predictions, 0u);
}

UTEST(ExtensionResponse, FailuresAreErrors) {
    PredictionEngine unloaded(TextAnalyzers{}, RealtimeProfile());
    const auto not_loaded = MakeExtensionResponse(unloaded, kReview);
    EXPECT_EQ(not_loaded.status(), "error");
    EXPECT_EQ(not_loaded.message(), "Analysis failed");
    EXPECT_EQ(not_loaded.risk(), "unknown");

    auto failing = LoadedEngine(0.9, /*fail=*/true);
    const auto failed = MakeExtensionResponse(*failing, kReview);
    EXPECT_EQ(failed.status(), "error");
    EXPECT_EQ(failed.risk(), "unknown");
    EXPECT_FALSE(failed.has_details());
}

UTEST(ExtensionResponse, LowercaseLabels) {
    auto engine = LoadedEngine(0.9);
    const auto response = MakeExtensionResponse(*engine, kReview);

    EXPECT_EQ(response.status(), "success");
    EXPECT_EQ(response.prediction(), "fake");
    EXPECT_EQ(response.risk(), "high");
    EXPECT_DOUBLE_EQ(response.confidence(), 0.9);
    EXPECT_DOUBLE_EQ(response.fake_prob(), 0.9);
    EXPECT_TRUE(response.details().malaysian());
    EXPECT_GE(response.details().quality(), 0);
    EXPECT_LE(response.details().quality(), 100);
}

UTEST(ExtensionResponse, RoundsToThreeDecimals) {
    auto engine = LoadedEngine(0.12345);
    const auto response = MakeExtensionResponse(*engine, kReview);

    EXPECT_EQ(response.status(), "success");
    EXPECT_EQ(response.prediction(), "real");
    EXPECT_EQ(response.risk(), "minimal");
    EXPECT_DOUBLE_EQ(response.fake_prob(), 0.123);
    EXPECT_DOUBLE_EQ(response.confidence(), 0.877);
    const double time_ms = response.details().time() * 1000.0;
    EXPECT_NEAR(time_ms, std::round(time_ms), 1e-6);
}

UTEST(BatchResponse, OverLimitIsInvalidArgument) {
    auto engine = LoadedEngine(0.9);
    const std::vector<std::string> texts(3, std::string(kReview));

    review::AnalyzeBatchResponse response;
    const auto status = AnalyzeBatchInto(*engine, texts, 2, response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(response.results_size(), 0);

    const std::vector<std::string> fifty_one(PredictionEngine::kMaxBatchSize + 1, std::string(kReview));
    review::AnalyzeBatchResponse large;
    EXPECT_EQ(AnalyzeBatchInto(*engine, fifty_one, PredictionEngine::kMaxBatchSize, large).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}

UTEST(BatchResponse, FillsResultsAndStatistics) {
    auto engine = LoadedEngine(0.9);
    const std::vector<std::string> texts{std::string(kReview), "!!!", std::string(kReview)};

    review::AnalyzeBatchResponse response;
    const auto status = AnalyzeBatchInto(*engine, texts, PredictionEngine::kMaxBatchSize, response);
    ASSERT_TRUE(status.ok());

    EXPECT_TRUE(response.success());
    ASSERT_EQ(response.results_size(), 3);
    EXPECT_EQ(response.results(0).prediction(), review::FAKE);
    EXPECT_EQ(response.results(1).prediction(), review::REAL);
    EXPECT_EQ(response.results(2).index(), 2u);
    EXPECT_EQ(response.statistics().total(), 3u);
    EXPECT_EQ(response.statistics().fake_count(), 2u);
    EXPECT_EQ(response.statistics().real_count(), 1u);
    EXPECT_EQ(response.api_version(), kApiVersion);
    EXPECT_FALSE(response.timestamp().empty());
}

UTEST(BatchResponse, FailedEntriesCarryError) {
    auto engine = LoadedEngine(0.9, /*fail=*/true);
    review::AnalyzeBatchResponse response;
    ASSERT_TRUE(AnalyzeBatchInto(*engine, {std::string(kReview)}, 10, response).ok());

    ASSERT_EQ(response.results_size(), 1);
    EXPECT_EQ(response.results(0).error(), "malformed vector");
    EXPECT_EQ(response.statistics().error_count(), 1u);
}

UTEST(AnalyzeResponse, UnknownIsNotSuccess) {
    PredictionEngine unloaded(TextAnalyzers{}, RealtimeProfile());
    const auto response = MakeAnalyzeResponse(unloaded.Predict(kReview));

    EXPECT_FALSE(response.success());
    EXPECT_EQ(response.prediction(), review::UNKNOWN);
    EXPECT_EQ(response.error().kind(), "model_not_loaded");
    EXPECT_EQ(response.metadata().api_version(), kApiVersion);
}

UTEST(AnalyzeResponse, CopiesPrediction) {
    auto engine = LoadedEngine(0.9);
    const auto response = MakeAnalyzeResponse(engine->Predict(kReview));

    EXPECT_TRUE(response.success());
    EXPECT_EQ(response.prediction(), review::FAKE);
    EXPECT_EQ(response.risk_level(), review::HIGH);
    EXPECT_DOUBLE_EQ(response.confidence(), 0.9);
    EXPECT_EQ(response.metadata().model_version(), "test-1");
    EXPECT_EQ(response.metadata().text_length(), kReview.size());
    EXPECT_EQ(response.metadata().api_version(), kApiVersion);
}

} // namespace review_scoring
