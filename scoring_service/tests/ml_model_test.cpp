#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <xgboost/c_api.h>

#include <userver/utest/utest.hpp>

#include "feature_extractor/feature_record.hpp"
#include "ml_model/model_bundle_loader.hpp"
#include "ml_model/standard_scaler.hpp"
#include "ml_model/tfidf_vectorizer.hpp"
#include "ml_model/xgb_ensemble_classifier.hpp"
#include "prediction_engine/prediction_engine.hpp"
#include "scoring_profile/scoring_profile.hpp"

namespace review_scoring {

namespace {

review_model::TfidfVectorizer SampleTfidfProto() {
    review_model::TfidfVectorizer proto;
    auto& vocabulary = *proto.mutable_vocabulary();
    vocabulary["barang"] = 0;
    vocabulary["bagus"] = 1;
    vocabulary["barang bagus"] = 2;
    vocabulary["ok"] = 3;
    for (double idf : {1.0, 2.0, 3.0, 1.5}) proto.add_idf(idf);
    proto.set_ngram_min(1);
    proto.set_ngram_max(2);
    return proto;
}

review_model::ModelBundle SampleBundle() {
    review_model::ModelBundle bundle;
    *bundle.mutable_vectorizers()->mutable_tfidf() = SampleTfidfProto();
    for (std::size_t i = 0; i < kModelFeatureCount; ++i) {
        bundle.mutable_scaler()->add_mean(0.0);
        bundle.mutable_scaler()->add_scale(1.0);
    }
    bundle.mutable_models()->mutable_ensemble()->set_payload("not an xgboost model");
    return bundle;
}

// 4 столбца TF-IDF из SampleTfidfProto и плотный блок
constexpr std::size_t kSampleModelWidth = 4 + kModelFeatureCount;

void CheckXgb(int code, const char* what) {
    if (code != 0) {
        throw std::runtime_error(std::string(what) + ": " + XGBGetLastError());
    }
}

// Обучает маленький бустер в памяти и возвращает его JSON-модель.
// Метка строки i равна i % num_labels и продублирована в столбце 0.
std::string TrainEnsemblePayload(const std::string& objective, int num_class = 0) {
    constexpr std::size_t kRows = 12;
    const int num_labels = num_class > 0 ? num_class : 2;
    std::vector<float> data(kRows * kSampleModelWidth, 0.5f);
    std::vector<float> labels(kRows);
    for (std::size_t row = 0; row < kRows; ++row) {
        labels[row] = static_cast<float>(row % num_labels);
        data[row * kSampleModelWidth] = labels[row];
    }

    DMatrixHandle dtrain = nullptr;
    CheckXgb(XGDMatrixCreateFromMat(data.data(), kRows, kSampleModelWidth, std::nanf(""), &dtrain),
             "XGDMatrixCreateFromMat");
    BoosterHandle booster = nullptr;
    std::string payload;
    try {
        CheckXgb(XGDMatrixSetFloatInfo(dtrain, "label", labels.data(), kRows), "XGDMatrixSetFloatInfo");
        CheckXgb(XGBoosterCreate(&dtrain, 1, &booster), "XGBoosterCreate");
        CheckXgb(XGBoosterSetParam(booster, "objective", objective.c_str()), "objective");
        CheckXgb(XGBoosterSetParam(booster, "max_depth", "2"), "max_depth");
        CheckXgb(XGBoosterSetParam(booster, "eta", "1"), "eta");
        CheckXgb(XGBoosterSetParam(booster, "nthread", "1"), "nthread");
        if (num_class > 0) {
            const auto classes = std::to_string(num_class);
            CheckXgb(XGBoosterSetParam(booster, "num_class", classes.c_str()), "num_class");
        }
        for (int iter = 0; iter < 3; ++iter) {
            CheckXgb(XGBoosterUpdateOneIter(booster, iter, dtrain), "XGBoosterUpdateOneIter");
        }
        bst_ulong length = 0;
        const char* buffer = nullptr;
        CheckXgb(XGBoosterSaveModelToBuffer(booster, "{\"format\": \"json\"}", &length, &buffer),
                 "XGBoosterSaveModelToBuffer");
        // буфер принадлежит бустеру
        payload.assign(buffer, length);
    } catch (const std::exception&) {
        if (booster) XGBoosterFree(booster);
        XGDMatrixFree(dtrain);
        throw;
    }
    XGBoosterFree(booster);
    XGDMatrixFree(dtrain);
    return payload;
}

ModelInput SampleModelInput(float marker, std::size_t dimension = kSampleModelWidth) {
    ModelInput input;
    input.dimension = dimension;
    input.indices = {0, 5};
    input.values = {marker, 0.5f};
    return input;
}

review_model::ModelBundle TrainedBundle() {
    auto bundle = SampleBundle();
    auto& ensemble = *bundle.mutable_models()->mutable_ensemble();
    ensemble.set_payload(TrainEnsemblePayload("binary:logistic"));
    ensemble.set_num_features(kSampleModelWidth);
    bundle.mutable_detector()->set_profile(std::string(kBatchInferenceProfileName));
    bundle.mutable_detector()->set_feature_schema_version(kFeatureSchemaVersion);
    bundle.mutable_metadata()->set_version("2024.06-trained");
    return bundle;
}

void ExpectProbabilityPair(const ProbabilityPair& proba) {
    EXPECT_GE(proba.fake_probability, 0.0);
    EXPECT_LE(proba.fake_probability, 1.0);
    EXPECT_GE(proba.real_probability, 0.0);
    EXPECT_LE(proba.real_probability, 1.0);
    EXPECT_NEAR(proba.fake_probability + proba.real_probability, 1.0, 1e-5);
}

class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(::testing::TempDir() + name) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST(TfidfVectorizer, UnigramsAndBigramsWithL2Norm) {
    const auto vectorizer = TfidfVectorizer::FromProto(SampleTfidfProto());
    ASSERT_EQ(vectorizer->Dimension(), 4u);

    const auto vector = vectorizer->Transform("Barang bagus, ok ok");
    ASSERT_EQ(vector.indices, (std::vector<std::uint32_t>{0, 1, 2, 3}));

    const double norm = std::sqrt(23.0);
    EXPECT_NEAR(vector.values[0], 1.0 / norm, 1e-6);
    EXPECT_NEAR(vector.values[1], 2.0 / norm, 1e-6);
    EXPECT_NEAR(vector.values[2], 3.0 / norm, 1e-6);
    EXPECT_NEAR(vector.values[3], 3.0 / norm, 1e-6);
}

TEST(TfidfVectorizer, SublinearTf) {
    auto proto = SampleTfidfProto();
    proto.set_sublinear_tf(true);
    proto.set_norm(review_model::TfidfVectorizer::NONE);
    const auto vector = TfidfVectorizer::FromProto(proto)->Transform("ok ok");

    ASSERT_EQ(vector.indices, (std::vector<std::uint32_t>{3}));
    EXPECT_NEAR(vector.values[0], (1.0 + std::log(2.0)) * 1.5, 1e-5);
}

TEST(TfidfVectorizer, UnknownWordsGiveEmptyVector) {
    const auto vector = TfidfVectorizer::FromProto(SampleTfidfProto())->Transform("sampai cepat");
    EXPECT_TRUE(vector.indices.empty());
    EXPECT_EQ(vector.dimension, 4u);
}

TEST(TfidfVectorizer, WordTokensDropSingleCharacters) {
    EXPECT_EQ(TfidfVectorizer::WordTokens("A barang, 2 OK! x"),
              (std::vector<std::string>{"barang", "ok"}));
}

TEST(TfidfVectorizer, RejectsUnsupportedConfig) {
    auto char_analyzer = SampleTfidfProto();
    char_analyzer.set_analyzer(review_model::TfidfVectorizer::CHAR);
    EXPECT_THROW(TfidfVectorizer::FromProto(char_analyzer), std::invalid_argument);

    review_model::TfidfVectorizer empty;
    EXPECT_THROW(TfidfVectorizer::FromProto(empty), std::invalid_argument);
}

TEST(StandardScaler, CentersAndScales) {
    const StandardScaler scaler({1.0, 2.0}, {2.0, 0.0});
    const auto out = scaler.Transform({5.0, 7.0});
    EXPECT_DOUBLE_EQ(out[0], 2.0);
    EXPECT_DOUBLE_EQ(out[1], 5.0);  // нулевой масштаб считается единичным
}

TEST(StandardScaler, DimensionMismatchThrows) {
    const StandardScaler scaler({1.0, 2.0}, {1.0, 1.0});
    EXPECT_THROW(scaler.Transform({1.0}), std::invalid_argument);
    EXPECT_THROW(StandardScaler({1.0}, {1.0, 2.0}), std::invalid_argument);
}

UTEST(ModelBundleLoader, MissingFileIsNotFound) {
    const auto result = ModelBundleLoader::Load("/nonexistent/model_bundle.pb");
    EXPECT_EQ(result.status, LoadStatus::kNotFound);
    EXPECT_FALSE(result.Ok());
    EXPECT_EQ(ToString(result.status), "not_found");
}

UTEST(ModelBundleLoader, MissingScalerIsIncomplete) {
    auto bundle = SampleBundle();
    bundle.clear_scaler();
    const auto result = ModelBundleLoader::FromBundle(bundle, "memory://bundle");
    EXPECT_EQ(result.status, LoadStatus::kIncompleteModel);
    EXPECT_FALSE(result.components.has_value());
}

UTEST(ModelBundleLoader, EmptyEnsemblePayloadIsIncomplete) {
    auto bundle = SampleBundle();
    bundle.mutable_models()->mutable_ensemble()->clear_payload();
    EXPECT_EQ(ModelBundleLoader::FromBundle(bundle, "memory://bundle").status,
              LoadStatus::kIncompleteModel);
}

UTEST(ModelBundleLoader, ScalerOfWrongWidthFails) {
    auto bundle = SampleBundle();
    bundle.mutable_scaler()->clear_mean();
    bundle.mutable_scaler()->clear_scale();
    bundle.mutable_scaler()->add_mean(0.0);
    EXPECT_EQ(ModelBundleLoader::FromBundle(bundle, "memory://bundle").status,
              LoadStatus::kDeserializeFailure);
}

UTEST(ModelBundleLoader, EnsembleWidthMismatchFails) {
    auto bundle = SampleBundle();
    bundle.mutable_models()->mutable_ensemble()->set_num_features(5);
    EXPECT_EQ(ModelBundleLoader::FromBundle(bundle, "memory://bundle").status,
              LoadStatus::kDeserializeFailure);
}

UTEST(ModelBundleLoader, GarbageEnsemblePayloadFails) {
    const auto result = ModelBundleLoader::FromBundle(SampleBundle(), "memory://bundle");
    EXPECT_EQ(result.status, LoadStatus::kDeserializeFailure);
    EXPECT_FALSE(result.message.empty());
}

UTEST(ModelBundleLoader, GarbageBinaryFails) {
    const TempFile file("garbage_bundle.pb", "\xff\xff\xff");
    EXPECT_EQ(ModelBundleLoader::Load(file.Path()).status, LoadStatus::kDeserializeFailure);
}

UTEST(ModelBundleLoader, InvalidJsonFails) {
    const TempFile file("broken_bundle.json", "{\"models\": ");
    EXPECT_EQ(ModelBundleLoader::Load(file.Path()).status, LoadStatus::kDeserializeFailure);
}

UTEST(ModelBundleLoader, JsonIgnoresUnknownFields) {
    const TempFile file("partial_bundle.json",
                        R"({"scaler": {"mean": [0.0]}, "trainer": "notebook-v2"})");
    EXPECT_EQ(ModelBundleLoader::Load(file.Path()).status, LoadStatus::kIncompleteModel);
}

UTEST(ModelBundleLoader, FindBundleReturnsFirstExisting) {
    const TempFile file("found_bundle.pb", "");
    EXPECT_EQ(ModelBundleLoader::FindBundle({"/nonexistent/a.pb", file.Path(), "/nonexistent/b.pb"}),
              file.Path());
    EXPECT_FALSE(ModelBundleLoader::FindBundle({"/nonexistent/a.pb"}).has_value());
    EXPECT_FALSE(ModelBundleLoader::FindBundle({}).has_value());
}

UTEST(XgbEnsembleClassifier, BinaryLogisticGivesProbabilities) {
    const auto classifier =
        XgbEnsembleClassifier::FromBuffer(TrainEnsemblePayload("binary:logistic"), kSampleModelWidth);

    const auto fake = classifier->PredictProba(SampleModelInput(1.0f));
    const auto real = classifier->PredictProba(SampleModelInput(0.0f));
    ExpectProbabilityPair(fake);
    ExpectProbabilityPair(real);
    EXPECT_GT(fake.fake_probability, real.fake_probability);
    EXPECT_EQ(classifier->Predict(SampleModelInput(1.0f)), LabelFor(fake));
}

UTEST(XgbEnsembleClassifier, TwoClassSoftprobGivesProbabilities) {
    const auto classifier =
        XgbEnsembleClassifier::FromBuffer(TrainEnsemblePayload("multi:softprob", 2), kSampleModelWidth);

    const auto fake = classifier->PredictProba(SampleModelInput(1.0f));
    const auto real = classifier->PredictProba(SampleModelInput(0.0f));
    ExpectProbabilityPair(fake);
    ExpectProbabilityPair(real);
    EXPECT_GT(fake.fake_probability, real.fake_probability);
}

UTEST(XgbEnsembleClassifier, ThreeClassOutputIsRejected) {
    const auto classifier =
        XgbEnsembleClassifier::FromBuffer(TrainEnsemblePayload("multi:softprob", 3), kSampleModelWidth);
    EXPECT_THROW(classifier->PredictProba(SampleModelInput(1.0f)), ClassifierError);
}

UTEST(XgbEnsembleClassifier, WiderInputIsRejected) {
    const auto classifier =
        XgbEnsembleClassifier::FromBuffer(TrainEnsemblePayload("binary:logistic"), kSampleModelWidth);
    EXPECT_THROW(classifier->PredictProba(SampleModelInput(1.0f, kSampleModelWidth + 3)), ClassifierError);

    auto malformed = SampleModelInput(1.0f);
    malformed.values.pop_back();
    EXPECT_THROW(classifier->PredictProba(malformed), ClassifierError);
}

UTEST(XgbEnsembleClassifier, EmptyPayloadIsRejected) {
    EXPECT_THROW(XgbEnsembleClassifier::FromBuffer("", kSampleModelWidth), ClassifierError);
}

UTEST(ModelBundleLoader, TrainedBundleLoads) {
    const TempFile file("trained_bundle.pb", TrainedBundle().SerializeAsString());
    const auto result = ModelBundleLoader::Load(file.Path());

    ASSERT_EQ(result.status, LoadStatus::kOk) << result.message;
    ASSERT_TRUE(result.Ok());
    const auto& components = *result.components;
    ASSERT_TRUE(components.detector_profile.has_value());
    EXPECT_EQ(*components.detector_profile, kBatchInferenceProfileName);
    EXPECT_EQ(components.version, "2024.06-trained");
    EXPECT_EQ(components.source_path, file.Path());
    EXPECT_EQ(components.vectorizer->Dimension(), 4u);
    ExpectProbabilityPair(components.classifier->PredictProba(SampleModelInput(1.0f)));
}

UTEST(ModelBundleLoader, UnsupportedFeatureSchemaFails) {
    auto bundle = TrainedBundle();
    bundle.mutable_detector()->set_feature_schema_version(7);
    const auto result = ModelBundleLoader::FromBundle(bundle, "memory://bundle");
    EXPECT_EQ(result.status, LoadStatus::kDeserializeFailure);
    EXPECT_NE(result.message.find("feature schema v7"), std::string::npos);
}

UTEST(ModelBundleLoader, UnknownDetectorProfileFails) {
    auto bundle = TrainedBundle();
    bundle.mutable_detector()->set_profile("overnight");
    EXPECT_EQ(ModelBundleLoader::FromBundle(bundle, "memory://bundle").status,
              LoadStatus::kDeserializeFailure);
}

UTEST(PredictionEngine, LoadsTrainedBundle) {
    const TempFile file("engine_bundle.pb", TrainedBundle().SerializeAsString());
    PredictionEngine engine(TextAnalyzers{}, RealtimeProfile());

    EXPECT_EQ(engine.LoadModel(file.Path()), LoadStatus::kOk);
    EXPECT_TRUE(engine.IsLoaded());
    EXPECT_EQ(engine.ActiveProfileName(), kBatchInferenceProfileName);
    EXPECT_EQ(engine.Health().version, "2024.06-trained");

    const auto result = engine.Predict("Barang bagus, sampai cepat lah");
    EXPECT_FALSE(result.IsError());
    EXPECT_NEAR(result.fake_probability + result.real_probability, 1.0, 1e-5);
    EXPECT_EQ(result.metadata.model_version, "2024.06-trained");
}

} // namespace review_scoring
