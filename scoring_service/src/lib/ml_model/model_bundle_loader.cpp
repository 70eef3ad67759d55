#include "model_bundle_loader.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>
#include <google/protobuf/util/json_util.h>

#include <userver/logging/log.hpp>

#include "feature_extractor/feature_record.hpp"
#include "scoring_profile/scoring_profile.hpp"
#include "standard_scaler.hpp"
#include "tfidf_vectorizer.hpp"
#include "xgb_ensemble_classifier.hpp"

namespace review_scoring {

namespace {

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

BundleLoadResult Failure(LoadStatus status, std::string message) {
    LOG_ERROR() << "Model bundle load failed (" << ToString(status) << "): " << message;
    BundleLoadResult result;
    result.status = status;
    result.message = std::move(message);
    return result;
}

void CheckFeatureNames(const review_model::ModelBundle& bundle) {
    if (bundle.feature_names().empty()) return;

    const auto& columns = ModelFeatureColumns();
    bool same = static_cast<std::size_t>(bundle.feature_names_size()) == columns.size();
    for (std::size_t i = 0; same && i < columns.size(); ++i) {
        same = bundle.feature_names(static_cast<int>(i)) == columns[i].name;
    }
    if (!same) {
        LOG_WARNING() << "Bundle feature_names differ from the dense feature order (schema v"
                      << kFeatureSchemaVersion << "), predictions may be off";
    }
}

} // anonymous namespace

std::string_view ToString(LoadStatus status) {
    switch (status) {
        case LoadStatus::kOk:
            return "ok";
        case LoadStatus::kNotFound:
            return "not_found";
        case LoadStatus::kIncompleteModel:
            return "incomplete_model";
        case LoadStatus::kDeserializeFailure:
            return "deserialize_failure";
    }
    return "unknown";
}

std::optional<std::string> ModelBundleLoader::FindBundle(const std::vector<std::string>& search_paths) {
    for (const auto& path : search_paths) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::nullopt;
}

bool ModelBundleLoader::ReadBundle(const std::string& path, review_model::ModelBundle& bundle,
                                   std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = fmt::format("cannot open {}", path);
        return false;
    }

    if (!EndsWith(path, ".json")) {
        if (!bundle.ParseFromIstream(&file)) {
            error = fmt::format("{} is not a valid binary bundle", path);
            return false;
        }
        return true;
    }

    const std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    const auto status = google::protobuf::util::JsonStringToMessage(json, &bundle, options);
    if (!status.ok()) {
        const auto message = status.message();
        error = fmt::format("{} is not a valid JSON bundle: {}", path,
                            std::string(message.data(), message.size()));
        return false;
    }
    return true;
}

BundleLoadResult ModelBundleLoader::Load(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        BundleLoadResult result;
        result.status = LoadStatus::kNotFound;
        result.message = fmt::format("model bundle not found: {}", path);
        LOG_WARNING() << result.message;
        return result;
    }

    review_model::ModelBundle bundle;
    std::string error;
    if (!ReadBundle(path, bundle, error)) {
        return Failure(LoadStatus::kDeserializeFailure, error);
    }
    return FromBundle(bundle, path);
}

BundleLoadResult ModelBundleLoader::FromBundle(const review_model::ModelBundle& bundle,
                                               const std::string& source_path) {
    const bool has_ensemble = bundle.has_models() && bundle.models().has_ensemble()
        && !bundle.models().ensemble().payload().empty();
    const bool has_tfidf = bundle.has_vectorizers() && bundle.vectorizers().has_tfidf();
    if (!has_ensemble || !has_tfidf || !bundle.has_scaler()) {
        return Failure(LoadStatus::kIncompleteModel, fmt::format(
            "{}: ensemble={}, tfidf={}, scaler={}", source_path, has_ensemble, has_tfidf,
            bundle.has_scaler()));
    }

    ModelComponents components;
    components.source_path = source_path;

    try {
        auto vectorizer = TfidfVectorizer::FromProto(bundle.vectorizers().tfidf());
        auto scaler = StandardScaler::FromProto(bundle.scaler());
        if (scaler->Dimension() != kModelFeatureCount) {
            throw std::invalid_argument(fmt::format(
                "scaler covers {} features, expected {}", scaler->Dimension(), kModelFeatureCount));
        }

        const auto& ensemble = bundle.models().ensemble();
        const std::size_t expected_features = vectorizer->Dimension() + kModelFeatureCount;
        if (ensemble.num_features() != 0 && ensemble.num_features() != expected_features) {
            throw std::invalid_argument(fmt::format(
                "ensemble expects {} features, vectorizer and scaler give {}",
                ensemble.num_features(), expected_features));
        }

        components.classifier = XgbEnsembleClassifier::FromBuffer(ensemble.payload(), expected_features);
        components.vectorizer = std::move(vectorizer);
        components.scaler = std::move(scaler);
    } catch (const std::exception& e) {
        return Failure(LoadStatus::kDeserializeFailure, fmt::format("{}: {}", source_path, e.what()));
    }

    CheckFeatureNames(bundle);

    if (bundle.has_detector() && !bundle.detector().profile().empty()) {
        if (bundle.detector().feature_schema_version() != 0
            && bundle.detector().feature_schema_version() != kFeatureSchemaVersion) {
            return Failure(LoadStatus::kDeserializeFailure, fmt::format(
                "{}: feature schema v{} is not supported", source_path,
                bundle.detector().feature_schema_version()));
        }
        try {
            ProfileByName(bundle.detector().profile());
        } catch (const std::invalid_argument& e) {
            return Failure(LoadStatus::kDeserializeFailure, fmt::format("{}: {}", source_path, e.what()));
        }
        components.detector_profile = bundle.detector().profile();
    }
    if (bundle.has_metadata() && !bundle.metadata().version().empty()) {
        components.version = bundle.metadata().version();
    }

    LOG_INFO() << fmt::format("Loaded model bundle {} (version {}, tfidf dimension {})",
                              source_path, components.version, components.vectorizer->Dimension());

    BundleLoadResult result;
    result.status = LoadStatus::kOk;
    result.components = std::move(components);
    return result;
}

} // namespace review_scoring
