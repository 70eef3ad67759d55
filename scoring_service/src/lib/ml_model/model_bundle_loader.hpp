#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <review/model_bundle.pb.h>

#include "model_interface.hpp"

namespace review_scoring {

enum class LoadStatus {
    kOk,
    kNotFound,
    kIncompleteModel,     // нет ensemble, tfidf или scaler
    kDeserializeFailure,  // бандл не читается или подобъект некорректен
};

std::string_view ToString(LoadStatus status);

struct BundleLoadResult {
    LoadStatus status = LoadStatus::kNotFound;
    std::optional<ModelComponents> components;
    std::string message;

    bool Ok() const { return status == LoadStatus::kOk && components.has_value(); }
};

// Загрузчик бандла модели: бинарный protobuf, либо protobuf JSON для путей *.json.
// Никогда не бросает, ошибка возвращается статусом.
class ModelBundleLoader {
public:
    static BundleLoadResult Load(const std::string& path);

    // Сборка компонентов из уже прочитанного бандла
    static BundleLoadResult FromBundle(const review_model::ModelBundle& bundle,
                                       const std::string& source_path);

    // Первый существующий путь из списка кандидатов
    static std::optional<std::string> FindBundle(const std::vector<std::string>& search_paths);

private:
    static bool ReadBundle(const std::string& path, review_model::ModelBundle& bundle,
                           std::string& error);
};

} // namespace review_scoring
