#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace review_scoring {

enum class ReviewLabel {
    kReal,
    kFake,
    kUnknown,  // модель не загружена
    kError,    // сбой классификатора
};

std::string_view ToString(ReviewLabel label);

// Одна строка в формате CSR: индексы по возрастанию, нули не хранятся
struct SparseVector {
    std::size_t dimension = 0;
    std::vector<std::uint32_t> indices;
    std::vector<float> values;
};

using ModelInput = SparseVector;

struct ProbabilityPair {
    double fake_probability = 0.0;
    double real_probability = 0.0;
};

// FAKE, если fake_probability строго больше real_probability
ReviewLabel LabelFor(const ProbabilityPair& proba);

class ClassifierError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Classifier {
public:
    virtual ~Classifier() = default;

    virtual ReviewLabel Predict(const ModelInput& input) const = 0;
    virtual ProbabilityPair PredictProba(const ModelInput& input) const = 0;
};

class TextVectorizer {
public:
    virtual ~TextVectorizer() = default;

    virtual SparseVector Transform(std::string_view text) const = 0;
    virtual std::size_t Dimension() const = 0;
};

class FeatureScaler {
public:
    virtual ~FeatureScaler() = default;

    virtual std::vector<double> Transform(const std::vector<double>& dense) const = 0;
};

// Всё, что нужно движку для предсказаний; заменяется целиком
struct ModelComponents {
    std::shared_ptr<const Classifier> classifier;
    std::shared_ptr<const TextVectorizer> vectorizer;
    std::shared_ptr<const FeatureScaler> scaler;
    std::optional<std::string> detector_profile;
    std::string version = "1.0";
    std::string source_path;
};

} // namespace review_scoring
