#pragma once

#include <memory>
#include <vector>

#include <review/model_bundle.pb.h>

#include "model_interface.hpp"

namespace review_scoring {

// (x - mean) / scale; нулевой масштаб заменяется на 1, как в scikit-learn
class StandardScaler final : public FeatureScaler {
public:
    StandardScaler(std::vector<double> mean, std::vector<double> scale);

    static std::unique_ptr<StandardScaler> FromProto(const review_model::StandardScaler& proto);

    // Бросает std::invalid_argument при несовпадении размерности
    std::vector<double> Transform(const std::vector<double>& dense) const override;

    std::size_t Dimension() const;

private:
    std::vector<double> mean_;
    std::vector<double> scale_;
};

} // namespace review_scoring
