#include "standard_scaler.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace review_scoring {

StandardScaler::StandardScaler(std::vector<double> mean, std::vector<double> scale)
    : mean_(std::move(mean))
    , scale_(std::move(scale)) {
    if (!mean_.empty() && !scale_.empty() && mean_.size() != scale_.size()) {
        throw std::invalid_argument(fmt::format(
            "Scaler mean has {} values but scale has {}", mean_.size(), scale_.size()));
    }
    for (auto& s : scale_) {
        if (s == 0.0) s = 1.0;
    }
}

std::unique_ptr<StandardScaler> StandardScaler::FromProto(const review_model::StandardScaler& proto) {
    std::vector<double> mean(proto.mean().begin(), proto.mean().end());
    std::vector<double> scale(proto.scale().begin(), proto.scale().end());
    if (mean.empty() && scale.empty()) {
        throw std::invalid_argument("Scaler has neither mean nor scale");
    }
    return std::make_unique<StandardScaler>(std::move(mean), std::move(scale));
}

std::size_t StandardScaler::Dimension() const {
    return std::max(mean_.size(), scale_.size());
}

std::vector<double> StandardScaler::Transform(const std::vector<double>& dense) const {
    if (dense.size() != Dimension()) {
        throw std::invalid_argument(fmt::format(
            "Scaler expects {} features, got {}", Dimension(), dense.size()));
    }

    std::vector<double> out(dense);
    for (std::size_t i = 0; i < out.size(); ++i) {
        if (!mean_.empty()) out[i] -= mean_[i];
        if (!scale_.empty()) out[i] /= scale_[i];
    }
    return out;
}

} // namespace review_scoring
