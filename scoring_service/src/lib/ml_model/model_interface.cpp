#include "model_interface.hpp"

namespace review_scoring {

std::string_view ToString(ReviewLabel label) {
    switch (label) {
        case ReviewLabel::kReal:
            return "REAL";
        case ReviewLabel::kFake:
            return "FAKE";
        case ReviewLabel::kUnknown:
            return "UNKNOWN";
        case ReviewLabel::kError:
            return "ERROR";
    }
    return "UNKNOWN";
}

ReviewLabel LabelFor(const ProbabilityPair& proba) {
    return proba.fake_probability > proba.real_probability ? ReviewLabel::kFake : ReviewLabel::kReal;
}

} // namespace review_scoring
