#include "text_utils.hpp"

#include <cctype>

namespace review_scoring::text_utils {

std::string ToLowerAscii(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::size_t CodePointCount(std::string_view text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!IsUtf8Continuation(c)) ++count;
    }
    return count;
}

} // namespace review_scoring::text_utils
