#pragma once

#include <string>
#include <string_view>

namespace review_scoring {

// Нормализованный текст вместе с исходным (для caps_ratio по исходному регистру)
struct NormalizedText {
    std::string text;
    std::string source;

    bool Empty() const { return text.empty(); }
};

class TextNormalizer {
public:
    // Нормализация повторяется до неподвижной точки, поэтому
    // Normalize(Normalize(t).text).text == Normalize(t).text
    static NormalizedText Normalize(std::string_view raw);

    // Один проход всех шагов очистки
    static std::string NormalizeOnce(std::string_view text);

    static std::string Trim(std::string_view s);
};

} // namespace review_scoring
