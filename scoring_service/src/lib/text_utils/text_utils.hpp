#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace review_scoring::text_utils {

// Побайтовый tolower: меняются только ASCII-буквы, байты UTF-8 остаются как есть
std::string ToLowerAscii(std::string_view text);

inline bool IsUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Длина в символах (кодовых точках UTF-8), а не в байтах
std::size_t CodePointCount(std::string_view text);

} // namespace review_scoring::text_utils
