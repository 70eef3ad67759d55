#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "text_analyzers.hpp"

namespace review_scoring {

// Разбиение по пробелам; запасной вариант для любого токенизатора
class WhitespaceTokenizer final : public Tokenizer {
public:
    std::vector<std::string> Tokenize(std::string_view text) const override;
};

// Упрощённый Treebank: пунктуация по краям слова отделяется в отдельные токены,
// "..." остаётся одним токеном, дефисы и апострофы внутри слова сохраняются
class TreebankTokenizer final : public Tokenizer {
public:
    std::vector<std::string> Tokenize(std::string_view text) const override;
};

} // namespace review_scoring
