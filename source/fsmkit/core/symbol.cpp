//
// Created by aowei on 2025 10月 8.
//

#include <fsmkit/core/symbol.hpp>

namespace fsmkit::core {
    std::string to_string(const Symbol &symbol) {
        if (const auto *text = std::get_if<std::string>(&symbol)) {
            return *text;
        }
        return std::to_string(std::get<std::int64_t>(symbol));
    }

    std::vector<Symbol> symbols_of(const std::string_view word) {
        std::vector<Symbol> symbols;
        symbols.reserve(word.size());
        for (const char c: word) {
            symbols.emplace_back(std::string(1, c));
        }
        return symbols;
    }
}
