//
// Created by aowei on 2025 10月 8.
//

#ifndef FSMKIT_CORE_SYMBOL_HPP
#define FSMKIT_CORE_SYMBOL_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fsmkit::core {
    // 符号：整数或字符串，输入和输出共用同一种类型
    // std::variant 自带 ==、< 和 std::hash，可以直接作为转移表的键
    using Symbol = std::variant<std::int64_t, std::string>;

    // 符号 -> 字符串（调试和报错用）
    std::string to_string(const Symbol &symbol);

    // 把单词拆成单字符符号序列，例如 "sls" -> {"s", "l", "s"}
    std::vector<Symbol> symbols_of(std::string_view word);
}

#endif //FSMKIT_CORE_SYMBOL_HPP
