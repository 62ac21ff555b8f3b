//
// Created by aowei on 2025 10月 13.
//

#ifndef FSMKIT_CASES_REPETITION_HPP
#define FSMKIT_CASES_REPETITION_HPP

#include <cstddef>
#include <functional>
#include <vector>
#include <fsmkit/core/symbol.hpp>
#include <fsmkit/transducer/mealy.hpp>

namespace fsmkit::cases {
    using core::Symbol;

    // 初始状态的名字
    constexpr const char *REPETITION_INITIAL_STATE = "i";

    // 构建连续重复检测器（Mealy 机）：
    // 同一个符号连续出现到第 run_length 次时输出 alarm_for(符号)，其余情况输出 normal。
    // 超过 run_length 之后继续重复不会再次报警，换一个符号后重新计数。
    // 状态命名：初始状态 "i"，符号 a 连续出现 k 次的状态为 "a" + k，例如 "s1"、"l3"
    transducer::MealyMachine build_repetition_detector(const std::vector<Symbol> &alphabet,
                                                       std::size_t run_length,
                                                       const Symbol &normal,
                                                       const std::function<Symbol(const Symbol &)> &alarm_for);

    // 所有符号共用同一个报警输出
    transducer::MealyMachine build_repetition_detector(const std::vector<Symbol> &alphabet,
                                                       std::size_t run_length,
                                                       const Symbol &normal,
                                                       const Symbol &alarm);
}

#endif //FSMKIT_CASES_REPETITION_HPP
