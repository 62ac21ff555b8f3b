//
// Created by aowei on 2025 10月 8.
//

#ifndef FSMKIT_CORE_ERRORS_HPP
#define FSMKIT_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <fsmkit/core/symbol.hpp>

namespace fsmkit::core {
    // 所有自动机错误的基类
    struct AutomatonError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // 当前状态上没有 symbol 对应的转移
    class UndefinedTransitionError : public AutomatonError {
    public:
        UndefinedTransitionError(std::string state_name, Symbol symbol);

        [[nodiscard]] const std::string &state_name() const noexcept { return this->from; }
        [[nodiscard]] const Symbol &symbol() const noexcept { return this->input; }

    private:
        std::string from;
        Symbol input;
    };

    // 快照结构不一致：悬空引用、initial 缺失/重复、current 无法解析等
    struct MalformedSnapshotError : public AutomatonError {
        using AutomatonError::AutomatonError;
    };

    // 组装机器时的配置错误：重名状态、多个初始状态、没有初始状态
    struct MachineDefinitionError : public AutomatonError {
        using AutomatonError::AutomatonError;
    };
}

#endif //FSMKIT_CORE_ERRORS_HPP
