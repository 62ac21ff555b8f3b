//
// Created by aowei on 2025 10月 9.
//

#ifndef FSMKIT_ACCEPTOR_DFA_HPP
#define FSMKIT_ACCEPTOR_DFA_HPP

#include <memory>
#include <string>
#include <vector>
#include <fsmkit/core/state.hpp>
#include <fsmkit/core/symbol.hpp>

namespace fsmkit::acceptor {
    using core::Symbol;

    // 补全时添加的陷阱状态的名字（重名时在后面追加 '）
    constexpr const char *SINK_STATE_NAME = "q'";

    struct DFAState : public core::State<DFAState *> {
        using State::State;

        // 注册 symbol --> target，后写覆盖先写
        void add_transition(const Symbol &symbol, DFAState *target);
        // 跟随 symbol 上的转移，不存在时抛出 UndefinedTransitionError
        [[nodiscard]] DFAState *transition(const Symbol &symbol) const;
        [[nodiscard]] std::vector<DFAState *> successors() const;
    };

    class DFA {
    public:
        explicit DFA(std::vector<Symbol> alphabet);
        DFA(const DFA &) = delete;
        DFA &operator=(const DFA &) = delete;
        DFA(DFA &&) = default;
        DFA &operator=(DFA &&) = default;

        // 添加状态并返回裸指针，所有权保留在 DFA 中；标记为 initial 的状态成为起始状态和游标位置
        DFAState *add_state(std::unique_ptr<DFAState> state);
        DFAState *add_state(std::string name, bool initial = false, bool accepting = false);

        [[nodiscard]] DFAState *find_state(const std::string &name) const;
        [[nodiscard]] const DFAState *initial() const noexcept;
        [[nodiscard]] const std::vector<Symbol> &alphabet() const noexcept { return this->symbols; }
        [[nodiscard]] const DFAState *current() const noexcept { return this->position; }

        // 判定：从起始状态走完整个序列，返回终点的 accepting
        // 不修改任何状态，每次调用都从头开始；缺失的转移以 UndefinedTransitionError 抛出，而不是当作拒绝
        [[nodiscard]] bool accept(const std::vector<Symbol> &sequence) const;

        // 逐步执行：游标沿 symbol 前进一步，与 accept 互不影响
        // 缺失转移时抛出 UndefinedTransitionError，游标不动
        void forward(const Symbol &symbol);
        // 游标回到起始状态
        void reset();

        // 从起始状态可达的全部状态（按身份去重），起始状态在首位
        [[nodiscard]] std::vector<const DFAState *> states() const;
        // 每个可达状态对字母表中的每个符号都有转移
        [[nodiscard]] bool is_complete() const;
        // 补全：缺失的转移全部指向一个新的非接受陷阱状态；已经完整时返回 nullptr
        DFAState *complete();

        [[nodiscard]] std::string render() const;
        // 调试用：打印 DFA 结构
        void print(const std::string &name = "DFA") const;

    private:
        std::vector<Symbol> symbols;
        core::StateArena<DFAState> arena;
        DFAState *position = nullptr; // 游标，只有 forward/reset 会修改
    };
}

#endif //FSMKIT_ACCEPTOR_DFA_HPP
