//
// Created by aowei on 2025 10月 10.
//

#ifndef FSMKIT_TRANSDUCER_MEALY_HPP
#define FSMKIT_TRANSDUCER_MEALY_HPP

#include <memory>
#include <string>
#include <vector>
#include <fsmkit/core/state.hpp>
#include <fsmkit/core/symbol.hpp>

// 1. Mealy 状态：输出挂在转移上
namespace fsmkit::transducer {
    using core::Symbol;

    struct MealyState;

    struct MealyEdge {
        MealyState *target; // 目标状态（裸指针 = 引用，不拥有）
        Symbol output;      // 走这条边时输出的符号
    };

    struct MealyState : public core::State<MealyEdge> {
        using State::State;

        // 注册 symbol --> (target, output)，后写覆盖先写
        void add_transition(const Symbol &symbol, MealyState *target, Symbol output);
        [[nodiscard]] const MealyEdge &transition(const Symbol &symbol) const;
        [[nodiscard]] std::vector<MealyState *> successors() const;
    };
}

// 2. Mealy 机：记录当前位置，每消耗一个输入符号输出一个符号
namespace fsmkit::transducer {
    class MealyMachine {
    public:
        explicit MealyMachine(std::vector<Symbol> alphabet = {});
        MealyMachine(const MealyMachine &) = delete;
        MealyMachine &operator=(const MealyMachine &) = delete;
        MealyMachine(MealyMachine &&) = default;
        MealyMachine &operator=(MealyMachine &&) = default;

        // 添加状态并返回裸指针，所有权保留在机器中；initial 状态同时成为当前位置
        MealyState *add_state(std::unique_ptr<MealyState> state);
        MealyState *add_state(std::string name, bool initial = false, bool accepting = false);

        [[nodiscard]] MealyState *find_state(const std::string &name) const;
        [[nodiscard]] const MealyState *initial() const noexcept;
        [[nodiscard]] const MealyState *current() const noexcept { return this->position; }
        [[nodiscard]] const std::vector<Symbol> &alphabet() const noexcept { return this->symbols; }

        // 走一步并返回输出；失败时抛出 UndefinedTransitionError，当前位置不变
        Symbol step(const Symbol &symbol);
        Symbol forward(const Symbol &symbol);
        // 依次 step；中途失败时，之前已消耗的符号保持生效
        std::vector<Symbol> forward(const std::vector<Symbol> &sequence);
        // 回到初始状态
        void reset();
        // 把当前位置移到名为 name 的状态，该状态必须从初始状态可达
        void seek(const std::string &name);

        // 从初始状态可达的全部状态，初始状态在首位
        [[nodiscard]] std::vector<const MealyState *> states() const;
        [[nodiscard]] std::string render() const;
        void print(const std::string &name = "Mealy") const;

    private:
        std::vector<Symbol> symbols;
        core::StateArena<MealyState> arena;
        MealyState *position = nullptr; // 当前位置，只有 step/reset/seek 会修改
    };
}

#endif //FSMKIT_TRANSDUCER_MEALY_HPP
