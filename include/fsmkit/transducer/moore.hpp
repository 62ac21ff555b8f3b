//
// Created by aowei on 2025 10月 11.
//

#ifndef FSMKIT_TRANSDUCER_MOORE_HPP
#define FSMKIT_TRANSDUCER_MOORE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <fsmkit/core/state.hpp>
#include <fsmkit/core/symbol.hpp>

// Moore 机：输出挂在状态上，进入哪个状态就输出哪个状态的符号
namespace fsmkit::transducer {
    using core::Symbol;

    struct MooreState : public core::State<MooreState *> {
        std::optional<Symbol> output; // 进入该状态时的输出，可以没有

        explicit MooreState(std::string name, std::optional<Symbol> output = std::nullopt,
                            bool initial = false, bool accepting = false);

        void add_transition(const Symbol &symbol, MooreState *target);
        [[nodiscard]] MooreState *transition(const Symbol &symbol) const;
        [[nodiscard]] std::vector<MooreState *> successors() const;
    };

    class MooreMachine {
    public:
        explicit MooreMachine(std::vector<Symbol> alphabet = {});
        MooreMachine(const MooreMachine &) = delete;
        MooreMachine &operator=(const MooreMachine &) = delete;
        MooreMachine(MooreMachine &&) = default;
        MooreMachine &operator=(MooreMachine &&) = default;

        MooreState *add_state(std::unique_ptr<MooreState> state);
        MooreState *add_state(std::string name, std::optional<Symbol> output = std::nullopt, bool initial = false);

        [[nodiscard]] MooreState *find_state(const std::string &name) const;
        [[nodiscard]] const MooreState *initial() const noexcept;
        [[nodiscard]] const MooreState *current() const noexcept { return this->position; }
        [[nodiscard]] const std::vector<Symbol> &alphabet() const noexcept { return this->symbols; }

        // 走一步并返回新状态的输出；失败时抛出 UndefinedTransitionError，当前位置不变
        std::optional<Symbol> step(const Symbol &symbol);
        std::vector<std::optional<Symbol> > forward(const std::vector<Symbol> &sequence);
        void reset();

        [[nodiscard]] std::vector<const MooreState *> states() const;
        [[nodiscard]] std::string render() const;
        void print(const std::string &name = "Moore") const;

    private:
        std::vector<Symbol> symbols;
        core::StateArena<MooreState> arena;
        MooreState *position = nullptr;
    };
}

#endif //FSMKIT_TRANSDUCER_MOORE_HPP
