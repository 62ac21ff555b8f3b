//
// Created by aowei on 2025 10月 11.
//

#include <iostream>
#include <utility>
#include <fsmkit/core/graph.hpp>
#include <fsmkit/transducer/moore.hpp>

// MooreState 的实现
namespace fsmkit::transducer {
    // MooreState 构造函数
    MooreState::MooreState(std::string name, std::optional<Symbol> output, const bool initial, const bool accepting)
        : State(std::move(name), initial, accepting), output(std::move(output)) {}

    // MooreState 转移注册函数
    void MooreState::add_transition(const Symbol &symbol, MooreState *target) {
        if (!target) {
            throw core::MachineDefinitionError("Transition on '" + core::to_string(symbol) + "' from state '" +
                                               this->name + "' has no target.");
        }
        this->set_edge(symbol, target);
    }

    MooreState *MooreState::transition(const Symbol &symbol) const {
        return this->transition_for(symbol);
    }

    // 后继状态（按符号顺序）
    std::vector<MooreState *> MooreState::successors() const {
        std::vector<MooreState *> targets;
        targets.reserve(this->transitions.size());
        for (const auto &[_, target]: this->transitions) targets.push_back(target);
        return targets;
    }
}

// MooreMachine 的实现
namespace fsmkit::transducer {
    // Moore 机构造函数
    MooreMachine::MooreMachine(std::vector<Symbol> alphabet) : symbols(std::move(alphabet)) {}

    // Moore 状态添加函数
    MooreState *MooreMachine::add_state(std::unique_ptr<MooreState> state) {
        MooreState *ptr = this->arena.add_state(std::move(state));
        if (ptr->initial) this->position = ptr;
        return ptr;
    }

    MooreState *MooreMachine::add_state(std::string name, std::optional<Symbol> output, const bool initial) {
        return this->add_state(std::make_unique<MooreState>(std::move(name), std::move(output), initial));
    }

    MooreState *MooreMachine::find_state(const std::string &name) const {
        return this->arena.find(name);
    }

    const MooreState *MooreMachine::initial() const noexcept {
        return this->arena.initial_state();
    }

    // 单步执行：返回进入的状态的输出
    std::optional<Symbol> MooreMachine::step(const Symbol &symbol) {
        if (!this->position) {
            throw core::MachineDefinitionError("Machine has no initial state.");
        }
        this->position = this->position->transition(symbol);
        return this->position->output;
    }

    // 序列执行
    std::vector<std::optional<Symbol> > MooreMachine::forward(const std::vector<Symbol> &sequence) {
        std::vector<std::optional<Symbol> > outputs;
        outputs.reserve(sequence.size());
        for (const auto &symbol: sequence) {
            outputs.push_back(this->step(symbol));
        }
        return outputs;
    }

    void MooreMachine::reset() {
        this->position = this->arena.require_initial();
    }

    std::vector<const MooreState *> MooreMachine::states() const {
        return core::reachable_states<const MooreState>(this->arena.require_initial());
    }

    // 渲染成缩进树，节点上带输出
    std::string MooreMachine::render() const {
        return core::render_tree(
            this->arena.initial_state(),
            [](const MooreState &state) {
                std::string label = state.initial ? "> " + state.name : state.name;
                if (state.output) label += " [" + core::to_string(*state.output) + "]";
                return label;
            },
            [](const MooreState &state) {
                std::vector<std::pair<std::string, const MooreState *> > edges;
                for (const auto &[symbol, target]: state.transitions) {
                    edges.emplace_back(core::to_string(symbol), target);
                }
                return edges;
            });
    }

    // Moore 调试用打印函数
    void MooreMachine::print(const std::string &name) const {
        std::cout << "=== " << name << " Structure ===" << std::endl;
        std::cout << "Current State: " << (this->position ? this->position->name : "None") << std::endl;
        std::cout << this->render();
        std::cout << "===========================\n" << std::endl;
    }
}
