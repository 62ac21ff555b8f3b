//
// Created by aowei on 2025 10月 9.
//

#include <iostream>
#include <utility>
#include <fsmkit/acceptor/dfa.hpp>
#include <fsmkit/core/graph.hpp>

// DFAState 的实现
namespace fsmkit::acceptor {
    // DFAState 转移注册函数
    void DFAState::add_transition(const Symbol &symbol, DFAState *target) {
        if (!target) {
            throw core::MachineDefinitionError("Transition on '" + core::to_string(symbol) + "' from state '" +
                                               this->name + "' has no target.");
        }
        this->set_edge(symbol, target);
    }

    // 跟随转移
    DFAState *DFAState::transition(const Symbol &symbol) const {
        return this->transition_for(symbol);
    }

    // 后继状态（按符号顺序）
    std::vector<DFAState *> DFAState::successors() const {
        std::vector<DFAState *> targets;
        targets.reserve(this->transitions.size());
        for (const auto &[_, target]: this->transitions) targets.push_back(target);
        return targets;
    }
}

// DFA 的实现
namespace fsmkit::acceptor {
    // DFA 构造函数
    DFA::DFA(std::vector<Symbol> alphabet) : symbols(std::move(alphabet)) {}

    // DFA 状态添加函数
    DFAState *DFA::add_state(std::unique_ptr<DFAState> state) {
        DFAState *ptr = this->arena.add_state(std::move(state));
        if (ptr->initial) this->position = ptr;
        return ptr;
    }

    DFAState *DFA::add_state(std::string name, const bool initial, const bool accepting) {
        return this->add_state(std::make_unique<DFAState>(std::move(name), initial, accepting));
    }

    // 按名字查找状态
    DFAState *DFA::find_state(const std::string &name) const {
        return this->arena.find(name);
    }

    const DFAState *DFA::initial() const noexcept {
        return this->arena.initial_state();
    }

    // 判定函数：每次都从起始状态开始，不动游标
    bool DFA::accept(const std::vector<Symbol> &sequence) const {
        const DFAState *current = this->arena.require_initial();
        for (const auto &symbol: sequence) {
            current = current->transition(symbol);
        }
        return current->accepting;
    }

    // 游标前进一步，先查找再移动
    void DFA::forward(const Symbol &symbol) {
        if (!this->position) {
            throw core::MachineDefinitionError("Machine has no initial state.");
        }
        this->position = this->position->transition(symbol);
    }

    // 游标复位
    void DFA::reset() {
        this->position = this->arena.require_initial();
    }

    // 可达状态列表
    std::vector<const DFAState *> DFA::states() const {
        return core::reachable_states<const DFAState>(this->arena.require_initial());
    }

    // 完整性检查
    bool DFA::is_complete() const {
        for (const auto *state: this->states()) {
            for (const auto &symbol: this->symbols) {
                if (!state->transitions.count(symbol)) return false;
            }
        }
        return true;
    }

    // 用陷阱状态补全缺失的转移
    DFAState *DFA::complete() {
        if (this->symbols.empty() || this->is_complete()) return nullptr;
        // 先记下补全前的可达状态，陷阱状态本身不在其中
        const auto reachable = core::reachable_states(this->arena.require_initial());
        std::string sink_name = SINK_STATE_NAME;
        while (this->arena.find(sink_name)) sink_name += "'";
        DFAState *sink = this->add_state(sink_name);
        // 陷阱状态：不接受，所有符号都转回自己
        for (const auto &symbol: this->symbols) {
            sink->add_transition(symbol, sink);
        }
        for (auto *state: reachable) {
            for (const auto &symbol: this->symbols) {
                if (!state->transitions.count(symbol)) state->add_transition(symbol, sink);
            }
        }
        return sink;
    }

    // 渲染成缩进树
    std::string DFA::render() const {
        return core::render_tree(
            this->arena.initial_state(),
            [](const DFAState &state) {
                std::string label = state.initial ? "> " + state.name : state.name;
                if (state.accepting) label += " *";
                return label;
            },
            [](const DFAState &state) {
                std::vector<std::pair<std::string, const DFAState *> > edges;
                for (const auto &[symbol, target]: state.transitions) {
                    edges.emplace_back(core::to_string(symbol), target);
                }
                return edges;
            });
    }

    // DFA 调试用打印函数
    void DFA::print(const std::string &name) const {
        std::cout << "=== " << name << " Structure ===" << std::endl;
        std::cout << "Alphabet: ";
        for (const auto &symbol: this->symbols) std::cout << core::to_string(symbol) << " ";
        std::cout << "\nCurrent State: " << (this->position ? this->position->name : "None") << std::endl;
        std::cout << this->render();
        std::cout << "===========================\n" << std::endl;
    }
}
