//
// Created by aowei on 2025 10月 10.
//

#include <algorithm>
#include <iostream>
#include <utility>
#include <fsmkit/core/graph.hpp>
#include <fsmkit/transducer/mealy.hpp>

// MealyState 的实现
namespace fsmkit::transducer {
    // MealyState 转移注册函数
    void MealyState::add_transition(const Symbol &symbol, MealyState *target, Symbol output) {
        if (!target) {
            throw core::MachineDefinitionError("Transition on '" + core::to_string(symbol) + "' from state '" +
                                               this->name + "' has no target.");
        }
        this->set_edge(symbol, MealyEdge{target, std::move(output)});
    }

    // 查找出边
    const MealyEdge &MealyState::transition(const Symbol &symbol) const {
        return this->transition_for(symbol);
    }

    // 后继状态（按符号顺序）
    std::vector<MealyState *> MealyState::successors() const {
        std::vector<MealyState *> targets;
        targets.reserve(this->transitions.size());
        for (const auto &[_, edge]: this->transitions) targets.push_back(edge.target);
        return targets;
    }
}

// MealyMachine 的实现
namespace fsmkit::transducer {
    // Mealy 机构造函数
    MealyMachine::MealyMachine(std::vector<Symbol> alphabet) : symbols(std::move(alphabet)) {}

    // Mealy 状态添加函数，初始状态同时成为当前位置
    MealyState *MealyMachine::add_state(std::unique_ptr<MealyState> state) {
        MealyState *ptr = this->arena.add_state(std::move(state));
        if (ptr->initial) this->position = ptr;
        return ptr;
    }

    MealyState *MealyMachine::add_state(std::string name, const bool initial, const bool accepting) {
        return this->add_state(std::make_unique<MealyState>(std::move(name), initial, accepting));
    }

    MealyState *MealyMachine::find_state(const std::string &name) const {
        return this->arena.find(name);
    }

    const MealyState *MealyMachine::initial() const noexcept {
        return this->arena.initial_state();
    }

    // 单步执行：返回本次转移的输出
    Symbol MealyMachine::step(const Symbol &symbol) {
        if (!this->position) {
            throw core::MachineDefinitionError("Machine has no initial state.");
        }
        // 先查找，成功后才移动，失败时 position 保持不变
        const MealyEdge &edge = this->position->transition(symbol);
        this->position = edge.target;
        return edge.output;
    }

    Symbol MealyMachine::forward(const Symbol &symbol) {
        return this->step(symbol);
    }

    // 序列执行
    std::vector<Symbol> MealyMachine::forward(const std::vector<Symbol> &sequence) {
        std::vector<Symbol> outputs;
        outputs.reserve(sequence.size());
        for (const auto &symbol: sequence) {
            outputs.push_back(this->step(symbol));
        }
        return outputs;
    }

    // 回到初始状态
    void MealyMachine::reset() {
        this->position = this->arena.require_initial();
    }

    // 定位到指定状态（加载快照时使用）
    void MealyMachine::seek(const std::string &name) {
        MealyState *target = this->arena.find(name);
        if (!target) {
            throw core::MachineDefinitionError("Unknown state '" + name + "'.");
        }
        const auto reachable = core::reachable_states(this->arena.require_initial());
        if (std::find(reachable.begin(), reachable.end(), target) == reachable.end()) {
            throw core::MachineDefinitionError("State '" + name + "' is not reachable from the initial state.");
        }
        this->position = target;
    }

    std::vector<const MealyState *> MealyMachine::states() const {
        return core::reachable_states<const MealyState>(this->arena.require_initial());
    }

    // 渲染成缩进树，边上带输出
    std::string MealyMachine::render() const {
        return core::render_tree(
            this->arena.initial_state(),
            [](const MealyState &state) {
                return state.initial ? "> " + state.name : state.name;
            },
            [](const MealyState &state) {
                std::vector<std::pair<std::string, const MealyState *> > edges;
                for (const auto &[symbol, edge]: state.transitions) {
                    edges.emplace_back(core::to_string(symbol) + " [" + core::to_string(edge.output) + "]",
                                       edge.target);
                }
                return edges;
            });
    }

    // Mealy 调试用打印函数
    void MealyMachine::print(const std::string &name) const {
        std::cout << "=== " << name << " Structure ===" << std::endl;
        std::cout << "Current State: " << (this->position ? this->position->name : "None") << std::endl;
        std::cout << this->render();
        std::cout << "===========================\n" << std::endl;
    }
}
