//
// Created by aowei on 2025 10月 8.
//

#ifndef FSMKIT_CORE_STATE_HPP
#define FSMKIT_CORE_STATE_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <fsmkit/core/errors.hpp>
#include <fsmkit/core/symbol.hpp>

// 1. 状态：所有机器共用的纯数据节点，Edge 决定一条转移携带什么
namespace fsmkit::core {
    template<typename Edge>
    struct State {
        std::string name;                      // 机器内唯一的名字，加入机器后不再修改
        bool initial;                          // 是否为初始状态
        bool accepting;                        // 是否为接受状态，只对接受器有意义
        std::map<Symbol, Edge> transitions; // 转移表：符号 --> 边（有序，保证遍历顺序确定）

        explicit State(std::string name, const bool initial = false, const bool accepting = false)
            : name(std::move(name)), initial(initial), accepting(accepting) {}

        // 查找 symbol 上的出边，不存在时抛出 UndefinedTransitionError
        [[nodiscard]] const Edge &transition_for(const Symbol &symbol) const {
            auto it = this->transitions.find(symbol);
            if (it == this->transitions.end()) {
                throw UndefinedTransitionError(this->name, symbol);
            }
            return it->second;
        }

    protected:
        // 注册/覆盖 symbol 上的出边：后写覆盖先写，方便反复组装
        void set_edge(const Symbol &symbol, Edge edge) {
            this->transitions.insert_or_assign(symbol, std::move(edge));
        }
    };
}

// 2. 状态仓库：一台机器的全部状态都归它所有，转移里只存裸指针
namespace fsmkit::core {
    template<typename StateT>
    class StateArena {
    public:
        StateArena() = default;
        StateArena(const StateArena &) = delete;
        StateArena &operator=(const StateArena &) = delete;
        StateArena(StateArena &&) = default;
        StateArena &operator=(StateArena &&) = default;

        // 加入状态并返回裸指针，所有权保留在仓库中
        StateT *add_state(std::unique_ptr<StateT> state) {
            if (!state) {
                throw MachineDefinitionError("Cannot add a null state.");
            }
            if (this->by_name.count(state->name)) {
                throw MachineDefinitionError("Duplicate state name '" + state->name + "'.");
            }
            if (state->initial && this->start) {
                throw MachineDefinitionError("State '" + state->name + "' is marked initial, but '" +
                                             this->start->name + "' already is.");
            }
            StateT *ptr = state.get();
            this->states.emplace_back(std::move(state));
            this->by_name.emplace(ptr->name, ptr);
            if (ptr->initial) this->start = ptr;
            return ptr;
        }

        [[nodiscard]] StateT *find(const std::string &name) const {
            auto it = this->by_name.find(name);
            return it == this->by_name.end() ? nullptr : it->second;
        }

        [[nodiscard]] StateT *initial_state() const noexcept { return this->start; }

        // 执行前调用：没有初始状态的机器不能运行
        [[nodiscard]] StateT *require_initial() const {
            if (!this->start) {
                throw MachineDefinitionError("Machine has no initial state.");
            }
            return this->start;
        }

        [[nodiscard]] std::size_t size() const noexcept { return this->states.size(); }

    private:
        std::vector<std::unique_ptr<StateT> > states;      // 核心：State 的唯一所有者(RAII)
        std::unordered_map<std::string, StateT *> by_name; // 名字 --> 状态
        StateT *start = nullptr;                            // 初始状态（裸指针 = 引用 states 中的对象）
    };
}

#endif //FSMKIT_CORE_STATE_HPP
