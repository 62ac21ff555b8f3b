//
// Created by aowei on 2025 10月 9.
//

#ifndef FSMKIT_CORE_GRAPH_HPP
#define FSMKIT_CORE_GRAPH_HPP

#include <cstddef>
#include <sstream>
#include <stack>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace fsmkit::core {
    // 渲染时每一层的缩进宽度
    constexpr std::size_t RENDER_INDENT = 7;

    // 从 root 出发深度优先收集可达状态，root 在首位
    // visited 以指针（身份）为键，环和自环只访问一次
    // StateT 需要提供 successors()，按符号顺序返回目标状态
    template<typename StateT>
    std::vector<StateT *> reachable_states(StateT *root) {
        std::vector<StateT *> order;
        if (!root) return order;
        std::unordered_set<const StateT *> visited;
        std::stack<StateT *> pending;
        pending.push(root);
        while (!pending.empty()) {
            StateT *state = pending.top();
            pending.pop();
            if (!visited.insert(state).second) continue;
            order.push_back(state);
            const auto next = state->successors();
            // 逆序入栈，出栈时就是符号顺序
            for (auto it = next.rbegin(); it != next.rend(); ++it) {
                if (!visited.count(*it)) pending.push(*it);
            }
        }
        return order;
    }

    // 调试用：把可达图渲染成缩进树，每个状态只展开一次
    // node_label(state) -> 节点文本；edges_of(state) -> [(边文本, 目标状态)]
    // 用显式栈代替递归，很长的链也不会耗尽调用栈；输出顺序与先序递归相同
    template<typename StateT, typename NodeLabel, typename EdgeLister>
    std::string render_tree(const StateT *root, NodeLabel &&node_label, EdgeLister &&edges_of) {
        using Edges = std::decay_t<decltype(edges_of(*root))>;
        struct Frame {
            std::size_t depth; // 该状态所在的层
            Edges edges;       // 该状态的全部出边
            std::size_t next;  // 下一条要输出的边
        };
        std::ostringstream out;
        std::unordered_set<const StateT *> visited;
        std::vector<Frame> frames;
        auto enter = [&](const StateT *state, const std::size_t depth) {
            if (!visited.insert(state).second) return;
            out << std::string(depth * RENDER_INDENT, ' ') << node_label(*state) << "\n";
            frames.push_back(Frame{depth, edges_of(*state), 0});
        };
        if (root) enter(root, 0);
        while (!frames.empty()) {
            Frame &frame = frames.back();
            if (frame.next == frame.edges.size()) {
                frames.pop_back();
                continue;
            }
            const auto &edge = frame.edges[frame.next++];
            const std::size_t depth = frame.depth;
            const StateT *target = edge.second;
            out << std::string(depth * RENDER_INDENT, ' ') << "  " << edge.first << " -> " << target->name << "\n";
            // enter 可能让 frames 扩容，之后不能再使用 frame 和 edge
            enter(target, depth + 1);
        }
        return out.str();
    }
}

#endif //FSMKIT_CORE_GRAPH_HPP
