//
// Created by aowei on 2025 10月 12.
//

#ifndef FSMKIT_PERSIST_SNAPSHOT_HPP
#define FSMKIT_PERSIST_SNAPSHOT_HPP

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <fsmkit/acceptor/dfa.hpp>
#include <fsmkit/core/symbol.hpp>
#include <fsmkit/transducer/mealy.hpp>

// 1. 快照的数据结构：状态之间只通过名字互相引用，不依赖任何内存地址
namespace fsmkit::persist {
    using core::Symbol;

    struct TransitionRecord {
        Symbol symbol;                // 输入符号
        std::string target;           // 目标状态的名字
        std::optional<Symbol> output; // 输出符号，只有转换器有
    };

    struct StateRecord {
        std::string name;
        bool initial = false;
        bool accepting = false;
        std::vector<TransitionRecord> transitions;
    };

    struct Snapshot {
        std::vector<Symbol> alphabet;
        std::vector<StateRecord> states;    // 初始状态在首位，其余按深度优先顺序
        std::optional<std::string> current; // 当前位置，只有转换器有
    };

    // JSON 文档中的字段名
    namespace field {
        constexpr const char *ALPHABET = "alphabet";
        constexpr const char *STATES = "states";
        constexpr const char *CURRENT = "current";
        constexpr const char *NAME = "name";
        constexpr const char *INITIAL = "initial";
        constexpr const char *ACCEPTING = "accepting";
        constexpr const char *TRANSITIONS = "transitions";
        constexpr const char *SYMBOL = "symbol";
        constexpr const char *TARGET = "target";
        constexpr const char *OUTPUT = "output";
    }
}

// 2. 机器 <--> 快照 <--> JSON
namespace fsmkit::persist {
    // 遍历从初始状态可达的全部状态，每个状态恰好记录一次
    Snapshot capture(const transducer::MealyMachine &machine);
    Snapshot capture(const acceptor::DFA &dfa);

    // 先建全部状态，再连转移，最后设置初始状态和当前位置
    // 结构不一致时抛出 MalformedSnapshotError，不会返回半成品
    transducer::MealyMachine restore_transducer(const Snapshot &snapshot);
    acceptor::DFA restore_acceptor(const Snapshot &snapshot);

    nlohmann::json to_document(const Snapshot &snapshot);
    // 文档字段缺失或类型不对时抛出 MalformedSnapshotError
    Snapshot from_document(const nlohmann::json &document);
}

// 3. 读写：流或者文件路径
namespace fsmkit::persist {
    void save(const transducer::MealyMachine &machine, std::ostream &out);
    // 先写同目录下的临时文件，成功后再重命名覆盖目标，读者看不到写了一半的快照
    void save(const transducer::MealyMachine &machine, const std::filesystem::path &path);
    void save(const acceptor::DFA &dfa, std::ostream &out);
    void save(const acceptor::DFA &dfa, const std::filesystem::path &path);

    transducer::MealyMachine load(std::istream &in);
    transducer::MealyMachine load(const std::filesystem::path &path);
    acceptor::DFA load_acceptor(std::istream &in);
    acceptor::DFA load_acceptor(const std::filesystem::path &path);
}

#endif //FSMKIT_PERSIST_SNAPSHOT_HPP
