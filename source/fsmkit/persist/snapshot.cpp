//
// Created by aowei on 2025 10月 12.
//

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <fsmkit/core/errors.hpp>
#include <fsmkit/persist/snapshot.hpp>

// 匿名辅助：符号和字段的读写
namespace fsmkit::persist {
    namespace {
        using nlohmann::json;

        // 符号 -> JSON 值
        json symbol_to_json(const Symbol &symbol) {
            return std::visit([](const auto &value) { return json(value); }, symbol);
        }

        // 符号只能是字符串或整数
        Symbol symbol_from_json(const json &value, const std::string &where) {
            if (value.is_string()) return value.get<std::string>();
            if (value.is_number_unsigned() &&
                value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw core::MalformedSnapshotError(where + " is out of the 64-bit signed integer range.");
            }
            if (value.is_number_integer()) return value.get<std::int64_t>();
            throw core::MalformedSnapshotError(where + " must be a string or an integer.");
        }

        // 必填字段
        const json &require_field(const json &object, const char *key, const std::string &where) {
            if (!object.is_object()) {
                throw core::MalformedSnapshotError(where + " must be a JSON object.");
            }
            auto it = object.find(key);
            if (it == object.end()) {
                throw core::MalformedSnapshotError(where + " is missing field '" + key + "'.");
            }
            return *it;
        }

        std::string require_string(const json &object, const char *key, const std::string &where) {
            const json &value = require_field(object, key, where);
            if (!value.is_string()) {
                throw core::MalformedSnapshotError(where + " field '" + key + "' must be a string.");
            }
            return value.get<std::string>();
        }

        // 可选布尔字段，缺省为 false
        bool optional_bool(const json &object, const char *key, const std::string &where) {
            auto it = object.find(key);
            if (it == object.end()) return false;
            if (!it->is_boolean()) {
                throw core::MalformedSnapshotError(where + " field '" + key + "' must be a boolean.");
            }
            return it->get<bool>();
        }

        // 可选数组字段，缺省为空数组
        const json &optional_array(const json &object, const char *key, const std::string &where) {
            static const json empty = json::array();
            auto it = object.find(key);
            if (it == object.end()) return empty;
            if (!it->is_array()) {
                throw core::MalformedSnapshotError(where + " field '" + key + "' must be an array.");
            }
            return *it;
        }
    }

    // nlohmann::json 的 ADL 序列化入口
    void to_json(nlohmann::json &j, const TransitionRecord &record) {
        j = nlohmann::json{{field::SYMBOL, symbol_to_json(record.symbol)}, {field::TARGET, record.target}};
        if (record.output) j[field::OUTPUT] = symbol_to_json(*record.output);
    }

    // 状态记录 -> JSON
    void to_json(nlohmann::json &j, const StateRecord &record) {
        j = nlohmann::json{
            {field::NAME, record.name},
            {field::INITIAL, record.initial},
            {field::ACCEPTING, record.accepting},
            {field::TRANSITIONS, record.transitions},
        };
    }
}

// 快照的一致性检查
namespace fsmkit::persist {
    namespace {
        // 名字唯一、目标可解析、恰好一个初始状态；转换器还要求每条转移都有输出且 current 可解析
        void validate(const Snapshot &snapshot, const bool transducer) {
            std::set<std::string> names;
            std::vector<std::string> initials;
            for (const auto &record: snapshot.states) {
                if (!names.insert(record.name).second) {
                    throw core::MalformedSnapshotError("Duplicate state '" + record.name + "' in snapshot.");
                }
                if (record.initial) initials.push_back(record.name);
            }
            for (const auto &record: snapshot.states) {
                std::set<Symbol> seen;
                for (const auto &transition: record.transitions) {
                    const std::string edge = "Transition on '" + core::to_string(transition.symbol) +
                                             "' from state '" + record.name + "'";
                    if (!seen.insert(transition.symbol).second) {
                        throw core::MalformedSnapshotError(edge + " is declared twice.");
                    }
                    if (!names.count(transition.target)) {
                        throw core::MalformedSnapshotError(edge + " references undeclared state '" +
                                                           transition.target + "'.");
                    }
                    if (transducer && !transition.output) {
                        throw core::MalformedSnapshotError(edge + " has no output.");
                    }
                }
            }
            if (initials.empty()) {
                throw core::MalformedSnapshotError("Snapshot has no initial state.");
            }
            if (initials.size() > 1) {
                throw core::MalformedSnapshotError("Snapshot has more than one initial state ('" + initials[0] +
                                                   "', '" + initials[1] + "').");
            }
            if (!transducer) return;
            if (!snapshot.current) {
                throw core::MalformedSnapshotError("Snapshot has no current state.");
            }
            if (!names.count(*snapshot.current)) {
                throw core::MalformedSnapshotError("Current state '" + *snapshot.current +
                                                   "' is not declared in snapshot.");
            }
        }
    }
}

// 机器 <--> 快照
namespace fsmkit::persist {
    // Mealy 机 -> 快照
    Snapshot capture(const transducer::MealyMachine &machine) {
        Snapshot snapshot;
        snapshot.alphabet = machine.alphabet();
        for (const auto *state: machine.states()) {
            StateRecord record{state->name, state->initial, state->accepting, {}};
            for (const auto &[symbol, edge]: state->transitions) {
                record.transitions.push_back({symbol, edge.target->name, edge.output});
            }
            snapshot.states.push_back(std::move(record));
        }
        snapshot.current = machine.current()->name;
        return snapshot;
    }

    // DFA -> 快照
    Snapshot capture(const acceptor::DFA &dfa) {
        Snapshot snapshot;
        snapshot.alphabet = dfa.alphabet();
        for (const auto *state: dfa.states()) {
            StateRecord record{state->name, state->initial, state->accepting, {}};
            for (const auto &[symbol, target]: state->transitions) {
                record.transitions.push_back({symbol, target->name, std::nullopt});
            }
            snapshot.states.push_back(std::move(record));
        }
        return snapshot;
    }

    // 快照 -> Mealy 机
    transducer::MealyMachine restore_transducer(const Snapshot &snapshot) {
        validate(snapshot, true);
        transducer::MealyMachine machine(snapshot.alphabet);
        // 步骤一：先建全部状态，名字才能解析成身份
        for (const auto &record: snapshot.states) {
            machine.add_state(record.name, record.initial, record.accepting);
        }
        // 步骤二：再连转移，前向引用和环都能正确解析
        for (const auto &record: snapshot.states) {
            auto *from = machine.find_state(record.name);
            for (const auto &transition: record.transitions) {
                from->add_transition(transition.symbol, machine.find_state(transition.target), *transition.output);
            }
        }
        // 步骤三：恢复当前位置，必须从初始状态可达
        const auto reachable = machine.states();
        const bool found = std::any_of(reachable.begin(), reachable.end(), [&](const auto *state) {
            return state->name == *snapshot.current;
        });
        if (!found) {
            throw core::MalformedSnapshotError("Current state '" + *snapshot.current +
                                               "' is not reachable from the initial state.");
        }
        machine.seek(*snapshot.current);
        return machine;
    }

    // 快照 -> DFA，同样先建状态再连转移
    acceptor::DFA restore_acceptor(const Snapshot &snapshot) {
        validate(snapshot, false);
        acceptor::DFA dfa(snapshot.alphabet);
        for (const auto &record: snapshot.states) {
            dfa.add_state(record.name, record.initial, record.accepting);
        }
        for (const auto &record: snapshot.states) {
            auto *from = dfa.find_state(record.name);
            for (const auto &transition: record.transitions) {
                from->add_transition(transition.symbol, dfa.find_state(transition.target));
            }
        }
        return dfa;
    }
}

// 快照 <--> JSON
namespace fsmkit::persist {
    // 快照 -> JSON 文档
    nlohmann::json to_document(const Snapshot &snapshot) {
        nlohmann::json document = nlohmann::json::object();
        nlohmann::json alphabet = nlohmann::json::array();
        for (const auto &symbol: snapshot.alphabet) alphabet.push_back(symbol_to_json(symbol));
        document[field::ALPHABET] = std::move(alphabet);
        document[field::STATES] = snapshot.states;
        if (snapshot.current) document[field::CURRENT] = *snapshot.current;
        return document;
    }

    // JSON 文档 -> 快照
    Snapshot from_document(const nlohmann::json &document) {
        Snapshot snapshot;
        const std::string root = "Snapshot";
        if (!document.is_object()) {
            throw core::MalformedSnapshotError(root + " must be a JSON object.");
        }
        for (const auto &symbol: optional_array(document, field::ALPHABET, root)) {
            snapshot.alphabet.push_back(symbol_from_json(symbol, "Alphabet symbol"));
        }
        const nlohmann::json &states = require_field(document, field::STATES, root);
        if (!states.is_array()) {
            throw core::MalformedSnapshotError(root + " field 'states' must be an array.");
        }
        for (std::size_t i = 0; i < states.size(); ++i) {
            const std::string where = "State record #" + std::to_string(i);
            StateRecord record;
            record.name = require_string(states[i], field::NAME, where);
            record.initial = optional_bool(states[i], field::INITIAL, where);
            record.accepting = optional_bool(states[i], field::ACCEPTING, where);
            const auto &transitions = optional_array(states[i], field::TRANSITIONS, where);
            for (std::size_t k = 0; k < transitions.size(); ++k) {
                const std::string edge = where + " transition #" + std::to_string(k);
                TransitionRecord transition;
                transition.symbol = symbol_from_json(require_field(transitions[k], field::SYMBOL, edge),
                                                     edge + " symbol");
                transition.target = require_string(transitions[k], field::TARGET, edge);
                auto output = transitions[k].find(field::OUTPUT);
                if (output != transitions[k].end() && !output->is_null()) {
                    transition.output = symbol_from_json(*output, edge + " output");
                }
                record.transitions.push_back(std::move(transition));
            }
            snapshot.states.push_back(std::move(record));
        }
        auto current = document.find(field::CURRENT);
        if (current != document.end()) {
            if (!current->is_string()) {
                throw core::MalformedSnapshotError(root + " field 'current' must be a string.");
            }
            snapshot.current = current->get<std::string>();
        }
        return snapshot;
    }
}

// 流和文件的读写
namespace fsmkit::persist {
    namespace {
        // 临时文件：提交前析构会把它删掉
        class PendingFile {
        public:
            explicit PendingFile(std::filesystem::path target) : target(std::move(target)) {
                this->temporary = this->target;
                this->temporary += ".tmp";
            }

            PendingFile(const PendingFile &) = delete;
            PendingFile &operator=(const PendingFile &) = delete;

            ~PendingFile() {
                if (this->committed) return;
                std::error_code ignored;
                std::filesystem::remove(this->temporary, ignored);
            }

            [[nodiscard]] const std::filesystem::path &path() const noexcept { return this->temporary; }

            // 重命名覆盖目标文件，失败时抛出 std::filesystem::filesystem_error
            void commit() {
                std::filesystem::rename(this->temporary, this->target);
                this->committed = true;
            }

        private:
            std::filesystem::path target;
            std::filesystem::path temporary;
            bool committed = false;
        };

        // 写出并检查流状态
        void write_document(const nlohmann::json &document, std::ostream &out) {
            out << document.dump(2) << '\n';
            out.flush();
            if (!out) {
                throw std::runtime_error("Failed to write snapshot.");
            }
        }

        // 写临时文件，成功后提交
        void write_file(const nlohmann::json &document, const std::filesystem::path &path) {
            PendingFile pending(path);
            {
                std::ofstream out(pending.path(), std::ios::binary | std::ios::trunc);
                if (!out.is_open()) {
                    throw std::runtime_error("Cannot open '" + pending.path().string() + "' for writing.");
                }
                write_document(document, out);
            }
            pending.commit();
        }

        // 解析失败统一报告为 MalformedSnapshotError
        nlohmann::json read_document(std::istream &in) {
            try {
                return nlohmann::json::parse(in);
            } catch (const nlohmann::json::parse_error &e) {
                throw core::MalformedSnapshotError(std::string("Snapshot is not valid JSON: ") + e.what());
            }
        }

        // 打开文件并解析
        nlohmann::json read_file(const std::filesystem::path &path) {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open()) {
                throw std::runtime_error("Cannot open snapshot '" + path.string() + "'.");
            }
            return read_document(in);
        }
    }

    // 保存 Mealy 机
    void save(const transducer::MealyMachine &machine, std::ostream &out) {
        write_document(to_document(capture(machine)), out);
    }

    void save(const transducer::MealyMachine &machine, const std::filesystem::path &path) {
        write_file(to_document(capture(machine)), path);
    }

    // 保存 DFA
    void save(const acceptor::DFA &dfa, std::ostream &out) {
        write_document(to_document(capture(dfa)), out);
    }

    void save(const acceptor::DFA &dfa, const std::filesystem::path &path) {
        write_file(to_document(capture(dfa)), path);
    }

    // 加载 Mealy 机
    transducer::MealyMachine load(std::istream &in) {
        return restore_transducer(from_document(read_document(in)));
    }

    transducer::MealyMachine load(const std::filesystem::path &path) {
        return restore_transducer(from_document(read_file(path)));
    }

    // 加载 DFA
    acceptor::DFA load_acceptor(std::istream &in) {
        return restore_acceptor(from_document(read_document(in)));
    }

    acceptor::DFA load_acceptor(const std::filesystem::path &path) {
        return restore_acceptor(from_document(read_file(path)));
    }
}
