//
// Created by aowei on 2025 10月 13.
//

#include <set>
#include <stdexcept>
#include <string>
#include <fsmkit/cases/repetition.hpp>

namespace fsmkit::cases {
    namespace {
        std::string run_state_name(const Symbol &symbol, const std::size_t count) {
            return core::to_string(symbol) + std::to_string(count);
        }
    }

    transducer::MealyMachine build_repetition_detector(const std::vector<Symbol> &alphabet,
                                                       const std::size_t run_length,
                                                       const Symbol &normal,
                                                       const std::function<Symbol(const Symbol &)> &alarm_for) {
        if (alphabet.empty()) {
            throw std::invalid_argument("Repetition detector needs a non-empty alphabet.");
        }
        if (run_length == 0) {
            throw std::invalid_argument("Repetition detector needs a run length of at least 1.");
        }
        if (std::set<Symbol>(alphabet.begin(), alphabet.end()).size() != alphabet.size()) {
            throw std::invalid_argument("Repetition detector alphabet contains duplicate symbols.");
        }
        transducer::MealyMachine machine(alphabet);
        // 步骤一：初始状态 + 每个符号一条长度为 run_length 的计数链
        auto *initial = machine.add_state(REPETITION_INITIAL_STATE, true);
        std::vector<std::vector<transducer::MealyState *> > runs;
        for (const auto &symbol: alphabet) {
            std::vector<transducer::MealyState *> chain;
            for (std::size_t k = 1; k <= run_length; ++k) {
                chain.push_back(machine.add_state(run_state_name(symbol, k)));
            }
            runs.push_back(std::move(chain));
        }
        // 步骤二：i --a--> a1；在 a_k 上：同一个符号前进到 a_(k+1)（到顶后停在 a_n），换符号回到 b1
        auto output_on_entry = [&](const Symbol &symbol, const std::size_t count) {
            return count == run_length ? alarm_for(symbol) : normal;
        };
        for (std::size_t a = 0; a < alphabet.size(); ++a) {
            initial->add_transition(alphabet[a], runs[a][0], output_on_entry(alphabet[a], 1));
        }
        for (std::size_t a = 0; a < alphabet.size(); ++a) {
            for (std::size_t k = 1; k <= run_length; ++k) {
                auto *state = runs[a][k - 1];
                for (std::size_t b = 0; b < alphabet.size(); ++b) {
                    if (a != b) {
                        state->add_transition(alphabet[b], runs[b][0], output_on_entry(alphabet[b], 1));
                    } else if (k < run_length) {
                        state->add_transition(alphabet[a], runs[a][k], output_on_entry(alphabet[a], k + 1));
                    } else {
                        state->add_transition(alphabet[a], state, normal);
                    }
                }
            }
        }
        return machine;
    }

    transducer::MealyMachine build_repetition_detector(const std::vector<Symbol> &alphabet,
                                                       const std::size_t run_length,
                                                       const Symbol &normal,
                                                       const Symbol &alarm) {
        return build_repetition_detector(alphabet, run_length, normal,
                                         [&alarm](const Symbol &) { return alarm; });
    }
}
