//
// Created by aowei on 2025/10/13.
//

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <fsmkit/cases/repetition.hpp>
#include <fsmkit/core/errors.hpp>
#include <fsmkit/persist/snapshot.hpp>

using fsmkit::core::Symbol;

namespace {
    const Symbol OK = "ok";

    // 棒棒糖口味检测：s = 草莓，l = 柠檬，同一口味连续三根就报警
    fsmkit::transducer::MealyMachine build_lollipop_detector() {
        return fsmkit::cases::build_repetition_detector(
            {"s", "l"}, 3, OK,
            [](const Symbol &flavor) -> Symbol {
                return flavor == Symbol{"s"}
                           ? "Error: three strawberry lollipops in a row"
                           : "Error: three lemon lollipops in a row";
            });
    }

    void report(const std::vector<Symbol> &outputs) {
        for (std::size_t pos = 0; pos < outputs.size(); ++pos) {
            if (outputs[pos] != OK) {
                std::cout << fsmkit::core::to_string(outputs[pos]) << " at position " << pos + 1 << std::endl;
            }
        }
    }

    void usage(const char *program) {
        std::cerr << "Usage: " << program << " <input, e.g. sslll> [--snapshot PATH]\n";
    }
}

int main(int argc, char **argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }
    std::string input;
    std::filesystem::path snapshot_path = "./machine.json";
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--snapshot" && i + 1 < argc) {
            snapshot_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (input.empty()) {
            input = arg;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    try {
        const auto sequence = fsmkit::core::symbols_of(input);

        // 一次性处理整个序列
        auto machine = build_lollipop_detector();
        const auto outputs = machine.forward(sequence);
        report(outputs);

        // 处理前一半，保存，重新加载，再处理后一半
        machine.reset();
        const auto half = static_cast<std::ptrdiff_t>(sequence.size() / 2);
        auto resumed_outputs = machine.forward(std::vector<Symbol>(sequence.begin(), sequence.begin() + half));
        fsmkit::persist::save(machine, snapshot_path);
        auto resumed = fsmkit::persist::load(snapshot_path);
        const auto rest = resumed.forward(std::vector<Symbol>(sequence.begin() + half, sequence.end()));
        resumed_outputs.insert(resumed_outputs.end(), rest.begin(), rest.end());

        if (resumed_outputs != outputs) {
            std::cerr << "Resumed run differs from the uninterrupted run." << std::endl;
            return 1;
        }
        std::cout << "Resumed run from " << snapshot_path.string() << " matches ("
                  << resumed.current()->name << ")" << std::endl;
        return 0;
    } catch (const fsmkit::core::UndefinedTransitionError &e) {
        std::cerr << "Unknown lollipop flavor '" << fsmkit::core::to_string(e.symbol()) << "'" << std::endl;
        return 2;
    } catch (const fsmkit::core::AutomatonError &e) {
        std::cerr << "Automaton error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
