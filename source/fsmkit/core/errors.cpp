//
// Created by aowei on 2025 10月 8.
//

#include <utility>
#include <fsmkit/core/errors.hpp>

namespace fsmkit::core {
    UndefinedTransitionError::UndefinedTransitionError(std::string state_name, Symbol symbol)
        : AutomatonError("No transition on '" + to_string(symbol) + "' from state '" + state_name + "'."),
          from(std::move(state_name)), input(std::move(symbol)) {}
}
