/**
 * Statement Outcome
 *
 * Result of executing a statement: normal completion, a break signal,
 * or a return signal carrying the returned values. Loops consume
 * Break, function activations consume Return, everything else passes
 * the outcome upward unchanged.
 */

#pragma once

#include "runtime/value.hpp"
#include <utility>

namespace luna {
namespace executor {

enum class Signal {
    Normal,
    Break,
    Return
};

struct Outcome {
    Signal signal = Signal::Normal;
    runtime::ValueList values;   // Only meaningful for Return

    static Outcome normal() { return Outcome(); }

    static Outcome breakLoop() {
        Outcome outcome;
        outcome.signal = Signal::Break;
        return outcome;
    }

    static Outcome returning(runtime::ValueList values) {
        Outcome outcome;
        outcome.signal = Signal::Return;
        outcome.values = std::move(values);
        return outcome;
    }

    bool isNormal() const { return signal == Signal::Normal; }
};

} // namespace executor
} // namespace luna
