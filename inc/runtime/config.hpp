/**
 * Interpreter Configuration
 *
 * Specifies diagnostics and safety limits for one interpreter session.
 */

#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>

namespace luna {
namespace runtime {

struct InterpreterConfig {
    std::ostream* diagnostics = &std::cerr;   // Sink for [DEBUG]/[WARNING] lines

    bool debugLogging = false;   // Emit [DEBUG] lines (collections, ...)
    bool traceCalls = false;     // Log every function call

    // Maximum __index/__newindex hops; 0 means unbounded
    std::size_t metatableChainLimit = 0;

    // Objects allocated before the evaluator collects between
    // statements; 0 disables automatic collection
    std::size_t collectionThreshold = 4096;
};

} // namespace runtime
} // namespace luna
