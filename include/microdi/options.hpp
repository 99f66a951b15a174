#pragma once

#include <memory>

namespace spdlog {
class logger;
} // namespace spdlog

namespace microdi {

/// Container configuration, passed to the container constructor.
///
///     microdi::container c({.detect_cycles = false});
struct container_options {
    /// Raise cyclic_dependency when a type re-enters its own construction
    /// (or its own provider) with no singleton construction in between.
    /// When false such a cycle recurses until the stack is exhausted.
    bool detect_cycles = true;

    /// Capture a stacktrace for every provider binding so provider
    /// failures can report where the provider was registered.  Has no
    /// effect unless microdi was built with Boost.Stacktrace support.
    bool capture_stacktraces = true;

    /// Destination for container diagnostics.  nullptr = spdlog's default
    /// logger.
    std::shared_ptr<spdlog::logger> logger;
};

} // namespace microdi
