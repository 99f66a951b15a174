#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed — it is only used by the library's .cpp files.

#include "registry.hpp"
#include "microdi/exceptions.hpp"

#include <any>
#include <sstream>
#include <string>
#include <typeindex>

#ifdef MICRODI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace microdi::internal {

/// Capture the current call stack into a std::any (empty when stacktrace
/// support is compiled out).  Implemented in stacktrace_capture.cpp.
std::any capture_stacktrace();

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef MICRODI_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one provider binding's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for provider of MyType:\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(std::type_index type,
                                             const provider_binding& binding) {
    std::string trace = format_stacktrace(binding.registration_stacktrace);
    if (trace.empty()) return {};
    return "Registration stacktrace for provider of " + demangle(type) + ":\n" + trace;
}

} // namespace microdi::internal
