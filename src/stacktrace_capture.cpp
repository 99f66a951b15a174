#include "stacktrace_utils.hpp"

#include <any>

#ifdef MICRODI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace microdi::internal {

std::any capture_stacktrace() {
#ifdef MICRODI_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace microdi::internal
