#include "microdi/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace microdi {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

} // namespace internal

std::string_view to_string(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::invalid_binding:        return "invalid binding";
        case error_kind::missing_provider:       return "missing provider";
        case error_kind::unresolved_interface:   return "unresolved interface";
        case error_kind::provider_failure:       return "provider failure";
        case error_kind::construction_failure:   return "construction failure";
        case error_kind::post_construct_failure: return "post-construct failure";
        case error_kind::cyclic_dependency:      return "cyclic dependency";
    }
    return "unknown";
}

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(error_kind kind, const std::string& message,
                   std::exception_ptr cause, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , kind_(kind)
    , cause_(std::move(cause))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& component_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_info;
    cached_what_.clear();
}

const char* di_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::exception&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

invalid_binding::invalid_binding(std::type_index type, std::string_view reason,
                                 std::source_location loc)
    : di_error(error_kind::invalid_binding,
               "Invalid binding for " + internal::demangle(type) + ": "
               + std::string(reason), nullptr, loc)
    , component_type_(type)
{}

missing_provider::missing_provider(std::type_index type, std::source_location loc)
    : di_error(error_kind::missing_provider,
               "Missing provider for abstract class: " + internal::demangle(type),
               nullptr, loc)
    , component_type_(type)
{}

unresolved_interface::unresolved_interface(std::type_index type, std::source_location loc)
    : di_error(error_kind::unresolved_interface,
               "No binding or provider for interface: " + internal::demangle(type),
               nullptr, loc)
    , component_type_(type)
{}

provider_failure::provider_failure(std::type_index type, std::string_view reason,
                                   std::exception_ptr cause,
                                   std::source_location registration_loc,
                                   std::source_location loc)
    : di_error(error_kind::provider_failure, [&]() {
          std::string msg = "Provider for " + internal::demangle(type)
                            + " failed: " + std::string(reason);
          if (registration_loc.file_name()[0]) {
              msg += " (registered at " + std::string(registration_loc.file_name())
                     + ":" + std::to_string(registration_loc.line()) + ")";
          }
          return msg;
      }(), std::move(cause), loc)
    , component_type_(type)
{}

construction_failure::construction_failure(std::type_index type, std::string_view reason,
                                           std::exception_ptr cause,
                                           std::source_location loc)
    : di_error(error_kind::construction_failure,
               "Failed to construct " + internal::demangle(type) + ": "
               + std::string(reason), std::move(cause), loc)
    , component_type_(type)
{}

post_construct_failure::post_construct_failure(std::type_index type, std::string_view hook,
                                               std::string_view reason,
                                               std::exception_ptr cause,
                                               std::source_location loc)
    : di_error(error_kind::post_construct_failure,
               "Post-construct hook " + internal::demangle(type) + "::"
               + std::string(hook) + " failed: " + std::string(reason),
               std::move(cause), loc)
    , component_type_(type)
    , hook_(hook)
{}

std::string cyclic_dependency::build_message(const std::vector<std::type_index>& cycle) {
    std::string msg = "Cyclic dependency detected: ";
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) msg += " -> ";
        msg += internal::demangle(cycle[i]);
    }
    return msg;
}

cyclic_dependency::cyclic_dependency(const std::vector<std::type_index>& cycle,
                                     std::source_location loc)
    : di_error(error_kind::cyclic_dependency, build_message(cycle), nullptr, loc)
    , cycle_(cycle)
{}

} // namespace microdi
