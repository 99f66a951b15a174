#pragma once

#include "export.hpp"

#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace microdi {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
MICRODI_EXPORT std::string demangle(std::type_index type);
} // namespace internal

enum class error_kind {
    invalid_binding,
    missing_provider,
    unresolved_interface,
    provider_failure,
    construction_failure,
    post_construct_failure,
    cyclic_dependency
};

MICRODI_EXPORT std::string_view to_string(error_kind kind) noexcept;

/// Root of every error the container raises.
class MICRODI_EXPORT di_error : public std::runtime_error {
public:
    di_error(error_kind kind, const std::string& message,
             std::exception_ptr cause = nullptr,
             std::source_location loc = std::source_location::current());

    error_kind kind() const noexcept { return kind_; }

    /// The exception that caused this one (provider, constructor or hook
    /// failure); null when the container itself detected the problem.
    const std::exception_ptr& cause() const noexcept { return cause_; }

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a dependency
    /// fails, every enclosing injection appends the field being resolved
    /// so what() shows the full chain, e.g.:
    ///   "... (while resolving repository::db -> service::repo)"
    void append_resolution_context(const std::string& component_info);

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    error_kind kind_;
    std::exception_ptr cause_;
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// bind_interface() was given an invalid pair of types.
class MICRODI_EXPORT invalid_binding : public di_error {
public:
    invalid_binding(std::type_index type, std::string_view reason,
                    std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// An abstract class was requested and no provider is bound for it.
class MICRODI_EXPORT missing_provider : public di_error {
public:
    explicit missing_provider(std::type_index type,
                              std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// An interface was requested with neither a mapping nor a provider.
class MICRODI_EXPORT unresolved_interface : public di_error {
public:
    explicit unresolved_interface(std::type_index type,
                                  std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class MICRODI_EXPORT provider_failure : public di_error {
public:
    provider_failure(std::type_index type, std::string_view reason,
                     std::exception_ptr cause,
                     std::source_location registration_loc,
                     std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class MICRODI_EXPORT construction_failure : public di_error {
public:
    construction_failure(std::type_index type, std::string_view reason,
                         std::exception_ptr cause = nullptr,
                         std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class MICRODI_EXPORT post_construct_failure : public di_error {
public:
    post_construct_failure(std::type_index type, std::string_view hook,
                           std::string_view reason, std::exception_ptr cause,
                           std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }
    const std::string& hook() const noexcept { return hook_; }

private:
    std::type_index component_type_;
    std::string hook_;
};

class MICRODI_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(const std::vector<std::type_index>& cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<std::type_index>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::type_index> cycle_;
    static std::string build_message(const std::vector<std::type_index>& cycle);
};

} // namespace microdi
