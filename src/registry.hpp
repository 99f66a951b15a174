#pragma once

// Internal binding registry.
// This header is NOT installed — it is only used by the library's .cpp files.

#include "microdi/descriptor.hpp"

#include <any>
#include <memory>
#include <source_location>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>

namespace microdi::internal {

/// interface → implementation mapping.
struct interface_binding {
    const component_descriptor* implementation = nullptr;
    cast_fn upcast = nullptr;   // implementation* → interface*
    std::source_location registration_location;
};

/// type → provider mapping.  The provider's result addresses the object
/// as the bound type.
struct provider_binding {
    provider_fn provider;
    std::source_location registration_location;
    std::any registration_stacktrace;   // empty unless stacktraces are captured
};

/// Three independent maps, mutated only through the bind operations.
class binding_registry {
public:
    /// Replaces any previous mapping for `interface_type`.
    void bind_interface(std::type_index interface_type, interface_binding binding);

    /// Replaces any previous provider for `type`.
    void bind_provider(std::type_index type, provider_binding binding);

    void mark_singleton(std::type_index type);

    const interface_binding* find_interface(std::type_index interface_type) const;

    /// Shared so a running provider survives being rebound by itself.
    std::shared_ptr<const provider_binding> find_provider(std::type_index type) const;
    bool is_marked_singleton(std::type_index type) const;

private:
    std::unordered_map<std::type_index, interface_binding> interfaces_;
    std::unordered_map<std::type_index, std::shared_ptr<const provider_binding>> providers_;
    std::unordered_set<std::type_index> singletons_;
};

} // namespace microdi::internal
