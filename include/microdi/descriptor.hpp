#pragma once

#include "type_kind.hpp"

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace microdi {

struct component_descriptor;

/// Owning, type-erased handle to a resolved instance.  The stored pointer
/// always addresses the object as the type it was requested as, so
/// `std::static_pointer_cast<T>` round-trips for `get_instance<T>()`.
using instance_ptr = std::shared_ptr<void>;

/// Zero-argument factory; the result addresses the object as the bound type.
using provider_fn = std::function<instance_ptr()>;

/// Pointer adjustment from a derived object to one of its bases.
using cast_fn = void* (*)(void*);

/// Accessor for the descriptor of a dependency.  Descriptors are referenced
/// through accessors (not directly) so types may depend on each other.
using descriptor_fn = const component_descriptor& (*)();

// ---------------------------------------------------------------
// field_descriptor — one injectable field
// ---------------------------------------------------------------

struct field_descriptor {
    std::string   name;
    descriptor_fn dependency = nullptr;

    /// False for `std::weak_ptr` fields: the resolved instance must be kept
    /// alive by the container (or a provider), not by the field.
    bool owning = true;

    /// Stores a resolved dependency into the field of `self`.
    std::function<void(void* self, const instance_ptr& value)> assign;
};

// ---------------------------------------------------------------
// hook_descriptor — one post-construct callback
// ---------------------------------------------------------------

struct hook_descriptor {
    std::string name;
    std::function<void(void* self)> invoke;
};

// ---------------------------------------------------------------
// component_descriptor — everything the container knows about a type
// ---------------------------------------------------------------

struct component_descriptor {
    std::type_index type = std::type_index(typeid(void));
    type_kind       kind = type_kind::concrete;

    /// The type declares itself singleton-scoped.
    bool singleton = false;

    /// Zero-argument construction; empty when the type has no accessible
    /// default constructor (or is abstract).
    std::function<instance_ptr()> construct;

    /// Flattened: own fields first, then those of each declared base.
    std::vector<field_descriptor> fields;

    /// Flattened in the same order as fields.
    std::vector<hook_descriptor> post_construct;
};

} // namespace microdi
