#pragma once

/// @file fwd.hpp
/// Forward declarations for all public microdi symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace microdi {

// type_kind.hpp
enum class type_kind;

// type_traits.hpp
struct abstract_class;

// descriptor.hpp
struct field_descriptor;
struct hook_descriptor;
struct component_descriptor;

// manifest.hpp
template <typename T>
class manifest;
template <typename T>
struct component_traits;

// options.hpp
struct container_options;

// exceptions.hpp
enum class error_kind;
class di_error;
class invalid_binding;
class missing_provider;
class unresolved_interface;
class provider_failure;
class construction_failure;
class post_construct_failure;
class cyclic_dependency;

// container.hpp
class container;

} // namespace microdi
