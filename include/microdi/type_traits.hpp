#pragma once

#include "type_kind.hpp"

#include <concepts>
#include <memory>
#include <type_traits>

namespace microdi {

// ---------------------------------------------------------------
// Abstract-class marker
// ---------------------------------------------------------------

/// Empty base that opts an abstract type into abstract-class semantics.
/// Abstract types deriving from it are never mapped to implementations;
/// they must be bound with bind_provider() or bind_instance().
/// Types without the marker that have pure virtual members are interfaces.
struct abstract_class {};

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// Anything the container can key a binding on.
template <typename T>
concept component = std::is_class_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>;

template <typename T>
concept abstract_class_type = component<T>
                           && std::is_abstract_v<T>
                           && std::derived_from<T, abstract_class>;

template <typename T>
concept interface_type = component<T>
                      && std::is_abstract_v<T>
                      && !std::derived_from<T, abstract_class>;

template <typename T>
concept concrete_type = component<T> && !std::is_abstract_v<T>;

/// TImpl can stand in for TInterface (or TImpl == TInterface).
template <typename TImpl, typename TInterface>
concept implements = component<TImpl> && component<TInterface>
                  && std::derived_from<TImpl, TInterface>;

/// F is a copyable zero-argument factory whose result converts to
/// std::shared_ptr<T>.
template <typename F, typename T>
concept provider_for = std::copy_constructible<F>
                    && std::invocable<F&>
                    && std::convertible_to<std::invoke_result_t<F&>, std::shared_ptr<T>>;

template <component T>
constexpr type_kind kind_of() noexcept {
    if constexpr (concrete_type<T>) {
        return type_kind::concrete;
    } else if constexpr (abstract_class_type<T>) {
        return type_kind::abstract_class;
    } else {
        return type_kind::interface;
    }
}

// ---------------------------------------------------------------
// Injectable field traits
// ---------------------------------------------------------------

/// Primary: not an injectable field type.
template <typename F>
struct field_traits {
    static constexpr bool injectable = false;
};

/// `std::shared_ptr<D>` → shared handle to the resolved instance.
template <typename D>
struct field_traits<std::shared_ptr<D>> {
    using dependency_type = D;
    static constexpr bool injectable = true;
    static constexpr bool owning = true;
};

/// `std::weak_ptr<D>` → non-owning handle, breaks cycles between singletons.
template <typename D>
struct field_traits<std::weak_ptr<D>> {
    using dependency_type = D;
    static constexpr bool injectable = true;
    static constexpr bool owning = false;
};

template <typename F>
concept injectable_field = field_traits<F>::injectable
                        && component<typename field_traits<F>::dependency_type>;

} // namespace microdi
