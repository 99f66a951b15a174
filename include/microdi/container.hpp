#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "manifest.hpp"
#include "options.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace microdi {

namespace detail {

template <typename F>
struct is_function_wrapper : std::false_type {};

template <typename Sig>
struct is_function_wrapper<std::function<Sig>> : std::true_type {};

/// True for null function pointers and empty std::function objects.
template <typename F>
bool is_empty_callable(const F& f) {
    if constexpr (std::is_pointer_v<F>) {
        return f == nullptr;
    } else if constexpr (is_function_wrapper<F>::value) {
        return !f;
    } else {
        return false;
    }
}

} // namespace detail

// ---------------------------------------------------------------
// container
// ---------------------------------------------------------------

/// Holds the bindings and the singleton instances of one object graph.
/// Every public operation is serialised by a per-container lock; providers
/// may call back into the container that invokes them.
class MICRODI_EXPORT container {
public:
    explicit container(container_options options = {});
    ~container();

    container(const container&) = delete;
    container& operator=(const container&) = delete;
    /// Moving transfers the bindings and cached singletons.  A moved-from
    /// container may only be destroyed or assigned to; every other
    /// operation on it is undefined behaviour.
    container(container&&) noexcept;
    container& operator=(container&&) noexcept;

    // ===============================================================
    // Bindings
    // ===============================================================

    /// Map interface TInterface to the concrete type TImpl.  Throws
    /// invalid_binding if TInterface is not an interface or TImpl is not
    /// concrete.  Replaces an earlier mapping for TInterface.
    template <typename TInterface, typename TImpl>
        requires implements<TImpl, TInterface>
    container& bind_interface(std::source_location loc = std::source_location::current()) {
        return register_interface(
            describe<TInterface>(), describe<TImpl>(),
            [](void* p) -> void* {
                return static_cast<TInterface*>(static_cast<TImpl*>(p));
            },
            loc);
    }

    /// Always answer requests for T with `instance`.  The instance is
    /// returned as-is: no injection, no post-construct hooks.
    template <typename T>
        requires component<T>
    container& bind_instance(std::shared_ptr<T> instance,
                             std::source_location loc = std::source_location::current()) {
        if (!instance) {
            throw invalid_binding(typeid(T), "bound instance is empty", loc);
        }
        return register_provider(
            typeid(T),
            [instance = std::move(instance)]() -> instance_ptr { return instance; },
            "instance", loc);
    }

    /// Answer requests for T by calling `provider`, a zero-argument callable
    /// returning something convertible to std::shared_ptr<T>.  Replaces an
    /// earlier provider for T.
    template <typename T, typename F>
        requires component<T> && provider_for<F, T>
    container& bind_provider(F provider,
                             std::source_location loc = std::source_location::current()) {
        if (detail::is_empty_callable(provider)) {
            throw invalid_binding(typeid(T), "provider is empty", loc);
        }
        return register_provider(
            typeid(T),
            [provider = std::move(provider)]() mutable -> instance_ptr {
                std::shared_ptr<T> result = std::invoke(provider);
                return result;
            },
            "provider", loc);
    }

    /// Force T into singleton scope, whether or not its manifest declares it.
    template <typename T>
        requires component<T>
    container& mark_singleton(std::source_location loc = std::source_location::current()) {
        return register_singleton(typeid(T), loc);
    }

    // ===============================================================
    // Resolution
    // ===============================================================

    /// Resolve T into a fully constructed and injected instance.
    /// Throws a di_error subclass when T cannot be satisfied.
    template <typename T>
        requires component<T>
    std::shared_ptr<T> get_instance() {
        return std::static_pointer_cast<T>(resolve(describe<T>()));
    }

    /// Inject the fields declared by T's manifest into an object built
    /// outside the container.  Post-construct hooks are not run.
    template <typename T>
        requires component<T>
    void inject(T& instance) {
        inject_into(describe<T>(), static_cast<void*>(std::addressof(instance)));
    }

    // ===============================================================
    // Queries
    // ===============================================================

    /// True when T is declared singleton or was passed to mark_singleton().
    template <typename T>
        requires component<T>
    bool is_singleton() const {
        return is_singleton_impl(describe<T>());
    }

    /// Number of singleton instances currently cached.
    std::size_t singleton_count() const;

    const container_options& options() const noexcept;

private:
    container& register_interface(const component_descriptor& interface_desc,
                                  const component_descriptor& impl_desc,
                                  cast_fn upcast,
                                  std::source_location loc);

    container& register_provider(std::type_index type,
                                 provider_fn provider,
                                 std::string_view origin,
                                 std::source_location loc);

    container& register_singleton(std::type_index type, std::source_location loc);

    instance_ptr resolve(const component_descriptor& requested);
    void inject_into(const component_descriptor& desc, void* self);
    bool is_singleton_impl(const component_descriptor& desc) const;

    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace microdi
