#pragma once

#include "descriptor.hpp"
#include "type_traits.hpp"

#include <concepts>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace microdi {

template <component T>
const component_descriptor& describe();

template <typename T>
class manifest;

namespace detail {
template <component T>
component_descriptor build_descriptor();
} // namespace detail

/// T declares its own manifest through a public static member:
///
///     static void describe(microdi::manifest<T>& m);
template <typename T>
concept self_describing = requires(manifest<T>& m) { T::describe(m); };

/// Customisation point.  Specialise for types that cannot carry a
/// `describe` member (third-party classes); the primary template forwards
/// to `T::describe` when present and otherwise describes nothing.
template <typename T>
struct component_traits {
    static void describe(manifest<T>& m) {
        if constexpr (self_describing<T>) {
            T::describe(m);
        }
    }
};

// ---------------------------------------------------------------
// manifest<T> — declarative description of an injectable type
// ---------------------------------------------------------------

/// Builder handed to a type's describe function.  Every verb returns the
/// manifest so declarations chain:
///
///     static void describe(microdi::manifest<service>& m) {
///         m.singleton()
///          .inject("logger", &service::logger_)
///          .post_construct("start", &service::start);
///     }
///
/// Fields and hooks are discovered in declaration order; those of bases
/// named through extends<Base>() follow the type's own.
template <typename T>
class manifest {
public:
    manifest(const manifest&) = delete;
    manifest& operator=(const manifest&) = delete;

    /// Declare T singleton-scoped.
    manifest& singleton() noexcept {
        singleton_ = true;
        return *this;
    }

    /// Declare an injectable field.  F is `std::shared_ptr<D>` or
    /// `std::weak_ptr<D>`; the container resolves D and assigns it.
    template <typename F>
        requires injectable_field<F>
    manifest& inject(std::string name, F T::*member) {
        using D = typename field_traits<F>::dependency_type;
        fields_.push_back(field_descriptor{
            std::move(name),
            &microdi::describe<D>,
            field_traits<F>::owning,
            [member](void* self, const instance_ptr& value) {
                static_cast<T*>(self)->*member = std::static_pointer_cast<D>(value);
            }});
        return *this;
    }

    /// Declare a post-construct hook, run once after injection.
    manifest& post_construct(std::string name, void (T::*fn)()) {
        hooks_.push_back(hook_descriptor{
            std::move(name),
            [fn](void* self) { (static_cast<T*>(self)->*fn)(); }});
        return *this;
    }

    /// Inherit the injectable fields and hooks declared by Base's manifest.
    template <typename Base>
        requires component<Base> && std::derived_from<T, Base> && (!std::same_as<T, Base>)
    manifest& extends() {
        bases_.push_back(base_entry{
            &microdi::describe<Base>,
            [](void* self) -> void* {
                return static_cast<Base*>(static_cast<T*>(self));
            }});
        return *this;
    }

private:
    template <component U>
    friend component_descriptor detail::build_descriptor();

    struct base_entry {
        descriptor_fn describe;
        cast_fn       to_base;
    };

    manifest() = default;

    component_descriptor finish() && {
        component_descriptor desc;
        desc.type = std::type_index(typeid(T));
        desc.kind = kind_of<T>();
        desc.singleton = singleton_;
        if constexpr (concrete_type<T> && std::is_default_constructible_v<T>) {
            desc.construct = [] { return instance_ptr(std::make_shared<T>()); };
        }

        desc.fields = std::move(fields_);
        desc.post_construct = std::move(hooks_);
        for (const auto& base : bases_) {
            const component_descriptor& inherited = base.describe();
            for (const auto& field : inherited.fields) {
                desc.fields.push_back(field_descriptor{
                    field.name, field.dependency, field.owning,
                    [to_base = base.to_base, assign = field.assign](void* self,
                                                                    const instance_ptr& value) {
                        assign(to_base(self), value);
                    }});
            }
            for (const auto& hook : inherited.post_construct) {
                desc.post_construct.push_back(hook_descriptor{
                    hook.name,
                    [to_base = base.to_base, invoke = hook.invoke](void* self) {
                        invoke(to_base(self));
                    }});
            }
        }
        return desc;
    }

    bool singleton_ = false;
    std::vector<field_descriptor> fields_;
    std::vector<hook_descriptor> hooks_;
    std::vector<base_entry> bases_;
};

namespace detail {

template <component T>
component_descriptor build_descriptor() {
    manifest<T> m;
    component_traits<T>::describe(m);
    return std::move(m).finish();
}

} // namespace detail

/// The descriptor of T, built from its manifest on first use.
template <component T>
const component_descriptor& describe() {
    static const component_descriptor desc = detail::build_descriptor<T>();
    return desc;
}

} // namespace microdi
