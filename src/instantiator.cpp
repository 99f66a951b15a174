#include "container_impl.hpp"

#include <exception>
#include <string>

namespace microdi {

instance_ptr container::impl::create_new_instance(const component_descriptor& concrete) {
    const bool singleton = is_singleton(concrete);
    progress_guard guard(*this, concrete.type, singleton);

    if (!concrete.construct) {
        throw construction_failure(concrete.type, "no accessible zero-argument constructor");
    }

    instance_ptr instance;
    try {
        instance = concrete.construct();
    } catch (const std::exception& e) {
        throw construction_failure(concrete.type, e.what(), std::current_exception());
    } catch (...) {
        throw construction_failure(concrete.type, "unknown exception", std::current_exception());
    }
    log->debug("constructed {}", internal::demangle(concrete.type));

    // A singleton is visible in the cache before its fields are injected,
    // so dependencies that refer back to it receive this instance.
    if (singleton) {
        cache_singleton(concrete, instance);
    }

    try {
        inject(concrete, instance.get());
        call_post_construct(concrete, instance.get());
    } catch (const di_error& e) {
        // The cached instance may already be held by other objects; it stays.
        if (singleton) {
            log->warn("singleton {} stays cached after failed initialisation: {}",
                      internal::demangle(concrete.type), e.what());
        }
        throw;
    }
    return instance;
}

void container::impl::inject(const component_descriptor& desc, void* self) {
    for (const auto& field : desc.fields) {
        instance_ptr value;
        try {
            value = get_instance(field.dependency());
        } catch (di_error& e) {
            e.append_resolution_context(internal::demangle(desc.type) + "::" + field.name);
            throw;
        }
        // A non-owning field needs an owner other than this local handle.
        if (!field.owning && value.use_count() == 1) {
            throw construction_failure(
                desc.type,
                "non-owning field " + internal::demangle(desc.type) + "::" + field.name
                + " would expire at once: " + internal::demangle(field.dependency().type)
                + " is neither a cached singleton nor held by its provider");
        }
        field.assign(self, value);
    }
}

void container::impl::call_post_construct(const component_descriptor& desc, void* self) {
    for (const auto& hook : desc.post_construct) {
        try {
            hook.invoke(self);
        } catch (const std::exception& e) {
            throw post_construct_failure(desc.type, hook.name, e.what(),
                                         std::current_exception());
        } catch (...) {
            throw post_construct_failure(desc.type, hook.name, "unknown exception",
                                         std::current_exception());
        }
    }
}

} // namespace microdi
