#pragma once

// Internal container state shared by the resolver (container.cpp) and the
// instantiator (instantiator.cpp).
// This header is NOT installed — it is only used by the library's .cpp files.

#include "microdi/container.hpp"
#include "registry.hpp"
#include "singleton_cache.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <typeindex>
#include <vector>

namespace microdi {

struct container::impl {
    explicit impl(container_options opts);

    container_options options;
    std::shared_ptr<spdlog::logger> log;

    internal::binding_registry registry;
    internal::singleton_cache singletons;

    // Serialises every public operation.  Recursive: providers may call
    // back into the container on the same thread.
    std::recursive_mutex mutex;

    struct progress_entry {
        std::type_index type;
        // A singleton construction: cached before injection, so any
        // cycle that passes through it ends at the cache.
        bool cached_before_injection;
    };

    // Constructions and provider calls that are running, outermost first.
    std::vector<progress_entry> in_progress;

    // ---------------------------------------------------------------
    // Resolver (container.cpp)
    // ---------------------------------------------------------------

    instance_ptr get_instance(const component_descriptor& requested);
    instance_ptr resolve_concrete(const component_descriptor& concrete);
    instance_ptr invoke_provider(const component_descriptor& type,
                                 const internal::provider_binding& binding);

    bool is_singleton(const component_descriptor& desc) const;

    /// Returns the instance that is cached afterwards.
    instance_ptr cache_singleton(const component_descriptor& desc, instance_ptr instance);

    // ---------------------------------------------------------------
    // Instantiator (instantiator.cpp)
    // ---------------------------------------------------------------

    instance_ptr create_new_instance(const component_descriptor& concrete);
    void inject(const component_descriptor& desc, void* self);
    void call_post_construct(const component_descriptor& desc, void* self);

    // ---------------------------------------------------------------
    // Guards
    // ---------------------------------------------------------------

    /// Marks a type in progress for one construction or provider call.
    /// Throws cyclic_dependency if the type is already in progress and no
    /// singleton construction lies between the two entries.
    class progress_guard {
    public:
        progress_guard(impl& owner, std::type_index type, bool cached_before_injection);
        ~progress_guard();

        progress_guard(const progress_guard&) = delete;
        progress_guard& operator=(const progress_guard&) = delete;

    private:
        impl& owner_;
    };
};

} // namespace microdi
