#include "container_impl.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace microdi {

namespace {

provider_failure make_provider_failure(std::type_index type, std::string_view reason,
                                       std::exception_ptr cause,
                                       const internal::provider_binding& binding) {
    provider_failure error(type, reason, std::move(cause), binding.registration_location);
    error.set_diagnostic_detail(internal::format_registration_trace(type, binding));
    return error;
}

} // namespace

// ---------------------------------------------------------------
// impl
// ---------------------------------------------------------------

container::impl::impl(container_options opts)
    : options(std::move(opts))
    , log(options.logger ? options.logger : spdlog::default_logger())
{}

container::impl::progress_guard::progress_guard(impl& owner, std::type_index type,
                                                bool cached_before_injection)
    : owner_(owner)
{
    if (owner.options.detect_cycles) {
        auto it = std::find_if(owner.in_progress.begin(), owner.in_progress.end(),
                               [type](const progress_entry& e) { return e.type == type; });
        // A singleton construction in [it, end) serves the repeated request
        // from the cache further down, so the recursion ends on its own.
        const bool broken = std::any_of(it, owner.in_progress.end(),
                                        [](const progress_entry& e) {
                                            return e.cached_before_injection;
                                        });
        if (it != owner.in_progress.end() && !broken) {
            std::vector<std::type_index> cycle;
            for (; it != owner.in_progress.end(); ++it) {
                cycle.push_back(it->type);
            }
            cycle.push_back(type);
            throw cyclic_dependency(cycle);
        }
    }
    owner.in_progress.push_back(progress_entry{type, cached_before_injection});
}

container::impl::progress_guard::~progress_guard() {
    owner_.in_progress.pop_back();
}

bool container::impl::is_singleton(const component_descriptor& desc) const {
    return desc.singleton || registry.is_marked_singleton(desc.type);
}

instance_ptr container::impl::cache_singleton(const component_descriptor& desc,
                                              instance_ptr instance) {
    instance_ptr cached = singletons.insert(desc.type, instance);
    if (cached == instance) {
        log->debug("cached singleton {}", internal::demangle(desc.type));
    }
    return cached;
}

// ---------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------

instance_ptr container::impl::get_instance(const component_descriptor& requested) {
    if (log->should_log(spdlog::level::trace)) {
        log->trace("resolving {} ({})", internal::demangle(requested.type),
                   to_string(requested.kind));
    }

    switch (requested.kind) {
        case type_kind::abstract_class: {
            auto binding = registry.find_provider(requested.type);
            if (!binding) {
                throw missing_provider(requested.type);
            }
            return invoke_provider(requested, *binding);
        }

        case type_kind::interface: {
            // Mappings win over a provider bound on the interface itself.
            if (const auto* mapping = registry.find_interface(requested.type)) {
                const component_descriptor& implementation = *mapping->implementation;
                const cast_fn upcast = mapping->upcast;
                instance_ptr instance = resolve_concrete(implementation);
                void* as_interface = upcast(instance.get());
                return instance_ptr(std::move(instance), as_interface);
            }
            if (auto binding = registry.find_provider(requested.type)) {
                return invoke_provider(requested, *binding);
            }
            throw unresolved_interface(requested.type);
        }

        case type_kind::concrete:
            break;
    }
    return resolve_concrete(requested);
}

instance_ptr container::impl::resolve_concrete(const component_descriptor& concrete) {
    if (instance_ptr cached = singletons.find(concrete.type)) {
        return cached;
    }

    if (auto binding = registry.find_provider(concrete.type)) {
        instance_ptr instance = invoke_provider(concrete, *binding);
        if (is_singleton(concrete)) {
            return cache_singleton(concrete, std::move(instance));
        }
        return instance;
    }

    return create_new_instance(concrete);
}

instance_ptr container::impl::invoke_provider(const component_descriptor& type,
                                              const internal::provider_binding& binding) {
    progress_guard guard(*this, type.type, false);

    instance_ptr instance;
    try {
        instance = binding.provider();
    } catch (const std::exception& e) {
        throw make_provider_failure(type.type, e.what(), std::current_exception(), binding);
    } catch (...) {
        throw make_provider_failure(type.type, "unknown exception", std::current_exception(),
                                    binding);
    }

    if (!instance) {
        throw make_provider_failure(type.type, "provider returned an empty instance",
                                    nullptr, binding);
    }
    return instance;
}

// ---------------------------------------------------------------
// container
// ---------------------------------------------------------------

container::container(container_options options)
    : impl_(std::make_unique<impl>(std::move(options)))
{}

container::~container() = default;

container::container(container&&) noexcept = default;
container& container::operator=(container&&) noexcept = default;

container& container::register_interface(const component_descriptor& interface_desc,
                                         const component_descriptor& impl_desc,
                                         cast_fn upcast,
                                         std::source_location loc) {
    if (interface_desc.kind != type_kind::interface) {
        throw invalid_binding(interface_desc.type,
                              "expecting the first argument to be an interface, but it is a "
                              + std::string(to_string(interface_desc.kind)) + " type",
                              loc);
    }
    if (impl_desc.kind != type_kind::concrete) {
        throw invalid_binding(interface_desc.type,
                              "expecting an implementing concrete class, but "
                              + internal::demangle(impl_desc.type) + " is an "
                              + std::string(to_string(impl_desc.kind)),
                              loc);
    }

    std::lock_guard lock(impl_->mutex);
    impl_->registry.bind_interface(interface_desc.type,
                                   internal::interface_binding{&impl_desc, upcast, loc});
    impl_->log->debug("bound interface {} -> {}", internal::demangle(interface_desc.type),
                      internal::demangle(impl_desc.type));
    return *this;
}

container& container::register_provider(std::type_index type,
                                        provider_fn provider,
                                        std::string_view origin,
                                        std::source_location loc) {
    internal::provider_binding binding{std::move(provider), loc, {}};
    if (impl_->options.capture_stacktraces) {
        binding.registration_stacktrace = internal::capture_stacktrace();
    }

    std::lock_guard lock(impl_->mutex);
    impl_->registry.bind_provider(type, std::move(binding));
    impl_->log->debug("bound {} for {}", origin, internal::demangle(type));
    return *this;
}

container& container::register_singleton(std::type_index type, std::source_location loc) {
    std::lock_guard lock(impl_->mutex);
    impl_->registry.mark_singleton(type);
    impl_->log->debug("marked {} singleton at {}:{}", internal::demangle(type),
                      loc.file_name(), loc.line());
    return *this;
}

instance_ptr container::resolve(const component_descriptor& requested) {
    std::lock_guard lock(impl_->mutex);
    return impl_->get_instance(requested);
}

void container::inject_into(const component_descriptor& desc, void* self) {
    std::lock_guard lock(impl_->mutex);
    impl_->inject(desc, self);
}

bool container::is_singleton_impl(const component_descriptor& desc) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->is_singleton(desc);
}

std::size_t container::singleton_count() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->singletons.size();
}

const container_options& container::options() const noexcept {
    return impl_->options;
}

} // namespace microdi
