#include "registry.hpp"

#include <memory>
#include <utility>

namespace microdi::internal {

void binding_registry::bind_interface(std::type_index interface_type,
                                      interface_binding binding) {
    interfaces_.insert_or_assign(interface_type, std::move(binding));
}

void binding_registry::bind_provider(std::type_index type, provider_binding binding) {
    providers_.insert_or_assign(
        type, std::make_shared<const provider_binding>(std::move(binding)));
}

void binding_registry::mark_singleton(std::type_index type) {
    singletons_.insert(type);
}

const interface_binding* binding_registry::find_interface(std::type_index interface_type) const {
    auto it = interfaces_.find(interface_type);
    return it == interfaces_.end() ? nullptr : &it->second;
}

std::shared_ptr<const provider_binding>
binding_registry::find_provider(std::type_index type) const {
    auto it = providers_.find(type);
    return it == providers_.end() ? nullptr : it->second;
}

bool binding_registry::is_marked_singleton(std::type_index type) const {
    return singletons_.contains(type);
}

} // namespace microdi::internal
