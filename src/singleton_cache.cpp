#include "singleton_cache.hpp"

#include <utility>

namespace microdi::internal {

instance_ptr singleton_cache::find(std::type_index type) const {
    auto it = instances_.find(type);
    return it == instances_.end() ? nullptr : it->second;
}

instance_ptr singleton_cache::insert(std::type_index type, instance_ptr instance) {
    return instances_.try_emplace(type, std::move(instance)).first->second;
}

void singleton_cache::erase(std::type_index type) {
    instances_.erase(type);
}

} // namespace microdi::internal
