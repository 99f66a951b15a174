#pragma once

// Internal singleton cache.
// This header is NOT installed — it is only used by the library's .cpp files.

#include "microdi/descriptor.hpp"

#include <cstddef>
#include <typeindex>
#include <unordered_map>

namespace microdi::internal {

/// concrete type → its single shared instance.
class singleton_cache {
public:
    /// The cached instance, or an empty pointer.
    instance_ptr find(std::type_index type) const;

    /// Cache `instance` unless `type` already has one.  Returns the instance
    /// that is cached afterwards, which is the earlier one on conflict.
    instance_ptr insert(std::type_index type, instance_ptr instance);

    void erase(std::type_index type);

    std::size_t size() const noexcept { return instances_.size(); }

private:
    std::unordered_map<std::type_index, instance_ptr> instances_;
};

} // namespace microdi::internal
