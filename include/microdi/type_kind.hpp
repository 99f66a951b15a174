#pragma once

#include <string_view>

namespace microdi {

/// How the container may satisfy a request for a type.
enum class type_kind {
    concrete,        ///< instantiable through its zero-argument constructor
    interface,       ///< abstract contract, mapped to an implementation or provided
    abstract_class   ///< abstract type deriving from microdi::abstract_class; provider only
};

constexpr std::string_view to_string(type_kind kind) noexcept {
    constexpr std::string_view names[] = {"concrete", "interface", "abstract class"};
    return names[static_cast<int>(kind)];
}

} // namespace microdi
