#include "provider.hpp"

namespace maxproxy {

std::optional<Role> role_from_string(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    return std::nullopt;
}

} // namespace maxproxy
