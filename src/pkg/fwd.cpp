/// @file fwd.cpp
/// @brief Implementation of forward declaration utilities

#include <nitro/pkg/fwd.hpp>

namespace nitro_pkg {

const char* package_stability_to_string(PackageStability stability) noexcept {
    switch (stability) {
        case PackageStability::Stable: return "stable";
        case PackageStability::Latest: return "latest";
        default:                       return "unknown";
    }
}

bool package_stability_from_string(const std::string& str, PackageStability& out) noexcept {
    if (str == "stable") {
        out = PackageStability::Stable;
        return true;
    }
    if (str == "latest") {
        out = PackageStability::Latest;
        return true;
    }
    return false;
}

const char* eval_permissions_to_string(EvalPermissions perms) noexcept {
    switch (perms) {
        case EvalPermissions::Restricted: return "restricted";
        case EvalPermissions::Standard:   return "standard";
        case EvalPermissions::Elevated:   return "elevated";
        default:                          return "unknown";
    }
}

bool eval_permissions_from_string(const std::string& str, EvalPermissions& out) noexcept {
    if (str == "restricted") {
        out = EvalPermissions::Restricted;
        return true;
    }
    if (str == "standard") {
        out = EvalPermissions::Standard;
        return true;
    }
    if (str == "elevated") {
        out = EvalPermissions::Elevated;
        return true;
    }
    return false;
}

const char* side_to_string(Side side) noexcept {
    switch (side) {
        case Side::Client: return "client";
        case Side::Server: return "server";
        default:           return "unknown";
    }
}

} // namespace nitro_pkg
