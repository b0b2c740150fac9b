#pragma once

/// @file overrides.hpp
/// @brief Overrides that apply to the whole package installation

#include "fwd.hpp"
#include <nitro/core/error.hpp>

#include <string>
#include <vector>

namespace nitro_pkg {

/// Package overrides
///
/// ```json
/// { "suppress": ["sodium"], "force": ["iris"] }
/// ```
struct PackageOverrides {
    std::vector<std::string> suppress;  ///< Packages to never install
    std::vector<std::string> force;     ///< Packages evaluated with the force flag

    /// Parse overrides from a JSON object string; missing keys default to empty
    [[nodiscard]] static nitro_core::Result<PackageOverrides> from_json_string(const std::string& json_str);
};

/// Check if a package is named in an override list. Entries are parsed as
/// requests, so "repo:id@version" entries match by ID.
[[nodiscard]] bool is_package_overridden(const PackageRequest& package,
                                         const std::vector<std::string>& list);

} // namespace nitro_pkg
