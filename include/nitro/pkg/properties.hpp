#pragma once

/// @file properties.hpp
/// @brief Package properties published by a package

#include "fwd.hpp"
#include <nitro/core/error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace nitro_pkg {

// =============================================================================
// PackageProperties
// =============================================================================

/// Metadata a package publishes about itself, available before evaluation
///
/// ```json
/// {
///   "content_versions": ["1.0", "1.1", "2.0"],
///   "features": ["extras", "shaders"],
///   "default_features": ["extras"]
/// }
/// ```
struct PackageProperties {
    std::optional<std::vector<std::string>> content_versions;  ///< Oldest first
    std::optional<std::vector<std::string>> features;          ///< Features that can be enabled
    std::optional<std::vector<std::string>> default_features;  ///< Features enabled by default

    /// Whether the package publishes a non-empty content version list
    [[nodiscard]] bool has_content_versions() const noexcept {
        return content_versions.has_value() && !content_versions->empty();
    }

    /// Parse properties from a JSON object string
    [[nodiscard]] static nitro_core::Result<PackageProperties> from_json_string(const std::string& json_str);
};

} // namespace nitro_pkg
