#pragma once

/// @file config.hpp
/// @brief User configuration for packages
///
/// Packages are configured per instance or profile as a JSON array whose
/// entries are either a bare request string or an object:
/// ```json
/// [
///   "sodium",
///   "modrinth:iris@1.6+",
///   {
///     "id": "create",
///     "features": ["extras"],
///     "use_default_features": false,
///     "permissions": "restricted",
///     "stability": "latest",
///     "worlds": ["survival"],
///     "content_version": "0.5.1",
///     "optional": true
///   }
/// ]
/// ```

#include "fwd.hpp"
#include "evaluator.hpp"
#include <nitro/core/error.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nitro_pkg {

/// Stored configuration for a package
struct PackageConfig : public ConfiguredPackage {
    std::string id;                                     ///< Request text without content version
    std::vector<std::string> features;                  ///< Enabled features
    bool use_default_features = true;                   ///< Also enable the package's default features
    EvalPermissions permissions = EvalPermissions::Standard;
    PackageStability stability = PackageStability::Stable;
    std::vector<std::string> worlds;                    ///< Worlds to put addons in
    std::optional<std::string> content_version;         ///< Desired content version pattern
    bool optional = false;                              ///< Failures are non-fatal

    /// Default configuration for a package ID
    [[nodiscard]] static PackageConfig from_id(std::string id);

    /// Configured features plus, if enabled, the package's default features.
    /// Fails if a configured feature is not offered by the package.
    [[nodiscard]] nitro_core::Result<std::vector<std::string>> calculate_features(
        const PackageProperties& properties) const;

    // =========================================================================
    // ConfiguredPackage
    // =========================================================================

    [[nodiscard]] ArcPkgReq get_package() const override;

    [[nodiscard]] bool is_optional() const override { return optional; }

    /// Requires a LauncherEvalInput
    [[nodiscard]] nitro_core::Result<void> override_configured_package_input(
        const PackageProperties& properties, EvalInput& input) const override;
};

/// Parse a list of package configs from a JSON array string. Packages without
/// an explicit stability inherit the profile's.
[[nodiscard]] nitro_core::Result<std::vector<PackageConfig>> read_package_configs(
    const std::string& json_str, PackageStability profile_stability);

} // namespace nitro_pkg
