#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for nitro_pkg module

#include <cstdint>
#include <memory>
#include <string>

namespace nitro_pkg {

// =============================================================================
// Version Types
// =============================================================================

struct VersionPattern;

// =============================================================================
// Request Types
// =============================================================================

class RequestSource;
struct PackageRequest;

/// Shared, immutable package request
using ArcPkgReq = std::shared_ptr<const PackageRequest>;

// =============================================================================
// Package Data
// =============================================================================

struct PackageProperties;
struct RequiredPackage;
struct RecommendedPackage;
struct RelationsResult;

/// Stability setting for a package's content
enum class PackageStability : std::uint8_t {
    Stable,  ///< Whatever the latest stable version is
    Latest   ///< Whatever the latest version is
};

/// Permission level granted to a package's evaluation
enum class EvalPermissions : std::uint8_t {
    Restricted,
    Standard,
    Elevated
};

/// Side of the game a package is installed on
enum class Side : std::uint8_t {
    Client,
    Server
};

// =============================================================================
// Evaluation Boundary
// =============================================================================

class EvalInput;
class ConfiguredPackage;
class PackageEvaluator;
class CommonInput;

// =============================================================================
// Configuration
// =============================================================================

struct PackageOverrides;
struct PackageConfig;
struct EvalConstants;
struct EvalParameters;
class LauncherEvalInput;

// =============================================================================
// Resolution
// =============================================================================

enum class DependencyKind : std::uint8_t;
class ResolutionError;
struct ResolutionPackageResult;
struct ResolutionResult;

// =============================================================================
// Utility Functions
// =============================================================================

[[nodiscard]] const char* package_stability_to_string(PackageStability stability) noexcept;
[[nodiscard]] bool package_stability_from_string(const std::string& str, PackageStability& out) noexcept;

[[nodiscard]] const char* eval_permissions_to_string(EvalPermissions perms) noexcept;
[[nodiscard]] bool eval_permissions_from_string(const std::string& str, EvalPermissions& out) noexcept;

[[nodiscard]] const char* side_to_string(Side side) noexcept;

} // namespace nitro_pkg
