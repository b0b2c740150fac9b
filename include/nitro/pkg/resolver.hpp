#pragma once

/// @file resolver.hpp
/// @brief Package dependency resolution
///
/// resolve() turns the user's configured packages into the complete set of
/// packages to install. It is a greedy, monotonic constraint accumulator:
/// - every evaluated package reports relations (dependencies, conflicts,
///   bundles, compatibility pairs, extensions, recommendations)
/// - requirements are only ever added, never retracted
/// - contradictions are reported as errors instead of being searched around
///
/// Packages are evaluated in waves. Before a wave, every queued package that
/// has not been fetched yet is preloaded in a single batch through the
/// evaluator.
///
/// Thread-safety: resolve() owns all of its state. The evaluator is called
/// from the calling thread only, one call at a time.

#include "fwd.hpp"
#include "error.hpp"
#include "evaluator.hpp"
#include "overrides.hpp"
#include "request.hpp"
#include <nitro/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nitro_pkg {

// =============================================================================
// DependencyKind
// =============================================================================

/// How strongly a package is required. Only ever raised during resolution.
enum class DependencyKind : std::uint8_t {
    Require = 0,     ///< Dependency of another package
    Bundled = 1,     ///< Bundled by another package
    UserRequire = 2  ///< Required by the user
};

/// Get dependency kind name
[[nodiscard]] const char* dependency_kind_name(DependencyKind kind) noexcept;

// =============================================================================
// Results
// =============================================================================

/// A package in the resolution result
struct ResolutionPackageResult {
    ArcPkgReq req;                                        ///< First request seen for this package
    DependencyKind kind = DependencyKind::Require;
    std::vector<std::string> required_content_versions;   ///< Allowed versions at the last evaluation
    std::vector<std::string> preferred_content_versions;  ///< Preferred versions at the last evaluation
};

/// A recommendation that the final package set does not satisfy
struct UnfulfilledRecommendation {
    ArcPkgReq req;
    bool invert = false;  ///< The recommended-against package is installed
};

/// Result of a successful resolution
struct ResolutionResult {
    std::vector<ResolutionPackageResult> packages;                   ///< In discovery order
    std::vector<UnfulfilledRecommendation> unfulfilled_recommendations;
};

/// resolve() outcome
using ResolutionOutcome = nitro_core::Result<ResolutionResult, ResolutionError>;

// =============================================================================
// Resolution
// =============================================================================

/// Resolve the full set of packages to install
///
/// @param configured_packages Packages the user configured directly
/// @param evaluator Supplies properties and relations of packages
/// @param constant_input Input cloned for every evaluated package
/// @param common_input Passed to every evaluator call
/// @param overrides Suppressed and force-installed packages
/// @return The resolved packages, or an error whose requests have already
///         been passed through evaluator.make_req_displayable
[[nodiscard]] ResolutionOutcome resolve(
    const std::vector<std::shared_ptr<const ConfiguredPackage>>& configured_packages,
    PackageEvaluator& evaluator,
    const EvalInput& constant_input,
    const CommonInput& common_input,
    const PackageOverrides& overrides);

} // namespace nitro_pkg
