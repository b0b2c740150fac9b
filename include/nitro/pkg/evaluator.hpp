#pragma once

/// @file evaluator.hpp
/// @brief Interfaces between the resolver and whatever evaluates packages
///
/// The resolver never reads package content itself. Instead the caller
/// supplies:
/// - a PackageEvaluator, which knows how to fetch and evaluate packages
///   (script, declarative or plugin-provided)
/// - a CommonInput, handed unchanged to every evaluator call
/// - a constant EvalInput, cloned once per evaluated package
/// - the list of ConfiguredPackages the user asked for
///
/// Every evaluator call is blocking; the resolver never has two calls in
/// flight. An evaluator may parallelize internally (preload_packages in
/// particular is meant to fan out).

#include "fwd.hpp"
#include "properties.hpp"
#include "request.hpp"
#include <nitro/core/error.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nitro_pkg {

// =============================================================================
// Relations
// =============================================================================

/// A dependency declared by a package
struct RequiredPackage {
    std::string value;      ///< Request text ("repo:id@version")
    bool explicit_ = false; ///< Must also be required by the user directly

    [[nodiscard]] auto operator<=>(const RequiredPackage&) const = default;
};

/// A recommendation (or, inverted, a recommendation against) a package
struct RecommendedPackage {
    std::string value;   ///< Request text
    bool invert = false; ///< Recommend against instead of for

    [[nodiscard]] auto operator<=>(const RecommendedPackage&) const = default;
};

/// The relations a package reports when evaluated
struct RelationsResult {
    std::vector<std::string> conflicts;
    std::vector<std::vector<RequiredPackage>> deps;  ///< Groups are flattened; no OR semantics
    std::vector<std::string> bundled;
    std::vector<std::pair<std::string, std::string>> compats;  ///< (if installed, also install)
    std::vector<std::string> extensions;
    std::vector<RecommendedPackage> recommendations;
};

// =============================================================================
// EvalInput
// =============================================================================

/// Per-package evaluation input
class EvalInput {
public:
    virtual ~EvalInput() = default;

    /// Fresh copy, one per evaluated package
    [[nodiscard]] virtual std::unique_ptr<EvalInput> clone() const = 0;

    /// Set the content versions the package may and should pick from
    virtual void set_content_versions(std::vector<std::string> required,
                                      std::vector<std::string> preferred) = 0;

    /// Set whether the package is force-installed
    virtual void set_force(bool force) = 0;
};

/// Input shared by every evaluator call of one resolution, such as the
/// launcher paths and plugin host. Opaque to the resolver.
class CommonInput {
public:
    virtual ~CommonInput() = default;
};

// =============================================================================
// ConfiguredPackage
// =============================================================================

/// A package the user configured directly
class ConfiguredPackage {
public:
    virtual ~ConfiguredPackage() = default;

    /// The user's request for this package
    [[nodiscard]] virtual ArcPkgReq get_package() const = 0;

    /// Whether evaluation failures of this package are non-fatal
    [[nodiscard]] virtual bool is_optional() const = 0;

    /// Apply this configuration to the package's evaluation input
    [[nodiscard]] virtual nitro_core::Result<void> override_configured_package_input(
        const PackageProperties& properties, EvalInput& input) const = 0;
};

// =============================================================================
// PackageEvaluator
// =============================================================================

/// Supplies package properties and relations to the resolver
class PackageEvaluator {
public:
    virtual ~PackageEvaluator() = default;

    /// Batch warm-up for a set of packages. Failure aborts resolution.
    [[nodiscard]] virtual nitro_core::Result<void> preload_packages(
        const std::vector<ArcPkgReq>& packages, const CommonInput& common_input) = 0;

    /// Properties of a package. The pointer stays valid for the lifetime of
    /// the evaluator.
    [[nodiscard]] virtual nitro_core::Result<const PackageProperties*> get_package_properties(
        const ArcPkgReq& package, const CommonInput& common_input) = 0;

    /// Evaluate the relations of a package with the given input
    [[nodiscard]] virtual nitro_core::Result<RelationsResult> eval_package_relations(
        const ArcPkgReq& package, const EvalInput& input, const CommonInput& common_input) = 0;

    /// Rewrite a request into a user-facing form (e.g. resolve version
    /// aliases). Also used to canonicalize content version patterns.
    [[nodiscard]] virtual ArcPkgReq make_req_displayable(const ArcPkgReq& package,
                                                         const CommonInput& common_input) = 0;
};

} // namespace nitro_pkg
