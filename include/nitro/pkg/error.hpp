#pragma once

/// @file error.hpp
/// @brief Errors produced by package resolution

#include "fwd.hpp"
#include "request.hpp"
#include "version_pattern.hpp"
#include <nitro/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nitro_pkg {

// =============================================================================
// ResolutionError
// =============================================================================

/// Error from package resolution
///
/// Every kind keeps the requests it refers to, so that the whole error can
/// be rewritten into user-facing form with make_displayable() before it is
/// reported.
class ResolutionError {
public:
    enum class Kind : std::uint8_t {
        FailedToPreload,              ///< Evaluator batch warm-up failed
        FailedToGetProperties,        ///< Properties lookup failed for package()
        FailedToEvaluate,             ///< Relation evaluation failed for package()
        NoValidVersionsFound,         ///< package() is overconstrained by constraints()
        IncompatiblePackage,          ///< package() is refused by refusers()
        ExtensionNotFulfilled,        ///< package() was extended by source() but never required
        ExplicitRequireNotFulfilled,  ///< source() explicitly requires package()
        PackageContext,               ///< inner() happened while resolving package()
        Misc                          ///< Configuration or other caller-side failure
    };

    /// Defaults to a Misc error with an unknown cause
    ResolutionError() = default;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static ResolutionError failed_to_preload(nitro_core::Error cause);
    [[nodiscard]] static ResolutionError failed_to_get_properties(ArcPkgReq package, nitro_core::Error cause);
    [[nodiscard]] static ResolutionError failed_to_evaluate(ArcPkgReq package, nitro_core::Error cause);
    [[nodiscard]] static ResolutionError no_valid_versions_found(ArcPkgReq package,
                                                                 std::vector<VersionPattern> constraints);
    [[nodiscard]] static ResolutionError incompatible_package(ArcPkgReq package,
                                                              std::vector<ArcPkgReq> refusers);
    [[nodiscard]] static ResolutionError extension_not_fulfilled(ArcPkgReq source, ArcPkgReq package);
    [[nodiscard]] static ResolutionError explicit_require_not_fulfilled(ArcPkgReq package, ArcPkgReq source);
    [[nodiscard]] static ResolutionError package_context(ArcPkgReq package, ResolutionError inner);
    [[nodiscard]] static ResolutionError misc(nitro_core::Error cause);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

    /// The package the error is about (null for FailedToPreload and Misc)
    [[nodiscard]] const ArcPkgReq& package() const noexcept { return m_package; }

    /// The package that caused the error, if any
    [[nodiscard]] const ArcPkgReq& source() const noexcept { return m_source; }

    /// Every package that refused package() (IncompatiblePackage)
    [[nodiscard]] const std::vector<ArcPkgReq>& refusers() const noexcept { return m_refusers; }

    /// Canonical constraints that failed to intersect (NoValidVersionsFound)
    [[nodiscard]] const std::vector<VersionPattern>& constraints() const noexcept { return m_constraints; }

    /// Underlying cause reported by the evaluator or configuration
    [[nodiscard]] const nitro_core::Error& cause() const noexcept { return m_cause; }

    /// Wrapped error (PackageContext), or null
    [[nodiscard]] const ResolutionError* inner() const noexcept { return m_inner.get(); }

    /// Innermost error, following PackageContext wrappers
    [[nodiscard]] const ResolutionError& root() const noexcept;

    // =========================================================================
    // Display
    // =========================================================================

    /// User-facing message, including the provenance chains of the requests
    [[nodiscard]] std::string message() const;

    /// Copy of this error with every embedded request passed through the
    /// evaluator's make_req_displayable
    [[nodiscard]] ResolutionError make_displayable(PackageEvaluator& evaluator,
                                                   const CommonInput& common_input) const;

private:
    explicit ResolutionError(Kind kind) : m_kind(kind) {}

    Kind m_kind = Kind::Misc;
    ArcPkgReq m_package;
    ArcPkgReq m_source;
    std::vector<ArcPkgReq> m_refusers;
    std::vector<VersionPattern> m_constraints;
    nitro_core::Error m_cause;
    std::shared_ptr<const ResolutionError> m_inner;
};

/// Get resolution error kind name
[[nodiscard]] const char* resolution_error_kind_name(ResolutionError::Kind kind) noexcept;

} // namespace nitro_pkg
