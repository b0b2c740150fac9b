#pragma once

/// @file request.hpp
/// @brief Package requests and their provenance
///
/// A PackageRequest names a package along with where the request came from.
/// Requests are immutable and shared (ArcPkgReq); a request that was
/// produced by evaluating another package holds a pointer to that package's
/// request, so the provenance of every request forms a tree rooted at the
/// user's configuration.
///
/// IMPORTANT: requests compare equal and hash identically when their IDs
/// match, regardless of source, repository or content version. The resolver
/// keys its state on package identity alone; ordering (operator<=>) on the
/// other hand looks at every field and only exists for deterministic sorting.

#include "fwd.hpp"
#include "version_pattern.hpp"
#include <nitro/core/error.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace nitro_pkg {

// =============================================================================
// RequestSource
// =============================================================================

/// Where a package request came from
class RequestSource {
public:
    enum class Kind : std::uint8_t {
        UserRequire = 0,  ///< Required by the user
        Bundled = 1,      ///< Bundled by another package
        Dependency = 2,   ///< Depended on by another package
        Refused = 3,      ///< Refused by another package
        Repository = 4    ///< Requested by some automatic system
    };

    /// Defaults to a user requirement
    RequestSource() = default;

    [[nodiscard]] static RequestSource user_require() { return RequestSource{Kind::UserRequire, nullptr}; }
    [[nodiscard]] static RequestSource repository() { return RequestSource{Kind::Repository, nullptr}; }
    [[nodiscard]] static RequestSource bundled(ArcPkgReq parent) {
        return RequestSource{Kind::Bundled, std::move(parent)};
    }
    [[nodiscard]] static RequestSource dependency(ArcPkgReq parent) {
        return RequestSource{Kind::Dependency, std::move(parent)};
    }
    [[nodiscard]] static RequestSource refused(ArcPkgReq parent) {
        return RequestSource{Kind::Refused, std::move(parent)};
    }

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }

    /// The request that produced this one, for any non-root source
    [[nodiscard]] const ArcPkgReq& get_parent() const noexcept { return m_parent; }

    /// The package that depended on or bundled this one, if any
    [[nodiscard]] ArcPkgReq get_source() const;

    /// Whether this source is a user requirement, or a chain of bundles
    /// that leads up to one
    [[nodiscard]] bool is_user_bundled() const;

    /// Sort key; sources only compare by their kind
    [[nodiscard]] std::strong_ordering operator<=>(const RequestSource& other) const noexcept {
        return static_cast<std::uint8_t>(m_kind) <=> static_cast<std::uint8_t>(other.m_kind);
    }

    [[nodiscard]] bool operator==(const RequestSource& other) const noexcept {
        return m_kind == other.m_kind;
    }

private:
    RequestSource(Kind kind, ArcPkgReq parent) : m_kind(kind), m_parent(std::move(parent)) {}

    Kind m_kind = Kind::UserRequire;
    ArcPkgReq m_parent;
};

/// Get source kind name
[[nodiscard]] const char* request_source_name(RequestSource::Kind kind) noexcept;

// =============================================================================
// PackageRequest
// =============================================================================

/// A request for a package that will be fulfilled later
struct PackageRequest {
    RequestSource source;                   ///< Provenance of this request
    std::string id;                         ///< Package ID
    std::optional<std::string> repository;  ///< Pinned repository, if any
    VersionPattern content_version;         ///< Content version this request asks for

    PackageRequest(std::string pkg_id,
                   RequestSource src,
                   VersionPattern version = VersionPattern::any(),
                   std::optional<std::string> repo = std::nullopt)
        : source(std::move(src))
        , id(std::move(pkg_id))
        , repository(std::move(repo))
        , content_version(std::move(version)) {}

    // =========================================================================
    // Construction
    // =========================================================================

    /// Parse "repository:id@version"; both the repository and the version
    /// are optional and an empty repository means none
    [[nodiscard]] static PackageRequest parse(std::string_view str, RequestSource source);

    /// parse() into a shared request
    [[nodiscard]] static ArcPkgReq parse_shared(std::string_view str, RequestSource source);

    /// Copy of this request with a different content version
    [[nodiscard]] ArcPkgReq with_content_version(VersionPattern version) const;

    // =========================================================================
    // Display
    // =========================================================================

    /// Render the provenance chain, e.g. "Repository -> baz -> bar -> foo"
    [[nodiscard]] std::string debug_sources() const;

    /// The package ID
    [[nodiscard]] const std::string& to_string() const noexcept { return id; }

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Identity: IDs only
    [[nodiscard]] bool operator==(const PackageRequest& other) const noexcept {
        return id == other.id;
    }

    /// Deterministic ordering: source kind, ID, repository, content version
    [[nodiscard]] std::strong_ordering operator<=>(const PackageRequest& other) const;
};

/// Hash on package ID, consistent with operator==
struct PackageRequestHash {
    [[nodiscard]] std::size_t operator()(const PackageRequest& req) const noexcept {
        return std::hash<std::string>{}(req.id);
    }
};

/// Ordering for shared requests
[[nodiscard]] bool request_less(const ArcPkgReq& a, const ArcPkgReq& b);

// =============================================================================
// Package IDs
// =============================================================================

/// The maximum length for a package identifier
inline constexpr std::size_t MAX_PACKAGE_ID_LENGTH = 32;

/// Check if a package identifier is valid: lowercase ASCII letters, digits
/// and '-', non-empty and at most MAX_PACKAGE_ID_LENGTH characters
[[nodiscard]] bool is_valid_package_id(std::string_view id) noexcept;

/// Validate a package identifier
[[nodiscard]] nitro_core::Result<void> validate_package_id(std::string_view id);

} // namespace nitro_pkg
