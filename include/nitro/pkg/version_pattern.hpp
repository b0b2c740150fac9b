#pragma once

/// @file version_pattern.hpp
/// @brief Content version patterns for package requests
///
/// Content versions are opaque strings published by a package in release
/// order (oldest first). Patterns select from that ordered list by identity
/// or by position; they never interpret the version text itself.

#include "fwd.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nitro_pkg {

// =============================================================================
// VersionPattern
// =============================================================================

/// A pattern that selects content versions
///
/// Text forms:
/// - "*" or "" -> any version
/// - "latest" -> newest version
/// - "~1.2" -> prefer 1.2 without constraining
/// - "1.0..2.0" -> inclusive range by position
/// - "1.2+" -> 1.2 and everything after it
/// - "1.2-" -> 1.2 and everything before it
/// - "1.2" -> exactly 1.2
struct VersionPattern {
    enum class Type : std::uint8_t {
        Any,     ///< Matches any version
        Single,  ///< Exactly one version
        Prefer,  ///< Matches any version, but records a preference
        Latest,  ///< The newest version (or a given one, treated as newest)
        Before,  ///< Up to and including a version
        After,   ///< From a version onwards, inclusive
        Range    ///< Inclusive range between two versions
    };

    Type type = Type::Any;
    std::string version;    ///< Primary version (empty for Any and bare Latest)
    std::string range_end;  ///< Upper bound, Range only

    /// Default constructor - matches any version
    VersionPattern() = default;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static VersionPattern any() { return VersionPattern{}; }

    [[nodiscard]] static VersionPattern single(std::string v) {
        return make(Type::Single, std::move(v));
    }

    [[nodiscard]] static VersionPattern prefer(std::string v) {
        return make(Type::Prefer, std::move(v));
    }

    [[nodiscard]] static VersionPattern latest(std::string v = {}) {
        return make(Type::Latest, std::move(v));
    }

    [[nodiscard]] static VersionPattern before(std::string v) {
        return make(Type::Before, std::move(v));
    }

    [[nodiscard]] static VersionPattern after(std::string v) {
        return make(Type::After, std::move(v));
    }

    [[nodiscard]] static VersionPattern range(std::string start, std::string end) {
        VersionPattern p = make(Type::Range, std::move(start));
        p.range_end = std::move(end);
        return p;
    }

    // =========================================================================
    // Parsing
    // =========================================================================

    /// Parse a pattern from its text form. Never fails: unknown text is
    /// treated as a single version.
    [[nodiscard]] static VersionPattern parse(std::string_view str);

    /// Convert back to the text form accepted by parse()
    [[nodiscard]] std::string to_string() const;

    // =========================================================================
    // Matching
    // =========================================================================

    /// Filter an ordered candidate list down to the versions this pattern allows
    [[nodiscard]] std::vector<std::string> matches(const std::vector<std::string>& candidates) const;

    /// Check whether a single version is allowed, given the ordered candidate list
    [[nodiscard]] bool matches_single(const std::string& version,
                                      const std::vector<std::string>& candidates) const;

    [[nodiscard]] bool is_any() const noexcept { return type == Type::Any; }
    [[nodiscard]] bool is_prefer() const noexcept { return type == Type::Prefer; }

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Structural equality and ordering (type first, then versions)
    [[nodiscard]] auto operator<=>(const VersionPattern&) const = default;

private:
    static VersionPattern make(Type t, std::string v) {
        VersionPattern p;
        p.type = t;
        p.version = std::move(v);
        return p;
    }
};

// =============================================================================
// Utility Functions
// =============================================================================

/// Split "name@version" at the last '@' into the name and its pattern
[[nodiscard]] std::pair<std::string, VersionPattern> parse_versioned_string(std::string_view str);

} // namespace nitro_pkg
