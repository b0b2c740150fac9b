/// @file version_pattern.cpp
/// @brief Content version pattern implementation

#include <nitro/pkg/version_pattern.hpp>

#include <algorithm>
#include <cctype>

namespace nitro_pkg {

namespace {

std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

/// Position of a version within the candidate list
std::vector<std::string>::const_iterator find_version(const std::vector<std::string>& candidates,
                                                      const std::string& version) {
    return std::find(candidates.begin(), candidates.end(), version);
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

VersionPattern VersionPattern::parse(std::string_view str) {
    str = trim(str);

    if (str.empty() || str == "*") {
        return any();
    }
    if (str == "latest") {
        return latest();
    }
    if (str.size() > 1 && str.front() == '~') {
        return prefer(std::string(str.substr(1)));
    }

    auto range_pos = str.find("..");
    if (range_pos != std::string_view::npos && range_pos > 0 && range_pos + 2 < str.size()) {
        return range(std::string(str.substr(0, range_pos)), std::string(str.substr(range_pos + 2)));
    }

    if (str.size() > 1 && str.back() == '+') {
        return after(std::string(str.substr(0, str.size() - 1)));
    }
    if (str.size() > 1 && str.back() == '-') {
        return before(std::string(str.substr(0, str.size() - 1)));
    }

    return single(std::string(str));
}

std::string VersionPattern::to_string() const {
    switch (type) {
        case Type::Any:    return "*";
        case Type::Single: return version;
        case Type::Prefer: return "~" + version;
        case Type::Latest: return version.empty() ? "latest" : version;
        case Type::Before: return version + "-";
        case Type::After:  return version + "+";
        case Type::Range:  return version + ".." + range_end;
        default:           return "*";
    }
}

// =============================================================================
// Matching
// =============================================================================

std::vector<std::string> VersionPattern::matches(const std::vector<std::string>& candidates) const {
    switch (type) {
        case Type::Any:
        case Type::Prefer:
            return candidates;

        case Type::Single:
            if (find_version(candidates, version) != candidates.end()) {
                return {version};
            }
            return {};

        case Type::Latest: {
            if (candidates.empty()) {
                return {};
            }
            if (version.empty()) {
                return {candidates.back()};
            }
            if (find_version(candidates, version) != candidates.end()) {
                return {version};
            }
            return {};
        }

        case Type::Before: {
            auto it = find_version(candidates, version);
            if (it == candidates.end()) {
                return {};
            }
            return std::vector<std::string>(candidates.begin(), it + 1);
        }

        case Type::After: {
            auto it = find_version(candidates, version);
            if (it == candidates.end()) {
                return {};
            }
            return std::vector<std::string>(it, candidates.end());
        }

        case Type::Range: {
            auto start = find_version(candidates, version);
            auto end = find_version(candidates, range_end);
            if (start == candidates.end() || end == candidates.end() || end < start) {
                return {};
            }
            return std::vector<std::string>(start, end + 1);
        }
    }

    return {};
}

bool VersionPattern::matches_single(const std::string& v,
                                    const std::vector<std::string>& candidates) const {
    auto allowed = matches(candidates);
    return std::find(allowed.begin(), allowed.end(), v) != allowed.end();
}

// =============================================================================
// Utility Functions
// =============================================================================

std::pair<std::string, VersionPattern> parse_versioned_string(std::string_view str) {
    auto at_pos = str.rfind('@');
    if (at_pos == std::string_view::npos) {
        return {std::string(str), VersionPattern::any()};
    }
    return {std::string(str.substr(0, at_pos)), VersionPattern::parse(str.substr(at_pos + 1))};
}

} // namespace nitro_pkg
