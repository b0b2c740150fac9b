/// @file request.cpp
/// @brief Package request implementation

#include <nitro/pkg/request.hpp>

#include <cctype>

namespace nitro_pkg {

// =============================================================================
// RequestSource Implementation
// =============================================================================

ArcPkgReq RequestSource::get_source() const {
    switch (m_kind) {
        case Kind::Dependency:
        case Kind::Bundled:
            return m_parent;
        case Kind::UserRequire:
        case Kind::Refused:
        case Kind::Repository:
            return nullptr;
    }
    return nullptr;
}

bool RequestSource::is_user_bundled() const {
    switch (m_kind) {
        case Kind::UserRequire:
            return true;
        case Kind::Bundled:
            return m_parent && m_parent->source.is_user_bundled();
        case Kind::Dependency:
        case Kind::Refused:
        case Kind::Repository:
            return false;
    }
    return false;
}

const char* request_source_name(RequestSource::Kind kind) noexcept {
    switch (kind) {
        case RequestSource::Kind::UserRequire: return "UserRequire";
        case RequestSource::Kind::Bundled:     return "Bundled";
        case RequestSource::Kind::Dependency:  return "Dependency";
        case RequestSource::Kind::Refused:     return "Refused";
        case RequestSource::Kind::Repository:  return "Repository";
        default:                               return "Unknown";
    }
}

// =============================================================================
// PackageRequest Implementation
// =============================================================================

PackageRequest PackageRequest::parse(std::string_view str, RequestSource source) {
    auto [id_and_repo, version] = parse_versioned_string(str);

    std::string id = id_and_repo;
    std::optional<std::string> repository;
    auto colon_pos = id_and_repo.find(':');
    if (colon_pos != std::string::npos) {
        id = id_and_repo.substr(colon_pos + 1);
        std::string repo = id_and_repo.substr(0, colon_pos);
        if (!repo.empty()) {
            repository = std::move(repo);
        }
    }

    return PackageRequest(std::move(id), std::move(source), std::move(version), std::move(repository));
}

ArcPkgReq PackageRequest::parse_shared(std::string_view str, RequestSource source) {
    return std::make_shared<const PackageRequest>(parse(str, std::move(source)));
}

ArcPkgReq PackageRequest::with_content_version(VersionPattern version) const {
    return std::make_shared<const PackageRequest>(id, source, std::move(version), repository);
}

std::string PackageRequest::debug_sources() const {
    const auto& parent = source.get_parent();
    switch (source.kind()) {
        case RequestSource::Kind::UserRequire:
            return id;
        case RequestSource::Kind::Dependency:
            return (parent ? parent->debug_sources() : std::string("?")) + " -> " + id;
        case RequestSource::Kind::Refused:
            return (parent ? parent->debug_sources() : std::string("?")) + " =X=> " + id;
        case RequestSource::Kind::Bundled:
            return (parent ? parent->debug_sources() : std::string("?")) + " => " + id;
        case RequestSource::Kind::Repository:
            return "Repository -> " + id;
    }
    return id;
}

std::strong_ordering PackageRequest::operator<=>(const PackageRequest& other) const {
    if (auto cmp = source <=> other.source; cmp != 0) return cmp;
    if (auto cmp = id <=> other.id; cmp != 0) return cmp;
    if (auto cmp = repository <=> other.repository; cmp != 0) return cmp;
    return content_version <=> other.content_version;
}

bool request_less(const ArcPkgReq& a, const ArcPkgReq& b) {
    return (*a <=> *b) < 0;
}

// =============================================================================
// Package IDs
// =============================================================================

bool is_valid_package_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > MAX_PACKAGE_ID_LENGTH) {
        return false;
    }

    for (char c : id) {
        auto uc = static_cast<unsigned char>(c);
        if (std::islower(uc) || std::isdigit(uc) || c == '-') {
            continue;
        }
        return false;
    }

    return true;
}

nitro_core::Result<void> validate_package_id(std::string_view id) {
    if (!is_valid_package_id(id)) {
        return nitro_core::Err(nitro_core::ConfigError::invalid_package_id(std::string(id)));
    }
    return nitro_core::Ok();
}

} // namespace nitro_pkg
