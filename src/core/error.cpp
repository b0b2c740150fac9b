/// @file error.cpp
/// @brief Error handling implementation for nitro_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <nitro/core/error.hpp>
#include <sstream>
#include <vector>

namespace nitro_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* config_error_kind_name(ConfigError::Kind kind) {
    switch (kind) {
        case ConfigError::Kind::MissingField: return "MissingField";
        case ConfigError::Kind::InvalidField: return "InvalidField";
        case ConfigError::Kind::UnknownFeature: return "UnknownFeature";
        case ConfigError::Kind::InvalidPackageId: return "InvalidPackageId";
        default: return "Unknown";
    }
}

const char* package_error_kind_name(PackageError::Kind kind) {
    switch (kind) {
        case PackageError::Kind::NotFound: return "NotFound";
        case PackageError::Kind::PreloadFailed: return "PreloadFailed";
        case PackageError::Kind::PropertiesUnavailable: return "PropertiesUnavailable";
        case PackageError::Kind::EvalFailed: return "EvalFailed";
        default: return "Unknown";
    }
}

/// Format configuration error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError:" << config_error_kind_name(err.kind) << "] " << err.message;

    if (!err.package_id.empty()) {
        oss << " (package: " << err.package_id << ")";
    }

    return oss.str();
}

/// Format package error with full context
std::string format_package_error(const PackageError& err) {
    std::ostringstream oss;
    oss << "[PackageError:" << package_error_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        } else if constexpr (std::is_same_v<T, PackageError>) {
            oss << detail::format_package_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " (" << key << ": " << value << ")";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace nitro_core
