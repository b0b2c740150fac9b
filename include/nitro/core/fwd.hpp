#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for nitro_core module

#include <cstdint>

namespace nitro_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
struct PackageError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

class LogScope;

} // namespace nitro_core
