#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for stockpile_core module

#include <cstdint>

namespace stockpile_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct InputError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace stockpile_core
