/// @file error.cpp
/// @brief Error handling implementation for stockpile_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <stockpile/core/error.hpp>
#include <sstream>
#include <vector>

namespace stockpile_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format input error with file and line
std::string format_input_error(const InputError& err) {
    std::ostringstream oss;
    oss << "[InputError] " << err.message;

    if (!err.path.empty()) {
        oss << " (file: " << err.path;
        if (err.line > 0) {
            oss << ":" << err.line;
        }
        oss << ")";
    }

    return oss.str();
}

/// Format config error with offending key
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.key.empty() && err.message.find(err.key) == std::string::npos) {
        oss << " (key: " << err.key << ")";
    }
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
        } else if constexpr (std::is_same_v<T, InputError>) {
            oss << detail::format_input_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " [" << key << "=" << value << "]";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::int64_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace stockpile_core
