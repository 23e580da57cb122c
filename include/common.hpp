//! # Common Definitions
//!
//! This module provides common types and constants used throughout the BASIS
//! executable utilities. Every other component depends on it.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Banner Defaults**: Contact, copyright and license configured at build time
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: `Box<T>` alias for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership
//! - **Absence is not an error**: lookups that may miss return `std::optional`

#ifndef BASIS_COMMON_HPP
#define BASIS_COMMON_HPP

#include "basis_config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace basis {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.1.0").
constexpr const char* VERSION = BASIS_VERSION_STRING;

// ============================================================================
// Banner Defaults
// ============================================================================

/// Default contact used for help output of executables.
constexpr const char* DEFAULT_CONTACT = BASIS_DEFAULT_CONTACT_STRING;

/// Default copyright of executables, without the "Copyright (c) " prefix.
constexpr const char* DEFAULT_COPYRIGHT = BASIS_DEFAULT_COPYRIGHT_STRING;

/// Default license notice of executables.
constexpr const char* DEFAULT_LICENSE = BASIS_DEFAULT_LICENSE_STRING;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// Result<fs::path, WhichError> found = which("cmake");
/// if (is_ok(found)) {
///     run(unwrap(found));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace basis

#endif // BASIS_COMMON_HPP
