//! # Common Definitions
//!
//! Types and constants shared by every tpgen component.
//!
//! ## Overview
//!
//! - **Version Information**: generator version constants
//! - **Result Type**: error handling without exceptions
//! - **Identifier Helpers**: C identifier checks used by the model and codegen
//!
//! ## Design Philosophy
//!
//! Every fallible operation on the generation path returns `Result<T, E>`.
//! Nothing in the model or the generation engine throws.

#ifndef TPGEN_COMMON_HPP
#define TPGEN_COMMON_HPP

#include <cctype>
#include <string>
#include <string_view>
#include <variant>

namespace tpgen {

// ============================================================================
// Version Information
// ============================================================================

/// The generator version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = registry.register_tracepoint(std::move(decl));
/// if (is_err(result)) {
///     std::cerr << unwrap_err(result).to_string() << "\n";
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
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Identifier Helpers
// ============================================================================

/// Returns true if `s` is a valid C identifier (`[A-Za-z_][A-Za-z0-9_]*`).
///
/// Generated symbol names are derived directly from tracepoint, toggle and
/// argument names, so every such name must pass this check.
[[nodiscard]] inline auto is_c_identifier(std::string_view s) -> bool {
    if (s.empty())
        return false;
    auto first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first) && first != '_')
        return false;
    for (char c : s.substr(1)) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_')
            return false;
    }
    return true;
}

/// Returns an ASCII upper-cased copy of `s`.
[[nodiscard]] inline auto to_upper(std::string_view s) -> std::string {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

/// Returns an ASCII lower-cased copy of `s`.
[[nodiscard]] inline auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace tpgen

#endif // TPGEN_COMMON_HPP
