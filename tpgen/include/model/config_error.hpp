//! # Configuration Errors
//!
//! Error type reported when a tracepoint declaration or the generation
//! contract is rejected. Every configuration error aborts the generation run.
//!
//! ## Error Codes
//!
//! | Code | Meaning                                         |
//! |------|-------------------------------------------------|
//! | C001 | Tracepoint name already registered              |
//! | C002 | Name is not a valid C identifier                |
//! | C003 | Malformed argument                              |
//! | C004 | Format specifier does not match the value type  |
//! | C005 | Inline and record capture both requested        |
//! | C006 | Argument name repeated within a tracepoint      |
//! | C007 | Registration after the registry was sealed      |
//! | C008 | Invalid generation contract                     |
//! | C009 | Malformed print format override                 |

#pragma once

#include <string>
#include <utility>

namespace tpgen::model {

namespace ErrorCodes {
constexpr const char* DUPLICATE_TRACEPOINT = "C001";
constexpr const char* INVALID_IDENTIFIER = "C002";
constexpr const char* MALFORMED_ARG = "C003";
constexpr const char* FORMAT_MISMATCH = "C004";
constexpr const char* CONFLICTING_CAPTURE = "C005";
constexpr const char* DUPLICATE_ARG = "C006";
constexpr const char* REGISTRY_SEALED = "C007";
constexpr const char* INVALID_CONTRACT = "C008";
constexpr const char* MALFORMED_PRINT = "C009";
} // namespace ErrorCodes

/// A rejected declaration.
///
/// `tracepoint` names the declaration being registered when the error was
/// found; it is empty for contract errors that are not tied to one entry.
struct ConfigError {
    std::string code;
    std::string message;
    std::string tracepoint;

    static auto make(const char* code, std::string msg, std::string tracepoint = {})
        -> ConfigError {
        return ConfigError{code, std::move(msg), std::move(tracepoint)};
    }

    /// Formats as `error[C001]: <tracepoint>: message`.
    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = "error[" + code + "]: ";
        if (!tracepoint.empty()) {
            out += tracepoint + ": ";
        }
        return out + message;
    }
};

} // namespace tpgen::model
