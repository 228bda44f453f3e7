//! # Tracepoint Model
//!
//! Value types describing what the generated instrumentation must contain:
//! headers to include, forward declarations, and tracepoint declarations
//! with their captured arguments.
//!
//! ## Capture Strategies
//!
//! A tracepoint payload is captured in one of two ways:
//!
//! | Strategy | Declared with   | Call-site parameters     | Record fields       |
//! |----------|-----------------|--------------------------|---------------------|
//! | Inline   | `args`          | one per argument         | one per argument    |
//! | Record   | `struct_args`   | `params` (may be empty)  | one per struct arg  |
//!
//! With record capture the call site passes a few handles (`params`) and the
//! record fields read from them (`fb->width`). Either way the emitted
//! `__trace_*` body only copies values; conversions such as a format
//! enumerant to its short name run when the record is printed.

#pragma once

#include "model/config_error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tpgen::model {

// ============================================================================
// Headers and Forward Declarations
// ============================================================================

/// Where a header is included.
enum class HeaderScope {
    Header, ///< Included by the generated header (visible to all consumers)
    Source  ///< Included by the generated source only
};

struct HeaderRef {
    std::string path;
    HeaderScope scope = HeaderScope::Header;
};

/// A type declared without its definition, e.g. `struct tu_device`.
struct ForwardDecl {
    std::string decl;
};

// ============================================================================
// Arguments
// ============================================================================

/// A call-site parameter read by record-captured arguments.
struct Param {
    std::string type; ///< C type, e.g. `const struct tu_framebuffer *`
    std::string var;  ///< Parameter name
};

/// A single value captured at trace time.
struct Arg {
    std::string type;     ///< C type of the stored value
    std::string var;      ///< Capture expression (a parameter name for inline capture)
    std::string c_format; ///< printf specifier for the printed value
    std::string name;     ///< Record field name; empty means `var`

    /// Conversion applied when printing, `{}` stands for the stored value,
    /// e.g. `vk_format_description({})->short_name`. Empty means none.
    std::string to_prim_type;

    /// Type produced by `to_prim_type`. Empty means `const char *`.
    std::string prim_type;

    [[nodiscard]] auto field_name() const -> const std::string& {
        return name.empty() ? var : name;
    }

    [[nodiscard]] auto has_conversion() const -> bool {
        return !to_prim_type.empty();
    }

    /// Type the format specifier has to describe.
    [[nodiscard]] auto printed_type() const -> std::string;

    /// Expression printing the value stored at `stored`, with the
    /// conversion applied if there is one.
    [[nodiscard]] auto print_expr(std::string_view stored) const -> std::string;
};

/// Custom print format, `fprintf`-style: a format string and one expression
/// per conversion. Expressions refer to the record as `__entry`.
struct PrintFormat {
    std::string format;
    std::vector<std::string> args;
};

// ============================================================================
// Tracepoint Declaration
// ============================================================================

/// How a tracepoint's payload is captured.
enum class CaptureMode { None, Inline, Record };

/// One emission point in the generated code.
struct TracepointDecl {
    std::string name;
    std::string toggle_name;   ///< Empty: gated only by u_trace being enabled
    std::vector<Param> params; ///< Only with `struct_args`
    std::vector<Arg> args;
    std::vector<Arg> struct_args;
    std::optional<PrintFormat> print;
    std::string perfetto_name; ///< Export callback symbol; empty for none
    bool end_of_pipe = false;

    [[nodiscard]] auto capture() const -> CaptureMode;

    /// Fields of the `struct trace_<name>` record, in declaration order.
    [[nodiscard]] auto record_fields() const -> const std::vector<Arg>&;

    /// Parameters of the generated `trace_<name>` call after `ut, cs`.
    [[nodiscard]] auto call_params() const -> std::vector<Param>;

    [[nodiscard]] auto has_payload() const -> bool {
        return !record_fields().empty();
    }
};

// ============================================================================
// Validation
// ============================================================================

/// Broad class of a C value, used to match types against format specifiers.
enum class ValueClass { Integer, Float, String, Pointer, Unknown };

/// Classifies a C type spelling. Unrecognized typedefs are `Unknown`.
auto classify_type(std::string_view c_type) -> ValueClass;

/// Classifies the value a printf specifier consumes, or nullopt if `c_format`
/// is not a specifier. `PRIu64`-style macros are accepted.
auto classify_format(std::string_view c_format) -> std::optional<ValueClass>;

/// Number of conversions in a printf format string (`%%` excluded).
auto count_conversions(std::string_view format) -> size_t;

/// Checks one argument in isolation. `inline_capture` requires `var` to be
/// usable as a parameter name.
auto validate_arg(const Arg& arg, bool inline_capture, const std::string& tracepoint)
    -> std::optional<ConfigError>;

/// Checks a complete declaration: identifiers, capture strategy, arguments
/// and print override.
auto validate_tracepoint(const TracepointDecl& decl) -> std::optional<ConfigError>;

} // namespace tpgen::model
