//! # Tracepoint Model Implementation
//!
//! Capture helpers and declaration validation.

#include "model/tracepoint.hpp"

#include "common.hpp"

#include <cctype>
#include <sstream>
#include <unordered_set>

namespace tpgen::model {

namespace {

constexpr std::string_view DEFAULT_PRIM_TYPE = "const char *";

/// Splits a type spelling into words and pointer stars, dropping qualifiers.
/// `const struct tu_framebuffer *` -> {"struct", "tu_framebuffer"}, 1 star.
struct TypeWords {
    std::vector<std::string> words;
    int stars = 0;
};

TypeWords split_type(std::string_view c_type) {
    TypeWords out;
    std::string word;
    auto flush = [&]() {
        if (!word.empty() && word != "const" && word != "volatile" && word != "restrict") {
            out.words.push_back(word);
        }
        word.clear();
    };
    for (char c : c_type) {
        if (c == '*') {
            flush();
            ++out.stars;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            word += c;
        }
    }
    flush();
    return out;
}

bool is_integer_spelling(const std::vector<std::string>& words) {
    static const std::unordered_set<std::string> fixed = {
        "bool",     "_Bool",   "int8_t",    "int16_t",   "int32_t",  "int64_t",
        "uint8_t",  "uint16_t", "uint32_t", "uint64_t",  "size_t",   "ssize_t",
        "intptr_t", "uintptr_t", "ptrdiff_t", "off_t",   "unsigned", "signed"};
    static const std::unordered_set<std::string> builtin = {"char",     "short", "int",
                                                            "long",     "signed", "unsigned"};

    if (words.size() == 1 && fixed.count(words[0]))
        return true;
    for (const auto& w : words) {
        if (!builtin.count(w))
            return false;
    }
    return !words.empty();
}

bool is_one_of(char c, std::string_view set) {
    return set.find(c) != std::string_view::npos;
}

ConfigError arg_error(const char* code, const Arg& arg, const std::string& tracepoint,
                      const std::string& what) {
    std::string label = arg.field_name().empty() ? "<unnamed>" : arg.field_name();
    return ConfigError::make(code, "argument '" + label + "': " + what, tracepoint);
}

} // namespace

// ============================================================================
// Arg / TracepointDecl helpers
// ============================================================================

auto Arg::printed_type() const -> std::string {
    if (!has_conversion())
        return type;
    return prim_type.empty() ? std::string(DEFAULT_PRIM_TYPE) : prim_type;
}

auto Arg::print_expr(std::string_view stored) const -> std::string {
    if (!has_conversion())
        return std::string(stored);

    std::string out;
    size_t pos = 0;
    while (pos < to_prim_type.size()) {
        size_t hole = to_prim_type.find("{}", pos);
        if (hole == std::string::npos) {
            out.append(to_prim_type, pos, std::string::npos);
            break;
        }
        out.append(to_prim_type, pos, hole - pos);
        out += stored;
        pos = hole + 2;
    }
    return out;
}

auto TracepointDecl::capture() const -> CaptureMode {
    if (!struct_args.empty())
        return CaptureMode::Record;
    if (!args.empty())
        return CaptureMode::Inline;
    return CaptureMode::None;
}

auto TracepointDecl::record_fields() const -> const std::vector<Arg>& {
    return struct_args.empty() ? args : struct_args;
}

auto TracepointDecl::call_params() const -> std::vector<Param> {
    if (capture() == CaptureMode::Record)
        return params;

    std::vector<Param> out;
    out.reserve(args.size());
    for (const auto& arg : args) {
        out.push_back(Param{arg.type, arg.var});
    }
    return out;
}

// ============================================================================
// Type / Format Classification
// ============================================================================

auto classify_type(std::string_view c_type) -> ValueClass {
    auto tw = split_type(c_type);
    if (tw.words.empty())
        return ValueClass::Unknown;

    if (tw.stars > 0) {
        bool char_base = tw.words.back() == "char";
        return (char_base && tw.stars == 1) ? ValueClass::String : ValueClass::Pointer;
    }

    if (tw.words[0] == "enum")
        return ValueClass::Integer;
    if (tw.words.back() == "float" || tw.words.back() == "double")
        return ValueClass::Float;
    if (is_integer_spelling(tw.words))
        return ValueClass::Integer;
    return ValueClass::Unknown;
}

auto classify_format(std::string_view c_format) -> std::optional<ValueClass> {
    if (c_format.size() < 2 || c_format[0] != '%')
        return std::nullopt;

    // `%" PRIu64 "` as written inside a C string literal
    size_t pri = c_format.find("PRI");
    if (pri != std::string_view::npos) {
        if (pri + 3 < c_format.size() && is_one_of(c_format[pri + 3], "diuxXo")) {
            return ValueClass::Integer;
        }
        return std::nullopt;
    }

    size_t i = 1;
    while (i < c_format.size() && is_one_of(c_format[i], "-+ #0"))
        ++i;
    while (i < c_format.size() &&
           (std::isdigit(static_cast<unsigned char>(c_format[i])) || c_format[i] == '.' ||
            c_format[i] == '*'))
        ++i;
    while (i < c_format.size() && is_one_of(c_format[i], "hljztLq"))
        ++i;
    if (i >= c_format.size())
        return std::nullopt;

    switch (c_format[i]) {
    case 'd':
    case 'i':
    case 'u':
    case 'x':
    case 'X':
    case 'o':
    case 'c':
        return ValueClass::Integer;
    case 'f':
    case 'F':
    case 'e':
    case 'E':
    case 'g':
    case 'G':
    case 'a':
    case 'A':
        return ValueClass::Float;
    case 's':
        return ValueClass::String;
    case 'p':
        return ValueClass::Pointer;
    default:
        return std::nullopt;
    }
}

auto count_conversions(std::string_view format) -> size_t {
    size_t count = 0;
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '%')
            continue;
        if (i + 1 < format.size() && format[i + 1] == '%') {
            ++i;
            continue;
        }
        ++count;
    }
    return count;
}

// ============================================================================
// Validation
// ============================================================================

auto validate_arg(const Arg& arg, bool inline_capture, const std::string& tracepoint)
    -> std::optional<ConfigError> {
    if (arg.type.empty())
        return arg_error(ErrorCodes::MALFORMED_ARG, arg, tracepoint, "missing type");
    if (arg.var.empty())
        return arg_error(ErrorCodes::MALFORMED_ARG, arg, tracepoint, "missing capture expression");

    if (!is_c_identifier(arg.field_name())) {
        return arg_error(ErrorCodes::INVALID_IDENTIFIER, arg, tracepoint,
                         "field name is not a C identifier (give the argument an explicit name)");
    }
    if (inline_capture && !is_c_identifier(arg.var)) {
        return arg_error(ErrorCodes::INVALID_IDENTIFIER, arg, tracepoint,
                         "inline capture needs a parameter name, got '" + arg.var + "'");
    }

    if (arg.c_format.empty())
        return arg_error(ErrorCodes::MALFORMED_ARG, arg, tracepoint, "missing format specifier");

    if (arg.has_conversion() && arg.to_prim_type.find("{}") == std::string::npos) {
        return arg_error(ErrorCodes::MALFORMED_ARG, arg, tracepoint,
                         "conversion '" + arg.to_prim_type + "' has no {} placeholder");
    }
    if (!arg.has_conversion() && !arg.prim_type.empty()) {
        return arg_error(ErrorCodes::MALFORMED_ARG, arg, tracepoint,
                         "converted type given without a conversion");
    }

    auto fmt_class = classify_format(arg.c_format);
    if (!fmt_class) {
        return arg_error(ErrorCodes::MALFORMED_ARG, arg, tracepoint,
                         "'" + arg.c_format + "' is not a format specifier");
    }
    if (count_conversions(arg.c_format) != 1) {
        return arg_error(ErrorCodes::MALFORMED_ARG, arg, tracepoint,
                         "'" + arg.c_format + "' must hold exactly one conversion");
    }

    auto printed = arg.printed_type();
    auto type_class = classify_type(printed);
    if (type_class != ValueClass::Unknown && type_class != *fmt_class) {
        std::string what = "format '" + arg.c_format + "' does not match ";
        what += arg.has_conversion() ? "converted type '" : "type '";
        return arg_error(ErrorCodes::FORMAT_MISMATCH, arg, tracepoint, what + printed + "'");
    }

    return std::nullopt;
}

auto validate_tracepoint(const TracepointDecl& decl) -> std::optional<ConfigError> {
    const auto& tp = decl.name;

    if (!is_c_identifier(tp)) {
        return ConfigError::make(ErrorCodes::INVALID_IDENTIFIER,
                                 "tracepoint name '" + tp + "' is not a C identifier", tp);
    }
    if (!decl.toggle_name.empty() && !is_c_identifier(decl.toggle_name)) {
        return ConfigError::make(ErrorCodes::INVALID_IDENTIFIER,
                                 "toggle name '" + decl.toggle_name + "' is not a C identifier",
                                 tp);
    }
    if (!decl.perfetto_name.empty() && !is_c_identifier(decl.perfetto_name)) {
        return ConfigError::make(ErrorCodes::INVALID_IDENTIFIER,
                                 "export name '" + decl.perfetto_name + "' is not a C identifier",
                                 tp);
    }

    if (!decl.args.empty() && !decl.struct_args.empty()) {
        return ConfigError::make(ErrorCodes::CONFLICTING_CAPTURE,
                                 "inline args and record args are alternative capture "
                                 "strategies, declare only one",
                                 tp);
    }
    if (!decl.params.empty() && decl.struct_args.empty()) {
        return ConfigError::make(ErrorCodes::CONFLICTING_CAPTURE,
                                 "call-site params are only used by record args", tp);
    }

    std::unordered_set<std::string> param_names;
    for (const auto& param : decl.params) {
        if (param.type.empty()) {
            return ConfigError::make(ErrorCodes::MALFORMED_ARG,
                                     "param '" + param.var + "': missing type", tp);
        }
        if (!is_c_identifier(param.var)) {
            return ConfigError::make(ErrorCodes::INVALID_IDENTIFIER,
                                     "param '" + param.var + "' is not a C identifier", tp);
        }
        if (!param_names.insert(param.var).second) {
            return ConfigError::make(ErrorCodes::DUPLICATE_ARG,
                                     "param '" + param.var + "' declared twice", tp);
        }
    }

    bool inline_capture = decl.capture() == CaptureMode::Inline;
    std::unordered_set<std::string> field_names;
    for (const auto& arg : decl.record_fields()) {
        if (auto err = validate_arg(arg, inline_capture, tp))
            return err;
        if (!field_names.insert(arg.field_name()).second) {
            return ConfigError::make(ErrorCodes::DUPLICATE_ARG,
                                     "argument '" + arg.field_name() + "' declared twice", tp);
        }
        if (inline_capture && !param_names.insert(arg.var).second) {
            return ConfigError::make(ErrorCodes::DUPLICATE_ARG,
                                     "parameter '" + arg.var + "' declared twice", tp);
        }
    }

    if (decl.print) {
        const auto& print = *decl.print;
        if (print.format.empty()) {
            return ConfigError::make(ErrorCodes::MALFORMED_PRINT, "empty print format", tp);
        }
        if (count_conversions(print.format) != print.args.size()) {
            std::ostringstream oss;
            oss << "print format '" << print.format << "' has " << count_conversions(print.format)
                << " conversions but " << print.args.size() << " arguments";
            return ConfigError::make(ErrorCodes::MALFORMED_PRINT, oss.str(), tp);
        }
        for (const auto& expr : print.args) {
            if (expr.empty()) {
                return ConfigError::make(ErrorCodes::MALFORMED_PRINT,
                                         "empty print format argument", tp);
            }
        }
    }

    return std::nullopt;
}

} // namespace tpgen::model
