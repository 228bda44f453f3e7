//! # Command-Line Options
//!
//! Parsed form of the generator invocation.
//!
//! | Option                   | Meaning                                   |
//! |--------------------------|-------------------------------------------|
//! | `-p`, `--import-path`    | Directory of the tracepoint engine        |
//! | `--utrace-src`           | Generated source path                     |
//! | `--utrace-hdr`           | Generated header path                     |
//! | `--perfetto-hdr`         | Generated perfetto header path            |
//! | `-h`, `--help`           | Print usage                               |
//! | `-V`, `--version`        | Print version                             |
//!
//! Every valued option accepts `--opt value` and `--opt=value`. Logging
//! options (`--log-level=`, `-v`, ...) are left to log::parse_log_options().

#pragma once

#include "common.hpp"

#include <string>

namespace tpgen::cli {

struct CliOptions {
    std::string import_path;
    std::string utrace_src;
    std::string utrace_hdr;
    std::string perfetto_hdr;
    bool show_help = false;
    bool show_version = false;
};

/// Usage error: missing, unknown or malformed option.
struct InvocationError {
    std::string message;
};

/// Parses argv. `--help` and `--version` short-circuit the required-option
/// checks.
auto parse_args(int argc, char* argv[]) -> Result<CliOptions, InvocationError>;

} // namespace tpgen::cli
