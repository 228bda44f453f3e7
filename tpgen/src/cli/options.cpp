//! # Command-Line Option Parsing

#include "options.hpp"

#include "log/log.hpp"

#include <filesystem>
#include <string_view>

namespace tpgen::cli {

namespace {

struct ValuedOption {
    const char* long_name;
    const char* short_name; ///< nullptr if none
    std::string CliOptions::*field;
};

const ValuedOption VALUED_OPTIONS[] = {
    {"--import-path", "-p", &CliOptions::import_path},
    {"--utrace-src", nullptr, &CliOptions::utrace_src},
    {"--utrace-hdr", nullptr, &CliOptions::utrace_hdr},
    {"--perfetto-hdr", nullptr, &CliOptions::perfetto_hdr},
};

} // namespace

auto parse_args(int argc, char* argv[]) -> Result<CliOptions, InvocationError> {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-V") {
            opts.show_version = true;
            continue;
        }
        if (log::is_log_option(arg))
            continue;

        bool matched = false;
        for (const auto& opt : VALUED_OPTIONS) {
            std::string_view long_name = opt.long_name;
            if (arg == long_name || (opt.short_name && arg == opt.short_name)) {
                if (i + 1 >= argc) {
                    return InvocationError{"option '" + std::string(arg) + "' requires a value"};
                }
                opts.*opt.field = argv[++i];
                matched = true;
                break;
            }
            if (arg.size() > long_name.size() && arg.starts_with(long_name) &&
                arg[long_name.size()] == '=') {
                opts.*opt.field = std::string(arg.substr(long_name.size() + 1));
                matched = true;
                break;
            }
        }
        if (matched)
            continue;

        if (arg.starts_with("-")) {
            return InvocationError{"unknown option '" + std::string(arg) + "'"};
        }
        return InvocationError{"unexpected argument '" + std::string(arg) + "'"};
    }

    if (opts.show_help || opts.show_version)
        return opts;

    for (const auto& opt : VALUED_OPTIONS) {
        if ((opts.*opt.field).empty()) {
            return InvocationError{"missing required option '" + std::string(opt.long_name) +
                                   "'"};
        }
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(opts.import_path, ec)) {
        return InvocationError{"import path '" + opts.import_path + "' is not a directory"};
    }

    return opts;
}

} // namespace tpgen::cli
