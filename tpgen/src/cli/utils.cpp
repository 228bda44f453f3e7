#include "utils.hpp"

#include "common.hpp"

namespace tpgen::cli {

void print_usage(std::ostream& out) {
    out << "tpgen " << VERSION << "\n\n";
    out << "Generates the turnip u_trace instrumentation sources.\n\n";
    out << "Usage: tpgen -p <dir> --utrace-src <file> --utrace-hdr <file> "
           "--perfetto-hdr <file>\n\n";
    out << "Options:\n";
    out << "  -p, --import-path <dir>   Directory of the tracepoint engine\n";
    out << "  --utrace-src <file>       Generated C source\n";
    out << "  --utrace-hdr <file>       Generated C header\n";
    out << "  --perfetto-hdr <file>     Generated perfetto helper header\n";
    out << "  --help, -h                Show this help\n";
    out << "  --version, -V             Show version\n";
    out << "\nLogging:\n";
    out << "  --log-level=<level>       trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>       Per-module levels, e.g. codegen=debug,*=warn\n";
    out << "  --log-file=<path>         Also write log messages to a file\n";
    out << "  --log-format=<fmt>        text or json\n";
    out << "  -v, -vv, -vvv             Info, debug, trace\n";
    out << "  -q, --quiet               Errors only\n";
    out << "\nEnvironment:\n";
    out << "  TPGEN_LOG                 Level or filter spec when no logging option is given\n";
}

void print_version() {
    std::cout << "tpgen " << VERSION << "\n";
}

} // namespace tpgen::cli
