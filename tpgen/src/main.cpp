//! # tpgen Entry Point
//!
//! Delegates to the CLI driver, which parses the command line and writes
//! the generated u_trace sources.
//!
//! ## Usage
//!
//! ```bash
//! tpgen -p src/util/perf \
//!       --utrace-src tu_tracepoints.c \
//!       --utrace-hdr tu_tracepoints.h \
//!       --perfetto-hdr tu_tracepoints_perfetto.h
//! ```

#include "cli/driver.hpp"

/// @return Exit code: 0 for success, 1 for errors
int main(int argc, char* argv[]) {
    return tpgen_main(argc, argv);
}
