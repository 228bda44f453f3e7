//! # Generator Dispatcher
//!
//! Entry point of the `tpgen` executable.
//!
//! ## Pipeline
//!
//! ```text
//! tpgen_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   └─ generate
//!        ├─ register_tu_tracepoints()   headers, forward decls, scoped events
//!        ├─ UTraceGen::create()         seals the registry, checks the contract
//!        ├─ UTraceGen::generate()       renders all three artifacts in memory
//!        └─ write_artifacts()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                           |
//! |------|---------------------------------------------------|
//! | 0    | Success, or help/version printed                  |
//! | 1    | Invocation, configuration or write error          |

#include "codegen/utrace_gen.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "model/registry.hpp"
#include "model/scoped_event.hpp"
#include "options.hpp"
#include "tu/tu_tracepoints.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

namespace tpgen::cli {

namespace {

int run_generate(const CliOptions& opts) {
    TPGEN_LOG_DEBUG("cli", "import path " << opts.import_path << " (engine is built in)");

    model::DeclarationRegistry registry;
    model::PairSynthesizer synth(registry, tu::EXPORT_PREFIX);

    auto declared = tu::register_tu_tracepoints(synth);
    if (is_err(declared)) {
        std::cerr << unwrap_err(declared).to_string() << "\n";
        return 1;
    }

    auto gen_result = codegen::UTraceGen::create(registry, tu::tu_contract(synth));
    if (is_err(gen_result)) {
        std::cerr << unwrap_err(gen_result).to_string() << "\n";
        return 1;
    }
    auto& gen = unwrap(gen_result);

    codegen::OutputPaths paths{opts.utrace_src, opts.utrace_hdr, opts.perfetto_hdr};
    auto artifacts = gen.generate(paths);
    if (is_err(artifacts)) {
        std::cerr << "error: " << unwrap_err(artifacts).to_string() << "\n";
        return 1;
    }

    auto written = codegen::write_artifacts(unwrap(artifacts), paths);
    if (is_err(written)) {
        std::cerr << "error: " << unwrap_err(written).to_string() << "\n";
        return 1;
    }
    return 0;
}

} // namespace

} // namespace tpgen::cli

int tpgen_main(int argc, char* argv[]) {
    tpgen::log::Logger::init(tpgen::log::parse_log_options(argc, argv));

    auto parsed = tpgen::cli::parse_args(argc, argv);
    if (tpgen::is_err(parsed)) {
        std::cerr << "error: " << tpgen::unwrap_err(parsed).message << "\n\n";
        tpgen::cli::print_usage(std::cerr);
        return 1;
    }

    const auto& opts = tpgen::unwrap(parsed);
    if (opts.show_help) {
        tpgen::cli::print_usage();
        return 0;
    }
    if (opts.show_version) {
        tpgen::cli::print_version();
        return 0;
    }

    int rc = tpgen::cli::run_generate(opts);
    tpgen::log::Logger::instance().flush();
    return rc;
}
