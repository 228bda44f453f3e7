//! # u_trace Code Generator
//!
//! Turns a sealed DeclarationRegistry into the three artifacts the driver
//! links against:
//!
//! | Artifact            | Contents                                                  |
//! |---------------------|-----------------------------------------------------------|
//! | utrace header       | records, toggle bits, inline `trace_*` emission calls     |
//! | utrace source       | toggle initializer, printers, descriptors, `__trace_*`    |
//! | perfetto header     | `trace_payload_as_extra_*` exporters for track events     |
//!
//! ## Usage
//!
//! ```cpp
//! auto gen = UTraceGen::create(registry, contract);   // seals the registry
//! auto artifacts = unwrap(gen).generate(paths);
//! write_artifacts(unwrap(artifacts), paths);
//! ```
//!
//! All three artifacts are rendered in memory before any file is written.

#pragma once

#include "common.hpp"
#include "model/config_error.hpp"
#include "model/registry.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace tpgen::codegen {

/// Toggle bits live in one `uint64_t`.
constexpr size_t MAX_TOGGLES = 64;

/// Error while rendering or writing an artifact.
struct GenError {
    std::string message;
    std::string path; ///< Artifact involved, empty if none

    [[nodiscard]] auto to_string() const -> std::string {
        return path.empty() ? message : path + ": " + message;
    }
};

/// Naming contract fixed by the driver.
struct GenerationContract {
    std::string ctx_param;                          ///< e.g. `struct tu_device *dev`
    std::string trace_toggle_name;                  ///< e.g. `tu_gpu_tracepoint`
    std::vector<std::string> trace_toggle_defaults; ///< Toggles enabled by default
};

/// Output file paths.
struct OutputPaths {
    std::string utrace_src;
    std::string utrace_hdr;
    std::string perfetto_hdr;
};

/// Rendered artifact text.
struct GeneratedArtifacts {
    std::string utrace_src;
    std::string utrace_hdr;
    std::string perfetto_hdr;
};

/// Checks the contract against the registry: toggle switch name, context
/// parameter, defaults naming registered toggles, toggle count.
auto validate_contract(const model::DeclarationRegistry& registry,
                       const GenerationContract& contract) -> std::optional<model::ConfigError>;

/// Include guard for a generated header, e.g. `tu_tracepoints.h` ->
/// `_TU_TRACEPOINTS_H`.
auto guard_name(const std::string& file_name) -> std::string;

class UTraceGen {
public:
    /// Seals `registry` and validates `contract`. Fails with C007 if the
    /// registry was already handed to a generator.
    static auto create(model::DeclarationRegistry& registry, GenerationContract contract)
        -> Result<UTraceGen, model::ConfigError>;

    /// Renders all three artifacts. Generated includes refer to the other
    /// artifacts by file name.
    auto generate(const OutputPaths& paths) -> Result<GeneratedArtifacts, GenError>;

    /// `hdr_name` is the file name of the utrace header.
    auto generate_header(const std::string& hdr_name) -> std::string;
    auto generate_source(const std::string& hdr_name) -> std::string;
    auto generate_perfetto_header(const std::string& perfetto_name, const std::string& hdr_name)
        -> std::string;

    [[nodiscard]] auto contract() const -> const GenerationContract& {
        return contract_;
    }

    /// Enum constant of a toggle bit, e.g. `TU_GPU_TRACEPOINT_BLIT`.
    [[nodiscard]] auto toggle_constant(const std::string& toggle) const -> std::string;

private:
    UTraceGen(const model::DeclarationRegistry& registry, GenerationContract contract);

    const model::DeclarationRegistry& registry_;
    GenerationContract contract_;
    std::ostringstream out_;

    void emit(const std::string& code);
    void emit_line(const std::string& code = "");
    auto take() -> std::string;

    void emit_banner();
    void emit_tracepoint_comment(const model::TracepointDecl& tp);
    void emit_param_list(const model::TracepointDecl& tp, bool with_types);

    // Header
    void emit_toggle_decls();
    void emit_record(const model::TracepointDecl& tp);
    void emit_perfetto_decl(const model::TracepointDecl& tp);
    void emit_trace_wrapper(const model::TracepointDecl& tp);

    // Source
    void emit_toggle_init();
    void emit_printers(const model::TracepointDecl& tp);
    void emit_descriptor(const model::TracepointDecl& tp);
    void emit_trace_body(const model::TracepointDecl& tp);

    // Perfetto
    void emit_payload_as_extra(const model::TracepointDecl& tp);
};

/// Writes every artifact. Stops at the first failure.
auto write_artifacts(const GeneratedArtifacts& artifacts, const OutputPaths& paths)
    -> Result<bool, GenError>;

} // namespace tpgen::codegen
