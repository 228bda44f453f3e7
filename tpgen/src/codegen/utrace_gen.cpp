//! # u_trace Code Generator: Driver
//!
//! Contract validation, shared emission helpers and artifact writing. The
//! per-artifact emitters live in utrace_header_gen.cpp,
//! utrace_source_gen.cpp and perfetto_gen.cpp.

#include "codegen/utrace_gen.hpp"

#include "log/log.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <utility>

namespace tpgen::codegen {

using model::ConfigError;
using model::ErrorCodes::INVALID_CONTRACT;

namespace {

/// `struct tu_device *dev` -> `dev`
std::string ctx_param_name(const std::string& ctx_param) {
    size_t end = ctx_param.find_last_not_of(" \t");
    if (end == std::string::npos)
        return "";
    size_t start = ctx_param.find_last_of(" \t*", end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return ctx_param.substr(start, end - start + 1);
}

std::string file_name_of(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

} // namespace

// ============================================================================
// Contract
// ============================================================================

auto validate_contract(const model::DeclarationRegistry& registry,
                       const GenerationContract& contract) -> std::optional<ConfigError> {
    const auto& toggles = registry.toggle_names();

    if (contract.trace_toggle_name.empty()) {
        if (!toggles.empty()) {
            return ConfigError::make(INVALID_CONTRACT, "tracepoints use toggle '" + toggles[0] +
                                                           "' but no toggle switch name was given");
        }
    } else if (!is_c_identifier(contract.trace_toggle_name)) {
        return ConfigError::make(INVALID_CONTRACT, "toggle switch name '" +
                                                       contract.trace_toggle_name +
                                                       "' is not a C identifier");
    }

    auto param = ctx_param_name(contract.ctx_param);
    if (!is_c_identifier(param) || param.size() == contract.ctx_param.size()) {
        return ConfigError::make(INVALID_CONTRACT, "context parameter '" + contract.ctx_param +
                                                       "' must be a type followed by a name");
    }

    if (toggles.size() > MAX_TOGGLES) {
        return ConfigError::make(INVALID_CONTRACT,
                                 std::to_string(toggles.size()) + " toggles declared, at most " +
                                     std::to_string(MAX_TOGGLES) + " fit the toggle mask");
    }

    std::unordered_set<std::string> known(toggles.begin(), toggles.end());
    std::unordered_set<std::string> seen;
    for (const auto& name : contract.trace_toggle_defaults) {
        if (!known.count(name)) {
            return ConfigError::make(INVALID_CONTRACT,
                                     "default-enabled toggle '" + name + "' is not declared");
        }
        if (!seen.insert(name).second) {
            return ConfigError::make(INVALID_CONTRACT,
                                     "default-enabled toggle '" + name + "' listed twice");
        }
    }

    return std::nullopt;
}

auto guard_name(const std::string& file_name) -> std::string {
    std::string guard = "_";
    for (char c : file_name) {
        auto uc = static_cast<unsigned char>(c);
        guard += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return guard;
}

// ============================================================================
// UTraceGen
// ============================================================================

UTraceGen::UTraceGen(const model::DeclarationRegistry& registry, GenerationContract contract)
    : registry_(registry), contract_(std::move(contract)) {}

auto UTraceGen::create(model::DeclarationRegistry& registry, GenerationContract contract)
    -> Result<UTraceGen, ConfigError> {
    if (registry.is_sealed()) {
        return ConfigError::make(model::ErrorCodes::REGISTRY_SEALED,
                                 "the generation contract was already passed for this registry");
    }
    registry.seal();

    if (auto err = validate_contract(registry, contract))
        return *err;

    TPGEN_LOG_DEBUG("codegen", "contract: ctx '" << contract.ctx_param << "', toggle '"
                                                 << contract.trace_toggle_name << "', "
                                                 << contract.trace_toggle_defaults.size()
                                                 << " defaults");
    return UTraceGen(registry, std::move(contract));
}

auto UTraceGen::generate(const OutputPaths& paths) -> Result<GeneratedArtifacts, GenError> {
    if (paths.utrace_src.empty() || paths.utrace_hdr.empty() || paths.perfetto_hdr.empty()) {
        return GenError{"all three output paths are required", ""};
    }

    auto hdr_name = file_name_of(paths.utrace_hdr);
    auto perfetto_name = file_name_of(paths.perfetto_hdr);
    if (hdr_name.empty())
        return GenError{"output path has no file name", paths.utrace_hdr};
    if (perfetto_name.empty())
        return GenError{"output path has no file name", paths.perfetto_hdr};
    if (hdr_name == perfetto_name)
        return GenError{"utrace and perfetto headers share a file name", paths.perfetto_hdr};

    TPGEN_LOG_INFO("codegen", "generating " << registry_.tracepoints().size()
                                            << " tracepoints, "
                                            << registry_.toggle_names().size() << " toggles");

    GeneratedArtifacts artifacts;
    artifacts.utrace_hdr = generate_header(hdr_name);
    artifacts.utrace_src = generate_source(hdr_name);
    artifacts.perfetto_hdr = generate_perfetto_header(perfetto_name, hdr_name);
    return artifacts;
}

auto UTraceGen::toggle_constant(const std::string& toggle) const -> std::string {
    return to_upper(contract_.trace_toggle_name) + "_" + to_upper(toggle);
}

// ============================================================================
// Emission Helpers
// ============================================================================

void UTraceGen::emit(const std::string& code) {
    out_ << code;
}

void UTraceGen::emit_line(const std::string& code) {
    out_ << code << "\n";
}

auto UTraceGen::take() -> std::string {
    std::string text = out_.str();
    out_.str("");
    out_.clear();
    return text;
}

void UTraceGen::emit_banner() {
    emit_line("/* Generated by tpgen " + std::string(VERSION) + ", do not edit. */");
    emit_line();
}

void UTraceGen::emit_tracepoint_comment(const model::TracepointDecl& tp) {
    emit_line("/*");
    emit_line(" * " + tp.name);
    emit_line(" */");
}

/// `(struct u_trace *ut, void *cs, <params>)`, one parameter per line.
/// Without types it renders the matching call arguments.
void UTraceGen::emit_param_list(const model::TracepointDecl& tp, bool with_types) {
    emit_line(with_types ? "     struct u_trace *ut" : "        ut");
    emit_line(with_types ? "   , void *cs" : "      , cs");
    for (const auto& param : tp.call_params()) {
        if (with_types) {
            emit_line("   , " + param.type + " " + param.var);
        } else {
            emit_line("      , " + param.var);
        }
    }
}

// ============================================================================
// Writing
// ============================================================================

auto write_artifacts(const GeneratedArtifacts& artifacts, const OutputPaths& paths)
    -> Result<bool, GenError> {
    const std::pair<const std::string*, const std::string*> outputs[] = {
        {&paths.utrace_hdr, &artifacts.utrace_hdr},
        {&paths.utrace_src, &artifacts.utrace_src},
        {&paths.perfetto_hdr, &artifacts.perfetto_hdr},
    };

    for (const auto& [path, text] : outputs) {
        std::ofstream file(*path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file) {
            return GenError{"cannot open for writing", *path};
        }
        file << *text;
        file.close();
        if (!file) {
            return GenError{"write failed", *path};
        }
        TPGEN_LOG_INFO("codegen", "wrote " << *path << " (" << text->size() << " bytes)");
    }
    return true;
}

} // namespace tpgen::codegen
