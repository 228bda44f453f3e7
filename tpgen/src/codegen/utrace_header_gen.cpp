//! # u_trace Code Generator: Header
//!
//! Emits the instrumentation header included by driver code: one record
//! struct and one inline `trace_<name>()` per tracepoint, gated by the
//! toggle bits.

#include "codegen/utrace_gen.hpp"

namespace tpgen::codegen {

auto UTraceGen::generate_header(const std::string& hdr_name) -> std::string {
    take();
    auto guard = guard_name(hdr_name);

    emit_banner();
    emit_line("#ifndef " + guard);
    emit_line("#define " + guard);
    emit_line();

    auto public_headers = registry_.headers(model::HeaderScope::Header);
    for (const auto& header : public_headers) {
        emit_line("#include \"" + header.path + "\"");
    }
    if (!public_headers.empty())
        emit_line();
    emit_line("#include \"util/u_trace.h\"");
    emit_line();
    emit_line("#ifdef __cplusplus");
    emit_line("extern \"C\" {");
    emit_line("#endif");
    emit_line();

    for (const auto& fwd : registry_.forward_decls()) {
        emit_line(fwd.decl + ";");
    }
    if (!registry_.forward_decls().empty())
        emit_line();

    emit_toggle_decls();

    for (const auto& tp : registry_.tracepoints()) {
        emit_tracepoint_comment(tp);
        emit_record(tp);
        emit_perfetto_decl(tp);
        emit_line("void __trace_" + tp.name + "(");
        emit_param_list(tp, true);
        emit_line(");");
        emit_trace_wrapper(tp);
        emit_line();
    }

    emit_line("#ifdef __cplusplus");
    emit_line("}");
    emit_line("#endif");
    emit_line();
    emit_line("#endif /* " + guard + " */");
    return take();
}

void UTraceGen::emit_toggle_decls() {
    const auto& switch_name = contract_.trace_toggle_name;
    if (switch_name.empty())
        return;

    const auto& toggles = registry_.toggle_names();
    if (!toggles.empty()) {
        emit_line("enum " + to_lower(switch_name) + " {");
        for (size_t bit = 0; bit < toggles.size(); ++bit) {
            emit_line("   " + toggle_constant(toggles[bit]) + " = 1ull << " + std::to_string(bit) +
                      ",");
        }
        emit_line("};");
        emit_line();
    }

    emit_line("extern uint64_t " + switch_name + ";");
    emit_line();
    emit_line("void " + switch_name + "_config_variable(void);");
    emit_line();
}

void UTraceGen::emit_record(const model::TracepointDecl& tp) {
    emit_line("struct trace_" + tp.name + " {");
    for (const auto& field : tp.record_fields()) {
        // Raw values only; conversions happen when the record is printed.
        emit_line("   " + field.type + " " + field.field_name() + ";");
    }
    if (!tp.has_payload()) {
        emit_line("#ifdef __cplusplus");
        emit_line("   /* an empty struct is sized 0 in C and 1 in C++ */");
        emit_line("   uint8_t dummy;");
        emit_line("#endif");
    }
    emit_line("};");
}

void UTraceGen::emit_perfetto_decl(const model::TracepointDecl& tp) {
    if (tp.perfetto_name.empty())
        return;

    emit_line("#ifdef HAVE_PERFETTO");
    emit_line("void " + tp.perfetto_name + "(");
    emit_line("   " + contract_.ctx_param + ",");
    emit_line("   uint64_t ts_ns,");
    emit_line("   const void *flush_data,");
    emit_line("   const struct trace_" + tp.name + " *payload);");
    emit_line("#endif");
}

void UTraceGen::emit_trace_wrapper(const model::TracepointDecl& tp) {
    emit_line("static ALWAYS_INLINE void trace_" + tp.name + "(");
    emit_param_list(tp, true);
    emit_line(") {");
    if (tp.toggle_name.empty()) {
        emit_line("   if (!unlikely(u_trace_instrument()))");
    } else {
        emit_line("   if (!unlikely(u_trace_instrument() &&");
        emit_line("                 (" + contract_.trace_toggle_name + " & " +
                  toggle_constant(tp.toggle_name) + ")))");
    }
    emit_line("      return;");
    emit_line("   __trace_" + tp.name + "(");
    emit_param_list(tp, false);
    emit_line("   );");
    emit_line("}");
}

} // namespace tpgen::codegen
