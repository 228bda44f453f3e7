//! # u_trace Code Generator: Source
//!
//! Emits the translation unit backing the generated header: the toggle
//! mask and its environment initializer, one printer pair and descriptor
//! per tracepoint, and the out-of-line `__trace_<name>()` bodies.

#include "codegen/utrace_gen.hpp"

namespace tpgen::codegen {

auto UTraceGen::generate_source(const std::string& hdr_name) -> std::string {
    take();

    emit_banner();
    emit_line("#include \"" + hdr_name + "\"");
    for (const auto& header : registry_.headers(model::HeaderScope::Source)) {
        emit_line("#include \"" + header.path + "\"");
    }
    emit_line();
    emit_line("#define __NEEDS_TRACE_PRIV");
    emit_line("#include \"util/u_debug.h\"");
    emit_line("#include \"util/perf/u_trace_priv.h\"");
    emit_line();

    emit_toggle_init();

    for (const auto& tp : registry_.tracepoints()) {
        emit_tracepoint_comment(tp);
        emit_printers(tp);
        emit_descriptor(tp);
        emit_trace_body(tp);
        emit_line();
    }
    return take();
}

void UTraceGen::emit_toggle_init() {
    const auto& switch_name = contract_.trace_toggle_name;
    if (switch_name.empty())
        return;

    emit_line("static const struct debug_control config_control[] = {");
    for (const auto& toggle : registry_.toggle_names()) {
        emit_line("   { \"" + toggle + "\", " + toggle_constant(toggle) + ", },");
    }
    emit_line("   { NULL, 0, },");
    emit_line("};");
    emit_line("uint64_t " + switch_name + " = 0;");
    emit_line();

    emit_line("static void");
    emit_line(switch_name + "_variable_once(void)");
    emit_line("{");
    emit("   uint64_t default_value = 0");
    for (const auto& toggle : contract_.trace_toggle_defaults) {
        emit("\n     | " + toggle_constant(toggle));
    }
    emit_line(";");
    emit_line();
    emit_line("   " + switch_name + " =");
    emit_line("      parse_enable_string(getenv(\"" + to_upper(switch_name) + "\"),");
    emit_line("                          default_value,");
    emit_line("                          config_control);");
    emit_line("}");
    emit_line();

    auto flag = "process_" + switch_name + "_variable_flag";
    emit_line("void");
    emit_line(switch_name + "_config_variable(void)");
    emit_line("{");
    emit_line("   static once_flag " + flag + " = ONCE_FLAG_INIT;");
    emit_line();
    emit_line("   call_once(&" + flag + ",");
    emit_line("             " + switch_name + "_variable_once);");
    emit_line("}");
    emit_line();
}

void UTraceGen::emit_printers(const model::TracepointDecl& tp) {
    const auto& fields = tp.record_fields();
    if (!tp.has_payload() && !tp.print) {
        emit_line("#define __print_" + tp.name + " NULL");
        emit_line("#define __print_json_" + tp.name + " NULL");
        return;
    }

    auto entry_decl = "   const struct trace_" + tp.name + " *__entry =";
    auto entry_cast = "      (const struct trace_" + tp.name + " *)arg;";

    // Plain text
    emit_line("static void __print_" + tp.name + "(FILE *out, const void *arg) {");
    emit_line(entry_decl);
    emit_line(entry_cast);
    if (tp.print) {
        emit_line("   fprintf(out, \"" + tp.print->format + "\\n\"");
        for (const auto& expr : tp.print->args) {
            emit_line("           , " + expr);
        }
    } else {
        emit_line("   fprintf(out, \"\"");
        for (const auto& field : fields) {
            emit_line("      \"" + field.field_name() + "=" + field.c_format + ", \"");
        }
        emit_line("         \"\\n\"");
        for (const auto& field : fields) {
            emit_line("   , " + field.print_expr("__entry->" + field.field_name()));
        }
    }
    emit_line("   );");
    emit_line("}");
    emit_line();

    // JSON
    emit_line("static void __print_json_" + tp.name + "(FILE *out, const void *arg) {");
    emit_line(entry_decl);
    emit_line(entry_cast);
    if (tp.print) {
        emit_line("   fprintf(out, \"\\\"unstructured\\\": \\\"" + tp.print->format + "\\\"\"");
        for (const auto& expr : tp.print->args) {
            emit_line("           , " + expr);
        }
    } else {
        emit_line("   fprintf(out, \"\"");
        for (size_t i = 0; i < fields.size(); ++i) {
            const auto& field = fields[i];
            std::string sep = (i + 1 < fields.size()) ? ", " : "";
            emit_line("      \"\\\"" + field.field_name() + "\\\": \\\"" + field.c_format +
                      "\\\"" + sep + "\"");
        }
        for (const auto& field : fields) {
            emit_line("   , " + field.print_expr("__entry->" + field.field_name()));
        }
    }
    emit_line("   );");
    emit_line("}");
    emit_line();
}

void UTraceGen::emit_descriptor(const model::TracepointDecl& tp) {
    emit_line("static const struct u_tracepoint __tp_" + tp.name + " = {");
    emit_line("   ALIGN_POT(sizeof(struct trace_" + tp.name + "), 8),");
    emit_line("   \"" + tp.name + "\",");
    emit_line(std::string("   ") + (tp.end_of_pipe ? "true" : "false") + ",");
    emit_line("   __print_" + tp.name + ",");
    emit_line("   __print_json_" + tp.name + ",");
    if (!tp.perfetto_name.empty()) {
        emit_line("#ifdef HAVE_PERFETTO");
        emit_line("   (void (*)(void *pctx, uint64_t, const void *, const void *))" +
                  tp.perfetto_name + ",");
        emit_line("#endif");
    }
    emit_line("};");
}

void UTraceGen::emit_trace_body(const model::TracepointDecl& tp) {
    emit_line("void __trace_" + tp.name + "(");
    emit_param_list(tp, true);
    emit_line(") {");
    emit_line("   struct trace_" + tp.name + " *__entry =");
    emit_line("      (struct trace_" + tp.name + " *)u_trace_append(ut, cs, &__tp_" + tp.name +
              ");");
    if (!tp.has_payload()) {
        emit_line("   (void)__entry;");
    }
    for (const auto& field : tp.record_fields()) {
        emit_line("   __entry->" + field.field_name() + " = " + field.var + ";");
    }
    emit_line("}");
}

} // namespace tpgen::codegen
