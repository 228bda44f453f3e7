//! # u_trace Code Generator: Perfetto Header
//!
//! Emits `trace_payload_as_extra_<name>()` for every exported tracepoint.
//! The driver's perfetto glue calls them to attach the record fields to a
//! `GpuRenderStageEvent` as extra data, formatted with each field's
//! specifier and conversion.

#include "codegen/utrace_gen.hpp"

namespace tpgen::codegen {

auto UTraceGen::generate_perfetto_header(const std::string& perfetto_name,
                                         const std::string& hdr_name) -> std::string {
    take();
    auto guard = guard_name(perfetto_name);

    emit_banner();
    emit_line("#ifndef " + guard);
    emit_line("#define " + guard);
    emit_line();
    emit_line("#include <perfetto.h>");
    emit_line();
    emit_line("#include \"" + hdr_name + "\"");
    emit_line();

    for (const auto& tp : registry_.tracepoints()) {
        emit_payload_as_extra(tp);
    }

    emit_line("#endif /* " + guard + " */");
    return take();
}

void UTraceGen::emit_payload_as_extra(const model::TracepointDecl& tp) {
    if (tp.perfetto_name.empty())
        return;

    emit_line("static void UNUSED");
    emit_line("trace_payload_as_extra_" + tp.name +
              "(perfetto::protos::pbzero::GpuRenderStageEvent *event,");
    emit_line("                                    const struct trace_" + tp.name + " *payload)");
    emit_line("{");
    if (tp.has_payload()) {
        emit_line("   char buf[128];");
        emit_line();
        for (const auto& field : tp.record_fields()) {
            emit_line("   {");
            emit_line("      auto data = event->add_extra_data();");
            emit_line("      data->set_name(\"" + field.field_name() + "\");");
            emit_line();
            emit_line("      snprintf(buf, sizeof(buf), \"" + field.c_format + "\", " +
                      field.print_expr("payload->" + field.field_name()) + ");");
            emit_line();
            emit_line("      data->set_value(buf);");
            emit_line("   }");
        }
    } else {
        emit_line("   (void)event;");
        emit_line("   (void)payload;");
    }
    emit_line("}");
    emit_line();
}

} // namespace tpgen::codegen
