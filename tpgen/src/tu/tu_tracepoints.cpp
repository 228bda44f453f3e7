//! # Turnip Tracepoints Implementation

#include "tu/tu_tracepoints.hpp"

#include "log/log.hpp"

#include <utility>

namespace tpgen::tu {

using model::Arg;
using model::ConfigError;
using model::ScopedEvent;

namespace {

constexpr const char* VK_FORMAT_NAME = "vk_format_description({})->short_name";

Arg u8(const char* var) {
    return Arg{"uint8_t", var, "%u", "", "", ""};
}

Arg u16(const char* var) {
    return Arg{"uint16_t", var, "%u", "", "", ""};
}

/// `enum VkFormat`, printed by its short name.
Arg vk_format(const char* var) {
    return Arg{"enum VkFormat", var, "%s", "", VK_FORMAT_NAME, ""};
}

/// Record field read through the framebuffer handle.
Arg fb_field(const char* type, const char* name, const char* expr) {
    return Arg{type, expr, "%u", name, "", ""};
}

ScopedEvent event(const char* name, std::vector<Arg> args = {}) {
    ScopedEvent ev;
    ev.name = name;
    ev.args = std::move(args);
    return ev;
}

ScopedEvent render_pass() {
    ScopedEvent ev;
    ev.name = "render_pass";
    ev.params.push_back(model::Param{"const struct tu_framebuffer *", "fb"});
    ev.struct_args = {
        fb_field("uint16_t", "width", "fb->width"),
        fb_field("uint16_t", "height", "fb->height"),
        fb_field("uint8_t", "MRTs", "fb->attachment_count"),
        fb_field("uint16_t", "numberOfBins", "fb->tile_count.width * fb->tile_count.height"),
        fb_field("uint16_t", "binWidth", "fb->tile0.width"),
        fb_field("uint16_t", "binHeight", "fb->tile0.height"),
    };
    return ev;
}

auto scoped_events() -> std::vector<ScopedEvent> {
    std::vector<ScopedEvent> events;
    events.push_back(render_pass());
    events.push_back(event("binning_ib"));
    events.push_back(event("draw_ib_sysmem"));
    events.push_back(event("draw_ib_gmem"));
    events.push_back(event("gmem_clear", {vk_format("format"), u8("samples")}));
    events.push_back(
        event("sysmem_clear", {vk_format("format"), u8("uses_3d_ops"), u8("samples")}));
    events.push_back(event("sysmem_clear_all", {u8("mrt_count"), u8("rect_count")}));
    events.push_back(event("gmem_load", {vk_format("format"), u8("force_load")}));
    events.push_back(
        event("gmem_store", {vk_format("format"), u8("fast_path"), u8("unaligned")}));
    events.push_back(event("sysmem_resolve", {vk_format("format")}));
    events.push_back(event("blit", {u8("uses_3d_blit"), vk_format("src_format"),
                                    vk_format("dst_format"), u8("layers")}));
    events.push_back(event("compute", {u8("indirect"), u16("local_size_x"), u16("local_size_y"),
                                       u16("local_size_z"), u16("num_groups_x"),
                                       u16("num_groups_y"), u16("num_groups_z")}));
    return events;
}

} // namespace

auto register_tu_tracepoints(model::PairSynthesizer& synth) -> Result<bool, ConfigError> {
    auto& registry = synth.registry();

    const std::pair<const char*, model::HeaderScope> headers[] = {
        {"util/u_dump.h", model::HeaderScope::Header},
        {"vk_format.h", model::HeaderScope::Header},
        {"freedreno/vulkan/tu_private.h", model::HeaderScope::Source},
    };
    for (const auto& [path, scope] : headers) {
        auto result = registry.register_header(path, scope);
        if (is_err(result))
            return unwrap_err(result);
    }

    auto fwd = registry.register_forward_decl("struct tu_device");
    if (is_err(fwd))
        return unwrap_err(fwd);

    for (auto& ev : scoped_events()) {
        auto result = synth.declare_scoped_event(std::move(ev));
        if (is_err(result))
            return unwrap_err(result);
    }

    TPGEN_LOG_INFO("tu", "declared " << synth.scoped_events().size() << " scoped events, "
                                     << registry.tracepoints().size() << " tracepoints");
    return true;
}

auto tu_contract(const model::PairSynthesizer& synth) -> codegen::GenerationContract {
    codegen::GenerationContract contract;
    contract.ctx_param = CTX_PARAM;
    contract.trace_toggle_name = TOGGLE_SWITCH;
    contract.trace_toggle_defaults = synth.default_enablement();
    return contract;
}

} // namespace tpgen::tu
