//! # Turnip Tracepoints
//!
//! The turnip (freedreno Vulkan) declaration table: the headers and forward
//! declarations its instrumentation needs, and one scoped event per
//! instrumented driver operation.
//!
//! | Scoped event       | Payload                                             |
//! |--------------------|-----------------------------------------------------|
//! | `render_pass`      | framebuffer size, MRT count, bin layout (from `fb`) |
//! | `binning_ib`       | -                                                   |
//! | `draw_ib_sysmem`   | -                                                   |
//! | `draw_ib_gmem`     | -                                                   |
//! | `gmem_clear`       | format, samples                                     |
//! | `sysmem_clear`     | format, uses_3d_ops, samples                        |
//! | `sysmem_clear_all` | mrt_count, rect_count                               |
//! | `gmem_load`        | format, force_load                                  |
//! | `gmem_store`       | format, fast_path, unaligned                        |
//! | `sysmem_resolve`   | format                                              |
//! | `blit`             | uses_3d_blit, src_format, dst_format, layers        |
//! | `compute`          | indirect, local size, group counts                  |

#pragma once

#include "codegen/utrace_gen.hpp"
#include "common.hpp"
#include "model/scoped_event.hpp"

namespace tpgen::tu {

/// Export names are `tu_start_<event>` / `tu_end_<event>`.
constexpr const char* EXPORT_PREFIX = "tu";
constexpr const char* CTX_PARAM = "struct tu_device *dev";
constexpr const char* TOGGLE_SWITCH = "tu_gpu_tracepoint";

/// Registers the turnip headers, forward declarations and scoped events
/// through `synth`. Stops at the first configuration error.
auto register_tu_tracepoints(model::PairSynthesizer& synth) -> Result<bool, model::ConfigError>;

/// Turnip naming contract, defaults taken from the synthesizer.
auto tu_contract(const model::PairSynthesizer& synth) -> codegen::GenerationContract;

} // namespace tpgen::tu
