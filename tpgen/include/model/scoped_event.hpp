//! # Scoped Events
//!
//! A scoped event brackets one driver operation (a render pass, a blit, a
//! clear) with two tracepoints that share a single toggle:
//!
//! ```text
//! declare_scoped_event({.name = "blit", .args = {...}})
//!     ├─ start_blit   toggle "blit", no payload,   export tu_start_blit
//!     └─ end_blit     toggle "blit", the payload,  export tu_end_blit
//! ```
//!
//! Enabling a toggle always enables both halves, so a trace never holds a
//! start without a possible end. Events declared with `default_enabled`
//! are collected, in declaration order, into the default-enablement list
//! the generated toggle initializer starts from.

#pragma once

#include "common.hpp"
#include "model/registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tpgen::model {

/// Declaration of one scoped event. The payload is attached to the end
/// tracepoint only.
struct ScopedEvent {
    std::string name;
    std::vector<Param> params;    ///< Call-site params read by `struct_args`
    std::vector<Arg> args;        ///< Inline capture
    std::vector<Arg> struct_args; ///< Record capture
    std::optional<PrintFormat> print;
    bool default_enabled = true;
};

/// Expands scoped events into start/end tracepoint pairs.
class PairSynthesizer {
public:
    /// `export_prefix` is prepended to the export names, e.g. "tu" gives
    /// `tu_start_<name>` and `tu_end_<name>`.
    PairSynthesizer(DeclarationRegistry& registry, std::string export_prefix);

    /// Registers `start_<name>` and `end_<name>`. Either both are registered
    /// or, on error, neither is and the default-enablement list is unchanged.
    /// `name` must not be a registered tracepoint, nor a toggle whose enum
    /// constant it would repeat.
    auto declare_scoped_event(ScopedEvent event) -> Result<bool, ConfigError>;

    /// Names of default-enabled scoped events, in declaration order.
    [[nodiscard]] auto default_enablement() const -> const std::vector<std::string>& {
        return defaults_;
    }

    /// Names of every scoped event declared so far, in declaration order.
    [[nodiscard]] auto scoped_events() const -> const std::vector<std::string>& {
        return events_;
    }

    [[nodiscard]] auto export_prefix() const -> const std::string& {
        return export_prefix_;
    }

    [[nodiscard]] auto registry() -> DeclarationRegistry& {
        return registry_;
    }

    [[nodiscard]] static auto start_name(const std::string& event) -> std::string {
        return "start_" + event;
    }

    [[nodiscard]] static auto end_name(const std::string& event) -> std::string {
        return "end_" + event;
    }

    /// `<prefix>_<tracepoint>`
    [[nodiscard]] auto export_name(const std::string& tracepoint) const -> std::string;

private:
    DeclarationRegistry& registry_;
    std::string export_prefix_;
    std::vector<std::string> defaults_;
    std::vector<std::string> events_;
};

} // namespace tpgen::model
