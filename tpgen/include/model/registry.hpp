//! # Declaration Registry
//!
//! The ordered list of headers, forward declarations and tracepoints that
//! forms the complete input of one generation run.
//!
//! ## Lifecycle
//!
//! ```text
//! register_header / register_forward_decl / register_tracepoint  (source order)
//!         │
//!      seal()        ← generation engine takes the registry
//!         │
//!   read-only queries
//! ```
//!
//! Tracepoint names are unique: the generator derives C symbols from them,
//! so a collision is rejected here instead of surfacing as a duplicate
//! symbol when the driver is compiled. The same holds for export names
//! and for toggles, whose enum constant is the upper-cased name: `blit`
//! and `Blit` would both become `..._BLIT`.
//!
//! Tracepoint names and toggle names share one namespace. A tracepoint may
//! not take the name of a toggle, nor a scoped event the name of a
//! tracepoint, even where the generated symbols would not clash.

#pragma once

#include "common.hpp"
#include "model/config_error.hpp"
#include "model/tracepoint.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tpgen::model {

class DeclarationRegistry {
public:
    DeclarationRegistry() = default;

    /// Appends a header include. Duplicates are kept.
    auto register_header(std::string path, HeaderScope scope = HeaderScope::Header)
        -> Result<bool, ConfigError>;

    /// Appends a forward declaration, e.g. `struct tu_device`.
    auto register_forward_decl(std::string decl) -> Result<bool, ConfigError>;

    /// Validates and appends a tracepoint. Returns its position in the
    /// registry. On error the registry is left unchanged.
    auto register_tracepoint(TracepointDecl decl) -> Result<size_t, ConfigError>;

    /// Runs every check register_tracepoint() would, without registering.
    [[nodiscard]] auto check_tracepoint(const TracepointDecl& decl) const
        -> std::optional<ConfigError>;

    /// Marks the registry as handed to the generation engine. Later
    /// registrations fail with C007.
    void seal() {
        sealed_ = true;
    }

    [[nodiscard]] auto is_sealed() const -> bool {
        return sealed_;
    }

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto headers() const -> const std::vector<HeaderRef>& {
        return headers_;
    }

    /// Headers with the given scope, in registration order.
    [[nodiscard]] auto headers(HeaderScope scope) const -> std::vector<HeaderRef>;

    [[nodiscard]] auto forward_decls() const -> const std::vector<ForwardDecl>& {
        return forward_decls_;
    }

    [[nodiscard]] auto tracepoints() const -> const std::vector<TracepointDecl>& {
        return tracepoints_;
    }

    /// Returns the tracepoint with the given name, or nullptr.
    [[nodiscard]] auto find(const std::string& name) const -> const TracepointDecl*;

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index_.count(name) != 0;
    }

    /// Returns the registered toggle whose enum constant equals that of
    /// `toggle`, or nullptr.
    [[nodiscard]] auto toggle_owning_constant(const std::string& toggle) const
        -> const std::string*;

    /// Distinct toggle names in order of first appearance.
    [[nodiscard]] auto toggle_names() const -> const std::vector<std::string>& {
        return toggle_order_;
    }

private:
    std::vector<HeaderRef> headers_;
    std::vector<ForwardDecl> forward_decls_;
    std::vector<TracepointDecl> tracepoints_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_set<std::string> toggles_;
    std::vector<std::string> toggle_order_;
    std::unordered_map<std::string, std::string> toggle_constants_; ///< upper-cased -> toggle
    std::unordered_set<std::string> exports_;
    bool sealed_ = false;

    [[nodiscard]] auto sealed_error(const std::string& what) const -> ConfigError;
};

} // namespace tpgen::model
