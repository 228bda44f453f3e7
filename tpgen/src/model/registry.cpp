//! # Declaration Registry Implementation

#include "model/registry.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>

namespace tpgen::model {

namespace {

auto upper(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

auto DeclarationRegistry::sealed_error(const std::string& what) const -> ConfigError {
    return ConfigError::make(ErrorCodes::REGISTRY_SEALED,
                             "cannot register " + what +
                                 ": the registry was already handed to the generator");
}

auto DeclarationRegistry::register_header(std::string path, HeaderScope scope)
    -> Result<bool, ConfigError> {
    if (sealed_)
        return sealed_error("header '" + path + "'");
    if (path.empty()) {
        return ConfigError::make(ErrorCodes::MALFORMED_ARG, "empty header path");
    }

    TPGEN_LOG_TRACE("registry", "header " << path
                                          << (scope == HeaderScope::Source ? " (source)" : ""));
    headers_.push_back(HeaderRef{std::move(path), scope});
    return true;
}

auto DeclarationRegistry::register_forward_decl(std::string decl) -> Result<bool, ConfigError> {
    if (sealed_)
        return sealed_error("forward declaration '" + decl + "'");
    if (decl.empty()) {
        return ConfigError::make(ErrorCodes::MALFORMED_ARG, "empty forward declaration");
    }

    TPGEN_LOG_TRACE("registry", "forward decl " << decl);
    forward_decls_.push_back(ForwardDecl{std::move(decl)});
    return true;
}

auto DeclarationRegistry::check_tracepoint(const TracepointDecl& decl) const
    -> std::optional<ConfigError> {
    if (sealed_)
        return sealed_error("tracepoint '" + decl.name + "'");

    if (index_.count(decl.name)) {
        return ConfigError::make(ErrorCodes::DUPLICATE_TRACEPOINT,
                                 "tracepoint '" + decl.name + "' is already registered",
                                 decl.name);
    }
    if (toggles_.count(decl.name)) {
        return ConfigError::make(ErrorCodes::DUPLICATE_TRACEPOINT,
                                 "tracepoint '" + decl.name +
                                     "' collides with the scoped event of the same name",
                                 decl.name);
    }
    if (!decl.toggle_name.empty()) {
        const auto* owner = toggle_owning_constant(decl.toggle_name);
        if (owner && *owner != decl.toggle_name) {
            return ConfigError::make(ErrorCodes::DUPLICATE_TRACEPOINT,
                                     "toggle '" + decl.toggle_name +
                                         "' maps to the same constant as toggle '" + *owner + "'",
                                     decl.name);
        }
    }
    if (!decl.perfetto_name.empty() && exports_.count(decl.perfetto_name)) {
        return ConfigError::make(ErrorCodes::DUPLICATE_TRACEPOINT,
                                 "export name '" + decl.perfetto_name + "' is already registered",
                                 decl.name);
    }

    return validate_tracepoint(decl);
}

auto DeclarationRegistry::register_tracepoint(TracepointDecl decl) -> Result<size_t, ConfigError> {
    if (auto err = check_tracepoint(decl)) {
        TPGEN_LOG_DEBUG("registry", "rejected " << decl.name << ": " << err->message);
        return *err;
    }

    size_t pos = tracepoints_.size();
    TPGEN_LOG_DEBUG("registry", "tracepoint #" << pos << " " << decl.name << " ("
                                               << decl.record_fields().size() << " fields)");
    index_.emplace(decl.name, pos);
    if (!decl.toggle_name.empty() && toggles_.insert(decl.toggle_name).second) {
        toggle_order_.push_back(decl.toggle_name);
        toggle_constants_.emplace(upper(decl.toggle_name), decl.toggle_name);
    }
    if (!decl.perfetto_name.empty())
        exports_.insert(decl.perfetto_name);
    tracepoints_.push_back(std::move(decl));
    return pos;
}

auto DeclarationRegistry::headers(HeaderScope scope) const -> std::vector<HeaderRef> {
    std::vector<HeaderRef> out;
    for (const auto& header : headers_) {
        if (header.scope == scope)
            out.push_back(header);
    }
    return out;
}

auto DeclarationRegistry::toggle_owning_constant(const std::string& toggle) const
    -> const std::string* {
    auto it = toggle_constants_.find(upper(toggle));
    if (it == toggle_constants_.end())
        return nullptr;
    return &it->second;
}

auto DeclarationRegistry::find(const std::string& name) const -> const TracepointDecl* {
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tracepoints_[it->second];
}

} // namespace tpgen::model
