//! # Pair Synthesizer Implementation

#include "model/scoped_event.hpp"

#include "log/log.hpp"

namespace tpgen::model {

PairSynthesizer::PairSynthesizer(DeclarationRegistry& registry, std::string export_prefix)
    : registry_(registry), export_prefix_(std::move(export_prefix)) {}

auto PairSynthesizer::export_name(const std::string& tracepoint) const -> std::string {
    if (export_prefix_.empty())
        return tracepoint;
    return export_prefix_ + "_" + tracepoint;
}

auto PairSynthesizer::declare_scoped_event(ScopedEvent event) -> Result<bool, ConfigError> {
    const std::string& name = event.name;

    if (!is_c_identifier(name)) {
        return ConfigError::make(ErrorCodes::INVALID_IDENTIFIER,
                                 "scoped event name '" + name + "' is not a C identifier", name);
    }
    if (registry_.contains(name)) {
        return ConfigError::make(ErrorCodes::DUPLICATE_TRACEPOINT,
                                 "scoped event '" + name + "' collides with a tracepoint", name);
    }
    if (const auto* owner = registry_.toggle_owning_constant(name)) {
        if (*owner == name) {
            return ConfigError::make(ErrorCodes::DUPLICATE_TRACEPOINT,
                                     "toggle '" + name +
                                         "' is already owned by another declaration",
                                     name);
        }
        return ConfigError::make(ErrorCodes::DUPLICATE_TRACEPOINT,
                                 "toggle '" + name + "' maps to the same constant as toggle '" +
                                     *owner + "'",
                                 name);
    }

    TracepointDecl start;
    start.name = start_name(name);
    start.toggle_name = name;
    start.perfetto_name = export_name(start.name);

    TracepointDecl end;
    end.name = end_name(name);
    end.toggle_name = name;
    end.params = std::move(event.params);
    end.args = std::move(event.args);
    end.struct_args = std::move(event.struct_args);
    end.print = std::move(event.print);
    end.perfetto_name = export_name(end.name);

    // Check both halves before registering either.
    if (auto err = registry_.check_tracepoint(start))
        return *err;
    if (auto err = registry_.check_tracepoint(end))
        return *err;

    auto start_result = registry_.register_tracepoint(std::move(start));
    if (is_err(start_result))
        return unwrap_err(start_result);
    auto end_result = registry_.register_tracepoint(std::move(end));
    if (is_err(end_result))
        return unwrap_err(end_result);

    events_.push_back(name);
    if (event.default_enabled) {
        defaults_.push_back(name);
    }

    TPGEN_LOG_DEBUG("synth", "scoped event " << name << " -> " << start_name(name) << ", "
                                             << end_name(name)
                                             << (event.default_enabled ? " [default]" : ""));
    return true;
}

} // namespace tpgen::model
