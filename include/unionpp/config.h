#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/config.h — Engine configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Options may be built in code, read from a JSON document, or
//  overridden from the environment:
//
//    auto opts = EngineOptions::fromJson(nlohmann::json::parse(text));
//    opts.applyEnvironment();
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace unionpp {

// ── Engine Options ──
struct EngineOptions {
    bool           strict             = false;         // warnings fail the build
    std::string    discriminatorField = "__typename";  // reserved discriminator key
    std::size_t    maxDepth           = 64;            // deepest accepted input nesting
    console::Level logLevel           = console::Level::Warn;

    // Throws std::invalid_argument on unknown keys or mistyped values.
    static EngineOptions fromJson(const nlohmann::json& document);

    // UNIONPP_STRICT, UNIONPP_DISCRIMINATOR_FIELD, UNIONPP_MAX_DEPTH,
    // UNIONPP_LOG_LEVEL
    EngineOptions& applyEnvironment();

    nlohmann::json toJson() const;
};

} // namespace unionpp
