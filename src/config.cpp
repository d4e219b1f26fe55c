// ═══════════════════════════════════════════════════════════════════
//  config.cpp — Engine option loading
// ═══════════════════════════════════════════════════════════════════

#include "unionpp/config.h"
#include <cstdlib>
#include <stdexcept>

namespace unionpp {

namespace {

bool parseFlag(const std::string& name, const std::string& text) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    throw std::invalid_argument(name + " must be a boolean, got '" + text + "'");
}

std::size_t parseDepth(const std::string& name, const std::string& text) {
    std::size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be a positive integer, got '" + text + "'");
    }
    if (consumed != text.size() || value == 0) {
        throw std::invalid_argument(name + " must be a positive integer, got '" + text + "'");
    }
    return static_cast<std::size_t>(value);
}

} // namespace

EngineOptions EngineOptions::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Engine options must be a JSON object");
    }

    EngineOptions opts;
    for (auto& [key, value] : document.items()) {
        if (key == "strict") {
            if (!value.is_boolean()) throw std::invalid_argument("'strict' must be a boolean");
            opts.strict = value.get<bool>();
        } else if (key == "discriminatorField") {
            if (!value.is_string() || value.get<std::string>().empty()) {
                throw std::invalid_argument("'discriminatorField' must be a non-empty string");
            }
            opts.discriminatorField = value.get<std::string>();
        } else if (key == "maxDepth") {
            if (!value.is_number_integer() || value.get<long long>() <= 0) {
                throw std::invalid_argument("'maxDepth' must be a positive integer");
            }
            opts.maxDepth = value.get<std::size_t>();
        } else if (key == "logLevel") {
            if (!value.is_string()) throw std::invalid_argument("'logLevel' must be a string");
            opts.logLevel = console::parseLevel(value.get<std::string>());
        } else {
            throw std::invalid_argument("Unknown engine option '" + key + "'");
        }
    }
    return opts;
}

EngineOptions& EngineOptions::applyEnvironment() {
    if (const char* v = std::getenv("UNIONPP_STRICT")) {
        strict = parseFlag("UNIONPP_STRICT", v);
    }
    if (const char* v = std::getenv("UNIONPP_DISCRIMINATOR_FIELD"); v && *v) {
        discriminatorField = v;
    }
    if (const char* v = std::getenv("UNIONPP_MAX_DEPTH")) {
        maxDepth = parseDepth("UNIONPP_MAX_DEPTH", v);
    }
    if (const char* v = std::getenv("UNIONPP_LOG_LEVEL")) {
        logLevel = console::parseLevel(v);
    }
    return *this;
}

nlohmann::json EngineOptions::toJson() const {
    return nlohmann::json{
        {"strict", strict},
        {"discriminatorField", discriminatorField},
        {"maxDepth", maxDepth},
        {"logLevel", console::levelName(logLevel)}
    };
}

} // namespace unionpp
