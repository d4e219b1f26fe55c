// ═══════════════════════════════════════════════════════════════════
//  scalars.cpp — Built-in scalar parsing
// ═══════════════════════════════════════════════════════════════════

#include "unionpp/scalars.h"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>

namespace unionpp::scalars {

std::optional<ValueNode> parseInt(const ValueNode& raw) {
    if (raw.is_number_unsigned()) {
        auto v = raw.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
            return std::nullopt;
        }
        return ValueNode(static_cast<std::int64_t>(v));
    }
    if (raw.is_number_integer()) {
        auto v = raw.get<std::int64_t>();
        if (v < std::numeric_limits<std::int32_t>::min() ||
            v > std::numeric_limits<std::int32_t>::max()) {
            return std::nullopt;
        }
        return ValueNode(v);
    }
    return std::nullopt;
}

std::optional<ValueNode> parseFloat(const ValueNode& raw) {
    if (!raw.is_number()) return std::nullopt;
    return ValueNode(raw.get<double>());
}

std::optional<ValueNode> parseString(const ValueNode& raw) {
    if (!raw.is_string()) return std::nullopt;
    return raw;
}

std::optional<ValueNode> parseBoolean(const ValueNode& raw) {
    if (!raw.is_boolean()) return std::nullopt;
    return raw;
}

std::optional<ValueNode> parseId(const ValueNode& raw) {
    if (raw.is_string()) return raw;
    if (raw.is_number_unsigned()) return ValueNode(std::to_string(raw.get<std::uint64_t>()));
    if (raw.is_number_integer()) return ValueNode(std::to_string(raw.get<std::int64_t>()));
    return std::nullopt;
}

ParseFunction builtinParser(std::string_view name) {
    if (name == "Int")     return parseInt;
    if (name == "Float")   return parseFloat;
    if (name == "String")  return parseString;
    if (name == "Boolean") return parseBoolean;
    if (name == "ID")      return parseId;
    return nullptr;
}

std::vector<LeafType> builtins() {
    std::vector<LeafType> result;
    for (auto name : {"Int", "Float", "String", "Boolean", "ID"}) {
        result.push_back({name, TypeKind::Scalar, builtinParser(name), {}});
    }
    return result;
}

LeafType makeEnum(std::string name, std::vector<std::string> values) {
    auto allowed = std::make_shared<const std::vector<std::string>>(values);
    ParseFunction parse = [allowed](const ValueNode& raw) -> std::optional<ValueNode> {
        if (!raw.is_string()) return std::nullopt;
        auto& text = raw.get_ref<const std::string&>();
        if (std::find(allowed->begin(), allowed->end(), text) == allowed->end()) {
            return std::nullopt;
        }
        return raw;
    };
    return LeafType{std::move(name), TypeKind::Enum, std::move(parse), std::move(values)};
}

} // namespace unionpp::scalars
