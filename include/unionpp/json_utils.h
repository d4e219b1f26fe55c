#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/json_utils.h — Value tree built on nlohmann/json
// ═══════════════════════════════════════════════════════════════════
//  Raw client input arrives as an ordered JSON tree: null, scalars,
//  lists and objects whose keys keep their submission order.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <string>
#include <string_view>
#include <stdexcept>

namespace unionpp {

// ── A raw input value, owned by the request ──
using ValueNode = nlohmann::ordered_json;

// ─────────────────────────────────────────────
//  enum ValueKind
//  The four shapes a raw input can take.
// ─────────────────────────────────────────────
enum class ValueKind { Null, Scalar, List, Object };

inline ValueKind kindOf(const ValueNode& node) {
    if (node.is_null()) return ValueKind::Null;
    if (node.is_array()) return ValueKind::List;
    if (node.is_object()) return ValueKind::Object;
    return ValueKind::Scalar;
}

inline const char* kindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Scalar: return "scalar";
        case ValueKind::List:   return "list";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
//  Concept: ValueConvertible
//  Any C++ value nlohmann::json can turn into a ValueNode.
// ─────────────────────────────────────────────
template <typename T>
concept ValueConvertible = requires(T t) {
    { ValueNode(t) } -> std::convertible_to<ValueNode>;
};

template <ValueConvertible T>
inline ValueNode toValue(const T& value) {
    return ValueNode(value);
}

// ── Compact rendering used inside error messages ──
// Truncation never splits a UTF-8 sequence, so the result stays dumpable.
inline std::string describe(const ValueNode& node, std::size_t maxLength = 64) {
    auto text = node.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > maxLength) {
        auto cut = maxLength - 3;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) cut--;
        text = text.substr(0, cut) + "...";
    }
    return text;
}

// ── Parse JSON text into a value tree ──
inline ValueNode parseValue(std::string_view text) {
    try {
        return ValueNode::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Invalid JSON value: ") + e.what());
    }
}

// ── Object member lookup that never inserts ──
inline const ValueNode* findMember(const ValueNode& object, const std::string& key) {
    if (!object.is_object()) return nullptr;
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

} // namespace unionpp
