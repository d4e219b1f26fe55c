#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/kinds.h — Type kinds and discrimination strategy kinds
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>
#include <string_view>

namespace unionpp {

enum class TypeKind { Scalar, Enum, InputObject, InputUnion };

inline const char* typeKindName(TypeKind kind) {
    switch (kind) {
        case TypeKind::Scalar:      return "scalar";
        case TypeKind::Enum:        return "enum";
        case TypeKind::InputObject: return "input object";
        case TypeKind::InputUnion:  return "input union";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
//  enum StrategyKind
//  The closed set of ways an input union picks its member.
// ─────────────────────────────────────────────
enum class StrategyKind {
    Discriminator,  // reserved type-name field, e.g. __typename
    LiteralTag,     // user-chosen field with a fixed literal per member
    Ordered,        // first member in declaration order that coerces
    Structural,     // unique required-field set
    OneOf           // wrapper object with exactly one field set
};

inline const char* strategyName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Discriminator: return "discriminator";
        case StrategyKind::LiteralTag:    return "literalTag";
        case StrategyKind::Ordered:       return "ordered";
        case StrategyKind::Structural:    return "structural";
        case StrategyKind::OneOf:         return "oneOf";
    }
    return "unknown";
}

inline StrategyKind parseStrategy(std::string_view name) {
    if (name == "discriminator") return StrategyKind::Discriminator;
    if (name == "literalTag")    return StrategyKind::LiteralTag;
    if (name == "ordered")       return StrategyKind::Ordered;
    if (name == "structural")    return StrategyKind::Structural;
    if (name == "oneOf")         return StrategyKind::OneOf;
    throw std::invalid_argument("Unknown discrimination strategy '" + std::string(name) + "'");
}

} // namespace unionpp
