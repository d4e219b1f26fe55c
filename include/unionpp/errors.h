#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/errors.h — Schema errors (build time) and coercion errors
//  (per request)
// ═══════════════════════════════════════════════════════════════════

#include "kinds.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace unionpp {

// ═══════════════════════════════════════════
//  Schema errors
// ═══════════════════════════════════════════

enum class SchemaErrorCode {
    UnknownType,
    DuplicateType,
    DuplicateField,
    InvalidTypeReference,
    InvalidDefault,
    InvalidLiteral,
    EmptyUnion,
    DuplicateMember,
    UnionCycle,
    IllegalMember,
    LeafMemberAmbiguity,
    ReservedFieldCollision,
    UnknownDefaultMember,
    MissingTagField,
    InconsistentTagType,
    DuplicateLiteral,
    UnreachableMember,
    AmbiguousMembers,
    InvalidWrapper
};

inline const char* schemaErrorCodeName(SchemaErrorCode code) {
    switch (code) {
        case SchemaErrorCode::UnknownType:            return "UNKNOWN_TYPE";
        case SchemaErrorCode::DuplicateType:          return "DUPLICATE_TYPE";
        case SchemaErrorCode::DuplicateField:         return "DUPLICATE_FIELD";
        case SchemaErrorCode::InvalidTypeReference:   return "INVALID_TYPE_REFERENCE";
        case SchemaErrorCode::InvalidDefault:         return "INVALID_DEFAULT";
        case SchemaErrorCode::InvalidLiteral:         return "INVALID_LITERAL";
        case SchemaErrorCode::EmptyUnion:             return "EMPTY_UNION";
        case SchemaErrorCode::DuplicateMember:        return "DUPLICATE_MEMBER";
        case SchemaErrorCode::UnionCycle:             return "UNION_CYCLE";
        case SchemaErrorCode::IllegalMember:          return "ILLEGAL_MEMBER";
        case SchemaErrorCode::LeafMemberAmbiguity:    return "LEAF_MEMBER_AMBIGUITY";
        case SchemaErrorCode::ReservedFieldCollision: return "RESERVED_FIELD_COLLISION";
        case SchemaErrorCode::UnknownDefaultMember:   return "UNKNOWN_DEFAULT_MEMBER";
        case SchemaErrorCode::MissingTagField:        return "MISSING_TAG_FIELD";
        case SchemaErrorCode::InconsistentTagType:    return "INCONSISTENT_TAG_TYPE";
        case SchemaErrorCode::DuplicateLiteral:       return "DUPLICATE_LITERAL";
        case SchemaErrorCode::UnreachableMember:      return "UNREACHABLE_MEMBER";
        case SchemaErrorCode::AmbiguousMembers:       return "AMBIGUOUS_MEMBERS";
        case SchemaErrorCode::InvalidWrapper:         return "INVALID_WRAPPER";
    }
    return "UNKNOWN";
}

enum class Severity { Error, Warning };

// ── A malformed or ambiguous declaration ──
struct SchemaError {
    std::string typeName;                 // union (or type) the rule applies to
    std::optional<StrategyKind> strategy; // set for union-specific rules
    SchemaErrorCode code = SchemaErrorCode::UnknownType;
    std::string message;
    std::vector<std::string> members;     // offending members, if any
    Severity severity = Severity::Error;

    bool isWarning() const { return severity == Severity::Warning; }

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"type", typeName},
            {"code", schemaErrorCodeName(code)},
            {"message", message},
            {"severity", severity == Severity::Warning ? "warning" : "error"}
        };
        if (strategy) j["strategy"] = strategyName(*strategy);
        if (!members.empty()) j["members"] = members;
        return j;
    }

    bool operator==(const SchemaError&) const = default;
};

// ── Thrown when a schema cannot be built ──
class SchemaBuildError : public std::runtime_error {
public:
    explicit SchemaBuildError(std::vector<SchemaError> errors)
        : std::runtime_error(summarize(errors)), errors_(std::move(errors)) {}

    const std::vector<SchemaError>& errors() const { return errors_; }

private:
    std::vector<SchemaError> errors_;

    static std::string summarize(const std::vector<SchemaError>& errors) {
        std::string text = "Schema build failed with " + std::to_string(errors.size()) + " error(s)";
        for (auto& e : errors) {
            text += "\n  " + e.typeName + ": " + e.message;
        }
        return text;
    }
};

// ═══════════════════════════════════════════
//  Coercion errors
// ═══════════════════════════════════════════

enum class CoercionCode {
    ExpectedObject,
    MissingDiscriminator,
    UnrecognizedDiscriminator,
    MissingTag,
    UnrecognizedTag,
    NoMatchingMember,
    AmbiguousMember,
    NoMemberSelected,
    MultipleMembersSelected,
    NullValue,
    MissingRequiredField,
    UnknownField,
    InvalidValue,
    LiteralMismatch,
    DepthExceeded
};

// Stable message stems; every message begins with one.
inline const char* messageStem(CoercionCode code) {
    switch (code) {
        case CoercionCode::ExpectedObject:            return "expected object";
        case CoercionCode::MissingDiscriminator:      return "missing discriminator";
        case CoercionCode::UnrecognizedDiscriminator: return "unrecognized discriminator value";
        case CoercionCode::MissingTag:                return "missing tag field";
        case CoercionCode::UnrecognizedTag:           return "unrecognized tag value";
        case CoercionCode::NoMatchingMember:          return "no matching member";
        case CoercionCode::AmbiguousMember:           return "ambiguous";
        case CoercionCode::NoMemberSelected:          return "no member selected";
        case CoercionCode::MultipleMembersSelected:   return "multiple members selected";
        case CoercionCode::NullValue:                 return "unexpected null";
        case CoercionCode::MissingRequiredField:      return "missing required field";
        case CoercionCode::UnknownField:              return "unknown field";
        case CoercionCode::InvalidValue:              return "invalid value";
        case CoercionCode::LiteralMismatch:           return "literal mismatch";
        case CoercionCode::DepthExceeded:             return "maximum input depth exceeded";
    }
    return "coercion failed";
}

inline const char* coercionCodeName(CoercionCode code) {
    switch (code) {
        case CoercionCode::ExpectedObject:            return "EXPECTED_OBJECT";
        case CoercionCode::MissingDiscriminator:      return "MISSING_DISCRIMINATOR";
        case CoercionCode::UnrecognizedDiscriminator: return "UNRECOGNIZED_DISCRIMINATOR";
        case CoercionCode::MissingTag:                return "MISSING_TAG";
        case CoercionCode::UnrecognizedTag:           return "UNRECOGNIZED_TAG";
        case CoercionCode::NoMatchingMember:          return "NO_MATCHING_MEMBER";
        case CoercionCode::AmbiguousMember:           return "AMBIGUOUS_MEMBER";
        case CoercionCode::NoMemberSelected:          return "NO_MEMBER_SELECTED";
        case CoercionCode::MultipleMembersSelected:   return "MULTIPLE_MEMBERS_SELECTED";
        case CoercionCode::NullValue:                 return "NULL_VALUE";
        case CoercionCode::MissingRequiredField:      return "MISSING_REQUIRED_FIELD";
        case CoercionCode::UnknownField:              return "UNKNOWN_FIELD";
        case CoercionCode::InvalidValue:              return "INVALID_VALUE";
        case CoercionCode::LiteralMismatch:           return "LITERAL_MISMATCH";
        case CoercionCode::DepthExceeded:             return "DEPTH_EXCEEDED";
    }
    return "UNKNOWN";
}

// ── One failure for one submitted value ──
struct CoercionError {
    CoercionCode code = CoercionCode::InvalidValue;
    std::string message;
    nlohmann::json path = nlohmann::json::array();  // field names and list indices
    std::vector<CoercionError> causes;               // per-member trial failures

    static CoercionError make(CoercionCode code, const std::string& detail,
                              nlohmann::json path = nlohmann::json::array()) {
        CoercionError e;
        e.code = code;
        e.message = messageStem(code);
        if (!detail.empty()) e.message += ": " + detail;
        e.path = std::move(path);
        return e;
    }

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"message", message},
            {"path", path},
            {"extensions", {{"code", coercionCodeName(code)}}}
        };
        if (!causes.empty()) {
            nlohmann::json arr = nlohmann::json::array();
            for (auto& c : causes) arr.push_back(c.toJson());
            j["extensions"]["causes"] = arr;
        }
        return j;
    }
};

inline nlohmann::json toJson(const std::vector<CoercionError>& errors) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& e : errors) arr.push_back(e.toJson());
    return arr;
}

inline nlohmann::json toJson(const std::vector<SchemaError>& errors) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& e : errors) arr.push_back(e.toJson());
    return arr;
}

} // namespace unionpp
