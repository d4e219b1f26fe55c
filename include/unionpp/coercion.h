#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/coercion.h — Member coercion and the recursion glue that
//  re-enters discrimination for nested input unions
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    Coercer coercer(*schema);
//    auto result = coercer.coerceValue(node, TypeRef::parse("AnimalInput!"));
//    if (!result.ok()) {
//        auto errors = toJson(result.errors);
//    }
//
// ═══════════════════════════════════════════════════════════════════

#include "coerced_value.h"
#include "errors.h"
#include "path.h"
#include "schema.h"
#include <optional>
#include <string_view>
#include <vector>

namespace unionpp {

struct CoercionResult {
    std::optional<CoercedValue> value;
    std::vector<CoercionError> errors;

    bool ok() const { return value.has_value() && errors.empty(); }
};

struct ArgumentsResult {
    std::vector<CoercedField> arguments;  // successfully coerced arguments only
    std::vector<CoercionError> errors;

    bool ok() const { return errors.empty(); }
    const CoercedValue* argument(std::string_view name) const {
        for (auto& a : arguments) {
            if (a.name == name) return &a.value;
        }
        return nullptr;
    }
};

// ─────────────────────────────────────────────
//  class Coercer
//  Stateless view over an immutable schema. Every method is a pure
//  function of its inputs; one instance may serve many threads.
// ─────────────────────────────────────────────
class Coercer {
public:
    explicit Coercer(const Schema& schema) : schema_(schema) {}

    const Schema& schema() const { return schema_; }

    // Coerce a value already known to represent `member`.
    CoercionResult coerce(const ValueNode& node, const MemberRef& member) const;

    // Coerce a value against any declared type.
    CoercionResult coerceValue(const ValueNode& node, const TypeRef& type) const;

    // Discriminate and coerce a value of an input union.
    CoercionResult coerceUnion(const ValueNode& node, const InputUnionType& unionType) const;

    // Coerce every argument of a field; a failing argument never stops
    // its siblings.
    ArgumentsResult coerceArguments(const ValueNode& arguments,
                                    const std::vector<FieldDef>& definitions) const;

    // Back to a raw value tree, re-emitting discriminator keys and
    // oneOf wrappers so the value resolves to the same members again.
    ValueNode toValueNode(const CoercedValue& value) const;

    // ── Building blocks shared with the resolver ──
    // Errors are appended to `errors`; nothing else is written.

    std::optional<CoercedValue> coerceAt(const ValueNode& node, const TypeRef& type,
                                         const detail::PathFrame* path, std::size_t depth,
                                         std::vector<CoercionError>& errors) const;

    std::optional<CoercedValue> coerceMember(const ValueNode& node, const MemberRef& member,
                                             const detail::PathFrame* path, std::size_t depth,
                                             std::vector<CoercionError>& errors,
                                             std::string_view excludedField = {}) const;

    std::optional<CoercedValue> coerceUnionAt(const ValueNode& node, const InputUnionType& unionType,
                                              const detail::PathFrame* path, std::size_t depth,
                                              std::vector<CoercionError>& errors) const;

private:
    const Schema& schema_;

    std::optional<CoercedValue> coerceNamed(const ValueNode& node, const std::string& typeName,
                                            const detail::PathFrame* path, std::size_t depth,
                                            std::vector<CoercionError>& errors) const;

    std::optional<CoercedValue> coerceLeaf(const ValueNode& node, const LeafType& leaf,
                                           const detail::PathFrame* path,
                                           std::vector<CoercionError>& errors) const;

    std::optional<CoercedValue> coerceObject(const ValueNode& node, const InputObjectType& type,
                                             const detail::PathFrame* path, std::size_t depth,
                                             std::vector<CoercionError>& errors,
                                             std::string_view excludedField) const;

    // Returns false when the field failed; `out` stays untouched then.
    bool coerceField(const ValueNode* raw, const FieldDef& def, const std::string& owner,
                     const detail::PathFrame* path, std::size_t depth,
                     std::vector<CoercionError>& errors, std::optional<CoercedValue>& out) const;
};

} // namespace unionpp
