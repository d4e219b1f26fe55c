// ═══════════════════════════════════════════════════════════════════
//  coercion.cpp — Member coercion and nested union recursion
// ═══════════════════════════════════════════════════════════════════

#include "unionpp/coercion.h"
#include "unionpp/resolver.h"
#include "unionpp/strategy.h"
#include <algorithm>

namespace unionpp {

using detail::PathFrame;
using detail::materialize;

// ═══════════════════════════════════════════
//  Public entry points
// ═══════════════════════════════════════════

CoercionResult Coercer::coerce(const ValueNode& node, const MemberRef& member) const {
    CoercionResult result;
    auto value = coerceMember(node, member, nullptr, 0, result.errors);
    if (value && result.errors.empty()) result.value = std::move(value);
    return result;
}

CoercionResult Coercer::coerceValue(const ValueNode& node, const TypeRef& type) const {
    CoercionResult result;
    auto value = coerceAt(node, type, nullptr, 0, result.errors);
    if (value && result.errors.empty()) result.value = std::move(value);
    return result;
}

CoercionResult Coercer::coerceUnion(const ValueNode& node, const InputUnionType& unionType) const {
    CoercionResult result;
    if (node.is_null()) {
        result.errors.push_back(CoercionError::make(
            CoercionCode::NullValue, "expected a value for input union '" + unionType.name() + "'"));
        return result;
    }
    auto value = coerceUnionAt(node, unionType, nullptr, 0, result.errors);
    if (value && result.errors.empty()) result.value = std::move(value);
    return result;
}

ArgumentsResult Coercer::coerceArguments(const ValueNode& arguments,
                                         const std::vector<FieldDef>& definitions) const {
    ArgumentsResult result;
    static const ValueNode empty = ValueNode::object();
    const ValueNode& args = arguments.is_null() ? empty : arguments;

    if (!args.is_object()) {
        result.errors.push_back(CoercionError::make(
            CoercionCode::ExpectedObject, "arguments must be an object, found " + describe(args)));
        return result;
    }

    for (auto& [key, value] : args.items()) {
        bool declared = std::any_of(definitions.begin(), definitions.end(),
                                    [&](const FieldDef& d) { return d.name == key; });
        if (!declared) {
            auto frame = PathFrame::field(nullptr, key);
            result.errors.push_back(CoercionError::make(
                CoercionCode::UnknownField, "argument '" + key + "' is not defined",
                materialize(&frame)));
        }
    }

    for (auto& def : definitions) {
        std::optional<CoercedValue> value;
        if (!coerceField(findMember(args, def.name), def, "arguments", nullptr, 0,
                         result.errors, value)) {
            continue;
        }
        if (value) result.arguments.push_back({def.name, std::move(*value)});
    }
    return result;
}

// ═══════════════════════════════════════════
//  Recursive coercion
// ═══════════════════════════════════════════

std::optional<CoercedValue> Coercer::coerceAt(const ValueNode& node, const TypeRef& type,
                                              const PathFrame* path, std::size_t depth,
                                              std::vector<CoercionError>& errors) const {
    if (depth > schema_.options().maxDepth) {
        errors.push_back(CoercionError::make(
            CoercionCode::DepthExceeded,
            "values may nest at most " + std::to_string(schema_.options().maxDepth) + " levels",
            materialize(path)));
        return std::nullopt;
    }

    if (type.isNonNull()) {
        if (node.is_null()) {
            errors.push_back(CoercionError::make(
                CoercionCode::NullValue,
                "expected non-null value of type '" + type.toString() + "'", materialize(path)));
            return std::nullopt;
        }
        return coerceAt(node, type.ofType(), path, depth, errors);
    }

    if (node.is_null()) return CoercedValue::null();

    if (type.isList()) {
        if (!node.is_array()) {
            // A single value stands for a one-element list
            auto item = coerceAt(node, type.ofType(), path, depth + 1, errors);
            if (!item) return std::nullopt;
            std::vector<CoercedValue> items;
            items.push_back(std::move(*item));
            return CoercedValue::list(std::move(items));
        }

        std::vector<CoercedValue> items;
        items.reserve(node.size());
        bool failed = false;
        for (std::size_t i = 0; i < node.size(); i++) {
            auto frame = PathFrame::element(path, i);
            auto item = coerceAt(node[i], type.ofType(), &frame, depth + 1, errors);
            if (!item) {
                failed = true;
                continue;
            }
            items.push_back(std::move(*item));
        }
        if (failed) return std::nullopt;
        return CoercedValue::list(std::move(items));
    }

    return coerceNamed(node, type.namedType(), path, depth, errors);
}

std::optional<CoercedValue> Coercer::coerceNamed(const ValueNode& node, const std::string& typeName,
                                                 const PathFrame* path, std::size_t depth,
                                                 std::vector<CoercionError>& errors) const {
    if (auto* leaf = schema_.leaf(typeName)) {
        return coerceLeaf(node, *leaf, path, errors);
    }
    if (auto* obj = schema_.inputObject(typeName)) {
        return coerceObject(node, *obj, path, depth, errors, {});
    }
    if (auto* u = schema_.inputUnion(typeName)) {
        return coerceUnionAt(node, *u, path, depth, errors);
    }
    errors.push_back(CoercionError::make(
        CoercionCode::InvalidValue, "type '" + typeName + "' is not defined", materialize(path)));
    return std::nullopt;
}

std::optional<CoercedValue> Coercer::coerceLeaf(const ValueNode& node, const LeafType& leaf,
                                                const PathFrame* path,
                                                std::vector<CoercionError>& errors) const {
    auto parsed = leaf.parse(node);
    if (!parsed) {
        errors.push_back(CoercionError::make(
            CoercionCode::InvalidValue,
            "expected type '" + leaf.name + "', found " + describe(node), materialize(path)));
        return std::nullopt;
    }
    return CoercedValue::leafValue(leaf.name, std::move(*parsed));
}

std::optional<CoercedValue> Coercer::coerceObject(const ValueNode& node, const InputObjectType& type,
                                                  const PathFrame* path, std::size_t depth,
                                                  std::vector<CoercionError>& errors,
                                                  std::string_view excludedField) const {
    if (!node.is_object()) {
        errors.push_back(CoercionError::make(
            CoercionCode::ExpectedObject,
            "expected type '" + type.name() + "' to be an object, found " + describe(node),
            materialize(path)));
        return std::nullopt;
    }

    auto before = errors.size();
    for (auto& [key, value] : node.items()) {
        if (key == excludedField || type.field(key)) continue;
        auto frame = PathFrame::field(path, key);
        errors.push_back(CoercionError::make(
            CoercionCode::UnknownField,
            "field '" + key + "' is not defined by type '" + type.name() + "'",
            materialize(&frame)));
    }

    std::vector<CoercedField> fields;
    fields.reserve(type.fields().size());
    for (auto& def : type.fields()) {
        std::optional<CoercedValue> value;
        if (!coerceField(findMember(node, def.name), def, type.name(), path, depth,
                         errors, value)) {
            continue;
        }
        fields.push_back({def.name, value ? std::move(*value) : CoercedValue::null()});
    }

    if (errors.size() != before) return std::nullopt;
    return CoercedValue::object(type.name(), std::move(fields));
}

bool Coercer::coerceField(const ValueNode* raw, const FieldDef& def, const std::string& owner,
                          const PathFrame* path, std::size_t depth,
                          std::vector<CoercionError>& errors,
                          std::optional<CoercedValue>& out) const {
    auto frame = PathFrame::field(path, def.name);

    if (!raw) {
        if (def.defaultValue) {
            auto value = coerceAt(*def.defaultValue, def.type, &frame, depth + 1, errors);
            if (!value) return false;
            out = std::move(value);
            return true;
        }
        if (def.literal) {
            auto value = coerceAt(*def.literal, def.type, &frame, depth + 1, errors);
            if (!value) return false;
            out = std::move(value);
            return true;
        }
        if (def.type.isNonNull()) {
            errors.push_back(CoercionError::make(
                CoercionCode::MissingRequiredField,
                "field '" + owner + "." + def.name + "' of required type '"
                + def.type.toString() + "' was not provided", materialize(&frame)));
            return false;
        }
        return true;
    }

    auto value = coerceAt(*raw, def.type, &frame, depth + 1, errors);
    if (!value) return false;

    if (def.literal) {
        auto* leaf = schema_.leaf(def.type.namedType());
        auto expected = leaf ? leaf->parse(*def.literal) : std::nullopt;
        if (!expected || !value->isLeaf() || value->leaf != *expected) {
            errors.push_back(CoercionError::make(
                CoercionCode::LiteralMismatch,
                "field '" + owner + "." + def.name + "' must be " + def.literal->dump()
                + ", found " + describe(*raw), materialize(&frame)));
            return false;
        }
    }

    out = std::move(value);
    return true;
}

// ═══════════════════════════════════════════
//  Union recursion
// ═══════════════════════════════════════════

std::optional<CoercedValue> Coercer::coerceMember(const ValueNode& node, const MemberRef& member,
                                                  const PathFrame* path, std::size_t depth,
                                                  std::vector<CoercionError>& errors,
                                                  std::string_view excludedField) const {
    if (depth > schema_.options().maxDepth) {
        errors.push_back(CoercionError::make(
            CoercionCode::DepthExceeded,
            "values may nest at most " + std::to_string(schema_.options().maxDepth) + " levels",
            materialize(path)));
        return std::nullopt;
    }
    if (node.is_null()) {
        errors.push_back(CoercionError::make(
            CoercionCode::NullValue,
            "expected a value of member type '" + member.name() + "'", materialize(path)));
        return std::nullopt;
    }
    if (member.object) return coerceObject(node, *member.object, path, depth, errors, excludedField);
    if (member.leaf) return coerceLeaf(node, *member.leaf, path, errors);
    return coerceUnionAt(node, *member.unionType, path, depth, errors);
}

std::optional<CoercedValue> Coercer::coerceUnionAt(const ValueNode& node, const InputUnionType& unionType,
                                                   const PathFrame* path, std::size_t depth,
                                                   std::vector<CoercionError>& errors) const {
    auto* plan = unionType.plan();
    if (!plan) {
        errors.push_back(CoercionError::make(
            CoercionCode::InvalidValue,
            "input union '" + unionType.name() + "' has no resolution plan", materialize(path)));
        return std::nullopt;
    }

    auto resolved = detail::resolveAt(node, *plan, unionType, *this, path, depth);
    if (!resolved.ok()) {
        for (auto& e : resolved.errors) errors.push_back(std::move(e));
        return std::nullopt;
    }

    CoercedValue value;
    if (resolved.coerced) {
        value = std::move(*resolved.coerced);
    } else if (!resolved.selectedField.empty()) {
        auto frame = PathFrame::field(path, resolved.selectedField);
        auto inner = coerceMember(*resolved.value, *resolved.member, &frame, depth + 1, errors);
        if (!inner) return std::nullopt;
        value = std::move(*inner);
    } else {
        auto inner = coerceMember(*resolved.value, *resolved.member, path, depth, errors,
                                  resolved.excludedField);
        if (!inner) return std::nullopt;
        value = std::move(*inner);
    }

    value.unions.insert(value.unions.begin(),
                        UnionSelection{unionType.name(), std::string(resolved.selectedField)});
    return value;
}

// ═══════════════════════════════════════════
//  Back to raw values
// ═══════════════════════════════════════════

ValueNode Coercer::toValueNode(const CoercedValue& value) const {
    ValueNode node;
    switch (value.kind) {
        case CoercedValue::Kind::Null:
            node = nullptr;
            break;
        case CoercedValue::Kind::Leaf:
            node = value.leaf;
            break;
        case CoercedValue::Kind::List:
            node = ValueNode::array();
            for (auto& item : value.items) node.push_back(toValueNode(item));
            break;
        case CoercedValue::Kind::Object:
            node = ValueNode::object();
            for (auto& f : value.fields) node[f.name] = toValueNode(f.value);
            break;
    }

    // Innermost union first, so wrappers nest the right way round
    for (auto it = value.unions.rbegin(); it != value.unions.rend(); ++it) {
        auto* u = schema_.inputUnion(it->unionName);
        if (!u || !u->plan()) continue;

        if (auto* d = std::get_if<DiscriminatorPlan>(&u->plan()->detail); d && node.is_object()) {
            // Members declaring the reserved name already carry it as a field
            auto* member = schema_.inputObject(value.typeName);
            if (member && member->field(d->fieldName)) continue;

            ValueNode tagged = ValueNode::object();
            tagged[d->fieldName] = value.typeName;
            for (auto& [key, field] : node.items()) tagged[key] = field;
            node = std::move(tagged);
        } else if (u->strategy() == StrategyKind::OneOf) {
            ValueNode wrapped = ValueNode::object();
            wrapped[it->selectedField] = std::move(node);
            node = std::move(wrapped);
        }
    }
    return node;
}

} // namespace unionpp
