#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/coerced_value.h — Concretely typed coercion results
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <string>
#include <string_view>
#include <vector>

namespace unionpp {

struct CoercedField;

// ── How a value was discriminated through one input union ──
struct UnionSelection {
    std::string unionName;
    std::string selectedField;  // oneOf wrapper field, empty otherwise

    bool operator==(const UnionSelection&) const = default;
};

// ─────────────────────────────────────────────
//  struct CoercedValue
//  The typed result handed to the execution layer. Owned by the
//  caller; never references the request's raw value tree.
// ─────────────────────────────────────────────
struct CoercedValue {
    enum class Kind { Null, Leaf, List, Object };

    Kind kind = Kind::Null;
    std::string typeName;               // member type name for leaves and objects
    ValueNode leaf;                     // Leaf only
    std::vector<CoercedValue> items;    // List only
    std::vector<CoercedField> fields;   // Object only, declaration order
    std::vector<UnionSelection> unions; // outermost union first

    bool isNull() const { return kind == Kind::Null; }
    bool isLeaf() const { return kind == Kind::Leaf; }
    bool isList() const { return kind == Kind::List; }
    bool isObject() const { return kind == Kind::Object; }

    static CoercedValue null();
    static CoercedValue leafValue(std::string type, ValueNode value);
    static CoercedValue list(std::vector<CoercedValue> items);
    static CoercedValue object(std::string type, std::vector<CoercedField> fields);

    const CoercedValue* field(std::string_view name) const;

    // Plain data view, without type or union annotations
    ValueNode toJson() const;
};

struct CoercedField {
    std::string name;
    CoercedValue value;
};

inline CoercedValue CoercedValue::null() {
    return CoercedValue{};
}

inline CoercedValue CoercedValue::leafValue(std::string type, ValueNode value) {
    CoercedValue v;
    v.kind = Kind::Leaf;
    v.typeName = std::move(type);
    v.leaf = std::move(value);
    return v;
}

inline CoercedValue CoercedValue::list(std::vector<CoercedValue> items) {
    CoercedValue v;
    v.kind = Kind::List;
    v.items = std::move(items);
    return v;
}

inline CoercedValue CoercedValue::object(std::string type, std::vector<CoercedField> fields) {
    CoercedValue v;
    v.kind = Kind::Object;
    v.typeName = std::move(type);
    v.fields = std::move(fields);
    return v;
}

inline const CoercedValue* CoercedValue::field(std::string_view name) const {
    for (auto& f : fields) {
        if (f.name == name) return &f.value;
    }
    return nullptr;
}

inline ValueNode CoercedValue::toJson() const {
    switch (kind) {
        case Kind::Null:
            return nullptr;
        case Kind::Leaf:
            return leaf;
        case Kind::List: {
            ValueNode arr = ValueNode::array();
            for (auto& item : items) arr.push_back(item.toJson());
            return arr;
        }
        case Kind::Object: {
            ValueNode obj = ValueNode::object();
            for (auto& f : fields) obj[f.name] = f.value.toJson();
            return obj;
        }
    }
    return nullptr;
}

} // namespace unionpp
