// ═══════════════════════════════════════════════════════════════════
//  schema.cpp — Schema model lookups and SchemaBuilder
// ═══════════════════════════════════════════════════════════════════

#include "unionpp/schema.h"
#include "unionpp/coercion.h"
#include "unionpp/console.h"
#include "unionpp/scalars.h"
#include "unionpp/strategy.h"
#include <set>
#include <stdexcept>

namespace unionpp {

// ═══════════════════════════════════════════
//  MemberRef
// ═══════════════════════════════════════════

const std::string& MemberRef::name() const {
    if (object) return object->name();
    if (leaf) return leaf->name;
    if (unionType) return unionType->name();
    static const std::string none;
    return none;
}

TypeKind MemberRef::kind() const {
    if (object) return TypeKind::InputObject;
    if (leaf) return leaf->kind;
    return TypeKind::InputUnion;
}

// ═══════════════════════════════════════════
//  Schema
// ═══════════════════════════════════════════

const LeafType* Schema::leaf(std::string_view name) const {
    auto it = leaves_.find(name);
    return it == leaves_.end() ? nullptr : it->second.get();
}

const InputObjectType* Schema::inputObject(std::string_view name) const {
    auto it = objects_.find(name);
    return it == objects_.end() ? nullptr : it->second.get();
}

const InputUnionType* Schema::inputUnion(std::string_view name) const {
    auto it = unions_.find(name);
    return it == unions_.end() ? nullptr : it->second.get();
}

std::optional<TypeKind> Schema::typeKind(std::string_view name) const {
    if (auto* l = leaf(name)) return l->kind;
    if (inputObject(name)) return TypeKind::InputObject;
    if (inputUnion(name)) return TypeKind::InputUnion;
    return std::nullopt;
}

// ═══════════════════════════════════════════
//  SchemaBuilder — declarations
// ═══════════════════════════════════════════

SchemaBuilder::SchemaBuilder() : leaves_(scalars::builtins()) {}

SchemaBuilder& SchemaBuilder::scalar(std::string name, ParseFunction parse) {
    leaves_.push_back({std::move(name), TypeKind::Scalar, std::move(parse), {}});
    return *this;
}

SchemaBuilder& SchemaBuilder::enumType(std::string name, std::vector<std::string> values) {
    leaves_.push_back(scalars::makeEnum(std::move(name), std::move(values)));
    return *this;
}

InputObjectBuilder& SchemaBuilder::inputObject(std::string name) {
    objects_.emplace_back(std::move(name));
    return objects_.back();
}

InputUnionBuilder& SchemaBuilder::inputUnion(std::string name, StrategyKind strategy) {
    unions_.emplace_back(std::move(name), strategy);
    return unions_.back();
}

// ═══════════════════════════════════════════
//  SchemaBuilder — build
// ═══════════════════════════════════════════

namespace {

SchemaError typeError(const std::string& typeName, SchemaErrorCode code, std::string message) {
    return SchemaError{typeName, std::nullopt, code, std::move(message), {}, Severity::Error};
}

} // namespace

std::shared_ptr<const Schema> SchemaBuilder::build(const EngineOptions& options) const {
    auto schema = std::make_shared<Schema>(Schema::BuildKey{});
    schema->options_ = options;
    std::vector<SchemaError> errors;
    std::set<std::string> names;

    auto claim = [&](const std::string& name, const char* kind) {
        if (names.insert(name).second) return true;
        errors.push_back(typeError(name, SchemaErrorCode::DuplicateType,
                                   std::string("Type '") + name + "' is declared more than once (as "
                                   + kind + ")"));
        return false;
    };

    // ── Register every type before resolving references ──
    for (auto& leaf : leaves_) {
        if (!claim(leaf.name, typeKindName(leaf.kind))) continue;
        schema->leaves_.emplace(leaf.name, std::make_unique<LeafType>(leaf));
    }
    std::vector<const InputObjectBuilder*> registered;
    for (auto& decl : objects_) {
        if (!claim(decl.name_, "input object")) continue;
        schema->objects_.emplace(decl.name_, std::make_unique<InputObjectType>(decl.name_));
        registered.push_back(&decl);
    }
    for (auto& decl : unions_) {
        if (!claim(decl.name_, "input union")) continue;
        auto u = std::make_unique<InputUnionType>(decl.name_, decl.strategy_);
        u->config_ = decl.config_;
        u->members_ = decl.members_;
        schema->unions_.emplace(decl.name_, std::move(u));
        schema->unionOrder_.push_back(decl.name_);
    }

    // ── Input object fields ──
    for (auto* declared : registered) {
        auto& decl = *declared;
        auto& obj = *schema->objects_.at(decl.name_);

        std::set<std::string> fieldNames;
        for (auto& f : decl.fields_) {
            if (!fieldNames.insert(f.name).second) {
                errors.push_back(typeError(decl.name_, SchemaErrorCode::DuplicateField,
                                           "Field '" + decl.name_ + "." + f.name
                                           + "' is declared more than once"));
                continue;
            }

            TypeRef type;
            try {
                type = TypeRef::parse(f.type);
            } catch (const std::invalid_argument& e) {
                errors.push_back(typeError(decl.name_, SchemaErrorCode::InvalidTypeReference,
                                           "Field '" + decl.name_ + "." + f.name + "': " + e.what()));
                continue;
            }
            if (!schema->typeKind(type.namedType())) {
                errors.push_back(typeError(decl.name_, SchemaErrorCode::UnknownType,
                                           "Field '" + decl.name_ + "." + f.name
                                           + "' refers to undefined type '" + type.namedType() + "'"));
                continue;
            }
            obj.fields_.push_back({f.name, std::move(type), f.defaultValue, f.literal});
        }
    }

    // ── oneOf unions take their members from the wrapper's fields ──
    for (auto& [name, u] : schema->unions_) {
        if (u->strategy_ != StrategyKind::OneOf || !u->members_.empty()) continue;
        if (auto* wrapper = schema->inputObject(u->config_.wrapperType)) {
            for (auto& f : wrapper->fields()) u->members_.push_back(f.type.namedType());
        }
    }

    // ── Literal constraints: leaf-typed, and valid for their own type ──
    Coercer coercer(*schema);
    for (auto& [name, obj] : schema->objects_) {
        for (auto& f : obj->fields()) {
            if (!f.literal) continue;
            auto* leaf = f.type.nullable().isNamed() ? schema->leaf(f.type.namedType()) : nullptr;
            if (!leaf) {
                errors.push_back(typeError(name, SchemaErrorCode::InvalidLiteral,
                                           "Field '" + name + "." + f.name + "' of type '"
                                           + f.type.toString() + "' cannot carry a literal constraint"));
                continue;
            }
            if (f.literal->is_null() || !leaf->parse(*f.literal)) {
                errors.push_back(typeError(name, SchemaErrorCode::InvalidLiteral,
                                           "Literal " + f.literal->dump() + " of field '" + name + "."
                                           + f.name + "' is not a valid '" + leaf->name + "'"));
            }
        }
    }

    // ── Union membership cycles, then one plan per union ──
    std::set<std::string> cyclic;
    for (auto& e : checkUnionCycles(*schema, cyclic)) errors.push_back(std::move(e));

    std::vector<SchemaError> warnings;
    for (auto& name : schema->unionOrder_) {
        if (cyclic.count(name)) continue;
        auto& u = *schema->unions_.at(name);
        auto result = validate(u, *schema, options);
        for (auto& e : result.errors) {
            (e.isWarning() ? warnings : errors).push_back(e);
        }
        u.plan_ = std::move(result.plan);
    }

    // ── Defaults are coerced like client input, unions included ──
    for (auto& [name, obj] : schema->objects_) {
        for (auto& f : obj->fields()) {
            if (!f.defaultValue) continue;
            auto result = coercer.coerceValue(*f.defaultValue, f.type);
            if (result.ok()) continue;
            errors.push_back(typeError(name, SchemaErrorCode::InvalidDefault,
                                       "Default " + f.defaultValue->dump() + " of field '" + name + "."
                                       + f.name + "' is invalid: " + result.errors.front().message));
        }
    }

    // options.logLevel narrows what the build reports; the global level still applies
    auto reports = [&](console::Level level) { return options.logLevel <= level; };

    if (!errors.empty()) {
        if (reports(console::Level::Error)) {
            for (auto& e : errors) console::error(e.typeName + ":", e.message);
        }
        for (auto& e : warnings) errors.push_back(e);
        throw SchemaBuildError(std::move(errors));
    }

    if (reports(console::Level::Warn)) {
        for (auto& w : warnings) console::warn(w.typeName + ":", w.message);
    }
    schema->warnings_ = std::move(warnings);
    if (reports(console::Level::Info)) {
        console::info("schema built with", schema->unionOrder_.size(), "input union(s)");
    }
    return schema;
}

// ═══════════════════════════════════════════
//  SchemaBuilder — JSON declarations
// ═══════════════════════════════════════════
//
//  {
//    "scalars": { "DateTime": "String" },
//    "enums":   { "Breed": ["WHIPPET", "POODLE"] },
//    "inputs":  {
//      "CatInput": {
//        "name":  "String!",
//        "kind":  { "type": "PetKind!", "literal": "CAT" },
//        "lives": { "type": "Int", "default": 9 }
//      }
//    },
//    "unions": {
//      "PetInput": { "strategy": "literalTag", "field": "kind",
//                    "members": ["CatInput", "DogInput"] },
//      "AdoptInput": { "strategy": "oneOf", "wrapper": "AdoptWrapper" }
//    }
//  }
//
// ═══════════════════════════════════════════

namespace {

const nlohmann::ordered_json& section(const nlohmann::ordered_json& document, const char* key) {
    static const nlohmann::ordered_json empty = nlohmann::ordered_json::object();
    auto it = document.find(key);
    if (it == document.end()) return empty;
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("Section '") + key + "' must be an object");
    }
    return *it;
}

std::string stringAt(const nlohmann::ordered_json& value, const std::string& where) {
    if (!value.is_string()) throw std::invalid_argument(where + " must be a string");
    return value.get<std::string>();
}

} // namespace

SchemaBuilder SchemaBuilder::fromJson(const nlohmann::ordered_json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Schema declaration must be a JSON object");
    }
    for (auto& [key, value] : document.items()) {
        if (key != "scalars" && key != "enums" && key != "inputs" && key != "unions") {
            throw std::invalid_argument("Unknown schema section '" + key + "'");
        }
    }

    SchemaBuilder builder;

    for (auto& [name, base] : section(document, "scalars").items()) {
        auto baseName = stringAt(base, "Scalar '" + name + "' base");
        auto parse = scalars::builtinParser(baseName);
        if (!parse) {
            throw std::invalid_argument("Scalar '" + name + "' must be based on a built-in scalar, not '"
                                        + baseName + "'");
        }
        builder.scalar(name, std::move(parse));
    }

    for (auto& [name, values] : section(document, "enums").items()) {
        if (!values.is_array()) throw std::invalid_argument("Enum '" + name + "' must list its values");
        std::vector<std::string> list;
        for (auto& v : values) list.push_back(stringAt(v, "Value of enum '" + name + "'"));
        builder.enumType(name, std::move(list));
    }

    for (auto& [name, fields] : section(document, "inputs").items()) {
        if (!fields.is_object()) throw std::invalid_argument("Input '" + name + "' must be an object");
        auto& obj = builder.inputObject(name);
        for (auto& [fieldName, decl] : fields.items()) {
            auto where = "Field '" + name + "." + fieldName + "'";
            if (decl.is_string()) {
                obj.field(fieldName, decl.get<std::string>());
                continue;
            }
            if (!decl.is_object() || !decl.contains("type")) {
                throw std::invalid_argument(where + " must be a type string or an object with \"type\"");
            }
            obj.field(fieldName, stringAt(decl["type"], where + " type"));
            for (auto& [key, value] : decl.items()) {
                if (key == "type") continue;
                if (key == "default") obj.defaultValue(value);
                else if (key == "literal") obj.literal(value);
                else throw std::invalid_argument(where + " has unknown key '" + key + "'");
            }
        }
    }

    for (auto& [name, decl] : section(document, "unions").items()) {
        if (!decl.is_object() || !decl.contains("strategy")) {
            throw std::invalid_argument("Union '" + name + "' must be an object with \"strategy\"");
        }
        auto& u = builder.inputUnion(name, parseStrategy(stringAt(decl["strategy"], "Union strategy")));
        for (auto& [key, value] : decl.items()) {
            auto where = "Union '" + name + "' " + key;
            if (key == "strategy") continue;
            if (key == "members") {
                if (!value.is_array()) throw std::invalid_argument(where + " must be an array");
                for (auto& m : value) u.member(stringAt(m, where));
            } else if (key == "field") {
                u.field(stringAt(value, where));
            } else if (key == "default") {
                u.defaultMember(stringAt(value, where));
            } else if (key == "wrapper") {
                u.wrapper(stringAt(value, where));
            } else {
                throw std::invalid_argument("Union '" + name + "' has unknown key '" + key + "'");
            }
        }
    }

    return builder;
}

} // namespace unionpp
