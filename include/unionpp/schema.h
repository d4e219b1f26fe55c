#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/schema.h — Immutable schema model: leaf types, input
//  objects and input unions
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    SchemaBuilder builder;
//    builder.inputObject("CatInput")
//        .field("name", "String!")
//        .field("livesLeft", "Int");
//    builder.inputObject("DogInput")
//        .field("name", "String!")
//        .field("breed", "String");
//    builder.inputUnion("AnimalInput", StrategyKind::Discriminator)
//        .members({"CatInput", "DogInput"});
//    auto schema = builder.build();   // throws SchemaBuildError
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "errors.h"
#include "json_utils.h"
#include "kinds.h"
#include "type_ref.h"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unionpp {

struct ResolutionPlan;
class InputUnionType;

// ── Raw value → typed value, or nullopt when rejected ──
using ParseFunction = std::function<std::optional<ValueNode>(const ValueNode&)>;

// ═══════════════════════════════════════════
//  Leaf types (scalars and enums)
// ═══════════════════════════════════════════
struct LeafType {
    std::string name;
    TypeKind kind = TypeKind::Scalar;
    ParseFunction parse;
    std::vector<std::string> enumValues;  // enums only
};

// ═══════════════════════════════════════════
//  Input objects
// ═══════════════════════════════════════════
struct FieldDef {
    std::string name;
    TypeRef type;
    std::optional<ValueNode> defaultValue;
    std::optional<ValueNode> literal;     // fixed value constraint

    bool required() const { return type.isNonNull() && !defaultValue; }
};

class InputObjectType {
public:
    explicit InputObjectType(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    const std::vector<FieldDef>& fields() const { return fields_; }

    const FieldDef* field(std::string_view name) const {
        for (auto& f : fields_) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

private:
    friend class SchemaBuilder;
    std::string name_;
    std::vector<FieldDef> fields_;  // declaration order
};

// ═══════════════════════════════════════════
//  Input unions
// ═══════════════════════════════════════════

// ── One member a union may resolve to ──
struct MemberRef {
    const InputObjectType* object = nullptr;
    const LeafType* leaf = nullptr;
    const InputUnionType* unionType = nullptr;  // oneOf wrapper fields only

    const std::string& name() const;
    TypeKind kind() const;
    bool isObject() const { return object != nullptr; }
    bool isLeaf() const { return leaf != nullptr; }

    bool operator==(const MemberRef&) const = default;
};

struct StrategyConfig {
    std::string fieldName;                    // discriminator key or tag field
    std::optional<std::string> defaultMember; // discriminator only
    std::string wrapperType;                  // oneOf only
};

class InputUnionType {
public:
    InputUnionType(std::string name, StrategyKind strategy)
        : name_(std::move(name)), strategy_(strategy) {}

    const std::string& name() const { return name_; }
    StrategyKind strategy() const { return strategy_; }
    const StrategyConfig& config() const { return config_; }

    // Declared member type names, in declaration order
    const std::vector<std::string>& members() const { return members_; }

    // Compiled at schema build; null only while the schema is being built
    const ResolutionPlan* plan() const { return plan_.get(); }

private:
    friend class SchemaBuilder;
    std::string name_;
    StrategyKind strategy_;
    StrategyConfig config_;
    std::vector<std::string> members_;
    std::shared_ptr<const ResolutionPlan> plan_;
};

// ═══════════════════════════════════════════
//  class Schema
//  Owns every type. Never mutated once built; safe to share
//  across concurrent requests.
// ═══════════════════════════════════════════
class Schema {
public:
    Schema(const Schema&) = delete;
    Schema& operator=(const Schema&) = delete;

    const LeafType* leaf(std::string_view name) const;
    const InputObjectType* inputObject(std::string_view name) const;
    const InputUnionType* inputUnion(std::string_view name) const;
    std::optional<TypeKind> typeKind(std::string_view name) const;

    // Union names in declaration order
    const std::vector<std::string>& unionNames() const { return unionOrder_; }

    // Warning-class errors kept by a non-strict build
    const std::vector<SchemaError>& warnings() const { return warnings_; }

    const EngineOptions& options() const { return options_; }

private:
    friend class SchemaBuilder;
    struct BuildKey { explicit BuildKey() = default; };

public:
    // Only SchemaBuilder can name the key
    explicit Schema(BuildKey) {}

private:

    std::map<std::string, std::unique_ptr<LeafType>, std::less<>> leaves_;
    std::map<std::string, std::unique_ptr<InputObjectType>, std::less<>> objects_;
    std::map<std::string, std::unique_ptr<InputUnionType>, std::less<>> unions_;
    std::vector<std::string> unionOrder_;
    std::vector<SchemaError> warnings_;
    EngineOptions options_;
};

// ═══════════════════════════════════════════
//  Declarations collected by SchemaBuilder
// ═══════════════════════════════════════════
class InputObjectBuilder {
public:
    explicit InputObjectBuilder(std::string name) : name_(std::move(name)) {}

    InputObjectBuilder& field(std::string name, std::string type) {
        fields_.push_back({std::move(name), std::move(type), std::nullopt, std::nullopt});
        return *this;
    }

    // Applies to the most recently declared field
    InputObjectBuilder& defaultValue(ValueNode value) {
        last().defaultValue = std::move(value);
        return *this;
    }

    // Applies to the most recently declared field
    InputObjectBuilder& literal(ValueNode value) {
        last().literal = std::move(value);
        return *this;
    }

    const std::string& name() const { return name_; }

private:
    friend class SchemaBuilder;

    struct FieldDecl {
        std::string name;
        std::string type;
        std::optional<ValueNode> defaultValue;
        std::optional<ValueNode> literal;
    };

    FieldDecl& last() {
        if (fields_.empty()) {
            throw std::logic_error("Input object '" + name_ + "' has no field to modify");
        }
        return fields_.back();
    }

    std::string name_;
    std::vector<FieldDecl> fields_;
};

class InputUnionBuilder {
public:
    InputUnionBuilder(std::string name, StrategyKind strategy)
        : name_(std::move(name)), strategy_(strategy) {}

    InputUnionBuilder& member(std::string name) {
        members_.push_back(std::move(name));
        return *this;
    }

    InputUnionBuilder& members(std::vector<std::string> names) {
        for (auto& n : names) members_.push_back(std::move(n));
        return *this;
    }

    // Discriminator key or literal tag field
    InputUnionBuilder& field(std::string name) {
        config_.fieldName = std::move(name);
        return *this;
    }

    InputUnionBuilder& defaultMember(std::string name) {
        config_.defaultMember = std::move(name);
        return *this;
    }

    InputUnionBuilder& wrapper(std::string inputObject) {
        config_.wrapperType = std::move(inputObject);
        return *this;
    }

    const std::string& name() const { return name_; }

private:
    friend class SchemaBuilder;
    std::string name_;
    StrategyKind strategy_;
    StrategyConfig config_;
    std::vector<std::string> members_;
};

// ═══════════════════════════════════════════
//  class SchemaBuilder
//  Collects declarations, then validates them and compiles a
//  resolution plan for every input union.
// ═══════════════════════════════════════════
class SchemaBuilder {
public:
    SchemaBuilder();  // registers Int, Float, String, Boolean, ID

    SchemaBuilder& scalar(std::string name, ParseFunction parse);
    SchemaBuilder& enumType(std::string name, std::vector<std::string> values);
    InputObjectBuilder& inputObject(std::string name);
    InputUnionBuilder& inputUnion(std::string name, StrategyKind strategy);

    // Throws SchemaBuildError with every collected error.
    std::shared_ptr<const Schema> build(const EngineOptions& options = {}) const;

    // Declarations from a JSON document with "scalars", "enums", "inputs"
    // and "unions" sections. Throws std::invalid_argument when malformed.
    static SchemaBuilder fromJson(const nlohmann::ordered_json& document);

private:
    std::vector<LeafType> leaves_;
    std::deque<InputObjectBuilder> objects_;
    std::deque<InputUnionBuilder> unions_;
};

} // namespace unionpp
