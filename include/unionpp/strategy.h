#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/strategy.h — Build-time strategy validation and the
//  resolution plans it compiles
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "errors.h"
#include "schema.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace unionpp {

// ═══════════════════════════════════════════
//  Per-strategy plans
// ═══════════════════════════════════════════

struct DiscriminatorPlan {
    std::string fieldName;
    std::map<std::string, MemberRef, std::less<>> byTypeName;
    std::optional<MemberRef> defaultMember;
};

struct LiteralTagPlan {
    std::string fieldName;
    const LeafType* tagType = nullptr;
    std::map<std::string, MemberRef> byLiteral;  // keyed by the parsed literal's JSON text
};

struct OrderedPlan {
    std::vector<MemberRef> members;  // declaration order is the match order
};

struct StructuralPlan {
    struct Entry {
        MemberRef member;
        std::set<std::string> required;
        std::set<std::string> fields;  // required and optional
    };
    std::vector<Entry> entries;                          // object members, declaration order
    std::map<std::set<std::string>, MemberRef> byRequiredSet;
    std::set<std::string> requiredUniverse;              // required by at least one member
};

struct OneOfPlan {
    const InputObjectType* wrapper = nullptr;
    std::map<std::string, MemberRef, std::less<>> byField;
};

// ─────────────────────────────────────────────
//  struct ResolutionPlan
//  Compiled once per union; shared read-only by every request.
// ─────────────────────────────────────────────
struct ResolutionPlan {
    std::string unionName;
    StrategyKind strategy = StrategyKind::Ordered;
    std::vector<MemberRef> members;       // effective members, nested unions flattened
    std::optional<MemberRef> leafMember;  // sole leaf member, if any
    std::variant<DiscriminatorPlan, LiteralTagPlan, OrderedPlan, StructuralPlan, OneOfPlan> detail;

    // Stable JSON rendering, for diagnostics and plan comparison
    nlohmann::json describe() const;
};

struct ValidationResult {
    std::shared_ptr<const ResolutionPlan> plan;  // null when any fatal error was found
    std::vector<SchemaError> errors;             // fatal errors and warnings

    bool ok() const { return plan != nullptr; }
};

// Checks one union under its strategy. Pure: the schema is not touched.
// Callers must have excluded unions reported by checkUnionCycles.
ValidationResult validate(const InputUnionType& unionType, const Schema& schema,
                          const EngineOptions& options = {});

// Depth-first search over union membership. Every union on a cycle is
// added to `cyclic`.
std::vector<SchemaError> checkUnionCycles(const Schema& schema, std::set<std::string>& cyclic);

} // namespace unionpp
