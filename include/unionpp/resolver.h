#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/resolver.h — Runtime discrimination of input union values
// ═══════════════════════════════════════════════════════════════════

#include "coerced_value.h"
#include "errors.h"
#include "path.h"
#include "schema.h"
#include "strategy.h"
#include <optional>
#include <string_view>
#include <vector>

namespace unionpp {

class Coercer;

// ─────────────────────────────────────────────
//  struct ResolveResult
//  The member a raw value was mapped to, and what member coercion
//  should be handed next.
// ─────────────────────────────────────────────
struct ResolveResult {
    std::optional<MemberRef> member;
    const ValueNode* value = nullptr;      // node to coerce against the member
    std::string_view excludedField;        // discriminator key, not forwarded
    std::string_view selectedField;        // oneOf wrapper field
    std::optional<CoercedValue> coerced;   // winning trial of an ordered union
    std::vector<CoercionError> errors;

    bool ok() const { return member.has_value(); }
};

// Maps `node` to exactly one member of `unionType` using its compiled plan.
ResolveResult resolve(const ValueNode& node, const ResolutionPlan& plan,
                      const InputUnionType& unionType, const Coercer& coercer);

ResolveResult resolve(const ValueNode& node, const InputUnionType& unionType,
                      const Schema& schema);

namespace detail {

// Same as resolve(), with error paths rooted at `path`.
ResolveResult resolveAt(const ValueNode& node, const ResolutionPlan& plan,
                        const InputUnionType& unionType, const Coercer& coercer,
                        const PathFrame* path, std::size_t depth);

} // namespace detail

} // namespace unionpp
