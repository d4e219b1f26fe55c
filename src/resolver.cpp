// ═══════════════════════════════════════════════════════════════════
//  resolver.cpp — Per-strategy discrimination of raw input values
// ═══════════════════════════════════════════════════════════════════

#include "unionpp/resolver.h"
#include "unionpp/coercion.h"
#include "unionpp/console.h"
#include <algorithm>
#include <type_traits>

namespace unionpp {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    std::string text;
    for (std::size_t i = 0; i < names.size(); i++) {
        if (i > 0) text += ", ";
        text += names[i];
    }
    return text;
}

// ─────────────────────────────────────────────
//  class Discriminator
//  One resolution of one value; holds only references to the
//  request's value tree and the shared plan.
// ─────────────────────────────────────────────
class Discriminator {
public:
    Discriminator(const ValueNode& node, const ResolutionPlan& plan, const InputUnionType& unionType,
                  const Coercer& coercer, const detail::PathFrame* path, std::size_t depth)
        : node_(node), plan_(plan), union_(unionType), coercer_(coercer), path_(path), depth_(depth) {}

    ResolveResult run() {
        if (!node_.is_object()) return resolveNonObject();

        std::visit([this](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, DiscriminatorPlan>)   byDiscriminator(d);
            else if constexpr (std::is_same_v<T, LiteralTagPlan>) byLiteralTag(d);
            else if constexpr (std::is_same_v<T, OrderedPlan>)    byOrder(d);
            else if constexpr (std::is_same_v<T, StructuralPlan>) byStructure(d);
            else if constexpr (std::is_same_v<T, OneOfPlan>)      byWrapper(d);
        }, plan_.detail);

        if (result_.ok()) {
            console::debug("input union", union_.name(), "resolved to", result_.member->name());
        }
        return std::move(result_);
    }

private:
    const ValueNode& node_;
    const ResolutionPlan& plan_;
    const InputUnionType& union_;
    const Coercer& coercer_;
    const detail::PathFrame* path_;
    std::size_t depth_;
    ResolveResult result_;

    void fail(CoercionCode code, const std::string& text) {
        result_.member.reset();
        result_.errors.push_back(CoercionError::make(code, text, detail::materialize(path_)));
    }

    void select(const MemberRef& member, const ValueNode& value) {
        result_.member = member;
        result_.value = &value;
    }

    // ── Non-object values can only be the sole leaf member ──
    ResolveResult resolveNonObject() {
        if (!plan_.leafMember) {
            fail(CoercionCode::ExpectedObject,
                 "input union '" + union_.name() + "' requires an object, found " + describe(node_));
            return std::move(result_);
        }
        auto& leaf = *plan_.leafMember->leaf;
        if (!leaf.parse(node_)) {
            fail(CoercionCode::InvalidValue,
                 "expected type '" + leaf.name + "' for input union '" + union_.name()
                 + "', found " + describe(node_));
            return std::move(result_);
        }
        select(*plan_.leafMember, node_);
        return std::move(result_);
    }

    // ═══════════════════════════════════════════
    //  Discriminator field
    // ═══════════════════════════════════════════
    void byDiscriminator(const DiscriminatorPlan& d) {
        auto* tag = findMember(node_, d.fieldName);

        if (!tag || tag->is_null()) {
            if (d.defaultMember) {
                selectTagged(d, *d.defaultMember);
                return;
            }
            fail(CoercionCode::MissingDiscriminator,
                 "input union '" + union_.name() + "' requires field '" + d.fieldName + "'");
            return;
        }

        auto it = tag->is_string() ? d.byTypeName.find(tag->get_ref<const std::string&>())
                                   : d.byTypeName.end();
        if (it != d.byTypeName.end()) {
            selectTagged(d, it->second);
            return;
        }

        // A default member declaring the reserved name takes other values as its own field
        if (d.defaultMember && declaresTag(d, *d.defaultMember)) {
            select(*d.defaultMember, node_);
            return;
        }
        if (!tag->is_string()) {
            fail(CoercionCode::UnrecognizedDiscriminator,
                 "field '" + d.fieldName + "' must name a member type, found " + describe(*tag));
            return;
        }
        fail(CoercionCode::UnrecognizedDiscriminator,
             describe(*tag) + " is not a member of input union '" + union_.name() + "'");
    }

    static bool declaresTag(const DiscriminatorPlan& d, const MemberRef& member) {
        return member.object && member.object->field(d.fieldName);
    }

    // The tag is forwarded only to members that declare a field of that name
    void selectTagged(const DiscriminatorPlan& d, const MemberRef& member) {
        select(member, node_);
        if (!declaresTag(d, member)) result_.excludedField = d.fieldName;
    }

    // ═══════════════════════════════════════════
    //  Literal-tag field
    // ═══════════════════════════════════════════
    void byLiteralTag(const LiteralTagPlan& d) {
        auto* tag = findMember(node_, d.fieldName);
        if (!tag || tag->is_null()) {
            fail(CoercionCode::MissingTag,
                 "input union '" + union_.name() + "' requires field '" + d.fieldName + "'");
            return;
        }

        auto parsed = d.tagType->parse(*tag);
        auto it = parsed ? d.byLiteral.find(parsed->dump()) : d.byLiteral.end();
        if (it == d.byLiteral.end()) {
            fail(CoercionCode::UnrecognizedTag,
                 describe(*tag) + " does not tag any member of input union '" + union_.name() + "'");
            return;
        }
        select(it->second, node_);
    }

    // ═══════════════════════════════════════════
    //  Order-based: first member whose trial coercion succeeds
    // ═══════════════════════════════════════════
    void byOrder(const OrderedPlan& d) {
        std::vector<CoercionError> causes;
        for (auto& member : d.members) {
            // Leaf members are tried in place too: custom scalars may accept objects
            std::vector<CoercionError> trial;
            auto value = coercer_.coerceMember(node_, member, path_, depth_, trial);
            if (value && trial.empty()) {
                select(member, node_);
                result_.coerced = std::move(value);
                return;
            }

            auto cause = CoercionError::make(CoercionCode::InvalidValue,
                                             "member '" + member.name() + "' rejected the value",
                                             detail::materialize(path_));
            cause.causes = std::move(trial);
            causes.push_back(std::move(cause));
        }

        fail(CoercionCode::NoMatchingMember,
             "no member of input union '" + union_.name() + "' accepts the value");
        result_.errors.back().causes = std::move(causes);
    }

    // ═══════════════════════════════════════════
    //  Structural uniqueness
    // ═══════════════════════════════════════════
    void byStructure(const StructuralPlan& d) {
        std::set<std::string> present;
        for (auto& [key, value] : node_.items()) {
            if (!value.is_null() && d.requiredUniverse.count(key)) present.insert(key);
        }

        std::vector<const StructuralPlan::Entry*> candidates;
        for (auto& e : d.entries) {
            if (std::includes(present.begin(), present.end(), e.required.begin(), e.required.end())) {
                candidates.push_back(&e);
            }
        }

        // A candidate whose required set is strictly inside another's is less specific
        std::vector<const StructuralPlan::Entry*> maximal;
        for (auto* c : candidates) {
            bool dominated = std::any_of(candidates.begin(), candidates.end(), [&](auto* other) {
                return other != c && other->required.size() > c->required.size() &&
                       std::includes(other->required.begin(), other->required.end(),
                                     c->required.begin(), c->required.end());
            });
            if (!dominated) maximal.push_back(c);
        }

        if (maximal.empty()) {
            fail(CoercionCode::NoMatchingMember,
                 "the fields provided do not include the required fields of any member of input union '"
                 + union_.name() + "'");
            return;
        }
        if (maximal.size() > 1) {
            std::vector<std::string> names;
            for (auto* m : maximal) names.push_back(m->member.name());
            fail(CoercionCode::AmbiguousMember,
                 "value matches members " + joinNames(names) + " of input union '"
                 + union_.name() + "'");
            return;
        }
        select(maximal.front()->member, node_);
    }

    // ═══════════════════════════════════════════
    //  Tagged wrapper (oneOf)
    // ═══════════════════════════════════════════
    void byWrapper(const OneOfPlan& d) {
        std::vector<std::string> selected;
        bool unknown = false;
        for (auto& [key, value] : node_.items()) {
            if (!d.wrapper->field(key)) {
                auto frame = detail::PathFrame::field(path_, key);
                result_.errors.push_back(CoercionError::make(
                    CoercionCode::UnknownField,
                    "field '" + key + "' is not defined by input union '" + union_.name() + "'",
                    detail::materialize(&frame)));
                unknown = true;
                continue;
            }
            if (!value.is_null()) selected.push_back(key);
        }
        if (unknown) return;

        if (selected.empty()) {
            std::vector<std::string> names;
            for (auto& f : d.wrapper->fields()) names.push_back(f.name);
            fail(CoercionCode::NoMemberSelected,
                 "input union '" + union_.name() + "' requires exactly one of "
                 + joinNames(names) + " to be set");
            return;
        }
        if (selected.size() > 1) {
            fail(CoercionCode::MultipleMembersSelected,
                 "fields " + joinNames(selected) + " are all set on input union '"
                 + union_.name() + "'");
            return;
        }

        auto it = d.byField.find(selected.front());
        if (it == d.byField.end()) {
            fail(CoercionCode::NoMemberSelected,
                 "field '" + selected.front() + "' does not select a member of input union '"
                 + union_.name() + "'");
            return;
        }
        result_.selectedField = it->first;
        select(it->second, *findMember(node_, selected.front()));
    }
};

} // namespace

namespace detail {

ResolveResult resolveAt(const ValueNode& node, const ResolutionPlan& plan,
                        const InputUnionType& unionType, const Coercer& coercer,
                        const PathFrame* path, std::size_t depth) {
    return Discriminator(node, plan, unionType, coercer, path, depth).run();
}

} // namespace detail

ResolveResult resolve(const ValueNode& node, const ResolutionPlan& plan,
                      const InputUnionType& unionType, const Coercer& coercer) {
    return detail::resolveAt(node, plan, unionType, coercer, nullptr, 0);
}

ResolveResult resolve(const ValueNode& node, const InputUnionType& unionType, const Schema& schema) {
    if (!unionType.plan()) {
        throw std::logic_error("Input union '" + unionType.name() + "' has no resolution plan");
    }
    Coercer coercer(schema);
    return resolve(node, *unionType.plan(), unionType, coercer);
}

} // namespace unionpp
