// ═══════════════════════════════════════════════════════════════════
//  strategy.cpp — Strategy validation and resolution plan compilation
// ═══════════════════════════════════════════════════════════════════

#include "unionpp/strategy.h"
#include <algorithm>
#include <functional>
#include <type_traits>

namespace unionpp {

namespace {

std::string joinNames(const std::set<std::string>& names) {
    std::string text = "{";
    bool first = true;
    for (auto& n : names) {
        if (!first) text += ", ";
        first = false;
        text += n;
    }
    return text + "}";
}

// ─────────────────────────────────────────────
//  class PlanCompiler
//  Collects every error for one union instead of stopping at the
//  first, then hands back a plan only when none is fatal.
// ─────────────────────────────────────────────
class PlanCompiler {
public:
    PlanCompiler(const InputUnionType& unionType, const Schema& schema, const EngineOptions& options)
        : union_(unionType), schema_(schema), options_(options) {}

    ValidationResult run() {
        plan_ = std::make_shared<ResolutionPlan>();
        plan_->unionName = union_.name();
        plan_->strategy = union_.strategy();

        if (union_.strategy() == StrategyKind::OneOf) {
            compileOneOf();
        } else {
            collectMembers();
            checkLeafMembers();
            switch (union_.strategy()) {
                case StrategyKind::Discriminator: compileDiscriminator(); break;
                case StrategyKind::LiteralTag:    compileLiteralTag(); break;
                case StrategyKind::Ordered:       compileOrdered(); break;
                case StrategyKind::Structural:    compileStructural(); break;
                case StrategyKind::OneOf:         break;
            }
        }

        ValidationResult result;
        result.errors = std::move(errors_);
        bool fatal = std::any_of(result.errors.begin(), result.errors.end(),
                                 [](const SchemaError& e) { return !e.isWarning(); });
        if (!fatal) result.plan = std::move(plan_);
        return result;
    }

private:
    const InputUnionType& union_;
    const Schema& schema_;
    const EngineOptions& options_;
    std::shared_ptr<ResolutionPlan> plan_;
    std::vector<SchemaError> errors_;

    void report(SchemaErrorCode code, std::string message,
                std::vector<std::string> members = {},
                Severity severity = Severity::Error) {
        errors_.push_back({union_.name(), union_.strategy(), code,
                           std::move(message), std::move(members), severity});
    }

    std::vector<const InputObjectType*> objectMembers() const {
        std::vector<const InputObjectType*> result;
        for (auto& m : plan_->members) {
            if (m.object) result.push_back(m.object);
        }
        return result;
    }

    // ── Flatten nested unions depth-first, in declaration order ──
    void collectMembers() {
        if (union_.members().empty()) {
            report(SchemaErrorCode::EmptyUnion,
                   "Input union '" + union_.name() + "' must declare at least one member");
            return;
        }

        std::set<std::string> onPath{union_.name()};
        std::set<std::string> seen;
        std::function<void(const InputUnionType&)> visit = [&](const InputUnionType& u) {
            for (auto& name : u.members()) {
                if (auto* obj = schema_.inputObject(name)) {
                    addMember(MemberRef{obj, nullptr, nullptr}, seen);
                } else if (auto* leaf = schema_.leaf(name)) {
                    addMember(MemberRef{nullptr, leaf, nullptr}, seen);
                } else if (auto* nested = schema_.inputUnion(name)) {
                    if (onPath.count(name)) {
                        report(SchemaErrorCode::UnionCycle,
                               "Input union '" + u.name() + "' includes '" + name
                               + "' which already contains it", {u.name(), name});
                        continue;
                    }
                    if (nested->strategy() == StrategyKind::OneOf) {
                        report(SchemaErrorCode::IllegalMember,
                               "oneOf union '" + name + "' cannot be flattened into '"
                               + union_.name() + "'", {name});
                        continue;
                    }
                    onPath.insert(name);
                    visit(*nested);
                    onPath.erase(name);
                } else {
                    report(SchemaErrorCode::UnknownType,
                           "Member '" + name + "' of input union '" + u.name() + "' is not defined",
                           {name});
                }
            }
        };
        visit(union_);
    }

    void addMember(MemberRef member, std::set<std::string>& seen) {
        if (!seen.insert(member.name()).second) {
            report(SchemaErrorCode::DuplicateMember,
                   "Member '" + member.name() + "' appears more than once in input union '"
                   + union_.name() + "'", {member.name()});
            return;
        }
        plan_->members.push_back(member);
    }

    // ── Leaf members: none for tagged strategies, at most one otherwise ──
    void checkLeafMembers() {
        std::vector<std::string> leaves;
        for (auto& m : plan_->members) {
            if (m.leaf) leaves.push_back(m.name());
        }
        if (leaves.empty()) return;

        bool tagged = union_.strategy() == StrategyKind::Discriminator ||
                      union_.strategy() == StrategyKind::LiteralTag;
        if (tagged) {
            for (auto& name : leaves) {
                report(SchemaErrorCode::LeafMemberAmbiguity,
                       "Leaf member '" + name + "' cannot carry a " +
                       strategyName(union_.strategy()) + " tag", {name});
            }
            return;
        }
        if (leaves.size() > 1) {
            report(SchemaErrorCode::LeafMemberAmbiguity,
                   "Input union '" + union_.name() + "' has more than one leaf member; "
                   "leaf members cannot be told apart by structure", leaves);
            return;
        }
        for (auto& m : plan_->members) {
            if (m.leaf) plan_->leafMember = m;
        }
    }

    // ═══════════════════════════════════════════
    //  Discriminator field
    // ═══════════════════════════════════════════
    void compileDiscriminator() {
        DiscriminatorPlan detail;
        detail.fieldName = union_.config().fieldName.empty()
            ? options_.discriminatorField
            : union_.config().fieldName;

        // With a default member, members may carry the reserved name as their own field
        bool hasDefault = union_.config().defaultMember.has_value();
        for (auto* obj : objectMembers()) {
            if (!hasDefault && obj->field(detail.fieldName)) {
                report(SchemaErrorCode::ReservedFieldCollision,
                       "Member '" + obj->name() + "' declares field '" + detail.fieldName
                       + "', which is reserved as the discriminator", {obj->name()});
            }
            detail.byTypeName.emplace(obj->name(), MemberRef{obj, nullptr, nullptr});
        }

        if (auto& def = union_.config().defaultMember) {
            auto it = detail.byTypeName.find(*def);
            if (it == detail.byTypeName.end()) {
                report(SchemaErrorCode::UnknownDefaultMember,
                       "Default member '" + *def + "' is not a member of input union '"
                       + union_.name() + "'", {*def});
            } else {
                detail.defaultMember = it->second;
            }
        }
        plan_->detail = std::move(detail);
    }

    // ═══════════════════════════════════════════
    //  Literal-tag field
    // ═══════════════════════════════════════════
    void compileLiteralTag() {
        LiteralTagPlan detail;
        detail.fieldName = union_.config().fieldName;
        if (detail.fieldName.empty()) {
            report(SchemaErrorCode::MissingTagField,
                   "Literal-tag union '" + union_.name() + "' does not name its tag field");
            plan_->detail = std::move(detail);
            return;
        }

        const FieldDef* reference = nullptr;
        const InputObjectType* referenceOwner = nullptr;
        std::map<std::string, std::string> ownerOfLiteral;

        for (auto* obj : objectMembers()) {
            auto* tag = obj->field(detail.fieldName);
            if (!tag) {
                report(SchemaErrorCode::MissingTagField,
                       "Member '" + obj->name() + "' does not declare tag field '"
                       + detail.fieldName + "'", {obj->name()});
                continue;
            }
            if (!tag->literal) {
                report(SchemaErrorCode::MissingTagField,
                       "Tag field '" + obj->name() + "." + detail.fieldName
                       + "' has no literal constraint", {obj->name()});
                continue;
            }

            auto* leaf = tag->type.nullable().isNamed() ? schema_.leaf(tag->type.namedType()) : nullptr;
            if (!leaf) {
                report(SchemaErrorCode::InconsistentTagType,
                       "Tag field '" + obj->name() + "." + detail.fieldName + "' of type '"
                       + tag->type.toString() + "' is not a leaf type", {obj->name()});
                continue;
            }
            if (!reference) {
                reference = tag;
                referenceOwner = obj;
                detail.tagType = leaf;
            } else if (tag->type.namedType() != reference->type.namedType()) {
                report(SchemaErrorCode::InconsistentTagType,
                       "Tag field type '" + tag->type.toString() + "' on '" + obj->name()
                       + "' differs from '" + reference->type.toString() + "' on '"
                       + referenceOwner->name() + "'", {referenceOwner->name(), obj->name()});
                continue;
            }

            // Unparseable literals are reported by the schema-wide literal check
            auto parsed = leaf->parse(*tag->literal);
            if (!parsed) continue;

            auto key = parsed->dump();
            auto [it, inserted] = ownerOfLiteral.emplace(key, obj->name());
            if (!inserted) {
                report(SchemaErrorCode::DuplicateLiteral,
                       "Members '" + it->second + "' and '" + obj->name()
                       + "' share tag literal " + key, {it->second, obj->name()});
                continue;
            }
            detail.byLiteral.emplace(key, MemberRef{obj, nullptr, nullptr});
        }
        plan_->detail = std::move(detail);
    }

    // ═══════════════════════════════════════════
    //  Order-based structural matching
    // ═══════════════════════════════════════════
    static bool structurallyIdentical(const InputObjectType& a, const InputObjectType& b) {
        if (a.fields().size() != b.fields().size()) return false;
        for (auto& fa : a.fields()) {
            auto* fb = b.field(fa.name);
            if (!fb || fa.type != fb->type || fa.literal != fb->literal) return false;
        }
        return true;
    }

    void compileOrdered() {
        OrderedPlan detail;
        detail.members = plan_->members;

        auto objects = objectMembers();
        auto severity = options_.strict ? Severity::Error : Severity::Warning;
        for (std::size_t j = 1; j < objects.size(); j++) {
            for (std::size_t i = 0; i < j; i++) {
                if (!structurallyIdentical(*objects[i], *objects[j])) continue;
                report(SchemaErrorCode::UnreachableMember,
                       "Member '" + objects[j]->name() + "' is structurally identical to '"
                       + objects[i]->name() + "' and can never be selected",
                       {objects[i]->name(), objects[j]->name()}, severity);
                break;
            }
        }
        plan_->detail = std::move(detail);
    }

    // ═══════════════════════════════════════════
    //  Structural uniqueness
    // ═══════════════════════════════════════════
    void compileStructural() {
        StructuralPlan detail;
        for (auto* obj : objectMembers()) {
            StructuralPlan::Entry entry{MemberRef{obj, nullptr, nullptr}, {}, {}};
            for (auto& f : obj->fields()) {
                entry.fields.insert(f.name);
                if (f.required()) {
                    entry.required.insert(f.name);
                    detail.requiredUniverse.insert(f.name);
                }
            }
            detail.entries.push_back(std::move(entry));
        }

        for (std::size_t a = 0; a < detail.entries.size(); a++) {
            for (std::size_t b = 0; b < detail.entries.size(); b++) {
                if (a == b) continue;
                auto& ea = detail.entries[a];
                auto& eb = detail.entries[b];
                if (!std::includes(eb.fields.begin(), eb.fields.end(),
                                   ea.required.begin(), ea.required.end())) {
                    continue;
                }
                report(SchemaErrorCode::AmbiguousMembers,
                       "ambiguous members '" + ea.member.name() + "' and '" + eb.member.name()
                       + "': required fields " + joinNames(ea.required) + " of '"
                       + ea.member.name() + "' are all declared by '" + eb.member.name() + "'",
                       {ea.member.name(), eb.member.name()});
            }
        }

        for (auto& e : detail.entries) {
            detail.byRequiredSet.emplace(e.required, e.member);
        }
        plan_->detail = std::move(detail);
    }

    // ═══════════════════════════════════════════
    //  Tagged wrapper (oneOf)
    // ═══════════════════════════════════════════
    void compileOneOf() {
        OneOfPlan detail;
        auto& wrapperName = union_.config().wrapperType;
        detail.wrapper = schema_.inputObject(wrapperName);
        if (!detail.wrapper) {
            report(SchemaErrorCode::InvalidWrapper,
                   "oneOf union '" + union_.name() + "' wrapper '" + wrapperName
                   + "' is not an input object");
            plan_->detail = std::move(detail);
            return;
        }

        auto& fields = detail.wrapper->fields();
        if (fields.size() < 2) {
            report(SchemaErrorCode::InvalidWrapper,
                   "Wrapper '" + wrapperName + "' must declare at least two fields");
        }

        std::set<std::string> seen;
        std::vector<std::string> implied;
        for (auto& f : fields) {
            if (f.type.isNonNull()) {
                report(SchemaErrorCode::InvalidWrapper,
                       "Wrapper field '" + wrapperName + "." + f.name + "' must be optional");
            }
            if (f.defaultValue) {
                report(SchemaErrorCode::InvalidWrapper,
                       "Wrapper field '" + wrapperName + "." + f.name + "' must not declare a default");
            }
            if (!f.type.nullable().isNamed()) {
                report(SchemaErrorCode::InvalidWrapper,
                       "Wrapper field '" + wrapperName + "." + f.name
                       + "' must reference a named type, not '" + f.type.toString() + "'");
                continue;
            }

            auto& typeName = f.type.namedType();
            implied.push_back(typeName);
            MemberRef member;
            if (auto* obj = schema_.inputObject(typeName)) {
                member.object = obj;
            } else if (auto* nested = schema_.inputUnion(typeName)) {
                member.unionType = nested;
            } else if (schema_.leaf(typeName)) {
                report(SchemaErrorCode::LeafMemberAmbiguity,
                       "Wrapper field '" + wrapperName + "." + f.name + "' selects leaf type '"
                       + typeName + "'; wrap it in an input object", {typeName});
                continue;
            } else {
                report(SchemaErrorCode::UnknownType,
                       "Wrapper field type '" + typeName + "' is not defined", {typeName});
                continue;
            }

            if (!seen.insert(typeName).second) {
                report(SchemaErrorCode::DuplicateMember,
                       "Member '" + typeName + "' is selected by more than one wrapper field",
                       {typeName});
                continue;
            }
            detail.byField.emplace(f.name, member);
            plan_->members.push_back(member);
        }

        if (!union_.members().empty() && union_.members() != implied) {
            report(SchemaErrorCode::InvalidWrapper,
                   "Declared members of '" + union_.name() + "' do not match the fields of wrapper '"
                   + wrapperName + "'");
        }
        plan_->detail = std::move(detail);
    }
};

// ── Member type names an input union points at ──
std::vector<std::string> unionEdges(const InputUnionType& u, const Schema& schema) {
    std::vector<std::string> edges;
    if (u.strategy() == StrategyKind::OneOf) {
        if (auto* wrapper = schema.inputObject(u.config().wrapperType)) {
            for (auto& f : wrapper->fields()) {
                if (schema.inputUnion(f.type.namedType())) edges.push_back(f.type.namedType());
            }
        }
        return edges;
    }
    for (auto& m : u.members()) {
        if (schema.inputUnion(m)) edges.push_back(m);
    }
    return edges;
}

} // namespace

ValidationResult validate(const InputUnionType& unionType, const Schema& schema,
                          const EngineOptions& options) {
    return PlanCompiler(unionType, schema, options).run();
}

std::vector<SchemaError> checkUnionCycles(const Schema& schema, std::set<std::string>& cyclic) {
    enum class Mark { Unvisited, OnPath, Done };
    std::map<std::string, Mark> marks;
    std::vector<std::string> path;
    std::vector<SchemaError> errors;

    std::function<void(const InputUnionType&)> visit = [&](const InputUnionType& u) {
        marks[u.name()] = Mark::OnPath;
        path.push_back(u.name());

        for (auto& next : unionEdges(u, schema)) {
            auto mark = marks.count(next) ? marks[next] : Mark::Unvisited;
            if (mark == Mark::Done) continue;
            if (mark == Mark::OnPath) {
                auto start = std::find(path.begin(), path.end(), next);
                std::vector<std::string> cycle(start, path.end());
                std::string text;
                for (auto& n : cycle) {
                    cyclic.insert(n);
                    text += n + " -> ";
                }
                errors.push_back({u.name(), u.strategy(), SchemaErrorCode::UnionCycle,
                                  "Input union membership forms a cycle: " + text + next,
                                  cycle, Severity::Error});
                continue;
            }
            visit(*schema.inputUnion(next));
        }

        path.pop_back();
        marks[u.name()] = Mark::Done;
    };

    for (auto& name : schema.unionNames()) {
        if (marks.count(name) && marks[name] == Mark::Done) continue;
        visit(*schema.inputUnion(name));
    }
    return errors;
}

// ═══════════════════════════════════════════
//  ResolutionPlan::describe
// ═══════════════════════════════════════════

nlohmann::json ResolutionPlan::describe() const {
    nlohmann::json j = {
        {"union", unionName},
        {"strategy", strategyName(strategy)},
        {"members", nlohmann::json::array()}
    };
    for (auto& m : members) j["members"].push_back(m.name());
    if (leafMember) j["leafMember"] = leafMember->name();

    std::visit([&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, DiscriminatorPlan>) {
            j["field"] = d.fieldName;
            if (d.defaultMember) j["default"] = d.defaultMember->name();
        } else if constexpr (std::is_same_v<T, LiteralTagPlan>) {
            j["field"] = d.fieldName;
            nlohmann::json literals = nlohmann::json::object();
            for (auto& [literal, member] : d.byLiteral) literals[literal] = member.name();
            j["literals"] = literals;
        } else if constexpr (std::is_same_v<T, OrderedPlan>) {
            j["order"] = j["members"];
        } else if constexpr (std::is_same_v<T, StructuralPlan>) {
            nlohmann::json required = nlohmann::json::object();
            for (auto& e : d.entries) required[e.member.name()] = e.required;
            j["required"] = required;
        } else if constexpr (std::is_same_v<T, OneOfPlan>) {
            if (d.wrapper) j["wrapper"] = d.wrapper->name();
            nlohmann::json fields = nlohmann::json::object();
            for (auto& [field, member] : d.byField) fields[field] = member.name();
            j["fields"] = fields;
        }
    }, detail);
    return j;
}

} // namespace unionpp
