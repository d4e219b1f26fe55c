#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/type_ref.h — Declared type references ("[CatInput!]!")
// ═══════════════════════════════════════════════════════════════════

#include <memory>
#include <string>
#include <string_view>

namespace unionpp {

// ─────────────────────────────────────────────
//  class TypeRef
//  A named type wrapped in any number of list and non-null
//  modifiers. Immutable; copies share their inner reference.
// ─────────────────────────────────────────────
class TypeRef {
public:
    enum class Kind { Named, List, NonNull };

    TypeRef() = default;

    static TypeRef named(std::string name);
    static TypeRef listOf(TypeRef inner);
    static TypeRef nonNull(TypeRef inner);

    // Throws std::invalid_argument on malformed syntax.
    static TypeRef parse(std::string_view text);

    Kind kind() const { return kind_; }
    bool isNamed() const { return kind_ == Kind::Named; }
    bool isList() const { return kind_ == Kind::List; }
    bool isNonNull() const { return kind_ == Kind::NonNull; }

    // Inner reference of a List or NonNull
    const TypeRef& ofType() const;

    // Nullable form of this reference (strips one NonNull)
    const TypeRef& nullable() const { return isNonNull() ? *ofType_ : *this; }

    // Innermost named type
    const std::string& namedType() const;

    std::string toString() const;

    bool operator==(const TypeRef& other) const;
    bool operator!=(const TypeRef& other) const { return !(*this == other); }

private:
    Kind kind_ = Kind::Named;
    std::string name_;
    std::shared_ptr<const TypeRef> ofType_;
};

} // namespace unionpp
