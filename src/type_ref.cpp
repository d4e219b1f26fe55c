// ═══════════════════════════════════════════════════════════════════
//  type_ref.cpp — Type reference construction and parsing
// ═══════════════════════════════════════════════════════════════════

#include "unionpp/type_ref.h"
#include <stdexcept>

namespace unionpp {

namespace detail {

class TypeRefParser {
public:
    explicit TypeRefParser(std::string_view source)
        : source_(source), pos_(0) {}

    TypeRef parse() {
        auto result = parseType();
        skipWhitespace();
        if (pos_ != source_.size()) {
            fail("Unexpected '" + std::string(1, source_[pos_]) + "'");
        }
        return result;
    }

private:
    std::string_view source_;
    std::size_t pos_;

    char peek() const {
        return pos_ < source_.size() ? source_[pos_] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < source_.size() && (source_[pos_] == ' ' || source_[pos_] == '\t')) {
            pos_++;
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::invalid_argument("Invalid type reference '" + std::string(source_) + "': "
                                    + what + " at position " + std::to_string(pos_));
    }

    bool isNameStart(char c) const {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool isNameChar(char c) const {
        return isNameStart(c) || (c >= '0' && c <= '9');
    }

    TypeRef parseType() {
        skipWhitespace();
        TypeRef base;
        if (peek() == '[') {
            pos_++;
            auto inner = parseType();
            skipWhitespace();
            if (peek() != ']') fail("Expected ']'");
            pos_++;
            base = TypeRef::listOf(std::move(inner));
        } else if (isNameStart(peek())) {
            std::string name;
            while (pos_ < source_.size() && isNameChar(source_[pos_])) {
                name += source_[pos_++];
            }
            base = TypeRef::named(std::move(name));
        } else {
            fail("Expected type name or '['");
        }

        skipWhitespace();
        if (peek() == '!') {
            pos_++;
            return TypeRef::nonNull(std::move(base));
        }
        return base;
    }
};

} // namespace detail

TypeRef TypeRef::named(std::string name) {
    if (name.empty()) throw std::invalid_argument("Type name must not be empty");
    TypeRef ref;
    ref.kind_ = Kind::Named;
    ref.name_ = std::move(name);
    return ref;
}

TypeRef TypeRef::listOf(TypeRef inner) {
    TypeRef ref;
    ref.kind_ = Kind::List;
    ref.ofType_ = std::make_shared<const TypeRef>(std::move(inner));
    return ref;
}

TypeRef TypeRef::nonNull(TypeRef inner) {
    if (inner.isNonNull()) {
        throw std::invalid_argument("Non-null type '" + inner.toString() + "' cannot be wrapped again");
    }
    TypeRef ref;
    ref.kind_ = Kind::NonNull;
    ref.ofType_ = std::make_shared<const TypeRef>(std::move(inner));
    return ref;
}

TypeRef TypeRef::parse(std::string_view text) {
    return detail::TypeRefParser(text).parse();
}

const TypeRef& TypeRef::ofType() const {
    if (!ofType_) throw std::logic_error("Named type '" + name_ + "' has no inner type");
    return *ofType_;
}

const std::string& TypeRef::namedType() const {
    return ofType_ ? ofType_->namedType() : name_;
}

std::string TypeRef::toString() const {
    switch (kind_) {
        case Kind::Named:   return name_;
        case Kind::List:    return "[" + ofType_->toString() + "]";
        case Kind::NonNull: return ofType_->toString() + "!";
    }
    return name_;
}

bool TypeRef::operator==(const TypeRef& other) const {
    if (kind_ != other.kind_) return false;
    if (kind_ == Kind::Named) return name_ == other.name_;
    return *ofType_ == *other.ofType_;
}

} // namespace unionpp
