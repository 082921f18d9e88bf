#ifndef SRC_LOOM_TYPE_REF_HPP_
#define SRC_LOOM_TYPE_REF_HPP_

#include <memory>
#include <string>

namespace loom {

enum class OperationKind { kQuery, kMutation, kSubscription };

// "query", "mutation" or "subscription".
const char* operationKindName(OperationKind kind);

// A reference to a schema type, possibly wrapped in list and non-null modifiers. TypeRefs are small immutable values;
// the wrapped type is shared between copies.
struct TypeRef {
    enum Kind { kNamed, kList, kNonNull };

    TypeRef() = default;
    ~TypeRef() = default;

    static TypeRef named(std::string typeName);
    static TypeRef listOf(TypeRef itemType);
    static TypeRef nonNull(TypeRef type);

    bool isValid() const { return kind != kNamed || !name.empty(); }
    bool isNonNull() const { return kind == kNonNull; }
    // True if this is a list type, ignoring any outer non-null modifier.
    bool isList() const;

    // Strips one outer non-null modifier, if present.
    TypeRef nullable() const;
    // The wrapped type of a list or non-null TypeRef.
    const TypeRef& inner() const { return *ofType; }
    // The innermost named type.
    const std::string& namedType() const;

    // GraphQL notation, for example "[ID!]!".
    std::string toString() const;

    bool operator==(const TypeRef& other) const;
    bool operator!=(const TypeRef& other) const { return !(*this == other); }

    Kind kind = kNamed;
    std::string name;
    std::shared_ptr<const TypeRef> ofType;
};

} // namespace loom

#endif // SRC_LOOM_TYPE_REF_HPP_
