#include "loom/TypeRef.hpp"

#include <cassert>

namespace loom {

const char* operationKindName(OperationKind kind) {
    switch (kind) {
    case OperationKind::kQuery:
        return "query";
    case OperationKind::kMutation:
        return "mutation";
    case OperationKind::kSubscription:
        return "subscription";
    }
    return "query";
}

// static
TypeRef TypeRef::named(std::string typeName) {
    TypeRef type;
    type.kind = kNamed;
    type.name = std::move(typeName);
    return type;
}

// static
TypeRef TypeRef::listOf(TypeRef itemType) {
    TypeRef type;
    type.kind = kList;
    type.ofType = std::make_shared<const TypeRef>(std::move(itemType));
    return type;
}

// static
TypeRef TypeRef::nonNull(TypeRef wrapped) {
    // Non-null of non-null is not a valid type, keep the input as-is.
    if (wrapped.kind == kNonNull) {
        return wrapped;
    }
    TypeRef type;
    type.kind = kNonNull;
    type.ofType = std::make_shared<const TypeRef>(std::move(wrapped));
    return type;
}

bool TypeRef::isList() const {
    if (kind == kNonNull) {
        return ofType->kind == kList;
    }
    return kind == kList;
}

TypeRef TypeRef::nullable() const {
    if (kind == kNonNull) {
        return *ofType;
    }
    return *this;
}

const std::string& TypeRef::namedType() const {
    const TypeRef* type = this;
    while (type->kind != kNamed) {
        assert(type->ofType);
        type = type->ofType.get();
    }
    return type->name;
}

std::string TypeRef::toString() const {
    switch (kind) {
    case kNamed:
        return name;
    case kList:
        return "[" + ofType->toString() + "]";
    case kNonNull:
        return ofType->toString() + "!";
    }
    return name;
}

bool TypeRef::operator==(const TypeRef& other) const {
    if (kind != other.kind) {
        return false;
    }
    if (kind == kNamed) {
        return name == other.name;
    }
    return *ofType == *other.ofType;
}

} // namespace loom
