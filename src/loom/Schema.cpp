#include "loom/Schema.hpp"

#include <algorithm>

namespace loom {

const char* typeKindName(TypeKind kind) {
    switch (kind) {
    case TypeKind::kScalar: return "scalar";
    case TypeKind::kObject: return "object";
    case TypeKind::kInterface: return "interface";
    case TypeKind::kUnion: return "union";
    case TypeKind::kEnum: return "enum";
    case TypeKind::kInputObject: return "input object";
    }
    return "unknown";
}

const ArgumentDefinition* Field::findArgument(const std::string& argumentName) const {
    for (const auto& argument : arguments) {
        if (argument.name == argumentName) { return &argument; }
    }
    return nullptr;
}

const Field* Type::findField(const std::string& fieldName) const {
    for (const auto& field : fields) {
        if (field.name == fieldName) { return &field; }
    }
    return nullptr;
}

const ArgumentDefinition* Type::findInputField(const std::string& fieldName) const {
    for (const auto& field : inputFields) {
        if (field.name == fieldName) { return &field; }
    }
    return nullptr;
}

const ArgumentDefinition* DirectiveDefinition::findArgument(const std::string& argumentName) const {
    for (const auto& argument : arguments) {
        if (argument.name == argumentName) { return &argument; }
    }
    return nullptr;
}

Schema::Schema():
    m_queryTypeName("Query"),
    m_mutationTypeName("Mutation"),
    m_subscriptionTypeName("Subscription") {
    m_typenameField.name = "__typename";
    m_typenameField.type = TypeRef::nonNull(TypeRef::named("String"));
}

const Type* Schema::findType(const std::string& typeName) const {
    auto iter = m_types.find(typeName);
    if (iter == m_types.end()) { return nullptr; }
    return &iter->second;
}

const DirectiveDefinition* Schema::findDirective(const std::string& directiveName) const {
    auto iter = m_directives.find(directiveName);
    if (iter == m_directives.end()) { return nullptr; }
    return &iter->second;
}

const Type* Schema::rootType(OperationKind kind) const {
    const Type* type = findType(rootTypeName(kind));
    if (type && type->kind != TypeKind::kObject) { return nullptr; }
    return type;
}

const std::string& Schema::rootTypeName(OperationKind kind) const {
    switch (kind) {
    case OperationKind::kQuery: return m_queryTypeName;
    case OperationKind::kMutation: return m_mutationTypeName;
    case OperationKind::kSubscription: return m_subscriptionTypeName;
    }
    return m_queryTypeName;
}

const Field* Schema::findField(const Type* type, const std::string& fieldName) const {
    if (!type || !type->isComposite()) { return nullptr; }
    if (fieldName == m_typenameField.name) { return &m_typenameField; }
    return type->findField(fieldName);
}

bool Schema::isPossibleType(const std::string& abstractOrObjectTypeName, const std::string& objectTypeName) const {
    if (abstractOrObjectTypeName == objectTypeName) { return true; }
    const Type* type = findType(abstractOrObjectTypeName);
    const Type* objectType = findType(objectTypeName);
    if (!type || !objectType || objectType->kind != TypeKind::kObject) { return false; }
    if (type->kind == TypeKind::kUnion) {
        return std::find(type->members.begin(), type->members.end(), objectTypeName) != type->members.end();
    }
    if (type->kind == TypeKind::kInterface) {
        return std::find(objectType->interfaces.begin(), objectType->interfaces.end(), abstractOrObjectTypeName)
                != objectType->interfaces.end();
    }
    return false;
}

std::vector<std::string> Schema::possibleTypes(const std::string& typeName) const {
    std::vector<std::string> result;
    const Type* type = findType(typeName);
    if (!type) { return result; }
    if (type->kind == TypeKind::kObject) {
        result.emplace_back(typeName);
        return result;
    }
    // m_types is ordered so the result comes out sorted.
    for (const auto& pair : m_types) {
        if (pair.second.kind == TypeKind::kObject && isPossibleType(typeName, pair.first)) {
            result.emplace_back(pair.first);
        }
    }
    return result;
}

bool Schema::typesOverlap(const std::string& typeA, const std::string& typeB) const {
    if (typeA == typeB) { return true; }
    auto possibleA = possibleTypes(typeA);
    auto possibleB = possibleTypes(typeB);
    for (const auto& name : possibleA) {
        if (std::binary_search(possibleB.begin(), possibleB.end(), name)) { return true; }
    }
    return false;
}

bool Schema::isTypeSubtypeOf(const TypeRef& variableType, const TypeRef& locationType) const {
    if (locationType.isNonNull()) {
        if (!variableType.isNonNull()) { return false; }
        return isTypeSubtypeOf(variableType.inner(), locationType.inner());
    }
    if (variableType.isNonNull()) {
        return isTypeSubtypeOf(variableType.inner(), locationType);
    }
    if (locationType.kind == TypeRef::kList) {
        if (variableType.kind != TypeRef::kList) { return false; }
        return isTypeSubtypeOf(variableType.inner(), locationType.inner());
    }
    if (variableType.kind == TypeRef::kList) { return false; }
    return variableType.name == locationType.name;
}

} // namespace loom
