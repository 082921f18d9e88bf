#include "loom/IRBuilder.hpp"

#include "loom/AST.hpp"
#include "loom/Config.hpp"
#include "loom/Schema.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <functional>

namespace {

void collectSpreads(const loom::ast::SelectionList& selections, std::vector<std::string>& spreads) {
    for (const auto& selection : selections) {
        switch (selection->selectionType) {
        case loom::ast::SelectionType::kField:
            collectSpreads(static_cast<const loom::ast::FieldSelection*>(selection.get())->selections, spreads);
            break;
        case loom::ast::SelectionType::kFragmentSpread:
            spreads.emplace_back(static_cast<const loom::ast::FragmentSpreadSelection*>(selection.get())->name);
            break;
        case loom::ast::SelectionType::kInlineFragment:
            collectSpreads(static_cast<const loom::ast::InlineFragmentSelection*>(selection.get())->selections,
                    spreads);
            break;
        }
    }
}

loom::ir::Value::Kind irValueKind(loom::ast::Value::Kind kind) {
    switch (kind) {
    case loom::ast::Value::Kind::kVariable: return loom::ir::Value::Kind::kVariable;
    case loom::ast::Value::Kind::kInt: return loom::ir::Value::Kind::kInt;
    case loom::ast::Value::Kind::kFloat: return loom::ir::Value::Kind::kFloat;
    case loom::ast::Value::Kind::kString: return loom::ir::Value::Kind::kString;
    case loom::ast::Value::Kind::kBoolean: return loom::ir::Value::Kind::kBoolean;
    case loom::ast::Value::Kind::kNull: return loom::ir::Value::Kind::kNull;
    case loom::ast::Value::Kind::kEnum: return loom::ir::Value::Kind::kEnum;
    case loom::ast::Value::Kind::kList: return loom::ir::Value::Kind::kList;
    case loom::ast::Value::Kind::kObject: return loom::ir::Value::Kind::kObject;
    }
    return loom::ir::Value::Kind::kNull;
}

// Short rendering of a literal for error messages.
std::string describeValue(const loom::ast::Value& value) {
    switch (value.kind) {
    case loom::ast::Value::Kind::kString: return fmt::format("\"{}\"", value.text);
    case loom::ast::Value::Kind::kList: return "a list";
    case loom::ast::Value::Kind::kObject: return "an object";
    default: return value.text;
    }
}

bool valuesEqual(const loom::ir::Value& a, const loom::ir::Value& b) {
    if (a.kind != b.kind || a.text != b.text || a.fieldNames != b.fieldNames || a.items.size() != b.items.size()) {
        return false;
    }
    for (size_t i = 0; i < a.items.size(); ++i) {
        if (!valuesEqual(a.items[i], b.items[i])) { return false; }
    }
    return true;
}

bool argumentsEqual(const std::vector<loom::ir::Argument>& a, const std::vector<loom::ir::Argument>& b) {
    if (a.size() != b.size()) { return false; }
    for (const auto& argument : a) {
        auto match = std::find_if(b.begin(), b.end(),
                [&argument](const loom::ir::Argument& other) { return other.name == argument.name; });
        if (match == b.end() || !valuesEqual(argument.value, match->value)) { return false; }
    }
    return true;
}

} // namespace

namespace loom {

IRBuilder::IRBuilder(std::shared_ptr<const Schema> schema): m_schema(std::move(schema)) {}

IRBuilder::~IRBuilder() {}

// static
IRBuildResult IRBuilder::build(const ProjectConfig& projectConfig, std::shared_ptr<const Schema> schema,
        const AstSets& astSets) {
    static const std::vector<std::shared_ptr<const ast::ExecutableDocument>> kNoDocuments;

    const auto* documents = &kNoDocuments;
    auto iter = astSets.find(projectConfig.name);
    if (iter != astSets.end()) {
        documents = &iter->second.documents;
    }

    const auto* baseDocuments = &kNoDocuments;
    if (projectConfig.baseProject) {
        auto baseIter = astSets.find(*projectConfig.baseProject);
        if (baseIter != astSets.end()) {
            baseDocuments = &baseIter->second.documents;
        }
    }

    IRBuilder builder(std::move(schema));
    return builder.buildDocuments(*documents, *baseDocuments);
}

IRBuildResult IRBuilder::buildDocuments(const std::vector<std::shared_ptr<const ast::ExecutableDocument>>& documents,
        const std::vector<std::shared_ptr<const ast::ExecutableDocument>>& baseDocuments) {
    collectDefinitions(documents, false);
    collectDefinitions(baseDocuments, true);

    IRResult result;
    for (const auto& document : documents) {
        for (const auto& definition : document->definitions) {
            if (m_acceptedDefinitions.count(definition.get()) == 0) {
                continue;
            }
            ir::DefinitionPtr built;
            if (definition->definitionType == ast::DefinitionType::kOperation) {
                built = buildOperation(static_cast<const ast::OperationDefinition*>(definition.get()),
                        document.get());
            } else {
                built = buildFragment(static_cast<const ast::FragmentDefinition*>(definition.get()), document.get());
            }
            if (built) {
                result.ir.definitions.emplace_back(std::move(built));
            }
        }
    }

    for (const auto& baseFragmentName : reachableBaseFragments()) {
        const auto& source = m_fragments[baseFragmentName];
        auto built = buildFragment(static_cast<const ast::FragmentDefinition*>(source.definition), source.document);
        if (built) {
            result.ir.definitions.emplace_back(std::move(built));
        }
        result.baseFragmentNames.emplace(baseFragmentName);
    }

    checkFragmentCycles();

    for (const auto& definition : result.ir.definitions) {
        if (definition->isOperation()) {
            checkVariables(*definition, m_operationContexts[definition->name]);
        }
    }

    if (!m_diagnostics.empty()) {
        SPDLOG_DEBUG("IR build found {} errors", m_diagnostics.size());
        return std::move(m_diagnostics);
    }

    SPDLOG_DEBUG("Built IR with {} definitions, {} from base project", result.ir.definitions.size(),
            result.baseFragmentNames.size());
    return result;
}

void IRBuilder::collectDefinitions(const std::vector<std::shared_ptr<const ast::ExecutableDocument>>& documents,
        bool isBase) {
    for (const auto& document : documents) {
        for (const auto& definition : document->definitions) {
            bool isFragment = definition->definitionType == ast::DefinitionType::kFragment;

            if (isBase) {
                // The base project checks its own documents, only its fragments are visible here.
                if (!isFragment) { continue; }
                auto existing = m_fragments.find(definition->name);
                if (existing != m_fragments.end()) {
                    if (!existing->second.isBase) {
                        addError(fmt::format("Fragment '{}' is already defined by the base project",
                                definition->name), std::vector<Location>{ existing->second.definition->nameLocation,
                                definition->nameLocation });
                    }
                    continue;
                }
                m_fragments.emplace(definition->name, SourceDefinition{ definition.get(), document.get(), true });
                continue;
            }

            if (definition->name.empty()) {
                addError("Anonymous operations are not supported, every operation must have a name",
                        definition->location);
                continue;
            }

            auto existing = m_definitionNames.find(definition->name);
            if (existing != m_definitionNames.end()) {
                addError(fmt::format("Duplicate definitions named '{}'", definition->name),
                        std::vector<Location>{ definition->nameLocation, existing->second });
                continue;
            }
            m_definitionNames.emplace(definition->name, definition->nameLocation);
            m_acceptedDefinitions.insert(definition.get());

            if (isFragment) {
                m_fragments.emplace(definition->name, SourceDefinition{ definition.get(), document.get(), false });
            }
        }
    }
}

std::vector<std::string> IRBuilder::reachableBaseFragments() const {
    std::set<std::string> reached;
    std::vector<std::string> pending;

    for (const auto* definition : m_acceptedDefinitions) {
        collectSpreads(definition->selections, pending);
    }

    while (!pending.empty()) {
        auto name = std::move(pending.back());
        pending.pop_back();
        auto iter = m_fragments.find(name);
        if (iter == m_fragments.end()) { continue; }
        if (iter->second.isBase) {
            if (!reached.insert(name).second) { continue; }
            collectSpreads(iter->second.definition->selections, pending);
        }
    }

    return std::vector<std::string>(reached.begin(), reached.end());
}

ir::DefinitionPtr IRBuilder::buildOperation(const ast::OperationDefinition* operation,
        const ast::ExecutableDocument* document) {
    const Type* rootType = m_schema->rootType(operation->operationKind);
    if (!rootType) {
        addError(fmt::format("Schema does not define a {} root type", operationKindName(operation->operationKind)),
                operation->location);
        return nullptr;
    }

    auto definition = std::make_shared<ir::Definition>();
    definition->kind = ir::DefinitionKind::kOperation;
    definition->name = operation->name;
    definition->operationKind = operation->operationKind;
    definition->typeCondition = rootType->name;
    definition->location = operation->location;
    definition->nameLocation = operation->nameLocation;
    definition->sourcePath = document->path;

    for (const auto& variable : operation->variables) {
        auto duplicate = std::find_if(definition->variables.begin(), definition->variables.end(),
                [&variable](const ir::VariableDefinition& v) { return v.name == variable.name; });
        if (duplicate != definition->variables.end()) {
            addError(fmt::format("Duplicate variable '${}'", variable.name),
                    std::vector<Location>{ variable.location, duplicate->location });
            continue;
        }

        const Type* type = m_schema->findType(variable.type.namedType());
        if (!type) {
            addError(fmt::format("Unknown type '{}'", variable.type.namedType()), variable.typeLocation);
            continue;
        }
        if (!type->isInput()) {
            addError(fmt::format("Variable '${}' cannot be of non input type '{}'", variable.name,
                    variable.type.toString()), variable.typeLocation);
            continue;
        }

        ir::VariableDefinition irVariable;
        irVariable.name = variable.name;
        irVariable.type = variable.type;
        irVariable.location = variable.location;
        if (variable.defaultValue) {
            irVariable.defaultValue = buildConstValue(*variable.defaultValue, variable.type);
        }
        definition->variables.emplace_back(std::move(irVariable));
    }

    DefinitionContext context;
    context.definitionName = operation->name;
    definition->directives = buildDirectives(operation->directives, context);
    definition->selections = buildSelections(operation->selections, rootType, context);
    m_operationContexts[operation->name] = std::move(context);

    return definition;
}

ir::DefinitionPtr IRBuilder::buildFragment(const ast::FragmentDefinition* fragment,
        const ast::ExecutableDocument* document) {
    const Type* type = m_schema->findType(fragment->typeCondition);
    if (!type) {
        addError(fmt::format("Unknown type '{}'", fragment->typeCondition), fragment->typeConditionLocation);
        return nullptr;
    }
    if (!type->isComposite()) {
        addError(fmt::format("Fragment '{}' cannot condition on non composite type '{}'", fragment->name,
                fragment->typeCondition), fragment->typeConditionLocation);
        return nullptr;
    }

    auto definition = std::make_shared<ir::Definition>();
    definition->kind = ir::DefinitionKind::kFragment;
    definition->name = fragment->name;
    definition->typeCondition = fragment->typeCondition;
    definition->location = fragment->location;
    definition->nameLocation = fragment->nameLocation;
    definition->sourcePath = document->path;

    DefinitionContext context;
    context.definitionName = fragment->name;
    definition->directives = buildDirectives(fragment->directives, context);
    definition->selections = buildSelections(fragment->selections, type, context);
    m_fragmentContexts[fragment->name] = std::move(context);

    return definition;
}

ir::Selections IRBuilder::buildSelections(const std::vector<std::unique_ptr<ast::Selection>>& selections,
        const Type* parentType, DefinitionContext& context) {
    ir::Selections result;
    for (const auto& selection : selections) {
        auto built = buildSelection(selection.get(), parentType, context);
        if (built) {
            result.emplace_back(std::move(built));
        }
    }
    checkConflicts(result);
    return result;
}

ir::SelectionPtr IRBuilder::buildSelection(const ast::Selection* selection, const Type* parentType,
        DefinitionContext& context) {
    switch (selection->selectionType) {
    case ast::SelectionType::kField: {
        const auto* astField = static_cast<const ast::FieldSelection*>(selection);
        const Field* fieldDefinition = m_schema->findField(parentType, astField->name);
        if (!fieldDefinition) {
            addError(fmt::format("Unknown field '{}' on type '{}'", astField->name, parentType->name),
                    astField->nameLocation);
            return nullptr;
        }
        const Type* fieldType = m_schema->findType(fieldDefinition->type.namedType());
        assert(fieldType);

        auto ownerDescription = fmt::format("field '{}.{}'", parentType->name, astField->name);
        auto arguments = buildArguments(astField->arguments, fieldDefinition->arguments, ownerDescription,
                astField->nameLocation, context);
        auto directives = buildDirectives(astField->directives, context);
        bool isClientExtension = fieldDefinition->isExtension || parentType->isExtension;

        if (fieldType->isLeaf()) {
            if (astField->hasSelectionSet) {
                addError(fmt::format("Field '{}' of type '{}' must not have a selection since '{}' has no subfields",
                        astField->name, fieldDefinition->type.toString(), fieldType->name), astField->location);
                return nullptr;
            }
            auto field = std::make_shared<ir::ScalarField>(astField->location);
            field->alias = astField->alias;
            field->name = astField->name;
            field->arguments = std::move(arguments);
            field->directives = std::move(directives);
            field->type = fieldDefinition->type;
            field->parentType = parentType->name;
            field->isClientExtension = isClientExtension;
            return field;
        }

        if (!astField->hasSelectionSet) {
            addError(fmt::format("Field '{}' of type '{}' must have a selection of subfields", astField->name,
                    fieldDefinition->type.toString()), astField->nameLocation);
            return nullptr;
        }
        auto field = std::make_shared<ir::LinkedField>(astField->location);
        field->alias = astField->alias;
        field->name = astField->name;
        field->arguments = std::move(arguments);
        field->directives = std::move(directives);
        field->type = fieldDefinition->type;
        field->parentType = parentType->name;
        field->isClientExtension = isClientExtension;
        field->selections = buildSelections(astField->selections, fieldType, context);
        return field;
    }

    case ast::SelectionType::kFragmentSpread: {
        const auto* astSpread = static_cast<const ast::FragmentSpreadSelection*>(selection);
        context.spreads.emplace_back(std::make_pair(astSpread->name, astSpread->nameLocation));
        auto iter = m_fragments.find(astSpread->name);
        if (iter == m_fragments.end()) {
            addError(fmt::format("Unknown fragment '{}'", astSpread->name), astSpread->nameLocation);
            return nullptr;
        }
        const auto* fragment = static_cast<const ast::FragmentDefinition*>(iter->second.definition);
        if (m_schema->findType(fragment->typeCondition)
                && !m_schema->typesOverlap(parentType->name, fragment->typeCondition)) {
            addError(fmt::format("Fragment '{}' cannot be spread here as objects of type '{}' can never be of "
                    "type '{}'", astSpread->name, parentType->name, fragment->typeCondition), astSpread->location);
            return nullptr;
        }
        auto spread = std::make_shared<ir::FragmentSpread>(astSpread->location);
        spread->fragmentName = astSpread->name;
        spread->directives = buildDirectives(astSpread->directives, context);
        return spread;
    }

    case ast::SelectionType::kInlineFragment: {
        const auto* astInline = static_cast<const ast::InlineFragmentSelection*>(selection);
        const Type* type = parentType;
        if (!astInline->typeCondition.empty()) {
            type = m_schema->findType(astInline->typeCondition);
            if (!type) {
                addError(fmt::format("Unknown type '{}'", astInline->typeCondition),
                        astInline->typeConditionLocation);
                return nullptr;
            }
            if (!type->isComposite()) {
                addError(fmt::format("Inline fragment cannot condition on non composite type '{}'", type->name),
                        astInline->typeConditionLocation);
                return nullptr;
            }
            if (!m_schema->typesOverlap(parentType->name, type->name)) {
                addError(fmt::format("Inline fragment cannot be spread here as objects of type '{}' can never be "
                        "of type '{}'", parentType->name, type->name), astInline->typeConditionLocation);
                return nullptr;
            }
        }
        auto inlineFragment = std::make_shared<ir::InlineFragment>(astInline->location);
        inlineFragment->typeCondition = astInline->typeCondition;
        inlineFragment->directives = buildDirectives(astInline->directives, context);
        inlineFragment->selections = buildSelections(astInline->selections, type, context);
        return inlineFragment;
    }
    }

    assert(false);
    return nullptr;
}

std::vector<ir::Argument> IRBuilder::buildArguments(const std::vector<ast::Argument>& arguments,
        const std::vector<ArgumentDefinition>& definitions, const std::string& ownerDescription,
        const Location& ownerLocation, DefinitionContext& context) {
    std::vector<ir::Argument> result;
    std::set<std::string> seen;

    for (const auto& argument : arguments) {
        if (!seen.insert(argument.name).second) {
            addError(fmt::format("Duplicate argument '{}' on {}", argument.name, ownerDescription),
                    argument.nameLocation);
            continue;
        }
        auto definition = std::find_if(definitions.begin(), definitions.end(),
                [&argument](const ArgumentDefinition& d) { return d.name == argument.name; });
        if (definition == definitions.end()) {
            addError(fmt::format("Unknown argument '{}' on {}", argument.name, ownerDescription),
                    argument.nameLocation);
            continue;
        }
        ir::Argument irArgument;
        irArgument.name = argument.name;
        irArgument.value = buildValue(argument.value, definition->type, definition->hasDefault, context);
        irArgument.location = argument.location;
        result.emplace_back(std::move(irArgument));
    }

    for (const auto& definition : definitions) {
        if (definition.type.isNonNull() && !definition.hasDefault && seen.count(definition.name) == 0) {
            addError(fmt::format("Missing required argument '{}' on {}", definition.name, ownerDescription),
                    ownerLocation);
        }
    }

    return result;
}

std::vector<ir::Directive> IRBuilder::buildDirectives(const std::vector<ast::Directive>& directives,
        DefinitionContext& context) {
    std::vector<ir::Directive> result;
    for (const auto& directive : directives) {
        const DirectiveDefinition* definition = m_schema->findDirective(directive.name);
        if (!definition) {
            addError(fmt::format("Unknown directive '@{}'", directive.name), directive.location);
            continue;
        }
        ir::Directive irDirective;
        irDirective.name = directive.name;
        irDirective.location = directive.location;
        irDirective.arguments = buildArguments(directive.arguments, definition->arguments,
                fmt::format("directive '@{}'", directive.name), directive.location, context);
        result.emplace_back(std::move(irDirective));
    }
    return result;
}

ir::Value IRBuilder::buildValue(const ast::Value& value, const TypeRef& expectedType, bool positionHasDefault,
        DefinitionContext& context) {
    ir::Value result;
    result.kind = irValueKind(value.kind);
    result.text = value.text;
    result.type = expectedType;
    result.location = value.location;

    if (value.kind == ast::Value::Kind::kVariable) {
        context.variableUsages.emplace_back(VariableUsage{ value.text, expectedType, positionHasDefault,
                value.location });
        return result;
    }

    if (value.kind == ast::Value::Kind::kNull) {
        if (expectedType.isNonNull()) {
            addError(fmt::format("Expected a non-null value of type '{}', found null", expectedType.toString()),
                    value.location);
        }
        return result;
    }

    TypeRef nullableType = expectedType.nullable();
    if (nullableType.kind == TypeRef::kList) {
        if (value.kind != ast::Value::Kind::kList) {
            // Input coercion accepts a single item where a list is expected.
            return buildValue(value, nullableType.inner(), false, context);
        }
        for (const auto& item : value.items) {
            result.items.emplace_back(buildValue(item, nullableType.inner(), false, context));
        }
        return result;
    }

    const Type* type = m_schema->findType(nullableType.namedType());
    if (value.kind == ast::Value::Kind::kList) {
        addError(fmt::format("Expected a value of type '{}', found a list", expectedType.toString()),
                value.location);
        return result;
    }

    if (value.kind == ast::Value::Kind::kObject) {
        if (!type || type->kind != TypeKind::kInputObject) {
            addError(fmt::format("Expected a value of type '{}', found an object", expectedType.toString()),
                    value.location);
            return result;
        }
        std::set<std::string> seen;
        for (const auto& field : value.fields) {
            if (!seen.insert(field.name).second) {
                addError(fmt::format("Duplicate field '{}' in input object value", field.name), field.nameLocation);
                continue;
            }
            const ArgumentDefinition* fieldDefinition = type->findInputField(field.name);
            if (!fieldDefinition) {
                addError(fmt::format("Unknown field '{}' on input type '{}'", field.name, type->name),
                        field.nameLocation);
                continue;
            }
            result.fieldNames.emplace_back(field.name);
            result.items.emplace_back(buildValue(field.value, fieldDefinition->type, fieldDefinition->hasDefault,
                    context));
        }
        for (const auto& inputField : type->inputFields) {
            if (inputField.type.isNonNull() && !inputField.hasDefault && seen.count(inputField.name) == 0) {
                addError(fmt::format("Missing required field '{}' of input type '{}'", inputField.name, type->name),
                        value.location);
            }
        }
        return result;
    }

    if (!checkScalarValue(value, type)) {
        addError(fmt::format("Expected a value of type '{}', found {}", expectedType.toString(),
                describeValue(value)), value.location);
    }
    return result;
}

ir::Value IRBuilder::buildConstValue(const ast::Value& value, const TypeRef& expectedType) {
    // The Parser rejects variables in constant positions, so no usage will be recorded here.
    DefinitionContext context;
    return buildValue(value, expectedType, false, context);
}

bool IRBuilder::checkScalarValue(const ast::Value& value, const Type* type) {
    if (!type) { return false; }

    if (type->kind == TypeKind::kEnum) {
        return value.kind == ast::Value::Kind::kEnum
                && std::find(type->enumValues.begin(), type->enumValues.end(), value.text) != type->enumValues.end();
    }
    if (type->kind != TypeKind::kScalar) { return false; }

    if (type->name == "Int") { return value.kind == ast::Value::Kind::kInt; }
    if (type->name == "Float") {
        return value.kind == ast::Value::Kind::kInt || value.kind == ast::Value::Kind::kFloat;
    }
    if (type->name == "String") { return value.kind == ast::Value::Kind::kString; }
    if (type->name == "Boolean") { return value.kind == ast::Value::Kind::kBoolean; }
    if (type->name == "ID") {
        return value.kind == ast::Value::Kind::kString || value.kind == ast::Value::Kind::kInt;
    }
    // Custom scalars accept any literal.
    return true;
}

void IRBuilder::checkConflicts(const ir::Selections& selections) {
    std::map<std::string, const ir::Field*> fieldsByKey;
    for (const auto& selection : selections) {
        if (!selection->isField()) { continue; }
        const auto* field = static_cast<const ir::Field*>(selection.get());
        auto iter = fieldsByKey.find(field->responseKey());
        if (iter == fieldsByKey.end()) {
            fieldsByKey.emplace(field->responseKey(), field);
            continue;
        }
        const auto* other = iter->second;
        if (other->name != field->name) {
            addError(fmt::format("Fields '{}' conflict because '{}' and '{}' are different fields",
                    field->responseKey(), other->name, field->name),
                    std::vector<Location>{ field->location, other->location });
        } else if (!argumentsEqual(other->arguments, field->arguments)) {
            addError(fmt::format("Fields '{}' conflict because they have differing arguments", field->responseKey()),
                    std::vector<Location>{ field->location, other->location });
        } else if (other->kind != field->kind) {
            addError(fmt::format("Fields '{}' conflict because they return different types", field->responseKey()),
                    std::vector<Location>{ field->location, other->location });
        }
    }
}

void IRBuilder::checkFragmentCycles() {
    std::set<std::string> reported;

    for (const auto& pair : m_fragments) {
        const auto& fragmentName = pair.first;
        if (reported.count(fragmentName)) { continue; }
        auto contextIter = m_fragmentContexts.find(fragmentName);
        if (contextIter == m_fragmentContexts.end()) { continue; }

        std::set<std::string> visited;
        std::vector<std::string> path;
        Location cycleLocation;

        std::function<bool(const std::string&)> visit = [&](const std::string& current) -> bool {
            auto iter = m_fragmentContexts.find(current);
            if (iter == m_fragmentContexts.end()) { return false; }
            for (const auto& spread : iter->second.spreads) {
                if (current == fragmentName) {
                    cycleLocation = spread.second;
                }
                if (spread.first == fragmentName) {
                    return true;
                }
                if (!visited.insert(spread.first).second) { continue; }
                path.emplace_back(spread.first);
                if (visit(spread.first)) { return true; }
                path.pop_back();
            }
            return false;
        };

        if (!visit(fragmentName)) { continue; }

        reported.insert(fragmentName);
        reported.insert(path.begin(), path.end());
        if (path.empty()) {
            addError(fmt::format("Cannot spread fragment '{}' within itself", fragmentName), cycleLocation);
        } else {
            std::string via;
            for (const auto& name : path) {
                via += fmt::format("{}'{}'", via.empty() ? "" : ", ", name);
            }
            addError(fmt::format("Cannot spread fragment '{}' within itself via {}", fragmentName, via),
                    cycleLocation);
        }
    }
}

void IRBuilder::checkVariables(const ir::Definition& operation, const DefinitionContext& context) {
    std::vector<const VariableUsage*> usages;
    for (const auto& usage : context.variableUsages) {
        usages.emplace_back(&usage);
    }

    // Fragments use the variables of the operation they are spread in.
    std::set<std::string> visited;
    std::vector<std::string> pending;
    for (const auto& spread : context.spreads) {
        pending.emplace_back(spread.first);
    }
    while (!pending.empty()) {
        auto name = std::move(pending.back());
        pending.pop_back();
        if (!visited.insert(name).second) { continue; }
        auto iter = m_fragmentContexts.find(name);
        if (iter == m_fragmentContexts.end()) { continue; }
        for (const auto& usage : iter->second.variableUsages) {
            usages.emplace_back(&usage);
        }
        for (const auto& spread : iter->second.spreads) {
            pending.emplace_back(spread.first);
        }
    }

    for (const auto* usage : usages) {
        auto variable = std::find_if(operation.variables.begin(), operation.variables.end(),
                [usage](const ir::VariableDefinition& v) { return v.name == usage->name; });
        if (variable == operation.variables.end()) {
            addError(fmt::format("Variable '${}' is not defined by operation '{}'", usage->name, operation.name),
                    usage->location);
            continue;
        }
        TypeRef locationType = usage->expectedType;
        if (locationType.isNonNull() && !variable->type.isNonNull()
                && (variable->defaultValue.has_value() || usage->positionHasDefault)) {
            locationType = locationType.nullable();
        }
        if (!m_schema->isTypeSubtypeOf(variable->type, locationType)) {
            addError(fmt::format("Variable '${}' of type '{}' cannot be used where '{}' is expected", usage->name,
                    variable->type.toString(), usage->expectedType.toString()),
                    std::vector<Location>{ usage->location, variable->location });
        }
    }
}

void IRBuilder::addError(std::string message, Location location) {
    m_diagnostics.emplace_back(Diagnostic(std::move(message), location));
}

void IRBuilder::addError(std::string message, std::vector<Location> locations) {
    m_diagnostics.emplace_back(Diagnostic(std::move(message), std::move(locations)));
}

} // namespace loom
