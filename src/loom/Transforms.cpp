#include "loom/Transforms.hpp"

#include "loom/Schema.hpp"
#include "loom/TransformPipeline.hpp"

#include "spdlog/spdlog.h"

#include <cassert>
#include <set>
#include <unordered_set>

namespace {

bool sameSelections(const loom::ir::Selections& a, const loom::ir::Selections& b) {
    if (a.size() != b.size()) { return false; }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) { return false; }
    }
    return true;
}

std::shared_ptr<loom::ir::Selection> cloneSelection(const loom::ir::Selection& selection) {
    switch (selection.kind) {
    case loom::ir::SelectionKind::kScalarField:
        return std::make_shared<loom::ir::ScalarField>(static_cast<const loom::ir::ScalarField&>(selection));
    case loom::ir::SelectionKind::kLinkedField:
        return std::make_shared<loom::ir::LinkedField>(static_cast<const loom::ir::LinkedField&>(selection));
    case loom::ir::SelectionKind::kFragmentSpread:
        return std::make_shared<loom::ir::FragmentSpread>(static_cast<const loom::ir::FragmentSpread&>(selection));
    case loom::ir::SelectionKind::kInlineFragment:
        return std::make_shared<loom::ir::InlineFragment>(static_cast<const loom::ir::InlineFragment&>(selection));
    }
    assert(false);
    return nullptr;
}

// Copy of |selection|, which must be a linked field or inline fragment, with |children| as its selections.
loom::ir::SelectionPtr withChildren(const loom::ir::Selection& selection, loom::ir::Selections children) {
    auto copy = cloneSelection(selection);
    if (copy->kind == loom::ir::SelectionKind::kLinkedField) {
        static_cast<loom::ir::LinkedField*>(copy.get())->selections = std::move(children);
    } else {
        assert(copy->kind == loom::ir::SelectionKind::kInlineFragment);
        static_cast<loom::ir::InlineFragment*>(copy.get())->selections = std::move(children);
    }
    return copy;
}

const loom::ir::Selections& childrenOf(const loom::ir::Selection& selection) {
    if (selection.kind == loom::ir::SelectionKind::kLinkedField) {
        return static_cast<const loom::ir::LinkedField&>(selection).selections;
    }
    assert(selection.kind == loom::ir::SelectionKind::kInlineFragment);
    return static_cast<const loom::ir::InlineFragment&>(selection).selections;
}

bool selectsResponseKey(const loom::ir::Selections& selections, const std::string& responseKey) {
    for (const auto& selection : selections) {
        if (!selection->isField()) { continue; }
        if (static_cast<const loom::ir::Field*>(selection.get())->responseKey() == responseKey) {
            return true;
        }
    }
    return false;
}

// Returns the value of a constant 'if' argument of |directive|, or -1 if it is a variable.
int constantCondition(const loom::ir::Directive& directive) {
    const auto* argument = directive.findArgument("if");
    if (!argument || argument->value.kind != loom::ir::Value::Kind::kBoolean) { return -1; }
    return argument->value.text == "true" ? 1 : 0;
}

// Removes every spread of the named fragments.
class RemoveSpreadsTransformer : public loom::SelectionTransformer {
public:
    RemoveSpreadsTransformer(loom::ProgramPtr program, std::unordered_set<std::string> fragmentNames):
        SelectionTransformer(std::move(program)), m_fragmentNames(std::move(fragmentNames)) {}

protected:
    void transformSelection(const loom::ir::SelectionPtr& selection, const std::string& parentType,
            loom::ir::Selections& out) override {
        if (selection->kind == loom::ir::SelectionKind::kFragmentSpread
            && m_fragmentNames.count(static_cast<const loom::ir::FragmentSpread*>(selection.get())->fragmentName)) {
            return;
        }
        SelectionTransformer::transformSelection(selection, parentType, out);
    }

private:
    std::unordered_set<std::string> m_fragmentNames;
};

class FlattenInlineFragmentsTransformer : public loom::SelectionTransformer {
public:
    explicit FlattenInlineFragmentsTransformer(loom::ProgramPtr program): SelectionTransformer(std::move(program)) {}

protected:
    void transformSelection(const loom::ir::SelectionPtr& selection, const std::string& parentType,
            loom::ir::Selections& out) override {
        if (selection->kind == loom::ir::SelectionKind::kInlineFragment && selection->directives.empty()) {
            const auto* inlineFragment = static_cast<const loom::ir::InlineFragment*>(selection.get());
            if (inlineFragment->typeCondition.empty() || inlineFragment->typeCondition == parentType) {
                auto children = transformSelections(inlineFragment->selections, parentType);
                out.insert(out.end(), children.begin(), children.end());
                return;
            }
        }
        SelectionTransformer::transformSelection(selection, parentType, out);
    }
};

class InlineFragmentsTransformer : public loom::SelectionTransformer {
public:
    explicit InlineFragmentsTransformer(loom::ProgramPtr program): SelectionTransformer(std::move(program)) {}

protected:
    // Once every spread is inlined the fragment definitions themselves are no longer needed.
    loom::ir::DefinitionPtr transformDefinition(const loom::ir::DefinitionPtr& definition) override {
        if (definition->isFragment()) { return nullptr; }
        return SelectionTransformer::transformDefinition(definition);
    }

    void transformSelection(const loom::ir::SelectionPtr& selection, const std::string& parentType,
            loom::ir::Selections& out) override {
        if (selection->kind != loom::ir::SelectionKind::kFragmentSpread) {
            SelectionTransformer::transformSelection(selection, parentType, out);
            return;
        }
        const auto* spread = static_cast<const loom::ir::FragmentSpread*>(selection.get());
        const auto* fragment = m_program->findFragment(spread->fragmentName);
        assert(fragment);
        if (!fragment) {
            SPDLOG_CRITICAL("Spread of missing fragment '{}' while inlining", spread->fragmentName);
            out.emplace_back(selection);
            return;
        }
        auto inlineFragment = std::make_shared<loom::ir::InlineFragment>(spread->location);
        inlineFragment->typeCondition = fragment->typeCondition;
        inlineFragment->directives = spread->directives;
        inlineFragment->selections = transformSelections(fragment->selections, fragment->typeCondition);
        out.emplace_back(std::move(inlineFragment));
    }
};

class GenerateTypenameTransformer : public loom::SelectionTransformer {
public:
    explicit GenerateTypenameTransformer(loom::ProgramPtr program): SelectionTransformer(std::move(program)) {}

protected:
    void transformSelection(const loom::ir::SelectionPtr& selection, const std::string& parentType,
            loom::ir::Selections& out) override {
        auto transformed = transformChildren(selection, parentType);
        if (!transformed) { return; }
        if (transformed->kind == loom::ir::SelectionKind::kLinkedField) {
            const auto* field = static_cast<const loom::ir::LinkedField*>(transformed.get());
            const auto* type = m_program->schema()->findType(field->type.namedType());
            if (type && type->isAbstract() && !selectsResponseKey(field->selections, "__typename")) {
                auto typenameField = std::make_shared<loom::ir::ScalarField>(loom::Location());
                typenameField->name = "__typename";
                typenameField->type = m_program->schema()->typenameField()->type;
                typenameField->parentType = type->name;
                loom::ir::Selections children;
                children.emplace_back(std::move(typenameField));
                children.insert(children.end(), field->selections.begin(), field->selections.end());
                transformed = withChildren(*field, std::move(children));
            }
        }
        out.emplace_back(std::move(transformed));
    }
};

class GenerateIdFieldTransformer : public loom::SelectionTransformer {
public:
    explicit GenerateIdFieldTransformer(loom::ProgramPtr program): SelectionTransformer(std::move(program)) {}

protected:
    void transformSelection(const loom::ir::SelectionPtr& selection, const std::string& parentType,
            loom::ir::Selections& out) override {
        auto transformed = transformChildren(selection, parentType);
        if (!transformed) { return; }
        if (transformed->kind == loom::ir::SelectionKind::kLinkedField) {
            const auto* field = static_cast<const loom::ir::LinkedField*>(transformed.get());
            const auto* type = m_program->schema()->findType(field->type.namedType());
            const auto* idField = type ? type->findField("id") : nullptr;
            if (idField && idField->type.namedType() == "ID" && !selectsResponseKey(field->selections, "id")) {
                auto id = std::make_shared<loom::ir::ScalarField>(loom::Location());
                id->name = "id";
                id->type = idField->type;
                id->parentType = type->name;
                id->isClientExtension = idField->isExtension;
                loom::ir::Selections children(field->selections);
                children.emplace_back(std::move(id));
                transformed = withChildren(*field, std::move(children));
            }
        }
        out.emplace_back(std::move(transformed));
    }
};

class SkipUnreachableNodesTransformer : public loom::SelectionTransformer {
public:
    explicit SkipUnreachableNodesTransformer(loom::ProgramPtr program): SelectionTransformer(std::move(program)) {}

protected:
    void transformSelection(const loom::ir::SelectionPtr& selection, const std::string& parentType,
            loom::ir::Selections& out) override {
        std::vector<loom::ir::Directive> directives;
        bool directivesChanged = false;
        for (const auto& directive : selection->directives) {
            if (directive.name == "include" || directive.name == "skip") {
                int condition = constantCondition(directive);
                if (condition >= 0) {
                    bool passes = directive.name == "include" ? condition == 1 : condition == 0;
                    if (!passes) { return; }
                    directivesChanged = true;
                    continue;
                }
            }
            directives.emplace_back(directive);
        }

        auto current = selection;
        if (directivesChanged) {
            auto copy = cloneSelection(*selection);
            copy->directives = std::move(directives);
            current = std::move(copy);
        }
        SelectionTransformer::transformSelection(current, parentType, out);
    }
};

class SkipClientExtensionsTransformer : public loom::SelectionTransformer {
public:
    explicit SkipClientExtensionsTransformer(loom::ProgramPtr program): SelectionTransformer(std::move(program)) {}

protected:
    loom::ir::DefinitionPtr transformDefinition(const loom::ir::DefinitionPtr& definition) override {
        if (definition->isFragment() && isExtensionType(definition->typeCondition)) {
            return nullptr;
        }
        return SelectionTransformer::transformDefinition(definition);
    }

    void transformSelection(const loom::ir::SelectionPtr& selection, const std::string& parentType,
            loom::ir::Selections& out) override {
        switch (selection->kind) {
        case loom::ir::SelectionKind::kScalarField:
        case loom::ir::SelectionKind::kLinkedField:
            if (static_cast<const loom::ir::Field*>(selection.get())->isClientExtension) { return; }
            break;
        case loom::ir::SelectionKind::kInlineFragment:
            if (isExtensionType(static_cast<const loom::ir::InlineFragment*>(selection.get())->typeCondition)) {
                return;
            }
            break;
        case loom::ir::SelectionKind::kFragmentSpread: {
            const auto* fragment = m_program->findFragment(
                    static_cast<const loom::ir::FragmentSpread*>(selection.get())->fragmentName);
            if (fragment && isExtensionType(fragment->typeCondition)) { return; }
        } break;
        }
        SelectionTransformer::transformSelection(selection, parentType, out);
    }

private:
    bool isExtensionType(const std::string& typeName) const {
        if (typeName.empty()) { return false; }
        const auto* type = m_program->schema()->findType(typeName);
        return type && type->isExtension;
    }
};

} // namespace

namespace loom {

ProgramPtr SelectionTransformer::transformProgram() {
    std::vector<ir::DefinitionPtr> definitions;
    definitions.reserve(m_program->definitions().size());
    std::unordered_set<std::string> emptiedFragments;
    for (const auto& definition : m_program->definitions()) {
        auto transformed = transformDefinition(definition);
        if (!transformed) { continue; }
        if (transformed->selections.empty()) {
            SPDLOG_DEBUG("Dropping '{}', no selections remain", transformed->name);
            if (transformed->isFragment()) {
                emptiedFragments.insert(transformed->name);
            }
            continue;
        }
        definitions.emplace_back(std::move(transformed));
    }

    auto program = m_program->withDefinitions(std::move(definitions));
    if (emptiedFragments.empty()) {
        return program;
    }
    // Removing the spreads can empty more definitions, which the nested transformProgram() call drops in turn.
    RemoveSpreadsTransformer remover(std::move(program), std::move(emptiedFragments));
    return remover.transformProgram();
}

ir::DefinitionPtr SelectionTransformer::transformDefinition(const ir::DefinitionPtr& definition) {
    auto selections = transformSelections(definition->selections, definition->typeCondition);
    if (sameSelections(selections, definition->selections)) {
        return definition;
    }
    auto copy = std::make_shared<ir::Definition>(*definition);
    copy->selections = std::move(selections);
    return copy;
}

void SelectionTransformer::transformSelection(const ir::SelectionPtr& selection, const std::string& parentType,
        ir::Selections& out) {
    auto transformed = transformChildren(selection, parentType);
    if (transformed) {
        out.emplace_back(std::move(transformed));
    }
}

ir::Selections SelectionTransformer::transformSelections(const ir::Selections& selections,
        const std::string& parentType) {
    ir::Selections out;
    out.reserve(selections.size());
    for (const auto& selection : selections) {
        transformSelection(selection, parentType, out);
    }
    return out;
}

ir::SelectionPtr SelectionTransformer::transformChildren(const ir::SelectionPtr& selection,
        const std::string& parentType) {
    std::string childParentType;
    switch (selection->kind) {
    case ir::SelectionKind::kScalarField:
    case ir::SelectionKind::kFragmentSpread:
        return selection;
    case ir::SelectionKind::kLinkedField:
        childParentType = static_cast<const ir::LinkedField*>(selection.get())->type.namedType();
        break;
    case ir::SelectionKind::kInlineFragment: {
        const auto* inlineFragment = static_cast<const ir::InlineFragment*>(selection.get());
        childParentType = inlineFragment->typeCondition.empty() ? parentType : inlineFragment->typeCondition;
    } break;
    }

    const auto& children = childrenOf(*selection);
    auto transformed = transformSelections(children, childParentType);
    if (sameSelections(transformed, children)) {
        return selection;
    }
    if (transformed.empty()) {
        return nullptr;
    }
    return withChildren(*selection, std::move(transformed));
}

namespace transforms {

ProgramPtr removeBaseFragments(const ProgramPtr& program, const TransformContext& context) {
    std::vector<ir::DefinitionPtr> definitions;
    for (const auto& definition : program->definitions()) {
        if (definition->isFragment() && context.baseFragmentNames.count(definition->name)) {
            continue;
        }
        definitions.emplace_back(definition);
    }
    return program->withDefinitions(std::move(definitions));
}

ProgramPtr flattenInlineFragments(const ProgramPtr& program, const TransformContext& /* context */) {
    FlattenInlineFragmentsTransformer transformer(program);
    return transformer.transformProgram();
}

ProgramPtr inlineFragments(const ProgramPtr& program, const TransformContext& /* context */) {
    InlineFragmentsTransformer transformer(program);
    return transformer.transformProgram();
}

ProgramPtr generateTypename(const ProgramPtr& program, const TransformContext& /* context */) {
    GenerateTypenameTransformer transformer(program);
    return transformer.transformProgram();
}

ProgramPtr generateIdField(const ProgramPtr& program, const TransformContext& /* context */) {
    GenerateIdFieldTransformer transformer(program);
    return transformer.transformProgram();
}

ProgramPtr skipUnreachableNodes(const ProgramPtr& program, const TransformContext& /* context */) {
    SkipUnreachableNodesTransformer transformer(program);
    return transformer.transformProgram();
}

ProgramPtr skipClientExtensions(const ProgramPtr& program, const TransformContext& /* context */) {
    SkipClientExtensionsTransformer transformer(program);
    return transformer.transformProgram();
}

ProgramPtr onlyReachableFromOperations(const ProgramPtr& program, const TransformContext& /* context */) {
    std::unordered_set<std::string> reached;
    std::vector<std::string> pending;
    for (const auto& operation : program->operations()) {
        ir::forEachFragmentSpread(operation->selections,
                [&pending](const std::string& fragmentName) { pending.emplace_back(fragmentName); });
    }
    while (!pending.empty()) {
        auto name = std::move(pending.back());
        pending.pop_back();
        if (!reached.insert(name).second) { continue; }
        const auto* fragment = program->findFragment(name);
        if (!fragment) { continue; }
        ir::forEachFragmentSpread(fragment->selections,
                [&pending](const std::string& fragmentName) { pending.emplace_back(fragmentName); });
    }

    std::vector<ir::DefinitionPtr> definitions;
    for (const auto& definition : program->definitions()) {
        if (definition->isOperation() || reached.count(definition->name)) {
            definitions.emplace_back(definition);
        }
    }
    return program->withDefinitions(std::move(definitions));
}

} // namespace transforms

} // namespace loom
