#include "loom/Validator.hpp"

#include "loom/Config.hpp"
#include "loom/Program.hpp"
#include "loom/Schema.hpp"
#include "loom/TransformPipeline.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <unordered_set>

namespace {

const char* operationSuffix(loom::OperationKind kind) {
    switch (kind) {
    case loom::OperationKind::kQuery: return "Query";
    case loom::OperationKind::kMutation: return "Mutation";
    case loom::OperationKind::kSubscription: return "Subscription";
    }
    return "Query";
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void collectValueVariables(const loom::ir::Value& value, std::unordered_set<std::string>& variables) {
    if (value.kind == loom::ir::Value::Kind::kVariable) {
        variables.insert(value.text);
        return;
    }
    for (const auto& item : value.items) {
        collectValueVariables(item, variables);
    }
}

void collectDirectiveVariables(const std::vector<loom::ir::Directive>& directives,
        std::unordered_set<std::string>& variables) {
    for (const auto& directive : directives) {
        for (const auto& argument : directive.arguments) {
            collectValueVariables(argument.value, variables);
        }
    }
}

// Collects variables referenced in |selections|, queueing the names of any fragments spread.
void collectSelectionVariables(const loom::ir::Selections& selections, std::unordered_set<std::string>& variables,
        std::vector<std::string>& spreads) {
    for (const auto& selection : selections) {
        collectDirectiveVariables(selection->directives, variables);
        switch (selection->kind) {
        case loom::ir::SelectionKind::kScalarField:
        case loom::ir::SelectionKind::kLinkedField: {
            const auto* field = static_cast<const loom::ir::Field*>(selection.get());
            for (const auto& argument : field->arguments) {
                collectValueVariables(argument.value, variables);
            }
            if (selection->kind == loom::ir::SelectionKind::kLinkedField) {
                collectSelectionVariables(static_cast<const loom::ir::LinkedField*>(field)->selections, variables,
                        spreads);
            }
        } break;
        case loom::ir::SelectionKind::kFragmentSpread:
            spreads.emplace_back(static_cast<const loom::ir::FragmentSpread*>(selection.get())->fragmentName);
            break;
        case loom::ir::SelectionKind::kInlineFragment:
            collectSelectionVariables(static_cast<const loom::ir::InlineFragment*>(selection.get())->selections,
                    variables, spreads);
            break;
        }
    }
}

} // namespace

namespace loom {

Validator::Validator(const ProjectConfig& projectConfig, const std::set<std::string>& baseFragmentNames):
    m_maxSelectionDepth(projectConfig.maxSelectionDepth),
    m_baseFragmentNames(baseFragmentNames) {}

Diagnostics Validator::validate(const Program& program) const {
    Diagnostics diagnostics;

    for (const auto& definition : program.definitions()) {
        // Base fragments were validated by the project that owns them.
        if (m_baseFragmentNames.count(definition->name)) { continue; }

        if (definition->isOperation()) {
            checkOperationName(*definition, diagnostics);
            checkTypenameOnRoot(*definition, definition->selections, diagnostics);
            checkUnusedVariables(program, *definition, diagnostics);
        } else {
            checkFragmentName(*definition, diagnostics);
        }

        bool reportedDepth = false;
        checkSelections(definition->selections, 1, *definition, reportedDepth, diagnostics);
    }

    SPDLOG_DEBUG("Validation found {} errors in {} definitions", diagnostics.size(), program.documentCount());
    return diagnostics;
}

// static
Diagnostics Validator::validate(const Program& program, const ProjectConfig& projectConfig,
        const std::set<std::string>& baseFragmentNames) {
    Validator validator(projectConfig, baseFragmentNames);
    return validator.validate(program);
}

// static
std::string Validator::moduleName(const std::string& sourcePath) {
    auto slash = sourcePath.find_last_of("/\\");
    std::string fileName = slash == std::string::npos ? sourcePath : sourcePath.substr(slash + 1);
    auto dot = fileName.find('.');
    if (dot != std::string::npos) {
        fileName = fileName.substr(0, dot);
    }
    return fileName;
}

void Validator::checkOperationName(const ir::Definition& definition, Diagnostics& diagnostics) const {
    auto module = moduleName(definition.sourcePath);
    std::string suffix = operationSuffix(definition.operationKind);
    if (startsWith(definition.name, module) && endsWith(definition.name, suffix)
            && definition.name.size() >= module.size() + suffix.size()) {
        return;
    }
    diagnostics.emplace_back(Diagnostic(fmt::format("Operation '{}' must be named '{}<Name>{}', starting with the "
            "module name and ending with '{}'", definition.name, module, suffix, suffix), definition.nameLocation));
}

void Validator::checkFragmentName(const ir::Definition& definition, Diagnostics& diagnostics) const {
    auto module = moduleName(definition.sourcePath);
    if (startsWith(definition.name, module)) {
        return;
    }
    diagnostics.emplace_back(Diagnostic(fmt::format("Fragment '{}' must be named '{}_<name>' or '{}<Name>', "
            "starting with the module name", definition.name, module, module), definition.nameLocation));
}

void Validator::checkSelections(const ir::Selections& selections, int depth, const ir::Definition& definition,
        bool& reportedDepth, Diagnostics& diagnostics) const {
    for (const auto& selection : selections) {
        switch (selection->kind) {
        case ir::SelectionKind::kScalarField:
        case ir::SelectionKind::kLinkedField: {
            const auto* field = static_cast<const ir::Field*>(selection.get());
            if (field->alias == "id" && field->name != "id") {
                diagnostics.emplace_back(Diagnostic(fmt::format("Aliasing field '{}' as 'id' is not allowed, 'id' "
                        "is reserved for object identifiers", field->name), field->location));
            }
            if (depth > m_maxSelectionDepth && !reportedDepth) {
                reportedDepth = true;
                diagnostics.emplace_back(Diagnostic(fmt::format("Selections in '{}' are nested {} levels deep, "
                        "deeper than the maximum of {}", definition.name, depth, m_maxSelectionDepth),
                        field->location));
            }
            if (selection->kind == ir::SelectionKind::kLinkedField) {
                checkSelections(static_cast<const ir::LinkedField*>(field)->selections, depth + 1, definition,
                        reportedDepth, diagnostics);
            }
        } break;

        case ir::SelectionKind::kInlineFragment:
            checkSelections(static_cast<const ir::InlineFragment*>(selection.get())->selections, depth, definition,
                    reportedDepth, diagnostics);
            break;

        case ir::SelectionKind::kFragmentSpread:
            break;
        }
    }
}

void Validator::checkTypenameOnRoot(const ir::Definition& definition, const ir::Selections& selections,
        Diagnostics& diagnostics) const {
    for (const auto& selection : selections) {
        if (selection->kind == ir::SelectionKind::kScalarField) {
            const auto* field = static_cast<const ir::Field*>(selection.get());
            if (field->name == "__typename") {
                diagnostics.emplace_back(Diagnostic(fmt::format("Selecting '__typename' on the root of {} '{}' is "
                        "not allowed", operationKindName(definition.operationKind), definition.name),
                        field->location));
            }
        } else if (selection->kind == ir::SelectionKind::kInlineFragment) {
            checkTypenameOnRoot(definition, static_cast<const ir::InlineFragment*>(selection.get())->selections,
                    diagnostics);
        }
    }
}

void Validator::checkUnusedVariables(const Program& program, const ir::Definition& definition,
        Diagnostics& diagnostics) const {
    if (definition.variables.empty()) { return; }

    std::unordered_set<std::string> used;
    std::vector<std::string> spreads;
    collectDirectiveVariables(definition.directives, used);
    collectSelectionVariables(definition.selections, used, spreads);

    std::unordered_set<std::string> visited;
    while (!spreads.empty()) {
        auto name = std::move(spreads.back());
        spreads.pop_back();
        if (!visited.insert(name).second) { continue; }
        const auto* fragment = program.findFragment(name);
        if (!fragment) { continue; }
        collectDirectiveVariables(fragment->directives, used);
        collectSelectionVariables(fragment->selections, used, spreads);
    }

    for (const auto& variable : definition.variables) {
        if (used.count(variable.name) == 0) {
            diagnostics.emplace_back(Diagnostic(fmt::format("Variable '${}' is never used in operation '{}'",
                    variable.name, definition.name), variable.location));
        }
    }
}

// static
bool Validator::validateProgram(const Program* program) {
    if (!program) {
        SPDLOG_ERROR("Program is null");
        return false;
    }
    if (!program->schema()) {
        SPDLOG_ERROR("Program has no schema");
        return false;
    }
    std::unordered_set<std::string> names;
    for (const auto& definition : program->definitions()) {
        if (!definition) {
            SPDLOG_ERROR("Program contains a null definition");
            return false;
        }
        if (definition->name.empty()) {
            SPDLOG_ERROR("Program contains an unnamed definition");
            return false;
        }
        if (!names.insert(definition->name).second) {
            SPDLOG_ERROR("Program contains duplicate definition '{}'", definition->name);
            return false;
        }
        if (definition->selections.empty()) {
            SPDLOG_ERROR("Definition '{}' has no selections", definition->name);
            return false;
        }
        if (!validateSelections(program, definition->selections)) {
            SPDLOG_ERROR("Invalid selections in definition '{}'", definition->name);
            return false;
        }
    }
    return true;
}

// static
bool Validator::validateSelections(const Program* program, const ir::Selections& selections) {
    for (const auto& selection : selections) {
        if (!selection) {
            SPDLOG_ERROR("Null selection");
            return false;
        }
        switch (selection->kind) {
        case ir::SelectionKind::kScalarField:
            break;
        case ir::SelectionKind::kLinkedField: {
            const auto* field = static_cast<const ir::LinkedField*>(selection.get());
            if (field->selections.empty()) {
                SPDLOG_ERROR("Linked field '{}' has no selections", field->name);
                return false;
            }
            if (!validateSelections(program, field->selections)) { return false; }
        } break;
        case ir::SelectionKind::kInlineFragment: {
            const auto* inlineFragment = static_cast<const ir::InlineFragment*>(selection.get());
            if (!inlineFragment->typeCondition.empty() && !program->schema()->findType(inlineFragment->typeCondition)) {
                SPDLOG_ERROR("Inline fragment on unknown type '{}'", inlineFragment->typeCondition);
                return false;
            }
            if (!validateSelections(program, inlineFragment->selections)) { return false; }
        } break;
        case ir::SelectionKind::kFragmentSpread:
            break;
        }
    }
    return true;
}

// static
bool Validator::validateTargets(const Program* program, const TargetPrograms& targets,
        const std::set<std::string>& baseFragmentNames) {
    std::unordered_set<std::string> targetNames;
    for (const auto& target : targets.programs) {
        if (!targetNames.insert(target.first).second) {
            SPDLOG_ERROR("Duplicate target '{}'", target.first);
            return false;
        }
        if (!validateProgram(target.second.get())) {
            SPDLOG_ERROR("Target '{}' produced an invalid Program", target.first);
            return false;
        }
        if (target.second->schema() != program->schema()) {
            SPDLOG_ERROR("Target '{}' changed the schema", target.first);
            return false;
        }

        // Every spread must resolve within the target, unless it refers to a base fragment the target dropped.
        for (const auto& definition : target.second->definitions()) {
            bool valid = true;
            ir::forEachFragmentSpread(definition->selections, [&](const std::string& fragmentName) {
                if (!target.second->findFragment(fragmentName) && baseFragmentNames.count(fragmentName) == 0) {
                    SPDLOG_ERROR("Target '{}' definition '{}' spreads missing fragment '{}'", target.first,
                            definition->name, fragmentName);
                    valid = false;
                }
            });
            if (!valid) { return false; }
        }
    }

    if (auto reader = targets.find(kReaderTarget)) {
        for (const auto& name : baseFragmentNames) {
            if (reader->findFragment(name)) {
                SPDLOG_ERROR("Reader target contains base fragment '{}'", name);
                return false;
            }
        }
    }

    if (auto normalization = targets.find(kNormalizationTarget)) {
        for (const auto& operation : normalization->operations()) {
            bool hasSpread = false;
            ir::forEachFragmentSpread(operation->selections, [&hasSpread](const std::string&) { hasSpread = true; });
            if (hasSpread) {
                SPDLOG_ERROR("Normalization operation '{}' still contains fragment spreads", operation->name);
                return false;
            }
        }
    }

    return true;
}

} // namespace loom
