#include "loom/Program.hpp"

#include "loom/Schema.hpp"

#include "spdlog/spdlog.h"

namespace loom {

Program::Program(std::shared_ptr<const Schema> schema, std::vector<ir::DefinitionPtr> definitions):
    m_schema(std::move(schema)),
    m_definitions(std::move(definitions)) {
    for (size_t i = 0; i < m_definitions.size(); ++i) {
        // Duplicate names are rejected when building the IR, keep the first one if a transform produced any.
        if (!m_index.emplace(m_definitions[i]->name, i).second) {
            SPDLOG_WARN("Program has duplicate definition named '{}'", m_definitions[i]->name);
        }
    }
}

// static
std::shared_ptr<const Program> Program::fromDefinitions(std::shared_ptr<const Schema> schema, const ir::IR& ir) {
    return std::make_shared<const Program>(std::move(schema), ir.definitions);
}

std::shared_ptr<const Program> Program::withDefinitions(std::vector<ir::DefinitionPtr> definitions) const {
    return std::make_shared<const Program>(m_schema, std::move(definitions));
}

const ir::Definition* Program::findDefinition(const std::string& name) const {
    auto iter = m_index.find(name);
    if (iter == m_index.end()) { return nullptr; }
    return m_definitions[iter->second].get();
}

const ir::Definition* Program::findFragment(const std::string& name) const {
    const auto* definition = findDefinition(name);
    if (!definition || !definition->isFragment()) { return nullptr; }
    return definition;
}

const ir::Definition* Program::findOperation(const std::string& name) const {
    const auto* definition = findDefinition(name);
    if (!definition || !definition->isOperation()) { return nullptr; }
    return definition;
}

std::vector<ir::DefinitionPtr> Program::operations() const {
    std::vector<ir::DefinitionPtr> result;
    for (const auto& definition : m_definitions) {
        if (definition->isOperation()) { result.emplace_back(definition); }
    }
    return result;
}

std::vector<ir::DefinitionPtr> Program::fragments() const {
    std::vector<ir::DefinitionPtr> result;
    for (const auto& definition : m_definitions) {
        if (definition->isFragment()) { result.emplace_back(definition); }
    }
    return result;
}

} // namespace loom
