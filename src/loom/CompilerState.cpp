#include "loom/CompilerState.hpp"

#include "loom/AST.hpp"
#include "loom/Config.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/Parser.hpp"
#include "loom/SourceFile.hpp"
#include "loom/Sources.hpp"
#include "loom/internal/FileSystem.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace {

const std::vector<std::shared_ptr<const loom::ast::TypeSystemDocument>> kEmptyDocuments;

bool readSource(const loom::Config& config, const std::string& relativePath, std::string& code,
        loom::ErrorReporter& errorReporter) {
    auto path = config.rootDirectory / fs::path(relativePath);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        errorReporter.addFileNotFoundError(path.string());
        return false;
    }
    if (!loom::readFileContents(path, code)) {
        errorReporter.addFileReadError(path.string());
        return false;
    }
    return true;
}

} // namespace

namespace loom {

void CompilerState::addSchema(const std::string& projectName,
        std::shared_ptr<const ast::TypeSystemDocument> document) {
    m_schemas[projectName].emplace_back(std::move(document));
}

void CompilerState::addExtension(const std::string& projectName,
        std::shared_ptr<const ast::TypeSystemDocument> document) {
    m_extensions[projectName].emplace_back(std::move(document));
}

const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& CompilerState::schemaDocuments(
        const std::string& projectName) const {
    auto iter = m_schemas.find(projectName);
    if (iter == m_schemas.end()) { return kEmptyDocuments; }
    return iter->second;
}

const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& CompilerState::extensionDocuments(
        const std::string& projectName) const {
    auto iter = m_extensions.find(projectName);
    if (iter == m_extensions.end()) { return kEmptyDocuments; }
    return iter->second;
}

// static
bool CompilerState::loadFromConfig(const Config& config, Sources& sources, CompilerState& compilerState,
        AstSets& astSets, ErrorReporter& errorReporter) {
    size_t startingErrors = errorReporter.errorCount();

    // Schema files are commonly shared between projects, parse each file only once.
    std::unordered_map<std::string, std::shared_ptr<const ast::TypeSystemDocument>> typeSystemCache;
    auto loadTypeSystem = [&](const std::string& relativePath) -> std::shared_ptr<const ast::TypeSystemDocument> {
        auto iter = typeSystemCache.find(relativePath);
        if (iter != typeSystemCache.end()) { return iter->second; }
        std::string code;
        if (!readSource(config, relativePath, code, errorReporter)) { return nullptr; }
        auto document = parseTypeSystemSource(sources, relativePath, std::move(code), errorReporter);
        typeSystemCache.emplace(relativePath, document);
        return document;
    };

    for (const auto& project : config.projects) {
        auto schema = loadTypeSystem(project.schemaPath);
        if (schema) {
            compilerState.addSchema(project.name, schema);
        }
        for (const auto& extensionPath : project.extensionPaths) {
            auto extension = loadTypeSystem(extensionPath);
            if (extension) {
                compilerState.addExtension(project.name, extension);
            }
        }

        auto& astSet = astSets[project.name];
        for (const auto& directory : project.documentDirectories) {
            auto files = findFilesWithExtension(config.rootDirectory / fs::path(directory), ".graphql");
            for (const auto& file : files) {
                auto relativePath = relativePathString(file, config.rootDirectory);
                std::string code;
                if (!readSource(config, relativePath, code, errorReporter)) { continue; }
                auto document = parseExecutableSource(sources, relativePath, std::move(code), errorReporter);
                if (document) {
                    astSet.documents.emplace_back(std::move(document));
                }
            }
        }
        SPDLOG_DEBUG("Project '{}' loaded {} documents", project.name, astSet.documents.size());
    }

    return errorReporter.errorCount() == startingErrors;
}

// static
std::shared_ptr<const ast::TypeSystemDocument> CompilerState::parseTypeSystemSource(Sources& sources,
        const std::string& path, std::string code, ErrorReporter& errorReporter) {
    SourceID sourceID = sources.addSource(path, std::move(code));
    Parser parser(sources.source(sourceID)->codeView(), sourceID);
    if (!parser.parseTypeSystem()) {
        for (const auto& diagnostic : parser.diagnostics()) {
            errorReporter.addDiagnostic(sources.resolve(diagnostic));
        }
        return nullptr;
    }
    auto document = parser.takeTypeSystemDocument();
    document->path = path;
    return std::shared_ptr<const ast::TypeSystemDocument>(std::move(document));
}

// static
std::shared_ptr<const ast::ExecutableDocument> CompilerState::parseExecutableSource(Sources& sources,
        const std::string& path, std::string code, ErrorReporter& errorReporter) {
    SourceID sourceID = sources.addSource(path, std::move(code));
    Parser parser(sources.source(sourceID)->codeView(), sourceID);
    if (!parser.parseExecutable()) {
        for (const auto& diagnostic : parser.diagnostics()) {
            errorReporter.addDiagnostic(sources.resolve(diagnostic));
        }
        return nullptr;
    }
    auto document = parser.takeExecutableDocument();
    document->path = path;
    return std::shared_ptr<const ast::ExecutableDocument>(std::move(document));
}

} // namespace loom
