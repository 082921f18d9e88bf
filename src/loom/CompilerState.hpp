#ifndef SRC_LOOM_COMPILER_STATE_HPP_
#define SRC_LOOM_COMPILER_STATE_HPP_

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace loom {

namespace ast {
struct ExecutableDocument;
struct TypeSystemDocument;
} // namespace ast

struct Config;
class ErrorReporter;
class Sources;

// The parsed executable documents of one project.
struct ProjectAstSet {
    std::vector<std::shared_ptr<const ast::ExecutableDocument>> documents;
};

// Keyed by project name. Read-only once builds start.
using AstSets = std::unordered_map<std::string, ProjectAstSet>;

// Parsed schema inputs for every project. Filled in before any project build starts and only read afterwards, so one
// instance is shared by all concurrent builds.
class CompilerState {
public:
    CompilerState() = default;
    ~CompilerState() = default;

    void addSchema(const std::string& projectName, std::shared_ptr<const ast::TypeSystemDocument> document);
    void addExtension(const std::string& projectName, std::shared_ptr<const ast::TypeSystemDocument> document);

    // Both return an empty list for unknown projects.
    const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& schemaDocuments(
            const std::string& projectName) const;
    const std::vector<std::shared_ptr<const ast::TypeSystemDocument>>& extensionDocuments(
            const std::string& projectName) const;

    // Reads and parses every schema, extension and document file named by |config|, registering the text with
    // |sources|. Returns false if any file failed to load or parse; every failure is reported to |errorReporter|.
    static bool loadFromConfig(const Config& config, Sources& sources, CompilerState& compilerState, AstSets& astSets,
            ErrorReporter& errorReporter);

    // Registers |code| with |sources| and parses it, reporting any syntax error. Returns nullptr on failure.
    static std::shared_ptr<const ast::TypeSystemDocument> parseTypeSystemSource(Sources& sources,
            const std::string& path, std::string code, ErrorReporter& errorReporter);
    static std::shared_ptr<const ast::ExecutableDocument> parseExecutableSource(Sources& sources,
            const std::string& path, std::string code, ErrorReporter& errorReporter);

private:
    std::unordered_map<std::string, std::vector<std::shared_ptr<const ast::TypeSystemDocument>>> m_schemas;
    std::unordered_map<std::string, std::vector<std::shared_ptr<const ast::TypeSystemDocument>>> m_extensions;
};

} // namespace loom

#endif // SRC_LOOM_COMPILER_STATE_HPP_
