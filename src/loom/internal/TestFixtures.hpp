#ifndef SRC_LOOM_INTERNAL_TEST_FIXTURES_HPP_
#define SRC_LOOM_INTERNAL_TEST_FIXTURES_HPP_

// Fixtures shared by the unit tests: Schemas and Programs built straight from GraphQL text, and scratch directories.

#include "loom/AST.hpp"
#include "loom/CompilerState.hpp"
#include "loom/ErrorReporter.hpp"
#include "loom/IRBuilder.hpp"
#include "loom/Program.hpp"
#include "loom/Schema.hpp"
#include "loom/SchemaBuilder.hpp"
#include "loom/Sources.hpp"
#include "loom/internal/FileSystem.hpp"

#include "doctest/doctest.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace loom {
namespace test {

static constexpr const char* kTestSchema = R"(
interface Node { id: ID! }
type User implements Node {
  id: ID!
  name: String
  email: String
  friends(first: Int): [User!]!
  avatar(size: Int = 32): String
}
type Page implements Node { id: ID! title: String }
union Actor = User | Page
type Comment { body: String, author: User }
type Query {
  node(id: ID!): Node
  viewer: User
  actor: Actor
  user(id: ID!): User
  comments: [Comment]
}
type Mutation { rename(id: ID!, name: String!): User }
)";

static constexpr const char* kTestExtension = R"(
extend type User { isSelected: Boolean }
)";

inline std::shared_ptr<const Schema> buildSchema(Sources& sources, const std::string& schemaCode = kTestSchema,
        const std::string& extensionCode = kTestExtension) {
    ErrorReporter errorReporter(true);
    std::vector<std::shared_ptr<const ast::TypeSystemDocument>> schemaDocuments;
    std::vector<std::shared_ptr<const ast::TypeSystemDocument>> extensionDocuments;
    auto schemaDocument = CompilerState::parseTypeSystemSource(sources, "schema.graphql", schemaCode, errorReporter);
    REQUIRE(schemaDocument);
    schemaDocuments.emplace_back(std::move(schemaDocument));
    if (!extensionCode.empty()) {
        auto extensionDocument = CompilerState::parseTypeSystemSource(sources, "extension.graphql", extensionCode,
                errorReporter);
        REQUIRE(extensionDocument);
        extensionDocuments.emplace_back(std::move(extensionDocument));
    }
    auto result = SchemaBuilder::buildFromDocuments(schemaDocuments, extensionDocuments);
    REQUIRE(std::holds_alternative<std::shared_ptr<const Schema>>(result));
    return std::get<std::shared_ptr<const Schema>>(result);
}

// Each pair is a document path relative to the configuration root and the document text.
using TestDocuments = std::vector<std::pair<std::string, std::string>>;

inline std::vector<std::shared_ptr<const ast::ExecutableDocument>> parseDocuments(Sources& sources,
        const TestDocuments& documents) {
    ErrorReporter errorReporter(true);
    std::vector<std::shared_ptr<const ast::ExecutableDocument>> parsed;
    for (const auto& document : documents) {
        auto executable = CompilerState::parseExecutableSource(sources, document.first, document.second,
                errorReporter);
        REQUIRE(executable);
        parsed.emplace_back(std::move(executable));
    }
    return parsed;
}

// Builds a type checked Program, failing the test if the documents have errors.
inline ProgramPtr buildProgram(Sources& sources, std::shared_ptr<const Schema> schema,
        const TestDocuments& documents, const TestDocuments& baseDocuments = TestDocuments(),
        std::set<std::string>* baseFragmentNames = nullptr) {
    auto parsed = parseDocuments(sources, documents);
    auto parsedBase = parseDocuments(sources, baseDocuments);
    IRBuilder builder(schema);
    auto result = builder.buildDocuments(parsed, parsedBase);
    std::string errors;
    if (std::holds_alternative<Diagnostics>(result)) {
        for (const auto& diagnostic : std::get<Diagnostics>(result)) {
            errors += sources.resolve(diagnostic).toString() + "\n";
        }
    }
    INFO(errors);
    REQUIRE(std::holds_alternative<IRResult>(result));
    const auto& irResult = std::get<IRResult>(result);
    if (baseFragmentNames) {
        *baseFragmentNames = irResult.baseFragmentNames;
    }
    return Program::fromDefinitions(std::move(schema), irResult.ir);
}

// Creates a fresh directory under the system temporary directory and removes it with everything inside on destruction.
class ScratchDirectory {
public:
    ScratchDirectory() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() / ("loom_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(m_path);
    }
    ~ScratchDirectory() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    const fs::path& path() const { return m_path; }

    // Writes |contents| to |relativePath| under the directory, failing the test if that isn't possible.
    void addFile(const std::string& relativePath, std::string_view contents) const {
        REQUIRE(writeFileContents(m_path / relativePath, contents));
    }

private:
    fs::path m_path;
};

} // namespace test
} // namespace loom

#endif // SRC_LOOM_INTERNAL_TEST_FIXTURES_HPP_
