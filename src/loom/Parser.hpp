#ifndef SRC_LOOM_PARSER_HPP_
#define SRC_LOOM_PARSER_HPP_

#include "loom/AST.hpp"
#include "loom/Diagnostic.hpp"
#include "loom/Token.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace loom {

class Lexer;

// Recursive descent parser for GraphQL executable documents and type system documents. Parsing stops at the first
// syntax error, which is reported as the single Diagnostic in diagnostics().
class Parser {
public:
    Parser() = delete;
    // Builds documents from an external lexer that has already successfully lexed the source code.
    explicit Parser(const Lexer* lexer);

    // Used for testing and the loader, lexes the code itself with an owned Lexer first.
    explicit Parser(std::string_view code, SourceID sourceID = kInvalidSourceID);
    ~Parser();

    // Parse operations and fragments. executableDocument() will be valid after a successful parse.
    bool parseExecutable();
    // Parse a schema or schema extension. typeSystemDocument() will be valid after a successful parse.
    bool parseTypeSystem();

    const ast::ExecutableDocument* executableDocument() const { return m_executableDocument.get(); }
    std::unique_ptr<ast::ExecutableDocument> takeExecutableDocument() { return std::move(m_executableDocument); }

    const ast::TypeSystemDocument* typeSystemDocument() const { return m_typeSystemDocument.get(); }
    std::unique_ptr<ast::TypeSystemDocument> takeTypeSystemDocument() { return std::move(m_typeSystemDocument); }

    const Diagnostics& diagnostics() const { return m_diagnostics; }

private:
    bool lexIfNeeded();

    // Token access.
    const Token& peek(size_t lookahead = 0) const;
    void next() { ++m_tokenIndex; }
    bool peekName(std::string_view name, size_t lookahead = 0) const;
    // If the current token is |name|, consume it and return true.
    bool skip(Token::Name name);
    bool expect(Token::Name name, std::string_view context);
    bool expectKeyword(std::string_view keyword);
    bool parseName(std::string& name, Location& location, std::string_view context);
    Location location(const Token& token) const;
    Location locationFrom(int32_t start) const;

    // Executable definitions.
    std::unique_ptr<ast::ExecutableDefinition> parseOperation();
    std::unique_ptr<ast::ExecutableDefinition> parseFragment();
    bool parseVariableDefinitions(std::vector<ast::VariableDefinition>& variables);
    bool parseSelectionSet(ast::SelectionList& selections);
    std::unique_ptr<ast::Selection> parseSelection();
    bool parseArguments(std::vector<ast::Argument>& arguments, bool isConst);
    bool parseDirectives(std::vector<ast::Directive>& directives, bool isConst);
    bool parseValue(ast::Value& value, bool isConst);
    bool parseType(TypeRef& type);

    // Type system definitions.
    bool parseTypeSystemDefinition(ast::TypeSystemDefinition& definition);
    bool parseImplementsInterfaces(std::vector<std::string>& interfaces);
    bool parseFieldDefinitions(std::vector<ast::FieldDefinition>& fields);
    bool parseInputValueDefinitions(std::vector<ast::InputValueDefinition>& values, Token::Name open,
            Token::Name close);
    void skipDescription();

    bool unescapeString(const Token& token, std::string& value);
    void addError(std::string message, Location errorLocation);

    std::unique_ptr<Lexer> m_ownLexer;
    const Lexer* m_lexer;
    size_t m_tokenIndex;
    Token m_endToken;

    std::unique_ptr<ast::ExecutableDocument> m_executableDocument;
    std::unique_ptr<ast::TypeSystemDocument> m_typeSystemDocument;
    Diagnostics m_diagnostics;
};

} // namespace loom

#endif // SRC_LOOM_PARSER_HPP_
