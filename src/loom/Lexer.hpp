#ifndef SRC_LOOM_LEXER_HPP_
#define SRC_LOOM_LEXER_HPP_

#include "loom/Diagnostic.hpp"
#include "loom/Token.hpp"

#include <string_view>
#include <vector>

namespace loom {

// Lexes GraphQL source text, both executable documents and the type system language. Commas, whitespace, byte order
// marks and comments are all ignored. Stops at the first invalid character, which is reported as a Diagnostic.
class Lexer {
public:
    Lexer() = delete;
    // |code| must outlive the Lexer and its Tokens. |sourceID| is only used to build error locations.
    explicit Lexer(std::string_view code, SourceID sourceID = kInvalidSourceID);
    ~Lexer() = default;

    bool lex();

    const std::vector<Token>& tokens() const { return m_tokens; }
    const Diagnostics& diagnostics() const { return m_diagnostics; }
    SourceID sourceID() const { return m_sourceID; }

    // Access for testing
    std::string_view code() const { return m_code; }

private:
    bool lexString(size_t& position);
    bool lexBlockString(size_t& position);
    bool lexNumber(size_t& position);
    void addError(std::string message, size_t start, size_t end);

    std::string_view m_code;
    SourceID m_sourceID;
    std::vector<Token> m_tokens;
    Diagnostics m_diagnostics;
};

} // namespace loom

#endif // SRC_LOOM_LEXER_HPP_
