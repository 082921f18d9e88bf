#ifndef SRC_LOOM_TOKEN_HPP_
#define SRC_LOOM_TOKEN_HPP_

#include <cstdint>
#include <string_view>

namespace loom {

// Lexer lexes source to produce Tokens, Parser consumes Tokens to produce documents.
struct Token {
    Token() = delete;
    ~Token() = default;

    enum Name {
        kEmpty = 0, // represents no token, also returned past the end of input
        kBang = 1,
        kDollar = 2,
        kAmpersand = 3,
        kOpenParen = 4,
        kCloseParen = 5,
        kEllipses = 6,
        kColon = 7,
        kEquals = 8,
        kAt = 9,
        kOpenSquare = 10,
        kCloseSquare = 11,
        kOpenCurly = 12,
        kCloseCurly = 13,
        kPipe = 14,
        kName = 15,
        kInt = 16,
        kFloat = 17,
        kString = 18, // range includes the quotes, the Parser unescapes.
        kBlockString = 19 // range includes the triple quotes.
    };

    Name name;
    // Points into the source code, which must outlive the token.
    std::string_view range;
    // Byte offset of the start of range within the source.
    int32_t offset;

    static inline Token make(Name n, std::string_view r, int32_t o) { return Token(n, r, o); }
    static inline Token makeEmpty(int32_t o) { return Token(kEmpty, std::string_view(), o); }

    int32_t end() const { return offset + static_cast<int32_t>(range.size()); }

private:
    Token(Name n, std::string_view r, int32_t o): name(n), range(r), offset(o) {}
};

// Human-readable token description for error messages, e.g. "'{'" or "Name".
const char* tokenDescription(Token::Name name);

} // namespace loom

#endif // SRC_LOOM_TOKEN_HPP_
