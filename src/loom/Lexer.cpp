#include "loom/Lexer.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace {

inline bool isNameStart(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
inline bool isNameContinue(char c) { return isNameStart(c) || (c >= '0' && c <= '9'); }
inline bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // namespace

namespace loom {

const char* tokenDescription(Token::Name name) {
    switch (name) {
    case Token::kEmpty: return "end of input";
    case Token::kBang: return "'!'";
    case Token::kDollar: return "'$'";
    case Token::kAmpersand: return "'&'";
    case Token::kOpenParen: return "'('";
    case Token::kCloseParen: return "')'";
    case Token::kEllipses: return "'...'";
    case Token::kColon: return "':'";
    case Token::kEquals: return "'='";
    case Token::kAt: return "'@'";
    case Token::kOpenSquare: return "'['";
    case Token::kCloseSquare: return "']'";
    case Token::kOpenCurly: return "'{'";
    case Token::kCloseCurly: return "'}'";
    case Token::kPipe: return "'|'";
    case Token::kName: return "Name";
    case Token::kInt: return "Int";
    case Token::kFloat: return "Float";
    case Token::kString: return "String";
    case Token::kBlockString: return "String";
    }
    return "unknown token";
}

Lexer::Lexer(std::string_view code, SourceID sourceID): m_code(code), m_sourceID(sourceID) {}

bool Lexer::lex() {
    size_t position = 0;
    // Skip a leading byte order mark.
    if (m_code.substr(0, 3) == "\xEF\xBB\xBF") {
        position = 3;
    }

    while (position < m_code.size()) {
        char c = m_code[position];
        int32_t offset = static_cast<int32_t>(position);
        switch (c) {
        // Insignificant characters.
        case ' ':
        case '\t':
        case '\n':
        case '\r':
        case ',':
            ++position;
            break;

        case '#':
            while (position < m_code.size() && m_code[position] != '\n' && m_code[position] != '\r') {
                ++position;
            }
            break;

        case '!':
            m_tokens.emplace_back(Token::make(Token::kBang, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '$':
            m_tokens.emplace_back(Token::make(Token::kDollar, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '&':
            m_tokens.emplace_back(Token::make(Token::kAmpersand, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '(':
            m_tokens.emplace_back(Token::make(Token::kOpenParen, m_code.substr(position, 1), offset));
            ++position;
            break;
        case ')':
            m_tokens.emplace_back(Token::make(Token::kCloseParen, m_code.substr(position, 1), offset));
            ++position;
            break;
        case ':':
            m_tokens.emplace_back(Token::make(Token::kColon, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '=':
            m_tokens.emplace_back(Token::make(Token::kEquals, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '@':
            m_tokens.emplace_back(Token::make(Token::kAt, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '[':
            m_tokens.emplace_back(Token::make(Token::kOpenSquare, m_code.substr(position, 1), offset));
            ++position;
            break;
        case ']':
            m_tokens.emplace_back(Token::make(Token::kCloseSquare, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '{':
            m_tokens.emplace_back(Token::make(Token::kOpenCurly, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '}':
            m_tokens.emplace_back(Token::make(Token::kCloseCurly, m_code.substr(position, 1), offset));
            ++position;
            break;
        case '|':
            m_tokens.emplace_back(Token::make(Token::kPipe, m_code.substr(position, 1), offset));
            ++position;
            break;

        case '.':
            if (m_code.substr(position, 3) != "...") {
                addError("Unexpected '.', did you mean '...'?", position, position + 1);
                return false;
            }
            m_tokens.emplace_back(Token::make(Token::kEllipses, m_code.substr(position, 3), offset));
            position += 3;
            break;

        case '"':
            if (m_code.substr(position, 3) == "\"\"\"") {
                if (!lexBlockString(position)) { return false; }
            } else {
                if (!lexString(position)) { return false; }
            }
            break;

        default:
            if (isNameStart(c)) {
                size_t start = position;
                while (position < m_code.size() && isNameContinue(m_code[position])) {
                    ++position;
                }
                m_tokens.emplace_back(Token::make(Token::kName, m_code.substr(start, position - start), offset));
            } else if (c == '-' || isDigit(c)) {
                if (!lexNumber(position)) { return false; }
            } else {
                addError(fmt::format("Unexpected character '{}'", c), position, position + 1);
                return false;
            }
            break;
        }
    }

    return true;
}

bool Lexer::lexString(size_t& position) {
    size_t start = position;
    ++position;
    while (position < m_code.size()) {
        char c = m_code[position];
        if (c == '\n' || c == '\r') {
            addError("Unterminated string", start, position);
            return false;
        }
        if (c == '\\') {
            // Skip the escaped character, the Parser validates escape sequences.
            position += 2;
            continue;
        }
        ++position;
        if (c == '"') {
            m_tokens.emplace_back(Token::make(Token::kString, m_code.substr(start, position - start),
                    static_cast<int32_t>(start)));
            return true;
        }
    }
    addError("Unterminated string", start, m_code.size());
    return false;
}

bool Lexer::lexBlockString(size_t& position) {
    size_t start = position;
    position += 3;
    while (position < m_code.size()) {
        if (m_code.substr(position, 4) == "\\\"\"\"") {
            position += 4;
            continue;
        }
        if (m_code.substr(position, 3) == "\"\"\"") {
            position += 3;
            m_tokens.emplace_back(Token::make(Token::kBlockString, m_code.substr(start, position - start),
                    static_cast<int32_t>(start)));
            return true;
        }
        ++position;
    }
    addError("Unterminated block string", start, m_code.size());
    return false;
}

bool Lexer::lexNumber(size_t& position) {
    size_t start = position;
    bool isFloat = false;

    if (m_code[position] == '-') {
        ++position;
    }
    if (position >= m_code.size() || !isDigit(m_code[position])) {
        addError("Expected digit after '-'", start, position);
        return false;
    }
    if (m_code[position] == '0' && position + 1 < m_code.size() && isDigit(m_code[position + 1])) {
        addError("Invalid number, unexpected leading zero", start, position + 1);
        return false;
    }
    while (position < m_code.size() && isDigit(m_code[position])) {
        ++position;
    }

    if (position < m_code.size() && m_code[position] == '.') {
        isFloat = true;
        ++position;
        if (position >= m_code.size() || !isDigit(m_code[position])) {
            addError("Invalid number, expected digit after '.'", start, position);
            return false;
        }
        while (position < m_code.size() && isDigit(m_code[position])) {
            ++position;
        }
    }

    if (position < m_code.size() && (m_code[position] == 'e' || m_code[position] == 'E')) {
        isFloat = true;
        ++position;
        if (position < m_code.size() && (m_code[position] == '+' || m_code[position] == '-')) {
            ++position;
        }
        if (position >= m_code.size() || !isDigit(m_code[position])) {
            addError("Invalid number, expected digit in exponent", start, position);
            return false;
        }
        while (position < m_code.size() && isDigit(m_code[position])) {
            ++position;
        }
    }

    if (position < m_code.size() && (isNameStart(m_code[position]) || m_code[position] == '.')) {
        addError(fmt::format("Invalid number, unexpected character '{}'", m_code[position]), start, position + 1);
        return false;
    }

    m_tokens.emplace_back(Token::make(isFloat ? Token::kFloat : Token::kInt, m_code.substr(start, position - start),
            static_cast<int32_t>(start)));
    return true;
}

void Lexer::addError(std::string message, size_t start, size_t end) {
    SPDLOG_DEBUG("Lex error at {}: {}", start, message);
    m_diagnostics.emplace_back(Diagnostic(std::move(message),
            Location(m_sourceID, static_cast<int32_t>(start), static_cast<int32_t>(end))));
}

} // namespace loom
