#include "loom/Parser.hpp"

#include "loom/Lexer.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>

namespace {

// Appends the UTF-8 encoding of |codePoint| to |out|.
void appendUTF8(uint32_t codePoint, std::string& out) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

// Block string value in GraphQL: common indentation and leading and trailing blank
// lines are removed.
std::string blockStringValue(std::string_view raw) {
    std::vector<std::string> lines;
    std::string line;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw.substr(i, 4) == "\\\"\"\"") {
            line += "\"\"\"";
            i += 3;
        } else if (raw[i] == '\n' || raw[i] == '\r') {
            if (raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') { ++i; }
            lines.emplace_back(std::move(line));
            line.clear();
        } else {
            line += raw[i];
        }
    }
    lines.emplace_back(std::move(line));

    size_t commonIndent = std::string::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t indent = lines[i].find_first_not_of(" \t");
        if (indent != std::string::npos && indent < commonIndent) {
            commonIndent = indent;
        }
    }
    if (commonIndent != std::string::npos) {
        for (size_t i = 1; i < lines.size(); ++i) {
            lines[i] = lines[i].size() >= commonIndent ? lines[i].substr(commonIndent) : std::string();
        }
    }

    auto isBlank = [](const std::string& l) { return l.find_first_not_of(" \t") == std::string::npos; };
    size_t first = 0;
    while (first < lines.size() && isBlank(lines[first])) { ++first; }
    size_t last = lines.size();
    while (last > first && isBlank(lines[last - 1])) { --last; }

    std::string value;
    for (size_t i = first; i < last; ++i) {
        if (i != first) { value += '\n'; }
        value += lines[i];
    }
    return value;
}

} // namespace

namespace loom {

Parser::Parser(const Lexer* lexer):
    m_lexer(lexer),
    m_tokenIndex(0),
    m_endToken(Token::makeEmpty(static_cast<int32_t>(lexer->code().size()))) {}

Parser::Parser(std::string_view code, SourceID sourceID):
    m_ownLexer(std::make_unique<Lexer>(code, sourceID)),
    m_lexer(nullptr),
    m_tokenIndex(0),
    m_endToken(Token::makeEmpty(static_cast<int32_t>(code.size()))) {}

Parser::~Parser() {}

bool Parser::lexIfNeeded() {
    if (m_lexer) {
        return true;
    }
    if (!m_ownLexer->lex()) {
        m_diagnostics = m_ownLexer->diagnostics();
        return false;
    }
    m_lexer = m_ownLexer.get();
    return true;
}

bool Parser::parseExecutable() {
    if (!lexIfNeeded()) { return false; }
    m_tokenIndex = 0;
    m_executableDocument = std::make_unique<ast::ExecutableDocument>();
    m_executableDocument->sourceID = m_lexer->sourceID();

    while (peek().name != Token::kEmpty) {
        std::unique_ptr<ast::ExecutableDefinition> definition;
        if (peek().name == Token::kOpenCurly || peekName("query") || peekName("mutation")
                || peekName("subscription")) {
            definition = parseOperation();
        } else if (peekName("fragment")) {
            definition = parseFragment();
        } else if (peek().name == Token::kName) {
            addError(fmt::format("Unexpected '{}', only operations and fragments are allowed in documents",
                    peek().range), location(peek()));
            return false;
        } else {
            addError(fmt::format("Unexpected {}, expected an operation or fragment", tokenDescription(peek().name)),
                    location(peek()));
            return false;
        }
        if (!definition) {
            return false;
        }
        m_executableDocument->definitions.emplace_back(std::move(definition));
    }

    return true;
}

bool Parser::parseTypeSystem() {
    if (!lexIfNeeded()) { return false; }
    m_tokenIndex = 0;
    m_typeSystemDocument = std::make_unique<ast::TypeSystemDocument>();
    m_typeSystemDocument->sourceID = m_lexer->sourceID();

    while (peek().name != Token::kEmpty) {
        ast::TypeSystemDefinition definition;
        if (!parseTypeSystemDefinition(definition)) {
            return false;
        }
        m_typeSystemDocument->definitions.emplace_back(std::move(definition));
    }

    return true;
}

const Token& Parser::peek(size_t lookahead) const {
    size_t index = m_tokenIndex + lookahead;
    if (index >= m_lexer->tokens().size()) {
        return m_endToken;
    }
    return m_lexer->tokens()[index];
}

bool Parser::peekName(std::string_view name, size_t lookahead) const {
    const auto& token = peek(lookahead);
    return token.name == Token::kName && token.range == name;
}

bool Parser::skip(Token::Name name) {
    if (peek().name == name) {
        next();
        return true;
    }
    return false;
}

bool Parser::expect(Token::Name name, std::string_view context) {
    if (peek().name != name) {
        addError(fmt::format("Expected {} {}, found {}", tokenDescription(name), context,
                peek().name == Token::kEmpty ? std::string("end of input") : fmt::format("'{}'", peek().range)),
                location(peek()));
        return false;
    }
    next();
    return true;
}

bool Parser::expectKeyword(std::string_view keyword) {
    if (!peekName(keyword)) {
        addError(fmt::format("Expected '{}', found {}", keyword,
                peek().name == Token::kEmpty ? std::string("end of input") : fmt::format("'{}'", peek().range)),
                location(peek()));
        return false;
    }
    next();
    return true;
}

bool Parser::parseName(std::string& name, Location& nameLocation, std::string_view context) {
    if (peek().name != Token::kName) {
        addError(fmt::format("Expected Name {}, found {}", context,
                peek().name == Token::kEmpty ? std::string("end of input") : fmt::format("'{}'", peek().range)),
                location(peek()));
        return false;
    }
    name = std::string(peek().range);
    nameLocation = location(peek());
    next();
    return true;
}

Location Parser::location(const Token& token) const {
    return Location(m_lexer->sourceID(), token.offset, token.end());
}

Location Parser::locationFrom(int32_t start) const {
    // Ends at the end of the most recently consumed token.
    int32_t end = start;
    if (m_tokenIndex > 0) {
        end = m_lexer->tokens()[m_tokenIndex - 1].end();
    }
    return Location(m_lexer->sourceID(), start, end);
}

std::unique_ptr<ast::ExecutableDefinition> Parser::parseOperation() {
    int32_t start = peek().offset;
    auto operation = std::make_unique<ast::OperationDefinition>(Location());

    // Shorthand query syntax.
    if (peek().name == Token::kOpenCurly) {
        if (!parseSelectionSet(operation->selections)) { return nullptr; }
        operation->location = locationFrom(start);
        return operation;
    }

    if (peekName("query")) {
        operation->operationKind = OperationKind::kQuery;
    } else if (peekName("mutation")) {
        operation->operationKind = OperationKind::kMutation;
    } else {
        operation->operationKind = OperationKind::kSubscription;
    }
    next();

    if (peek().name == Token::kName) {
        operation->name = std::string(peek().range);
        operation->nameLocation = location(peek());
        next();
    }
    if (peek().name == Token::kOpenParen) {
        if (!parseVariableDefinitions(operation->variables)) { return nullptr; }
    }
    if (!parseDirectives(operation->directives, false)) { return nullptr; }
    if (!parseSelectionSet(operation->selections)) { return nullptr; }
    operation->location = locationFrom(start);
    return operation;
}

std::unique_ptr<ast::ExecutableDefinition> Parser::parseFragment() {
    int32_t start = peek().offset;
    auto fragment = std::make_unique<ast::FragmentDefinition>(Location());
    next(); // 'fragment'

    if (peekName("on")) {
        addError("Fragment name cannot be 'on'", location(peek()));
        return nullptr;
    }
    if (!parseName(fragment->name, fragment->nameLocation, "for fragment name")) { return nullptr; }
    if (!expectKeyword("on")) { return nullptr; }
    if (!parseName(fragment->typeCondition, fragment->typeConditionLocation, "for fragment type condition")) {
        return nullptr;
    }
    if (!parseDirectives(fragment->directives, false)) { return nullptr; }
    if (!parseSelectionSet(fragment->selections)) { return nullptr; }
    fragment->location = locationFrom(start);
    return fragment;
}

bool Parser::parseVariableDefinitions(std::vector<ast::VariableDefinition>& variables) {
    if (!expect(Token::kOpenParen, "to open variable definitions")) { return false; }
    if (peek().name == Token::kCloseParen) {
        addError("Expected at least one variable definition", location(peek()));
        return false;
    }
    while (!skip(Token::kCloseParen)) {
        ast::VariableDefinition variable;
        int32_t start = peek().offset;
        if (!expect(Token::kDollar, "to begin variable definition")) { return false; }
        Location nameLocation;
        if (!parseName(variable.name, nameLocation, "for variable")) { return false; }
        if (!expect(Token::kColon, "after variable name")) { return false; }
        int32_t typeStart = peek().offset;
        if (!parseType(variable.type)) { return false; }
        variable.typeLocation = locationFrom(typeStart);
        if (skip(Token::kEquals)) {
            ast::Value defaultValue;
            if (!parseValue(defaultValue, true)) { return false; }
            variable.defaultValue = std::move(defaultValue);
        }
        if (!parseDirectives(variable.directives, true)) { return false; }
        variable.location = locationFrom(start);
        variables.emplace_back(std::move(variable));
    }
    return true;
}

bool Parser::parseSelectionSet(ast::SelectionList& selections) {
    if (!expect(Token::kOpenCurly, "to open selection set")) { return false; }
    if (peek().name == Token::kCloseCurly) {
        addError("Selection set cannot be empty", location(peek()));
        return false;
    }
    while (!skip(Token::kCloseCurly)) {
        auto selection = parseSelection();
        if (!selection) {
            return false;
        }
        selections.emplace_back(std::move(selection));
    }
    return true;
}

std::unique_ptr<ast::Selection> Parser::parseSelection() {
    int32_t start = peek().offset;

    if (skip(Token::kEllipses)) {
        // Fragment spreads are named with anything but 'on', inline fragments have an optional type condition.
        if (peek().name == Token::kName && !peekName("on")) {
            auto spread = std::make_unique<ast::FragmentSpreadSelection>(Location());
            spread->name = std::string(peek().range);
            spread->nameLocation = location(peek());
            next();
            if (!parseDirectives(spread->directives, false)) { return nullptr; }
            spread->location = locationFrom(start);
            return spread;
        }

        auto inlineFragment = std::make_unique<ast::InlineFragmentSelection>(Location());
        if (skip(Token::kName)) {
            // Consumed 'on'.
            if (!parseName(inlineFragment->typeCondition, inlineFragment->typeConditionLocation,
                    "for inline fragment type condition")) {
                return nullptr;
            }
        }
        if (!parseDirectives(inlineFragment->directives, false)) { return nullptr; }
        if (!parseSelectionSet(inlineFragment->selections)) { return nullptr; }
        inlineFragment->location = locationFrom(start);
        return inlineFragment;
    }

    auto field = std::make_unique<ast::FieldSelection>(Location());
    if (!parseName(field->name, field->nameLocation, "for field")) { return nullptr; }
    if (skip(Token::kColon)) {
        field->alias = field->name;
        field->aliasLocation = field->nameLocation;
        if (!parseName(field->name, field->nameLocation, "for field after alias")) { return nullptr; }
    }
    if (peek().name == Token::kOpenParen) {
        if (!parseArguments(field->arguments, false)) { return nullptr; }
    }
    if (!parseDirectives(field->directives, false)) { return nullptr; }
    if (peek().name == Token::kOpenCurly) {
        field->hasSelectionSet = true;
        if (!parseSelectionSet(field->selections)) { return nullptr; }
    }
    field->location = locationFrom(start);
    return field;
}

bool Parser::parseArguments(std::vector<ast::Argument>& arguments, bool isConst) {
    if (!expect(Token::kOpenParen, "to open arguments")) { return false; }
    if (peek().name == Token::kCloseParen) {
        addError("Expected at least one argument", location(peek()));
        return false;
    }
    while (!skip(Token::kCloseParen)) {
        ast::Argument argument;
        int32_t start = peek().offset;
        if (!parseName(argument.name, argument.nameLocation, "for argument")) { return false; }
        if (!expect(Token::kColon, "after argument name")) { return false; }
        if (!parseValue(argument.value, isConst)) { return false; }
        argument.location = locationFrom(start);
        arguments.emplace_back(std::move(argument));
    }
    return true;
}

bool Parser::parseDirectives(std::vector<ast::Directive>& directives, bool isConst) {
    while (peek().name == Token::kAt) {
        ast::Directive directive;
        int32_t start = peek().offset;
        next();
        Location nameLocation;
        if (!parseName(directive.name, nameLocation, "for directive")) { return false; }
        if (peek().name == Token::kOpenParen) {
            if (!parseArguments(directive.arguments, isConst)) { return false; }
        }
        directive.location = locationFrom(start);
        directives.emplace_back(std::move(directive));
    }
    return true;
}

bool Parser::parseValue(ast::Value& value, bool isConst) {
    const auto& token = peek();
    int32_t start = token.offset;

    switch (token.name) {
    case Token::kDollar: {
        if (isConst) {
            addError("Variables are not allowed in constant values", location(token));
            return false;
        }
        next();
        value.kind = ast::Value::Kind::kVariable;
        Location nameLocation;
        if (!parseName(value.text, nameLocation, "for variable")) { return false; }
    } break;

    case Token::kInt:
        value.kind = ast::Value::Kind::kInt;
        value.text = std::string(token.range);
        next();
        break;

    case Token::kFloat:
        value.kind = ast::Value::Kind::kFloat;
        value.text = std::string(token.range);
        next();
        break;

    case Token::kString:
    case Token::kBlockString:
        value.kind = ast::Value::Kind::kString;
        if (!unescapeString(token, value.text)) { return false; }
        next();
        break;

    case Token::kName:
        if (token.range == "true" || token.range == "false") {
            value.kind = ast::Value::Kind::kBoolean;
        } else if (token.range == "null") {
            value.kind = ast::Value::Kind::kNull;
        } else {
            value.kind = ast::Value::Kind::kEnum;
        }
        value.text = std::string(token.range);
        next();
        break;

    case Token::kOpenSquare:
        next();
        value.kind = ast::Value::Kind::kList;
        while (!skip(Token::kCloseSquare)) {
            if (peek().name == Token::kEmpty) {
                addError("Unterminated list value", locationFrom(start));
                return false;
            }
            ast::Value item;
            if (!parseValue(item, isConst)) { return false; }
            value.items.emplace_back(std::move(item));
        }
        break;

    case Token::kOpenCurly:
        next();
        value.kind = ast::Value::Kind::kObject;
        while (!skip(Token::kCloseCurly)) {
            ast::ObjectField field;
            if (!parseName(field.name, field.nameLocation, "for object field")) { return false; }
            if (!expect(Token::kColon, "after object field name")) { return false; }
            if (!parseValue(field.value, isConst)) { return false; }
            value.fields.emplace_back(std::move(field));
        }
        break;

    default:
        addError(fmt::format("Expected a value, found {}",
                token.name == Token::kEmpty ? std::string("end of input") : fmt::format("'{}'", token.range)),
                location(token));
        return false;
    }

    value.location = locationFrom(start);
    return true;
}

bool Parser::parseType(TypeRef& type) {
    if (skip(Token::kOpenSquare)) {
        TypeRef itemType;
        if (!parseType(itemType)) { return false; }
        if (!expect(Token::kCloseSquare, "to close list type")) { return false; }
        type = TypeRef::listOf(std::move(itemType));
    } else {
        std::string name;
        Location nameLocation;
        if (!parseName(name, nameLocation, "for type")) { return false; }
        type = TypeRef::named(std::move(name));
    }
    if (skip(Token::kBang)) {
        type = TypeRef::nonNull(std::move(type));
    }
    return true;
}

bool Parser::parseTypeSystemDefinition(ast::TypeSystemDefinition& definition) {
    skipDescription();
    int32_t start = peek().offset;

    if (peekName("extend")) {
        definition.isExtension = true;
        next();
    }

    if (peek().name != Token::kName) {
        addError(fmt::format("Expected a type system definition, found {}",
                peek().name == Token::kEmpty ? std::string("end of input") : fmt::format("'{}'", peek().range)),
                location(peek()));
        return false;
    }

    auto keyword = peek().range;
    next();

    if (keyword == "schema") {
        definition.kind = ast::TypeSystemKind::kSchema;
        if (!parseDirectives(definition.directives, true)) { return false; }
        if (peek().name == Token::kOpenCurly) {
            next();
            while (!skip(Token::kCloseCurly)) {
                OperationKind kind;
                if (peekName("query")) {
                    kind = OperationKind::kQuery;
                } else if (peekName("mutation")) {
                    kind = OperationKind::kMutation;
                } else if (peekName("subscription")) {
                    kind = OperationKind::kSubscription;
                } else {
                    addError(fmt::format("Expected 'query', 'mutation' or 'subscription', found '{}'", peek().range),
                            location(peek()));
                    return false;
                }
                next();
                if (!expect(Token::kColon, "after root operation kind")) { return false; }
                std::string typeName;
                Location typeLocation;
                if (!parseName(typeName, typeLocation, "for root operation type")) { return false; }
                definition.rootOperationTypes.emplace_back(std::make_pair(kind, std::move(typeName)));
            }
        }
        definition.location = locationFrom(start);
        return true;
    }

    if (keyword == "directive") {
        if (definition.isExtension) {
            addError("Directive definitions cannot be extended", locationFrom(start));
            return false;
        }
        definition.kind = ast::TypeSystemKind::kDirective;
        if (!expect(Token::kAt, "before directive name")) { return false; }
        if (!parseName(definition.name, definition.nameLocation, "for directive definition")) { return false; }
        if (peek().name == Token::kOpenParen) {
            if (!parseInputValueDefinitions(definition.inputFields, Token::kOpenParen, Token::kCloseParen)) {
                return false;
            }
        }
        if (peekName("repeatable")) {
            next();
        }
        if (!expectKeyword("on")) { return false; }
        skip(Token::kPipe);
        do {
            std::string directiveLocation;
            Location nameLocation;
            if (!parseName(directiveLocation, nameLocation, "for directive location")) { return false; }
            definition.directiveLocations.emplace_back(std::move(directiveLocation));
        } while (skip(Token::kPipe));
        definition.location = locationFrom(start);
        return true;
    }

    if (keyword == "scalar") {
        definition.kind = ast::TypeSystemKind::kScalar;
    } else if (keyword == "type") {
        definition.kind = ast::TypeSystemKind::kObject;
    } else if (keyword == "interface") {
        definition.kind = ast::TypeSystemKind::kInterface;
    } else if (keyword == "union") {
        definition.kind = ast::TypeSystemKind::kUnion;
    } else if (keyword == "enum") {
        definition.kind = ast::TypeSystemKind::kEnum;
    } else if (keyword == "input") {
        definition.kind = ast::TypeSystemKind::kInputObject;
    } else {
        addError(fmt::format("Unexpected '{}', expected a type system definition", keyword),
                locationFrom(start));
        return false;
    }

    if (!parseName(definition.name, definition.nameLocation, "for type definition")) { return false; }

    switch (definition.kind) {
    case ast::TypeSystemKind::kScalar:
        if (!parseDirectives(definition.directives, true)) { return false; }
        break;

    case ast::TypeSystemKind::kObject:
    case ast::TypeSystemKind::kInterface:
        if (peekName("implements")) {
            next();
            if (!parseImplementsInterfaces(definition.interfaces)) { return false; }
        }
        if (!parseDirectives(definition.directives, true)) { return false; }
        if (peek().name == Token::kOpenCurly) {
            if (!parseFieldDefinitions(definition.fields)) { return false; }
        }
        break;

    case ast::TypeSystemKind::kUnion:
        if (!parseDirectives(definition.directives, true)) { return false; }
        if (skip(Token::kEquals)) {
            skip(Token::kPipe);
            do {
                std::string member;
                Location memberLocation;
                if (!parseName(member, memberLocation, "for union member")) { return false; }
                definition.unionMembers.emplace_back(std::move(member));
            } while (skip(Token::kPipe));
        }
        break;

    case ast::TypeSystemKind::kEnum:
        if (!parseDirectives(definition.directives, true)) { return false; }
        if (skip(Token::kOpenCurly)) {
            while (!skip(Token::kCloseCurly)) {
                skipDescription();
                std::string enumValue;
                Location enumLocation;
                if (!parseName(enumValue, enumLocation, "for enum value")) { return false; }
                if (enumValue == "true" || enumValue == "false" || enumValue == "null") {
                    addError(fmt::format("Enum values cannot be named '{}'", enumValue), enumLocation);
                    return false;
                }
                std::vector<ast::Directive> directives;
                if (!parseDirectives(directives, true)) { return false; }
                definition.enumValues.emplace_back(std::move(enumValue));
            }
        }
        break;

    case ast::TypeSystemKind::kInputObject:
        if (!parseDirectives(definition.directives, true)) { return false; }
        if (peek().name == Token::kOpenCurly) {
            if (!parseInputValueDefinitions(definition.inputFields, Token::kOpenCurly, Token::kCloseCurly)) {
                return false;
            }
        }
        break;

    default:
        assert(false);
        break;
    }

    definition.location = locationFrom(start);
    return true;
}

bool Parser::parseImplementsInterfaces(std::vector<std::string>& interfaces) {
    skip(Token::kAmpersand);
    do {
        std::string name;
        Location nameLocation;
        if (!parseName(name, nameLocation, "for implemented interface")) { return false; }
        interfaces.emplace_back(std::move(name));
    } while (skip(Token::kAmpersand));
    return true;
}

bool Parser::parseFieldDefinitions(std::vector<ast::FieldDefinition>& fields) {
    if (!expect(Token::kOpenCurly, "to open field definitions")) { return false; }
    while (!skip(Token::kCloseCurly)) {
        skipDescription();
        ast::FieldDefinition field;
        int32_t start = peek().offset;
        Location nameLocation;
        if (!parseName(field.name, nameLocation, "for field definition")) { return false; }
        if (peek().name == Token::kOpenParen) {
            if (!parseInputValueDefinitions(field.arguments, Token::kOpenParen, Token::kCloseParen)) { return false; }
        }
        if (!expect(Token::kColon, "after field name")) { return false; }
        if (!parseType(field.type)) { return false; }
        if (!parseDirectives(field.directives, true)) { return false; }
        field.location = locationFrom(start);
        fields.emplace_back(std::move(field));
    }
    return true;
}

bool Parser::parseInputValueDefinitions(std::vector<ast::InputValueDefinition>& values, Token::Name open,
        Token::Name close) {
    if (!expect(open, "to open input value definitions")) { return false; }
    while (!skip(close)) {
        skipDescription();
        ast::InputValueDefinition value;
        int32_t start = peek().offset;
        Location nameLocation;
        if (!parseName(value.name, nameLocation, "for input value definition")) { return false; }
        if (!expect(Token::kColon, "after input value name")) { return false; }
        if (!parseType(value.type)) { return false; }
        if (skip(Token::kEquals)) {
            ast::Value defaultValue;
            if (!parseValue(defaultValue, true)) { return false; }
            value.defaultValue = std::move(defaultValue);
        }
        if (!parseDirectives(value.directives, true)) { return false; }
        value.location = locationFrom(start);
        values.emplace_back(std::move(value));
    }
    return true;
}

void Parser::skipDescription() {
    if (peek().name == Token::kString || peek().name == Token::kBlockString) {
        next();
    }
}

bool Parser::unescapeString(const Token& token, std::string& value) {
    value.clear();
    if (token.name == Token::kBlockString) {
        value = blockStringValue(token.range.substr(3, token.range.size() - 6));
        return true;
    }

    auto raw = token.range.substr(1, token.range.size() - 2);
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '\\') {
            value += raw[i];
            continue;
        }
        ++i;
        if (i >= raw.size()) {
            break;
        }
        switch (raw[i]) {
        case '"': value += '"'; break;
        case '\\': value += '\\'; break;
        case '/': value += '/'; break;
        case 'b': value += '\b'; break;
        case 'f': value += '\f'; break;
        case 'n': value += '\n'; break;
        case 'r': value += '\r'; break;
        case 't': value += '\t'; break;
        case 'u': {
            uint32_t codePoint = 0;
            for (size_t j = 1; j <= 4; ++j) {
                int digit = i + j < raw.size() ? hexValue(raw[i + j]) : -1;
                if (digit < 0) {
                    int32_t escapeStart = token.offset + 1 + static_cast<int32_t>(i) - 1;
                    addError("Invalid unicode escape sequence",
                            Location(m_lexer->sourceID(), escapeStart, escapeStart + 2));
                    return false;
                }
                codePoint = (codePoint << 4) | static_cast<uint32_t>(digit);
            }
            appendUTF8(codePoint, value);
            i += 4;
        } break;
        default: {
            int32_t escapeStart = token.offset + 1 + static_cast<int32_t>(i) - 1;
            addError(fmt::format("Invalid escape sequence '\\{}'", raw[i]),
                    Location(m_lexer->sourceID(), escapeStart, escapeStart + 2));
            return false;
        }
        }
    }
    return true;
}

void Parser::addError(std::string message, Location errorLocation) {
    SPDLOG_DEBUG("Parse error: {}", message);
    m_diagnostics.emplace_back(Diagnostic(std::move(message), errorLocation));
}

} // namespace loom
