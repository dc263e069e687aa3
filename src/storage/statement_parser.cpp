#include <neograph/storage/statement_parser.h>

#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace neograph::storage {

namespace {

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& what, size_t offset)
        : std::runtime_error(what), offset_(offset) {}

    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

enum class TokenType { Identifier, String, Integer, Float, Punct, End };

struct Token {
    TokenType type;
    std::string text;
    size_t offset;
};

bool isIdentStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool isIdentChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool equalsKeyword(std::string_view text, std::string_view keyword) {
    if (text.size() != keyword.size())
        return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(text[i])) != keyword[i])
            return false;
    }
    return true;
}

void appendUtf8(std::string& out, unsigned int cp, size_t offset) {
    // Lone surrogates have no UTF-8 encoding
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        throw SyntaxError(fmt::format("Invalid unicode code point U+{:04X}", cp), offset);
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::vector<Token> tokenize(std::string_view s) {
    std::vector<Token> tokens;
    size_t i = 0;

    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);

        if (std::isspace(c)) {
            ++i;
            continue;
        }

        size_t start = i;

        if (isIdentStart(c)) {
            while (i < s.size() && isIdentChar(static_cast<unsigned char>(s[i])))
                ++i;
            tokens.push_back(
                {TokenType::Identifier, std::string(s.substr(start, i - start)), start});
            continue;
        }

        if (std::isdigit(c)) {
            bool isFloat = false;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
                ++i;
            if (i + 1 < s.size() && s[i] == '.' &&
                std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
                isFloat = true;
                ++i;
                while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
                    ++i;
            }
            if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
                size_t j = i + 1;
                if (j < s.size() && (s[j] == '+' || s[j] == '-'))
                    ++j;
                if (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
                    isFloat = true;
                    i = j;
                    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
                        ++i;
                }
            }
            tokens.push_back({isFloat ? TokenType::Float : TokenType::Integer,
                              std::string(s.substr(start, i - start)), start});
            continue;
        }

        if (c == '"' || c == '\'') {
            char quote = static_cast<char>(c);
            std::string value;
            ++i;
            bool closed = false;
            while (i < s.size()) {
                char ch = s[i];
                if (ch == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                if (ch == '\\') {
                    if (i + 1 >= s.size())
                        break;
                    char esc = s[i + 1];
                    i += 2;
                    switch (esc) {
                        case '\\': value.push_back('\\'); break;
                        case '"': value.push_back('"'); break;
                        case '\'': value.push_back('\''); break;
                        case 'n': value.push_back('\n'); break;
                        case 't': value.push_back('\t'); break;
                        case 'r': value.push_back('\r'); break;
                        case 'b': value.push_back('\b'); break;
                        case 'f': value.push_back('\f'); break;
                        case 'u': {
                            if (i + 4 > s.size()) {
                                throw SyntaxError("Invalid unicode escape", i - 2);
                            }
                            std::string hex(s.substr(i, 4));
                            char* end = nullptr;
                            auto cp = std::strtoul(hex.c_str(), &end, 16);
                            if (end != hex.c_str() + 4) {
                                throw SyntaxError("Invalid unicode escape", i - 2);
                            }
                            appendUtf8(value, static_cast<unsigned int>(cp), i - 2);
                            i += 4;
                            break;
                        }
                        default:
                            throw SyntaxError(fmt::format("Invalid escape sequence '\\{}'", esc),
                                              i - 2);
                    }
                    continue;
                }
                value.push_back(ch);
                ++i;
            }
            if (!closed) {
                throw SyntaxError("Unterminated string literal", start);
            }
            tokens.push_back({TokenType::String, std::move(value), start});
            continue;
        }

        // Multi-character punctuation first
        if (c == '-' && i + 1 < s.size() && s[i + 1] == '>') {
            tokens.push_back({TokenType::Punct, "->", start});
            i += 2;
            continue;
        }
        if (c == '<' && i + 1 < s.size() && s[i + 1] == '-') {
            tokens.push_back({TokenType::Punct, "<-", start});
            i += 2;
            continue;
        }
        if (c == '+' && i + 1 < s.size() && s[i + 1] == '=') {
            tokens.push_back({TokenType::Punct, "+=", start});
            i += 2;
            continue;
        }

        switch (c) {
            case '(':
            case ')':
            case '[':
            case ']':
            case '{':
            case '}':
            case ':':
            case ',':
            case '.':
            case '=':
            case '-':
            case ';':
                tokens.push_back({TokenType::Punct, std::string(1, static_cast<char>(c)), start});
                ++i;
                continue;
            default:
                throw SyntaxError(fmt::format("Invalid input '{}'", static_cast<char>(c)), start);
        }
    }

    tokens.push_back({TokenType::End, "", s.size()});
    return tokens;
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    ParsedStatement parse() {
        ParsedStatement result;
        if (isKeyword("CREATE") && isKeywordAt(1, "CONSTRAINT")) {
            result = parseCreateConstraint();
        } else if (isKeyword("SHOW")) {
            advance();
            expectKeyword("CONSTRAINTS");
            result = ShowConstraintsStatement{};
        } else {
            result = parseQuery();
        }

        if (isPunct(";"))
            advance();
        if (peek().type != TokenType::End) {
            fail(fmt::format("Unexpected input '{}'", peek().text));
        }
        return result;
    }

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    const Token& peek(size_t ahead = 0) const {
        size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[idx];
    }

    const Token& advance() {
        const Token& t = tokens_[pos_];
        if (pos_ + 1 < tokens_.size())
            ++pos_;
        return t;
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw SyntaxError(message, peek().offset);
    }

    bool isKeyword(std::string_view kw) const { return isKeywordAt(0, kw); }

    bool isKeywordAt(size_t ahead, std::string_view kw) const {
        const auto& t = peek(ahead);
        return t.type == TokenType::Identifier && equalsKeyword(t.text, kw);
    }

    bool isPunct(std::string_view p) const {
        return peek().type == TokenType::Punct && peek().text == p;
    }

    void expectKeyword(std::string_view kw) {
        if (!isKeyword(kw)) {
            fail(fmt::format("Expected {} but found '{}'", kw, describe(peek())));
        }
        advance();
    }

    void expectPunct(std::string_view p) {
        if (!isPunct(p)) {
            fail(fmt::format("Expected '{}' but found '{}'", p, describe(peek())));
        }
        advance();
    }

    std::string expectIdentifier(std::string_view what) {
        if (peek().type != TokenType::Identifier) {
            fail(fmt::format("Expected {} but found '{}'", what, describe(peek())));
        }
        return advance().text;
    }

    static std::string describe(const Token& t) {
        return t.type == TokenType::End ? std::string("end of input") : t.text;
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    QueryStatement parseQuery() {
        QueryStatement query;
        while (peek().type != TokenType::End && !isPunct(";")) {
            if (isKeyword("MATCH")) {
                advance();
                query.clauses.emplace_back(MatchClause{parsePath()});
            } else if (isKeyword("MERGE")) {
                advance();
                query.clauses.emplace_back(parseMerge());
            } else if (isKeyword("SET")) {
                advance();
                query.clauses.emplace_back(SetClause{parseSetItems()});
            } else if (isKeyword("RETURN")) {
                advance();
                query.clauses.emplace_back(parseReturn());
            } else {
                fail(fmt::format("Invalid input '{}': expected MATCH, MERGE, SET or RETURN",
                                 describe(peek())));
            }
        }
        if (query.clauses.empty()) {
            fail("Empty statement");
        }
        return query;
    }

    MergeClause parseMerge() {
        MergeClause merge;
        merge.pattern = parsePath();
        while (isKeyword("ON")) {
            advance();
            bool onCreate = false;
            if (isKeyword("CREATE")) {
                onCreate = true;
            } else if (!isKeyword("MATCH")) {
                fail(fmt::format("Expected CREATE or MATCH after ON but found '{}'",
                                 describe(peek())));
            }
            advance();
            expectKeyword("SET");
            auto items = parseSetItems();
            auto& target = onCreate ? merge.onCreate : merge.onMatch;
            target.insert(target.end(), items.begin(), items.end());
        }
        return merge;
    }

    PathPattern parsePath() {
        PathPattern path;
        path.start = parseNode();
        if (isPunct("-") || isPunct("<-")) {
            path.relationship = parseRelationship();
            path.end = parseNode();
        }
        return path;
    }

    NodePattern parseNode() {
        NodePattern node;
        expectPunct("(");
        if (peek().type == TokenType::Identifier) {
            node.variable = advance().text;
        }
        if (isPunct(":")) {
            advance();
            node.label = expectIdentifier("a label");
        }
        if (isPunct("{")) {
            node.properties = parseMap();
        }
        expectPunct(")");
        return node;
    }

    RelationshipPattern parseRelationship() {
        RelationshipPattern rel;
        bool incoming = false;
        if (isPunct("<-")) {
            incoming = true;
            advance();
        } else {
            expectPunct("-");
        }

        expectPunct("[");
        if (peek().type == TokenType::Identifier) {
            rel.variable = advance().text;
        }
        if (isPunct(":")) {
            advance();
            rel.type = expectIdentifier("a relationship type");
        }
        if (isPunct("{")) {
            rel.properties = parseMap();
        }
        expectPunct("]");

        bool outgoing = false;
        if (isPunct("->")) {
            outgoing = true;
            advance();
        } else {
            expectPunct("-");
        }

        if (incoming && outgoing) {
            fail("Relationship cannot point both ways");
        }
        rel.direction = incoming   ? Direction::Incoming
                        : outgoing ? Direction::Outgoing
                                   : Direction::Undirected;
        return rel;
    }

    MapLiteral parseMap() {
        MapLiteral map;
        expectPunct("{");
        if (isPunct("}")) {
            advance();
            return map;
        }
        while (true) {
            auto key = expectIdentifier("a property key");
            expectPunct(":");
            map.emplace_back(std::move(key), parseExpression());
            if (isPunct(",")) {
                advance();
                continue;
            }
            expectPunct("}");
            break;
        }
        return map;
    }

    Expression parseExpression() {
        const Token& t = peek();
        switch (t.type) {
            case TokenType::String:
                return Expression::makeLiteral(graph::PropertyValue(advance().text));
            case TokenType::Integer:
                return Expression::makeLiteral(graph::PropertyValue(parseInteger(advance())));
            case TokenType::Float:
                return Expression::makeLiteral(graph::PropertyValue(std::stod(advance().text)));
            case TokenType::Punct:
                if (t.text == "-") {
                    advance();
                    const Token& num = peek();
                    if (num.type == TokenType::Integer) {
                        return Expression::makeLiteral(
                            graph::PropertyValue(parseInteger(advance(), true)));
                    }
                    if (num.type == TokenType::Float) {
                        return Expression::makeLiteral(
                            graph::PropertyValue(-std::stod(advance().text)));
                    }
                }
                break;
            case TokenType::Identifier:
                if (equalsKeyword(t.text, "TRUE")) {
                    advance();
                    return Expression::makeLiteral(graph::PropertyValue(true));
                }
                if (equalsKeyword(t.text, "FALSE")) {
                    advance();
                    return Expression::makeLiteral(graph::PropertyValue(false));
                }
                if (equalsKeyword(t.text, "NULL")) {
                    advance();
                    return Expression{Expression::Kind::Null, {}};
                }
                if (equalsKeyword(t.text, "TIMESTAMP")) {
                    advance();
                    expectPunct("(");
                    expectPunct(")");
                    return Expression{Expression::Kind::Timestamp, {}};
                }
                break;
            default:
                break;
        }
        fail(fmt::format("Invalid input '{}': expected a literal value", describe(peek())));
    }

    int64_t parseInteger(const Token& t, bool negative = false) {
        try {
            return std::stoll(negative ? "-" + t.text : t.text);
        } catch (const std::out_of_range&) {
            throw SyntaxError("Integer literal out of range: " + t.text, t.offset);
        }
    }

    std::vector<SetItem> parseSetItems() {
        std::vector<SetItem> items;
        while (true) {
            SetItem item;
            item.variable = expectIdentifier("a variable");
            if (isPunct(".")) {
                advance();
                item.kind = SetItem::Kind::Property;
                item.property = expectIdentifier("a property key");
                expectPunct("=");
                item.value = parseExpression();
            } else if (isPunct("+=")) {
                advance();
                item.kind = SetItem::Kind::MergeMap;
                item.map = parseMap();
            } else if (isPunct("=")) {
                advance();
                item.kind = SetItem::Kind::ReplaceMap;
                item.map = parseMap();
            } else {
                fail(fmt::format("Invalid input '{}': expected '.', '=' or '+='",
                                 describe(peek())));
            }
            items.push_back(std::move(item));
            if (!isPunct(","))
                break;
            advance();
        }
        return items;
    }

    ReturnClause parseReturn() {
        ReturnClause ret;
        while (true) {
            ReturnItem item;
            item.variable = expectIdentifier("a variable");
            item.column = item.variable;
            if (isPunct(".")) {
                advance();
                item.property = expectIdentifier("a property key");
                item.column += "." + *item.property;
            }
            if (isKeyword("AS")) {
                advance();
                item.column = expectIdentifier("an alias");
            }
            ret.items.push_back(std::move(item));
            if (!isPunct(","))
                break;
            advance();
        }
        return ret;
    }

    // ---------------------------------------------------------------------
    // Schema commands
    // ---------------------------------------------------------------------

    CreateConstraintStatement parseCreateConstraint() {
        CreateConstraintStatement stmt;
        expectKeyword("CREATE");
        expectKeyword("CONSTRAINT");

        if (peek().type == TokenType::Identifier && !isKeyword("IF") && !isKeyword("FOR")) {
            stmt.name = advance().text;
        }
        if (isKeyword("IF")) {
            advance();
            expectKeyword("NOT");
            expectKeyword("EXISTS");
            stmt.ifNotExists = true;
        }
        expectKeyword("FOR");

        auto path = parsePath();
        std::string variable;
        if (path.relationship) {
            if (!path.relationship->type) {
                fail("Constraint pattern requires a relationship type");
            }
            stmt.entity = ConstraintEntity::Relationship;
            stmt.label = *path.relationship->type;
            variable = path.relationship->variable;
        } else {
            if (!path.start.label) {
                fail("Constraint pattern requires a node label");
            }
            stmt.entity = ConstraintEntity::Node;
            stmt.label = *path.start.label;
            variable = path.start.variable;
        }

        expectKeyword("REQUIRE");
        auto ref = expectIdentifier("a variable");
        if (ref != variable) {
            fail(fmt::format("Variable '{}' not defined", ref));
        }
        expectPunct(".");
        stmt.property = expectIdentifier("a property key");
        expectKeyword("IS");
        if (isKeyword("UNIQUE")) {
            advance();
            stmt.requirement = ConstraintRequirement::Unique;
        } else {
            expectKeyword("NOT");
            expectKeyword("NULL");
            stmt.requirement = ConstraintRequirement::NotNull;
        }
        return stmt;
    }
};

} // namespace

bool QueryStatement::isWrite() const {
    for (const auto& clause : clauses) {
        if (std::holds_alternative<MergeClause>(clause) ||
            std::holds_alternative<SetClause>(clause)) {
            return true;
        }
    }
    return false;
}

Result<ParsedStatement> parseStatement(std::string_view text) {
    try {
        Parser parser(tokenize(text));
        return parser.parse();
    } catch (const SyntaxError& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("{} (offset {})", e.what(), e.offset())};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, e.what()};
    }
}

} // namespace neograph::storage
