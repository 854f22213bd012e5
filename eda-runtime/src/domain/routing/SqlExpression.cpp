#include "domain/routing/SqlExpression.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <variant>
#include <vector>

namespace eda::domain::routing {

namespace {

using Value = std::variant<bool, int64_t, std::string>;

/**
 * @brief Ошибка вычисления выражения (не синтаксическая)
 */
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& message)
        : std::runtime_error(message) {}
};

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ============================================================================
// LIKE
// ============================================================================

struct LikeToken {
    enum class Kind { LITERAL, ANY_ONE, ANY_SEQUENCE };
    Kind kind;
    char ch;
};

std::vector<LikeToken> compileLikePattern(const std::string& pattern) {
    std::vector<LikeToken> tokens;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\') {
            if (i + 1 >= pattern.size()) {
                throw SqlSyntaxError("LIKE pattern ends with an escape character");
            }
            tokens.push_back({LikeToken::Kind::LITERAL, pattern[++i]});
        } else if (c == '%') {
            tokens.push_back({LikeToken::Kind::ANY_SEQUENCE, 0});
        } else if (c == '_') {
            tokens.push_back({LikeToken::Kind::ANY_ONE, 0});
        } else {
            tokens.push_back({LikeToken::Kind::LITERAL, c});
        }
    }
    return tokens;
}

bool likeMatches(const std::string& value, const std::vector<LikeToken>& pattern) {
    const size_t npos = std::numeric_limits<size_t>::max();
    size_t v = 0;
    size_t p = 0;
    size_t starP = npos;
    size_t starV = 0;

    while (v < value.size()) {
        if (p < pattern.size()
            && (pattern[p].kind == LikeToken::Kind::ANY_ONE
                || (pattern[p].kind == LikeToken::Kind::LITERAL && pattern[p].ch == value[v]))) {
            ++v;
            ++p;
        } else if (p < pattern.size() && pattern[p].kind == LikeToken::Kind::ANY_SEQUENCE) {
            starP = p++;
            starV = v;
        } else if (starP != npos) {
            p = starP + 1;
            v = ++starV;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p].kind == LikeToken::Kind::ANY_SEQUENCE) {
        ++p;
    }
    return p == pattern.size();
}

// ============================================================================
// Lexer
// ============================================================================

enum class TokenType {
    WORD,
    STRING,
    INTEGER,
    OPERATOR,
    LPAREN,
    RPAREN,
    COMMA,
    END
};

struct Token {
    TokenType type;
    std::string text;
    size_t position;
};

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    size_t i = 0;

    while (i < text.size()) {
        char c = text[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t start = i;
            while (i < text.size()
                   && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_')) {
                ++i;
            }
            tokens.push_back({TokenType::WORD, text.substr(start, i - start), start});
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t start = i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            tokens.push_back({TokenType::INTEGER, text.substr(start, i - start), start});
            continue;
        }

        if (c == '\'' || c == '"') {
            size_t start = i;
            char quote = c;
            std::string value;
            ++i;
            bool closed = false;
            while (i < text.size()) {
                char ch = text[i];
                if (ch == '\\' && i + 1 < text.size()) {
                    char next = text[i + 1];
                    // \' \" \\ - экранирование; остальное оставляем как есть для LIKE
                    if (next == quote || next == '\\') {
                        if (next == '\\') value += '\\';
                        value += next;
                        i += 2;
                        continue;
                    }
                    value += ch;
                    ++i;
                    continue;
                }
                if (ch == quote) {
                    closed = true;
                    ++i;
                    break;
                }
                value += ch;
                ++i;
            }
            if (!closed) {
                throw SqlSyntaxError("unterminated string literal at position " + std::to_string(start));
            }
            tokens.push_back({TokenType::STRING, value, start});
            continue;
        }

        if (c == '(') { tokens.push_back({TokenType::LPAREN, "(", i++}); continue; }
        if (c == ')') { tokens.push_back({TokenType::RPAREN, ")", i++}); continue; }
        if (c == ',') { tokens.push_back({TokenType::COMMA, ",", i++}); continue; }

        if (c == '<' || c == '>' || c == '!') {
            size_t start = i;
            std::string op(1, c);
            if (i + 1 < text.size() && (text[i + 1] == '=' || (c == '<' && text[i + 1] == '>'))) {
                op += text[i + 1];
            }
            if (op == "!") {
                throw SqlSyntaxError("unexpected '!' at position " + std::to_string(start));
            }
            i += op.size();
            tokens.push_back({TokenType::OPERATOR, op, start});
            continue;
        }

        if (c == '=' || c == '+' || c == '-' || c == '*' || c == '/' || c == '%') {
            tokens.push_back({TokenType::OPERATOR, std::string(1, c), i++});
            continue;
        }

        throw SqlSyntaxError("unexpected character '" + std::string(1, c)
                             + "' at position " + std::to_string(i));
    }

    tokens.push_back({TokenType::END, "", text.size()});
    return tokens;
}

// ============================================================================
// Functions
// ============================================================================

struct FunctionSignature {
    const char* name;
    size_t minArgs;
    size_t maxArgs;
};

const FunctionSignature kFunctions[] = {
    {"LENGTH", 1, 1},
    {"CONCAT", 0, std::numeric_limits<size_t>::max()},
    {"LOWER", 1, 1},
    {"UPPER", 1, 1},
    {"TRIM", 1, 1},
    {"ABS", 1, 1},
    {"INT", 1, 1},
    {"BOOL", 1, 1},
    {"STRING", 1, 1},
};

const FunctionSignature* findFunction(const std::string& name) {
    for (const auto& function : kFunctions) {
        if (name == function.name) {
            return &function;
        }
    }
    return nullptr;
}

bool isKeyword(const std::string& upper) {
    return upper == "AND" || upper == "OR" || upper == "XOR" || upper == "NOT"
        || upper == "LIKE" || upper == "IN" || upper == "EXISTS"
        || upper == "TRUE" || upper == "FALSE";
}

} // namespace

// ============================================================================
// AST
// ============================================================================

struct SqlExpression::Node {
    enum class Kind {
        LITERAL,
        IDENTIFIER,
        UNARY,
        BINARY,
        LIKE,
        IN,
        EXISTS,
        FUNCTION
    };

    Kind kind;
    Value literal;
    std::string name;                 ///< идентификатор, оператор или функция
    bool negated = false;             ///< NOT LIKE / NOT IN
    std::vector<LikeToken> pattern;   ///< скомпилированный шаблон LIKE
    std::vector<std::shared_ptr<const Node>> children;
};

namespace {

using NodePtr = std::shared_ptr<const SqlExpression::Node>;
using Node = SqlExpression::Node;

NodePtr makeNode(Node::Kind kind, std::string name, std::vector<NodePtr> children) {
    auto node = std::make_shared<Node>();
    node->kind = kind;
    node->name = std::move(name);
    node->children = std::move(children);
    return node;
}

NodePtr makeLiteral(Value value) {
    auto node = std::make_shared<Node>();
    node->kind = Node::Kind::LITERAL;
    node->literal = std::move(value);
    return node;
}

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    NodePtr parse() {
        NodePtr root = parseOr();
        if (peek().type != TokenType::END) {
            fail("unexpected token '" + peek().text + "'");
        }
        return root;
    }

private:
    const Token& peek(size_t offset = 0) const {
        size_t index = std::min(pos_ + offset, tokens_.size() - 1);
        return tokens_[index];
    }

    const Token& advance() {
        const Token& token = tokens_[pos_];
        if (pos_ < tokens_.size() - 1) ++pos_;
        return token;
    }

    bool isKeywordToken(const Token& token, const char* keyword) const {
        return token.type == TokenType::WORD && toUpper(token.text) == keyword;
    }

    bool acceptKeyword(const char* keyword) {
        if (isKeywordToken(peek(), keyword)) {
            advance();
            return true;
        }
        return false;
    }

    bool isOperator(const Token& token, const char* op) const {
        return token.type == TokenType::OPERATOR && token.text == op;
    }

    void expect(TokenType type, const char* what) {
        if (peek().type != type) {
            fail(std::string("expected ") + what);
        }
        advance();
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw SqlSyntaxError(message + " at position " + std::to_string(peek().position));
    }

    NodePtr parseOr() {
        NodePtr left = parseXor();
        while (acceptKeyword("OR")) {
            left = makeNode(Node::Kind::BINARY, "OR", {left, parseXor()});
        }
        return left;
    }

    NodePtr parseXor() {
        NodePtr left = parseAnd();
        while (acceptKeyword("XOR")) {
            left = makeNode(Node::Kind::BINARY, "XOR", {left, parseAnd()});
        }
        return left;
    }

    NodePtr parseAnd() {
        NodePtr left = parsePredicate();
        while (acceptKeyword("AND")) {
            left = makeNode(Node::Kind::BINARY, "AND", {left, parsePredicate()});
        }
        return left;
    }

    NodePtr parsePredicate() {
        NodePtr left = parseAdditive();

        while (true) {
            const Token& token = peek();

            if (token.type == TokenType::OPERATOR
                && (token.text == "=" || token.text == "!=" || token.text == "<>"
                    || token.text == "<" || token.text == "<=" || token.text == ">"
                    || token.text == ">=")) {
                std::string op = advance().text;
                if (op == "<>") op = "!=";
                left = makeNode(Node::Kind::BINARY, op, {left, parseAdditive()});
                continue;
            }

            bool negated = false;
            if (isKeywordToken(token, "NOT")
                && (isKeywordToken(peek(1), "LIKE") || isKeywordToken(peek(1), "IN"))) {
                advance();
                negated = true;
            }

            if (acceptKeyword("LIKE")) {
                if (peek().type != TokenType::STRING) {
                    fail("LIKE requires a string literal pattern");
                }
                auto node = std::make_shared<Node>();
                node->kind = Node::Kind::LIKE;
                node->negated = negated;
                node->pattern = compileLikePattern(advance().text);
                node->children = {left};
                left = node;
                continue;
            }

            if (acceptKeyword("IN")) {
                expect(TokenType::LPAREN, "'(' after IN");
                std::vector<NodePtr> children{left};
                if (peek().type == TokenType::RPAREN) {
                    fail("IN requires at least one element");
                }
                children.push_back(parseOr());
                while (peek().type == TokenType::COMMA) {
                    advance();
                    children.push_back(parseOr());
                }
                expect(TokenType::RPAREN, "')' to close IN list");
                auto node = std::make_shared<Node>();
                node->kind = Node::Kind::IN;
                node->negated = negated;
                node->children = std::move(children);
                left = node;
                continue;
            }

            if (negated) {
                fail("expected LIKE or IN after NOT");
            }
            return left;
        }
    }

    NodePtr parseAdditive() {
        NodePtr left = parseMultiplicative();
        while (isOperator(peek(), "+") || isOperator(peek(), "-")) {
            std::string op = advance().text;
            left = makeNode(Node::Kind::BINARY, op, {left, parseMultiplicative()});
        }
        return left;
    }

    NodePtr parseMultiplicative() {
        NodePtr left = parseUnary();
        while (isOperator(peek(), "*") || isOperator(peek(), "/") || isOperator(peek(), "%")) {
            std::string op = advance().text;
            left = makeNode(Node::Kind::BINARY, op, {left, parseUnary()});
        }
        return left;
    }

    NodePtr parseUnary() {
        if (acceptKeyword("NOT")) {
            return makeNode(Node::Kind::UNARY, "NOT", {parseUnary()});
        }
        if (isOperator(peek(), "-")) {
            advance();
            return makeNode(Node::Kind::UNARY, "-", {parseUnary()});
        }
        return parsePrimary();
    }

    NodePtr parsePrimary() {
        const Token& token = peek();

        switch (token.type) {
            case TokenType::STRING:
                return makeLiteral(advance().text);

            case TokenType::INTEGER: {
                std::string text = advance().text;
                try {
                    return makeLiteral(static_cast<int64_t>(std::stoll(text)));
                } catch (const std::out_of_range&) {
                    fail("integer literal out of range: " + text);
                }
            }

            case TokenType::LPAREN: {
                advance();
                NodePtr inner = parseOr();
                expect(TokenType::RPAREN, "')'");
                return inner;
            }

            case TokenType::WORD:
                return parseWord();

            default:
                fail(token.type == TokenType::END ? "unexpected end of expression"
                                                  : "unexpected token '" + token.text + "'");
        }
    }

    NodePtr parseWord() {
        std::string text = advance().text;
        std::string upper = toUpper(text);

        if (upper == "TRUE") return makeLiteral(true);
        if (upper == "FALSE") return makeLiteral(false);

        if (upper == "EXISTS") {
            if (peek().type != TokenType::WORD || isKeyword(toUpper(peek().text))) {
                fail("EXISTS requires an attribute name");
            }
            return makeNode(Node::Kind::EXISTS, toLower(advance().text), {});
        }

        if (peek().type == TokenType::LPAREN) {
            const FunctionSignature* signature = findFunction(upper);
            if (!signature) {
                fail("unknown function: " + text);
            }
            advance();
            std::vector<NodePtr> args;
            if (peek().type != TokenType::RPAREN) {
                args.push_back(parseOr());
                while (peek().type == TokenType::COMMA) {
                    advance();
                    args.push_back(parseOr());
                }
            }
            expect(TokenType::RPAREN, "')' to close function call");
            if (args.size() < signature->minArgs || args.size() > signature->maxArgs) {
                fail("wrong number of arguments for " + upper);
            }
            return makeNode(Node::Kind::FUNCTION, upper, std::move(args));
        }

        if (isKeyword(upper)) {
            fail("unexpected keyword " + upper);
        }
        return makeNode(Node::Kind::IDENTIFIER, toLower(text), {});
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

// ============================================================================
// Evaluator
// ============================================================================

bool castToBool(const Value& value) {
    if (auto b = std::get_if<bool>(&value)) {
        return *b;
    }
    if (auto s = std::get_if<std::string>(&value)) {
        std::string lower = toLower(*s);
        if (lower == "true") return true;
        if (lower == "false") return false;
        throw EvaluationError("cannot cast '" + *s + "' to boolean");
    }
    throw EvaluationError("cannot cast integer to boolean");
}

int64_t castToInt(const Value& value) {
    if (auto i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (auto s = std::get_if<std::string>(&value)) {
        if (s->empty()) {
            throw EvaluationError("cannot cast empty string to integer");
        }
        size_t consumed = 0;
        try {
            int64_t result = std::stoll(*s, &consumed);
            if (consumed == s->size()) {
                return result;
            }
        } catch (const std::logic_error&) {
        }
        throw EvaluationError("cannot cast '" + *s + "' to integer");
    }
    throw EvaluationError("cannot cast boolean to integer");
}

std::string castToString(const Value& value) {
    if (auto s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (auto i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    return std::get<bool>(value) ? "true" : "false";
}

int64_t negate(int64_t value) {
    if (value == std::numeric_limits<int64_t>::min()) {
        throw EvaluationError("integer overflow in negation");
    }
    return -value;
}

bool valuesEqual(const Value& left, const Value& right) {
    if (left.index() == right.index()) {
        return left == right;
    }
    if (std::holds_alternative<bool>(left) || std::holds_alternative<bool>(right)) {
        return castToBool(left) == castToBool(right);
    }
    return castToInt(left) == castToInt(right);
}

class Evaluator {
public:
    explicit Evaluator(const Event& event) : event_(event) {}

    Value eval(const Node& node) const {
        switch (node.kind) {
            case Node::Kind::LITERAL:
                return node.literal;

            case Node::Kind::IDENTIFIER: {
                auto value = event_.attribute(node.name);
                if (!value) {
                    throw EvaluationError("missing attribute: " + node.name);
                }
                return *value;
            }

            case Node::Kind::EXISTS:
                return event_.attribute(node.name).has_value();

            case Node::Kind::UNARY:
                if (node.name == "NOT") {
                    return !castToBool(eval(*node.children[0]));
                }
                return negate(castToInt(eval(*node.children[0])));

            case Node::Kind::BINARY:
                return evalBinary(node);

            case Node::Kind::LIKE: {
                bool matched = likeMatches(castToString(eval(*node.children[0])), node.pattern);
                return node.negated ? !matched : matched;
            }

            case Node::Kind::IN: {
                Value left = eval(*node.children[0]);
                bool found = false;
                for (size_t i = 1; i < node.children.size() && !found; ++i) {
                    found = valuesEqual(left, eval(*node.children[i]));
                }
                return node.negated ? !found : found;
            }

            case Node::Kind::FUNCTION:
                return evalFunction(node);
        }
        throw EvaluationError("unknown expression node");
    }

private:
    Value evalBinary(const Node& node) const {
        const std::string& op = node.name;

        if (op == "AND") {
            if (!castToBool(eval(*node.children[0]))) return false;
            return castToBool(eval(*node.children[1]));
        }
        if (op == "OR") {
            if (castToBool(eval(*node.children[0]))) return true;
            return castToBool(eval(*node.children[1]));
        }
        if (op == "XOR") {
            return castToBool(eval(*node.children[0])) != castToBool(eval(*node.children[1]));
        }

        Value left = eval(*node.children[0]);
        Value right = eval(*node.children[1]);

        if (op == "=") return valuesEqual(left, right);
        if (op == "!=") return !valuesEqual(left, right);

        if (op == "<" || op == "<=" || op == ">" || op == ">=") {
            int compared;
            if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
                compared = std::get<std::string>(left).compare(std::get<std::string>(right));
            } else {
                int64_t l = castToInt(left);
                int64_t r = castToInt(right);
                compared = l < r ? -1 : (l > r ? 1 : 0);
            }
            if (op == "<") return compared < 0;
            if (op == "<=") return compared <= 0;
            if (op == ">") return compared > 0;
            return compared >= 0;
        }

        int64_t l = castToInt(left);
        int64_t r = castToInt(right);
        int64_t result = 0;
        if (op == "+") {
            if (__builtin_add_overflow(l, r, &result)) throw EvaluationError("integer overflow in +");
            return result;
        }
        if (op == "-") {
            if (__builtin_sub_overflow(l, r, &result)) throw EvaluationError("integer overflow in -");
            return result;
        }
        if (op == "*") {
            if (__builtin_mul_overflow(l, r, &result)) throw EvaluationError("integer overflow in *");
            return result;
        }
        if (r == 0) {
            throw EvaluationError("division by zero");
        }
        // INT64_MIN / -1 не представимо и на x86 дает SIGFPE
        if (l == std::numeric_limits<int64_t>::min() && r == -1) {
            throw EvaluationError("integer overflow in " + op);
        }
        if (op == "/") return l / r;
        return l % r;
    }

    Value evalFunction(const Node& node) const {
        const std::string& name = node.name;

        if (name == "CONCAT") {
            std::string result;
            for (const auto& arg : node.children) {
                result += castToString(eval(*arg));
            }
            return result;
        }

        Value arg = eval(*node.children[0]);
        if (name == "LENGTH") return static_cast<int64_t>(castToString(arg).size());
        if (name == "LOWER") return toLower(castToString(arg));
        if (name == "UPPER") return toUpper(castToString(arg));
        if (name == "TRIM") {
            std::string s = castToString(arg);
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) return std::string();
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }
        if (name == "ABS") {
            int64_t value = castToInt(arg);
            return value < 0 ? negate(value) : value;
        }
        if (name == "INT") return castToInt(arg);
        if (name == "BOOL") return castToBool(arg);
        return castToString(arg);
    }

    const Event& event_;
};

} // namespace

SqlExpression SqlExpression::parse(const std::string& text) {
    Parser parser(tokenize(text));
    return SqlExpression(parser.parse(), text);
}

bool SqlExpression::evaluate(const Event& event) const {
    try {
        return castToBool(Evaluator(event).eval(*root_));
    } catch (const EvaluationError&) {
        return false;
    }
}

} // namespace eda::domain::routing
