#include "FilterExpression.h"

#include "CommonUtils.h"
#include "SieveExceptions.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <variant>

struct FilterExpression::Node {
    enum class Kind { AND, OR, COMPARE };
    enum class Op { EQ, NE, LT, LE, GT, GE };
    struct Null {};
    using Literal = std::variant<Null, double, std::string>;

    Kind kind = Kind::COMPARE;
    size_t depth = 1;
    std::shared_ptr<const Node> left;
    std::shared_ptr<const Node> right;

    std::string column;
    Op op = Op::EQ;
    Literal literal;
};

namespace {
using Node = FilterExpression::Node;

// Bounds parser and evaluator recursion for stored expressions.
constexpr size_t kMaxDepth = 512;

enum class TokenType { IDENT, NUMBER, STRING, OP, LPAREN, RPAREN, AND, OR, NUL, END };

struct Token {
    TokenType type = TokenType::END;
    std::string text;
    double number = 0.0;
    size_t offset = 0;
};

[[noreturn]] void syntaxError(const std::string& code, size_t offset, const std::string& what) {
    throw Sieve::ResolutionException("filter", "", "Invalid filter expression '" + code + "' at offset " +
                                                       std::to_string(offset) + ": " + what);
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.';
}

std::vector<Token> tokenize(const std::string& code) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < code.size()) {
        const char c = code[i];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        Token tok;
        tok.offset = i;
        if (c == '(' || c == ')') {
            tok.type = (c == '(') ? TokenType::LPAREN : TokenType::RPAREN;
            ++i;
        } else if (c == '=' || c == '!' || c == '<' || c == '>') {
            std::string op(1, c);
            if (i + 1 < code.size() && code[i + 1] == '=') op.push_back('=');
            if (op == "=" || op == "!") syntaxError(code, i, "unknown operator '" + op + "'");
            tok.type = TokenType::OP;
            tok.text = op;
            i += op.size();
        } else if (c == '`') {
            ++i;
            while (true) {
                if (i >= code.size()) syntaxError(code, tok.offset, "unterminated back-quoted column");
                if (code[i] == '`') {
                    if (i + 1 < code.size() && code[i + 1] == '`') {
                        tok.text.push_back('`');
                        i += 2;
                        continue;
                    }
                    ++i;
                    break;
                }
                tok.text.push_back(code[i++]);
            }
            tok.type = TokenType::IDENT;
        } else if (c == '\'' || c == '"') {
            ++i;
            while (true) {
                if (i >= code.size()) syntaxError(code, tok.offset, "unterminated string literal");
                if (code[i] == c) {
                    ++i;
                    break;
                }
                if (code[i] == '\\' && i + 1 < code.size()) ++i;
                tok.text.push_back(code[i++]);
            }
            tok.type = TokenType::STRING;
        } else if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '+' || c == '.') {
            const char* begin = code.c_str() + i;
            char* end = nullptr;
            tok.number = std::strtod(begin, &end);
            if (end == begin) syntaxError(code, i, "malformed number");
            tok.type = TokenType::NUMBER;
            tok.text.assign(begin, static_cast<size_t>(end - begin));
            i += static_cast<size_t>(end - begin);
        } else if (isIdentStart(c)) {
            while (i < code.size() && isIdentChar(code[i])) tok.text.push_back(code[i++]);
            const std::string lowered = CommonUtils::toLower(tok.text);
            if (lowered == "and") tok.type = TokenType::AND;
            else if (lowered == "or") tok.type = TokenType::OR;
            else if (lowered == "null" || lowered == "none") tok.type = TokenType::NUL;
            else tok.type = TokenType::IDENT;
        } else {
            syntaxError(code, i, std::string("unexpected character '") + c + "'");
        }
        tokens.push_back(std::move(tok));
    }

    Token end;
    end.type = TokenType::END;
    end.offset = code.size();
    tokens.push_back(end);
    return tokens;
}

class Parser {
public:
    Parser(const std::string& code, std::vector<Token> tokens) : code_(code), tokens_(std::move(tokens)) {}

    std::shared_ptr<const Node> parse() {
        auto root = parseOr();
        if (peek().type != TokenType::END) syntaxError(code_, peek().offset, "unexpected trailing input");
        return root;
    }

private:
    const std::string& code_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t nesting_ = 0;

    const Token& peek() const { return tokens_[pos_]; }
    const Token& next() { return tokens_[pos_ < tokens_.size() - 1 ? pos_++ : pos_]; }

    std::shared_ptr<const Node> combine(Node::Kind kind, std::shared_ptr<const Node> l, std::shared_ptr<const Node> r) {
        auto node = std::make_shared<Node>();
        node->kind = kind;
        node->depth = 1 + std::max(l->depth, r->depth);
        if (node->depth > kMaxDepth) {
            syntaxError(code_, peek().offset, "expression nests deeper than " + std::to_string(kMaxDepth) + " levels");
        }
        node->left = std::move(l);
        node->right = std::move(r);
        return node;
    }

    std::shared_ptr<const Node> parseOr() {
        auto left = parseAnd();
        while (peek().type == TokenType::OR) {
            next();
            left = combine(Node::Kind::OR, std::move(left), parseAnd());
        }
        return left;
    }

    std::shared_ptr<const Node> parseAnd() {
        auto left = parsePrimary();
        while (peek().type == TokenType::AND) {
            next();
            left = combine(Node::Kind::AND, std::move(left), parsePrimary());
        }
        return left;
    }

    std::shared_ptr<const Node> parsePrimary() {
        if (peek().type == TokenType::LPAREN) {
            if (++nesting_ > kMaxDepth) {
                syntaxError(code_, peek().offset, "parentheses nest deeper than " + std::to_string(kMaxDepth) + " levels");
            }
            next();
            auto inner = parseOr();
            if (peek().type != TokenType::RPAREN) syntaxError(code_, peek().offset, "expected ')'");
            next();
            --nesting_;
            return inner;
        }

        const Token& column = next();
        if (column.type != TokenType::IDENT) syntaxError(code_, column.offset, "expected a column name");
        const Token& op = next();
        if (op.type != TokenType::OP) syntaxError(code_, op.offset, "expected a comparison operator");
        const Token& literal = next();

        auto node = std::make_shared<Node>();
        node->column = column.text;
        if (op.text == "==") node->op = Node::Op::EQ;
        else if (op.text == "!=") node->op = Node::Op::NE;
        else if (op.text == "<") node->op = Node::Op::LT;
        else if (op.text == "<=") node->op = Node::Op::LE;
        else if (op.text == ">") node->op = Node::Op::GT;
        else node->op = Node::Op::GE;

        switch (literal.type) {
            case TokenType::NUMBER: node->literal = literal.number; break;
            case TokenType::STRING: node->literal = literal.text; break;
            case TokenType::NUL:
                if (node->op != Node::Op::EQ && node->op != Node::Op::NE) {
                    syntaxError(code_, op.offset, "null only supports == and !=");
                }
                node->literal = Node::Null{};
                break;
            default:
                syntaxError(code_, literal.offset, "expected a literal");
        }
        return node;
    }
};

template <typename T>
bool compare(const T& lhs, Node::Op op, const T& rhs) {
    switch (op) {
        case Node::Op::EQ: return lhs == rhs;
        case Node::Op::NE: return lhs != rhs;
        case Node::Op::LT: return lhs < rhs;
        case Node::Op::LE: return lhs <= rhs;
        case Node::Op::GT: return lhs > rhs;
        case Node::Op::GE: return lhs >= rhs;
    }
    return false;
}

bool parseNumber(const std::string& raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

bool matchCell(const TypedColumn& col, size_t row, const Node& node) {
    const bool missing = col.isMissing(row);
    if (std::holds_alternative<Node::Null>(node.literal)) {
        return node.op == Node::Op::EQ ? missing : !missing;
    }
    if (missing) return false;

    if (const double* rhs = std::get_if<double>(&node.literal)) {
        double lhs = 0.0;
        if (col.isNumeric()) {
            lhs = std::get<std::vector<double>>(col.values)[row];
        } else if (!parseNumber(std::get<std::vector<std::string>>(col.values)[row], lhs)) {
            return node.op == Node::Op::NE;
        }
        return compare(lhs, node.op, *rhs);
    }

    const std::string& rhs = std::get<std::string>(node.literal);
    if (col.isNumeric()) {
        double rhsNumber = 0.0;
        if (parseNumber(rhs, rhsNumber)) {
            return compare(std::get<std::vector<double>>(col.values)[row], node.op, rhsNumber);
        }
    }
    return compare(col.cellText(row), node.op, rhs);
}

MissingMask evaluateNode(const Node& node, const DataFrame& data) {
    if (node.kind == Node::Kind::COMPARE) {
        const int idx = data.findColumnIndex(node.column);
        if (idx < 0) {
            throw Sieve::ResolutionException("filter", node.column,
                                             "Action 'filter' references missing column '" + node.column + "'");
        }
        const TypedColumn& col = data.columns()[static_cast<size_t>(idx)];
        MissingMask mask(data.rowCount(), static_cast<uint8_t>(0));
        for (size_t r = 0; r < data.rowCount(); ++r) mask[r] = matchCell(col, r, node) ? 1 : 0;
        return mask;
    }

    MissingMask lhs = evaluateNode(*node.left, data);
    const MissingMask rhs = evaluateNode(*node.right, data);
    for (size_t r = 0; r < lhs.size(); ++r) {
        lhs[r] = (node.kind == Node::Kind::AND) ? (lhs[r] && rhs[r]) : (lhs[r] || rhs[r]);
    }
    return lhs;
}

void collectColumns(const Node& node, std::vector<std::string>& out, std::set<std::string>& seen) {
    if (node.kind == Node::Kind::COMPARE) {
        if (seen.insert(node.column).second) out.push_back(node.column);
        return;
    }
    collectColumns(*node.left, out, seen);
    collectColumns(*node.right, out, seen);
}
} // namespace

FilterExpression FilterExpression::parse(const std::string& code) {
    if (CommonUtils::trim(code).empty()) syntaxError(code, 0, "empty expression");
    Parser parser(code, tokenize(code));
    return FilterExpression(parser.parse());
}

std::string FilterExpression::quoteColumn(const std::string& column) {
    bool plain = !column.empty() && isIdentStart(column.front());
    for (char c : column) {
        if (!isIdentChar(c)) plain = false;
    }
    const std::string lowered = CommonUtils::toLower(column);
    if (lowered == "and" || lowered == "or" || lowered == "null" || lowered == "none") plain = false;
    if (plain) return column;

    std::string quoted = "`";
    for (char c : column) {
        if (c == '`') quoted.push_back('`');
        quoted.push_back(c);
    }
    quoted.push_back('`');
    return quoted;
}

MissingMask FilterExpression::evaluate(const DataFrame& data) const {
    return evaluateNode(*root_, data);
}

std::vector<std::string> FilterExpression::referencedColumns() const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    collectColumns(*root_, out, seen);
    return out;
}
