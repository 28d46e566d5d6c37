#include "loopguard/analysis/php_parser.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

namespace loopguard::php {

namespace {

constexpr int kAssignPrecedence = 4;
constexpr int kTernaryPrecedence = 5;
constexpr int kNotPrecedence = 18;
constexpr int kUnaryPrecedence = 19;

struct OperatorInfo {
    int precedence;
    bool right_assoc;
    bool assignment;
};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<OperatorInfo> binary_operator(const Token& t) {
    if (t.is(TokenType::Identifier)) {
        if (t.is_keyword("or"))         return OperatorInfo{1, false, false};
        if (t.is_keyword("xor"))        return OperatorInfo{2, false, false};
        if (t.is_keyword("and"))        return OperatorInfo{3, false, false};
        if (t.is_keyword("instanceof")) return OperatorInfo{18, false, false};
        return std::nullopt;
    }
    if (!t.is(TokenType::Punct)) {
        return std::nullopt;
    }

    static const std::array<std::string_view, 14> assignments = {
        "=", "+=", "-=", "*=", "/=", ".=", "%=", "**=", "??=", "&=", "|=", "^=", "<<=", ">>="
    };
    if (std::find(assignments.begin(), assignments.end(), t.text) != assignments.end()) {
        return OperatorInfo{kAssignPrecedence, true, true};
    }

    const std::string& op = t.text;
    if (op == "??") return OperatorInfo{6, true, false};
    if (op == "||") return OperatorInfo{7, false, false};
    if (op == "&&") return OperatorInfo{8, false, false};
    if (op == "|")  return OperatorInfo{9, false, false};
    if (op == "^")  return OperatorInfo{10, false, false};
    if (op == "&")  return OperatorInfo{11, false, false};
    if (op == "==" || op == "!=" || op == "===" || op == "!==" || op == "<>" || op == "<=>") {
        return OperatorInfo{12, false, false};
    }
    if (op == "<" || op == "<=" || op == ">" || op == ">=") return OperatorInfo{13, false, false};
    if (op == ".")  return OperatorInfo{14, false, false};
    if (op == "<<" || op == ">>") return OperatorInfo{15, false, false};
    if (op == "+" || op == "-")   return OperatorInfo{16, false, false};
    if (op == "*" || op == "/" || op == "%") return OperatorInfo{17, false, false};
    if (op == "**") return OperatorInfo{20, true, false};

    return std::nullopt;
}

NodePtr make(NodeKind kind, size_t line) {
    return std::make_unique<Node>(kind, line);
}

} // namespace

Parser::Parser(std::vector<Token> tokens)
    : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is(TokenType::End)) {
        size_t line = tokens_.empty() ? 1 : tokens_.back().line;
        tokens_.push_back(Token{TokenType::End, "", line});
    }
}

NodePtr Parser::parse(std::string_view source) {
    Lexer lexer(source);
    Parser parser(lexer.tokenize());
    return parser.parse_program();
}

Parser::NestingGuard::NestingGuard(Parser& parser) : parser_(parser) {
    if (parser_.depth_ >= kMaxNesting) {
        throw ParseError("nesting too deep", parser_.peek().line);
    }
    ++parser_.depth_;
}

NodePtr Parser::parse_program() {
    auto program = make(NodeKind::Program, 1);
    parse_statements_until(*program, {}, false);
    return program;
}

// ============================================================================
// Token access
// ============================================================================

const Token& Parser::peek(size_t offset) const {
    const size_t index = std::min(pos_ + offset, tokens_.size() - 1);
    return tokens_[index];
}

const Token& Parser::advance() {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
    return token;
}

bool Parser::accept_punct(std::string_view p) {
    if (peek().is_punct(p)) {
        advance();
        return true;
    }
    return false;
}

bool Parser::accept_keyword(std::string_view kw) {
    if (peek().is_keyword(kw)) {
        advance();
        return true;
    }
    return false;
}

const Token& Parser::expect_punct(std::string_view p) {
    if (!peek().is_punct(p)) {
        fail("expected '" + std::string(p) + "'");
    }
    return advance();
}

const Token& Parser::expect_keyword(std::string_view kw) {
    if (!peek().is_keyword(kw)) {
        fail("expected '" + std::string(kw) + "'");
    }
    return advance();
}

const Token& Parser::expect_identifier(const char* what) {
    if (!peek().is(TokenType::Identifier)) {
        fail(std::string("expected ") + what);
    }
    return advance();
}

bool Parser::at_any_keyword(std::initializer_list<std::string_view> keywords) const {
    const Token& t = peek();
    return std::any_of(keywords.begin(), keywords.end(),
                       [&t](std::string_view kw) { return t.is_keyword(kw); });
}

void Parser::fail(const std::string& message) const {
    const Token& t = peek();
    std::string found;
    switch (t.type) {
        case TokenType::End:       found = "end of file"; break;
        case TokenType::Variable:  found = "'$" + t.text + "'"; break;
        case TokenType::String:    found = "string literal"; break;
        case TokenType::CloseTag:  found = "'?>'"; break;
        default:                   found = "'" + t.text + "'"; break;
    }
    throw ParseError(message + ", found " + found, t.line);
}

bool Parser::is_reserved(const Token& token) const {
    static const std::array<std::string_view, 40> reserved = {
        "if", "else", "elseif", "endif", "while", "endwhile", "do", "for", "endfor",
        "foreach", "endforeach", "as", "switch", "endswitch", "case", "default",
        "break", "continue", "return", "try", "catch", "finally", "global", "echo",
        "class", "interface", "trait", "extends", "implements", "const", "use",
        "goto", "declare", "enddeclare", "abstract", "final", "var", "public",
        "private", "protected"
    };
    if (!token.is(TokenType::Identifier)) {
        return false;
    }
    return std::any_of(reserved.begin(), reserved.end(),
                       [&token](std::string_view kw) { return token.is_keyword(kw); });
}

// ============================================================================
// Statements
// ============================================================================

void Parser::parse_statements_until(Node& parent, std::initializer_list<std::string_view> end_keywords,
                                    bool until_brace) {
    while (true) {
        const Token& t = peek();
        if (t.is(TokenType::End)) {
            if (until_brace || end_keywords.size() > 0) {
                fail("unexpected end of file");
            }
            return;
        }
        if (t.is_punct("}")) {
            if (until_brace) {
                return;
            }
            fail("unexpected '}'");
        }
        if (end_keywords.size() > 0 && at_any_keyword(end_keywords)) {
            return;
        }
        parent.add(parse_statement());
    }
}

NodePtr Parser::parse_statement() {
    NestingGuard guard(*this);
    const Token& t = peek();

    switch (t.type) {
        case TokenType::OpenTag:
        case TokenType::CloseTag:
            advance();
            return nullptr;
        case TokenType::InlineHtml: {
            auto html = make(NodeKind::InlineHtml, t.line);
            html->value = t.text;
            advance();
            return html;
        }
        case TokenType::End:
            fail("unexpected end of file");
        default:
            break;
    }

    if (t.is_punct("#[")) {
        skip_attributes();
        return parse_statement();
    }
    if (t.is_punct("{")) {
        return parse_block();
    }
    if (t.is_punct(";")) {
        advance();
        return nullptr;
    }

    if (t.is(TokenType::Identifier)) {
        const Token& next = peek(1);

        if (t.is_keyword("if"))       return parse_if();
        if (t.is_keyword("while"))    return parse_while();
        if (t.is_keyword("do"))       return parse_do_while();
        if (t.is_keyword("for"))      return parse_for();
        if (t.is_keyword("foreach"))  return parse_foreach();
        if (t.is_keyword("switch"))   return parse_switch();
        if (t.is_keyword("break"))    return parse_jump(NodeKind::Break);
        if (t.is_keyword("continue")) return parse_jump(NodeKind::Continue);
        if (t.is_keyword("return"))   return parse_return();
        if (t.is_keyword("echo"))     return parse_echo();
        if (t.is_keyword("global"))   return parse_global();
        if (t.is_keyword("try"))      return parse_try();
        if (t.is_keyword("declare"))  return parse_declare();

        if (t.is_keyword("static") && next.is(TokenType::Variable)) {
            return parse_static_vars();
        }
        if (t.is_keyword("function") &&
            (next.is(TokenType::Identifier) || (next.is_punct("&") && peek(2).is(TokenType::Identifier)))) {
            return parse_function_decl();
        }
        if (at_any_keyword({"abstract", "final", "readonly", "class", "interface", "trait"}) &&
            next.is(TokenType::Identifier)) {
            return parse_class_like();
        }
        if (t.is_keyword("enum") && next.is(TokenType::Identifier) &&
            (peek(2).is_punct("{") || peek(2).is_punct(":") || peek(2).is_keyword("implements"))) {
            return parse_class_like();
        }
        if (t.is_keyword("namespace") &&
            (next.is(TokenType::Identifier) || next.is_punct("{") || next.is_punct(";"))) {
            return parse_namespace();
        }
        if (t.is_keyword("use")) {
            skip_use_statement();
            return nullptr;
        }
        if (t.is_keyword("const") && next.is(TokenType::Identifier)) {
            return parse_const();
        }
        if (t.is_keyword("goto")) {
            auto node = make(NodeKind::Goto, t.line);
            advance();
            node->name = expect_identifier("label").text;
            end_statement();
            return node;
        }
        if (t.is_keyword("__halt_compiler")) {
            pos_ = tokens_.size() - 1;
            return nullptr;
        }
        if (next.is_punct(":") && !is_reserved(t)) {
            auto label = make(NodeKind::Label, t.line);
            label->name = t.text;
            advance();
            advance();
            return label;
        }
    }

    auto stmt = make(NodeKind::ExprStatement, t.line);
    stmt->add(parse_expression());
    end_statement();
    return stmt;
}

NodePtr Parser::parse_body_statement() {
    const size_t line = peek().line;
    auto stmt = parse_statement();
    return stmt ? std::move(stmt) : make(NodeKind::Block, line);
}

NodePtr Parser::parse_block() {
    auto block = make(NodeKind::Block, expect_punct("{").line);
    parse_statements_until(*block, {}, true);
    expect_punct("}");
    return block;
}

NodePtr Parser::parse_alt_block(std::initializer_list<std::string_view> end_keywords) {
    auto block = make(NodeKind::Block, peek().line);
    parse_statements_until(*block, end_keywords, false);
    return block;
}

void Parser::end_statement() {
    if (accept_punct(";")) {
        return;
    }
    if (peek().is(TokenType::CloseTag)) {
        advance();
        return;
    }
    fail("expected ';'");
}

NodePtr Parser::parse_if() {
    auto node = make(NodeKind::If, advance().line);
    expect_punct("(");
    node->add(parse_expression());
    expect_punct(")");

    if (accept_punct(":")) {
        node->add(parse_alt_block({"elseif", "else", "endif"}));
        while (true) {
            if (accept_keyword("elseif")) {
                expect_punct("(");
                node->add(parse_expression());
                expect_punct(")");
                expect_punct(":");
                node->add(parse_alt_block({"elseif", "else", "endif"}));
                continue;
            }
            if (accept_keyword("else")) {
                expect_punct(":");
                node->add(parse_alt_block({"endif"}));
            }
            break;
        }
        expect_keyword("endif");
        end_statement();
        return node;
    }

    node->add(parse_body_statement());
    while (true) {
        if (accept_keyword("elseif")) {
            expect_punct("(");
            node->add(parse_expression());
            expect_punct(")");
            node->add(parse_body_statement());
            continue;
        }
        if (accept_keyword("else")) {
            // `else if` arrives here as a nested if statement
            node->add(parse_body_statement());
        }
        break;
    }
    return node;
}

NodePtr Parser::parse_while() {
    auto node = make(NodeKind::While, advance().line);
    expect_punct("(");
    node->add(parse_expression());
    expect_punct(")");

    if (accept_punct(":")) {
        node->add(parse_alt_block({"endwhile"}));
        expect_keyword("endwhile");
        end_statement();
    } else {
        node->add(parse_body_statement());
    }
    return node;
}

NodePtr Parser::parse_do_while() {
    auto node = make(NodeKind::DoWhile, advance().line);
    node->add(parse_body_statement());
    expect_keyword("while");
    expect_punct("(");
    node->add(parse_expression());
    expect_punct(")");
    end_statement();
    return node;
}

NodePtr Parser::parse_for() {
    auto node = make(NodeKind::For, advance().line);
    expect_punct("(");
    node->add(parse_expression_list(";"));
    expect_punct(";");
    node->add(parse_expression_list(";"));
    expect_punct(";");
    node->add(parse_expression_list(")"));
    expect_punct(")");

    if (accept_punct(":")) {
        node->add(parse_alt_block({"endfor"}));
        expect_keyword("endfor");
        end_statement();
    } else {
        node->add(parse_body_statement());
    }
    return node;
}

NodePtr Parser::parse_foreach() {
    auto node = make(NodeKind::Foreach, advance().line);
    expect_punct("(");
    node->add(parse_expression());
    expect_keyword("as");
    node->add(parse_expression());
    if (accept_punct("=>")) {
        node->add(parse_expression());
    }
    expect_punct(")");

    if (accept_punct(":")) {
        node->add(parse_alt_block({"endforeach"}));
        expect_keyword("endforeach");
        end_statement();
    } else {
        node->add(parse_body_statement());
    }
    return node;
}

NodePtr Parser::parse_switch() {
    auto node = make(NodeKind::Switch, advance().line);
    expect_punct("(");
    node->add(parse_expression());
    expect_punct(")");

    bool alt = false;
    if (!accept_punct("{")) {
        expect_punct(":");
        alt = true;
    }
    accept_punct(";");

    while (true) {
        if (!alt && accept_punct("}")) {
            break;
        }
        if (alt && accept_keyword("endswitch")) {
            end_statement();
            break;
        }
        // Whitespace-only HTML between "switch (...):" and the first case
        if (peek().is(TokenType::CloseTag) || peek().is(TokenType::OpenTag) ||
            peek().is(TokenType::InlineHtml)) {
            advance();
            continue;
        }

        auto case_node = make(NodeKind::Case, peek().line);
        if (accept_keyword("case")) {
            case_node->add(parse_expression());
        } else if (!accept_keyword("default")) {
            fail("expected 'case' or 'default'");
        }
        if (!accept_punct(":")) {
            expect_punct(";");
        }

        auto body = make(NodeKind::Block, peek().line);
        if (alt) {
            parse_statements_until(*body, {"case", "default", "endswitch"}, false);
        } else {
            parse_statements_until(*body, {"case", "default"}, true);
        }
        case_node->add(std::move(body));
        node->add(std::move(case_node));
    }
    return node;
}

NodePtr Parser::parse_jump(NodeKind kind) {
    auto node = make(kind, advance().line);
    node->value = "1";
    if (peek().is(TokenType::Integer)) {
        node->value = advance().text;
    }
    end_statement();
    return node;
}

NodePtr Parser::parse_return() {
    auto node = make(NodeKind::Return, advance().line);
    if (!peek().is_punct(";") && !peek().is(TokenType::CloseTag)) {
        node->add(parse_expression());
    }
    end_statement();
    return node;
}

NodePtr Parser::parse_echo() {
    auto node = make(NodeKind::Echo, advance().line);
    do {
        node->add(parse_expression());
    } while (accept_punct(","));
    end_statement();
    return node;
}

NodePtr Parser::parse_global() {
    auto node = make(NodeKind::GlobalDecl, advance().line);
    do {
        if (!peek().is(TokenType::Variable) && !peek().is_punct("$")) {
            fail("expected variable after 'global'");
        }
        node->add(parse_primary());
    } while (accept_punct(","));
    end_statement();
    return node;
}

NodePtr Parser::parse_static_vars() {
    auto node = make(NodeKind::StaticVarDecl, advance().line);
    do {
        if (!peek().is(TokenType::Variable)) {
            fail("expected variable after 'static'");
        }
        const Token& var = advance();
        auto decl = make(NodeKind::Variable, var.line);
        decl->name = var.text;
        if (accept_punct("=")) {
            decl->add(parse_expression());
        }
        node->add(std::move(decl));
    } while (accept_punct(","));
    end_statement();
    return node;
}

NodePtr Parser::parse_function_decl() {
    const size_t line = advance().line;
    accept_punct("&");
    auto node = make(NodeKind::FunctionDecl, line);
    node->name = expect_identifier("function name").text;
    parse_parameters(*node);
    parse_optional_return_type();
    node->add(parse_block());
    return node;
}

NodePtr Parser::parse_class_like() {
    const size_t line = peek().line;
    while (at_any_keyword({"abstract", "final", "readonly"})) {
        advance();
    }

    if (!at_any_keyword({"class", "interface", "trait", "enum"})) {
        fail("expected class declaration");
    }
    auto node = make(NodeKind::ClassDecl, line);
    node->value = to_lower(advance().text);
    node->name = expect_identifier("class name").text;

    if (node->value == "enum" && accept_punct(":")) {
        parse_type();
    }
    if (accept_keyword("extends")) {
        do {
            expect_identifier("class name");
        } while (accept_punct(","));
    }
    if (accept_keyword("implements")) {
        do {
            expect_identifier("interface name");
        } while (accept_punct(","));
    }

    parse_class_members(*node);
    return node;
}

void Parser::parse_class_members(Node& cls) {
    expect_punct("{");

    while (!accept_punct("}")) {
        if (peek().is(TokenType::End)) {
            fail("unexpected end of file in class body");
        }
        if (peek().is_punct("#[")) {
            skip_attributes();
            continue;
        }
        if (accept_keyword("use")) {
            while (!peek().is_punct(";") && !peek().is_punct("{")) {
                if (peek().is(TokenType::End)) fail("unexpected end of file in trait use");
                advance();
            }
            if (peek().is_punct("{")) {
                skip_balanced("{", "}");
            } else {
                advance();
            }
            continue;
        }
        if (cls.value == "enum" && peek().is_keyword("case")) {
            auto enum_case = make(NodeKind::ClassConst, advance().line);
            enum_case->name = expect_identifier("enum case name").text;
            if (accept_punct("=")) {
                enum_case->add(parse_expression());
            }
            expect_punct(";");
            cls.add(std::move(enum_case));
            continue;
        }

        const size_t line = peek().line;
        bool is_static = false;
        while (at_any_keyword({"public", "protected", "private", "static", "abstract", "final", "var", "readonly"})) {
            if (peek().is_keyword("static")) {
                is_static = true;
            }
            advance();
            if (peek().is_punct("(")) {
                skip_balanced("(", ")");   // asymmetric visibility, private(set)
            }
        }

        if (accept_keyword("const")) {
            if (!peek(1).is_punct("=")) {
                parse_type();
            }
            do {
                auto constant = make(NodeKind::ClassConst, peek().line);
                constant->name = expect_identifier("constant name").text;
                expect_punct("=");
                constant->add(parse_expression());
                cls.add(std::move(constant));
            } while (accept_punct(","));
            expect_punct(";");
            continue;
        }

        if (accept_keyword("function")) {
            accept_punct("&");
            auto method = make(NodeKind::FunctionDecl, line);
            method->name = expect_identifier("method name").text;
            method->value = is_static ? "static" : "";
            parse_parameters(*method);
            parse_optional_return_type();
            if (!accept_punct(";")) {
                method->add(parse_block());
            }
            cls.add(std::move(method));
            continue;
        }

        if (!peek().is(TokenType::Variable)) {
            parse_type();
        }
        bool hooked = false;
        do {
            if (!peek().is(TokenType::Variable)) {
                fail("expected property declaration");
            }
            const Token& var = advance();
            auto property = make(NodeKind::PropertyDecl, var.line);
            property->name = var.text;
            property->value = is_static ? "static" : "";
            if (accept_punct("=")) {
                property->add(parse_expression());
            }
            if (peek().is_punct("{")) {
                skip_balanced("{", "}");
                hooked = true;
            }
            cls.add(std::move(property));
        } while (!hooked && accept_punct(","));

        if (!hooked) {
            expect_punct(";");
        }
    }
}

NodePtr Parser::parse_namespace() {
    auto node = make(NodeKind::Namespace, advance().line);
    if (peek().is(TokenType::Identifier)) {
        node->name = advance().text;
    }

    if (accept_punct(";")) {
        return node;
    }
    expect_punct("{");
    parse_statements_until(*node, {}, true);
    expect_punct("}");
    return node;
}

NodePtr Parser::parse_const() {
    auto block = make(NodeKind::Block, advance().line);
    do {
        auto constant = make(NodeKind::ClassConst, peek().line);
        constant->name = expect_identifier("constant name").text;
        expect_punct("=");
        constant->add(parse_expression());
        block->add(std::move(constant));
    } while (accept_punct(","));
    end_statement();
    return block;
}

NodePtr Parser::parse_try() {
    auto node = make(NodeKind::Try, advance().line);
    node->add(parse_block());

    bool handled = false;
    while (peek().is_keyword("catch")) {
        auto catch_node = make(NodeKind::Catch, advance().line);
        expect_punct("(");
        do {
            catch_node->name = expect_identifier("exception type").text;
        } while (accept_punct("|"));
        if (peek().is(TokenType::Variable)) {
            auto var = make(NodeKind::Variable, peek().line);
            var->name = advance().text;
            catch_node->add(std::move(var));
        }
        expect_punct(")");
        catch_node->add(parse_block());
        node->add(std::move(catch_node));
        handled = true;
    }

    if (accept_keyword("finally")) {
        node->add(parse_block());
        handled = true;
    }

    if (!handled) {
        fail("expected 'catch' or 'finally'");
    }
    return node;
}

NodePtr Parser::parse_declare() {
    auto node = make(NodeKind::Declare, advance().line);
    expect_punct("(");
    do {
        node->name = expect_identifier("declare directive").text;
        expect_punct("=");
        node->add(parse_expression());
    } while (accept_punct(","));
    expect_punct(")");

    if (accept_punct(":")) {
        node->add(parse_alt_block({"enddeclare"}));
        expect_keyword("enddeclare");
        end_statement();
    } else if (peek().is_punct(";") || peek().is(TokenType::CloseTag)) {
        end_statement();
    } else {
        node->add(parse_body_statement());
    }
    return node;
}

void Parser::skip_use_statement() {
    advance();
    while (!peek().is_punct(";") && !peek().is(TokenType::CloseTag)) {
        if (peek().is(TokenType::End)) {
            fail("unexpected end of file in use statement");
        }
        if (peek().is_punct("{")) {
            skip_balanced("{", "}");
        } else {
            advance();
        }
    }
    end_statement();
}

void Parser::skip_attributes() {
    while (peek().is_punct("#[")) {
        advance();
        int depth = 1;
        while (depth > 0) {
            if (peek().is(TokenType::End)) {
                fail("unterminated attribute");
            }
            const Token& t = advance();
            if (t.is_punct("[") || t.is_punct("#[")) {
                ++depth;
            } else if (t.is_punct("]")) {
                --depth;
            }
        }
    }
}

void Parser::skip_balanced(std::string_view open, std::string_view close) {
    expect_punct(open);
    int depth = 1;
    while (depth > 0) {
        if (peek().is(TokenType::End)) {
            fail("expected '" + std::string(close) + "'");
        }
        const Token& t = advance();
        if (t.is_punct(open)) {
            ++depth;
        } else if (t.is_punct(close)) {
            --depth;
        }
    }
}

// ============================================================================
// Functions
// ============================================================================

void Parser::parse_parameters(Node& fn) {
    expect_punct("(");

    while (!accept_punct(")")) {
        skip_attributes();
        while (at_any_keyword({"public", "private", "protected", "readonly"})) {
            advance();
            if (peek().is_punct("(")) {
                skip_balanced("(", ")");
            }
        }

        if (!peek().is(TokenType::Variable) && !peek().is_punct("&") && !peek().is_punct("...")) {
            parse_type();
        }
        accept_punct("&");
        accept_punct("...");

        if (!peek().is(TokenType::Variable)) {
            fail("expected parameter name");
        }
        const Token& var = advance();
        auto param = make(NodeKind::Parameter, var.line);
        param->name = var.text;
        if (accept_punct("=")) {
            param->add(parse_expression());
        }
        if (peek().is_punct("{")) {
            skip_balanced("{", "}");
        }
        fn.add(std::move(param));

        if (!accept_punct(",")) {
            expect_punct(")");
            break;
        }
    }
}

void Parser::parse_type() {
    accept_punct("?");
    while (true) {
        if (peek().is_punct("(")) {
            skip_balanced("(", ")");
        } else {
            expect_identifier("type");
        }

        if (accept_punct("|")) {
            continue;
        }
        // Intersection types; '&' before a variable is by-reference instead
        if (peek().is_punct("&") && (peek(1).is(TokenType::Identifier) || peek(1).is_punct("("))) {
            advance();
            continue;
        }
        break;
    }
}

void Parser::parse_optional_return_type() {
    if (accept_punct(":")) {
        parse_type();
    }
}

// ============================================================================
// Expressions
// ============================================================================

NodePtr Parser::parse_expression(int min_precedence) {
    NestingGuard guard(*this);
    NodePtr left = parse_unary();

    while (true) {
        const Token& op = peek();

        if (op.is_punct("?")) {
            if (kTernaryPrecedence < min_precedence) {
                break;
            }
            auto ternary = make(NodeKind::Ternary, advance().line);
            ternary->add(std::move(left));
            if (!accept_punct(":")) {
                ternary->add(parse_expression(kAssignPrecedence));
                expect_punct(":");
            }
            ternary->add(parse_expression(kTernaryPrecedence + 1));
            left = std::move(ternary);
            continue;
        }

        auto info = binary_operator(op);
        if (!info || info->precedence < min_precedence) {
            break;
        }

        const Token& op_token = advance();
        const int next_min = info->right_assoc ? info->precedence : info->precedence + 1;

        auto node = make(info->assignment ? NodeKind::Assign : NodeKind::Binary, op_token.line);
        node->name = to_lower(op_token.text);
        node->add(std::move(left));
        node->add(parse_expression(next_min));
        left = std::move(node);
    }

    return left;
}

NodePtr Parser::parse_unary() {
    const Token& t = peek();

    if (t.is(TokenType::Punct) &&
        (t.text == "!" || t.text == "-" || t.text == "+" || t.text == "~" || t.text == "@" ||
         t.text == "&" || t.text == "++" || t.text == "--")) {
        auto node = make(NodeKind::Unary, advance().line);
        node->name = t.text;
        node->add(parse_expression(t.text == "!" ? kNotPrecedence : kUnaryPrecedence));
        return node;
    }

    if (t.is(TokenType::Cast)) {
        auto node = make(NodeKind::Cast, advance().line);
        node->name = t.text;
        node->add(parse_expression(kUnaryPrecedence));
        return node;
    }

    return parse_postfix(parse_primary());
}

NodePtr Parser::parse_primary() {
    const Token& t = peek();

    switch (t.type) {
        case TokenType::Variable: {
            auto var = make(NodeKind::Variable, t.line);
            var->name = t.text;
            advance();
            return var;
        }
        case TokenType::Integer: {
            auto lit = make(NodeKind::IntegerLiteral, t.line);
            lit->value = t.text;
            advance();
            return lit;
        }
        case TokenType::Float: {
            auto lit = make(NodeKind::FloatLiteral, t.line);
            lit->value = t.text;
            advance();
            return lit;
        }
        case TokenType::String:
        case TokenType::ShellCommand: {
            auto lit = make(t.is(TokenType::String) ? NodeKind::StringLiteral : NodeKind::ShellCommand, t.line);
            lit->value = t.text;
            for (const auto& part : t.interpolations) {
                auto var = make(NodeKind::Variable, part.line);
                var->name = part.name;
                lit->add(std::move(var));
            }
            advance();
            return lit;
        }
        case TokenType::Identifier:
            return parse_identifier_expression();
        default:
            break;
    }

    if (t.is_punct("$")) {
        // Variable variables: $$name, ${expr}
        NestingGuard guard(*this);
        auto var = make(NodeKind::Variable, advance().line);
        if (accept_punct("{")) {
            var->add(parse_expression());
            expect_punct("}");
        } else {
            var->add(parse_primary());
        }
        return var;
    }

    if (t.is_punct("(")) {
        advance();
        auto inner = parse_expression();
        expect_punct(")");
        return inner;
    }

    if (t.is_punct("[")) {
        advance();
        return parse_array_literal("]");
    }

    if (t.is_punct("#[")) {
        skip_attributes();
        return parse_primary();
    }

    fail("unexpected token");
}

NodePtr Parser::parse_identifier_expression() {
    const Token& t = peek();
    const size_t line = t.line;
    const std::string lower = to_lower(t.text);

    if (lower == "true" || lower == "false" || lower == "null") {
        auto name = make(NodeKind::Name, line);
        name->name = t.text;
        name->value = lower;
        advance();
        return name;
    }

    if ((lower == "array" || lower == "list") && peek(1).is_punct("(")) {
        advance();
        advance();
        return parse_array_literal(")");
    }

    if (lower == "isset" || lower == "empty" || lower == "unset") {
        if (!peek(1).is_punct("(")) {
            advance();
            fail("expected '('");
        }
        advance();
        auto node = make(lower == "isset" ? NodeKind::Isset
                         : lower == "empty" ? NodeKind::Empty : NodeKind::Unset, line);
        parse_arguments(*node);
        return node;
    }

    if (lower == "exit" || lower == "die") {
        advance();
        auto node = make(NodeKind::Exit, line);
        node->name = lower;
        if (accept_punct("(")) {
            if (!accept_punct(")")) {
                node->add(parse_expression());
                expect_punct(")");
            }
        }
        return node;
    }

    if (lower == "new") {
        advance();
        return parse_new();
    }

    if (lower == "clone" || lower == "print") {
        advance();
        auto node = make(lower == "clone" ? NodeKind::Clone : NodeKind::Print, line);
        node->add(parse_expression(lower == "clone" ? kUnaryPrecedence : kAssignPrecedence));
        return node;
    }

    if (lower == "yield") {
        advance();
        auto node = make(NodeKind::Yield, line);
        if (accept_keyword("from")) {
            node->value = "from";
            node->add(parse_expression(kAssignPrecedence));
            return node;
        }
        const Token& next = peek();
        if (!next.is_punct(";") && !next.is_punct(")") && !next.is_punct(",") &&
            !next.is_punct("]") && !next.is(TokenType::CloseTag)) {
            node->add(parse_expression(kAssignPrecedence));
            if (accept_punct("=>")) {
                node->add(parse_expression(kAssignPrecedence));
            }
        }
        return node;
    }

    if (lower == "throw") {
        advance();
        auto node = make(NodeKind::Throw, line);
        node->add(parse_expression());
        return node;
    }

    if (lower == "include" || lower == "include_once" || lower == "require" || lower == "require_once") {
        advance();
        auto node = make(NodeKind::Include, line);
        node->name = lower;
        node->add(parse_expression(kAssignPrecedence));
        return node;
    }

    if (lower == "function") {
        advance();
        return parse_closure(line);
    }

    if (lower == "fn") {
        advance();
        return parse_arrow_function(line);
    }

    if (lower == "static" && (peek(1).is_keyword("function") || peek(1).is_keyword("fn"))) {
        advance();
        const bool arrow = peek().is_keyword("fn");
        advance();
        return arrow ? parse_arrow_function(line) : parse_closure(line);
    }

    if (lower == "match" && peek(1).is_punct("(")) {
        advance();
        return parse_match();
    }

    if (is_reserved(t)) {
        fail("unexpected keyword");
    }

    auto name = make(NodeKind::Name, line);
    name->name = t.text;
    advance();
    return name;
}

NodePtr Parser::parse_new() {
    auto node = make(NodeKind::New, peek().line);

    if (peek().is_keyword("class")) {
        auto cls = make(NodeKind::ClassDecl, advance().line);
        cls->name = "class@anonymous";
        cls->value = "class";
        if (peek().is_punct("(")) {
            parse_arguments(*node);
        }
        if (accept_keyword("extends")) {
            expect_identifier("class name");
        }
        if (accept_keyword("implements")) {
            do {
                expect_identifier("interface name");
            } while (accept_punct(","));
        }
        parse_class_members(*cls);
        node->add(std::move(cls));
        return node;
    }

    if (peek().is(TokenType::Identifier)) {
        node->name = advance().text;
    } else if (peek().is(TokenType::Variable) || peek().is_punct("$")) {
        NodePtr target = parse_primary();
        while (true) {
            if (peek().is_punct("->") || peek().is_punct("?->")) {
                auto fetch = make(NodeKind::PropertyFetch, advance().line);
                if (peek().is(TokenType::Identifier) || peek().is(TokenType::Variable)) {
                    fetch->name = advance().text;
                } else {
                    fail("expected property name");
                }
                fetch->add(std::move(target));
                target = std::move(fetch);
            } else if (peek().is_punct("::") && peek(1).is(TokenType::Variable)) {
                auto fetch = make(NodeKind::StaticPropertyFetch, advance().line);
                fetch->name = advance().text;
                fetch->add(std::move(target));
                target = std::move(fetch);
            } else if (peek().is_punct("[")) {
                auto index = make(NodeKind::Index, advance().line);
                index->add(std::move(target));
                index->add(parse_expression());
                expect_punct("]");
                target = std::move(index);
            } else {
                break;
            }
        }
        node->add(std::move(target));
    } else if (accept_punct("(")) {
        node->add(parse_expression());
        expect_punct(")");
    } else {
        fail("expected class name after 'new'");
    }

    if (peek().is_punct("(")) {
        parse_arguments(*node);
    }
    return node;
}

NodePtr Parser::parse_closure(size_t line) {
    auto node = make(NodeKind::Closure, line);
    accept_punct("&");
    parse_parameters(*node);

    if (accept_keyword("use")) {
        expect_punct("(");
        while (!accept_punct(")")) {
            accept_punct("&");
            if (!peek().is(TokenType::Variable)) {
                fail("expected variable in closure use list");
            }
            auto var = make(NodeKind::Variable, peek().line);
            var->name = advance().text;
            node->add(std::move(var));
            if (!accept_punct(",")) {
                expect_punct(")");
                break;
            }
        }
    }

    parse_optional_return_type();
    node->add(parse_block());
    return node;
}

NodePtr Parser::parse_arrow_function(size_t line) {
    auto node = make(NodeKind::ArrowFunction, line);
    accept_punct("&");
    parse_parameters(*node);
    parse_optional_return_type();
    expect_punct("=>");
    node->add(parse_expression(kAssignPrecedence));
    return node;
}

NodePtr Parser::parse_match() {
    auto node = make(NodeKind::Match, peek().line);
    expect_punct("(");
    node->add(parse_expression());
    expect_punct(")");
    expect_punct("{");

    while (!accept_punct("}")) {
        auto arm = make(NodeKind::MatchArm, peek().line);
        if (accept_keyword("default")) {
            arm->name = "default";
            accept_punct(",");
        } else {
            while (true) {
                arm->add(parse_expression());
                if (!accept_punct(",") || peek().is_punct("=>")) {
                    break;
                }
            }
        }
        expect_punct("=>");
        arm->add(parse_expression());
        node->add(std::move(arm));

        if (!accept_punct(",")) {
            expect_punct("}");
            break;
        }
    }
    return node;
}

NodePtr Parser::parse_array_literal(std::string_view close) {
    auto array = make(NodeKind::ArrayLiteral, peek().line);

    while (!accept_punct(close)) {
        // Skipped slot in a list() destructuring
        if (accept_punct(",")) {
            continue;
        }

        auto item = make(NodeKind::ArrayItem, peek().line);
        if (peek().is_punct("...")) {
            auto spread = make(NodeKind::Spread, advance().line);
            spread->add(parse_expression());
            item->add(std::move(spread));
        } else {
            item->add(parse_expression());
            if (accept_punct("=>")) {
                item->add(parse_expression());
            }
        }
        array->add(std::move(item));

        if (!accept_punct(",")) {
            expect_punct(close);
            break;
        }
    }
    return array;
}

NodePtr Parser::parse_expression_list(std::string_view terminator) {
    auto list = make(NodeKind::ExprList, peek().line);
    if (peek().is_punct(terminator)) {
        return list;
    }
    do {
        list->add(parse_expression());
    } while (accept_punct(","));
    return list;
}

void Parser::parse_arguments(Node& call) {
    expect_punct("(");

    while (!accept_punct(")")) {
        // First-class callable syntax: strlen(...)
        if (peek().is_punct("...") && peek(1).is_punct(")")) {
            advance();
            advance();
            call.value = "...";
            return;
        }
        // Named argument
        if (peek().is(TokenType::Identifier) && peek(1).is_punct(":")) {
            advance();
            advance();
        }

        if (peek().is_punct("...")) {
            auto spread = make(NodeKind::Spread, advance().line);
            spread->add(parse_expression());
            call.add(std::move(spread));
        } else {
            call.add(parse_expression());
        }

        if (!accept_punct(",")) {
            expect_punct(")");
            break;
        }
    }
}

NodePtr Parser::parse_postfix(NodePtr expr) {
    while (true) {
        const Token& t = peek();

        if (t.is_punct("[")) {
            auto index = make(NodeKind::Index, advance().line);
            index->add(std::move(expr));
            if (!accept_punct("]")) {
                index->add(parse_expression());
                expect_punct("]");
            }
            expr = std::move(index);
            continue;
        }

        if (t.is_punct("->") || t.is_punct("?->")) {
            const size_t line = advance().line;
            std::string member;
            NodePtr dynamic_member;
            if (peek().is(TokenType::Identifier)) {
                member = advance().text;
            } else if (peek().is(TokenType::Variable)) {
                dynamic_member = parse_primary();
            } else if (accept_punct("{")) {
                dynamic_member = parse_expression();
                expect_punct("}");
            } else {
                fail("expected member name");
            }

            const bool is_call = peek().is_punct("(");
            auto node = make(is_call ? NodeKind::MethodCall : NodeKind::PropertyFetch, line);
            node->name = member;
            node->add(std::move(expr));
            node->add(std::move(dynamic_member));
            if (is_call) {
                parse_arguments(*node);
            }
            expr = std::move(node);
            continue;
        }

        if (t.is_punct("::")) {
            const size_t line = advance().line;
            if (peek().is(TokenType::Variable)) {
                auto fetch = make(NodeKind::StaticPropertyFetch, line);
                fetch->name = advance().text;
                fetch->add(std::move(expr));
                expr = std::move(fetch);
            } else if (peek().is(TokenType::Identifier)) {
                const std::string member = advance().text;
                const bool is_call = peek().is_punct("(");
                auto node = make(is_call ? NodeKind::StaticCall : NodeKind::ClassConstFetch, line);
                node->name = member;
                node->add(std::move(expr));
                if (is_call) {
                    parse_arguments(*node);
                }
                expr = std::move(node);
            } else if (accept_punct("{")) {
                auto node = make(NodeKind::StaticCall, line);
                node->add(std::move(expr));
                node->add(parse_expression());
                expect_punct("}");
                parse_arguments(*node);
                expr = std::move(node);
            } else {
                fail("expected member after '::'");
            }
            continue;
        }

        if (t.is_punct("(")) {
            auto call = make(NodeKind::Call, t.line);
            if (expr->kind == NodeKind::Name) {
                call->name = expr->name;
            } else {
                call->add(std::move(expr));
            }
            parse_arguments(*call);
            expr = std::move(call);
            continue;
        }

        if (t.is_punct("++") || t.is_punct("--")) {
            auto node = make(NodeKind::Unary, advance().line);
            node->name = t.text;
            node->value = "postfix";
            node->add(std::move(expr));
            expr = std::move(node);
            continue;
        }

        break;
    }
    return expr;
}

} // namespace loopguard::php
