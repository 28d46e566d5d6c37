#pragma once

#include "loopguard/analysis/php_ast.h"
#include "loopguard/analysis/php_lexer.h"

#include <initializer_list>
#include <string_view>
#include <vector>

namespace loopguard::php {

/**
 * @brief Recursive-descent parser for PHP 8 source
 *
 * Builds a syntax tree detailed enough for linting: calls, variables,
 * declarations and control flow are structural, while types, attributes
 * and import lists are consumed without being represented. Both brace and
 * alternative (`while (...): ... endwhile;`) syntax are accepted.
 *
 * Statements and expressions nest at most kMaxNesting levels deep.
 *
 * @throws ParseError on malformed input or nesting past the limit
 */
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    [[nodiscard]] NodePtr parse_program();

    /**
     * @brief Lex and parse in one step
     */
    [[nodiscard]] static NodePtr parse(std::string_view source);

    static constexpr size_t kMaxNesting = 256;

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;

    /**
     * @brief Counts one nesting level for the lifetime of a recursive call
     */
    class NestingGuard {
    public:
        explicit NestingGuard(Parser& parser);
        ~NestingGuard() { --parser_.depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        Parser& parser_;
    };

    // Token access
    [[nodiscard]] const Token& peek(size_t offset = 0) const;
    const Token& advance();
    bool accept_punct(std::string_view p);
    bool accept_keyword(std::string_view kw);
    const Token& expect_punct(std::string_view p);
    const Token& expect_keyword(std::string_view kw);
    const Token& expect_identifier(const char* what);
    [[nodiscard]] bool at_any_keyword(std::initializer_list<std::string_view> keywords) const;
    [[noreturn]] void fail(const std::string& message) const;

    // Statements
    void parse_statements_until(Node& parent, std::initializer_list<std::string_view> end_keywords,
                                bool until_brace);
    NodePtr parse_statement();
    NodePtr parse_body_statement();
    NodePtr parse_block();
    NodePtr parse_alt_block(std::initializer_list<std::string_view> end_keywords);
    void end_statement();

    NodePtr parse_if();
    NodePtr parse_while();
    NodePtr parse_do_while();
    NodePtr parse_for();
    NodePtr parse_foreach();
    NodePtr parse_switch();
    NodePtr parse_jump(NodeKind kind);
    NodePtr parse_return();
    NodePtr parse_echo();
    NodePtr parse_global();
    NodePtr parse_static_vars();
    NodePtr parse_function_decl();
    NodePtr parse_class_like();
    void parse_class_members(Node& cls);
    NodePtr parse_namespace();
    NodePtr parse_const();
    NodePtr parse_try();
    NodePtr parse_declare();
    void skip_use_statement();
    void skip_attributes();
    void skip_balanced(std::string_view open, std::string_view close);

    // Functions
    void parse_parameters(Node& fn);
    void parse_type();
    void parse_optional_return_type();

    // Expressions
    NodePtr parse_expression(int min_precedence = 0);
    NodePtr parse_unary();
    NodePtr parse_primary();
    NodePtr parse_postfix(NodePtr expr);
    NodePtr parse_identifier_expression();
    NodePtr parse_new();
    NodePtr parse_closure(size_t line);
    NodePtr parse_arrow_function(size_t line);
    NodePtr parse_match();
    NodePtr parse_array_literal(std::string_view close);
    NodePtr parse_expression_list(std::string_view terminator);
    void parse_arguments(Node& call);

    [[nodiscard]] bool is_reserved(const Token& token) const;
};

} // namespace loopguard::php
