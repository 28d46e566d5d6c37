#pragma once

#include "loopguard/core/exceptions.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace loopguard::php {

// ============================================================================
// Tokens
// ============================================================================

enum class TokenType : int {
    InlineHtml,     ///< Text outside <?php ... ?>
    OpenTag,        ///< <?php or <?
    CloseTag,       ///< ?>, terminates a statement
    Variable,       ///< $name, text holds the name without '$'
    Identifier,     ///< Names and keywords, may contain namespace separators
    Integer,
    Float,
    String,         ///< Quoted string, heredoc or nowdoc; text holds the raw body
    ShellCommand,   ///< Backtick string
    Cast,           ///< (int), (string), ...; text holds the target type
    Punct,          ///< Operators and punctuation
    End
};

/**
 * @brief A `$name` embedded in an interpolating string
 */
struct Interpolation {
    std::string name;   ///< Without '$'
    size_t line = 0;
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    size_t line = 0;
    std::vector<Interpolation> interpolations;   ///< String and ShellCommand tokens only

    [[nodiscard]] bool is(TokenType t) const noexcept { return type == t; }
    [[nodiscard]] bool is_punct(std::string_view p) const noexcept {
        return type == TokenType::Punct && text == p;
    }

    /**
     * @brief Case-insensitive keyword match on an identifier
     */
    [[nodiscard]] bool is_keyword(std::string_view kw) const noexcept;
};

/**
 * @brief Malformed source, with the line the problem was found on
 */
class ParseError : public LoopguardException {
public:
    ParseError(const std::string& message, size_t line)
        : LoopguardException("Syntax error on line " + std::to_string(line) + ": " + message)
        , line_(line) {}

    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

// ============================================================================
// Lexer
// ============================================================================

/**
 * @brief Splits PHP source into tokens
 *
 * Comments and whitespace are dropped. `<?=` is emitted as an open tag
 * followed by an `echo` identifier.
 *
 * @throws ParseError on unterminated strings, comments or heredocs
 */
class Lexer {
public:
    explicit Lexer(std::string_view source);

    [[nodiscard]] std::vector<Token> tokenize();

private:
    std::string_view src_;
    size_t pos_ = 0;
    size_t line_ = 1;
    bool in_php_ = false;
    std::vector<Token> tokens_;

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= src_.size(); }
    [[nodiscard]] char peek(size_t offset = 0) const noexcept;
    [[nodiscard]] bool starts_with(std::string_view text) const noexcept;
    char advance();
    void emit(TokenType type, std::string text, size_t line);

    void lex_inline_html();
    void lex_php_token();
    void skip_line_comment();
    void skip_block_comment();
    void lex_variable();
    void lex_identifier();
    void lex_number();
    void lex_quoted(char quote);
    void lex_heredoc();
    bool try_lex_cast();
    void lex_punct();
};

[[nodiscard]] bool is_identifier_start(char c) noexcept;
[[nodiscard]] bool is_identifier_char(char c) noexcept;

/**
 * @brief Variables referenced by a double-quoted, heredoc or backtick body
 *
 * Recognises `$name`, `{$name` and `${name}`; `\$` is a literal dollar.
 * @param first_line Line the body starts on
 */
[[nodiscard]] std::vector<Interpolation> find_interpolations(std::string_view body, size_t first_line);

} // namespace loopguard::php
