#include "loopguard/analysis/php_lexer.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace loopguard::php {

namespace {

// Longest first so that prefix operators never shadow longer ones
constexpr std::array<std::string_view, 44> kPunctuators = {
    "<<=", ">>=", "**=", "...", "<=>", "===", "!==", "??=", "?->",
    "<<", ">>", "**", "++", "--", "->", "=>", "::", "==", "!=", "<>",
    "<=", ">=", "&&", "||", "??", "+=", "-=", "*=", "/=", ".=", "%=",
    "&=", "|=", "^=", "#[",
    "+", "-", "*", "/", "%", "=", "<", ">", "!"
};

constexpr std::string_view kSinglePunct = ".,;:?()[]{}&|^~@$\\";

constexpr std::array<std::string_view, 12> kCastTypes = {
    "int", "integer", "bool", "boolean", "float", "double",
    "real", "string", "array", "object", "unset", "binary"
};

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool is_identifier_start(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

bool is_identifier_char(char c) noexcept {
    return is_identifier_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

std::vector<Interpolation> find_interpolations(std::string_view body, size_t first_line) {
    std::vector<Interpolation> found;
    size_t line = first_line;

    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '\n') {
            ++line;
        } else if (c == '\\') {
            if (i + 1 < body.size() && body[i + 1] == '\n') {
                ++line;
            }
            ++i;
        } else if (c == '$') {
            size_t p = i + 1;
            if (p < body.size() && body[p] == '{') {
                ++p;   // ${name}
            }
            if (p >= body.size() || !is_identifier_start(body[p])) {
                continue;
            }
            const size_t name_start = p;
            while (p < body.size() && is_identifier_char(body[p])) {
                ++p;
            }
            found.push_back(Interpolation{std::string(body.substr(name_start, p - name_start)), line});
            i = p - 1;
        }
    }
    return found;
}

bool Token::is_keyword(std::string_view kw) const noexcept {
    return type == TokenType::Identifier && iequals(text, kw);
}

// ============================================================================
// Lexer
// ============================================================================

Lexer::Lexer(std::string_view source)
    : src_(source) {
}

char Lexer::peek(size_t offset) const noexcept {
    return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
}

bool Lexer::starts_with(std::string_view text) const noexcept {
    return src_.substr(pos_, text.size()) == text;
}

char Lexer::advance() {
    char c = src_[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

void Lexer::emit(TokenType type, std::string text, size_t line) {
    tokens_.push_back(Token{type, std::move(text), line});
}

std::vector<Token> Lexer::tokenize() {
    while (!at_end()) {
        if (in_php_) {
            lex_php_token();
        } else {
            lex_inline_html();
        }
    }
    emit(TokenType::End, "", line_);
    return std::move(tokens_);
}

void Lexer::lex_inline_html() {
    const size_t start = pos_;
    const size_t start_line = line_;

    while (!at_end()) {
        if (peek() == '<' && peek(1) == '?') {
            const bool php_tag = iequals(src_.substr(pos_ + 2, 3), "php") &&
                                 (pos_ + 5 >= src_.size() || std::isspace(static_cast<unsigned char>(peek(5))));
            const bool echo_tag = peek(2) == '=';

            if (php_tag || echo_tag) {
                if (pos_ > start) {
                    emit(TokenType::InlineHtml, std::string(src_.substr(start, pos_ - start)), start_line);
                }

                const size_t tag_line = line_;
                if (php_tag) {
                    pos_ += 5;
                    if (!at_end()) advance();   // the whitespace after <?php belongs to the tag
                    emit(TokenType::OpenTag, "<?php", tag_line);
                } else {
                    pos_ += 3;
                    emit(TokenType::OpenTag, "<?=", tag_line);
                    emit(TokenType::Identifier, "echo", tag_line);
                }
                in_php_ = true;
                return;
            }
        }
        advance();
    }

    emit(TokenType::InlineHtml, std::string(src_.substr(start, pos_ - start)), start_line);
}

void Lexer::lex_php_token() {
    const char c = peek();

    if (std::isspace(static_cast<unsigned char>(c))) {
        advance();
        return;
    }

    if (starts_with("?>")) {
        emit(TokenType::CloseTag, "?>", line_);
        pos_ += 2;
        if (peek() == '\n') {
            advance();
        } else if (peek() == '\r' && peek(1) == '\n') {
            advance();
            advance();
        }
        in_php_ = false;
        return;
    }

    if (starts_with("#[")) {
        emit(TokenType::Punct, "#[", line_);
        pos_ += 2;
        return;
    }

    if (c == '#' || starts_with("//")) {
        skip_line_comment();
        return;
    }

    if (starts_with("/*")) {
        skip_block_comment();
        return;
    }

    if (c == '$' && is_identifier_start(peek(1))) {
        lex_variable();
        return;
    }

    if (is_identifier_start(c) || (c == '\\' && is_identifier_start(peek(1)))) {
        lex_identifier();
        return;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
        lex_number();
        return;
    }

    if (c == '\'' || c == '"' || c == '`') {
        lex_quoted(c);
        return;
    }

    if (starts_with("<<<")) {
        lex_heredoc();
        return;
    }

    if (c == '(' && try_lex_cast()) {
        return;
    }

    lex_punct();
}

void Lexer::skip_line_comment() {
    while (!at_end() && peek() != '\n') {
        if (starts_with("?>")) {
            return;
        }
        advance();
    }
}

void Lexer::skip_block_comment() {
    const size_t start_line = line_;
    pos_ += 2;
    while (!at_end()) {
        if (starts_with("*/")) {
            pos_ += 2;
            return;
        }
        advance();
    }
    throw ParseError("unterminated comment", start_line);
}

void Lexer::lex_variable() {
    const size_t line = line_;
    ++pos_;  // '$'
    const size_t start = pos_;
    while (!at_end() && is_identifier_char(peek())) {
        ++pos_;
    }
    emit(TokenType::Variable, std::string(src_.substr(start, pos_ - start)), line);
}

void Lexer::lex_identifier() {
    const size_t line = line_;
    const size_t start = pos_;

    while (!at_end()) {
        if (is_identifier_char(peek())) {
            ++pos_;
        } else if (peek() == '\\' && is_identifier_start(peek(1))) {
            ++pos_;
        } else {
            break;
        }
    }
    emit(TokenType::Identifier, std::string(src_.substr(start, pos_ - start)), line);
}

void Lexer::lex_number() {
    const size_t line = line_;
    const size_t start = pos_;
    bool is_float = false;

    auto digits = [this](auto pred) {
        while (!at_end() && (pred(static_cast<unsigned char>(peek())) || peek() == '_')) {
            ++pos_;
        }
    };

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
        pos_ += 2;
        digits([](unsigned char ch) { return std::isxdigit(ch) != 0; });
    } else if (peek() == '0' && (peek(1) == 'b' || peek(1) == 'B')) {
        pos_ += 2;
        digits([](unsigned char ch) { return ch == '0' || ch == '1'; });
    } else if (peek() == '0' && (peek(1) == 'o' || peek(1) == 'O')) {
        pos_ += 2;
        digits([](unsigned char ch) { return ch >= '0' && ch <= '7'; });
    } else {
        digits([](unsigned char ch) { return std::isdigit(ch) != 0; });
        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
            is_float = true;
            ++pos_;
            digits([](unsigned char ch) { return std::isdigit(ch) != 0; });
        } else if (peek() == '.' && !(peek(1) == '.' || peek(1) == '=')) {
            // "1." is a float, "1 . x" and "1.=" are not
            if (!is_identifier_start(peek(1)) && peek(1) != '$' && peek(1) != '\'' && peek(1) != '"') {
                is_float = true;
                ++pos_;
            }
        }
        if ((peek() == 'e' || peek() == 'E') &&
            (std::isdigit(static_cast<unsigned char>(peek(1))) ||
             ((peek(1) == '+' || peek(1) == '-') && std::isdigit(static_cast<unsigned char>(peek(2)))))) {
            is_float = true;
            pos_ += 2;
            digits([](unsigned char ch) { return std::isdigit(ch) != 0; });
        }
    }

    emit(is_float ? TokenType::Float : TokenType::Integer,
         std::string(src_.substr(start, pos_ - start)), line);
}

void Lexer::lex_quoted(char quote) {
    const size_t start_line = line_;
    advance();  // opening quote
    const size_t start = pos_;

    while (!at_end()) {
        const char c = peek();
        if (c == '\\') {
            advance();
            if (!at_end()) advance();
            continue;
        }
        if (c == quote) {
            std::string body(src_.substr(start, pos_ - start));
            advance();
            emit(quote == '`' ? TokenType::ShellCommand : TokenType::String, std::move(body), start_line);
            if (quote != '\'') {
                tokens_.back().interpolations = find_interpolations(tokens_.back().text, start_line);
            }
            return;
        }
        advance();
    }

    throw ParseError(quote == '`' ? "unterminated shell command" : "unterminated string", start_line);
}

void Lexer::lex_heredoc() {
    const size_t start_line = line_;
    pos_ += 3;
    while (peek() == ' ' || peek() == '\t') {
        ++pos_;
    }

    char quote = '\0';
    if (peek() == '\'' || peek() == '"') {
        quote = advance();
    }

    const size_t label_start = pos_;
    while (!at_end() && is_identifier_char(peek())) {
        ++pos_;
    }
    const std::string label(src_.substr(label_start, pos_ - label_start));
    if (label.empty()) {
        throw ParseError("invalid heredoc label", start_line);
    }

    if (quote != '\0') {
        if (peek() != quote) {
            throw ParseError("unterminated heredoc label", start_line);
        }
        ++pos_;
    }
    if (peek() == '\r') ++pos_;
    if (peek() != '\n') {
        throw ParseError("heredoc label must end the line", start_line);
    }
    advance();

    const size_t body_start = pos_;
    while (!at_end()) {
        const size_t line_start = pos_;
        size_t p = pos_;
        while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) {
            ++p;
        }
        if (src_.substr(p, label.size()) == label &&
            (p + label.size() >= src_.size() || !is_identifier_char(src_[p + label.size()]))) {
            std::string body(src_.substr(body_start, line_start - body_start));
            pos_ = p + label.size();
            emit(TokenType::String, std::move(body), start_line);
            if (quote != '\'') {
                // Nowdoc bodies are literal
                tokens_.back().interpolations = find_interpolations(tokens_.back().text, start_line + 1);
            }
            return;
        }

        while (!at_end() && peek() != '\n') {
            ++pos_;
        }
        if (!at_end()) advance();
    }

    throw ParseError("unterminated heredoc '" + label + "'", start_line);
}

bool Lexer::try_lex_cast() {
    size_t p = pos_ + 1;
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) ++p;

    const size_t word_start = p;
    while (p < src_.size() && std::isalpha(static_cast<unsigned char>(src_[p]))) ++p;
    const std::string_view word = src_.substr(word_start, p - word_start);

    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) ++p;
    if (p >= src_.size() || src_[p] != ')' || word.empty()) {
        return false;
    }

    auto it = std::find_if(kCastTypes.begin(), kCastTypes.end(),
                           [word](std::string_view t) { return iequals(t, word); });
    if (it == kCastTypes.end()) {
        return false;
    }

    emit(TokenType::Cast, std::string(*it), line_);
    pos_ = p + 1;
    return true;
}

void Lexer::lex_punct() {
    const size_t line = line_;

    for (std::string_view p : kPunctuators) {
        if (starts_with(p)) {
            emit(TokenType::Punct, std::string(p), line);
            pos_ += p.size();
            return;
        }
    }

    const char c = peek();
    if (kSinglePunct.find(c) != std::string_view::npos) {
        emit(TokenType::Punct, std::string(1, c), line);
        ++pos_;
        return;
    }

    throw ParseError(std::string("unexpected character '") + c + "'", line);
}

} // namespace loopguard::php
