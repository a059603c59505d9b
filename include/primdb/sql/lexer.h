#pragma once

#include "primdb/sql/token.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace primdb::sql {

/// Raised for any malformed command line; carries the offending input
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::string input, std::size_t column)
        : std::runtime_error(message), input_(std::move(input)), column_(column) {}

    const std::string& input() const noexcept { return input_; }
    std::size_t column() const noexcept { return column_; }

private:
    std::string input_;
    std::size_t column_;
};

class Lexer {
public:
    explicit Lexer(std::string_view source);

    // Токенизация всей строки, последний токен всегда END_OF_FILE
    std::vector<Token> tokenize();

    Token next_token();

private:
    void skip_whitespace();

    Token scan_word();
    Token scan_number();
    Token scan_string(char quote);

    char current() const;
    char advance();

    bool is_at_end() const;
    static bool is_alpha(char c);
    static bool is_digit(char c);
    static bool is_alphanumeric(char c);

    [[noreturn]] void fail(const std::string& message, std::size_t column) const;

    std::string_view source_;
    std::size_t start_{0};
    std::size_t current_{0};

    static const std::unordered_map<std::string, TokenType> keywords_;
};

} // namespace primdb::sql
