#pragma once

#include <cstddef>
#include <string>

namespace primdb::sql {

enum class TokenType {
    // Command words
    CREATE_TABLE,
    LIST_TABLES,
    DROP_TABLE,
    INFO,
    INSERT,
    SELECT,
    UPDATE,
    DELETE,
    HELP,
    EXIT,

    // Clause keywords
    INTO,
    VALUES,
    FROM,
    WHERE,
    SET,

    // Delimiters
    EQUAL,           // =
    COLON,           // :
    LEFT_PAREN,      // (
    RIGHT_PAREN,     // )
    COMMA,           // ,
    SEMICOLON,       // ;

    // Literals
    IDENTIFIER,      // table names, column names, type tags, true/false
    INTEGER_LITERAL, // optional leading '-'
    STRING_LITERAL,

    // Special
    END_OF_FILE
};

struct Token {
    TokenType type;
    std::string lexeme;  // Исходный текст токена
    std::string text;    // Значение строкового литерала без кавычек
    std::size_t column;

    Token(TokenType t, std::string lex, std::size_t c)
        : type(t), lexeme(std::move(lex)), column(c) {}

    bool is_keyword() const {
        return type >= TokenType::CREATE_TABLE && type <= TokenType::SET;
    }

    /// Keywords double as names wherever the grammar expects a name
    bool is_word() const {
        return type == TokenType::IDENTIFIER || is_keyword();
    }

    std::string to_string() const;
};

const char* token_type_to_string(TokenType type) noexcept;

} // namespace primdb::sql
