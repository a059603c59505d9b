#include "primdb/sql/lexer.h"

#include <cctype>

namespace primdb::sql {

// Ключевые слова, поиск без учёта регистра
const std::unordered_map<std::string, TokenType> Lexer::keywords_ = {
    {"CREATE_TABLE", TokenType::CREATE_TABLE},
    {"LIST_TABLES", TokenType::LIST_TABLES},
    {"DROP_TABLE", TokenType::DROP_TABLE},
    {"INFO", TokenType::INFO},
    {"INSERT", TokenType::INSERT},
    {"SELECT", TokenType::SELECT},
    {"UPDATE", TokenType::UPDATE},
    {"DELETE", TokenType::DELETE},
    {"HELP", TokenType::HELP},
    {"EXIT", TokenType::EXIT},
    {"INTO", TokenType::INTO},
    {"VALUES", TokenType::VALUES},
    {"FROM", TokenType::FROM},
    {"WHERE", TokenType::WHERE},
    {"SET", TokenType::SET}
};

Lexer::Lexer(std::string_view source) : source_(source) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (true) {
        Token token = next_token();
        bool done = token.type == TokenType::END_OF_FILE;
        tokens.push_back(std::move(token));
        if (done) break;
    }

    return tokens;
}

Token Lexer::next_token() {
    skip_whitespace();

    if (is_at_end()) {
        return Token(TokenType::END_OF_FILE, "", current_ + 1);
    }

    start_ = current_;
    char c = advance();
    std::size_t column = start_ + 1;

    if (is_alpha(c)) {
        return scan_word();
    }

    if (is_digit(c) || (c == '-' && is_digit(current()))) {
        return scan_number();
    }

    if (c == '"' || c == '\'') {
        return scan_string(c);
    }

    switch (c) {
        case '(': return Token(TokenType::LEFT_PAREN, "(", column);
        case ')': return Token(TokenType::RIGHT_PAREN, ")", column);
        case ',': return Token(TokenType::COMMA, ",", column);
        case ';': return Token(TokenType::SEMICOLON, ";", column);
        case '=': return Token(TokenType::EQUAL, "=", column);
        case ':': return Token(TokenType::COLON, ":", column);
        default: break;
    }

    fail("Unexpected character '" + std::string(1, c) + "'", column);
}

Token Lexer::scan_word() {
    while (is_alphanumeric(current())) {
        advance();
    }

    std::string text(source_.substr(start_, current_ - start_));

    std::string upper_text = text;
    for (char& c : upper_text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto it = keywords_.find(upper_text);
    if (it != keywords_.end()) {
        return Token(it->second, text, start_ + 1);
    }

    return Token(TokenType::IDENTIFIER, text, start_ + 1);
}

Token Lexer::scan_number() {
    while (is_digit(current())) {
        advance();
    }

    // 12abc - не число и не идентификатор
    if (is_alpha(current())) {
        fail("Malformed number", start_ + 1);
    }

    std::string text(source_.substr(start_, current_ - start_));
    Token token(TokenType::INTEGER_LITERAL, text, start_ + 1);
    token.text = text;
    return token;
}

Token Lexer::scan_string(char quote) {
    std::string value;

    while (!is_at_end() && current() != quote) {
        char c = advance();
        if (c == '\\' && !is_at_end()) {
            char escaped = advance();
            if (escaped != '"' && escaped != '\'' && escaped != '\\') {
                value.push_back(c);
            }
            value.push_back(escaped);
            continue;
        }
        value.push_back(c);
    }

    if (is_at_end()) {
        fail("Unterminated string literal", start_ + 1);
    }

    // закрывающая кавычка
    advance();

    Token token(TokenType::STRING_LITERAL,
                std::string(source_.substr(start_, current_ - start_)),
                start_ + 1);
    token.text = std::move(value);
    return token;
}

void Lexer::skip_whitespace() {
    while (!is_at_end() && std::isspace(static_cast<unsigned char>(current()))) {
        advance();
    }
}

char Lexer::current() const {
    if (is_at_end()) return '\0';
    return source_[current_];
}

char Lexer::advance() {
    return source_[current_++];
}

bool Lexer::is_at_end() const {
    return current_ >= source_.length();
}

bool Lexer::is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool Lexer::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool Lexer::is_alphanumeric(char c) {
    return is_alpha(c) || is_digit(c);
}

void Lexer::fail(const std::string& message, std::size_t column) const {
    throw ParseError(
        "Parse error at column " + std::to_string(column) + ": " + message,
        std::string(source_), column);
}

const char* token_type_to_string(TokenType type) noexcept {
    switch (type) {
        case TokenType::CREATE_TABLE: return "create_table";
        case TokenType::LIST_TABLES: return "list_tables";
        case TokenType::DROP_TABLE: return "drop_table";
        case TokenType::INFO: return "info";
        case TokenType::INSERT: return "insert";
        case TokenType::SELECT: return "select";
        case TokenType::UPDATE: return "update";
        case TokenType::DELETE: return "delete";
        case TokenType::HELP: return "help";
        case TokenType::EXIT: return "exit";
        case TokenType::INTO: return "into";
        case TokenType::VALUES: return "values";
        case TokenType::FROM: return "from";
        case TokenType::WHERE: return "where";
        case TokenType::SET: return "set";
        case TokenType::EQUAL: return "'='";
        case TokenType::COLON: return "':'";
        case TokenType::LEFT_PAREN: return "'('";
        case TokenType::RIGHT_PAREN: return "')'";
        case TokenType::COMMA: return "','";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::IDENTIFIER: return "identifier";
        case TokenType::INTEGER_LITERAL: return "integer";
        case TokenType::STRING_LITERAL: return "string";
        case TokenType::END_OF_FILE: return "end of input";
    }
    return "unknown";
}

std::string Token::to_string() const {
    return "Token(" + std::string(token_type_to_string(type)) +
           ", '" + lexeme + "')";
}

} // namespace primdb::sql
