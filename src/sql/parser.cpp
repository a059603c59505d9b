#include "primdb/sql/parser.h"

namespace primdb::sql {

Parser::Parser(std::vector<Token> tokens, std::string_view source)
    : tokens_(std::move(tokens)), source_(source) {
    if (tokens_.empty() || tokens_.back().type != TokenType::END_OF_FILE) {
        tokens_.emplace_back(TokenType::END_OF_FILE, "", source_.size() + 1);
    }
}

std::unique_ptr<Command> Parser::parse() {
    const Token& first = current();

    switch (first.type) {
        case TokenType::CREATE_TABLE:
            return parse_create_table();
        case TokenType::LIST_TABLES: {
            advance();
            expect_end();
            return std::make_unique<ListTablesCommand>();
        }
        case TokenType::DROP_TABLE:
            return parse_drop_table();
        case TokenType::INFO:
            return parse_info();
        case TokenType::INSERT:
            return parse_insert();
        case TokenType::SELECT:
            return parse_select();
        case TokenType::UPDATE:
            return parse_update();
        case TokenType::DELETE:
            return parse_delete();
        case TokenType::HELP: {
            advance();
            expect_end();
            return std::make_unique<HelpCommand>();
        }
        case TokenType::EXIT: {
            advance();
            expect_end();
            return std::make_unique<ExitCommand>();
        }
        case TokenType::END_OF_FILE:
            throw error("Expected command");
        default:
            throw error("Unknown command '" + first.lexeme + "'");
    }
}

std::unique_ptr<CreateTableCommand> Parser::parse_create_table() {
    auto cmd = std::make_unique<CreateTableCommand>();

    consume(TokenType::CREATE_TABLE, "Expected create_table");
    cmd->table_name_ = consume_name("table name");

    // Колонки вида name:type, список может быть пустым
    while (current().is_word()) {
        ColumnSpec spec;
        spec.name = advance().lexeme;
        consume(TokenType::COLON, "Expected ':' after column name '" + spec.name + "'");
        spec.type = consume_name("column type");
        cmd->columns_.push_back(std::move(spec));
    }

    expect_end();
    return cmd;
}

std::unique_ptr<DropTableCommand> Parser::parse_drop_table() {
    auto cmd = std::make_unique<DropTableCommand>();

    consume(TokenType::DROP_TABLE, "Expected drop_table");
    cmd->table_name_ = consume_name("table name");

    expect_end();
    return cmd;
}

std::unique_ptr<InfoCommand> Parser::parse_info() {
    auto cmd = std::make_unique<InfoCommand>();

    consume(TokenType::INFO, "Expected info");
    cmd->table_name_ = consume_name("table name");

    expect_end();
    return cmd;
}

std::unique_ptr<InsertCommand> Parser::parse_insert() {
    auto cmd = std::make_unique<InsertCommand>();

    consume(TokenType::INSERT, "Expected insert");
    consume(TokenType::INTO, "Expected 'into' after insert");
    cmd->table_name_ = consume_name("table name");

    consume(TokenType::VALUES, "Expected 'values' after table name");
    consume(TokenType::LEFT_PAREN, "Expected '(' after values");

    if (!check(TokenType::RIGHT_PAREN)) {
        do {
            cmd->values_.push_back(parse_literal());
        } while (match(TokenType::COMMA));
    }

    consume(TokenType::RIGHT_PAREN, "Expected ')' after values");

    expect_end();
    return cmd;
}

std::unique_ptr<SelectCommand> Parser::parse_select() {
    auto cmd = std::make_unique<SelectCommand>();

    consume(TokenType::SELECT, "Expected select");
    consume(TokenType::FROM, "Expected 'from' after select");
    cmd->table_name_ = consume_name("table name");

    if (match(TokenType::WHERE)) {
        cmd->where_clause_ = parse_condition("where");
    }

    expect_end();
    return cmd;
}

std::unique_ptr<UpdateCommand> Parser::parse_update() {
    auto cmd = std::make_unique<UpdateCommand>();

    consume(TokenType::UPDATE, "Expected update");
    cmd->table_name_ = consume_name("table name");

    // Ровно одно присваивание и ровно один фильтр
    consume(TokenType::SET, "Expected 'set' after table name");
    cmd->assignment_ = parse_condition("set");

    consume(TokenType::WHERE, "Expected 'where' clause");
    cmd->where_clause_ = parse_condition("where");

    expect_end();
    return cmd;
}

std::unique_ptr<DeleteCommand> Parser::parse_delete() {
    auto cmd = std::make_unique<DeleteCommand>();

    consume(TokenType::DELETE, "Expected delete");
    consume(TokenType::FROM, "Expected 'from' after delete");
    cmd->table_name_ = consume_name("table name");

    consume(TokenType::WHERE, "Expected 'where' clause");
    cmd->where_clause_ = parse_condition("where");

    expect_end();
    return cmd;
}

Condition Parser::parse_condition(const std::string& clause) {
    Condition condition;
    condition.column = consume_name("column name in " + clause + " clause");
    consume(TokenType::EQUAL, "Expected '=' after column name");
    condition.value = parse_literal();
    return condition;
}

Literal Parser::parse_literal() {
    if (check(TokenType::INTEGER_LITERAL)) {
        return Literal{Literal::Kind::INTEGER, advance().lexeme};
    }

    if (check(TokenType::STRING_LITERAL)) {
        return Literal{Literal::Kind::STRING, advance().text};
    }

    if (current().is_word()) {
        return Literal{Literal::Kind::WORD, advance().lexeme};
    }

    throw error("Expected value");
}

std::string Parser::consume_name(const std::string& what) {
    if (current().is_word()) {
        return advance().lexeme;
    }
    throw error("Expected " + what);
}

// Utility methods
const Token& Parser::current() const {
    return tokens_[current_];
}

Token Parser::advance() {
    if (!is_at_end()) current_++;
    return tokens_[current_ - 1];
}

bool Parser::check(TokenType type) const {
    return current().type == type;
}

bool Parser::match(TokenType type) {
    if (check(type) && !is_at_end()) {
        advance();
        return true;
    }
    return false;
}

Token Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) return advance();
    throw error(message);
}

void Parser::expect_end() {
    match(TokenType::SEMICOLON);
    if (!is_at_end()) {
        throw error("Unexpected " + std::string(token_type_to_string(current().type)) +
                    " '" + current().lexeme + "'");
    }
}

bool Parser::is_at_end() const {
    return current().type == TokenType::END_OF_FILE;
}

ParseError Parser::error(const std::string& message) const {
    const Token& token = current();
    return ParseError(
        "Parse error at column " + std::to_string(token.column) + ": " + message,
        source_, token.column);
}

Result<std::unique_ptr<Command>> parse_command(std::string_view line) {
    try {
        Lexer lexer(line);
        Parser parser(lexer.tokenize(), line);
        return parser.parse();
    } catch (const ParseError& e) {
        return Err<std::unique_ptr<Command>>(
            ErrorCode::ParseError,
            std::string(e.what()) + " (input: \"" + e.input() + "\")");
    }
}

} // namespace primdb::sql
