#pragma once

#include "primdb/result.h"
#include "primdb/sql/command.h"
#include "primdb/sql/lexer.h"

#include <memory>
#include <string>
#include <string_view>

namespace primdb::sql {

class Parser {
public:
    explicit Parser(std::vector<Token> tokens, std::string_view source = {});

    // Разбор одной команды; бросает ParseError
    std::unique_ptr<Command> parse();

private:
    std::unique_ptr<CreateTableCommand> parse_create_table();
    std::unique_ptr<DropTableCommand> parse_drop_table();
    std::unique_ptr<InfoCommand> parse_info();
    std::unique_ptr<InsertCommand> parse_insert();
    std::unique_ptr<SelectCommand> parse_select();
    std::unique_ptr<UpdateCommand> parse_update();
    std::unique_ptr<DeleteCommand> parse_delete();

    Condition parse_condition(const std::string& clause);
    Literal parse_literal();
    std::string consume_name(const std::string& what);

    // Утилиты
    const Token& current() const;
    Token advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    Token consume(TokenType type, const std::string& message);
    void expect_end();
    bool is_at_end() const;

    ParseError error(const std::string& message) const;

    std::vector<Token> tokens_;
    std::string source_;
    std::size_t current_{0};
};

/// Lex and parse one input line. Syntax errors come back as ErrorCode::ParseError.
[[nodiscard]] Result<std::unique_ptr<Command>> parse_command(std::string_view line);

} // namespace primdb::sql
