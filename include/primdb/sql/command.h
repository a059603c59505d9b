#pragma once

#include <optional>
#include <string>
#include <vector>

namespace primdb::sql {

// Литерал из текста команды; тип проверяется движком по схеме таблицы
struct Literal {
    enum class Kind {
        INTEGER,   // 42, -7
        STRING,    // "John" (text holds the unquoted value)
        WORD       // bare word: true, false, anything else unquoted
    };

    Kind kind{Kind::WORD};
    std::string text;

    std::string to_string() const;

    bool operator==(const Literal&) const = default;
};

/// `<column> = <literal>`, used both for filters and assignments
struct Condition {
    std::string column;
    Literal value;

    std::string to_string() const;
};

struct ColumnSpec {
    std::string name;
    std::string type;  // raw type tag, validated by the engine
};

// Базовый класс для всех команд
class Command {
public:
    enum class Type {
        CREATE_TABLE,
        LIST_TABLES,
        DROP_TABLE,
        INFO,
        INSERT,
        SELECT,
        UPDATE,
        DELETE,
        HELP,
        EXIT
    };

    virtual ~Command() = default;

    virtual Type get_type() const = 0;
    virtual std::string to_string() const = 0;
};

class CreateTableCommand : public Command {
public:
    Type get_type() const override { return Type::CREATE_TABLE; }

    std::string table_name_;
    std::vector<ColumnSpec> columns_;

    std::string to_string() const override;
};

class ListTablesCommand : public Command {
public:
    Type get_type() const override { return Type::LIST_TABLES; }
    std::string to_string() const override { return "list_tables"; }
};

class DropTableCommand : public Command {
public:
    Type get_type() const override { return Type::DROP_TABLE; }

    std::string table_name_;

    std::string to_string() const override { return "drop_table " + table_name_; }
};

class InfoCommand : public Command {
public:
    Type get_type() const override { return Type::INFO; }

    std::string table_name_;

    std::string to_string() const override { return "info " + table_name_; }
};

class InsertCommand : public Command {
public:
    Type get_type() const override { return Type::INSERT; }

    std::string table_name_;
    std::vector<Literal> values_;

    std::string to_string() const override;
};

class SelectCommand : public Command {
public:
    Type get_type() const override { return Type::SELECT; }

    std::string table_name_;
    std::optional<Condition> where_clause_;  // WHERE условие (опционально)

    std::string to_string() const override;
};

class UpdateCommand : public Command {
public:
    Type get_type() const override { return Type::UPDATE; }

    std::string table_name_;
    Condition assignment_;
    Condition where_clause_;

    std::string to_string() const override;
};

class DeleteCommand : public Command {
public:
    Type get_type() const override { return Type::DELETE; }

    std::string table_name_;
    Condition where_clause_;

    std::string to_string() const override;
};

class HelpCommand : public Command {
public:
    Type get_type() const override { return Type::HELP; }
    std::string to_string() const override { return "help"; }
};

class ExitCommand : public Command {
public:
    Type get_type() const override { return Type::EXIT; }
    std::string to_string() const override { return "exit"; }
};

} // namespace primdb::sql
