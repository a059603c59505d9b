#include "shell/session.hpp"
#include "shell/table_printer.hpp"
#include "internal/utils/logger.hpp"
#include "primdb/sql/parser.h"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <exception>
#include <utility>

namespace primdb::shell {

namespace {

struct Usage {
    std::string_view command;
    std::string_view text;
};

constexpr std::array<Usage, 8> kUsage{{
    {"create_table", "create_table <table_name> <col1:type> .."},
    {"list_tables", "list_tables"},
    {"drop_table", "drop_table <table_name>"},
    {"info", "info <table_name>"},
    {"insert", "insert into <table> values (<val1>, <val2>, ..)"},
    {"select", "select from <table> [where <col> = <val>]"},
    {"update", "update <table> set <col> = <val> where <col> = <val>"},
    {"delete", "delete from <table> where <col> = <val>"},
}};

std::string_view trim(std::string_view text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

} // anonymous namespace

Session::Session(core::Database& db, std::ostream& out, ConfirmFn confirm)
    : db_(db)
    , out_(out)
    , confirm_(std::move(confirm))
{
}

std::string Session::help_text() {
    std::string text;
    text += "\n***Data Operations***\n";
    text += "Commands:\n";
    text += "  create_table <table_name> <col1:type> .. - create table\n";
    text += "  list_tables - show all tables\n";
    text += "  drop_table <table_name> - delete table\n";
    text += "  insert into <table> values (<val1>, ..) - insert record\n";
    text += "  select from <table> [where <col> = <val>] - read records\n";
    text += "  update <table> set <col> = <val> where <col> = <val> - update records\n";
    text += "  delete from <table> where <col> = <val> - delete records\n";
    text += "  info <table_name> - show table information\n";
    text += "\nTypes: int, str (\"quoted\"), bool (true/false)\n";
    text += "\nGeneral:\n";
    text += "  help - show help\n";
    text += "  exit - exit program\n";
    return text;
}

// ==============================================================================
// Loop
// ==============================================================================

void Session::run(std::istream& in) {
    std::string line;

    while (true) {
        out_ << PROMPT << std::flush;

        if (!std::getline(in, line)) {
            out_ << '\n';
            break;
        }

        if (!execute(line)) {
            break;
        }
    }
}

bool Session::execute(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return true;
    }

    try {
        auto parsed = sql::parse_command(line);
        if (!parsed) {
            report(parsed.error());
            print_usage(line);
            return true;
        }

        const sql::Command& command = **parsed;
        if (command.get_type() == sql::Command::Type::EXIT) {
            out_ << "Goodbye!\n";
            return false;
        }

        log::debug("Executing: {}", command.to_string());
        dispatch(command);
    } catch (const std::exception& e) {
        ++error_count_;
        log::error("Unexpected error while executing '{}': {}", line, e.what());
        out_ << "Unexpected error: " << e.what() << '\n';
    }

    return true;
}

void Session::dispatch(const sql::Command& command) {
    using Type = sql::Command::Type;

    switch (command.get_type()) {
        case Type::CREATE_TABLE:
            handle_create_table(static_cast<const sql::CreateTableCommand&>(command));
            break;
        case Type::LIST_TABLES:
            handle_list_tables();
            break;
        case Type::DROP_TABLE:
            handle_drop_table(static_cast<const sql::DropTableCommand&>(command));
            break;
        case Type::INFO:
            handle_info(static_cast<const sql::InfoCommand&>(command));
            break;
        case Type::INSERT:
            handle_insert(static_cast<const sql::InsertCommand&>(command));
            break;
        case Type::SELECT:
            handle_select(static_cast<const sql::SelectCommand&>(command));
            break;
        case Type::UPDATE:
            handle_update(static_cast<const sql::UpdateCommand&>(command));
            break;
        case Type::DELETE:
            handle_delete(static_cast<const sql::DeleteCommand&>(command));
            break;
        case Type::HELP:
            out_ << help_text() << '\n';
            break;
        case Type::EXIT:
            break;
    }
}

// ==============================================================================
// Command Handlers
// ==============================================================================

template<typename Fn>
auto Session::timed(std::string_view operation, Fn&& fn) {
    auto start = std::chrono::steady_clock::now();
    auto result = std::forward<Fn>(fn)();
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    log::info("{} executed in {:.3f} seconds", operation, elapsed.count());
    return result;
}

void Session::handle_create_table(const sql::CreateTableCommand& cmd) {
    auto created = timed("create_table", [&] {
        return db_.create_table(cmd.table_name_, cmd.columns_);
    });
    if (!created) {
        report(created.error());
        return;
    }

    out_ << fmt::format("Table \"{}\" created successfully with columns: {}\n",
        created->name, format_columns(created->columns));
}

void Session::handle_list_tables() {
    auto tables = timed("list_tables", [&] { return db_.list_tables(); });
    if (!tables) {
        report(tables.error());
        return;
    }

    if (tables->empty()) {
        out_ << "No tables found.\n";
        return;
    }

    for (const auto& name : *tables) {
        out_ << "- " << name << '\n';
    }
}

void Session::handle_drop_table(const sql::DropTableCommand& cmd) {
    if (!confirm("drop table")) {
        return;
    }

    auto status = timed("drop_table", [&] { return db_.drop_table(cmd.table_name_); });
    if (!status) {
        report(status.error());
        return;
    }

    out_ << fmt::format("Table \"{}\" deleted successfully.\n", cmd.table_name_);
}

void Session::handle_info(const sql::InfoCommand& cmd) {
    auto info = timed("info", [&] { return db_.info(cmd.table_name_); });
    if (!info) {
        report(info.error());
        return;
    }

    out_ << "Table: " << info->name << '\n';
    out_ << "Columns: " << format_columns(info->columns) << '\n';
    out_ << "Record count: " << info->row_count << '\n';
}

void Session::handle_insert(const sql::InsertCommand& cmd) {
    auto id = timed("insert", [&] { return db_.insert(cmd.table_name_, cmd.values_); });
    if (!id) {
        report(id.error());
        return;
    }

    out_ << fmt::format("Record with ID={} added to table \"{}\" successfully.\n",
        *id, cmd.table_name_);
}

void Session::handle_select(const sql::SelectCommand& cmd) {
    auto result = timed("select", [&] { return db_.select(cmd.table_name_, cmd.where_clause_); });
    if (!result) {
        report(result.error());
        return;
    }

    if (result->rows.empty()) {
        out_ << "No records to display.\n";
        return;
    }

    out_ << render_rows(result->columns, result->rows);
}

void Session::handle_update(const sql::UpdateCommand& cmd) {
    auto updated = timed("update", [&] {
        return db_.update(cmd.table_name_, cmd.assignment_, cmd.where_clause_);
    });
    if (!updated) {
        report(updated.error());
        return;
    }

    if (updated->empty()) {
        out_ << "No records matching the condition found.\n";
        return;
    }

    for (auto id : *updated) {
        out_ << fmt::format("Record with ID={} in table \"{}\" updated successfully.\n",
            id, cmd.table_name_);
    }
    out_ << fmt::format("Updated {} record(s).\n", updated->size());
}

void Session::handle_delete(const sql::DeleteCommand& cmd) {
    if (!confirm("delete record")) {
        return;
    }

    auto removed = timed("delete", [&] { return db_.remove(cmd.table_name_, cmd.where_clause_); });
    if (!removed) {
        report(removed.error());
        return;
    }

    if (removed->empty()) {
        out_ << "No records matching the condition found.\n";
        return;
    }

    for (auto id : *removed) {
        out_ << fmt::format("Record with ID={} deleted from table \"{}\" successfully.\n",
            id, cmd.table_name_);
    }
    out_ << fmt::format("Deleted {} record(s).\n", removed->size());
}

// ==============================================================================
// Helpers
// ==============================================================================

bool Session::confirm(std::string_view action) {
    if (!confirm_) {
        return true;
    }

    if (confirm_(fmt::format("Are you sure you want to perform \"{}\"? [y/n]: ", action))) {
        return true;
    }

    out_ << "Operation cancelled.\n";
    return false;
}

void Session::report(const Error& error) {
    ++error_count_;
    log::debug("Command failed: {}", error.to_string());
    out_ << "Error: " << error.to_string() << '\n';
}

void Session::print_usage(std::string_view line) {
    std::string word(line.substr(0, line.find_first_of(" \t")));
    std::transform(word.begin(), word.end(), word.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = std::find_if(kUsage.begin(), kUsage.end(),
        [&](const Usage& usage) { return usage.command == word; });

    if (it != kUsage.end()) {
        out_ << "Usage: " << it->text << '\n';
    } else {
        out_ << "Type 'help' for available commands.\n";
    }
}

} // namespace primdb::shell
