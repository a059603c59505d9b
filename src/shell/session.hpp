#pragma once

#include "internal/core/database.hpp"
#include "primdb/result.h"
#include "primdb/sql/command.h"

#include <cstddef>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace primdb::shell {

/// Interactive command loop: parse a line, run it against the database,
/// print the outcome. A failing command is reported and the loop goes on.
class Session {
public:
    /// Asks the user to confirm a destructive action; true means proceed.
    /// An empty function confirms everything.
    using ConfirmFn = std::function<bool(std::string_view prompt)>;

    static constexpr std::string_view PROMPT = ">>> ";

    Session(core::Database& db, std::ostream& out, ConfirmFn confirm = {});

    /// Execute one line. Returns false once `exit` has been executed.
    bool execute(std::string_view line);

    /// Read and execute lines until `exit` or end of input
    void run(std::istream& in);

    /// Commands that ended with an error so far
    [[nodiscard]] std::size_t error_count() const noexcept { return error_count_; }

    static std::string help_text();

private:
    void dispatch(const sql::Command& command);

    void handle_create_table(const sql::CreateTableCommand& cmd);
    void handle_list_tables();
    void handle_drop_table(const sql::DropTableCommand& cmd);
    void handle_info(const sql::InfoCommand& cmd);
    void handle_insert(const sql::InsertCommand& cmd);
    void handle_select(const sql::SelectCommand& cmd);
    void handle_update(const sql::UpdateCommand& cmd);
    void handle_delete(const sql::DeleteCommand& cmd);

    bool confirm(std::string_view action);
    void report(const Error& error);
    void print_usage(std::string_view line);

    template<typename Fn>
    auto timed(std::string_view operation, Fn&& fn);

    core::Database& db_;
    std::ostream& out_;
    ConfirmFn confirm_;
    std::size_t error_count_{0};
};

} // namespace primdb::shell
