// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Database                                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/table.hpp"
#include "internal/storage/table_store.hpp"
#include "primdb/result.h"
#include "primdb/sql/command.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace primdb::core {

struct TableInfo {
    std::string name;
    std::vector<Column> columns;
    std::size_t row_count = 0;
};

struct SelectResult {
    std::vector<Column> columns;
    std::vector<Row> rows;
};

/// Entry point for all table commands.
///
/// Every operation loads the table file, validates, applies the change in
/// memory and writes the file back before returning. No table state is kept
/// between calls.
class Database {
public:
    // ==========================================================================
    // Construction
    // ==========================================================================

    explicit Database(std::filesystem::path data_dir);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] storage::TableStore& store() noexcept { return store_; }

    // ==========================================================================
    // Table Operations
    // ==========================================================================

    [[nodiscard]] Result<TableInfo> create_table(const std::string& name,
                                                 const std::vector<sql::ColumnSpec>& columns);

    /// Deletes the table file unconditionally; confirmation is the caller's job
    [[nodiscard]] Status drop_table(std::string_view name);

    [[nodiscard]] Result<std::vector<std::string>> list_tables() const;

    [[nodiscard]] Result<TableInfo> info(std::string_view name) const;

    // ==========================================================================
    // Row Operations
    // ==========================================================================

    [[nodiscard]] Result<RowId> insert(std::string_view table,
                                       const std::vector<sql::Literal>& values);

    [[nodiscard]] Result<SelectResult> select(std::string_view table,
                                              const std::optional<sql::Condition>& filter) const;

    [[nodiscard]] Result<std::vector<RowId>> update(std::string_view table,
                                                    const sql::Condition& assignment,
                                                    const sql::Condition& filter);

    [[nodiscard]] Result<std::vector<RowId>> remove(std::string_view table,
                                                    const sql::Condition& filter);

private:
    storage::TableStore store_;
};

} // namespace primdb::core
