// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Database Implementation                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/core/database.hpp"
#include "internal/utils/logger.hpp"

#include <fmt/core.h>

namespace primdb::core {

Database::Database(std::filesystem::path data_dir)
    : store_(std::move(data_dir))
{
}

// ==============================================================================
// Table Operations
// ==============================================================================

Result<TableInfo> Database::create_table(const std::string& name,
                                         const std::vector<sql::ColumnSpec>& columns) {
    if (store_.exists(name)) {
        return Err<TableInfo>(ErrorCode::DuplicateTable,
            fmt::format("Table '{}' already exists", name));
    }

    auto table = Table::create(name, columns);
    if (!table) {
        return Err<TableInfo>(table.error());
    }

    if (auto status = store_.save(*table); !status) {
        return Err<TableInfo>(status.error());
    }

    log::info("Created table '{}' with {} columns", name, table->columns().size());
    return TableInfo{table->name(), table->columns(), 0};
}

Status Database::drop_table(std::string_view name) {
    if (!store_.exists(name)) {
        return Err(ErrorCode::TableNotFound,
            fmt::format("Table '{}' does not exist", name));
    }

    if (auto status = store_.remove(name); !status) {
        return status;
    }

    log::info("Dropped table '{}'", name);
    return Ok();
}

Result<std::vector<std::string>> Database::list_tables() const {
    return store_.list();
}

Result<TableInfo> Database::info(std::string_view name) const {
    auto table = store_.load(name);
    if (!table) {
        return Err<TableInfo>(table.error());
    }
    return TableInfo{table->name(), table->columns(), table->row_count()};
}

// ==============================================================================
// Row Operations
// ==============================================================================

Result<RowId> Database::insert(std::string_view table_name,
                               const std::vector<sql::Literal>& values) {
    auto table = store_.load(table_name);
    if (!table) {
        return Err<RowId>(table.error());
    }

    auto id = table->insert(values);
    if (!id) {
        return id;
    }

    if (auto status = store_.save(*table); !status) {
        return Err<RowId>(status.error());
    }

    log::debug("Inserted row {} into '{}'", *id, table_name);
    return id;
}

Result<SelectResult> Database::select(std::string_view table_name,
                                      const std::optional<sql::Condition>& filter) const {
    auto table = store_.load(table_name);
    if (!table) {
        return Err<SelectResult>(table.error());
    }

    auto rows = table->select(filter);
    if (!rows) {
        return Err<SelectResult>(rows.error());
    }

    return SelectResult{table->columns(), std::move(*rows)};
}

Result<std::vector<RowId>> Database::update(std::string_view table_name,
                                            const sql::Condition& assignment,
                                            const sql::Condition& filter) {
    auto table = store_.load(table_name);
    if (!table) {
        return Err<std::vector<RowId>>(table.error());
    }

    auto updated = table->update(assignment, filter);
    if (!updated) {
        return updated;
    }

    // Нечего сохранять
    if (updated->empty()) {
        return updated;
    }

    if (auto status = store_.save(*table); !status) {
        return Err<std::vector<RowId>>(status.error());
    }

    log::debug("Updated {} rows in '{}'", updated->size(), table_name);
    return updated;
}

Result<std::vector<RowId>> Database::remove(std::string_view table_name,
                                            const sql::Condition& filter) {
    auto table = store_.load(table_name);
    if (!table) {
        return Err<std::vector<RowId>>(table.error());
    }

    auto removed = table->erase(filter);
    if (!removed) {
        return removed;
    }

    if (removed->empty()) {
        return removed;
    }

    if (auto status = store_.save(*table); !status) {
        return Err<std::vector<RowId>>(status.error());
    }

    log::debug("Deleted {} rows from '{}'", removed->size(), table_name);
    return removed;
}

} // namespace primdb::core
