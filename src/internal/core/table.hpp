// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - In-Memory Table                                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/value.hpp"
#include "primdb/result.h"
#include "primdb/sql/command.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace primdb::core {

struct Column {
    std::string name;
    ColumnType type;

    bool operator==(const Column&) const = default;
};

/// One value per column, in column order; element 0 is always the ID
using Row = std::vector<Value>;

/// Schema-bound set of rows. All mutations validate first and then apply,
/// so a failed call leaves the table exactly as it was.
class Table {
public:
    // ==========================================================================
    // Construction
    // ==========================================================================

    /// New empty table with ID:int prepended to the declared columns
    [[nodiscard]] static Result<Table> create(std::string name,
                                              const std::vector<sql::ColumnSpec>& specs);

    /// Rebuild a table read back from storage, checking every invariant
    [[nodiscard]] static Result<Table> restore(std::string name,
                                               std::vector<Column> columns,
                                               std::vector<Row> rows);

    // ==========================================================================
    // Accessors
    // ==========================================================================

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::vector<Column>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

    [[nodiscard]] std::optional<std::size_t> find_column(std::string_view name) const noexcept;

    /// max(existing IDs) + 1, or 1 when the table is empty.
    /// Empty once the largest ID has reached the RowId maximum.
    [[nodiscard]] std::optional<RowId> next_id() const noexcept;

    // ==========================================================================
    // Operations
    // ==========================================================================

    /// Append a row built from literals for every non-ID column; returns its ID
    [[nodiscard]] Result<RowId> insert(const std::vector<sql::Literal>& values);

    /// Rows in storage order, optionally restricted by `column = literal`
    [[nodiscard]] Result<std::vector<Row>> select(const std::optional<sql::Condition>& filter) const;

    /// Set one column on every matching row; returns the IDs of updated rows
    [[nodiscard]] Result<std::vector<RowId>> update(const sql::Condition& assignment,
                                                    const sql::Condition& filter);

    /// Remove every matching row; returns the IDs of removed rows
    [[nodiscard]] Result<std::vector<RowId>> erase(const sql::Condition& filter);

private:
    Table(std::string name, std::vector<Column> columns, std::vector<Row> rows);

    // Equality predicate on one column. A literal that does not fit the
    // column type leaves `value` empty and matches nothing.
    struct Predicate {
        std::size_t column;
        std::optional<Value> value;

        [[nodiscard]] bool matches(const Row& row) const;
    };

    [[nodiscard]] Result<Predicate> make_predicate(const sql::Condition& filter) const;

    std::string name_;
    std::vector<Column> columns_;
    std::vector<Row> rows_;
};

[[nodiscard]] inline RowId row_id(const Row& row) {
    return std::get<RowId>(row.front());
}

} // namespace primdb::core
