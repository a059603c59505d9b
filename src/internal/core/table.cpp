// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - In-Memory Table                                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/core/table.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <unordered_set>

namespace primdb::core {

Table::Table(std::string name, std::vector<Column> columns, std::vector<Row> rows)
    : name_(std::move(name))
    , columns_(std::move(columns))
    , rows_(std::move(rows))
{
}

// ==============================================================================
// Construction
// ==============================================================================

Result<Table> Table::create(std::string name, const std::vector<sql::ColumnSpec>& specs) {
    if (!is_valid_identifier(name)) {
        return Err<Table>(ErrorCode::InvalidName,
            fmt::format("'{}' is not a valid table name", name));
    }

    std::vector<Column> columns;
    columns.reserve(specs.size() + 1);
    columns.push_back(Column{std::string(ID_COLUMN), ColumnType::Int});

    std::unordered_set<std::string> seen{std::string(ID_COLUMN)};

    for (const auto& spec : specs) {
        if (!is_valid_identifier(spec.name)) {
            return Err<Table>(ErrorCode::InvalidName,
                fmt::format("'{}' is not a valid column name", spec.name));
        }

        if (!seen.insert(spec.name).second) {
            if (spec.name == ID_COLUMN) {
                return Err<Table>(ErrorCode::DuplicateColumn,
                    fmt::format("Column '{}' is reserved", ID_COLUMN));
            }
            return Err<Table>(ErrorCode::DuplicateColumn,
                fmt::format("Column '{}' is declared more than once", spec.name));
        }

        auto type = column_type_from_string(spec.type);
        if (!type) {
            return Err<Table>(ErrorCode::InvalidType,
                fmt::format("Invalid type '{}' for column '{}'. Allowed types: int, str, bool",
                    spec.type, spec.name));
        }

        columns.push_back(Column{spec.name, *type});
    }

    return Table(std::move(name), std::move(columns), {});
}

Result<Table> Table::restore(std::string name, std::vector<Column> columns, std::vector<Row> rows) {
    if (columns.empty() || columns.front().name != ID_COLUMN ||
        columns.front().type != ColumnType::Int) {
        return Err<Table>(ErrorCode::Corrupted,
            fmt::format("Table '{}': first column must be {}:int", name, ID_COLUMN));
    }

    std::unordered_set<std::string> names;
    for (const auto& column : columns) {
        if (!is_valid_identifier(column.name) || !names.insert(column.name).second) {
            return Err<Table>(ErrorCode::Corrupted,
                fmt::format("Table '{}': bad or duplicate column '{}'", name, column.name));
        }
    }

    std::unordered_set<RowId> ids;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const Row& row = rows[i];

        if (row.size() != columns.size()) {
            return Err<Table>(ErrorCode::Corrupted,
                fmt::format("Table '{}': row {} has {} values, expected {}",
                    name, i, row.size(), columns.size()));
        }

        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (type_of(row[c]) != columns[c].type) {
                return Err<Table>(ErrorCode::Corrupted,
                    fmt::format("Table '{}': row {} column '{}' is not {}",
                        name, i, columns[c].name, column_type_to_string(columns[c].type)));
            }
        }

        if (row_id(row) < 1) {
            return Err<Table>(ErrorCode::Corrupted,
                fmt::format("Table '{}': row {} has non-positive ID {}", name, i, row_id(row)));
        }

        if (!ids.insert(row_id(row)).second) {
            return Err<Table>(ErrorCode::Corrupted,
                fmt::format("Table '{}': duplicate ID {}", name, row_id(row)));
        }
    }

    return Table(std::move(name), std::move(columns), std::move(rows));
}

// ==============================================================================
// Accessors
// ==============================================================================

std::optional<std::size_t> Table::find_column(std::string_view name) const noexcept {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return i;
    }
    return std::nullopt;
}

std::optional<RowId> Table::next_id() const noexcept {
    RowId max_id = 0;
    for (const auto& row : rows_) {
        max_id = std::max(max_id, row_id(row));
    }
    if (max_id == std::numeric_limits<RowId>::max()) {
        return std::nullopt;
    }
    return max_id + 1;
}

// ==============================================================================
// Operations
// ==============================================================================

Result<RowId> Table::insert(const std::vector<sql::Literal>& values) {
    const std::size_t expected = columns_.size() - 1;

    if (values.size() != expected) {
        return Err<RowId>(ErrorCode::ColumnCountMismatch,
            fmt::format("Expected {} values, got {}", expected, values.size()));
    }

    const auto next = next_id();
    if (!next) {
        return Err<RowId>(ErrorCode::InternalError,
            fmt::format("Table '{}' has no free IDs left", name_));
    }
    const RowId id = *next;

    Row row;
    row.reserve(columns_.size());
    row.emplace_back(id);

    for (std::size_t i = 0; i < values.size(); ++i) {
        const Column& column = columns_[i + 1];

        auto value = coerce(column.type, values[i]);
        if (!value) {
            return Err<RowId>(value.error().code(),
                fmt::format("{} for column '{}'", value.error().message(), column.name));
        }
        row.push_back(std::move(*value));
    }

    rows_.push_back(std::move(row));
    return id;
}

Result<std::vector<Row>> Table::select(const std::optional<sql::Condition>& filter) const {
    if (!filter) {
        return rows_;
    }

    auto predicate = make_predicate(*filter);
    if (!predicate) {
        return Err<std::vector<Row>>(predicate.error());
    }

    std::vector<Row> result;
    std::copy_if(rows_.begin(), rows_.end(), std::back_inserter(result),
        [&](const Row& row) { return predicate->matches(row); });
    return result;
}

Result<std::vector<RowId>> Table::update(const sql::Condition& assignment,
                                         const sql::Condition& filter) {
    auto target = find_column(assignment.column);
    if (!target) {
        return Err<std::vector<RowId>>(ErrorCode::ColumnNotFound,
            fmt::format("Column '{}' does not exist in table '{}'", assignment.column, name_));
    }

    if (*target == 0) {
        return Err<std::vector<RowId>>(ErrorCode::ImmutableColumn,
            fmt::format("Column '{}' cannot be updated", ID_COLUMN));
    }

    auto predicate = make_predicate(filter);
    if (!predicate) {
        return Err<std::vector<RowId>>(predicate.error());
    }

    const Column& column = columns_[*target];
    auto value = coerce(column.type, assignment.value);
    if (!value) {
        return Err<std::vector<RowId>>(value.error().code(),
            fmt::format("{} for column '{}'", value.error().message(), column.name));
    }

    std::vector<RowId> updated;
    for (auto& row : rows_) {
        if (predicate->matches(row)) {
            row[*target] = *value;
            updated.push_back(row_id(row));
        }
    }
    return updated;
}

Result<std::vector<RowId>> Table::erase(const sql::Condition& filter) {
    auto predicate = make_predicate(filter);
    if (!predicate) {
        return Err<std::vector<RowId>>(predicate.error());
    }

    std::vector<RowId> removed;
    std::vector<Row> kept;
    kept.reserve(rows_.size());

    for (auto& row : rows_) {
        if (predicate->matches(row)) {
            removed.push_back(row_id(row));
        } else {
            kept.push_back(std::move(row));
        }
    }

    rows_ = std::move(kept);
    return removed;
}

// ==============================================================================
// Filtering
// ==============================================================================

bool Table::Predicate::matches(const Row& row) const {
    return value && row[column] == *value;
}

Result<Table::Predicate> Table::make_predicate(const sql::Condition& filter) const {
    auto index = find_column(filter.column);
    if (!index) {
        return Err<Predicate>(ErrorCode::ColumnNotFound,
            fmt::format("Column '{}' does not exist in table '{}'", filter.column, name_));
    }

    Predicate predicate{*index, std::nullopt};

    auto value = coerce(columns_[*index].type, filter.value);
    if (value) {
        predicate.value = std::move(*value);
    }
    return predicate;
}

} // namespace primdb::core
