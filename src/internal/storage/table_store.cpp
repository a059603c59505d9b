// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - JSON Table Store Implementation                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/storage/table_store.hpp"
#include "internal/utils/logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>

namespace primdb::storage {

namespace fs = std::filesystem;

using core::Column;
using core::ColumnType;
using core::Row;
using core::Table;
using core::Value;

namespace {

Status check_name(std::string_view name) {
    if (!core::is_valid_identifier(name)) {
        return Err(ErrorCode::InvalidName,
            fmt::format("'{}' is not a valid table name", name));
    }
    return Ok();
}

nlohmann::ordered_json value_to_json(const Value& value) {
    switch (core::type_of(value)) {
        case ColumnType::Int: return std::get<std::int64_t>(value);
        case ColumnType::Str: return std::get<std::string>(value);
        case ColumnType::Bool: return std::get<bool>(value);
    }
    return nullptr;
}

Result<Value> value_from_json(const nlohmann::ordered_json& json, ColumnType type) {
    switch (type) {
        case ColumnType::Int:
            if (json.is_number_unsigned() &&
                json.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                break;
            }
            if (json.is_number_integer()) return Value(json.get<std::int64_t>());
            break;
        case ColumnType::Str:
            if (json.is_string()) return Value(json.get<std::string>());
            break;
        case ColumnType::Bool:
            if (json.is_boolean()) return Value(json.get<bool>());
            break;
    }
    return Err<Value>(ErrorCode::Corrupted,
        fmt::format("{} is not a valid {} value", json.dump(), core::column_type_to_string(type)));
}

} // anonymous namespace

// ==============================================================================
// Serialization
// ==============================================================================

nlohmann::ordered_json table_to_json(const Table& table) {
    nlohmann::ordered_json doc;
    doc["name"] = table.name();

    nlohmann::ordered_json schema = nlohmann::ordered_json::object();
    for (const auto& column : table.columns()) {
        schema[column.name] = core::column_type_to_string(column.type);
    }
    doc["schema"] = std::move(schema);

    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    for (const auto& row : table.rows()) {
        nlohmann::ordered_json record = nlohmann::ordered_json::object();
        for (std::size_t i = 0; i < table.columns().size(); ++i) {
            record[table.columns()[i].name] = value_to_json(row[i]);
        }
        rows.push_back(std::move(record));
    }
    doc["rows"] = std::move(rows);

    return doc;
}

Result<Table> table_from_json(const nlohmann::ordered_json& doc, std::string_view name) {
    auto corrupted = [&](const std::string& what) {
        return Err<Table>(ErrorCode::Corrupted, fmt::format("Table '{}': {}", name, what));
    };

    if (!doc.is_object()) {
        return corrupted("document is not a JSON object");
    }

    if (auto it = doc.find("name"); it != doc.end()) {
        if (!it->is_string() || it->get<std::string>() != name) {
            return corrupted(fmt::format("stored name {} does not match file name", it->dump()));
        }
    }

    auto schema = doc.find("schema");
    if (schema == doc.end() || !schema->is_object()) {
        return corrupted("missing 'schema' object");
    }

    std::vector<Column> columns;
    for (auto it = schema->begin(); it != schema->end(); ++it) {
        const std::string& column_name = it.key();
        const auto& tag = it.value();

        std::optional<ColumnType> type;
        if (tag.is_string()) {
            type = core::column_type_from_string(tag.get<std::string>());
        }
        if (!type) {
            return corrupted(fmt::format("column '{}' has unknown type {}", column_name, tag.dump()));
        }
        columns.push_back(Column{column_name, *type});
    }

    auto records = doc.find("rows");
    if (records == doc.end() || !records->is_array()) {
        return corrupted("missing 'rows' array");
    }

    std::vector<Row> rows;
    rows.reserve(records->size());

    for (const auto& record : *records) {
        if (!record.is_object() || record.size() != columns.size()) {
            return corrupted(fmt::format("row {} does not match the schema", rows.size()));
        }

        Row row;
        row.reserve(columns.size());
        for (const auto& column : columns) {
            auto cell = record.find(column.name);
            if (cell == record.end()) {
                return corrupted(fmt::format("row {} has no value for '{}'", rows.size(), column.name));
            }

            auto value = value_from_json(*cell, column.type);
            if (!value) {
                return corrupted(fmt::format("row {} column '{}': {}",
                    rows.size(), column.name, value.error().message()));
            }
            row.push_back(std::move(*value));
        }
        rows.push_back(std::move(row));
    }

    return Table::restore(std::string(name), std::move(columns), std::move(rows));
}

// ==============================================================================
// TableStore
// ==============================================================================

TableStore::TableStore(fs::path data_dir)
    : data_dir_(std::move(data_dir))
{
}

fs::path TableStore::table_path(std::string_view name) const {
    return data_dir_ / (std::string(name) + std::string(TABLE_FILE_EXTENSION));
}

bool TableStore::exists(std::string_view name) const {
    if (!core::is_valid_identifier(name)) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(table_path(name), ec);
}

Result<std::vector<std::string>> TableStore::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::exists(data_dir_, ec)) {
        return names;
    }

    fs::directory_iterator it(data_dir_, ec);
    if (ec) {
        return Err<std::vector<std::string>>(ErrorCode::StorageError,
            fmt::format("Failed to read directory '{}': {}", data_dir_.string(), ec.message()));
    }

    // A failed increment leaves the iterator at end with ec set
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;

        const fs::path& path = it->path();
        if (path.extension().string() != TABLE_FILE_EXTENSION) continue;

        std::string stem = path.stem().string();
        if (core::is_valid_identifier(stem)) {
            names.push_back(std::move(stem));
        }
    }

    if (ec) {
        return Err<std::vector<std::string>>(ErrorCode::StorageError,
            fmt::format("Failed to read directory '{}': {}", data_dir_.string(), ec.message()));
    }

    std::sort(names.begin(), names.end());
    return names;
}

Result<Table> TableStore::load(std::string_view name) const {
    if (auto status = check_name(name); !status) {
        return Err<Table>(status.error());
    }

    if (!exists(name)) {
        return Err<Table>(ErrorCode::TableNotFound,
            fmt::format("Table '{}' does not exist", name));
    }

    const fs::path path = table_path(name);
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<Table>(ErrorCode::StorageError,
            fmt::format("Failed to open file '{}'", path.string()));
    }

    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<Table>(ErrorCode::Corrupted,
            fmt::format("Failed to parse '{}': {}", path.string(), e.what()));
    }

    auto table = table_from_json(doc, name);
    if (table) {
        log::debug("Loaded table '{}' ({} rows) from {}", name, table->row_count(), path.string());
    }
    return table;
}

Status TableStore::save(const Table& table) {
    if (auto status = check_name(table.name()); !status) {
        return status;
    }

    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        return Err(ErrorCode::StorageError,
            fmt::format("Failed to create directory '{}': {}", data_dir_.string(), ec.message()));
    }

    std::string content;
    try {
        content = table_to_json(table).dump(2);
    } catch (const nlohmann::json::type_error& e) {
        return Err(ErrorCode::StorageError,
            fmt::format("Failed to serialize table '{}': {}", table.name(), e.what()));
    }

    const fs::path path = table_path(table.name());
    fs::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            return Err(ErrorCode::StorageError,
                fmt::format("Failed to create file '{}'", temp_path.string()));
        }

        file << content << '\n';
        file.flush();

        if (!file) {
            file.close();
            fs::remove(temp_path, ec);
            return Err(ErrorCode::StorageError,
                fmt::format("Failed to write file '{}'", temp_path.string()));
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return Err(ErrorCode::StorageError,
            fmt::format("Failed to replace '{}': {}", path.string(), ec.message()));
    }

    log::debug("Saved table '{}' ({} rows) to {}", table.name(), table.row_count(), path.string());
    return Ok();
}

Status TableStore::remove(std::string_view name) {
    if (auto status = check_name(name); !status) {
        return status;
    }

    if (!exists(name)) {
        return Err(ErrorCode::TableNotFound,
            fmt::format("Table '{}' does not exist", name));
    }

    const fs::path path = table_path(name);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Err(ErrorCode::StorageError,
            fmt::format("Failed to delete '{}': {}", path.string(), ec.message()));
    }

    log::debug("Deleted table file {}", path.string());
    return Ok();
}

} // namespace primdb::storage
