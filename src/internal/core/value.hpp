// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Column Types and Values                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "primdb/result.h"
#include "primdb/sql/command.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace primdb::core {

// ==============================================================================
// Fundamental Types
// ==============================================================================

/// Closed set of column types
enum class ColumnType : std::uint8_t {
    Int,
    Str,
    Bool,
};

/// Typed cell value; index order matches ColumnType
using Value = std::variant<std::int64_t, std::string, bool>;

/// Row identifier stored in the implicit ID column
using RowId = std::int64_t;

/// Name of the implicit, auto-assigned key column
inline constexpr std::string_view ID_COLUMN = "ID";

[[nodiscard]] constexpr const char* column_type_to_string(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::Int: return "int";
        case ColumnType::Str: return "str";
        case ColumnType::Bool: return "bool";
    }
    return "unknown";
}

/// Parse a type tag (`int`, `str`, `bool`); exact match only
[[nodiscard]] std::optional<ColumnType> column_type_from_string(std::string_view tag) noexcept;

[[nodiscard]] ColumnType type_of(const Value& value) noexcept;

/// Convert a literal from command text into a value of the given type.
/// Fails with ErrorCode::TypeError; there is no implicit cross-type coercion.
[[nodiscard]] Result<Value> coerce(ColumnType type, const sql::Literal& literal);

/// Display form: integers in base 10, strings verbatim, booleans as true/false
[[nodiscard]] std::string value_to_string(const Value& value);

/// [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] bool is_valid_identifier(std::string_view name) noexcept;

} // namespace primdb::core
