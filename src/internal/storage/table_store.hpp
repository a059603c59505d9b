// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - JSON Table Store                                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "internal/core/table.hpp"
#include "primdb/result.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace primdb::storage {

/// Extension of table files inside the data directory
inline constexpr std::string_view TABLE_FILE_EXTENSION = ".json";

/// One JSON document per table, `<data_dir>/<table>.json`.
///
/// Every call goes straight to disk: nothing is cached between calls.
/// Writes replace the whole file through a temporary file and a rename.
class TableStore {
public:
    explicit TableStore(std::filesystem::path data_dir);

    [[nodiscard]] const std::filesystem::path& data_directory() const noexcept { return data_dir_; }

    [[nodiscard]] std::filesystem::path table_path(std::string_view name) const;

    /// True if a file for this table exists
    [[nodiscard]] bool exists(std::string_view name) const;

    /// Sorted names of all tables in the data directory
    [[nodiscard]] Result<std::vector<std::string>> list() const;

    [[nodiscard]] Result<core::Table> load(std::string_view name) const;

    [[nodiscard]] Status save(const core::Table& table);

    [[nodiscard]] Status remove(std::string_view name);

private:
    std::filesystem::path data_dir_;
};

// ==============================================================================
// Serialization
// ==============================================================================

[[nodiscard]] nlohmann::ordered_json table_to_json(const core::Table& table);

/// Fails with ErrorCode::Corrupted when the document does not describe a valid table
[[nodiscard]] Result<core::Table> table_from_json(const nlohmann::ordered_json& doc,
                                                  std::string_view name);

} // namespace primdb::storage
