#pragma once

#include "primdb/config.hpp"
#include "primdb/result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace primdb::shell {

// ============================================================================
// Configuration Structure
// ============================================================================
struct AppConfig {
    // Storage
    std::string data_dir = PRIMDB_DEFAULT_DATA_DIR;
    std::string config_file;

    // Logging
    std::string log_level = "warn";
    std::string log_file;
    size_t max_log_size = 10 * 1024 * 1024;
    size_t max_log_files = 3;

    // Session
    bool confirm = true;
    std::vector<std::string> execute;

    // Problems found while loading, reported once logging is set up
    std::vector<std::string> warnings;

    /// Reads `key = value` lines; `#` and `;` start comment lines.
    /// Unknown keys are recorded in `warnings`, malformed values are an error.
    Status load_from_file(const std::string& path);

    /// Applies one setting by key. Returns false for unknown keys.
    Result<bool> apply(std::string_view key, std::string_view value);
};

/// "true"/"false"/"yes"/"no"/"1"/"0", case-insensitive
std::optional<bool> parse_bool(std::string_view text);

bool is_valid_log_level(std::string_view level);

} // namespace primdb::shell
