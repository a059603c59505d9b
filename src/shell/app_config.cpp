#include "shell/app_config.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace primdb::shell {

namespace {

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

std::optional<bool> parse_bool(std::string_view text) {
    const std::string value = to_lower(trim(text));
    if (value == "true" || value == "yes" || value == "on" || value == "1") return true;
    if (value == "false" || value == "no" || value == "off" || value == "0") return false;
    return std::nullopt;
}

bool is_valid_log_level(std::string_view level) {
    static constexpr std::array<std::string_view, 6> levels{
        "trace", "debug", "info", "warn", "error", "off"};
    return std::find(levels.begin(), levels.end(), level) != levels.end();
}

Result<bool> AppConfig::apply(std::string_view key, std::string_view value) {
    if (key == "data_dir") {
        data_dir = std::string(value);
    } else if (key == "log_level") {
        const std::string level = to_lower(value);
        if (!is_valid_log_level(level)) {
            return Err<bool>(ErrorCode::ParseError,
                fmt::format("Invalid log level '{}'", value));
        }
        log_level = level;
    } else if (key == "log_file") {
        log_file = std::string(value);
    } else if (key == "confirm") {
        auto flag = parse_bool(value);
        if (!flag) {
            return Err<bool>(ErrorCode::ParseError,
                fmt::format("Invalid boolean '{}' for 'confirm'", value));
        }
        confirm = *flag;
    } else {
        return false;
    }
    return true;
}

Status AppConfig::load_from_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err(ErrorCode::StorageError,
            fmt::format("Config file '{}' does not exist", path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err(ErrorCode::StorageError,
            fmt::format("Failed to open config file '{}'", path));
    }

    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;

        std::string_view text = trim(line);
        if (text.empty() || text.front() == '#' || text.front() == ';') continue;

        const auto pos = text.find('=');
        if (pos == std::string_view::npos) {
            return Err(ErrorCode::ParseError,
                fmt::format("{}:{}: expected 'key = value'", path, line_no));
        }

        const std::string_view key = trim(text.substr(0, pos));
        const std::string_view value = trim(text.substr(pos + 1));

        auto applied = apply(key, value);
        if (!applied) {
            return Err(ErrorCode::ParseError,
                fmt::format("{}:{}: {}", path, line_no, applied.error().message()));
        }
        if (!*applied) {
            warnings.push_back(fmt::format("{}:{}: unknown key '{}' ignored", path, line_no, key));
        }
    }

    return Ok();
}

} // namespace primdb::shell
