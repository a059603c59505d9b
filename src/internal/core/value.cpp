// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Column Types and Values                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/core/value.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace primdb::core {

namespace {

// Table files are JSON, which only carries well-formed UTF-8
bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);

        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) return false;

        for (std::size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates, beyond U+10FFFF
        static constexpr std::uint32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < min_code_point[length] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }

        i += length;
    }
    return true;
}

} // anonymous namespace

std::optional<ColumnType> column_type_from_string(std::string_view tag) noexcept {
    if (tag == "int") return ColumnType::Int;
    if (tag == "str") return ColumnType::Str;
    if (tag == "bool") return ColumnType::Bool;
    return std::nullopt;
}

ColumnType type_of(const Value& value) noexcept {
    return static_cast<ColumnType>(value.index());
}

Result<Value> coerce(ColumnType type, const sql::Literal& literal) {
    using Kind = sql::Literal::Kind;

    switch (type) {
        case ColumnType::Int: {
            if (literal.kind == Kind::INTEGER) {
                std::int64_t parsed = 0;
                const char* first = literal.text.data();
                const char* last = first + literal.text.size();
                auto [ptr, ec] = std::from_chars(first, last, parsed);
                if (ec == std::errc() && ptr == last) {
                    return Value(parsed);
                }
                if (ec == std::errc::result_out_of_range) {
                    return Err<Value>(ErrorCode::TypeError,
                        fmt::format("Integer {} is out of range", literal.text));
                }
            }
            break;
        }
        case ColumnType::Str: {
            if (literal.kind == Kind::STRING) {
                if (!is_valid_utf8(literal.text)) {
                    return Err<Value>(ErrorCode::TypeError,
                        "String value is not valid UTF-8");
                }
                return Value(literal.text);
            }
            break;
        }
        case ColumnType::Bool: {
            if (literal.kind == Kind::WORD) {
                if (literal.text == "true") return Value(true);
                if (literal.text == "false") return Value(false);
            }
            break;
        }
    }

    return Err<Value>(ErrorCode::TypeError,
        fmt::format("Invalid value {} (expected {})",
            literal.to_string(), column_type_to_string(type)));
}

std::string value_to_string(const Value& value) {
    switch (type_of(value)) {
        case ColumnType::Int: return std::to_string(std::get<std::int64_t>(value));
        case ColumnType::Str: return std::get<std::string>(value);
        case ColumnType::Bool: return std::get<bool>(value) ? "true" : "false";
    }
    return {};
}

bool is_valid_identifier(std::string_view name) noexcept {
    if (name.empty()) return false;

    auto is_alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };

    if (!is_alpha(name.front())) return false;
    for (char c : name) {
        if (!is_alpha(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

} // namespace primdb::core
