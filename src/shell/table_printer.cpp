#include "shell/table_printer.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace primdb::shell {

namespace {

void append_border(std::string& out, const std::vector<std::size_t>& widths) {
    out += '+';
    for (auto width : widths) {
        out += std::string(width + 2, '-');
        out += '+';
    }
    out += '\n';
}

void append_row(std::string& out, const std::vector<std::string>& cells,
                const std::vector<std::size_t>& widths) {
    out += '|';
    for (std::size_t c = 0; c < widths.size(); ++c) {
        const std::string& cell = c < cells.size() ? cells[c] : std::string();
        out += fmt::format(" {:<{}} |", cell, widths[c]);
    }
    out += '\n';
}

} // anonymous namespace

std::string render_table(const std::vector<std::string>& header,
                         const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::size_t> widths(header.size(), 0);
    for (std::size_t c = 0; c < header.size(); ++c) {
        widths[c] = header[c].size();
    }
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < std::min(row.size(), widths.size()); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    std::string out;
    append_border(out, widths);
    append_row(out, header, widths);
    append_border(out, widths);
    for (const auto& row : rows) {
        append_row(out, row, widths);
    }
    append_border(out, widths);
    return out;
}

std::string render_rows(const std::vector<core::Column>& columns,
                        const std::vector<core::Row>& rows) {
    std::vector<std::string> header;
    header.reserve(columns.size());
    for (const auto& column : columns) {
        header.push_back(column.name);
    }

    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<std::string> line;
        line.reserve(row.size());
        for (const auto& value : row) {
            line.push_back(core::value_to_string(value));
        }
        cells.push_back(std::move(line));
    }

    return render_table(header, cells);
}

std::string format_columns(const std::vector<core::Column>& columns) {
    std::string result;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) result += ", ";
        result += columns[i].name;
        result += ':';
        result += core::column_type_to_string(columns[i].type);
    }
    return result;
}

} // namespace primdb::shell
