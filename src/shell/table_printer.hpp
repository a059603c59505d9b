#pragma once

#include "internal/core/table.hpp"

#include <string>
#include <vector>

namespace primdb::shell {

// Рамочная таблица:
// +----+------+-----+
// | ID | name | age |
// +----+------+-----+
// | 1  | John | 25  |
// +----+------+-----+
std::string render_table(const std::vector<std::string>& header,
                         const std::vector<std::vector<std::string>>& rows);

std::string render_rows(const std::vector<core::Column>& columns,
                        const std::vector<core::Row>& rows);

/// "ID:int, name:str, age:int"
std::string format_columns(const std::vector<core::Column>& columns);

} // namespace primdb::shell
