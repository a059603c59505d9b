#include "primdb/sql/command.h"

namespace primdb::sql {

std::string Literal::to_string() const {
    if (kind != Kind::STRING) {
        return text;
    }

    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') quoted.push_back('\\');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string Condition::to_string() const {
    return column + " = " + value.to_string();
}

std::string CreateTableCommand::to_string() const {
    std::string result = "create_table " + table_name_;
    for (const auto& col : columns_) {
        result += " " + col.name + ":" + col.type;
    }
    return result;
}

std::string InsertCommand::to_string() const {
    std::string result = "insert into " + table_name_ + " values (";
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (i > 0) result += ", ";
        result += values_[i].to_string();
    }
    result += ")";
    return result;
}

std::string SelectCommand::to_string() const {
    std::string result = "select from " + table_name_;
    if (where_clause_) {
        result += " where " + where_clause_->to_string();
    }
    return result;
}

std::string UpdateCommand::to_string() const {
    return "update " + table_name_ + " set " + assignment_.to_string() +
           " where " + where_clause_.to_string();
}

std::string DeleteCommand::to_string() const {
    return "delete from " + table_name_ + " where " + where_clause_.to_string();
}

} // namespace primdb::sql
