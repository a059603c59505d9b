// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Embedded Usage Example                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "primdb/version.hpp"
#include "internal/core/database.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <utility>

using primdb::sql::Condition;
using primdb::sql::Literal;

namespace {

Literal text(std::string value) { return Literal{Literal::Kind::STRING, std::move(value)}; }
Literal number(int value) { return Literal{Literal::Kind::INTEGER, std::to_string(value)}; }

void print_rows(const primdb::core::SelectResult& result) {
    for (const auto& row : result.rows) {
        fmt::print("  ");
        for (std::size_t i = 0; i < row.size(); ++i) {
            fmt::print("{}={} ", result.columns[i].name, primdb::core::value_to_string(row[i]));
        }
        fmt::print("\n");
    }
}

} // namespace

int main() {
    fmt::print(fmt::emphasis::bold, "\n=== PrimDB Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", primdb::VERSION_STRING);
    fmt::print("Build:   {} ({})\n\n", primdb::BUILD_TYPE, primdb::COMPILER_ID);

    const std::filesystem::path data_dir = "./example_data";
    primdb::core::Database db(data_dir);

    // Start from a clean table
    if (db.store().exists("users")) {
        if (auto status = db.drop_table("users"); !status) {
            fmt::print(fg(fmt::color::red), "ERROR: {}\n", status.error().to_string());
            return 1;
        }
    }

    auto created = db.create_table("users", {{"name", "str"}, {"age", "int"}});
    if (!created) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", created.error().to_string());
        return 1;
    }

    fmt::print(fg(fmt::color::green), "Table '{}' created in {}\n\n",
        created->name, std::filesystem::absolute(data_dir).string());

    // Insert some rows
    fmt::print("Inserting rows...\n");

    const std::pair<const char*, int> people[] = {{"John", 25}, {"Jane", 31}, {"Jim", 25}};
    for (const auto& [name, age] : people) {
        auto id = db.insert("users", {text(name), number(age)});
        if (!id) {
            fmt::print(fg(fmt::color::red), "Failed to insert {}: {}\n", name, id.error().to_string());
            continue;
        }
        fmt::print("  {} -> ID {}\n", name, *id);
    }

    fmt::print("\nRows with age = 25:\n");
    auto selected = db.select("users", Condition{"age", number(25)});
    if (selected) {
        print_rows(*selected);
    }

    // Update and delete
    auto updated = db.update("users", {"age", number(26)}, {"name", text("John")});
    if (updated) {
        fmt::print("\nUpdated {} row(s)\n", updated->size());
    }

    auto removed = db.remove("users", {"name", text("Jim")});
    if (removed) {
        fmt::print("Deleted {} row(s)\n", removed->size());
    }

    // A failing command comes back as an error value
    auto bad = db.update("users", {"ID", number(9)}, {"name", text("Jane")});
    if (!bad) {
        fmt::print(fg(fmt::color::yellow), "Expected failure: {}\n", bad.error().to_string());
    }

    fmt::print("\nFinal contents:\n");
    if (auto all = db.select("users", std::nullopt); all) {
        print_rows(*all);
    }

    auto info = db.info("users");
    if (info) {
        fmt::print("\nRecord count: {}\n", info->row_count);
    }

    fmt::print(fg(fmt::color::green), "\nDone!\n\n");

    return 0;
}
