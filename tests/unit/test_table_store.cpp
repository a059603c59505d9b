// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Table Store Unit Tests                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "internal/storage/table_store.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace primdb;
using namespace primdb::core;
using namespace primdb::storage;
using primdb::sql::Literal;

class TableStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
            (std::string("primdb_store_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    Table make_users() {
        auto table = Table::create("users", {{"name", "str"}, {"age", "int"}, {"active", "bool"}});
        EXPECT_TRUE(table.has_value());
        Table users = std::move(*table);

        auto first = users.insert({
            Literal{Literal::Kind::STRING, "John \"JJ\""},
            Literal{Literal::Kind::INTEGER, "25"},
            Literal{Literal::Kind::WORD, "true"}});
        EXPECT_TRUE(first.has_value());

        auto second = users.insert({
            Literal{Literal::Kind::STRING, "Jane"},
            Literal{Literal::Kind::INTEGER, "-3"},
            Literal{Literal::Kind::WORD, "false"}});
        EXPECT_TRUE(second.has_value());

        return users;
    }

    void write_file(const std::string& name, const std::string& content) {
        std::filesystem::create_directories(test_dir_);
        std::ofstream file(test_dir_ / name);
        file << content;
    }

    std::string read_file(const std::string& name) {
        std::ifstream file(test_dir_ / name);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path test_dir_;
};

// ==============================================================================
// Save / Load
// ==============================================================================

TEST_F(TableStoreTest, SaveCreatesDirectoryAndFile) {
    TableStore store(test_dir_);

    ASSERT_TRUE(store.save(make_users()).has_value());

    EXPECT_TRUE(std::filesystem::exists(test_dir_ / "users.json"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "users.json.tmp"));
    EXPECT_TRUE(store.exists("users"));
}

TEST_F(TableStoreTest, SaveThenLoad) {
    TableStore store(test_dir_);
    Table users = make_users();
    ASSERT_TRUE(store.save(users).has_value());

    auto loaded = store.load("users");

    ASSERT_TRUE(loaded.has_value()) << loaded.error().to_string();
    EXPECT_EQ(loaded->name(), "users");
    EXPECT_EQ(loaded->columns(), users.columns());
    EXPECT_EQ(loaded->rows(), users.rows());
}

TEST_F(TableStoreTest, FileLayout) {
    TableStore store(test_dir_);
    ASSERT_TRUE(store.save(make_users()).has_value());

    auto doc = nlohmann::ordered_json::parse(read_file("users.json"));

    EXPECT_EQ(doc["name"], "users");
    EXPECT_EQ(doc["schema"].dump(), R"({"ID":"int","name":"str","age":"int","active":"bool"})");
    ASSERT_EQ(doc["rows"].size(), 2);
    EXPECT_EQ(doc["rows"][0]["ID"], 1);
    EXPECT_EQ(doc["rows"][0]["name"], "John \"JJ\"");
    EXPECT_EQ(doc["rows"][1]["age"], -3);
    EXPECT_EQ(doc["rows"][1]["active"], false);
}

TEST_F(TableStoreTest, LoadMissingTable) {
    TableStore store(test_dir_);

    auto loaded = store.load("ghost");

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code(), ErrorCode::TableNotFound);
}

TEST_F(TableStoreTest, LoadRejectsInvalidName) {
    TableStore store(test_dir_);

    EXPECT_EQ(store.load("../users").error().code(), ErrorCode::InvalidName);
    EXPECT_FALSE(store.exists("../users"));
}

TEST_F(TableStoreTest, LoadUnparseableFile) {
    write_file("broken.json", "{ not json");
    TableStore store(test_dir_);

    auto loaded = store.load("broken");

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code(), ErrorCode::Corrupted);
}

TEST_F(TableStoreTest, LoadStructurallyInvalidFile) {
    write_file("bad.json", R"({"schema": {"ID": "int", "n": "float"}, "rows": []})");
    write_file("rows.json", R"({"schema": {"ID": "int"}, "rows": [{"ID": "one"}]})");
    write_file("missing.json", R"({"schema": {"ID": "int", "n": "int"}, "rows": [{"ID": 1}]})");
    TableStore store(test_dir_);

    EXPECT_EQ(store.load("bad").error().code(), ErrorCode::Corrupted);
    EXPECT_EQ(store.load("rows").error().code(), ErrorCode::Corrupted);
    EXPECT_EQ(store.load("missing").error().code(), ErrorCode::Corrupted);
}

TEST_F(TableStoreTest, LoadFileWithoutNameField) {
    write_file("plain.json", R"({"schema": {"ID": "int", "n": "str"}, "rows": [{"ID": 4, "n": "x"}]})");
    TableStore store(test_dir_);

    auto loaded = store.load("plain");

    ASSERT_TRUE(loaded.has_value()) << loaded.error().to_string();
    EXPECT_EQ(loaded->next_id(), 5);
}

// ==============================================================================
// List / Remove
// ==============================================================================

TEST_F(TableStoreTest, ListMissingDirectory) {
    TableStore store(test_dir_ / "nowhere");

    auto names = store.list();

    ASSERT_TRUE(names.has_value());
    EXPECT_TRUE(names->empty());
}

TEST_F(TableStoreTest, ListSortedJsonFilesOnly) {
    write_file("zeta.json", "{}");
    write_file("alpha.json", "{}");
    write_file("notes.txt", "x");
    TableStore store(test_dir_);

    auto names = store.list();

    ASSERT_TRUE(names.has_value());
    EXPECT_EQ(*names, (std::vector<std::string>{"alpha", "zeta"}));
}

TEST_F(TableStoreTest, Remove) {
    TableStore store(test_dir_);
    ASSERT_TRUE(store.save(make_users()).has_value());

    ASSERT_TRUE(store.remove("users").has_value());

    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "users.json"));
    EXPECT_EQ(store.remove("users").error().code(), ErrorCode::TableNotFound);
}

// ==============================================================================
// Filesystem Failures
// ==============================================================================

TEST_F(TableStoreTest, DataDirIsARegularFile) {
    write_file("not_a_dir", "x");
    TableStore store(test_dir_ / "not_a_dir");

    auto saved = store.save(make_users());
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code(), ErrorCode::StorageError);

    auto names = store.list();
    ASSERT_FALSE(names.has_value());
    EXPECT_EQ(names.error().code(), ErrorCode::StorageError);

    EXPECT_EQ(read_file("not_a_dir"), "x");
    EXPECT_FALSE(store.exists("users"));
}

TEST_F(TableStoreTest, FailedRenameRemovesTempFile) {
    // A non-empty directory cannot be replaced by a file
    std::filesystem::create_directories(test_dir_ / "users.json" / "inner");
    TableStore store(test_dir_);

    auto saved = store.save(make_users());

    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code(), ErrorCode::StorageError);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "users.json.tmp"));
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "users.json" / "inner"));
}
