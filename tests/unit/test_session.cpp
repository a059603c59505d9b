// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Session Unit Tests                                                 ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "shell/session.hpp"

#include <filesystem>
#include <sstream>

using namespace primdb;
using namespace primdb::shell;

namespace fs = std::filesystem;

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            (std::string("primdb_session_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir_);
        db_ = std::make_unique<core::Database>(test_dir_);
        session_ = std::make_unique<Session>(*db_, out_, [this](std::string_view prompt) {
            prompts_.emplace_back(prompt);
            return answer_;
        });
    }

    void TearDown() override {
        session_.reset();
        db_.reset();
        fs::remove_all(test_dir_);
    }

    // Runs one line and returns what it printed
    std::string run(std::string_view line) {
        out_.str("");
        session_->execute(line);
        return out_.str();
    }

    static bool contains(const std::string& text, std::string_view what) {
        return text.find(what) != std::string::npos;
    }

    fs::path test_dir_;
    std::ostringstream out_;
    std::unique_ptr<core::Database> db_;
    std::unique_ptr<Session> session_;
    std::vector<std::string> prompts_;
    bool answer_ = true;
};

TEST_F(SessionTest, CreateTable) {
    auto output = run("create_table users name:str age:int");

    EXPECT_EQ(output, "Table \"users\" created successfully with columns: ID:int, name:str, age:int\n");
    EXPECT_EQ(session_->error_count(), 0);
}

TEST_F(SessionTest, ListTables) {
    EXPECT_EQ(run("list_tables"), "No tables found.\n");

    run("create_table users name:str");
    run("create_table orders total:int");

    EXPECT_EQ(run("list_tables"), "- orders\n- users\n");
}

TEST_F(SessionTest, InsertAndSelect) {
    run("create_table users name:str age:int");

    EXPECT_EQ(run("insert into users values (\"John\", 25)"),
              "Record with ID=1 added to table \"users\" successfully.\n");

    auto output = run("select from users where age = 25");
    EXPECT_EQ(output,
        "+----+------+-----+\n"
        "| ID | name | age |\n"
        "+----+------+-----+\n"
        "| 1  | John | 25  |\n"
        "+----+------+-----+\n");
}

TEST_F(SessionTest, SelectEmpty) {
    run("create_table users name:str");

    EXPECT_EQ(run("select from users"), "No records to display.\n");
}

TEST_F(SessionTest, Info) {
    run("create_table users name:str active:bool");
    run("insert into users values (\"A\", true)");

    EXPECT_EQ(run("info users"),
        "Table: users\n"
        "Columns: ID:int, name:str, active:bool\n"
        "Record count: 1\n");
}

TEST_F(SessionTest, UpdateReportsEachRow) {
    run("create_table users name:str age:int");
    run("insert into users values (\"John\", 25)");
    run("insert into users values (\"Jane\", 25)");

    auto output = run("update users set age = 26 where age = 25");

    EXPECT_TRUE(contains(output, "Record with ID=1 in table \"users\" updated successfully."));
    EXPECT_TRUE(contains(output, "Record with ID=2 in table \"users\" updated successfully."));
    EXPECT_TRUE(contains(output, "Updated 2 record(s)."));

    EXPECT_EQ(run("update users set age = 1 where name = \"Nobody\""),
              "No records matching the condition found.\n");
}

TEST_F(SessionTest, DeleteAsksForConfirmation) {
    run("create_table users name:str");
    run("insert into users values (\"John\")");

    auto output = run("delete from users where ID = 1");

    ASSERT_EQ(prompts_.size(), 1);
    EXPECT_EQ(prompts_[0], "Are you sure you want to perform \"delete record\"? [y/n]: ");
    EXPECT_TRUE(contains(output, "Record with ID=1 deleted from table \"users\" successfully."));
    EXPECT_EQ(db_->info("users")->row_count, 0);
}

TEST_F(SessionTest, DeclinedDeleteKeepsRows) {
    run("create_table users name:str");
    run("insert into users values (\"John\")");
    answer_ = false;

    EXPECT_EQ(run("delete from users where ID = 1"), "Operation cancelled.\n");
    EXPECT_EQ(db_->info("users")->row_count, 1);
}

TEST_F(SessionTest, DeclinedDropKeepsTable) {
    run("create_table users name:str");
    answer_ = false;

    EXPECT_EQ(run("drop_table users"), "Operation cancelled.\n");
    EXPECT_TRUE(db_->store().exists("users"));

    answer_ = true;
    EXPECT_EQ(run("drop_table users"), "Table \"users\" deleted successfully.\n");
    EXPECT_FALSE(db_->store().exists("users"));
}

TEST_F(SessionTest, NoConfirmCallbackMeansYes) {
    Session session(*db_, out_);
    session.execute("create_table users name:str");
    out_.str("");

    session.execute("drop_table users");

    EXPECT_EQ(out_.str(), "Table \"users\" deleted successfully.\n");
}

TEST_F(SessionTest, ErrorsAreReportedAndCounted) {
    EXPECT_EQ(run("info ghost"), "Error: Table not found: Table 'ghost' does not exist\n");

    run("create_table users name:str age:int");
    EXPECT_EQ(run("insert into users values (\"John\")"),
              "Error: Column count mismatch: Expected 2 values, got 1\n");
    EXPECT_EQ(run("update users set ID = 5 where name = \"John\""),
              "Error: Immutable column: Column 'ID' cannot be updated\n");

    EXPECT_EQ(session_->error_count(), 3);
}

TEST_F(SessionTest, ParseErrorShowsUsage) {
    auto output = run("select users");

    EXPECT_TRUE(contains(output, "Error: Parse error: "));
    EXPECT_TRUE(contains(output, "Usage: select from <table> [where <col> = <val>]"));

    EXPECT_TRUE(contains(run("frobnicate"), "Type 'help' for available commands."));
}

TEST_F(SessionTest, BlankLineDoesNothing) {
    EXPECT_EQ(run("   "), "");
    EXPECT_EQ(session_->error_count(), 0);
}

TEST_F(SessionTest, Help) {
    auto output = run("help");

    EXPECT_TRUE(contains(output, "create_table <table_name> <col1:type>"));
    EXPECT_TRUE(contains(output, "exit - exit program"));
}

TEST_F(SessionTest, ExitStopsExecution) {
    EXPECT_FALSE(session_->execute("exit"));
    EXPECT_EQ(out_.str(), "Goodbye!\n");
}

TEST_F(SessionTest, RunReadsUntilExit) {
    std::istringstream input(
        "create_table users name:str\n"
        "insert into users values (\"John\")\n"
        "exit\n"
        "insert into users values (\"Never\")\n");

    session_->run(input);

    EXPECT_TRUE(contains(out_.str(), ">>> "));
    EXPECT_TRUE(contains(out_.str(), "Goodbye!"));
    EXPECT_EQ(db_->info("users")->row_count, 1);
}

TEST_F(SessionTest, RunStopsAtEndOfInput) {
    std::istringstream input("create_table t a:int\n");

    session_->run(input);

    EXPECT_TRUE(db_->store().exists("t"));
}
