// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Table Benchmarks                                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "internal/core/database.hpp"

#include <filesystem>
#include <memory>

using namespace primdb;
using namespace primdb::core;
using primdb::sql::Condition;
using primdb::sql::Literal;

namespace {

std::vector<Literal> make_row(int64_t i) {
    return {
        Literal{Literal::Kind::STRING, "user" + std::to_string(i)},
        Literal{Literal::Kind::INTEGER, std::to_string(i % 100)},
        Literal{Literal::Kind::WORD, i % 2 == 0 ? "true" : "false"},
    };
}

Table make_table(int64_t rows) {
    auto table = Table::create("users", {{"name", "str"}, {"age", "int"}, {"active", "bool"}});
    Table result = std::move(*table);
    for (int64_t i = 0; i < rows; ++i) {
        (void)result.insert(make_row(i));
    }
    return result;
}

} // namespace

// ==============================================================================
// In-memory table
// ==============================================================================

static void BM_TableInsert(benchmark::State& state) {
    for (auto _ : state) {
        Table table = make_table(state.range(0));
        benchmark::DoNotOptimize(table);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_TableInsert)->Range(8, 1024);

static void BM_TableSelectFiltered(benchmark::State& state) {
    Table table = make_table(state.range(0));
    const Condition filter{"age", Literal{Literal::Kind::INTEGER, "42"}};

    for (auto _ : state) {
        auto rows = table.select(filter);
        benchmark::DoNotOptimize(rows);
    }
}
BENCHMARK(BM_TableSelectFiltered)->Range(8, 4096);

// ==============================================================================
// Database with JSON files
// ==============================================================================

class DatabaseBenchmark : public benchmark::Fixture {
public:
    void SetUp(benchmark::State& state) override {
        test_dir_ = std::filesystem::temp_directory_path() / "primdb_bench";
        std::filesystem::remove_all(test_dir_);

        db_ = std::make_unique<Database>(test_dir_);
        (void)db_->create_table("users", {{"name", "str"}, {"age", "int"}, {"active", "bool"}});
        for (int64_t i = 0; i < state.range(0); ++i) {
            (void)db_->insert("users", make_row(i));
        }
    }

    void TearDown(benchmark::State&) override {
        db_.reset();
        std::filesystem::remove_all(test_dir_);
    }

protected:
    std::filesystem::path test_dir_;
    std::unique_ptr<Database> db_;
};

BENCHMARK_DEFINE_F(DatabaseBenchmark, Insert)(benchmark::State& state) {
    int64_t i = state.range(0);
    for (auto _ : state) {
        auto id = db_->insert("users", make_row(i++));
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK_REGISTER_F(DatabaseBenchmark, Insert)->Arg(10)->Arg(1000);

BENCHMARK_DEFINE_F(DatabaseBenchmark, Select)(benchmark::State& state) {
    const Condition filter{"age", Literal{Literal::Kind::INTEGER, "7"}};

    for (auto _ : state) {
        auto rows = db_->select("users", filter);
        benchmark::DoNotOptimize(rows);
    }
}
BENCHMARK_REGISTER_F(DatabaseBenchmark, Select)->Arg(10)->Arg(1000);

BENCHMARK_MAIN();
