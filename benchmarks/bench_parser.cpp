// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  PrimDB - Command Parser Benchmarks                                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "primdb/sql/lexer.h"
#include "primdb/sql/parser.h"

using namespace primdb::sql;

static void BM_LexInsert(benchmark::State& state) {
    const std::string line = "insert into users values (\"John Smith\", 25, true)";

    for (auto _ : state) {
        Lexer lexer(line);
        auto tokens = lexer.tokenize();
        benchmark::DoNotOptimize(tokens);
    }
}
BENCHMARK(BM_LexInsert);

static void BM_ParseSelect(benchmark::State& state) {
    const std::string line = "select from users where name = \"John\"";

    for (auto _ : state) {
        auto command = parse_command(line);
        benchmark::DoNotOptimize(command);
    }
}
BENCHMARK(BM_ParseSelect);

static void BM_ParseCreateTable(benchmark::State& state) {
    std::string line = "create_table wide";
    for (int64_t i = 0; i < state.range(0); ++i) {
        line += " col" + std::to_string(i) + ":int";
    }

    for (auto _ : state) {
        auto command = parse_command(line);
        benchmark::DoNotOptimize(command);
    }
}
BENCHMARK(BM_ParseCreateTable)->Range(1, 64);

static void BM_ParseError(benchmark::State& state) {
    const std::string line = "update users set age 26 where name = \"John\"";

    for (auto _ : state) {
        auto command = parse_command(line);
        benchmark::DoNotOptimize(command);
    }
}
BENCHMARK(BM_ParseError);

BENCHMARK_MAIN();
