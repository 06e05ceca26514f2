#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <mork/mork.h>
#include <algorithm>
#include <cstdint>
#include <random>
#include "scanner/scanner.h"

namespace {

using namespace Mork;

constexpr Size BENCH_COLUMNS {16};
constexpr Size BENCH_ATOMS {256};
constexpr Size BENCH_GROUP_SIZE {100};
constexpr auto BENCH_VALUE = "The quick brown fox\\) jumps over $4Cazy dogs";

// Builds a document that looks like an address book: a column dictionary, an atom dictionary, and
// a single table with one row per record. If use_groups is set, every BENCH_GROUP_SIZE rows are
// wrapped in their own committed group.
auto build_document(Size num_rows, bool use_groups) -> std::string
{
    std::mt19937 rng {42};
    std::string out {"// <!-- <mdb:mork:z v=\"1.4\"/> -->\n< <(a=c)>"};

    for (Size i {}; i < BENCH_COLUMNS; ++i)
        out += fmt::format("({:X}=Column{})", 0x80 + i, i);
    out += ">\n<";
    for (Size i {}; i < BENCH_ATOMS; ++i)
        out += fmt::format("({:X}={}{})", 0x100 + i, BENCH_VALUE, i);
    out += ">\n";

    const auto write_rows = [&](Size begin, Size end) {
        out += "{1:^80 {(k=^81)(s=9)} ";
        for (auto i = begin; i < end; ++i) {
            out += fmt::format("\n  [{:X}", i + 1);
            for (Size j {}; j < BENCH_COLUMNS; ++j) {
                if (rng() % 2) {
                    out += fmt::format("(^{:X}^{:X})", 0x80 + j, 0x100 + rng() % BENCH_ATOMS);
                } else {
                    out += fmt::format("(^{:X}={})", 0x80 + j, BENCH_VALUE);
                }
            }
            out += ']';
        }
        out += "}\n";
    };

    if (use_groups) {
        for (Size i {}; i < num_rows; i += BENCH_GROUP_SIZE) {
            const auto id = i / BENCH_GROUP_SIZE + 1;
            out += fmt::format("@$${{{:X}{{@\n", id);
            write_rows(i, std::min(i + BENCH_GROUP_SIZE, num_rows));
            out += fmt::format("@$$}}{:X}}}@\n", id);
        }
    } else {
        write_rows(0, num_rows);
    }
    return out;
}

auto BM_Scan(benchmark::State &state)
{
    const auto document = build_document(static_cast<Size>(state.range(0)), false);
    for (auto _: state) {
        Scanner scanner {document};
        Size count {};
        while (scanner.next_token().type != TokenType::END_OF_INPUT)
            ++count;
        benchmark::DoNotOptimize(count);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * document.size()));
}
BENCHMARK(BM_Scan)->Arg(100)->Arg(10'000);

auto BM_Read(benchmark::State &state)
{
    const auto document = build_document(static_cast<Size>(state.range(0)), false);
    for (auto _: state) {
        TableMap tables;
        benchmark::DoNotOptimize(Reader::read("bench", document, Options {}, tables));
        benchmark::DoNotOptimize(tables);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * document.size()));
}
BENCHMARK(BM_Read)->Arg(100)->Arg(10'000);

auto BM_ReadRawLiterals(benchmark::State &state)
{
    const auto document = build_document(static_cast<Size>(state.range(0)), false);
    Options options;
    options.decode_literals = false;
    for (auto _: state) {
        TableMap tables;
        benchmark::DoNotOptimize(Reader::read("bench", document, options, tables));
        benchmark::DoNotOptimize(tables);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * document.size()));
}
BENCHMARK(BM_ReadRawLiterals)->Arg(10'000);

auto BM_ReadGroups(benchmark::State &state)
{
    const auto document = build_document(static_cast<Size>(state.range(0)), true);
    for (auto _: state) {
        TableMap tables;
        benchmark::DoNotOptimize(Reader::read("bench", document, Options {}, tables));
        benchmark::DoNotOptimize(tables);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * document.size()));
}
BENCHMARK(BM_ReadGroups)->Arg(10'000);

} // namespace

auto main(int argc, char *argv[]) -> int
{
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
