#include "mork/mork.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace {

using namespace Mork;

template<class Map>
auto sorted_keys(const Map &map) -> std::vector<std::string>
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto &[key, value]: map)
        keys.emplace_back(key);
    std::sort(begin(keys), end(keys));
    return keys;
}

auto print_tables(const TableMap &tables) -> void
{
    for (const auto &table_id: sorted_keys(tables)) {
        const auto &table = tables.at(table_id);
        fmt::print("----- {} -----\n", table_id);
        for (const auto &row_id: sorted_keys(table.rows)) {
            const auto &row = table.rows.at(row_id);
            fmt::print("  row {}:\n", row_id);
            for (const auto &name: sorted_keys(row))
                fmt::print("    {}: '{}'\n", name, row.at(name));
        }
    }
}

auto print_tokens(const std::string &path) -> Status
{
    std::string contents;
    if (auto s = Reader::read_contents(path, contents); !s.is_ok())
        return s;

    std::vector<TokenRecord> tokens;
    const auto s = Reader::tokenize(path, contents, tokens);
    for (const auto &token: tokens)
        fmt::print("{}:{} {} \"{}\"\n", token.line, token.column, token.type, token.text);
    return s;
}

} // namespace

auto main(int argc, const char *argv[]) -> int
{
    Options options;
    auto dump_tokens = false;
    std::vector<std::string> paths;

    for (int i {1}; i < argc; ++i) {
        if (std::strcmp(argv[i], "--tokens") == 0) {
            dump_tokens = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            options.log_level = LogLevel::INFO;
            options.log_target = LogTarget::STDERR_COLOR;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            fmt::print("usage: {} [--tokens] [--verbose] FILE...\n", argv[0]);
            return EXIT_SUCCESS;
        } else {
            paths.emplace_back(argv[i]);
        }
    }

    if (paths.empty()) {
        fmt::print(stderr, "usage: {} [--tokens] [--verbose] FILE...\n", argv[0]);
        return EXIT_FAILURE;
    }

    // A bad file is reported, but does not stop the rest from being processed.
    auto failed = false;
    for (const auto &path: paths) {
        auto s = Status::ok();
        if (dump_tokens) {
            s = print_tokens(path);
        } else {
            TableMap tables;
            s = Reader::read_file(path, options, tables);
            print_tables(tables);
        }
        if (!s.is_ok()) {
            fmt::print(stderr, "ERROR: {}\n", s.what().to_view());
            failed = true;
        }
    }
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
