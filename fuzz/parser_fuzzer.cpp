/*
 * parser_fuzzer.cpp: Feeds arbitrary bytes to the reader. Reading must either succeed or fail with an input
 * error, and must be deterministic.
 */

#include "fuzzer.h"
#include <cstdint>
#include <vector>

namespace {

using namespace Mork;

auto same_tables(const TableMap &lhs, const TableMap &rhs) -> bool
{
    if (lhs.size() != rhs.size())
        return false;
    for (const auto &[id, table]: lhs) {
        const auto itr = rhs.find(id);
        if (itr == cend(rhs) || itr->second.meta != table.meta || itr->second.rows != table.rows)
            return false;
    }
    return true;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t *data, std::size_t size)
{
    const Slice input {reinterpret_cast<const Byte *>(data), size};

    TableMap first;
    const auto s = Reader::read("fuzz", input, FUZZ_OPTIONS, first);
    assert_true(s.is_ok() || is_input_error(s), "unexpected error category");

    TableMap second;
    const auto t = Reader::read("fuzz", input, FUZZ_OPTIONS, second);
    assert_true(s.is_ok() == t.is_ok(), "nondeterministic status");
    assert_true(s.what() == t.what(), "nondeterministic message");
    assert_true(same_tables(first, second), "nondeterministic tables");

    std::vector<TokenRecord> tokens;
    const auto u = Reader::tokenize("fuzz", input, tokens);
    assert_true(u.is_ok() || u.is_lexical_error(), "unexpected tokenizer error");

    // A document that reads cleanly must also scan cleanly.
    if (s.is_ok()) {
        assert_true(u.is_ok(), "scanner rejected a readable document");
        assert_true(!tokens.empty() && tokens.back().type == "END_OF_INPUT", "missing end of input");
    }
    return 0;
}
