#ifndef MORK_FUZZ_FUZZER_H
#define MORK_FUZZ_FUZZER_H

#include <cstdio>
#include <cstdlib>
#include <mork/mork.h>

namespace Mork {

static const Options FUZZ_OPTIONS {};

static auto assert_true(bool condition, const char *message)
{
    if (!condition) {
        std::fprintf(stderr, "error: %s\n", message);
        std::abort();
    }
}

// Errors the reader is allowed to report for malformed input.
static auto is_input_error(const Status &s)
{
    return s.is_lexical_error() ||
           s.is_syntax_error() ||
           s.is_unresolved_reference() ||
           s.is_invalid_identifier() ||
           s.is_group_mismatch();
}

} // namespace Mork

#endif // MORK_FUZZ_FUZZER_H
