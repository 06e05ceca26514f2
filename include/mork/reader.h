#ifndef MORK_READER_H
#define MORK_READER_H

#include <string>
#include <vector>
#include "options.h"
#include "status.h"
#include "table.h"

namespace Mork {

struct TokenRecord {
    std::string type;
    std::string text;
    Size line {};
    Size column {};
};

class Reader final {
public:
    /*
     * Parse the contents of one file. Every table completed before an error
     * is stored in "out", so "out" may be non-empty even if a non-OK status
     * is returned. "filename" is only used in messages.
     */
    [[nodiscard]] static auto read(const Slice &filename, const Slice &input, const Options &options, TableMap &out) -> Status;

    /*
     * Read the file at "path" from disk and parse it.
     */
    [[nodiscard]] static auto read_file(const std::string &path, const Options &options, TableMap &out) -> Status;

    /*
     * Scan "input" without parsing it. Tokens up to the end of input, or up
     * to the first lexical error, are stored in "out".
     */
    [[nodiscard]] static auto tokenize(const Slice &filename, const Slice &input, std::vector<TokenRecord> &out) -> Status;

    /*
     * Read the whole file at "path" into "out".
     */
    [[nodiscard]] static auto read_contents(const std::string &path, std::string &out) -> Status;
};

} // namespace Mork

#endif // MORK_READER_H
