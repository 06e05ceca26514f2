#ifndef MORK_PARSER_LITERAL_H
#define MORK_PARSER_LITERAL_H

#include <string>
#include "mork/slice.h"

namespace Mork {

/*
 * Decode the body of a literal value:
 *     "\" + newline  -> removed (line continuation, LF, CRLF, or CR)
 *     "\" + c        -> c
 *     "$" + 2 hex    -> the byte with that value
 * Anything else, including a "$" that is not followed by 2 hex digits, is copied as-is.
 */
[[nodiscard]] auto decode_literal(const Slice &raw) -> std::string;

} // namespace Mork

#endif // MORK_PARSER_LITERAL_H
