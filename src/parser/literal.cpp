#include "literal.h"
#include "scanner/token.h"

namespace Mork {

auto decode_literal(const Slice &raw) -> std::string
{
    std::string out;
    out.reserve(raw.size());

    for (Size i {}; i < raw.size(); ++i) {
        const auto c = raw[i];

        if (c == '\\' && i + 1 < raw.size()) {
            const auto next = raw[++i];
            if (next == '\r') {
                // Skip the LF in a CRLF continuation.
                if (i + 1 < raw.size() && raw[i + 1] == '\n')
                    ++i;
            } else if (next != '\n') {
                out.push_back(next);
            }
        } else if (c == '$' && i + 2 < raw.size() && is_hex_digit(raw[i + 1]) && is_hex_digit(raw[i + 2])) {
            out.push_back(static_cast<Byte>(hex_digit_value(raw[i + 1]) << 4 | hex_digit_value(raw[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace Mork
