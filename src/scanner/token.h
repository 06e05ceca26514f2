#ifndef MORK_SCANNER_TOKEN_H
#define MORK_SCANNER_TOKEN_H

#include <string>
#include "mork/slice.h"

namespace Mork {

enum class TokenType {
    END_OF_INPUT,
    ERROR,
    LITERAL,
    NAME, // Either a hex ID or a name.
    CARET,
    PLUS,
    COLON,
    EQUAL,
    LEFT_ANGLE,
    RIGHT_ANGLE,
    LEFT_PAREN,
    RIGHT_PAREN,
    LEFT_SQUARE,
    RIGHT_SQUARE,
    LEFT_BRACE,
    RIGHT_BRACE,
    GROUP_START,
    GROUP_COMMIT,
    GROUP_ABORT,
};

struct Position {
    Size offset {};
    Size line {1};
    Size column {};
};

struct Token {
    TokenType type {TokenType::END_OF_INPUT};

    // Source text covered by the token. For ERROR tokens, the diagnostic message, which is owned by the scanner.
    Slice text;

    Position position;
};

[[nodiscard]] auto token_type_name(TokenType type) -> const char *;

// Format a token as 'line:column TYPE "text"' for messages and dumps.
[[nodiscard]] auto describe_token(const Token &token) -> std::string;

[[nodiscard]] constexpr auto is_hex_digit(Byte c) noexcept -> bool
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

[[nodiscard]] constexpr auto hex_digit_value(Byte c) noexcept -> int
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

[[nodiscard]] constexpr auto is_hex_id(const Slice &text) noexcept -> bool
{
    if (text.is_empty())
        return false;
    for (Size i {}; i < text.size(); ++i) {
        if (!is_hex_digit(text[i]))
            return false;
    }
    return true;
}

} // namespace Mork

#endif // MORK_SCANNER_TOKEN_H
