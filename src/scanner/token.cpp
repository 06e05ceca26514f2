#include "token.h"
#include "utils/logging.h"

namespace Mork {

auto token_type_name(TokenType type) -> const char *
{
    switch (type) {
        case TokenType::END_OF_INPUT:
            return "END_OF_INPUT";
        case TokenType::ERROR:
            return "ERROR";
        case TokenType::LITERAL:
            return "LITERAL";
        case TokenType::NAME:
            return "NAME";
        case TokenType::CARET:
            return "CARET";
        case TokenType::PLUS:
            return "PLUS";
        case TokenType::COLON:
            return "COLON";
        case TokenType::EQUAL:
            return "EQUAL";
        case TokenType::LEFT_ANGLE:
            return "LEFT_ANGLE";
        case TokenType::RIGHT_ANGLE:
            return "RIGHT_ANGLE";
        case TokenType::LEFT_PAREN:
            return "LEFT_PAREN";
        case TokenType::RIGHT_PAREN:
            return "RIGHT_PAREN";
        case TokenType::LEFT_SQUARE:
            return "LEFT_SQUARE";
        case TokenType::RIGHT_SQUARE:
            return "RIGHT_SQUARE";
        case TokenType::LEFT_BRACE:
            return "LEFT_BRACE";
        case TokenType::RIGHT_BRACE:
            return "RIGHT_BRACE";
        case TokenType::GROUP_START:
            return "GROUP_START";
        case TokenType::GROUP_COMMIT:
            return "GROUP_COMMIT";
        case TokenType::GROUP_ABORT:
            return "GROUP_ABORT";
    }
    return "UNKNOWN";
}

auto describe_token(const Token &token) -> std::string
{
    return fmt::format("{}:{} {} \"{}\"",
                       token.position.line,
                       token.position.column,
                       token_type_name(token.type),
                       escape_string(token.text));
}

} // namespace Mork
