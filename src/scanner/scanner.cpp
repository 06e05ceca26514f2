#include "scanner.h"

namespace Mork {

static constexpr int END_OF_INPUT {-1};

static auto is_space(int c) -> bool
{
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

static auto is_alpha(int c) -> bool
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static auto is_digit(int c) -> bool
{
    return c >= '0' && c <= '9';
}

// Characters allowed in a name, but not at the start.
static auto is_name_tail(int c) -> bool
{
    return c == '-' || c == '!' || c == '?' || c == '+';
}

static auto single_token_type(int c, TokenType &out) -> bool
{
    switch (c) {
        case '(':
            out = TokenType::LEFT_PAREN;
            break;
        case ')':
            out = TokenType::RIGHT_PAREN;
            break;
        case '[':
            out = TokenType::LEFT_SQUARE;
            break;
        case ']':
            out = TokenType::RIGHT_SQUARE;
            break;
        case '{':
            out = TokenType::LEFT_BRACE;
            break;
        case '}':
            out = TokenType::RIGHT_BRACE;
            break;
        case '<':
            out = TokenType::LEFT_ANGLE;
            break;
        case '>':
            out = TokenType::RIGHT_ANGLE;
            break;
        case ':':
            out = TokenType::COLON;
            break;
        case '+':
            out = TokenType::PLUS;
            break;
        default:
            return false;
    }
    return true;
}

Scanner::Scanner(const Slice &input, LogPtr log)
    : m_log {std::move(log)},
      m_input {input}
{}

auto Scanner::next_token() -> Token
{
    while (m_queue.empty()) {
        switch (m_state) {
            case State::DEFAULT:
                m_state = scan_default();
                break;
            case State::NAME:
                m_state = scan_name();
                break;
            case State::LITERAL:
                m_state = scan_literal();
                break;
            case State::COMMENT:
                m_state = scan_comment();
                break;
            case State::GROUP:
                m_state = scan_group();
                break;
            case State::DONE:
                return m_final;
        }
    }
    auto token = m_queue.front();
    m_queue.pop_front();

    if (m_log && m_log->should_log(spdlog::level::trace))
        m_log->trace("token {}", describe_token(token));
    return token;
}

auto Scanner::is_empty() const -> bool
{
    return m_current.offset >= m_input.size();
}

auto Scanner::peek() const -> int
{
    if (is_empty())
        return END_OF_INPUT;
    return static_cast<unsigned char>(m_input[m_current.offset]);
}

auto Scanner::get() -> int
{
    if (is_empty())
        return END_OF_INPUT;

    const auto c = peek();
    if (c == '\n') {
        m_current.line++;
        m_current.column = 0;
    } else {
        m_current.column++;
    }
    m_current.offset++;
    return c;
}

auto Scanner::emit(TokenType type) -> void
{
    Token token;
    token.type = type;
    token.text = m_input.range(m_start.offset, m_current.offset - m_start.offset);
    token.position = m_start;
    m_queue.push_back(token);
    m_start = m_current;

    if (type == TokenType::END_OF_INPUT)
        m_final = token;
}

auto Scanner::emit_error(const std::string &message) -> State
{
    m_error = message;

    Token token;
    token.type = TokenType::ERROR;
    token.text = m_error;
    token.position = m_current;
    m_queue.push_back(token);
    m_final = token;
    return State::DONE;
}

auto Scanner::gather_hex() -> Slice
{
    const auto offset = m_current.offset;
    while (peek() != END_OF_INPUT && is_hex_digit(static_cast<Byte>(peek())))
        get();
    return m_input.range(offset, m_current.offset - offset);
}

auto Scanner::expect(const Slice &sequence) -> bool
{
    for (Size i {}; i < sequence.size(); ++i) {
        if (get() != static_cast<unsigned char>(sequence[i])) {
            emit_error(fmt::format("expected \"{}\"", sequence.to_view()));
            return false;
        }
    }
    return true;
}

auto Scanner::scan_default() -> State
{
    for (; ; ) {
        const auto c = peek();
        if (c == END_OF_INPUT) {
            emit(TokenType::END_OF_INPUT);
            return State::DONE;
        }

        // Whitespace is skipped, not included in the next token.
        if (is_space(c)) {
            get();
            m_start = m_current;
            continue;
        }

        if (TokenType type; single_token_type(c, type)) {
            get();
            emit(type);
            return State::DEFAULT;
        }

        switch (c) {
            case '^':
                // References are a caret followed by a hex ID.
                get();
                emit(TokenType::CARET);
                if (gather_hex().is_empty())
                    return emit_error("expected a hex ID after '^'");
                emit(TokenType::NAME);
                return State::DEFAULT;
            case '/':
                return State::COMMENT;
            case '=':
                return State::LITERAL;
            case '@':
                return State::GROUP;
            default:
                break;
        }

        if (is_alpha(c) || is_digit(c) || c == '_')
            return State::NAME;

        std::string message {"unexpected character '"};
        append_escaped_string(message, Slice {m_input.data() + m_current.offset, 1});
        return emit_error(message + '\'');
    }
}

auto Scanner::scan_name() -> State
{
    for (auto first = true; ; first = false) {
        const auto c = peek();
        if (!(is_alpha(c) || is_digit(c) || c == '_' || (!first && is_name_tail(c))))
            break;
        get();
    }
    emit(TokenType::NAME);
    return State::DEFAULT;
}

auto Scanner::scan_literal() -> State
{
    if (get() != '=')
        return emit_error("expected '='");
    emit(TokenType::EQUAL);

    // Escapes are not decoded here, but they must be tracked to find the end of the literal.
    auto escaped = false;
    for (; ; ) {
        const auto c = peek();
        if (c == END_OF_INPUT)
            break;
        if (!escaped && c == ')')
            break;
        escaped = !escaped && c == '\\';
        get();
    }
    emit(TokenType::LITERAL);
    return State::DEFAULT;
}

auto Scanner::scan_comment() -> State
{
    if (get() != '/' || get() != '/')
        return emit_error("expected \"//\"");

    while (peek() != END_OF_INPUT && peek() != '\n')
        get();

    // Discard.
    m_start = m_current;
    return State::DEFAULT;
}

auto Scanner::scan_group() -> State
{
    if (!expect("@$$"))
        return State::DONE;

    switch (get()) {
        case '{':
            // Group start: @$${ID{@
            if (gather_hex().is_empty())
                return emit_error("expected a group ID");
            if (!expect("{@"))
                return State::DONE;
            emit(TokenType::GROUP_START);
            return State::DEFAULT;
        case '}':
            // Group abort: @$$}~~}@
            if (peek() == '~') {
                if (!expect("~~}@"))
                    return State::DONE;
                emit(TokenType::GROUP_ABORT);
                return State::DEFAULT;
            }
            // Group commit: @$$}ID}@
            if (gather_hex().is_empty())
                return emit_error("expected a group ID");
            if (!expect("}@"))
                return State::DONE;
            emit(TokenType::GROUP_COMMIT);
            return State::DEFAULT;
        default:
            return emit_error("expected '{' or '}' after \"@$$\"");
    }
}

} // namespace Mork
