#ifndef MORK_SCANNER_SCANNER_H
#define MORK_SCANNER_SCANNER_H

#include <deque>
#include <string>
#include "token.h"
#include "utils/logging.h"

namespace Mork {

/*
 * Splits a buffer into tokens on demand. The scanner is a state machine: each call to a state handler consumes
 * some input, queues zero or more tokens, and selects the next state. next_token() runs handlers until a token
 * is available. Once the input is exhausted, END_OF_INPUT is returned forever. Once a lexical error is found,
 * the same ERROR token is returned forever.
 */
class Scanner final {
public:
    explicit Scanner(const Slice &input, LogPtr log = nullptr);

    [[nodiscard]] auto next_token() -> Token;

    Scanner(const Scanner &) = delete;
    auto operator=(const Scanner &) -> Scanner & = delete;

private:
    enum class State {
        DEFAULT,
        NAME,
        LITERAL,
        COMMENT,
        GROUP,
        DONE,
    };

    [[nodiscard]] auto is_empty() const -> bool;
    [[nodiscard]] auto peek() const -> int;
    auto get() -> int;
    auto emit(TokenType type) -> void;
    auto emit_error(const std::string &message) -> State;
    auto gather_hex() -> Slice;
    [[nodiscard]] auto expect(const Slice &sequence) -> bool;

    auto scan_default() -> State;
    auto scan_name() -> State;
    auto scan_literal() -> State;
    auto scan_comment() -> State;
    auto scan_group() -> State;

    std::deque<Token> m_queue;
    Token m_final;
    std::string m_error;
    LogPtr m_log;
    Slice m_input;
    Position m_current;
    Position m_start;
    State m_state {State::DEFAULT};
};

} // namespace Mork

#endif // MORK_SCANNER_SCANNER_H
