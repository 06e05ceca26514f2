#ifndef MORK_PARSER_PARSER_H
#define MORK_PARSER_PARSER_H

#include <optional>
#include <string>
#include "dictionary.h"
#include "mork/options.h"
#include "mork/table.h"
#include "scanner/scanner.h"
#include "utils/logging.h"

namespace Mork {

/*
 * Recursive descent parser with one token of lookahead.
 *
 *     dict      ::= '<' metadict? cell* '>'
 *     metadict  ::= '<' cell* '>'
 *     cell      ::= '(' col slot ')'
 *     col       ::= ref /default scope is "c"/ | NAME
 *     slot      ::= ref /default scope is "a"/ | '=' LITERAL
 *     ref       ::= '^' ID (':' (NAME | ref))?
 *     row       ::= '[' oid /default scope is the row scope/ cell* ']'
 *     table     ::= '{' oid /default scope is "c"/ metatable? (row | ID)* '}'
 *     metatable ::= '{' cell* '}'
 *     oid       ::= ID (':' (NAME | ref))?
 *     group     ::= GROUP_START (dict | row | table)* (GROUP_COMMIT | GROUP_ABORT)
 *
 * The first error is kept in m_status. Once it is set, every expect_*() method does nothing and returns an empty
 * value, so callers can finish a production without checking after each step.
 */
class Parser final {
public:
    Parser(std::string filename, Scanner &scanner, const Options &options, LogPtr log);

    // Parse until the end of input or the first error. Completed tables are added to "out" either way.
    [[nodiscard]] auto parse(TableMap &out) -> Status;

    [[nodiscard]] auto dictionary() const -> const Dictionary &
    {
        return m_dictionary;
    }

    Parser(const Parser &) = delete;
    auto operator=(const Parser &) -> Parser & = delete;

private:
    [[nodiscard]] auto is_ok() const -> bool
    {
        return m_status.is_ok();
    }

    auto set_error(Status s) -> void;
    auto unexpected(const Token &token, const char *expected) -> void;

    [[nodiscard]] auto peek_token() -> const Token &;
    auto next_token() -> Token;
    auto expect(TokenType type) -> Token;
    auto expect_name() -> std::string;
    auto expect_id() -> std::string;
    auto expect_ref(const char *default_scope) -> std::string;
    auto expect_scope(const char *default_scope) -> std::optional<std::string>;
    auto expect_oid(const char *default_scope) -> Oid;
    auto expect_cell() -> std::pair<std::string, std::string>;
    auto expect_cells() -> Row;
    auto expect_dict() -> void;
    auto expect_metadict() -> Row;
    auto expect_row(const std::string &row_scope) -> std::pair<std::string, Row>;
    auto expect_table() -> std::pair<std::string, Table>;
    auto expect_group(TableMap &out) -> void;

    std::optional<Token> m_peeked;
    Dictionary m_dictionary;
    std::string m_filename;
    Options m_options;
    LogPtr m_log;
    Scanner *m_scanner {};

    // Definitions go here. Points to m_dictionary, or to a group's overlay while a group is being parsed.
    Dictionary *m_active {};
    Status m_status {Status::ok()};
};

} // namespace Mork

#endif // MORK_PARSER_PARSER_H
