#include "parser.h"
#include "literal.h"
#include <vector>

namespace Mork {

Parser::Parser(std::string filename, Scanner &scanner, const Options &options, LogPtr log)
    : m_dictionary {filename},
      m_filename {std::move(filename)},
      m_options {options},
      m_log {std::move(log)},
      m_scanner {&scanner},
      m_active {&m_dictionary}
{
    MORK_EXPECT_NE(m_log, nullptr);
}

auto Parser::parse(TableMap &out) -> Status
{
    while (is_ok()) {
        const auto &token = peek_token();
        if (!is_ok())
            break;

        switch (token.type) {
            case TokenType::END_OF_INPUT:
                return m_status;
            case TokenType::LEFT_ANGLE:
                expect_dict();
                break;
            case TokenType::LEFT_SQUARE:
                // Rows outside of a table do not belong to anything.
                expect_row(COLUMN_NAMESPACE);
                break;
            case TokenType::LEFT_BRACE:
                if (auto [id, table] = expect_table(); is_ok())
                    out.insert_or_assign(std::move(id), std::move(table));
                break;
            case TokenType::GROUP_START:
                expect_group(out);
                break;
            default:
                unexpected(token, "'<', '[', '{', or a group");
        }
    }
    return m_status;
}

auto Parser::set_error(Status s) -> void
{
    MORK_EXPECT_FALSE(s.is_ok());
    if (is_ok())
        m_status = std::move(s);
}

auto Parser::unexpected(const Token &token, const char *expected) -> void
{
    if (!is_ok())
        return;

    LogMessage message {*m_log};
    message.set_primary("{}: unexpected token", m_filename);
    message.set_detail("{}", describe_token(token));
    message.set_hint("expected {}", expected);
    set_error(message.syntax_error());
}

auto Parser::peek_token() -> const Token &
{
    if (!m_peeked) {
        m_peeked = m_scanner->next_token();

        if (m_peeked->type == TokenType::ERROR && is_ok()) {
            LogMessage message {*m_log};
            message.set_primary("{}: syntax error", m_filename);
            message.set_detail("{} at {}:{}", m_peeked->text.to_view(), m_peeked->position.line, m_peeked->position.column);
            set_error(message.lexical_error());
        }
    }
    return *m_peeked;
}

auto Parser::next_token() -> Token
{
    auto token = peek_token();
    m_peeked.reset();
    return token;
}

auto Parser::expect(TokenType type) -> Token
{
    if (!is_ok())
        return {};

    auto token = next_token();
    if (token.type != type) {
        unexpected(token, token_type_name(type));
        return {};
    }
    return token;
}

auto Parser::expect_name() -> std::string
{
    return expect(TokenType::NAME).text.to_string();
}

auto Parser::expect_id() -> std::string
{
    const auto token = expect(TokenType::NAME);
    if (!is_ok())
        return {};

    // Names are scanned with a larger character set, so an ID like "1g" makes it here.
    if (!is_hex_id(token.text)) {
        LogMessage message {*m_log};
        message.set_primary("{}: not a hex ID", m_filename);
        message.set_detail("{}", describe_token(token));
        set_error(message.invalid_identifier());
        return {};
    }
    return token.text.to_string();
}

// A chain like "^a:^b:name" is read left to right but resolved right to left: each reference names the scope of
// the one before it. IDs are collected in a loop, so long chains do not use up the stack.
auto Parser::expect_ref(const char *default_scope) -> std::string
{
    std::vector<std::pair<std::string, Position>> chain;
    std::string scope {default_scope};

    while (is_ok()) {
        const auto position = peek_token().position;
        expect(TokenType::CARET);
        auto id = expect_id();
        if (!is_ok())
            return {};
        chain.emplace_back(std::move(id), position);

        if (peek_token().type != TokenType::COLON)
            break;
        next_token();
        if (peek_token().type != TokenType::CARET) {
            scope = expect_name();
            break;
        }
    }
    if (!is_ok())
        return {};

    for (auto itr = crbegin(chain); itr != crend(chain); ++itr) {
        auto value = m_active->resolve(itr->first, scope);
        if (!value.has_value()) {
            LogMessage message {*m_log};
            message.set_primary("{}", value.error().what().to_view());
            message.set_detail("referenced at {}:{}", itr->second.line, itr->second.column);
            set_error(message.unresolved_reference());
            return {};
        }
        scope = std::move(*value);
    }
    return scope;
}

// Parse an optional ':' followed by a scope name, or by a reference that resolves to the scope name.
auto Parser::expect_scope(const char *default_scope) -> std::optional<std::string>
{
    if (!is_ok() || peek_token().type != TokenType::COLON)
        return std::nullopt;
    next_token();

    if (peek_token().type == TokenType::CARET)
        return expect_ref(default_scope);
    return expect_name();
}

auto Parser::expect_oid(const char *default_scope) -> Oid
{
    Oid oid;
    oid.id = expect_id();
    oid.scope = expect_scope(default_scope).value_or(default_scope);
    return oid;
}

auto Parser::expect_cell() -> std::pair<std::string, std::string>
{
    expect(TokenType::LEFT_PAREN);

    std::string name;
    if (peek_token().type == TokenType::CARET) {
        name = expect_ref(COLUMN_NAMESPACE);
    } else {
        name = expect_name();
    }

    std::string value;
    if (peek_token().type == TokenType::EQUAL) {
        next_token();
        const auto literal = expect(TokenType::LITERAL).text;
        value = m_options.decode_literals ? decode_literal(literal) : literal.to_string();
    } else {
        value = expect_ref(ATOM_NAMESPACE);
    }

    expect(TokenType::RIGHT_PAREN);
    return {std::move(name), std::move(value)};
}

auto Parser::expect_cells() -> Row
{
    Row cells;
    while (is_ok() && peek_token().type == TokenType::LEFT_PAREN) {
        auto [name, value] = expect_cell();
        if (!is_ok())
            return {};
        cells.insert_or_assign(std::move(name), std::move(value));
    }
    return cells;
}

auto Parser::expect_dict() -> void
{
    expect(TokenType::LEFT_ANGLE);
    std::string scope {ATOM_NAMESPACE};

    // The metadict may name the namespace that the rest of the cells go in.
    if (is_ok() && peek_token().type == TokenType::LEFT_ANGLE) {
        const auto meta = expect_metadict();
        if (const auto itr = meta.find(ATOM_NAMESPACE); itr != cend(meta))
            scope = itr->second;
    }

    auto cells = expect_cells();
    expect(TokenType::RIGHT_ANGLE);
    if (!is_ok())
        return;

    for (auto &[id, value]: cells) {
        m_log->trace("define {}:{} = \"{}\"", id, scope, escape_string(value));
        m_active->define(id, scope, std::move(value));
    }
}

auto Parser::expect_metadict() -> Row
{
    expect(TokenType::LEFT_ANGLE);
    auto cells = expect_cells();
    expect(TokenType::RIGHT_ANGLE);
    return cells;
}

auto Parser::expect_row(const std::string &row_scope) -> std::pair<std::string, Row>
{
    expect(TokenType::LEFT_SQUARE);
    auto oid = expect_oid(row_scope.c_str());
    auto cells = expect_cells();
    expect(TokenType::RIGHT_SQUARE);
    return {std::move(oid.id), std::move(cells)};
}

auto Parser::expect_table() -> std::pair<std::string, Table>
{
    Table table;
    expect(TokenType::LEFT_BRACE);
    const auto oid = expect_oid(COLUMN_NAMESPACE);

    // Hex IDs are only unique within a scope, so the scope is part of the table's identity.
    auto id = oid.id + ':' + oid.scope;

    std::string row_scope {oid.scope};
    if (is_ok() && peek_token().type == TokenType::LEFT_BRACE) {
        next_token();
        table.meta = expect_cells();
        expect(TokenType::RIGHT_BRACE);

        if (const auto itr = table.meta.find(ROW_SCOPE_CELL); itr != cend(table.meta))
            row_scope = itr->second;
    }

    while (is_ok()) {
        const auto &token = peek_token();
        if (!is_ok())
            break;

        if (token.type == TokenType::RIGHT_BRACE) {
            next_token();
            m_log->info("table {}: {} rows", id, table.rows.size());
            return {std::move(id), std::move(table)};
        } else if (token.type == TokenType::LEFT_SQUARE) {
            auto [row_id, row] = expect_row(row_scope);
            if (is_ok())
                table.rows.insert_or_assign(std::move(row_id), std::move(row));
        } else if (token.type == TokenType::NAME) {
            // A bare row ID removes that row from the table.
            const auto row_id = expect_id();
            if (is_ok() && table.rows.erase(row_id))
                m_log->trace("table {}: removed row {}", id, row_id);
        } else {
            unexpected(token, "'[', '}', or a row ID");
        }
    }
    return {};
}

} // namespace Mork
