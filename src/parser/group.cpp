#include "parser.h"
#include "utils/scope_guard.h"
#include <algorithm>
#include <cctype>

namespace Mork {

// Group markers look like "@$${ID{@" and "@$$}ID}@". The ID is between the 4-character prefix and the
// 2-character suffix.
static auto group_id(const Token &token) -> std::string
{
    static constexpr Size PREFIX_SIZE {4};
    static constexpr Size SUFFIX_SIZE {2};
    MORK_EXPECT_GE(token.text.size(), PREFIX_SIZE + SUFFIX_SIZE);
    auto id = token.text.range(PREFIX_SIZE, token.text.size() - PREFIX_SIZE - SUFFIX_SIZE).to_string();
    std::transform(cbegin(id), cend(id), begin(id), [](auto c) {
        return static_cast<Byte>(std::tolower(static_cast<unsigned char>(c)));
    });
    return id;
}

/*
 * Edits made inside of a group go into an overlay: a dictionary layered over the main one, and a separate table
 * map. Lookups inside the group see the overlay first. The overlay is merged when the group is committed, and
 * dropped when it is aborted, when the input ends before the group does, or when an error is encountered.
 */
auto Parser::expect_group(TableMap &out) -> void
{
    const auto start = expect(TokenType::GROUP_START);
    if (!is_ok())
        return;
    const auto id = group_id(start);

    Dictionary overlay {m_filename, &m_dictionary};
    TableMap tables;

    m_active = &overlay;
    ScopeGuard guard {[this] {
        m_active = &m_dictionary;
    }};

    while (is_ok()) {
        const auto &token = peek_token();
        if (!is_ok())
            break;

        switch (token.type) {
            case TokenType::END_OF_INPUT:
                m_log->warn("group {}: input ended before the group was committed, discarding {} tables", id, tables.size());
                return;
            case TokenType::LEFT_ANGLE:
                expect_dict();
                break;
            case TokenType::LEFT_SQUARE:
                expect_row(COLUMN_NAMESPACE);
                break;
            case TokenType::LEFT_BRACE:
                if (auto [table_id, table] = expect_table(); is_ok())
                    tables.insert_or_assign(std::move(table_id), std::move(table));
                break;
            case TokenType::GROUP_COMMIT: {
                const auto commit = next_token();
                if (m_options.check_group_ids && group_id(commit) != id) {
                    LogMessage message {*m_log};
                    message.set_primary("{}: group ID mismatch", m_filename);
                    message.set_detail("group {} was committed as {}", id, group_id(commit));
                    message.set_hint("at {}:{}", commit.position.line, commit.position.column);
                    set_error(message.group_mismatch());
                    return;
                }
                m_log->info("group {}: committing {} definitions and {} tables", id, overlay.size(), tables.size());
                overlay.merge_into(m_dictionary);
                for (auto &[table_id, table]: tables)
                    out.insert_or_assign(table_id, std::move(table));
                return;
            }
            case TokenType::GROUP_ABORT:
                next_token();
                m_log->warn("group {}: aborted, discarding {} tables", id, tables.size());
                return;
            default:
                unexpected(token, "'<', '[', '{', or the end of the group");
        }
    }
}

} // namespace Mork
