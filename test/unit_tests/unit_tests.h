#ifndef MORK_TEST_UNIT_TESTS_H
#define MORK_TEST_UNIT_TESTS_H

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "mork/mork.h"
#include "parser/parser.h"
#include "scanner/scanner.h"
#include "utils/logging.h"

namespace Mork {

static constexpr auto EXPECTATION_MATCHER = "^expectation";
static constexpr auto TEST_FILENAME = "test.mork";

inline auto quiet_log(const std::string &name = "test") -> LogPtr
{
    return System {Options {}}.create_log(name);
}

struct ScannedToken {
    TokenType type;
    std::string text;
    Position position;
};

// Scan until the end of input or the first error.
inline auto scan_all(const std::string &input) -> std::vector<ScannedToken>
{
    Scanner scanner {input, quiet_log()};
    std::vector<ScannedToken> tokens;
    for (; ; ) {
        const auto token = scanner.next_token();
        tokens.push_back({token.type, token.text.to_string(), token.position});
        if (token.type == TokenType::END_OF_INPUT || token.type == TokenType::ERROR)
            return tokens;
    }
}

inline auto token_types(const std::vector<ScannedToken> &tokens) -> std::vector<TokenType>
{
    std::vector<TokenType> types;
    for (const auto &token: tokens)
        types.push_back(token.type);
    return types;
}

class ParserTests: public testing::Test {
protected:
    auto parse(std::string input) -> Status
    {
        m_input = std::move(input);
        m_scanner = std::make_unique<Scanner>(m_input, quiet_log("scanner"));
        m_parser = std::make_unique<Parser>(TEST_FILENAME, *m_scanner, options, quiet_log("parser"));
        tables.clear();
        return m_parser->parse(tables);
    }

    [[nodiscard]] auto dictionary() const -> const Dictionary &
    {
        return m_parser->dictionary();
    }

    [[nodiscard]] auto cell(const std::string &table_id, const std::string &row_id, const std::string &name) const -> std::string
    {
        return tables.at(table_id).rows.at(row_id).at(name);
    }

    Options options;
    TableMap tables;

private:
    std::string m_input;
    std::unique_ptr<Scanner> m_scanner;
    std::unique_ptr<Parser> m_parser;
};

} // namespace Mork

#endif // MORK_TEST_UNIT_TESTS_H
