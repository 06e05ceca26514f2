#include "unit_tests.h"

namespace {

using namespace Mork;
using T = TokenType;

TEST(ScannerTests, EmptyInputProducesEndOfInput)
{
    const auto tokens = scan_all("");
    ASSERT_EQ(tokens.size(), 1);
    ASSERT_EQ(tokens[0].type, T::END_OF_INPUT);
}

TEST(ScannerTests, WhitespaceIsSkipped)
{
    const auto tokens = scan_all(" \t\r\n  ");
    ASSERT_EQ(token_types(tokens), std::vector<T> {T::END_OF_INPUT});
}

TEST(ScannerTests, SingleCharacterTokens)
{
    const auto tokens = scan_all("()[]{}<>:+");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {
        T::LEFT_PAREN, T::RIGHT_PAREN, T::LEFT_SQUARE, T::RIGHT_SQUARE, T::LEFT_BRACE, T::RIGHT_BRACE,
        T::LEFT_ANGLE, T::RIGHT_ANGLE, T::COLON, T::PLUS, T::END_OF_INPUT}));
}

TEST(ScannerTests, ReferenceIsCaretAndHexId)
{
    const auto tokens = scan_all("^8aF^1:c");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::CARET, T::NAME, T::CARET, T::NAME, T::COLON, T::NAME, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[0].text, "^");
    ASSERT_EQ(tokens[1].text, "8aF");
    ASSERT_EQ(tokens[3].text, "1");
    ASSERT_EQ(tokens[5].text, "c");
}

TEST(ScannerTests, HexRunStopsAtNonHexCharacter)
{
    const auto tokens = scan_all("(x^5)");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::LEFT_PAREN, T::NAME, T::CARET, T::NAME, T::RIGHT_PAREN, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[1].text, "x");
    ASSERT_EQ(tokens[3].text, "5");
}

TEST(ScannerTests, CaretWithoutHexIdIsAnError)
{
    const auto tokens = scan_all("^zz");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::CARET, T::ERROR}));
}

TEST(ScannerTests, NameMayContainExtraCharactersAfterTheFirst)
{
    const auto tokens = scan_all("a-b!c?d+e _x 9z");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::NAME, T::NAME, T::NAME, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[0].text, "a-b!c?d+e");
    ASSERT_EQ(tokens[1].text, "_x");
    ASSERT_EQ(tokens[2].text, "9z");
}

TEST(ScannerTests, LeadingPlusIsItsOwnToken)
{
    const auto tokens = scan_all("+a");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::PLUS, T::NAME, T::END_OF_INPUT}));
}

TEST(ScannerTests, LeadingDashIsAnError)
{
    const auto tokens = scan_all("-a");
    ASSERT_EQ(token_types(tokens), std::vector<T> {T::ERROR});
    ASSERT_NE(tokens[0].text.find("'-'"), std::string::npos);
}

TEST(ScannerTests, LiteralEndsAtUnescapedParenthesis)
{
    const auto tokens = scan_all(R"((a=x\)y))");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::LEFT_PAREN, T::NAME, T::EQUAL, T::LITERAL, T::RIGHT_PAREN, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[2].text, "=");
    ASSERT_EQ(tokens[3].text, R"(x\)y)");
}

TEST(ScannerTests, EscapedBackslashDoesNotEscapeParenthesis)
{
    const auto tokens = scan_all(R"(=a\\)b)");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::EQUAL, T::LITERAL, T::RIGHT_PAREN, T::NAME, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[1].text, R"(a\\)");
}

TEST(ScannerTests, LiteralMayBeEmpty)
{
    const auto tokens = scan_all("=)");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::EQUAL, T::LITERAL, T::RIGHT_PAREN, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[1].text, "");
}

TEST(ScannerTests, LiteralMayRunToEndOfInput)
{
    const auto tokens = scan_all("=abc def");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::EQUAL, T::LITERAL, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[1].text, "abc def");
}

TEST(ScannerTests, CommentsAreDiscarded)
{
    const auto tokens = scan_all("// <(a=b)>\n<// trailing");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::LEFT_ANGLE, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[0].position.line, 2);
    ASSERT_EQ(tokens[0].position.column, 0);
}

TEST(ScannerTests, SingleSlashIsAnError)
{
    const auto tokens = scan_all("/x");
    ASSERT_EQ(token_types(tokens), std::vector<T> {T::ERROR});
    ASSERT_EQ(tokens[0].text, "expected \"//\"");
}

TEST(ScannerTests, GroupMarkers)
{
    const auto tokens = scan_all("@$${1A{@ @$$}1A}@ @$$}~~}@");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::GROUP_START, T::GROUP_COMMIT, T::GROUP_ABORT, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[0].text, "@$${1A{@");
    ASSERT_EQ(tokens[1].text, "@$$}1A}@");
    ASSERT_EQ(tokens[2].text, "@$$}~~}@");
}

TEST(ScannerTests, MalformedGroupMarkersAreErrors)
{
    for (const auto *input: {"@$x", "@$$x", "@$${{@", "@$${1{x", "@$$}}@", "@$$}1]@", "@$$}~abort~1}@", "@$"}) {
        const auto tokens = scan_all(input);
        ASSERT_EQ(token_types(tokens), std::vector<T> {T::ERROR}) << "input: " << input;
    }
}

TEST(ScannerTests, UnexpectedCharacterIsAnError)
{
    const auto tokens = scan_all("ab #");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::NAME, T::ERROR}));
    ASSERT_EQ(tokens[1].text, "unexpected character '#'");
    ASSERT_EQ(tokens[1].position.offset, 3);
    ASSERT_EQ(tokens[1].position.line, 1);
    ASSERT_EQ(tokens[1].position.column, 3);
}

TEST(ScannerTests, NonPrintableCharacterIsEscapedInMessage)
{
    const auto tokens = scan_all(std::string {"\x01"});
    ASSERT_EQ(tokens[0].text, "unexpected character '\\x01'");
}

TEST(ScannerTests, TracksLinesAndColumns)
{
    const auto tokens = scan_all("<\n  (abc\n=x)");
    ASSERT_EQ(token_types(tokens), (std::vector<T> {T::LEFT_ANGLE, T::LEFT_PAREN, T::NAME, T::EQUAL, T::LITERAL, T::RIGHT_PAREN, T::END_OF_INPUT}));
    ASSERT_EQ(tokens[1].position.line, 2);
    ASSERT_EQ(tokens[1].position.column, 2);
    ASSERT_EQ(tokens[1].position.offset, 4);
    ASSERT_EQ(tokens[2].position.column, 3);
    ASSERT_EQ(tokens[3].position.line, 3);
    ASSERT_EQ(tokens[3].position.column, 0);
}

TEST(ScannerTests, ErrorIsRepeated)
{
    const std::string input {"< $"};
    Scanner scanner {input};
    ASSERT_EQ(scanner.next_token().type, T::LEFT_ANGLE);
    const auto first = scanner.next_token();
    ASSERT_EQ(first.type, T::ERROR);
    for (int i {}; i < 3; ++i) {
        const auto again = scanner.next_token();
        ASSERT_EQ(again.type, T::ERROR);
        ASSERT_EQ(again.text, first.text);
    }
}

TEST(ScannerTests, EndOfInputIsRepeated)
{
    const std::string input {"<"};
    Scanner scanner {input};
    ASSERT_EQ(scanner.next_token().type, T::LEFT_ANGLE);
    for (int i {}; i < 3; ++i)
        ASSERT_EQ(scanner.next_token().type, T::END_OF_INPUT);
}

TEST(ScannerTests, DescribeToken)
{
    const std::string input {"\n  abc"};
    Scanner scanner {input};
    ASSERT_EQ(describe_token(scanner.next_token()), "2:2 NAME \"abc\"");
}

} // namespace
