#include "unit_tests.h"
#include "parser/dictionary.h"
#include "parser/literal.h"

namespace {

using namespace Mork;

class DictionaryTests: public testing::Test {
protected:
    Dictionary dictionary {TEST_FILENAME};
};

TEST_F(DictionaryTests, ResolvesDefinedAlias)
{
    dictionary.define("80", "c", "title");
    const auto value = dictionary.resolve("80", "c");
    ASSERT_TRUE(value.has_value());
    ASSERT_EQ(*value, "title");
}

TEST_F(DictionaryTests, LastDefinitionWins)
{
    dictionary.define("1", "a", "first");
    dictionary.define("1", "a", "second");
    ASSERT_EQ(*dictionary.resolve("1", "a"), "second");
    ASSERT_EQ(dictionary.size(), 1);
}

TEST_F(DictionaryTests, NamespacesAreSeparate)
{
    dictionary.define("1", "a", "atom");
    dictionary.define("1", "c", "column");
    ASSERT_EQ(*dictionary.resolve("1", "a"), "atom");
    ASSERT_EQ(*dictionary.resolve("1", "c"), "column");
    ASSERT_FALSE(dictionary.resolve("1", "x").has_value());
}

TEST_F(DictionaryTests, UnresolvedAliasNamesIdNamespaceAndFile)
{
    const auto value = dictionary.resolve("ff", "missing");
    ASSERT_FALSE(value.has_value());
    ASSERT_TRUE(value.error().is_unresolved_reference());
    ASSERT_EQ(value.error().what(), "test.mork: unresolved alias ff:missing");
}

TEST_F(DictionaryTests, UnresolvedAliasMessageIsEscaped)
{
    const auto value = dictionary.resolve("1", std::string {"x\0y", 3});
    ASSERT_FALSE(value.has_value());
    ASSERT_EQ(value.error().what().to_string(), "test.mork: unresolved alias 1:x\\x00y");
}

TEST_F(DictionaryTests, DictionaryForCreatesEmptyNamespace)
{
    auto &aliases = dictionary.dictionary_for("new");
    ASSERT_TRUE(aliases.empty());
    aliases.emplace("2", "two");
    ASSERT_EQ(*dictionary.resolve("2", "new"), "two");
}

TEST_F(DictionaryTests, ChildSeesParentDefinitions)
{
    dictionary.define("1", "a", "parent");
    Dictionary child {TEST_FILENAME, &dictionary};
    ASSERT_EQ(*child.resolve("1", "a"), "parent");

    child.define("1", "a", "child");
    ASSERT_EQ(*child.resolve("1", "a"), "child");
    ASSERT_EQ(*dictionary.resolve("1", "a"), "parent");
}

TEST_F(DictionaryTests, ParentDoesNotSeeChildDefinitions)
{
    Dictionary child {TEST_FILENAME, &dictionary};
    child.define("2", "a", "child");
    ASSERT_EQ(child.size(), 1);
    ASSERT_EQ(dictionary.find("2", "a"), nullptr);
}

TEST_F(DictionaryTests, MergeMovesDefinitionsIntoTarget)
{
    dictionary.define("1", "a", "old");
    dictionary.define("2", "a", "kept");
    Dictionary child {TEST_FILENAME, &dictionary};
    child.define("1", "a", "new");
    child.define("3", "c", "column");
    child.merge_into(dictionary);

    ASSERT_EQ(child.size(), 0);
    ASSERT_EQ(dictionary.size(), 3);
    ASSERT_EQ(*dictionary.resolve("1", "a"), "new");
    ASSERT_EQ(*dictionary.resolve("2", "a"), "kept");
    ASSERT_EQ(*dictionary.resolve("3", "c"), "column");
}

TEST(LiteralTests, PlainTextIsUnchanged)
{
    ASSERT_EQ(decode_literal("hello world"), "hello world");
    ASSERT_EQ(decode_literal(""), "");
}

TEST(LiteralTests, BackslashEscapesNextByte)
{
    ASSERT_EQ(decode_literal(R"(a\)b)"), "a)b");
    ASSERT_EQ(decode_literal(R"(a\\b)"), R"(a\b)");
    ASSERT_EQ(decode_literal(R"(\$24)"), "$24");
}

TEST(LiteralTests, BackslashNewlineIsLineContinuation)
{
    ASSERT_EQ(decode_literal("ab\\\ncd"), "abcd");
    ASSERT_EQ(decode_literal("ab\\\r\ncd"), "abcd");
    ASSERT_EQ(decode_literal("ab\\\rcd"), "abcd");
}

TEST(LiteralTests, DollarHexIsDecoded)
{
    ASSERT_EQ(decode_literal("$24"), "$");
    ASSERT_EQ(decode_literal("a$29b"), "a)b");
    ASSERT_EQ(decode_literal("$e2$82$ac"), "\xe2\x82\xac");
}

TEST(LiteralTests, IncompleteEscapesAreKept)
{
    ASSERT_EQ(decode_literal("$4"), "$4");
    ASSERT_EQ(decode_literal("$zz"), "$zz");
    ASSERT_EQ(decode_literal("cost: $"), "cost: $");
    ASSERT_EQ(decode_literal("ab\\"), "ab\\");
}

} // namespace
