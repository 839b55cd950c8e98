#include <gtest/gtest.h>

#include "confcache/util/strings.hh"

namespace confcache {

/* ----------------------------------------------------------------------------
 * chomp / trim
 * --------------------------------------------------------------------------*/

TEST(chomp, emptyString)
{
    ASSERT_EQ(chomp(""), "");
}

TEST(chomp, removesWhitespace)
{
    ASSERT_EQ(chomp("foo \n\t"), "foo");
}

TEST(trim, bothEnds)
{
    ASSERT_EQ(trim("  foo bar \n"), "foo bar");
}

TEST(trim, onlyWhitespace)
{
    ASSERT_EQ(trim(" \t\n"), "");
}

/* ----------------------------------------------------------------------------
 * stripIndentation
 * --------------------------------------------------------------------------*/

TEST(stripIndentation, removesCommonIndent)
{
    ASSERT_EQ(stripIndentation("\n    foo\n      bar\n"), "\nfoo\n  bar\n");
}

TEST(stripIndentation, singleLine)
{
    ASSERT_EQ(stripIndentation("description"), "description\n");
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, parsesNumbers)
{
    ASSERT_EQ(string2Int<int>("-42"), -42);
    ASSERT_EQ(string2Int<unsigned int>("512"), 512u);
}

TEST(string2Int, rejectsGarbage)
{
    ASSERT_FALSE(string2Int<int>("4x").has_value());
    ASSERT_FALSE(string2Int<int>("").has_value());
}

TEST(string2Int, rejectsNegativeForUnsigned)
{
    ASSERT_FALSE(string2Int<uint64_t>("-1").has_value());
}

} // namespace confcache
