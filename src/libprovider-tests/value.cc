#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "confcache/provider/value.hh"
#include "confcache/provider/tests/value.hh"

namespace confcache {

/* ----------------------------------------------------------------------------
 * Value
 * --------------------------------------------------------------------------*/

TEST(Value, scalarsCompareByContent)
{
    ASSERT_EQ(Value(int64_t{42}), Value(int64_t{42}));
    ASSERT_NE(Value(int64_t{42}), Value(42.0));
    ASSERT_EQ(Value("a"), Value(std::string("a")));
    ASSERT_NE(Value(true), Value(false));
    ASSERT_EQ(Value(Null{}), Value(Null{}));
    ASSERT_NE(Value(DirectoryPath{"/build"}), Value(RegularFilePath{"/build"}));
}

TEST(Value, listsAreOrdered)
{
    ASSERT_EQ(Value(ValueList{{"a", "b"}}), Value(ValueList{{"a", "b"}}));
    ASSERT_NE(Value(ValueList{{"a", "b"}}), Value(ValueList{{"b", "a"}}));
}

TEST(Value, handlesCompareByIdentity)
{
    auto object = std::make_shared<int>(1);
    Handle a{object, "a"};
    Handle b{object, "b"};
    Handle c{std::make_shared<int>(1), "a"};

    ASSERT_EQ(Value(a), Value(b));
    ASSERT_NE(Value(a), Value(c));
}

TEST(Value, shapeName)
{
    ASSERT_EQ(Value(Null{}).shapeName(), "Null");
    ASSERT_EQ(Value(int64_t{1}).shapeName(), "Integer");
    ASSERT_EQ(Value(0.5).shapeName(), "Float");
    ASSERT_EQ(Value("s").shapeName(), "String");
    ASSERT_EQ(Value(ValueMap{}).shapeName(), "Map");
}

TEST(Value, to_string)
{
    ASSERT_EQ(Value(int64_t{42}).to_string(), "42");
    ASSERT_EQ(Value(Null{}).to_string(), "null");
    ASSERT_EQ(Value(ValueList{{"a", int64_t{1}}}).to_string(), "[\"a\", 1]");
    ASSERT_EQ(Value(RegularFilePath{"/build/out"}).to_string(), "file '/build/out'");

    ValueMap map;
    map.put("k", true);
    ASSERT_EQ(Value(map).to_string(), "{\"k\": true}");
}

/* ----------------------------------------------------------------------------
 * ValueSet
 * --------------------------------------------------------------------------*/

TEST(ValueSet, insertIgnoresDuplicates)
{
    ValueSet set;
    ASSERT_TRUE(set.insert("a"));
    ASSERT_TRUE(set.insert("b"));
    ASSERT_FALSE(set.insert("a"));

    ASSERT_EQ(set.elems.size(), 2u);
    ASSERT_EQ(set.elems[0], Value("a"));
    ASSERT_TRUE(set.contains("b"));
    ASSERT_FALSE(set.contains("c"));
}

RC_GTEST_PROP(ValueSet, equalityIgnoresOrder, (std::vector<int64_t> elems))
{
    ValueSet forward, backward;
    for (auto i = elems.begin(); i != elems.end(); ++i)
        forward.insert(*i);
    for (auto i = elems.rbegin(); i != elems.rend(); ++i)
        backward.insert(*i);
    RC_ASSERT(forward == backward);
}

/* ----------------------------------------------------------------------------
 * ValueMap
 * --------------------------------------------------------------------------*/

TEST(ValueMap, putReplaces)
{
    ValueMap map;
    map.put("k", int64_t{1});
    map.put("k", int64_t{2});

    ASSERT_EQ(map.entries.size(), 1u);
    ASSERT_NE(map.get("k"), nullptr);
    ASSERT_EQ(*map.get("k"), Value(int64_t{2}));
    ASSERT_EQ(map.get("missing"), nullptr);
}

TEST(ValueMap, equalityIgnoresOrder)
{
    ValueMap a, b;
    a.put("x", int64_t{1});
    a.put("y", int64_t{2});
    b.put("y", int64_t{2});
    b.put("x", int64_t{1});
    ASSERT_EQ(a, b);

    b.put("x", int64_t{3});
    ASSERT_NE(a, b);
}

/* ----------------------------------------------------------------------------
 * TypeRef
 * --------------------------------------------------------------------------*/

TEST(TypeRef, builtinsCheckShape)
{
    ASSERT_TRUE(TypeRef::string.admits("s"));
    ASSERT_FALSE(TypeRef::string.admits(int64_t{1}));
    ASSERT_TRUE(TypeRef::integer.admits(int64_t{1}));
    ASSERT_FALSE(TypeRef::integer.admits(1.0));
    ASSERT_TRUE(TypeRef::directory.admits(DirectoryPath{"/build"}));
    ASSERT_FALSE(TypeRef::directory.admits(RegularFilePath{"/build"}));
}

TEST(TypeRef, objectAdmitsEverything)
{
    ASSERT_TRUE(TypeRef::object.admits("s"));
    ASSERT_TRUE(TypeRef::object.admits(ValueList{}));
}

RC_GTEST_PROP(TypeRef, declaredTypesAdmitEverything, (const Value & v))
{
    RC_ASSERT(TypeRef{"org.example.Options"}.admits(v));
}

} // namespace confcache
