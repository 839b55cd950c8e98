#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "confcache/provider/property.hh"
#include "confcache/provider/tests/test-providers.hh"

namespace confcache {

using testing::HasSubstr;

TEST(ScalarProperty, startsMissing)
{
    ScalarProperty p(TypeRef::string);
    ASSERT_FALSE(p.isPresent());
    ASSERT_TRUE(p.calculateExecutionTimeValue().isMissing());
}

TEST(ScalarProperty, setChecksTheType)
{
    ScalarProperty p(TypeRef::string);

    p.set("value");
    ASSERT_EQ(p.get(), Value("value"));

    ASSERT_THROW(p.set(int64_t{1}), PropertyTypeError);
    ASSERT_EQ(p.get(), Value("value"));
}

TEST(ScalarProperty, setNullClears)
{
    ScalarProperty p(TypeRef::integer);
    p.set(int64_t{1});
    p.set(Null{});
    ASSERT_FALSE(p.isPresent());
}

TEST(ScalarProperty, declaredTypeAdmitsAnything)
{
    ScalarProperty p(TypeRef{"org.example.Options"});
    p.set(ValueList{{"a"}});
    ASSERT_TRUE(p.isPresent());
}

TEST(ScalarProperty, backedByProvider)
{
    ScalarProperty p(TypeRef::string);
    auto greeting = make_ref<GreetingProvider>("world");
    p.set(greeting);

    ASSERT_EQ(p.get(), Value("hello, world"));
    ASSERT_EQ(&*p.getProvider(), &*greeting);

    auto state = p.calculateExecutionTimeValue();
    ASSERT_TRUE(state.isChangingValue());
    ASSERT_EQ(&*state.getChangingValue(), &*greeting);
}

TEST(ScalarProperty, wrongTypeFromProviderIsBroken)
{
    ScalarProperty p(TypeRef::integer);
    p.set(make_ref<FixedProvider>("not a number"));

    ASSERT_THROW(p.getOrNull(), PropertyTypeError);

    auto state = p.calculateExecutionTimeValue();
    ASSERT_TRUE(state.isBroken());
    ASSERT_THROW(state.getBrokenValue().rethrow(), PropertyTypeError);
}

TEST(ScalarProperty, failingProviderIsBroken)
{
    ScalarProperty p(TypeRef::string);
    p.set(make_ref<DefaultProvider>([]() -> Value { throw UsageError("no such task"); }));

    auto state = p.calculateExecutionTimeValue();
    ASSERT_TRUE(state.isBroken());
    ASSERT_EQ(state.getBrokenValue().message(), "no such task");
}

TEST(ScalarProperty, describe)
{
    ScalarProperty p(TypeRef::string);
    ASSERT_EQ(p.describe(), "property<String>(missing)");
}

TEST(ListProperty, checksElements)
{
    ListProperty p(TypeRef::string);

    p.set(ValueList{{"a", "b"}});
    ASSERT_EQ(p.get(), Value(ValueList{{"a", "b"}}));

    ASSERT_THROW(p.set(ValueList{{"a", int64_t{1}}}), PropertyTypeError);
    ASSERT_THROW(p.set("a"), PropertyTypeError);
}

TEST(SetProperty, checksElements)
{
    SetProperty p(TypeRef::integer);

    ValueSet set;
    set.insert(int64_t{1});
    set.insert(int64_t{2});
    p.set(set);
    ASSERT_EQ(p.get(), Value(set));

    ASSERT_THROW(p.set(ValueList{{int64_t{1}}}), PropertyTypeError);
}

TEST(MapProperty, checksKeysAndValues)
{
    MapProperty p(TypeRef::string, TypeRef::boolean);

    ValueMap good;
    good.put("enabled", true);
    p.set(good);
    ASSERT_EQ(p.getKeyType(), TypeRef::string);
    ASSERT_EQ(p.getValueType(), TypeRef::boolean);

    ValueMap badKey;
    badKey.put(int64_t{1}, true);
    ASSERT_THROW(p.set(badKey), PropertyTypeError);

    ValueMap badValue;
    badValue.put("enabled", "yes");
    ASSERT_THROW(p.set(badValue), PropertyTypeError);
}

TEST(DirectoryProperty, acceptsDirectoriesOnly)
{
    DirectoryProperty dir;
    dir.set(DirectoryPath{"/build/out"});
    ASSERT_EQ(dir.get(), Value(DirectoryPath{"/build/out"}));
    ASSERT_THROW(dir.set(RegularFilePath{"/build/out"}), PropertyTypeError);

    RegularFileProperty file;
    file.set(RegularFilePath{"/build/out.txt"});
    ASSERT_THROW(file.set(DirectoryPath{"/build"}), PropertyTypeError);
}

/* ----------------------------------------------------------------------------
 * fromState
 * --------------------------------------------------------------------------*/

TEST(Property, fromFixedState)
{
    ListProperty p(TypeRef::string);
    p.fromState(ExecutionTimeValue::fixedValue(ValueList{{"x"}}));
    ASSERT_EQ(p.get(), Value(ValueList{{"x"}}));
}

TEST(Property, fromMissingState)
{
    ListProperty p(TypeRef::string);
    p.set(ValueList{{"x"}});
    p.fromState(ExecutionTimeValue::missing());
    ASSERT_FALSE(p.isPresent());
}

TEST(Property, fromChangingState)
{
    ScalarProperty p(TypeRef::string);
    auto greeting = make_ref<GreetingProvider>("cache");
    p.fromState(ExecutionTimeValue::changingValue(greeting));
    ASSERT_EQ(&*p.getProvider(), &*greeting);
}

TEST(Property, fromBrokenState)
{
    ScalarProperty p(TypeRef::string);
    p.fromState(ExecutionTimeValue::broken(BrokenValue(std::make_exception_ptr(UsageError("gone")))));

    ASSERT_THROW(p.getOrNull(), UsageError);
    ASSERT_TRUE(p.calculateExecutionTimeValue().isBroken());
}

TEST(Property, fromStateChecksFixedValues)
{
    ListProperty p(TypeRef::integer);
    ASSERT_THROW(p.fromState(ExecutionTimeValue::fixedValue(ValueList{{"x"}})), PropertyTypeError);
}

/* ----------------------------------------------------------------------------
 * factories
 * --------------------------------------------------------------------------*/

TEST(PropertyFactory, createsEmptyProperties)
{
    PropertyFactory factory;

    auto scalar = factory.property(TypeRef::integer);
    ASSERT_EQ(scalar->getType(), TypeRef::integer);
    ASSERT_FALSE(scalar->isPresent());

    auto map = factory.mapProperty(TypeRef::string, TypeRef::integer);
    ASSERT_EQ(map->getKeyType(), TypeRef::string);
    ASSERT_EQ(map->getValueType(), TypeRef::integer);

    FilePropertyFactory files;
    ASSERT_FALSE(files.newDirectoryProperty()->isPresent());
    ASSERT_FALSE(files.newFileProperty()->isPresent());
}

} // namespace confcache
