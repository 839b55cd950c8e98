#include <gtest/gtest.h>

#include "confcache/codec/tests/codec-fixture.hh"

namespace confcache {

class PropertyCodecTest : public CodecTest
{
protected:

    std::string write(const Property & property)
    {
        return encode([&](WriteContext & ctx) { codecs.writeProperty(ctx, property); });
    }

    ref<Property> read(const std::string & bytes)
    {
        return decode(bytes, [&](ReadContext & ctx) { return codecs.readProperty(ctx); });
    }

    template<typename T>
    ref<T> readAs(const std::string & bytes)
    {
        auto p = read(bytes).dynamic_pointer_cast<T>();
        if (!p)
            throw Error("property was read back with the wrong kind");
        return ref<T>(p);
    }
};

/**
 * Counts the properties it creates.
 */
class CountingPropertyFactory : public PropertyFactory
{
public:
    mutable size_t created = 0;

    ref<ListProperty> listProperty(const TypeRef & elementType) const override
    {
        created++;
        return PropertyFactory::listProperty(elementType);
    }
};

TEST_F(PropertyCodecTest, scalarLayout)
{
    ScalarProperty p(TypeRef::integer);
    p.set(int64_t{42});

    auto bytes = write(p);
    ASSERT_EQ(bytes, std::string("\x00", 1) + encodedString("Integer") + std::string("\x02\x03", 2) + encodedInt(42));

    auto q = readAs<ScalarProperty>(bytes);
    ASSERT_EQ(q->getType(), TypeRef::integer);
    ASSERT_EQ(q->get(), Value(int64_t{42}));
}

TEST_F(PropertyCodecTest, scalarKeepsChangingProvider)
{
    ScalarProperty p(TypeRef::string);
    p.set(make_ref<GreetingProvider>("world"));

    auto q = readAs<ScalarProperty>(write(p));
    ASSERT_TRUE(q->calculateExecutionTimeValue().isChangingValue());
    ASSERT_EQ(q->get(), Value("hello, world"));
}

TEST_F(PropertyCodecTest, scalarWithFailingProviderIsAProblem)
{
    ScalarProperty p(TypeRef::string);
    p.set(make_ref<DefaultProvider>([]() -> Value { throw UsageError("task output is not ready"); }));

    auto q = readAs<ScalarProperty>(write(p));
    ASSERT_EQ(problems.size(), 1u);
    ASSERT_EQ(problems[0].message, "task output is not ready");
    ASSERT_THROW(q->get(), UsageError);
}

TEST_F(PropertyCodecTest, listOfStrings)
{
    ListProperty p(TypeRef::string);
    p.set(ValueList{{"a", "b", "c"}});

    auto bytes = write(p);
    ASSERT_EQ(
        bytes,
        std::string("\x01", 1) + encodedString("String") + std::string("\x02\x08", 2) + encodedInt(3)
            + std::string("\x05", 1) + encodedString("a") + std::string("\x05", 1) + encodedString("b")
            + std::string("\x05", 1) + encodedString("c"));

    auto q = readAs<ListProperty>(bytes);
    ASSERT_EQ(q->getElementType(), TypeRef::string);
    ASSERT_EQ(q->get(), Value(ValueList{{"a", "b", "c"}}));
}

TEST_F(PropertyCodecTest, missingList)
{
    ListProperty p(TypeRef::string);

    auto bytes = write(p);
    ASSERT_EQ(bytes, std::string("\x01", 1) + encodedString("String") + std::string("\x01", 1));
    ASSERT_FALSE(readAs<ListProperty>(bytes)->isPresent());
}

TEST_F(PropertyCodecTest, brokenListIsNotAProblem)
{
    ListProperty p(TypeRef::string);
    p.set(make_ref<FixedProvider>(ValueList{{int64_t{1}}}));

    auto bytes = write(p);
    ASSERT_TRUE(problems.empty());

    auto q = readAs<ListProperty>(bytes);
    ASSERT_THROW(q->get(), PropertyTypeError);
}

TEST_F(PropertyCodecTest, setOfIntegers)
{
    ValueSet set;
    set.insert(int64_t{3});
    set.insert(int64_t{1});

    SetProperty p(TypeRef::integer);
    p.set(set);

    auto q = readAs<SetProperty>(write(p));
    ASSERT_EQ(q->getElementType(), TypeRef::integer);
    ASSERT_EQ(q->get(), Value(set));
}

TEST_F(PropertyCodecTest, mapWritesBothTypes)
{
    ValueMap map;
    map.put("debug", true);

    MapProperty p(TypeRef::string, TypeRef::boolean);
    p.set(map);

    auto bytes = write(p);
    ASSERT_EQ(
        bytes.substr(0, 1 + 2 * 16), std::string("\x03", 1) + encodedString("String") + encodedString("Boolean"));

    auto q = readAs<MapProperty>(bytes);
    ASSERT_EQ(q->getKeyType(), TypeRef::string);
    ASSERT_EQ(q->getValueType(), TypeRef::boolean);
    ASSERT_EQ(q->get(), Value(map));
}

TEST_F(PropertyCodecTest, directoryAndFile)
{
    DirectoryProperty dir;
    dir.set(DirectoryPath{"/build/classes"});

    auto dirBytes = write(dir);
    ASSERT_EQ(
        dirBytes,
        std::string("\x04", 1) + encodedString("Directory") + std::string("\x02\x06", 2)
            + encodedString("/build/classes"));
    ASSERT_EQ(readAs<DirectoryProperty>(dirBytes)->get(), Value(DirectoryPath{"/build/classes"}));

    RegularFileProperty file;
    file.set(RegularFilePath{"/build/app.jar"});

    auto fileBytes = write(file);
    ASSERT_EQ(fileBytes[0], '\x05');
    ASSERT_EQ(readAs<RegularFileProperty>(fileBytes)->get(), Value(RegularFilePath{"/build/app.jar"}));
}

TEST_F(PropertyCodecTest, directoryWithWrongClassIsCorrupt)
{
    auto bytes = std::string("\x04", 1) + encodedString("RegularFile") + std::string("\x01", 1);
    ASSERT_THROW(read(bytes), CorruptCacheError);
}

TEST_F(PropertyCodecTest, unknownKind)
{
    ASSERT_THROW(read(std::string("\x06", 1)), CorruptCacheError);
}

TEST_F(PropertyCodecTest, decodeErrorsCarryTheProperty)
{
    auto bytes = std::string("\x01", 1) + encodedString("String") + std::string("\x07", 1);
    try {
        read(bytes);
        FAIL() << "decoding a corrupt list property did not fail";
    } catch (CorruptCacheError & e) {
        ASSERT_TRUE(e.hasTrace());
        ASSERT_NE(e.info().traces.front().hint.str().find("list property"), std::string::npos);
    }
}

TEST_F(PropertyCodecTest, factoryCreatesTheProperties)
{
    CountingPropertyFactory counting;
    Codecs countingCodecs{valueSources, services, counting, filePropertyFactory};

    ListProperty p(TypeRef::string);
    p.set(ValueList{{"a"}});

    auto bytes = encode([&](WriteContext & ctx) { countingCodecs.writeProperty(ctx, p); });
    decode(bytes, [&](ReadContext & ctx) { return countingCodecs.readProperty(ctx); });
    ASSERT_EQ(counting.created, 1u);
}

TEST_F(PropertyCodecTest, propertiesShareIdentityOfTheirProviders)
{
    auto source = valueSources.createProvider(EchoValueSource::type, "input");
    ScalarProperty a(TypeRef::string);
    ScalarProperty b(TypeRef::string);
    a.set(source);
    b.set(source);

    auto bytes = encode([&](WriteContext & ctx) {
        codecs.writeProperty(ctx, a);
        codecs.writeProperty(ctx, b);
    });

    auto [first, second] = decode(bytes, [&](ReadContext & ctx) {
        auto p = codecs.readProperty(ctx).cast<ScalarProperty>();
        auto q = codecs.readProperty(ctx).cast<ScalarProperty>();
        return std::make_pair(p, q);
    });
    ASSERT_EQ(&*first->getProvider(), &*second->getProvider());
}

} // namespace confcache
