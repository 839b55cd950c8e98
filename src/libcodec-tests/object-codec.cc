#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "confcache/codec/tests/codec-fixture.hh"
#include "confcache/provider/tests/value.hh"

namespace confcache {

class ObjectCodecTest : public CodecTest
{
protected:

    std::string write(const Value & v)
    {
        return encode([&](WriteContext & ctx) { ctx.write(v); });
    }

    Value read(const std::string & bytes)
    {
        return decode(bytes, [&](ReadContext & ctx) { return ctx.read(); });
    }
};

TEST_F(ObjectCodecTest, scalarLayouts)
{
    ASSERT_EQ(write(Null{}), std::string("\x00", 1));
    ASSERT_EQ(write(false), std::string("\x01", 1));
    ASSERT_EQ(write(true), std::string("\x02", 1));
    ASSERT_EQ(write(int64_t{-1}), std::string("\x03", 1) + std::string(8, '\xff'));
    ASSERT_EQ(write("ab"), std::string("\x05", 1) + encodedString("ab"));
    ASSERT_EQ(write(DirectoryPath{"/build"}), std::string("\x06", 1) + encodedString("/build"));
    ASSERT_EQ(write(RegularFilePath{"/build/a"}), std::string("\x07", 1) + encodedString("/build/a"));
}

TEST_F(ObjectCodecTest, floatsAreWrittenBitwise)
{
    auto bytes = write(1.0);
    ASSERT_EQ(bytes, std::string("\x04", 1) + encodedInt(0x3ff0000000000000));
    ASSERT_EQ(read(bytes), Value(1.0));
}

TEST_F(ObjectCodecTest, containerLayouts)
{
    ASSERT_EQ(
        write(ValueList{{"a", int64_t{1}}}),
        std::string("\x08", 1) + encodedInt(2) + std::string("\x05", 1) + encodedString("a") + std::string("\x03", 1)
            + encodedInt(1));

    ValueMap map;
    map.put("k", Null{});
    ASSERT_EQ(
        write(map), std::string("\x0a", 1) + encodedInt(1) + std::string("\x05", 1) + encodedString("k") + std::string("\x00", 1));
}

TEST_F(ObjectCodecTest, setKeepsInsertionOrder)
{
    ValueSet set;
    set.insert("b");
    set.insert("a");

    auto bytes = write(set);
    ASSERT_EQ(
        bytes,
        std::string("\x09", 1) + encodedInt(2) + std::string("\x05", 1) + encodedString("b") + std::string("\x05", 1)
            + encodedString("a"));

    auto v = read(bytes);
    ASSERT_EQ(std::get<ValueSet>(v.raw).elems[0], Value("b"));
}

TEST_F(ObjectCodecTest, duplicateSetElementsAreCorrupt)
{
    auto bytes = std::string("\x09", 1) + encodedInt(2) + std::string("\x02\x02", 2);
    ASSERT_THROW(read(bytes), CorruptCacheError);
}

TEST_F(ObjectCodecTest, duplicateMapKeysAreCorrupt)
{
    auto bytes = std::string("\x0a", 1) + encodedInt(2) + std::string("\x02\x00\x02\x01", 4);
    ASSERT_THROW(read(bytes), CorruptCacheError);
}

TEST_F(ObjectCodecTest, unknownTag)
{
    ASSERT_THROW(read(std::string("\x0b", 1)), CorruptCacheError);
}

RC_GTEST_PROP(ObjectCodec, roundTrip, (const Value & v))
{
    DefaultObjectCodec codec;

    StringSink sink;
    WriteContext writer(sink, codec);
    writer.write(v);

    StringSource source(sink.s);
    ReadContext reader(source, codec);
    RC_ASSERT(reader.read() == v);
    RC_ASSERT(source.atEnd());
}

} // namespace confcache
