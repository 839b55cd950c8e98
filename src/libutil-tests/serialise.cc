#include "confcache/util/serialise.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace confcache {

TEST(Serialise, integersAreLittleEndian)
{
    StringSink sink;
    sink << (uint64_t) 0x0102030405060708ULL;
    ASSERT_EQ(sink.s, std::string("\x08\x07\x06\x05\x04\x03\x02\x01", 8));
}

TEST(Serialise, stringsArePadded)
{
    StringSink sink;
    writeString("abc", sink);
    ASSERT_EQ(sink.s, std::string("\x03\0\0\0\0\0\0\0abc\0\0\0\0\0", 16));

    StringSink aligned;
    writeString("12345678", aligned);
    ASSERT_EQ(aligned.s.size(), 16u);
}

TEST(Serialise, singleBytesAreNotFramed)
{
    StringSink sink;
    writeByte(3, sink);
    writeByte(255, sink);
    ASSERT_EQ(sink.s, std::string("\x03\xff", 2));

    StringSource source(sink.s);
    ASSERT_EQ(readByte(source), 3);
    ASSERT_EQ(readByte(source), 255);
    ASSERT_TRUE(source.atEnd());
}

TEST(Serialise, readStringBack)
{
    StringSink sink;
    sink << "hello" << "";

    StringSource source(sink.s);
    ASSERT_EQ(readString(source), "hello");
    ASSERT_EQ(readString(source), "");
    ASSERT_TRUE(source.atEnd());
}

TEST(Serialise, readStringRespectsLimit)
{
    StringSink sink;
    sink << "a string that is too long";

    StringSource source(sink.s);
    ASSERT_THROW(readString(source, 4), SerialisationError);
}

TEST(Serialise, nonZeroPaddingIsRejected)
{
    auto bytes = std::string("\x01\0\0\0\0\0\0\0x\0\0\x01\0\0\0\0", 16);
    StringSource source(bytes);
    ASSERT_THROW(readString(source), SerialisationError);
}

TEST(Serialise, truncatedInputIsEndOfFile)
{
    auto bytes = std::string("\x05\0\0\0\0\0\0\0ab", 10);
    StringSource source(bytes);
    ASSERT_THROW(readString(source), EndOfFile);
}

TEST(Serialise, integerTooLargeForType)
{
    StringSink sink;
    sink << ((uint64_t) 1 << 40);

    StringSource source(sink.s);
    ASSERT_THROW(readInt(source), SerialisationError);
}

TEST(Serialise, errorRoundTrip)
{
    Error error("division by zero");
    error.addTrace("while evaluating '%s'", "quotient");

    StringSink sink;
    sink << error;

    StringSource source(sink.s);
    auto info = readErrorInfo(source);
    ASSERT_TRUE(source.atEnd());

    ASSERT_EQ(info.level, lvlError);
    ASSERT_EQ(info.msg.str(), "division by zero");
    ASSERT_EQ(info.traces.size(), 1u);
    ASSERT_EQ(info.traces.front().hint.str(), error.info().traces.front().hint.str());
    ASSERT_THAT(info.traces.front().hint.str(), testing::HasSubstr("quotient"));
}

TEST(Serialise, readErrorInfoRejectsOtherPayloads)
{
    StringSink sink;
    sink << "NotAnError";

    StringSource source(sink.s);
    ASSERT_THROW(readErrorInfo(source), SerialisationError);
}

TEST(Serialise, readErrorInfoLimitsStringSize)
{
    StringSink sink;
    sink << "Error" << lvlError << "Error" << ((uint64_t) 1 << 60);

    StringSource source(sink.s);
    ASSERT_THROW(readErrorInfo(source, 1024), SerialisationError);
}

} // namespace confcache
