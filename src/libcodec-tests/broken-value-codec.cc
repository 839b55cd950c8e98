#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

#include "confcache/codec/tests/codec-fixture.hh"
#include "confcache/codec/broken-value-codec.hh"

namespace confcache {

using testing::HasSubstr;

class BrokenValueCodecTest : public CodecTest
{
protected:

    BrokenValue roundTrip(std::exception_ptr failure)
    {
        auto bytes = encode([&](WriteContext & ctx) { writeBrokenValue(ctx, BrokenValue(failure)); });
        return decode(bytes, [](ReadContext & ctx) { return readBrokenValue(ctx); });
    }
};

TEST_F(BrokenValueCodecTest, layout)
{
    auto bytes = encode(
        [](WriteContext & ctx) { writeBrokenValue(ctx, BrokenValue(std::make_exception_ptr(UsageError("bad")))); });

    ASSERT_EQ(
        bytes,
        encodedString("confcache::UsageError") + encodedString("Error") + encodedInt(lvlError) + encodedString("Error")
            + encodedString("bad") + encodedInt(0) + encodedInt(0));
}

TEST_F(BrokenValueCodecTest, keepsTheErrorType)
{
    UsageError e("option '%s' is not set", "name");
    e.addTrace("while computing the value of '%s'", "greeting");

    auto value = roundTrip(std::make_exception_ptr(e));

    try {
        value.rethrow();
        FAIL() << "expected a UsageError";
    } catch (UsageError & e2) {
        ASSERT_EQ(e2.msg(), e.msg());
        ASSERT_EQ(e2.info().traces.size(), 1u);
        ASSERT_THAT(e2.info().traces.front().hint.str(), HasSubstr("greeting"));
    }
}

TEST_F(BrokenValueCodecTest, standardExceptions)
{
    auto value = roundTrip(std::make_exception_ptr(std::out_of_range("index 3")));

    try {
        value.rethrow();
        FAIL() << "expected std::out_of_range";
    } catch (std::out_of_range & e) {
        ASSERT_STREQ(e.what(), "index 3");
    }
}

TEST_F(BrokenValueCodecTest, sysErrorIsRebuiltAsSystemError)
{
    auto value = roundTrip(std::make_exception_ptr(SysError(ENOENT, "opening '%s'", "/nonexistent")));

    ASSERT_THROW(value.rethrow(), SystemError);
    ASSERT_THAT(value.message(), HasSubstr("/nonexistent"));
}

TEST_F(BrokenValueCodecTest, unknownKindIsAPlainError)
{
    auto bytes = encodedString("some::OtherError") + encodedString("Error") + encodedInt(lvlError)
                 + encodedString("Error") + encodedString("gone") + encodedInt(0) + encodedInt(0);

    auto value = decode(bytes, [](ReadContext & ctx) { return readBrokenValue(ctx); });

    ASSERT_THROW(value.rethrow(), Error);
    ASSERT_EQ(value.message(), "gone");
}

TEST_F(BrokenValueCodecTest, corruptPayload)
{
    auto bytes = encodedString("confcache::Error") + encodedString("Warning");

    ASSERT_THROW(
        decode(bytes, [](ReadContext & ctx) { return readBrokenValue(ctx); }), CorruptCacheError);
}

TEST_F(BrokenValueCodecTest, oversizedMessageIsCorrupt)
{
    auto bytes = encodedString("confcache::Error") + encodedString("Error") + encodedInt(lvlError)
                 + encodedString("Error") + encodedInt((int64_t) 1 << 60);

    ASSERT_THROW(
        decode(bytes, [](ReadContext & ctx) { return readBrokenValue(ctx); }), CorruptCacheError);
}

} // namespace confcache
