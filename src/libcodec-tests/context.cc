#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include "confcache/codec/tests/codec-fixture.hh"
#include "confcache/codec/codec-settings.hh"

namespace confcache {

using testing::HasSubstr;

class ContextTest : public CodecTest
{
protected:

    void logProblem(WriteContext & ctx, const std::string & description)
    {
        ctx.logPropertyProblem("serialize", BrokenValue(std::make_exception_ptr(UsageError("boom"))), description);
    }
};

/* ----------------------------------------------------------------------------
 * primitives
 * --------------------------------------------------------------------------*/

TEST_F(ContextTest, integersAreEightBytes)
{
    auto bytes = encode([](WriteContext & ctx) {
        ctx.writeInt(-2);
        ctx.writeSmallInt(7);
        ctx.writeBoolean(true);
        ctx.writeClass(TypeRef::list);
    });
    ASSERT_EQ(bytes, encodedInt(-2) + encodedInt(7) + std::string("\x01", 1) + encodedString("List"));

    decode(bytes, [](ReadContext & ctx) {
        EXPECT_EQ(ctx.readInt(), -2);
        EXPECT_EQ(ctx.readSmallInt(), 7u);
        EXPECT_TRUE(ctx.readBoolean());
        EXPECT_EQ(ctx.readClass(), TypeRef::list);
        return 0;
    });
}

TEST_F(ContextTest, invalidBoolean)
{
    std::string bytes("\x02", 1);
    ASSERT_THROW(decode(bytes, [](ReadContext & ctx) { return ctx.readBoolean(); }), CorruptCacheError);
}

TEST_F(ContextTest, stringSizeIsLimited)
{
    codecSettings.maxStringSize = 4;
    auto bytes = encodedString("longer than four bytes");
    ASSERT_THROW(decode(bytes, [](ReadContext & ctx) { return ctx.readString(); }), CorruptCacheError);
}

TEST_F(ContextTest, nonZeroPaddingIsCorrupt)
{
    auto bytes = encodedInt(1) + std::string("a\x01\0\0\0\0\0\0", 8);
    ASSERT_THROW(decode(bytes, [](ReadContext & ctx) { return ctx.readString(); }), CorruptCacheError);
}

/* ----------------------------------------------------------------------------
 * shared identity
 * --------------------------------------------------------------------------*/

TEST(IdentityWriteTable, assignsIdsInOrder)
{
    IdentityWriteTable table;
    auto a = std::make_shared<int>(1);
    auto b = std::make_shared<int>(2);

    ASSERT_EQ(table.assign(a.get(), a), 0u);
    ASSERT_EQ(table.assign(b.get(), b), 1u);
    ASSERT_EQ(table.find(a.get()), 0u);
    ASSERT_EQ(table.find(b.get()), 1u);
    ASSERT_FALSE(table.find(&table).has_value());
    ASSERT_THROW(table.assign(a.get(), a), Error);
    ASSERT_EQ(table.size(), 2u);
}

TEST(IdentityReadTable, slotsAreTyped)
{
    IdentityReadTable table;
    auto id = table.reserve(typeid(int));

    ASSERT_THROW(table.get(id, typeid(int)), CorruptCacheError);

    table.fill(id, std::make_shared<int>(3));
    ASSERT_EQ(*std::static_pointer_cast<const int>(table.get(id, typeid(int))), 3);
    ASSERT_THROW(table.get(id, typeid(double)), CorruptCacheError);
    ASSERT_THROW(table.get(id + 1, typeid(int)), CorruptCacheError);
    ASSERT_THROW(table.fill(id, std::make_shared<int>(4)), Error);
}

/* ----------------------------------------------------------------------------
 * problems
 * --------------------------------------------------------------------------*/

TEST_F(ContextTest, problemsAreRecorded)
{
    encode([&](WriteContext & ctx) { logProblem(ctx, "value of 'compilerArgs'"); });

    ASSERT_EQ(problems.size(), 1u);
    ASSERT_EQ(
        problems[0],
        (PropertyProblem{
            .action = "serialize",
            .description = "value of 'compilerArgs'",
            .message = "boom",
        }));
}

TEST_F(ContextTest, tooManyProblems)
{
    codecSettings.maxProblems = 2;

    ASSERT_THROW(
        encode([&](WriteContext & ctx) {
            for (int i = 0; i < 3; ++i)
                logProblem(ctx, "value " + std::to_string(i));
        }),
        TooManyProblemsError);
}

TEST_F(ContextTest, failOnProblems)
{
    codecSettings.failOnProblems = true;

    ASSERT_THROW(encode([&](WriteContext & ctx) { logProblem(ctx, "value"); }), Error);
    ASSERT_NO_THROW(encode([](WriteContext &) {}));
}

TEST_F(ContextTest, settingsAreConfigurable)
{
    ASSERT_TRUE(codecSettings.set("max-problems", "1"));
    ASSERT_EQ(codecSettings.maxProblems.get(), 1u);

    codecSettings.applyConfig("report-broken-values = false\n");
    ASSERT_FALSE(codecSettings.reportBrokenValues.get());

    encode([&](WriteContext & ctx) {
        logProblem(ctx, "a");
        logProblem(ctx, "b");
    });
    ASSERT_TRUE(problems.empty());
}

TEST(problemsToJSON, report)
{
    std::vector<PropertyProblem> problems{
        {.action = "serialize", .description = "value of 'a'", .message = "boom"},
    };

    ASSERT_EQ(
        problemsToJSON(problems).dump(),
        R"({"problems":[{"action":"serialize","description":"value of 'a'","message":"boom"}],"totalProblemCount":1})");
    ASSERT_EQ(problemsToJSON({}).dump(), R"({"problems":[],"totalProblemCount":0})");
}

} // namespace confcache
