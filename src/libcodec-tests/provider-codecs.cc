#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <rapidcheck/gtest.h>

#include <tuple>

#include "confcache/codec/tests/codec-fixture.hh"
#include "confcache/codec/broken-value-codec.hh"
#include "confcache/codec/codec-settings.hh"
#include "confcache/provider/tests/value.hh"

namespace confcache {

using testing::HasSubstr;

MakeError(ArithmeticError, Error);

static RegisterErrorKind<ArithmeticError> rArithmeticError;

/**
 * Not registered as an error kind.
 */
MakeError(LocalError, Error);

static RegisterTransform rShout("shout", [](const Value & v) { return Value(std::get<std::string>(v.raw) + "!"); });

class ProviderCodecTest : public CodecTest
{
protected:

    std::string write(const Provider & provider)
    {
        return encode([&](WriteContext & ctx) { codecs.writeProvider(ctx, provider); });
    }

    ref<const Provider> read(const std::string & bytes)
    {
        return decode(bytes, [&](ReadContext & ctx) { return codecs.readProvider(ctx); });
    }
};

/* ----------------------------------------------------------------------------
 * fixed and missing values
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, missingIsASingleTag)
{
    auto bytes = write(MissingProvider());
    ASSERT_EQ(bytes, std::string("\x01", 1));

    ASSERT_FALSE(read(bytes)->isPresent());
}

TEST_F(ProviderCodecTest, constantIsWrittenAsFixedValue)
{
    auto bytes = write(DefaultProvider([]() { return Value(int64_t{42}); }));
    // Fixed state tag, then the object codec's Integer tag.
    ASSERT_EQ(bytes, std::string("\x02\x03", 2) + encodedInt(42));

    auto p = read(bytes);
    ASSERT_EQ(p->get(), Value(int64_t{42}));
    ASSERT_TRUE(p->calculateExecutionTimeValue().isFixedValue());
}

TEST_F(ProviderCodecTest, eagerProviderIsWrittenAsItsValue)
{
    int calls = 0;
    DefaultProvider provider([&]() {
        calls++;
        return Value("computed");
    });

    auto bytes = write(provider);
    ASSERT_EQ(calls, 1);
    ASSERT_EQ(bytes, std::string("\x02\x05", 2) + encodedString("computed"));
}

TEST_F(ProviderCodecTest, fixedNullIsReadAsMissing)
{
    std::string bytes("\x02\x00", 2);
    ASSERT_FALSE(read(bytes)->isPresent());
}

TEST_F(ProviderCodecTest, mappedFixedIsWrittenAsItsValue)
{
    auto p = make_ref<FixedProvider>("world")->map([](const Value & v) {
        return Value("hello, " + std::get<std::string>(v.raw));
    });

    auto bytes = write(*p);
    ASSERT_EQ(bytes, std::string("\x02\x05", 2) + encodedString("hello, world"));
}

/* ----------------------------------------------------------------------------
 * broken values
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, brokenValueIsStoredAndReplayed)
{
    DefaultProvider provider([]() -> Value { throw ArithmeticError("div by zero"); });

    auto bytes = write(provider);
    ASSERT_EQ(bytes[0], '\x00');

    ASSERT_EQ(problems.size(), 1u);
    ASSERT_EQ(problems[0].action, "serialize");
    ASSERT_THAT(problems[0].description, HasSubstr("failed to unpack provider"));
    ASSERT_EQ(problems[0].message, "div by zero");

    auto p = read(bytes);
    try {
        p->getOrNull();
        FAIL() << "reading the broken value did not fail";
    } catch (ArithmeticError & e) {
        ASSERT_EQ(e.message(), "div by zero");
    }
}

TEST_F(ProviderCodecTest, brokenValueOfUnknownKindIsReplayedAsError)
{
    DefaultProvider provider([]() -> Value { throw LocalError("lost"); });

    auto p = read(write(provider));
    try {
        p->getOrNull();
        FAIL() << "reading the broken value did not fail";
    } catch (LocalError &) {
        FAIL() << "unregistered error kinds cannot be rebuilt";
    } catch (Error & e) {
        ASSERT_EQ(e.message(), "lost");
    }
}

TEST_F(ProviderCodecTest, brokenValueWithoutReport)
{
    codecSettings.reportBrokenValues = false;
    DefaultProvider provider([]() -> Value { throw ArithmeticError("div by zero"); });

    auto bytes = write(provider);
    ASSERT_EQ(bytes[0], '\x00');
    ASSERT_TRUE(problems.empty());
}

/* ----------------------------------------------------------------------------
 * value sources
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, valueSourceLayout)
{
    auto p = valueSources.createProvider(EchoValueSource::type, "input");

    auto bytes = write(*p);
    ASSERT_EQ(
        bytes,
        std::string("\x03\x00\x01", 3) + encodedInt(0) + encodedString("org.example.EchoValueSource")
            + encodedString("org.example.EchoValueSource.Parameters") + std::string("\x05", 1)
            + encodedString("input"));
    ASSERT_EQ(valueSources.echo->obtained, 0u);

    auto before = valueSources.instantiated;
    auto q = read(bytes);
    ASSERT_EQ(valueSources.instantiated, before + 1);
    ASSERT_TRUE(q->calculateExecutionTimeValue().isChangingValue());
    ASSERT_EQ(q->get(), Value("input"));
}

TEST_F(ProviderCodecTest, obtainedValueSourceIsWrittenAsItsValue)
{
    auto p = valueSources.createProvider(EchoValueSource::type, "input");
    p->get();

    auto bytes = write(*p);
    ASSERT_EQ(bytes, std::string("\x02\x05", 2) + encodedString("input"));
}

TEST_F(ProviderCodecTest, obtainedValueSourceCannotBeWrittenAsChanging)
{
    auto p = valueSources.createProvider(EchoValueSource::type, "input");
    p->get();

    ASSERT_THROW(
        encode([&](WriteContext & ctx) {
            codecs.providers().encodeValue(ctx, ExecutionTimeValue::changingValue(p));
        }),
        BuildLogicInputError);
}

TEST_F(ProviderCodecTest, valueSourceSharesIdentity)
{
    auto p = valueSources.createProvider(EchoValueSource::type, "input");

    auto bytes = encode([&](WriteContext & ctx) {
        codecs.writeProvider(ctx, *p);
        codecs.writeProvider(ctx, *p);
    });

    auto [a, b] = decode(bytes, [&](ReadContext & ctx) {
        auto first = codecs.readProvider(ctx);
        auto second = codecs.readProvider(ctx);
        return std::make_pair(first, second);
    });
    ASSERT_EQ(&*a, &*b);

    a->get();
    ASSERT_EQ(valueSources.echo->obtained, 1u);
    b->get();
    ASSERT_EQ(valueSources.echo->obtained, 1u);
}

/* ----------------------------------------------------------------------------
 * mapped providers
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, mappedValueSourceLayout)
{
    auto source = valueSources.createProvider(EchoValueSource::type, "input");
    auto p = source->map("shout");

    auto bytes = write(*p);
    ASSERT_EQ(
        bytes,
        std::string("\x03\x03", 2) + encodedInt(0) + encodedString("shout") + std::string("\x03\x00\x01", 3)
            + encodedInt(1) + encodedString("org.example.EchoValueSource")
            + encodedString("org.example.EchoValueSource.Parameters") + std::string("\x05", 1)
            + encodedString("input"));
    ASSERT_EQ(valueSources.echo->obtained, 0u);

    auto q = read(bytes);
    ASSERT_TRUE(q->calculateExecutionTimeValue().isChangingValue());
    ASSERT_EQ(q->get(), Value("input!"));
}

TEST_F(ProviderCodecTest, mappedProviderSharesItsSource)
{
    auto source = valueSources.createProvider(EchoValueSource::type, "input");
    auto p = source->map("shout");

    auto bytes = encode([&](WriteContext & ctx) {
        codecs.writeProvider(ctx, *source);
        codecs.writeProvider(ctx, *p);
        codecs.writeProvider(ctx, *p);
    });

    auto [s, a, b] = decode(bytes, [&](ReadContext & ctx) {
        auto plain = codecs.readProvider(ctx);
        auto first = codecs.readProvider(ctx);
        auto second = codecs.readProvider(ctx);
        return std::make_tuple(plain, first, second);
    });
    ASSERT_EQ(&*a, &*b);
    ASSERT_EQ(&*a.cast<const MappedProvider>()->getSource(), &*s);

    ASSERT_EQ(a->get(), Value("input!"));
    ASSERT_EQ(s->get(), Value("input"));
    ASSERT_EQ(valueSources.echo->obtained, 1u);
}

TEST_F(ProviderCodecTest, anonymousMapOfChangingValueIsUnsupported)
{
    auto source = valueSources.createProvider(EchoValueSource::type, "input");
    auto p = source->map([](const Value & v) { return v; });

    ASSERT_THROW(write(*p), UnsupportedValueError);
}

TEST_F(ProviderCodecTest, unknownTransform)
{
    auto bytes = std::string("\x03\x03", 2) + encodedInt(0) + encodedString("org.example.unknown")
                 + std::string("\x01", 1);
    ASSERT_THROW(read(bytes), UnknownTypeError);
}

/* ----------------------------------------------------------------------------
 * build services
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, buildServiceLayout)
{
    auto p = services.registerService("cache", TestBuildService::type, Null{}, 4);

    auto bytes = write(*p);
    ASSERT_EQ(
        bytes,
        std::string("\x03\x01", 2) + encodedInt(0) + encodedString("cache")
            + encodedString("org.example.TestBuildService") + std::string("\x00", 1) + encodedInt(4));
}

TEST_F(ProviderCodecTest, buildServiceIsRegisteredOnce)
{
    auto p = services.registerService("cache", TestBuildService::type, "params", -1);

    auto bytes = encode([&](WriteContext & ctx) {
        codecs.writeProvider(ctx, *p);
        codecs.writeProvider(ctx, *p);
    });
    ASSERT_EQ(bytes.substr(bytes.size() - 10), std::string("\x03\x01", 2) + encodedInt(0));

    TestBuildServiceRegistry fresh;
    Codecs freshCodecs{valueSources, fresh, propertyFactory, filePropertyFactory};

    auto [a, b] = decode(bytes, [&](ReadContext & ctx) {
        auto first = freshCodecs.readProvider(ctx);
        auto second = freshCodecs.readProvider(ctx);
        return std::make_pair(first, second);
    });

    ASSERT_EQ(fresh.registrations, 1u);
    ASSERT_EQ(&*a, &*b);
    ASSERT_EQ(a->get(), b->get());
    ASSERT_EQ(fresh.servicesCreated, 1u);

    auto registered = fresh.lookup("cache");
    ASSERT_NE(registered, nullptr);
    ASSERT_EQ(fresh.usageLimitOf(*registered), -1);
}

TEST_F(ProviderCodecTest, buildServiceWithInvalidUsageLimit)
{
    auto bytes = std::string("\x03\x01", 2) + encodedInt(0) + encodedString("cache")
                 + encodedString("org.example.TestBuildService") + std::string("\x00", 1) + encodedInt(-5);
    ASSERT_THROW(read(bytes), CorruptCacheError);
}

/* ----------------------------------------------------------------------------
 * objects
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, serialisableProviderLayout)
{
    auto p = make_ref<GreetingProvider>("world");

    auto bytes = write(*p);
    ASSERT_EQ(
        bytes,
        std::string("\x03\x02", 2) + encodedInt(0) + encodedString("org.example.Greeting") + std::string("\x05", 1)
            + encodedString("world"));

    auto q = read(bytes);
    ASSERT_EQ(q->get(), Value("hello, world"));
}

TEST_F(ProviderCodecTest, unownedProviderIsNotRecordedAsBroken)
{
    GreetingProvider p("world");
    ASSERT_THROW(write(p), std::bad_weak_ptr);
}

TEST_F(ProviderCodecTest, identityIsPreservedStructureIsNot)
{
    auto shared = make_ref<GreetingProvider>("world");
    auto twin = make_ref<GreetingProvider>("world");

    auto bytes = encode([&](WriteContext & ctx) {
        codecs.writeProvider(ctx, *shared);
        codecs.writeProvider(ctx, *twin);
        codecs.writeProvider(ctx, *shared);
    });

    auto [a, b, c] = decode(bytes, [&](ReadContext & ctx) {
        auto first = codecs.readProvider(ctx);
        auto second = codecs.readProvider(ctx);
        auto third = codecs.readProvider(ctx);
        return std::make_tuple(first, second, third);
    });

    ASSERT_EQ(&*a, &*c);
    ASSERT_NE(&*a, &*b);
    ASSERT_EQ(a->get(), b->get());
}

TEST_F(ProviderCodecTest, providerWithoutReaderIsUnsupported)
{
    DefaultObjectCodec bare;
    StringSink sink;
    WriteContext ctx(sink, bare);

    auto p = make_ref<GreetingProvider>("world");
    ASSERT_THROW(codecs.writeProvider(ctx, *p), UnsupportedValueError);
}

TEST_F(ProviderCodecTest, unknownChangingProviderIsUnsupported)
{
    auto p = make_ref<OpaqueChangingProvider>();
    ASSERT_THROW(write(*p), UnsupportedValueError);
}

TEST_F(ProviderCodecTest, handlesAreUnsupported)
{
    FixedProvider p(Handle{std::make_shared<int>(0), "a live object"});
    ASSERT_THROW(write(p), UnsupportedValueError);
}

/* ----------------------------------------------------------------------------
 * dispatch
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, bindingsOrder)
{
    auto & bindings = codecs.providers().changingValueCodec();
    ASSERT_EQ(bindings.size(), 4u);

    StringSink sink;
    WriteContext ctx(sink, objectCodec);

    auto source = valueSources.createProvider(EchoValueSource::type, "input");
    auto service = services.registerService("cache", TestBuildService::type, Null{}, -1);
    auto greeting = make_ref<GreetingProvider>("world");
    auto mapped = source->map("shout");

    ASSERT_EQ(bindings.indexOf(ctx, *source), 0);
    ASSERT_EQ(bindings.indexOf(ctx, *service), 1);
    ASSERT_EQ(bindings.indexOf(ctx, *greeting), 2);
    ASSERT_EQ(bindings.indexOf(ctx, *mapped), 3);
    ASSERT_THROW(bindings.indexOf(ctx, OpaqueChangingProvider()), UnsupportedValueError);
}

RC_GTEST_FIXTURE_PROP(ProviderCodecTest, fixedValuesAreStable, (const Value & v))
{
    auto bytes = write(FixedProvider(v));
    RC_ASSERT(bytes == write(FixedProvider(v)));

    auto p = read(bytes);
    if (v.isNull())
        RC_ASSERT(!p->isPresent());
    else
        RC_ASSERT(p->get() == v);
}

/* ----------------------------------------------------------------------------
 * corrupt streams
 * --------------------------------------------------------------------------*/

TEST_F(ProviderCodecTest, unknownTag)
{
    ASSERT_THROW(read(std::string("\x07", 1)), CorruptCacheError);
}

TEST_F(ProviderCodecTest, unknownCodecIndex)
{
    ASSERT_THROW(read(std::string("\x03\x09", 2)), CorruptCacheError);
}

TEST_F(ProviderCodecTest, invalidBoolean)
{
    ASSERT_THROW(read(std::string("\x03\x00\x02", 3)), CorruptCacheError);
    ASSERT_THROW(read(std::string("\x03\x00\x00", 3)), CorruptCacheError);
}

TEST_F(ProviderCodecTest, sharedIdentityOutOfOrder)
{
    ASSERT_THROW(read(std::string("\x03\x02", 2) + encodedInt(3)), CorruptCacheError);
}

TEST_F(ProviderCodecTest, unknownObjectType)
{
    auto bytes = std::string("\x03\x02", 2) + encodedInt(0) + encodedString("org.example.Unknown")
                 + std::string("\x00", 1);
    ASSERT_THROW(read(bytes), UnknownTypeError);
}

TEST_F(ProviderCodecTest, truncatedStream)
{
    auto bytes = write(FixedProvider("a string"));
    bytes.resize(bytes.size() - 3);
    ASSERT_THROW(read(bytes), EndOfFile);
}

} // namespace confcache
