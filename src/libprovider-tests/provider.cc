#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

#include "confcache/provider/provider.hh"
#include "confcache/provider/tests/test-providers.hh"

namespace confcache {

using testing::HasSubstr;

/* ----------------------------------------------------------------------------
 * Provider
 * --------------------------------------------------------------------------*/

TEST(FixedProvider, isFixed)
{
    auto p = make_ref<FixedProvider>(int64_t{42});

    ASSERT_TRUE(p->isPresent());
    ASSERT_EQ(p->get(), Value(int64_t{42}));

    auto state = p->calculateExecutionTimeValue();
    ASSERT_TRUE(state.isFixedValue());
    ASSERT_EQ(state.getFixedValue(), Value(int64_t{42}));
}

TEST(MissingProvider, hasNoValue)
{
    auto p = make_ref<MissingProvider>();

    ASSERT_FALSE(p->isPresent());
    ASSERT_THROW(p->get(), MissingValueError);
    ASSERT_TRUE(p->calculateExecutionTimeValue().isMissing());
}

TEST(DefaultProvider, nullMeansMissing)
{
    auto p = make_ref<DefaultProvider>([]() { return Value(Null{}); });

    ASSERT_FALSE(p->getOrNull().has_value());
    ASSERT_TRUE(p->calculateExecutionTimeValue().isMissing());
}

TEST(DefaultProvider, isEvaluatedEagerly)
{
    int calls = 0;
    auto p = make_ref<DefaultProvider>([&]() {
        calls++;
        return Value("computed");
    });

    auto state = p->calculateExecutionTimeValue();
    ASSERT_EQ(calls, 1);
    ASSERT_TRUE(state.isFixedValue());
    ASSERT_EQ(state.getFixedValue(), Value("computed"));
}

TEST(DefaultProvider, failuresPropagate)
{
    auto p = make_ref<DefaultProvider>([]() -> Value { throw std::runtime_error("no network"); });

    ASSERT_THROW(p->getOrNull(), std::runtime_error);
    ASSERT_THROW(p->calculateExecutionTimeValue(), std::runtime_error);
}

/* ----------------------------------------------------------------------------
 * map
 * --------------------------------------------------------------------------*/

static Value twice(const Value & v)
{
    return std::get<int64_t>(v.raw) * 2;
}

TEST(MappedProvider, ofFixedIsFixed)
{
    auto p = make_ref<FixedProvider>(int64_t{21})->map(twice);

    ASSERT_EQ(p->get(), Value(int64_t{42}));

    auto state = p->calculateExecutionTimeValue();
    ASSERT_TRUE(state.isFixedValue());
    ASSERT_EQ(state.getFixedValue(), Value(int64_t{42}));
}

static RegisterTransform rTwice("twice", twice);

TEST(MappedProvider, namedTransform)
{
    auto p = make_ref<FixedProvider>(int64_t{21})->map("twice");

    ASSERT_EQ(p->get(), Value(int64_t{42}));
    ASSERT_EQ(p.cast<const MappedProvider>()->getTransform(), "twice");
}

TEST(MappedProvider, unknownTransform)
{
    ASSERT_THROW(make_ref<FixedProvider>(int64_t{21})->map("org.example.unknown"), UnknownTypeError);
}

TEST(MappedProvider, ofMissingIsMissing)
{
    auto p = make_ref<MissingProvider>()->map(twice);

    ASSERT_FALSE(p->isPresent());
    ASSERT_TRUE(p->calculateExecutionTimeValue().isMissing());
}

TEST(MappedProvider, nullResultIsMissing)
{
    auto p = make_ref<FixedProvider>(int64_t{1})->map([](const Value &) { return Value(Null{}); });

    ASSERT_FALSE(p->isPresent());
    ASSERT_TRUE(p->calculateExecutionTimeValue().isMissing());
}

TEST(MappedProvider, ofChangingIsChanging)
{
    auto p = make_ref<GreetingProvider>("world")->map([](const Value & v) { return Value(std::get<std::string>(v.raw) + "!"); });

    ASSERT_EQ(p->get(), Value("hello, world!"));

    auto state = p->calculateExecutionTimeValue();
    ASSERT_TRUE(state.isChangingValue());
    ASSERT_EQ(&*state.getChangingValue(), &*p);
}

TEST(MappedProvider, describe)
{
    auto p = make_ref<MissingProvider>()->map(twice);
    ASSERT_EQ(p->describe(), "map(missing)");
}

/* ----------------------------------------------------------------------------
 * ExecutionTimeValue
 * --------------------------------------------------------------------------*/

TEST(ExecutionTimeValue, ofNullable)
{
    ASSERT_TRUE(ExecutionTimeValue::ofNullable(Null{}).isMissing());
    ASSERT_TRUE(ExecutionTimeValue::ofNullable("a").isFixedValue());
}

TEST(ExecutionTimeValue, accessorsCheckTheCase)
{
    auto missing = ExecutionTimeValue::missing();
    ASSERT_THROW(missing.getFixedValue(), Error);
    ASSERT_THROW(missing.getChangingValue(), Error);
    ASSERT_THROW(missing.getBrokenValue(), Error);
}

TEST(ExecutionTimeValue, calculateCapturesFailures)
{
    DefaultProvider p([]() -> Value { throw UsageError("bad configuration"); });

    auto state = ExecutionTimeValue::calculate(p);
    ASSERT_TRUE(state.isBroken());
    ASSERT_EQ(state.getBrokenValue().message(), "bad configuration");
    ASSERT_THROW(state.getBrokenValue().rethrow(), UsageError);
}

TEST(ExecutionTimeValue, calculateCapturesStandardExceptions)
{
    DefaultProvider p([]() -> Value { throw std::out_of_range("index 3"); });

    auto state = ExecutionTimeValue::calculate(p);
    ASSERT_TRUE(state.isBroken());
    ASSERT_EQ(state.getBrokenValue().message(), "index 3");
}

TEST(ExecutionTimeValue, calculateRequiresAnOwnedProvider)
{
    GreetingProvider p("world");
    ASSERT_THROW(ExecutionTimeValue::calculate(p), std::bad_weak_ptr);
}

TEST(ExecutionTimeValue, toProvider)
{
    ASSERT_FALSE(ExecutionTimeValue::missing().toProvider()->isPresent());
    ASSERT_EQ(ExecutionTimeValue::fixedValue("a").toProvider()->get(), Value("a"));

    auto greeting = make_ref<GreetingProvider>("world");
    auto changing = ExecutionTimeValue::changingValue(greeting).toProvider();
    ASSERT_EQ(&*changing, &*greeting);
}

TEST(BrokenProvider, raisesTheCapturedFailure)
{
    auto broken = ExecutionTimeValue::broken(BrokenValue(std::make_exception_ptr(UsageError("bad input"))));
    auto p = broken.toProvider();

    ASSERT_THROW(p->getOrNull(), UsageError);
    ASSERT_THAT(p->describe(), HasSubstr("bad input"));

    auto state = ExecutionTimeValue::calculate(*p);
    ASSERT_TRUE(state.isBroken());
    ASSERT_EQ(state.getBrokenValue().message(), "bad input");
}

} // namespace confcache
